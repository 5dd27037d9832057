#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/crypto/secure_memory_handle.hpp"
#include "kemtls/interfaces/i_signature_scheme.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kemtls::protocol::identity {

/**
 * @brief Self-signed server certificate binding a subject to a KEM public
 * key and a signature public key.
 *
 * Wire form is four length-prefixed fields ([u32 BE length][bytes]) in the
 * order subject, kem_public_key, sig_public_key, signature. The signed bytes
 * are the same encoding of the first three fields.
 *
 * There is no chain of trust: a parsed certificate means nothing until
 * Verify() succeeds. Not suitable for production PKI.
 */
class Certificate {
public:
    static Result<Certificate, ProtocolFailure> Create(
        std::string subject,
        std::vector<uint8_t> kem_public_key,
        std::vector<uint8_t> sig_public_key,
        const interfaces::ISignatureScheme& signature_scheme,
        const crypto::SecureMemoryHandle& signing_key);

    static Result<Certificate, ProtocolFailure> Parse(std::span<const uint8_t> bytes);

    [[nodiscard]] std::vector<uint8_t> Serialize() const;
    [[nodiscard]] std::vector<uint8_t> ToBeSigned() const;

    /// Checks the embedded signature against the embedded signature key.
    [[nodiscard]] bool Verify(const interfaces::ISignatureScheme& signature_scheme) const;

    [[nodiscard]] const std::string& Subject() const noexcept { return subject_; }
    [[nodiscard]] const std::string& Issuer() const noexcept { return subject_; }
    [[nodiscard]] std::span<const uint8_t> KemPublicKey() const noexcept { return kem_public_key_; }
    [[nodiscard]] std::span<const uint8_t> SigPublicKey() const noexcept { return sig_public_key_; }
    [[nodiscard]] std::span<const uint8_t> Signature() const noexcept { return signature_; }

private:
    Certificate(
        std::string subject,
        std::vector<uint8_t> kem_public_key,
        std::vector<uint8_t> sig_public_key,
        std::vector<uint8_t> signature);

    static Result<Unit, ProtocolFailure> ValidateFields(
        std::string_view subject,
        std::span<const uint8_t> kem_public_key,
        std::span<const uint8_t> sig_public_key);

    std::string subject_;
    std::vector<uint8_t> kem_public_key_;
    std::vector<uint8_t> sig_public_key_;
    std::vector<uint8_t> signature_;
};

}  // namespace kemtls::protocol::identity
