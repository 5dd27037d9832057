#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/crypto/secure_memory_handle.hpp"
#include "kemtls/identity/certificate.hpp"
#include "kemtls/interfaces/i_key_encapsulation.hpp"
#include "kemtls/interfaces/i_signature_scheme.hpp"
#include "identity/server_identity.pb.h"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kemtls::protocol::identity {

/**
 * @brief The server's long-term certificate and keys.
 *
 * Created once at startup and handed to every server handshake as a shared,
 * read-only object. All accessors are const and safe for concurrent use.
 */
class ServerIdentity {
public:
    static constexpr uint32_t STATE_VERSION = 1;

    static Result<std::shared_ptr<const ServerIdentity>, ProtocolFailure> Generate(
        std::string subject,
        std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
        std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme);

    /// Restores an exported identity and re-verifies its certificate.
    static Result<std::shared_ptr<const ServerIdentity>, ProtocolFailure> FromState(
        const proto::identity::ServerIdentityState& state,
        std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
        std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme);

    [[nodiscard]] Result<proto::identity::ServerIdentityState, ProtocolFailure> ExportState() const;

    [[nodiscard]] const Certificate& GetCertificate() const noexcept { return certificate_; }
    [[nodiscard]] std::span<const uint8_t> CertificateBytes() const noexcept { return certificate_bytes_; }
    [[nodiscard]] const std::string& Subject() const noexcept { return certificate_.Subject(); }

    [[nodiscard]] const interfaces::IKeyEncapsulation& Kem() const noexcept { return *kem_; }
    [[nodiscard]] const interfaces::ISignatureScheme& SignatureScheme() const noexcept { return *signature_scheme_; }

    /// Signs application data with the long-term signing key.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(
        std::span<const uint8_t> message) const;

    ServerIdentity(const ServerIdentity&) = delete;
    ServerIdentity& operator=(const ServerIdentity&) = delete;

private:
    ServerIdentity(
        std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
        std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme,
        crypto::SecureMemoryHandle kem_secret_key,
        crypto::SecureMemoryHandle signing_key,
        Certificate certificate);

    std::shared_ptr<const interfaces::IKeyEncapsulation> kem_;
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme_;
    crypto::SecureMemoryHandle kem_secret_key_;
    crypto::SecureMemoryHandle signing_key_;
    Certificate certificate_;
    std::vector<uint8_t> certificate_bytes_;
};

}  // namespace kemtls::protocol::identity
