#pragma once
#include "kemtls/interfaces/i_key_encapsulation.hpp"
#include <array>
#include <memory>
#include <string>
#include <string_view>

struct OQS_KEM;

namespace kemtls::protocol::crypto {

/**
 * @brief ML-KEM key encapsulation backed by liboqs.
 *
 * The algorithm is fixed when the object is created; there is no
 * per-call dispatch on names. Secret keys and shared secrets live in
 * guarded memory.
 */
class OqsKeyEncapsulation final : public interfaces::IKeyEncapsulation {
public:
    static constexpr std::array<std::string_view, 3> SUPPORTED_ALGORITHMS = {
        "ML-KEM-512", "ML-KEM-768", "ML-KEM-1024"
    };

    /// Unknown or disabled algorithm names yield InvalidInput.
    static Result<std::shared_ptr<OqsKeyEncapsulation>, ProtocolFailure> Create(
        std::string_view algorithm);

    ~OqsKeyEncapsulation() override;

    OqsKeyEncapsulation(const OqsKeyEncapsulation&) = delete;
    OqsKeyEncapsulation& operator=(const OqsKeyEncapsulation&) = delete;

    [[nodiscard]] std::string_view Name() const noexcept override { return name_; }
    [[nodiscard]] size_t PublicKeySize() const noexcept override;
    [[nodiscard]] size_t CiphertextSize() const noexcept override;
    [[nodiscard]] size_t SharedSecretSize() const noexcept override;
    [[nodiscard]] size_t SecretKeySize() const noexcept;

    [[nodiscard]] Result<interfaces::KemKeyPair, ProtocolFailure> GenerateKeyPair() const override;

    [[nodiscard]] Result<interfaces::KemEncapsulation, ProtocolFailure> Encapsulate(
        std::span<const uint8_t> public_key) const override;

    [[nodiscard]] Result<SecureMemoryHandle, ProtocolFailure> Decapsulate(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> ciphertext) const override;

private:
    OqsKeyEncapsulation(std::string name, OQS_KEM* kem) noexcept;

    std::string name_;
    OQS_KEM* kem_;
};

}  // namespace kemtls::protocol::crypto
