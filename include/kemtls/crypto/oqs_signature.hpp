#pragma once
#include "kemtls/interfaces/i_signature_scheme.hpp"
#include <array>
#include <memory>
#include <string>
#include <string_view>

struct OQS_SIG;

namespace kemtls::protocol::crypto {

/**
 * @brief Post-quantum signatures (ML-DSA, Falcon) backed by liboqs.
 */
class OqsSignature final : public interfaces::ISignatureScheme {
public:
    static constexpr std::array<std::string_view, 5> SUPPORTED_ALGORITHMS = {
        "ML-DSA-44", "ML-DSA-65", "ML-DSA-87", "Falcon-512", "Falcon-1024"
    };

    static Result<std::shared_ptr<OqsSignature>, ProtocolFailure> Create(
        std::string_view algorithm);

    ~OqsSignature() override;

    OqsSignature(const OqsSignature&) = delete;
    OqsSignature& operator=(const OqsSignature&) = delete;

    [[nodiscard]] std::string_view Name() const noexcept override { return name_; }
    [[nodiscard]] size_t PublicKeySize() const noexcept override;
    [[nodiscard]] size_t MaxSignatureSize() const noexcept override;
    [[nodiscard]] size_t SecretKeySize() const noexcept;

    [[nodiscard]] Result<interfaces::SignatureKeyPair, ProtocolFailure> GenerateKeyPair() const override;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> message) const override;

    [[nodiscard]] bool Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const override;

private:
    OqsSignature(std::string name, OQS_SIG* sig) noexcept;

    std::string name_;
    OQS_SIG* sig_;
};

}  // namespace kemtls::protocol::crypto
