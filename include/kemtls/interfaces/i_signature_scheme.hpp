#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/crypto/secure_memory_handle.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace kemtls::protocol::interfaces {

struct SignatureKeyPair {
    std::vector<uint8_t> public_key;
    crypto::SecureMemoryHandle secret_key;
};

/// Signature capability. Verify reports a mismatch as false rather than an
/// error; malformed keys or signatures also verify as false.
class ISignatureScheme {
public:
    virtual ~ISignatureScheme() = default;

    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
    [[nodiscard]] virtual size_t PublicKeySize() const noexcept = 0;
    [[nodiscard]] virtual size_t MaxSignatureSize() const noexcept = 0;

    [[nodiscard]] virtual Result<SignatureKeyPair, ProtocolFailure> GenerateKeyPair() const = 0;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> Sign(
        const crypto::SecureMemoryHandle& secret_key,
        std::span<const uint8_t> message) const = 0;

    [[nodiscard]] virtual bool Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const = 0;
};

}  // namespace kemtls::protocol::interfaces
