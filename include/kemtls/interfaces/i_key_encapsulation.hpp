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

struct KemKeyPair {
    std::vector<uint8_t> public_key;
    crypto::SecureMemoryHandle secret_key;
};

struct KemEncapsulation {
    std::vector<uint8_t> ciphertext;
    crypto::SecureMemoryHandle shared_secret;
};

/// Key-encapsulation capability. Implementations are immutable after
/// construction and safe to call concurrently.
class IKeyEncapsulation {
public:
    virtual ~IKeyEncapsulation() = default;

    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
    [[nodiscard]] virtual size_t PublicKeySize() const noexcept = 0;
    [[nodiscard]] virtual size_t CiphertextSize() const noexcept = 0;
    [[nodiscard]] virtual size_t SharedSecretSize() const noexcept = 0;

    [[nodiscard]] virtual Result<KemKeyPair, ProtocolFailure> GenerateKeyPair() const = 0;

    [[nodiscard]] virtual Result<KemEncapsulation, ProtocolFailure> Encapsulate(
        std::span<const uint8_t> public_key) const = 0;

    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, ProtocolFailure> Decapsulate(
        const crypto::SecureMemoryHandle& secret_key,
        std::span<const uint8_t> ciphertext) const = 0;
};

}  // namespace kemtls::protocol::interfaces
