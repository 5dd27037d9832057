#pragma once

#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace kemtls::protocol::crypto {

/**
 * @brief Interop layer for the libsodium primitives the handshake relies on.
 *
 * Covers library initialization, secure wiping, constant-time comparison,
 * the CSPRNG, HMAC-SHA256 and guarded allocations for secret material.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time equality. Buffers of different length are unequal.
     */
    [[nodiscard]] static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    [[nodiscard]] static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief HMAC-SHA256 with a 32-byte key.
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

}  // namespace kemtls::protocol::crypto
