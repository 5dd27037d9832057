#include "kemtls/crypto/sodium_interop.hpp"
#include "kemtls/core/constants.hpp"

#include <sodium.h>
#include <fmt/core.h>
#include <string>

namespace kemtls::protocol::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > SodiumConstants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                fmt::format("Buffer size {} exceeds maximum {}",
                    buffer.size(), SodiumConstants::MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= SodiumConstants::SMALL_BUFFER_THRESHOLD) {
        volatile uint8_t* vbuf = buffer.data();
        for (size_t i = 0; i < buffer.size(); ++i) {
            vbuf[i] = 0;
        }
    } else {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    if (key.size() != crypto_auth_hmacsha256_KEYBYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("HMAC key must be {} bytes, got {}",
                    crypto_auth_hmacsha256_KEYBYTES, key.size())));
    }
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256(mac.data(), data.data(), data.size(), key.data());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(mac));
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}  // namespace kemtls::protocol::crypto
