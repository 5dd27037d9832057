#pragma once

/**
 * @file key_logger.hpp
 * @brief Key-material tracing for interop debugging of the handshake.
 *
 * SECURITY WARNING: with KEMTLS_DEBUG_KEYS defined this writes secret keys
 * to the library logger. Development builds only.
 *
 * Enable via CMake: -DKEMTLS_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <span>
#include <string>

#ifdef KEMTLS_DEBUG_KEYS
#include "kemtls/core/logging.hpp"
#endif

namespace kemtls::debug {

enum class Side {
    Client,
    Server
};

#ifdef KEMTLS_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data, size_t max_bytes = 64) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2 + 24);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

inline const char* SideToString(Side side) {
    return side == Side::Client ? "CLIENT" : "SERVER";
}

#define KEMTLS_LOG_KEY(side, operation, key_name, data) \
    ::kemtls::protocol::Logging::Get()->debug("[KEYS] {} {} {}: {}", \
        ::kemtls::debug::SideToString(side), operation, key_name, \
        ::kemtls::debug::ToHex(data))

inline void LogEphemeralKeyGenerated(Side side, std::span<const uint8_t> public_key) {
    KEMTLS_LOG_KEY(side, "EPHEMERAL", "kem_public", public_key);
}

inline void LogKemSharedSecret(
    Side side,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> shared_secret) {
    KEMTLS_LOG_KEY(side, "KEM", "ciphertext", ciphertext);
    KEMTLS_LOG_KEY(side, "KEM", "shared_secret", shared_secret);
}

inline void LogSessionKeys(
    Side side,
    std::span<const uint8_t> enc_key,
    std::span<const uint8_t> mac_key,
    std::span<const uint8_t> iv) {
    KEMTLS_LOG_KEY(side, "SCHEDULE", "enc_key", enc_key);
    KEMTLS_LOG_KEY(side, "SCHEDULE", "mac_key", mac_key);
    KEMTLS_LOG_KEY(side, "SCHEDULE", "iv", iv);
}

inline void LogTranscriptMac(Side side, const char* label, std::span<const uint8_t> mac) {
    KEMTLS_LOG_KEY(side, "TRANSCRIPT", label, mac);
}

#else // !KEMTLS_DEBUG_KEYS

#define KEMTLS_LOG_KEY(side, operation, key_name, data) ((void)0)

inline void LogEphemeralKeyGenerated(Side, std::span<const uint8_t>) {}
inline void LogKemSharedSecret(Side, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogSessionKeys(Side, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>) {}
inline void LogTranscriptMac(Side, const char*, std::span<const uint8_t>) {}

#endif // KEMTLS_DEBUG_KEYS

} // namespace kemtls::debug
