#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/protocol/constants.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace kemtls::protocol {

/**
 * @brief Symmetric material for one established session.
 *
 * Move-only. Buffers are wiped on destruction and a moved-from instance is
 * left zeroed.
 */
class SessionKeys {
public:
    using EncKey = std::array<uint8_t, kEncKeyBytes>;
    using MacKey = std::array<uint8_t, kMacKeyBytes>;
    using Iv = std::array<uint8_t, kIvBytes>;

    static Result<SessionKeys, ProtocolFailure> FromBytes(
        std::span<const uint8_t> enc_key,
        std::span<const uint8_t> mac_key,
        std::span<const uint8_t> iv);

    ~SessionKeys();
    SessionKeys(SessionKeys&& other) noexcept;
    SessionKeys& operator=(SessionKeys&& other) noexcept;
    SessionKeys(const SessionKeys&) = delete;
    SessionKeys& operator=(const SessionKeys&) = delete;

    [[nodiscard]] std::span<const uint8_t, kEncKeyBytes> Enc() const noexcept { return enc_key_; }
    [[nodiscard]] std::span<const uint8_t, kMacKeyBytes> Mac() const noexcept { return mac_key_; }
    [[nodiscard]] std::span<const uint8_t, kIvBytes> IvBytes() const noexcept { return iv_; }

    void Wipe() noexcept;

private:
    SessionKeys() = default;

    friend class KeySchedule;

    EncKey enc_key_{};
    MacKey mac_key_{};
    Iv iv_{};
};

/**
 * @brief Deterministic session key schedule.
 *
 * PRK  = HKDF-Extract(salt = "KEMTLS-Session-Keys", ikm = shared_secret)
 * key  = HKDF-Expand(PRK, "KEMTLS-v1 " || label || client_nonce || server_nonce)
 *
 * for labels "enc" (32 bytes), "mac" (32 bytes) and "iv" (16 bytes).
 */
class KeySchedule {
public:
    [[nodiscard]] static Result<SessionKeys, ProtocolFailure> Derive(
        std::span<const uint8_t> shared_secret,
        std::span<const uint8_t> client_nonce,
        std::span<const uint8_t> server_nonce);

    /// HMAC-SHA256 over the concatenated handshake frames.
    [[nodiscard]] static Result<std::array<uint8_t, kFinishedMacBytes>, ProtocolFailure>
    ComputeTranscriptMac(
        std::span<const uint8_t> mac_key,
        std::span<const uint8_t> transcript);

    /// Constant-time comparison against a freshly computed MAC.
    [[nodiscard]] static bool VerifyTranscriptMac(
        std::span<const uint8_t> mac_key,
        std::span<const uint8_t> transcript,
        std::span<const uint8_t> mac);

private:
    KeySchedule() = delete;
};

}  // namespace kemtls::protocol
