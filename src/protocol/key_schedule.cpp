#include "kemtls/protocol/key_schedule.hpp"
#include "kemtls/crypto/hkdf.hpp"
#include "kemtls/crypto/sodium_interop.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <string_view>
#include <vector>

namespace kemtls::protocol {

using crypto::Hkdf;
using crypto::SodiumInterop;

namespace {
    template<size_t N>
    void WipeArray(std::array<uint8_t, N>& bytes) noexcept {
        auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
        (void)wiped;
    }

    std::vector<uint8_t> BuildInfo(
        std::string_view label,
        std::span<const uint8_t> client_nonce,
        std::span<const uint8_t> server_nonce) {
        std::vector<uint8_t> info;
        info.reserve(kSessionKeyInfoPrefix.size() + label.size() +
            client_nonce.size() + server_nonce.size());
        info.insert(info.end(), kSessionKeyInfoPrefix.begin(), kSessionKeyInfoPrefix.end());
        info.insert(info.end(), label.begin(), label.end());
        info.insert(info.end(), client_nonce.begin(), client_nonce.end());
        info.insert(info.end(), server_nonce.begin(), server_nonce.end());
        return info;
    }

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }
}

Result<SessionKeys, ProtocolFailure> SessionKeys::FromBytes(
    std::span<const uint8_t> enc_key,
    std::span<const uint8_t> mac_key,
    std::span<const uint8_t> iv) {
    if (enc_key.size() != kEncKeyBytes || mac_key.size() != kMacKeyBytes || iv.size() != kIvBytes) {
        return Result<SessionKeys, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Session keys must be {}/{}/{} bytes, got {}/{}/{}",
                    kEncKeyBytes, kMacKeyBytes, kIvBytes,
                    enc_key.size(), mac_key.size(), iv.size())));
    }
    SessionKeys keys;
    std::copy(enc_key.begin(), enc_key.end(), keys.enc_key_.begin());
    std::copy(mac_key.begin(), mac_key.end(), keys.mac_key_.begin());
    std::copy(iv.begin(), iv.end(), keys.iv_.begin());
    return Result<SessionKeys, ProtocolFailure>::Ok(std::move(keys));
}

SessionKeys::~SessionKeys() {
    Wipe();
}

SessionKeys::SessionKeys(SessionKeys&& other) noexcept
    : enc_key_(other.enc_key_)
    , mac_key_(other.mac_key_)
    , iv_(other.iv_) {
    other.Wipe();
}

SessionKeys& SessionKeys::operator=(SessionKeys&& other) noexcept {
    if (this != &other) {
        enc_key_ = other.enc_key_;
        mac_key_ = other.mac_key_;
        iv_ = other.iv_;
        other.Wipe();
    }
    return *this;
}

void SessionKeys::Wipe() noexcept {
    WipeArray(enc_key_);
    WipeArray(mac_key_);
    WipeArray(iv_);
}

Result<SessionKeys, ProtocolFailure> KeySchedule::Derive(
    std::span<const uint8_t> shared_secret,
    std::span<const uint8_t> client_nonce,
    std::span<const uint8_t> server_nonce) {
    if (shared_secret.size() != kSharedSecretBytes) {
        return Result<SessionKeys, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(
                fmt::format("Shared secret must be {} bytes, got {}",
                    kSharedSecretBytes, shared_secret.size())));
    }
    if (client_nonce.size() != kHandshakeNonceBytes || server_nonce.size() != kHandshakeNonceBytes) {
        return Result<SessionKeys, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Handshake nonces must be {} bytes, got {} and {}",
                    kHandshakeNonceBytes, client_nonce.size(), server_nonce.size())));
    }

    auto prk_result = Hkdf::Extract(shared_secret, AsBytes(kSessionKeySalt));
    if (prk_result.IsErr()) {
        return Result<SessionKeys, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(prk_result.UnwrapErr().message));
    }
    auto prk = std::move(prk_result).Unwrap();

    SessionKeys keys;
    const std::pair<std::string_view, std::span<uint8_t>> outputs[] = {
        {kEncKeyLabel, keys.enc_key_},
        {kMacKeyLabel, keys.mac_key_},
        {kIvLabel, keys.iv_},
    };
    for (const auto& [label, output] : outputs) {
        const auto info = BuildInfo(label, client_nonce, server_nonce);
        if (auto expanded = Hkdf::Expand(prk, output, info); expanded.IsErr()) {
            auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(prk));
            (void)wiped;
            return Result<SessionKeys, ProtocolFailure>::Err(
                ProtocolFailure::CryptoError(expanded.UnwrapErr().message));
        }
    }
    auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(prk));
    (void)wiped;
    return Result<SessionKeys, ProtocolFailure>::Ok(std::move(keys));
}

Result<std::array<uint8_t, kFinishedMacBytes>, ProtocolFailure> KeySchedule::ComputeTranscriptMac(
    std::span<const uint8_t> mac_key,
    std::span<const uint8_t> transcript) {
    using ResultType = Result<std::array<uint8_t, kFinishedMacBytes>, ProtocolFailure>;

    auto mac_result = SodiumInterop::HmacSha256(mac_key, transcript);
    if (mac_result.IsErr()) {
        return ResultType::Err(std::move(mac_result).UnwrapErr());
    }
    const auto& mac_bytes = mac_result.Unwrap();
    std::array<uint8_t, kFinishedMacBytes> mac{};
    std::copy_n(mac_bytes.begin(), kFinishedMacBytes, mac.begin());
    return ResultType::Ok(mac);
}

bool KeySchedule::VerifyTranscriptMac(
    std::span<const uint8_t> mac_key,
    std::span<const uint8_t> transcript,
    std::span<const uint8_t> mac) {
    auto expected = ComputeTranscriptMac(mac_key, transcript);
    if (expected.IsErr()) {
        return false;
    }
    return SodiumInterop::ConstantTimeEquals(expected.Unwrap(), mac);
}

}  // namespace kemtls::protocol
