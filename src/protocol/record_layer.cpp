#include "kemtls/protocol/record_layer.hpp"
#include "kemtls/crypto/aes_gcm.hpp"
#include "kemtls/protocol/byte_order.hpp"
#include "kemtls/protocol/wire_codec.hpp"
#include <fmt/core.h>

namespace kemtls::protocol {

using crypto::AesGcm;

namespace {
    constexpr uint64_t kClientDirectionBit = 0;
    constexpr size_t kMaxRecordPayloadBytes = kMaxRecordPlaintextBytes + kAesGcmTagBytes;

    std::array<uint8_t, kFrameHeaderBytes> RecordHeader(const size_t payload_length) {
        const auto length = static_cast<uint32_t>(payload_length);
        return {
            static_cast<uint8_t>(MessageType::Record),
            static_cast<uint8_t>(length >> 24),
            static_cast<uint8_t>(length >> 16),
            static_cast<uint8_t>(length >> 8),
            static_cast<uint8_t>(length)};
    }
}

RecordLayer::RecordLayer(SessionKeys keys, const Role role)
    : keys_(std::move(keys))
    , role_(role) {}

std::array<uint8_t, kAesGcmNonceBytes> RecordLayer::NonceFor(
    const uint64_t direction_bit,
    const uint64_t sequence) const noexcept {
    std::array<uint8_t, kAesGcmNonceBytes> nonce{};
    StoreUint64BE(std::span<uint8_t, 8>(nonce.data() + 4, 8), direction_bit | sequence);
    const auto iv = keys_.IvBytes();
    for (size_t i = 0; i < kAesGcmNonceBytes; ++i) {
        nonce[i] ^= iv[i];
    }
    return nonce;
}

Result<std::vector<uint8_t>, ProtocolFailure> RecordLayer::Terminate(ProtocolFailure failure) {
    failed_ = true;
    keys_.Wipe();
    return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(failure));
}

Result<std::vector<uint8_t>, ProtocolFailure> RecordLayer::Encrypt(std::span<const uint8_t> plaintext) {
    if (failed_) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Record layer has failed"));
    }
    if (plaintext.size() > kMaxRecordPlaintextBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Record plaintext of {} bytes exceeds {}",
                    plaintext.size(), kMaxRecordPlaintextBytes)));
    }
    if (send_sequence_ > kRecordSequenceLimit) {
        return Terminate(ProtocolFailure::CryptoError("Record send sequence exhausted"));
    }

    const uint64_t direction = role_ == Role::Server ? kServerDirectionBit : kClientDirectionBit;
    const auto nonce = NonceFor(direction, send_sequence_);
    const auto header = RecordHeader(plaintext.size() + kAesGcmTagBytes);

    auto sealed = AesGcm::Encrypt(keys_.Enc(), nonce, plaintext, header);
    if (sealed.IsErr()) {
        return Terminate(std::move(sealed).UnwrapErr());
    }
    ++send_sequence_;

    auto ciphertext = std::move(sealed).Unwrap();
    std::vector<uint8_t> frame(header.begin(), header.end());
    frame.insert(frame.end(), ciphertext.begin(), ciphertext.end());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(frame));
}

Result<std::vector<uint8_t>, ProtocolFailure> RecordLayer::Decrypt(std::span<const uint8_t> frame) {
    if (failed_) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Record layer has failed"));
    }

    auto decoded = WireCodec::Decode(frame, kMaxRecordPayloadBytes);
    if (decoded.IsErr()) {
        return Terminate(std::move(decoded).UnwrapErr());
    }
    const auto& record = decoded.Unwrap();
    if (record.bytes_consumed != frame.size()) {
        return Terminate(ProtocolFailure::MalformedMessage("Trailing bytes after record frame"));
    }
    if (record.type == MessageType::Alert) {
        const uint8_t description = record.payload.empty() ? 0xFF : record.payload[0];
        return Terminate(ProtocolFailure::ConnectionClosed(
            fmt::format("Peer sent alert 0x{:02x}", description)));
    }
    if (record.type != MessageType::Record) {
        return Terminate(ProtocolFailure::ProtocolViolation(
            fmt::format("Expected Record, got {}", ToString(record.type))));
    }
    if (record.payload.size() < kAesGcmTagBytes) {
        return Terminate(ProtocolFailure::MalformedMessage("Record shorter than the AEAD tag"));
    }
    if (receive_sequence_ > kRecordSequenceLimit) {
        return Terminate(ProtocolFailure::CryptoError("Record receive sequence exhausted"));
    }

    const uint64_t direction = role_ == Role::Client ? kServerDirectionBit : kClientDirectionBit;
    const auto nonce = NonceFor(direction, receive_sequence_);
    const auto header = frame.first(kFrameHeaderBytes);

    auto opened = AesGcm::Decrypt(keys_.Enc(), nonce, record.payload, header);
    if (opened.IsErr()) {
        auto failure = std::move(opened).UnwrapErr();
        if (failure.type != ProtocolFailureType::AuthenticationFailure) {
            return Terminate(ProtocolFailure::CryptoError(failure.message));
        }
        return Terminate(std::move(failure));
    }
    ++receive_sequence_;
    return opened;
}

}  // namespace kemtls::protocol
