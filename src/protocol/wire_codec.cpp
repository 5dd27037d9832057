#include "kemtls/protocol/wire_codec.hpp"
#include "kemtls/protocol/byte_order.hpp"
#include <fmt/core.h>
#include <limits>

namespace kemtls::protocol {

std::optional<MessageType> MessageTypeFromByte(const uint8_t tag) noexcept {
    switch (static_cast<MessageType>(tag)) {
        case MessageType::ClientHello:
        case MessageType::ServerHello:
        case MessageType::ClientFinished:
        case MessageType::ServerFinished:
        case MessageType::Record:
        case MessageType::Alert:
            return static_cast<MessageType>(tag);
    }
    return std::nullopt;
}

std::string_view ToString(const MessageType type) noexcept {
    switch (type) {
        case MessageType::ClientHello: return "ClientHello";
        case MessageType::ServerHello: return "ServerHello";
        case MessageType::ClientFinished: return "ClientFinished";
        case MessageType::ServerFinished: return "ServerFinished";
        case MessageType::Record: return "Record";
        case MessageType::Alert: return "Alert";
    }
    return "Unknown";
}

Result<std::vector<uint8_t>, ProtocolFailure> WireCodec::Encode(
    const MessageType type,
    std::span<const uint8_t> payload) {
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("{} payload of {} bytes does not fit a 32-bit length",
                    ToString(type), payload.size())));
    }
    std::vector<uint8_t> frame;
    frame.reserve(kFrameHeaderBytes + payload.size());
    frame.push_back(static_cast<uint8_t>(type));
    AppendUint32BE(frame, static_cast<uint32_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(frame));
}

Result<FrameHeader, ProtocolFailure> WireCodec::ReadHeader(
    std::span<const uint8_t> header,
    const size_t max_message_bytes) {
    if (header.size() < kFrameHeaderBytes) {
        return Result<FrameHeader, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage(
                fmt::format("Frame header needs {} bytes, got {}",
                    kFrameHeaderBytes, header.size())));
    }
    const auto type = MessageTypeFromByte(header[0]);
    if (!type) {
        return Result<FrameHeader, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage(
                fmt::format("Unknown message type 0x{:02x}", header[0])));
    }
    const uint32_t length = ReadUint32BE(header.subspan(1, 4));
    if (length > max_message_bytes) {
        return Result<FrameHeader, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage(
                fmt::format("Declared length {} exceeds maximum message size {}",
                    length, max_message_bytes)));
    }
    return Result<FrameHeader, ProtocolFailure>::Ok(FrameHeader{*type, length});
}

Result<DecodedFrame, ProtocolFailure> WireCodec::Decode(
    std::span<const uint8_t> bytes,
    const size_t max_message_bytes) {
    auto header_result = ReadHeader(bytes, max_message_bytes);
    if (header_result.IsErr()) {
        return Result<DecodedFrame, ProtocolFailure>::Err(std::move(header_result).UnwrapErr());
    }
    const FrameHeader header = header_result.Unwrap();
    const size_t available = bytes.size() - kFrameHeaderBytes;
    if (header.payload_length > available) {
        return Result<DecodedFrame, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage(
                fmt::format("Declared length {} exceeds available {} bytes",
                    header.payload_length, available)));
    }
    auto payload = bytes.subspan(kFrameHeaderBytes, header.payload_length);
    return Result<DecodedFrame, ProtocolFailure>::Ok(DecodedFrame{
        header.type,
        std::vector<uint8_t>(payload.begin(), payload.end()),
        kFrameHeaderBytes + header.payload_length});
}

}  // namespace kemtls::protocol
