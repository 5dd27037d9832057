#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/protocol/constants.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace kemtls::protocol {

enum class MessageType : uint8_t {
    ClientHello = 0x01,
    ServerHello = 0x02,
    ClientFinished = 0x05,
    ServerFinished = 0x06,
    Record = 0x10,
    Alert = 0xFF
};

[[nodiscard]] std::optional<MessageType> MessageTypeFromByte(uint8_t tag) noexcept;
[[nodiscard]] std::string_view ToString(MessageType type) noexcept;

struct FrameHeader {
    MessageType type;
    uint32_t payload_length;
};

struct DecodedFrame {
    MessageType type;
    std::vector<uint8_t> payload;
    size_t bytes_consumed;
};

/**
 * @brief Framing for every message on the wire:
 * [1-byte type][4-byte big-endian length][payload].
 *
 * All decoding entry points take the maximum accepted payload length so that
 * untrusted length fields never drive an allocation.
 */
class WireCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Encode(
        MessageType type,
        std::span<const uint8_t> payload);

    /// Validates a 5-byte header on its own, before any payload is read.
    [[nodiscard]] static Result<FrameHeader, ProtocolFailure> ReadHeader(
        std::span<const uint8_t> header,
        size_t max_message_bytes = kDefaultMaxMessageBytes);

    /// Decodes the first frame in @p bytes. Trailing bytes are left for the
    /// caller; bytes_consumed reports the frame's full size.
    [[nodiscard]] static Result<DecodedFrame, ProtocolFailure> Decode(
        std::span<const uint8_t> bytes,
        size_t max_message_bytes = kDefaultMaxMessageBytes);

private:
    WireCodec() = delete;
};

}  // namespace kemtls::protocol
