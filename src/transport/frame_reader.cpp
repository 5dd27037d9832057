#include "kemtls/transport/frame_reader.hpp"
#include "kemtls/protocol/wire_codec.hpp"

namespace kemtls::protocol::transport {

Result<std::vector<uint8_t>, ProtocolFailure> ReadFrame(
    interfaces::IByteStream& stream,
    const size_t max_payload_bytes,
    const std::chrono::milliseconds timeout) {
    auto header_bytes = stream.ReadExact(kFrameHeaderBytes, timeout);
    if (header_bytes.IsErr()) {
        return header_bytes;
    }
    auto frame = std::move(header_bytes).Unwrap();

    auto header = WireCodec::ReadHeader(frame, max_payload_bytes);
    if (header.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(header).UnwrapErr());
    }

    auto payload = stream.ReadExact(header.Unwrap().payload_length, timeout);
    if (payload.IsErr()) {
        return payload;
    }
    const auto& payload_bytes = payload.Unwrap();
    frame.insert(frame.end(), payload_bytes.begin(), payload_bytes.end());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(frame));
}

}  // namespace kemtls::protocol::transport
