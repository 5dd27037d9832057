#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/interfaces/i_byte_stream.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace kemtls::protocol::transport {

/// Reads one complete frame (header and payload). The header is validated
/// against @p max_payload_bytes before the payload is read or allocated.
[[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ReadFrame(
    interfaces::IByteStream& stream,
    size_t max_payload_bytes,
    std::chrono::milliseconds timeout);

}  // namespace kemtls::protocol::transport
