#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kemtls::protocol::interfaces {

/// Blocking, bounded-wait byte stream the transport binding runs over.
///
/// An expired wait fails with Timeout, end of stream with ConnectionClosed,
/// and other transport errors with Io.
class IByteStream {
public:
    virtual ~IByteStream() = default;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> ReadExact(
        size_t size,
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> WriteAll(
        std::span<const uint8_t> bytes,
        std::chrono::milliseconds timeout) = 0;

    /// Idempotent.
    virtual void Close() noexcept = 0;
};

}  // namespace kemtls::protocol::interfaces
