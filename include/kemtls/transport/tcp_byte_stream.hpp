#pragma once
#include "kemtls/interfaces/i_byte_stream.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace kemtls::protocol::transport {

/**
 * @brief IByteStream over a Boost.Asio TCP socket.
 *
 * Each stream owns a private io_context. Blocking calls start an async
 * operation and drive the context with run_for(), cancelling the operation
 * when the deadline passes. Calls on one stream must come from one thread at a
 * time; Interrupt() is the only member safe to call from another thread.
 */
class TcpByteStream final : public interfaces::IByteStream {
public:
    TcpByteStream();
    ~TcpByteStream() override;

    TcpByteStream(const TcpByteStream&) = delete;
    TcpByteStream& operator=(const TcpByteStream&) = delete;

    /// Resolves @p host and connects to the first reachable endpoint.
    static Result<std::shared_ptr<TcpByteStream>, ProtocolFailure> Connect(
        const std::string& host,
        uint16_t port,
        std::chrono::milliseconds timeout);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ReadExact(
        size_t size,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] Result<Unit, ProtocolFailure> WriteAll(
        std::span<const uint8_t> bytes,
        std::chrono::milliseconds timeout) override;

    void Close() noexcept override;

    /// Thread-safe: queues a close that aborts any pending read or write.
    void Interrupt();

    /// Socket for an acceptor to accept into.
    [[nodiscard]] boost::asio::ip::tcp::socket& Socket() noexcept { return socket_; }

    [[nodiscard]] std::string RemoteAddress() const;

private:
    /// Runs the context until @p done or the deadline; returns false on timeout.
    bool RunUntil(const bool& done, std::chrono::milliseconds timeout);

    /// Completes cancelled handlers after a timeout.
    void Drain();

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
};

}  // namespace kemtls::protocol::transport
