#include "kemtls/transport/tcp_byte_stream.hpp"
#include "kemtls/core/logging.hpp"
#include <fmt/core.h>
#include <string_view>

namespace kemtls::protocol::transport {

namespace asio = boost::asio;
using asio::ip::tcp;
using boost::system::error_code;

namespace {
    ProtocolFailure MapError(const error_code& ec, std::string_view operation) {
        if (ec == asio::error::eof ||
            ec == asio::error::connection_reset ||
            ec == asio::error::connection_aborted ||
            ec == asio::error::broken_pipe ||
            ec == asio::error::operation_aborted ||
            ec == asio::error::bad_descriptor) {
            return ProtocolFailure::ConnectionClosed(
                fmt::format("{}: {}", operation, ec.message()));
        }
        return ProtocolFailure::Io(fmt::format("{} failed: {}", operation, ec.message()));
    }

    ProtocolFailure TimedOut(std::string_view operation, std::chrono::milliseconds timeout) {
        return ProtocolFailure::Timeout(
            fmt::format("{} timed out after {} ms", operation, timeout.count()));
    }
}

TcpByteStream::TcpByteStream()
    : io_context_(1)
    , socket_(io_context_) {}

TcpByteStream::~TcpByteStream() {
    Close();
}

bool TcpByteStream::RunUntil(const bool& done, const std::chrono::milliseconds timeout) {
    io_context_.restart();
    io_context_.run_for(timeout);
    return done;
}

void TcpByteStream::Drain() {
    io_context_.restart();
    io_context_.run();
}

Result<std::shared_ptr<TcpByteStream>, ProtocolFailure> TcpByteStream::Connect(
    const std::string& host,
    const uint16_t port,
    const std::chrono::milliseconds timeout) {
    using ResultType = Result<std::shared_ptr<TcpByteStream>, ProtocolFailure>;

    auto stream = std::make_shared<TcpByteStream>();
    tcp::resolver resolver(stream->io_context_);

    error_code resolve_ec;
    tcp::resolver::results_type endpoints;
    bool resolved = false;
    resolver.async_resolve(host, std::to_string(port),
        [&](const error_code& ec, tcp::resolver::results_type results) {
            resolve_ec = ec;
            endpoints = std::move(results);
            resolved = true;
        });
    if (!stream->RunUntil(resolved, timeout)) {
        resolver.cancel();
        stream->Drain();
        return ResultType::Err(TimedOut(fmt::format("Resolving {}", host), timeout));
    }
    if (resolve_ec) {
        return ResultType::Err(ProtocolFailure::Io(
            fmt::format("Resolving {} failed: {}", host, resolve_ec.message())));
    }

    error_code connect_ec;
    bool connected = false;
    asio::async_connect(stream->socket_, endpoints,
        [&](const error_code& ec, const tcp::endpoint&) {
            connect_ec = ec;
            connected = true;
        });
    if (!stream->RunUntil(connected, timeout)) {
        stream->Close();
        stream->Drain();
        return ResultType::Err(TimedOut(fmt::format("Connecting to {}:{}", host, port), timeout));
    }
    if (connect_ec) {
        return ResultType::Err(ProtocolFailure::Io(
            fmt::format("Connecting to {}:{} failed: {}", host, port, connect_ec.message())));
    }

    error_code option_ec;
    stream->socket_.set_option(tcp::no_delay(true), option_ec);
    if (option_ec) {
        Logging::Get()->debug("TCP_NODELAY not applied: {}", option_ec.message());
    }
    return ResultType::Ok(std::move(stream));
}

Result<std::vector<uint8_t>, ProtocolFailure> TcpByteStream::ReadExact(
    const size_t size,
    const std::chrono::milliseconds timeout) {
    std::vector<uint8_t> buffer(size);
    if (size == 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(buffer));
    }

    error_code read_ec;
    bool done = false;
    asio::async_read(socket_, asio::buffer(buffer),
        [&](const error_code& ec, size_t) {
            read_ec = ec;
            done = true;
        });
    if (!RunUntil(done, timeout)) {
        error_code cancel_ec;
        socket_.cancel(cancel_ec);
        Drain();
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            TimedOut(fmt::format("Read of {} bytes", size), timeout));
    }
    if (read_ec) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(MapError(read_ec, "Read"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(buffer));
}

Result<Unit, ProtocolFailure> TcpByteStream::WriteAll(
    std::span<const uint8_t> bytes,
    const std::chrono::milliseconds timeout) {
    if (bytes.empty()) {
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    error_code write_ec;
    bool done = false;
    asio::async_write(socket_, asio::buffer(bytes.data(), bytes.size()),
        [&](const error_code& ec, size_t) {
            write_ec = ec;
            done = true;
        });
    if (!RunUntil(done, timeout)) {
        error_code cancel_ec;
        socket_.cancel(cancel_ec);
        Drain();
        return Result<Unit, ProtocolFailure>::Err(
            TimedOut(fmt::format("Write of {} bytes", bytes.size()), timeout));
    }
    if (write_ec) {
        return Result<Unit, ProtocolFailure>::Err(MapError(write_ec, "Write"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void TcpByteStream::Close() noexcept {
    if (!socket_.is_open()) {
        return;
    }
    error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void TcpByteStream::Interrupt() {
    asio::post(io_context_, [this]() { Close(); });
}

std::string TcpByteStream::RemoteAddress() const {
    error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

}  // namespace kemtls::protocol::transport
