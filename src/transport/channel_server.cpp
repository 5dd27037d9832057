#include "kemtls/transport/channel_server.hpp"
#include "kemtls/core/logging.hpp"
#include "kemtls/crypto/oqs_key_encapsulation.hpp"
#include "kemtls/crypto/oqs_signature.hpp"
#include "kemtls/transport/secure_channel.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <exception>

namespace kemtls::protocol::transport {

namespace asio = boost::asio;
using asio::ip::tcp;
using boost::system::error_code;
using configuration::ServerConfig;

namespace {
    /// Runs the application handler; an escaping exception fails only this request.
    Result<std::vector<uint8_t>, ProtocolFailure> InvokeHandler(
        const RequestHandler& handler,
        std::span<const uint8_t> request) {
        try {
            return handler(request);
        } catch (const std::exception& ex) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState(
                    fmt::format("Request handler threw: {}", ex.what())));
        } catch (...) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Request handler threw a non-standard exception"));
        }
    }
}

ChannelServer::ChannelServer(
    ServerConfig config,
    std::shared_ptr<const identity::ServerIdentity> identity,
    RequestHandler handler)
    : config_(std::move(config))
    , identity_(std::move(identity))
    , handler_(std::move(handler))
    , acceptor_(io_context_) {}

ChannelServer::~ChannelServer() {
    Stop();
}

Result<std::unique_ptr<ChannelServer>, ProtocolFailure> ChannelServer::Create(
    ServerConfig config,
    RequestHandler handler) {
    using ResultType = Result<std::unique_ptr<ChannelServer>, ProtocolFailure>;

    if (auto valid = config.Validate(); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    auto kem = crypto::OqsKeyEncapsulation::Create(config.kem_algorithm);
    if (kem.IsErr()) {
        return ResultType::Err(std::move(kem).UnwrapErr());
    }
    auto signature = crypto::OqsSignature::Create(config.signature_algorithm);
    if (signature.IsErr()) {
        return ResultType::Err(std::move(signature).UnwrapErr());
    }
    auto identity = identity::ServerIdentity::Generate(
        config.subject, std::move(kem).Unwrap(), std::move(signature).Unwrap());
    if (identity.IsErr()) {
        return ResultType::Err(std::move(identity).UnwrapErr());
    }
    return ResultType::Ok(std::make_unique<ChannelServer>(
        std::move(config), std::move(identity).Unwrap(), std::move(handler)));
}

Result<Unit, ProtocolFailure> ChannelServer::Start() {
    if (running_.load()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Server is already running"));
    }
    if (!identity_ || !handler_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Server needs an identity and a request handler"));
    }

    error_code ec;
    const auto address = asio::ip::make_address(config_.bind_host, ec);
    if (ec) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
            fmt::format("Invalid bind address '{}': {}", config_.bind_host, ec.message())));
    }
    const tcp::endpoint endpoint(address, config_.port);

    auto bind_failure = [&](std::string_view step) {
        error_code close_ec;
        acceptor_.close(close_ec);
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Io(
            fmt::format("{} {}:{} failed: {}", step, config_.bind_host, config_.port, ec.message())));
    };
    if (acceptor_.open(endpoint.protocol(), ec); ec) {
        return bind_failure("Opening");
    }
    if (acceptor_.set_option(tcp::acceptor::reuse_address(true), ec); ec) {
        return bind_failure("Configuring");
    }
    if (acceptor_.bind(endpoint, ec); ec) {
        return bind_failure("Binding");
    }
    if (acceptor_.listen(asio::socket_base::max_listen_connections, ec); ec) {
        return bind_failure("Listening on");
    }
    const auto bound = acceptor_.local_endpoint(ec);
    if (ec) {
        return bind_failure("Inspecting");
    }
    port_.store(bound.port());

    running_.store(true);
    io_context_.restart();
    AcceptNext();
    accept_thread_ = std::thread([this]() { io_context_.run(); });

    Logging::Get()->info("Server '{}' listening on {}:{}",
        identity_->Subject(), config_.bind_host, port_.load());
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void ChannelServer::AcceptNext() {
    auto stream = std::make_shared<TcpByteStream>();
    acceptor_.async_accept(stream->Socket(), [this, stream](const error_code& ec) {
        if (ec == asio::error::operation_aborted || !running_.load()) {
            return;
        }
        if (ec) {
            Logging::Get()->warn("Accept failed: {}", ec.message());
        } else {
            ReapFinished();
            auto finished = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard lock(connections_mutex_);
            connections_.push_back(Connection{
                stream,
                finished,
                std::thread([this, stream, finished]() {
                    Serve(stream);
                    finished->store(true);
                })});
        }
        AcceptNext();
    });
}

void ChannelServer::Serve(const std::shared_ptr<TcpByteStream>& stream) {
    const std::string peer = stream->RemoteAddress();
    Logging::Get()->debug("Connection from {}", peer);

    auto session = AcceptServerSession(stream, identity_, config_.channel);
    if (session.IsErr()) {
        Logging::Get()->warn("Handshake with {} failed: {}",
            peer, ToString(session.UnwrapErr().type));
        return;
    }
    auto channel = std::move(session).Unwrap();
    Logging::Get()->info("Session established with {}", peer);

    size_t handled = 0;
    while (channel.IsOpen()) {
        auto request = channel.Receive();
        if (request.IsErr()) {
            const auto& failure = request.UnwrapErr();
            if (failure.type == ProtocolFailureType::ConnectionClosed) {
                Logging::Get()->info("Session with {} closed after {} request(s)", peer, handled);
            } else {
                Logging::Get()->warn("Session with {} ended: {}: {}",
                    peer, ToString(failure.type), failure.message);
            }
            return;
        }

        auto response = InvokeHandler(handler_, request.Unwrap());
        if (response.IsErr()) {
            Logging::Get()->warn("Handler rejected request from {}: {}",
                peer, response.UnwrapErr().message);
            channel.Close();
            return;
        }
        if (auto sent = channel.Send(response.Unwrap()); sent.IsErr()) {
            Logging::Get()->warn("Reply to {} failed: {}: {}",
                peer, ToString(sent.UnwrapErr().type), sent.UnwrapErr().message);
            return;
        }
        ++handled;
    }
}

void ChannelServer::ReapFinished() {
    std::list<Connection> done;
    {
        std::lock_guard lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->finished->load()) {
                auto next = std::next(it);
                done.splice(done.end(), connections_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : done) {
        if (connection.thread.joinable()) {
            connection.thread.join();
        }
    }
}

void ChannelServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::post(io_context_, [this]() {
        error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::list<Connection> remaining;
    {
        std::lock_guard lock(connections_mutex_);
        remaining.swap(connections_);
    }
    for (auto& connection : remaining) {
        connection.stream->Interrupt();
    }
    for (auto& connection : remaining) {
        if (connection.thread.joinable()) {
            connection.thread.join();
        }
    }
    Logging::Get()->info("Server on port {} stopped", port_.load());
}

size_t ChannelServer::ActiveConnections() const {
    std::lock_guard lock(connections_mutex_);
    return static_cast<size_t>(std::count_if(connections_.begin(), connections_.end(),
        [](const Connection& connection) { return !connection.finished->load(); }));
}

}  // namespace kemtls::protocol::transport
