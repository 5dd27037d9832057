#pragma once
#include "kemtls/configuration/channel_config.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/core/result.hpp"
#include "kemtls/identity/server_identity.hpp"
#include "kemtls/transport/tcp_byte_stream.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

namespace kemtls::protocol::transport {

/// Maps one decrypted request to its response. An error ends the connection.
using RequestHandler = std::function<Result<std::vector<uint8_t>, ProtocolFailure>(std::span<const uint8_t>)>;

/**
 * @brief TCP listener serving request/response sessions.
 *
 * An accept thread runs the acceptor's io_context. Each accepted connection
 * gets its own thread: handshake, then receive -> handler -> send until the
 * peer closes or an error occurs. All connections share one ServerIdentity.
 */
class ChannelServer {
public:
    ChannelServer(
        configuration::ServerConfig config,
        std::shared_ptr<const identity::ServerIdentity> identity,
        RequestHandler handler);

    ~ChannelServer();

    ChannelServer(const ChannelServer&) = delete;
    ChannelServer& operator=(const ChannelServer&) = delete;

    /// Resolves the configured liboqs algorithms and generates a fresh identity.
    static Result<std::unique_ptr<ChannelServer>, ProtocolFailure> Create(
        configuration::ServerConfig config,
        RequestHandler handler);

    /// Binds, listens and starts accepting.
    [[nodiscard]] Result<Unit, ProtocolFailure> Start();

    /// Stops accepting, interrupts open connections and joins every thread.
    void Stop();

    /// Bound port; meaningful after Start().
    [[nodiscard]] uint16_t Port() const noexcept { return port_.load(); }
    [[nodiscard]] bool IsRunning() const noexcept { return running_.load(); }
    [[nodiscard]] size_t ActiveConnections() const;

    [[nodiscard]] const identity::ServerIdentity& Identity() const noexcept { return *identity_; }

private:
    struct Connection {
        std::shared_ptr<TcpByteStream> stream;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread thread;
    };

    void AcceptNext();
    void Serve(const std::shared_ptr<TcpByteStream>& stream);
    void ReapFinished();

    configuration::ServerConfig config_;
    std::shared_ptr<const identity::ServerIdentity> identity_;
    RequestHandler handler_;

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> port_{0};

    mutable std::mutex connections_mutex_;
    std::list<Connection> connections_;
};

}  // namespace kemtls::protocol::transport
