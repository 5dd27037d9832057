#pragma once

#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/protocol/constants.hpp"
#include "kemtls/protocol/handshake.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kemtls::protocol::configuration {

/// Per-connection settings shared by the client and server bindings.
///
/// Timeouts bound every read and write; an expired wait fails the session
/// with Timeout rather than blocking.
struct ChannelConfig {
    /// Largest frame payload accepted from the peer during the handshake.
    size_t max_message_bytes = kDefaultMaxMessageBytes;

    /// Largest application message accepted by SecureChannel::Receive.
    size_t max_application_message_bytes = kDefaultMaxMessageBytes;

    std::chrono::milliseconds handshake_timeout = kDefaultHandshakeTimeout;
    std::chrono::milliseconds record_timeout = kDefaultRecordTimeout;
    std::chrono::milliseconds connect_timeout = kDefaultConnectTimeout;

    /// Client only: pin the server certificate subject.
    std::optional<std::string> expected_subject;

    /// Nonce source override, for deterministic tests.
    RandomBytesFn random;

    [[nodiscard]] static ChannelConfig Default() {
        return ChannelConfig{};
    }

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;

    [[nodiscard]] HandshakeOptions ToHandshakeOptions() const;
};

/// Listener settings for ChannelServer and its long-term identity.
struct ServerConfig {
    std::string bind_host = "0.0.0.0";
    /// 0 binds an ephemeral port.
    uint16_t port = kDefaultServerPort;
    std::string subject = std::string(kDefaultServerSubject);
    std::string kem_algorithm = std::string(kDefaultKemAlgorithm);
    std::string signature_algorithm = std::string(kDefaultSignatureAlgorithm);
    ChannelConfig channel = ChannelConfig::Default();

    [[nodiscard]] static ServerConfig Default() {
        return ServerConfig{};
    }

    /// Loopback on an ephemeral port.
    [[nodiscard]] static ServerConfig Loopback() {
        ServerConfig config;
        config.bind_host = "127.0.0.1";
        config.port = 0;
        return config;
    }

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;
};

}  // namespace kemtls::protocol::configuration
