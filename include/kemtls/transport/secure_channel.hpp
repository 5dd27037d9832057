#pragma once
#include "kemtls/configuration/channel_config.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/core/result.hpp"
#include "kemtls/identity/certificate.hpp"
#include "kemtls/identity/server_identity.hpp"
#include "kemtls/interfaces/i_byte_stream.hpp"
#include "kemtls/interfaces/i_key_encapsulation.hpp"
#include "kemtls/interfaces/i_signature_scheme.hpp"
#include "kemtls/protocol/record_layer.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kemtls::protocol::transport {

/**
 * @brief Established, encrypted request/response channel.
 *
 * Application messages travel as [u32 BE length] || body, split across
 * records of at most 16 KiB. Any error closes the channel for good.
 * Not thread-safe; one thread drives a channel.
 */
class SecureChannel {
public:
    SecureChannel(
        std::shared_ptr<interfaces::IByteStream> stream,
        RecordLayer records,
        configuration::ChannelConfig config,
        std::optional<identity::Certificate> peer_certificate);

    ~SecureChannel();

    SecureChannel(SecureChannel&&) noexcept = default;
    SecureChannel& operator=(SecureChannel&&) noexcept = default;
    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;

    [[nodiscard]] Result<Unit, ProtocolFailure> Send(std::span<const uint8_t> message);

    /// Blocks up to the record timeout for each record of the next message.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Receive();

    /// Send followed by Receive.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> SendRequest(
        std::span<const uint8_t> request);

    /// Sends close_notify when still healthy, then closes the stream.
    void Close() noexcept;

    [[nodiscard]] bool IsOpen() const noexcept { return open_; }

    /// Server certificate on the client side; empty on the server side.
    [[nodiscard]] const std::optional<identity::Certificate>& PeerCertificate() const noexcept {
        return peer_certificate_;
    }

private:
    template<typename T>
    Result<T, ProtocolFailure> Abandon(ProtocolFailure failure);

    std::shared_ptr<interfaces::IByteStream> stream_;
    RecordLayer records_;
    configuration::ChannelConfig config_;
    std::optional<identity::Certificate> peer_certificate_;
    bool open_ = true;
};

/// Runs the client handshake over @p stream.
[[nodiscard]] Result<SecureChannel, ProtocolFailure> OpenClientSession(
    std::shared_ptr<interfaces::IByteStream> stream,
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme,
    const configuration::ChannelConfig& config = configuration::ChannelConfig::Default());

/// Connects over TCP and runs the client handshake.
[[nodiscard]] Result<SecureChannel, ProtocolFailure> ConnectClient(
    const std::string& host,
    uint16_t port,
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme,
    const configuration::ChannelConfig& config = configuration::ChannelConfig::Default());

/// Runs the server handshake over @p stream with the shared long-term identity.
[[nodiscard]] Result<SecureChannel, ProtocolFailure> AcceptServerSession(
    std::shared_ptr<interfaces::IByteStream> stream,
    std::shared_ptr<const identity::ServerIdentity> identity,
    const configuration::ChannelConfig& config = configuration::ChannelConfig::Default());

}  // namespace kemtls::protocol::transport
