#include "kemtls/transport/secure_channel.hpp"
#include "kemtls/core/logging.hpp"
#include "kemtls/protocol/byte_order.hpp"
#include "kemtls/protocol/handshake.hpp"
#include "kemtls/protocol/handshake_message.hpp"
#include "kemtls/transport/frame_reader.hpp"
#include "kemtls/transport/tcp_byte_stream.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <exception>

namespace kemtls::protocol::transport {

using configuration::ChannelConfig;

namespace {
    constexpr size_t kMaxRecordFrameBytes = kMaxRecordPlaintextBytes + kAesGcmTagBytes;

    /// Best effort: the peer may already be gone.
    void SendAlert(interfaces::IByteStream& stream, AlertDescription description,
                   std::chrono::milliseconds timeout) {
        auto frame = EncodeMessage(Alert{description});
        if (frame.IsErr()) {
            return;
        }
        auto written = stream.WriteAll(frame.Unwrap(), timeout);
        if (written.IsErr()) {
            Logging::Get()->debug("Alert not delivered: {}", written.UnwrapErr().message);
        }
    }

    Result<Unit, ProtocolFailure> WriteFrames(
        interfaces::IByteStream& stream,
        const std::vector<std::vector<uint8_t>>& frames,
        std::chrono::milliseconds timeout) {
        for (const auto& frame : frames) {
            auto written = stream.WriteAll(frame, timeout);
            if (written.IsErr()) {
                return written;
            }
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    /// Drives @p handshake to Established, sending @p initial first. On failure
    /// the peer only ever sees a generic handshake_failure alert.
    Result<SessionKeys, ProtocolFailure> RunHandshake(
        HandshakeEngine& handshake,
        interfaces::IByteStream& stream,
        StepResult initial,
        const ChannelConfig& config) {
        auto fail = [&](ProtocolFailure failure) {
            handshake.Abort(failure);
            if (failure.type != ProtocolFailureType::ConnectionClosed) {
                SendAlert(stream, AlertDescription::HandshakeFailure, config.handshake_timeout);
            }
            stream.Close();
            return Result<SessionKeys, ProtocolFailure>::Err(std::move(failure));
        };

        StepResult step = std::move(initial);
        while (true) {
            if (step.error) {
                return fail(std::move(*step.error));
            }
            if (auto written = WriteFrames(stream, step.outgoing, config.handshake_timeout);
                written.IsErr()) {
                return fail(std::move(written).UnwrapErr());
            }
            if (step.state == ConnectionState::Established) {
                break;
            }
            auto frame = ReadFrame(stream, config.max_message_bytes, config.handshake_timeout);
            if (frame.IsErr()) {
                return fail(std::move(frame).UnwrapErr());
            }
            step = handshake.Step(frame.Unwrap());
        }

        auto keys = handshake.TakeSession();
        if (keys.IsErr()) {
            return fail(std::move(keys).UnwrapErr());
        }
        return keys;
    }
}

// ============================================================================
// SecureChannel
// ============================================================================

SecureChannel::SecureChannel(
    std::shared_ptr<interfaces::IByteStream> stream,
    RecordLayer records,
    ChannelConfig config,
    std::optional<identity::Certificate> peer_certificate)
    : stream_(std::move(stream))
    , records_(std::move(records))
    , config_(std::move(config))
    , peer_certificate_(std::move(peer_certificate)) {}

SecureChannel::~SecureChannel() {
    Close();
}

template<typename T>
Result<T, ProtocolFailure> SecureChannel::Abandon(ProtocolFailure failure) {
    open_ = false;
    if (stream_) {
        stream_->Close();
    }
    return Result<T, ProtocolFailure>::Err(std::move(failure));
}

Result<Unit, ProtocolFailure> SecureChannel::Send(std::span<const uint8_t> message) {
    if (!open_ || !stream_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::ConnectionClosed("Secure channel is closed"));
    }
    if (message.size() > config_.max_application_message_bytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Message of {} bytes exceeds maximum {}",
                    message.size(), config_.max_application_message_bytes)));
    }

    std::vector<uint8_t> framed;
    framed.reserve(kApplicationLengthPrefixBytes + message.size());
    AppendUint32BE(framed, static_cast<uint32_t>(message.size()));
    framed.insert(framed.end(), message.begin(), message.end());

    std::vector<uint8_t> wire;
    const std::span<const uint8_t> remaining_all(framed);
    for (size_t offset = 0; offset < framed.size(); offset += kMaxRecordPlaintextBytes) {
        const size_t chunk = std::min(kMaxRecordPlaintextBytes, framed.size() - offset);
        auto record = records_.Encrypt(remaining_all.subspan(offset, chunk));
        if (record.IsErr()) {
            return Abandon<Unit>(std::move(record).UnwrapErr());
        }
        const auto& bytes = record.Unwrap();
        wire.insert(wire.end(), bytes.begin(), bytes.end());
    }

    auto written = stream_->WriteAll(wire, config_.record_timeout);
    if (written.IsErr()) {
        return Abandon<Unit>(std::move(written).UnwrapErr());
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> SecureChannel::Receive() {
    using ResultType = Result<std::vector<uint8_t>, ProtocolFailure>;

    if (!open_ || !stream_) {
        return ResultType::Err(ProtocolFailure::ConnectionClosed("Secure channel is closed"));
    }

    std::vector<uint8_t> message;
    std::optional<size_t> expected;
    while (!expected || message.size() < *expected) {
        auto frame = ReadFrame(*stream_, kMaxRecordFrameBytes, config_.record_timeout);
        if (frame.IsErr()) {
            return Abandon<std::vector<uint8_t>>(std::move(frame).UnwrapErr());
        }
        auto plaintext = records_.Decrypt(frame.Unwrap());
        if (plaintext.IsErr()) {
            return Abandon<std::vector<uint8_t>>(std::move(plaintext).UnwrapErr());
        }
        auto chunk = std::move(plaintext).Unwrap();
        std::span<const uint8_t> body(chunk);

        if (!expected) {
            if (chunk.size() < kApplicationLengthPrefixBytes) {
                return Abandon<std::vector<uint8_t>>(
                    ProtocolFailure::MalformedMessage("First record of a message lacks the length prefix"));
            }
            const size_t length = ReadUint32BE(body);
            if (length > config_.max_application_message_bytes) {
                return Abandon<std::vector<uint8_t>>(ProtocolFailure::MalformedMessage(
                    fmt::format("Incoming message of {} bytes exceeds maximum {}",
                        length, config_.max_application_message_bytes)));
            }
            expected = length;
            message.reserve(length);
            body = body.subspan(kApplicationLengthPrefixBytes);
        }
        if (message.size() + body.size() > *expected) {
            return Abandon<std::vector<uint8_t>>(
                ProtocolFailure::MalformedMessage("Record overruns the declared message length"));
        }
        message.insert(message.end(), body.begin(), body.end());
    }
    return ResultType::Ok(std::move(message));
}

Result<std::vector<uint8_t>, ProtocolFailure> SecureChannel::SendRequest(std::span<const uint8_t> request) {
    if (auto sent = Send(request); sent.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(sent).UnwrapErr());
    }
    return Receive();
}

void SecureChannel::Close() noexcept {
    if (!open_ || !stream_) {
        return;
    }
    open_ = false;
    if (!records_.IsFailed()) {
        try {
            SendAlert(*stream_, AlertDescription::CloseNotify, config_.record_timeout);
        } catch (const std::exception&) {
            // close_notify is advisory; the stream is closed below either way.
        }
    }
    stream_->Close();
}

// ============================================================================
// Session establishment
// ============================================================================

Result<SecureChannel, ProtocolFailure> OpenClientSession(
    std::shared_ptr<interfaces::IByteStream> stream,
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme,
    const ChannelConfig& config) {
    if (!stream || !kem || !signature_scheme) {
        return Result<SecureChannel, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Client session needs a stream and KEM/signature capabilities"));
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<SecureChannel, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
    }

    ClientHandshake handshake(std::move(kem), std::move(signature_scheme), config.ToHandshakeOptions());
    auto keys = RunHandshake(handshake, *stream, handshake.Start(), config);
    if (keys.IsErr()) {
        Logging::Get()->warn("Client handshake failed: {}: {}",
            ToString(keys.UnwrapErr().type), keys.UnwrapErr().message);
        return Result<SecureChannel, ProtocolFailure>::Err(std::move(keys).UnwrapErr());
    }

    Logging::Get()->info("Client session established with '{}'",
        handshake.ServerCertificate() ? handshake.ServerCertificate()->Subject() : std::string());
    return Result<SecureChannel, ProtocolFailure>::Ok(SecureChannel(
        std::move(stream),
        RecordLayer(std::move(keys).Unwrap(), Role::Client),
        config,
        handshake.ServerCertificate()));
}

Result<SecureChannel, ProtocolFailure> ConnectClient(
    const std::string& host,
    const uint16_t port,
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme,
    const ChannelConfig& config) {
    auto stream = TcpByteStream::Connect(host, port, config.connect_timeout);
    if (stream.IsErr()) {
        return Result<SecureChannel, ProtocolFailure>::Err(std::move(stream).UnwrapErr());
    }
    return OpenClientSession(std::move(stream).Unwrap(), std::move(kem), std::move(signature_scheme), config);
}

Result<SecureChannel, ProtocolFailure> AcceptServerSession(
    std::shared_ptr<interfaces::IByteStream> stream,
    std::shared_ptr<const identity::ServerIdentity> identity,
    const ChannelConfig& config) {
    if (!stream || !identity) {
        return Result<SecureChannel, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Server session needs a stream and an identity"));
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<SecureChannel, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
    }

    ServerHandshake handshake(std::move(identity), config.ToHandshakeOptions());
    auto keys = RunHandshake(handshake, *stream, StepResult{ConnectionState::Idle, {}, std::nullopt}, config);
    if (keys.IsErr()) {
        Logging::Get()->warn("Server handshake failed: {}: {}",
            ToString(keys.UnwrapErr().type), keys.UnwrapErr().message);
        return Result<SecureChannel, ProtocolFailure>::Err(std::move(keys).UnwrapErr());
    }
    return Result<SecureChannel, ProtocolFailure>::Ok(SecureChannel(
        std::move(stream),
        RecordLayer(std::move(keys).Unwrap(), Role::Server),
        config,
        std::nullopt));
}

}  // namespace kemtls::protocol::transport
