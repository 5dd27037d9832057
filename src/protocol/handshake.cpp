#include "kemtls/protocol/handshake.hpp"
#include "kemtls/core/constants.hpp"
#include "kemtls/core/logging.hpp"
#include "kemtls/crypto/sodium_interop.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace kemtls::protocol {

using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

namespace {
    const char* SideName(const debug::Side side) {
        return side == debug::Side::Client ? "client" : "server";
    }

    size_t CiphertextSizeOf(const std::shared_ptr<const identity::ServerIdentity>& identity) {
        return identity ? identity->Kem().CiphertextSize() : 0;
    }
}

std::string_view ToString(const ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Idle: return "Idle";
        case ConnectionState::AwaitServerHello: return "AwaitServerHello";
        case ConnectionState::AwaitFinished: return "AwaitFinished";
        case ConnectionState::Established: return "Established";
        case ConnectionState::Failed: return "Failed";
    }
    return "Unknown";
}

RandomBytesFn DefaultRandomSource() {
    return [](const size_t size) { return SodiumInterop::GetRandomBytes(size); };
}

// ============================================================================
// HandshakeEngine
// ============================================================================

HandshakeEngine::HandshakeEngine(
    const debug::Side side,
    const size_t kem_ciphertext_size,
    HandshakeOptions options)
    : side_(side)
    , kem_ciphertext_size_(kem_ciphertext_size)
    , options_(std::move(options)) {
    if (!options_.random) {
        options_.random = DefaultRandomSource();
    }
}

HandshakeEngine::~HandshakeEngine() {
    auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(transcript_));
    (void)wiped;
}

StepResult HandshakeEngine::Step(std::span<const uint8_t> frame) {
    if (state_ == ConnectionState::Failed) {
        return StepResult{state_, {}, ProtocolFailure::InvalidState(
            fmt::format("{} ({})", ErrorMessages::HANDSHAKE_TERMINATED, ToString(state_)))};
    }
    if (state_ == ConnectionState::Established) {
        return StepResult{state_, {}, ProtocolFailure::ProtocolViolation(
            fmt::format("{}: handshake frame after {}", ErrorMessages::UNEXPECTED_MESSAGE, ToString(state_)))};
    }

    auto decoded = WireCodec::Decode(frame, options_.max_message_bytes);
    if (decoded.IsErr()) {
        return Fail(std::move(decoded).UnwrapErr());
    }
    const auto& decoded_frame = decoded.Unwrap();
    if (decoded_frame.bytes_consumed != frame.size()) {
        return Fail(ProtocolFailure::MalformedMessage(
            fmt::format("{} trailing bytes after {} frame",
                frame.size() - decoded_frame.bytes_consumed, ToString(decoded_frame.type))));
    }

    auto parsed = ParseMessage(decoded_frame, kem_ciphertext_size_);
    if (parsed.IsErr()) {
        return Fail(std::move(parsed).UnwrapErr());
    }
    auto message = std::move(parsed).Unwrap();
    if (const auto* alert = std::get_if<Alert>(&message)) {
        return Fail(ProtocolFailure::ConnectionClosed(
            fmt::format("Peer sent alert 0x{:02x}", static_cast<uint8_t>(alert->description))));
    }
    return OnMessage(std::move(message), frame);
}

StepResult HandshakeEngine::Abort(ProtocolFailure reason) {
    if (state_ == ConnectionState::Failed || state_ == ConnectionState::Established) {
        return StepResult{state_, {}, std::nullopt};
    }
    return Fail(std::move(reason));
}

Result<SessionKeys, ProtocolFailure> HandshakeEngine::TakeSession() {
    if (state_ != ConnectionState::Established) {
        return Result<SessionKeys, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                fmt::format("Session keys are unavailable in state {}", ToString(state_))));
    }
    if (session_taken_ || !keys_) {
        return Result<SessionKeys, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Session keys were already taken"));
    }
    session_taken_ = true;
    SessionKeys keys = std::move(*keys_);
    keys_.reset();
    return Result<SessionKeys, ProtocolFailure>::Ok(std::move(keys));
}

const SessionKeys* HandshakeEngine::Keys() const noexcept {
    if (state_ != ConnectionState::Established || !keys_) {
        return nullptr;
    }
    return &*keys_;
}

StepResult HandshakeEngine::Fail(ProtocolFailure failure) {
    Logging::Get()->debug("{} handshake failed in {}: {}: {}",
        SideName(side_), ToString(state_), ToString(failure.type), failure.message);

    state_ = ConnectionState::Failed;
    keys_.reset();
    WipeEphemeral();
    auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(transcript_));
    (void)wiped;
    transcript_.clear();
    failure_ = failure;
    return StepResult{state_, {}, std::move(failure)};
}

StepResult HandshakeEngine::Advance(
    const ConnectionState next,
    std::vector<std::vector<uint8_t>> outgoing) {
    Logging::Get()->trace("{} handshake {} -> {}", SideName(side_), ToString(state_), ToString(next));
    state_ = next;
    return StepResult{state_, std::move(outgoing), std::nullopt};
}

StepResult HandshakeEngine::Unexpected(const HandshakeMessage& message) {
    return Fail(ProtocolFailure::ProtocolViolation(
        fmt::format("{}: {} in {}",
            ErrorMessages::UNEXPECTED_MESSAGE, ToString(TypeOf(message)), ToString(state_))));
}

Result<HandshakeNonce, ProtocolFailure> HandshakeEngine::GenerateNonce() {
    const auto bytes = options_.random(kHandshakeNonceBytes);
    if (bytes.size() != kHandshakeNonceBytes) {
        return Result<HandshakeNonce, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(
                fmt::format("Random source returned {} bytes, expected {}",
                    bytes.size(), kHandshakeNonceBytes)));
    }
    HandshakeNonce nonce{};
    std::copy(bytes.begin(), bytes.end(), nonce.begin());
    return Result<HandshakeNonce, ProtocolFailure>::Ok(nonce);
}

void HandshakeEngine::AppendTranscript(std::span<const uint8_t> frame) {
    transcript_.insert(transcript_.end(), frame.begin(), frame.end());
}

Result<Unit, ProtocolFailure> HandshakeEngine::InstallKeys(
    std::span<const uint8_t> shared_secret,
    const HandshakeNonce& client_nonce,
    const HandshakeNonce& server_nonce) {
    auto derived = KeySchedule::Derive(shared_secret, client_nonce, server_nonce);
    if (derived.IsErr()) {
        auto failure = std::move(derived).UnwrapErr();
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::CryptoError(failure.message));
    }
    keys_.emplace(std::move(derived).Unwrap());
    debug::LogSessionKeys(side_, keys_->Enc(), keys_->Mac(), keys_->IvBytes());
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> HandshakeEngine::FinishedFrame(const MessageType type) {
    auto mac = KeySchedule::ComputeTranscriptMac(keys_->Mac(), transcript_);
    if (mac.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(mac).UnwrapErr());
    }
    debug::LogTranscriptMac(side_, type == MessageType::ServerFinished ? "server_finished" : "client_finished",
        mac.Unwrap());
    if (type == MessageType::ServerFinished) {
        return EncodeMessage(ServerFinished{mac.Unwrap()});
    }
    return EncodeMessage(ClientFinished{mac.Unwrap()});
}

Result<Unit, ProtocolFailure> HandshakeEngine::VerifyFinished(const FinishedMac& mac) const {
    if (!keys_ || !KeySchedule::VerifyTranscriptMac(keys_->Mac(), transcript_, mac)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailure("Finished MAC does not match transcript"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

// ============================================================================
// ClientHandshake
// ============================================================================

ClientHandshake::ClientHandshake(
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme,
    HandshakeOptions options)
    : HandshakeEngine(debug::Side::Client, kem ? kem->CiphertextSize() : 0, std::move(options))
    , kem_(std::move(kem))
    , signature_scheme_(std::move(signature_scheme)) {}

ClientHandshake::~ClientHandshake() {
    WipeEphemeral();
}

void ClientHandshake::WipeEphemeral() noexcept {
    ephemeral_secret_ = SecureMemoryHandle();
}

StepResult ClientHandshake::Start() {
    if (State() != ConnectionState::Idle) {
        return StepResult{State(), {}, ProtocolFailure::InvalidState(
            fmt::format("Start() called in state {}", ToString(State())))};
    }
    if (!kem_ || !signature_scheme_) {
        return Fail(ProtocolFailure::InvalidState("Client handshake has no KEM or signature capability"));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Fail(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto key_pair = kem_->GenerateKeyPair();
    if (key_pair.IsErr()) {
        return Fail(ProtocolFailure::CryptoError(key_pair.UnwrapErr().message));
    }
    auto keys = std::move(key_pair).Unwrap();
    if (keys.public_key.size() != kem_->PublicKeySize()) {
        return Fail(ProtocolFailure::CryptoError("Ephemeral public key has unexpected length"));
    }
    ephemeral_secret_ = std::move(keys.secret_key);

    auto nonce = GenerateNonce();
    if (nonce.IsErr()) {
        return Fail(std::move(nonce).UnwrapErr());
    }
    client_nonce_ = nonce.Unwrap();
    debug::LogEphemeralKeyGenerated(GetSide(), keys.public_key);

    auto hello = EncodeMessage(ClientHello{std::move(keys.public_key), client_nonce_});
    if (hello.IsErr()) {
        return Fail(std::move(hello).UnwrapErr());
    }
    auto frame = std::move(hello).Unwrap();
    AppendTranscript(frame);

    std::vector<std::vector<uint8_t>> outgoing;
    outgoing.push_back(std::move(frame));
    return Advance(ConnectionState::AwaitServerHello, std::move(outgoing));
}

StepResult ClientHandshake::OnMessage(HandshakeMessage message, std::span<const uint8_t> frame) {
    if (State() == ConnectionState::AwaitServerHello) {
        if (const auto* hello = std::get_if<ServerHello>(&message)) {
            return OnServerHello(*hello, frame);
        }
    } else if (State() == ConnectionState::AwaitFinished) {
        if (const auto* finished = std::get_if<ServerFinished>(&message)) {
            return OnServerFinished(*finished, frame);
        }
    }
    return Unexpected(message);
}

StepResult ClientHandshake::OnServerHello(const ServerHello& hello, std::span<const uint8_t> frame) {
    auto parsed = identity::Certificate::Parse(hello.certificate);
    if (parsed.IsErr()) {
        return Fail(std::move(parsed).UnwrapErr());
    }
    auto certificate = std::move(parsed).Unwrap();
    if (!certificate.Verify(*signature_scheme_)) {
        return Fail(ProtocolFailure::AuthenticationFailure("Server certificate signature does not verify"));
    }
    const auto& expected_subject = Options().expected_subject;
    if (expected_subject && certificate.Subject() != *expected_subject) {
        return Fail(ProtocolFailure::AuthenticationFailure(
            fmt::format("Server certificate subject '{}' does not match expected '{}'",
                certificate.Subject(), *expected_subject)));
    }

    auto decapsulated = kem_->Decapsulate(ephemeral_secret_, hello.kem_ciphertext);
    WipeEphemeral();
    if (decapsulated.IsErr()) {
        return Fail(ProtocolFailure::CryptoError(decapsulated.UnwrapErr().message));
    }
    auto shared_secret = std::move(decapsulated).Unwrap();

    AppendTranscript(frame);
    auto installed = shared_secret.WithReadAccess([&](std::span<const uint8_t> secret) {
        debug::LogKemSharedSecret(GetSide(), hello.kem_ciphertext, secret);
        return InstallKeys(secret, client_nonce_, hello.server_nonce);
    });
    if (installed.IsErr()) {
        return Fail(ProtocolFailure::FromSodiumFailure(installed.UnwrapErr()));
    }
    if (auto& derive_result = installed.Unwrap(); derive_result.IsErr()) {
        return Fail(std::move(derive_result).UnwrapErr());
    }

    server_certificate_.emplace(std::move(certificate));
    return Advance(ConnectionState::AwaitFinished);
}

StepResult ClientHandshake::OnServerFinished(const ServerFinished& finished, std::span<const uint8_t> frame) {
    if (auto verified = VerifyFinished(finished.mac); verified.IsErr()) {
        return Fail(std::move(verified).UnwrapErr());
    }
    AppendTranscript(frame);

    auto client_finished = FinishedFrame(MessageType::ClientFinished);
    if (client_finished.IsErr()) {
        return Fail(std::move(client_finished).UnwrapErr());
    }
    auto out = std::move(client_finished).Unwrap();
    AppendTranscript(out);

    std::vector<std::vector<uint8_t>> outgoing;
    outgoing.push_back(std::move(out));
    return Advance(ConnectionState::Established, std::move(outgoing));
}

// ============================================================================
// ServerHandshake
// ============================================================================

ServerHandshake::ServerHandshake(
    std::shared_ptr<const identity::ServerIdentity> identity,
    HandshakeOptions options)
    : HandshakeEngine(debug::Side::Server, CiphertextSizeOf(identity), std::move(options))
    , identity_(std::move(identity)) {}

ServerHandshake::~ServerHandshake() = default;

StepResult ServerHandshake::OnMessage(HandshakeMessage message, std::span<const uint8_t> frame) {
    if (!identity_) {
        return Fail(ProtocolFailure::InvalidState("Server handshake has no identity"));
    }
    if (State() == ConnectionState::Idle) {
        if (const auto* hello = std::get_if<ClientHello>(&message)) {
            return OnClientHello(*hello, frame);
        }
    } else if (State() == ConnectionState::AwaitFinished) {
        if (const auto* finished = std::get_if<ClientFinished>(&message)) {
            return OnClientFinished(*finished, frame);
        }
    }
    return Unexpected(message);
}

StepResult ServerHandshake::OnClientHello(const ClientHello& hello, std::span<const uint8_t> frame) {
    const auto& kem = identity_->Kem();
    if (hello.ephemeral_public_key.size() != kem.PublicKeySize()) {
        return Fail(ProtocolFailure::MalformedMessage(
            fmt::format("ClientHello public key must be {} bytes for {}, got {}",
                kem.PublicKeySize(), kem.Name(), hello.ephemeral_public_key.size())));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Fail(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto encapsulated = kem.Encapsulate(hello.ephemeral_public_key);
    if (encapsulated.IsErr()) {
        return Fail(ProtocolFailure::CryptoError(encapsulated.UnwrapErr().message));
    }
    auto encapsulation = std::move(encapsulated).Unwrap();
    if (encapsulation.ciphertext.size() != kem.CiphertextSize()) {
        return Fail(ProtocolFailure::CryptoError("KEM ciphertext has unexpected length"));
    }

    auto nonce = GenerateNonce();
    if (nonce.IsErr()) {
        return Fail(std::move(nonce).UnwrapErr());
    }
    const HandshakeNonce server_nonce = nonce.Unwrap();

    AppendTranscript(frame);
    const auto certificate = identity_->CertificateBytes();
    auto server_hello = EncodeMessage(ServerHello{
        encapsulation.ciphertext,
        server_nonce,
        std::vector<uint8_t>(certificate.begin(), certificate.end())});
    if (server_hello.IsErr()) {
        return Fail(std::move(server_hello).UnwrapErr());
    }
    auto hello_frame = std::move(server_hello).Unwrap();
    AppendTranscript(hello_frame);

    auto installed = encapsulation.shared_secret.WithReadAccess([&](std::span<const uint8_t> secret) {
        debug::LogKemSharedSecret(GetSide(), encapsulation.ciphertext, secret);
        return InstallKeys(secret, hello.client_nonce, server_nonce);
    });
    encapsulation.shared_secret = SecureMemoryHandle();
    if (installed.IsErr()) {
        return Fail(ProtocolFailure::FromSodiumFailure(installed.UnwrapErr()));
    }
    if (auto& derive_result = installed.Unwrap(); derive_result.IsErr()) {
        return Fail(std::move(derive_result).UnwrapErr());
    }

    auto server_finished = FinishedFrame(MessageType::ServerFinished);
    if (server_finished.IsErr()) {
        return Fail(std::move(server_finished).UnwrapErr());
    }
    auto finished_frame = std::move(server_finished).Unwrap();
    AppendTranscript(finished_frame);

    std::vector<std::vector<uint8_t>> outgoing;
    outgoing.push_back(std::move(hello_frame));
    outgoing.push_back(std::move(finished_frame));
    return Advance(ConnectionState::AwaitFinished, std::move(outgoing));
}

StepResult ServerHandshake::OnClientFinished(const ClientFinished& finished, std::span<const uint8_t> frame) {
    if (auto verified = VerifyFinished(finished.mac); verified.IsErr()) {
        return Fail(std::move(verified).UnwrapErr());
    }
    AppendTranscript(frame);
    return Advance(ConnectionState::Established);
}

}  // namespace kemtls::protocol
