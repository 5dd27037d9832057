#pragma once
#include "kemtls/core/failures.hpp"
#include "kemtls/core/result.hpp"
#include "kemtls/crypto/secure_memory_handle.hpp"
#include "kemtls/debug/key_logger.hpp"
#include "kemtls/identity/server_identity.hpp"
#include "kemtls/interfaces/i_key_encapsulation.hpp"
#include "kemtls/interfaces/i_signature_scheme.hpp"
#include "kemtls/protocol/handshake_message.hpp"
#include "kemtls/protocol/key_schedule.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kemtls::protocol {

enum class ConnectionState : uint8_t {
    Idle,
    AwaitServerHello,
    AwaitFinished,
    Established,
    Failed
};

[[nodiscard]] std::string_view ToString(ConnectionState state) noexcept;

/// Source of handshake nonces. Must return exactly the requested count.
using RandomBytesFn = std::function<std::vector<uint8_t>(size_t)>;

[[nodiscard]] RandomBytesFn DefaultRandomSource();

/**
 * @brief Outcome of one handshake step.
 *
 * @p outgoing holds fully encoded frames to send in order. @p error is set
 * when the step failed; for peer-driven failures the state is then Failed.
 */
struct StepResult {
    ConnectionState state = ConnectionState::Idle;
    std::vector<std::vector<uint8_t>> outgoing;
    std::optional<ProtocolFailure> error;

    [[nodiscard]] bool Ok() const noexcept { return !error.has_value(); }
};

struct HandshakeOptions {
    size_t max_message_bytes = kDefaultMaxMessageBytes;
    /// Client only: reject certificates whose subject differs.
    std::optional<std::string> expected_subject;
    /// Nonce source; libsodium when empty.
    RandomBytesFn random;
};

/**
 * @brief State shared by both handshake roles.
 *
 * A handshake is a pure step function over encoded frames: it performs no
 * I/O. States only move forward and Failed is absorbing. Every failure
 * wipes derived keys and ephemeral secrets before it is reported.
 */
class HandshakeEngine {
public:
    virtual ~HandshakeEngine();

    HandshakeEngine(const HandshakeEngine&) = delete;
    HandshakeEngine& operator=(const HandshakeEngine&) = delete;

    /**
     * @brief Feeds exactly one encoded frame received from the peer.
     *
     * Once Established the record layer owns the connection: any further
     * frame is a ProtocolViolation and leaves the state and keys untouched.
     * In Failed every call is an InvalidState.
     */
    [[nodiscard]] StepResult Step(std::span<const uint8_t> frame);

    /// Forces Failed from any in-progress state (cancellation, timeouts).
    StepResult Abort(ProtocolFailure reason);

    /// Hands the session keys over. Valid once, and only when Established.
    [[nodiscard]] Result<SessionKeys, ProtocolFailure> TakeSession();

    [[nodiscard]] ConnectionState State() const noexcept { return state_; }
    [[nodiscard]] bool IsEstablished() const noexcept { return state_ == ConnectionState::Established; }
    [[nodiscard]] const std::optional<ProtocolFailure>& Failure() const noexcept { return failure_; }

    /// Keys of an established session that has not been taken yet.
    [[nodiscard]] const SessionKeys* Keys() const noexcept;

    [[nodiscard]] std::span<const uint8_t> Transcript() const noexcept { return transcript_; }

protected:
    HandshakeEngine(debug::Side side, size_t kem_ciphertext_size, HandshakeOptions options);

    virtual StepResult OnMessage(HandshakeMessage message, std::span<const uint8_t> frame) = 0;
    virtual void WipeEphemeral() noexcept {}

    StepResult Fail(ProtocolFailure failure);
    StepResult Advance(ConnectionState next, std::vector<std::vector<uint8_t>> outgoing = {});
    StepResult Unexpected(const HandshakeMessage& message);

    Result<HandshakeNonce, ProtocolFailure> GenerateNonce();
    void AppendTranscript(std::span<const uint8_t> frame);
    Result<Unit, ProtocolFailure> InstallKeys(
        std::span<const uint8_t> shared_secret,
        const HandshakeNonce& client_nonce,
        const HandshakeNonce& server_nonce);
    Result<std::vector<uint8_t>, ProtocolFailure> FinishedFrame(MessageType type);
    Result<Unit, ProtocolFailure> VerifyFinished(const FinishedMac& mac) const;

    [[nodiscard]] debug::Side GetSide() const noexcept { return side_; }
    [[nodiscard]] const HandshakeOptions& Options() const noexcept { return options_; }

private:
    debug::Side side_;
    size_t kem_ciphertext_size_;
    HandshakeOptions options_;
    ConnectionState state_ = ConnectionState::Idle;
    std::optional<ProtocolFailure> failure_;
    std::optional<SessionKeys> keys_;
    bool session_taken_ = false;
    std::vector<uint8_t> transcript_;
};

/**
 * @brief Client role.
 *
 * Idle --Start()--> AwaitServerHello --ServerHello--> AwaitFinished
 *      --ServerFinished / emits ClientFinished--> Established
 *
 * A fresh ephemeral KEM key pair is generated by Start() and destroyed as soon
 * as the ServerHello ciphertext has been decapsulated, or on failure.
 */
class ClientHandshake final : public HandshakeEngine {
public:
    ClientHandshake(
        std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
        std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme,
        HandshakeOptions options = {});

    ~ClientHandshake() override;

    /// Emits the ClientHello. Only valid in Idle.
    [[nodiscard]] StepResult Start();

    /// Certificate presented by the server, once it has verified.
    [[nodiscard]] const std::optional<identity::Certificate>& ServerCertificate() const noexcept {
        return server_certificate_;
    }

protected:
    StepResult OnMessage(HandshakeMessage message, std::span<const uint8_t> frame) override;
    void WipeEphemeral() noexcept override;

private:
    StepResult OnServerHello(const ServerHello& hello, std::span<const uint8_t> frame);
    StepResult OnServerFinished(const ServerFinished& finished, std::span<const uint8_t> frame);

    std::shared_ptr<const interfaces::IKeyEncapsulation> kem_;
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme_;
    crypto::SecureMemoryHandle ephemeral_secret_;
    HandshakeNonce client_nonce_{};
    std::optional<identity::Certificate> server_certificate_;
};

/**
 * @brief Server role.
 *
 * Idle --ClientHello / emits ServerHello, ServerFinished--> AwaitFinished
 *      --ClientFinished--> Established
 */
class ServerHandshake final : public HandshakeEngine {
public:
    explicit ServerHandshake(
        std::shared_ptr<const identity::ServerIdentity> identity,
        HandshakeOptions options = {});

    ~ServerHandshake() override;

protected:
    StepResult OnMessage(HandshakeMessage message, std::span<const uint8_t> frame) override;

private:
    StepResult OnClientHello(const ClientHello& hello, std::span<const uint8_t> frame);
    StepResult OnClientFinished(const ClientFinished& finished, std::span<const uint8_t> frame);

    std::shared_ptr<const identity::ServerIdentity> identity_;
};

}  // namespace kemtls::protocol
