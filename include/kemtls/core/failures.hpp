#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace kemtls::protocol {

enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    InvalidOperation
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Failure taxonomy of the handshake engine. Every kind is terminal for the
/// connection that produced it; callers retry only with a brand-new session.
enum class ProtocolFailureType {
    MalformedMessage,
    ProtocolViolation,
    AuthenticationFailure,
    CryptoError,
    Timeout,
    ConnectionClosed,
    InvalidInput,
    InvalidState,
    Io
};

class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;

    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static ProtocolFailure MalformedMessage(std::string msg) {
        return {ProtocolFailureType::MalformedMessage, std::move(msg)};
    }
    static ProtocolFailure ProtocolViolation(std::string msg) {
        return {ProtocolFailureType::ProtocolViolation, std::move(msg)};
    }
    static ProtocolFailure AuthenticationFailure(std::string msg) {
        return {ProtocolFailureType::AuthenticationFailure, std::move(msg)};
    }
    static ProtocolFailure CryptoError(std::string msg) {
        return {ProtocolFailureType::CryptoError, std::move(msg)};
    }
    static ProtocolFailure Timeout(std::string msg) {
        return {ProtocolFailureType::Timeout, std::move(msg)};
    }
    static ProtocolFailure ConnectionClosed(std::string msg) {
        return {ProtocolFailureType::ConnectionClosed, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Io(std::string msg) {
        return {ProtocolFailureType::Io, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return CryptoError(sf.message);
    }

    /// Text safe to show to a peer or an end user. Cryptographic and sequencing
    /// failures collapse into one string so the step that failed is not revealed.
    [[nodiscard]] std::string_view PublicMessage() const noexcept {
        switch (type) {
            case ProtocolFailureType::Timeout:
                return "connection timed out";
            case ProtocolFailureType::ConnectionClosed:
            case ProtocolFailureType::Io:
                return "connection closed";
            case ProtocolFailureType::MalformedMessage:
            case ProtocolFailureType::ProtocolViolation:
            case ProtocolFailureType::AuthenticationFailure:
            case ProtocolFailureType::CryptoError:
            case ProtocolFailureType::InvalidInput:
            case ProtocolFailureType::InvalidState:
                break;
        }
        return "secure channel could not be established";
    }
};

[[nodiscard]] constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::MalformedMessage: return "MalformedMessage";
        case ProtocolFailureType::ProtocolViolation: return "ProtocolViolation";
        case ProtocolFailureType::AuthenticationFailure: return "AuthenticationFailure";
        case ProtocolFailureType::CryptoError: return "CryptoError";
        case ProtocolFailureType::Timeout: return "Timeout";
        case ProtocolFailureType::ConnectionClosed: return "ConnectionClosed";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::Io: return "Io";
    }
    return "Unknown";
}

}  // namespace kemtls::protocol
