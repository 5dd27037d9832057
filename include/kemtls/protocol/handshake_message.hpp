#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/protocol/constants.hpp"
#include "kemtls/protocol/wire_codec.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace kemtls::protocol {

using HandshakeNonce = std::array<uint8_t, kHandshakeNonceBytes>;
using FinishedMac = std::array<uint8_t, kFinishedMacBytes>;

struct ClientHello {
    std::vector<uint8_t> ephemeral_public_key;
    HandshakeNonce client_nonce{};
};

struct ServerHello {
    std::vector<uint8_t> kem_ciphertext;
    HandshakeNonce server_nonce{};
    std::vector<uint8_t> certificate;
};

struct ServerFinished {
    FinishedMac mac{};
};

struct ClientFinished {
    FinishedMac mac{};
};

/// AEAD output of one record, tag included.
struct Record {
    std::vector<uint8_t> ciphertext;
};

enum class AlertDescription : uint8_t {
    CloseNotify = 0x00,
    HandshakeFailure = 0x28
};

struct Alert {
    AlertDescription description = AlertDescription::HandshakeFailure;
};

using HandshakeMessage = std::variant<
    ClientHello,
    ServerHello,
    ServerFinished,
    ClientFinished,
    Record,
    Alert>;

[[nodiscard]] MessageType TypeOf(const HandshakeMessage& message) noexcept;

/// Serializes the payload and wraps it in a frame.
[[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> EncodeMessage(
    const HandshakeMessage& message);

/**
 * @brief Interprets a decoded frame as a typed message.
 *
 * The KEM ciphertext inside a ServerHello carries no length of its own;
 * its width is fixed by the KEM in use and is passed in.
 */
[[nodiscard]] Result<HandshakeMessage, ProtocolFailure> ParseMessage(
    const DecodedFrame& frame,
    size_t kem_ciphertext_size);

}  // namespace kemtls::protocol
