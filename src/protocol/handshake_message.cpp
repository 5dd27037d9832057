#include "kemtls/protocol/handshake_message.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <string>

namespace kemtls::protocol {

namespace {
    template<class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };
    template<class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    template<size_t N>
    void AppendArray(std::vector<uint8_t>& out, const std::array<uint8_t, N>& bytes) {
        out.insert(out.end(), bytes.begin(), bytes.end());
    }

    template<size_t N>
    std::array<uint8_t, N> CopyArray(std::span<const uint8_t> bytes) {
        std::array<uint8_t, N> out{};
        std::copy_n(bytes.begin(), N, out.begin());
        return out;
    }

    Result<HandshakeMessage, ProtocolFailure> Malformed(MessageType type, std::string detail) {
        return Result<HandshakeMessage, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage(
                fmt::format("{}: {}", ToString(type), detail)));
    }

    std::vector<uint8_t> SerializePayload(const HandshakeMessage& message) {
        std::vector<uint8_t> payload;
        std::visit(Overloaded{
            [&](const ClientHello& m) {
                payload.reserve(m.ephemeral_public_key.size() + kHandshakeNonceBytes);
                payload.insert(payload.end(), m.ephemeral_public_key.begin(), m.ephemeral_public_key.end());
                AppendArray(payload, m.client_nonce);
            },
            [&](const ServerHello& m) {
                payload.reserve(m.kem_ciphertext.size() + kHandshakeNonceBytes + m.certificate.size());
                payload.insert(payload.end(), m.kem_ciphertext.begin(), m.kem_ciphertext.end());
                AppendArray(payload, m.server_nonce);
                payload.insert(payload.end(), m.certificate.begin(), m.certificate.end());
            },
            [&](const ServerFinished& m) { AppendArray(payload, m.mac); },
            [&](const ClientFinished& m) { AppendArray(payload, m.mac); },
            [&](const Record& m) { payload = m.ciphertext; },
            [&](const Alert& m) { payload.push_back(static_cast<uint8_t>(m.description)); }
        }, message);
        return payload;
    }
}

MessageType TypeOf(const HandshakeMessage& message) noexcept {
    return std::visit(Overloaded{
        [](const ClientHello&) { return MessageType::ClientHello; },
        [](const ServerHello&) { return MessageType::ServerHello; },
        [](const ServerFinished&) { return MessageType::ServerFinished; },
        [](const ClientFinished&) { return MessageType::ClientFinished; },
        [](const Record&) { return MessageType::Record; },
        [](const Alert&) { return MessageType::Alert; }
    }, message);
}

Result<std::vector<uint8_t>, ProtocolFailure> EncodeMessage(const HandshakeMessage& message) {
    const auto payload = SerializePayload(message);
    return WireCodec::Encode(TypeOf(message), payload);
}

Result<HandshakeMessage, ProtocolFailure> ParseMessage(
    const DecodedFrame& frame,
    const size_t kem_ciphertext_size) {
    const std::span<const uint8_t> payload(frame.payload);

    switch (frame.type) {
        case MessageType::ClientHello: {
            if (payload.size() <= kHandshakeNonceBytes) {
                return Malformed(frame.type,
                    fmt::format("payload of {} bytes leaves no room for a public key", payload.size()));
            }
            const size_t key_len = payload.size() - kHandshakeNonceBytes;
            ClientHello hello;
            hello.ephemeral_public_key.assign(payload.begin(), payload.begin() + key_len);
            hello.client_nonce = CopyArray<kHandshakeNonceBytes>(payload.subspan(key_len));
            return Result<HandshakeMessage, ProtocolFailure>::Ok(std::move(hello));
        }
        case MessageType::ServerHello: {
            if (kem_ciphertext_size == 0 ||
                payload.size() <= kem_ciphertext_size + kHandshakeNonceBytes) {
                return Malformed(frame.type,
                    fmt::format("payload of {} bytes is too short for a {}-byte ciphertext, nonce and certificate",
                        payload.size(), kem_ciphertext_size));
            }
            ServerHello hello;
            hello.kem_ciphertext.assign(payload.begin(), payload.begin() + kem_ciphertext_size);
            hello.server_nonce = CopyArray<kHandshakeNonceBytes>(
                payload.subspan(kem_ciphertext_size, kHandshakeNonceBytes));
            const auto cert = payload.subspan(kem_ciphertext_size + kHandshakeNonceBytes);
            hello.certificate.assign(cert.begin(), cert.end());
            return Result<HandshakeMessage, ProtocolFailure>::Ok(std::move(hello));
        }
        case MessageType::ServerFinished:
        case MessageType::ClientFinished: {
            if (payload.size() != kFinishedMacBytes) {
                return Malformed(frame.type,
                    fmt::format("MAC must be {} bytes, got {}", kFinishedMacBytes, payload.size()));
            }
            const auto mac = CopyArray<kFinishedMacBytes>(payload);
            if (frame.type == MessageType::ServerFinished) {
                return Result<HandshakeMessage, ProtocolFailure>::Ok(ServerFinished{mac});
            }
            return Result<HandshakeMessage, ProtocolFailure>::Ok(ClientFinished{mac});
        }
        case MessageType::Record: {
            if (payload.size() < kAesGcmTagBytes) {
                return Malformed(frame.type,
                    fmt::format("record of {} bytes is shorter than the AEAD tag", payload.size()));
            }
            return Result<HandshakeMessage, ProtocolFailure>::Ok(Record{frame.payload});
        }
        case MessageType::Alert: {
            if (payload.size() != 1) {
                return Malformed(frame.type,
                    fmt::format("alert must be 1 byte, got {}", payload.size()));
            }
            const auto description = static_cast<AlertDescription>(payload[0]);
            if (description != AlertDescription::CloseNotify &&
                description != AlertDescription::HandshakeFailure) {
                return Malformed(frame.type,
                    fmt::format("unknown alert description 0x{:02x}", payload[0]));
            }
            return Result<HandshakeMessage, ProtocolFailure>::Ok(Alert{description});
        }
    }
    return Malformed(frame.type, "unhandled message type");
}

}  // namespace kemtls::protocol
