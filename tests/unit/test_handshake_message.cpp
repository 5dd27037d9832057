#include <catch2/catch_test_macros.hpp>
#include "kemtls/protocol/handshake_message.hpp"
#include <vector>
using namespace kemtls::protocol;

namespace {
    constexpr size_t kTestCiphertextBytes = 24;

    Result<HandshakeMessage, ProtocolFailure> Reparse(const std::vector<uint8_t>& frame) {
        auto decoded = WireCodec::Decode(frame);
        if (decoded.IsErr()) {
            return Result<HandshakeMessage, ProtocolFailure>::Err(std::move(decoded).UnwrapErr());
        }
        return ParseMessage(decoded.Unwrap(), kTestCiphertextBytes);
    }

    HandshakeNonce FilledNonce(uint8_t value) {
        HandshakeNonce nonce{};
        nonce.fill(value);
        return nonce;
    }
}

TEST_CASE("Handshake messages - Layout", "[wire][messages]") {
    SECTION("ClientHello is public key followed by 32-byte nonce") {
        const ClientHello hello{std::vector<uint8_t>(40, 0x11), FilledNonce(0x22)};
        auto frame = EncodeMessage(hello).Unwrap();
        REQUIRE(frame.size() == kFrameHeaderBytes + 40 + kHandshakeNonceBytes);
        REQUIRE(frame[0] == 0x01);
        REQUIRE(frame[kFrameHeaderBytes] == 0x11);
        REQUIRE(frame.back() == 0x22);

        auto parsed = Reparse(frame);
        REQUIRE(parsed.IsOk());
        const auto& back = std::get<ClientHello>(parsed.Unwrap());
        REQUIRE(back.ephemeral_public_key == hello.ephemeral_public_key);
        REQUIRE(back.client_nonce == hello.client_nonce);
    }
    SECTION("ServerHello splits ciphertext, nonce and certificate by KEM width") {
        const ServerHello hello{
            std::vector<uint8_t>(kTestCiphertextBytes, 0x33),
            FilledNonce(0x44),
            std::vector<uint8_t>{0x55, 0x56, 0x57}};
        auto parsed = Reparse(EncodeMessage(hello).Unwrap());
        REQUIRE(parsed.IsOk());
        const auto& back = std::get<ServerHello>(parsed.Unwrap());
        REQUIRE(back.kem_ciphertext == hello.kem_ciphertext);
        REQUIRE(back.server_nonce == hello.server_nonce);
        REQUIRE(back.certificate == hello.certificate);
    }
    SECTION("Alert carries one description byte") {
        auto frame = EncodeMessage(Alert{AlertDescription::HandshakeFailure}).Unwrap();
        REQUIRE(frame == std::vector<uint8_t>{0xFF, 0x00, 0x00, 0x00, 0x01, 0x28});
        auto close = EncodeMessage(Alert{AlertDescription::CloseNotify}).Unwrap();
        REQUIRE(close == std::vector<uint8_t>{0xFF, 0x00, 0x00, 0x00, 0x01, 0x00});
    }
    SECTION("TypeOf matches the encoded tag") {
        const HandshakeMessage finished = ClientFinished{};
        REQUIRE(TypeOf(finished) == MessageType::ClientFinished);
        REQUIRE(EncodeMessage(finished).Unwrap()[0] == 0x05);
    }
}

TEST_CASE("Handshake messages - Malformed payloads", "[wire][messages]") {
    auto expect_malformed = [](const std::vector<uint8_t>& frame) {
        auto parsed = Reparse(frame);
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == ProtocolFailureType::MalformedMessage);
    };

    SECTION("ClientHello with no room for a key") {
        expect_malformed(WireCodec::Encode(MessageType::ClientHello,
            std::vector<uint8_t>(kHandshakeNonceBytes, 0x00)).Unwrap());
    }
    SECTION("ServerHello without certificate bytes") {
        expect_malformed(WireCodec::Encode(MessageType::ServerHello,
            std::vector<uint8_t>(kTestCiphertextBytes + kHandshakeNonceBytes, 0x00)).Unwrap());
    }
    SECTION("Finished MAC of the wrong size") {
        expect_malformed(WireCodec::Encode(MessageType::ServerFinished,
            std::vector<uint8_t>(31, 0x00)).Unwrap());
        expect_malformed(WireCodec::Encode(MessageType::ClientFinished,
            std::vector<uint8_t>(33, 0x00)).Unwrap());
    }
    SECTION("Record shorter than the AEAD tag") {
        expect_malformed(WireCodec::Encode(MessageType::Record,
            std::vector<uint8_t>(kAesGcmTagBytes - 1, 0x00)).Unwrap());
    }
    SECTION("Alert with unknown description or wrong size") {
        expect_malformed(WireCodec::Encode(MessageType::Alert, std::vector<uint8_t>{0x7F}).Unwrap());
        expect_malformed(WireCodec::Encode(MessageType::Alert, std::vector<uint8_t>{}).Unwrap());
        expect_malformed(WireCodec::Encode(MessageType::Alert, std::vector<uint8_t>{0x00, 0x00}).Unwrap());
    }
}
