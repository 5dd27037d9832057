#include <catch2/catch_test_macros.hpp>
#include "kemtls/protocol/handshake.hpp"
#include "helpers/handshake_fixture.hpp"
#include <string_view>
using namespace kemtls::protocol;
using namespace kemtls::protocol::test_helpers;

namespace {
    template<size_t N>
    std::vector<uint8_t> ToVector(std::span<const uint8_t, N> bytes) {
        return {bytes.begin(), bytes.end()};
    }

    std::vector<uint8_t> Concat(const std::vector<std::vector<uint8_t>>& frames) {
        std::vector<uint8_t> out;
        for (const auto& frame : frames) {
            out.insert(out.end(), frame.begin(), frame.end());
        }
        return out;
    }

    void RequireFailedWithoutKeys(const HandshakeEngine& engine, const StepResult& step,
                                  const ProtocolFailureType expected) {
        REQUIRE_FALSE(step.Ok());
        REQUIRE(step.error->type == expected);
        REQUIRE(step.state == ConnectionState::Failed);
        REQUIRE(step.outgoing.empty());
        REQUIRE(engine.State() == ConnectionState::Failed);
        REQUIRE(engine.Keys() == nullptr);
        REQUIRE(engine.Failure().has_value());
        REQUIRE(engine.Failure()->type == expected);
    }

    struct SessionSnapshot {
        std::vector<uint8_t> client_hello;
        std::vector<uint8_t> server_hello;
        std::vector<uint8_t> enc;
        std::vector<uint8_t> mac;
        std::vector<uint8_t> iv;
    };

    /// Drives one handshake to completion and checks both sides agree.
    SessionSnapshot RunSession(ClientHandshake& client, ServerHandshake& server) {
        auto start = client.Start();
        REQUIRE(start.Ok());
        auto flight = server.Step(start.outgoing.at(0));
        REQUIRE(flight.Ok());
        REQUIRE(client.Step(flight.outgoing.at(0)).Ok());
        auto finished = client.Step(flight.outgoing.at(1));
        REQUIRE(finished.Ok());
        REQUIRE(server.Step(finished.outgoing.at(0)).Ok());

        const auto* client_keys = client.Keys();
        const auto* server_keys = server.Keys();
        REQUIRE(client_keys != nullptr);
        REQUIRE(server_keys != nullptr);
        REQUIRE(ToVector(client_keys->Enc()) == ToVector(server_keys->Enc()));
        REQUIRE(ToVector(client_keys->Mac()) == ToVector(server_keys->Mac()));
        REQUIRE(ToVector(client_keys->IvBytes()) == ToVector(server_keys->IvBytes()));
        return SessionSnapshot{
            start.outgoing.at(0),
            flight.outgoing.at(0),
            ToVector(client_keys->Enc()),
            ToVector(client_keys->Mac()),
            ToVector(client_keys->IvBytes())};
    }

    /// Client start and server flight, leaving the client in AwaitServerHello.
    struct PartialHandshake {
        HandshakePair pair;
        std::vector<uint8_t> client_hello;
        std::vector<uint8_t> server_hello;
        std::vector<uint8_t> server_finished;

        explicit PartialHandshake(HandshakeOptions client_options = {})
            : pair(std::move(client_options)) {
            auto start = pair.client.Start();
            REQUIRE(start.Ok());
            client_hello = start.outgoing.at(0);
            auto flight = pair.server.Step(client_hello);
            REQUIRE(flight.Ok());
            REQUIRE(flight.outgoing.size() == 2);
            server_hello = flight.outgoing[0];
            server_finished = flight.outgoing[1];
        }
    };
}

TEST_CASE("Handshake - Successful exchange", "[handshake]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("States advance and both sides hold the same keys") {
        HandshakePair pair;
        REQUIRE(pair.client.State() == ConnectionState::Idle);
        REQUIRE(pair.server.State() == ConnectionState::Idle);

        auto start = pair.client.Start();
        REQUIRE(start.Ok());
        REQUIRE(start.state == ConnectionState::AwaitServerHello);
        REQUIRE(start.outgoing.size() == 1);
        REQUIRE(start.outgoing[0][0] == static_cast<uint8_t>(MessageType::ClientHello));

        auto flight = pair.server.Step(start.outgoing[0]);
        REQUIRE(flight.Ok());
        REQUIRE(flight.state == ConnectionState::AwaitFinished);
        REQUIRE(flight.outgoing.size() == 2);
        REQUIRE(flight.outgoing[0][0] == static_cast<uint8_t>(MessageType::ServerHello));
        REQUIRE(flight.outgoing[1][0] == static_cast<uint8_t>(MessageType::ServerFinished));
        REQUIRE(pair.server.Keys() == nullptr);

        auto after_hello = pair.client.Step(flight.outgoing[0]);
        REQUIRE(after_hello.Ok());
        REQUIRE(after_hello.state == ConnectionState::AwaitFinished);
        REQUIRE(after_hello.outgoing.empty());
        REQUIRE(pair.client.ServerCertificate().has_value());
        REQUIRE(pair.client.ServerCertificate()->Subject() == kTestSubject);

        auto after_finished = pair.client.Step(flight.outgoing[1]);
        REQUIRE(after_finished.Ok());
        REQUIRE(after_finished.state == ConnectionState::Established);
        REQUIRE(after_finished.outgoing.size() == 1);
        REQUIRE(after_finished.outgoing[0][0] == static_cast<uint8_t>(MessageType::ClientFinished));

        auto done = pair.server.Step(after_finished.outgoing[0]);
        REQUIRE(done.Ok());
        REQUIRE(done.state == ConnectionState::Established);
        REQUIRE(done.outgoing.empty());

        const auto* client_keys = pair.client.Keys();
        const auto* server_keys = pair.server.Keys();
        REQUIRE(client_keys != nullptr);
        REQUIRE(server_keys != nullptr);
        REQUIRE(ToVector(client_keys->Enc()) == ToVector(server_keys->Enc()));
        REQUIRE(ToVector(client_keys->Mac()) == ToVector(server_keys->Mac()));
        REQUIRE(ToVector(client_keys->IvBytes()) == ToVector(server_keys->IvBytes()));
    }
    SECTION("Transcript is the four frames in wire order on both sides") {
        HandshakePair pair;
        const auto frames = pair.Run();
        const auto expected = Concat(frames);
        REQUIRE(ToVector(pair.client.Transcript()) == expected);
        REQUIRE(ToVector(pair.server.Transcript()) == expected);
    }
    SECTION("Finished MACs cover the transcript prefix") {
        HandshakePair pair;
        const auto frames = pair.Run();
        const auto* keys = pair.client.Keys();
        REQUIRE(keys != nullptr);

        std::vector<uint8_t> prefix = Concat({frames[0], frames[1]});
        auto server_mac = KeySchedule::ComputeTranscriptMac(keys->Mac(), prefix).Unwrap();
        REQUIRE(std::equal(server_mac.begin(), server_mac.end(), frames[2].begin() + kFrameHeaderBytes));

        prefix.insert(prefix.end(), frames[2].begin(), frames[2].end());
        auto client_mac = KeySchedule::ComputeTranscriptMac(keys->Mac(), prefix).Unwrap();
        REQUIRE(std::equal(client_mac.begin(), client_mac.end(), frames[3].begin() + kFrameHeaderBytes));
    }
    SECTION("Pinned subject that matches is accepted") {
        HandshakeOptions options;
        options.expected_subject = kTestSubject;
        HandshakePair pair(std::move(options));
        REQUIRE_NOTHROW(pair.Run());
        REQUIRE(pair.client.IsEstablished());
    }
    SECTION("TakeSession hands the keys over exactly once") {
        HandshakePair pair;
        pair.Run();
        const auto expected_enc = ToVector(pair.server.Keys()->Enc());
        auto taken = pair.server.TakeSession();
        REQUIRE(taken.IsOk());
        REQUIRE(ToVector(taken.Unwrap().Enc()) == expected_enc);
        REQUIRE(pair.server.Keys() == nullptr);

        auto again = pair.server.TakeSession();
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("Handshake - Known answer with mock capabilities", "[handshake][conformance]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    // Mock KEM seed 0x4B, mock signature seed 0x53, client nonce seed 0xC1,
    // server nonce seed 0x5E, subject CN=test.kemtls.local.
        constexpr std::string_view kClientHello =
            "01000000406dc1e0e6fbe8223d211bb748aafc6b024143e473599fce1aaf3a53"
            "fb53666bcb3ea1b548d71a39a608058aee9dd803207415d964bdc30aa7e1e56c"
            "ec4c823094";
        constexpr std::string_view kServerHello =
            "02000000c426be594f7ba28f5e4cd8dcf7221290b9cddb4a4ea99ec914665f11"
            "adb09a9a4b90f1679f1e1918a27d97b4c40736d717274087e607bf7ab91ce503"
            "89e03313b100000014434e3d746573742e6b656d746c732e6c6f63616c000000"
            "200c3a8e10ac3f52c9fed92cd8814af39b6c7a9d0b350f50fa1e0ce898d1a214"
            "98000000201f8f522a1ecd80a3cc2045f24ec170e14ea9d502b0d9a03903debe"
            "9212dfb4d50000002036c63f5b8095b29c3f531b4dcf3d95da6abfaa4f253b4c"
            "3a0bc120c698b292e3";
        constexpr std::string_view kServerFinished =
            "06000000202045b4ff260dd966880a5d9bc3e9755dbb7cb1e7f010ecb49397e7"
            "0beb8891c1";
        constexpr std::string_view kClientFinished =
            "0500000020d8a0749a334299f8b09518e3279c9f574c0f819ee8e156fdc40136"
            "a9fc9465f9";
        constexpr std::string_view kEncKey =
            "157a23d9dd37583813768a0e739d37881566f442dc40ab45b70a30904782e491";
        constexpr std::string_view kMacKey =
            "c7a1d7f3ca84e9120e816e202b86d52771e7624757a9a5d98cc22dc1166fcb71";
        constexpr std::string_view kIv =
            "d3d775ea4a8bf36a9db6ee2ed7f6bdc5";

    HandshakePair pair;
    const auto frames = pair.Run();
    REQUIRE(frames.size() == 4);

    SECTION("Encoded frames") {
        REQUIRE(frames[0] == FromHex(kClientHello));
        REQUIRE(frames[1] == FromHex(kServerHello));
        REQUIRE(frames[2] == FromHex(kServerFinished));
        REQUIRE(frames[3] == FromHex(kClientFinished));
    }
    SECTION("Session keys on both sides") {
        for (const HandshakeEngine* engine : {static_cast<const HandshakeEngine*>(&pair.client),
                                              static_cast<const HandshakeEngine*>(&pair.server)}) {
            const auto* keys = engine->Keys();
            REQUIRE(keys != nullptr);
            REQUIRE(ToVector(keys->Enc()) == FromHex(kEncKey));
            REQUIRE(ToVector(keys->Mac()) == FromHex(kMacKey));
            REQUIRE(ToVector(keys->IvBytes()) == FromHex(kIv));
        }
    }
}

TEST_CASE("Handshake - Fresh ephemeral keys per session", "[handshake][forward_secrecy]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto kem = std::make_shared<MockKem>();
    auto signature = std::make_shared<MockSignature>();
    const auto identity = MakeMockIdentity(kTestSubject, kem, signature);

    auto options_with_seed = [](const uint8_t seed) {
        HandshakeOptions options;
        options.random = DeterministicRandom(seed);
        return options;
    };

    SECTION("Same certificate and nonces, different ephemeral key pairs") {
        ClientHandshake first_client(kem, signature, options_with_seed(0xC1));
        ServerHandshake first_server(identity, options_with_seed(0x5E));
        const auto first = RunSession(first_client, first_server);

        ClientHandshake second_client(kem, signature, options_with_seed(0xC1));
        ServerHandshake second_server(identity, options_with_seed(0x5E));
        const auto second = RunSession(second_client, second_server);

        REQUIRE(first.client_hello != second.client_hello);
        REQUIRE(first.server_hello != second.server_hello);
        REQUIRE(first.enc != second.enc);
        REQUIRE(first.mac != second.mac);
        REQUIRE(first.iv != second.iv);
    }
    SECTION("Different client nonce sources") {
        ClientHandshake first_client(kem, signature, options_with_seed(0x01));
        ServerHandshake first_server(identity, options_with_seed(0x5E));
        const auto first = RunSession(first_client, first_server);

        ClientHandshake second_client(kem, signature, options_with_seed(0x02));
        ServerHandshake second_server(identity, options_with_seed(0x5E));
        const auto second = RunSession(second_client, second_server);

        REQUIRE(first.enc != second.enc);
        REQUIRE(first.mac != second.mac);
        REQUIRE(first.iv != second.iv);
    }
}

TEST_CASE("Handshake - Tampering", "[handshake][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Corrupted certificate signature fails authentication") {
        PartialHandshake partial;
        auto tampered = partial.server_hello;
        tampered.back() ^= 0x01;
        auto step = partial.pair.client.Step(tampered);
        RequireFailedWithoutKeys(partial.pair.client, step, ProtocolFailureType::AuthenticationFailure);
        REQUIRE_FALSE(partial.pair.client.ServerCertificate().has_value());
    }
    SECTION("Corrupted KEM ciphertext fails at ServerFinished") {
        PartialHandshake partial;
        auto tampered = partial.server_hello;
        tampered[kFrameHeaderBytes] ^= 0x01;
        REQUIRE(partial.pair.client.Step(tampered).Ok());
        auto step = partial.pair.client.Step(partial.server_finished);
        RequireFailedWithoutKeys(partial.pair.client, step, ProtocolFailureType::AuthenticationFailure);
    }
    SECTION("Corrupted server nonce fails at ServerFinished") {
        PartialHandshake partial;
        auto tampered = partial.server_hello;
        tampered[kFrameHeaderBytes + MockKem::KEY_SIZE] ^= 0x80;
        REQUIRE(partial.pair.client.Step(tampered).Ok());
        RequireFailedWithoutKeys(partial.pair.client, partial.pair.client.Step(partial.server_finished),
            ProtocolFailureType::AuthenticationFailure);
    }
    SECTION("Corrupted ServerFinished MAC fails authentication") {
        PartialHandshake partial;
        REQUIRE(partial.pair.client.Step(partial.server_hello).Ok());
        auto tampered = partial.server_finished;
        tampered[kFrameHeaderBytes + 7] ^= 0x10;
        auto step = partial.pair.client.Step(tampered);
        RequireFailedWithoutKeys(partial.pair.client, step, ProtocolFailureType::AuthenticationFailure);
    }
    SECTION("Corrupted ClientFinished MAC fails on the server") {
        PartialHandshake partial;
        REQUIRE(partial.pair.client.Step(partial.server_hello).Ok());
        auto finished = partial.pair.client.Step(partial.server_finished);
        REQUIRE(finished.Ok());
        auto tampered = finished.outgoing.at(0);
        tampered.back() ^= 0x01;
        auto step = partial.pair.server.Step(tampered);
        RequireFailedWithoutKeys(partial.pair.server, step, ProtocolFailureType::AuthenticationFailure);
    }
    SECTION("Modified ClientHello leads to mismatched transcripts") {
        HandshakePair pair;
        auto start = pair.client.Start();
        auto tampered = start.outgoing.at(0);
        tampered.back() ^= 0x01;
        auto flight = pair.server.Step(tampered);
        REQUIRE(flight.Ok());
        REQUIRE(pair.client.Step(flight.outgoing[0]).Ok());
        RequireFailedWithoutKeys(pair.client, pair.client.Step(flight.outgoing[1]),
            ProtocolFailureType::AuthenticationFailure);
    }
    SECTION("Pinned subject mismatch fails authentication") {
        HandshakeOptions options;
        options.expected_subject = "CN=other.kemtls.local";
        PartialHandshake partial(std::move(options));
        auto step = partial.pair.client.Step(partial.server_hello);
        RequireFailedWithoutKeys(partial.pair.client, step, ProtocolFailureType::AuthenticationFailure);
    }
    SECTION("Substituted certificate signing key fails authentication") {
        PartialHandshake partial;
        auto tampered = partial.server_hello;
        // Last byte of sig_pub: [len][sig_pub][len][sig] closes the certificate.
        tampered[tampered.size() - MockSignature::KEY_SIZE - 4 - 1] ^= 0x01;
        RequireFailedWithoutKeys(partial.pair.client, partial.pair.client.Step(tampered),
            ProtocolFailureType::AuthenticationFailure);
    }
}

TEST_CASE("Handshake - Protocol violations", "[handshake]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Client rejects ServerFinished before ServerHello") {
        PartialHandshake partial;
        auto step = partial.pair.client.Step(partial.server_finished);
        RequireFailedWithoutKeys(partial.pair.client, step, ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Client rejects a second ServerHello") {
        PartialHandshake partial;
        REQUIRE(partial.pair.client.Step(partial.server_hello).Ok());
        auto step = partial.pair.client.Step(partial.server_hello);
        RequireFailedWithoutKeys(partial.pair.client, step, ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Server rejects ClientFinished in Idle") {
        HandshakePair pair;
        auto finished = EncodeMessage(ClientFinished{}).Unwrap();
        auto step = pair.server.Step(finished);
        RequireFailedWithoutKeys(pair.server, step, ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Server rejects a repeated ClientHello") {
        PartialHandshake partial;
        auto step = partial.pair.server.Step(partial.client_hello);
        RequireFailedWithoutKeys(partial.pair.server, step, ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Application record during the handshake is a violation") {
        HandshakePair pair;
        auto record = EncodeMessage(Record{std::vector<uint8_t>(32, 0x00)}).Unwrap();
        RequireFailedWithoutKeys(pair.server, pair.server.Step(record), ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Peer alert closes the handshake") {
        PartialHandshake partial;
        auto alert = EncodeMessage(Alert{AlertDescription::HandshakeFailure}).Unwrap();
        auto step = partial.pair.client.Step(alert);
        RequireFailedWithoutKeys(partial.pair.client, step, ProtocolFailureType::ConnectionClosed);
    }
    SECTION("Truncated frame is malformed") {
        PartialHandshake partial;
        auto truncated = std::vector<uint8_t>(partial.server_hello.begin(), partial.server_hello.end() - 3);
        RequireFailedWithoutKeys(partial.pair.client, partial.pair.client.Step(truncated),
            ProtocolFailureType::MalformedMessage);
    }
    SECTION("Trailing bytes after a frame are malformed") {
        PartialHandshake partial;
        auto extended = partial.server_hello;
        extended.push_back(0x00);
        RequireFailedWithoutKeys(partial.pair.client, partial.pair.client.Step(extended),
            ProtocolFailureType::MalformedMessage);
    }
    SECTION("Unknown message type is malformed") {
        HandshakePair pair;
        const std::vector<uint8_t> frame = {0x42, 0x00, 0x00, 0x00, 0x00};
        RequireFailedWithoutKeys(pair.server, pair.server.Step(frame), ProtocolFailureType::MalformedMessage);
    }
    SECTION("ClientHello key of the wrong size is malformed") {
        HandshakePair pair;
        ClientHello hello;
        hello.ephemeral_public_key = std::vector<uint8_t>(MockKem::KEY_SIZE + 1, 0x01);
        auto frame = EncodeMessage(hello).Unwrap();
        RequireFailedWithoutKeys(pair.server, pair.server.Step(frame), ProtocolFailureType::MalformedMessage);
    }
    SECTION("Frame above the configured limit is malformed") {
        HandshakeOptions options;
        options.max_message_bytes = 64;
        PartialHandshake partial(std::move(options));
        RequireFailedWithoutKeys(partial.pair.client, partial.pair.client.Step(partial.server_hello),
            ProtocolFailureType::MalformedMessage);
    }
}

TEST_CASE("Handshake - Capability failures", "[handshake]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Decapsulation failure is a crypto error") {
        PartialHandshake partial;
        partial.pair.kem->FailDecapsulation(true);
        RequireFailedWithoutKeys(partial.pair.client, partial.pair.client.Step(partial.server_hello),
            ProtocolFailureType::CryptoError);
    }
    SECTION("Shared secret of the wrong width is a crypto error") {
        HandshakePair pair;
        pair.kem->SetSharedSecretSize(16);
        auto start = pair.client.Start();
        REQUIRE(start.Ok());
        RequireFailedWithoutKeys(pair.server, pair.server.Step(start.outgoing.at(0)),
            ProtocolFailureType::CryptoError);
    }
    SECTION("Short nonce from the random source is a crypto error") {
        HandshakeOptions options;
        options.random = [](size_t) { return std::vector<uint8_t>(8, 0x00); };
        HandshakePair pair(std::move(options));
        auto start = pair.client.Start();
        REQUIRE_FALSE(start.Ok());
        REQUIRE(start.error->type == ProtocolFailureType::CryptoError);
        REQUIRE(pair.client.State() == ConnectionState::Failed);
    }
    SECTION("Client without capabilities cannot start") {
        ClientHandshake client(nullptr, nullptr);
        auto start = client.Start();
        REQUIRE_FALSE(start.Ok());
        REQUIRE(start.error->type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("Handshake - Lifecycle", "[handshake]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Start twice is an invalid state without side effects") {
        HandshakePair pair;
        REQUIRE(pair.client.Start().Ok());
        auto again = pair.client.Start();
        REQUIRE_FALSE(again.Ok());
        REQUIRE(again.error->type == ProtocolFailureType::InvalidState);
        REQUIRE(pair.client.State() == ConnectionState::AwaitServerHello);
    }
    SECTION("Frame after Established is a violation and the keys survive") {
        HandshakePair pair;
        const auto frames = pair.Run();
        const auto expected_enc = ToVector(pair.server.Keys()->Enc());
        for (const auto& frame : {frames[0], frames[3]}) {
            auto step = pair.server.Step(frame);
            REQUIRE_FALSE(step.Ok());
            REQUIRE(step.error->type == ProtocolFailureType::ProtocolViolation);
            REQUIRE(step.state == ConnectionState::Established);
            REQUIRE(step.outgoing.empty());
        }
        REQUIRE(pair.server.State() == ConnectionState::Established);
        REQUIRE(pair.server.Keys() != nullptr);
        REQUIRE(ToVector(pair.server.Keys()->Enc()) == expected_enc);
        REQUIRE_FALSE(pair.server.Failure().has_value());
    }
    SECTION("Failed is absorbing") {
        PartialHandshake partial;
        REQUIRE_FALSE(partial.pair.client.Step(partial.server_finished).Ok());
        auto step = partial.pair.client.Step(partial.server_hello);
        REQUIRE_FALSE(step.Ok());
        REQUIRE(step.error->type == ProtocolFailureType::InvalidState);
        REQUIRE(partial.pair.client.State() == ConnectionState::Failed);
        REQUIRE(partial.pair.client.Failure()->type == ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Abort fails an in-progress handshake and wipes keys") {
        PartialHandshake partial;
        REQUIRE(partial.pair.client.Step(partial.server_hello).Ok());
        auto aborted = partial.pair.client.Abort(ProtocolFailure::Timeout("test deadline"));
        RequireFailedWithoutKeys(partial.pair.client, aborted, ProtocolFailureType::Timeout);
        REQUIRE(partial.pair.client.Transcript().empty());
    }
    SECTION("Abort after Established is a no-op") {
        HandshakePair pair;
        pair.Run();
        auto aborted = pair.client.Abort(ProtocolFailure::Timeout("late"));
        REQUIRE(aborted.Ok());
        REQUIRE(pair.client.State() == ConnectionState::Established);
        REQUIRE(pair.client.Keys() != nullptr);
    }
    SECTION("TakeSession before Established is an invalid state") {
        PartialHandshake partial;
        auto taken = partial.pair.server.TakeSession();
        REQUIRE(taken.IsErr());
        REQUIRE(taken.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
    SECTION("State names") {
        REQUIRE(ToString(ConnectionState::Idle) == "Idle");
        REQUIRE(ToString(ConnectionState::AwaitServerHello) == "AwaitServerHello");
        REQUIRE(ToString(ConnectionState::Established) == "Established");
        REQUIRE(ToString(ConnectionState::Failed) == "Failed");
    }
}
