#include <catch2/catch_test_macros.hpp>
#include "kemtls/transport/secure_channel.hpp"
#include "helpers/handshake_fixture.hpp"
#include "helpers/memory_pipe.hpp"
#include <new>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace kemtls::protocol;
using namespace kemtls::protocol::transport;
using namespace kemtls::protocol::configuration;
using namespace kemtls::protocol::test_helpers;
using namespace std::chrono_literals;

namespace {

ChannelConfig TestConfig() {
    auto config = ChannelConfig::Default();
    config.handshake_timeout = 2s;
    config.record_timeout = 2s;
    return config;
}

/// What the in-process server saw before its session ended.
struct ServerOutcome {
    std::optional<ProtocolFailure> handshake_error;
    std::vector<std::vector<uint8_t>> requests;
    std::optional<ProtocolFailure> receive_error;
};

/// Memory-pipe endpoints, mock capabilities and an echo server on its own thread.
struct ChannelTestContext {
    std::shared_ptr<MockKem> kem = std::make_shared<MockKem>();
    std::shared_ptr<MockSignature> signature = std::make_shared<MockSignature>();
    std::shared_ptr<const identity::ServerIdentity> identity = MakeMockIdentity(kTestSubject, kem, signature);
    std::shared_ptr<MemoryStream> client_stream;
    std::shared_ptr<MemoryStream> server_stream;
    ServerOutcome outcome;
    std::thread server_thread;

    ChannelTestContext() {
        auto [client, server] = CreateMemoryPipe();
        client_stream = std::move(client);
        server_stream = std::move(server);
    }

    ~ChannelTestContext() {
        client_stream->Close();
        JoinServer();
    }

    void StartEchoServer(ChannelConfig config = TestConfig()) {
        server_thread = std::thread([this, config]() {
            auto session = AcceptServerSession(server_stream, identity, config);
            if (session.IsErr()) {
                outcome.handshake_error = session.UnwrapErr();
                return;
            }
            auto channel = std::move(session).Unwrap();
            while (true) {
                auto request = channel.Receive();
                if (request.IsErr()) {
                    outcome.receive_error = request.UnwrapErr();
                    return;
                }
                outcome.requests.push_back(request.Unwrap());
                if (channel.Send(request.Unwrap()).IsErr()) {
                    return;
                }
            }
        });
    }

    Result<SecureChannel, ProtocolFailure> Connect(ChannelConfig config = TestConfig()) {
        return OpenClientSession(client_stream, kem, signature, config);
    }

    void JoinServer() {
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }
};

std::vector<uint8_t> Pattern(const size_t size) {
    std::vector<uint8_t> bytes(size);
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>(i * 31 + 7);
    }
    return bytes;
}

}  // namespace

TEST_CASE("SecureChannel - Request and response", "[integration][secure_channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ChannelTestContext ctx;
    ctx.StartEchoServer();

    auto session = ctx.Connect();
    REQUIRE(session.IsOk());
    auto channel = std::move(session).Unwrap();
    REQUIRE(channel.IsOpen());
    REQUIRE(channel.PeerCertificate().has_value());
    REQUIRE(channel.PeerCertificate()->Subject() == kTestSubject);

    SECTION("Short message") {
        const std::string body = "grant_type=authorization_code&code=abc";
        const std::vector<uint8_t> request(body.begin(), body.end());
        auto response = channel.SendRequest(request);
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap() == request);
    }
    SECTION("Empty message") {
        auto response = channel.SendRequest(std::vector<uint8_t>{});
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap().empty());
    }
    SECTION("Message spanning many records") {
        const auto request = Pattern(100 * 1024 + 17);
        auto response = channel.SendRequest(request);
        REQUIRE(response.IsOk());
        REQUIRE(response.Unwrap() == request);
    }
    SECTION("Message filling the first record exactly") {
        const auto request = Pattern(kMaxRecordPlaintextBytes - kApplicationLengthPrefixBytes);
        REQUIRE(channel.SendRequest(request).Unwrap() == request);
    }
    SECTION("Several messages in sequence") {
        for (size_t i = 1; i <= 5; ++i) {
            const auto request = Pattern(i * 1000);
            REQUIRE(channel.SendRequest(request).Unwrap() == request);
        }
    }

    channel.Close();
    REQUIRE_FALSE(channel.IsOpen());
    ctx.JoinServer();
    REQUIRE_FALSE(ctx.outcome.handshake_error.has_value());
    REQUIRE(ctx.outcome.receive_error.has_value());
    REQUIRE(ctx.outcome.receive_error->type == ProtocolFailureType::ConnectionClosed);
}

TEST_CASE("SecureChannel - Closure", "[integration][secure_channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("close_notify ends the peer's receive") {
        ChannelTestContext ctx;
        ctx.StartEchoServer();
        auto channel = ctx.Connect().Unwrap();
        channel.Close();
        ctx.JoinServer();
        REQUIRE(ctx.outcome.requests.empty());
        REQUIRE(ctx.outcome.receive_error->type == ProtocolFailureType::ConnectionClosed);
    }
    SECTION("Operations after Close report closure") {
        ChannelTestContext ctx;
        ctx.StartEchoServer();
        auto channel = ctx.Connect().Unwrap();
        channel.Close();
        const std::vector<uint8_t> request = {1, 2, 3};
        auto sent = channel.Send(request);
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == ProtocolFailureType::ConnectionClosed);
        REQUIRE(channel.Receive().UnwrapErr().type == ProtocolFailureType::ConnectionClosed);
    }
    SECTION("Close survives a stream that throws while sending close_notify") {
        ChannelTestContext ctx;
        ctx.StartEchoServer();
        auto channel = ctx.Connect().Unwrap();
        ctx.client_stream->SetWriteFilter([](std::vector<uint8_t>&) { throw std::bad_alloc(); });
        REQUIRE_NOTHROW(channel.Close());
        REQUIRE_FALSE(channel.IsOpen());
        ctx.JoinServer();
        REQUIRE(ctx.outcome.requests.empty());
        REQUIRE(ctx.outcome.receive_error->type == ProtocolFailureType::ConnectionClosed);
    }
    SECTION("Destroying a channel closes it") {
        ChannelTestContext ctx;
        ctx.StartEchoServer();
        {
            auto channel = ctx.Connect().Unwrap();
        }
        ctx.JoinServer();
        REQUIRE(ctx.outcome.receive_error->type == ProtocolFailureType::ConnectionClosed);
    }
}

TEST_CASE("SecureChannel - Handshake failures", "[integration][secure_channel][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Pinned subject mismatch aborts both sides") {
        ChannelTestContext ctx;
        ctx.StartEchoServer();
        auto config = TestConfig();
        config.expected_subject = "CN=idp.example";
        auto session = ctx.Connect(config);
        REQUIRE(session.IsErr());
        REQUIRE(session.UnwrapErr().type == ProtocolFailureType::AuthenticationFailure);
        ctx.JoinServer();
        REQUIRE(ctx.outcome.handshake_error.has_value());
        REQUIRE(ctx.outcome.handshake_error->type == ProtocolFailureType::ConnectionClosed);
    }
    SECTION("Tampered ServerHello is rejected by the client") {
        ChannelTestContext ctx;
        ctx.server_stream->SetWriteFilter([](std::vector<uint8_t>& data) {
            if (!data.empty() && data[0] == static_cast<uint8_t>(MessageType::ServerHello)) {
                data.back() ^= 0x01;
            }
        });
        ctx.StartEchoServer();
        auto session = ctx.Connect();
        REQUIRE(session.IsErr());
        REQUIRE(session.UnwrapErr().type == ProtocolFailureType::AuthenticationFailure);
        ctx.JoinServer();
        REQUIRE(ctx.outcome.handshake_error.has_value());
    }
    SECTION("Tampered ClientFinished is rejected by the server") {
        ChannelTestContext ctx;
        ctx.client_stream->SetWriteFilter([](std::vector<uint8_t>& data) {
            if (!data.empty() && data[0] == static_cast<uint8_t>(MessageType::ClientFinished)) {
                data.back() ^= 0x01;
            }
        });
        ctx.StartEchoServer();
        auto channel = ctx.Connect();
        // ClientFinished is the last flight, so the client is already established.
        REQUIRE(channel.IsOk());
        ctx.JoinServer();
        REQUIRE(ctx.outcome.handshake_error->type == ProtocolFailureType::AuthenticationFailure);

        auto response = channel.Unwrap().SendRequest(std::vector<uint8_t>{0x01});
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == ProtocolFailureType::ConnectionClosed);
    }
    SECTION("Silent server times out") {
        ChannelTestContext ctx;
        auto config = TestConfig();
        config.handshake_timeout = 50ms;
        auto session = ctx.Connect(config);
        REQUIRE(session.IsErr());
        REQUIRE(session.UnwrapErr().type == ProtocolFailureType::Timeout);
    }
    SECTION("Invalid configuration is rejected before any I/O") {
        ChannelTestContext ctx;
        auto config = TestConfig();
        config.max_message_bytes = 0;
        auto session = ctx.Connect(config);
        REQUIRE(session.IsErr());
        REQUIRE(session.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(ctx.server_stream->Pending() == 0);
    }
}

TEST_CASE("SecureChannel - Record failures", "[integration][secure_channel][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Tampered application record closes the session") {
        ChannelTestContext ctx;
        ctx.StartEchoServer();
        auto channel = ctx.Connect().Unwrap();
        ctx.client_stream->SetWriteFilter([](std::vector<uint8_t>& data) {
            if (data.size() > kFrameHeaderBytes && data[0] == static_cast<uint8_t>(MessageType::Record)) {
                data[kFrameHeaderBytes] ^= 0x01;
            }
        });
        auto response = channel.SendRequest(std::vector<uint8_t>{'h', 'i'});
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == ProtocolFailureType::ConnectionClosed);
        REQUIRE_FALSE(channel.IsOpen());
        ctx.JoinServer();
        REQUIRE(ctx.outcome.receive_error->type == ProtocolFailureType::AuthenticationFailure);
    }
    SECTION("Message above the local limit is refused without closing") {
        ChannelTestContext ctx;
        ctx.StartEchoServer();
        auto config = TestConfig();
        config.max_application_message_bytes = 1024;
        auto channel = ctx.Connect(config).Unwrap();
        auto sent = channel.Send(Pattern(1025));
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(channel.IsOpen());
        REQUIRE(channel.SendRequest(Pattern(1024)).Unwrap() == Pattern(1024));
    }
    SECTION("Message above the peer's limit is malformed there") {
        ChannelTestContext ctx;
        auto server_config = TestConfig();
        server_config.max_application_message_bytes = 1024;
        ctx.StartEchoServer(server_config);
        auto channel = ctx.Connect().Unwrap();
        REQUIRE(channel.Send(Pattern(4096)).IsOk());
        ctx.JoinServer();
        REQUIRE(ctx.outcome.receive_error->type == ProtocolFailureType::MalformedMessage);
    }
}
