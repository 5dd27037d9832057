#include <catch2/catch_test_macros.hpp>
#include "kemtls/crypto/oqs_key_encapsulation.hpp"
#include "kemtls/crypto/oqs_signature.hpp"
#include "kemtls/crypto/sodium_interop.hpp"
#include "kemtls/identity/server_identity.hpp"
#include "kemtls/protocol/handshake.hpp"
#include <algorithm>
#include <vector>
using namespace kemtls::protocol;
using namespace kemtls::protocol::crypto;

TEST_CASE("OqsKeyEncapsulation - ML-KEM", "[oqs][kem]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("ML-KEM-768 parameters") {
        auto kem = OqsKeyEncapsulation::Create("ML-KEM-768");
        REQUIRE(kem.IsOk());
        REQUIRE(kem.Unwrap()->Name() == "ML-KEM-768");
        REQUIRE(kem.Unwrap()->PublicKeySize() == 1184);
        REQUIRE(kem.Unwrap()->CiphertextSize() == 1088);
        REQUIRE(kem.Unwrap()->SharedSecretSize() == 32);
        REQUIRE(kem.Unwrap()->SecretKeySize() == 2400);
    }
    SECTION("Encapsulation agrees with decapsulation for every parameter set") {
        for (const auto name : OqsKeyEncapsulation::SUPPORTED_ALGORITHMS) {
            auto kem = OqsKeyEncapsulation::Create(name).Unwrap();
            auto key_pair = kem->GenerateKeyPair();
            REQUIRE(key_pair.IsOk());
            auto keys = std::move(key_pair).Unwrap();
            REQUIRE(keys.public_key.size() == kem->PublicKeySize());

            auto encapsulated = kem->Encapsulate(keys.public_key);
            REQUIRE(encapsulated.IsOk());
            auto& encapsulation = encapsulated.Unwrap();
            REQUIRE(encapsulation.ciphertext.size() == kem->CiphertextSize());

            auto decapsulated = kem->Decapsulate(keys.secret_key, encapsulation.ciphertext);
            REQUIRE(decapsulated.IsOk());
            auto expected = encapsulation.shared_secret.ReadBytes(32).Unwrap();
            REQUIRE(decapsulated.Unwrap().ReadBytes(32).Unwrap() == expected);
        }
    }
    SECTION("Modified ciphertext yields a different secret") {
        auto kem = OqsKeyEncapsulation::Create("ML-KEM-512").Unwrap();
        auto keys = kem->GenerateKeyPair().Unwrap();
        auto encapsulation = kem->Encapsulate(keys.public_key).Unwrap();
        auto tampered = encapsulation.ciphertext;
        tampered[0] ^= 0x01;
        auto decapsulated = kem->Decapsulate(keys.secret_key, tampered);
        REQUIRE(decapsulated.IsOk());
        REQUIRE(decapsulated.Unwrap().ReadBytes(32).Unwrap() !=
            encapsulation.shared_secret.ReadBytes(32).Unwrap());
    }
    SECTION("Wrong public key size is rejected") {
        auto kem = OqsKeyEncapsulation::Create("ML-KEM-768").Unwrap();
        std::vector<uint8_t> short_key(100, 0x00);
        auto encapsulated = kem->Encapsulate(short_key);
        REQUIRE(encapsulated.IsErr());
        REQUIRE(encapsulated.UnwrapErr().type == ProtocolFailureType::CryptoError);
    }
    SECTION("Unknown algorithm names are rejected") {
        auto kem = OqsKeyEncapsulation::Create("Kyber-2048");
        REQUIRE(kem.IsErr());
        REQUIRE(kem.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}

TEST_CASE("OqsSignature - ML-DSA and Falcon", "[oqs][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> message = {'i', 'd', '_', 't', 'o', 'k', 'e', 'n'};

    SECTION("Sign and verify") {
        for (const auto name : {"ML-DSA-44", "Falcon-512"}) {
            auto scheme = OqsSignature::Create(name).Unwrap();
            auto keys = scheme->GenerateKeyPair().Unwrap();
            REQUIRE(keys.public_key.size() == scheme->PublicKeySize());
            auto signature = scheme->Sign(keys.secret_key, message);
            REQUIRE(signature.IsOk());
            REQUIRE(signature.Unwrap().size() <= scheme->MaxSignatureSize());
            REQUIRE(scheme->Verify(keys.public_key, message, signature.Unwrap()));
        }
    }
    SECTION("Verification fails on a modified message or signature") {
        auto scheme = OqsSignature::Create("ML-DSA-44").Unwrap();
        auto keys = scheme->GenerateKeyPair().Unwrap();
        auto signature = scheme->Sign(keys.secret_key, message).Unwrap();

        auto other_message = message;
        other_message[0] ^= 0x01;
        REQUIRE_FALSE(scheme->Verify(keys.public_key, other_message, signature));

        auto tampered = signature;
        tampered[10] ^= 0x01;
        REQUIRE_FALSE(scheme->Verify(keys.public_key, message, tampered));

        REQUIRE_FALSE(scheme->Verify(std::vector<uint8_t>(10, 0x00), message, signature));
    }
    SECTION("Unknown algorithm names are rejected") {
        auto scheme = OqsSignature::Create("SPHINCS-unknown");
        REQUIRE(scheme.IsErr());
        REQUIRE(scheme.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}

TEST_CASE("Handshake - Post-quantum capabilities", "[oqs][handshake]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem = OqsKeyEncapsulation::Create("ML-KEM-768").Unwrap();
    std::shared_ptr<const interfaces::ISignatureScheme> signature = OqsSignature::Create("ML-DSA-44").Unwrap();
    auto identity = identity::ServerIdentity::Generate("CN=PQ-OIDC-Server", kem, signature).Unwrap();

    ClientHandshake client(kem, signature);
    ServerHandshake server(identity);

    auto hello = client.Start();
    REQUIRE(hello.Ok());
    REQUIRE(hello.outgoing.at(0).size() == kFrameHeaderBytes + 1184 + kHandshakeNonceBytes);

    auto flight = server.Step(hello.outgoing.at(0));
    REQUIRE(flight.Ok());
    REQUIRE(client.Step(flight.outgoing.at(0)).Ok());
    auto finished = client.Step(flight.outgoing.at(1));
    REQUIRE(finished.Ok());
    REQUIRE(server.Step(finished.outgoing.at(0)).Ok());

    REQUIRE(client.IsEstablished());
    REQUIRE(server.IsEstablished());
    const auto client_enc = client.Keys()->Enc();
    const auto server_enc = server.Keys()->Enc();
    REQUIRE(std::equal(client_enc.begin(), client_enc.end(), server_enc.begin()));
    REQUIRE(client.ServerCertificate()->Subject() == "CN=PQ-OIDC-Server");
}

TEST_CASE("Handshake - Post-quantum sessions do not share keys", "[oqs][handshake][forward_secrecy]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem = OqsKeyEncapsulation::Create("ML-KEM-768").Unwrap();
    std::shared_ptr<const interfaces::ISignatureScheme> signature = OqsSignature::Create("ML-DSA-44").Unwrap();
    auto identity = identity::ServerIdentity::Generate("CN=PQ-OIDC-Server", kem, signature).Unwrap();

    // Same server nonce in both sessions so only the ephemeral KEM exchange differs.
    auto fixed_nonce = [](const uint8_t value) {
        HandshakeOptions options;
        options.random = [value](const size_t size) { return std::vector<uint8_t>(size, value); };
        return options;
    };

    std::vector<std::vector<uint8_t>> enc_keys;
    std::vector<std::vector<uint8_t>> mac_keys;
    std::vector<std::vector<uint8_t>> ivs;
    std::vector<std::vector<uint8_t>> ephemeral_keys;
    for (int session = 0; session < 2; ++session) {
        ClientHandshake client(kem, signature, fixed_nonce(0xC1));
        ServerHandshake server(identity, fixed_nonce(0x5E));

        auto hello = client.Start();
        REQUIRE(hello.Ok());
        auto flight = server.Step(hello.outgoing.at(0));
        REQUIRE(flight.Ok());
        REQUIRE(client.Step(flight.outgoing.at(0)).Ok());
        auto finished = client.Step(flight.outgoing.at(1));
        REQUIRE(finished.Ok());
        REQUIRE(server.Step(finished.outgoing.at(0)).Ok());

        const auto* client_keys = client.Keys();
        const auto* server_keys = server.Keys();
        REQUIRE(client_keys != nullptr);
        REQUIRE(server_keys != nullptr);
        REQUIRE(std::equal(client_keys->Enc().begin(), client_keys->Enc().end(), server_keys->Enc().begin()));
        REQUIRE(std::equal(client_keys->Mac().begin(), client_keys->Mac().end(), server_keys->Mac().begin()));
        REQUIRE(std::equal(client_keys->IvBytes().begin(), client_keys->IvBytes().end(),
                           server_keys->IvBytes().begin()));

        const auto& client_hello = hello.outgoing.at(0);
        ephemeral_keys.emplace_back(client_hello.begin() + kFrameHeaderBytes,
                                    client_hello.end() - kHandshakeNonceBytes);
        enc_keys.emplace_back(client_keys->Enc().begin(), client_keys->Enc().end());
        mac_keys.emplace_back(client_keys->Mac().begin(), client_keys->Mac().end());
        ivs.emplace_back(client_keys->IvBytes().begin(), client_keys->IvBytes().end());
    }

    REQUIRE(ephemeral_keys[0] != ephemeral_keys[1]);
    REQUIRE(enc_keys[0] != enc_keys[1]);
    REQUIRE(mac_keys[0] != mac_keys[1]);
    REQUIRE(ivs[0] != ivs[1]);
}
