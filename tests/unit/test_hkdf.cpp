#include <catch2/catch_test_macros.hpp>
#include "kemtls/crypto/hkdf.hpp"
#include "kemtls/crypto/sodium_interop.hpp"
#include <algorithm>
#include <array>
#include <vector>

using namespace kemtls::protocol::crypto;
using namespace kemtls::protocol;

TEST_CASE("HKDF RFC 5869 Test Vectors", "[hkdf][crypto][conformance]") {

    SECTION("RFC 5869 Test Case 1 - Basic test case with SHA-256") {
        const std::array<uint8_t, 22> ikm = {
            0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b,
            0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b,
            0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b
        };
        const std::array<uint8_t, 13> salt = {
            0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
            0x08, 0x09, 0x0a, 0x0b, 0x0c
        };
        const std::array<uint8_t, 10> info = {
            0xf0, 0xf1, 0xf2, 0xf3, 0xf4, 0xf5, 0xf6, 0xf7,
            0xf8, 0xf9
        };
        const std::array<uint8_t, 32> expected_prk = {
            0x07, 0x77, 0x09, 0x36, 0x2c, 0x2e, 0x32, 0xdf,
            0x0d, 0xdc, 0x3f, 0x0d, 0xc4, 0x7b, 0xba, 0x63,
            0x90, 0xb6, 0xc7, 0x3b, 0xb5, 0x0f, 0x9c, 0x31,
            0x22, 0xec, 0x84, 0x4a, 0xd7, 0xc2, 0xb3, 0xe5
        };
        const std::array<uint8_t, 42> expected_okm = {
            0x3c, 0xb2, 0x5f, 0x25, 0xfa, 0xac, 0xd5, 0x7a,
            0x90, 0x43, 0x4f, 0x64, 0xd0, 0x36, 0x2f, 0x2a,
            0x2d, 0x2d, 0x0a, 0x90, 0xcf, 0x1a, 0x5a, 0x4c,
            0x5d, 0xb0, 0x2d, 0x56, 0xec, 0xc4, 0xc5, 0xbf,
            0x34, 0x00, 0x72, 0x08, 0xd5, 0xb8, 0x87, 0x18,
            0x58, 0x65
        };

        auto result = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
        REQUIRE(result.IsOk());
        const auto okm = std::move(result).Unwrap();
        REQUIRE(std::equal(okm.begin(), okm.end(), expected_okm.begin()));

        auto prk_result = Hkdf::Extract(ikm, salt);
        REQUIRE(prk_result.IsOk());
        const auto prk = std::move(prk_result).Unwrap();
        REQUIRE(prk.size() == expected_prk.size());
        REQUIRE(std::equal(prk.begin(), prk.end(), expected_prk.begin()));

        std::vector<uint8_t> expanded_okm(expected_okm.size());
        REQUIRE(Hkdf::Expand(prk, expanded_okm, info).IsOk());
        REQUIRE(std::equal(expanded_okm.begin(), expanded_okm.end(), expected_okm.begin()));
    }

    SECTION("RFC 5869 Test Case 3 - Zero-length salt and info") {
        const std::vector<uint8_t> ikm(22, 0x0b);
        const std::array<uint8_t, 32> expected_prk = {
            0x19, 0xef, 0x24, 0xa3, 0x2c, 0x71, 0x7b, 0x16,
            0x7f, 0x33, 0xa9, 0x1d, 0x6f, 0x64, 0x8b, 0xdf,
            0x96, 0x59, 0x67, 0x76, 0xaf, 0xdb, 0x63, 0x77,
            0xac, 0x43, 0x4c, 0x1c, 0x29, 0x3c, 0xcb, 0x04
        };
        const std::array<uint8_t, 42> expected_okm = {
            0x8d, 0xa4, 0xe7, 0x75, 0xa5, 0x63, 0xc1, 0x8f,
            0x71, 0x5f, 0x80, 0x2a, 0x06, 0x3c, 0x5a, 0x31,
            0xb8, 0xa1, 0x1f, 0x5c, 0x5e, 0xe1, 0x87, 0x9e,
            0xc3, 0x45, 0x4e, 0x5f, 0x3c, 0x73, 0x8d, 0x2d,
            0x9d, 0x20, 0x13, 0x95, 0xfa, 0xa4, 0xb6, 0x1a,
            0x96, 0xc8
        };

        auto prk = Hkdf::Extract(ikm);
        REQUIRE(prk.IsOk());
        REQUIRE(std::equal(prk.Unwrap().begin(), prk.Unwrap().end(), expected_prk.begin()));

        auto okm = Hkdf::DeriveKeyBytes(ikm, 42);
        REQUIRE(okm.IsOk());
        REQUIRE(std::equal(okm.Unwrap().begin(), okm.Unwrap().end(), expected_okm.begin()));
    }
}

TEST_CASE("HKDF Input Validation", "[hkdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Empty IKM must fail") {
        auto result = Hkdf::DeriveKeyBytes({}, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(Hkdf::Extract({}).IsErr());
    }

    SECTION("Zero and oversized output lengths must fail") {
        const std::vector<uint8_t> ikm(32, 0x01);
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, 0).IsErr());
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1).IsErr());
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN).IsOk());
    }

    SECTION("Expand with invalid PRK size must fail") {
        const std::vector<uint8_t> invalid_prk(16, 0x42);
        std::vector<uint8_t> output(32);
        auto result = Hkdf::Expand(invalid_prk, output);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Same PRK with different info produces different outputs") {
        const auto ikm = SodiumInterop::GetRandomBytes(32);
        const auto prk = Hkdf::Extract(ikm).Unwrap();
        const std::vector<uint8_t> info_enc = {'e', 'n', 'c'};
        const std::vector<uint8_t> info_mac = {'m', 'a', 'c'};
        std::vector<uint8_t> enc(32);
        std::vector<uint8_t> mac(32);
        REQUIRE(Hkdf::Expand(prk, enc, info_enc).IsOk());
        REQUIRE(Hkdf::Expand(prk, mac, info_mac).IsOk());
        REQUIRE(enc != mac);
    }
}
