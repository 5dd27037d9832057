#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace kemtls::protocol::crypto {

/**
 * AES-256-GCM AEAD over OpenSSL EVP.
 *
 * Stateless: the caller owns nonce uniqueness. The record layer derives each
 * nonce from the session IV, the direction and an implicit sequence number,
 * so a (key, nonce) pair is never reused within a session.
 *
 * Output of Encrypt is ciphertext || 16-byte tag.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /// Fails with AuthenticationFailure when the tag does not verify.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

private:
    AesGcm() = delete;
};

}  // namespace kemtls::protocol::crypto
