#pragma once

#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kemtls::protocol::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 over the OpenSSL 3 EVP_KDF interface.
 *
 * The session key schedule runs one Extract over the KEM shared secret and
 * then one Expand per derived key, so both phases are exposed separately.
 */
class Hkdf {
public:
    /**
     * @brief Full extract-then-expand derivation into @p output.
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /**
     * @brief HKDF-Extract. Always yields HASH_LEN bytes.
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    /**
     * @brief HKDF-Expand. @p prk must be HASH_LEN bytes.
     */
    static Result<Unit, ProtocolFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<uint8_t> output,
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}  // namespace kemtls::protocol::crypto
