#include "kemtls/crypto/hkdf.hpp"
#include "kemtls/core/constants.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <fmt/core.h>

#include <memory>
#include <string>

namespace kemtls::protocol::crypto {

namespace {
    struct EvpKdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const noexcept {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EvpKdfCtxDeleter>;

    Result<Unit, ProtocolFailure> RunHkdf(
        int mode,
        std::span<const uint8_t> key,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) {

        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr);
        if (!kdf) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::CryptoError("Failed to fetch HKDF algorithm"));
        }
        EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
        EVP_KDF_free(kdf);
        if (!kctx) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::CryptoError("Failed to create HKDF context"));
        }

        OSSL_PARAM params[6];
        int param_idx = 0;
        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_DIGEST,
            const_cast<char*>(OpenSSLConstants::DIGEST_SHA256.data()), 0);
        params[param_idx++] = OSSL_PARAM_construct_int(OSSL_KDF_PARAM_MODE, &mode);
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(key.data()), key.size());
        if (!salt.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
        }
        if (!info.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
        }
        params[param_idx] = OSSL_PARAM_construct_end();

        if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params)
                != OpenSSLConstants::SUCCESS) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::CryptoError("HKDF key derivation failed"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Result<Unit, ProtocolFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("HKDF output size must be in 1..{}, got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }
    return RunHkdf(EVP_KDF_HKDF_MODE_EXTRACT_AND_EXPAND, ikm, output, salt, info);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {

    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }
    std::vector<uint8_t> prk(HASH_LEN);
    auto result = RunHkdf(EVP_KDF_HKDF_MODE_EXTRACT_ONLY, ikm, prk, salt, {});
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(prk));
}

Result<Unit, ProtocolFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<uint8_t> output,
    std::span<const uint8_t> info) {

    if (prk.size() != HASH_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("PRK must be exactly {} bytes", HASH_LEN)));
    }
    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("HKDF output size must be in 1..{}, got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }
    return RunHkdf(EVP_KDF_HKDF_MODE_EXPAND_ONLY, prk, output, {}, info);
}

}  // namespace kemtls::protocol::crypto
