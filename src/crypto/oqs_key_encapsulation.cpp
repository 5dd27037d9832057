#include "kemtls/crypto/oqs_key_encapsulation.hpp"
#include "kemtls/crypto/oqs_runtime.hpp"
#include "kemtls/core/constants.hpp"

#include <oqs/oqs.h>
#include <fmt/core.h>

#include <algorithm>

namespace kemtls::protocol::crypto {

using interfaces::KemEncapsulation;
using interfaces::KemKeyPair;

Result<std::shared_ptr<OqsKeyEncapsulation>, ProtocolFailure> OqsKeyEncapsulation::Create(
    std::string_view algorithm) {
    using ResultType = Result<std::shared_ptr<OqsKeyEncapsulation>, ProtocolFailure>;

    if (std::find(SUPPORTED_ALGORITHMS.begin(), SUPPORTED_ALGORITHMS.end(), algorithm)
            == SUPPORTED_ALGORITHMS.end()) {
        return ResultType::Err(ProtocolFailure::InvalidInput(
            fmt::format("Unsupported KEM algorithm '{}'", algorithm)));
    }
    if (auto init = OqsRuntime::Initialize(); init.IsErr()) {
        return ResultType::Err(std::move(init).UnwrapErr());
    }

    const std::string name(algorithm);
    if (!OQS_KEM_alg_is_enabled(name.c_str())) {
        return ResultType::Err(ProtocolFailure::InvalidInput(
            fmt::format("{}: {}", ErrorMessages::OQS_UNAVAILABLE, name)));
    }
    OQS_KEM* kem = OQS_KEM_new(name.c_str());
    if (kem == nullptr) {
        return ResultType::Err(ProtocolFailure::CryptoError(
            fmt::format("Failed to create {} KEM instance (liboqs)", name)));
    }
    return ResultType::Ok(std::shared_ptr<OqsKeyEncapsulation>(new OqsKeyEncapsulation(name, kem)));
}

OqsKeyEncapsulation::OqsKeyEncapsulation(std::string name, OQS_KEM* kem) noexcept
    : name_(std::move(name))
    , kem_(kem) {}

OqsKeyEncapsulation::~OqsKeyEncapsulation() {
    if (kem_ != nullptr) {
        OQS_KEM_free(kem_);
        kem_ = nullptr;
    }
}

size_t OqsKeyEncapsulation::PublicKeySize() const noexcept {
    return kem_->length_public_key;
}

size_t OqsKeyEncapsulation::CiphertextSize() const noexcept {
    return kem_->length_ciphertext;
}

size_t OqsKeyEncapsulation::SharedSecretSize() const noexcept {
    return kem_->length_shared_secret;
}

size_t OqsKeyEncapsulation::SecretKeySize() const noexcept {
    return kem_->length_secret_key;
}

Result<KemKeyPair, ProtocolFailure> OqsKeyEncapsulation::GenerateKeyPair() const {
    auto sk_result = SecureMemoryHandle::Allocate(SecretKeySize());
    if (sk_result.IsErr()) {
        return Result<KemKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sk_result.UnwrapErr()));
    }
    auto sk_handle = std::move(sk_result).Unwrap();
    std::vector<uint8_t> pk(PublicKeySize());

    OQS_STATUS status = OQS_ERROR;
    auto write_result = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk_span) -> Unit {
        status = OQS_KEM_keypair(kem_, pk.data(), sk_span.data());
        return unit;
    });
    if (write_result.IsErr()) {
        return Result<KemKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    if (status != OQS_SUCCESS) {
        return Result<KemKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(fmt::format("{} key generation failed", name_)));
    }
    return Result<KemKeyPair, ProtocolFailure>::Ok(
        KemKeyPair{std::move(pk), std::move(sk_handle)});
}

Result<KemEncapsulation, ProtocolFailure> OqsKeyEncapsulation::Encapsulate(
    std::span<const uint8_t> public_key) const {
    if (public_key.size() != PublicKeySize()) {
        return Result<KemEncapsulation, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(
                fmt::format("{} public key must be {} bytes, got {}",
                    name_, PublicKeySize(), public_key.size())));
    }

    auto ss_result = SecureMemoryHandle::Allocate(SharedSecretSize());
    if (ss_result.IsErr()) {
        return Result<KemEncapsulation, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(ss_result.UnwrapErr()));
    }
    auto ss_handle = std::move(ss_result).Unwrap();
    std::vector<uint8_t> ciphertext(CiphertextSize());

    OQS_STATUS status = OQS_ERROR;
    auto write_result = ss_handle.WithWriteAccess([&](std::span<uint8_t> ss_span) -> Unit {
        status = OQS_KEM_encaps(kem_, ciphertext.data(), ss_span.data(), public_key.data());
        return unit;
    });
    if (write_result.IsErr()) {
        return Result<KemEncapsulation, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    if (status != OQS_SUCCESS) {
        return Result<KemEncapsulation, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(fmt::format("{} encapsulation failed", name_)));
    }
    return Result<KemEncapsulation, ProtocolFailure>::Ok(
        KemEncapsulation{std::move(ciphertext), std::move(ss_handle)});
}

Result<SecureMemoryHandle, ProtocolFailure> OqsKeyEncapsulation::Decapsulate(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> ciphertext) const {
    if (ciphertext.size() != CiphertextSize()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(
                fmt::format("{} ciphertext must be {} bytes, got {}",
                    name_, CiphertextSize(), ciphertext.size())));
    }
    if (secret_key.IsInvalid() || secret_key.Size() != SecretKeySize()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(fmt::format("{} secret key is invalid", name_)));
    }

    auto ss_result = SecureMemoryHandle::Allocate(SharedSecretSize());
    if (ss_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(ss_result.UnwrapErr()));
    }
    auto ss_handle = std::move(ss_result).Unwrap();

    OQS_STATUS status = OQS_ERROR;
    auto read_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk_span) {
        return ss_handle.WithWriteAccess([&](std::span<uint8_t> ss_span) -> Unit {
            status = OQS_KEM_decaps(kem_, ss_span.data(), ciphertext.data(), sk_span.data());
            return unit;
        });
    });
    if (read_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    if (const auto& write_result = read_result.Unwrap(); write_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    if (status != OQS_SUCCESS) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(fmt::format("{} decapsulation failed", name_)));
    }
    return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(ss_handle));
}

}  // namespace kemtls::protocol::crypto
