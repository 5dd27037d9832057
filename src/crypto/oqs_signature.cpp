#include "kemtls/crypto/oqs_signature.hpp"
#include "kemtls/crypto/oqs_runtime.hpp"
#include "kemtls/core/constants.hpp"

#include <oqs/oqs.h>
#include <fmt/core.h>

#include <algorithm>

namespace kemtls::protocol::crypto {

using interfaces::SignatureKeyPair;

Result<std::shared_ptr<OqsSignature>, ProtocolFailure> OqsSignature::Create(
    std::string_view algorithm) {
    using ResultType = Result<std::shared_ptr<OqsSignature>, ProtocolFailure>;

    if (std::find(SUPPORTED_ALGORITHMS.begin(), SUPPORTED_ALGORITHMS.end(), algorithm)
            == SUPPORTED_ALGORITHMS.end()) {
        return ResultType::Err(ProtocolFailure::InvalidInput(
            fmt::format("Unsupported signature algorithm '{}'", algorithm)));
    }
    if (auto init = OqsRuntime::Initialize(); init.IsErr()) {
        return ResultType::Err(std::move(init).UnwrapErr());
    }

    const std::string name(algorithm);
    if (!OQS_SIG_alg_is_enabled(name.c_str())) {
        return ResultType::Err(ProtocolFailure::InvalidInput(
            fmt::format("{}: {}", ErrorMessages::OQS_UNAVAILABLE, name)));
    }
    OQS_SIG* sig = OQS_SIG_new(name.c_str());
    if (sig == nullptr) {
        return ResultType::Err(ProtocolFailure::CryptoError(
            fmt::format("Failed to create {} signature instance (liboqs)", name)));
    }
    return ResultType::Ok(std::shared_ptr<OqsSignature>(new OqsSignature(name, sig)));
}

OqsSignature::OqsSignature(std::string name, OQS_SIG* sig) noexcept
    : name_(std::move(name))
    , sig_(sig) {}

OqsSignature::~OqsSignature() {
    if (sig_ != nullptr) {
        OQS_SIG_free(sig_);
        sig_ = nullptr;
    }
}

size_t OqsSignature::PublicKeySize() const noexcept {
    return sig_->length_public_key;
}

size_t OqsSignature::MaxSignatureSize() const noexcept {
    return sig_->length_signature;
}

size_t OqsSignature::SecretKeySize() const noexcept {
    return sig_->length_secret_key;
}

Result<SignatureKeyPair, ProtocolFailure> OqsSignature::GenerateKeyPair() const {
    auto sk_result = SecureMemoryHandle::Allocate(SecretKeySize());
    if (sk_result.IsErr()) {
        return Result<SignatureKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sk_result.UnwrapErr()));
    }
    auto sk_handle = std::move(sk_result).Unwrap();
    std::vector<uint8_t> pk(PublicKeySize());

    OQS_STATUS status = OQS_ERROR;
    auto write_result = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk_span) -> Unit {
        status = OQS_SIG_keypair(sig_, pk.data(), sk_span.data());
        return unit;
    });
    if (write_result.IsErr()) {
        return Result<SignatureKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    if (status != OQS_SUCCESS) {
        return Result<SignatureKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(fmt::format("{} key generation failed", name_)));
    }
    return Result<SignatureKeyPair, ProtocolFailure>::Ok(
        SignatureKeyPair{std::move(pk), std::move(sk_handle)});
}

Result<std::vector<uint8_t>, ProtocolFailure> OqsSignature::Sign(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> message) const {
    if (secret_key.IsInvalid() || secret_key.Size() != SecretKeySize()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(fmt::format("{} signing key is invalid", name_)));
    }

    std::vector<uint8_t> signature(MaxSignatureSize());
    size_t signature_len = 0;
    OQS_STATUS status = OQS_ERROR;
    auto read_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk_span) -> Unit {
        status = OQS_SIG_sign(sig_, signature.data(), &signature_len,
            message.data(), message.size(), sk_span.data());
        return unit;
    });
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    if (status != OQS_SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError(fmt::format("{} signing failed", name_)));
    }
    signature.resize(signature_len);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

bool OqsSignature::Verify(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) const {
    if (public_key.size() != PublicKeySize() ||
        signature.empty() || signature.size() > MaxSignatureSize()) {
        return false;
    }
    return OQS_SIG_verify(sig_, message.data(), message.size(),
        signature.data(), signature.size(), public_key.data()) == OQS_SUCCESS;
}

}  // namespace kemtls::protocol::crypto
