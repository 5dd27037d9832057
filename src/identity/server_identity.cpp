#include "kemtls/identity/server_identity.hpp"
#include "kemtls/core/logging.hpp"
#include "kemtls/crypto/sodium_interop.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace kemtls::protocol::identity {

using crypto::SecureMemoryHandle;

namespace {
    std::span<const uint8_t> AsBytes(const std::string& field) {
        return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
    }

    std::string ToField(std::span<const uint8_t> bytes) {
        return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    Result<SecureMemoryHandle, ProtocolFailure> RestoreSecret(
        const std::string& field, const char* name) {
        if (field.empty()) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(fmt::format("Identity state is missing {}", name)));
        }
        auto handle = SecureMemoryHandle::FromBytes(AsBytes(field));
        if (handle.IsErr()) {
            return Result<SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle).Unwrap());
    }

    Result<std::string, ProtocolFailure> ExportSecret(const SecureMemoryHandle& handle) {
        auto bytes = handle.ReadBytes(handle.Size());
        if (bytes.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(bytes.UnwrapErr()));
        }
        auto secret = std::move(bytes).Unwrap();
        std::string field = ToField(secret);
        auto wiped = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(secret));
        (void)wiped;
        return Result<std::string, ProtocolFailure>::Ok(std::move(field));
    }
}

ServerIdentity::ServerIdentity(
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme,
    SecureMemoryHandle kem_secret_key,
    SecureMemoryHandle signing_key,
    Certificate certificate)
    : kem_(std::move(kem))
    , signature_scheme_(std::move(signature_scheme))
    , kem_secret_key_(std::move(kem_secret_key))
    , signing_key_(std::move(signing_key))
    , certificate_(std::move(certificate))
    , certificate_bytes_(certificate_.Serialize()) {}

Result<std::shared_ptr<const ServerIdentity>, ProtocolFailure> ServerIdentity::Generate(
    std::string subject,
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme) {
    using ResultType = Result<std::shared_ptr<const ServerIdentity>, ProtocolFailure>;

    if (!kem || !signature_scheme) {
        return ResultType::Err(ProtocolFailure::InvalidInput("Server identity needs KEM and signature capabilities"));
    }

    auto kem_pair = kem->GenerateKeyPair();
    if (kem_pair.IsErr()) {
        return ResultType::Err(std::move(kem_pair).UnwrapErr());
    }
    auto sig_pair = signature_scheme->GenerateKeyPair();
    if (sig_pair.IsErr()) {
        return ResultType::Err(std::move(sig_pair).UnwrapErr());
    }
    auto kem_keys = std::move(kem_pair).Unwrap();
    auto sig_keys = std::move(sig_pair).Unwrap();

    auto certificate = Certificate::Create(
        std::move(subject),
        std::move(kem_keys.public_key),
        std::move(sig_keys.public_key),
        *signature_scheme,
        sig_keys.secret_key);
    if (certificate.IsErr()) {
        return ResultType::Err(std::move(certificate).UnwrapErr());
    }

    std::shared_ptr<const ServerIdentity> identity(new ServerIdentity(
        std::move(kem),
        std::move(signature_scheme),
        std::move(kem_keys.secret_key),
        std::move(sig_keys.secret_key),
        std::move(certificate).Unwrap()));

    Logging::Get()->info("Generated server identity '{}' ({} / {})",
        identity->Subject(), identity->Kem().Name(), identity->SignatureScheme().Name());
    return ResultType::Ok(std::move(identity));
}

Result<std::shared_ptr<const ServerIdentity>, ProtocolFailure> ServerIdentity::FromState(
    const proto::identity::ServerIdentityState& state,
    std::shared_ptr<const interfaces::IKeyEncapsulation> kem,
    std::shared_ptr<const interfaces::ISignatureScheme> signature_scheme) {
    using ResultType = Result<std::shared_ptr<const ServerIdentity>, ProtocolFailure>;

    if (!kem || !signature_scheme) {
        return ResultType::Err(ProtocolFailure::InvalidInput("Server identity needs KEM and signature capabilities"));
    }
    if (state.version() != STATE_VERSION) {
        return ResultType::Err(ProtocolFailure::InvalidInput(
            fmt::format("Unsupported identity state version {}", state.version())));
    }
    if (state.kem_algorithm() != kem->Name() ||
        state.signature_algorithm() != signature_scheme->Name()) {
        return ResultType::Err(ProtocolFailure::InvalidInput(
            fmt::format("Identity state uses {} / {}, capabilities are {} / {}",
                state.kem_algorithm(), state.signature_algorithm(),
                kem->Name(), signature_scheme->Name())));
    }

    auto certificate_result = Certificate::Parse(AsBytes(state.certificate()));
    if (certificate_result.IsErr()) {
        return ResultType::Err(std::move(certificate_result).UnwrapErr());
    }
    auto certificate = std::move(certificate_result).Unwrap();
    if (!certificate.Verify(*signature_scheme)) {
        return ResultType::Err(ProtocolFailure::AuthenticationFailure(
            "Stored certificate signature does not verify"));
    }

    const auto kem_public = AsBytes(state.kem_public_key());
    const auto sig_public = AsBytes(state.sig_public_key());
    if (certificate.Subject() != state.subject() ||
        !std::equal(kem_public.begin(), kem_public.end(),
            certificate.KemPublicKey().begin(), certificate.KemPublicKey().end()) ||
        !std::equal(sig_public.begin(), sig_public.end(),
            certificate.SigPublicKey().begin(), certificate.SigPublicKey().end())) {
        return ResultType::Err(ProtocolFailure::InvalidInput(
            "Identity state does not match its certificate"));
    }

    auto kem_secret = RestoreSecret(state.kem_secret_key(), "kem_secret_key");
    if (kem_secret.IsErr()) {
        return ResultType::Err(std::move(kem_secret).UnwrapErr());
    }
    auto sig_secret = RestoreSecret(state.sig_secret_key(), "sig_secret_key");
    if (sig_secret.IsErr()) {
        return ResultType::Err(std::move(sig_secret).UnwrapErr());
    }

    std::shared_ptr<const ServerIdentity> identity(new ServerIdentity(
        std::move(kem),
        std::move(signature_scheme),
        std::move(kem_secret).Unwrap(),
        std::move(sig_secret).Unwrap(),
        std::move(certificate)));
    return ResultType::Ok(std::move(identity));
}

Result<proto::identity::ServerIdentityState, ProtocolFailure> ServerIdentity::ExportState() const {
    using ResultType = Result<proto::identity::ServerIdentityState, ProtocolFailure>;

    auto kem_secret = ExportSecret(kem_secret_key_);
    if (kem_secret.IsErr()) {
        return ResultType::Err(std::move(kem_secret).UnwrapErr());
    }
    auto sig_secret = ExportSecret(signing_key_);
    if (sig_secret.IsErr()) {
        return ResultType::Err(std::move(sig_secret).UnwrapErr());
    }

    proto::identity::ServerIdentityState state;
    state.set_version(STATE_VERSION);
    state.set_subject(certificate_.Subject());
    state.set_kem_algorithm(std::string(kem_->Name()));
    state.set_signature_algorithm(std::string(signature_scheme_->Name()));
    state.set_kem_public_key(ToField(certificate_.KemPublicKey()));
    state.set_kem_secret_key(std::move(kem_secret).Unwrap());
    state.set_sig_public_key(ToField(certificate_.SigPublicKey()));
    state.set_sig_secret_key(std::move(sig_secret).Unwrap());
    state.set_certificate(ToField(certificate_bytes_));
    return ResultType::Ok(std::move(state));
}

Result<std::vector<uint8_t>, ProtocolFailure> ServerIdentity::Sign(
    std::span<const uint8_t> message) const {
    return signature_scheme_->Sign(signing_key_, message);
}

}  // namespace kemtls::protocol::identity
