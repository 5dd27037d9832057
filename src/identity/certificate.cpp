#include "kemtls/identity/certificate.hpp"
#include "kemtls/protocol/byte_order.hpp"
#include "kemtls/protocol/constants.hpp"
#include <fmt/core.h>

namespace kemtls::protocol::identity {

namespace {
    void AppendField(std::vector<uint8_t>& out, std::span<const uint8_t> field) {
        AppendUint32BE(out, static_cast<uint32_t>(field.size()));
        out.insert(out.end(), field.begin(), field.end());
    }

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    class FieldReader {
    public:
        explicit FieldReader(std::span<const uint8_t> bytes) : remaining_(bytes) {}

        Result<std::span<const uint8_t>, ProtocolFailure> Next(std::string_view name) {
            if (remaining_.size() < kCertificateFieldLengthBytes) {
                return Result<std::span<const uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::MalformedMessage(
                        fmt::format("Certificate truncated before {} length", name)));
            }
            const uint32_t length = ReadUint32BE(remaining_);
            remaining_ = remaining_.subspan(kCertificateFieldLengthBytes);
            if (length > remaining_.size()) {
                return Result<std::span<const uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::MalformedMessage(
                        fmt::format("Certificate {} length {} exceeds remaining {} bytes",
                            name, length, remaining_.size())));
            }
            auto field = remaining_.first(length);
            remaining_ = remaining_.subspan(length);
            return Result<std::span<const uint8_t>, ProtocolFailure>::Ok(field);
        }

        [[nodiscard]] bool AtEnd() const noexcept { return remaining_.empty(); }

    private:
        std::span<const uint8_t> remaining_;
    };
}

Certificate::Certificate(
    std::string subject,
    std::vector<uint8_t> kem_public_key,
    std::vector<uint8_t> sig_public_key,
    std::vector<uint8_t> signature)
    : subject_(std::move(subject))
    , kem_public_key_(std::move(kem_public_key))
    , sig_public_key_(std::move(sig_public_key))
    , signature_(std::move(signature)) {}

Result<Unit, ProtocolFailure> Certificate::ValidateFields(
    std::string_view subject,
    std::span<const uint8_t> kem_public_key,
    std::span<const uint8_t> sig_public_key) {
    if (subject.empty() || subject.size() > kMaxSubjectBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage(
                fmt::format("Certificate subject must be 1..{} bytes, got {}",
                    kMaxSubjectBytes, subject.size())));
    }
    if (kem_public_key.empty() || sig_public_key.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage("Certificate public keys must not be empty"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Certificate, ProtocolFailure> Certificate::Create(
    std::string subject,
    std::vector<uint8_t> kem_public_key,
    std::vector<uint8_t> sig_public_key,
    const interfaces::ISignatureScheme& signature_scheme,
    const crypto::SecureMemoryHandle& signing_key) {
    if (auto valid = ValidateFields(subject, kem_public_key, sig_public_key); valid.IsErr()) {
        return Result<Certificate, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(valid.UnwrapErr().message));
    }

    Certificate unsigned_cert(
        std::move(subject), std::move(kem_public_key), std::move(sig_public_key), {});
    auto sign_result = signature_scheme.Sign(signing_key, unsigned_cert.ToBeSigned());
    if (sign_result.IsErr()) {
        return Result<Certificate, ProtocolFailure>::Err(std::move(sign_result).UnwrapErr());
    }
    unsigned_cert.signature_ = std::move(sign_result).Unwrap();
    if (unsigned_cert.signature_.empty()) {
        return Result<Certificate, ProtocolFailure>::Err(
            ProtocolFailure::CryptoError("Signature scheme produced an empty signature"));
    }
    return Result<Certificate, ProtocolFailure>::Ok(std::move(unsigned_cert));
}

Result<Certificate, ProtocolFailure> Certificate::Parse(std::span<const uint8_t> bytes) {
    FieldReader reader(bytes);

    auto subject = reader.Next("subject");
    if (subject.IsErr()) {
        return Result<Certificate, ProtocolFailure>::Err(std::move(subject).UnwrapErr());
    }
    auto kem_pub = reader.Next("kem_public_key");
    if (kem_pub.IsErr()) {
        return Result<Certificate, ProtocolFailure>::Err(std::move(kem_pub).UnwrapErr());
    }
    auto sig_pub = reader.Next("sig_public_key");
    if (sig_pub.IsErr()) {
        return Result<Certificate, ProtocolFailure>::Err(std::move(sig_pub).UnwrapErr());
    }
    auto signature = reader.Next("signature");
    if (signature.IsErr()) {
        return Result<Certificate, ProtocolFailure>::Err(std::move(signature).UnwrapErr());
    }
    if (!reader.AtEnd()) {
        return Result<Certificate, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage("Trailing bytes after certificate signature"));
    }

    const auto subject_bytes = subject.Unwrap();
    const std::string_view subject_text(
        reinterpret_cast<const char*>(subject_bytes.data()), subject_bytes.size());
    if (auto valid = ValidateFields(subject_text, kem_pub.Unwrap(), sig_pub.Unwrap()); valid.IsErr()) {
        return Result<Certificate, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (signature.Unwrap().empty()) {
        return Result<Certificate, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage("Certificate signature must not be empty"));
    }

    return Result<Certificate, ProtocolFailure>::Ok(Certificate(
        std::string(subject_text),
        std::vector<uint8_t>(kem_pub.Unwrap().begin(), kem_pub.Unwrap().end()),
        std::vector<uint8_t>(sig_pub.Unwrap().begin(), sig_pub.Unwrap().end()),
        std::vector<uint8_t>(signature.Unwrap().begin(), signature.Unwrap().end())));
}

std::vector<uint8_t> Certificate::ToBeSigned() const {
    std::vector<uint8_t> tbs;
    tbs.reserve(3 * kCertificateFieldLengthBytes +
        subject_.size() + kem_public_key_.size() + sig_public_key_.size());
    AppendField(tbs, AsBytes(subject_));
    AppendField(tbs, kem_public_key_);
    AppendField(tbs, sig_public_key_);
    return tbs;
}

std::vector<uint8_t> Certificate::Serialize() const {
    std::vector<uint8_t> out = ToBeSigned();
    AppendField(out, signature_);
    return out;
}

bool Certificate::Verify(const interfaces::ISignatureScheme& signature_scheme) const {
    if (signature_.empty()) {
        return false;
    }
    return signature_scheme.Verify(sig_public_key_, ToBeSigned(), signature_);
}

}  // namespace kemtls::protocol::identity
