#include "kemtls/configuration/channel_config.hpp"
#include "kemtls/crypto/oqs_key_encapsulation.hpp"
#include "kemtls/crypto/oqs_signature.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace kemtls::protocol::configuration {

namespace {
    Result<Unit, ProtocolFailure> Invalid(std::string message) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(std::move(message)));
    }

    template<typename Container>
    bool Contains(const Container& names, const std::string& name) {
        return std::find(names.begin(), names.end(), name) != names.end();
    }
}

Result<Unit, ProtocolFailure> ChannelConfig::Validate() const {
    if (max_message_bytes < kFrameHeaderBytes || max_message_bytes > kMaxMessageBytesLimit) {
        return Invalid(fmt::format("max_message_bytes must be in {}..{}, got {}",
            kFrameHeaderBytes, kMaxMessageBytesLimit, max_message_bytes));
    }
    if (max_application_message_bytes == 0 || max_application_message_bytes > kMaxMessageBytesLimit) {
        return Invalid(fmt::format("max_application_message_bytes must be in 1..{}, got {}",
            kMaxMessageBytesLimit, max_application_message_bytes));
    }
    if (handshake_timeout.count() <= 0 || record_timeout.count() <= 0 || connect_timeout.count() <= 0) {
        return Invalid("Timeouts must be positive");
    }
    if (expected_subject && (expected_subject->empty() || expected_subject->size() > kMaxSubjectBytes)) {
        return Invalid(fmt::format("expected_subject must be 1..{} bytes", kMaxSubjectBytes));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

HandshakeOptions ChannelConfig::ToHandshakeOptions() const {
    HandshakeOptions options;
    options.max_message_bytes = max_message_bytes;
    options.expected_subject = expected_subject;
    options.random = random;
    return options;
}

Result<Unit, ProtocolFailure> ServerConfig::Validate() const {
    if (bind_host.empty()) {
        return Invalid("bind_host must not be empty");
    }
    if (subject.empty() || subject.size() > kMaxSubjectBytes) {
        return Invalid(fmt::format("subject must be 1..{} bytes", kMaxSubjectBytes));
    }
    if (!Contains(crypto::OqsKeyEncapsulation::SUPPORTED_ALGORITHMS, kem_algorithm)) {
        return Invalid(fmt::format("Unsupported KEM algorithm '{}'", kem_algorithm));
    }
    if (!Contains(crypto::OqsSignature::SUPPORTED_ALGORITHMS, signature_algorithm)) {
        return Invalid(fmt::format("Unsupported signature algorithm '{}'", signature_algorithm));
    }
    return channel.Validate();
}

}  // namespace kemtls::protocol::configuration
