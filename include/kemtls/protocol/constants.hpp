#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace kemtls::protocol {

inline constexpr size_t kFrameHeaderBytes = 5;
inline constexpr size_t kDefaultMaxMessageBytes = 1024 * 1024;
inline constexpr size_t kMaxMessageBytesLimit = 16 * 1024 * 1024;

inline constexpr size_t kHandshakeNonceBytes = 32;
inline constexpr size_t kSharedSecretBytes = 32;
inline constexpr size_t kEncKeyBytes = 32;
inline constexpr size_t kMacKeyBytes = 32;
inline constexpr size_t kIvBytes = 16;
inline constexpr size_t kFinishedMacBytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kMaxRecordPlaintextBytes = 16 * 1024;
inline constexpr size_t kApplicationLengthPrefixBytes = 4;
inline constexpr uint64_t kRecordSequenceLimit = 0x7FFFFFFFFFFFFFFFull;
inline constexpr uint64_t kServerDirectionBit = 0x8000000000000000ull;

inline constexpr size_t kCertificateFieldLengthBytes = 4;
inline constexpr size_t kMaxSubjectBytes = 1024;

inline constexpr std::string_view kSessionKeySalt = "KEMTLS-Session-Keys";
inline constexpr std::string_view kSessionKeyInfoPrefix = "KEMTLS-v1 ";
inline constexpr std::string_view kEncKeyLabel = "enc";
inline constexpr std::string_view kMacKeyLabel = "mac";
inline constexpr std::string_view kIvLabel = "iv";

inline constexpr std::string_view kDefaultKemAlgorithm = "ML-KEM-768";
inline constexpr std::string_view kDefaultSignatureAlgorithm = "ML-DSA-44";
inline constexpr std::string_view kDefaultServerSubject = "CN=PQ-OIDC-Server";
inline constexpr uint16_t kDefaultServerPort = 8443;

inline constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{10'000};
inline constexpr std::chrono::milliseconds kDefaultRecordTimeout{30'000};
inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{5'000};

}  // namespace kemtls::protocol
