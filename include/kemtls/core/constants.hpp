#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace kemtls::protocol {

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr size_t ERROR_BUFFER_SIZE = 256;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view DIGEST_SHA256 = "SHA256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle has been disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view OQS_UNAVAILABLE = "Algorithm is not enabled in liboqs";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED = "AES-GCM authentication tag mismatch";
    static constexpr std::string_view UNEXPECTED_MESSAGE = "Unexpected message for current handshake state";
    static constexpr std::string_view HANDSHAKE_TERMINATED = "Handshake already terminated";
};

}  // namespace kemtls::protocol
