#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"

namespace kemtls::protocol::crypto {

/**
 * @brief One-time liboqs setup shared by the KEM and signature wrappers.
 *
 * Initializes libsodium and routes liboqs randomness through its CSPRNG so
 * that every random byte in the library comes from one source.
 */
class OqsRuntime {
public:
    static Result<Unit, ProtocolFailure> Initialize();

private:
    OqsRuntime() = delete;
};

}  // namespace kemtls::protocol::crypto
