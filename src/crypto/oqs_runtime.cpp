#include "kemtls/crypto/oqs_runtime.hpp"
#include "kemtls/crypto/sodium_interop.hpp"

#include <oqs/oqs.h>
#include <oqs/rand.h>
#include <sodium.h>

#include <mutex>

namespace kemtls::protocol::crypto {

Result<Unit, ProtocolFailure> OqsRuntime::Initialize() {
    auto sodium_init = SodiumInterop::Initialize();
    if (sodium_init.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sodium_init.UnwrapErr()));
    }

    static std::once_flag oqs_init_flag;
    std::call_once(oqs_init_flag, []() {
        OQS_init();
        OQS_randombytes_custom_algorithm(
            [](uint8_t* buf, size_t len) { randombytes_buf(buf, len); });
    });
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}  // namespace kemtls::protocol::crypto
