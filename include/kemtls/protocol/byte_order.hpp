#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kemtls::protocol {

inline void AppendUint32BE(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

[[nodiscard]] inline uint32_t ReadUint32BE(std::span<const uint8_t> in) noexcept {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

inline void StoreUint64BE(std::span<uint8_t, 8> out, uint64_t value) noexcept {
    for (size_t i = 0; i < 8; ++i) {
        out[7 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

}  // namespace kemtls::protocol
