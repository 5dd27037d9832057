#pragma once
#include "kemtls/core/result.hpp"
#include "kemtls/core/failures.hpp"
#include "kemtls/protocol/constants.hpp"
#include "kemtls/protocol/key_schedule.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace kemtls::protocol {

enum class Role : uint8_t {
    Client,
    Server
};

/**
 * @brief AES-256-GCM record protection for an established session.
 *
 * Each direction keeps its own implicit 63-bit sequence number. The nonce is
 * iv[0..12) XOR (0^32 || BE64(direction_bit | sequence)), with the direction
 * bit set for server-to-client traffic, so the two directions never share a
 * nonce. The 5-byte record header is authenticated as associated data.
 *
 * Because sequence numbers are implicit, a dropped, replayed or reordered
 * record fails authentication. Any decrypt failure is terminal.
 */
class RecordLayer {
public:
    RecordLayer(SessionKeys keys, Role role);

    RecordLayer(RecordLayer&&) noexcept = default;
    RecordLayer& operator=(RecordLayer&&) noexcept = default;
    RecordLayer(const RecordLayer&) = delete;
    RecordLayer& operator=(const RecordLayer&) = delete;

    /// Protects up to kMaxRecordPlaintextBytes and returns an encoded Record frame.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext);

    /// Opens one encoded frame from the peer. An Alert frame yields ConnectionClosed.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> frame);

    [[nodiscard]] uint64_t SendSequence() const noexcept { return send_sequence_; }
    [[nodiscard]] uint64_t ReceiveSequence() const noexcept { return receive_sequence_; }
    [[nodiscard]] bool IsFailed() const noexcept { return failed_; }

private:
    [[nodiscard]] std::array<uint8_t, kAesGcmNonceBytes> NonceFor(
        uint64_t direction_bit, uint64_t sequence) const noexcept;

    Result<std::vector<uint8_t>, ProtocolFailure> Terminate(ProtocolFailure failure);

    SessionKeys keys_;
    Role role_;
    uint64_t send_sequence_ = 0;
    uint64_t receive_sequence_ = 0;
    bool failed_ = false;
};

}  // namespace kemtls::protocol
