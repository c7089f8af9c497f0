#pragma once

#include "mixnet/core/errors.hpp"
#include "mixnet/core/identity.hpp"
#include "mixnet/crypto/keys.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <variant>
#include <vector>

namespace mixnet::core {

// Sealed packet wire layout (all packets are exactly PACKET_LEN bytes):
//
//   version(1) | alpha(32) | mac(32) | beta(808) | body(1144) | nonce(16) | zero pad(15)
//
// alpha, mac, beta and body form the onion ciphertext. beta carries one
// ROUTING_LEN block per hop; each relay strips its block and shifts in
// keystream so the header stays fixed-size.
//
// Every hop's nonce is epoch(4) | random(12), where epoch counts
// PACKET_EPOCH periods of the sender's wall clock. The nonce is under the
// hop's MAC, so the epoch cannot be rewritten without failing the peel.
constexpr uint8_t PACKET_VERSION = 0x01;
constexpr size_t MAX_HOPS = 8;
constexpr size_t ALPHA_LEN = 32;
constexpr size_t MAC_LEN = 32;
constexpr size_t NONCE_LEN = 16;
constexpr size_t ROUTING_LEN = 1 + crypto::NODE_ID_LEN + ALPHA_LEN + MAC_LEN + NONCE_LEN;
constexpr size_t HEADER_LEN = MAX_HOPS * ROUTING_LEN;
constexpr size_t BODY_LEN = 1144;
constexpr size_t PAD_LEN = 15;
constexpr size_t ONION_LEN = ALPHA_LEN + MAC_LEN + HEADER_LEN + BODY_LEN;
constexpr size_t PACKET_LEN = 1 + ONION_LEN + NONCE_LEN + PAD_LEN;
constexpr size_t MAX_PAYLOAD_LEN = BODY_LEN - 2;

using WallClock = std::chrono::system_clock;

constexpr std::chrono::seconds PACKET_EPOCH{60};
// Epochs either side of ours that a relay still accepts
constexpr uint32_t PACKET_EPOCH_SLACK = 1;
constexpr size_t NONCE_EPOCH_LEN = 4;

static_assert(ROUTING_LEN == 101);
static_assert(PACKET_LEN == 2048);

namespace layout {
constexpr size_t VERSION = 0;
constexpr size_t ALPHA = 1;
constexpr size_t MAC = ALPHA + ALPHA_LEN;
constexpr size_t BETA = MAC + MAC_LEN;
constexpr size_t BODY = BETA + HEADER_LEN;
constexpr size_t NONCE = BODY + BODY_LEN;
constexpr size_t PAD = NONCE + NONCE_LEN;
}  // namespace layout

enum class RoutingKind : uint8_t {
    Forward = 0x01,
    Deliver = 0x02,
};

using PacketNonce = std::array<uint8_t, NONCE_LEN>;

class SealedPacket {
public:
    SealedPacket();

    // Structural validation only: length, version, zero padding
    [[nodiscard]] static std::expected<SealedPacket, MixnetError>
    parse(std::span<const uint8_t> data);

    [[nodiscard]] std::span<const uint8_t> bytes() const { return data_; }
    [[nodiscard]] std::span<uint8_t> mutable_bytes() { return data_; }

    [[nodiscard]] uint8_t version() const { return data_[layout::VERSION]; }
    [[nodiscard]] std::span<const uint8_t> alpha() const {
        return std::span<const uint8_t>(data_).subspan(layout::ALPHA, ALPHA_LEN);
    }
    [[nodiscard]] std::span<const uint8_t> mac() const {
        return std::span<const uint8_t>(data_).subspan(layout::MAC, MAC_LEN);
    }
    [[nodiscard]] std::span<const uint8_t> beta() const {
        return std::span<const uint8_t>(data_).subspan(layout::BETA, HEADER_LEN);
    }
    [[nodiscard]] std::span<const uint8_t> body() const {
        return std::span<const uint8_t>(data_).subspan(layout::BODY, BODY_LEN);
    }
    [[nodiscard]] PacketNonce nonce() const;

    bool operator==(const SealedPacket&) const = default;

private:
    std::array<uint8_t, PACKET_LEN> data_{};
};

// Outcome of peeling one layer
struct Forward {
    NodeId next_hop;
    SealedPacket packet;
};

struct Deliver {
    std::vector<uint8_t> payload;
};

using Disposition = std::variant<Forward, Deliver>;

[[nodiscard]] uint32_t packet_epoch(WallClock::time_point t);
[[nodiscard]] uint32_t nonce_epoch(const PacketNonce& nonce);

// Wraps payload in one layer per hop of route; route[0] peels first.
// Every hop's nonce carries the epoch of now.
[[nodiscard]] std::expected<SealedPacket, MixnetError>
encode(const Route& route, std::span<const uint8_t> payload,
       WallClock::time_point now = WallClock::now());

// Removes exactly one layer with this relay's onion key.
// DecryptionError on MAC mismatch; MalformedPacket on bad structure.
[[nodiscard]] std::expected<Disposition, MixnetError>
peel(const SealedPacket& packet, const crypto::OnionSecretKey& onion_key);

}  // namespace mixnet::core
