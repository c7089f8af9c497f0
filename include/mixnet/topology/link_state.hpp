#pragma once

#include "mixnet/crypto/keys.hpp"
#include "mixnet/util/binary.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace mixnet::topology {

using crypto::NodeId;

constexpr size_t MAX_ADVERTISED_EDGES = 256;

struct EdgeAdvert {
    NodeId neighbor;
    uint32_t cost{1};

    bool operator==(const EdgeAdvert&) const = default;
};

// Signed gossip record: the announcing relay's current view of its own links.
// counter strictly increases per relay; a newer record replaces all edges the
// relay announced before.
struct LinkStateRecord {
    NodeId relay_id;
    uint64_t counter{0};
    uint64_t timestamp{0};  // unix seconds at signing
    std::vector<EdgeAdvert> edges;
    crypto::Signature signature{};

    [[nodiscard]] std::vector<uint8_t> signed_bytes() const;
    [[nodiscard]] std::vector<uint8_t> serialize() const;
    [[nodiscard]] bool verify(const crypto::IdentityPublicKey& key) const;

    [[nodiscard]] static std::expected<LinkStateRecord, util::WireError>
    parse(std::span<const uint8_t> data);

    [[nodiscard]] static std::expected<LinkStateRecord, crypto::KeyError>
    create(const crypto::IdentitySecretKey& key,
           uint64_t counter,
           uint64_t timestamp,
           std::vector<EdgeAdvert> edges);

    bool operator==(const LinkStateRecord&) const = default;
};

}  // namespace mixnet::topology
