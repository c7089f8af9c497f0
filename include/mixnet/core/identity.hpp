#pragma once

#include "mixnet/crypto/keys.hpp"
#include "mixnet/util/binary.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace mixnet::core {

using crypto::NodeId;

// Published description of a relay: who it is and where to reach it.
// Signed by the identity key over everything except the signature.
struct RelayIdentity {
    crypto::IdentityPublicKey identity_key;
    crypto::OnionPublicKey onion_key;
    std::vector<std::string> addresses;  // "host:port"
    uint64_t published_at{0};            // unix seconds
    crypto::Signature signature{};

    [[nodiscard]] NodeId node_id() const { return NodeId(identity_key); }

    [[nodiscard]] std::vector<uint8_t> signed_bytes() const;
    [[nodiscard]] std::vector<uint8_t> serialize() const;
    [[nodiscard]] bool verify() const;

    [[nodiscard]] static std::expected<RelayIdentity, util::WireError>
    parse(std::span<const uint8_t> data);

    [[nodiscard]] static std::expected<RelayIdentity, crypto::KeyError>
    create(const crypto::NodeKeys& keys,
           std::vector<std::string> addresses,
           uint64_t published_at);

    bool operator==(const RelayIdentity&) const = default;
};

// A path as chosen by a sender: hops after the sender, destination last
using Route = std::vector<RelayIdentity>;

[[nodiscard]] uint64_t unix_now();

}  // namespace mixnet::core
