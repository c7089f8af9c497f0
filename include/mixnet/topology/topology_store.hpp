#pragma once

#include "mixnet/core/identity.hpp"
#include "mixnet/topology/link_state.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mixnet::topology {

using Clock = std::chrono::steady_clock;

enum class TopologyError {
    InvalidSignature,
    UnknownRelay,      // record from a relay whose identity we have not seen
    StaleRecord,       // older than what we hold
    NoRouteFound,
    InvalidArgument,
};

[[nodiscard]] std::string topology_error_message(TopologyError err);

// Undirected edge key, endpoints ordered
struct EdgeKey {
    NodeId lo;
    NodeId hi;

    EdgeKey() = default;
    EdgeKey(const NodeId& a, const NodeId& b)
        : lo(a < b ? a : b), hi(a < b ? b : a) {}

    auto operator<=>(const EdgeKey&) const = default;
    bool operator==(const EdgeKey&) const = default;
};

struct EdgeState {
    EdgeKey key;
    uint32_t cost{1};
    NodeId announcer;       // relay whose record currently owns this edge
    uint64_t counter{0};    // that record's counter
    Clock::time_point last_seen;
    bool stale{false};      // excluded from path computation
};

// Immutable point-in-time view. Path computation runs only on snapshots.
class TopologySnapshot {
public:
    uint64_t generation{0};
    std::map<NodeId, core::RelayIdentity> relays;
    std::map<EdgeKey, EdgeState> edges;

    // Usable (non-stale) neighbours, sorted by id
    std::map<NodeId, std::vector<std::pair<NodeId, uint32_t>>> adjacency;

    [[nodiscard]] const core::RelayIdentity* find(const NodeId& id) const;
    [[nodiscard]] bool has_usable_edge(const NodeId& a, const NodeId& b) const;
    [[nodiscard]] std::string dump(const NodeId& self) const;
};

using SnapshotPtr = std::shared_ptr<const TopologySnapshot>;

// Eventually-consistent relay graph fed by gossip.
//
// One writer mutex serializes merges; every mutation publishes a fresh
// generation-tagged snapshot that readers load without taking the mutex.
class TopologyStore {
public:
    struct Config {
        std::chrono::seconds edge_ttl{300};
        std::chrono::seconds identity_ttl{3600};
    };

    TopologyStore(NodeId self, Config config);

    // Returns true if the store changed. Verifies the self-signature.
    [[nodiscard]] std::expected<bool, TopologyError>
    insert_identity(const core::RelayIdentity& identity, Clock::time_point now = Clock::now());

    // Applies the per-edge merge rule. Returns true if the store changed.
    [[nodiscard]] std::expected<bool, TopologyError>
    merge(const LinkStateRecord& record, Clock::time_point now = Clock::now());

    // Excludes edge a-b from paths until a newer record refreshes it
    void mark_stale(const NodeId& a, const NodeId& b);

    // Drops edges and identities not refreshed within their TTL.
    // Returns the number of entries removed.
    size_t evict_expired(Clock::time_point now = Clock::now());

    [[nodiscard]] SnapshotPtr snapshot() const { return current_.load(); }
    [[nodiscard]] uint64_t generation() const { return snapshot()->generation; }

    // Latest accepted record per relay (for re-gossip)
    [[nodiscard]] std::vector<LinkStateRecord> records() const;
    [[nodiscard]] std::optional<LinkStateRecord> record_of(const NodeId& relay) const;

    // Signs and merges a new record for this node. The counter never repeats,
    // including across restarts.
    [[nodiscard]] std::expected<LinkStateRecord, TopologyError>
    announce_local(const crypto::IdentitySecretKey& key, std::vector<EdgeAdvert> edges,
                   Clock::time_point now = Clock::now());

    [[nodiscard]] const NodeId& self() const { return self_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct IdentityEntry {
        core::RelayIdentity identity;
        Clock::time_point refreshed;
    };

    void publish_locked();

    NodeId self_;
    Config config_;

    mutable std::mutex mutex_;
    std::unordered_map<NodeId, IdentityEntry> identities_;
    std::map<EdgeKey, EdgeState> edges_;
    std::unordered_map<NodeId, LinkStateRecord> records_;
    uint64_t local_counter_{0};
    uint64_t generation_{0};

    std::atomic<SnapshotPtr> current_;
};

// Minimum-cost path from src to dst using at most max_hops edges.
// Ties on cost prefer fewer hops, then the smaller predecessor id.
// Only relays with a known identity are used. The result excludes src and
// ends at dst.
[[nodiscard]] std::expected<core::Route, TopologyError>
compute_route(const TopologySnapshot& snapshot,
              const NodeId& src,
              const NodeId& dst,
              size_t max_hops);

}  // namespace mixnet::topology

namespace std {
template <>
struct hash<mixnet::topology::EdgeKey> {
    size_t operator()(const mixnet::topology::EdgeKey& k) const noexcept {
        hash<mixnet::crypto::NodeId> h;
        return h(k.lo) * 31 + h(k.hi);
    }
};
}  // namespace std
