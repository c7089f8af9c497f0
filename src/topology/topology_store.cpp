#include "mixnet/topology/topology_store.hpp"
#include "mixnet/core/packet.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace mixnet::topology {

std::string topology_error_message(TopologyError err) {
    switch (err) {
        case TopologyError::InvalidSignature: return "Invalid signature";
        case TopologyError::UnknownRelay: return "Unknown relay";
        case TopologyError::StaleRecord: return "Stale record";
        case TopologyError::NoRouteFound: return "No route found";
        case TopologyError::InvalidArgument: return "Invalid argument";
        default: return "Unknown topology error";
    }
}

// TopologySnapshot

const core::RelayIdentity* TopologySnapshot::find(const NodeId& id) const {
    auto it = relays.find(id);
    return it == relays.end() ? nullptr : &it->second;
}

bool TopologySnapshot::has_usable_edge(const NodeId& a, const NodeId& b) const {
    auto it = edges.find(EdgeKey(a, b));
    return it != edges.end() && !it->second.stale;
}

std::string TopologySnapshot::dump(const NodeId& self) const {
    std::ostringstream out;
    out << "generation " << generation << ", "
        << relays.size() << " relays, " << edges.size() << " edges\n";
    for (const auto& [id, relay] : relays) {
        out << (id == self ? "* " : "  ") << id.to_hex();
        for (const auto& addr : relay.addresses) {
            out << " " << addr;
        }
        out << "\n";
    }
    for (const auto& [key, edge] : edges) {
        out << "  " << key.lo.short_hex() << " -- " << key.hi.short_hex()
            << " cost=" << edge.cost
            << " via=" << edge.announcer.short_hex() << "#" << edge.counter
            << (edge.stale ? " [stale]" : "") << "\n";
    }
    return out.str();
}

// TopologyStore

TopologyStore::TopologyStore(NodeId self, Config config)
    : self_(self), config_(config) {
    current_.store(std::make_shared<const TopologySnapshot>());
}

std::expected<bool, TopologyError>
TopologyStore::insert_identity(const core::RelayIdentity& identity, Clock::time_point now) {
    if (!identity.verify()) {
        return std::unexpected(TopologyError::InvalidSignature);
    }
    auto id = identity.node_id();

    std::lock_guard lock(mutex_);
    auto it = identities_.find(id);
    if (it != identities_.end()) {
        if (identity.published_at < it->second.identity.published_at) {
            return std::unexpected(TopologyError::StaleRecord);
        }
        it->second.refreshed = now;
        if (it->second.identity == identity) {
            return false;
        }
        it->second.identity = identity;
    } else {
        identities_.emplace(id, IdentityEntry{identity, now});
        LOG_DEBUG("topology: learned relay {}", id.short_hex());
    }
    publish_locked();
    return true;
}

std::expected<bool, TopologyError>
TopologyStore::merge(const LinkStateRecord& record, Clock::time_point now) {
    std::lock_guard lock(mutex_);

    auto ident = identities_.find(record.relay_id);
    if (ident == identities_.end()) {
        return std::unexpected(TopologyError::UnknownRelay);
    }
    if (!record.verify(ident->second.identity.identity_key)) {
        return std::unexpected(TopologyError::InvalidSignature);
    }

    auto held = records_.find(record.relay_id);
    if (held != records_.end()) {
        if (record.counter < held->second.counter) {
            return std::unexpected(TopologyError::StaleRecord);
        }
        if (record.counter == held->second.counter) {
            return false;
        }
    }

    const NodeId& announcer = record.relay_id;
    bool changed = false;

    // Withdraw edges this announcer owns but no longer lists
    for (auto it = edges_.begin(); it != edges_.end();) {
        const auto& e = it->second;
        if (e.announcer == announcer) {
            const NodeId& other = e.key.lo == announcer ? e.key.hi : e.key.lo;
            bool listed = std::any_of(record.edges.begin(), record.edges.end(),
                [&](const EdgeAdvert& a) { return a.neighbor == other; });
            if (!listed) {
                it = edges_.erase(it);
                changed = true;
                continue;
            }
        }
        ++it;
    }

    for (const auto& advert : record.edges) {
        if (advert.neighbor == announcer) {
            continue;
        }
        EdgeKey key(announcer, advert.neighbor);
        EdgeState incoming{
            .key = key,
            .cost = std::max<uint32_t>(advert.cost, 1),
            .announcer = announcer,
            .counter = record.counter,
            .last_seen = now,
            .stale = false,
        };

        auto it = edges_.find(key);
        if (it == edges_.end()) {
            edges_.emplace(key, incoming);
            changed = true;
            continue;
        }
        auto& current = it->second;
        bool wins = current.announcer == announcer ||
                    record.counter > current.counter ||
                    (record.counter == current.counter && announcer < current.announcer);
        if (wins) {
            current = incoming;
            changed = true;
        }
    }

    records_[announcer] = record;
    ident->second.refreshed = now;

    if (changed) {
        publish_locked();
    }
    return changed;
}

void TopologyStore::mark_stale(const NodeId& a, const NodeId& b) {
    std::lock_guard lock(mutex_);
    auto it = edges_.find(EdgeKey(a, b));
    if (it == edges_.end() || it->second.stale) {
        return;
    }
    it->second.stale = true;
    LOG_INFO("topology: edge {} -- {} marked stale", a.short_hex(), b.short_hex());
    publish_locked();
}

size_t TopologyStore::evict_expired(Clock::time_point now) {
    std::lock_guard lock(mutex_);
    size_t removed = 0;

    for (auto it = edges_.begin(); it != edges_.end();) {
        if (now - it->second.last_seen > config_.edge_ttl) {
            it = edges_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    for (auto it = identities_.begin(); it != identities_.end();) {
        if (it->first != self_ && now - it->second.refreshed > config_.identity_ttl) {
            LOG_DEBUG("topology: relay {} expired", it->first.short_hex());
            records_.erase(it->first);
            it = identities_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        publish_locked();
    }
    return removed;
}

std::vector<LinkStateRecord> TopologyStore::records() const {
    std::lock_guard lock(mutex_);
    std::vector<LinkStateRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, rec] : records_) {
        out.push_back(rec);
    }
    return out;
}

std::optional<LinkStateRecord> TopologyStore::record_of(const NodeId& relay) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(relay);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::expected<LinkStateRecord, TopologyError>
TopologyStore::announce_local(const crypto::IdentitySecretKey& key,
                              std::vector<EdgeAdvert> edges,
                              Clock::time_point now) {
    if (NodeId(key.public_key()) != self_) {
        return std::unexpected(TopologyError::InvalidArgument);
    }

    uint64_t counter;
    {
        std::lock_guard lock(mutex_);
        // Millisecond wall clock keeps counters increasing across restarts
        local_counter_ = std::max(local_counter_ + 1, core::unix_now() * 1000);
        counter = local_counter_;
    }

    auto record = LinkStateRecord::create(key, counter, core::unix_now(), std::move(edges));
    if (!record) {
        return std::unexpected(TopologyError::InvalidSignature);
    }
    auto merged = merge(*record, now);
    if (!merged) {
        return std::unexpected(merged.error());
    }
    return std::move(*record);
}

void TopologyStore::publish_locked() {
    auto snap = std::make_shared<TopologySnapshot>();
    snap->generation = ++generation_;
    for (const auto& [id, entry] : identities_) {
        snap->relays.emplace(id, entry.identity);
    }
    snap->edges = edges_;
    for (const auto& [key, edge] : edges_) {
        if (edge.stale) continue;
        snap->adjacency[key.lo].emplace_back(key.hi, edge.cost);
        snap->adjacency[key.hi].emplace_back(key.lo, edge.cost);
    }
    for (auto& [id, neighbours] : snap->adjacency) {
        std::sort(neighbours.begin(), neighbours.end());
    }
    current_.store(std::move(snap));
}

// Path computation

std::expected<core::Route, TopologyError>
compute_route(const TopologySnapshot& snapshot,
              const NodeId& src,
              const NodeId& dst,
              size_t max_hops) {
    if (src == dst || max_hops == 0) {
        return std::unexpected(TopologyError::InvalidArgument);
    }
    max_hops = std::min(max_hops, core::MAX_HOPS);

    if (!snapshot.adjacency.contains(src) || !snapshot.adjacency.contains(dst) ||
        !snapshot.relays.contains(dst)) {
        return std::unexpected(TopologyError::NoRouteFound);
    }

    // Dense indices in id order keep relaxation order deterministic
    std::vector<NodeId> ids;
    ids.reserve(snapshot.adjacency.size());
    for (const auto& [id, _] : snapshot.adjacency) {
        ids.push_back(id);
    }
    auto index_of = [&](const NodeId& id) -> size_t {
        return static_cast<size_t>(
            std::lower_bound(ids.begin(), ids.end(), id) - ids.begin());
    };

    constexpr uint64_t INF = std::numeric_limits<uint64_t>::max();
    constexpr size_t NONE = std::numeric_limits<size_t>::max();
    const size_t n = ids.size();
    const size_t s = index_of(src);
    const size_t d = index_of(dst);

    std::vector<uint64_t> prev(n, INF);
    prev[s] = 0;
    std::vector<std::vector<size_t>> preds;  // preds[k-1][v]: predecessor on a k-edge walk

    uint64_t best_cost = INF;
    size_t best_hops = 0;

    for (size_t k = 1; k <= max_hops; ++k) {
        std::vector<uint64_t> cur(n, INF);
        std::vector<size_t> pred(n, NONE);

        for (size_t u = 0; u < n; ++u) {
            if (prev[u] == INF) continue;
            // Intermediate hops need an onion key
            if (u != s && !snapshot.relays.contains(ids[u])) continue;

            for (const auto& [neighbour, cost] : snapshot.adjacency.at(ids[u])) {
                size_t v = index_of(neighbour);
                if (v == s) continue;
                uint64_t cand = prev[u] + cost;
                if (cand < cur[v] || (cand == cur[v] && u < pred[v])) {
                    cur[v] = cand;
                    pred[v] = u;
                }
            }
        }

        if (cur[d] < best_cost) {
            best_cost = cur[d];
            best_hops = k;
        }
        preds.push_back(std::move(pred));
        prev = std::move(cur);
    }

    if (best_cost == INF) {
        return std::unexpected(TopologyError::NoRouteFound);
    }

    std::vector<size_t> path;
    size_t v = d;
    for (size_t k = best_hops; k >= 1; --k) {
        path.push_back(v);
        v = preds[k - 1][v];
    }
    std::reverse(path.begin(), path.end());

    core::Route route;
    route.reserve(path.size());
    for (size_t idx : path) {
        const auto* relay = snapshot.find(ids[idx]);
        if (!relay) {
            return std::unexpected(TopologyError::NoRouteFound);
        }
        route.push_back(*relay);
    }
    return route;
}

}  // namespace mixnet::topology
