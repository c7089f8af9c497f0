#include "mixnet/node/gossip.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>
#include <random>

namespace mixnet::node {

GossipTask::GossipTask(Config config,
                       const crypto::NodeKeys& keys,
                       topology::TopologyStore& topology,
                       transport::LinkManager& links,
                       AddressBook& address_book)
    : config_(config)
    , keys_(keys)
    , topology_(topology)
    , links_(links)
    , address_book_(address_book) {}

GossipTask::~GossipTask() {
    stop();
}

void GossipTask::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](std::stop_token stop) { loop(stop); });
}

void GossipTask::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        wake_cv_.notify_all();
        thread_.join();
    }
}

void GossipTask::trigger() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        triggered_ = true;
    }
    wake_cv_.notify_all();
}

void GossipTask::loop(std::stop_token stop) {
    util::LogContext ctx("gossip");
    while (!stop.stop_requested()) {
        run_once();
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, config_.interval, [this] { return triggered_; });
        triggered_ = false;
    }
}

void GossipTask::announce() {
    std::vector<topology::EdgeAdvert> edges;
    for (const auto& peer : links_.up_peers()) {
        edges.push_back(topology::EdgeAdvert{.neighbor = peer, .cost = 1});
        if (edges.size() == topology::MAX_ADVERTISED_EDGES) break;
    }
    auto record = topology_.announce_local(keys_.identity, std::move(edges));
    if (!record) {
        LOG_WARN("Failed to announce local links: {}",
                 topology::topology_error_message(record.error()));
        return;
    }
    LOG_TRACE("Announced record {} with {} edge(s)", record->counter, record->edges.size());
}

void GossipTask::push_to(const NodeId& peer) {
    auto send = [&](transport::GossipKind kind, const std::vector<uint8_t>& record) {
        auto body = transport::encode_gossip(kind, record);
        if (auto r = links_.send_gossip(peer, body); !r) {
            LOG_TRACE("Gossip to {} failed: {}", peer.short_hex(),
                      transport::link_error_message(r.error()));
            return false;
        }
        return true;
    };

    if (!send(transport::GossipKind::Identity, links_.identity().serialize())) return;
    if (auto own = topology_.record_of(topology_.self())) {
        if (!send(transport::GossipKind::LinkState, own->serialize())) return;
    }

    // Identities go first so the receiver can verify the records that follow
    auto snapshot = topology_.snapshot();
    std::vector<NodeId> others;
    for (const auto& [id, identity] : snapshot->relays) {
        if (id != topology_.self() && id != peer) {
            others.push_back(id);
        }
    }
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::shuffle(others.begin(), others.end(), rng);
    if (others.size() > config_.sample_size) {
        others.resize(config_.sample_size);
    }

    for (const auto& id : others) {
        const auto* identity = snapshot->find(id);
        if (!identity) continue;
        if (!send(transport::GossipKind::Identity, identity->serialize())) return;
        if (auto record = topology_.record_of(id)) {
            if (!send(transport::GossipKind::LinkState, record->serialize())) return;
        }
    }
}

void GossipTask::gossip_round() {
    for (const auto& peer : links_.up_peers()) {
        push_to(peer);
    }
}

void GossipTask::sync_address_book() {
    auto snapshot = topology_.snapshot();
    auto now = core::unix_now();
    for (const auto& [id, identity] : snapshot->relays) {
        if (id == topology_.self()) continue;
        address_book_.insert(identity, identity.published_at);
    }
    for (const auto& peer : links_.up_peers()) {
        address_book_.touch(peer, now);
    }
}

void GossipTask::run_once(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(round_mutex_);

    if (auto evicted = topology_.evict_expired(now); evicted > 0) {
        LOG_DEBUG("Evicted {} expired topology entries", evicted);
    }
    announce();
    gossip_round();
    sync_address_book();
    links_.maintain(now);

    rounds_.fetch_add(1);
}

}  // namespace mixnet::node
