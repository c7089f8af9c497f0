#include "mixnet/core/forwarding.hpp"
#include "mixnet/util/logging.hpp"
#include <mutex>

namespace mixnet::core {

ForwardingEngine::ForwardingEngine(const crypto::OnionSecretKey& onion_key,
                                   NodeId self,
                                   Config config,
                                   OutboundRouter& router,
                                   NodeStats& stats,
                                   EventSink& events)
    : onion_key_(onion_key)
    , self_(self)
    , config_(config)
    , router_(router)
    , stats_(stats)
    , events_(events)
    , admission_(config.admission)
    , debts_(config.debt) {}

void ForwardingEngine::register_link(const NodeId& peer) {
    std::unique_lock lock(windows_mutex_);
    auto& shard = windows_[peer];
    if (!shard.window) {
        shard.window = std::make_shared<policy::ReplayWindow>(config_.replay);
    }
    shard.linked = true;
}

void ForwardingEngine::unregister_link(const NodeId& peer, const policy::ScopeId& scope,
                                       WallClock::time_point wall) {
    const auto current = packet_epoch(wall);
    {
        std::unique_lock lock(windows_mutex_);
        if (auto it = windows_.find(peer); it != windows_.end()) {
            it->second.linked = false;
        }
        // Nonces a retired shard holds can still be replayed until they expire
        for (auto it = windows_.begin(); it != windows_.end();) {
            if (!it->second.linked) {
                it->second.window->expire(current);
                if (it->second.window->empty()) {
                    it = windows_.erase(it);
                    continue;
                }
            }
            ++it;
        }
    }
    admission_.forget_scope(scope);
}

size_t ForwardingEngine::replay_shards() const {
    std::shared_lock lock(windows_mutex_);
    return windows_.size();
}

std::shared_ptr<policy::ReplayWindow> ForwardingEngine::window_for(const NodeId& peer) {
    {
        std::shared_lock lock(windows_mutex_);
        auto it = windows_.find(peer);
        if (it != windows_.end()) {
            return it->second.window;
        }
    }
    std::unique_lock lock(windows_mutex_);
    auto& shard = windows_[peer];
    if (!shard.window) {
        shard.window = std::make_shared<policy::ReplayWindow>(config_.replay);
    }
    return shard.window;
}

std::unexpected<MixnetError>
ForwardingEngine::drop(MixnetError reason, const std::optional<NodeId>& link) {
    stats_.record_drop(reason);
    events_.on_event(PacketDropped{reason, link});
    return std::unexpected(reason);
}

std::expected<ForwardOutcome, MixnetError>
ForwardingEngine::process(const InboundPacket& inbound, policy::Clock::time_point now,
                          WallClock::time_point wall) {
    stats_.record_received(inbound.bytes.size());

    auto packet = SealedPacket::parse(inbound.bytes);
    if (!packet) {
        return drop(packet.error(), inbound.ingress);
    }

    if (!debts_.within_limit(inbound.ingress)) {
        LOG_TRACE("forwarding: {} is over its debt limit", inbound.ingress.short_hex());
        return drop(MixnetError::AdmissionDenied, inbound.ingress);
    }

    auto nonce = packet->nonce();
    auto verdict = window_for(inbound.ingress)->check_and_insert(
        nonce, nonce_epoch(nonce), packet_epoch(wall));
    switch (verdict) {
        case policy::ReplayVerdict::Fresh:
            break;
        case policy::ReplayVerdict::Replayed:
        case policy::ReplayVerdict::Expired:
            LOG_TRACE("forwarding: {} nonce on {}", policy::replay_verdict_name(verdict),
                      inbound.ingress.short_hex());
            return drop(MixnetError::ReplayDetected, inbound.ingress);
        case policy::ReplayVerdict::Full:
            LOG_DEBUG("forwarding: replay window of {} is full for this epoch",
                      inbound.ingress.short_hex());
            return drop(MixnetError::AdmissionDenied, inbound.ingress);
    }

    auto admitted = admission_.admit(inbound.scope, nonce, inbound.ticket, now, wall);
    if (!admitted) {
        LOG_TRACE("forwarding: admission denied on {}: {}",
                  inbound.ingress.short_hex(), policy::admission_error_message(admitted.error()));
        return drop(MixnetError::AdmissionDenied, inbound.ingress);
    }
    if (inbound.ingress != self_) {
        debts_.record_incoming(inbound.ingress);
    }

    auto disposition = peel(*packet, onion_key_);
    if (!disposition) {
        return drop(disposition.error(), inbound.ingress);
    }

    if (auto* fwd = std::get_if<Forward>(&*disposition)) {
        auto queued = enqueue(fwd->next_hop, policy::QueuedPacket{
            .packet = std::move(fwd->packet),
            .priority = config_.relay_priority,
            .flow_id = 0,
        });
        if (!queued) {
            return std::unexpected(queued.error());
        }
        debts_.record_outgoing(fwd->next_hop);
        stats_.record_forwarded();
        return ForwardOutcome::Forwarded;
    }

    auto& deliver = std::get<Deliver>(*disposition);
    if (!delivery_) {
        return drop(MixnetError::CircuitClosed, inbound.ingress);
    }
    stats_.record_delivered();
    delivery_->deliver(std::move(deliver.payload));
    return ForwardOutcome::Delivered;
}

std::expected<void, MixnetError>
ForwardingEngine::send_local(const NodeId& first_hop, SealedPacket packet,
                             policy::Priority priority, uint64_t flow_id) {
    return enqueue(first_hop, policy::QueuedPacket{
        .packet = std::move(packet),
        .priority = priority,
        .flow_id = flow_id,
    });
}

std::expected<void, MixnetError>
ForwardingEngine::enqueue(const NodeId& next_hop, policy::QueuedPacket item) {
    if (next_hop == self_) {
        // A route never names this node twice in a row
        return drop(MixnetError::MalformedPacket, next_hop);
    }

    auto result = router_.enqueue(next_hop, std::move(item));
    if (!result) {
        return drop(result.error(), next_hop);
    }
    if (*result) {
        // Displaced a lower-priority packet to make room
        (void)drop(MixnetError::QueueOverflow, next_hop);
    }
    return {};
}

}  // namespace mixnet::core
