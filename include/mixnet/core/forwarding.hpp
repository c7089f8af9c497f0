#pragma once

#include "mixnet/core/errors.hpp"
#include "mixnet/core/events.hpp"
#include "mixnet/core/packet.hpp"
#include "mixnet/core/stats.hpp"
#include "mixnet/policy/admission.hpp"
#include "mixnet/policy/debt_ledger.hpp"
#include "mixnet/policy/replay_window.hpp"
#include "mixnet/policy/scheduler.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace mixnet::core {

// Egress side of the engine: hands packets to the Up link towards a peer.
// Implemented by the link manager.
class OutboundRouter {
public:
    virtual ~OutboundRouter() = default;

    // LinkDown when there is no Up link to next_hop, QueueOverflow when its
    // queue refuses the packet. On success returns a packet shed to make room.
    [[nodiscard]] virtual std::expected<std::optional<policy::QueuedPacket>, MixnetError>
    enqueue(const NodeId& next_hop, policy::QueuedPacket item) = 0;
};

// Final-hop payload consumer (the circuit layer)
class DeliverySink {
public:
    virtual ~DeliverySink() = default;
    virtual void deliver(std::vector<uint8_t> payload) = 0;
};

// What the link layer hands the engine for every inbound Packet frame
struct InboundPacket {
    NodeId ingress;                  // peer the frame arrived from
    policy::ScopeId scope{};         // admission scope of that link
    policy::AdmissionTicket ticket;
    std::span<const uint8_t> bytes;  // sealed packet as received
};

enum class ForwardOutcome {
    Forwarded,
    Delivered,
};

// Per-packet pipeline: parse, replay check, admission, peel, forward or
// deliver. Every failure is a drop: it is counted, reported as a
// PacketDropped event and returned, and nothing else happens.
//
// Replay state is sharded per ingress link; the engine itself holds no lock
// across a packet. A peer's shard survives its link going down and coming
// back, and is dropped only once every epoch it holds has expired.
class ForwardingEngine {
public:
    struct Config {
        policy::ReplayWindow::Config replay;
        policy::AdmissionController::Config admission;
        policy::DebtLedger::Config debt;
        policy::Priority relay_priority{policy::Priority::Bulk};
    };

    ForwardingEngine(const crypto::OnionSecretKey& onion_key,
                     NodeId self,
                     Config config,
                     OutboundRouter& router,
                     NodeStats& stats,
                     EventSink& events);

    ForwardingEngine(const ForwardingEngine&) = delete;
    ForwardingEngine& operator=(const ForwardingEngine&) = delete;

    void set_delivery_sink(DeliverySink* sink) { delivery_ = sink; }

    // Creates the replay window of an ingress link, or retires it
    void register_link(const NodeId& peer);
    void unregister_link(const NodeId& peer, const policy::ScopeId& scope,
                         WallClock::time_point wall = WallClock::now());

    // now drives admission rate limits; wall decides which packet epochs
    // are current
    [[nodiscard]] std::expected<ForwardOutcome, MixnetError>
    process(const InboundPacket& inbound,
            policy::Clock::time_point now = policy::Clock::now(),
            WallClock::time_point wall = WallClock::now());

    // Ingress shards held, including retired ones not yet expired
    [[nodiscard]] size_t replay_shards() const;

    // Injects a packet built by this node towards its first hop
    [[nodiscard]] std::expected<void, MixnetError>
    send_local(const NodeId& first_hop, SealedPacket packet,
               policy::Priority priority, uint64_t flow_id = 0);

    [[nodiscard]] const NodeId& self() const { return self_; }
    [[nodiscard]] policy::AdmissionController& admission() { return admission_; }
    [[nodiscard]] const policy::DebtLedger& debts() const { return debts_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] std::shared_ptr<policy::ReplayWindow> window_for(const NodeId& peer);

    [[nodiscard]] std::expected<void, MixnetError>
    enqueue(const NodeId& next_hop, policy::QueuedPacket item);

    std::unexpected<MixnetError> drop(MixnetError reason, const std::optional<NodeId>& link);

    const crypto::OnionSecretKey& onion_key_;
    NodeId self_;
    Config config_;
    OutboundRouter& router_;
    NodeStats& stats_;
    EventSink& events_;
    DeliverySink* delivery_{nullptr};

    policy::AdmissionController admission_;
    policy::DebtLedger debts_;

    struct ReplayShard {
        std::shared_ptr<policy::ReplayWindow> window;
        bool linked{true};
    };

    mutable std::shared_mutex windows_mutex_;
    std::unordered_map<NodeId, ReplayShard> windows_;
};

}  // namespace mixnet::core
