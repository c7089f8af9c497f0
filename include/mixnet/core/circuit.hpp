#pragma once

#include "mixnet/core/circuit_message.hpp"
#include "mixnet/core/errors.hpp"
#include "mixnet/core/events.hpp"
#include "mixnet/core/forwarding.hpp"
#include "mixnet/core/identity.hpp"
#include "mixnet/policy/replay_window.hpp"
#include "mixnet/policy/scheduler.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mixnet::core {

using CircuitClock = std::chrono::steady_clock;

// Circuit state
enum class CircuitState {
    Opening,    // OPEN sent, waiting for OPEN_ACK
    Open,       // Ready for data
    Closing,    // Flushing, then FIN handshake
    Closed,     // Clean teardown finished
    Failed,     // Open timeout, retransmit exhaustion or first-hop loss
};

[[nodiscard]] const char* circuit_state_name(CircuitState state);

// How circuits reach the network: route lookup plus onion sending.
// The node wires this to the topology store and the forwarding engine.
class PacketPath {
public:
    virtual ~PacketPath() = default;

    [[nodiscard]] virtual std::expected<Route, MixnetError> route_to(const NodeId& dst) = 0;

    // Wraps payload for route and hands it to the first hop
    [[nodiscard]] virtual std::expected<void, MixnetError>
    send(const Route& route, std::span<const uint8_t> payload,
         policy::Priority priority, uint64_t flow_id) = 0;
};

class CircuitManager;

// One end of an ordered, reliable byte stream over a route.
// Circuits must not outlive the manager that created them.
class Circuit {
public:
    Circuit(CircuitManager& manager, CircuitId id, bool initiator, NodeId remote,
            Route route, CircuitKeys keys, policy::Priority priority,
            CircuitClock::time_point now);

    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;

    [[nodiscard]] CircuitId id() const { return id_; }
    [[nodiscard]] bool initiator() const { return initiator_; }
    [[nodiscard]] const NodeId& remote() const { return remote_; }
    [[nodiscard]] const Route& route() const { return route_; }
    [[nodiscard]] NodeId first_hop() const { return route_.front().node_id(); }
    [[nodiscard]] policy::Priority priority() const { return priority_; }

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] std::optional<MixnetError> error() const;

    // Queues data as sequenced segments. Blocks only while the send buffer
    // is full.
    [[nodiscard]] std::expected<void, MixnetError> send(std::span<const uint8_t> data);

    // Blocks until data arrives or the circuit ends. An empty result means
    // the peer finished sending or the circuit closed cleanly.
    [[nodiscard]] std::expected<std::vector<uint8_t>, MixnetError> recv();

    // As recv(), but gives up after timeout and returns nullopt
    [[nodiscard]] std::expected<std::optional<std::vector<uint8_t>>, MixnetError>
    recv_for(std::chrono::milliseconds timeout);

    // Flushes in-flight segments, then performs the FIN handshake
    [[nodiscard]] std::expected<void, MixnetError> close();

    [[nodiscard]] size_t in_flight() const;
    [[nodiscard]] size_t buffered() const;

private:
    friend class CircuitManager;

    struct Segment {
        uint32_t seq{0};
        std::vector<uint8_t> data;
        CircuitClock::time_point sent_at;
        uint32_t retries{0};
    };

    using Outbox = std::vector<std::vector<uint8_t>>;

    // All *_locked helpers require mutex_
    void seal_locked(CircuitMessage msg, Outbox& out);
    void pump_locked(CircuitClock::time_point now, Outbox& out);
    void maybe_send_fin_locked(CircuitClock::time_point now, Outbox& out);
    void send_ack_locked(Outbox& out);
    void fail_locked(MixnetError err);
    [[nodiscard]] bool terminal_locked() const {
        return state_ == CircuitState::Closed || state_ == CircuitState::Failed;
    }
    [[nodiscard]] std::expected<std::optional<std::vector<uint8_t>>, MixnetError>
    take_ready_locked();

    CircuitManager& manager_;
    const CircuitId id_;
    const bool initiator_;
    const NodeId remote_;
    const Route route_;
    const CircuitKeys keys_;
    const policy::Priority priority_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    CircuitState state_;
    std::optional<MixnetError> error_;
    bool close_reported_{false};
    CircuitClock::time_point created_at_;
    CircuitClock::time_point last_activity_;
    CircuitClock::time_point closed_at_;

    uint64_t send_counter_{0};
    policy::SequenceWindow seen_counters_;

    // Opening (initiator)
    crypto::OnionPublicKey ephemeral_;
    crypto::Signature open_signature_{};
    CircuitClock::time_point open_sent_at_;

    // Sender
    uint32_t next_seq_{0};
    std::deque<Segment> pending_;
    std::map<uint32_t, Segment> in_flight_;
    std::optional<uint32_t> fin_seq_;
    CircuitClock::time_point fin_sent_at_;
    uint32_t fin_retries_{0};
    bool fin_acked_{false};

    // Receiver
    uint32_t expected_seq_{0};
    std::map<uint32_t, std::vector<uint8_t>> reorder_;
    std::deque<std::vector<uint8_t>> ready_;
    std::optional<uint32_t> remote_fin_seq_;
    bool remote_finished_{false};
};

// Summary row for the control plane
struct CircuitInfo {
    CircuitId id{0};
    CircuitState state{CircuitState::Opening};
    NodeId remote;
    bool initiator{false};
    size_t hops{0};
    size_t in_flight{0};
    size_t buffered{0};
};

// Endpoint side of the circuit layer. Receives final-hop payloads from the
// forwarding engine and drives retransmission from its own timer thread.
class CircuitManager : public DeliverySink {
public:
    struct Config {
        std::chrono::milliseconds open_timeout{5000};
        std::chrono::milliseconds rto{500};
        uint32_t max_retries{8};
        size_t window{32};                 // segments in flight
        size_t max_buffered{256};          // queued segments before send() blocks
        std::chrono::seconds idle_timeout{300};
        std::chrono::milliseconds tick{50};
        std::chrono::milliseconds linger{10000};  // keep closed circuits to answer FINs
    };

    CircuitManager(NodeId self,
                   const crypto::IdentitySecretKey& identity_key,
                   const crypto::OnionSecretKey& onion_key,
                   Config config,
                   PacketPath& path,
                   EventSink& events);
    ~CircuitManager() override;

    CircuitManager(const CircuitManager&) = delete;
    CircuitManager& operator=(const CircuitManager&) = delete;

    // Starts the timer thread
    void start();
    // Fails every live circuit and stops the timer thread
    void stop();

    // Opens a circuit over route (destination last). Blocks until the
    // destination acknowledges or open_timeout passes.
    [[nodiscard]] std::expected<std::shared_ptr<Circuit>, MixnetError>
    open(const Route& route, policy::Priority priority = policy::Priority::Interactive);

    // Computes a route from the current topology, then opens
    [[nodiscard]] std::expected<std::shared_ptr<Circuit>, MixnetError>
    open_to(const NodeId& dst, policy::Priority priority = policy::Priority::Interactive);

    // Next circuit opened by a remote initiator, or nullptr on timeout
    [[nodiscard]] std::shared_ptr<Circuit> accept(std::chrono::milliseconds timeout);

    void deliver(std::vector<uint8_t> payload) override;

    // Fails circuits whose first hop is peer
    void on_link_down(const NodeId& peer);

    // Retransmission, timeouts and idle/linger expiry
    void tick(CircuitClock::time_point now = CircuitClock::now());

    [[nodiscard]] std::shared_ptr<Circuit> find(CircuitId id) const;
    [[nodiscard]] std::vector<CircuitInfo> list() const;
    [[nodiscard]] size_t circuit_count() const;

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const NodeId& self() const { return self_; }

private:
    friend class Circuit;

    void transmit(Circuit& circuit, Circuit::Outbox& out);
    void report_closed(Circuit& circuit);
    void remove(CircuitId id);
    void handle_open(std::span<const uint8_t> payload, const CircuitHeader& header);
    void timer_loop(std::stop_token stop);

    NodeId self_;
    const crypto::IdentitySecretKey& identity_key_;
    const crypto::OnionSecretKey& onion_key_;
    Config config_;
    PacketPath& path_;
    EventSink& events_;

    mutable std::mutex table_mutex_;
    std::unordered_map<CircuitId, std::shared_ptr<Circuit>> circuits_;

    std::mutex accept_mutex_;
    std::condition_variable accept_cv_;
    std::deque<std::shared_ptr<Circuit>> accept_queue_;

    std::jthread timer_;
};

}  // namespace mixnet::core
