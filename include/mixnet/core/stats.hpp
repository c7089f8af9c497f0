#pragma once

#include "mixnet/core/errors.hpp"
#include "mixnet/core/events.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace mixnet::core {

// Plain copy of the counters at one instant
struct StatsSnapshot {
    uint64_t packets_received{0};
    uint64_t packets_forwarded{0};
    uint64_t packets_delivered{0};
    uint64_t packets_sent{0};
    uint64_t bytes_in{0};
    uint64_t bytes_out{0};
    uint64_t circuits_opened{0};
    uint64_t circuits_closed{0};
    uint64_t links_up{0};
    uint64_t links_down{0};
    std::array<uint64_t, MIXNET_ERROR_COUNT> drops{};

    [[nodiscard]] uint64_t drops_for(MixnetError reason) const {
        return drops[static_cast<size_t>(reason)];
    }
    [[nodiscard]] uint64_t total_drops() const;
    [[nodiscard]] std::string to_string() const;
};

// Lock-free node counters
class NodeStats {
public:
    void record_received(size_t bytes);
    void record_forwarded();
    void record_delivered();
    void record_sent(size_t bytes);
    void record_drop(MixnetError reason);

    void record_circuit_opened() { circuits_opened_.fetch_add(1, std::memory_order_relaxed); }
    void record_circuit_closed() { circuits_closed_.fetch_add(1, std::memory_order_relaxed); }
    void record_link_up() { links_up_.fetch_add(1, std::memory_order_relaxed); }
    void record_link_down() { links_down_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] uint64_t drops(MixnetError reason) const;
    [[nodiscard]] StatsSnapshot snapshot() const;

private:
    std::atomic<uint64_t> packets_received_{0};
    std::atomic<uint64_t> packets_forwarded_{0};
    std::atomic<uint64_t> packets_delivered_{0};
    std::atomic<uint64_t> packets_sent_{0};
    std::atomic<uint64_t> bytes_in_{0};
    std::atomic<uint64_t> bytes_out_{0};
    std::atomic<uint64_t> circuits_opened_{0};
    std::atomic<uint64_t> circuits_closed_{0};
    std::atomic<uint64_t> links_up_{0};
    std::atomic<uint64_t> links_down_{0};
    std::array<std::atomic<uint64_t>, MIXNET_ERROR_COUNT> drops_{};
};

// Counts link and circuit lifecycle events into NodeStats
class StatsEventSink : public EventSink {
public:
    explicit StatsEventSink(NodeStats& stats) : stats_(stats) {}
    void on_event(const Event& event) override;

private:
    NodeStats& stats_;
};

}  // namespace mixnet::core
