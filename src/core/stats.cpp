#include "mixnet/core/stats.hpp"
#include "mixnet/policy/token_bucket.hpp"
#include <format>

namespace mixnet::core {

uint64_t StatsSnapshot::total_drops() const {
    uint64_t total = 0;
    for (auto d : drops) total += d;
    return total;
}

std::string StatsSnapshot::to_string() const {
    auto out = std::format(
        "received={} forwarded={} delivered={} sent={} in={} out={} "
        "circuits={}/{} links={}/{} drops={}",
        packets_received, packets_forwarded, packets_delivered, packets_sent,
        policy::format_bytes(bytes_in), policy::format_bytes(bytes_out),
        circuits_opened, circuits_closed, links_up, links_down, total_drops());
    for (size_t i = 0; i < drops.size(); ++i) {
        if (drops[i] > 0) {
            out += std::format(" {}={}", mixnet_error_name(static_cast<MixnetError>(i)), drops[i]);
        }
    }
    return out;
}

void NodeStats::record_received(size_t bytes) {
    packets_received_.fetch_add(1, std::memory_order_relaxed);
    bytes_in_.fetch_add(bytes, std::memory_order_relaxed);
}

void NodeStats::record_forwarded() {
    packets_forwarded_.fetch_add(1, std::memory_order_relaxed);
}

void NodeStats::record_delivered() {
    packets_delivered_.fetch_add(1, std::memory_order_relaxed);
}

void NodeStats::record_sent(size_t bytes) {
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
    bytes_out_.fetch_add(bytes, std::memory_order_relaxed);
}

void NodeStats::record_drop(MixnetError reason) {
    auto idx = static_cast<size_t>(reason);
    if (idx < drops_.size()) {
        drops_[idx].fetch_add(1, std::memory_order_relaxed);
    }
}

uint64_t NodeStats::drops(MixnetError reason) const {
    auto idx = static_cast<size_t>(reason);
    return idx < drops_.size() ? drops_[idx].load(std::memory_order_relaxed) : 0;
}

StatsSnapshot NodeStats::snapshot() const {
    StatsSnapshot s;
    s.packets_received = packets_received_.load(std::memory_order_relaxed);
    s.packets_forwarded = packets_forwarded_.load(std::memory_order_relaxed);
    s.packets_delivered = packets_delivered_.load(std::memory_order_relaxed);
    s.packets_sent = packets_sent_.load(std::memory_order_relaxed);
    s.bytes_in = bytes_in_.load(std::memory_order_relaxed);
    s.bytes_out = bytes_out_.load(std::memory_order_relaxed);
    s.circuits_opened = circuits_opened_.load(std::memory_order_relaxed);
    s.circuits_closed = circuits_closed_.load(std::memory_order_relaxed);
    s.links_up = links_up_.load(std::memory_order_relaxed);
    s.links_down = links_down_.load(std::memory_order_relaxed);
    for (size_t i = 0; i < drops_.size(); ++i) {
        s.drops[i] = drops_[i].load(std::memory_order_relaxed);
    }
    return s;
}

void StatsEventSink::on_event(const Event& event) {
    if (std::holds_alternative<LinkUp>(event)) {
        stats_.record_link_up();
    } else if (std::holds_alternative<LinkDown>(event)) {
        stats_.record_link_down();
    } else if (std::holds_alternative<CircuitOpened>(event)) {
        stats_.record_circuit_opened();
    } else if (std::holds_alternative<CircuitClosed>(event)) {
        stats_.record_circuit_closed();
    }
}

}  // namespace mixnet::core
