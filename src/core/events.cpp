#include "mixnet/core/events.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>
#include <format>

namespace mixnet::core {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

}  // namespace

std::string describe(const Event& event) {
    return std::visit(Overloaded{
        [](const LinkUp& e) {
            return std::format("link up: {} at {}", e.peer.short_hex(), e.address);
        },
        [](const LinkDown& e) {
            return std::format("link down: {} ({}, {} failures)",
                               e.peer.short_hex(), mixnet_error_name(e.reason), e.failures);
        },
        [](const CircuitOpened& e) {
            return std::format("circuit {:016x} opened {} {}", e.circuit_id,
                               e.initiator ? "to" : "from", e.remote.short_hex());
        },
        [](const CircuitClosed& e) {
            return std::format("circuit {:016x} closed{}", e.circuit_id,
                               e.error ? std::string(": ") + mixnet_error_name(*e.error) : "");
        },
        [](const PacketDropped& e) {
            return std::format("packet dropped: {}{}", mixnet_error_name(e.reason),
                               e.link ? " on " + e.link->short_hex() : "");
        },
    }, event);
}

void EventBus::subscribe(std::shared_ptr<EventSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void EventBus::unsubscribe(const std::shared_ptr<EventSink>& sink) {
    std::lock_guard lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void EventBus::on_event(const Event& event) {
    std::vector<std::shared_ptr<EventSink>> sinks;
    {
        std::lock_guard lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->on_event(event);
    }
}

size_t EventBus::sink_count() const {
    std::lock_guard lock(mutex_);
    return sinks_.size();
}

void LoggingEventSink::on_event(const Event& event) {
    // Drops can arrive at line rate; keep them out of the default log level
    if (std::holds_alternative<PacketDropped>(event)) {
        LOG_DEBUG("event: {}", describe(event));
    } else {
        LOG_INFO("event: {}", describe(event));
    }
}

}  // namespace mixnet::core
