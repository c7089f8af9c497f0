#pragma once

#include "mixnet/core/errors.hpp"
#include "mixnet/core/identity.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mixnet::core {

struct LinkUp {
    NodeId peer;
    std::string address;
};

struct LinkDown {
    NodeId peer;
    MixnetError reason{MixnetError::LinkDown};
    uint32_t failures{0};
};

struct CircuitOpened {
    uint64_t circuit_id{0};
    NodeId remote;
    bool initiator{false};
};

struct CircuitClosed {
    uint64_t circuit_id{0};
    std::optional<MixnetError> error;  // nullopt for a clean close
};

struct PacketDropped {
    MixnetError reason{MixnetError::MalformedPacket};
    std::optional<NodeId> link;  // ingress or egress link, when known
};

using Event = std::variant<LinkUp, LinkDown, CircuitOpened, CircuitClosed, PacketDropped>;

[[nodiscard]] std::string describe(const Event& event);

// Consumer of structured events (telemetry, control plane)
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const Event& event) = 0;
};

// Fan-out to registered sinks. Sinks are called on the emitting thread.
class EventBus : public EventSink {
public:
    void subscribe(std::shared_ptr<EventSink> sink);
    void unsubscribe(const std::shared_ptr<EventSink>& sink);

    void on_event(const Event& event) override;
    void emit(const Event& event) { on_event(event); }

    [[nodiscard]] size_t sink_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<EventSink>> sinks_;
};

// Writes every event to the global logger
class LoggingEventSink : public EventSink {
public:
    void on_event(const Event& event) override;
};

// Sink that ignores everything
class NullEventSink : public EventSink {
public:
    void on_event(const Event&) override {}
};

}  // namespace mixnet::core
