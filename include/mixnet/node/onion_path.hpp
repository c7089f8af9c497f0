#pragma once

#include "mixnet/core/circuit.hpp"
#include "mixnet/core/forwarding.hpp"
#include "mixnet/topology/topology_store.hpp"
#include <atomic>

namespace mixnet::node {

// Circuit packet path over the live network: routes come from the current
// topology snapshot, packets are onion-wrapped and handed to the forwarding
// engine for the first hop.
class OnionPacketPath : public core::PacketPath {
public:
    OnionPacketPath(crypto::NodeId self,
                    topology::TopologyStore& topology,
                    core::ForwardingEngine& engine,
                    size_t max_hops);

    [[nodiscard]] std::expected<core::Route, core::MixnetError>
    route_to(const crypto::NodeId& dst) override;

    [[nodiscard]] std::expected<void, core::MixnetError>
    send(const core::Route& route, std::span<const uint8_t> payload,
         policy::Priority priority, uint64_t flow_id) override;

    void set_max_hops(size_t max_hops) { max_hops_.store(max_hops); }
    [[nodiscard]] size_t max_hops() const { return max_hops_.load(); }

private:
    crypto::NodeId self_;
    topology::TopologyStore& topology_;
    core::ForwardingEngine& engine_;
    std::atomic<size_t> max_hops_;
};

}  // namespace mixnet::node
