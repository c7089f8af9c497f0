#include "mixnet/node/onion_path.hpp"
#include "mixnet/core/packet.hpp"
#include "mixnet/util/logging.hpp"

namespace mixnet::node {

OnionPacketPath::OnionPacketPath(crypto::NodeId self,
                                 topology::TopologyStore& topology,
                                 core::ForwardingEngine& engine,
                                 size_t max_hops)
    : self_(self)
    , topology_(topology)
    , engine_(engine)
    , max_hops_(max_hops) {}

std::expected<core::Route, core::MixnetError>
OnionPacketPath::route_to(const crypto::NodeId& dst) {
    auto snapshot = topology_.snapshot();
    auto route = topology::compute_route(*snapshot, self_, dst, max_hops_.load());
    if (!route) {
        LOG_DEBUG("No route to {} in generation {}: {}", dst.short_hex(),
                  snapshot->generation, topology::topology_error_message(route.error()));
        if (route.error() == topology::TopologyError::InvalidArgument) {
            return std::unexpected(core::MixnetError::InvalidArgument);
        }
        return std::unexpected(core::MixnetError::NoRouteFound);
    }
    return std::move(*route);
}

std::expected<void, core::MixnetError>
OnionPacketPath::send(const core::Route& route, std::span<const uint8_t> payload,
                      policy::Priority priority, uint64_t flow_id) {
    if (route.empty()) {
        return std::unexpected(core::MixnetError::NoRouteFound);
    }
    auto packet = core::encode(route, payload);
    if (!packet) {
        return std::unexpected(packet.error());
    }
    return engine_.send_local(route.front().node_id(), std::move(*packet), priority, flow_id);
}

}  // namespace mixnet::node
