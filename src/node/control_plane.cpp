#include "mixnet/node/control_plane.hpp"
#include "mixnet/util/logging.hpp"

namespace mixnet::node {

ControlPlane::ControlPlane(NodeId self,
                           core::CircuitManager& circuits,
                           topology::TopologyStore& topology,
                           transport::LinkManager& links,
                           core::NodeStats& stats,
                           const policy::DebtLedger& debts)
    : self_(self)
    , circuits_(circuits)
    , topology_(topology)
    , links_(links)
    , stats_(stats)
    , debts_(debts) {}

std::expected<ControlResponse, core::MixnetError>
ControlPlane::handle(const ControlRequest& request) {
    return std::visit([this](const auto& req) { return on(req); }, request);
}

std::expected<std::shared_ptr<core::Circuit>, core::MixnetError>
ControlPlane::circuit(core::CircuitId id) const {
    auto c = circuits_.find(id);
    if (!c) {
        return std::unexpected(core::MixnetError::CircuitClosed);
    }
    return c;
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const OpenCircuit& req) {
    if (req.destination == self_) {
        return std::unexpected(core::MixnetError::InvalidArgument);
    }

    std::expected<std::shared_ptr<core::Circuit>, core::MixnetError> opened;
    if (req.via) {
        if (req.via->empty() || req.via->back() != req.destination) {
            return std::unexpected(core::MixnetError::InvalidArgument);
        }
        auto snapshot = topology_.snapshot();
        core::Route route;
        for (const auto& hop : *req.via) {
            const auto* identity = snapshot->find(hop);
            if (!identity) {
                LOG_DEBUG("Explicit route names unknown relay {}", hop.short_hex());
                return std::unexpected(core::MixnetError::NoRouteFound);
            }
            route.push_back(*identity);
        }
        opened = circuits_.open(route, req.priority);
    } else {
        opened = circuits_.open_to(req.destination, req.priority);
    }

    if (!opened) {
        return std::unexpected(opened.error());
    }
    return CircuitReady{.circuit_id = (*opened)->id(), .hops = (*opened)->route().size()};
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const SendOnCircuit& req) {
    auto c = circuit(req.circuit_id);
    if (!c) return std::unexpected(c.error());
    if (auto r = (*c)->send(req.data); !r) {
        return std::unexpected(r.error());
    }
    return DataSent{.bytes = req.data.size()};
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const RecvOnCircuit& req) {
    auto c = circuit(req.circuit_id);
    if (!c) return std::unexpected(c.error());
    auto r = (*c)->recv_for(req.timeout);
    if (!r) {
        return std::unexpected(r.error());
    }
    if (!r->has_value()) {
        return DataReceived{.timed_out = true};
    }
    auto data = std::move(**r);
    bool finished = data.empty();
    return DataReceived{.data = std::move(data), .finished = finished};
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const CloseCircuit& req) {
    auto c = circuit(req.circuit_id);
    if (!c) return std::unexpected(c.error());
    if (auto r = (*c)->close(); !r) {
        return std::unexpected(r.error());
    }
    return CircuitDone{.circuit_id = req.circuit_id};
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const QueryStats&) {
    auto snapshot = topology_.snapshot();
    return StatsReport{.stats = stats_.snapshot(),
                       .topology_generation = snapshot->generation,
                       .relays_known = snapshot->relays.size()};
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const ListLinks&) {
    return LinkReport{.links = links_.links()};
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const ListCircuits&) {
    return CircuitReport{.circuits = circuits_.list()};
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const DumpGraph&) {
    auto snapshot = topology_.snapshot();
    return GraphDump{.generation = snapshot->generation, .text = snapshot->dump(self_)};
}

std::expected<ControlResponse, core::MixnetError> ControlPlane::on(const ListDebts&) {
    return DebtReport{.debts = debts_.balances()};
}

}  // namespace mixnet::node
