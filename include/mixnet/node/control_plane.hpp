#pragma once

#include "mixnet/core/circuit.hpp"
#include "mixnet/core/stats.hpp"
#include "mixnet/policy/debt_ledger.hpp"
#include "mixnet/topology/topology_store.hpp"
#include "mixnet/transport/link_manager.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mixnet::node {

using crypto::NodeId;

// --- Requests ---

struct OpenCircuit {
    NodeId destination;
    policy::Priority priority{policy::Priority::Interactive};
    // Explicit relay path ending at destination; computed when absent
    std::optional<std::vector<NodeId>> via;
};

struct SendOnCircuit {
    core::CircuitId circuit_id{0};
    std::vector<uint8_t> data;
};

struct RecvOnCircuit {
    core::CircuitId circuit_id{0};
    std::chrono::milliseconds timeout{1000};
};

struct CloseCircuit {
    core::CircuitId circuit_id{0};
};

struct QueryStats {};
struct ListLinks {};
struct ListCircuits {};
struct DumpGraph {};
struct ListDebts {};

using ControlRequest = std::variant<OpenCircuit, SendOnCircuit, RecvOnCircuit, CloseCircuit,
                                    QueryStats, ListLinks, ListCircuits, DumpGraph, ListDebts>;

// --- Responses ---

struct CircuitReady {
    core::CircuitId circuit_id{0};
    size_t hops{0};
};

struct DataSent {
    size_t bytes{0};
};

struct DataReceived {
    std::vector<uint8_t> data;
    bool finished{false};    // peer finished sending
    bool timed_out{false};
};

struct CircuitDone {
    core::CircuitId circuit_id{0};
};

struct StatsReport {
    core::StatsSnapshot stats;
    uint64_t topology_generation{0};
    size_t relays_known{0};
};

struct LinkReport {
    std::vector<transport::LinkStatus> links;
};

struct CircuitReport {
    std::vector<core::CircuitInfo> circuits;
};

struct GraphDump {
    uint64_t generation{0};
    std::string text;
};

struct DebtReport {
    std::vector<policy::DebtBalance> debts;
};

using ControlResponse = std::variant<CircuitReady, DataSent, DataReceived, CircuitDone,
                                     StatsReport, LinkReport, CircuitReport, GraphDump,
                                     DebtReport>;

// In-process request/response surface over a running node
class ControlPlane {
public:
    ControlPlane(NodeId self,
                 core::CircuitManager& circuits,
                 topology::TopologyStore& topology,
                 transport::LinkManager& links,
                 core::NodeStats& stats,
                 const policy::DebtLedger& debts);

    [[nodiscard]] std::expected<ControlResponse, core::MixnetError>
    handle(const ControlRequest& request);

private:
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const OpenCircuit& req);
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const SendOnCircuit& req);
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const RecvOnCircuit& req);
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const CloseCircuit& req);
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const QueryStats& req);
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const ListLinks& req);
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const ListCircuits& req);
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const DumpGraph& req);
    [[nodiscard]] std::expected<ControlResponse, core::MixnetError> on(const ListDebts& req);

    [[nodiscard]] std::expected<std::shared_ptr<core::Circuit>, core::MixnetError>
    circuit(core::CircuitId id) const;

    NodeId self_;
    core::CircuitManager& circuits_;
    topology::TopologyStore& topology_;
    transport::LinkManager& links_;
    core::NodeStats& stats_;
    const policy::DebtLedger& debts_;
};

}  // namespace mixnet::node
