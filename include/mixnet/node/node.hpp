#pragma once

#include "mixnet/core/circuit.hpp"
#include "mixnet/core/events.hpp"
#include "mixnet/core/stats.hpp"
#include "mixnet/node/address_book.hpp"
#include "mixnet/node/control_plane.hpp"
#include "mixnet/topology/topology_store.hpp"
#include "mixnet/transport/link_manager.hpp"
#include "mixnet/util/config.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mixnet::node {

// Version information
struct VersionInfo {
    static constexpr uint8_t MAJOR = 0;
    static constexpr uint8_t MINOR = 1;
    static constexpr uint8_t PATCH = 0;

    [[nodiscard]] static std::string to_string() {
        return std::to_string(MAJOR) + "." +
               std::to_string(MINOR) + "." +
               std::to_string(PATCH);
    }
};

// Node error types
enum class NodeError {
    ConfigError,
    KeyLoadFailed,
    CorruptIdentityKey,
    IdentityError,
    BindFailed,
    AlreadyRunning,
    NotRunning,
};

[[nodiscard]] std::string node_error_message(NodeError err);

// A mixnet node: one relay that forwards onion packets for others and is an
// endpoint for its own circuits.
//
// Owns the topology store, forwarding engine, link manager, circuit manager
// and gossip task, wired together in that order.
class Node : public transport::PeerObserver {
public:
    ~Node() override;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Listens, publishes our identity, restores the saved relay graph, dials
    // configured peers and starts gossip
    [[nodiscard]] std::expected<void, NodeError> start();

    // Stops gossip, fails open circuits, closes every link and saves the
    // address book and relay graph
    [[nodiscard]] std::expected<void, NodeError> stop();

    [[nodiscard]] bool is_running() const { return running_; }

    [[nodiscard]] NodeId node_id() const;
    [[nodiscard]] core::RelayIdentity identity() const;
    [[nodiscard]] const crypto::NodeKeys& keys() const;
    [[nodiscard]] const util::Config& config() const;
    [[nodiscard]] uint16_t listen_port() const;

    // Dials a relay and keeps redialing it while the node runs
    void connect(const core::RelayIdentity& peer);

    // Opens a circuit to dst over a computed route
    [[nodiscard]] std::expected<std::shared_ptr<core::Circuit>, core::MixnetError>
    open_circuit(const NodeId& dst, policy::Priority priority = policy::Priority::Interactive);

    // Runs one gossip round immediately
    void gossip_now();

    [[nodiscard]] topology::TopologyStore& topology();
    [[nodiscard]] transport::LinkManager& links();
    [[nodiscard]] core::CircuitManager& circuits();
    [[nodiscard]] core::ForwardingEngine& engine();
    [[nodiscard]] ControlPlane& control();
    [[nodiscard]] core::EventBus& events();
    [[nodiscard]] core::StatsSnapshot stats() const;
    [[nodiscard]] AddressBook& address_book();

    // PeerObserver
    void on_peer_up(const core::RelayIdentity& peer) override;
    void on_peer_down(const NodeId& peer) override;

private:
    friend class NodeBuilder;

    struct Impl;
    explicit Node(std::unique_ptr<Impl> impl);

    [[nodiscard]] std::vector<std::string> advertised_addresses(uint16_t port) const;

    bool running_{false};
    std::unique_ptr<Impl> impl_;
};

// Builder for creating a Node
class NodeBuilder {
public:
    NodeBuilder() = default;
    ~NodeBuilder() = default;

    // Set configuration
    NodeBuilder& config(const util::Config& cfg);

    // Use these keys instead of the key store under data_dir
    NodeBuilder& keys(crypto::NodeKeys keys);

    // Dial peers through dialer instead of TCP. dialer must outlive the node.
    NodeBuilder& dialer(transport::Dialer& dialer);

    // Use this address book instead of data_dir/peers
    NodeBuilder& address_book(std::unique_ptr<AddressBook> book);

    // Extra event sink, subscribed before the node starts
    NodeBuilder& subscribe(std::shared_ptr<core::EventSink> sink);

    // Build the node
    [[nodiscard]] std::expected<std::unique_ptr<Node>, NodeError> build();

private:
    std::optional<util::Config> config_;
    std::optional<crypto::NodeKeys> keys_;
    transport::Dialer* dialer_{nullptr};
    std::unique_ptr<AddressBook> address_book_;
    std::vector<std::shared_ptr<core::EventSink>> sinks_;
};

}  // namespace mixnet::node
