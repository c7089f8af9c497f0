#pragma once

#include "mixnet/core/events.hpp"
#include "mixnet/core/forwarding.hpp"
#include "mixnet/net/acceptor.hpp"
#include "mixnet/policy/replay_window.hpp"
#include "mixnet/topology/topology_store.hpp"
#include "mixnet/transport/link_protocol.hpp"
#include "mixnet/transport/transport_link.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mixnet::transport {

// Gossip frame body: kind(1) | serialized record
enum class GossipKind : uint8_t {
    Identity = 1,
    LinkState = 2,
};

[[nodiscard]] std::vector<uint8_t> encode_gossip(GossipKind kind, std::span<const uint8_t> record);

// Node-level reactions to peers coming and going
class PeerObserver {
public:
    virtual ~PeerObserver() = default;
    virtual void on_peer_up(const core::RelayIdentity& peer) = 0;
    virtual void on_peer_down(const NodeId& peer) = 0;
};

// Owns every transport link of the node: dials configured peers, accepts
// inbound links, and routes packets to the Up link towards a next hop.
//
// Inbound Packet frames go to the forwarding engine; Gossip frames are
// merged into the topology store. A link going Down marks our edge to that
// peer stale.
class LinkManager : public core::OutboundRouter, public LinkHandler {
public:
    struct Config {
        TransportLink::Config link;
        // Epochs here are the hours the handshake MAC covers
        policy::ReplayWindow::Config handshake_replay{.capacity = 8192, .slack = 1};
        // Delay before a Down link to a persistent peer is dialed afresh
        std::chrono::milliseconds redial_interval{60000};
    };

    LinkManager(Config config,
                LocalCredentials local,
                Dialer& dialer,
                topology::TopologyStore& topology,
                core::ForwardingEngine& engine,
                core::EventSink& events,
                core::NodeStats& stats);
    ~LinkManager() override;

    LinkManager(const LinkManager&) = delete;
    LinkManager& operator=(const LinkManager&) = delete;

    void set_observer(PeerObserver* observer) { observer_ = observer; }

    // Listens for inbound links; port 0 picks a free port
    [[nodiscard]] std::expected<uint16_t, net::AcceptorError>
    listen(const std::string& address, uint16_t port);

    // Takes ownership of an accepted stream and runs the responder handshake
    void adopt(std::unique_ptr<net::Stream> stream);

    // Replaces the identity presented in hellos, e.g. once the listen port
    // is known. Must keep the same identity key.
    void set_identity(core::RelayIdentity identity);
    [[nodiscard]] core::RelayIdentity identity() const;

    // Dials peer unless a live outbound link to it exists. Persistent peers
    // are redialed after going Down.
    void connect(const core::RelayIdentity& peer, bool persistent = true);

    // Closes every link to peer and forgets it as a persistent peer
    void disconnect(const NodeId& peer);

    // Stops the listener and closes every link
    void shutdown();

    // Reaps finished links and redials persistent peers that went Down
    void maintain(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // OutboundRouter
    [[nodiscard]] std::expected<std::optional<policy::QueuedPacket>, core::MixnetError>
    enqueue(const NodeId& next_hop, policy::QueuedPacket item) override;

    // LinkHandler
    void on_link_up(TransportLink& link, const PeerHello& hello) override;
    void on_frame(TransportLink& link, Frame frame) override;
    void on_packet_sent(TransportLink& link, size_t bytes) override;
    void on_link_down(TransportLink& link, core::MixnetError reason, uint32_t failures) override;

    // Sends a gossip frame to one peer
    [[nodiscard]] std::expected<void, LinkError>
    send_gossip(const NodeId& peer, std::span<const uint8_t> body);

    [[nodiscard]] std::vector<NodeId> up_peers() const;
    [[nodiscard]] bool is_up(const NodeId& peer) const;
    [[nodiscard]] std::vector<LinkStatus> links() const;
    [[nodiscard]] uint16_t listen_port() const;
    [[nodiscard]] const NodeId& self() const { return self_; }

private:
    struct Persistent {
        core::RelayIdentity identity;
        std::optional<std::chrono::steady_clock::time_point> down_since;
    };

    [[nodiscard]] std::shared_ptr<TransportLink> up_link(const NodeId& peer) const;
    void handle_gossip(const NodeId& from, std::span<const uint8_t> body);

    Config config_;
    LocalCredentials local_;   // guarded by mutex_
    NodeId self_;
    Dialer& dialer_;
    topology::TopologyStore& topology_;
    core::ForwardingEngine& engine_;
    core::EventSink& events_;
    core::NodeStats& stats_;
    PeerObserver* observer_{nullptr};

    policy::ReplayWindow handshake_replay_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<TransportLink>> links_;
    std::unordered_map<NodeId, Persistent> persistent_;

    boost::asio::io_context io_context_;
    std::unique_ptr<net::TcpAcceptor> acceptor_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::jthread io_thread_;
};

}  // namespace mixnet::transport
