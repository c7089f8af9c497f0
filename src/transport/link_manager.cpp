#include "mixnet/transport/link_manager.hpp"
#include "mixnet/topology/link_state.hpp"
#include "mixnet/util/binary.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>

namespace mixnet::transport {

namespace {

// Stream over a connection handed out by the acceptor
class AcceptedTcpStream : public net::Stream {
public:
    explicit AcceptedTcpStream(std::shared_ptr<net::TcpConnection> conn)
        : conn_(std::move(conn)) {}

    [[nodiscard]] std::expected<void, net::ConnectionError>
    read_exactly(std::span<uint8_t> buffer) override { return conn_->read_exactly(buffer); }

    [[nodiscard]] std::expected<void, net::ConnectionError>
    write_all(std::span<const uint8_t> data) override { return conn_->write_all(data); }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        conn_->set_read_timeout(timeout);
    }
    void close() override { conn_->close(); }
    [[nodiscard]] std::string remote_endpoint() const override { return conn_->remote_endpoint(); }

private:
    std::shared_ptr<net::TcpConnection> conn_;
};

}  // namespace

std::vector<uint8_t> encode_gossip(GossipKind kind, std::span<const uint8_t> record) {
    std::vector<uint8_t> out;
    out.reserve(1 + record.size());
    out.push_back(static_cast<uint8_t>(kind));
    out.insert(out.end(), record.begin(), record.end());
    return out;
}

LinkManager::LinkManager(Config config,
                         LocalCredentials local,
                         Dialer& dialer,
                         topology::TopologyStore& topology,
                         core::ForwardingEngine& engine,
                         core::EventSink& events,
                         core::NodeStats& stats)
    : config_(config)
    , local_(std::move(local))
    , self_(local_.identity.node_id())
    , dialer_(dialer)
    , topology_(topology)
    , engine_(engine)
    , events_(events)
    , stats_(stats)
    , handshake_replay_(config.handshake_replay) {}

LinkManager::~LinkManager() {
    shutdown();
}

std::expected<uint16_t, net::AcceptorError>
LinkManager::listen(const std::string& address, uint16_t port) {
    if (acceptor_ && acceptor_->is_listening()) {
        return std::unexpected(net::AcceptorError::AlreadyListening);
    }
    acceptor_ = std::make_unique<net::TcpAcceptor>(io_context_);
    if (auto r = acceptor_->listen(address, port); !r) {
        LOG_ERROR("Failed to listen on {}:{}: {}", address, port,
                  net::acceptor_error_message(r.error()));
        return std::unexpected(r.error());
    }

    acceptor_->start_accept_loop([this](auto result) {
        if (!result) {
            if (result.error() != net::AcceptorError::Closed) {
                LOG_WARN("Accept failed: {}", net::acceptor_error_message(result.error()));
            }
            return;
        }
        auto conn = *result;
        conn->set_no_delay(true);
        LOG_DEBUG("Inbound connection from {}", conn->remote_endpoint());
        adopt(std::make_unique<AcceptedTcpStream>(std::move(conn)));
    });

    work_.emplace(boost::asio::make_work_guard(io_context_));
    io_thread_ = std::jthread([this] { io_context_.run(); });

    auto bound = acceptor_->local_port();
    LOG_INFO("Listening for links on {}:{}", acceptor_->local_address(), bound);
    return bound;
}

void LinkManager::adopt(std::unique_ptr<net::Stream> stream) {
    std::shared_ptr<TransportLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        link = std::make_shared<TransportLink>(config_.link, local_, std::move(stream),
                                               handshake_replay_, *this);
        links_.push_back(link);
    }
    link->start();
}

void LinkManager::set_identity(core::RelayIdentity identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (identity.node_id() != self_) {
        LOG_ERROR("Refusing to replace local identity with a different key");
        return;
    }
    local_.identity = std::move(identity);
}

core::RelayIdentity LinkManager::identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_.identity;
}

void LinkManager::connect(const core::RelayIdentity& peer, bool persistent) {
    auto id = peer.node_id();
    if (id == self_) {
        return;
    }
    std::shared_ptr<TransportLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (persistent) {
            persistent_[id] = Persistent{.identity = peer, .down_since = std::nullopt};
        }
        for (const auto& l : links_) {
            if (l->outbound() && !l->finished() && l->peer_id() == id) {
                return;
            }
        }
        link = std::make_shared<TransportLink>(config_.link, local_, peer, dialer_, *this);
        links_.push_back(link);
    }
    LOG_DEBUG("Dialing {}", id.short_hex());
    link->start();
}

void LinkManager::disconnect(const NodeId& peer) {
    std::vector<std::shared_ptr<TransportLink>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        persistent_.erase(peer);
        auto it = std::stable_partition(links_.begin(), links_.end(),
            [&](const auto& l) { return l->peer_id() != peer; });
        closing.assign(it, links_.end());
        links_.erase(it, links_.end());
    }
    for (auto& l : closing) {
        l->close();
    }
    if (!closing.empty()) {
        engine_.unregister_link(peer, closing.front()->inbound_scope());
        topology_.mark_stale(self_, peer);
        if (observer_) observer_->on_peer_down(peer);
    }
}

void LinkManager::shutdown() {
    if (acceptor_) {
        acceptor_->stop();
        acceptor_->close();
    }
    work_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    std::vector<std::shared_ptr<TransportLink>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing.swap(links_);
        persistent_.clear();
    }
    for (auto& l : closing) {
        l->close();
    }
}

void LinkManager::maintain(std::chrono::steady_clock::time_point now) {
    std::vector<std::shared_ptr<TransportLink>> reaped;
    std::vector<std::shared_ptr<TransportLink>> started;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::stable_partition(links_.begin(), links_.end(),
            [](const auto& l) { return !l->finished(); });
        reaped.assign(it, links_.end());
        links_.erase(it, links_.end());

        for (auto& [id, p] : persistent_) {
            if (!p.down_since || now - *p.down_since < config_.redial_interval) {
                continue;
            }
            bool live = std::any_of(links_.begin(), links_.end(), [&](const auto& l) {
                return l->outbound() && l->peer_id() == id;
            });
            p.down_since.reset();
            if (live) continue;
            auto current = topology_.snapshot()->find(id);
            const auto& identity = current ? *current : p.identity;
            auto link = std::make_shared<TransportLink>(config_.link, local_, identity,
                                                        dialer_, *this);
            links_.push_back(link);
            started.push_back(link);
        }
    }
    for (auto& l : started) {
        LOG_INFO("Redialing {}", l->peer_id()->short_hex());
        l->start();
    }
    // reaped links release their threads here, outside the lock
}

std::shared_ptr<TransportLink> LinkManager::up_link(const NodeId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& l : links_) {
        if (l->is_up() && l->peer_id() == peer) {
            return l;
        }
    }
    return nullptr;
}

std::expected<std::optional<policy::QueuedPacket>, core::MixnetError>
LinkManager::enqueue(const NodeId& next_hop, policy::QueuedPacket item) {
    auto link = up_link(next_hop);
    if (!link) {
        return std::unexpected(core::MixnetError::LinkDown);
    }
    return link->enqueue(std::move(item));
}

void LinkManager::on_link_up(TransportLink& link, const PeerHello& hello) {
    auto peer = hello.identity.node_id();
    if (auto r = topology_.insert_identity(hello.identity); !r) {
        LOG_DEBUG("Identity of {} not stored: {}", peer.short_hex(),
                  topology::topology_error_message(r.error()));
    }
    engine_.register_link(peer);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = persistent_.find(peer); it != persistent_.end()) {
            it->second.down_since.reset();
            it->second.identity = hello.identity;
        }
    }

    events_.on_event(core::LinkUp{.peer = peer, .address = link.status().address});
    if (observer_) {
        observer_->on_peer_up(hello.identity);
    }
}

void LinkManager::on_packet_sent(TransportLink&, size_t bytes) {
    stats_.record_sent(bytes);
}

void LinkManager::on_frame(TransportLink& link, Frame frame) {
    auto peer = link.peer_id();
    if (!peer) {
        return;
    }
    switch (frame.type) {
        case FrameType::Packet: {
            core::InboundPacket inbound{.ingress = *peer, .scope = link.inbound_scope()};
            std::span<const uint8_t> body(frame.body);
            if (body.size() >= policy::AdmissionTicket::WIRE_LEN) {
                util::BinaryReader r(body);
                inbound.ticket.solution = *r.read_u64();
                inbound.bytes = r.rest();
            }
            if (auto outcome = engine_.process(inbound); !outcome) {
                LOG_TRACE("Packet from {} dropped: {}", peer->short_hex(),
                          core::mixnet_error_name(outcome.error()));
            }
            break;
        }
        case FrameType::Gossip:
            handle_gossip(*peer, frame.body);
            break;
        default:
            break;
    }
}

void LinkManager::on_link_down(TransportLink& link, core::MixnetError reason, uint32_t failures) {
    auto peer = link.peer_id();
    if (!peer) {
        LOG_DEBUG("Inbound link from {} failed before identifying itself", link.status().address);
        return;
    }

    bool other_up = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& l : links_) {
            if (l.get() != &link && l->is_up() && l->peer_id() == peer) {
                other_up = true;
            }
        }
        if (auto it = persistent_.find(*peer); it != persistent_.end() && link.outbound()) {
            it->second.down_since = std::chrono::steady_clock::now();
        }
    }

    if (!other_up) {
        engine_.unregister_link(*peer, link.inbound_scope());
        topology_.mark_stale(self_, *peer);
        if (observer_) {
            observer_->on_peer_down(*peer);
        }
    }
    events_.on_event(core::LinkDown{.peer = *peer, .reason = reason, .failures = failures});
}

std::expected<void, LinkError>
LinkManager::send_gossip(const NodeId& peer, std::span<const uint8_t> body) {
    auto link = up_link(peer);
    if (!link) {
        return std::unexpected(LinkError::Closed);
    }
    return link->send_frame(FrameType::Gossip, body);
}

void LinkManager::handle_gossip(const NodeId& from, std::span<const uint8_t> body) {
    if (body.empty()) {
        return;
    }
    auto record = body.subspan(1);
    switch (static_cast<GossipKind>(body[0])) {
        case GossipKind::Identity: {
            auto identity = core::RelayIdentity::parse(record);
            if (!identity) {
                LOG_DEBUG("Malformed identity gossip from {}", from.short_hex());
                return;
            }
            if (auto r = topology_.insert_identity(*identity); !r) {
                LOG_TRACE("Identity gossip from {} rejected: {}", from.short_hex(),
                          topology::topology_error_message(r.error()));
            }
            break;
        }
        case GossipKind::LinkState: {
            auto lsr = topology::LinkStateRecord::parse(record);
            if (!lsr) {
                LOG_DEBUG("Malformed link-state gossip from {}", from.short_hex());
                return;
            }
            if (auto r = topology_.merge(*lsr); !r) {
                LOG_TRACE("Link-state gossip from {} rejected: {}", from.short_hex(),
                          topology::topology_error_message(r.error()));
            }
            break;
        }
        default:
            LOG_DEBUG("Unknown gossip kind {} from {}", body[0], from.short_hex());
            break;
    }
}

std::vector<NodeId> LinkManager::up_peers() const {
    std::vector<NodeId> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& l : links_) {
        if (!l->is_up()) continue;
        auto id = l->peer_id();
        if (id && std::find(out.begin(), out.end(), *id) == out.end()) {
            out.push_back(*id);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool LinkManager::is_up(const NodeId& peer) const {
    return up_link(peer) != nullptr;
}

std::vector<LinkStatus> LinkManager::links() const {
    std::vector<LinkStatus> out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(links_.size());
    for (const auto& l : links_) {
        out.push_back(l->status());
    }
    return out;
}

uint16_t LinkManager::listen_port() const {
    return acceptor_ ? acceptor_->local_port() : 0;
}

}  // namespace mixnet::transport
