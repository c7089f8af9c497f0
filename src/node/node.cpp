#include "mixnet/node/node.hpp"
#include "mixnet/crypto/key_store.hpp"
#include "mixnet/node/gossip.hpp"
#include "mixnet/node/onion_path.hpp"
#include "mixnet/topology/topology_file.hpp"
#include "mixnet/util/logging.hpp"

namespace mixnet::node {

std::string node_error_message(NodeError err) {
    switch (err) {
        case NodeError::ConfigError: return "Configuration error";
        case NodeError::KeyLoadFailed: return "Failed to load or generate keys";
        case NodeError::CorruptIdentityKey: return "Identity key is corrupt";
        case NodeError::IdentityError: return "Failed to sign relay identity";
        case NodeError::BindFailed: return "Failed to bind listener";
        case NodeError::AlreadyRunning: return "Node is already running";
        case NodeError::NotRunning: return "Node is not running";
        default: return "Unknown node error";
    }
}

namespace {

core::ForwardingEngine::Config engine_config(const util::Config& cfg) {
    return core::ForwardingEngine::Config{
        .replay = {.capacity = cfg.replay.capacity, .slack = cfg.replay.epoch_slack},
        .admission = {.difficulty_bits = cfg.admission.difficulty_bits,
                      .scope = cfg.admission.scope,
                      .rate = cfg.admission.rate,
                      .burst = cfg.admission.burst,
                      .spent = {.capacity = 1 << 17, .slack = cfg.replay.epoch_slack}},
        .debt = {.limit = cfg.admission.debt_limit},
        .relay_priority = policy::Priority::Bulk,
    };
}

transport::LinkManager::Config link_config(const util::Config& cfg) {
    transport::LinkManager::Config out;
    out.link.max_failures = cfg.link.max_failures;
    out.link.backoff_initial = cfg.link.backoff_initial;
    out.link.backoff_max = cfg.link.backoff_max;
    out.link.handshake_timeout = cfg.link.handshake_timeout;
    out.link.keepalive_interval = cfg.link.keepalive_interval;
    out.link.idle_timeout = cfg.link.keepalive_interval * 4;
    out.link.rate = cfg.link.rate;
    out.link.burst = cfg.link.burst;
    out.link.queue = {.capacity = cfg.queue.capacity, .policy = cfg.queue.policy};
    return out;
}

core::CircuitManager::Config circuit_config(const util::Config& cfg) {
    core::CircuitManager::Config out;
    out.open_timeout = cfg.circuit.open_timeout;
    out.rto = cfg.circuit.rto;
    out.max_retries = cfg.circuit.max_retries;
    out.window = cfg.circuit.window;
    out.idle_timeout = cfg.circuit.idle_timeout;
    return out;
}

core::RelayIdentity unsigned_identity(const crypto::NodeKeys& keys) {
    return core::RelayIdentity{
        .identity_key = keys.identity.public_key(),
        .onion_key = keys.onion.public_key(),
        .addresses = {},
        .published_at = 0,
        .signature = {},
    };
}

}  // namespace

struct Node::Impl {
    Impl(util::Config cfg, crypto::NodeKeys node_keys, transport::Dialer* dialer_override,
         std::unique_ptr<AddressBook> book, FileAddressBook* file_book_ptr)
        : config(std::move(cfg))
        , keys(std::move(node_keys))
        , self(keys.node_id())
        , tcp_dialer(config.link.handshake_timeout)
        , dialer(dialer_override ? *dialer_override : tcp_dialer)
        , address_book(std::move(book))
        , file_book(file_book_ptr)
        , topology(self, topology::TopologyStore::Config{.edge_ttl = config.topology.edge_ttl,
                                                         .identity_ttl = config.topology.identity_ttl})
        , links(link_config(config),
                transport::LocalCredentials{
                    .keys = &keys,
                    .identity = unsigned_identity(keys),
                    .difficulty_bits = static_cast<uint8_t>(config.admission.difficulty_bits),
                    .admission_scope = config.admission.scope,
                },
                dialer, topology, engine, events, stats)
        , engine(keys.onion, self, engine_config(config), links, stats, events)
        , path(self, topology, engine, config.routing.max_hops)
        , circuits(self, keys.identity, keys.onion, circuit_config(config), path, events)
        , gossip(GossipTask::Config{.interval = config.topology.gossip_interval},
                 keys, topology, links, *address_book)
        , control(self, circuits, topology, links, stats, engine.debts()) {}

    util::Config config;
    crypto::NodeKeys keys;
    NodeId self;

    core::NodeStats stats;
    core::EventBus events;

    transport::TcpDialer tcp_dialer;
    transport::Dialer& dialer;
    std::unique_ptr<AddressBook> address_book;
    FileAddressBook* file_book{nullptr};

    topology::TopologyStore topology;
    // links hands packets to engine, which is constructed next; links starts
    // no thread before start() or connect()
    transport::LinkManager links;
    core::ForwardingEngine engine;
    OnionPacketPath path;
    core::CircuitManager circuits;
    GossipTask gossip;
    ControlPlane control;

    [[nodiscard]] std::filesystem::path topology_path() const {
        return config.node.data_dir / "topology";
    }
};

Node::Node(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {
    impl_->engine.set_delivery_sink(&impl_->circuits);
    impl_->links.set_observer(this);
}

Node::~Node() {
    if (running_) {
        (void)stop();
    }
    // Link threads call into the engine and circuits, which are destroyed
    // before the link manager
    impl_->gossip.stop();
    impl_->circuits.stop();
    impl_->links.shutdown();
    impl_->links.set_observer(nullptr);
}

std::vector<std::string> Node::advertised_addresses(uint16_t port) const {
    const auto& node_cfg = impl_->config.node;
    if (!node_cfg.advertise.empty()) {
        return node_cfg.advertise;
    }
    std::string host = node_cfg.listen_address;
    if (host == "0.0.0.0" || host == "::" || host.empty()) {
        LOG_WARN("No advertise address configured; advertising 127.0.0.1:{}", port);
        host = "127.0.0.1";
    }
    return {host + ":" + std::to_string(port)};
}

std::expected<void, NodeError> Node::start() {
    if (running_) {
        return std::unexpected(NodeError::AlreadyRunning);
    }
    auto& d = *impl_;
    util::LogContext ctx("node");

    LOG_INFO("Starting node {} ({})", d.config.node.nickname, d.self.to_hex());

    auto port = d.links.listen(d.config.node.listen_address, d.config.node.listen_port);
    if (!port) {
        return std::unexpected(NodeError::BindFailed);
    }

    auto identity = core::RelayIdentity::create(d.keys, advertised_addresses(*port), core::unix_now());
    if (!identity) {
        LOG_ERROR("Failed to sign identity: {}", crypto::key_error_message(identity.error()));
        d.links.shutdown();
        return std::unexpected(NodeError::IdentityError);
    }
    d.links.set_identity(*identity);
    if (auto r = d.topology.insert_identity(*identity); !r) {
        LOG_ERROR("Own identity rejected: {}", topology::topology_error_message(r.error()));
        d.links.shutdown();
        return std::unexpected(NodeError::IdentityError);
    }

    // Relays remembered from earlier runs are routable until their TTL runs out
    for (const auto& entry : d.address_book->all()) {
        if (entry.identity.verify()) {
            (void)d.topology.insert_identity(entry.identity);
        }
    }
    auto graph = topology::load_topology(d.topology, d.topology_path(), core::unix_now());
    if (!graph) {
        LOG_WARN("Ignoring unreadable relay graph: {}",
                 topology::topology_file_error_message(graph.error()));
    } else if (graph->identities > 0 || graph->records > 0) {
        LOG_INFO("Restored {} relay(s) and {} link-state record(s) ({} skipped)",
                 graph->identities, graph->records, graph->skipped);
    }

    d.circuits.start();
    running_ = true;

    d.gossip.announce();
    for (const auto& peer : d.config.peers) {
        auto peer_identity = peer.to_identity();
        d.address_book->insert(peer_identity, 0);
        LOG_INFO("Connecting to configured peer {} at {}", peer.name, peer.address);
        d.links.connect(peer_identity, true);
    }
    d.gossip.start();

    LOG_INFO("Node running on port {}", *port);
    return {};
}

std::expected<void, NodeError> Node::stop() {
    if (!running_) {
        return std::unexpected(NodeError::NotRunning);
    }
    auto& d = *impl_;
    LOG_INFO("Stopping node {}", d.config.node.nickname);

    d.gossip.stop();
    d.circuits.stop();
    d.links.shutdown();

    if (d.file_book) {
        if (auto r = d.file_book->save(); !r) {
            LOG_WARN("Failed to save address book: {}", address_book_error_message(r.error()));
        }
    }
    if (auto r = topology::save_topology(d.topology, d.topology_path()); !r) {
        LOG_WARN("Failed to save relay graph: {}", topology::topology_file_error_message(r.error()));
    }

    running_ = false;
    LOG_INFO("Node stopped");
    return {};
}

NodeId Node::node_id() const { return impl_->self; }
core::RelayIdentity Node::identity() const { return impl_->links.identity(); }
const crypto::NodeKeys& Node::keys() const { return impl_->keys; }
const util::Config& Node::config() const { return impl_->config; }
uint16_t Node::listen_port() const { return impl_->links.listen_port(); }

void Node::connect(const core::RelayIdentity& peer) {
    impl_->address_book->insert(peer, 0);
    impl_->links.connect(peer, true);
}

std::expected<std::shared_ptr<core::Circuit>, core::MixnetError>
Node::open_circuit(const NodeId& dst, policy::Priority priority) {
    return impl_->circuits.open_to(dst, priority);
}

void Node::gossip_now() { impl_->gossip.run_once(); }

topology::TopologyStore& Node::topology() { return impl_->topology; }
transport::LinkManager& Node::links() { return impl_->links; }
core::CircuitManager& Node::circuits() { return impl_->circuits; }
core::ForwardingEngine& Node::engine() { return impl_->engine; }
ControlPlane& Node::control() { return impl_->control; }
core::EventBus& Node::events() { return impl_->events; }
core::StatsSnapshot Node::stats() const { return impl_->stats.snapshot(); }
AddressBook& Node::address_book() { return *impl_->address_book; }

void Node::on_peer_up(const core::RelayIdentity& peer) {
    impl_->address_book->insert(peer, core::unix_now());
    impl_->gossip.trigger();
}

void Node::on_peer_down(const NodeId& peer) {
    impl_->circuits.on_link_down(peer);
    impl_->gossip.trigger();
}

// --- NodeBuilder ---

NodeBuilder& NodeBuilder::config(const util::Config& cfg) {
    config_ = cfg;
    return *this;
}

NodeBuilder& NodeBuilder::keys(crypto::NodeKeys keys) {
    keys_ = std::move(keys);
    return *this;
}

NodeBuilder& NodeBuilder::dialer(transport::Dialer& dialer) {
    dialer_ = &dialer;
    return *this;
}

NodeBuilder& NodeBuilder::address_book(std::unique_ptr<AddressBook> book) {
    address_book_ = std::move(book);
    return *this;
}

NodeBuilder& NodeBuilder::subscribe(std::shared_ptr<core::EventSink> sink) {
    sinks_.push_back(std::move(sink));
    return *this;
}

std::expected<std::unique_ptr<Node>, NodeError> NodeBuilder::build() {
    if (!config_) {
        LOG_ERROR("Node configuration not set");
        return std::unexpected(NodeError::ConfigError);
    }
    if (auto r = config_->validate(); !r) {
        LOG_ERROR("Invalid configuration: {}", util::config_error_message(r.error()));
        return std::unexpected(NodeError::ConfigError);
    }

    if (!keys_) {
        crypto::KeyStore store(config_->node.data_dir);
        auto loaded = store.load_or_generate();
        if (!loaded) {
            LOG_ERROR("Key store: {}", crypto::key_store_error_message(loaded.error()));
            if (loaded.error() == crypto::KeyStoreError::CorruptIdentityKey) {
                return std::unexpected(NodeError::CorruptIdentityKey);
            }
            return std::unexpected(NodeError::KeyLoadFailed);
        }
        keys_ = std::move(*loaded);
    }

    FileAddressBook* file_book = nullptr;
    if (!address_book_) {
        auto book = std::make_unique<FileAddressBook>(config_->node.data_dir / "peers");
        if (auto r = book->load(); !r) {
            LOG_WARN("Ignoring unreadable address book: {}", address_book_error_message(r.error()));
        }
        file_book = book.get();
        address_book_ = std::move(book);
    }

    auto impl = std::make_unique<Node::Impl>(std::move(*config_), std::move(*keys_), dialer_,
                                             std::move(address_book_), file_book);
    config_.reset();
    keys_.reset();

    impl->events.subscribe(std::make_shared<core::LoggingEventSink>());
    impl->events.subscribe(std::make_shared<core::StatsEventSink>(impl->stats));
    for (auto& sink : sinks_) {
        impl->events.subscribe(std::move(sink));
    }
    sinks_.clear();

    return std::unique_ptr<Node>(new Node(std::move(impl)));
}

}  // namespace mixnet::node
