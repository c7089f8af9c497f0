#include "mixnet/transport/transport_link.hpp"
#include "mixnet/util/binary.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>

namespace mixnet::transport {

namespace {

constexpr size_t PACKET_FRAME_BODY = policy::AdmissionTicket::WIRE_LEN + core::PACKET_LEN;
constexpr size_t PACKET_FRAME_WIRE = FRAME_HEADER_LEN + 1 + PACKET_FRAME_BODY + crypto::AEAD_TAG_LEN;

// A TCP stream that owns the io_context its connection runs on
class DialedTcpStream : public net::Stream {
public:
    explicit DialedTcpStream(std::chrono::milliseconds connect_timeout) : conn_(io_) {
        conn_.set_connect_timeout(connect_timeout);
    }

    [[nodiscard]] std::expected<void, net::ConnectionError>
    connect(const std::string& host, uint16_t port) {
        auto r = conn_.connect(host, port);
        if (r) {
            conn_.set_no_delay(true);
            conn_.set_keep_alive(true);
        }
        return r;
    }

    [[nodiscard]] std::expected<void, net::ConnectionError>
    read_exactly(std::span<uint8_t> buffer) override { return conn_.read_exactly(buffer); }

    [[nodiscard]] std::expected<void, net::ConnectionError>
    write_all(std::span<const uint8_t> data) override { return conn_.write_all(data); }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        conn_.set_read_timeout(timeout);
    }
    void close() override { conn_.close(); }
    [[nodiscard]] std::string remote_endpoint() const override { return conn_.remote_endpoint(); }

private:
    net::asio::io_context io_;
    net::TcpConnection conn_;
};

bool is_transport_error(LinkError err) {
    return err == LinkError::Timeout || err == LinkError::Closed || err == LinkError::IoError;
}

}  // namespace

const char* link_state_name(LinkState state) {
    switch (state) {
        case LinkState::Connecting: return "connecting";
        case LinkState::Handshaking: return "handshaking";
        case LinkState::Up: return "up";
        case LinkState::Reconnecting: return "reconnecting";
        case LinkState::Down: return "down";
        case LinkState::Closed: return "closed";
        default: return "unknown";
    }
}

std::expected<std::unique_ptr<net::Stream>, net::ConnectionError>
TcpDialer::dial(const std::string& address) {
    auto hp = net::parse_host_port(address);
    if (!hp) {
        return std::unexpected(hp.error());
    }
    auto stream = std::make_unique<DialedTcpStream>(connect_timeout_);
    if (auto r = stream->connect(hp->first, hp->second); !r) {
        return std::unexpected(r.error());
    }
    return stream;
}

std::chrono::milliseconds
backoff_delay(std::chrono::milliseconds initial, std::chrono::milliseconds max, uint32_t failures) {
    auto delay = initial;
    for (uint32_t i = 1; i < failures && delay < max; ++i) {
        delay *= 2;
    }
    return std::min(delay, max);
}

// --- TransportLink ---

TransportLink::TransportLink(Config config, LocalCredentials local, core::RelayIdentity peer,
                             Dialer& dialer, LinkHandler& handler)
    : config_(config)
    , local_(std::move(local))
    , outbound_(true)
    , dialer_(&dialer)
    , handler_(handler)
    , state_(LinkState::Connecting)
    , peer_(std::move(peer))
    , queue_(config.queue)
    , egress_(config.rate, std::max<uint64_t>(config.burst, PACKET_FRAME_WIRE)) {
    queue_.close();
}

TransportLink::TransportLink(Config config, LocalCredentials local,
                             std::unique_ptr<net::Stream> accepted,
                             policy::ReplayWindow& handshake_replay, LinkHandler& handler)
    : config_(config)
    , local_(std::move(local))
    , outbound_(false)
    , handshake_replay_(&handshake_replay)
    , handler_(handler)
    , state_(LinkState::Handshaking)
    , address_(accepted->remote_endpoint())
    , stream_(std::move(accepted))
    , queue_(config.queue)
    , egress_(config.rate, std::max<uint64_t>(config.burst, PACKET_FRAME_WIRE)) {
    queue_.close();
}

TransportLink::~TransportLink() {
    close();
}

void TransportLink::start() {
    supervisor_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void TransportLink::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LinkState::Closed) {
            LOG_DEBUG("Closing link to {}", peer_ ? peer_->node_id().short_hex() : address_);
        }
        state_ = LinkState::Closed;
        if (stream_) {
            stream_->close();
        }
    }
    queue_.close();
    supervisor_.request_stop();
    if (supervisor_.joinable() && supervisor_.get_id() != std::this_thread::get_id()) {
        supervisor_.join();
    }
}

std::expected<std::optional<policy::QueuedPacket>, core::MixnetError>
TransportLink::enqueue(policy::QueuedPacket item) {
    if (state() != LinkState::Up) {
        return std::unexpected(core::MixnetError::LinkDown);
    }
    return queue_.push(std::move(item));
}

std::expected<void, LinkError>
TransportLink::send_frame(FrameType type, std::span<const uint8_t> body) {
    std::lock_guard<std::mutex> wl(write_mutex_);
    LinkSession* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LinkState::Up || !session_) {
            return std::unexpected(LinkError::Closed);
        }
        session = session_.get();
    }
    return session->write_frame(type, body);
}

LinkState TransportLink::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool TransportLink::finished() const {
    auto s = state();
    return s == LinkState::Down || s == LinkState::Closed;
}

std::optional<NodeId> TransportLink::peer_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!peer_) return std::nullopt;
    return peer_->node_id();
}

std::optional<core::RelayIdentity> TransportLink::peer_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_;
}

policy::ScopeId TransportLink::inbound_scope() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbound_scope_;
}

uint32_t TransportLink::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

LinkStatus TransportLink::status() const {
    LinkStatus s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (peer_) s.peer = peer_->node_id();
        s.address = address_;
        s.state = state_;
        s.failures = failures_;
    }
    s.outbound = outbound_;
    s.queued = queue_.size();
    s.packets_sent = packets_sent_.load();
    s.packets_received = packets_received_.load();
    return s;
}

void TransportLink::set_state(LinkState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != LinkState::Closed) {
        state_ = state;
    }
}

bool TransportLink::sleep_for(std::stop_token stop, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

void TransportLink::run(std::stop_token stop) {
    std::string tag;
    if (auto peer = peer_identity()) {
        tag = "link>" + peer->node_id().short_hex();
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        tag = "link<" + address_;
    }
    util::LogContext log_context(std::move(tag));

    while (!stop.stop_requested()) {
        core::MixnetError reason = core::MixnetError::LinkDown;
        LinkError cause = LinkError::Closed;

        auto established = establish(stop);
        if (established) {
            PeerHello hello;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                failures_ = 0;
                hello = *peer_hello_;
            }
            set_state(LinkState::Up);
            if (state() != LinkState::Up) {
                end_session();
                break;
            }
            LOG_INFO("Link {} {} is up", outbound_ ? "to" : "from",
                     hello.identity.node_id().short_hex());
            handler_.on_link_up(*this, hello);
            writer_ = std::jthread([this](std::stop_token ws) { write_loop(ws); });

            auto ended = read_loop(stop);
            cause = ended ? LinkError::Closed : ended.error();
        } else {
            cause = established.error();
            if (!is_transport_error(cause)) {
                reason = core::MixnetError::HandshakeFailed;
            }
        }
        end_session();

        if (stop.stop_requested() || state() == LinkState::Closed) {
            break;
        }

        uint32_t failures = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failures = ++failures_;
        }
        auto peer = peer_identity();
        std::string who;
        if (peer) {
            who = peer->node_id().short_hex();
        } else {
            std::lock_guard<std::mutex> lock(mutex_);
            who = address_;
        }
        LOG_WARN("Link {} failed ({}), {} consecutive failure(s)",
                 who, link_error_message(cause), failures);

        if (!outbound_ || failures >= config_.max_failures) {
            set_state(LinkState::Down);
            if (state() == LinkState::Down) {
                LOG_WARN("Link {} is down after {} failure(s)", who, failures);
                handler_.on_link_down(*this, reason, failures);
            }
            break;
        }

        set_state(LinkState::Reconnecting);
        auto delay = backoff_delay(config_.backoff_initial, config_.backoff_max, failures);
        LOG_DEBUG("Reconnecting to {} in {}ms", who, delay.count());
        if (!sleep_for(stop, delay)) {
            break;
        }
    }
}

std::expected<void, LinkError> TransportLink::establish(std::stop_token stop) {
    std::unique_ptr<net::Stream> stream;
    if (outbound_) {
        set_state(LinkState::Connecting);
        auto peer = *peer_identity();
        std::optional<net::ConnectionError> last_error;
        for (const auto& address : peer.addresses) {
            if (stop.stop_requested()) {
                return std::unexpected(LinkError::Closed);
            }
            auto dialed = dialer_->dial(address);
            if (dialed) {
                stream = std::move(*dialed);
                std::lock_guard<std::mutex> lock(mutex_);
                address_ = address;
                break;
            }
            LOG_DEBUG("Dial {} failed: {}", address, net::connection_error_message(dialed.error()));
            last_error = dialed.error();
        }
        if (!stream) {
            return std::unexpected(last_error ? from_connection_error(*last_error) : LinkError::IoError);
        }
    }

    net::Stream* raw = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == LinkState::Closed) {
            if (stream) stream->close();
            return std::unexpected(LinkError::Closed);
        }
        if (stream) {
            stream_ = std::move(stream);
        }
        if (!stream_) {
            // Inbound streams are used once
            return std::unexpected(LinkError::Closed);
        }
        state_ = LinkState::Handshaking;
        raw = stream_.get();
    }

    raw->set_read_timeout(config_.handshake_timeout);

    std::expected<crypto::LinkSessionKeys, LinkError> keys;
    if (outbound_) {
        auto peer = *peer_identity();
        keys = client_handshake(*raw, peer.node_id(), peer.onion_key);
    } else {
        keys = server_handshake(*raw, local_.identity.node_id(), local_.keys->onion,
                                *handshake_replay_);
    }
    if (!keys) {
        return std::unexpected(keys.error());
    }

    auto session = std::make_unique<LinkSession>(*raw, outbound_);
    if (auto r = session->install(*keys); !r) {
        return std::unexpected(r.error());
    }
    auto hello = session->exchange_hello(local_);
    if (!hello) {
        return std::unexpected(hello.error());
    }

    auto peer_id = hello->identity.node_id();
    if (peer_id == local_.identity.node_id()) {
        return std::unexpected(LinkError::IdentityMismatch);
    }
    if (outbound_) {
        auto expected_peer = *peer_identity();
        if (peer_id != expected_peer.node_id() ||
            hello->identity.onion_key != expected_peer.onion_key) {
            LOG_WARN("Peer at {} presented identity {}, expected {}",
                     raw->remote_endpoint(), peer_id.short_hex(),
                     expected_peer.node_id().short_hex());
            return std::unexpected(LinkError::IdentityMismatch);
        }
    }

    raw->set_read_timeout(config_.idle_timeout);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == LinkState::Closed) {
            return std::unexpected(LinkError::Closed);
        }
        if (!peer_ || peer_->published_at <= hello->identity.published_at) {
            peer_ = hello->identity;
        }
        inbound_scope_ = local_.admission_scope == policy::AdmissionScope::PerLink
            ? session->session_id()
            : policy::scope_for_identity(peer_id);
        outbound_scope_ = hello->admission_scope == policy::AdmissionScope::PerLink
            ? session->session_id()
            : policy::scope_for_identity(local_.identity.node_id());
        peer_hello_ = *hello;
        session_ = std::move(session);
    }
    egress_.reset();
    queue_.reopen();
    return {};
}

std::expected<void, LinkError> TransportLink::read_loop(std::stop_token stop) {
    LinkSession* session = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_.get();
    }
    while (!stop.stop_requested()) {
        auto frame = session->read_frame();
        if (!frame) {
            return std::unexpected(frame.error());
        }
        switch (frame->type) {
            case FrameType::Keepalive:
                break;
            case FrameType::Hello:
                return std::unexpected(LinkError::UnexpectedFrame);
            case FrameType::Packet:
                packets_received_.fetch_add(1, std::memory_order_relaxed);
                handler_.on_frame(*this, std::move(*frame));
                break;
            case FrameType::Gossip:
                handler_.on_frame(*this, std::move(*frame));
                break;
        }
    }
    return {};
}

void TransportLink::write_loop(std::stop_token stop) {
    auto last_write = std::chrono::steady_clock::now();
    while (!stop.stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        auto until_keepalive = config_.keepalive_interval -
            std::chrono::duration_cast<std::chrono::milliseconds>(now - last_write);
        auto wait = std::clamp(until_keepalive, std::chrono::milliseconds(1),
                               std::chrono::milliseconds(100));

        auto item = queue_.pop(wait);
        if (!item) {
            if (queue_.closed()) {
                return;
            }
            if (std::chrono::steady_clock::now() - last_write >= config_.keepalive_interval) {
                if (!send_frame(FrameType::Keepalive, {})) {
                    return;
                }
                last_write = std::chrono::steady_clock::now();
            }
            continue;
        }

        for (;;) {
            auto delay = egress_.time_until(PACKET_FRAME_WIRE);
            if (delay.count() == 0) break;
            if (!sleep_for(stop, delay)) return;
        }
        if (!egress_.try_consume(PACKET_FRAME_WIRE)) {
            continue;
        }

        if (!write_packet(*item)) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stream_) stream_->close();
            return;
        }
        last_write = std::chrono::steady_clock::now();
    }
}

bool TransportLink::write_packet(const policy::QueuedPacket& item) {
    policy::ScopeId scope;
    unsigned difficulty = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scope = outbound_scope_;
        difficulty = peer_hello_ ? peer_hello_->difficulty_bits : 0;
    }

    auto ticket = policy::mint_ticket(scope, item.packet.nonce(), difficulty);
    if (!ticket) {
        LOG_WARN("Could not mint admission ticket ({}), dropping packet",
                 policy::admission_error_message(ticket.error()));
        return true;
    }

    util::BinaryWriter w(PACKET_FRAME_BODY);
    w.write_u64(ticket->solution);
    w.write_bytes(item.packet.bytes());

    auto sent = send_frame(FrameType::Packet, w.data());
    if (!sent) {
        LOG_DEBUG("Packet write failed: {}", link_error_message(sent.error()));
        return false;
    }
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
    handler_.on_packet_sent(*this, item.packet.bytes().size());
    return true;
}

void TransportLink::end_session() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) {
            stream_->close();
        }
    }
    queue_.close();
    auto dropped = queue_.clear();
    if (dropped > 0) {
        LOG_DEBUG("Released {} queued packet(s)", dropped);
    }
    if (writer_.joinable()) {
        writer_.request_stop();
        writer_.join();
    }
    std::lock_guard<std::mutex> wl(write_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
    stream_.reset();
    peer_hello_.reset();
}

}  // namespace mixnet::transport
