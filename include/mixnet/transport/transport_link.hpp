#pragma once

#include "mixnet/core/errors.hpp"
#include "mixnet/core/identity.hpp"
#include "mixnet/net/connection.hpp"
#include "mixnet/policy/admission.hpp"
#include "mixnet/policy/replay_window.hpp"
#include "mixnet/policy/scheduler.hpp"
#include "mixnet/policy/token_bucket.hpp"
#include "mixnet/transport/link_protocol.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace mixnet::transport {

enum class LinkState {
    Connecting,     // dialing
    Handshaking,    // key exchange and HELLO
    Up,             // carrying frames
    Reconnecting,   // waiting out the backoff after a failure
    Down,           // gave up after max_failures; edges marked stale
    Closed,         // closed locally
};

[[nodiscard]] const char* link_state_name(LinkState state);

// Opens outbound streams. Production uses TCP; tests substitute in-memory pipes.
class Dialer {
public:
    virtual ~Dialer() = default;

    [[nodiscard]] virtual std::expected<std::unique_ptr<net::Stream>, net::ConnectionError>
    dial(const std::string& address) = 0;
};

class TcpDialer : public Dialer {
public:
    explicit TcpDialer(std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000))
        : connect_timeout_(connect_timeout) {}

    [[nodiscard]] std::expected<std::unique_ptr<net::Stream>, net::ConnectionError>
    dial(const std::string& address) override;

private:
    std::chrono::milliseconds connect_timeout_;
};

class TransportLink;

// Link lifecycle and inbound frames, delivered on the link's own threads
class LinkHandler {
public:
    virtual ~LinkHandler() = default;

    virtual void on_link_up(TransportLink& link, const PeerHello& hello) = 0;
    virtual void on_frame(TransportLink& link, Frame frame) = 0;
    // A queued packet of `bytes` was written to the stream
    virtual void on_packet_sent(TransportLink& link, size_t bytes) = 0;
    virtual void on_link_down(TransportLink& link, core::MixnetError reason, uint32_t failures) = 0;
};

// Delay before reconnect attempt number `failures` (1-based)
[[nodiscard]] std::chrono::milliseconds
backoff_delay(std::chrono::milliseconds initial, std::chrono::milliseconds max, uint32_t failures);

struct LinkStatus {
    std::optional<NodeId> peer;
    std::string address;
    LinkState state{LinkState::Connecting};
    bool outbound{false};
    uint32_t failures{0};
    size_t queued{0};
    uint64_t packets_sent{0};
    uint64_t packets_received{0};
};

// A directly peered relay reached over one stream at a time.
//
// Outbound links dial the peer's advertised address and redial with
// exponential backoff after a failure; after max_failures consecutive
// failures the link goes Down. Inbound links wrap an accepted stream and go
// Down when it fails, since the dialing side owns reconnection.
//
// Threads: a supervisor that connects, handshakes and then reads frames, and
// a writer started per session that drains the outbound queue.
class TransportLink {
public:
    struct Config {
        uint32_t max_failures{5};
        std::chrono::milliseconds backoff_initial{250};
        std::chrono::milliseconds backoff_max{30000};
        std::chrono::milliseconds handshake_timeout{10000};
        std::chrono::milliseconds keepalive_interval{15000};
        std::chrono::milliseconds idle_timeout{60000};
        uint64_t rate{0};                 // egress bytes per second, 0 = unlimited
        uint64_t burst{256 * 1024};
        policy::OutboundQueue::Config queue;
    };

    // Outbound link towards peer
    TransportLink(Config config, LocalCredentials local, core::RelayIdentity peer,
                  Dialer& dialer, LinkHandler& handler);

    // Inbound link over an accepted stream
    TransportLink(Config config, LocalCredentials local, std::unique_ptr<net::Stream> accepted,
                  policy::ReplayWindow& handshake_replay, LinkHandler& handler);

    ~TransportLink();

    TransportLink(const TransportLink&) = delete;
    TransportLink& operator=(const TransportLink&) = delete;

    void start();

    // Stops all threads and releases queued packets. Idempotent.
    void close();

    // LinkDown unless Up
    [[nodiscard]] std::expected<std::optional<policy::QueuedPacket>, core::MixnetError>
    enqueue(policy::QueuedPacket item);

    // Sends a control frame (gossip) ahead of queued packets
    [[nodiscard]] std::expected<void, LinkError>
    send_frame(FrameType type, std::span<const uint8_t> body);

    [[nodiscard]] LinkState state() const;
    [[nodiscard]] bool is_up() const { return state() == LinkState::Up; }
    [[nodiscard]] bool finished() const;
    [[nodiscard]] bool outbound() const { return outbound_; }
    [[nodiscard]] std::optional<NodeId> peer_id() const;
    [[nodiscard]] std::optional<core::RelayIdentity> peer_identity() const;

    // Admission scope that packets arriving on this link are charged to
    [[nodiscard]] policy::ScopeId inbound_scope() const;

    [[nodiscard]] uint32_t failures() const;
    [[nodiscard]] LinkStatus status() const;
    [[nodiscard]] const Config& config() const { return config_; }

private:
    void run(std::stop_token stop);
    [[nodiscard]] std::expected<void, LinkError> establish(std::stop_token stop);
    [[nodiscard]] std::expected<void, LinkError> read_loop(std::stop_token stop);
    void write_loop(std::stop_token stop);
    [[nodiscard]] bool write_packet(const policy::QueuedPacket& item);
    void end_session();
    void set_state(LinkState state);
    bool sleep_for(std::stop_token stop, std::chrono::milliseconds delay);

    Config config_;
    LocalCredentials local_;
    const bool outbound_;
    Dialer* dialer_{nullptr};
    policy::ReplayWindow* handshake_replay_{nullptr};
    LinkHandler& handler_;

    mutable std::mutex mutex_;
    LinkState state_;
    uint32_t failures_{0};
    std::optional<core::RelayIdentity> peer_;
    std::optional<PeerHello> peer_hello_;
    std::string address_;
    std::unique_ptr<net::Stream> stream_;
    std::unique_ptr<LinkSession> session_;
    policy::ScopeId inbound_scope_{};
    policy::ScopeId outbound_scope_{};

    // Serializes frame writes between the writer and send_frame()
    std::mutex write_mutex_;

    policy::OutboundQueue queue_;
    policy::TokenBucket egress_;

    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;

    std::atomic<uint64_t> packets_sent_{0};
    std::atomic<uint64_t> packets_received_{0};

    std::jthread writer_;
    std::jthread supervisor_;
};

}  // namespace mixnet::transport
