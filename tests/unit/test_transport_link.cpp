#include <catch2/catch_all.hpp>
#include "mixnet/transport/transport_link.hpp"
#include "../fixtures/node_fixtures.hpp"
#include "../mocks/mock_dialer.hpp"
#include <mutex>
#include <vector>

using namespace mixnet;
using namespace mixnet::transport;
using mixnet::test::MockDialer;
using mixnet::test::TestRelay;
using mixnet::test::wait_until;

namespace {

constexpr const char* SERVER_ADDRESS = "mem:server";

TransportLink::Config fast_link_config(uint32_t max_failures = 3) {
    TransportLink::Config config;
    config.max_failures = max_failures;
    config.backoff_initial = std::chrono::milliseconds(10);
    config.backoff_max = std::chrono::milliseconds(50);
    config.handshake_timeout = std::chrono::milliseconds(1000);
    config.keepalive_interval = std::chrono::milliseconds(200);
    config.idle_timeout = std::chrono::milliseconds(3000);
    config.queue = {.capacity = 16};
    return config;
}

LocalCredentials credentials(const TestRelay& relay, uint8_t difficulty) {
    return LocalCredentials{
        .keys = &relay.keys,
        .identity = relay.identity,
        .difficulty_bits = difficulty,
        .admission_scope = policy::AdmissionScope::PerLink,
    };
}

// Keeps every callback a link makes
class RecordingHandler : public LinkHandler {
public:
    struct Down {
        core::MixnetError reason;
        uint32_t failures;
    };

    void on_link_up(TransportLink&, const PeerHello& hello) override {
        std::lock_guard<std::mutex> lock(mutex_);
        hellos_.push_back(hello);
    }

    void on_frame(TransportLink&, Frame frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(std::move(frame));
    }

    void on_packet_sent(TransportLink&, size_t bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_bytes_ += bytes;
    }

    void on_link_down(TransportLink&, core::MixnetError reason, uint32_t failures) override {
        std::lock_guard<std::mutex> lock(mutex_);
        downs_.push_back({reason, failures});
    }

    [[nodiscard]] std::vector<PeerHello> hellos() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hellos_;
    }

    [[nodiscard]] std::vector<Frame> frames(FrameType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Frame> out;
        for (const auto& f : frames_) {
            if (f.type == type) out.push_back(f);
        }
        return out;
    }

    [[nodiscard]] size_t sent_bytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_bytes_;
    }

    [[nodiscard]] std::vector<Down> downs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return downs_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<PeerHello> hellos_;
    std::vector<Frame> frames_;
    std::vector<Down> downs_;
    size_t sent_bytes_{0};
};

// A client relay dialing a server relay over in-memory pipes
struct LinkPair {
    TestRelay client{"mem:client"};
    TestRelay server{SERVER_ADDRESS};
    MockDialer dialer;
    policy::ReplayWindow replay{{.capacity = 1024, .slack = 1}};
    RecordingHandler client_events, server_events;
    uint8_t server_difficulty{4};

    std::mutex inbound_mutex;
    std::vector<std::unique_ptr<TransportLink>> inbound;

    // Accepts as `as`; normally the server relay
    void serve(const TestRelay& as) {
        dialer.listen(SERVER_ADDRESS, [this, &as](std::unique_ptr<net::Stream> stream) {
            auto link = std::make_unique<TransportLink>(
                fast_link_config(), credentials(as, server_difficulty), std::move(stream),
                replay, server_events);
            link->start();
            std::lock_guard<std::mutex> lock(inbound_mutex);
            inbound.push_back(std::move(link));
        });
    }

    std::unique_ptr<TransportLink> dial(TransportLink::Config config = fast_link_config()) {
        auto link = std::make_unique<TransportLink>(config, credentials(client, 0), server.identity,
                                                    dialer, client_events);
        link->start();
        return link;
    }

    TransportLink* first_inbound() {
        std::lock_guard<std::mutex> lock(inbound_mutex);
        return inbound.empty() ? nullptr : inbound.front().get();
    }

    ~LinkPair() {
        std::lock_guard<std::mutex> lock(inbound_mutex);
        for (auto& link : inbound) {
            link->close();
        }
    }
};

core::SealedPacket packet_for(const TestRelay& relay) {
    std::vector<uint8_t> payload{'h', 'i'};
    auto packet = core::encode({relay.identity}, payload);
    REQUIRE(packet.has_value());
    return *packet;
}

}  // namespace

TEST_CASE("Reconnect backoff doubles up to the cap", "[transport][unit]") {
    using ms = std::chrono::milliseconds;
    CHECK(backoff_delay(ms(100), ms(1000), 1) == ms(100));
    CHECK(backoff_delay(ms(100), ms(1000), 2) == ms(200));
    CHECK(backoff_delay(ms(100), ms(1000), 3) == ms(400));
    CHECK(backoff_delay(ms(100), ms(1000), 5) == ms(1000));
    CHECK(backoff_delay(ms(100), ms(1000), 500) == ms(1000));
}

TEST_CASE("An outbound link comes up and carries packets", "[transport][unit]") {
    LinkPair pair;
    pair.serve(pair.server);
    auto link = pair.dial();

    REQUIRE(wait_until([&] { return link->is_up(); }));
    REQUIRE(wait_until([&] { return pair.first_inbound() && pair.first_inbound()->is_up(); }));
    auto* inbound = pair.first_inbound();

    CHECK(link->peer_id() == pair.server.id());
    CHECK(inbound->peer_id() == pair.client.id());
    CHECK(link->outbound());
    CHECK_FALSE(inbound->outbound());

    auto hellos = pair.client_events.hellos();
    REQUIRE(hellos.size() == 1);
    CHECK(hellos[0].difficulty_bits == 4);

    SECTION("Packets arrive with a ticket for the receiver's scope") {
        auto packet = packet_for(pair.server);
        auto queued = link->enqueue({.packet = packet, .priority = policy::Priority::Interactive});
        REQUIRE(queued.has_value());

        REQUIRE(wait_until([&] { return !pair.server_events.frames(FrameType::Packet).empty(); }));
        auto frame = pair.server_events.frames(FrameType::Packet).front();
        REQUIRE(frame.body.size() == policy::AdmissionTicket::WIRE_LEN + core::PACKET_LEN);

        util::BinaryReader r(frame.body);
        auto solution = r.read_u64();
        REQUIRE(solution.has_value());
        auto sealed = core::SealedPacket::parse(
            std::span<const uint8_t>(frame.body).subspan(policy::AdmissionTicket::WIRE_LEN));
        REQUIRE(sealed.has_value());
        CHECK(*sealed == packet);

        auto work = policy::ticket_work(inbound->inbound_scope(), sealed->nonce(),
                                        policy::AdmissionTicket{*solution});
        REQUIRE(work.has_value());
        CHECK(*work >= 4);
        CHECK(wait_until([&] { return link->status().packets_sent == 1; }));
        CHECK(wait_until([&] { return pair.client_events.sent_bytes() == core::PACKET_LEN; }));
        CHECK(pair.server_events.sent_bytes() == 0);
    }

    SECTION("Control frames go out directly") {
        std::vector<uint8_t> body{1, 2, 3};
        REQUIRE(link->send_frame(FrameType::Gossip, body).has_value());
        REQUIRE(wait_until([&] { return !pair.server_events.frames(FrameType::Gossip).empty(); }));
        CHECK(pair.server_events.frames(FrameType::Gossip).front().body == body);
    }

    SECTION("Closing the outbound side takes the inbound side down") {
        link->close();
        CHECK(link->state() == LinkState::Closed);
        REQUIRE(wait_until([&] { return inbound->state() == LinkState::Down; }));
        auto downs = pair.server_events.downs();
        REQUIRE(downs.size() == 1);
        CHECK(downs[0].failures == 1);
        // A local close is not reported as a failure
        CHECK(pair.client_events.downs().empty());
    }

    link->close();
}

TEST_CASE("Packets are refused unless the link is up", "[transport][unit]") {
    LinkPair pair;
    auto link = std::make_unique<TransportLink>(fast_link_config(), credentials(pair.client, 0),
                                                pair.server.identity, pair.dialer,
                                                pair.client_events);
    auto r = link->enqueue({.packet = packet_for(pair.server)});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::MixnetError::LinkDown);
    CHECK(link->state() == LinkState::Connecting);
}

TEST_CASE("An outbound link rides out transient dial failures", "[transport][unit]") {
    LinkPair pair;
    pair.serve(pair.server);
    pair.dialer.fail_next(2);

    auto link = pair.dial(fast_link_config(5));
    REQUIRE(wait_until([&] { return link->is_up(); }));
    CHECK(pair.dialer.dials() == 3);
    CHECK(link->failures() == 0);
    CHECK(pair.client_events.downs().empty());
    link->close();
}

TEST_CASE("An outbound link goes down after max_failures", "[transport][unit]") {
    LinkPair pair;  // nobody listens

    auto link = pair.dial(fast_link_config(3));
    REQUIRE(wait_until([&] { return link->state() == LinkState::Down; }));
    CHECK(pair.dialer.dials() == 3);

    auto downs = pair.client_events.downs();
    REQUIRE(downs.size() == 1);
    CHECK(downs[0].reason == core::MixnetError::LinkDown);
    CHECK(downs[0].failures == 3);
    CHECK(link->finished());

    auto r = link->enqueue({.packet = packet_for(pair.server)});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::MixnetError::LinkDown);
}

TEST_CASE("A severed link reconnects when the peer returns", "[transport][unit]") {
    LinkPair pair;
    pair.serve(pair.server);
    auto link = pair.dial(fast_link_config(20));
    REQUIRE(wait_until([&] { return link->is_up(); }));

    pair.dialer.sever(SERVER_ADDRESS);
    REQUIRE(wait_until([&] { return !link->is_up(); }));
    pair.dialer.restore(SERVER_ADDRESS);

    REQUIRE(wait_until([&] { return link->is_up(); }));
    CHECK(pair.client_events.hellos().size() == 2);
    CHECK(pair.client_events.downs().empty());
    link->close();
}

TEST_CASE("A link that reaches ourselves is refused as a handshake failure",
          "[transport][unit]") {
    LinkPair pair;
    // The listener answers with the dialing relay's own keys
    pair.serve(pair.client);
    auto self_at_server = test::make_identity(pair.client.keys, {SERVER_ADDRESS});
    auto link = std::make_unique<TransportLink>(fast_link_config(1), credentials(pair.client, 0),
                                                self_at_server, pair.dialer, pair.client_events);
    link->start();

    REQUIRE(wait_until([&] { return link->state() == LinkState::Down; }));
    auto downs = pair.client_events.downs();
    REQUIRE(downs.size() == 1);
    CHECK(downs[0].reason == core::MixnetError::HandshakeFailed);
    CHECK(pair.client_events.hellos().empty());
}

TEST_CASE("Link state names", "[transport][unit]") {
    CHECK(std::string(link_state_name(LinkState::Up)) == "up");
    CHECK(std::string(link_state_name(LinkState::Down)) == "down");
}
