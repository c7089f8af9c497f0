#include <catch2/catch_all.hpp>
#include "mixnet/core/forwarding.hpp"
#include "../fixtures/node_fixtures.hpp"
#include "../mocks/mock_router.hpp"
#include <string>
#include <vector>

using namespace mixnet;
using namespace mixnet::core;
using mixnet::test::CollectingSink;
using mixnet::test::MockRouter;
using mixnet::test::RecordingSink;
using mixnet::test::TestRelay;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return {s.begin(), s.end()};
}

ForwardingEngine::Config engine_config(unsigned difficulty, uint64_t rate = 0, uint64_t burst = 64) {
    return ForwardingEngine::Config{
        .replay = {.capacity = 1024, .slack = 1},
        .admission = {.difficulty_bits = difficulty, .rate = rate, .burst = burst},
        .relay_priority = policy::Priority::Bulk,
    };
}

// The relay under test (b) with an upstream sender (a) and a next hop (c)
struct EngineFixture {
    TestRelay a, b, c;
    MockRouter router;
    NodeStats stats;
    RecordingSink events;
    CollectingSink delivered;
    ForwardingEngine engine;

    explicit EngineFixture(ForwardingEngine::Config config = engine_config(0),
                           policy::OutboundQueue::Config queue = {})
        : router(queue)
        , engine(b.keys.onion, b.id(), config, router, stats, events) {
        engine.set_delivery_sink(&delivered);
        engine.register_link(a.id());
    }

    [[nodiscard]] policy::ScopeId scope() const { return policy::scope_for_identity(a.id()); }

    [[nodiscard]] InboundPacket inbound(const SealedPacket& packet,
                                        policy::AdmissionTicket ticket = {}) const {
        return InboundPacket{
            .ingress = a.id(),
            .scope = scope(),
            .ticket = ticket,
            .bytes = packet.bytes(),
        };
    }

    [[nodiscard]] SealedPacket via_b_to_c(const std::string& text) const {
        auto packet = encode({b.identity, c.identity}, bytes_of(text));
        REQUIRE(packet.has_value());
        return *packet;
    }
};

policy::AdmissionTicket weak_ticket(const policy::ScopeId& scope, const PacketNonce& nonce,
                                    unsigned below) {
    for (uint64_t s = 0;; ++s) {
        auto work = policy::ticket_work(scope, nonce, {s});
        REQUIRE(work.has_value());
        if (*work < below) return {s};
    }
}

}  // namespace

TEST_CASE("Forwarding a packet to its next hop", "[forwarding][unit]") {
    EngineFixture f;
    f.router.up(f.c.id());

    auto packet = f.via_b_to_c("onward");
    auto r = f.engine.process(f.inbound(packet));
    REQUIRE(r.has_value());
    CHECK(*r == ForwardOutcome::Forwarded);

    auto queued = f.router.drain(f.c.id());
    REQUIRE(queued.size() == 1);
    CHECK(queued[0].priority == policy::Priority::Bulk);

    // The forwarded packet is the next layer, readable only by c
    auto d = peel(queued[0].packet, f.c.keys.onion);
    REQUIRE(d.has_value());
    auto* deliver = std::get_if<Deliver>(&*d);
    REQUIRE(deliver != nullptr);
    CHECK(deliver->payload == bytes_of("onward"));

    auto snap = f.stats.snapshot();
    CHECK(snap.packets_received == 1);
    CHECK(snap.packets_forwarded == 1);
    CHECK(snap.total_drops() == 0);
    CHECK(f.events.size() == 0);
}

TEST_CASE("Delivering at the final hop", "[forwarding][unit]") {
    EngineFixture f;
    auto packet = encode({f.b.identity}, bytes_of("for b"));
    REQUIRE(packet.has_value());

    SECTION("Payload goes to the delivery sink") {
        auto r = f.engine.process(f.inbound(*packet));
        REQUIRE(r.has_value());
        CHECK(*r == ForwardOutcome::Delivered);
        REQUIRE(f.delivered.payloads().size() == 1);
        CHECK(f.delivered.payloads()[0] == bytes_of("for b"));
        CHECK(f.stats.snapshot().packets_delivered == 1);
    }

    SECTION("Without a sink the packet is dropped") {
        f.engine.set_delivery_sink(nullptr);
        auto r = f.engine.process(f.inbound(*packet));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::CircuitClosed);
    }
}

TEST_CASE("Replayed packets are dropped", "[forwarding][unit]") {
    EngineFixture f;
    f.router.up(f.c.id());
    auto packet = f.via_b_to_c("once");

    REQUIRE(f.engine.process(f.inbound(packet)).has_value());
    auto again = f.engine.process(f.inbound(packet));
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error() == MixnetError::ReplayDetected);

    CHECK(f.router.drain(f.c.id()).size() == 1);
    CHECK(f.stats.drops(MixnetError::ReplayDetected) == 1);

    auto dropped = f.events.of<PacketDropped>();
    REQUIRE(dropped.size() == 1);
    CHECK(dropped[0].reason == MixnetError::ReplayDetected);
    CHECK(dropped[0].link == f.a.id());
}

TEST_CASE("Packets that fail a pipeline stage are dropped and reported", "[forwarding][unit]") {
    SECTION("Malformed bytes") {
        EngineFixture f;
        std::vector<uint8_t> junk(100, 0x42);
        InboundPacket in{.ingress = f.a.id(), .scope = f.scope(), .ticket = {}, .bytes = junk};
        auto r = f.engine.process(in);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::MalformedPacket);
        CHECK(f.events.count<PacketDropped>() == 1);
    }

    SECTION("Tampered onion") {
        EngineFixture f;
        f.router.up(f.c.id());
        auto packet = f.via_b_to_c("tamper");
        packet.mutable_bytes()[layout::BETA + 3] ^= 0x10;
        auto r = f.engine.process(f.inbound(packet));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::DecryptionError);
        CHECK(f.router.drain(f.c.id()).empty());
    }

    SECTION("Insufficient admission work") {
        EngineFixture f(engine_config(12));
        f.router.up(f.c.id());
        auto packet = f.via_b_to_c("cheap");
        auto ticket = weak_ticket(f.scope(), packet.nonce(), 12);
        auto r = f.engine.process(f.inbound(packet, ticket));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::AdmissionDenied);
        CHECK(f.engine.admission().denied() == 1);
    }

    SECTION("Sufficient admission work") {
        EngineFixture f(engine_config(6));
        f.router.up(f.c.id());
        auto packet = f.via_b_to_c("paid");
        auto ticket = policy::mint_ticket(f.scope(), packet.nonce(), 6);
        REQUIRE(ticket.has_value());
        CHECK(f.engine.process(f.inbound(packet, *ticket)).has_value());
    }

    SECTION("Next hop has no link") {
        EngineFixture f;
        auto packet = f.via_b_to_c("nowhere");
        auto r = f.engine.process(f.inbound(packet));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::LinkDown);
        auto dropped = f.events.of<PacketDropped>();
        REQUIRE(dropped.size() == 1);
        CHECK(dropped[0].link == f.c.id());
    }
}

TEST_CASE("A flooded relay sheds load without unbounded queueing", "[forwarding][unit]") {
    EngineFixture f(engine_config(0, 10, 5), {.capacity = 4});
    f.router.up(f.c.id());
    auto now = policy::Clock::now();

    uint64_t last_denied = 0;
    for (int i = 0; i < 50; ++i) {
        auto packet = f.via_b_to_c("flood " + std::to_string(i));
        (void)f.engine.process(f.inbound(packet), now);

        auto denied = f.stats.drops(MixnetError::AdmissionDenied);
        CHECK(denied >= last_denied);
        last_denied = denied;
        CHECK(f.router.queue(f.c.id())->size() <= 4);
    }

    // Burst of 5 admitted, one of which did not fit the queue
    CHECK(f.stats.drops(MixnetError::AdmissionDenied) == 45);
    CHECK(f.stats.drops(MixnetError::QueueOverflow) == 1);
    CHECK(f.router.queue(f.c.id())->size() == 4);
    CHECK(f.router.queue(f.c.id())->refused_count() == 1);
}

TEST_CASE("Locally built packets are queued to their first hop", "[forwarding][unit]") {
    EngineFixture f;
    auto packet = f.via_b_to_c("local");

    SECTION("First hop up") {
        f.router.up(f.a.id());
        REQUIRE(f.engine.send_local(f.a.id(), packet, policy::Priority::Interactive, 77).has_value());
        auto queued = f.router.drain(f.a.id());
        REQUIRE(queued.size() == 1);
        CHECK(queued[0].priority == policy::Priority::Interactive);
        CHECK(queued[0].flow_id == 77);
    }

    SECTION("First hop down") {
        auto r = f.engine.send_local(f.a.id(), packet, policy::Priority::Interactive);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::LinkDown);
    }

    SECTION("A displaced packet counts as an overflow drop") {
        EngineFixture small(engine_config(0), {.capacity = 1});
        small.router.up(small.a.id());
        REQUIRE(small.engine.send_local(small.a.id(), packet, policy::Priority::Background).has_value());
        REQUIRE(small.engine.send_local(small.a.id(), packet, policy::Priority::Control).has_value());
        CHECK(small.stats.drops(MixnetError::QueueOverflow) == 1);
        CHECK(small.router.queue(small.a.id())->size(policy::Priority::Control) == 1);
    }

    SECTION("Sending to ourselves is refused") {
        auto r = f.engine.send_local(f.b.id(), packet, policy::Priority::Bulk);
        REQUIRE_FALSE(r.has_value());
    }
}

TEST_CASE("Replay state outlives a reconnect of the link", "[forwarding][unit]") {
    EngineFixture f;
    f.router.up(f.c.id());
    auto wall = WallClock::now();
    auto packet = f.via_b_to_c("again later");
    REQUIRE(f.engine.process(f.inbound(packet), policy::Clock::now(), wall).has_value());

    f.engine.unregister_link(f.a.id(), f.scope(), wall);
    CHECK(f.engine.replay_shards() == 1);
    f.engine.register_link(f.a.id());

    auto r = f.engine.process(f.inbound(packet), policy::Clock::now(), wall);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == MixnetError::ReplayDetected);
    CHECK(f.router.drain(f.c.id()).size() == 1);

    SECTION("A retired shard is dropped once its nonces expire") {
        f.engine.unregister_link(f.a.id(), f.scope(), wall);
        CHECK(f.engine.replay_shards() == 1);
        f.engine.unregister_link(f.a.id(), f.scope(), wall + std::chrono::minutes(10));
        CHECK(f.engine.replay_shards() == 0);
    }
}

TEST_CASE("A captured packet is never forwarded twice", "[forwarding][unit]") {
    EngineFixture f;
    f.router.up(f.c.id());
    auto wall = WallClock::now();
    auto packet = f.via_b_to_c("captured");

    REQUIRE(f.engine.process(f.inbound(packet), policy::Clock::now(), wall).has_value());
    REQUIRE(f.router.drain(f.c.id()).size() == 1);

    // Replay it at increasing delays, well beyond any cache lifetime
    for (auto delay : {std::chrono::seconds(1), std::chrono::seconds(59),
                       std::chrono::seconds(121), std::chrono::seconds(310),
                       std::chrono::seconds(621), std::chrono::seconds(86400)}) {
        INFO("replayed after " << delay.count() << "s");
        auto r = f.engine.process(f.inbound(packet), policy::Clock::now() + delay, wall + delay);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::ReplayDetected);
    }
    CHECK(f.router.drain(f.c.id()).empty());
    CHECK(f.stats.snapshot().packets_forwarded == 1);

    // A packet built at the later time is still accepted
    auto later = wall + std::chrono::hours(24);
    auto fresh = encode({f.b.identity, f.c.identity}, bytes_of("fresh"), later);
    REQUIRE(fresh.has_value());
    auto r = f.engine.process(f.inbound(*fresh), policy::Clock::now(), later);
    REQUIRE(r.has_value());
    CHECK(*r == ForwardOutcome::Forwarded);
}

TEST_CASE("Rewriting the epoch of a captured packet breaks its MAC", "[forwarding][unit]") {
    EngineFixture f;
    f.router.up(f.c.id());
    auto wall = WallClock::now();
    auto packet = f.via_b_to_c("captured");
    REQUIRE(f.engine.process(f.inbound(packet), policy::Clock::now(), wall).has_value());

    auto later = wall + std::chrono::minutes(30);
    std::vector<uint8_t> bytes(packet.bytes().begin(), packet.bytes().end());
    const uint32_t epoch = packet_epoch(later);
    for (size_t i = 0; i < NONCE_EPOCH_LEN; ++i) {
        bytes[layout::NONCE + i] = static_cast<uint8_t>(epoch >> (24 - 8 * i));
    }
    InboundPacket in{.ingress = f.a.id(), .scope = f.scope(), .ticket = {}, .bytes = bytes};
    auto r = f.engine.process(in, policy::Clock::now(), later);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == MixnetError::DecryptionError);
    CHECK(f.router.drain(f.c.id()).size() == 1);
}

TEST_CASE("A neighbour over its debt limit gets nothing relayed", "[forwarding][unit]") {
    auto config = engine_config(0);
    config.debt.limit = 2;
    EngineFixture f(config);
    f.router.up(f.a.id());
    f.router.up(f.c.id());

    REQUIRE(f.engine.process(f.inbound(f.via_b_to_c("one"))).has_value());
    REQUIRE(f.engine.process(f.inbound(f.via_b_to_c("two"))).has_value());
    auto refused = f.engine.process(f.inbound(f.via_b_to_c("three")));
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error() == MixnetError::AdmissionDenied);
    CHECK(f.router.drain(f.c.id()).size() == 2);

    auto owed = f.engine.debts().balance(f.a.id());
    REQUIRE(owed.has_value());
    CHECK(owed->incoming == 2);
    CHECK(owed->outgoing == 0);
    CHECK(owed->net() == 2);
    auto owing = f.engine.debts().balance(f.c.id());
    REQUIRE(owing.has_value());
    CHECK(owing->net() == -2);

    // Relaying towards a on behalf of c pays a's debt down
    auto toward_a = encode({f.b.identity, f.a.identity}, bytes_of("back"));
    REQUIRE(toward_a.has_value());
    auto r = f.engine.process(InboundPacket{
        .ingress = f.c.id(),
        .scope = policy::scope_for_identity(f.c.id()),
        .ticket = {},
        .bytes = toward_a->bytes(),
    });
    REQUIRE(r.has_value());
    CHECK(*r == ForwardOutcome::Forwarded);
    CHECK(f.engine.debts().balance(f.a.id())->net() == 1);

    auto again = f.engine.process(f.inbound(f.via_b_to_c("four")));
    REQUIRE(again.has_value());
    CHECK(*again == ForwardOutcome::Forwarded);
}
