#include <catch2/catch_all.hpp>
#include "mixnet/core/events.hpp"
#include "mixnet/core/stats.hpp"
#include "../fixtures/node_fixtures.hpp"
#include <memory>

using namespace mixnet::core;
using mixnet::test::RecordingSink;
using mixnet::test::TestRelay;

TEST_CASE("Event bus fans out to every sink", "[events][unit]") {
    EventBus bus;
    auto first = std::make_shared<RecordingSink>();
    auto second = std::make_shared<RecordingSink>();
    bus.subscribe(first);
    bus.subscribe(second);
    bus.subscribe(nullptr);
    CHECK(bus.sink_count() == 2);

    TestRelay peer;
    bus.emit(LinkUp{.peer = peer.id(), .address = "127.0.0.1:7400"});
    CHECK(first->count<LinkUp>() == 1);
    CHECK(second->count<LinkUp>() == 1);

    SECTION("Unsubscribed sinks stop receiving") {
        bus.unsubscribe(first);
        CHECK(bus.sink_count() == 1);
        bus.emit(CircuitClosed{.circuit_id = 9});
        CHECK(first->size() == 1);
        CHECK(second->size() == 2);
    }
}

TEST_CASE("Events describe themselves", "[events][unit]") {
    TestRelay peer;
    auto hex = peer.id().short_hex();

    CHECK(describe(LinkUp{.peer = peer.id(), .address = "10.0.0.1:1"}) ==
          "link up: " + hex + " at 10.0.0.1:1");
    CHECK(describe(LinkDown{.peer = peer.id(), .reason = MixnetError::LinkDown, .failures = 3}) ==
          "link down: " + hex + " (LinkDown, 3 failures)");
    CHECK(describe(CircuitOpened{.circuit_id = 0xab, .remote = peer.id(), .initiator = true}) ==
          "circuit 00000000000000ab opened to " + hex);
    CHECK(describe(CircuitClosed{.circuit_id = 1}) == "circuit 0000000000000001 closed");
    CHECK(describe(CircuitClosed{.circuit_id = 1, .error = MixnetError::RetransmitExhausted}) ==
          "circuit 0000000000000001 closed: RetransmitExhausted");
    CHECK(describe(PacketDropped{.reason = MixnetError::ReplayDetected}) ==
          "packet dropped: ReplayDetected");
    CHECK(describe(PacketDropped{.reason = MixnetError::ReplayDetected, .link = peer.id()}) ==
          "packet dropped: ReplayDetected on " + hex);
}

TEST_CASE("Stats sink counts lifecycle events", "[events][stats][unit]") {
    NodeStats stats;
    StatsEventSink sink(stats);
    TestRelay peer;

    sink.on_event(LinkUp{.peer = peer.id()});
    sink.on_event(LinkUp{.peer = peer.id()});
    sink.on_event(LinkDown{.peer = peer.id()});
    sink.on_event(CircuitOpened{.circuit_id = 1, .remote = peer.id()});
    sink.on_event(CircuitClosed{.circuit_id = 1});
    sink.on_event(PacketDropped{.reason = MixnetError::MalformedPacket});

    auto snap = stats.snapshot();
    CHECK(snap.links_up == 2);
    CHECK(snap.links_down == 1);
    CHECK(snap.circuits_opened == 1);
    CHECK(snap.circuits_closed == 1);
    // Drops are counted where they happen, not from events
    CHECK(snap.total_drops() == 0);
}

TEST_CASE("Node counters", "[stats][unit]") {
    NodeStats stats;
    stats.record_received(2048);
    stats.record_received(2048);
    stats.record_forwarded();
    stats.record_sent(2056);
    stats.record_drop(MixnetError::QueueOverflow);
    stats.record_drop(MixnetError::QueueOverflow);
    stats.record_drop(MixnetError::AdmissionDenied);

    auto snap = stats.snapshot();
    CHECK(snap.packets_received == 2);
    CHECK(snap.bytes_in == 4096);
    CHECK(snap.packets_forwarded == 1);
    CHECK(snap.bytes_out == 2056);
    CHECK(snap.drops_for(MixnetError::QueueOverflow) == 2);
    CHECK(stats.drops(MixnetError::AdmissionDenied) == 1);
    CHECK(snap.total_drops() == 3);

    auto text = snap.to_string();
    CHECK(text.find("received=2") != std::string::npos);
    CHECK(text.find("in=4.00 KB") != std::string::npos);
    CHECK(text.find("QueueOverflow=2") != std::string::npos);
    CHECK(text.find("ReplayDetected") == std::string::npos);
}

TEST_CASE("Error names cover the taxonomy", "[errors][unit]") {
    for (size_t i = 0; i < MIXNET_ERROR_COUNT; ++i) {
        std::string name = mixnet_error_name(static_cast<MixnetError>(i));
        CHECK_FALSE(name.empty());
        CHECK(name != "Unknown");
    }
}
