#include <catch2/catch_all.hpp>
#include "mixnet/policy/scheduler.hpp"
#include "../fixtures/node_fixtures.hpp"
#include <thread>

using namespace mixnet;
using namespace mixnet::policy;

namespace {

// A sealed packet whose first body byte tags it
core::SealedPacket packet_tagged(uint8_t tag) {
    static test::TestRelay relay;
    std::vector<uint8_t> payload{tag};
    auto packet = core::encode({relay.identity}, payload);
    REQUIRE(packet.has_value());
    return *packet;
}

QueuedPacket item(Priority p, uint64_t flow) {
    static const auto base = packet_tagged(0);
    return QueuedPacket{.packet = base, .priority = p, .flow_id = flow};
}

}  // namespace

TEST_CASE("Strict priority serves lower levels first, FIFO within", "[scheduler][unit]") {
    OutboundQueue queue({.capacity = 16, .policy = SchedulingPolicy::StrictPriority});

    REQUIRE(queue.push(item(Priority::Bulk, 1)).has_value());
    REQUIRE(queue.push(item(Priority::Background, 2)).has_value());
    REQUIRE(queue.push(item(Priority::Interactive, 3)).has_value());
    REQUIRE(queue.push(item(Priority::Control, 4)).has_value());
    REQUIRE(queue.push(item(Priority::Interactive, 5)).has_value());

    std::vector<uint64_t> order;
    while (auto p = queue.try_pop()) {
        order.push_back(p->flow_id);
    }
    CHECK(order == std::vector<uint64_t>{4, 3, 5, 1, 2});
    CHECK(queue.size() == 0);
}

TEST_CASE("Weighted fair queueing shares 8:4:2:1", "[scheduler][unit]") {
    OutboundQueue queue({.capacity = 1000, .policy = SchedulingPolicy::WeightedFair});
    for (int i = 0; i < 100; ++i) {
        for (auto p : {Priority::Control, Priority::Interactive, Priority::Bulk, Priority::Background}) {
            REQUIRE(queue.push(item(p, static_cast<uint64_t>(p))).has_value());
        }
    }

    std::array<int, PRIORITY_LEVELS> served{};
    for (int i = 0; i < 150; ++i) {
        auto p = queue.try_pop();
        REQUIRE(p.has_value());
        ++served[p->flow_id];
    }
    CHECK(served[0] == 80);
    CHECK(served[1] == 40);
    CHECK(served[2] == 20);
    CHECK(served[3] == 10);

    SECTION("Lower levels are never starved") {
        OutboundQueue fresh({.capacity = 100, .policy = SchedulingPolicy::WeightedFair});
        for (int i = 0; i < 50; ++i) {
            REQUIRE(fresh.push(item(Priority::Control, 0)).has_value());
        }
        REQUIRE(fresh.push(item(Priority::Background, 3)).has_value());
        bool background_served = false;
        for (int i = 0; i < 16 && !background_served; ++i) {
            auto p = fresh.try_pop();
            REQUIRE(p.has_value());
            background_served = p->flow_id == 3;
        }
        CHECK(background_served);
    }
}

TEST_CASE("A full queue sheds the lowest priority", "[scheduler][unit]") {
    OutboundQueue queue({.capacity = 3});

    REQUIRE(queue.push(item(Priority::Background, 1)).has_value());
    REQUIRE(queue.push(item(Priority::Background, 2)).has_value());
    REQUIRE(queue.push(item(Priority::Bulk, 3)).has_value());

    SECTION("A higher arrival displaces the newest of the lowest level") {
        auto r = queue.push(item(Priority::Interactive, 4));
        REQUIRE(r.has_value());
        REQUIRE(r->has_value());
        CHECK((*r)->flow_id == 2);
        CHECK(queue.size() == 3);
        CHECK(queue.shed_count() == 1);
        CHECK(queue.size(Priority::Background) == 1);
    }

    SECTION("An arrival at the lowest level is refused") {
        auto r = queue.push(item(Priority::Background, 5));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == core::MixnetError::QueueOverflow);
        CHECK(queue.refused_count() == 1);
        CHECK(queue.size() == 3);
    }

    SECTION("Control traffic is refused only when nothing lower remains") {
        for (uint64_t f = 10; f < 13; ++f) {
            auto r = queue.push(item(Priority::Control, f));
            REQUIRE(r.has_value());
            CHECK(r->has_value());
        }
        auto r = queue.push(item(Priority::Control, 13));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == core::MixnetError::QueueOverflow);
        CHECK(queue.size(Priority::Control) == 3);
    }

    CHECK(queue.size() <= queue.capacity());
    CHECK(queue.bytes() == queue.size() * core::PACKET_LEN);
}

TEST_CASE("Closing the queue", "[scheduler][unit]") {
    OutboundQueue queue({.capacity = 8});
    REQUIRE(queue.push(item(Priority::Bulk, 1)).has_value());

    SECTION("Pushes fail with LinkDown, queued packets can still drain") {
        queue.close();
        CHECK(queue.closed());
        auto r = queue.push(item(Priority::Bulk, 2));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == core::MixnetError::LinkDown);
        CHECK(queue.try_pop().has_value());

        queue.reopen();
        CHECK(queue.push(item(Priority::Bulk, 3)).has_value());
    }

    SECTION("Close wakes a blocked consumer") {
        REQUIRE(queue.try_pop().has_value());
        std::jthread closer([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            queue.close();
        });
        auto start = std::chrono::steady_clock::now();
        auto p = queue.pop(std::chrono::seconds(5));
        CHECK_FALSE(p.has_value());
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(4));
    }

    SECTION("Clear drops everything") {
        REQUIRE(queue.push(item(Priority::Control, 2)).has_value());
        CHECK(queue.clear() == 2);
        CHECK(queue.size() == 0);
    }
}

TEST_CASE("Pop waits for a producer", "[scheduler][unit]") {
    OutboundQueue queue({.capacity = 8});
    std::jthread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        (void)queue.push(item(Priority::Interactive, 9));
    });
    auto p = queue.pop(std::chrono::seconds(5));
    REQUIRE(p.has_value());
    CHECK(p->flow_id == 9);

    CHECK_FALSE(queue.pop(std::chrono::milliseconds(10)).has_value());
}

TEST_CASE("Scheduling policy names", "[scheduler][unit]") {
    CHECK(parse_scheduling_policy("strict") == SchedulingPolicy::StrictPriority);
    CHECK(parse_scheduling_policy("weighted") == SchedulingPolicy::WeightedFair);
    CHECK_FALSE(parse_scheduling_policy("fifo").has_value());
}
