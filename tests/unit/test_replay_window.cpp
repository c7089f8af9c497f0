#include <catch2/catch_all.hpp>
#include "mixnet/policy/replay_window.hpp"

using namespace mixnet;
using namespace mixnet::policy;

namespace {

core::PacketNonce nonce_of(uint32_t n) {
    core::PacketNonce nonce{};
    nonce[12] = static_cast<uint8_t>(n >> 24);
    nonce[13] = static_cast<uint8_t>(n >> 16);
    nonce[14] = static_cast<uint8_t>(n >> 8);
    nonce[15] = static_cast<uint8_t>(n);
    nonce[4] = 0x5a;
    return nonce;
}

constexpr uint32_t E = 1'000'000;

}  // namespace

TEST_CASE("Replay window rejects a nonce it has seen", "[replay][unit]") {
    ReplayWindow window({.capacity = 16, .slack = 1});

    CHECK(window.check_and_insert(nonce_of(1), E, E) == ReplayVerdict::Fresh);
    CHECK(window.check_and_insert(nonce_of(1), E, E) == ReplayVerdict::Replayed);
    CHECK(window.check_and_insert(nonce_of(2), E, E) == ReplayVerdict::Fresh);
    CHECK(window.contains(nonce_of(1), E));
    CHECK_FALSE(window.contains(nonce_of(3), E));
    CHECK(window.size() == 2);

    // The same random part under another epoch is a different packet
    CHECK(window.check_and_insert(nonce_of(1), E + 1, E) == ReplayVerdict::Fresh);
}

TEST_CASE("Replay window never accepts a nonce twice at any later time", "[replay][unit]") {
    ReplayWindow window({.capacity = 16, .slack = 1});
    REQUIRE(window.check_and_insert(nonce_of(7), E, E) == ReplayVerdict::Fresh);

    // Walk the clock far past the point where the nonce could be accepted,
    // replaying at every step
    for (uint32_t now = E; now < E + 100; ++now) {
        INFO("current epoch " << now);
        auto verdict = window.check_and_insert(nonce_of(7), E, now);
        CHECK(verdict != ReplayVerdict::Fresh);
        if (now <= E + 1) {
            CHECK(verdict == ReplayVerdict::Replayed);
        } else {
            CHECK(verdict == ReplayVerdict::Expired);
        }
    }
}

TEST_CASE("Replay window only accepts epochs near the current one", "[replay][unit]") {
    ReplayWindow window({.capacity = 16, .slack = 1});

    CHECK(window.check_and_insert(nonce_of(1), E - 1, E) == ReplayVerdict::Fresh);
    CHECK(window.check_and_insert(nonce_of(2), E + 1, E) == ReplayVerdict::Fresh);
    CHECK(window.check_and_insert(nonce_of(3), E - 2, E) == ReplayVerdict::Expired);
    CHECK(window.check_and_insert(nonce_of(4), E + 2, E) == ReplayVerdict::Expired);
    CHECK(window.size() == 2);

    SECTION("Edges of the epoch range do not wrap") {
        ReplayWindow edge({.capacity = 4, .slack = 1});
        CHECK(edge.check_and_insert(nonce_of(1), 0, 0) == ReplayVerdict::Fresh);
        CHECK(edge.check_and_insert(nonce_of(2), UINT32_MAX, 0) == ReplayVerdict::Expired);
        CHECK(edge.check_and_insert(nonce_of(3), 0, UINT32_MAX) == ReplayVerdict::Expired);
    }
}

TEST_CASE("A full epoch refuses new nonces instead of forgetting old ones", "[replay][unit]") {
    ReplayWindow window({.capacity = 4, .slack = 1});
    for (uint32_t i = 0; i < 4; ++i) {
        REQUIRE(window.check_and_insert(nonce_of(i), E, E) == ReplayVerdict::Fresh);
    }
    CHECK(window.check_and_insert(nonce_of(4), E, E) == ReplayVerdict::Full);
    for (uint32_t i = 0; i < 4; ++i) {
        CHECK(window.check_and_insert(nonce_of(i), E, E) == ReplayVerdict::Replayed);
    }
    // Neighbouring epochs have their own room
    CHECK(window.check_and_insert(nonce_of(4), E + 1, E) == ReplayVerdict::Fresh);
}

TEST_CASE("Replay window memory stays bounded", "[replay][unit]") {
    ReplayWindow window({.capacity = 100, .slack = 1});
    for (uint32_t now = E; now < E + 50; ++now) {
        for (uint32_t i = 0; i < 100; ++i) {
            REQUIRE(window.check_and_insert(nonce_of(i), now, now) == ReplayVerdict::Fresh);
        }
        CHECK(window.buckets() <= 3);
        CHECK(window.size() <= 300);
    }

    window.expire(E + 1000);
    CHECK(window.empty());
    CHECK(window.buckets() == 0);
}

TEST_CASE("Sequence window rejects repeated and stale counters", "[replay][unit]") {
    SequenceWindow window;
    CHECK(window.check_and_insert(0));
    CHECK_FALSE(window.check_and_insert(0));
    CHECK(window.check_and_insert(5));
    CHECK(window.check_and_insert(3));
    CHECK_FALSE(window.check_and_insert(3));
    CHECK(window.highest() == 5);

    // Jumping ahead by the full width leaves everything older stale
    CHECK(window.check_and_insert(5 + SequenceWindow::WIDTH));
    CHECK_FALSE(window.check_and_insert(4));
    CHECK_FALSE(window.check_and_insert(5));
    CHECK(window.check_and_insert(6 + 1));
    CHECK_FALSE(window.check_and_insert(6 + 1));
}
