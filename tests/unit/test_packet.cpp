#include <catch2/catch_all.hpp>
#include "mixnet/core/packet.hpp"
#include "../fixtures/node_fixtures.hpp"
#include <string>
#include <vector>

using namespace mixnet;
using namespace mixnet::core;
using mixnet::test::TestRelay;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return {s.begin(), s.end()};
}

// Peels through every relay of the path; returns the final payload
std::vector<uint8_t> peel_all(const std::vector<TestRelay*>& path, SealedPacket packet) {
    for (size_t i = 0; i < path.size(); ++i) {
        auto d = peel(packet, path[i]->keys.onion);
        REQUIRE(d.has_value());
        if (i + 1 < path.size()) {
            auto* fwd = std::get_if<Forward>(&*d);
            REQUIRE(fwd != nullptr);
            CHECK(fwd->next_hop == path[i + 1]->id());
            packet = fwd->packet;
        } else {
            auto* del = std::get_if<Deliver>(&*d);
            REQUIRE(del != nullptr);
            return del->payload;
        }
    }
    return {};
}

}  // namespace

TEST_CASE("Sealed packet layout constants", "[packet][unit]") {
    CHECK(PACKET_LEN == 2048);
    CHECK(ROUTING_LEN == 101);
    CHECK(MAX_PAYLOAD_LEN == 1142);
    CHECK(layout::NONCE + NONCE_LEN + PAD_LEN == PACKET_LEN);
}

TEST_CASE("Peeling every layer yields the payload and next hops", "[packet][unit]") {
    TestRelay a, b, c, d;

    SECTION("Single hop") {
        auto payload = bytes_of("direct");
        auto packet = encode({a.identity}, payload);
        REQUIRE(packet.has_value());
        CHECK(peel_all({&a}, *packet) == payload);
    }

    SECTION("Three hops") {
        auto payload = bytes_of("hello");
        auto packet = encode({a.identity, b.identity, c.identity}, payload);
        REQUIRE(packet.has_value());
        CHECK(peel_all({&a, &b, &c}, *packet) == payload);
    }

    SECTION("Four hops with a maximum-size payload") {
        std::vector<uint8_t> payload(MAX_PAYLOAD_LEN);
        for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i * 7);
        auto packet = encode({a.identity, b.identity, c.identity, d.identity}, payload);
        REQUIRE(packet.has_value());
        CHECK(peel_all({&a, &b, &c, &d}, *packet) == payload);
    }

    SECTION("Empty payload") {
        auto packet = encode({a.identity, b.identity}, {});
        REQUIRE(packet.has_value());
        CHECK(peel_all({&a, &b}, *packet).empty());
    }
}

TEST_CASE("Every forwarded packet keeps the fixed size", "[packet][unit]") {
    TestRelay a, b, c;
    auto packet = encode({a.identity, b.identity, c.identity}, bytes_of("x"));
    REQUIRE(packet.has_value());
    CHECK(packet->bytes().size() == PACKET_LEN);

    auto first = peel(*packet, a.keys.onion);
    REQUIRE(first.has_value());
    auto& fwd = std::get<Forward>(*first);
    CHECK(fwd.packet.bytes().size() == PACKET_LEN);
    CHECK(fwd.packet.version() == PACKET_VERSION);

    // Each hop sees a different nonce
    CHECK(fwd.packet.nonce() != packet->nonce());
}

TEST_CASE("Encoding rejects bad routes and payloads", "[packet][unit]") {
    TestRelay a;

    SECTION("Empty route") {
        auto r = encode({}, bytes_of("x"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::InvalidArgument);
    }

    SECTION("Too many hops") {
        Route route(MAX_HOPS + 1, a.identity);
        auto r = encode(route, bytes_of("x"));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::InvalidArgument);
    }

    SECTION("Oversized payload") {
        std::vector<uint8_t> payload(MAX_PAYLOAD_LEN + 1, 0xaa);
        auto r = encode({a.identity}, payload);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == MixnetError::InvalidArgument);
    }
}

TEST_CASE("Any bit flip in the onion fails authentication at the owning hop",
          "[packet][unit]") {
    TestRelay a, b;
    auto packet = encode({a.identity, b.identity}, bytes_of("tamper me"));
    REQUIRE(packet.has_value());

    // Offsets across alpha, mac, beta, body and nonce
    const size_t offsets[] = {
        layout::ALPHA, layout::ALPHA + 31, layout::MAC, layout::MAC + 17,
        layout::BETA, layout::BETA + 500, layout::BETA + HEADER_LEN - 1,
        layout::BODY, layout::BODY + 600, layout::NONCE, layout::NONCE + 15,
    };

    for (size_t offset : offsets) {
        for (uint8_t bit : {uint8_t{0x01}, uint8_t{0x80}}) {
            auto mutated = *packet;
            mutated.mutable_bytes()[offset] ^= bit;
            auto d = peel(mutated, a.keys.onion);
            INFO("offset " << offset);
            REQUIRE_FALSE(d.has_value());
            CHECK(d.error() == MixnetError::DecryptionError);
        }
    }

    SECTION("A flip in the inner layer is caught by the second hop") {
        auto first = peel(*packet, a.keys.onion);
        REQUIRE(first.has_value());
        auto inner = std::get<Forward>(*first).packet;
        inner.mutable_bytes()[layout::BODY + 10] ^= 0x04;
        auto d = peel(inner, b.keys.onion);
        REQUIRE_FALSE(d.has_value());
        CHECK(d.error() == MixnetError::DecryptionError);
    }
}

TEST_CASE("Peeling with the wrong key fails", "[packet][unit]") {
    TestRelay a, stranger;
    auto packet = encode({a.identity}, bytes_of("secret"));
    REQUIRE(packet.has_value());

    auto d = peel(*packet, stranger.keys.onion);
    REQUIRE_FALSE(d.has_value());
    CHECK(d.error() == MixnetError::DecryptionError);
}

TEST_CASE("Structural parsing", "[packet][unit]") {
    TestRelay a;
    auto packet = encode({a.identity}, bytes_of("p"));
    REQUIRE(packet.has_value());

    SECTION("Round trip through raw bytes") {
        auto parsed = SealedPacket::parse(packet->bytes());
        REQUIRE(parsed.has_value());
        CHECK(*parsed == *packet);
    }

    SECTION("Wrong length") {
        std::vector<uint8_t> shorter(packet->bytes().begin(), packet->bytes().end() - 1);
        auto parsed = SealedPacket::parse(shorter);
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error() == MixnetError::MalformedPacket);
    }

    SECTION("Unknown version") {
        std::vector<uint8_t> raw(packet->bytes().begin(), packet->bytes().end());
        raw[layout::VERSION] = 0x02;
        auto parsed = SealedPacket::parse(raw);
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error() == MixnetError::MalformedPacket);
    }

    SECTION("Non-zero padding") {
        std::vector<uint8_t> raw(packet->bytes().begin(), packet->bytes().end());
        raw[layout::PAD + 3] = 0x01;
        auto parsed = SealedPacket::parse(raw);
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error() == MixnetError::MalformedPacket);
    }
}

TEST_CASE("Encoding the same payload twice gives unrelated packets", "[packet][unit]") {
    TestRelay a, b;
    auto p1 = encode({a.identity, b.identity}, bytes_of("same"));
    auto p2 = encode({a.identity, b.identity}, bytes_of("same"));
    REQUIRE(p1.has_value());
    REQUIRE(p2.has_value());
    CHECK(p1->nonce() != p2->nonce());
    CHECK_FALSE(std::equal(p1->alpha().begin(), p1->alpha().end(), p2->alpha().begin()));
}
