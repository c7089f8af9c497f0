#include <catch2/catch_all.hpp>
#include "mixnet/topology/topology_store.hpp"
#include "../fixtures/node_fixtures.hpp"

using namespace mixnet;
using namespace mixnet::topology;
using mixnet::test::TestRelay;

namespace {

LinkStateRecord record(const TestRelay& relay, uint64_t counter,
                       std::vector<std::pair<const TestRelay*, uint32_t>> neighbours) {
    std::vector<EdgeAdvert> edges;
    for (const auto& [n, cost] : neighbours) {
        edges.push_back(EdgeAdvert{.neighbor = n->id(), .cost = cost});
    }
    auto r = LinkStateRecord::create(relay.keys.identity, counter, 1700000000 + counter,
                                     std::move(edges));
    REQUIRE(r.has_value());
    return std::move(*r);
}

std::vector<NodeId> ids_of(const core::Route& route) {
    std::vector<NodeId> out;
    for (const auto& r : route) out.push_back(r.node_id());
    return out;
}

// self - a - b - c, plus a detour self - d - e - c that costs more
struct Graph {
    TestRelay self, a, b, c, d, e;
    TopologyStore store{self.id(), TopologyStore::Config{}};

    Graph() {
        for (auto* r : {&self, &a, &b, &c, &d, &e}) {
            REQUIRE(store.insert_identity(r->identity).has_value());
        }
        REQUIRE(store.announce_local(self.keys.identity,
            {{.neighbor = a.id(), .cost = 1}, {.neighbor = d.id(), .cost = 2}}).has_value());
        REQUIRE(store.merge(record(a, 1, {{&b, 1}})).has_value());
        REQUIRE(store.merge(record(b, 1, {{&c, 1}})).has_value());
        REQUIRE(store.merge(record(d, 1, {{&e, 2}})).has_value());
        REQUIRE(store.merge(record(e, 1, {{&c, 2}})).has_value());
    }
};

}  // namespace

TEST_CASE("Identities are verified before they are stored", "[topology][unit]") {
    TestRelay self, a;
    TopologyStore store(self.id(), {});

    SECTION("Valid identity") {
        auto r = store.insert_identity(a.identity);
        REQUIRE(r.has_value());
        CHECK(*r);
        CHECK(store.snapshot()->find(a.id()) != nullptr);
    }

    SECTION("Forged signature") {
        auto forged = a.identity;
        forged.addresses = {"10.0.0.1:9"};
        auto r = store.insert_identity(forged);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == TopologyError::InvalidSignature);
    }

    SECTION("Same identity twice is not a change") {
        REQUIRE(store.insert_identity(a.identity).has_value());
        auto gen = store.generation();
        auto r = store.insert_identity(a.identity);
        REQUIRE(r.has_value());
        CHECK_FALSE(*r);
        CHECK(store.generation() == gen);
    }

    SECTION("Older identity is stale") {
        auto newer = test::make_identity(a.keys, {"127.0.0.1:2"}, 1800000000);
        REQUIRE(store.insert_identity(newer).has_value());
        auto r = store.insert_identity(a.identity);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == TopologyError::StaleRecord);
    }
}

TEST_CASE("Link-state merge rules", "[topology][unit]") {
    TestRelay self, a, b, c;
    TopologyStore store(self.id(), {});
    for (auto* r : {&a, &b, &c}) {
        REQUIRE(store.insert_identity(r->identity).has_value());
    }

    SECTION("Records from unknown relays are refused") {
        TestRelay stranger;
        auto r = store.merge(record(stranger, 1, {{&a, 1}}));
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == TopologyError::UnknownRelay);
    }

    SECTION("Records signed by another key are refused") {
        auto rec = record(a, 1, {{&b, 1}});
        rec.relay_id = b.id();
        auto r = store.merge(rec);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == TopologyError::InvalidSignature);
    }

    SECTION("Older counters are stale, equal counters are no-ops") {
        REQUIRE(store.merge(record(a, 5, {{&b, 1}})).has_value());
        auto older = store.merge(record(a, 4, {{&c, 1}}));
        REQUIRE_FALSE(older.has_value());
        CHECK(older.error() == TopologyError::StaleRecord);

        auto same = store.merge(record(a, 5, {{&b, 1}}));
        REQUIRE(same.has_value());
        CHECK_FALSE(*same);
    }

    SECTION("A newer record withdraws edges it no longer lists") {
        REQUIRE(store.merge(record(a, 1, {{&b, 1}, {&c, 1}})).has_value());
        CHECK(store.snapshot()->has_usable_edge(a.id(), c.id()));

        REQUIRE(store.merge(record(a, 2, {{&b, 1}})).has_value());
        auto snap = store.snapshot();
        CHECK(snap->has_usable_edge(a.id(), b.id()));
        CHECK_FALSE(snap->edges.contains(EdgeKey(a.id(), c.id())));
    }

    SECTION("The higher counter owns a shared edge") {
        REQUIRE(store.merge(record(a, 3, {{&b, 4}})).has_value());
        REQUIRE(store.merge(record(b, 7, {{&a, 2}})).has_value());
        auto edge = store.snapshot()->edges.at(EdgeKey(a.id(), b.id()));
        CHECK(edge.announcer == b.id());
        CHECK(edge.cost == 2);

        // a's next record is still older than b's, so b keeps the edge
        REQUIRE(store.merge(record(a, 4, {{&b, 9}})).has_value());
        CHECK(store.snapshot()->edges.at(EdgeKey(a.id(), b.id())).cost == 2);
    }

    SECTION("Self-loops are ignored and zero cost counts as one") {
        REQUIRE(store.merge(record(a, 1, {{&a, 1}, {&b, 0}})).has_value());
        auto snap = store.snapshot();
        CHECK_FALSE(snap->edges.contains(EdgeKey(a.id(), a.id())));
        CHECK(snap->edges.at(EdgeKey(a.id(), b.id())).cost == 1);
    }
}

TEST_CASE("Snapshots are immutable and generation tagged", "[topology][unit]") {
    TestRelay self, a, b;
    TopologyStore store(self.id(), {});
    REQUIRE(store.insert_identity(a.identity).has_value());

    auto before = store.snapshot();
    REQUIRE(store.insert_identity(b.identity).has_value());
    auto after = store.snapshot();

    CHECK(after->generation > before->generation);
    CHECK(before->find(b.id()) == nullptr);
    CHECK(after->find(b.id()) != nullptr);
}

TEST_CASE("Route computation", "[topology][unit]") {
    Graph g;
    auto snap = g.store.snapshot();

    SECTION("Cheapest path within the hop bound") {
        auto route = compute_route(*snap, g.self.id(), g.c.id(), 3);
        REQUIRE(route.has_value());
        CHECK(ids_of(*route) == std::vector<NodeId>{g.a.id(), g.b.id(), g.c.id()});
    }

    SECTION("Deterministic over the same snapshot") {
        auto r1 = compute_route(*snap, g.self.id(), g.c.id(), 3);
        auto r2 = compute_route(*snap, g.self.id(), g.c.id(), 3);
        REQUIRE(r1.has_value());
        REQUIRE(r2.has_value());
        CHECK(ids_of(*r1) == ids_of(*r2));
    }

    SECTION("Never exceeds max_hops") {
        for (size_t hops = 1; hops <= 5; ++hops) {
            auto route = compute_route(*snap, g.self.id(), g.c.id(), hops);
            if (route) {
                CHECK(route->size() <= hops);
            } else {
                CHECK(route.error() == TopologyError::NoRouteFound);
            }
        }
        auto two = compute_route(*snap, g.self.id(), g.c.id(), 2);
        REQUIRE_FALSE(two.has_value());
        CHECK(two.error() == TopologyError::NoRouteFound);
    }

    SECTION("Direct neighbour") {
        auto route = compute_route(*snap, g.self.id(), g.a.id(), 1);
        REQUIRE(route.has_value());
        CHECK(ids_of(*route) == std::vector<NodeId>{g.a.id()});
    }

    SECTION("Unreachable and invalid destinations") {
        TestRelay island;
        REQUIRE(g.store.insert_identity(island.identity).has_value());
        auto r = compute_route(*g.store.snapshot(), g.self.id(), island.id(), 8);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == TopologyError::NoRouteFound);

        auto to_self = compute_route(*snap, g.self.id(), g.self.id(), 3);
        REQUIRE_FALSE(to_self.has_value());
        CHECK(to_self.error() == TopologyError::InvalidArgument);

        auto zero = compute_route(*snap, g.self.id(), g.c.id(), 0);
        REQUIRE_FALSE(zero.has_value());
        CHECK(zero.error() == TopologyError::InvalidArgument);
    }

    SECTION("A stale edge reroutes, then disconnects") {
        g.store.mark_stale(g.a.id(), g.b.id());
        auto detour = compute_route(*g.store.snapshot(), g.self.id(), g.c.id(), 3);
        REQUIRE(detour.has_value());
        CHECK(ids_of(*detour) == std::vector<NodeId>{g.d.id(), g.e.id(), g.c.id()});

        g.store.mark_stale(g.self.id(), g.d.id());
        auto none = compute_route(*g.store.snapshot(), g.self.id(), g.c.id(), 3);
        REQUIRE_FALSE(none.has_value());
        CHECK(none.error() == TopologyError::NoRouteFound);

        // The old snapshot still routes the original way
        auto old = compute_route(*snap, g.self.id(), g.c.id(), 3);
        REQUIRE(old.has_value());
        CHECK(old->front().node_id() == g.a.id());
    }

    SECTION("A newer record clears the stale flag") {
        g.store.mark_stale(g.a.id(), g.b.id());
        REQUIRE(g.store.merge(record(g.a, 2, {{&g.b, 1}})).has_value());
        CHECK(g.store.snapshot()->has_usable_edge(g.a.id(), g.b.id()));
    }
}

TEST_CASE("Local announcements", "[topology][unit]") {
    TestRelay self, a, other;
    TopologyStore store(self.id(), {});
    REQUIRE(store.insert_identity(self.identity).has_value());
    REQUIRE(store.insert_identity(a.identity).has_value());

    auto first = store.announce_local(self.keys.identity, {{.neighbor = a.id(), .cost = 1}});
    REQUIRE(first.has_value());
    auto second = store.announce_local(self.keys.identity, {{.neighbor = a.id(), .cost = 1}});
    REQUIRE(second.has_value());
    CHECK(second->counter > first->counter);
    CHECK(second->verify(self.keys.identity.public_key()));

    auto held = store.record_of(self.id());
    REQUIRE(held.has_value());
    CHECK(held->counter == second->counter);

    auto wrong = store.announce_local(other.keys.identity, {});
    REQUIRE_FALSE(wrong.has_value());
    CHECK(wrong.error() == TopologyError::InvalidArgument);
}

TEST_CASE("Expired entries are evicted", "[topology][unit]") {
    TestRelay self, a, b;
    TopologyStore store(self.id(), {.edge_ttl = std::chrono::seconds(10),
                                    .identity_ttl = std::chrono::seconds(20)});
    auto t0 = Clock::now();
    REQUIRE(store.insert_identity(self.identity, t0).has_value());
    REQUIRE(store.insert_identity(a.identity, t0).has_value());
    REQUIRE(store.insert_identity(b.identity, t0).has_value());
    REQUIRE(store.merge(record(a, 1, {{&b, 1}}), t0).has_value());

    CHECK(store.evict_expired(t0 + std::chrono::seconds(5)) == 0);

    // Edge expires first
    CHECK(store.evict_expired(t0 + std::chrono::seconds(11)) == 1);
    CHECK(store.snapshot()->edges.empty());

    // Then both foreign identities; our own is kept
    CHECK(store.evict_expired(t0 + std::chrono::seconds(21)) == 2);
    auto snap = store.snapshot();
    CHECK(snap->find(self.id()) != nullptr);
    CHECK(snap->find(a.id()) == nullptr);
    CHECK_FALSE(store.record_of(a.id()).has_value());
}

TEST_CASE("Gossip records survive serialization", "[topology][unit]") {
    TestRelay a, b;
    auto rec = record(a, 42, {{&b, 3}});
    auto parsed = LinkStateRecord::parse(rec.serialize());
    REQUIRE(parsed.has_value());
    CHECK(*parsed == rec);
    CHECK(parsed->verify(a.keys.identity.public_key()));
    CHECK_FALSE(parsed->verify(b.keys.identity.public_key()));

    auto truncated = rec.serialize();
    truncated.pop_back();
    CHECK_FALSE(LinkStateRecord::parse(truncated).has_value());
}

TEST_CASE("Graph dump lists relays and stale edges", "[topology][unit]") {
    Graph g;
    g.store.mark_stale(g.a.id(), g.b.id());
    auto text = g.store.snapshot()->dump(g.self.id());
    CHECK(text.find("* " + g.self.id().to_hex()) != std::string::npos);
    CHECK(text.find("[stale]") != std::string::npos);
}
