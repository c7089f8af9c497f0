#include <catch2/catch_all.hpp>
#include "mixnet/policy/debt_ledger.hpp"
#include "../fixtures/node_fixtures.hpp"

using namespace mixnet;
using namespace mixnet::policy;
using mixnet::test::TestRelay;

TEST_CASE("Debt ledger keeps a balance per neighbour", "[policy][unit]") {
    TestRelay a, b;
    DebtLedger ledger({.limit = 0});

    CHECK_FALSE(ledger.balance(a.id()).has_value());
    ledger.record_incoming(a.id());
    ledger.record_incoming(a.id());
    ledger.record_outgoing(a.id());
    ledger.record_outgoing(b.id());

    auto ba = ledger.balance(a.id());
    REQUIRE(ba.has_value());
    CHECK(ba->incoming == 2);
    CHECK(ba->outgoing == 1);
    CHECK(ba->net() == 1);
    CHECK(ledger.balance(b.id())->net() == -1);

    // Without a limit nobody is ever cut off
    for (int i = 0; i < 100; ++i) ledger.record_incoming(a.id());
    CHECK(ledger.within_limit(a.id()));

    auto all = ledger.balances();
    REQUIRE(all.size() == 2);
    CHECK(all[0].neighbor < all[1].neighbor);
}

TEST_CASE("Debt limit cuts off a neighbour until the balance evens out", "[policy][unit]") {
    TestRelay a;
    DebtLedger ledger({.limit = 3});

    CHECK(ledger.within_limit(a.id()));
    for (int i = 0; i < 3; ++i) {
        REQUIRE(ledger.within_limit(a.id()));
        ledger.record_incoming(a.id());
    }
    CHECK_FALSE(ledger.within_limit(a.id()));

    ledger.record_outgoing(a.id());
    CHECK(ledger.within_limit(a.id()));

    SECTION("Credit carries forward") {
        for (int i = 0; i < 5; ++i) ledger.record_outgoing(a.id());
        CHECK(ledger.balance(a.id())->net() == -3);
        for (int i = 0; i < 5; ++i) ledger.record_incoming(a.id());
        CHECK(ledger.within_limit(a.id()));
        ledger.record_incoming(a.id());
        CHECK_FALSE(ledger.within_limit(a.id()));
    }
}
