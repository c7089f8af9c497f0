#include <catch2/catch_all.hpp>
#include "mixnet/policy/admission.hpp"
#include "mixnet/policy/token_bucket.hpp"
#include "../fixtures/node_fixtures.hpp"
#include <thread>
#include <vector>

using namespace mixnet;
using namespace mixnet::policy;

namespace {

// Nonce claiming the epoch of `wall`, as an encoder would produce
core::PacketNonce nonce_of(uint8_t n, core::WallClock::time_point wall = core::WallClock::now()) {
    core::PacketNonce nonce{};
    nonce.fill(n);
    const uint32_t epoch = core::packet_epoch(wall);
    for (size_t i = 0; i < core::NONCE_EPOCH_LEN; ++i) {
        nonce[i] = static_cast<uint8_t>(epoch >> (24 - 8 * i));
    }
    return nonce;
}

ScopeId scope_of(uint8_t n) {
    ScopeId scope{};
    scope.fill(n);
    return scope;
}

AdmissionTicket mint(const ScopeId& scope, const core::PacketNonce& nonce, unsigned bits) {
    auto ticket = mint_ticket(scope, nonce, bits);
    REQUIRE(ticket.has_value());
    return *ticket;
}

}  // namespace

TEST_CASE("Minted tickets carry the requested work", "[admission][unit]") {
    auto scope = scope_of(1);
    auto nonce = nonce_of(2);
    auto ticket = mint(scope, nonce, 10);

    auto work = ticket_work(scope, nonce, ticket);
    REQUIRE(work.has_value());
    CHECK(*work >= 10);

    SECTION("The ticket is bound to its scope and nonce") {
        auto other_scope = ticket_work(scope_of(9), nonce, ticket);
        auto other_nonce = ticket_work(scope, nonce_of(9), ticket);
        REQUIRE(other_scope.has_value());
        REQUIRE(other_nonce.has_value());
        // A 10-bit solution transfers by chance with probability 2^-10
        CHECK((*other_scope < 10 || *other_nonce < 10));
    }

    SECTION("Minting gives up after the attempt limit") {
        auto r = mint_ticket(scope, nonce, 64, 16);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == AdmissionError::WorkExhausted);
    }
}

TEST_CASE("Admission verifies and spends tickets", "[admission][unit]") {
    AdmissionController controller({.difficulty_bits = 8});
    auto scope = scope_of(3);
    auto nonce = nonce_of(4);
    auto ticket = mint(scope, nonce, 8);

    REQUIRE(controller.admit(scope, nonce, ticket).has_value());

    SECTION("A spent ticket is refused") {
        auto again = controller.admit(scope, nonce, ticket);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error() == AdmissionError::AlreadySpent);
    }

    SECTION("A different solution for the same nonce is still spent") {
        auto second = mint(scope, nonce, 8);
        auto r = controller.admit(scope, nonce, second);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == AdmissionError::AlreadySpent);
    }

    SECTION("The same nonce under another scope is independent") {
        auto other = scope_of(5);
        REQUIRE(controller.admit(other, nonce, mint(other, nonce, 8)).has_value());
    }

    SECTION("Insufficient work is refused") {
        AdmissionController strict({.difficulty_bits = 20});
        auto weak_nonce = nonce_of(6);
        AdmissionTicket weak{};
        for (uint64_t s = 0;; ++s) {
            auto w = ticket_work(scope, weak_nonce, AdmissionTicket{s});
            REQUIRE(w.has_value());
            if (*w < 20) {
                weak.solution = s;
                break;
            }
        }
        auto r = strict.admit(scope, weak_nonce, weak);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == AdmissionError::InsufficientWork);
    }

    CHECK(controller.admitted() >= 1);
}

TEST_CASE("Spent tickets stay spent until their nonce is stale", "[admission][unit]") {
    AdmissionController controller({.difficulty_bits = 4});
    auto scope = scope_of(3);
    auto wall = core::WallClock::now();
    auto nonce = nonce_of(4, wall);
    auto ticket = mint(scope, nonce, 4);
    auto now = Clock::now();
    REQUIRE(controller.admit(scope, nonce, ticket, now, wall).has_value());

    auto again = controller.admit(scope, nonce, ticket, now, wall + core::PACKET_EPOCH);
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error() == AdmissionError::AlreadySpent);

    for (auto delay : {std::chrono::minutes(2), std::chrono::minutes(10), std::chrono::minutes(600)}) {
        auto late = controller.admit(scope, nonce, ticket, now, wall + delay);
        REQUIRE_FALSE(late.has_value());
        CHECK(late.error() == AdmissionError::StaleNonce);
    }

    SECTION("A nonce from the future is refused") {
        auto ahead = nonce_of(5, wall + std::chrono::minutes(5));
        auto r = controller.admit(scope, ahead, mint(scope, ahead, 4), now, wall);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == AdmissionError::StaleNonce);
    }
}

TEST_CASE("Concurrent admits of one ticket succeed at most once", "[admission][unit]") {
    AdmissionController controller({.difficulty_bits = 4});
    auto scope = scope_of(7);
    auto nonce = nonce_of(8);
    auto ticket = mint(scope, nonce, 4);

    std::atomic<int> successes{0};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                if (controller.admit(scope, nonce, ticket)) {
                    successes.fetch_add(1);
                }
            });
        }
    }
    CHECK(successes.load() == 1);
    CHECK(controller.denied() == 7);
}

TEST_CASE("Admission rate is capped per scope", "[admission][unit]") {
    AdmissionController controller({.difficulty_bits = 0, .rate = 10, .burst = 3});
    auto t0 = Clock::now();
    auto scope = scope_of(9);

    int accepted = 0;
    for (uint8_t i = 0; i < 10; ++i) {
        auto nonce = nonce_of(static_cast<uint8_t>(100 + i));
        auto r = controller.admit(scope, nonce, AdmissionTicket{0}, t0);
        if (r) {
            ++accepted;
        } else {
            CHECK(r.error() == AdmissionError::RateLimited);
        }
    }
    CHECK(accepted == 3);

    // Another scope has its own bucket
    auto other = scope_of(10);
    CHECK(controller.admit(other, nonce_of(200), AdmissionTicket{0}, t0).has_value());

    // Refills over time
    auto later = t0 + std::chrono::milliseconds(200);
    CHECK(controller.admit(scope, nonce_of(201), AdmissionTicket{0}, later).has_value());

    SECTION("Forgetting a scope resets its bucket") {
        controller.forget_scope(scope);
        CHECK(controller.admit(scope, nonce_of(202), AdmissionTicket{0}, later).has_value());
    }
}

TEST_CASE("Identity scopes and names", "[admission][unit]") {
    auto keys = test::make_keys();
    auto scope = scope_for_identity(keys.node_id());
    CHECK(std::equal(scope.begin(), scope.end(), keys.node_id().data().begin()));

    CHECK(parse_admission_scope("link") == AdmissionScope::PerLink);
    CHECK(parse_admission_scope("source") == AdmissionScope::PerSourceIdentity);
    CHECK_FALSE(parse_admission_scope("global").has_value());
    CHECK(std::string(admission_scope_name(AdmissionScope::PerSourceIdentity)) == "source");
}

TEST_CASE("Token bucket", "[admission][bucket][unit]") {
    auto t0 = Clock::now();

    SECTION("Burst then refill") {
        TokenBucket bucket(100, 10, t0);
        CHECK(bucket.available(t0) == 10);
        CHECK(bucket.try_consume(10, t0));
        CHECK_FALSE(bucket.try_consume(1, t0));
        CHECK(bucket.time_until(1, t0) == std::chrono::milliseconds(10));

        auto later = t0 + std::chrono::milliseconds(50);
        CHECK(bucket.available(later) == 5);
        CHECK(bucket.try_consume(5, later));
        CHECK_FALSE(bucket.try_consume(1, later));
    }

    SECTION("Never exceeds burst") {
        TokenBucket bucket(1000, 4, t0);
        CHECK(bucket.available(t0 + std::chrono::seconds(60)) == 4);
    }

    SECTION("Zero rate is unlimited") {
        TokenBucket bucket(0, 1, t0);
        CHECK(bucket.unlimited());
        for (int i = 0; i < 100; ++i) {
            CHECK(bucket.try_consume(1000, t0));
        }
        CHECK(bucket.time_until(5, t0) == std::chrono::milliseconds(0));
    }

    SECTION("Slow rates still refill") {
        TokenBucket bucket(1, 1, t0);
        REQUIRE(bucket.try_consume(1, t0));
        CHECK_FALSE(bucket.try_consume(1, t0 + std::chrono::milliseconds(999)));
        CHECK(bucket.try_consume(1, t0 + std::chrono::milliseconds(1000)));
    }

    SECTION("Reconfiguration") {
        TokenBucket bucket(10, 10, t0);
        bucket.set_burst(2);
        CHECK(bucket.available(t0) == 2);
        bucket.set_rate(0);
        CHECK(bucket.try_consume(50, t0));
        bucket.set_rate(10);
        bucket.reset(t0);
        CHECK(bucket.available(t0) == 2);
    }

    CHECK(format_bytes(1536) == "1.50 KB");
    CHECK(format_rate(0) == "0.00 B/s");
}
