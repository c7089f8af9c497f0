#pragma once

#include "mixnet/core/packet.hpp"
#include "mixnet/policy/replay_window.hpp"
#include "mixnet/policy/token_bucket.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mixnet::policy {

// What a ticket is bound to, and what the rate limit is keyed on
enum class AdmissionScope {
    PerLink,            // the link session id
    PerSourceIdentity,  // the sending relay's NodeId
};

[[nodiscard]] const char* admission_scope_name(AdmissionScope scope);
[[nodiscard]] std::optional<AdmissionScope> parse_admission_scope(const std::string& s);

using ScopeId = std::array<uint8_t, 32>;

// Highest difficulty a relay may demand; one ticket costs about 2^bits hashes
constexpr unsigned MAX_DIFFICULTY_BITS = 24;

[[nodiscard]] ScopeId scope_for_identity(const crypto::NodeId& id);

// Proof-of-work solution attached to each packet frame
struct AdmissionTicket {
    static constexpr size_t WIRE_LEN = 8;
    uint64_t solution{0};

    bool operator==(const AdmissionTicket&) const = default;
};

enum class AdmissionError {
    InsufficientWork,
    AlreadySpent,
    StaleNonce,      // nonce epoch no longer, or not yet, accepted
    RateLimited,
    WorkExhausted,   // minting gave up
    CryptoError,
};

[[nodiscard]] std::string admission_error_message(AdmissionError err);

// Number of leading zero bits of SHA-256(scope | nonce | solution)
[[nodiscard]] std::expected<unsigned, AdmissionError>
ticket_work(const ScopeId& scope, const core::PacketNonce& nonce, const AdmissionTicket& ticket);

// Searches for a solution with at least difficulty_bits of work
[[nodiscard]] std::expected<AdmissionTicket, AdmissionError>
mint_ticket(const ScopeId& scope,
            const core::PacketNonce& nonce,
            unsigned difficulty_bits,
            uint64_t max_attempts = uint64_t{1} << 28);

// Verifies and spends admission tickets and caps the accepted rate per scope.
//
// Verification and spending are one atomic step: of any number of concurrent
// admits for the same (scope, nonce) at most one succeeds.
class AdmissionController {
public:
    struct Config {
        unsigned difficulty_bits{8};
        AdmissionScope scope{AdmissionScope::PerLink};
        uint64_t rate{0};    // packets per second per scope, 0 = unlimited
        uint64_t burst{64};
        ReplayWindow::Config spent{.capacity = 1 << 17};
    };

    explicit AdmissionController(Config config);

    [[nodiscard]] std::expected<void, AdmissionError>
    admit(const ScopeId& scope,
          const core::PacketNonce& nonce,
          const AdmissionTicket& ticket,
          Clock::time_point now = Clock::now(),
          core::WallClock::time_point wall = core::WallClock::now());

    // Drops the rate-limit state of a closed scope
    void forget_scope(const ScopeId& scope);

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] unsigned difficulty_bits() const { return config_.difficulty_bits; }

    [[nodiscard]] uint64_t admitted() const { return admitted_.load(); }
    [[nodiscard]] uint64_t denied() const { return denied_.load(); }

private:
    [[nodiscard]] TokenBucket& bucket_for(const ScopeId& scope, Clock::time_point now);

    Config config_;
    ReplayWindow spent_;

    std::mutex buckets_mutex_;
    std::map<ScopeId, std::unique_ptr<TokenBucket>> buckets_;

    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> denied_{0};
};

}  // namespace mixnet::policy
