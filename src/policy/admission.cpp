#include "mixnet/policy/admission.hpp"
#include "mixnet/crypto/hash.hpp"
#include "mixnet/crypto/keys.hpp"
#include <algorithm>

namespace mixnet::policy {

const char* admission_scope_name(AdmissionScope scope) {
    switch (scope) {
        case AdmissionScope::PerLink: return "link";
        case AdmissionScope::PerSourceIdentity: return "source";
        default: return "unknown";
    }
}

std::optional<AdmissionScope> parse_admission_scope(const std::string& s) {
    if (s == "link") return AdmissionScope::PerLink;
    if (s == "source") return AdmissionScope::PerSourceIdentity;
    return std::nullopt;
}

ScopeId scope_for_identity(const crypto::NodeId& id) {
    ScopeId scope{};
    std::copy(id.data().begin(), id.data().end(), scope.begin());
    return scope;
}

std::string admission_error_message(AdmissionError err) {
    switch (err) {
        case AdmissionError::InsufficientWork: return "Insufficient proof of work";
        case AdmissionError::AlreadySpent: return "Ticket already spent";
        case AdmissionError::StaleNonce: return "Nonce epoch outside the accepted range";
        case AdmissionError::RateLimited: return "Admission rate exceeded";
        case AdmissionError::WorkExhausted: return "No solution found within attempt limit";
        case AdmissionError::CryptoError: return "Hash failure";
        default: return "Unknown admission error";
    }
}

namespace {

constexpr size_t PREIMAGE_LEN = 32 + core::NONCE_LEN + AdmissionTicket::WIRE_LEN;

using Preimage = std::array<uint8_t, PREIMAGE_LEN>;

Preimage make_preimage(const ScopeId& scope, const core::PacketNonce& nonce) {
    Preimage p{};
    std::copy(scope.begin(), scope.end(), p.begin());
    std::copy(nonce.begin(), nonce.end(), p.begin() + 32);
    return p;
}

void set_solution(Preimage& p, uint64_t solution) {
    for (size_t i = 0; i < 8; ++i) {
        p[32 + core::NONCE_LEN + i] = static_cast<uint8_t>(solution >> (56 - 8 * i));
    }
}

// Spent-set key: the ticket is bound to (scope, nonce), not to one solution
std::expected<core::PacketNonce, AdmissionError>
spent_key(const ScopeId& scope, const core::PacketNonce& nonce) {
    auto p = make_preimage(scope, nonce);
    auto digest = crypto::sha256(std::span<const uint8_t>(p).first(32 + core::NONCE_LEN));
    if (!digest) {
        return std::unexpected(AdmissionError::CryptoError);
    }
    core::PacketNonce key{};
    std::copy_n(digest->begin(), key.size(), key.begin());
    return key;
}

}  // namespace

std::expected<unsigned, AdmissionError>
ticket_work(const ScopeId& scope, const core::PacketNonce& nonce, const AdmissionTicket& ticket) {
    auto p = make_preimage(scope, nonce);
    set_solution(p, ticket.solution);
    auto digest = crypto::sha256(p);
    if (!digest) {
        return std::unexpected(AdmissionError::CryptoError);
    }
    return crypto::leading_zero_bits(*digest);
}

std::expected<AdmissionTicket, AdmissionError>
mint_ticket(const ScopeId& scope,
            const core::PacketNonce& nonce,
            unsigned difficulty_bits,
            uint64_t max_attempts) {
    auto p = make_preimage(scope, nonce);
    uint64_t start = crypto::random_u64();

    for (uint64_t i = 0; i < max_attempts; ++i) {
        uint64_t solution = start + i;
        set_solution(p, solution);
        auto digest = crypto::sha256(p);
        if (!digest) {
            return std::unexpected(AdmissionError::CryptoError);
        }
        if (crypto::leading_zero_bits(*digest) >= difficulty_bits) {
            return AdmissionTicket{solution};
        }
    }
    return std::unexpected(AdmissionError::WorkExhausted);
}

// AdmissionController

AdmissionController::AdmissionController(Config config)
    : config_(config), spent_(config.spent) {}

TokenBucket& AdmissionController::bucket_for(const ScopeId& scope, Clock::time_point now) {
    std::lock_guard lock(buckets_mutex_);
    auto& slot = buckets_[scope];
    if (!slot) {
        slot = std::make_unique<TokenBucket>(config_.rate, config_.burst, now);
    }
    return *slot;
}

std::expected<void, AdmissionError>
AdmissionController::admit(const ScopeId& scope,
                           const core::PacketNonce& nonce,
                           const AdmissionTicket& ticket,
                           Clock::time_point now,
                           core::WallClock::time_point wall) {
    auto deny = [this](AdmissionError err) -> std::expected<void, AdmissionError> {
        denied_.fetch_add(1, std::memory_order_relaxed);
        return std::unexpected(err);
    };

    auto work = ticket_work(scope, nonce, ticket);
    if (!work) {
        return deny(work.error());
    }
    if (*work < config_.difficulty_bits) {
        return deny(AdmissionError::InsufficientWork);
    }

    auto key = spent_key(scope, nonce);
    if (!key) {
        return deny(key.error());
    }
    // Spent keys live in the bucket of the nonce's epoch, so a ticket stays
    // spent for as long as its nonce could be presented
    switch (spent_.check_and_insert(*key, core::nonce_epoch(nonce), core::packet_epoch(wall))) {
        case ReplayVerdict::Fresh:
            break;
        case ReplayVerdict::Replayed:
            return deny(AdmissionError::AlreadySpent);
        case ReplayVerdict::Expired:
            return deny(AdmissionError::StaleNonce);
        case ReplayVerdict::Full:
            return deny(AdmissionError::RateLimited);
    }

    if (config_.rate > 0 && !bucket_for(scope, now).try_consume(1, now)) {
        return deny(AdmissionError::RateLimited);
    }

    admitted_.fetch_add(1, std::memory_order_relaxed);
    return {};
}

void AdmissionController::forget_scope(const ScopeId& scope) {
    std::lock_guard lock(buckets_mutex_);
    buckets_.erase(scope);
}

}  // namespace mixnet::policy
