#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace mixnet::policy {

using Clock = std::chrono::steady_clock;

// Token bucket rate limiter. A rate of 0 means unlimited.
class TokenBucket {
public:
    // rate in tokens per second, burst in tokens
    TokenBucket(uint64_t rate_per_sec, uint64_t burst, Clock::time_point now = Clock::now());

    // Try to consume tokens, returns true if allowed
    [[nodiscard]] bool try_consume(uint64_t tokens, Clock::time_point now = Clock::now());

    // Time until `tokens` would be available (zero if available now)
    [[nodiscard]] std::chrono::milliseconds
    time_until(uint64_t tokens, Clock::time_point now = Clock::now()) const;

    [[nodiscard]] uint64_t available(Clock::time_point now = Clock::now()) const;

    [[nodiscard]] uint64_t rate() const;
    [[nodiscard]] uint64_t burst() const;
    [[nodiscard]] bool unlimited() const { return rate() == 0; }

    void set_rate(uint64_t rate_per_sec);
    void set_burst(uint64_t burst);

    // Reset bucket to full
    void reset(Clock::time_point now = Clock::now());

private:
    // Token counts are kept in thousandths so slow rates still refill
    [[nodiscard]] uint64_t refilled_millis(Clock::time_point now) const;
    void refill(Clock::time_point now);

    uint64_t rate_;
    uint64_t burst_;
    uint64_t millitokens_;
    Clock::time_point last_refill_;
    mutable std::mutex mutex_;
};

// Format bytes as human-readable string
[[nodiscard]] std::string format_bytes(uint64_t bytes);
[[nodiscard]] std::string format_rate(uint64_t bytes_per_sec);

}  // namespace mixnet::policy
