#include "mixnet/policy/token_bucket.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace mixnet::policy {

TokenBucket::TokenBucket(uint64_t rate_per_sec, uint64_t burst, Clock::time_point now)
    : rate_(rate_per_sec)
    , burst_(std::max<uint64_t>(burst, 1))
    , millitokens_(burst_ * 1000)
    , last_refill_(now) {}

uint64_t TokenBucket::refilled_millis(Clock::time_point now) const {
    if (now <= last_refill_) {
        return millitokens_;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_refill_);
    // rate tokens/sec == rate millitokens/ms
    uint64_t gained = rate_ * static_cast<uint64_t>(elapsed.count());
    return std::min(millitokens_ + gained, burst_ * 1000);
}

void TokenBucket::refill(Clock::time_point now) {
    if (now <= last_refill_) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_refill_);
    if (elapsed.count() == 0) {
        return;
    }
    millitokens_ = refilled_millis(now);
    // Advance by whole milliseconds so sub-millisecond remainders are kept
    last_refill_ += elapsed;
}

bool TokenBucket::try_consume(uint64_t tokens, Clock::time_point now) {
    std::lock_guard lock(mutex_);
    if (rate_ == 0) {
        return true;
    }
    refill(now);

    uint64_t needed = tokens * 1000;
    if (millitokens_ >= needed) {
        millitokens_ -= needed;
        return true;
    }
    return false;
}

std::chrono::milliseconds TokenBucket::time_until(uint64_t tokens, Clock::time_point now) const {
    std::lock_guard lock(mutex_);
    if (rate_ == 0) {
        return std::chrono::milliseconds(0);
    }
    uint64_t have = refilled_millis(now);
    uint64_t needed = std::min(tokens, burst_) * 1000;
    if (have >= needed) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds((needed - have + rate_ - 1) / rate_);
}

uint64_t TokenBucket::available(Clock::time_point now) const {
    std::lock_guard lock(mutex_);
    if (rate_ == 0) {
        return burst_;
    }
    return refilled_millis(now) / 1000;
}

uint64_t TokenBucket::rate() const {
    std::lock_guard lock(mutex_);
    return rate_;
}

uint64_t TokenBucket::burst() const {
    std::lock_guard lock(mutex_);
    return burst_;
}

void TokenBucket::set_rate(uint64_t rate_per_sec) {
    std::lock_guard lock(mutex_);
    rate_ = rate_per_sec;
}

void TokenBucket::set_burst(uint64_t burst) {
    std::lock_guard lock(mutex_);
    burst_ = std::max<uint64_t>(burst, 1);
    millitokens_ = std::min(millitokens_, burst_ * 1000);
}

void TokenBucket::reset(Clock::time_point now) {
    std::lock_guard lock(mutex_);
    millitokens_ = burst_ * 1000;
    last_refill_ = now;
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double value = static_cast<double>(bytes);

    while (value >= 1024 && unit < 4) {
        value /= 1024;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

std::string format_rate(uint64_t bytes_per_sec) {
    return format_bytes(bytes_per_sec) + "/s";
}

}  // namespace mixnet::policy
