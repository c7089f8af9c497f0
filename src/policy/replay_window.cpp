#include "mixnet/policy/replay_window.hpp"
#include <algorithm>

namespace mixnet::policy {

const char* replay_verdict_name(ReplayVerdict verdict) {
    switch (verdict) {
        case ReplayVerdict::Fresh: return "fresh";
        case ReplayVerdict::Replayed: return "replayed";
        case ReplayVerdict::Expired: return "expired";
        case ReplayVerdict::Full: return "full";
        default: return "unknown";
    }
}

ReplayWindow::ReplayWindow(Config config) : config_(config) {
    config_.capacity = std::max<size_t>(config_.capacity, 1);
}

bool ReplayWindow::acceptable(uint32_t epoch, uint32_t current_epoch) const {
    // Written to avoid wrapping at either end of the epoch range
    if (epoch <= current_epoch) {
        return current_epoch - epoch <= config_.slack;
    }
    return epoch - current_epoch <= config_.slack;
}

ReplayVerdict ReplayWindow::check_and_insert(const core::PacketNonce& nonce,
                                             uint32_t epoch,
                                             uint32_t current_epoch) {
    std::lock_guard lock(mutex_);
    expire_locked(current_epoch);

    if (!acceptable(epoch, current_epoch)) {
        return ReplayVerdict::Expired;
    }

    auto& bucket = buckets_[epoch];
    if (bucket.contains(nonce)) {
        return ReplayVerdict::Replayed;
    }
    if (bucket.size() >= config_.capacity) {
        return ReplayVerdict::Full;
    }
    bucket.insert(nonce);
    return ReplayVerdict::Fresh;
}

bool ReplayWindow::contains(const core::PacketNonce& nonce, uint32_t epoch) const {
    std::lock_guard lock(mutex_);
    auto it = buckets_.find(epoch);
    return it != buckets_.end() && it->second.contains(nonce);
}

void ReplayWindow::expire(uint32_t current_epoch) {
    std::lock_guard lock(mutex_);
    expire_locked(current_epoch);
}

void ReplayWindow::expire_locked(uint32_t current_epoch) {
    // Buckets are ordered by epoch; everything below the floor is dead
    const uint32_t floor = current_epoch > config_.slack ? current_epoch - config_.slack : 0;
    buckets_.erase(buckets_.begin(), buckets_.lower_bound(floor));
}

size_t ReplayWindow::size() const {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& [epoch, bucket] : buckets_) {
        n += bucket.size();
    }
    return n;
}

size_t ReplayWindow::buckets() const {
    std::lock_guard lock(mutex_);
    return buckets_.size();
}

// --- SequenceWindow ---

bool SequenceWindow::check_and_insert(uint64_t counter) {
    if (!any_) {
        any_ = true;
        highest_ = counter;
        seen_.set(counter % WIDTH);
        return true;
    }
    if (counter > highest_) {
        const uint64_t advance = counter - highest_;
        if (advance >= WIDTH) {
            seen_.reset();
        } else {
            for (uint64_t c = highest_ + 1; c <= counter; ++c) {
                seen_.reset(c % WIDTH);
            }
        }
        highest_ = counter;
        seen_.set(counter % WIDTH);
        return true;
    }
    if (highest_ - counter >= WIDTH) {
        return false;
    }
    if (seen_.test(counter % WIDTH)) {
        return false;
    }
    seen_.set(counter % WIDTH);
    return true;
}

}  // namespace mixnet::policy
