#include "mixnet/policy/scheduler.hpp"
#include <algorithm>

namespace mixnet::policy {

namespace {

constexpr std::array<uint32_t, PRIORITY_LEVELS> FAIR_WEIGHTS = {8, 4, 2, 1};

}  // namespace

const char* scheduling_policy_name(SchedulingPolicy policy) {
    switch (policy) {
        case SchedulingPolicy::StrictPriority: return "strict";
        case SchedulingPolicy::WeightedFair: return "weighted";
        default: return "unknown";
    }
}

std::optional<SchedulingPolicy> parse_scheduling_policy(const std::string& s) {
    if (s == "strict") return SchedulingPolicy::StrictPriority;
    if (s == "weighted" || s == "fair") return SchedulingPolicy::WeightedFair;
    return std::nullopt;
}

OutboundQueue::OutboundQueue(Config config)
    : config_(config), credits_(FAIR_WEIGHTS) {
    config_.capacity = std::max<size_t>(config_.capacity, 1);
}

std::expected<std::optional<QueuedPacket>, core::MixnetError>
OutboundQueue::push(QueuedPacket item) {
    std::optional<QueuedPacket> shed;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return std::unexpected(core::MixnetError::LinkDown);
        }

        auto level = static_cast<size_t>(item.priority);
        if (level >= PRIORITY_LEVELS) {
            level = PRIORITY_LEVELS - 1;
            item.priority = static_cast<Priority>(level);
        }

        if (size_ >= config_.capacity) {
            // Lowest non-empty priority strictly below the arrival
            std::optional<size_t> victim;
            for (size_t p = PRIORITY_LEVELS; p-- > level + 1;) {
                if (!buckets_[p].empty()) {
                    victim = p;
                    break;
                }
            }
            if (!victim) {
                ++refused_;
                return std::unexpected(core::MixnetError::QueueOverflow);
            }
            shed = std::move(buckets_[*victim].back());
            buckets_[*victim].pop_back();
            --size_;
            ++shed_;
        }

        buckets_[level].push_back(std::move(item));
        ++size_;
    }
    cv_.notify_one();
    return shed;
}

std::optional<size_t> OutboundQueue::next_bucket_locked() {
    if (size_ == 0) {
        return std::nullopt;
    }

    if (config_.policy == SchedulingPolicy::StrictPriority) {
        for (size_t p = 0; p < PRIORITY_LEVELS; ++p) {
            if (!buckets_[p].empty()) return p;
        }
        return std::nullopt;
    }

    // Weighted round robin: each bucket spends its credit, then all refill
    for (int pass = 0; pass < 2; ++pass) {
        for (size_t i = 0; i < PRIORITY_LEVELS; ++i) {
            size_t p = (cursor_ + i) % PRIORITY_LEVELS;
            if (!buckets_[p].empty() && credits_[p] > 0) {
                --credits_[p];
                cursor_ = credits_[p] > 0 ? p : (p + 1) % PRIORITY_LEVELS;
                return p;
            }
        }
        credits_ = FAIR_WEIGHTS;
        cursor_ = 0;
    }
    return std::nullopt;
}

std::optional<QueuedPacket> OutboundQueue::pop_locked() {
    auto bucket = next_bucket_locked();
    if (!bucket) {
        return std::nullopt;
    }
    QueuedPacket item = std::move(buckets_[*bucket].front());
    buckets_[*bucket].pop_front();
    --size_;
    return item;
}

std::optional<QueuedPacket> OutboundQueue::try_pop() {
    std::lock_guard lock(mutex_);
    return pop_locked();
}

std::optional<QueuedPacket> OutboundQueue::pop(std::chrono::milliseconds wait) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, wait, [this] { return size_ > 0 || closed_; });
    return pop_locked();
}

void OutboundQueue::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void OutboundQueue::reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
}

size_t OutboundQueue::clear() {
    std::lock_guard lock(mutex_);
    size_t dropped = size_;
    for (auto& bucket : buckets_) {
        bucket.clear();
    }
    size_ = 0;
    credits_ = FAIR_WEIGHTS;
    cursor_ = 0;
    return dropped;
}

size_t OutboundQueue::size() const {
    std::lock_guard lock(mutex_);
    return size_;
}

size_t OutboundQueue::size(Priority priority) const {
    std::lock_guard lock(mutex_);
    auto level = std::min(static_cast<size_t>(priority), PRIORITY_LEVELS - 1);
    return buckets_[level].size();
}

uint64_t OutboundQueue::shed_count() const {
    std::lock_guard lock(mutex_);
    return shed_;
}

uint64_t OutboundQueue::refused_count() const {
    std::lock_guard lock(mutex_);
    return refused_;
}

bool OutboundQueue::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

}  // namespace mixnet::policy
