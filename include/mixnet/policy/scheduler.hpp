#pragma once

#include "mixnet/core/errors.hpp"
#include "mixnet/core/packet.hpp"
#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <string>

namespace mixnet::policy {

// Lower value = served first, shed last
enum class Priority : uint8_t {
    Control = 0,
    Interactive = 1,
    Bulk = 2,
    Background = 3,
};

inline constexpr size_t PRIORITY_LEVELS = 4;

enum class SchedulingPolicy {
    StrictPriority,
    WeightedFair,   // weights 8:4:2:1 by priority
};

[[nodiscard]] const char* scheduling_policy_name(SchedulingPolicy policy);
[[nodiscard]] std::optional<SchedulingPolicy> parse_scheduling_policy(const std::string& s);

struct QueuedPacket {
    core::SealedPacket packet;
    Priority priority{Priority::Bulk};
    uint64_t flow_id{0};
};

// Bounded per-link outbound queue.
//
// FIFO within each priority bucket. When full, an arriving packet displaces
// the newest packet of the lowest non-empty priority below its own; if there
// is none, the arriving packet is refused with QueueOverflow. Never blocks
// the producer.
class OutboundQueue {
public:
    struct Config {
        size_t capacity{1024};
        SchedulingPolicy policy{SchedulingPolicy::StrictPriority};
    };

    explicit OutboundQueue(Config config);

    OutboundQueue(const OutboundQueue&) = delete;
    OutboundQueue& operator=(const OutboundQueue&) = delete;

    // On success returns the displaced packet, if one was shed
    [[nodiscard]] std::expected<std::optional<QueuedPacket>, core::MixnetError>
    push(QueuedPacket item);

    [[nodiscard]] std::optional<QueuedPacket> try_pop();

    // Waits up to `wait` for a packet; returns nullopt on timeout or close
    [[nodiscard]] std::optional<QueuedPacket> pop(std::chrono::milliseconds wait);

    // Wakes waiters; later pushes fail with LinkDown
    void close();
    void reopen();

    // Drops everything queued; returns how many were dropped
    size_t clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t size(Priority priority) const;
    [[nodiscard]] size_t capacity() const { return config_.capacity; }
    [[nodiscard]] size_t bytes() const { return size() * core::PACKET_LEN; }
    [[nodiscard]] uint64_t shed_count() const;
    [[nodiscard]] uint64_t refused_count() const;
    [[nodiscard]] bool closed() const;

private:
    [[nodiscard]] std::optional<QueuedPacket> pop_locked();
    [[nodiscard]] std::optional<size_t> next_bucket_locked();

    Config config_;
    std::array<std::deque<QueuedPacket>, PRIORITY_LEVELS> buckets_;
    std::array<uint32_t, PRIORITY_LEVELS> credits_{};
    size_t size_{0};
    size_t cursor_{0};
    uint64_t shed_{0};
    uint64_t refused_{0};
    bool closed_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace mixnet::policy
