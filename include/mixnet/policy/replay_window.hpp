#pragma once

#include "mixnet/core/packet.hpp"
#include <chrono>
#include <cstdint>
#include <bitset>
#include <map>
#include <mutex>
#include <unordered_set>

namespace mixnet::policy {

using Clock = std::chrono::steady_clock;

struct NonceHash {
    size_t operator()(const core::PacketNonce& n) const noexcept {
        size_t h = 0;
        for (size_t i = 0; i < sizeof(size_t) && i < n.size(); ++i) {
            h = (h << 8) | n[core::NONCE_LEN - 1 - i];
        }
        return h;
    }
};

enum class ReplayVerdict {
    Fresh,      // recorded now
    Replayed,   // seen before
    Expired,    // epoch outside the accepted range
    Full,       // epoch bucket at capacity; nothing recorded
};

[[nodiscard]] const char* replay_verdict_name(ReplayVerdict verdict);

// Record of seen nonces for one ingress link, bucketed by the epoch each
// nonce claims.
//
// A nonce is accepted only while its epoch is within `slack` of the current
// one, and its bucket is kept until exactly that stops being true. Every key
// that could still be accepted is therefore remembered, so a replay is
// rejected whenever it arrives. Memory is bounded by (2 * slack + 1)
// buckets of `capacity` nonces; a full bucket refuses new nonces instead of
// forgetting old ones.
class ReplayWindow {
public:
    struct Config {
        size_t capacity{65536};   // nonces per epoch
        uint32_t slack{core::PACKET_EPOCH_SLACK};
    };

    explicit ReplayWindow(Config config);

    [[nodiscard]] ReplayVerdict check_and_insert(const core::PacketNonce& nonce,
                                                 uint32_t epoch,
                                                 uint32_t current_epoch);

    [[nodiscard]] bool contains(const core::PacketNonce& nonce, uint32_t epoch) const;

    // Drops buckets that can no longer accept anything
    void expire(uint32_t current_epoch);

    // Number of nonces currently remembered
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t buckets() const;
    [[nodiscard]] bool empty() const { return size() == 0; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] bool acceptable(uint32_t epoch, uint32_t current_epoch) const;
    void expire_locked(uint32_t current_epoch);

    Config config_;
    std::map<uint32_t, std::unordered_set<core::PacketNonce, NonceHash>> buckets_;
    mutable std::mutex mutex_;
};

// Sliding anti-replay window over a monotonically assigned 64-bit counter.
// Counters more than WIDTH behind the highest accepted one are refused, so
// nothing inside the window is ever forgotten. Not thread-safe.
class SequenceWindow {
public:
    static constexpr size_t WIDTH = 1024;

    // True if the counter is new and has been recorded
    [[nodiscard]] bool check_and_insert(uint64_t counter);

    [[nodiscard]] uint64_t highest() const { return highest_; }

private:
    bool any_{false};
    uint64_t highest_{0};
    std::bitset<WIDTH> seen_;   // bit (counter % WIDTH)
};

}  // namespace mixnet::policy
