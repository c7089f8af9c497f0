#pragma once

#include "mixnet/crypto/keys.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mixnet::policy {

// Packets relayed between us and one directly linked neighbour. `incoming`
// counts packets we accepted from it for relaying, `outgoing` packets we
// handed to it. A positive net is what the neighbour owes us.
struct DebtBalance {
    crypto::NodeId neighbor;
    uint64_t incoming{0};
    uint64_t outgoing{0};

    [[nodiscard]] int64_t net() const {
        return static_cast<int64_t>(incoming) - static_cast<int64_t>(outgoing);
    }
};

// Per-neighbour relaying balance. A neighbour whose net debt has reached the
// limit gets nothing more relayed until traffic we send through it evens
// the balance out. A limit of 0 only keeps accounts.
class DebtLedger {
public:
    struct Config {
        uint64_t limit{0};   // packets
    };

    explicit DebtLedger(Config config) : config_(config) {}

    [[nodiscard]] bool within_limit(const crypto::NodeId& neighbor) const;

    void record_incoming(const crypto::NodeId& neighbor);
    void record_outgoing(const crypto::NodeId& neighbor);

    [[nodiscard]] std::optional<DebtBalance> balance(const crypto::NodeId& neighbor) const;
    // Sorted by neighbour id
    [[nodiscard]] std::vector<DebtBalance> balances() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    mutable std::mutex mutex_;
    std::unordered_map<crypto::NodeId, DebtBalance> entries_;
};

}  // namespace mixnet::policy
