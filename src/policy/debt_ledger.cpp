#include "mixnet/policy/debt_ledger.hpp"
#include <algorithm>

namespace mixnet::policy {

bool DebtLedger::within_limit(const crypto::NodeId& neighbor) const {
    if (config_.limit == 0) {
        return true;
    }
    std::lock_guard lock(mutex_);
    auto it = entries_.find(neighbor);
    return it == entries_.end() || it->second.net() < static_cast<int64_t>(config_.limit);
}

void DebtLedger::record_incoming(const crypto::NodeId& neighbor) {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[neighbor];
    entry.neighbor = neighbor;
    ++entry.incoming;
}

void DebtLedger::record_outgoing(const crypto::NodeId& neighbor) {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[neighbor];
    entry.neighbor = neighbor;
    ++entry.outgoing;
}

std::optional<DebtBalance> DebtLedger::balance(const crypto::NodeId& neighbor) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(neighbor);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DebtBalance> DebtLedger::balances() const {
    std::vector<DebtBalance> out;
    {
        std::lock_guard lock(mutex_);
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            out.push_back(entry);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const DebtBalance& a, const DebtBalance& b) { return a.neighbor < b.neighbor; });
    return out;
}

}  // namespace mixnet::policy
