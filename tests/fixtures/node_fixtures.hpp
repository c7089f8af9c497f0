#pragma once

#include "mixnet/core/events.hpp"
#include "mixnet/core/identity.hpp"
#include "mixnet/crypto/keys.hpp"
#include "mixnet/util/config.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace mixnet::test {

namespace fs = std::filesystem;

// RAII helper for temporary test directories
struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<uint64_t> counter{0};
        path = fs::temp_directory_path() / ("mixnet_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
            std::to_string(counter.fetch_add(1)));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

inline crypto::NodeKeys make_keys() {
    auto keys = crypto::NodeKeys::generate();
    if (!keys) {
        throw std::runtime_error("key generation failed");
    }
    return std::move(*keys);
}

inline core::RelayIdentity make_identity(const crypto::NodeKeys& keys,
                                         std::vector<std::string> addresses = {"127.0.0.1:1"},
                                         uint64_t published_at = 1700000000) {
    auto identity = core::RelayIdentity::create(keys, std::move(addresses), published_at);
    if (!identity) {
        throw std::runtime_error("identity signing failed");
    }
    return std::move(*identity);
}

// A relay's keys and its signed identity
struct TestRelay {
    crypto::NodeKeys keys;
    core::RelayIdentity identity;

    explicit TestRelay(std::string address = "127.0.0.1:1")
        : keys(make_keys()), identity(make_identity(keys, {std::move(address)})) {}

    [[nodiscard]] crypto::NodeId id() const { return keys.node_id(); }
};

// Polls pred until it holds or timeout passes
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Keeps every event it sees
class RecordingSink : public core::EventSink {
public:
    void on_event(const core::Event& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    template <typename T>
    [[nodiscard]] std::vector<T> of() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        for (const auto& e : events_) {
            if (const auto* v = std::get_if<T>(&e)) out.push_back(*v);
        }
        return out;
    }

    template <typename T>
    [[nodiscard]] size_t count() const { return of<T>().size(); }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<core::Event> events_;
};

// Loopback node settings with short timers
inline util::Config fast_config(const std::string& nickname, const fs::path& data_dir) {
    util::Config cfg;
    cfg.node.nickname = nickname;
    cfg.node.data_dir = data_dir;
    cfg.node.listen_address = "127.0.0.1";
    cfg.node.listen_port = 0;
    cfg.admission.difficulty_bits = 4;
    cfg.topology.gossip_interval = std::chrono::seconds(1);
    cfg.link.max_failures = 2;
    cfg.link.backoff_initial = std::chrono::milliseconds(20);
    cfg.link.backoff_max = std::chrono::milliseconds(100);
    cfg.link.handshake_timeout = std::chrono::milliseconds(2000);
    cfg.circuit.open_timeout = std::chrono::milliseconds(3000);
    cfg.circuit.rto = std::chrono::milliseconds(100);
    cfg.circuit.max_retries = 5;
    cfg.logging.level = "warn";
    return cfg;
}

}  // namespace mixnet::test
