#pragma once

#include "mixnet/node/address_book.hpp"
#include "mixnet/topology/topology_store.hpp"
#include "mixnet/transport/link_manager.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <thread>

namespace mixnet::node {

// Periodic topology maintenance.
//
// Every round re-announces this node's links, pushes our identity and record
// plus a random sample of known ones to each Up peer, evicts expired
// topology entries, syncs the address book and lets the link manager redial.
class GossipTask {
public:
    struct Config {
        std::chrono::milliseconds interval{30000};
        size_t sample_size{10};   // foreign records pushed per peer per round
    };

    GossipTask(Config config,
               const crypto::NodeKeys& keys,
               topology::TopologyStore& topology,
               transport::LinkManager& links,
               AddressBook& address_book);
    ~GossipTask();

    GossipTask(const GossipTask&) = delete;
    GossipTask& operator=(const GossipTask&) = delete;

    void start();
    void stop();

    // Signs a fresh record of the current Up links and merges it locally
    void announce();

    // Sends our identity and record, then a sample of others, to one peer.
    // Our identity is the one the link manager currently presents.
    void push_to(const NodeId& peer);

    void gossip_round();

    // One full maintenance round
    void run_once(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Asks the background thread to run a round now
    void trigger();

    [[nodiscard]] uint64_t rounds() const { return rounds_.load(); }

private:
    void loop(std::stop_token stop);
    void sync_address_book();

    Config config_;
    const crypto::NodeKeys& keys_;
    topology::TopologyStore& topology_;
    transport::LinkManager& links_;
    AddressBook& address_book_;

    std::mutex round_mutex_;   // serializes rounds
    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool triggered_{false};
    std::atomic<uint64_t> rounds_{0};
    std::jthread thread_;
};

}  // namespace mixnet::node
