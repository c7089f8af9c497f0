#pragma once

#include "memory_stream.hpp"
#include "mixnet/transport/transport_link.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mixnet::test {

// Dialer over in-memory pipes. Each address maps to an accept callback that
// receives the server end of the pipe; unknown or refused addresses fail
// with ConnectionRefused.
class MockDialer : public transport::Dialer {
public:
    using AcceptFn = std::function<void(std::unique_ptr<net::Stream>)>;

    void listen(const std::string& address, AcceptFn accept) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_[address] = std::move(accept);
    }

    // Refuse the next n dials
    void fail_next(int n) { fail_next_.store(n); }

    // Refuse every dial to address and close the pipes already open to it
    void sever(const std::string& address) {
        std::vector<std::shared_ptr<ByteChannel>> closing;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refused_.insert(address);
            for (auto& [addr, channels] : open_) {
                if (addr == address) {
                    closing.insert(closing.end(), channels.begin(), channels.end());
                }
            }
            open_.erase(address);
        }
        for (auto& c : closing) {
            c->close();
        }
    }

    void restore(const std::string& address) {
        std::lock_guard<std::mutex> lock(mutex_);
        refused_.erase(address);
    }

    std::expected<std::unique_ptr<net::Stream>, net::ConnectionError>
    dial(const std::string& address) override {
        dials_.fetch_add(1);
        if (fail_next_.load() > 0) {
            fail_next_.fetch_sub(1);
            return std::unexpected(net::ConnectionError::ConnectionRefused);
        }

        AcceptFn accept;
        auto a_to_b = std::make_shared<ByteChannel>();
        auto b_to_a = std::make_shared<ByteChannel>();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = listeners_.find(address);
            if (it == listeners_.end() || refused_.contains(address)) {
                return std::unexpected(net::ConnectionError::ConnectionRefused);
            }
            accept = it->second;
            open_[address].push_back(a_to_b);
            open_[address].push_back(b_to_a);
        }
        accept(std::make_unique<MemoryStream>(a_to_b, b_to_a, "dialer"));
        return std::make_unique<MemoryStream>(b_to_a, a_to_b, address);
    }

    [[nodiscard]] int dials() const { return dials_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, AcceptFn> listeners_;
    std::set<std::string> refused_;
    std::map<std::string, std::vector<std::shared_ptr<ByteChannel>>> open_;
    std::atomic<int> fail_next_{0};
    std::atomic<int> dials_{0};
};

// Wraps a real dialer so tests can cut a link at the stream level and keep
// it cut
class SeverableDialer : public transport::Dialer {
public:
    explicit SeverableDialer(transport::Dialer& inner) : inner_(inner) {}

    std::expected<std::unique_ptr<net::Stream>, net::ConnectionError>
    dial(const std::string& address) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (refused_.contains(address)) {
                return std::unexpected(net::ConnectionError::ConnectionRefused);
            }
        }
        auto stream = inner_.dial(address);
        if (!stream) {
            return std::unexpected(stream.error());
        }
        auto shared = std::shared_ptr<net::Stream>(std::move(*stream));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_[address].push_back(shared);
        }
        return std::make_unique<SharedStream>(std::move(shared));
    }

    void sever(const std::string& address) {
        std::vector<std::shared_ptr<net::Stream>> closing;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refused_.insert(address);
            for (auto& weak : open_[address]) {
                if (auto s = weak.lock()) closing.push_back(std::move(s));
            }
            open_.erase(address);
        }
        for (auto& s : closing) {
            s->close();
        }
    }

private:
    class SharedStream : public net::Stream {
    public:
        explicit SharedStream(std::shared_ptr<net::Stream> inner) : inner_(std::move(inner)) {}
        std::expected<void, net::ConnectionError> read_exactly(std::span<uint8_t> b) override {
            return inner_->read_exactly(b);
        }
        std::expected<void, net::ConnectionError> write_all(std::span<const uint8_t> d) override {
            return inner_->write_all(d);
        }
        void set_read_timeout(std::chrono::milliseconds t) override { inner_->set_read_timeout(t); }
        void close() override { inner_->close(); }
        [[nodiscard]] std::string remote_endpoint() const override { return inner_->remote_endpoint(); }

    private:
        std::shared_ptr<net::Stream> inner_;
    };

    transport::Dialer& inner_;
    std::mutex mutex_;
    std::set<std::string> refused_;
    std::map<std::string, std::vector<std::weak_ptr<net::Stream>>> open_;
};

}  // namespace mixnet::test
