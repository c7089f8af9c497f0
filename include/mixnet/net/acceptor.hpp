#pragma once

#include "mixnet/net/connection.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace mixnet::net {

// Acceptor error types
enum class AcceptorError {
    BindFailed,
    ListenFailed,
    AcceptFailed,
    AlreadyListening,
    NotListening,
    Closed,
};

// Accepted connection handler
using AcceptHandler = std::function<void(
    std::expected<std::shared_ptr<TcpConnection>, AcceptorError>
)>;

// TCP connection acceptor. The accept loop runs on the io_context passed at
// construction; accepted connections are then used with blocking I/O.
class TcpAcceptor {
public:
    explicit TcpAcceptor(asio::io_context& io_context);
    ~TcpAcceptor();

    // Disable copying
    TcpAcceptor(const TcpAcceptor&) = delete;
    TcpAcceptor& operator=(const TcpAcceptor&) = delete;

    // Start listening on address:port; port 0 picks a free port
    [[nodiscard]] std::expected<void, AcceptorError>
    listen(const std::string& address, uint16_t port, int backlog = 128);

    // Accept loop (calls handler for each connection until stopped)
    void start_accept_loop(AcceptHandler handler);

    // Stop accepting
    void stop();

    // Close acceptor
    void close();

    // State queries
    [[nodiscard]] bool is_listening() const { return listening_; }

    // Listening info
    [[nodiscard]] std::string local_address() const;
    [[nodiscard]] uint16_t local_port() const;

private:
    void async_accept(AcceptHandler handler);

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    std::atomic<bool> listening_{false};
    std::atomic<bool> accept_loop_running_{false};
};

// Utility
[[nodiscard]] std::string acceptor_error_message(AcceptorError err);

}  // namespace mixnet::net
