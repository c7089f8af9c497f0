#pragma once

#include <utility>  // must precede Boost.Asio 1.74 (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace mixnet::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Connection error types
enum class ConnectionError {
    NotConnected,
    ConnectionFailed,
    ConnectionRefused,
    ConnectionReset,
    Timeout,
    HostUnreachable,
    NetworkUnreachable,
    AddressInUse,
    ReadError,
    WriteError,
    Closed,
    InvalidAddress,
};

// Connection state
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Closing,
    Closed,
    Error,
};

// Blocking, ordered byte stream. Transport links speak their protocol over
// this; TCP in production, in-memory pipes in tests.
//
// One thread may read while another writes; close() may be called from any
// thread and unblocks both.
class Stream {
public:
    virtual ~Stream() = default;

    [[nodiscard]] virtual std::expected<void, ConnectionError>
    read_exactly(std::span<uint8_t> buffer) = 0;

    [[nodiscard]] virtual std::expected<void, ConnectionError>
    write_all(std::span<const uint8_t> data) = 0;

    // Zero disables the timeout
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual std::string remote_endpoint() const = 0;
};

// TCP connection with blocking I/O
class TcpConnection : public Stream {
public:
    explicit TcpConnection(asio::io_context& io_context);
    ~TcpConnection() override;

    // Disable copying
    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    // Resolves and connects within the connect timeout. Runs the io_context
    // passed at construction, which must not be run by another thread.
    [[nodiscard]] std::expected<void, ConnectionError>
    connect(const std::string& host, uint16_t port);

    // Initialize from accepted socket
    void accept(tcp::socket socket);

    [[nodiscard]] std::expected<void, ConnectionError>
    read_exactly(std::span<uint8_t> buffer) override;

    [[nodiscard]] std::expected<void, ConnectionError>
    write_all(std::span<const uint8_t> data) override;

    void set_read_timeout(std::chrono::milliseconds timeout) override;
    void close() override;
    [[nodiscard]] std::string remote_endpoint() const override;

    // State queries
    [[nodiscard]] ConnectionState state() const { return state_.load(); }
    [[nodiscard]] bool is_connected() const { return state() == ConnectionState::Connected; }

    // Connection info
    [[nodiscard]] std::string remote_address() const;
    [[nodiscard]] uint16_t remote_port() const;
    [[nodiscard]] uint16_t local_port() const;

    // Set socket options
    void set_no_delay(bool enable);
    void set_keep_alive(bool enable);
    void set_write_timeout(std::chrono::milliseconds timeout);
    void set_connect_timeout(std::chrono::milliseconds timeout) { connect_timeout_ = timeout; }

private:
    asio::io_context& io_context_;
    tcp::socket socket_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::chrono::milliseconds connect_timeout_{10000};
};

// Utility
[[nodiscard]] std::string connection_error_message(ConnectionError err);
[[nodiscard]] const char* connection_state_name(ConnectionState state);

// Convert boost error to ConnectionError
[[nodiscard]] ConnectionError from_boost_error(const boost::system::error_code& ec);

// Splits "host:port" (IPv6 hosts in brackets)
[[nodiscard]] std::expected<std::pair<std::string, uint16_t>, ConnectionError>
parse_host_port(const std::string& address);

}  // namespace mixnet::net
