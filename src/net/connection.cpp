#include "mixnet/net/connection.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <sys/socket.h>
#include <sys/time.h>
#include <charconv>

namespace mixnet::net {

namespace {

void set_socket_timeout(tcp::socket& socket, int option, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    // Best effort: a socket without timeouts still works, it just blocks longer
    (void)::setsockopt(socket.native_handle(), SOL_SOCKET, option, &tv, sizeof(tv));
}

}  // namespace

// TcpConnection implementation
TcpConnection::TcpConnection(asio::io_context& io_context)
    : io_context_(io_context)
    , socket_(io_context) {}

TcpConnection::~TcpConnection() {
    close();
}

std::expected<void, ConnectionError> TcpConnection::connect(
    const std::string& host, uint16_t port) {
    state_ = ConnectionState::Connecting;

    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        state_ = ConnectionState::Error;
        return std::unexpected(ConnectionError::InvalidAddress);
    }

    // Async connect bounded by run_for gives the blocking call a deadline
    boost::system::error_code connect_ec = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
        [&connect_ec](const boost::system::error_code& result, const tcp::endpoint&) {
            connect_ec = result;
        });

    io_context_.restart();
    io_context_.run_for(connect_timeout_);

    if (connect_ec == asio::error::would_block) {
        socket_.close(ec);
        io_context_.restart();
        io_context_.run();
        state_ = ConnectionState::Error;
        return std::unexpected(ConnectionError::Timeout);
    }
    if (connect_ec) {
        state_ = ConnectionState::Error;
        return std::unexpected(from_boost_error(connect_ec));
    }

    state_ = ConnectionState::Connected;
    return {};
}

void TcpConnection::accept(tcp::socket socket) {
    socket_ = std::move(socket);
    state_ = ConnectionState::Connected;
}

std::expected<void, ConnectionError> TcpConnection::read_exactly(std::span<uint8_t> buffer) {
    if (!is_connected()) {
        return std::unexpected(ConnectionError::NotConnected);
    }
    boost::system::error_code ec;
    asio::read(socket_, asio::buffer(buffer.data(), buffer.size()), ec);
    if (ec) {
        return std::unexpected(from_boost_error(ec));
    }
    return {};
}

std::expected<void, ConnectionError> TcpConnection::write_all(std::span<const uint8_t> data) {
    if (!is_connected()) {
        return std::unexpected(ConnectionError::NotConnected);
    }
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
    if (ec) {
        return std::unexpected(from_boost_error(ec));
    }
    return {};
}

void TcpConnection::set_read_timeout(std::chrono::milliseconds timeout) {
    set_socket_timeout(socket_, SO_RCVTIMEO, timeout);
}

void TcpConnection::set_write_timeout(std::chrono::milliseconds timeout) {
    set_socket_timeout(socket_, SO_SNDTIMEO, timeout);
}

void TcpConnection::close() {
    auto expected = ConnectionState::Connected;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Closing)) {
        return;
    }
    boost::system::error_code ec;
    // shutdown wakes a reader blocked in another thread
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    state_ = ConnectionState::Closed;
}

std::string TcpConnection::remote_endpoint() const {
    auto addr = remote_address();
    if (addr.empty()) return "";
    return addr + ":" + std::to_string(remote_port());
}

std::string TcpConnection::remote_address() const {
    if (!socket_.is_open()) return "";
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) return "";
    return endpoint.address().to_string();
}

uint16_t TcpConnection::remote_port() const {
    if (!socket_.is_open()) return 0;
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) return 0;
    return endpoint.port();
}

uint16_t TcpConnection::local_port() const {
    if (!socket_.is_open()) return 0;
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    if (ec) return 0;
    return endpoint.port();
}

void TcpConnection::set_no_delay(bool enable) {
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(enable), ec);
}

void TcpConnection::set_keep_alive(bool enable) {
    boost::system::error_code ec;
    socket_.set_option(asio::socket_base::keep_alive(enable), ec);
}

// Utility functions
std::string connection_error_message(ConnectionError err) {
    switch (err) {
        case ConnectionError::NotConnected: return "Not connected";
        case ConnectionError::ConnectionFailed: return "Connection failed";
        case ConnectionError::ConnectionRefused: return "Connection refused";
        case ConnectionError::ConnectionReset: return "Connection reset";
        case ConnectionError::Timeout: return "Connection timeout";
        case ConnectionError::HostUnreachable: return "Host unreachable";
        case ConnectionError::NetworkUnreachable: return "Network unreachable";
        case ConnectionError::AddressInUse: return "Address in use";
        case ConnectionError::ReadError: return "Read error";
        case ConnectionError::WriteError: return "Write error";
        case ConnectionError::Closed: return "Connection closed";
        case ConnectionError::InvalidAddress: return "Invalid address";
        default: return "Unknown connection error";
    }
}

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Closing: return "Closing";
        case ConnectionState::Closed: return "Closed";
        case ConnectionState::Error: return "Error";
        default: return "Unknown";
    }
}

ConnectionError from_boost_error(const boost::system::error_code& ec) {
    if (ec == asio::error::connection_refused) {
        return ConnectionError::ConnectionRefused;
    }
    if (ec == asio::error::connection_reset) {
        return ConnectionError::ConnectionReset;
    }
    if (ec == asio::error::timed_out || ec == asio::error::would_block ||
        ec == asio::error::try_again) {
        return ConnectionError::Timeout;
    }
    if (ec == asio::error::host_unreachable) {
        return ConnectionError::HostUnreachable;
    }
    if (ec == asio::error::network_unreachable) {
        return ConnectionError::NetworkUnreachable;
    }
    if (ec == asio::error::address_in_use) {
        return ConnectionError::AddressInUse;
    }
    if (ec == asio::error::eof || ec == asio::error::broken_pipe ||
        ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor ||
        ec == asio::error::not_connected || ec == asio::error::shut_down) {
        return ConnectionError::Closed;
    }
    return ConnectionError::ConnectionFailed;
}

std::expected<std::pair<std::string, uint16_t>, ConnectionError>
parse_host_port(const std::string& address) {
    std::string host;
    std::string port_str;

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
            return std::unexpected(ConnectionError::InvalidAddress);
        }
        host = address.substr(1, close - 1);
        port_str = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            return std::unexpected(ConnectionError::InvalidAddress);
        }
        host = address.substr(0, colon);
        port_str = address.substr(colon + 1);
    }

    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (host.empty() || ec != std::errc{} || ptr != port_str.data() + port_str.size() ||
        port == 0 || port > 65535) {
        return std::unexpected(ConnectionError::InvalidAddress);
    }
    return std::make_pair(host, static_cast<uint16_t>(port));
}

}  // namespace mixnet::net
