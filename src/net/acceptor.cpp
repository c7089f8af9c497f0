#include "mixnet/net/acceptor.hpp"
#include <boost/asio/ip/tcp.hpp>

namespace mixnet::net {

// TcpAcceptor implementation
TcpAcceptor::TcpAcceptor(asio::io_context& io_context)
    : io_context_(io_context)
    , acceptor_(io_context) {}

TcpAcceptor::~TcpAcceptor() {
    close();
}

std::expected<void, AcceptorError> TcpAcceptor::listen(
    const std::string& address, uint16_t port, int backlog) {
    if (listening_) {
        return std::unexpected(AcceptorError::AlreadyListening);
    }

    boost::system::error_code ec;
    auto endpoint = tcp::endpoint(asio::ip::make_address(address, ec), port);
    if (ec) {
        return std::unexpected(AcceptorError::BindFailed);
    }

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return std::unexpected(AcceptorError::BindFailed);
    }

    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) {
        acceptor_.close(ec);
        return std::unexpected(AcceptorError::BindFailed);
    }

    acceptor_.listen(backlog, ec);
    if (ec) {
        acceptor_.close(ec);
        return std::unexpected(AcceptorError::ListenFailed);
    }

    listening_ = true;
    return {};
}

void TcpAcceptor::async_accept(AcceptHandler handler) {
    if (!listening_) {
        handler(std::unexpected(AcceptorError::NotListening));
        return;
    }

    auto socket = std::make_shared<tcp::socket>(io_context_);
    acceptor_.async_accept(*socket, [this, socket, handler](boost::system::error_code ec) {
        if (ec == asio::error::operation_aborted) {
            handler(std::unexpected(AcceptorError::Closed));
            return;
        }
        if (ec) {
            handler(std::unexpected(AcceptorError::AcceptFailed));
        } else {
            auto conn = std::make_shared<TcpConnection>(io_context_);
            conn->accept(std::move(*socket));
            handler(conn);
        }
        if (accept_loop_running_ && listening_) {
            async_accept(handler);
        }
    });
}

void TcpAcceptor::start_accept_loop(AcceptHandler handler) {
    accept_loop_running_ = true;
    async_accept(std::move(handler));
}

void TcpAcceptor::stop() {
    accept_loop_running_ = false;
    listening_ = false;
    boost::system::error_code ec;
    acceptor_.cancel(ec);
}

void TcpAcceptor::close() {
    stop();
    boost::system::error_code ec;
    acceptor_.close(ec);
}

std::string TcpAcceptor::local_address() const {
    if (!acceptor_.is_open()) return "";
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    if (ec) return "";
    return endpoint.address().to_string();
}

uint16_t TcpAcceptor::local_port() const {
    if (!acceptor_.is_open()) return 0;
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    if (ec) return 0;
    return endpoint.port();
}

std::string acceptor_error_message(AcceptorError err) {
    switch (err) {
        case AcceptorError::BindFailed: return "Failed to bind address";
        case AcceptorError::ListenFailed: return "Failed to listen";
        case AcceptorError::AcceptFailed: return "Failed to accept connection";
        case AcceptorError::AlreadyListening: return "Already listening";
        case AcceptorError::NotListening: return "Not listening";
        case AcceptorError::Closed: return "Acceptor closed";
        default: return "Unknown acceptor error";
    }
}

}  // namespace mixnet::net
