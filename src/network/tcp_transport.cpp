//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// network/tcp_transport.cpp
//
// Transport over an asio TCP socket
//===----------------------------------------------------------------------===//

#include "network/tcp_transport.hpp"
#include "logging/logger.hpp"
#include <poll.h>
#include <sys/socket.h>
#include <cerrno>

namespace pgmux {

TcpTransport::TcpTransport(asio::io_context& io_context)
    : socket_(std::make_shared<asio::ip::tcp::socket>(io_context)) {
}

TcpTransport::~TcpTransport() {
    Close();
}

void TcpTransport::Connect(const std::string& host, uint16_t port,
                           std::chrono::milliseconds timeout, std::error_code& ec) {
    asio::ip::tcp::resolver resolver(socket_->get_executor());
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return;
    }

    auto deadline = Clock::now() + timeout;
    for (const auto& entry : endpoints) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            ec = asio::error::timed_out;
            return;
        }
        if (ConnectEndpoint(entry.endpoint(), remaining, ec)) {
            remote_ = host + ":" + std::to_string(port);
            return;
        }
        LOG_DEBUG("backend", "Connect to " + entry.endpoint().address().to_string() +
                  " failed: " + ec.message());
    }
    if (!ec) {
        ec = asio::error::host_not_found;
    }
}

bool TcpTransport::ConnectEndpoint(const asio::ip::tcp::endpoint& endpoint,
                                   std::chrono::milliseconds timeout, std::error_code& ec) {
    std::error_code ignored;
    socket_->close(ignored);

    socket_->open(endpoint.protocol(), ec);
    if (ec) {
        return false;
    }

    socket_->non_blocking(true, ec);
    if (ec) {
        return false;
    }

    socket_->connect(endpoint, ec);
    if (ec == asio::error::in_progress || ec == asio::error::would_block) {
        if (!WaitReady(POLLOUT, timeout, ec)) {
            socket_->close(ignored);
            return false;
        }
        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (::getsockopt(socket_->native_handle(), SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) {
            so_error = errno;
        }
        ec = std::error_code(so_error, asio::error::get_system_category());
    }
    if (ec) {
        socket_->close(ignored);
        return false;
    }

    socket_->non_blocking(false, ec);
    if (ec) {
        socket_->close(ignored);
        return false;
    }

    socket_->set_option(asio::ip::tcp::no_delay(true), ignored);
    socket_->set_option(asio::socket_base::keep_alive(true), ignored);
    return true;
}

bool TcpTransport::WaitReady(short events, std::chrono::milliseconds timeout, std::error_code& ec) {
    struct pollfd pfd;
    pfd.fd = socket_->native_handle();
    pfd.events = events;
    pfd.revents = 0;

    auto deadline = Clock::now() + timeout;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc > 0) {
            return true;
        }
        if (rc == 0) {
            ec = asio::error::timed_out;
            return false;
        }
        if (errno != EINTR) {
            ec = std::error_code(errno, asio::error::get_system_category());
            return false;
        }
    }
}

void TcpTransport::Write(const uint8_t* data, size_t len, std::error_code& ec) {
    asio::write(*socket_, asio::buffer(data, len), ec);
}

size_t TcpTransport::ReadSome(uint8_t* data, size_t len, std::chrono::milliseconds timeout,
                              std::error_code& ec) {
    if (!WaitReady(POLLIN, timeout, ec)) {
        return 0;
    }
    return socket_->read_some(asio::buffer(data, len), ec);
}

void TcpTransport::AsyncWrite(std::vector<uint8_t> data, IoHandler handler) {
    auto buffer = std::make_shared<std::vector<uint8_t>>(std::move(data));
    auto socket = socket_;
    asio::async_write(*socket, asio::buffer(*buffer),
        [socket, buffer, handler](const std::error_code& ec, size_t bytes) {
            handler(ec, bytes);
        });
}

void TcpTransport::AsyncReadSome(uint8_t* data, size_t len, IoHandler handler) {
    auto socket = socket_;
    socket->async_read_some(asio::buffer(data, len),
        [socket, handler](const std::error_code& ec, size_t bytes) {
            handler(ec, bytes);
        });
}

void TcpTransport::Cancel() {
    auto socket = socket_;
    asio::post(socket->get_executor(), [socket]() {
        std::error_code ec;
        socket->cancel(ec);
    });
}

void TcpTransport::Close() {
    if (socket_->is_open()) {
        std::error_code ec;
        socket_->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_->close(ec);
    }
}

bool TcpTransport::IsOpen() const {
    return socket_->is_open();
}

} // namespace pgmux
