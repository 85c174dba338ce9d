//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// network/tcp_transport.hpp
//
// Transport over an asio TCP socket
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/transport.hpp"
#include <asio.hpp>
#include <memory>

namespace pgmux {

class TcpTransport : public Transport {
public:
    explicit TcpTransport(asio::io_context& io_context);
    ~TcpTransport() override;

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Resolve and connect, trying each address until one succeeds
    void Connect(const std::string& host, uint16_t port,
                 std::chrono::milliseconds timeout, std::error_code& ec);

    void Write(const uint8_t* data, size_t len, std::error_code& ec) override;
    size_t ReadSome(uint8_t* data, size_t len, std::chrono::milliseconds timeout,
                    std::error_code& ec) override;
    void AsyncWrite(std::vector<uint8_t> data, IoHandler handler) override;
    void AsyncReadSome(uint8_t* data, size_t len, IoHandler handler) override;
    void Cancel() override;
    void Close() override;
    bool IsOpen() const override;
    std::string Describe() const override { return remote_; }

private:
    bool ConnectEndpoint(const asio::ip::tcp::endpoint& endpoint,
                         std::chrono::milliseconds timeout, std::error_code& ec);

    // poll() the native handle for the given events
    bool WaitReady(short events, std::chrono::milliseconds timeout, std::error_code& ec);

private:
    // Shared so posted cancellations never outlive the socket
    std::shared_ptr<asio::ip::tcp::socket> socket_;
    std::string remote_;
};

} // namespace pgmux
