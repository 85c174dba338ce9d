//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// network/tcp_server.hpp
//
// Client listener: accepts connections and starts proxy sessions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/server_config.hpp"
#include <asio.hpp>

namespace pgmux {

class IoContextPool;
class PoolManager;
class SessionRegistry;

class TcpServer {
public:
    TcpServer(const ServerConfig& config,
              std::shared_ptr<IoContextPool> io_pool,
              std::shared_ptr<PoolManager> pool,
              std::shared_ptr<SessionRegistry> registry);
    ~TcpServer();

    // Non-copyable
    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Bind and listen; throws std::system_error when the address is unusable
    void Start();
    void Stop();

    bool IsRunning() const { return running_; }

    // Bound port, useful when configured with port 0
    uint16_t GetPort() const { return bound_port_; }

    // Statistics
    size_t GetConnectionCount() const;
    uint64_t GetTotalConnections() const { return total_connections_; }
    uint64_t GetTotalBytesReceived() const { return total_bytes_received_; }
    uint64_t GetTotalBytesSent() const { return total_bytes_sent_; }

    void AddBytesReceived(size_t bytes) { total_bytes_received_ += bytes; }
    void AddBytesSent(size_t bytes) { total_bytes_sent_ += bytes; }

private:
    void DoAccept();

private:
    ServerConfig config_;
    std::shared_ptr<IoContextPool> io_pool_;
    std::shared_ptr<PoolManager> pool_;
    std::shared_ptr<SessionRegistry> registry_;

    asio::io_context acceptor_io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread acceptor_thread_;
    std::atomic<bool> running_;
    uint16_t bound_port_ = 0;

    std::atomic<uint64_t> total_connections_;
    std::atomic<uint64_t> total_bytes_received_;
    std::atomic<uint64_t> total_bytes_sent_;
};

} // namespace pgmux
