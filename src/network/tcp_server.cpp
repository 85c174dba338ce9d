//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// network/tcp_server.cpp
//
// TCP server implementation
//===----------------------------------------------------------------------===//

#include "network/tcp_server.hpp"
#include "network/io_context_pool.hpp"
#include "pool/pool_manager.hpp"
#include "proxy/proxy_session.hpp"
#include "proxy/session_registry.hpp"
#include "logging/logger.hpp"

namespace pgmux {

TcpServer::TcpServer(const ServerConfig& config,
                     std::shared_ptr<IoContextPool> io_pool,
                     std::shared_ptr<PoolManager> pool,
                     std::shared_ptr<SessionRegistry> registry)
    : config_(config)
    , io_pool_(std::move(io_pool))
    , pool_(std::move(pool))
    , registry_(std::move(registry))
    , acceptor_(acceptor_io_context_)
    , running_(false)
    , total_connections_(0)
    , total_bytes_received_(0)
    , total_bytes_sent_(0) {
}

TcpServer::~TcpServer() {
    Stop();
}

void TcpServer::Start() {
    if (running_) {
        return;
    }

    asio::ip::tcp::endpoint endpoint(
        asio::ip::make_address(config_.host),
        config_.port
    );

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;

    if (!io_pool_->IsRunning()) {
        io_pool_->Start();
    }

    DoAccept();

    // Run acceptor in its own thread
    acceptor_thread_ = std::thread([this]() {
        acceptor_io_context_.run();
    });

    LOG_INFO("server", "PgMux listening on " + config_.host + ":" + std::to_string(bound_port_) +
             ", backend " + config_.backend_host + ":" + std::to_string(config_.backend_port));
}

void TcpServer::Stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    // Stop accepting
    asio::error_code ec;
    acceptor_.close(ec);
    acceptor_io_context_.stop();

    if (acceptor_thread_.joinable()) {
        acceptor_thread_.join();
    }

    // Sessions release their leases as they close
    size_t active = registry_->GetActiveSessionCount();
    if (active > 0) {
        LOG_INFO("server", "Closing " + std::to_string(active) + " client sessions");
    }
    registry_->CloseAll();

    LOG_INFO("server", "PgMux listener stopped (" + std::to_string(total_connections_.load()) +
             " connections served)");
}

size_t TcpServer::GetConnectionCount() const {
    return registry_->GetActiveSessionCount();
}

void TcpServer::DoAccept() {
    if (!running_) {
        return;
    }

    asio::io_context& io_context = io_pool_->GetNextIoContext();
    auto socket = std::make_shared<asio::ip::tcp::socket>(io_context);

    acceptor_.async_accept(*socket,
        [this, socket](const asio::error_code& ec) {
            if (ec) {
                if (running_) {
                    LOG_WARN("server", "Accept error: " + ec.message());
                    DoAccept();
                }
                return;
            }

            // Over the limit the session itself answers with 53300
            asio::error_code opt_ec;
            socket->set_option(asio::ip::tcp::no_delay(true), opt_ec);

            ProxySession::Options options;
            options.acquire_timeout = std::chrono::milliseconds(config_.pool_acquire_timeout_ms);
            options.max_frame_size = static_cast<size_t>(config_.max_frame_size);

            auto session = ProxySession::Create(std::move(*socket), this, pool_, registry_, options);
            total_connections_++;
            session->Start();

            DoAccept();
        });
}

} // namespace pgmux
