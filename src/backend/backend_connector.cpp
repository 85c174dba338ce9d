//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// backend/backend_connector.cpp
//
// TCP backend connector
//===----------------------------------------------------------------------===//

#include "backend/backend_connector.hpp"
#include "network/io_context_pool.hpp"
#include "network/tcp_transport.hpp"
#include "protocol/pg/pg_message_writer.hpp"
#include "logging/logger.hpp"

namespace pgmux {

TcpBackendConnector::TcpBackendConnector(IoContextPool& io_pool, BackendEndpoint endpoint,
                                         std::shared_ptr<CredentialProvider> credentials)
    : io_pool_(io_pool)
    , endpoint_(std::move(endpoint))
    , credentials_(std::move(credentials)) {
}

std::unique_ptr<BackendConnection> TcpBackendConnector::Connect(uint64_t id, const ConnectionKey& key) {
    auto transport = std::make_unique<TcpTransport>(io_pool_.GetNextIoContext());

    TimePoint start = Clock::now();
    std::error_code ec;
    transport->Connect(endpoint_.host, endpoint_.port, endpoint_.connect_timeout, ec);
    if (ec) {
        throw PoolError(ErrorKind::HandshakeFailed,
                        "could not connect to " + endpoint_.host + ":" +
                        std::to_string(endpoint_.port) + ": " + ec.message());
    }

    auto remaining = endpoint_.connect_timeout -
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    if (remaining.count() <= 0) {
        throw PoolError(ErrorKind::HandshakeFailed, "connect timeout expired before startup");
    }

    auto conn = std::make_unique<BackendConnection>(id, key, std::move(transport),
                                                    endpoint_.max_frame_size);
    std::string password = credentials_ ? credentials_->GetPassword(key) : std::string();
    conn->Handshake(password, remaining);

    LOG_DEBUG("backend", "Opened backend connection " + conn->Describe() + " in " +
              std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                  Clock::now() - start).count()) + "ms");
    return conn;
}

bool TcpBackendConnector::SendCancelRequest(int32_t backend_pid, int32_t cancel_secret) {
    TcpTransport transport(io_pool_.GetNextIoContext());

    std::error_code ec;
    transport.Connect(endpoint_.host, endpoint_.port, endpoint_.connect_timeout, ec);
    if (ec) {
        LOG_WARN("backend", "Cancel request for pid " + std::to_string(backend_pid) +
                 " not delivered: " + ec.message());
        return false;
    }

    pg::PgMessageWriter writer;
    writer.WriteCancelRequest(backend_pid, cancel_secret);
    transport.Write(writer.GetBuffer().data(), writer.GetBuffer().size(), ec);
    transport.Close();
    if (ec) {
        LOG_WARN("backend", "Cancel request for pid " + std::to_string(backend_pid) +
                 " not delivered: " + ec.message());
        return false;
    }

    LOG_DEBUG("backend", "Sent cancel request for pid " + std::to_string(backend_pid));
    return true;
}

} // namespace pgmux
