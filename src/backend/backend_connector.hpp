//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// backend/backend_connector.hpp
//
// Opens authenticated backend connections and sends cancel requests
//===----------------------------------------------------------------------===//

#pragma once

#include "backend/backend_connection.hpp"
#include "backend/credential_provider.hpp"

namespace pgmux {

class BackendConnector {
public:
    virtual ~BackendConnector() = default;

    // Connect and complete the handshake. Throws PoolError(HandshakeFailed).
    // Called on executor threads.
    virtual std::unique_ptr<BackendConnection> Connect(uint64_t id, const ConnectionKey& key) = 0;

    // Deliver a CancelRequest on a short-lived side connection
    virtual bool SendCancelRequest(int32_t backend_pid, int32_t cancel_secret) = 0;
};

struct BackendEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 5432;
    std::chrono::milliseconds connect_timeout{5000};
    size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
};

class TcpBackendConnector : public BackendConnector {
public:
    TcpBackendConnector(IoContextPool& io_pool, BackendEndpoint endpoint,
                        std::shared_ptr<CredentialProvider> credentials);

    std::unique_ptr<BackendConnection> Connect(uint64_t id, const ConnectionKey& key) override;
    bool SendCancelRequest(int32_t backend_pid, int32_t cancel_secret) override;

    const BackendEndpoint& GetEndpoint() const { return endpoint_; }

private:
    IoContextPool& io_pool_;
    BackendEndpoint endpoint_;
    std::shared_ptr<CredentialProvider> credentials_;
};

} // namespace pgmux
