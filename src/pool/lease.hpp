//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// pool/lease.hpp
//
// Exclusive, move-only right to use one backend connection
//===----------------------------------------------------------------------===//

#pragma once

#include "backend/backend_connection.hpp"

namespace pgmux {

class PoolManager;

//===----------------------------------------------------------------------===//
// Lease
//
// Give it back with PoolManager::Release. A lease destroyed without being
// released is treated as a Dirty release and counted as leaked.
//===----------------------------------------------------------------------===//
class Lease {
public:
    Lease() = default;
    Lease(std::shared_ptr<PoolManager> pool, std::unique_ptr<BackendConnection> connection);
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    BackendConnection* Get() const { return connection_.get(); }
    BackendConnection* operator->() const { return connection_.get(); }
    BackendConnection& operator*() const { return *connection_; }

    explicit operator bool() const { return connection_ != nullptr; }

    uint64_t ConnectionId() const { return connection_ ? connection_->Id() : 0; }

private:
    friend class PoolManager;

    // Hand the connection back to the pool; leaves the lease empty
    std::unique_ptr<BackendConnection> Take();

    void Abandon();

private:
    std::shared_ptr<PoolManager> pool_;
    std::unique_ptr<BackendConnection> connection_;
};

//===----------------------------------------------------------------------===//
// AcquireResult - a lease or the reason none was granted
//===----------------------------------------------------------------------===//
struct AcquireResult {
    Lease lease;
    ErrorKind error = ErrorKind::None;
    std::string message;

    AcquireResult() = default;
    explicit AcquireResult(Lease lease_p) : lease(std::move(lease_p)) {}
    AcquireResult(ErrorKind error_p, std::string message_p)
        : error(error_p), message(std::move(message_p)) {}

    bool Ok() const { return static_cast<bool>(lease); }
};

} // namespace pgmux
