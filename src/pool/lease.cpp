//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// pool/lease.cpp
//
// Lease ownership transfer
//===----------------------------------------------------------------------===//

#include "pool/lease.hpp"
#include "pool/pool_manager.hpp"

namespace pgmux {

Lease::Lease(std::shared_ptr<PoolManager> pool, std::unique_ptr<BackendConnection> connection)
    : pool_(std::move(pool))
    , connection_(std::move(connection)) {
}

Lease::~Lease() {
    Abandon();
}

Lease::Lease(Lease&& other) noexcept
    : pool_(std::move(other.pool_))
    , connection_(std::move(other.connection_)) {
}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Abandon();
        pool_ = std::move(other.pool_);
        connection_ = std::move(other.connection_);
    }
    return *this;
}

std::unique_ptr<BackendConnection> Lease::Take() {
    pool_.reset();
    return std::move(connection_);
}

void Lease::Abandon() {
    if (connection_ && pool_) {
        std::shared_ptr<PoolManager> pool = std::move(pool_);
        pool->ReleaseAbandoned(std::move(connection_));
    }
    pool_.reset();
    connection_.reset();
}

} // namespace pgmux
