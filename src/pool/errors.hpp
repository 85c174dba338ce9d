//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// pool/errors.hpp
//
// Error kinds reported by the backend and pool layers
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/pg/pg_protocol.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace pgmux {

enum class ErrorKind : uint8_t {
    None = 0,
    MalformedFrame,      // codec-level, fatal to the connection producing it
    HandshakeFailed,     // authentication or negotiation failure
    PoolExhausted,       // no slot and caller opted out of waiting
    AcquireTimeout,      // waiter deadline elapsed
    BackendUnavailable,  // liveness probe or backend I/O failed
    PoolShuttingDown,
    Cancelled            // queued waiter cancelled by its owner
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "None";
        case ErrorKind::MalformedFrame:     return "MalformedFrame";
        case ErrorKind::HandshakeFailed:    return "HandshakeFailed";
        case ErrorKind::PoolExhausted:      return "PoolExhausted";
        case ErrorKind::AcquireTimeout:     return "AcquireTimeout";
        case ErrorKind::BackendUnavailable: return "BackendUnavailable";
        case ErrorKind::PoolShuttingDown:   return "PoolShuttingDown";
        case ErrorKind::Cancelled:          return "Cancelled";
    }
    return "Unknown";
}

// SQLSTATE sent to a client whose session fails with the given kind
inline const char* ErrorKindToSqlState(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedFrame:     return pg::SqlState::ProtocolViolation;
        case ErrorKind::HandshakeFailed:    return pg::SqlState::UnableToEstablishConnection;
        case ErrorKind::PoolExhausted:      return pg::SqlState::TooManyConnections;
        case ErrorKind::AcquireTimeout:     return pg::SqlState::TooManyConnections;
        case ErrorKind::BackendUnavailable: return pg::SqlState::UnableToEstablishConnection;
        case ErrorKind::PoolShuttingDown:   return pg::SqlState::CannotConnectNow;
        case ErrorKind::Cancelled:          return pg::SqlState::QueryCanceled;
        case ErrorKind::None:               break;
    }
    return pg::SqlState::InternalError;
}

//===----------------------------------------------------------------------===//
// PoolError - thrown inside the backend layer, converted to an AcquireResult
// at the pool boundary
//===----------------------------------------------------------------------===//
class PoolError : public std::runtime_error {
public:
    PoolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace pgmux
