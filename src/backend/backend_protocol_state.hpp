//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// backend/backend_protocol_state.hpp
//
// Tracks where a backend session is in the message exchange so the pool can
// tell whether it is safe to hand to another client
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/pg/pg_frame.hpp"
#include "protocol/pg/pg_protocol.hpp"

namespace pgmux {

enum class CopyState {
    None,
    CopyIn,    // backend expects CopyData from the client
    CopyOut,   // backend streams CopyData to the client
    CopyBoth   // streaming replication
};

const char* CopyStateToString(CopyState state);

class BackendProtocolState {
public:
    BackendProtocolState() = default;

    // Frame written to the backend
    void OnFrameSent(char tag);

    // Frame read from the backend
    void OnFrameReceived(const pg::Frame& frame);

    // Status byte of the latest ReadyForQuery
    char GetTransactionStatus() const { return transaction_status_; }
    bool InTransaction() const { return transaction_status_ != pg::TransactionStatus::Idle; }

    // No request awaiting ReadyForQuery, no unsynced extended-query messages,
    // no copy in progress
    bool AtBoundary() const {
        return pending_ready_ == 0 && !unsynced_ && copy_state_ == CopyState::None;
    }

    int PendingReadyForQuery() const { return pending_ready_; }
    bool HasUnsyncedMessages() const { return unsynced_; }

    CopyState GetCopyState() const { return copy_state_; }
    bool AcceptsCopyData() const {
        return copy_state_ == CopyState::CopyIn || copy_state_ == CopyState::CopyBoth;
    }

    // Backend reported FATAL or PANIC; the session is going away
    bool SawFatalError() const { return saw_fatal_; }

    void Reset();

private:
    char transaction_status_ = pg::TransactionStatus::Idle;
    int pending_ready_ = 0;
    bool unsynced_ = false;
    CopyState copy_state_ = CopyState::None;
    bool saw_fatal_ = false;
};

} // namespace pgmux
