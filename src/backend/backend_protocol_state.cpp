//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// backend/backend_protocol_state.cpp
//
// Backend session state tracking
//===----------------------------------------------------------------------===//

#include "backend/backend_protocol_state.hpp"
#include "protocol/pg/pg_message_reader.hpp"

namespace pgmux {

const char* CopyStateToString(CopyState state) {
    switch (state) {
        case CopyState::None:     return "none";
        case CopyState::CopyIn:   return "copy-in";
        case CopyState::CopyOut:  return "copy-out";
        case CopyState::CopyBoth: return "copy-both";
    }
    return "unknown";
}

void BackendProtocolState::OnFrameSent(char tag) {
    switch (tag) {
        case pg::FrontendMessage::Query:
        case pg::FrontendMessage::FunctionCall:
            pending_ready_++;
            break;

        case pg::FrontendMessage::Sync:
            // Ignored by the backend while copy-in is active
            if (!AcceptsCopyData()) {
                pending_ready_++;
                unsynced_ = false;
            }
            break;

        case pg::FrontendMessage::Parse:
        case pg::FrontendMessage::Bind:
        case pg::FrontendMessage::Describe:
        case pg::FrontendMessage::Execute:
        case pg::FrontendMessage::Close:
        case pg::FrontendMessage::Flush:
            if (!AcceptsCopyData()) {
                unsynced_ = true;
            }
            break;

        case pg::FrontendMessage::CopyDone:
        case pg::FrontendMessage::CopyFail:
            if (copy_state_ == CopyState::CopyIn) {
                copy_state_ = CopyState::None;
            } else if (copy_state_ == CopyState::CopyBoth) {
                copy_state_ = CopyState::CopyOut;
            }
            break;

        default:
            break;
    }
}

void BackendProtocolState::OnFrameReceived(const pg::Frame& frame) {
    switch (frame.tag) {
        case pg::BackendMessage::ReadyForQuery: {
            char status = pg::TransactionStatus::Idle;
            pg::PgMessageReader reader(frame.payload);
            if (reader.ReadReadyForQuery(status)) {
                transaction_status_ = status;
            }
            if (pending_ready_ > 0) {
                pending_ready_--;
            }
            copy_state_ = CopyState::None;
            break;
        }

        case pg::BackendMessage::CopyInResponse:
            copy_state_ = CopyState::CopyIn;
            break;

        case pg::BackendMessage::CopyOutResponse:
            copy_state_ = CopyState::CopyOut;
            break;

        case pg::BackendMessage::CopyBothResponse:
            copy_state_ = CopyState::CopyBoth;
            break;

        case pg::BackendMessage::CopyDone:
            if (copy_state_ == CopyState::CopyOut) {
                copy_state_ = CopyState::None;
            } else if (copy_state_ == CopyState::CopyBoth) {
                copy_state_ = CopyState::CopyIn;
            }
            break;

        case pg::BackendMessage::ErrorResponse: {
            pg::ErrorFields fields;
            pg::PgMessageReader reader(frame.payload);
            if (reader.ReadErrorFields(fields) && fields.IsFatal()) {
                saw_fatal_ = true;
            }
            // An error ends copy-out at once; copy-in ends at the next ReadyForQuery
            if (copy_state_ == CopyState::CopyOut) {
                copy_state_ = CopyState::None;
            }
            break;
        }

        default:
            break;
    }
}

void BackendProtocolState::Reset() {
    transaction_status_ = pg::TransactionStatus::Idle;
    pending_ready_ = 0;
    unsynced_ = false;
    copy_state_ = CopyState::None;
    saw_fatal_ = false;
}

} // namespace pgmux
