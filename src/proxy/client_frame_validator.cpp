//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// proxy/client_frame_validator.cpp
//
// Client frame validation
//===----------------------------------------------------------------------===//

#include "proxy/client_frame_validator.hpp"

namespace pgmux {

namespace {

std::string TagName(char tag) {
    if (tag >= 0x20 && tag < 0x7F) {
        return std::string("'") + tag + "'";
    }
    return "0x" + std::to_string(static_cast<unsigned char>(tag));
}

} // anonymous namespace

bool ClientFrameValidator::IsFrontendTag(char tag) {
    switch (tag) {
        case pg::FrontendMessage::Bind:
        case pg::FrontendMessage::Close:
        case pg::FrontendMessage::CopyData:
        case pg::FrontendMessage::CopyDone:
        case pg::FrontendMessage::CopyFail:
        case pg::FrontendMessage::Describe:
        case pg::FrontendMessage::Execute:
        case pg::FrontendMessage::Flush:
        case pg::FrontendMessage::FunctionCall:
        case pg::FrontendMessage::Parse:
        case pg::FrontendMessage::PasswordMessage:
        case pg::FrontendMessage::Query:
        case pg::FrontendMessage::Sync:
        case pg::FrontendMessage::Terminate:
            return true;
        default:
            return false;
    }
}

ValidationResult ClientFrameValidator::Validate(const pg::Frame& frame,
                                                const BackendProtocolState& state,
                                                std::string& error) {
    if (!IsFrontendTag(frame.tag)) {
        error = "invalid frontend message type " + TagName(frame.tag);
        return ValidationResult::Reject;
    }

    switch (frame.tag) {
        case pg::FrontendMessage::Terminate:
            return ValidationResult::Terminate;

        case pg::FrontendMessage::PasswordMessage:
            // The proxy completed authentication on the client's behalf
            error = "unexpected authentication message after startup";
            return ValidationResult::Reject;

        case pg::FrontendMessage::Sync:
        case pg::FrontendMessage::Flush:
        case pg::FrontendMessage::CopyDone:
            if (!frame.payload.empty()) {
                error = "malformed " + TagName(frame.tag) + " message";
                return ValidationResult::Reject;
            }
            break;

        case pg::FrontendMessage::Query:
            if (frame.payload.empty() || frame.payload.back() != 0) {
                error = "malformed Query message";
                return ValidationResult::Reject;
            }
            break;

        default:
            break;
    }

    bool copy_message = frame.tag == pg::FrontendMessage::CopyData ||
                        frame.tag == pg::FrontendMessage::CopyDone ||
                        frame.tag == pg::FrontendMessage::CopyFail;

    if (state.AcceptsCopyData()) {
        // Flush and Sync are ignored by the server during copy-in
        if (!copy_message && frame.tag != pg::FrontendMessage::Flush &&
            frame.tag != pg::FrontendMessage::Sync) {
            error = "unexpected message type " + TagName(frame.tag) + " during COPY from stdin";
            return ValidationResult::Reject;
        }
    } else if (copy_message) {
        error = "unexpected message type " + TagName(frame.tag) + " outside of COPY from stdin";
        return ValidationResult::Reject;
    }

    return ValidationResult::Forward;
}

} // namespace pgmux
