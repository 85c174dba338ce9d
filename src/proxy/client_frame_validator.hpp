//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// proxy/client_frame_validator.hpp
//
// Structural checks on client frames before they reach a backend
//===----------------------------------------------------------------------===//

#pragma once

#include "backend/backend_protocol_state.hpp"
#include "protocol/pg/pg_frame.hpp"
#include <string>

namespace pgmux {

enum class ValidationResult {
    Forward,    // relay to the backend
    Terminate,  // client ended the session
    Reject      // protocol violation, session must end
};

class ClientFrameValidator {
public:
    // Check one post-startup client frame against the backend's current
    // protocol state. On Reject, error holds the message for the client.
    static ValidationResult Validate(const pg::Frame& frame,
                                     const BackendProtocolState& state,
                                     std::string& error);

    static bool IsFrontendTag(char tag);
};

} // namespace pgmux
