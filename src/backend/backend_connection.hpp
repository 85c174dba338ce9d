//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// backend/backend_connection.hpp
//
// One authenticated session with the PostgreSQL server
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "backend/backend_protocol_state.hpp"
#include "network/transport.hpp"
#include "pool/connection_key.hpp"
#include "pool/errors.hpp"
#include "protocol/pg/pg_frame.hpp"
#include <array>
#include <map>

namespace pgmux {

namespace pg {
class ScramSha256Client;
}

enum class ConnectionState {
    Connecting,
    Idle,
    Leased,
    Broken,   // transport or protocol failure seen
    Failed,   // handshake never completed
    Closed
};

const char* ConnectionStateToString(ConnectionState state);

class BackendConnection {
public:
    using SendHandler = std::function<void(const std::error_code&)>;
    using ReadHandler = Transport::IoHandler;

    BackendConnection(uint64_t id, ConnectionKey key, std::unique_ptr<Transport> transport,
                      size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);
    ~BackendConnection();

    // Non-copyable
    BackendConnection(const BackendConnection&) = delete;
    BackendConnection& operator=(const BackendConnection&) = delete;

    //===------------------------------------------------------------------===//
    // Blocking operations, run on executor threads while no relay I/O is
    // outstanding
    //===------------------------------------------------------------------===//

    // StartupMessage, authentication, parameter collection up to the first
    // ReadyForQuery. Throws PoolError(HandshakeFailed).
    void Handshake(const std::string& password, std::chrono::milliseconds timeout);

    // Simple query; false on ErrorResponse, I/O failure or timeout
    bool ExecuteSimple(const std::string& sql, std::chrono::milliseconds timeout,
                       std::string& error);

    // ROLLBACK an open transaction; true when the session is idle afterwards
    bool Rollback(std::chrono::milliseconds timeout);

    // Run the configured reset query
    bool Reset(const std::string& reset_query, std::chrono::milliseconds timeout);

    // Liveness probe
    bool Ping(std::chrono::milliseconds timeout);

    // Send Terminate and close; never throws
    void Terminate();

    void Close();

    //===------------------------------------------------------------------===//
    // Relay I/O
    //===------------------------------------------------------------------===//

    // Read into the connection's buffer; pass the byte count to ConsumeReceived
    void AsyncRead(ReadHandler handler);

    // Decode received bytes and update the protocol state. Returns
    // MalformedFrame when the stream is corrupt.
    ErrorKind ConsumeReceived(size_t bytes, std::vector<pg::Frame>& frames, std::string& error);

    // Write client frames, recording them in the protocol state
    void AsyncSendFrames(const std::vector<pg::Frame>& frames, SendHandler handler);

    // Abort outstanding relay I/O
    void CancelIo();

    //===------------------------------------------------------------------===//
    // State
    //===------------------------------------------------------------------===//
    uint64_t Id() const { return id_; }
    const ConnectionKey& Key() const { return key_; }

    ConnectionState GetState() const { return state_; }
    void MarkLeased();
    void MarkIdle(TimePoint now);
    void MarkChecked(TimePoint now) { last_checked_at_ = now; }
    void MarkBroken(ErrorKind kind, const std::string& reason);

    // Open, healthy, at a message boundary with nothing half-read
    bool IsReusable() const;
    bool IsOpen() const;

    int32_t BackendPid() const { return backend_pid_; }
    int32_t CancelSecret() const { return cancel_secret_; }

    TimePoint CreatedAt() const { return created_at_; }
    TimePoint LastUsedAt() const { return last_used_at_; }
    TimePoint LastCheckedAt() const { return last_checked_at_; }
    uint64_t UseCount() const { return use_count_; }

    ErrorKind LastError() const { return last_error_; }
    const std::string& LastErrorMessage() const { return last_error_message_; }

    // ParameterStatus values reported by the backend, kept current while relaying
    const std::map<std::string, std::string>& GetParameters() const { return parameters_; }

    const BackendProtocolState& ProtocolState() const { return protocol_; }
    char GetTransactionStatus() const { return protocol_.GetTransactionStatus(); }
    bool InTransaction() const { return protocol_.InTransaction(); }

    std::string Describe() const;

private:
    void SendBlocking(const std::vector<uint8_t>& bytes);
    pg::Frame ReceiveFrame(TimePoint deadline);
    void HandleAuthentication(const pg::Frame& frame, const std::string& password,
                              bool& authenticated);
    void RecordParameter(const pg::Frame& frame);

private:
    uint64_t id_;
    ConnectionKey key_;
    std::unique_ptr<Transport> transport_;

    ConnectionState state_ = ConnectionState::Connecting;
    ErrorKind last_error_ = ErrorKind::None;
    std::string last_error_message_;

    int32_t backend_pid_ = 0;
    int32_t cancel_secret_ = 0;

    TimePoint created_at_;
    TimePoint last_used_at_;
    TimePoint last_checked_at_;
    uint64_t use_count_ = 0;

    std::map<std::string, std::string> parameters_;

    pg::FrameDecoder decoder_;
    BackendProtocolState protocol_;

    // SCRAM exchange in progress during Handshake
    std::unique_ptr<pg::ScramSha256Client> scram_;

    std::array<uint8_t, DEFAULT_READ_BUFFER_SIZE> read_buffer_;
};

} // namespace pgmux
