//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// backend/backend_connection.cpp
//
// Backend session: handshake, housekeeping queries and relay I/O
//===----------------------------------------------------------------------===//

#include "backend/backend_connection.hpp"
#include "protocol/pg/pg_auth.hpp"
#include "protocol/pg/pg_message_reader.hpp"
#include "protocol/pg/pg_message_writer.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace pgmux {

const char* ConnectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Idle:       return "idle";
        case ConnectionState::Leased:     return "leased";
        case ConnectionState::Broken:     return "broken";
        case ConnectionState::Failed:     return "failed";
        case ConnectionState::Closed:     return "closed";
    }
    return "unknown";
}

BackendConnection::BackendConnection(uint64_t id, ConnectionKey key,
                                     std::unique_ptr<Transport> transport,
                                     size_t max_frame_size)
    : id_(id)
    , key_(std::move(key))
    , transport_(std::move(transport))
    , created_at_(Clock::now())
    , last_used_at_(created_at_)
    , last_checked_at_(created_at_)
    , decoder_(max_frame_size) {
}

BackendConnection::~BackendConnection() {
    Close();
}

std::string BackendConnection::Describe() const {
    return "#" + std::to_string(id_) + " " + key_.ToString() +
           " (pid " + std::to_string(backend_pid_) + ")";
}

//===----------------------------------------------------------------------===//
// Handshake
//===----------------------------------------------------------------------===//

void BackendConnection::Handshake(const std::string& password, std::chrono::milliseconds timeout) {
    TimePoint deadline = Clock::now() + timeout;

    try {
        pg::PgMessageWriter writer;
        writer.WriteStartupMessage(key_.ToStartupParameters());
        SendBlocking(writer.GetBuffer());

        bool authenticated = false;
        while (true) {
            pg::Frame frame = ReceiveFrame(deadline);
            pg::PgMessageReader reader(frame.payload);

            switch (frame.tag) {
                case pg::BackendMessage::Authentication:
                    HandleAuthentication(frame, password, authenticated);
                    break;

                case pg::BackendMessage::ParameterStatus:
                    RecordParameter(frame);
                    break;

                case pg::BackendMessage::BackendKeyData:
                    if (!reader.ReadBackendKeyData(backend_pid_, cancel_secret_)) {
                        throw PoolError(ErrorKind::MalformedFrame, "malformed BackendKeyData");
                    }
                    break;

                case pg::BackendMessage::NoticeResponse: {
                    pg::ErrorFields fields;
                    if (reader.ReadErrorFields(fields)) {
                        LOG_DEBUG("backend", "Startup notice: " + fields.ToString());
                    }
                    break;
                }

                case pg::BackendMessage::NegotiateProtocolVersion:
                    LOG_DEBUG("backend", "Server negotiated protocol version down for " + Describe());
                    break;

                case pg::BackendMessage::ErrorResponse: {
                    pg::ErrorFields fields;
                    reader.ReadErrorFields(fields);
                    throw PoolError(ErrorKind::HandshakeFailed, "server rejected startup: " +
                                    fields.ToString());
                }

                case pg::BackendMessage::ReadyForQuery:
                    if (!authenticated) {
                        throw PoolError(ErrorKind::HandshakeFailed,
                                        "ReadyForQuery before authentication completed");
                    }
                    protocol_.Reset();
                    protocol_.OnFrameReceived(frame);
                    scram_.reset();
                    state_ = ConnectionState::Idle;
                    last_used_at_ = last_checked_at_ = Clock::now();
                    LOG_DEBUG("backend", "Handshake complete for " + Describe());
                    return;

                default:
                    throw PoolError(ErrorKind::HandshakeFailed,
                                    std::string("unexpected message '") + frame.tag +
                                    "' during startup");
            }
        }
    } catch (const PoolError& e) {
        state_ = ConnectionState::Failed;
        last_error_ = ErrorKind::HandshakeFailed;
        last_error_message_ = e.what();
        scram_.reset();
        transport_->Close();
        throw PoolError(ErrorKind::HandshakeFailed, e.what());
    } catch (const std::runtime_error& e) {
        // OpenSSL failures inside the SCRAM exchange
        state_ = ConnectionState::Failed;
        last_error_ = ErrorKind::HandshakeFailed;
        last_error_message_ = e.what();
        scram_.reset();
        transport_->Close();
        throw PoolError(ErrorKind::HandshakeFailed, e.what());
    }
}

void BackendConnection::HandleAuthentication(const pg::Frame& frame, const std::string& password,
                                             bool& authenticated) {
    pg::AuthenticationRequest auth;
    pg::PgMessageReader reader(frame.payload);
    if (!reader.ReadAuthenticationRequest(auth)) {
        throw PoolError(ErrorKind::MalformedFrame, "malformed authentication request");
    }

    pg::PgMessageWriter writer;
    switch (auth.type) {
        case pg::AuthType::Ok:
            authenticated = true;
            return;

        case pg::AuthType::CleartextPassword:
            if (password.empty()) {
                throw PoolError(ErrorKind::HandshakeFailed,
                                "server requested a password but none is configured for " +
                                key_.user);
            }
            writer.WritePasswordMessage(password);
            break;

        case pg::AuthType::MD5Password:
            if (auth.data.size() < 4) {
                throw PoolError(ErrorKind::MalformedFrame, "MD5 request without salt");
            }
            if (password.empty()) {
                throw PoolError(ErrorKind::HandshakeFailed,
                                "server requested a password but none is configured for " +
                                key_.user);
            }
            writer.WritePasswordMessage(pg::ComputeMD5Password(key_.user, password, auth.data.data()));
            break;

        case pg::AuthType::SASL: {
            std::vector<std::string> mechanisms;
            pg::PgMessageReader mech_reader(auth.data);
            mech_reader.ReadSaslMechanisms(mechanisms);
            if (std::find(mechanisms.begin(), mechanisms.end(), pg::SCRAM_SHA_256) == mechanisms.end()) {
                throw PoolError(ErrorKind::HandshakeFailed, "no supported SASL mechanism offered");
            }
            // The server takes the user name from the startup packet
            scram_ = std::make_unique<pg::ScramSha256Client>("", password);
            writer.WriteSASLInitialResponse(pg::SCRAM_SHA_256, scram_->ClientFirstMessage());
            break;
        }

        case pg::AuthType::SASLContinue: {
            if (!scram_) {
                throw PoolError(ErrorKind::HandshakeFailed, "SASLContinue without SASL exchange");
            }
            std::string client_final;
            std::string error;
            std::string server_first(auth.data.begin(), auth.data.end());
            if (!scram_->HandleServerFirst(server_first, client_final, error)) {
                throw PoolError(ErrorKind::HandshakeFailed, error);
            }
            writer.WriteSASLResponse(client_final);
            break;
        }

        case pg::AuthType::SASLFinal: {
            if (!scram_) {
                throw PoolError(ErrorKind::HandshakeFailed, "SASLFinal without SASL exchange");
            }
            std::string error;
            std::string server_final(auth.data.begin(), auth.data.end());
            if (!scram_->VerifyServerFinal(server_final, error)) {
                throw PoolError(ErrorKind::HandshakeFailed, error);
            }
            return;
        }

        default:
            throw PoolError(ErrorKind::HandshakeFailed,
                            "unsupported authentication method " + std::to_string(auth.type));
    }

    SendBlocking(writer.GetBuffer());
}

void BackendConnection::RecordParameter(const pg::Frame& frame) {
    std::string name;
    std::string value;
    pg::PgMessageReader reader(frame.payload);
    if (reader.ReadParameterStatus(name, value)) {
        parameters_[name] = value;
    }
}

//===----------------------------------------------------------------------===//
// Blocking I/O
//===----------------------------------------------------------------------===//

void BackendConnection::SendBlocking(const std::vector<uint8_t>& bytes) {
    std::error_code ec;
    transport_->Write(bytes.data(), bytes.size(), ec);
    if (ec) {
        throw PoolError(ErrorKind::BackendUnavailable, "write to backend failed: " + ec.message());
    }
}

pg::Frame BackendConnection::ReceiveFrame(TimePoint deadline) {
    while (true) {
        pg::DecodeResult result = decoder_.Next();
        if (result.Ok()) {
            return std::move(result.frame);
        }
        if (result.status == pg::DecodeStatus::MalformedFrame) {
            throw PoolError(ErrorKind::MalformedFrame, "malformed backend frame: " + result.error);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            throw PoolError(ErrorKind::BackendUnavailable, "timed out waiting for backend");
        }

        std::error_code ec;
        size_t n = transport_->ReadSome(read_buffer_.data(), read_buffer_.size(), remaining, ec);
        if (ec) {
            throw PoolError(ErrorKind::BackendUnavailable, "read from backend failed: " + ec.message());
        }
        decoder_.Feed(read_buffer_.data(), n);
    }
}

bool BackendConnection::ExecuteSimple(const std::string& sql, std::chrono::milliseconds timeout,
                                      std::string& error) {
    if (!IsOpen()) {
        error = "connection is closed";
        return false;
    }

    bool ok = true;
    try {
        pg::PgMessageWriter writer;
        writer.WriteQuery(sql);
        SendBlocking(writer.GetBuffer());
        protocol_.OnFrameSent(pg::FrontendMessage::Query);

        TimePoint deadline = Clock::now() + timeout;
        while (true) {
            pg::Frame frame = ReceiveFrame(deadline);
            protocol_.OnFrameReceived(frame);

            if (frame.tag == pg::BackendMessage::ErrorResponse) {
                pg::ErrorFields fields;
                pg::PgMessageReader reader(frame.payload);
                reader.ReadErrorFields(fields);
                error = fields.ToString();
                ok = false;
            } else if (frame.tag == pg::BackendMessage::ParameterStatus) {
                RecordParameter(frame);
            } else if (frame.tag == pg::BackendMessage::CopyInResponse ||
                       frame.tag == pg::BackendMessage::CopyBothResponse) {
                MarkBroken(ErrorKind::BackendUnavailable, "unexpected COPY during '" + sql + "'");
                error = last_error_message_;
                return false;
            } else if (frame.tag == pg::BackendMessage::ReadyForQuery) {
                break;
            }
        }
    } catch (const PoolError& e) {
        MarkBroken(e.Kind(), e.what());
        error = e.what();
        return false;
    }

    if (protocol_.SawFatalError()) {
        MarkBroken(ErrorKind::BackendUnavailable, error);
        return false;
    }
    return ok;
}

bool BackendConnection::Rollback(std::chrono::milliseconds timeout) {
    std::string error;
    if (!ExecuteSimple("ROLLBACK", timeout, error)) {
        LOG_WARN("backend", "ROLLBACK failed on " + Describe() + ": " + error);
        return false;
    }
    return !protocol_.InTransaction();
}

bool BackendConnection::Reset(const std::string& reset_query, std::chrono::milliseconds timeout) {
    std::string error;
    if (!ExecuteSimple(reset_query, timeout, error)) {
        LOG_WARN("backend", "Reset query failed on " + Describe() + ": " + error);
        return false;
    }
    return !protocol_.InTransaction();
}

bool BackendConnection::Ping(std::chrono::milliseconds timeout) {
    std::string error;
    if (!ExecuteSimple("SELECT 1", timeout, error)) {
        LOG_DEBUG("backend", "Probe failed on " + Describe() + ": " + error);
        return false;
    }
    return true;
}

void BackendConnection::Terminate() {
    if (transport_->IsOpen() && state_ != ConnectionState::Failed) {
        pg::PgMessageWriter writer;
        writer.WriteTerminate();
        std::error_code ec;
        transport_->Write(writer.GetBuffer().data(), writer.GetBuffer().size(), ec);
        if (ec) {
            LOG_DEBUG("backend", "Terminate not delivered to " + Describe() + ": " + ec.message());
        }
    }
    Close();
}

void BackendConnection::Close() {
    transport_->Close();
    if (state_ != ConnectionState::Failed) {
        state_ = ConnectionState::Closed;
    }
}

//===----------------------------------------------------------------------===//
// Relay I/O
//===----------------------------------------------------------------------===//

void BackendConnection::AsyncRead(ReadHandler handler) {
    transport_->AsyncReadSome(read_buffer_.data(), read_buffer_.size(), std::move(handler));
}

ErrorKind BackendConnection::ConsumeReceived(size_t bytes, std::vector<pg::Frame>& frames,
                                             std::string& error) {
    decoder_.Feed(read_buffer_.data(), bytes);
    while (true) {
        pg::DecodeResult result = decoder_.Next();
        if (result.status == pg::DecodeStatus::NeedMoreData) {
            return ErrorKind::None;
        }
        if (result.status == pg::DecodeStatus::MalformedFrame) {
            error = "malformed backend frame: " + result.error;
            MarkBroken(ErrorKind::MalformedFrame, error);
            return ErrorKind::MalformedFrame;
        }
        protocol_.OnFrameReceived(result.frame);
        if (result.frame.tag == pg::BackendMessage::ParameterStatus) {
            RecordParameter(result.frame);
        }
        frames.push_back(std::move(result.frame));
    }
}

void BackendConnection::AsyncSendFrames(const std::vector<pg::Frame>& frames, SendHandler handler) {
    std::vector<uint8_t> bytes;
    for (const auto& frame : frames) {
        pg::AppendFrame(bytes, frame);
        protocol_.OnFrameSent(frame.tag);
    }
    transport_->AsyncWrite(std::move(bytes),
        [handler](const std::error_code& ec, size_t) {
            handler(ec);
        });
}

void BackendConnection::CancelIo() {
    transport_->Cancel();
}

//===----------------------------------------------------------------------===//
// State
//===----------------------------------------------------------------------===//

void BackendConnection::MarkLeased() {
    state_ = ConnectionState::Leased;
    use_count_++;
}

void BackendConnection::MarkIdle(TimePoint now) {
    state_ = ConnectionState::Idle;
    last_used_at_ = now;
    last_checked_at_ = now;
}

void BackendConnection::MarkBroken(ErrorKind kind, const std::string& reason) {
    if (state_ == ConnectionState::Broken || state_ == ConnectionState::Failed ||
        state_ == ConnectionState::Closed) {
        return;
    }
    state_ = ConnectionState::Broken;
    last_error_ = kind;
    last_error_message_ = reason;
    LOG_DEBUG("backend", "Connection " + Describe() + " broken: " + reason);
}

bool BackendConnection::IsOpen() const {
    return transport_->IsOpen();
}

bool BackendConnection::IsReusable() const {
    return transport_->IsOpen() &&
           (state_ == ConnectionState::Idle || state_ == ConnectionState::Leased) &&
           protocol_.AtBoundary() &&
           !protocol_.SawFatalError() &&
           !decoder_.HasPartialFrame();
}

} // namespace pgmux
