//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// proxy/proxy_session.cpp
//
// Client session: startup, backend lease, bidirectional relay
//===----------------------------------------------------------------------===//

#include "proxy/proxy_session.hpp"
#include "proxy/client_frame_validator.hpp"
#include "network/tcp_server.hpp"
#include "protocol/pg/pg_message_writer.hpp"
#include "logging/logger.hpp"

namespace pgmux {

ProxySession::Ptr ProxySession::Create(asio::ip::tcp::socket socket_p,
                                       TcpServer* server_p,
                                       std::shared_ptr<PoolManager> pool_p,
                                       std::shared_ptr<SessionRegistry> registry_p,
                                       const Options& options_p) {
    return Ptr(new ProxySession(std::move(socket_p), server_p, std::move(pool_p),
                                std::move(registry_p), options_p));
}

ProxySession::ProxySession(asio::ip::tcp::socket socket_p,
                           TcpServer* server_p,
                           std::shared_ptr<PoolManager> pool_p,
                           std::shared_ptr<SessionRegistry> registry_p,
                           const Options& options_p)
    : socket(std::move(socket_p))
    , server(server_p)
    , pool(std::move(pool_p))
    , registry(std::move(registry_p))
    , options(options_p)
    , decoder(options_p.max_frame_size)
    , backend_pid(0)
    , backend_secret(0) {
}

ProxySession::~ProxySession() {
    if (registered) {
        registry->Unregister(cancel_key);
    }
    if (lease) {
        pool->Release(std::move(lease), ReleaseOutcome::Dirty);
    }
    asio::error_code ec;
    socket.close(ec);
    LOG_DEBUG("proxy", "Session destroyed");
}

void ProxySession::Start() {
    if (!registry->Register(shared_from_this(), cancel_key)) {
        LOG_WARN("proxy", "Session limit reached, rejecting " + GetRemoteAddress());
        Fail(pg::SqlState::TooManyConnections, "sorry, too many clients already",
             ReleaseOutcome::Clean);
        return;
    }
    registered = true;

    LOG_INFO("proxy", "New client connection from " + GetRemoteAddress() + ":" +
             std::to_string(GetRemotePort()));

    DoRead();
}

void ProxySession::Close() {
    auto self = shared_from_this();
    asio::post(socket.get_executor(), [this, self]() {
        Fail(pg::SqlState::AdminShutdown, "terminating connection due to administrator command",
             ReleaseOutcome::Clean);
    });
}

bool ProxySession::CancelBackendQuery() {
    int32_t pid = backend_pid.load();
    int32_t secret = backend_secret.load();
    if (pid == 0) {
        return false;
    }
    LOG_DEBUG("proxy", "Forwarding cancel request to backend pid " + std::to_string(pid));
    return pool->Cancel(pid, secret);
}

std::string ProxySession::GetRemoteAddress() const {
    asio::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

uint16_t ProxySession::GetRemotePort() const {
    asio::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return 0;
    }
    return endpoint.port();
}

//===----------------------------------------------------------------------===//
// Client side
//===----------------------------------------------------------------------===//

void ProxySession::DoRead() {
    if (socket_closed || phase == Phase::Closing || phase == Phase::Closed) return;

    auto self = shared_from_this();
    socket.async_read_some(
        asio::buffer(read_buffer),
        [this, self](std::error_code ec, std::size_t bytes_read) {
            if (ec) {
                if (ec != asio::error::operation_aborted &&
                    ec != asio::error::eof) {
                    LOG_DEBUG("proxy", "Client read error: " + ec.message());
                }
                Finish(ReleaseOutcome::Clean);
                return;
            }

            if (phase == Phase::Closing || phase == Phase::Closed) {
                return;
            }

            if (server) {
                server->AddBytesReceived(bytes_read);
            }

            decoder.Feed(read_buffer.data(), bytes_read);
            ProcessClientData();
        });
}

void ProxySession::ProcessClientData() {
    while (phase == Phase::Startup) {
        auto result = decoder.Next(true);
        if (result.status == pg::DecodeStatus::NeedMoreData) {
            DoRead();
            return;
        }
        if (result.status == pg::DecodeStatus::MalformedFrame) {
            Fail(pg::SqlState::ProtocolViolation, "invalid startup packet: " + result.error,
                 ReleaseOutcome::Clean);
            return;
        }
        if (!HandleStartupPacket(result.frame)) {
            return;
        }
    }

    if (phase != Phase::Relaying) {
        return;
    }

    // Validate against the state the backend will be in once the frames
    // ahead of each one have been sent
    BackendProtocolState projected = lease->ProtocolState();
    std::vector<pg::Frame> frames;
    bool terminate = false;
    while (!terminate) {
        auto result = decoder.Next(false);
        if (result.status == pg::DecodeStatus::NeedMoreData) {
            break;
        }
        if (result.status == pg::DecodeStatus::MalformedFrame) {
            Fail(pg::SqlState::ProtocolViolation, "invalid frontend message: " + result.error,
                 ReleaseOutcome::Clean);
            return;
        }

        std::string error;
        switch (ClientFrameValidator::Validate(result.frame, projected, error)) {
            case ValidationResult::Forward:
                projected.OnFrameSent(result.frame.tag);
                frames.push_back(std::move(result.frame));
                break;
            case ValidationResult::Terminate:
                terminate = true;
                break;
            case ValidationResult::Reject:
                LOG_WARN("proxy", "Rejecting client " + GetRemoteAddress() + ": " + error);
                Fail(pg::SqlState::ProtocolViolation, error, ReleaseOutcome::Clean);
                return;
        }
    }

    if (!frames.empty()) {
        // Next client read starts when the backend has taken these
        ForwardToBackend(std::move(frames), terminate);
        return;
    }
    if (terminate) {
        LOG_DEBUG("proxy", "Client sent Terminate");
        Finish(ReleaseOutcome::Clean);
        return;
    }
    DoRead();
}

bool ProxySession::HandleStartupPacket(const pg::Frame& frame) {
    pg::StartupMessage startup;
    pg::PgMessageReader reader(frame.payload.data(), frame.payload.size());
    if (!reader.ReadStartupMessage(startup)) {
        Fail(pg::SqlState::ProtocolViolation, "invalid startup packet layout",
             ReleaseOutcome::Clean);
        return false;
    }

    if (startup.IsSSLRequest() || startup.IsGSSEncRequest()) {
        if (decoder.HasPartialFrame()) {
            Fail(pg::SqlState::ProtocolViolation,
                 "received unencrypted data after encryption request", ReleaseOutcome::Clean);
            return false;
        }
        LOG_DEBUG("proxy", std::string(startup.IsSSLRequest() ? "SSL" : "GSSAPI") +
                  " encryption request declined");
        Send(std::vector<uint8_t>{'N'});
        return true;
    }

    if (startup.IsCancelRequest()) {
        // No reply, success or not
        bool found = registry->CancelQuery(startup.cancel_pid, startup.cancel_secret_key);
        LOG_DEBUG("proxy", "Cancel request for session " + std::to_string(startup.cancel_pid) +
                  (found ? " forwarded" : " matched no session"));
        Finish(ReleaseOutcome::Clean);
        return false;
    }

    int32_t major = pg::ProtocolMajor(startup.protocol_version);
    int32_t minor = pg::ProtocolMinor(startup.protocol_version);
    if (major != 3) {
        Fail(pg::SqlState::FeatureNotSupported,
             "unsupported frontend protocol " + std::to_string(major) + "." +
             std::to_string(minor) + ": server supports 3.0 to 3.0",
             ReleaseOutcome::Clean);
        return false;
    }

    if (startup.GetUser().empty()) {
        Fail(pg::SqlState::InvalidAuthorization,
             "no PostgreSQL user name specified in startup packet", ReleaseOutcome::Clean);
        return false;
    }

    std::vector<std::string> unrecognized;
    for (const auto& kv : startup.parameters) {
        if (kv.first.compare(0, 5, "_pq_.") == 0) {
            unrecognized.push_back(kv.first);
        }
    }
    if (minor > 0 || !unrecognized.empty()) {
        pg::PgMessageWriter writer;
        writer.WriteNegotiateProtocolVersion(0, unrecognized);
        Send(writer.TakeBuffer());
    }

    BeginAcquire(startup);
    return false;
}

void ProxySession::Send(std::vector<uint8_t> data) {
    if (socket_closed || data.empty()) return;

    bool should_write = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex);
        write_queue.push_back(std::move(data));

        if (!writing) {
            writing = true;
            should_write = true;
        }
    }

    if (should_write) {
        auto self = shared_from_this();
        asio::dispatch(socket.get_executor(), [this, self]() {
            DoWrite();
        });
    }
}

void ProxySession::DoWrite() {
    if (socket_closed) return;

    auto self = shared_from_this();

    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex);
        if (write_queue.empty()) {
            writing = false;
            drained = true;
        } else {
            write_batch.clear();
            std::swap(write_batch, write_queue);
        }
    }

    if (drained) {
        if (close_after_write) {
            CloseSocket();
        } else if (resume_backend_read) {
            resume_backend_read = false;
            DoBackendRead();
        }
        return;
    }

    std::vector<asio::const_buffer> buffers;
    buffers.reserve(write_batch.size());
    for (const auto& buf : write_batch) {
        buffers.emplace_back(asio::buffer(buf));
    }

    asio::async_write(
        socket,
        buffers,
        [this, self](std::error_code ec, std::size_t bytes_written) {
            write_batch.clear();

            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    LOG_DEBUG("proxy", "Client write error: " + ec.message());
                }
                Finish(ReleaseOutcome::Clean);
                CloseSocket();
                return;
            }

            if (server) {
                server->AddBytesSent(bytes_written);
            }

            DoWrite();
        });
}

//===----------------------------------------------------------------------===//
// Backend side
//===----------------------------------------------------------------------===//

void ProxySession::BeginAcquire(const pg::StartupMessage& startup) {
    phase = Phase::Acquiring;

    ConnectionKey key = ConnectionKey::FromStartup(startup);
    key_description = key.ToString();
    LOG_DEBUG("proxy", "Acquiring backend for " + key_description);

    auto self = shared_from_this();
    auto executor = socket.get_executor();
    waiter_id = pool->AsyncAcquire(
        key, Clock::now() + options.acquire_timeout,
        [self, executor](AcquireResult result) {
            asio::post(executor, [self, result = std::move(result)]() mutable {
                self->OnAcquired(std::move(result));
            });
        });
}

void ProxySession::OnAcquired(AcquireResult result) {
    waiter_id = 0;

    if (phase != Phase::Acquiring) {
        if (result.Ok()) {
            pool->Release(std::move(result.lease), ReleaseOutcome::Clean);
        }
        return;
    }

    if (!result.Ok()) {
        LOG_WARN("proxy", "No backend for " + key_description + ": " + result.message);
        Fail(ErrorKindToSqlState(result.error), result.message, ReleaseOutcome::Clean);
        return;
    }

    lease = std::move(result.lease);
    backend_pid = lease->BackendPid();
    backend_secret = lease->CancelSecret();

    // The backend already authenticated; finish the client's startup from
    // what it reported
    pg::PgMessageWriter writer;
    writer.WriteAuthenticationOk();
    for (const auto& kv : lease->GetParameters()) {
        writer.WriteParameterStatus(kv.first, kv.second);
    }
    writer.WriteBackendKeyData(cancel_key.process_id, cancel_key.secret_key);
    writer.WriteReadyForQuery(lease->GetTransactionStatus());
    Send(writer.TakeBuffer());

    phase = Phase::Relaying;
    LOG_DEBUG("proxy", "Session for " + key_description + " bound to backend " + lease->Describe());

    DoBackendRead();
    // Frames pipelined behind the startup packet
    ProcessClientData();
}

void ProxySession::ForwardToBackend(std::vector<pg::Frame> frames, bool terminate_after) {
    backend_write_pending = true;
    terminate_after_write = terminate_after;

    auto self = shared_from_this();
    auto executor = socket.get_executor();
    lease->AsyncSendFrames(frames, [this, self, executor](const std::error_code& ec) {
        asio::post(executor, [this, self, ec]() {
            OnBackendWrite(ec);
        });
    });
}

void ProxySession::OnBackendWrite(const std::error_code& ec) {
    backend_write_pending = false;

    if (ec) {
        if (lease) {
            lease->MarkBroken(ErrorKind::BackendUnavailable, "write failed: " + ec.message());
        }
        if (phase == Phase::Relaying) {
            LOG_WARN("proxy", "Backend write failed for " + key_description + ": " + ec.message());
            Fail(pg::SqlState::ConnectionFailure, "lost connection to the server",
                 ReleaseOutcome::Dirty);
        } else {
            release_outcome = ReleaseOutcome::Dirty;
            MaybeReleaseLease();
        }
        return;
    }

    if (phase != Phase::Relaying) {
        MaybeReleaseLease();
        return;
    }

    if (terminate_after_write) {
        Finish(ReleaseOutcome::Clean);
        return;
    }
    DoRead();
}

void ProxySession::DoBackendRead() {
    if (!lease || backend_read_pending) return;

    backend_read_pending = true;
    auto self = shared_from_this();
    auto executor = socket.get_executor();
    lease->AsyncRead([this, self, executor](const std::error_code& ec, size_t bytes) {
        asio::post(executor, [this, self, ec, bytes]() {
            OnBackendRead(ec, bytes);
        });
    });
}

void ProxySession::OnBackendRead(const std::error_code& ec, size_t bytes) {
    backend_read_pending = false;
    if (!lease) return;

    if (phase != Phase::Relaying) {
        // Keep the protocol state current so release can judge reuse
        if (!ec && bytes > 0) {
            std::vector<pg::Frame> dropped;
            std::string error;
            lease->ConsumeReceived(bytes, dropped, error);
        }
        MaybeReleaseLease();
        return;
    }

    if (ec) {
        lease->MarkBroken(ErrorKind::BackendUnavailable, "read failed: " + ec.message());
        LOG_WARN("proxy", "Backend connection lost for " + key_description + ": " + ec.message());
        Fail(pg::SqlState::ConnectionFailure, "server closed the connection unexpectedly",
             ReleaseOutcome::Dirty);
        return;
    }

    std::vector<pg::Frame> frames;
    std::string error;
    if (lease->ConsumeReceived(bytes, frames, error) != ErrorKind::None) {
        LOG_ERROR("proxy", "Malformed data from backend " + lease->Describe() + ": " + error);
        Fail(pg::SqlState::ConnectionFailure, "invalid message from server",
             ReleaseOutcome::Dirty);
        return;
    }

    if (!frames.empty()) {
        std::vector<uint8_t> out;
        for (const auto& frame : frames) {
            pg::AppendFrame(out, frame);
        }
        Send(std::move(out));
    }

    // Stop reading the backend while the client is behind
    {
        std::lock_guard<std::mutex> lock(write_mutex);
        if (writing) {
            resume_backend_read = true;
            return;
        }
    }
    DoBackendRead();
}

//===----------------------------------------------------------------------===//
// Teardown
//===----------------------------------------------------------------------===//

void ProxySession::Fail(const std::string& sqlstate, const std::string& message,
                        ReleaseOutcome outcome) {
    if (phase == Phase::Closing || phase == Phase::Closed) return;

    pg::PgMessageWriter writer;
    writer.WriteErrorResponse("FATAL", sqlstate, message);
    Send(writer.TakeBuffer());
    close_after_write = true;
    Finish(outcome);
}

void ProxySession::Finish(ReleaseOutcome outcome) {
    if (phase == Phase::Closing || phase == Phase::Closed) {
        if (outcome == ReleaseOutcome::Dirty) {
            release_outcome = ReleaseOutcome::Dirty;
        }
        return;
    }

    phase = Phase::Closing;
    release_outcome = outcome;

    if (waiter_id != 0) {
        pool->CancelAcquire(waiter_id);
        waiter_id = 0;
    }
    if (registered) {
        registry->Unregister(cancel_key);
        registered = false;
    }

    if (lease && (backend_read_pending || backend_write_pending)) {
        lease->CancelIo();
    }
    MaybeReleaseLease();

    bool flushing = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex);
        flushing = close_after_write && writing;
    }
    if (!flushing) {
        CloseSocket();
    }
}

void ProxySession::MaybeReleaseLease() {
    if (!lease || backend_read_pending || backend_write_pending) return;

    backend_pid = 0;
    backend_secret = 0;

    LOG_DEBUG("proxy", "Releasing backend " + lease->Describe() +
              (release_outcome == ReleaseOutcome::Dirty ? " (dirty)" : ""));
    pool->Release(std::move(lease), release_outcome);

    if (socket_closed) {
        phase = Phase::Closed;
    }
}

void ProxySession::CloseSocket() {
    if (socket_closed) return;
    socket_closed = true;

    asio::error_code ec;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);

    if (!lease) {
        phase = Phase::Closed;
    }
    LOG_DEBUG("proxy", "Client connection closed");
}

} // namespace pgmux
