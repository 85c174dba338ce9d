//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// proxy/proxy_session.hpp
//
// One client connection: startup, backend lease, bidirectional relay
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "pool/pool_manager.hpp"
#include "protocol/pg/pg_frame.hpp"
#include "protocol/pg/pg_message_reader.hpp"
#include "proxy/session_registry.hpp"
#include <asio.hpp>
#include <array>

namespace pgmux {

class TcpServer;

class ProxySession : public ClientSession, public std::enable_shared_from_this<ProxySession> {
public:
    using Ptr = std::shared_ptr<ProxySession>;

    struct Options {
        std::chrono::milliseconds acquire_timeout{5000};
        size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
    };

    static Ptr Create(asio::ip::tcp::socket socket_p,
                      TcpServer* server_p,
                      std::shared_ptr<PoolManager> pool_p,
                      std::shared_ptr<SessionRegistry> registry_p,
                      const Options& options_p);

    ~ProxySession() override;

    void Start();

    // Safe from any thread
    void Close() override;

    bool CancelBackendQuery() override;

    std::string GetRemoteAddress() const;
    uint16_t GetRemotePort() const;

private:
    enum class Phase {
        Startup,    // reading the startup packet
        Acquiring,  // waiting for a backend lease
        Relaying,
        Closing,    // waiting for backend I/O to drain
        Closed
    };

    ProxySession(asio::ip::tcp::socket socket_p,
                 TcpServer* server_p,
                 std::shared_ptr<PoolManager> pool_p,
                 std::shared_ptr<SessionRegistry> registry_p,
                 const Options& options_p);

    // Client side
    void DoRead();
    void ProcessClientData();
    bool HandleStartupPacket(const pg::Frame& frame);
    void Send(std::vector<uint8_t> data);
    void DoWrite();

    // Backend side
    void BeginAcquire(const pg::StartupMessage& startup);
    void OnAcquired(AcquireResult result);
    void ForwardToBackend(std::vector<pg::Frame> frames, bool terminate_after);
    void OnBackendWrite(const std::error_code& ec);
    void DoBackendRead();
    void OnBackendRead(const std::error_code& ec, size_t bytes);

    // Teardown
    void Fail(const std::string& sqlstate, const std::string& message, ReleaseOutcome outcome);
    void Finish(ReleaseOutcome outcome);
    void MaybeReleaseLease();
    void CloseSocket();

private:
    asio::ip::tcp::socket socket;
    TcpServer* server;
    std::shared_ptr<PoolManager> pool;
    std::shared_ptr<SessionRegistry> registry;
    Options options;

    Phase phase = Phase::Startup;
    std::string key_description;

    // Proxy-issued cancel key
    CancelKey cancel_key;
    bool registered = false;

    pg::FrameDecoder decoder;
    std::array<uint8_t, DEFAULT_READ_BUFFER_SIZE> read_buffer;

    std::vector<std::vector<uint8_t>> write_queue;
    std::vector<std::vector<uint8_t>> write_batch;  // Owned by DoWrite, holds data during async_write
    std::mutex write_mutex;
    bool writing = false;
    bool close_after_write = false;
    bool socket_closed = false;

    PoolManager::WaiterId waiter_id = 0;
    Lease lease;
    ReleaseOutcome release_outcome = ReleaseOutcome::Clean;
    bool backend_read_pending = false;
    bool backend_write_pending = false;
    bool resume_backend_read = false;
    bool terminate_after_write = false;

    // Backend key of the current lease, read by CancelBackendQuery
    std::atomic<int32_t> backend_pid;
    std::atomic<int32_t> backend_secret;
};

} // namespace pgmux
