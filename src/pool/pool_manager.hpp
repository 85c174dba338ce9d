//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// pool/pool_manager.hpp
//
// Keyed pools of backend connections under one global size budget
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "backend/backend_connector.hpp"
#include "pool/lease.hpp"
#include "pool/pool_config.hpp"
#include "pool/waiter_queue.hpp"
#include <asio.hpp>
#include <parallel_hashmap/phmap.h>
#include <deque>

namespace pgmux {

class ExecutorPool;

enum class ReleaseOutcome {
    Clean,  // session ended normally, reuse if the connection allows it
    Dirty   // relay failed, always close
};

//===----------------------------------------------------------------------===//
// PoolManager
//
// Live connections (connecting, idle, leased or being cleaned up) never
// exceed max_size. Acquire requests for a key are served in arrival order.
// Callbacks run outside the pool lock, either inline in the calling thread
// or on a pool thread.
//===----------------------------------------------------------------------===//
class PoolManager : public std::enable_shared_from_this<PoolManager> {
public:
    using AcquireCallback = std::function<void(AcquireResult)>;
    using WaiterId = uint64_t;

    struct Stats {
        uint64_t total_created = 0;
        uint64_t total_destroyed = 0;
        size_t current_size = 0;
        size_t idle = 0;
        size_t leased = 0;
        size_t connecting = 0;
        size_t waiting = 0;
        size_t keys = 0;
        uint64_t acquire_count = 0;
        uint64_t acquire_timeout_count = 0;
        uint64_t handshake_failure_count = 0;
        uint64_t reaped_count = 0;
        uint64_t probe_failure_count = 0;
        uint64_t leaked_lease_count = 0;
    };

    static std::shared_ptr<PoolManager> Create(const PoolConfig& config,
                                               std::shared_ptr<BackendConnector> connector,
                                               std::shared_ptr<ExecutorPool> executor);
    ~PoolManager();

    // Non-copyable
    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    //===------------------------------------------------------------------===//
    // Acquire
    //===------------------------------------------------------------------===//

    // Callback runs exactly once. A deadline at or before now means the
    // caller will not queue behind the size budget.
    WaiterId AsyncAcquire(const ConnectionKey& key, TimePoint deadline, AcquireCallback callback);

    // Blocking forms
    AcquireResult Acquire(const ConnectionKey& key);
    AcquireResult Acquire(const ConnectionKey& key, std::chrono::milliseconds timeout);
    AcquireResult TryAcquire(const ConnectionKey& key);

    // Withdraw a queued request; its callback receives Cancelled
    bool CancelAcquire(WaiterId id);

    //===------------------------------------------------------------------===//
    // Release
    //===------------------------------------------------------------------===//
    void Release(Lease lease, ReleaseOutcome outcome);

    //===------------------------------------------------------------------===//
    // Other operations
    //===------------------------------------------------------------------===//

    // Ask the backend to cancel the query running on the session with this
    // backend key. Does not use a slot from the budget.
    bool Cancel(int32_t backend_pid, int32_t cancel_secret);

    // Keep min_size connections of this key open
    void Prewarm(const ConnectionKey& key);

    // One pass of reaping, probing and replenishing; also run periodically
    void RunMaintenance();

    // Reject new acquires, wait up to the grace period for leases to come
    // back, close what is left
    void Shutdown();
    void Shutdown(std::chrono::milliseconds grace);

    Stats GetStats() const;
    const PoolConfig& GetConfig() const { return config_; }
    bool IsShuttingDown() const { return shutting_down_; }

private:
    friend class Lease;

    struct SubPool;

    struct Waiter {
        WaiterId id = 0;
        SubPool* subpool = nullptr;
        TimePoint enqueued_at;
        TimePoint deadline;
        AcquireCallback callback;
        std::shared_ptr<asio::steady_timer> timer;

        Waiter* queue_prev = nullptr;
        Waiter* queue_next = nullptr;
        bool queued = false;
    };

    struct SubPool {
        ConnectionKey key;
        // Most recently returned at the back
        std::deque<std::unique_ptr<BackendConnection>> idle;
        WaiterQueue<Waiter> waiters;
        size_t live = 0;
        size_t connecting = 0;
        bool warm = false;
    };

    enum class SlotState {
        Connecting,
        Idle,
        Leased,
        Cleanup,  // rollback or reset running
        Probing
    };

    struct Slot {
        SubPool* subpool = nullptr;
        SlotState state = SlotState::Connecting;
        WaiterId owner = 0;  // waiter that triggered the spawn
        int32_t backend_pid = 0;
        int32_t cancel_secret = 0;
    };

    struct SpawnRequest {
        uint64_t id;
        ConnectionKey key;
    };

    // Work collected under the lock and performed after releasing it
    struct Actions {
        std::vector<std::pair<AcquireCallback, AcquireResult>> completions;
        std::vector<std::unique_ptr<BackendConnection>> to_close;
        std::vector<SpawnRequest> spawns;
        std::vector<std::unique_ptr<BackendConnection>> to_probe;
        std::vector<std::shared_ptr<asio::steady_timer>> timers_to_cancel;
    };

private:
    PoolManager(const PoolConfig& config,
                std::shared_ptr<BackendConnector> connector,
                std::shared_ptr<ExecutorPool> executor);

    // Wakeup state shared with the maintenance thread, which may outlive the pool
    struct MaintenanceSignal {
        std::mutex mutex;
        std::condition_variable cv;
        bool stopped = false;
    };

    void Start();
    void StopThreads();
    static void MaintenanceLoop(std::weak_ptr<PoolManager> weak,
                                std::shared_ptr<MaintenanceSignal> signal,
                                std::chrono::milliseconds interval);

    WaiterId AcquireInternal(const ConnectionKey& key, TimePoint deadline,
                             bool wait_for_budget, AcquireCallback callback);

    // Locked helpers
    SubPool& GetSubPoolLocked(const ConnectionKey& key);
    bool HasBudgetLocked() const { return slots_.size() < config_.max_size; }
    void ReserveSpawnLocked(SubPool& subpool, WaiterId owner, Actions& actions);
    bool ReclaimIdleLocked(const SubPool& requester, Actions& actions);
    void ServeQueuedWaitersLocked(Actions& actions);
    bool HasStarvedKeyLocked(const SubPool* except) const;
    void ReturnToPoolLocked(std::unique_ptr<BackendConnection> conn, bool touch, Actions& actions);
    void LeaseToWaiterLocked(Waiter* waiter, std::unique_ptr<BackendConnection> conn, Actions& actions);
    Lease MakeLeaseLocked(std::unique_ptr<BackendConnection> conn);
    void FailWaiterLocked(Waiter* waiter, ErrorKind kind, const std::string& message, Actions& actions);
    AcquireCallback RemoveWaiterLocked(Waiter* waiter, Actions& actions);
    void DiscardLocked(std::unique_ptr<BackendConnection> conn, Actions& actions);
    void FreeSlotLocked(uint64_t id);
    void ScheduleRetryLocked();
    void EraseEmptySubPoolsLocked();

    void RunActions(Actions& actions);
    void ArmWaiterTimer(const std::shared_ptr<asio::steady_timer>& timer, TimePoint deadline, WaiterId id);

    // Completion paths
    void OnSpawnComplete(uint64_t id, std::unique_ptr<BackendConnection> conn,
                         ErrorKind kind, const std::string& message);
    void OnWaiterTimeout(WaiterId id);
    void OnCleanupComplete(std::unique_ptr<BackendConnection> conn, bool ok);
    void OnProbeComplete(std::unique_ptr<BackendConnection> conn, bool ok);
    void SubmitCleanup(std::unique_ptr<BackendConnection> conn);
    void SubmitProbe(std::unique_ptr<BackendConnection> conn);
    void Discard(std::unique_ptr<BackendConnection> conn, const std::string& reason);

    // Called by ~Lease for a lease that was never released
    void ReleaseAbandoned(std::unique_ptr<BackendConnection> conn) noexcept;

private:
    PoolConfig config_;
    std::shared_ptr<BackendConnector> connector_;
    std::shared_ptr<ExecutorPool> executor_;

    mutable std::mutex mutex_;
    std::condition_variable drained_cv_;

    phmap::node_hash_map<ConnectionKey, SubPool, ConnectionKeyHash> subpools_;
    phmap::flat_hash_map<uint64_t, Slot> slots_;
    phmap::flat_hash_map<int32_t, uint64_t> pid_index_;
    phmap::flat_hash_map<WaiterId, std::unique_ptr<Waiter>> waiters_;

    uint64_t next_connection_id_ = 1;
    WaiterId next_waiter_id_ = 1;

    // Spawn retry backoff after handshake failures
    uint32_t consecutive_spawn_failures_ = 0;
    TimePoint spawn_backoff_until_;
    bool retry_scheduled_ = false;

    std::atomic<bool> shutting_down_;
    std::atomic<bool> running_;

    // Waiter deadlines and spawn retries
    std::shared_ptr<asio::io_context> timer_io_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> timer_work_;
    std::shared_ptr<asio::steady_timer> retry_timer_;
    std::thread timer_thread_;

    // Reaper and health checks
    std::thread maintenance_thread_;
    std::shared_ptr<MaintenanceSignal> maintenance_signal_;

    // Statistics
    std::atomic<uint64_t> total_created_;
    std::atomic<uint64_t> total_destroyed_;
    std::atomic<uint64_t> acquire_count_;
    std::atomic<uint64_t> acquire_timeout_count_;
    std::atomic<uint64_t> handshake_failure_count_;
    std::atomic<uint64_t> reaped_count_;
    std::atomic<uint64_t> probe_failure_count_;
    std::atomic<uint64_t> leaked_lease_count_;
};

} // namespace pgmux
