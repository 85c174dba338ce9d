//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// pool/pool_manager.cpp
//
// Pool manager implementation
//===----------------------------------------------------------------------===//

#include "pool/pool_manager.hpp"
#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <future>

namespace pgmux {

namespace {

std::string Millis(Duration d) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(d).count()) + "ms";
}

void JoinOrDetach(std::thread& thread) {
    if (!thread.joinable()) {
        return;
    }
    if (thread.get_id() == std::this_thread::get_id()) {
        thread.detach();
    } else {
        thread.join();
    }
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Lifecycle
//===----------------------------------------------------------------------===//

std::shared_ptr<PoolManager> PoolManager::Create(const PoolConfig& config,
                                                 std::shared_ptr<BackendConnector> connector,
                                                 std::shared_ptr<ExecutorPool> executor) {
    std::shared_ptr<PoolManager> pool(new PoolManager(config, std::move(connector),
                                                      std::move(executor)));
    pool->Start();
    return pool;
}

PoolManager::PoolManager(const PoolConfig& config,
                         std::shared_ptr<BackendConnector> connector,
                         std::shared_ptr<ExecutorPool> executor)
    : config_(config)
    , connector_(std::move(connector))
    , executor_(std::move(executor))
    , shutting_down_(false)
    , running_(false)
    , timer_io_(std::make_shared<asio::io_context>())
    , maintenance_signal_(std::make_shared<MaintenanceSignal>())
    , total_created_(0)
    , total_destroyed_(0)
    , acquire_count_(0)
    , acquire_timeout_count_(0)
    , handshake_failure_count_(0)
    , reaped_count_(0)
    , probe_failure_count_(0)
    , leaked_lease_count_(0) {
}

PoolManager::~PoolManager() {
    Shutdown(std::chrono::milliseconds(0));
}

void PoolManager::Start() {
    running_ = true;

    timer_work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(*timer_io_));
    retry_timer_ = std::make_shared<asio::steady_timer>(*timer_io_);

    // Both threads can run the last Lease destructor, so neither may rely on `this`
    std::shared_ptr<asio::io_context> io = timer_io_;
    timer_thread_ = std::thread([io]() {
        io->run();
    });

    std::weak_ptr<PoolManager> weak = weak_from_this();
    std::shared_ptr<MaintenanceSignal> signal = maintenance_signal_;
    std::chrono::milliseconds interval = config_.health_check_interval;
    maintenance_thread_ = std::thread([weak, signal, interval]() {
        MaintenanceLoop(weak, signal, interval);
    });

    LOG_INFO("pool", "Pool started (min_size=" + std::to_string(config_.min_size) +
             ", max_size=" + std::to_string(config_.max_size) +
             ", transaction_policy=" + TransactionPolicyToString(config_.transaction_policy) + ")");
}

void PoolManager::StopThreads() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(maintenance_signal_->mutex);
        maintenance_signal_->stopped = true;
    }
    maintenance_signal_->cv.notify_all();
    JoinOrDetach(maintenance_thread_);

    timer_work_.reset();
    timer_io_->stop();
    JoinOrDetach(timer_thread_);
}

void PoolManager::MaintenanceLoop(std::weak_ptr<PoolManager> weak,
                                  std::shared_ptr<MaintenanceSignal> signal,
                                  std::chrono::milliseconds interval) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(signal->mutex);
            signal->cv.wait_for(lock, interval, [&signal]() {
                return signal->stopped;
            });
            if (signal->stopped) {
                return;
            }
        }

        // Dropping the last reference here runs the destructor on this thread
        std::shared_ptr<PoolManager> self = weak.lock();
        if (!self) {
            return;
        }
        self->RunMaintenance();
    }
}

void PoolManager::Shutdown() {
    Shutdown(config_.shutdown_grace);
}

void PoolManager::Shutdown(std::chrono::milliseconds grace) {
    Actions actions;
    bool first = !shutting_down_.exchange(true);
    size_t leased = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<Waiter*> pending;
        pending.reserve(waiters_.size());
        for (auto& kv : waiters_) {
            pending.push_back(kv.second.get());
        }
        for (Waiter* waiter : pending) {
            FailWaiterLocked(waiter, ErrorKind::PoolShuttingDown, "pool is shutting down", actions);
        }

        for (auto& kv : subpools_) {
            SubPool& subpool = kv.second;
            while (!subpool.idle.empty()) {
                std::unique_ptr<BackendConnection> conn = std::move(subpool.idle.front());
                subpool.idle.pop_front();
                DiscardLocked(std::move(conn), actions);
            }
        }
        leased = slots_.size();
    }
    RunActions(actions);

    if (first) {
        LOG_INFO("pool", "Pool shutting down, waiting up to " + Millis(grace) + " for " +
                 std::to_string(leased) + " connections");
    }

    size_t remaining = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        drained_cv_.wait_for(lock, grace, [this]() {
            return slots_.empty();
        });
        remaining = slots_.size();
    }

    StopThreads();

    if (first) {
        if (remaining > 0) {
            LOG_WARN("pool", std::to_string(remaining) +
                     " connections still in use at shutdown, they close when released");
        }
        LOG_INFO("pool", "Pool stopped");
    }
}

//===----------------------------------------------------------------------===//
// Acquire
//===----------------------------------------------------------------------===//

PoolManager::WaiterId PoolManager::AsyncAcquire(const ConnectionKey& key, TimePoint deadline,
                                                AcquireCallback callback) {
    TimePoint now = Clock::now();
    bool wait_for_budget = deadline > now;
    if (!wait_for_budget) {
        deadline = now + config_.acquire_timeout;
    }
    return AcquireInternal(key, deadline, wait_for_budget, std::move(callback));
}

AcquireResult PoolManager::Acquire(const ConnectionKey& key) {
    return Acquire(key, config_.acquire_timeout);
}

AcquireResult PoolManager::Acquire(const ConnectionKey& key, std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<AcquireResult>>();
    std::future<AcquireResult> future = promise->get_future();
    AcquireInternal(key, Clock::now() + timeout, true,
        [promise](AcquireResult result) {
            promise->set_value(std::move(result));
        });
    return future.get();
}

AcquireResult PoolManager::TryAcquire(const ConnectionKey& key) {
    auto promise = std::make_shared<std::promise<AcquireResult>>();
    std::future<AcquireResult> future = promise->get_future();
    AcquireInternal(key, Clock::now() + config_.acquire_timeout, false,
        [promise](AcquireResult result) {
            promise->set_value(std::move(result));
        });
    return future.get();
}

PoolManager::WaiterId PoolManager::AcquireInternal(const ConnectionKey& key, TimePoint deadline,
                                                   bool wait_for_budget, AcquireCallback callback) {
    Actions actions;
    WaiterId id = 0;
    acquire_count_++;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_waiter_id_++;

        if (shutting_down_) {
            actions.completions.emplace_back(std::move(callback),
                AcquireResult(ErrorKind::PoolShuttingDown, "pool is shutting down"));
        } else {
            SubPool& subpool = GetSubPoolLocked(key);

            if (subpool.waiters.Empty() && !subpool.idle.empty()) {
                // Most recently used first, its caches are warmest
                std::unique_ptr<BackendConnection> conn = std::move(subpool.idle.back());
                subpool.idle.pop_back();
                auto slot = slots_.find(conn->Id());
                if (slot != slots_.end()) {
                    slot->second.state = SlotState::Leased;
                }
                conn->MarkLeased();
                actions.completions.emplace_back(std::move(callback),
                    AcquireResult(Lease(shared_from_this(), std::move(conn))));
            } else {
                auto waiter = std::make_unique<Waiter>();
                waiter->id = id;
                waiter->subpool = &subpool;
                waiter->enqueued_at = Clock::now();
                waiter->deadline = deadline;
                waiter->callback = std::move(callback);
                waiter->timer = std::make_shared<asio::steady_timer>(*timer_io_);

                Waiter* w = waiter.get();
                waiters_.emplace(id, std::move(waiter));
                subpool.waiters.PushBack(w);

                if (subpool.waiters.Size() > subpool.connecting) {
                    if (HasBudgetLocked() || ReclaimIdleLocked(subpool, actions)) {
                        ReserveSpawnLocked(subpool, id, actions);
                    } else if (!wait_for_budget) {
                        FailWaiterLocked(w, ErrorKind::PoolExhausted,
                                         "connection pool exhausted (max_size " +
                                         std::to_string(config_.max_size) + ")", actions);
                        w = nullptr;
                    }
                }

                if (w) {
                    ArmWaiterTimer(w->timer, deadline, id);
                    LOG_DEBUG("pool", "Queued acquire " + std::to_string(id) + " for " +
                              key.ToString() + " (" + std::to_string(subpool.waiters.Size()) +
                              " waiting)");
                }
            }
        }
    }
    RunActions(actions);
    return id;
}

bool PoolManager::CancelAcquire(WaiterId id) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiters_.find(id);
        if (it == waiters_.end()) {
            return false;
        }
        FailWaiterLocked(it->second.get(), ErrorKind::Cancelled, "acquire cancelled", actions);
    }
    RunActions(actions);
    return true;
}

//===----------------------------------------------------------------------===//
// Release
//===----------------------------------------------------------------------===//

void PoolManager::Release(Lease lease, ReleaseOutcome outcome) {
    if (!lease) {
        LOG_WARN("pool", "Release of an empty lease ignored");
        return;
    }

    // Keep the pool alive until the release completes
    std::shared_ptr<PoolManager> self = lease.pool_;
    std::unique_ptr<BackendConnection> conn = lease.Take();

    if (outcome == ReleaseOutcome::Dirty) {
        Discard(std::move(conn), "released dirty");
        return;
    }
    if (!conn->IsReusable()) {
        std::string reason = conn->IsOpen() ? "not at a message boundary" : "transport closed";
        if (!conn->LastErrorMessage().empty()) {
            reason = conn->LastErrorMessage();
        }
        Discard(std::move(conn), "not reusable: " + reason);
        return;
    }

    bool in_transaction = conn->InTransaction();
    if (in_transaction && config_.transaction_policy == TransactionPolicy::Discard) {
        Discard(std::move(conn), "released inside a transaction");
        return;
    }

    if (in_transaction || !config_.reset_query.empty()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto slot = slots_.find(conn->Id());
            if (slot != slots_.end()) {
                slot->second.state = SlotState::Cleanup;
            }
        }
        SubmitCleanup(std::move(conn));
        return;
    }

    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ReturnToPoolLocked(std::move(conn), true, actions);
    }
    RunActions(actions);
}

void PoolManager::ReleaseAbandoned(std::unique_ptr<BackendConnection> conn) noexcept {
    leaked_lease_count_++;
    try {
        LOG_WARN("pool", "Lease on " + conn->Describe() + " dropped without release");
        Discard(std::move(conn), "lease leaked");
    } catch (const std::exception& e) {
        LOG_ERROR("pool", "Failed to reclaim leaked lease: " + std::string(e.what()));
    }
}

void PoolManager::Discard(std::unique_ptr<BackendConnection> conn, const std::string& reason) {
    LOG_INFO("pool", "Closing backend connection " + conn->Describe() + ": " + reason);
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        DiscardLocked(std::move(conn), actions);
        ServeQueuedWaitersLocked(actions);
    }
    RunActions(actions);
}

void PoolManager::SubmitCleanup(std::unique_ptr<BackendConnection> conn) {
    auto holder = std::make_shared<std::unique_ptr<BackendConnection>>(std::move(conn));
    std::weak_ptr<PoolManager> weak = weak_from_this();
    auto timeout = config_.probe_timeout;
    std::string reset_query = config_.reset_query;

    bool submitted = executor_->Submit([weak, holder, timeout, reset_query]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        BackendConnection& c = **holder;
        bool ok = true;
        if (c.InTransaction()) {
            ok = c.Rollback(timeout);
            LOG_DEBUG("pool", "Rolled back open transaction on " + c.Describe() +
                      (ok ? "" : " (failed)"));
        }
        if (ok && !reset_query.empty()) {
            ok = c.Reset(reset_query, timeout);
        }
        self->OnCleanupComplete(std::move(*holder), ok);
    });

    if (!submitted) {
        Discard(std::move(*holder), "executor unavailable for cleanup");
    }
}

void PoolManager::OnCleanupComplete(std::unique_ptr<BackendConnection> conn, bool ok) {
    if (!ok || !conn->IsReusable()) {
        std::string reason = "cleanup failed: " + conn->LastErrorMessage();
        Discard(std::move(conn), reason);
        return;
    }

    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ReturnToPoolLocked(std::move(conn), true, actions);
    }
    RunActions(actions);
}

//===----------------------------------------------------------------------===//
// Cancel / Prewarm / Maintenance
//===----------------------------------------------------------------------===//

bool PoolManager::Cancel(int32_t backend_pid, int32_t cancel_secret) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pid_index_.find(backend_pid);
        if (it == pid_index_.end()) {
            LOG_DEBUG("pool", "Cancel request for unknown backend pid " + std::to_string(backend_pid));
            return false;
        }
        auto slot = slots_.find(it->second);
        if (slot == slots_.end() || slot->second.cancel_secret != cancel_secret) {
            LOG_WARN("pool", "Cancel request with wrong key for backend pid " +
                     std::to_string(backend_pid));
            return false;
        }
    }

    std::shared_ptr<BackendConnector> connector = connector_;
    bool submitted = executor_->Submit([connector, backend_pid, cancel_secret]() {
        connector->SendCancelRequest(backend_pid, cancel_secret);
    });
    if (!submitted) {
        LOG_WARN("pool", "Executor unavailable, cancel for backend pid " +
                 std::to_string(backend_pid) + " dropped");
        return false;
    }

    LOG_INFO("pool", "Forwarding cancel request to backend pid " + std::to_string(backend_pid));
    return true;
}

void PoolManager::Prewarm(const ConnectionKey& key) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return;
        }
        SubPool& subpool = GetSubPoolLocked(key);
        subpool.warm = true;
        while (slots_.size() < config_.min_size && HasBudgetLocked()) {
            ReserveSpawnLocked(subpool, 0, actions);
        }
    }
    LOG_INFO("pool", "Prewarming " + key.ToString() + " with " +
             std::to_string(actions.spawns.size()) + " connections");
    RunActions(actions);
}

void PoolManager::RunMaintenance() {
    Actions actions;
    size_t reaped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return;
        }

        TimePoint now = Clock::now();
        for (auto& kv : subpools_) {
            SubPool& subpool = kv.second;
            // Front holds the least recently used connections
            for (auto it = subpool.idle.begin(); it != subpool.idle.end();) {
                BackendConnection& conn = **it;
                bool idle_expired = config_.idle_timeout.count() > 0 &&
                                    now - conn.LastUsedAt() >= config_.idle_timeout;
                bool life_expired = config_.max_connection_lifetime.count() > 0 &&
                                    now - conn.CreatedAt() >= config_.max_connection_lifetime;

                if ((idle_expired || life_expired) && slots_.size() > config_.min_size) {
                    LOG_DEBUG("pool", "Reaping " + conn.Describe() +
                              (idle_expired ? " (idle timeout)" : " (max lifetime)"));
                    std::unique_ptr<BackendConnection> victim = std::move(*it);
                    it = subpool.idle.erase(it);
                    DiscardLocked(std::move(victim), actions);
                    reaped++;
                    continue;
                }

                if (now - conn.LastCheckedAt() >= config_.health_check_interval) {
                    auto slot = slots_.find(conn.Id());
                    if (slot != slots_.end()) {
                        slot->second.state = SlotState::Probing;
                    }
                    actions.to_probe.push_back(std::move(*it));
                    it = subpool.idle.erase(it);
                    continue;
                }
                ++it;
            }
        }

        ServeQueuedWaitersLocked(actions);

        // Replenish prewarmed keys up to min_size
        if (now >= spawn_backoff_until_) {
            bool progress = true;
            while (progress && slots_.size() < config_.min_size && HasBudgetLocked()) {
                progress = false;
                for (auto& kv : subpools_) {
                    if (!kv.second.warm) {
                        continue;
                    }
                    if (slots_.size() >= config_.min_size || !HasBudgetLocked()) {
                        break;
                    }
                    ReserveSpawnLocked(kv.second, 0, actions);
                    progress = true;
                }
            }
        }

        EraseEmptySubPoolsLocked();
    }

    reaped_count_ += reaped;
    if (reaped > 0) {
        LOG_INFO("pool", "Reaped " + std::to_string(reaped) + " idle connections");
    }
    RunActions(actions);
}

void PoolManager::SubmitProbe(std::unique_ptr<BackendConnection> conn) {
    auto holder = std::make_shared<std::unique_ptr<BackendConnection>>(std::move(conn));
    std::weak_ptr<PoolManager> weak = weak_from_this();
    auto timeout = config_.probe_timeout;

    bool submitted = executor_->Submit([weak, holder, timeout]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        bool ok = (*holder)->Ping(timeout);
        self->OnProbeComplete(std::move(*holder), ok);
    });

    if (!submitted) {
        Discard(std::move(*holder), "executor unavailable for probe");
    }
}

void PoolManager::OnProbeComplete(std::unique_ptr<BackendConnection> conn, bool ok) {
    if (!ok) {
        probe_failure_count_++;
        LOG_WARN("pool", "Liveness probe failed for " + conn->Describe() + ": " +
                 conn->LastErrorMessage());
        Discard(std::move(conn), "backend unavailable");
        return;
    }

    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        conn->MarkChecked(Clock::now());
        ReturnToPoolLocked(std::move(conn), false, actions);
    }
    RunActions(actions);
}

//===----------------------------------------------------------------------===//
// Spawn completion and waiter deadlines
//===----------------------------------------------------------------------===//

void PoolManager::OnSpawnComplete(uint64_t id, std::unique_ptr<BackendConnection> conn,
                                  ErrorKind kind, const std::string& message) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            if (conn) {
                actions.to_close.push_back(std::move(conn));
            }
        } else if (!conn) {
            Slot& slot = it->second;
            WaiterId owner = slot.owner;
            std::string key = slot.subpool->key.ToString();
            FreeSlotLocked(id);

            handshake_failure_count_++;
            consecutive_spawn_failures_++;
            uint32_t shift = std::min<uint32_t>(consecutive_spawn_failures_ - 1, 10);
            std::chrono::milliseconds delay = std::min(config_.health_check_interval,
                                                       std::chrono::milliseconds(50 << shift));
            spawn_backoff_until_ = Clock::now() + delay;

            LOG_WARN("pool", "Backend connection for " + key + " failed (" +
                     ErrorKindToString(kind) + "): " + message +
                     "; retrying queued requests in " + Millis(delay));

            auto owner_it = waiters_.find(owner);
            if (owner != 0 && owner_it != waiters_.end()) {
                FailWaiterLocked(owner_it->second.get(), ErrorKind::HandshakeFailed, message, actions);
            }
            ServeQueuedWaitersLocked(actions);
        } else {
            total_created_++;
            consecutive_spawn_failures_ = 0;
            spawn_backoff_until_ = TimePoint();

            Slot& slot = it->second;
            slot.subpool->connecting--;
            slot.state = SlotState::Idle;
            slot.backend_pid = conn->BackendPid();
            slot.cancel_secret = conn->CancelSecret();
            if (slot.backend_pid != 0) {
                pid_index_[slot.backend_pid] = id;
            }

            LOG_DEBUG("pool", "Backend connection " + conn->Describe() + " ready (" +
                      std::to_string(slots_.size()) + "/" + std::to_string(config_.max_size) + ")");
            ReturnToPoolLocked(std::move(conn), true, actions);
        }
    }
    RunActions(actions);
}

void PoolManager::OnWaiterTimeout(WaiterId id) {
    Actions actions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiters_.find(id);
        if (it == waiters_.end()) {
            return;
        }
        Waiter* waiter = it->second.get();
        std::string waited = Millis(Clock::now() - waiter->enqueued_at);
        acquire_timeout_count_++;
        LOG_WARN("pool", "Acquire timeout for " + waiter->subpool->key.ToString() +
                 " after " + waited);
        FailWaiterLocked(waiter, ErrorKind::AcquireTimeout,
                         "timed out waiting for a backend connection after " + waited, actions);
    }
    RunActions(actions);
}

void PoolManager::ArmWaiterTimer(const std::shared_ptr<asio::steady_timer>& timer,
                                 TimePoint deadline, WaiterId id) {
    std::weak_ptr<PoolManager> weak = weak_from_this();
    asio::post(*timer_io_, [weak, timer, deadline, id]() {
        timer->expires_at(deadline);
        timer->async_wait([weak, id](const std::error_code& ec) {
            if (ec) {
                return;
            }
            if (auto self = weak.lock()) {
                self->OnWaiterTimeout(id);
            }
        });
    });
}

void PoolManager::ScheduleRetryLocked() {
    if (retry_scheduled_ || !running_) {
        return;
    }
    retry_scheduled_ = true;

    TimePoint when = spawn_backoff_until_;
    std::shared_ptr<asio::steady_timer> timer = retry_timer_;
    std::weak_ptr<PoolManager> weak = weak_from_this();
    asio::post(*timer_io_, [weak, timer, when]() {
        timer->expires_at(when);
        timer->async_wait([weak](const std::error_code& ec) {
            if (ec) {
                return;
            }
            auto self = weak.lock();
            if (!self) {
                return;
            }
            Actions actions;
            {
                std::lock_guard<std::mutex> lock(self->mutex_);
                self->retry_scheduled_ = false;
                self->ServeQueuedWaitersLocked(actions);
            }
            self->RunActions(actions);
        });
    });
}

//===----------------------------------------------------------------------===//
// Locked helpers
//===----------------------------------------------------------------------===//

PoolManager::SubPool& PoolManager::GetSubPoolLocked(const ConnectionKey& key) {
    auto result = subpools_.try_emplace(key);
    if (result.second) {
        result.first->second.key = key;
    }
    return result.first->second;
}

void PoolManager::ReserveSpawnLocked(SubPool& subpool, WaiterId owner, Actions& actions) {
    uint64_t id = next_connection_id_++;
    Slot slot;
    slot.subpool = &subpool;
    slot.state = SlotState::Connecting;
    slot.owner = owner;
    slots_.emplace(id, slot);
    subpool.live++;
    subpool.connecting++;
    actions.spawns.push_back(SpawnRequest{id, subpool.key});
}

bool PoolManager::ReclaimIdleLocked(const SubPool& requester, Actions& actions) {
    SubPool* victim = nullptr;
    TimePoint oldest;
    for (auto& kv : subpools_) {
        SubPool& subpool = kv.second;
        if (&subpool == &requester || subpool.idle.empty() || !subpool.waiters.Empty()) {
            continue;
        }
        TimePoint last_used = subpool.idle.front()->LastUsedAt();
        if (!victim || last_used < oldest) {
            victim = &subpool;
            oldest = last_used;
        }
    }
    if (!victim) {
        return false;
    }

    std::unique_ptr<BackendConnection> conn = std::move(victim->idle.front());
    victim->idle.pop_front();
    LOG_DEBUG("pool", "Reclaiming idle " + conn->Describe() + " for " + requester.key.ToString());
    DiscardLocked(std::move(conn), actions);
    return true;
}

void PoolManager::ServeQueuedWaitersLocked(Actions& actions) {
    if (shutting_down_) {
        return;
    }

    bool backoff = Clock::now() < spawn_backoff_until_;
    for (auto& kv : subpools_) {
        SubPool& subpool = kv.second;

        while (!subpool.waiters.Empty() && !subpool.idle.empty()) {
            std::unique_ptr<BackendConnection> conn = std::move(subpool.idle.back());
            subpool.idle.pop_back();
            LeaseToWaiterLocked(subpool.waiters.Front(), std::move(conn), actions);
        }

        while (subpool.waiters.Size() > subpool.connecting) {
            if (backoff) {
                ScheduleRetryLocked();
                break;
            }
            if (HasBudgetLocked() || ReclaimIdleLocked(subpool, actions)) {
                ReserveSpawnLocked(subpool, 0, actions);
            } else {
                break;
            }
        }
    }
}

bool PoolManager::HasStarvedKeyLocked(const SubPool* except) const {
    for (const auto& kv : subpools_) {
        const SubPool& subpool = kv.second;
        if (&subpool != except && subpool.waiters.Size() > subpool.connecting) {
            return true;
        }
    }
    return false;
}

void PoolManager::ReturnToPoolLocked(std::unique_ptr<BackendConnection> conn, bool touch,
                                     Actions& actions) {
    auto it = slots_.find(conn->Id());
    if (it == slots_.end()) {
        actions.to_close.push_back(std::move(conn));
        return;
    }

    Slot& slot = it->second;
    SubPool& subpool = *slot.subpool;

    if (shutting_down_) {
        DiscardLocked(std::move(conn), actions);
        return;
    }

    if (Waiter* waiter = subpool.waiters.Front()) {
        LeaseToWaiterLocked(waiter, std::move(conn), actions);
        return;
    }

    // Another key is blocked on the budget; trade this connection for a slot
    if (!HasBudgetLocked() && HasStarvedKeyLocked(&subpool)) {
        LOG_DEBUG("pool", "Closing " + conn->Describe() + " to serve a waiting key");
        DiscardLocked(std::move(conn), actions);
        ServeQueuedWaitersLocked(actions);
        return;
    }

    slot.state = SlotState::Idle;
    if (touch) {
        conn->MarkIdle(Clock::now());
    }
    subpool.idle.push_back(std::move(conn));
}

void PoolManager::LeaseToWaiterLocked(Waiter* waiter, std::unique_ptr<BackendConnection> conn,
                                      Actions& actions) {
    // Empty while the pool itself is being destroyed
    std::shared_ptr<PoolManager> self = weak_from_this().lock();
    if (!self) {
        FailWaiterLocked(waiter, ErrorKind::PoolShuttingDown, "pool is shutting down", actions);
        DiscardLocked(std::move(conn), actions);
        return;
    }

    auto slot = slots_.find(conn->Id());
    if (slot != slots_.end()) {
        slot->second.state = SlotState::Leased;
    }
    conn->MarkLeased();

    LOG_DEBUG("pool", "Handing " + conn->Describe() + " to queued acquire " +
              std::to_string(waiter->id) + " after " + Millis(Clock::now() - waiter->enqueued_at));
    AcquireCallback callback = RemoveWaiterLocked(waiter, actions);
    actions.completions.emplace_back(std::move(callback),
                                     AcquireResult(Lease(std::move(self), std::move(conn))));
}

void PoolManager::FailWaiterLocked(Waiter* waiter, ErrorKind kind, const std::string& message,
                                   Actions& actions) {
    AcquireCallback callback = RemoveWaiterLocked(waiter, actions);
    actions.completions.emplace_back(std::move(callback), AcquireResult(kind, message));
}

PoolManager::AcquireCallback PoolManager::RemoveWaiterLocked(Waiter* waiter, Actions& actions) {
    waiter->subpool->waiters.Unlink(waiter);
    if (waiter->timer) {
        actions.timers_to_cancel.push_back(std::move(waiter->timer));
    }
    AcquireCallback callback = std::move(waiter->callback);
    WaiterId id = waiter->id;
    waiters_.erase(id);
    return callback;
}

void PoolManager::DiscardLocked(std::unique_ptr<BackendConnection> conn, Actions& actions) {
    FreeSlotLocked(conn->Id());
    total_destroyed_++;
    actions.to_close.push_back(std::move(conn));
}

void PoolManager::FreeSlotLocked(uint64_t id) {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return;
    }

    Slot& slot = it->second;
    if (slot.backend_pid != 0) {
        auto pid = pid_index_.find(slot.backend_pid);
        if (pid != pid_index_.end() && pid->second == id) {
            pid_index_.erase(pid);
        }
    }
    slot.subpool->live--;
    if (slot.state == SlotState::Connecting) {
        slot.subpool->connecting--;
    }
    slots_.erase(it);

    if (slots_.empty()) {
        drained_cv_.notify_all();
    }
}

void PoolManager::EraseEmptySubPoolsLocked() {
    for (auto it = subpools_.begin(); it != subpools_.end();) {
        const SubPool& subpool = it->second;
        if (subpool.live == 0 && subpool.connecting == 0 && subpool.idle.empty() &&
            subpool.waiters.Empty() && !subpool.warm) {
            subpools_.erase(it++);
        } else {
            ++it;
        }
    }
}

//===----------------------------------------------------------------------===//
// Deferred work
//===----------------------------------------------------------------------===//

void PoolManager::RunActions(Actions& actions) {
    for (auto& timer : actions.timers_to_cancel) {
        asio::post(*timer_io_, [timer]() {
            timer->cancel();
        });
    }

    for (auto& conn : actions.to_close) {
        conn->Terminate();
    }
    actions.to_close.clear();

    for (auto& spawn : actions.spawns) {
        std::weak_ptr<PoolManager> weak = weak_from_this();
        std::shared_ptr<BackendConnector> connector = connector_;
        uint64_t id = spawn.id;
        ConnectionKey key = spawn.key;

        bool submitted = executor_->Submit([weak, connector, id, key]() {
            std::unique_ptr<BackendConnection> conn;
            ErrorKind kind = ErrorKind::None;
            std::string message;
            try {
                conn = connector->Connect(id, key);
            } catch (const PoolError& e) {
                kind = ErrorKind::HandshakeFailed;
                message = e.what();
            } catch (const std::exception& e) {
                kind = ErrorKind::HandshakeFailed;
                message = e.what();
            }

            auto self = weak.lock();
            if (!self) {
                if (conn) {
                    conn->Terminate();
                }
                return;
            }
            self->OnSpawnComplete(id, std::move(conn), kind, message);
        });

        if (!submitted) {
            OnSpawnComplete(id, nullptr, ErrorKind::HandshakeFailed, "executor unavailable");
        }
    }
    actions.spawns.clear();

    for (auto& conn : actions.to_probe) {
        SubmitProbe(std::move(conn));
    }
    actions.to_probe.clear();

    for (auto& completion : actions.completions) {
        if (!completion.first) {
            continue;
        }
        try {
            completion.first(std::move(completion.second));
        } catch (const std::exception& e) {
            LOG_ERROR("pool", "Acquire callback threw: " + std::string(e.what()));
        }
    }
    actions.completions.clear();
}

//===----------------------------------------------------------------------===//
// Stats
//===----------------------------------------------------------------------===//

PoolManager::Stats PoolManager::GetStats() const {
    Stats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.current_size = slots_.size();
        for (const auto& kv : slots_) {
            switch (kv.second.state) {
                case SlotState::Idle:       stats.idle++; break;
                case SlotState::Leased:     stats.leased++; break;
                case SlotState::Connecting: stats.connecting++; break;
                case SlotState::Cleanup:
                case SlotState::Probing:    break;
            }
        }
        stats.waiting = waiters_.size();
        stats.keys = subpools_.size();
    }
    stats.total_created = total_created_;
    stats.total_destroyed = total_destroyed_;
    stats.acquire_count = acquire_count_;
    stats.acquire_timeout_count = acquire_timeout_count_;
    stats.handshake_failure_count = handshake_failure_count_;
    stats.reaped_count = reaped_count_;
    stats.probe_failure_count = probe_failure_count_;
    stats.leaked_lease_count = leaked_lease_count_;
    return stats;
}

} // namespace pgmux
