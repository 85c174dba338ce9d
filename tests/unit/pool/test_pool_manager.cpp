//===----------------------------------------------------------------------===//
//                         PgMux Server - Unit Tests
//
// tests/unit/pool/test_pool_manager.cpp
//
// Unit tests for PoolManager
//===----------------------------------------------------------------------===//

#include "pool/pool_manager.hpp"
#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"
#include "support/fake_transport.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

using namespace pgmux;
using namespace pgmux::test;

static const std::chrono::milliseconds TIMEOUT(1000);

PoolConfig TestConfig() {
    PoolConfig config;
    config.min_size = 0;
    config.max_size = 4;
    config.acquire_timeout = std::chrono::milliseconds(2000);
    config.health_check_interval = std::chrono::milliseconds(60000);
    config.probe_timeout = std::chrono::milliseconds(500);
    config.shutdown_grace = std::chrono::milliseconds(0);
    return config;
}

struct TestPool {
    std::shared_ptr<ExecutorPool> executor;
    std::shared_ptr<FakeConnector> connector;
    std::shared_ptr<PoolManager> pool;

    explicit TestPool(const PoolConfig& config = TestConfig()) {
        executor = std::make_shared<ExecutorPool>(4);
        executor->Start();
        connector = std::make_shared<FakeConnector>();
        pool = PoolManager::Create(config, connector, executor);
    }

    ~TestPool() {
        pool->Shutdown(std::chrono::milliseconds(0));
        executor->Stop();
    }
};

template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = TIMEOUT) {
    auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// Collects AsyncAcquire completions in arrival order
struct Completions {
    std::mutex mutex;
    std::vector<std::pair<uint64_t, AcquireResult>> results;

    PoolManager::AcquireCallback Callback(uint64_t tag) {
        return [this, tag](AcquireResult result) {
            std::lock_guard<std::mutex> lock(mutex);
            results.emplace_back(tag, std::move(result));
        };
    }

    size_t Count() {
        std::lock_guard<std::mutex> lock(mutex);
        return results.size();
    }
};

const ConnectionKey KEY_A("alice", "shop");
const ConnectionKey KEY_B("bob", "shop");

//===----------------------------------------------------------------------===//
// Acquire and Release
//===----------------------------------------------------------------------===//

void TestAcquireSpawnsConnection() {
    std::cout << "  Testing acquire on an empty pool..." << std::endl;

    TestPool tp;
    AcquireResult result = tp.pool->Acquire(KEY_A);
    assert(result.Ok());
    assert(result.error == ErrorKind::None);
    assert(result.lease->Key() == KEY_A);
    assert(result.lease->GetState() == ConnectionState::Leased);
    assert(result.lease->BackendPid() != 0);

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.total_created == 1);
    assert(stats.current_size == 1);
    assert(stats.leased == 1);

    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);
    stats = tp.pool->GetStats();
    assert(stats.idle == 1);
    assert(stats.leased == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestIdleReuse() {
    std::cout << "  Testing idle connection reuse..." << std::endl;

    TestPool tp;
    AcquireResult first = tp.pool->Acquire(KEY_A);
    uint64_t id = first.lease.ConnectionId();
    tp.pool->Release(std::move(first.lease), ReleaseOutcome::Clean);

    AcquireResult second = tp.pool->Acquire(KEY_A);
    assert(second.Ok());
    assert(second.lease.ConnectionId() == id);
    assert(second.lease->UseCount() == 2);
    assert(tp.pool->GetStats().total_created == 1);
    assert(tp.connector->ConnectAttempts() == 1);

    tp.pool->Release(std::move(second.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestKeysAreSeparate() {
    std::cout << "  Testing connections are not shared across keys..." << std::endl;

    TestPool tp;
    AcquireResult a = tp.pool->Acquire(KEY_A);
    tp.pool->Release(std::move(a.lease), ReleaseOutcome::Clean);

    AcquireResult b = tp.pool->Acquire(KEY_B);
    assert(b.Ok());
    assert(b.lease->Key() == KEY_B);

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.total_created == 2);
    assert(stats.keys == 2);
    assert(stats.idle == 1);

    tp.pool->Release(std::move(b.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestDirtyReleaseCloses() {
    std::cout << "  Testing dirty release..." << std::endl;

    TestPool tp;
    AcquireResult result = tp.pool->Acquire(KEY_A);
    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Dirty);

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.current_size == 0);
    assert(stats.total_destroyed == 1);

    // Empty lease is ignored
    tp.pool->Release(Lease(), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestReleaseMidQueryDiscards() {
    std::cout << "  Testing release with a request in flight..." << std::endl;

    TestPool tp;
    AcquireResult result = tp.pool->Acquire(KEY_A);
    std::vector<pg::Frame> frames = {pg::Frame(pg::FrontendMessage::Parse, {0, 'x', 0, 0, 0})};
    result.lease->AsyncSendFrames(frames, [](const std::error_code&) {});
    assert(!result.lease->IsReusable());

    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);
    assert(tp.pool->GetStats().current_size == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Transactions
//===----------------------------------------------------------------------===//

void TestRollbackOnRelease() {
    std::cout << "  Testing rollback of an open transaction..." << std::endl;

    TestPool tp;
    AcquireResult result = tp.pool->Acquire(KEY_A);
    uint64_t id = result.lease.ConnectionId();
    std::string error;
    assert(result.lease->ExecuteSimple("BEGIN", TIMEOUT, error));
    assert(result.lease->InTransaction());

    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);
    assert(WaitFor([&]() { return tp.pool->GetStats().idle == 1; }));
    assert(tp.connector->QueryCount() == 2);  // BEGIN, ROLLBACK

    AcquireResult again = tp.pool->Acquire(KEY_A);
    assert(again.lease.ConnectionId() == id);
    assert(!again.lease->InTransaction());
    tp.pool->Release(std::move(again.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestFailedRollbackCloses() {
    std::cout << "  Testing failed rollback closes the connection..." << std::endl;

    TestPool tp;
    AcquireResult result = tp.pool->Acquire(KEY_A);
    uint64_t id = result.lease.ConnectionId();
    FakeTransport* transport = tp.connector->TransportFor(id);
    assert(transport != nullptr);
    transport->SetResponder([](FakeTransport& t, const std::vector<uint8_t>& bytes) {
        if (bytes.empty() || bytes[0] != pg::FrontendMessage::Query) {
            return;
        }
        std::string sql(reinterpret_cast<const char*>(bytes.data() + 5));
        if (sql == "BEGIN") {
            t.Inject(QueryReply("BEGIN", pg::TransactionStatus::InTransaction));
        } else {
            t.Inject(ErrorReply("ERROR", "XX000", "could not roll back"));
        }
    });

    std::string error;
    assert(result.lease->ExecuteSimple("BEGIN", TIMEOUT, error));
    assert(result.lease->InTransaction());

    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);
    assert(WaitFor([&]() { return tp.pool->GetStats().total_destroyed == 1; }));

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.idle == 0);
    assert(stats.current_size == 0);

    AcquireResult again = tp.pool->Acquire(KEY_A);
    assert(again.Ok());
    assert(again.lease.ConnectionId() != id);
    assert(tp.connector->ConnectAttempts() == 2);
    tp.pool->Release(std::move(again.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestDiscardPolicy() {
    std::cout << "  Testing discard transaction policy..." << std::endl;

    PoolConfig config = TestConfig();
    config.transaction_policy = TransactionPolicy::Discard;
    TestPool tp(config);

    AcquireResult result = tp.pool->Acquire(KEY_A);
    std::string error;
    assert(result.lease->ExecuteSimple("BEGIN", TIMEOUT, error));
    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.current_size == 0);
    assert(stats.total_destroyed == 1);
    assert(tp.connector->QueryCount() == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestResetQuery() {
    std::cout << "  Testing reset query on release..." << std::endl;

    PoolConfig config = TestConfig();
    config.reset_query = "DISCARD ALL";
    TestPool tp(config);

    AcquireResult result = tp.pool->Acquire(KEY_A);
    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);
    assert(WaitFor([&]() { return tp.pool->GetStats().idle == 1; }));
    assert(tp.connector->QueryCount() == 1);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Budget and Waiters
//===----------------------------------------------------------------------===//

void TestTryAcquireExhausted() {
    std::cout << "  Testing TryAcquire on an exhausted pool..." << std::endl;

    PoolConfig config = TestConfig();
    config.max_size = 1;
    TestPool tp(config);

    AcquireResult held = tp.pool->Acquire(KEY_A);
    assert(held.Ok());

    AcquireResult result = tp.pool->TryAcquire(KEY_A);
    assert(!result.Ok());
    assert(result.error == ErrorKind::PoolExhausted);
    assert(tp.pool->GetStats().waiting == 0);

    tp.pool->Release(std::move(held.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestAcquireTimeout() {
    std::cout << "  Testing acquire timeout..." << std::endl;

    PoolConfig config = TestConfig();
    config.max_size = 1;
    TestPool tp(config);

    AcquireResult held = tp.pool->Acquire(KEY_A);
    auto start = Clock::now();
    AcquireResult result = tp.pool->Acquire(KEY_A, std::chrono::milliseconds(100));
    auto waited = Clock::now() - start;

    assert(!result.Ok());
    assert(result.error == ErrorKind::AcquireTimeout);
    assert(waited >= std::chrono::milliseconds(90));
    assert(waited < std::chrono::milliseconds(100 + 150));

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.acquire_timeout_count == 1);
    assert(stats.waiting == 0);
    assert(stats.current_size == 1);

    tp.pool->Release(std::move(held.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestWaitersServedInOrder() {
    std::cout << "  Testing waiters are served in arrival order..." << std::endl;

    PoolConfig config = TestConfig();
    config.max_size = 1;
    TestPool tp(config);

    AcquireResult held = tp.pool->Acquire(KEY_A);
    uint64_t id = held.lease.ConnectionId();

    Completions completions;
    TimePoint deadline = Clock::now() + std::chrono::seconds(5);
    tp.pool->AsyncAcquire(KEY_A, deadline, completions.Callback(1));
    tp.pool->AsyncAcquire(KEY_A, deadline, completions.Callback(2));
    assert(tp.pool->GetStats().waiting == 2);

    tp.pool->Release(std::move(held.lease), ReleaseOutcome::Clean);
    assert(WaitFor([&]() { return completions.Count() == 1; }));
    {
        std::lock_guard<std::mutex> lock(completions.mutex);
        assert(completions.results[0].first == 1);
        assert(completions.results[0].second.Ok());
        assert(completions.results[0].second.lease.ConnectionId() == id);
    }

    Lease next;
    {
        std::lock_guard<std::mutex> lock(completions.mutex);
        next = std::move(completions.results[0].second.lease);
    }
    tp.pool->Release(std::move(next), ReleaseOutcome::Clean);
    assert(WaitFor([&]() { return completions.Count() == 2; }));
    {
        std::lock_guard<std::mutex> lock(completions.mutex);
        assert(completions.results[1].first == 2);
        next = std::move(completions.results[1].second.lease);
    }
    assert(next.ConnectionId() == id);
    tp.pool->Release(std::move(next), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestCancelAcquire() {
    std::cout << "  Testing CancelAcquire..." << std::endl;

    PoolConfig config = TestConfig();
    config.max_size = 1;
    TestPool tp(config);

    AcquireResult held = tp.pool->Acquire(KEY_A);
    Completions completions;
    PoolManager::WaiterId id = tp.pool->AsyncAcquire(KEY_A, Clock::now() + std::chrono::seconds(5),
                                                     completions.Callback(1));
    assert(tp.pool->CancelAcquire(id));
    assert(completions.Count() == 1);
    {
        std::lock_guard<std::mutex> lock(completions.mutex);
        assert(completions.results[0].second.error == ErrorKind::Cancelled);
    }
    assert(!tp.pool->CancelAcquire(id));
    assert(!tp.pool->CancelAcquire(9999));

    // The released connection goes idle rather than to the cancelled waiter
    tp.pool->Release(std::move(held.lease), ReleaseOutcome::Clean);
    assert(tp.pool->GetStats().idle == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestReclaimIdleForOtherKey() {
    std::cout << "  Testing idle connection reclaimed for another key..." << std::endl;

    PoolConfig config = TestConfig();
    config.max_size = 1;
    TestPool tp(config);

    AcquireResult a = tp.pool->Acquire(KEY_A);
    tp.pool->Release(std::move(a.lease), ReleaseOutcome::Clean);
    assert(tp.pool->GetStats().idle == 1);

    AcquireResult b = tp.pool->Acquire(KEY_B);
    assert(b.Ok());
    assert(b.lease->Key() == KEY_B);

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.current_size == 1);
    assert(stats.total_destroyed == 1);

    tp.pool->Release(std::move(b.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestReleaseServesStarvedKey() {
    std::cout << "  Testing release frees budget for a waiting key..." << std::endl;

    PoolConfig config = TestConfig();
    config.max_size = 1;
    TestPool tp(config);

    AcquireResult a = tp.pool->Acquire(KEY_A);
    Completions completions;
    tp.pool->AsyncAcquire(KEY_B, Clock::now() + std::chrono::seconds(5), completions.Callback(1));

    tp.pool->Release(std::move(a.lease), ReleaseOutcome::Clean);
    assert(WaitFor([&]() { return completions.Count() == 1; }));

    Lease b;
    {
        std::lock_guard<std::mutex> lock(completions.mutex);
        assert(completions.results[0].second.Ok());
        b = std::move(completions.results[0].second.lease);
    }
    assert(b->Key() == KEY_B);
    assert(tp.pool->GetStats().current_size == 1);
    tp.pool->Release(std::move(b), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentAcquire() {
    std::cout << "  Testing concurrent acquire and release..." << std::endl;

    PoolConfig config = TestConfig();
    config.max_size = 3;
    config.acquire_timeout = std::chrono::milliseconds(5000);
    TestPool tp(config);

    const int num_threads = 8;
    const int iterations = 25;
    std::atomic<int> successes{0};
    std::atomic<size_t> max_seen{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&, t]() {
            const ConnectionKey& key = (t % 2 == 0) ? KEY_A : KEY_B;
            for (int i = 0; i < iterations; i++) {
                AcquireResult result = tp.pool->Acquire(key);
                if (!result.Ok()) {
                    continue;
                }
                successes++;
                size_t size = tp.pool->GetStats().current_size;
                size_t seen = max_seen.load();
                while (size > seen && !max_seen.compare_exchange_weak(seen, size)) {
                }
                tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    assert(successes == num_threads * iterations);
    assert(max_seen <= 3);
    assert(tp.pool->GetStats().waiting == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Failures
//===----------------------------------------------------------------------===//

void TestSpawnFailure() {
    std::cout << "  Testing backend connect failure..." << std::endl;

    TestPool tp;
    tp.connector->SetFailConnects(true);

    AcquireResult result = tp.pool->Acquire(KEY_A);
    assert(!result.Ok());
    assert(result.error == ErrorKind::HandshakeFailed);
    assert(result.message.find("connection refused") != std::string::npos);

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.handshake_failure_count == 1);
    assert(stats.current_size == 0);

    // Recovers once the backend accepts again
    tp.connector->SetFailConnects(false);
    AcquireResult retry = tp.pool->Acquire(KEY_A);
    assert(retry.Ok());
    tp.pool->Release(std::move(retry.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestQueuedWaiterOutlivesFailingSpawns() {
    std::cout << "  Testing queued waiter while connects keep failing..." << std::endl;

    PoolConfig config = TestConfig();
    config.max_size = 1;
    TestPool tp(config);

    AcquireResult held = tp.pool->Acquire(KEY_A);
    assert(held.Ok());

    Completions completions;
    auto start = Clock::now();
    tp.pool->AsyncAcquire(KEY_A, start + std::chrono::milliseconds(600), completions.Callback(1));
    assert(tp.pool->GetStats().waiting == 1);

    tp.connector->SetFailConnects(true);
    tp.pool->Release(std::move(held.lease), ReleaseOutcome::Dirty);

    // Each failure hands its slot back before the next attempt
    assert(WaitFor([&]() { return tp.pool->GetStats().handshake_failure_count >= 1; }));
    assert(WaitFor([&]() { return tp.pool->GetStats().current_size == 0; }));
    assert(completions.Count() == 0);

    assert(WaitFor([&]() { return completions.Count() == 1; }, std::chrono::milliseconds(2000)));
    auto waited = Clock::now() - start;
    {
        std::lock_guard<std::mutex> lock(completions.mutex);
        assert(completions.results[0].second.error == ErrorKind::AcquireTimeout);
    }
    assert(waited >= std::chrono::milliseconds(590));

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.handshake_failure_count >= 3);
    // Backoff spaces the retries out
    assert(tp.connector->ConnectAttempts() <= 1 + 6);
    assert(stats.current_size == 0);
    assert(stats.waiting == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestLeakedLease() {
    std::cout << "  Testing lease dropped without release..." << std::endl;

    TestPool tp;
    {
        AcquireResult result = tp.pool->Acquire(KEY_A);
        assert(result.Ok());
    }

    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.leaked_lease_count == 1);
    assert(stats.current_size == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestProbeFailure() {
    std::cout << "  Testing liveness probe failure..." << std::endl;

    PoolConfig config = TestConfig();
    config.health_check_interval = std::chrono::milliseconds(20);
    TestPool tp(config);

    AcquireResult result = tp.pool->Acquire(KEY_A);
    FakeTransport* transport = tp.connector->TransportFor(result.lease.ConnectionId());
    assert(transport != nullptr);
    // Backend stops answering
    transport->SetResponder(nullptr);
    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);

    assert(WaitFor([&]() { return tp.pool->GetStats().probe_failure_count == 1; }));
    assert(WaitFor([&]() { return tp.pool->GetStats().current_size == 0; }));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Cancel, Maintenance, Shutdown
//===----------------------------------------------------------------------===//

void TestCancelForwarding() {
    std::cout << "  Testing cancel request forwarding..." << std::endl;

    TestPool tp;
    AcquireResult result = tp.pool->Acquire(KEY_A);
    int32_t pid = result.lease->BackendPid();
    int32_t secret = result.lease->CancelSecret();

    assert(!tp.pool->Cancel(pid, secret + 1));
    assert(!tp.pool->Cancel(pid + 12345, secret));
    assert(tp.pool->Cancel(pid, secret));

    assert(WaitFor([&]() { return tp.connector->Cancels().size() == 1; }));
    auto cancels = tp.connector->Cancels();
    assert(cancels[0].first == pid);
    assert(cancels[0].second == secret);

    // Cancelling never takes a slot
    assert(tp.pool->GetStats().current_size == 1);

    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestIdleReaping() {
    std::cout << "  Testing idle timeout reaping..." << std::endl;

    PoolConfig config = TestConfig();
    config.idle_timeout = std::chrono::milliseconds(10);
    TestPool tp(config);

    AcquireResult result = tp.pool->Acquire(KEY_A);
    tp.pool->Release(std::move(result.lease), ReleaseOutcome::Clean);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    tp.pool->RunMaintenance();
    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.reaped_count == 1);
    assert(stats.current_size == 0);
    assert(stats.keys == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestReapingKeepsMinSize() {
    std::cout << "  Testing reaping respects min_size..." << std::endl;

    PoolConfig config = TestConfig();
    config.min_size = 2;
    config.idle_timeout = std::chrono::milliseconds(10);
    TestPool tp(config);

    tp.pool->Prewarm(KEY_A);
    assert(WaitFor([&]() { return tp.pool->GetStats().idle == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    tp.pool->RunMaintenance();
    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.reaped_count == 0);
    assert(stats.current_size == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestReapingSkipsLeased() {
    std::cout << "  Testing reaping leaves leased connections alone..." << std::endl;

    PoolConfig config = TestConfig();
    config.idle_timeout = std::chrono::milliseconds(1);
    config.max_connection_lifetime = std::chrono::milliseconds(1);
    TestPool tp(config);

    AcquireResult held = tp.pool->Acquire(KEY_A);
    assert(held.Ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    tp.pool->RunMaintenance();
    PoolManager::Stats stats = tp.pool->GetStats();
    assert(stats.reaped_count == 0);
    assert(stats.current_size == 1);
    assert(stats.leased == 1);

    std::string error;
    assert(held.lease->ExecuteSimple("SELECT 1", TIMEOUT, error));
    assert(held.lease->IsReusable());

    tp.pool->Release(std::move(held.lease), ReleaseOutcome::Clean);

    std::cout << "    PASSED" << std::endl;
}

void TestShutdown() {
    std::cout << "  Testing shutdown..." << std::endl;

    TestPool tp;
    AcquireResult idle = tp.pool->Acquire(KEY_A);
    AcquireResult held = tp.pool->Acquire(KEY_A);
    tp.pool->Release(std::move(idle.lease), ReleaseOutcome::Clean);

    tp.pool->Shutdown(std::chrono::milliseconds(0));
    assert(tp.pool->IsShuttingDown());
    assert(tp.pool->GetStats().current_size == 1);

    AcquireResult rejected = tp.pool->Acquire(KEY_A);
    assert(rejected.error == ErrorKind::PoolShuttingDown);

    // Leases outstanding at shutdown close when they come back
    tp.pool->Release(std::move(held.lease), ReleaseOutcome::Clean);
    assert(tp.pool->GetStats().current_size == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestShutdownWaitsForLeases() {
    std::cout << "  Testing shutdown grace period..." << std::endl;

    TestPool tp;
    AcquireResult held = tp.pool->Acquire(KEY_A);

    std::thread releaser([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        tp.pool->Release(std::move(held.lease), ReleaseOutcome::Clean);
    });

    auto start = Clock::now();
    tp.pool->Shutdown(std::chrono::milliseconds(2000));
    auto waited = Clock::now() - start;
    releaser.join();

    assert(tp.pool->GetStats().current_size == 0);
    assert(waited < std::chrono::milliseconds(1500));

    std::cout << "    PASSED" << std::endl;
}

void TestLastReferenceDroppedOnTimerThread() {
    std::cout << "  Testing pool destroyed by its own waiter timeout..." << std::endl;

    auto executor = std::make_shared<ExecutorPool>(2);
    executor->Start();
    auto connector = std::make_shared<FakeConnector>();
    connector->SetConnectDelay(std::chrono::milliseconds(300));

    PoolConfig config = TestConfig();
    config.max_size = 1;
    auto pool = PoolManager::Create(config, connector, executor);
    std::weak_ptr<PoolManager> weak = pool;

    std::atomic<bool> fired{false};
    std::atomic<int> error{0};
    pool->AsyncAcquire(KEY_A, Clock::now() + std::chrono::milliseconds(50),
        [pool, &fired, &error](AcquireResult result) {
            error = static_cast<int>(result.error);
            fired = true;
        });
    pool.reset();

    // The callback held the only reference
    assert(WaitFor([&]() { return fired.load() && weak.expired(); }));
    assert(error.load() == static_cast<int>(ErrorKind::AcquireTimeout));

    // The slow connect finishes against a dead pool
    std::this_thread::sleep_for(std::chrono::milliseconds(350));
    assert(connector->ConnectAttempts() == 1);
    executor->Stop();

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    Logger::SetLevel(LogLevel::WARN);

    std::cout << "=== Pool Manager Unit Tests ===" << std::endl;

    std::cout << "\n1. Acquire and Release:" << std::endl;
    TestAcquireSpawnsConnection();
    TestIdleReuse();
    TestKeysAreSeparate();
    TestDirtyReleaseCloses();
    TestReleaseMidQueryDiscards();

    std::cout << "\n2. Transactions:" << std::endl;
    TestRollbackOnRelease();
    TestFailedRollbackCloses();
    TestDiscardPolicy();
    TestResetQuery();

    std::cout << "\n3. Budget and Waiters:" << std::endl;
    TestTryAcquireExhausted();
    TestAcquireTimeout();
    TestWaitersServedInOrder();
    TestCancelAcquire();
    TestReclaimIdleForOtherKey();
    TestReleaseServesStarvedKey();
    TestConcurrentAcquire();

    std::cout << "\n4. Failures:" << std::endl;
    TestSpawnFailure();
    TestQueuedWaiterOutlivesFailingSpawns();
    TestLeakedLease();
    TestProbeFailure();

    std::cout << "\n5. Cancel, Maintenance, Shutdown:" << std::endl;
    TestCancelForwarding();
    TestIdleReaping();
    TestReapingKeepsMinSize();
    TestReapingSkipsLeased();
    TestShutdown();
    TestShutdownWaitsForLeases();
    TestLastReferenceDroppedOnTimerThread();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
