//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// proxy/session_registry.hpp
//
// Live client sessions indexed by the cancel key the proxy issued them
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <parallel_hashmap/phmap.h>
#include <random>

namespace pgmux {

// What the registry needs from a client session
class ClientSession {
public:
    virtual ~ClientSession() = default;

    // Forward a cancel to the backend currently serving this session
    virtual bool CancelBackendQuery() = 0;

    // Close from any thread
    virtual void Close() = 0;
};

struct CancelKey {
    int32_t process_id = 0;
    int32_t secret_key = 0;
};

class SessionRegistry {
public:
    explicit SessionRegistry(size_t max_sessions = DEFAULT_MAX_CLIENT_CONNECTIONS);
    ~SessionRegistry() = default;

    // Non-copyable
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Register a session and issue its cancel key; false when full
    bool Register(std::weak_ptr<ClientSession> session, CancelKey& key);

    bool Unregister(const CancelKey& key);

    // Route a client CancelRequest; false when the key matches no session
    bool CancelQuery(int32_t process_id, int32_t secret_key);

    // Close every registered session
    void CloseAll();

    size_t GetActiveSessionCount() const { return sessions_.size(); }
    uint64_t GetTotalSessionsCreated() const { return total_sessions_; }
    size_t GetMaxSessions() const { return max_sessions_; }

private:
    struct Entry {
        std::weak_ptr<ClientSession> session;
        int32_t secret_key = 0;
    };

    CancelKey GenerateKey();

private:
    size_t max_sessions_;

    // Keyed by issued process id, sharded into 2^4 submaps
    phmap::parallel_flat_hash_map<
        int32_t,
        Entry,
        phmap::priv::hash_default_hash<int32_t>,
        phmap::priv::hash_default_eq<int32_t>,
        phmap::priv::Allocator<phmap::priv::Pair<const int32_t, Entry>>,
        4,
        std::mutex
    > sessions_;

    std::mutex random_mutex_;
    std::mt19937 random_;

    std::atomic<uint64_t> total_sessions_;
};

} // namespace pgmux
