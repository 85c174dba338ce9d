//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// pool/pool_config.hpp
//
// Pool sizing, timeouts and release policy
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>

namespace pgmux {

// What to do with a connection released while a transaction is open
enum class TransactionPolicy {
    Rollback,  // issue ROLLBACK, return to pool on success
    Discard    // close the connection
};

inline const char* TransactionPolicyToString(TransactionPolicy policy) {
    return policy == TransactionPolicy::Rollback ? "rollback" : "discard";
}

inline bool ParseTransactionPolicy(std::string text, TransactionPolicy& policy) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "rollback") {
        policy = TransactionPolicy::Rollback;
        return true;
    }
    if (text == "discard") {
        policy = TransactionPolicy::Discard;
        return true;
    }
    return false;
}

struct PoolConfig {
    size_t min_size = 0;
    size_t max_size = 20;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};              // 0 = never reap idle
    std::chrono::milliseconds max_connection_lifetime{3600000};  // 0 = unlimited
    std::chrono::milliseconds health_check_interval{30000};
    std::chrono::milliseconds probe_timeout{2000};
    std::chrono::milliseconds shutdown_grace{10000};
    TransactionPolicy transaction_policy = TransactionPolicy::Rollback;
    std::string reset_query;  // run before a released connection is reused

    bool Validate(std::string& error) const {
        if (max_size == 0) {
            error = "pool max_size must be greater than 0";
            return false;
        }
        if (min_size > max_size) {
            error = "pool min_size (" + std::to_string(min_size) +
                    ") exceeds max_size (" + std::to_string(max_size) + ")";
            return false;
        }
        if (health_check_interval.count() <= 0) {
            error = "pool health_check_interval must be positive";
            return false;
        }
        if (probe_timeout.count() <= 0) {
            error = "pool probe_timeout must be positive";
            return false;
        }
        if (acquire_timeout.count() < 0 || shutdown_grace.count() < 0 ||
            idle_timeout.count() < 0 || max_connection_lifetime.count() < 0) {
            error = "pool timeouts must not be negative";
            return false;
        }
        return true;
    }
};

} // namespace pgmux
