//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// common.hpp
//
// Common definitions and includes for PgMux
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>

namespace pgmux {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// Forward declarations
class TcpServer;
class ProxySession;
class SessionRegistry;
class ExecutorPool;
class IoContextPool;
class PoolManager;
class BackendConnection;
struct ServerConfig;

// Constants
constexpr size_t DEFAULT_MAX_CLIENT_CONNECTIONS = 10000;
constexpr size_t DEFAULT_IO_THREADS = 0;  // 0 = auto (CPU cores / 2)
constexpr size_t DEFAULT_EXECUTOR_THREADS = 0;  // 0 = auto (CPU cores)
constexpr size_t DEFAULT_READ_BUFFER_SIZE = 32768;  // 32KB
constexpr size_t DEFAULT_MAX_FRAME_SIZE = 64 * 1024 * 1024;  // 64MB

} // namespace pgmux
