//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// network/io_context_pool.hpp
//
// Asio IO context thread pool shared by client and backend sockets
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace pgmux {

class IoContextPool {
public:
    explicit IoContextPool(size_t pool_size = 0);
    ~IoContextPool();

    // Non-copyable
    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void Start();
    void Stop();

    // Get the next io_context to use (round-robin)
    asio::io_context& GetNextIoContext();

    size_t Size() const { return io_contexts_.size(); }

    bool IsRunning() const { return running_; }

private:
    std::vector<std::unique_ptr<asio::io_context>> io_contexts_;

    // Work guards to keep io_contexts running
    std::vector<asio::executor_work_guard<asio::io_context::executor_type>> work_guards_;

    std::vector<std::thread> threads_;

    std::atomic<size_t> next_io_context_;

    std::atomic<bool> running_;
};

} // namespace pgmux
