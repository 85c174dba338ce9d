//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// executor/executor_pool.hpp
//
// Worker pool for blocking backend work (connect, handshake, rollback, probe)
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <concurrentqueue.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace pgmux {

class ExecutorPool {
public:
    using Task = std::function<void()>;

    explicit ExecutorPool(size_t thread_count = 0);
    ~ExecutorPool();

    // Non-copyable
    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    // Start the pool
    void Start();

    // Stop the pool, dropping tasks that have not started
    void Stop();

    // Submit a task; false once the pool is stopping
    bool Submit(Task task);

    // Submit with future
    template<typename F, typename... Args>
    auto SubmitWithFuture(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task->get_future();

        if (!Submit([task]() { (*task)(); })) {
            throw std::runtime_error("executor pool is stopped");
        }

        return result;
    }

    // Get pool size
    size_t Size() const { return thread_count_; }

    // Get pending task count
    size_t PendingTasks() const;

    // Check if running
    bool IsRunning() const { return running_; }

private:
    void Worker();

private:
    size_t thread_count_;

    std::vector<std::thread> workers_;

    // Lock-free task queue
    moodycamel::ConcurrentQueue<Task> tasks_;

    // Sleeping workers
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
};

} // namespace pgmux
