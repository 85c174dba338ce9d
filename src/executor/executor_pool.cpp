//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// executor/executor_pool.cpp
//
// Worker pool implementation
//===----------------------------------------------------------------------===//

#include "executor/executor_pool.hpp"
#include "logging/logger.hpp"

namespace pgmux {

ExecutorPool::ExecutorPool(size_t thread_count)
    : thread_count_(thread_count)
    , running_(false)
    , stop_requested_(false) {

    if (thread_count_ == 0) {
        // Tasks spend most of their time blocked on backend round trips
        thread_count_ = std::thread::hardware_concurrency() * 2;
        if (thread_count_ == 0) {
            thread_count_ = 8;  // Default fallback
        }
    }
}

ExecutorPool::~ExecutorPool() {
    Stop();
}

void ExecutorPool::Start() {
    if (running_) {
        return;
    }

    running_ = true;
    stop_requested_ = false;

    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back([this]() {
            Worker();
        });
    }

    LOG_INFO("executor", "Executor pool started with " +
             std::to_string(thread_count_) + " threads");
}

void ExecutorPool::Stop() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            if (worker.get_id() == std::this_thread::get_id()) {
                worker.detach();
            } else {
                worker.join();
            }
        }
    }

    workers_.clear();
    running_ = false;

    size_t dropped = 0;
    Task task;
    while (tasks_.try_dequeue(task)) {
        ++dropped;
    }

    if (dropped > 0) {
        LOG_WARN("executor", "Dropped " + std::to_string(dropped) + " pending tasks on stop");
    }
    LOG_INFO("executor", "Executor pool stopped");
}

bool ExecutorPool::Submit(Task task) {
    if (stop_requested_ || !running_) {
        return false;
    }
    tasks_.enqueue(std::move(task));
    {
        // Pairs with the predicate check in Worker so a wakeup is never lost
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_one();
    return true;
}

size_t ExecutorPool::PendingTasks() const {
    return tasks_.size_approx();
}

void ExecutorPool::Worker() {
    while (true) {
        if (stop_requested_) {
            return;
        }

        Task task;
        if (!tasks_.try_dequeue(task)) {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait(lock, [this]() {
                return stop_requested_.load() || tasks_.size_approx() > 0;
            });
            continue;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("executor", "Task exception: " + std::string(e.what()));
        }
    }
}

} // namespace pgmux
