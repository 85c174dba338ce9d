//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// network/io_context_pool.cpp
//
// IO context thread pool implementation
//===----------------------------------------------------------------------===//

#include "network/io_context_pool.hpp"
#include "logging/logger.hpp"

namespace pgmux {

IoContextPool::IoContextPool(size_t pool_size)
    : next_io_context_(0)
    , running_(false) {

    if (pool_size == 0) {
        pool_size = std::thread::hardware_concurrency();
        if (pool_size == 0) {
            pool_size = 4;  // Default fallback
        }
    }

    for (size_t i = 0; i < pool_size; ++i) {
        io_contexts_.push_back(std::make_unique<asio::io_context>(1));
    }

    LOG_DEBUG("io_pool", "Created IO context pool with " + std::to_string(pool_size) + " contexts");
}

IoContextPool::~IoContextPool() {
    Stop();
}

void IoContextPool::Start() {
    if (running_) {
        return;
    }

    running_ = true;

    for (auto& io_context : io_contexts_) {
        io_context->restart();
        work_guards_.push_back(asio::make_work_guard(*io_context));

        asio::io_context* ctx = io_context.get();
        threads_.emplace_back([ctx]() {
            ctx->run();
        });
    }

    LOG_INFO("io_pool", "IO context pool started with " + std::to_string(threads_.size()) + " threads");
}

void IoContextPool::Stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    work_guards_.clear();

    for (auto& io_context : io_contexts_) {
        io_context->stop();
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    threads_.clear();

    LOG_INFO("io_pool", "IO context pool stopped");
}

asio::io_context& IoContextPool::GetNextIoContext() {
    size_t index = next_io_context_.fetch_add(1) % io_contexts_.size();
    return *io_contexts_[index];
}

} // namespace pgmux
