// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/worker_pool.hpp>
#include <spdlog/spdlog.h>

namespace rangedl::core {

WorkerPool::WorkerPool(std::uint32_t workers) {
    if (workers == 0) {
        workers = 1;
    }
    threads_.reserve(workers);
    for (std::uint32_t i = 0; i < workers; ++i) {
        threads_.emplace_back([this](std::stop_token stoken) { worker_loop(stoken); });
    }
    spdlog::debug("Worker pool started with {} threads", workers);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() noexcept {
    for (auto& t : threads_) {
        t.request_stop();
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerPool::worker_loop(std::stop_token stoken) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stoken, [this] { return !queue_.empty(); });
            // Drain what was queued before the stop request
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        // packaged_task stores exceptions in the future
        task();
    }
}

} // namespace rangedl::core
