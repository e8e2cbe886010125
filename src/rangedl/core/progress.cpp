// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/progress.hpp>
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <mutex>

namespace rangedl::core {

ProgressObserver::ProgressObserver(const ProgressAggregator& aggregator,
                                   std::uint64_t total_bytes,
                                   ProgressSink sink,
                                   std::chrono::milliseconds interval)
    : aggregator_(aggregator)
    , total_bytes_(total_bytes)
    , sink_(std::move(sink))
    , interval_(interval) {}

ProgressObserver::~ProgressObserver() {
    stop();
}

void ProgressObserver::start() {
    if (!sink_ || thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stoken) { poll_loop(stoken); });
}

void ProgressObserver::stop() noexcept {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    thread_.join();
    emit();
}

void ProgressObserver::poll_loop(std::stop_token stoken) noexcept {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);

    while (!stoken.stop_requested()) {
        emit();
        cv.wait_for(lock, stoken, interval_, [] { return false; });
    }
}

void ProgressObserver::emit() noexcept {
    try {
        sink_(aggregator_.snapshot(), total_bytes_);
    } catch (const std::exception& e) {
        spdlog::warn("Progress sink threw: {}", e.what());
    }
}

} // namespace rangedl::core
