// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace rangedl::core {

// Bytes received across every fetcher of one run. Add-only.
class ProgressAggregator {
public:
    ProgressAggregator() = default;

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void add(std::uint64_t bytes) noexcept {
        downloaded_.fetch_add(bytes, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t snapshot() const noexcept {
        return downloaded_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> downloaded_{0};
};

// Display sink: (bytes downloaded, total bytes; 0 when unknown)
using ProgressSink = std::function<void(std::uint64_t, std::uint64_t)>;

// Polls an aggregator on a fixed interval and forwards samples to a sink.
// Purely for display; a final sample is delivered on stop().
class ProgressObserver {
public:
    ProgressObserver(const ProgressAggregator& aggregator,
                     std::uint64_t total_bytes,
                     ProgressSink sink,
                     std::chrono::milliseconds interval);
    ~ProgressObserver();

    ProgressObserver(const ProgressObserver&) = delete;
    ProgressObserver& operator=(const ProgressObserver&) = delete;

    void start();
    void stop() noexcept;

private:
    void poll_loop(std::stop_token stoken) noexcept;
    void emit() noexcept;

    const ProgressAggregator& aggregator_;
    std::uint64_t total_bytes_;
    ProgressSink sink_;
    std::chrono::milliseconds interval_;
    std::jthread thread_;
};

} // namespace rangedl::core
