// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace rangedl::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // New (downloaded, total) sample; total 0 means unknown
    void update(std::uint64_t current, std::uint64_t total) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    // Status line for a sample, without the leading carriage return
    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t total, std::uint64_t speed_bps) const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::string label_;
    std::chrono::steady_clock::time_point start_;
    std::uint64_t last_current_{0};
    std::uint64_t last_total_{0};
    int last_percent_{-1};
    bool drawn_{false};
    bool finished_{false};
    std::mutex mutex_;   // Samples arrive on the observer thread
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

} // namespace rangedl::cli
