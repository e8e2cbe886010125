// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rangedl::cli {

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::string_view label)
    : label_(label)
    , start_(std::chrono::steady_clock::now()) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t total) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) return;

    // Redraw on every whole percent, or on every sample when the size is unknown
    int percent = -1;
    if (total > 0) {
        percent = static_cast<int>(std::min<std::uint64_t>(current, total) * 100 / total);
        if (percent == last_percent_ && drawn_) {
            last_current_ = current;
            return;
        }
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    std::uint64_t speed = elapsed > 0.0 ? static_cast<std::uint64_t>(static_cast<double>(current) / elapsed) : 0;

    last_percent_ = percent;
    last_current_ = current;
    last_total_ = total;
    drawn_ = true;

    std::cout << "\r" << render(current, total, speed) << std::flush;
}

void ProgressBar::finish() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) return;
    finished_ = true;
    if (!drawn_) return;

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    std::uint64_t speed = elapsed > 0.0 ? static_cast<std::uint64_t>(static_cast<double>(last_current_) / elapsed) : 0;
    std::cout << "\r" << render(last_current_, last_total_, speed) << std::endl;
}

void ProgressBar::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!drawn_) return;
    std::cout << "\r" << std::string(79, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t total, std::uint64_t speed_bps) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total > 0) {
        double percent = std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total), 0.0, 100.0);
        line += render_bar(percent);

        int pct_int = static_cast<int>(percent);
        line += " ";
        if (pct_int < 100) line += " ";
        if (pct_int < 10) line += " ";
        line += std::to_string(pct_int) + "%";

        line += " (";
        line += format_bytes(std::min(current, total));
        line += "/";
        line += format_bytes(total);
        line += ")";
    } else {
        line += format_bytes(current);
    }

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        if (total > current) {
            line += " ETA: ";
            line += format_time((total - current) / speed_bps);
        }
    }

    // Clear what a longer previous frame left behind
    line += std::string(8, ' ');
    return line;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

//=============================================================================
// Formatting
//=============================================================================

namespace {

std::string scaled(double value, int precision, const char* unit) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value << ' ' << unit;
    return ss.str();
}

} // namespace

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return scaled(static_cast<double>(bytes) / TB, 2, "TB");
    } else if (bytes >= GB) {
        return scaled(static_cast<double>(bytes) / GB, 2, "GB");
    } else if (bytes >= MB) {
        return scaled(static_cast<double>(bytes) / MB, 1, "MB");
    } else if (bytes >= KB) {
        return scaled(static_cast<double>(bytes) / KB, 0, "KB");
    }
    return std::to_string(bytes) + " B";
}

std::string format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bps >= GB) {
        return scaled(static_cast<double>(bps) / GB, 1, "GB/s");
    } else if (bps >= MB) {
        return scaled(static_cast<double>(bps) / MB, 1, "MB/s");
    } else if (bps >= KB) {
        return scaled(static_cast<double>(bps) / KB, 1, "KB/s");
    }
    return std::to_string(bps) + " B/s";
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace rangedl::cli
