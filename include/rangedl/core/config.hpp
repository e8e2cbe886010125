// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace rangedl::core {

constexpr std::uint32_t MIN_WORKERS = 1;
constexpr std::uint32_t MAX_WORKERS = 16;
constexpr std::uint32_t DEFAULT_WORKERS = 4;

constexpr std::uint64_t CHUNKED_THRESHOLD = 1024 * 1024;            // 1 MiB

constexpr std::uint32_t MAX_ATTEMPTS = 3;
constexpr std::chrono::milliseconds RETRY_DELAY{1000};
constexpr std::chrono::seconds CHUNK_TIMEOUT{300};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{250};

constexpr std::size_t IO_BUFFER_SIZE = 64 * 1024;                   // 64 KB

// Runtime knobs for one coordinator; defaults mirror the constants above.
struct DownloadConfig {
    std::uint32_t max_attempts{MAX_ATTEMPTS};
    std::chrono::milliseconds retry_delay{RETRY_DELAY};
    std::chrono::seconds chunk_timeout{CHUNK_TIMEOUT};
    std::uint64_t chunked_threshold{CHUNKED_THRESHOLD};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::string user_agent{"rangedl/0.1"};
    std::vector<std::string> headers;   // "Name: value", passed through verbatim
    bool verify_tls{true};

    [[nodiscard]] std::error_code validate() const noexcept;
};

// Clamp a requested worker count into [MIN_WORKERS, MAX_WORKERS].
[[nodiscard]] constexpr std::uint32_t clamp_workers(std::int64_t requested) noexcept {
    if (requested < static_cast<std::int64_t>(MIN_WORKERS)) return MIN_WORKERS;
    if (requested > static_cast<std::int64_t>(MAX_WORKERS)) return MAX_WORKERS;
    return static_cast<std::uint32_t>(requested);
}

// Load overrides from a JSON object on top of the defaults.
[[nodiscard]] std::expected<DownloadConfig, std::error_code>
load_config(std::string_view path) noexcept;

// Same as load_config, from an in-memory JSON document.
[[nodiscard]] std::expected<DownloadConfig, std::error_code>
parse_config(std::string_view json) noexcept;

} // namespace rangedl::core
