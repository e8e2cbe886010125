// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/config.hpp>
#include <rangedl/core/error.hpp>
#include <rangedl/core/http_session.hpp>
#include <rangedl/core/progress.hpp>
#include <rangedl/core/range_planner.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace rangedl::core {

// Per-chunk state machine
enum class FetchPhase : std::uint8_t {
    attempting,  // Request in flight
    retry_wait,  // Sleeping before the next attempt
    succeeded,   // Segment store holds exactly the range
    exhausted    // Gave up: attempts used up, permanent error, or cancelled
};

// Result of fetching one chunk; produced exactly once per chunk
struct ChunkOutcome {
    std::uint32_t index{0};
    bool success{false};
    std::uint64_t bytes_written{0};
    std::error_code error;
    std::string message;
    std::uint32_t attempts{0};
};

struct FetchPolicy {
    std::uint32_t max_attempts{MAX_ATTEMPTS};
    std::chrono::milliseconds retry_delay{RETRY_DELAY};
};

// Downloads one byte range into its own segment store.
//
// Every attempt truncates the segment store and restarts from the first byte
// of the range. Never throws; all failures end up in the outcome.
class ChunkFetcher {
public:
    ChunkFetcher(Transport& transport, ProgressAggregator& progress, FetchPolicy policy = {}) noexcept;

    [[nodiscard]] ChunkOutcome fetch(const std::string& url,
                                     const ChunkRange& range,
                                     const std::filesystem::path& segment_path,
                                     std::stop_token stoken = {}) noexcept;

    // Whole resource without a Range header. The length is checked only when
    // expected_size is known.
    [[nodiscard]] ChunkOutcome fetch_whole(const std::string& url,
                                           const std::filesystem::path& path,
                                           std::optional<std::uint64_t> expected_size,
                                           std::stop_token stoken = {}) noexcept;

    [[nodiscard]] const FetchPolicy& policy() const noexcept { return policy_; }

private:
    struct Attempt {
        FetchRequest request;
        std::uint64_t skip_on_full{0};            // bytes to drop when the origin answers 200
        std::optional<std::uint64_t> expected;    // exact length the store must end up with
        std::filesystem::path path;
    };

    [[nodiscard]] ChunkOutcome run(std::uint32_t index, const Attempt& attempt, std::stop_token stoken) noexcept;

    [[nodiscard]] std::error_code attempt_once(const Attempt& attempt,
                                               std::uint64_t& written,
                                               std::string& detail,
                                               std::stop_token stoken) noexcept;

    // false when cancelled during the wait
    [[nodiscard]] bool wait_before_retry(std::stop_token stoken) const noexcept;

    Transport& transport_;
    ProgressAggregator& progress_;
    FetchPolicy policy_;
};

} // namespace rangedl::core
