// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/chunk_fetcher.hpp>
#include <rangedl/core/config.hpp>
#include <rangedl/core/error.hpp>
#include <rangedl/core/http_session.hpp>
#include <rangedl/core/progress.hpp>
#include <rangedl/core/range_planner.hpp>
#include <rangedl/disk/merger.hpp>
#include <rangedl/disk/segment_layout.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace rangedl::core {

// Coordinator state. The terminal state stays visible until the next run.
enum class DownloadState : std::uint8_t {
    idle,           // No run has started yet
    probing,        // HEAD request in flight
    single_stream,  // One plain GET into <name>.tmp
    chunked,        // Range fetchers running
    merging,        // Concatenating segment stores
    succeeded,      // Final file is in place
    failed          // Terminal failure; see DownloadResult
};

enum class Strategy : std::uint8_t {
    none,           // Never got past the probe
    single_stream,
    chunked
};

[[nodiscard]] std::string_view state_name(DownloadState state) noexcept;
[[nodiscard]] std::string_view strategy_name(Strategy strategy) noexcept;

struct ExpectedDigest {
    disk::DigestAlgorithm algorithm{disk::DigestAlgorithm::md5};
    std::string hex;
};

struct DownloadOptions {
    std::optional<ExpectedDigest> digest;
    // Overrides the name derived from the probe and the URL
    std::string filename;
};

struct DownloadResult {
    DownloadState state{DownloadState::idle};
    std::error_code error;
    std::string message;
    std::filesystem::path output;
    std::uint64_t bytes{0};
    Strategy strategy{Strategy::none};
    std::vector<ChunkOutcome> outcomes;         // One per chunk, index order
    std::vector<ChunkOutcome> failed_chunks;
    std::optional<bool> digest_ok;              // Set only when a digest was supplied

    [[nodiscard]] bool ok() const noexcept { return state == DownloadState::succeeded; }
};

// Drives one download end to end: probe, pick a strategy, fetch (in parallel
// when the origin allows it), merge, verify.
//
// A single instance runs one download at a time; a second concurrent run()
// is rejected with DownloadErrc::busy. The query methods and cancel() are
// safe to call from any thread while run() is in progress.
class DownloadCoordinator {
public:
    // Uses its own libcurl session built from config
    explicit DownloadCoordinator(DownloadConfig config = {});
    // Uses a caller-owned transport, which must outlive the coordinator
    explicit DownloadCoordinator(Transport& transport, DownloadConfig config = {});
    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;
    DownloadCoordinator(DownloadCoordinator&&) = delete;
    DownloadCoordinator& operator=(DownloadCoordinator&&) = delete;

    [[nodiscard]] DownloadResult run(std::string_view url,
                                     std::int64_t worker_count,
                                     const std::filesystem::path& destination_dir) noexcept;

    [[nodiscard]] DownloadResult run(std::string_view url,
                                     std::int64_t worker_count,
                                     const std::filesystem::path& destination_dir,
                                     const DownloadOptions& options) noexcept;

    // Probe only; does not change state
    [[nodiscard]] std::expected<ResourceInfo, std::error_code> probe(std::string_view url) noexcept;

    // Stops every in-flight fetcher; the current run ends as failed/cancelled.
    // Returns false when no run is in progress, so nothing was stopped.
    bool cancel() noexcept;

    // Bytes received so far, clamped to the total when the total is known
    [[nodiscard]] std::uint64_t downloaded() const noexcept;
    // 0 when unknown or before the probe
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_.load(std::memory_order_acquire); }
    // 0.0 .. 1.0
    [[nodiscard]] double fraction() const noexcept;
    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Periodic (downloaded, total) samples while a transfer is running
    void set_progress_sink(ProgressSink sink);

    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

private:
    struct Plan {
        std::string url;
        disk::SegmentLayout layout;
        std::optional<std::uint64_t> size;
        std::uint32_t workers{1};
    };

    [[nodiscard]] DownloadResult execute(std::string_view url,
                                         std::int64_t worker_count,
                                         const std::filesystem::path& destination_dir,
                                         const DownloadOptions& options,
                                         std::stop_token stoken);

    void run_single_stream(const Plan& plan, DownloadResult& result, std::stop_token stoken);
    void run_chunked(const Plan& plan, DownloadResult& result, std::stop_token stoken);
    void run_merge(const Plan& plan, DownloadResult& result);
    void verify(const ExpectedDigest& digest, DownloadResult& result) const;

    void fail(DownloadResult& result, std::error_code ec, std::string message);
    void set_state(DownloadState state) noexcept;

    [[nodiscard]] std::shared_ptr<ProgressAggregator> current_progress() const;
    [[nodiscard]] std::unique_ptr<ProgressObserver> make_observer(const ProgressAggregator& progress,
                                                                  std::uint64_t total);

    std::unique_ptr<Transport> owned_transport_;
    Transport& transport_;
    DownloadConfig config_;
    disk::Merger merger_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    std::atomic<std::uint64_t> total_size_{0};

    std::shared_ptr<ProgressAggregator> progress_;
    std::stop_source stop_source_;
    ProgressSink progress_sink_;
    bool running_{false};
    mutable std::mutex mutex_;  // Protects running_, progress_, stop_source_ and progress_sink_
};

// File name used when neither the server nor the URL provides one
[[nodiscard]] std::string fallback_filename();

} // namespace rangedl::core
