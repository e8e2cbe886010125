// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/download_coordinator.hpp>
#include <rangedl/core/url.hpp>
#include <rangedl/core/worker_pool.hpp>
#include <rangedl/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <future>

namespace rangedl::core {

namespace fs = std::filesystem;

std::string_view state_name(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::idle:          return "idle";
        case DownloadState::probing:       return "probing";
        case DownloadState::single_stream: return "single_stream";
        case DownloadState::chunked:       return "chunked";
        case DownloadState::merging:       return "merging";
        case DownloadState::succeeded:     return "succeeded";
        case DownloadState::failed:        return "failed";
    }
    return "unknown";
}

std::string_view strategy_name(Strategy strategy) noexcept {
    switch (strategy) {
        case Strategy::none:          return "none";
        case Strategy::single_stream: return "single stream";
        case Strategy::chunked:       return "chunked";
    }
    return "unknown";
}

std::string fallback_filename() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "download_" + std::to_string(millis);
}

//=============================================================================
// DownloadCoordinator
//=============================================================================

DownloadCoordinator::DownloadCoordinator(DownloadConfig config)
    : owned_transport_(std::make_unique<HttpSession>(config))
    , transport_(*owned_transport_)
    , config_(std::move(config)) {}

DownloadCoordinator::DownloadCoordinator(Transport& transport, DownloadConfig config)
    : transport_(transport)
    , config_(std::move(config)) {}

DownloadCoordinator::~DownloadCoordinator() {
    cancel();
}

DownloadResult DownloadCoordinator::run(std::string_view url,
                                        std::int64_t worker_count,
                                        const fs::path& destination_dir) noexcept {
    return run(url, worker_count, destination_dir, DownloadOptions{});
}

DownloadResult DownloadCoordinator::run(std::string_view url,
                                        std::int64_t worker_count,
                                        const fs::path& destination_dir,
                                        const DownloadOptions& options) noexcept {
    std::stop_token stoken;
    {
        // Marking the run and arming its stop source is one step for cancel()
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            DownloadResult busy;
            busy.state = DownloadState::failed;
            busy.error = make_error_code(DownloadErrc::busy);
            busy.message = "A download is already running on this coordinator";
            spdlog::warn("{}", busy.message);
            return busy;
        }
        running_ = true;
        stop_source_ = std::stop_source{};
        stoken = stop_source_.get_token();
    }

    DownloadResult result;
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_ = std::make_shared<ProgressAggregator>();
        }
        total_size_.store(0, std::memory_order_release);

        result = execute(url, worker_count, destination_dir, options, stoken);
    } catch (const std::exception& e) {
        spdlog::error("Download aborted: {}", e.what());
        result.state = DownloadState::failed;
        result.error = make_error_code(DownloadErrc::network_error);
        result.message = e.what();
        set_state(DownloadState::failed);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    return result;
}

std::expected<ResourceInfo, std::error_code> DownloadCoordinator::probe(std::string_view url) noexcept {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return transport_.probe(parsed->str());
}

bool DownloadCoordinator::cancel() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return false;
    }
    if (stop_source_.request_stop()) {
        spdlog::info("Cancellation requested");
    }
    return true;
}

std::uint64_t DownloadCoordinator::downloaded() const noexcept {
    auto progress = current_progress();
    if (!progress) {
        return 0;
    }
    auto bytes = progress->snapshot();
    auto total = total_size();
    // Failed attempts keep their bytes in the counter
    return total > 0 ? std::min(bytes, total) : bytes;
}

double DownloadCoordinator::fraction() const noexcept {
    auto total = total_size();
    if (total == 0) {
        return state() == DownloadState::succeeded ? 1.0 : 0.0;
    }
    return std::min(1.0, static_cast<double>(downloaded()) / static_cast<double>(total));
}

void DownloadCoordinator::set_progress_sink(ProgressSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_sink_ = std::move(sink);
}

DownloadResult DownloadCoordinator::execute(std::string_view url,
                                            std::int64_t worker_count,
                                            const fs::path& destination_dir,
                                            const DownloadOptions& options,
                                            std::stop_token stoken) {
    DownloadResult result;

    auto parsed = Url::parse(url);
    if (!parsed) {
        fail(result, parsed.error(), "Invalid URL '" + std::string(url) + "': " + parsed.error().message());
        return result;
    }

    // 1. Probe, exactly once
    set_state(DownloadState::probing);
    spdlog::info("Probing {}", parsed->str());
    auto info = transport_.probe(parsed->str());
    if (!info) {
        fail(result, make_error_code(DownloadErrc::probe_failed),
             "Probe failed: " + info.error().message());
        return result;
    }
    if (stoken.stop_requested()) {
        fail(result, make_error_code(DownloadErrc::cancelled), "Download cancelled");
        return result;
    }

    Plan plan;
    plan.url = parsed->str();
    plan.size = info->content_length;
    plan.workers = clamp_workers(worker_count);
    total_size_.store(plan.size.value_or(0), std::memory_order_release);

    spdlog::info("Size: {}, ranges: {}, type: {}",
                 plan.size ? std::to_string(*plan.size) : std::string("unknown"),
                 info->accepts_ranges ? "yes" : "no",
                 info->content_type.empty() ? std::string("-") : info->content_type);

    // 2. Output location
    std::string name = options.filename;
    if (name.empty()) name = info->filename;
    if (name.empty()) name = parsed->filename();
    if (name.empty()) name = fallback_filename();
    plan.layout = disk::SegmentLayout(destination_dir, name);
    result.output = plan.layout.output_path();

    std::error_code dir_ec;
    fs::create_directories(destination_dir, dir_ec);
    if (dir_ec) {
        fail(result, disk::from_errno(dir_ec.value(), disk::DiskErrc::invalid_path),
             "Cannot create " + destination_dir.string() + ": " + dir_ec.message());
        return result;
    }

    // 3. Strategy
    bool chunked = info->accepts_ranges &&
                   plan.workers > 1 &&
                   plan.size.has_value() &&
                   *plan.size > config_.chunked_threshold;

    if (chunked) {
        result.strategy = Strategy::chunked;
        run_chunked(plan, result, stoken);
        if (result.state == DownloadState::failed) {
            return result;
        }
        run_merge(plan, result);
    } else {
        result.strategy = Strategy::single_stream;
        run_single_stream(plan, result, stoken);
    }

    if (result.state == DownloadState::failed) {
        return result;
    }

    // 4. Optional digest check; never undoes the download
    if (options.digest) {
        verify(*options.digest, result);
    }

    set_state(DownloadState::succeeded);
    result.state = DownloadState::succeeded;
    spdlog::info("Saved {} ({} bytes, {})", result.output.string(), result.bytes,
                 strategy_name(result.strategy));
    return result;
}

void DownloadCoordinator::run_single_stream(const Plan& plan, DownloadResult& result, std::stop_token stoken) {
    set_state(DownloadState::single_stream);
    spdlog::info("Single-stream transfer into {}", plan.layout.temp_path().string());

    auto progress = current_progress();
    ChunkFetcher fetcher(transport_, *progress, FetchPolicy{config_.max_attempts, config_.retry_delay});

    ChunkOutcome outcome;
    {
        auto observer = make_observer(*progress, plan.size.value_or(0));
        outcome = fetcher.fetch_whole(plan.url, plan.layout.temp_path(), plan.size, stoken);
    }
    result.outcomes.push_back(outcome);

    if (stoken.stop_requested()) {
        std::error_code ignored;
        fs::remove(plan.layout.temp_path(), ignored);
        fail(result, make_error_code(DownloadErrc::cancelled), "Download cancelled");
        return;
    }
    if (!outcome.success) {
        result.failed_chunks.push_back(outcome);
        std::error_code ignored;
        fs::remove(plan.layout.temp_path(), ignored);
        fail(result, outcome.error, "Transfer failed: " + outcome.message);
        return;
    }

    std::error_code ec;
    fs::rename(plan.layout.temp_path(), plan.layout.output_path(), ec);
    if (ec) {
        fail(result, make_error_code(disk::DiskErrc::rename_failed),
             "Cannot rename " + plan.layout.temp_path().string() + ": " + ec.message());
        return;
    }
    result.bytes = outcome.bytes_written;
}

void DownloadCoordinator::run_chunked(const Plan& plan, DownloadResult& result, std::stop_token stoken) {
    set_state(DownloadState::chunked);

    auto ranges = plan_ranges(*plan.size, plan.workers);
    if (!ranges) {
        fail(result, ranges.error(), "Cannot plan ranges: " + ranges.error().message());
        return;
    }
    const auto chunk_count = static_cast<std::uint32_t>(ranges->size());
    spdlog::info("Chunked transfer: {} chunks of ~{} bytes", chunk_count, (*ranges)[0].length);

    auto progress = current_progress();
    auto observer = make_observer(*progress, *plan.size);

    // One source per chunk so a timeout cancels only that chunk; the run-wide
    // token fans out to all of them.
    std::vector<std::stop_source> chunk_sources(chunk_count);
    std::stop_callback fan_out(stoken, [&chunk_sources] {
        for (auto& source : chunk_sources) {
            source.request_stop();
        }
    });

    ChunkFetcher fetcher(transport_, *progress, FetchPolicy{config_.max_attempts, config_.retry_delay});
    std::vector<std::future<ChunkOutcome>> futures;
    futures.reserve(chunk_count);

    {
        WorkerPool pool(plan.workers);

        auto dispatched = std::chrono::steady_clock::now();
        for (const auto& range : *ranges) {
            auto token = chunk_sources[range.index].get_token();
            auto segment = plan.layout.segment_path(range.index);
            futures.push_back(pool.submit([&fetcher, &plan, range, segment, token] {
                return fetcher.fetch(plan.url, range, segment, token);
            }));
        }

        // The pool is as wide as the plan, so every chunk starts at dispatch
        auto deadline = dispatched + config_.chunk_timeout;
        for (std::uint32_t i = 0; i < chunk_count; ++i) {
            if (futures[i].wait_until(deadline) == std::future_status::timeout) {
                chunk_sources[i].request_stop();
                ChunkOutcome timed_out;
                timed_out.index = i;
                timed_out.error = make_error_code(DownloadErrc::timeout);
                timed_out.message = "No result within " + std::to_string(config_.chunk_timeout.count()) + " s";
                spdlog::error("Chunk {}: {}", i, timed_out.message);
                result.outcomes.push_back(std::move(timed_out));
                continue;
            }
            result.outcomes.push_back(futures[i].get());
        }
        // Leaving the scope joins the workers, including cancelled stragglers
    }

    if (observer) {
        observer->stop();
    }

    for (const auto& outcome : result.outcomes) {
        if (!outcome.success) {
            result.failed_chunks.push_back(outcome);
        }
    }

    if (stoken.stop_requested()) {
        fail(result, make_error_code(DownloadErrc::cancelled), "Download cancelled");
        return;
    }
    if (!result.failed_chunks.empty()) {
        std::string detail;
        for (const auto& failed : result.failed_chunks) {
            if (!detail.empty()) detail += "; ";
            detail += "chunk " + std::to_string(failed.index) + ": " + failed.message;
        }
        // Segment stores stay on disk; nothing is merged
        fail(result, make_error_code(DownloadErrc::chunk_failed),
             std::to_string(result.failed_chunks.size()) + " of " + std::to_string(chunk_count) +
             " chunks failed (" + detail + ")");
        return;
    }

    for (const auto& outcome : result.outcomes) {
        result.bytes += outcome.bytes_written;
    }
}

void DownloadCoordinator::run_merge(const Plan& plan, DownloadResult& result) {
    set_state(DownloadState::merging);

    auto merged = merger_.merge(plan.layout.directory,
                                static_cast<std::uint32_t>(result.outcomes.size()),
                                plan.layout.output_path(),
                                plan.size);
    if (!merged) {
        fail(result, merged.error(), "Merge failed: " + merged.error().message());
        return;
    }
    result.bytes = merged->bytes;
}

void DownloadCoordinator::verify(const ExpectedDigest& digest, DownloadResult& result) const {
    auto verdict = disk::Merger::verify_digest(result.output, digest.algorithm, digest.hex);
    if (!verdict) {
        spdlog::error("Cannot verify {} digest: {}", disk::digest_name(digest.algorithm),
                      verdict.error().message());
        result.digest_ok = false;
        result.error = verdict.error();
        result.message = "Digest verification failed: " + verdict.error().message();
        return;
    }
    result.digest_ok = *verdict;
    if (!*verdict) {
        result.error = make_error_code(DownloadErrc::checksum_mismatch);
        result.message = std::string(disk::digest_name(digest.algorithm)) + " mismatch";
    }
}

void DownloadCoordinator::fail(DownloadResult& result, std::error_code ec, std::string message) {
    result.state = DownloadState::failed;
    result.error = ec;
    result.message = std::move(message);
    set_state(DownloadState::failed);
    if (ec == DownloadErrc::cancelled) {
        spdlog::warn("{}", result.message);
    } else {
        spdlog::error("{}", result.message);
    }
}

void DownloadCoordinator::set_state(DownloadState state) noexcept {
    state_.store(state, std::memory_order_release);
    spdlog::debug("State -> {}", state_name(state));
}

std::shared_ptr<ProgressAggregator> DownloadCoordinator::current_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::unique_ptr<ProgressObserver> DownloadCoordinator::make_observer(const ProgressAggregator& progress,
                                                                     std::uint64_t total) {
    ProgressSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = progress_sink_;
    }
    if (!sink) {
        return nullptr;
    }
    auto observer = std::make_unique<ProgressObserver>(progress, total, std::move(sink), config_.progress_interval);
    observer->start();
    return observer;
}

} // namespace rangedl::core
