// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/core/chunk_fetcher.hpp>
#include <rangedl/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace rangedl::core {

namespace fs = std::filesystem;

ChunkFetcher::ChunkFetcher(Transport& transport, ProgressAggregator& progress, FetchPolicy policy) noexcept
    : transport_(transport)
    , progress_(progress)
    , policy_(policy) {
    if (policy_.max_attempts == 0) {
        policy_.max_attempts = 1;
    }
}

ChunkOutcome ChunkFetcher::fetch(const std::string& url,
                                 const ChunkRange& range,
                                 const fs::path& segment_path,
                                 std::stop_token stoken) noexcept {
    if (range.empty()) {
        // Nothing to transfer; the store still has to exist for the merge
        ChunkOutcome outcome;
        outcome.index = range.index;
        outcome.attempts = 1;
        disk::FileWriter writer;
        if (auto ec = writer.open(segment_path)) {
            outcome.error = ec;
            outcome.message = ec.message();
            return outcome;
        }
        outcome.success = true;
        return outcome;
    }

    Attempt attempt;
    attempt.request.url = url;
    attempt.request.range = ByteRange{range.start, range.end()};
    attempt.skip_on_full = range.start;
    attempt.expected = range.length;
    attempt.path = segment_path;
    return run(range.index, attempt, stoken);
}

ChunkOutcome ChunkFetcher::fetch_whole(const std::string& url,
                                       const fs::path& path,
                                       std::optional<std::uint64_t> expected_size,
                                       std::stop_token stoken) noexcept {
    Attempt attempt;
    attempt.request.url = url;
    attempt.expected = expected_size;
    attempt.path = path;
    return run(0, attempt, stoken);
}

ChunkOutcome ChunkFetcher::run(std::uint32_t index, const Attempt& attempt, std::stop_token stoken) noexcept {
    ChunkOutcome outcome;
    outcome.index = index;

    FetchPhase phase = FetchPhase::attempting;
    while (phase != FetchPhase::succeeded && phase != FetchPhase::exhausted) {
        switch (phase) {
            case FetchPhase::attempting: {
                ++outcome.attempts;
                std::uint64_t written = 0;
                std::string detail;

                auto ec = attempt_once(attempt, written, detail, stoken);
                outcome.bytes_written = written;

                if (!ec) {
                    outcome.success = true;
                    outcome.error.clear();
                    outcome.message.clear();
                    phase = FetchPhase::succeeded;
                    spdlog::debug("Chunk {}: {} bytes in {} attempt(s)", index, written, outcome.attempts);
                    break;
                }

                outcome.error = ec;
                outcome.message = detail.empty() ? ec.message() : detail;

                if (!is_retryable(ec) || outcome.attempts >= policy_.max_attempts) {
                    phase = FetchPhase::exhausted;
                    if (ec != DownloadErrc::cancelled) {
                        spdlog::error("Chunk {}: giving up after {} attempt(s): {}",
                                      index, outcome.attempts, outcome.message);
                    }
                } else {
                    phase = FetchPhase::retry_wait;
                    spdlog::warn("Chunk {}: attempt {}/{} failed: {}",
                                 index, outcome.attempts, policy_.max_attempts, outcome.message);
                }
                break;
            }

            case FetchPhase::retry_wait:
                if (!wait_before_retry(stoken)) {
                    outcome.error = make_error_code(DownloadErrc::cancelled);
                    outcome.message = outcome.error.message();
                    phase = FetchPhase::exhausted;
                } else {
                    phase = FetchPhase::attempting;
                }
                break;

            default:
                break;
        }
    }

    return outcome;
}

std::error_code ChunkFetcher::attempt_once(const Attempt& attempt,
                                           std::uint64_t& written,
                                           std::string& detail,
                                           std::stop_token stoken) noexcept {
    if (stoken.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }

    try {
        disk::FileWriter writer;
        if (auto ec = writer.open(attempt.path)) {
            detail = "Cannot open " + attempt.path.string() + ": " + ec.message();
            return ec;
        }

        std::error_code disk_ec;
        std::uint64_t to_skip = 0;
        bool first = true;

        BodySink sink = [&](std::int32_t status, std::string_view data) -> bool {
            if (first) {
                first = false;
                // The origin ignored the Range header and is sending everything
                if (status == 200) {
                    to_skip = attempt.skip_on_full;
                }
            }

            if (to_skip > 0) {
                auto dropped = std::min<std::uint64_t>(to_skip, data.size());
                data.remove_prefix(static_cast<std::size_t>(dropped));
                to_skip -= dropped;
            }

            std::size_t take = data.size();
            if (attempt.expected) {
                auto remaining = *attempt.expected - writer.bytes_written();
                take = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, data.size()));
            }

            if (take > 0) {
                if (auto ec = writer.write(data.data(), take)) {
                    disk_ec = ec;
                    return false;
                }
                progress_.add(take);
            }

            // Anything past the range is not ours
            return take == data.size();
        };

        auto result = transport_.fetch(attempt.request, sink, stoken);
        written = writer.bytes_written();

        if (disk_ec) {
            detail = "Write to " + attempt.path.string() + " failed: " + disk_ec.message();
            return disk_ec;
        }
        if (!result) {
            return result.error();
        }
        if (result->status_code != 200 && result->status_code != 206) {
            detail = "HTTP " + std::to_string(result->status_code);
            return make_error_code(DownloadErrc::bad_status);
        }

        if (auto ec = writer.flush()) {
            detail = "Flush of " + attempt.path.string() + " failed: " + ec.message();
            return ec;
        }
        writer.close();

        // Guards against connections that end early without a transport error
        if (attempt.expected) {
            std::error_code size_ec;
            auto on_disk = fs::file_size(attempt.path, size_ec);
            if (size_ec || on_disk != *attempt.expected) {
                detail = "Received " + std::to_string(size_ec ? written : on_disk) +
                         " of " + std::to_string(*attempt.expected) + " bytes";
                return make_error_code(DownloadErrc::size_mismatch);
            }
        }

        return {};
    } catch (const std::exception& e) {
        detail = e.what();
        return make_error_code(DownloadErrc::network_error);
    }
}

bool ChunkFetcher::wait_before_retry(std::stop_token stoken) const noexcept {
    if (stoken.stop_requested()) {
        return false;
    }
    if (policy_.retry_delay.count() <= 0) {
        return true;
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stoken, policy_.retry_delay, [] { return false; });
    return !stoken.stop_requested();
}

} // namespace rangedl::core
