// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangedl/core/chunk_fetcher.hpp>
#include "test_support.hpp"
#include <chrono>
#include <thread>

using namespace rangedl::core;
using namespace rangedl::test;

namespace {

constexpr const char* URL = "http://origin.test/data.bin";

FetchPolicy fast_policy(std::uint32_t attempts = 3) {
    return FetchPolicy{attempts, std::chrono::milliseconds(1)};
}

} // namespace

TEST_CASE("ChunkFetcher - range lands byte-exact in its segment", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(10'000));
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy());

    ChunkRange range{2, 4000, 2500};
    auto outcome = fetcher.fetch(URL, range, dir / "data.bin.part2");

    REQUIRE(outcome.success);
    CHECK(outcome.index == 2);
    CHECK(outcome.attempts == 1);
    CHECK(outcome.bytes_written == 2500);
    CHECK(!outcome.error);
    CHECK(read_file(dir / "data.bin.part2") == origin.body().substr(4000, 2500));
    CHECK(progress.snapshot() == 2500);

    auto requests = origin.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].range.has_value());
    CHECK(requests[0].range->first == 4000);
    CHECK(requests[0].range->last == 6499);
}

TEST_CASE("ChunkFetcher - origin ignoring the range still yields the right bytes", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(10'000));
    origin.ignore_range = true;
    origin.piece = 777;  // Misaligned with the range start
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy());

    auto outcome = fetcher.fetch(URL, ChunkRange{1, 3000, 3000}, dir / "seg");

    REQUIRE(outcome.success);
    CHECK(read_file(dir / "seg") == origin.body().substr(3000, 3000));
    CHECK(progress.snapshot() == 3000);
}

TEST_CASE("ChunkFetcher - transient failure is retried from the range start", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(8192));
    origin.script = [](const FetchRequest&, int attempt) {
        Script s;
        if (attempt == 1) {
            s.cut_at = 1000;
            s.error = make_error_code(DownloadErrc::connection_lost);
        }
        return s;
    };
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy());

    auto outcome = fetcher.fetch(URL, ChunkRange{0, 0, 4096}, dir / "seg");

    REQUIRE(outcome.success);
    CHECK(outcome.attempts == 2);
    CHECK(origin.attempts_for(0) == 2);
    CHECK(read_file(dir / "seg") == origin.body().substr(0, 4096));
    // Bytes from the failed attempt stay counted
    CHECK(progress.snapshot() == 1000 + 4096);
}

TEST_CASE("ChunkFetcher - gives up after the attempt limit", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(4096));
    origin.script = [](const FetchRequest&, int) {
        Script s;
        s.error = make_error_code(DownloadErrc::network_error);
        s.cut_at = 0;
        return s;
    };
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy(3));

    auto outcome = fetcher.fetch(URL, ChunkRange{0, 0, 4096}, dir / "seg");

    CHECK(!outcome.success);
    CHECK(outcome.attempts == 3);
    CHECK(origin.attempts_for(0) == 3);
    CHECK(outcome.error == DownloadErrc::network_error);
    CHECK(!outcome.message.empty());
}

TEST_CASE("ChunkFetcher - short body is a size mismatch", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(4096));
    origin.script = [](const FetchRequest&, int) {
        Script s;
        s.cut_at = 4000;  // Connection closed cleanly, 96 bytes short
        return s;
    };
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy(2));

    auto outcome = fetcher.fetch(URL, ChunkRange{0, 0, 4096}, dir / "seg");

    CHECK(!outcome.success);
    CHECK(outcome.attempts == 2);
    CHECK(outcome.error == DownloadErrc::size_mismatch);
    CHECK(outcome.message == "Received 4000 of 4096 bytes");
}

TEST_CASE("ChunkFetcher - unexpected status fails the attempt", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(4096));
    origin.script = [](const FetchRequest&, int attempt) {
        Script s;
        if (attempt < 3) s.status = 503;
        return s;
    };
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy(3));

    auto outcome = fetcher.fetch(URL, ChunkRange{0, 0, 4096}, dir / "seg");

    REQUIRE(outcome.success);
    CHECK(outcome.attempts == 3);
}

TEST_CASE("ChunkFetcher - non-retryable errors stop immediately", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(4096));
    auto code = GENERATE(DownloadErrc::invalid_url, DownloadErrc::unsupported_protocol);
    origin.script = [code](const FetchRequest&, int) {
        Script s;
        s.cut_at = 0;
        s.error = make_error_code(code);
        return s;
    };
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy(3));

    auto outcome = fetcher.fetch(URL, ChunkRange{0, 0, 4096}, dir / "seg");

    CHECK(!outcome.success);
    CHECK(outcome.attempts == 1);
    CHECK(outcome.error == code);
}

TEST_CASE("ChunkFetcher - cancellation during the retry wait", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(4096));
    origin.script = [](const FetchRequest&, int) {
        Script s;
        s.cut_at = 0;
        s.error = make_error_code(DownloadErrc::timeout);
        return s;
    };
    ProgressAggregator progress;
    // Long delay: only the stop request can end the wait early
    ChunkFetcher fetcher(origin, progress, FetchPolicy{3, std::chrono::milliseconds(60'000)});

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop.request_stop();
    });

    auto started = std::chrono::steady_clock::now();
    auto outcome = fetcher.fetch(URL, ChunkRange{0, 0, 4096}, dir / "seg", stop.get_token());
    auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(!outcome.success);
    CHECK(outcome.attempts == 1);
    CHECK(outcome.error == DownloadErrc::cancelled);
    CHECK(elapsed < std::chrono::seconds(10));
}

TEST_CASE("ChunkFetcher - already cancelled token makes no request", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(4096));
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy());

    std::stop_source stop;
    stop.request_stop();
    auto outcome = fetcher.fetch(URL, ChunkRange{0, 0, 4096}, dir / "seg", stop.get_token());

    CHECK(!outcome.success);
    CHECK(outcome.error == DownloadErrc::cancelled);
    CHECK(origin.requests().empty());
}

TEST_CASE("ChunkFetcher - fetch_whole", "[fetcher]") {
    TempDir dir;
    FakeTransport origin(make_payload(5000));
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy());

    SECTION("Known size") {
        auto outcome = fetcher.fetch_whole(URL, dir / "whole", 5000);
        REQUIRE(outcome.success);
        CHECK(read_file(dir / "whole") == origin.body());
        CHECK(!origin.requests().front().range.has_value());
    }

    SECTION("Unknown size accepts whatever arrives") {
        auto outcome = fetcher.fetch_whole(URL, dir / "whole", std::nullopt);
        REQUIRE(outcome.success);
        CHECK(outcome.bytes_written == 5000);
    }

    SECTION("Known size, short body") {
        origin.script = [](const FetchRequest&, int) {
            Script s;
            s.cut_at = 10;
            return s;
        };
        auto outcome = fetcher.fetch_whole(URL, dir / "whole", 5000);
        CHECK(!outcome.success);
        CHECK(outcome.error == DownloadErrc::size_mismatch);
    }
}

TEST_CASE("ChunkFetcher - empty range creates an empty segment", "[fetcher]") {
    TempDir dir;
    FakeTransport origin("");
    ProgressAggregator progress;
    ChunkFetcher fetcher(origin, progress, fast_policy());

    auto outcome = fetcher.fetch(URL, ChunkRange{0, 0, 0}, dir / "seg");

    REQUIRE(outcome.success);
    CHECK(std::filesystem::exists(dir / "seg"));
    CHECK(std::filesystem::file_size(dir / "seg") == 0);
    CHECK(origin.requests().empty());
}
