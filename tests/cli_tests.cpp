// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangedl/cli/commands.hpp>
#include <rangedl/cli/progress_bar.hpp>
#include <rangedl/version.hpp>
#include <string>
#include "test_support.hpp"
#include <vector>

using namespace rangedl::cli;

namespace {

CliArgs parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "rangedl");
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args - defaults", "[cli]") {
    auto args = parse({"https://example.com/a.zip"});
    CHECK(args.error.empty());
    CHECK(args.url == "https://example.com/a.zip");
    CHECK(args.threads == rangedl::core::DEFAULT_WORKERS);
    CHECK(args.output_dir == ".");
    CHECK(!args.digest.has_value());
    CHECK(!args.info_only);
}

TEST_CASE("parse_args - options", "[cli]") {
    auto args = parse({"-n", "8", "-d", "/tmp/out", "-o", "x.bin", "-H", "A: 1", "--header", "B: 2",
                       "--sha256", "ABCDEF", "-c", "cfg.json", "-V", "https://example.com/a.zip"});
    REQUIRE(args.error.empty());
    CHECK(args.threads == 8);
    CHECK(args.output_dir == "/tmp/out");
    CHECK(args.output_file == "x.bin");
    REQUIRE(args.headers.size() == 2);
    CHECK(args.headers[1] == "B: 2");
    REQUIRE(args.digest.has_value());
    CHECK(args.digest->algorithm == rangedl::disk::DigestAlgorithm::sha256);
    CHECK(args.digest->hex == "ABCDEF");
    CHECK(args.config_path == "cfg.json");
    CHECK(args.verbose);
}

TEST_CASE("parse_args - help and version short-circuit", "[cli]") {
    CHECK(parse({"-h"}).help);
    CHECK(parse({"--version"}).version);
    CHECK(parse({"--bogus", "-h"}).error == "Unknown option: --bogus");
}

TEST_CASE("parse_args - errors", "[cli]") {
    CHECK(parse({}).error == "No URL specified");
    CHECK(parse({"-n", "many", "http://x/a.b"}).error == "Invalid thread count: many");
    CHECK(parse({"http://x/a.b", "-n"}).error == "Missing value for -n");
    CHECK(parse({"http://x/a.b", "http://y/c.d"}).error == "Only one URL may be given");
}

TEST_CASE("resolve_config - command line headers are appended", "[cli]") {
    rangedl::test::TempDir dir;
    rangedl::test::write_file(dir / "cfg.json", R"({"headers": ["A: 1"], "max_attempts": 4})");

    CliArgs args;
    args.config_path = (dir / "cfg.json").string();
    args.headers = {"B: 2"};

    auto cfg = resolve_config(args);
    REQUIRE(cfg.has_value());
    CHECK(cfg->max_attempts == 4);
    REQUIRE(cfg->headers.size() == 2);
    CHECK(cfg->headers[0] == "A: 1");
    CHECK(cfg->headers[1] == "B: 2");

    args.headers = {"broken"};
    CHECK(!resolve_config(args).has_value());
}

TEST_CASE("Byte and time formatting", "[cli]") {
    CHECK(format_bytes(0) == "0 B");
    CHECK(format_bytes(1023) == "1023 B");
    CHECK(format_bytes(2048) == "2 KB");
    CHECK(format_bytes(5 * 1024 * 1024 + 512 * 1024) == "5.5 MB");
    CHECK(format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");

    CHECK(format_speed(500) == "500 B/s");
    CHECK(format_speed(1536) == "1.5 KB/s");

    CHECK(format_time(59) == "59s");
    CHECK(format_time(61) == "1m 1s");
    CHECK(format_time(3600 + 5 * 60 + 7) == "1h 05m 07s");
}

TEST_CASE("ProgressBar rendering", "[cli]") {
    ProgressBar bar("Downloading");

    auto half = bar.render(512, 1024, 0);
    CHECK(half.rfind("Downloading: [", 0) == 0);
    CHECK(half.find(" 50%") != std::string::npos);
    CHECK(half.find("(512 B/1 KB)") != std::string::npos);

    auto unknown = bar.render(2048, 0, 1024);
    CHECK(unknown.find("2 KB @ 1.0 KB/s") != std::string::npos);
    CHECK(unknown.find('%') == std::string::npos);
}

TEST_CASE("Version string matches its components", "[cli]") {
    auto expected = std::to_string(RANGEDL_VERSION_MAJOR) + "." + std::to_string(RANGEDL_VERSION_MINOR) +
                    "." + std::to_string(RANGEDL_VERSION_PATCH);
    CHECK(rangedl::VERSION == expected);
}
