// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/config.hpp>
#include <rangedl/core/download_coordinator.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangedl::cli {

// Process exit status, or the error that ended the command
using CliResult = std::expected<int, std::error_code>;

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_DIGEST_MISMATCH = 2;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_dir{"."};
    std::string output_file;
    std::int64_t threads{core::DEFAULT_WORKERS};
    std::optional<core::ExpectedDigest> digest;
    std::string config_path;
    std::vector<std::string> headers;
    bool info_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;      // Non-empty when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, const char* const argv[]);

// Configuration file (if any) with command line overrides applied
[[nodiscard]] std::expected<core::DownloadConfig, std::error_code> resolve_config(const CliArgs& args) noexcept;

// Download one URL; EXIT_DIGEST_MISMATCH when the file arrived but did not verify
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Probe a URL and print what the server reports
[[nodiscard]] CliResult info(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

// SIGINT/SIGTERM cancel the running download
void install_interrupt_handler() noexcept;
[[nodiscard]] bool interrupt_requested() noexcept;

} // namespace rangedl::cli
