// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/cli/commands.hpp>
#include <rangedl/cli/progress_bar.hpp>
#include <rangedl/core/download_coordinator.hpp>
#include <rangedl/core/error.hpp>
#include <rangedl/core/http_session.hpp>
#include <rangedl/core/url.hpp>
#include <rangedl/version.hpp>
#include <spdlog/spdlog.h>
#include <curl/curlver.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace rangedl::core;

namespace chrono = std::chrono;

namespace rangedl::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

bool parse_count(const char* text, std::int64_t& out) {
    char* end = nullptr;
    long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

// Keeps libcurl initialized for the lifetime of a command
struct CurlScope {
    CurlScope() { HttpSession::global_init(); }
    ~CurlScope() { HttpSession::global_cleanup(); }
    CurlScope(const CurlScope&) = delete;
    CurlScope& operator=(const CurlScope&) = delete;
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, const char* const argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> const char* {
        if (i + 1 >= argc) {
            args.error = "Missing value for " + std::string(option);
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info_only = true;
        } else if (arg == "-n" || arg == "--threads") {
            if (const char* v = value_of(i, arg)) {
                if (!parse_count(v, args.threads)) {
                    args.error = "Invalid thread count: " + std::string(v);
                }
            }
        } else if (arg == "-d" || arg == "--directory") {
            if (const char* v = value_of(i, arg)) {
                args.output_dir = v;
            }
        } else if (arg == "-o" || arg == "--output") {
            if (const char* v = value_of(i, arg)) {
                args.output_file = v;
            }
        } else if (arg == "-c" || arg == "--config") {
            if (const char* v = value_of(i, arg)) {
                args.config_path = v;
            }
        } else if (arg == "-H" || arg == "--header") {
            if (const char* v = value_of(i, arg)) {
                args.headers.emplace_back(v);
            }
        } else if (arg == "--md5" || arg == "--sha256") {
            if (const char* v = value_of(i, arg)) {
                args.digest = ExpectedDigest{
                    arg == "--md5" ? disk::DigestAlgorithm::md5 : disk::DigestAlgorithm::sha256,
                    v};
            }
        } else if (!arg.empty() && arg.front() == '-') {
            args.error = "Unknown option: " + arg;
        } else if (args.url.empty()) {
            args.url = arg;
        } else {
            args.error = "Only one URL may be given";
        }
    }

    if (args.error.empty() && args.url.empty()) {
        args.error = "No URL specified";
    }
    return args;
}

std::expected<DownloadConfig, std::error_code> resolve_config(const CliArgs& args) noexcept {
    DownloadConfig config;
    if (!args.config_path.empty()) {
        auto loaded = load_config(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    try {
        config.headers.insert(config.headers.end(), args.headers.begin(), args.headers.end());
    } catch (const std::exception& e) {
        spdlog::error("Cannot apply headers: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_argument));
    }

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        auto config = resolve_config(args);
        if (!config) {
            std::cerr << "Error: Invalid configuration: " << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }

        CurlScope curl;
        DownloadCoordinator coordinator(std::move(*config));

        ProgressBar bar("Downloading");
        if (!args.quiet) {
            coordinator.set_progress_sink([&bar](std::uint64_t current, std::uint64_t total) {
                bar.update(current, total);
            });
        }

        // Signal handlers may not take locks, so a watcher forwards the request
        std::jthread watcher([&coordinator](std::stop_token stoken) {
            while (!stoken.stop_requested()) {
                // A Ctrl-C before the run starts is held until there is a run to stop
                if (interrupt_requested() && coordinator.cancel()) {
                    return;
                }
                std::this_thread::sleep_for(chrono::milliseconds(100));
            }
        });

        DownloadOptions options;
        options.digest = args.digest;
        options.filename = args.output_file;

        auto result = coordinator.run(args.url, args.threads, args.output_dir, options);
        watcher.request_stop();

        if (!result.ok()) {
            bar.clear();
            std::cerr << "Error: " << result.message << std::endl;
            for (const auto& chunk : result.failed_chunks) {
                std::cerr << "  chunk " << chunk.index << " after " << chunk.attempts
                          << " attempt(s): " << chunk.message << std::endl;
            }
            return std::unexpected(result.error);
        }

        bar.finish();
        if (!args.quiet) {
            std::cout << "Saved " << result.output.string() << " (" << format_bytes(result.bytes)
                      << ", " << strategy_name(result.strategy) << ")" << std::endl;
        }

        if (result.digest_ok) {
            if (!*result.digest_ok) {
                std::cerr << "Error: " << result.message << std::endl;
                if (result.error != DownloadErrc::checksum_mismatch) {
                    return std::unexpected(result.error);
                }
                return EXIT_DIGEST_MISMATCH;
            }
            if (!args.quiet) {
                std::cout << disk::digest_name(args.digest->algorithm) << " verified" << std::endl;
            }
        }
        return EXIT_OK;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

CliResult info(const CliArgs& args) noexcept {
    try {
        auto config = resolve_config(args);
        if (!config) {
            std::cerr << "Error: Invalid configuration: " << config.error().message() << std::endl;
            return std::unexpected(config.error());
        }

        CurlScope curl;
        DownloadCoordinator coordinator(std::move(*config));
        auto response = coordinator.probe(args.url);
        if (!response) {
            std::cerr << "Error: " << response.error().message() << std::endl;
            return std::unexpected(response.error());
        }

        auto name = response->filename;
        if (name.empty()) {
            if (auto parsed = Url::parse(args.url)) name = parsed->filename();
        }

        std::cout << "URL: " << response->url << std::endl;
        std::cout << "Status: " << response->status_code << std::endl;
        std::cout << "File name: " << (name.empty() ? "(none)" : name) << std::endl;
        std::cout << "Content-Type: " << response->content_type << std::endl;
        if (response->content_length) {
            std::cout << "Content-Length: " << *response->content_length
                      << " (" << format_bytes(*response->content_length) << ")" << std::endl;
        } else {
            std::cout << "Content-Length: unknown" << std::endl;
        }
        std::cout << "Accepts-Ranges: " << (response->accepts_ranges ? "yes" : "no") << std::endl;
        if (!response->last_modified.empty()) {
            std::cout << "Last-Modified: " << response->last_modified << std::endl;
        }
        if (!response->etag.empty()) {
            std::cout << "ETag: " << response->etag << std::endl;
        }
        return EXIT_OK;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "rangedl " << rangedl::VERSION << " - parallel HTTP range downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only, no progress bar\n";
    std::cout << "  -n, --threads <N>       Parallel connections, 1-16 (default: " << DEFAULT_WORKERS << ")\n";
    std::cout << "  -d, --directory <DIR>   Save into directory (default: .)\n";
    std::cout << "  -o, --output <NAME>     File name inside the directory\n";
    std::cout << "  -c, --config <FILE>     JSON configuration file\n";
    std::cout << "  -H, --header <LINE>     Extra request header, \"Name: value\" (repeatable)\n";
    std::cout << "      --md5 <HEX>         Verify the MD5 digest of the result\n";
    std::cout << "      --sha256 <HEX>      Verify the SHA-256 digest of the result\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "\n";
    std::cout << "EXIT STATUS:\n";
    std::cout << "  0 success, 1 failure, 2 digest mismatch\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -n 8 -d downloads https://example.com/large.iso\n";
    std::cout << "  " << program_name << " --sha256 9f86d0... https://example.com/file.tar.gz\n";
}

void print_version() noexcept {
    std::cout << "rangedl " << rangedl::VERSION << std::endl;
    std::cout << "Built with C++23, libcurl " << LIBCURL_VERSION << std::endl;
}

void install_interrupt_handler() noexcept {
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
}

bool interrupt_requested() noexcept {
    return g_interrupted != 0;
}

} // namespace rangedl::cli
