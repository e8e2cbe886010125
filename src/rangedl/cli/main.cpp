// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangedl/cli/commands.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace rangedl::cli;

// Terminate handler to catch exceptions in noexcept functions
static void rangedl_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

// Log lines go to stderr so they never tear the progress bar on stdout
static void setup_logging(const CliArgs& args) {
    auto logger = spdlog::stderr_color_mt("rangedl");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] [t%t] %v");

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

int main(int argc, char* argv[]) {
    std::set_terminate(rangedl_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (args.version) {
        print_version();
        return EXIT_OK;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_FAILED;
    }

    setup_logging(args);
    install_interrupt_handler();

    auto result = args.info_only ? info(args) : download(args);
    spdlog::shutdown();

    if (!result) {
        return EXIT_FAILED;
    }
    return *result;
}
