// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <surge/core/http_session.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace surge::cli;

// Terminate handler to catch exceptions in noexcept functions
static void surge_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(surge_terminate_handler);
    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }

    auto config = build_config(args);
    if (!config) {
        std::cerr << "Error: cannot load config " << args.config_file << ": "
                  << config.error().message() << std::endl;
        return 2;
    }
    configure_logging(args, *config);

    // A state file alone is enough: it resumes what it holds
    if (args.urls.empty() && config->state_file.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    surge::core::HttpSession::global_init();

    int exit_code = 0;
    if (args.info) {
        for (const auto& url : args.urls) {
            auto result = info(url, *config);
            if (!result) {
                exit_code = 1;
            }
        }
    } else {
        auto result = download(args, *config);
        exit_code = result ? *result : 1;
    }

    surge::core::HttpSession::global_cleanup();
    return exit_code;
}
