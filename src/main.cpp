/**
 * @file main.cpp
 * @brief cloudDoc - Main Entry Point
 *
 * Local emulator for the transactional document write path.
 *
 * @version 0.1.0
 */

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "api/document_service.hpp"
#include "common/config.hpp"
#include "network/server.hpp"
#include "storage/document_store.hpp"

namespace {

constexpr int SHUTDOWN_POLL_MS = 100;

/* Set from the signal handler; the main thread does the actual shutdown */
volatile std::sig_atomic_t g_shutdown_requested = 0;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

/**
 * Signal handler for graceful shutdown
 */
void signal_handler(int /*sig*/) {
    g_shutdown_requested = 1;
}

/**
 * Print usage information
 */
void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -p, --port PORT       Port to listen on (default: 8080)\n";
    std::cout << "  -c, --config FILE     Configuration file (optional)\n";
    std::cout << "      --project ID      Project id shown in the banner (default: demo-project)\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version information\n";
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "cloudDoc 0.1.0\n";
    std::cout << "Local emulator for transactional document reads and writes\n";
}

}  // namespace

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {  // NOLINT(bugprone-exception-escape)
    clouddoc::config::Config config;

    /* Convert argv to vector of strings for safer parsing */
    const std::vector<std::string> args(argv, argv + argc);

    /* Parse command line arguments */
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        }
        if ((arg == "-p" || arg == "--port") && i + 1 < args.size()) {
            try {
                const int port = std::stoi(args[++i]);
                if (port <= 0 || port > clouddoc::config::Config::MAX_PORT) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
                config.port = static_cast<uint16_t>(port);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid port: " << args[i] << "\n";
                return 1;
            }
        } else if ((arg == "-c" || arg == "--config") && i + 1 < args.size()) {
            config.config_file = args[++i];
            if (!config.load(config.config_file)) {
                std::cerr << "Failed to load configuration from " << config.config_file << "\n";
                return 1;
            }
        } else if (arg == "--project" && i + 1 < args.size()) {
            config.project_id = args[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!config.validate()) {
        std::cerr << "Invalid configuration\n";
        return 1;
    }

    std::cout << "=== cloudDoc ===\n";
    std::cout << "Version: 0.1.0\n";
    std::cout << "Project: " << config.project_id << "\n";
    std::cout << "Port: " << config.port << "\n\n";
    if (config.verbose) {
        config.print();
    }

    /* Set up signal handlers */
    static_cast<void>(std::signal(SIGINT, signal_handler));
    static_cast<void>(std::signal(SIGTERM, signal_handler));

    try {
        clouddoc::storage::DocumentStore store;
        clouddoc::api::DocumentService service(store, config);

        auto server = clouddoc::network::Server::create(config.port, service, config);
        if (!server) {
            std::cerr << "Failed to create server\n";
            return 1;
        }

        std::cout << "Starting server...\n";
        if (!server->start()) {
            std::cerr << "Failed to start server\n";
            return 1;
        }

        std::cout << "Listening on http://localhost:" << config.port << "/v1/projects/"
                  << config.project_id << "/databases/(default)/documents\n";
        std::cout << "Server running. Press Ctrl+C to stop.\n";
        while (g_shutdown_requested == 0 && server->is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(SHUTDOWN_POLL_MS));
        }

        std::cout << "\nShutting down...\n";
        static_cast<void>(server->stop());
        server.reset();

        std::cout << "Goodbye!\n";
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
