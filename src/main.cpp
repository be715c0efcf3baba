#include "config.hpp"
#include "logger.hpp"
#include "http_server.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_usage(std::ostream& os) {
    os << "Usage: httpd <port> <directory> [options]\n"
       << "Options:\n"
       << "  -c, --config <path>    YAML file with timeout and logging settings\n"
       << "  -h, --help             Show this help\n";
}

static void print_banner(const httpd::AppConfig& cfg) {
    spdlog::info("httpd " HTTPD_VERSION);
    spdlog::info("Configuration:");
    spdlog::info("  Port            : {}", cfg.server.port);
    spdlog::info("  Base directory  : {}", cfg.server.base_directory.string());
    spdlog::info("  Read timeout    : {} ms", cfg.server.read_timeout.count());
    spdlog::info("  Shutdown grace  : {} ms", cfg.server.shutdown_grace.count());
    spdlog::info("  Log file        : {}", cfg.logging.file.empty() ? "(console only)" : cfg.logging.file);
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        print_usage(std::cout);
        return 1;
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    httpd::AppConfig config;
    try {
        config.server = httpd::make_server_config(httpd::parse_port(positional[0]), positional[1]);
        if (!config_path.empty()) {
            httpd::load_config_file(config_path, config);
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    try {
        httpd::init_logger(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "ERROR: Failed to open log: " << e.what() << std::endl;
        return 1;
    }
    print_banner(config);

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    httpd::HttpServer server(config.server);
    if (!server.start()) {
        spdlog::critical("Failed to start HTTP server on port {}", config.server.port);
        return 1;
    }

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    if (!server.stop()) {
        spdlog::error("Some connections did not finish, exiting anyway");
        return 2;
    }
    spdlog::info("Shutdown complete");
    return 0;
}
