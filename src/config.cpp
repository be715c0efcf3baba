#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace httpd {

static std::chrono::milliseconds millis_or(const YAML::Node& node, std::chrono::milliseconds fallback) {
    long long value = node.as<long long>(fallback.count());
    if (value <= 0) {
        throw std::runtime_error("Durations must be positive, got " + std::to_string(value));
    }
    return std::chrono::milliseconds(value);
}

ServerConfig make_server_config(uint16_t port, const std::string& base_directory) {
    std::error_code ec;
    fs::path canonical = fs::canonical(base_directory, ec);
    if (ec) {
        throw std::runtime_error("Invalid base directory '" + base_directory + "': " + ec.message());
    }
    if (!fs::is_directory(canonical, ec)) {
        throw std::runtime_error("Base directory '" + base_directory + "' is not a directory");
    }

    ServerConfig cfg;
    cfg.port = port;
    cfg.base_directory = canonical;
    return cfg;
}

uint16_t parse_port(const std::string& text) {
    if (text.empty()) {
        throw std::runtime_error("Port must not be empty");
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < 0 || value > 65535) {
        throw std::runtime_error("Invalid port: " + text);
    }
    return static_cast<uint16_t>(value);
}

void load_config_file(const std::string& path, AppConfig& cfg) {
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.read_timeout = millis_or(s["read_timeout_ms"], cfg.server.read_timeout);
            cfg.server.accept_poll = millis_or(s["accept_poll_ms"], cfg.server.accept_poll);
            cfg.server.shutdown_grace = millis_or(s["shutdown_grace_ms"], cfg.server.shutdown_grace);
            cfg.server.backlog = s["backlog"].as<int>(cfg.server.backlog);
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>(cfg.logging.file);
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config '" + path + "': " + std::string(e.what()));
    }
}

} // namespace httpd
