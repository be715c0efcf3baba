#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace httpd {

struct ServerConfig {
    uint16_t port = 0;
    std::filesystem::path base_directory;  // canonical, absolute
    std::chrono::milliseconds read_timeout{60000};
    std::chrono::milliseconds accept_poll{1000};
    std::chrono::milliseconds shutdown_grace{60000};
    int backlog = 128;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

// Build a ServerConfig for the given port and directory. The directory is
// canonicalized here; throws std::runtime_error if it is not a directory.
ServerConfig make_server_config(uint16_t port, const std::string& base_directory);

// Parse a decimal port number, throws std::runtime_error when out of range
uint16_t parse_port(const std::string& text);

// Load the optional YAML settings file on top of an existing configuration.
// Port and base directory are never read from the file.
void load_config_file(const std::string& path, AppConfig& cfg);

} // namespace httpd
