#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"

namespace httpd {

// Workers are detached threads, so the thread id carries no useful context.
// The peer address in each message identifies the connection instead.
inline constexpr const char* kConsolePattern = "%H:%M:%S.%e %^%-5l%$ %v";
inline constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

inline spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

// Builds the "httpd" logger without installing it. Access log lines go out at
// info, so the file sink is flushed on every info line to keep it tail-able.
inline std::shared_ptr<spdlog::logger> make_logger(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    sinks.push_back(console);

    if (!cfg.file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file,
            static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(cfg.max_files));
        file->set_pattern(kFilePattern);
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>("httpd", sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(cfg.level));
    logger->flush_on(cfg.file.empty() ? spdlog::level::warn : spdlog::level::info);
    return logger;
}

inline void init_logger(const LoggingConfig& cfg) {
    spdlog::set_default_logger(make_logger(cfg));
}

} // namespace httpd
