#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "logger.hpp"
#include "test_util.hpp"

namespace httpd {
namespace {

TEST(ServerConfig, DefaultsMatchHistoricalBehavior) {
    ServerConfig cfg;
    EXPECT_EQ(cfg.read_timeout.count(), 60000);
    EXPECT_EQ(cfg.accept_poll.count(), 1000);
    EXPECT_EQ(cfg.shutdown_grace.count(), 60000);
}

TEST(ServerConfig, BaseDirectoryIsCanonicalized) {
    test::ScopedTempDir tmp;
    tmp.make_dir("www/sub");

    std::string messy = (tmp.path() / "www" / "sub" / "..").string() + "/./";
    ServerConfig cfg = make_server_config(8080, messy);
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.base_directory, tmp.path() / "www");
}

TEST(ServerConfig, RejectsMissingOrNonDirectoryBase) {
    test::ScopedTempDir tmp;
    auto file = tmp.write_file("plain.txt", "x");

    EXPECT_THROW(make_server_config(80, (tmp.path() / "missing").string()), std::runtime_error);
    EXPECT_THROW(make_server_config(80, file.string()), std::runtime_error);
}

TEST(ParsePort, ValidAndInvalid) {
    EXPECT_EQ(parse_port("0"), 0);
    EXPECT_EQ(parse_port("8080"), 8080);
    EXPECT_EQ(parse_port("65535"), 65535);
    EXPECT_THROW(parse_port(""), std::runtime_error);
    EXPECT_THROW(parse_port("65536"), std::runtime_error);
    EXPECT_THROW(parse_port("-1"), std::runtime_error);
    EXPECT_THROW(parse_port("80a"), std::runtime_error);
}

TEST(ConfigFile, OverridesTimeoutsAndLogging) {
    test::ScopedTempDir tmp;
    auto path = tmp.write_file("httpd.yaml",
                               "server:\n"
                               "  read_timeout_ms: 1500\n"
                               "  shutdown_grace_ms: 250\n"
                               "logging:\n"
                               "  level: debug\n"
                               "  max_files: 7\n");

    AppConfig cfg;
    cfg.server.port = 9000;
    load_config_file(path.string(), cfg);

    EXPECT_EQ(cfg.server.read_timeout.count(), 1500);
    EXPECT_EQ(cfg.server.shutdown_grace.count(), 250);
    EXPECT_EQ(cfg.server.accept_poll.count(), 1000);
    EXPECT_EQ(cfg.server.port, 9000);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.max_files, 7);
    EXPECT_TRUE(cfg.logging.file.empty());
}

TEST(ConfigFile, EmptyFileKeepsDefaults) {
    test::ScopedTempDir tmp;
    auto path = tmp.write_file("empty.yaml", "");

    AppConfig cfg;
    load_config_file(path.string(), cfg);
    EXPECT_EQ(cfg.server.read_timeout.count(), 60000);
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST(ConfigFile, ErrorsAreReported) {
    test::ScopedTempDir tmp;
    AppConfig cfg;

    EXPECT_THROW(load_config_file((tmp.path() / "missing.yaml").string(), cfg), std::runtime_error);

    auto broken = tmp.write_file("broken.yaml", "server: [unclosed\n");
    EXPECT_THROW(load_config_file(broken.string(), cfg), std::runtime_error);

    auto negative = tmp.write_file("neg.yaml", "server:\n  shutdown_grace_ms: -5\n");
    EXPECT_THROW(load_config_file(negative.string(), cfg), std::runtime_error);
}

TEST(Logger, LevelNames) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_EQ(parse_log_level("bogus"), spdlog::level::info);
}

TEST(Logger, FileSinkWritesAccessLinesWithoutThreadColumn) {
    test::ScopedTempDir tmp;
    LoggingConfig cfg;
    cfg.file = (tmp.path() / "httpd.log").string();

    auto logger = make_logger(cfg);
    EXPECT_EQ(logger->name(), "httpd");
    EXPECT_EQ(logger->level(), spdlog::level::info);
    logger->debug("hidden");
    logger->info("127.0.0.1:5000 \"GET / HTTP/1.0\" 404 9");
    logger.reset();

    std::ifstream in(cfg.file);
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    ASSERT_GT(line.size(), 26U);
    EXPECT_EQ(line[0], '[');
    EXPECT_EQ(line.substr(24), "] [info] 127.0.0.1:5000 \"GET / HTTP/1.0\" 404 9");
    EXPECT_FALSE(std::getline(in, line));
}

} // namespace
} // namespace httpd
