#include <gtest/gtest.h>
#include "sqlmcp/logging.hpp"
#include "sqlmcp/error.hpp"
#include <spdlog/spdlog.h>

using namespace sqlmcp;

TEST(Logging, ParseLevels) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("INFO"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_THROW(parse_log_level("loud"), McpConfigError);
}

TEST(Logging, InitInstallsDefaultLogger) {
    LogSettings settings;
    settings.level = "warn";
    settings.logger_name = "sqlmcp-test";
    init_logging(settings);
    EXPECT_EQ(spdlog::default_logger()->name(), "sqlmcp-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
}

TEST(Logging, BadLevelRejectedBeforeInstall) {
    LogSettings settings;
    settings.level = "chatty";
    EXPECT_THROW(init_logging(settings), McpConfigError);
}
