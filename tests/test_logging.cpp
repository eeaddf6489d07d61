#include <gtest/gtest.h>
#include <common/logging.hpp>

using namespace animatic;

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(logging::parse_level("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("off"), spdlog::level::off);
    EXPECT_FALSE(logging::parse_level("loud").has_value());
    EXPECT_FALSE(logging::parse_level("").has_value());
}

TEST(LoggingTest, SharedNamedLogger) {
    auto log = logging::get_logger();
    EXPECT_EQ(log->name(), logging::kLoggerName);
    EXPECT_EQ(log, logging::get_logger());
    EXPECT_EQ(spdlog::get(logging::kLoggerName), log);
}

TEST(LoggingTest, VerboseNeverRaisesLevel) {
    auto log = logging::get_logger();
    const auto saved = log->level();

    log->set_level(spdlog::level::warn);
    logging::enable_verbose();
    EXPECT_EQ(log->level(), spdlog::level::debug);

    log->set_level(spdlog::level::trace);
    logging::enable_verbose();
    EXPECT_EQ(log->level(), spdlog::level::trace);

    log->set_level(saved);
}
