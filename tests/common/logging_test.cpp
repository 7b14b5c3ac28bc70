#include <gtest/gtest.h>
#include "common/logging.hpp"

namespace {

using common::logging::parse_level;

TEST(LoggingTest, ParsesKnownLevels) {
    auto debug = parse_level("debug");
    ASSERT_TRUE(std::holds_alternative<spdlog::level::level_enum>(debug));
    EXPECT_EQ(std::get<spdlog::level::level_enum>(debug), spdlog::level::debug);

    auto warning = parse_level(" Warning ");
    ASSERT_TRUE(std::holds_alternative<spdlog::level::level_enum>(warning));
    EXPECT_EQ(std::get<spdlog::level::level_enum>(warning), spdlog::level::warn);

    auto error = parse_level("error");
    ASSERT_TRUE(std::holds_alternative<spdlog::level::level_enum>(error));
    EXPECT_EQ(std::get<spdlog::level::level_enum>(error), spdlog::level::err);
}

TEST(LoggingTest, RejectsUnknownLevel) {
    auto result = parse_level("verbose");
    ASSERT_TRUE(std::holds_alternative<common::Error>(result));
    EXPECT_NE(std::get<common::Error>(result).message.find("verbose"), std::string::npos);
}

// Callers that pass no logger still get a usable one
TEST(LoggingTest, FallsBackToNullLogger) {
    auto logger = common::logging::or_null(nullptr);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger, common::logging::null_logger());
    logger->warn("discarded {}", 1);

    auto named = common::logging::make_logger("test", spdlog::level::err);
    EXPECT_EQ(common::logging::or_null(named), named);
    EXPECT_EQ(named->level(), spdlog::level::err);
}

} // namespace
