/**
 * @file Logging_uTest.cpp
 * @brief Unit tests for pfrelay::logging.
 */

#include "src/logging/inc/Logging.hpp"

#include <gtest/gtest.h>

using pfrelay::logging::LOGGER_NAME;
using pfrelay::logging::makeStdoutLogger;
using pfrelay::logging::parseLevel;

/** @test Every documented level name parses. */
TEST(LoggingTest, ParseKnownLevels) {
  spdlog::level::level_enum level{};

  ASSERT_TRUE(parseLevel("trace", level));
  EXPECT_EQ(level, spdlog::level::trace);
  ASSERT_TRUE(parseLevel("debug", level));
  EXPECT_EQ(level, spdlog::level::debug);
  ASSERT_TRUE(parseLevel("info", level));
  EXPECT_EQ(level, spdlog::level::info);
  ASSERT_TRUE(parseLevel("warn", level));
  EXPECT_EQ(level, spdlog::level::warn);
  ASSERT_TRUE(parseLevel("error", level));
  EXPECT_EQ(level, spdlog::level::err);
}

/** @test Unknown names, wrong case and empty text are rejected. */
TEST(LoggingTest, ParseUnknownLevels) {
  spdlog::level::level_enum level = spdlog::level::info;

  EXPECT_FALSE(parseLevel("", level));
  EXPECT_FALSE(parseLevel("INFO", level));
  EXPECT_FALSE(parseLevel("warning", level));
  EXPECT_FALSE(parseLevel("critical", level));
  EXPECT_EQ(level, spdlog::level::info);
}

/** @test The stdout logger carries the daemon name and requested level. */
TEST(LoggingTest, StdoutLogger) {
  const auto LOG = makeStdoutLogger(spdlog::level::warn);

  ASSERT_NE(LOG, nullptr);
  EXPECT_EQ(LOG->name(), LOGGER_NAME);
  EXPECT_EQ(LOG->level(), spdlog::level::warn);
  EXPECT_FALSE(LOG->should_log(spdlog::level::info));
  EXPECT_TRUE(LOG->should_log(spdlog::level::err));
}
