/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "log/configurator.hpp"
#include "testutil/outcome.hpp"

using tribune::log::Error;
using tribune::log::Level;
using tribune::log::str2lvl;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    auto res = tribune::log::setupLoggingSystem(std::nullopt);
    ASSERT_TRUE(res) << res.error().message();
    logging_system_ = res.value();
  }

  static void TearDownTestCase() {
    logging_system_.reset();
  }

  static inline std::shared_ptr<soralog::LoggingSystem> logging_system_;
};

/**
 * @given level names and their short forms
 * @when parsed
 * @then levels are recognized, anything else is an error
 */
TEST_F(LoggerTest, LevelNames) {
  EXPECT_OUTCOME_TRUE(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  EXPECT_OUTCOME_TRUE(warn, str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_OUTCOME_TRUE(off, str2lvl("no"));
  EXPECT_EQ(off, Level::OFF);
  EXPECT_EC(str2lvl("loud"), Error::WRONG_LEVEL);
}

/**
 * @given embedded configuration
 * @when group levels are tuned
 * @then loggers of the group follow, unknown groups and levels are reported
 */
TEST_F(LoggerTest, TuneGroups) {
  auto log = tribune::log::createLogger("LoggerTest", "dispute");
  EXPECT_EQ(log->level(), Level::INFO);

  EXPECT_EC(
      tribune::log::tuneLoggingSystem({"dispute=trace", "nonexistent=debug"}),
      Error::WRONG_GROUP);
  EXPECT_EQ(log->level(), Level::TRACE);

  EXPECT_EC(tribune::log::tuneLoggingSystem({"dispute=loud"}),
            Error::WRONG_LEVEL);
  EXPECT_EQ(log->level(), Level::TRACE);

  EXPECT_TRUE(tribune::log::resetLevelOfGroup("dispute"));
  EXPECT_EQ(log->level(), Level::INFO);

  EXPECT_FALSE(tribune::log::setLevelOfGroup("nonexistent", Level::DEBUG));
}

/**
 * @given malformed YAML
 * @when logging system is set up from it
 * @then configuration error is returned
 */
TEST_F(LoggerTest, MalformedConfig) {
  EXPECT_EC(tribune::log::setupLoggingSystem("groups: [unclosed"),
            Error::WRONG_CONFIG);
}
