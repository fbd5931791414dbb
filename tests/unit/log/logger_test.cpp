/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>
#include <qtils/test/outcome.hpp>

#include "testutil/outcome_error.hpp"
#include "testutil/prepare_loggers.hpp"

using oppool::log::Error;
using oppool::log::Level;
using oppool::log::parseLevelOverride;
using oppool::log::str2lvl;

TEST(LoggerTest, LevelNames) {
  ASSERT_OUTCOME_SUCCESS(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  ASSERT_OUTCOME_SUCCESS(warn, str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  ASSERT_OUTCOME_SUCCESS(off, str2lvl("none"));
  EXPECT_EQ(off, Level::OFF);
  EXPECT_TRUE(testutil::hasError(str2lvl("loud"), Error::WRONG_LEVEL));
}

TEST(LoggerTest, LevelOverride) {
  ASSERT_OUTCOME_SUCCESS(whole, parseLevelOverride("debug"));
  EXPECT_EQ(whole.group, oppool::log::defaultGroupName);
  EXPECT_EQ(whole.level, Level::DEBUG);

  ASSERT_OUTCOME_SUCCESS(group, parseLevelOverride("op_pool=trace"));
  EXPECT_EQ(group.group, "op_pool");
  EXPECT_EQ(group.level, Level::TRACE);

  EXPECT_TRUE(testutil::hasError(parseLevelOverride("=trace"),
                                 Error::WRONG_FORMAT));
  EXPECT_TRUE(testutil::hasError(parseLevelOverride("op_pool="),
                                 Error::WRONG_LEVEL));
}

TEST(LoggerTest, TuneLoggingSystem) {
  auto logsys = testutil::prepareLoggers();
  std::vector<std::string> overrides{"op_pool=debug", "info"};
  EXPECT_OUTCOME_SUCCESS(logsys->tuneLoggingSystem(overrides));
  EXPECT_TRUE(testutil::hasError(logsys->tuneLoggingSystem({"nowhere=debug"}),
                                 Error::WRONG_GROUP));
  EXPECT_TRUE(testutil::hasError(logsys->tuneLoggingSystem({"op_pool=loud"}),
                                 Error::WRONG_LEVEL));
}

TEST(LoggerTest, InvalidConfig) {
  EXPECT_TRUE(testutil::hasError(
      oppool::log::createLoggingSystem("groups: [unterminated"),
      Error::CONFIGURATION_FAILED));
}
