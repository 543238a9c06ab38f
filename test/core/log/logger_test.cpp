/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using slotwatch::log::Configurator;
using slotwatch::log::Error;
using slotwatch::log::Level;
using slotwatch::log::str2lvl;
using slotwatch::log::tuneLoggingSystem;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void TearDown() override {
    slotwatch::log::setLevelOfGroup("testing", Level::TRACE);
  }
};

/**
 * @given level names used on the command line
 * @when parsing them
 * @then known names map to levels and the rest is rejected
 */
TEST_F(LoggerTest, StringToLevel) {
  EXPECT_OUTCOME_TRUE(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  EXPECT_OUTCOME_TRUE(warn, str2lvl("warning"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_OUTCOME_TRUE(off, str2lvl("off"));
  EXPECT_EQ(off, Level::OFF);
  EXPECT_EC(str2lvl("loud"), Error::WRONG_LEVEL);
  EXPECT_EC(str2lvl(""), Error::WRONG_LEVEL);
}

/**
 * @given configured logging system
 * @when group filter is applied
 * @then loggers of the group follow the new level
 */
TEST_F(LoggerTest, TuneGroup) {
  auto logger = slotwatch::log::createLogger("LoggerTest", "testing");
  ASSERT_OUTCOME_SUCCESS_TRY(tuneLoggingSystem({"testing=error"}));
  EXPECT_EQ(logger->level(), Level::ERROR);
}

/**
 * @given configured logging system
 * @when filter names unknown group or unknown level
 * @then the error is reported
 */
TEST_F(LoggerTest, TuneRejectsWrongFilter) {
  EXPECT_EC(tuneLoggingSystem({"nonexistent=debug"}), Error::WRONG_GROUP);
  EXPECT_EC(tuneLoggingSystem({"=debug"}), Error::WRONG_GROUP);
  EXPECT_EC(tuneLoggingSystem({"testing=loud"}), Error::WRONG_LEVEL);
  EXPECT_EC(tuneLoggingSystem({"loud"}), Error::WRONG_LEVEL);
}

/**
 * @given command lines with and without --logcfg
 * @when looking for logging config file
 * @then only explicit path is returned
 */
TEST_F(LoggerTest, LogConfigFileFromArgs) {
  const char *with_cfg[] = {
      "/path/", "-lrpc=debug", "--logcfg", "/etc/slotwatch/log.yaml", "--watch"};
  auto path = Configurator::getLogConfigFile(std::size(with_cfg), with_cfg);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path.value(), "/etc/slotwatch/log.yaml");

  const char *without_cfg[] = {"/path/", "--log", "debug"};
  EXPECT_FALSE(Configurator::getLogConfigFile(std::size(without_cfg),
                                              without_cfg)
                   .has_value());
}
