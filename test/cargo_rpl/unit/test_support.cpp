/***
 * Name: cargo_rpl::tests::Support
 * Purpose: Validate environment helpers and the logger.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <stdlib.h>

#include "cargo_rpl/support/env.h"
#include "cargo_rpl/support/log.h"

using namespace cargo_rpl::support;

TEST(Env, GetEnvDistinguishesUnsetFromEmpty) {
  ::unsetenv("CARGO_RPL_TEST_VAR");
  EXPECT_FALSE(GetEnv("CARGO_RPL_TEST_VAR").has_value());
  ::setenv("CARGO_RPL_TEST_VAR", "", 1);
  ASSERT_TRUE(GetEnv("CARGO_RPL_TEST_VAR").has_value());
  EXPECT_EQ("", *GetEnv("CARGO_RPL_TEST_VAR"));
  ::unsetenv("CARGO_RPL_TEST_VAR");
}

TEST(Env, TruthyValues) {
  EXPECT_TRUE(IsTrueValue("1"));
  EXPECT_TRUE(IsTrueValue("TRUE"));
  EXPECT_TRUE(IsTrueValue("Yes"));
  EXPECT_FALSE(IsTrueValue("0"));
  EXPECT_FALSE(IsTrueValue(""));
  EXPECT_FALSE(IsTrueValue("on"));
}

TEST(Env, AsciiLowerLeavesNonAsciiAlone) {
  EXPECT_EQ("needless_borrow", AsciiLower("NEEDLESS_Borrow"));
  EXPECT_EQ("caf\xC3\x89", AsciiLower("CAF\xC3\x89"));
}

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { Logger::SetSink(&sink_); }
  void TearDown() override {
    Logger::SetSink(nullptr);
    Logger::EnableDebug(false);
  }
  std::ostringstream sink_;
};

TEST_F(LoggerTest, ErrorAndWarnArePrefixed) {
  Logger::Error("could not run cargo");
  Logger::Warn("careful");
  EXPECT_EQ("cargo-rpl: error: could not run cargo\ncargo-rpl: warning: careful\n", sink_.str());
}

TEST_F(LoggerTest, DebugIsGated) {
  Logger::EnableDebug(false);
  Logger::Debug("hidden");
  EXPECT_TRUE(sink_.str().empty());
  Logger::EnableDebug(true);
  Logger::Debug("shown");
  EXPECT_EQ("cargo-rpl: debug: shown\n", sink_.str());
}
