/***
 * Name: test_env
 * Purpose: Environment flag parsing and InterpreterConfig::FromEnvironment.
 */
#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "pyhost/runtime/interpreter_config.h"
#include "pyhost/support/env.h"

using namespace pyhost;

TEST(SupportEnv, TrueValues) {
  EXPECT_TRUE(support::IsTrueValue("1"));
  EXPECT_TRUE(support::IsTrueValue("true"));
  EXPECT_TRUE(support::IsTrueValue("TRUE"));
  EXPECT_TRUE(support::IsTrueValue("Yes"));
  EXPECT_FALSE(support::IsTrueValue("0"));
  EXPECT_FALSE(support::IsTrueValue(""));
  EXPECT_FALSE(support::IsTrueValue("on"));
  EXPECT_FALSE(support::IsTrueValue("truee"));
}

TEST(SupportEnv, FlagAndStringFollowEnvironment) {
  ::setenv("PYHOST_TEST_FLAG", "yes", 1);
  EXPECT_TRUE(support::EnvFlag("PYHOST_TEST_FLAG"));
  ::setenv("PYHOST_TEST_FLAG", "no", 1);
  EXPECT_FALSE(support::EnvFlag("PYHOST_TEST_FLAG"));
  ::unsetenv("PYHOST_TEST_FLAG");
  EXPECT_FALSE(support::EnvFlag("PYHOST_TEST_FLAG"));

  ::setenv("PYHOST_TEST_STRING", "", 1);
  EXPECT_FALSE(support::EnvString("PYHOST_TEST_STRING").has_value());
  ::setenv("PYHOST_TEST_STRING", "value", 1);
  ASSERT_TRUE(support::EnvString("PYHOST_TEST_STRING").has_value());
  EXPECT_EQ(*support::EnvString("PYHOST_TEST_STRING"), "value");
  ::unsetenv("PYHOST_TEST_STRING");
}

TEST(SupportEnv, ConfigFromEnvironment) {
  ::setenv("PYHOST_PROGRAM_NAME", "embedded-app", 1);
  ::setenv("PYHOST_PATH", "/opt/a::/opt/b:", 1);
  ::setenv("PYHOST_SIGNALS", "true", 1);
  const auto config = runtime::InterpreterConfig::FromEnvironment();
  ::unsetenv("PYHOST_PROGRAM_NAME");
  ::unsetenv("PYHOST_PATH");
  ::unsetenv("PYHOST_SIGNALS");

  EXPECT_EQ(config.programName, "embedded-app");
  EXPECT_EQ(config.extraPaths, (std::vector<std::string>{"/opt/a", "/opt/b"}));
  EXPECT_TRUE(config.installSignalHandlers);
}

TEST(SupportEnv, ConfigDefaults) {
  const runtime::InterpreterConfig config;
  EXPECT_EQ(config.programName, "pyhost");
  EXPECT_FALSE(config.pythonHome.has_value());
  EXPECT_TRUE(config.extraPaths.empty());
  EXPECT_FALSE(config.installSignalHandlers);
}
