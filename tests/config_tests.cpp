#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "cmdtok.h"

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    unsetenv("CMDTOK_DEBUG");
    unsetenv("CMDTOK_PRESERVE_QUOTES");
    config::reset();
  }
  void TearDown() override {
    unsetenv("CMDTOK_DEBUG");
    unsetenv("CMDTOK_PRESERVE_QUOTES");
    config::reset();
  }
};

TEST_F(ConfigTest, DefaultsAreOff) {
  config::load_from_environment();
  EXPECT_FALSE(g_debug_mode);
  EXPECT_FALSE(config::preserve_surrounding_quotes);
}

TEST_F(ConfigTest, TruthyValuesEnableOptions) {
  for (const char* value : {"1", "true", "YES", "On"}) {
    config::reset();
    setenv("CMDTOK_PRESERVE_QUOTES", value, 1);
    config::load_from_environment();
    EXPECT_TRUE(config::preserve_surrounding_quotes) << value;
  }
}

TEST_F(ConfigTest, OtherValuesAreIgnored) {
  setenv("CMDTOK_PRESERVE_QUOTES", "0", 1);
  setenv("CMDTOK_DEBUG", "maybe", 1);
  config::load_from_environment();
  EXPECT_FALSE(config::preserve_surrounding_quotes);
  EXPECT_FALSE(g_debug_mode);
}

TEST_F(ConfigTest, DebugFlagLogsVersion) {
  setenv("CMDTOK_DEBUG", "1", 1);
  testing::internal::CaptureStderr();
  config::load_from_environment();
  std::string out = testing::internal::GetCapturedStderr();
  EXPECT_TRUE(g_debug_mode);
  EXPECT_NE(out.find("DEBUG: cmdtok " + c_version), std::string::npos);
}

TEST_F(ConfigTest, ResetRestoresDefaults) {
  g_debug_mode = true;
  config::preserve_surrounding_quotes = true;
  config::reset();
  EXPECT_FALSE(g_debug_mode);
  EXPECT_FALSE(config::preserve_surrounding_quotes);
}
