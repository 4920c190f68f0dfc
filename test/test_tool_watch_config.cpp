#include <gtest/gtest.h>

#include <string>

#include "toolwatch/ToolWatchConfig.h"

TEST(ToolWatchConfig, Defaults) {
  ToolWatchConfig c;
  EXPECT_STREQ(c.name(), "default");
  EXPECT_STREQ(c.toolchangerName(), "toolchanger");
  EXPECT_TRUE(c.syncToolchanger());
  EXPECT_FALSE(c.verbose());
  EXPECT_EQ(c.assignDelayMs(), 0u);
  EXPECT_EQ(c.sensorCount(), 0);
}

TEST(ToolWatchConfig, NoPinsIsAConfigError) {
  ToolWatchConfig c("dock");
  char err[ToolWatchConfig::ERROR_BYTES];
  EXPECT_FALSE(c.validate(err, sizeof(err)));
  EXPECT_NE(std::string(err).find("no pins found"), std::string::npos);
}

TEST(ToolWatchConfig, OptionsByName) {
  ToolWatchConfig c("dock");
  EXPECT_TRUE(c.setOption("pin_e", "^!PA1"));
  EXPECT_TRUE(c.setOption("pin_t0", "PB0"));
  EXPECT_TRUE(c.setOption("pin_t2", "PB2"));
  EXPECT_TRUE(c.setOption("toolchanger", "tc_main"));
  EXPECT_TRUE(c.setOption("sync_toolchanger", "0"));
  EXPECT_TRUE(c.setOption("verbose", "1"));
  EXPECT_TRUE(c.setOption("assign_delay", "0.25"));

  char err[ToolWatchConfig::ERROR_BYTES];
  EXPECT_TRUE(c.validate(err, sizeof(err)));

  EXPECT_EQ(c.sensorCount(), 3);
  EXPECT_STREQ(c.sensorLabel(0), "e");
  EXPECT_STREQ(c.sensorPin(0), "^!PA1");
  EXPECT_EQ(c.toolCount(), 3);
  EXPECT_STREQ(c.toolchangerName(), "tc_main");
  EXPECT_FALSE(c.syncToolchanger());
  EXPECT_TRUE(c.verbose());
  EXPECT_EQ(c.assignDelayMs(), 250u);
}

TEST(ToolWatchConfig, NegativeDelayMeansImmediate) {
  ToolWatchConfig c;
  EXPECT_TRUE(c.setOption("assign_delay", "-1.5"));
  EXPECT_EQ(c.assignDelayMs(), 0u);
}

TEST(ToolWatchConfig, BadValuesAreStickyErrors) {
  ToolWatchConfig c;
  c.addSensor("e", "PA1");

  EXPECT_FALSE(c.setOption("assign_delay", "soon"));
  EXPECT_TRUE(c.setOption("verbose", "1"));

  char err[ToolWatchConfig::ERROR_BYTES];
  EXPECT_FALSE(c.validate(err, sizeof(err)));
  EXPECT_NE(std::string(err).find("assign_delay"), std::string::npos);
}

TEST(ToolWatchConfig, RejectsUnknownKeysAndDuplicatePins) {
  ToolWatchConfig a;
  EXPECT_FALSE(a.setOption("debounce", "1"));

  ToolWatchConfig b;
  EXPECT_TRUE(b.addSensor("t0", "PB0"));
  EXPECT_FALSE(b.addSensor("t0", "PB1"));
  EXPECT_FALSE(b.setOption("pin_", "PB1"));
  EXPECT_FALSE(b.setOption("sync_toolchanger", "maybe"));

  char err[ToolWatchConfig::ERROR_BYTES];
  EXPECT_FALSE(b.validate(err, sizeof(err)));
  EXPECT_NE(std::string(err).find("duplicate option pin_t0"), std::string::npos);
}

TEST(ToolWatchConfig, ParseBool) {
  bool b = false;
  EXPECT_TRUE(ToolWatchConfig::parseBool("true", b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ToolWatchConfig::parseBool("0", b));
  EXPECT_FALSE(b);
  EXPECT_TRUE(ToolWatchConfig::parseBool("2", b));
  EXPECT_TRUE(b);
  EXPECT_FALSE(ToolWatchConfig::parseBool("", b));
  EXPECT_FALSE(ToolWatchConfig::parseBool("1x", b));
}
