#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "Config.h"

namespace {

std::string writeConfig(const std::string& name, const std::string& content) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream file(path.c_str());
  file << content;
  return path;
}

}

TEST(ConfigTest, MissingFileKeepsDefaults) {
  LightsOutConfig config;
  EXPECT_FALSE(loadConfig(::testing::TempDir() + "does_not_exist.ini", config));
  EXPECT_EQ(config.minOccurrences, DEFAULT_MIN_OCCURRENCES);
  EXPECT_DOUBLE_EQ(config.confidenceThreshold, DEFAULT_CONFIDENCE_THRESHOLD);
  EXPECT_EQ(config.analysisHour, 3);
  EXPECT_FALSE(config.automationEnabled);
  EXPECT_TRUE(config.dryRun);
  EXPECT_EQ(config.timezoneMode, SUN_TZ_LOCAL);
}

TEST(ConfigTest, ReadsValuesIgnoringCommentsAndQuotes) {
  std::string path = writeConfig("lightsout_full.ini",
    "# LightsOut\n"
    "[mining]\n"
    "min_occurrences = 5\n"
    "; confidence_threshold = 0.1\n"
    "confidence_threshold=0.8\n"
    "\n"
    "[location]\n"
    "latitude = 57.7\n"
    "timezone = fixed\n"
    "utc_offset_minutes = 120\n"
    "[service]\n"
    "automation_enabled = true\n"
    "dry_run = no\n"
    "automations_file = \"/etc/lightsout/automations.json\"\n"
    "log_level = 'verbose'\n");

  LightsOutConfig config;
  ASSERT_TRUE(loadConfig(path, config));
  EXPECT_EQ(config.minOccurrences, 5);
  EXPECT_DOUBLE_EQ(config.confidenceThreshold, 0.8);
  EXPECT_DOUBLE_EQ(config.latitude, 57.7);
  EXPECT_EQ(config.timezoneMode, SUN_TZ_FIXED);
  EXPECT_EQ(config.utcOffsetMinutes, 120);
  EXPECT_TRUE(config.automationEnabled);
  EXPECT_FALSE(config.dryRun);
  EXPECT_EQ(config.automationsFile, "/etc/lightsout/automations.json");
  EXPECT_EQ(config.logLevel, LOG_LEVEL_VERBOSE);

  std::remove(path.c_str());
}

TEST(ConfigTest, InvalidValuesAreIgnored) {
  std::string path = writeConfig("lightsout_invalid.ini",
    "min_occurrences = many\n"
    "confidence_threshold = 1.5\n"
    "analysis_hour = 30\n"
    "latitude = 95\n"
    "dry_run = maybe\n"
    "timezone = mars\n"
    "log_level = loud\n");

  LightsOutConfig config;
  ASSERT_TRUE(loadConfig(path, config));
  EXPECT_EQ(config.minOccurrences, DEFAULT_MIN_OCCURRENCES);
  EXPECT_DOUBLE_EQ(config.confidenceThreshold, DEFAULT_CONFIDENCE_THRESHOLD);
  EXPECT_EQ(config.analysisHour, 3);
  EXPECT_DOUBLE_EQ(config.latitude, DEFAULT_LATITUDE);
  EXPECT_TRUE(config.dryRun);
  EXPECT_EQ(config.timezoneMode, SUN_TZ_LOCAL);
  EXPECT_EQ(config.logLevel, LOG_LEVEL_INFO);

  std::remove(path.c_str());
}

TEST(ConfigTest, GetINIValueFallsBackToDefault) {
  std::string path = writeConfig("lightsout_lookup.ini", "name = Kitchen\n");

  EXPECT_EQ(getINIValue(path, "name", "none"), "Kitchen");
  EXPECT_EQ(getINIValue(path, "room", "none"), "none");
  EXPECT_EQ(getINIValue(path + ".missing", "name", "none"), "none");

  std::remove(path.c_str());
}

TEST(ConfigTest, StripQuotesHandlesBothStyles) {
  EXPECT_EQ(stripQuotes("\"abc\""), "abc");
  EXPECT_EQ(stripQuotes("'abc'"), "abc");
  EXPECT_EQ(stripQuotes("\"abc'"), "\"abc'");
  EXPECT_EQ(stripQuotes("\""), "\"");
}
