#ifndef LIGHTS_OUT_CONFIG_H
#define LIGHTS_OUT_CONFIG_H

#include "LightsOut.h"

struct LightsOutConfig {
  // Pattern mining
  int minOccurrences = DEFAULT_MIN_OCCURRENCES;
  int timeWindowMinutes = DEFAULT_TIME_WINDOW_MINUTES;
  double confidenceThreshold = DEFAULT_CONFIDENCE_THRESHOLD;
  int analysisWindowDays = 30;
  int analysisHour = 3;
  int eventQueryLimit = 10000;

  // Prediction
  double minConfidence = DEFAULT_CONFIDENCE_THRESHOLD;
  int lookaheadMinutes = DEFAULT_LOOKAHEAD_MINUTES;

  // Location
  double latitude = DEFAULT_LATITUDE;
  double longitude = DEFAULT_LONGITUDE;
  SunTimezoneMode timezoneMode = SUN_TZ_LOCAL;
  int utcOffsetMinutes = DEFAULT_UTC_OFFSET_MINUTES;

  // Service
  int pollIntervalSeconds = 10;
  int retentionDays = 90;
  bool automationEnabled = false;
  bool dryRun = true;
  std::string automationsFile = "automations.json";
  int adaptivePollMs = ADAPTIVE_POLL_MS;
  int adaptiveBackoffMs = ADAPTIVE_BACKOFF_MS;
  LogLevel logLevel = LOG_LEVEL_INFO;
};

std::string getINIValue(const std::string& filePath, const std::string& key, const std::string& defaultValue);
std::string stripQuotes(const std::string& value);

// False when the file is missing; config keeps its defaults then
bool loadConfig(const std::string& filePath, LightsOutConfig& config);

#endif // LIGHTS_OUT_CONFIG_H
