#include "Config.h"

#include <cstdlib>
#include <fstream>

// ===== CONFIGURATION =====

namespace {

std::string trim(const std::string& text) {
  size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  size_t last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

int readInt(const std::string& path, const char* key, int current, int minValue) {
  std::string text = getINIValue(path, key, "");
  if (text.empty()) return current;

  char* end = nullptr;
  long value = strtol(text.c_str(), &end, 10);
  if (*end != '\0' || value < minValue) {
    DEBUG_WARN(CONFIG, std::string("Ignoring invalid ") + key + " = " + text);
    return current;
  }
  return static_cast<int>(value);
}

double readDouble(const std::string& path, const char* key, double current, double minValue, double maxValue) {
  std::string text = getINIValue(path, key, "");
  if (text.empty()) return current;

  char* end = nullptr;
  double value = strtod(text.c_str(), &end);
  if (*end != '\0' || value < minValue || value > maxValue) {
    DEBUG_WARN(CONFIG, std::string("Ignoring invalid ") + key + " = " + text);
    return current;
  }
  return value;
}

bool readBool(const std::string& path, const char* key, bool current) {
  std::string text = getINIValue(path, key, "");
  if (text.empty()) return current;
  if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
  if (text == "false" || text == "0" || text == "no" || text == "off") return false;
  DEBUG_WARN(CONFIG, std::string("Ignoring invalid ") + key + " = " + text);
  return current;
}

}

std::string getINIValue(const std::string& filePath, const std::string& key, const std::string& defaultValue) {
  std::ifstream file(filePath.c_str());
  if (!file) return defaultValue;

  std::string line;
  while (std::getline(file, line)) {
    std::string content = trim(line);
    if (content.empty() || content[0] == '#' || content[0] == ';' || content[0] == '[') continue;

    size_t sep = content.find('=');
    if (sep == std::string::npos) continue;
    if (trim(content.substr(0, sep)) == key) {
      return stripQuotes(trim(content.substr(sep + 1)));
    }
  }
  return defaultValue;
}

std::string stripQuotes(const std::string& value) {
  if (value.size() >= 2 && ((value[0] == '"' && value[value.size() - 1] == '"') ||
                            (value[0] == '\'' && value[value.size() - 1] == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool loadConfig(const std::string& filePath, LightsOutConfig& config) {
  std::ifstream probe(filePath.c_str());
  if (!probe) {
    DEBUG_WARN(CONFIG, "Config file not found: " + filePath + ", using defaults");
    return false;
  }
  probe.close();

  config.minOccurrences = readInt(filePath, "min_occurrences", config.minOccurrences, 1);
  config.timeWindowMinutes = readInt(filePath, "time_window_minutes", config.timeWindowMinutes, 1);
  config.confidenceThreshold = readDouble(filePath, "confidence_threshold", config.confidenceThreshold, 0.0, 1.0);
  config.analysisWindowDays = readInt(filePath, "analysis_window_days", config.analysisWindowDays, 1);
  config.analysisHour = readInt(filePath, "analysis_hour", config.analysisHour, 0);
  if (config.analysisHour > 23) {
    DEBUG_WARN(CONFIG, "analysis_hour out of range, using 3");
    config.analysisHour = 3;
  }
  config.eventQueryLimit = readInt(filePath, "event_query_limit", config.eventQueryLimit, 1);

  config.minConfidence = readDouble(filePath, "min_confidence", config.minConfidence, 0.0, 1.0);
  config.lookaheadMinutes = readInt(filePath, "lookahead_minutes", config.lookaheadMinutes, 0);

  config.latitude = readDouble(filePath, "latitude", config.latitude, -90.0, 90.0);
  config.longitude = readDouble(filePath, "longitude", config.longitude, -180.0, 180.0);
  std::string timezone = getINIValue(filePath, "timezone", "");
  if (timezone == "fixed") {
    config.timezoneMode = SUN_TZ_FIXED;
  } else if (timezone == "local") {
    config.timezoneMode = SUN_TZ_LOCAL;
  } else if (!timezone.empty()) {
    DEBUG_WARN(CONFIG, "Unknown timezone mode '" + timezone + "', expected local or fixed");
  }
  config.utcOffsetMinutes = readInt(filePath, "utc_offset_minutes", config.utcOffsetMinutes, -14 * 60);

  config.pollIntervalSeconds = readInt(filePath, "poll_interval_seconds", config.pollIntervalSeconds, 1);
  config.retentionDays = readInt(filePath, "retention_days", config.retentionDays, 1);
  config.automationEnabled = readBool(filePath, "automation_enabled", config.automationEnabled);
  config.dryRun = readBool(filePath, "dry_run", config.dryRun);
  config.automationsFile = getINIValue(filePath, "automations_file", config.automationsFile);
  config.adaptivePollMs = readInt(filePath, "adaptive_poll_ms", config.adaptivePollMs, 1);
  config.adaptiveBackoffMs = readInt(filePath, "adaptive_backoff_ms", config.adaptiveBackoffMs, 1);

  std::string level = getINIValue(filePath, "log_level", "");
  if (!level.empty()) {
    LogLevel parsed;
    if (parseLogLevel(level, parsed)) {
      config.logLevel = parsed;
    } else {
      DEBUG_WARN(CONFIG, "Unknown log_level '" + level + "'");
    }
  }

  addLog("Loaded config from " + filePath);
  return true;
}
