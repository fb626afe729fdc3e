#include "DebugLog.h"

#include <ctime>
#include <iostream>
#include <mutex>

namespace {

std::mutex logMutex;
std::string logBuffer;
LogLevel currentLevel = LOG_LEVEL_INFO;

}

void addLog(const std::string& entry) {
  time_t now = time(nullptr);
  struct tm timeinfo;
  char timestamp[25] = "";
  if (localtime_r(&now, &timeinfo)) {
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%S%z", &timeinfo);
  }

  std::lock_guard<std::mutex> lock(logMutex);
  logBuffer += "[" + std::string(timestamp) + "] " + entry + "\n";

  // Keep log buffer from growing too large
  if (logBuffer.length() > LOG_BUFFER_LIMIT) {
    logBuffer = logBuffer.substr(logBuffer.length() - LOG_BUFFER_LIMIT);
  }

  std::cout << entry << std::endl;
}

std::string getLogBuffer() {
  std::lock_guard<std::mutex> lock(logMutex);
  return logBuffer;
}

void clearLogBuffer() {
  std::lock_guard<std::mutex> lock(logMutex);
  logBuffer.clear();
}

void setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(logMutex);
  currentLevel = level;
}

LogLevel getLogLevel() {
  std::lock_guard<std::mutex> lock(logMutex);
  return currentLevel;
}

bool parseLogLevel(const std::string& name, LogLevel& level) {
  if (name == "error") level = LOG_LEVEL_ERROR;
  else if (name == "warn" || name == "warning") level = LOG_LEVEL_WARN;
  else if (name == "info") level = LOG_LEVEL_INFO;
  else if (name == "verbose" || name == "debug") level = LOG_LEVEL_VERBOSE;
  else return false;
  return true;
}

void debugPrint(LogLevel level, const char* color, const char* tag, const char* component, const std::string& msg) {
  std::lock_guard<std::mutex> lock(logMutex);
  if (level > currentLevel) return;
  std::cerr << color << "[" << tag << "][" << component << "] " << msg << DEBUG_COLOR_RESET << std::endl;
}
