#ifndef DEBUG_LOG_H
#define DEBUG_LOG_H

#include <string>

// ===== DEBUG CONFIGURATION =====

// Per-component switches
#define DEBUG_MINER true
#define DEBUG_PREDICTOR true
#define DEBUG_SCHEDULER true
#define DEBUG_AUTOMATION true
#define DEBUG_ADAPTIVE true
#define DEBUG_STORE true
#define DEBUG_GATEWAY true
#define DEBUG_CONFIG true
#define DEBUG_SERVICE true

#define DEBUG_COLOR_ERROR "\033[31m"    // Red
#define DEBUG_COLOR_WARNING "\033[33m"  // Yellow
#define DEBUG_COLOR_INFO "\033[36m"     // Cyan
#define DEBUG_COLOR_VERBOSE "\033[32m"  // Green
#define DEBUG_COLOR_RESET "\033[0m"     // Reset to default

#define LOG_BUFFER_LIMIT 8192

enum LogLevel {
  LOG_LEVEL_ERROR = 1,
  LOG_LEVEL_WARN = 2,
  LOG_LEVEL_INFO = 3,
  LOG_LEVEL_VERBOSE = 4
};

// Timestamped entry into the shared log buffer, echoed to the console
void addLog(const std::string& entry);
std::string getLogBuffer();
void clearLogBuffer();

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool parseLogLevel(const std::string& name, LogLevel& level);

void debugPrint(LogLevel level, const char* color, const char* tag, const char* component, const std::string& msg);

#define DEBUG_ERROR(comp, msg) do { if (DEBUG_##comp) debugPrint(LOG_LEVEL_ERROR, DEBUG_COLOR_ERROR, "ERROR", #comp, (msg)); } while (0)
#define DEBUG_WARN(comp, msg) do { if (DEBUG_##comp) debugPrint(LOG_LEVEL_WARN, DEBUG_COLOR_WARNING, "WARN", #comp, (msg)); } while (0)
#define DEBUG_INFO(comp, msg) do { if (DEBUG_##comp) debugPrint(LOG_LEVEL_INFO, DEBUG_COLOR_INFO, "INFO", #comp, (msg)); } while (0)
#define DEBUG_VERBOSE(comp, msg) do { if (DEBUG_##comp) debugPrint(LOG_LEVEL_VERBOSE, DEBUG_COLOR_VERBOSE, "VERBOSE", #comp, (msg)); } while (0)

#endif // DEBUG_LOG_H
