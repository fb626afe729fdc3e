#ifndef JSON_CODEC_H
#define JSON_CODEC_H

#include <ArduinoJson.h>

#include "LightsOut.h"

// ===== PARSING =====

// Accepts the bridge short keys (bri, sat, ct, transitiontime) and the long names
bool parseLightCommand(JsonVariantConst json, LightCommand& out, std::string& error);

// Accepts {trigger, target, action} and the flat trigger_type/trigger_config form
bool parseAutomation(JsonObjectConst json, Automation& out, std::string& error);

// Malformed entries are logged and skipped. False only when the document itself is unreadable.
bool parseAutomationsJson(const std::string& text, std::vector<Automation>& out);
bool loadAutomationsFile(const std::string& path, std::vector<Automation>& out);

// ===== SERIALIZATION =====

double roundConfidence(double confidence);

void writePatternAction(JsonObject json, PatternType type, const PatternAction& action);
void writePattern(JsonObject json, const Pattern& pattern);
void writeLightCommand(JsonObject json, const LightCommand& command);

std::string patternsToJson(const std::vector<Pattern>& patterns);
std::string predictionsToJson(const std::vector<Prediction>& predictions, time_t now);
std::string recommendationsToJson(const std::vector<Recommendation>& recommendations);
std::string reactiveActionsToJson(const std::vector<ReactiveAction>& actions);
std::string automationResultToJson(const AutomationResult& result);
std::string adaptiveStatusToJson(const std::vector<AdaptiveSessionStatus>& sessions);
std::string sunTimesToJson(const ClockTime& sunrise, const ClockTime& sunset, time_t date);

#endif // JSON_CODEC_H
