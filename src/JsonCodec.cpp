#include "JsonCodec.h"

#include <cmath>
#include <cstring>
#include <fstream>
#include <sstream>

// ===== JSON CODEC =====

namespace {

std::string readString(JsonVariantConst value, const std::string& fallback) {
  const char* text = value.as<const char*>();
  return text ? std::string(text) : fallback;
}

// Ids may be strings, numbers, or one comma separated string
bool readIdList(JsonVariantConst value, std::vector<std::string>& out, std::string& error) {
  out.clear();
  if (value.is<const char*>()) {
    std::stringstream ids(value.as<const char*>());
    std::string id;
    while (std::getline(ids, id, ',')) {
      size_t first = id.find_first_not_of(" \t");
      size_t last = id.find_last_not_of(" \t");
      if (first != std::string::npos) out.push_back(id.substr(first, last - first + 1));
    }
  } else if (value.is<JsonArrayConst>()) {
    for (JsonVariantConst item : value.as<JsonArrayConst>()) {
      if (item.is<const char*>()) {
        out.push_back(item.as<const char*>());
      } else if (item.is<long>()) {
        out.push_back(std::to_string(item.as<long>()));
      } else {
        error = "target ids must be strings or integers";
        return false;
      }
    }
  }

  if (out.empty()) {
    error = "no target ids";
    return false;
  }
  return true;
}

bool readWeekdays(JsonVariantConst value, std::vector<int>& out, std::string& error) {
  out.clear();
  if (value.isNull()) return true;
  if (!value.is<JsonArrayConst>()) {
    error = "weekdays must be an array";
    return false;
  }
  for (JsonVariantConst day : value.as<JsonArrayConst>()) {
    if (!day.is<int>() || day.as<int>() < 0 || day.as<int>() > 6) {
      error = "weekdays must be integers 0-6";
      return false;
    }
    out.push_back(day.as<int>());
  }
  return true;
}

bool readRangedInt(JsonVariantConst value, const char* name, int minValue, int maxValue, int& out, std::string& error) {
  if (value.isNull()) return true;
  if (!value.is<int>() || value.as<int>() < minValue || value.as<int>() > maxValue) {
    error = std::string(name) + " must be an integer " + std::to_string(minValue) + "-" + std::to_string(maxValue);
    return false;
  }
  out = value.as<int>();
  return true;
}

JsonVariantConst firstOf(JsonObjectConst json, const char* shortKey, const char* longKey) {
  if (json.containsKey(shortKey)) return json[shortKey];
  return json[longKey];
}

bool parseTrigger(const std::string& type, JsonVariantConst config, AutomationTrigger& out, std::string& error) {
  JsonObjectConst json = config.as<JsonObjectConst>();

  if (type == "time") {
    out.type = TRIGGER_TIME;
    std::string timeText = readString(json["time"], "");
    if (!parseClockTime(timeText, out.time)) {
      error = "invalid time '" + timeText + "'";
      return false;
    }
  } else if (type == "sunrise" || type == "sunset") {
    out.type = type == "sunrise" ? TRIGGER_SUNRISE : TRIGGER_SUNSET;
    JsonVariantConst offset = json.containsKey("offset_minutes") ? json["offset_minutes"] : json["offset"];
    if (!offset.isNull() && !offset.is<int>()) {
      error = "offset_minutes must be an integer";
      return false;
    }
    out.offsetMinutes = offset.as<int>();
  } else if (type == "manual") {
    out.type = TRIGGER_MANUAL;
    return true;
  } else {
    error = "unknown trigger type '" + type + "'";
    return false;
  }

  return readWeekdays(json["weekdays"], out.weekdays, error);
}

bool parseAction(JsonVariantConst config, AutomationAction& out, std::string& error) {
  JsonObjectConst json = config.as<JsonObjectConst>();
  if (json.isNull()) {
    error = "action must be an object";
    return false;
  }

  if (!json.containsKey("sequence")) {
    out.type = ACTION_SINGLE;
    return parseLightCommand(json, out.command, error);
  }

  out.type = ACTION_SEQUENCE;
  out.sequence.clear();
  JsonArrayConst steps = json["sequence"].as<JsonArrayConst>();
  if (steps.isNull() || steps.size() == 0) {
    error = "sequence must be a non-empty array";
    return false;
  }

  for (JsonVariantConst item : steps) {
    JsonObjectConst step = item.as<JsonObjectConst>();
    SequenceStep parsed;
    JsonVariantConst delay = step.containsKey("delay_seconds") ? step["delay_seconds"] : step["delay"];
    if (!delay.isNull() && (!delay.is<int>() || delay.as<int>() < 0)) {
      error = "sequence delay must be a non-negative integer";
      return false;
    }
    parsed.delaySeconds = delay.as<int>();
    if (!parseLightCommand(step["action"], parsed.command, error)) {
      error = "sequence step " + std::to_string(out.sequence.size()) + ": " + error;
      return false;
    }
    out.sequence.push_back(parsed);
  }
  return true;
}

// Stored configs may hold JSON text instead of an object
template <typename Parser>
bool withEmbeddedJson(JsonVariantConst value, Parser parse, std::string& error) {
  if (!value.is<const char*>()) return parse(value);

  DynamicJsonDocument nested(1024 + strlen(value.as<const char*>()) * 2);
  DeserializationError err = deserializeJson(nested, value.as<const char*>());
  if (err) {
    error = std::string("embedded JSON: ") + err.c_str();
    return false;
  }
  return parse(nested.as<JsonVariantConst>());
}

void writeEventRef(JsonObject json, const EventRef& ref) {
  json["light_id"] = ref.lightId;
  json["type"] = eventTypeName(ref.eventType);
}

void writeIds(JsonArray json, const std::vector<std::string>& ids) {
  for (const auto& id : ids) json.add(id);
}

size_t documentCapacity(size_t items, size_t perItem) {
  return 1024 + items * perItem;
}

}

bool parseLightCommand(JsonVariantConst value, LightCommand& out, std::string& error) {
  JsonObjectConst json = value.as<JsonObjectConst>();
  if (json.isNull()) {
    error = "action must be an object";
    return false;
  }

  LightCommand command;
  JsonVariantConst on = json["on"];
  if (!on.isNull()) {
    if (!on.is<bool>()) {
      error = "on must be a boolean";
      return false;
    }
    command.hasOn = true;
    command.on = on.as<bool>();
  }

  if (!readRangedInt(firstOf(json, "bri", "brightness"), "brightness", 0, MAX_BRIGHTNESS, command.brightness, error)) return false;
  if (!readRangedInt(json["hue"], "hue", 0, 65535, command.hue, error)) return false;
  if (!readRangedInt(firstOf(json, "sat", "saturation"), "saturation", 0, 254, command.saturation, error)) return false;
  if (!readRangedInt(firstOf(json, "ct", "color_temp"), "color_temp", 153, 500, command.colorTemp, error)) return false;
  if (!readRangedInt(firstOf(json, "transitiontime", "transition_time"), "transition_time", 0, 65535,
                     command.transitionTime, error)) return false;

  command.alert = readString(json["alert"], "");
  command.effect = readString(json["effect"], "");
  command.scene = readString(json["scene"], "");

  JsonVariantConst xy = json["xy"];
  if (!xy.isNull()) {
    JsonArrayConst pair = xy.as<JsonArrayConst>();
    if (pair.isNull() || pair.size() != 2 || !pair[0].is<float>() || !pair[1].is<float>()) {
      error = "xy must be two numbers";
      return false;
    }
    command.hasXy = true;
    command.xy[0] = pair[0].as<float>();
    command.xy[1] = pair[1].as<float>();
  }

  if (command.isEmpty()) {
    error = "action sets no light parameters";
    return false;
  }
  out = command;
  return true;
}

bool parseAutomation(JsonObjectConst json, Automation& out, std::string& error) {
  Automation automation;
  automation.id = json["id"] | -1;
  automation.name = readString(json["name"], "");
  automation.description = readString(json["description"], "");
  automation.isEnabled = json.containsKey("is_enabled") ? json["is_enabled"].as<bool>() : (json["enabled"] | true);
  automation.triggerCount = json["trigger_count"] | 0;

  if (automation.name.empty()) {
    error = "missing name";
    return false;
  }

  bool flatForm = json.containsKey("trigger_type");
  std::string triggerType;
  JsonVariantConst triggerConfig;
  std::string targetType;
  JsonVariantConst targetIds;
  JsonVariantConst actionConfig;

  if (flatForm) {
    triggerType = readString(json["trigger_type"], "");
    triggerConfig = json["trigger_config"];
    targetType = readString(json["target_type"], "light");
    targetIds = json["target_ids"];
    actionConfig = json["action_config"];
  } else {
    triggerType = readString(json["trigger"]["type"], "manual");
    triggerConfig = json["trigger"];
    targetType = readString(json["target"]["type"], "light");
    targetIds = json["target"]["ids"];
    actionConfig = json["action"];
  }

  if (!withEmbeddedJson(triggerConfig, [&](JsonVariantConst config) {
        return parseTrigger(triggerType, config, automation.trigger, error);
      }, error)) {
    return false;
  }

  if (targetType == "light") {
    automation.target.type = TARGET_LIGHT;
  } else if (targetType == "room") {
    automation.target.type = TARGET_ROOM;
  } else {
    error = "unknown target type '" + targetType + "'";
    return false;
  }
  if (!readIdList(targetIds, automation.target.ids, error)) return false;

  if (!withEmbeddedJson(actionConfig, [&](JsonVariantConst config) {
        return parseAction(config, automation.action, error);
      }, error)) {
    return false;
  }

  out = automation;
  return true;
}

bool parseAutomationsJson(const std::string& text, std::vector<Automation>& out) {
  DynamicJsonDocument doc(documentCapacity(text.size(), 4));
  DeserializationError err = deserializeJson(doc, text);
  if (err) {
    DEBUG_ERROR(CONFIG, std::string("Invalid automations JSON: ") + err.c_str());
    return false;
  }

  JsonArrayConst entries = doc.is<JsonArray>() ? doc.as<JsonArrayConst>() : doc["automations"].as<JsonArrayConst>();
  if (entries.isNull()) {
    DEBUG_ERROR(CONFIG, "Automations JSON has no 'automations' array");
    return false;
  }

  out.clear();
  int index = 0;
  for (JsonVariantConst entry : entries) {
    Automation automation;
    std::string error;
    if (parseAutomation(entry.as<JsonObjectConst>(), automation, error)) {
      out.push_back(automation);
    } else {
      DEBUG_WARN(CONFIG, "Skipping automation #" + std::to_string(index) + ": " + error);
    }
    index++;
  }
  return true;
}

bool loadAutomationsFile(const std::string& path, std::vector<Automation>& out) {
  std::ifstream file(path.c_str());
  if (!file) {
    DEBUG_WARN(CONFIG, "Automations file not found: " + path);
    return false;
  }
  std::stringstream content;
  content << file.rdbuf();
  return parseAutomationsJson(content.str(), out);
}

double roundConfidence(double confidence) {
  return floor(confidence * 100.0 + 0.5) / 100.0;
}

void writePatternAction(JsonObject json, PatternType type, const PatternAction& action) {
  switch (type) {
    case PATTERN_TIME_BASED:
      json["light_id"] = action.lightId;
      json["type"] = eventTypeName(action.eventType);
      break;
    case PATTERN_SEQUENCE:
      writeEventRef(json.createNestedObject("trigger"), action.trigger);
      writeEventRef(json.createNestedObject("response"), action.response);
      json["delay_seconds"] = action.delaySeconds;
      break;
    case PATTERN_CORRELATION:
      json["type"] = eventTypeName(action.eventType);
      writeIds(json.createNestedArray("lights"), action.lights);
      break;
  }
}

void writePattern(JsonObject json, const Pattern& pattern) {
  if (pattern.id >= 0) json["id"] = pattern.id;
  json["pattern_type"] = patternTypeName(pattern.type);
  json["description"] = pattern.description;
  writeIds(json.createNestedArray("light_ids"), pattern.lightIds);
  JsonArray weekdays = json.createNestedArray("weekdays");
  for (size_t i = 0; i < pattern.weekdays.size(); i++) weekdays.add(pattern.weekdays[i]);
  if (!pattern.timeStart.empty()) json["time_start"] = pattern.timeStart;
  if (!pattern.timeEnd.empty()) json["time_end"] = pattern.timeEnd;
  writePatternAction(json.createNestedObject("action"), pattern.type, pattern.action);
  json["confidence"] = roundConfidence(pattern.confidence);
  json["occurrence_count"] = pattern.occurrenceCount;
  if (pattern.lastSeen > 0) json["last_seen"] = formatTimestamp(pattern.lastSeen);
  json["is_active"] = pattern.isActive;
}

void writeLightCommand(JsonObject json, const LightCommand& command) {
  if (command.hasOn) json["on"] = command.on;
  if (command.brightness >= 0) json["bri"] = command.brightness;
  if (command.hue >= 0) json["hue"] = command.hue;
  if (command.saturation >= 0) json["sat"] = command.saturation;
  if (command.colorTemp >= 0) json["ct"] = command.colorTemp;
  if (command.transitionTime >= 0) json["transitiontime"] = command.transitionTime;
  if (!command.alert.empty()) json["alert"] = command.alert;
  if (!command.effect.empty()) json["effect"] = command.effect;
  if (command.hasXy) {
    JsonArray xy = json.createNestedArray("xy");
    xy.add(command.xy[0]);
    xy.add(command.xy[1]);
  }
  if (!command.scene.empty()) json["scene"] = command.scene;
}

std::string patternsToJson(const std::vector<Pattern>& patterns) {
  DynamicJsonDocument doc(documentCapacity(patterns.size(), 1024));
  doc["count"] = patterns.size();
  JsonArray list = doc.createNestedArray("patterns");
  for (const auto& pattern : patterns) {
    writePattern(list.createNestedObject(), pattern);
  }

  std::string json;
  serializeJson(doc, json);
  return json;
}

std::string predictionsToJson(const std::vector<Prediction>& predictions, time_t now) {
  DynamicJsonDocument doc(documentCapacity(predictions.size(), 768));
  doc["timestamp"] = formatTimestamp(now);
  doc["count"] = predictions.size();
  JsonArray list = doc.createNestedArray("predictions");
  for (const auto& prediction : predictions) {
    JsonObject item = list.createNestedObject();
    item["pattern_id"] = prediction.patternId;
    item["pattern_type"] = patternTypeName(prediction.patternType);
    item["description"] = prediction.description;
    writePatternAction(item.createNestedObject("action"), prediction.patternType, prediction.action);
    item["confidence"] = roundConfidence(prediction.confidence);
    item["trigger_time"] = formatTimestamp(prediction.triggerTime);
  }

  std::string json;
  serializeJson(doc, json);
  return json;
}

std::string recommendationsToJson(const std::vector<Recommendation>& recommendations) {
  DynamicJsonDocument doc(documentCapacity(recommendations.size(), 768));
  doc["count"] = recommendations.size();
  JsonArray list = doc.createNestedArray("recommendations");
  for (const auto& recommendation : recommendations) {
    JsonObject item = list.createNestedObject();
    item["pattern_id"] = recommendation.patternId;
    item["type"] = recommendation.type;
    item["message"] = recommendation.message;
    item["confidence"] = roundConfidence(recommendation.confidence);
    writePatternAction(item.createNestedObject("action"), recommendation.patternType, recommendation.action);
  }

  std::string json;
  serializeJson(doc, json);
  return json;
}

std::string reactiveActionsToJson(const std::vector<ReactiveAction>& actions) {
  DynamicJsonDocument doc(documentCapacity(actions.size(), 256));
  JsonArray list = doc.createNestedArray("actions");
  for (const auto& action : actions) {
    JsonObject item = list.createNestedObject();
    item["pattern_id"] = action.patternId;
    item["light_id"] = action.lightId;
    item["action"] = eventTypeName(action.eventType);
    item["delay_seconds"] = action.delaySeconds;
    item["confidence"] = roundConfidence(action.confidence);
  }

  std::string json;
  serializeJson(doc, json);
  return json;
}

std::string automationResultToJson(const AutomationResult& result) {
  DynamicJsonDocument doc(512);
  doc["success"] = result.success;
  doc["reason"] = result.reason;
  doc["automation_id"] = result.automationId;
  if (!result.automationName.empty()) doc["name"] = result.automationName;
  doc["targets_succeeded"] = result.targetsSucceeded;
  doc["total_targets"] = result.totalTargets;
  doc["steps_scheduled"] = result.stepsScheduled;

  std::string json;
  serializeJson(doc, json);
  return json;
}

std::string adaptiveStatusToJson(const std::vector<AdaptiveSessionStatus>& sessions) {
  DynamicJsonDocument doc(documentCapacity(sessions.size(), 768));
  doc["active"] = sessions.size();
  JsonArray list = doc.createNestedArray("sessions");
  for (const auto& session : sessions) {
    JsonObject item = list.createNestedObject();
    item["session_id"] = session.sessionId;
    item["sensor_id"] = session.sensorId;
    writeIds(item.createNestedArray("light_ids"), session.lightIds);
    item["target_lux"] = session.targetLux;
    item["current_lux"] = floor(session.currentLux * 10.0 + 0.5) / 10.0;
    item["current_brightness"] = session.currentBrightness;
    item["status"] = adaptiveStatusName(session.status);
    if (!session.lastError.empty()) item["error"] = session.lastError;
    item["iterations"] = session.iterations;
    item["commands_sent"] = session.commandsSent;
    item["started_at"] = formatTimestamp(session.startedAt);
  }

  std::string json;
  serializeJson(doc, json);
  return json;
}

std::string sunTimesToJson(const ClockTime& sunrise, const ClockTime& sunset, time_t date) {
  DynamicJsonDocument doc(256);
  doc["sunrise"] = formatClockTime(sunrise);
  doc["sunset"] = formatClockTime(sunset);
  doc["date"] = localDateKey(date);

  std::string json;
  serializeJson(doc, json);
  return json;
}
