#include "LightsOut.h"

#include <cctype>
#include <cstdio>

bool LightCommand::isEmpty() const {
  return !hasOn && brightness < 0 && hue < 0 && saturation < 0 && colorTemp < 0 &&
         transitionTime < 0 && alert.empty() && effect.empty() && !hasXy && scene.empty();
}

LightEvent makeLightEvent(const std::string& lightId, const std::string& lightName, LightEventType type,
                          const std::string& oldValue, const std::string& newValue, time_t timestamp) {
  LightEvent event;
  event.lightId = lightId;
  event.lightName = lightName;
  event.timestamp = timestamp;
  event.eventType = type;
  event.oldValue = oldValue;
  event.newValue = newValue;

  struct tm timeinfo;
  if (localtime_r(&timestamp, &timeinfo)) {
    event.weekday = (timeinfo.tm_wday + 6) % 7;
    event.hour = timeinfo.tm_hour;
    event.minute = timeinfo.tm_min;
  }
  return event;
}

LightCommand makePowerCommand(bool on) {
  LightCommand command;
  command.hasOn = true;
  command.on = on;
  return command;
}

LightCommand makeBrightnessCommand(int brightness) {
  LightCommand command;
  command.brightness = brightness;
  return command;
}

// Accepts "H:MM" and "HH:MM", 00:00 - 23:59
bool parseClockTime(const std::string& text, ClockTime& out) {
  size_t sep = text.find(':');
  if (sep == std::string::npos || sep == 0 || sep > 2 || text.length() - sep - 1 != 2) return false;

  for (size_t i = 0; i < text.length(); i++) {
    if (i != sep && !isdigit(static_cast<unsigned char>(text[i]))) return false;
  }

  int hour = std::stoi(text.substr(0, sep));
  int minute = std::stoi(text.substr(sep + 1));
  if (hour > 23 || minute > 59) return false;

  out.hour = hour;
  out.minute = minute;
  return true;
}

std::string formatClockTime(const ClockTime& time) {
  char buf[8];
  snprintf(buf, sizeof(buf), "%02d:%02d", time.hour, time.minute);
  return std::string(buf);
}

std::string formatTimestamp(time_t timestamp) {
  struct tm timeinfo;
  char buf[25] = "";
  if (timestamp > 0 && localtime_r(&timestamp, &timeinfo)) {
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &timeinfo);
  }
  return std::string(buf);
}

std::string localDateKey(time_t timestamp) {
  struct tm timeinfo;
  char buf[12] = "";
  if (localtime_r(&timestamp, &timeinfo)) {
    strftime(buf, sizeof(buf), "%Y-%m-%d", &timeinfo);
  }
  return std::string(buf);
}

int mondayWeekday(time_t timestamp) {
  struct tm timeinfo;
  if (!localtime_r(&timestamp, &timeinfo)) return 0;
  return (timeinfo.tm_wday + 6) % 7;
}

// Same local calendar day as `day`, at hour:minute:00
time_t localTimeAt(time_t day, int hour, int minute) {
  struct tm timeinfo;
  if (!localtime_r(&day, &timeinfo)) return 0;
  timeinfo.tm_hour = hour;
  timeinfo.tm_min = minute;
  timeinfo.tm_sec = 0;
  timeinfo.tm_isdst = -1;
  return mktime(&timeinfo);
}

time_t addLocalDays(time_t timestamp, int days) {
  struct tm timeinfo;
  if (!localtime_r(&timestamp, &timeinfo)) return timestamp;
  timeinfo.tm_mday += days;
  timeinfo.tm_isdst = -1;
  return mktime(&timeinfo);
}

bool weekdayAllowed(const std::vector<int>& weekdays, int weekday) {
  if (weekdays.empty()) return true;
  for (size_t i = 0; i < weekdays.size(); i++) {
    if (weekdays[i] == weekday) return true;
  }
  return false;
}

std::string eventTypeName(LightEventType type) {
  switch (type) {
    case EVENT_ON: return "on";
    case EVENT_OFF: return "off";
    case EVENT_BRIGHTNESS: return "brightness";
    case EVENT_HUE: return "hue";
    case EVENT_COLOR_TEMP: return "color_temp";
    default: return "unknown";
  }
}

bool parseEventType(const std::string& name, LightEventType& out) {
  if (name == "on") out = EVENT_ON;
  else if (name == "off") out = EVENT_OFF;
  else if (name == "brightness") out = EVENT_BRIGHTNESS;
  else if (name == "hue") out = EVENT_HUE;
  else if (name == "color_temp") out = EVENT_COLOR_TEMP;
  else return false;
  return true;
}

std::string patternTypeName(PatternType type) {
  switch (type) {
    case PATTERN_TIME_BASED: return "time_based";
    case PATTERN_SEQUENCE: return "sequence";
    case PATTERN_CORRELATION: return "correlation";
    default: return "unknown";
  }
}

std::string triggerTypeName(TriggerType type) {
  switch (type) {
    case TRIGGER_TIME: return "time";
    case TRIGGER_SUNRISE: return "sunrise";
    case TRIGGER_SUNSET: return "sunset";
    case TRIGGER_MANUAL: return "manual";
    default: return "unknown";
  }
}

std::string targetTypeName(TargetType type) {
  return type == TARGET_ROOM ? "room" : "light";
}

std::string adaptiveStatusName(AdaptiveStatus status) {
  switch (status) {
    case ADAPTIVE_STARTING: return "starting";
    case ADAPTIVE_ADJUSTING: return "adjusting";
    case ADAPTIVE_TARGET_REACHED: return "target_reached";
    case ADAPTIVE_ERROR: return "error";
    case ADAPTIVE_STOPPED: return "stopped";
    default: return "unknown";
  }
}

std::string weekdayName(int weekday) {
  static const char* names[] = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};
  if (weekday < 0 || weekday > 6) return "?";
  return names[weekday];
}

std::string joinIds(const std::vector<std::string>& ids) {
  std::string result;
  for (size_t i = 0; i < ids.size(); i++) {
    if (i > 0) result += ",";
    result += ids[i];
  }
  return result;
}
