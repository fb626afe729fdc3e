#include "LightsOut.h"

#include <algorithm>
#include <cstdio>
#include <set>
#include <tuple>

// ===== PATTERN MINER =====

namespace {

typedef std::tuple<std::string, int, int, int> TimeKey;               // light, weekday, hour, event type
typedef std::tuple<std::string, int, std::string, int> SequenceKey;   // light a, type a, light b, type b
typedef std::tuple<std::string, std::string, int> CorrelationKey;     // light low, light high, event type

struct GroupStats {
  int count = 0;
  time_t lastSeen = 0;
  std::vector<long> delays;
};

std::string actionVerb(LightEventType type) {
  switch (type) {
    case EVENT_ON: return "turns on";
    case EVENT_OFF: return "turns off";
    case EVENT_BRIGHTNESS: return "changes brightness";
    case EVENT_HUE: return "changes colour";
    case EVENT_COLOR_TEMP: return "changes colour temperature";
    default: return "changes";
  }
}

std::string pluralVerb(LightEventType type) {
  switch (type) {
    case EVENT_ON: return "turn on";
    case EVENT_OFF: return "turn off";
    case EVENT_BRIGHTNESS: return "change brightness";
    case EVENT_HUE: return "change colour";
    case EVENT_COLOR_TEMP: return "change colour temperature";
    default: return "change";
  }
}

std::vector<int> allWeekdays() {
  std::vector<int> days;
  for (int d = 0; d < 7; d++) days.push_back(d);
  return days;
}

std::vector<LightEvent> sortedByTime(const std::vector<LightEvent>& events) {
  std::vector<LightEvent> sorted(events);
  std::stable_sort(sorted.begin(), sorted.end(),
    [](const LightEvent& a, const LightEvent& b) { return a.timestamp < b.timestamp; });
  return sorted;
}

std::string displayName(const std::map<std::string, std::string>& names, const std::string& lightId) {
  std::map<std::string, std::string>::const_iterator it = names.find(lightId);
  if (it == names.end() || it->second.empty()) return "Light " + lightId;
  return it->second;
}

std::map<std::string, std::string> collectNames(const std::vector<LightEvent>& events) {
  std::map<std::string, std::string> names;
  for (const auto& event : events) {
    if (names.find(event.lightId) == names.end()) names[event.lightId] = event.lightName;
  }
  return names;
}

}

PatternMiner::PatternMiner(int minOccurrences, int timeWindowMinutes, double confidenceThreshold)
  : minOccurrences(minOccurrences),
    timeWindowMinutes(timeWindowMinutes),
    confidenceThreshold(confidenceThreshold) {}

std::vector<Pattern> PatternMiner::analyze(const std::vector<LightEvent>& events) const {
  std::vector<Pattern> patterns;
  if (events.empty()) {
    DEBUG_WARN(MINER, "No events found to analyze");
    return patterns;
  }

  DEBUG_INFO(MINER, "Analyzing " + std::to_string(events.size()) + " light events");

  std::vector<Pattern> timePatterns = detectTimePatterns(events);
  std::vector<Pattern> sequencePatterns = detectSequencePatterns(events);
  std::vector<Pattern> correlationPatterns = detectCorrelationPatterns(events);

  patterns.insert(patterns.end(), timePatterns.begin(), timePatterns.end());
  patterns.insert(patterns.end(), sequencePatterns.begin(), sequencePatterns.end());
  patterns.insert(patterns.end(), correlationPatterns.begin(), correlationPatterns.end());

  patterns.erase(std::remove_if(patterns.begin(), patterns.end(),
    [this](const Pattern& p) { return p.confidence < confidenceThreshold; }),
    patterns.end());

  DEBUG_INFO(MINER, "Detected " + std::to_string(patterns.size()) + " patterns");
  return patterns;
}

// "Kitchen turns on at 07:00 on Mondays"
std::vector<Pattern> PatternMiner::detectTimePatterns(const std::vector<LightEvent>& events) const {
  std::vector<Pattern> patterns;
  std::map<TimeKey, GroupStats> groups;
  std::set<std::string> distinctDays;
  std::map<std::string, std::string> names = collectNames(events);

  for (const auto& event : events) {
    distinctDays.insert(localDateKey(event.timestamp));
    GroupStats& stats = groups[std::make_tuple(event.lightId, event.weekday, event.hour, static_cast<int>(event.eventType))];
    stats.count++;
    if (event.timestamp > stats.lastSeen) stats.lastSeen = event.timestamp;
  }

  // How often any one weekday could have occurred in the analysed range
  double expectedOccurrences = std::max(1.0, distinctDays.size() / 7.0);

  for (const auto& group : groups) {
    const GroupStats& stats = group.second;
    if (stats.count < minOccurrences) continue;

    std::string lightId = std::get<0>(group.first);
    int weekday = std::get<1>(group.first);
    int hour = std::get<2>(group.first);
    LightEventType eventType = static_cast<LightEventType>(std::get<3>(group.first));

    ClockTime start;
    start.hour = hour;
    start.minute = 0;
    ClockTime end;
    end.hour = hour;
    end.minute = 59;

    Pattern pattern;
    pattern.type = PATTERN_TIME_BASED;
    pattern.lightIds.push_back(lightId);
    pattern.weekdays.push_back(weekday);
    pattern.timeStart = formatClockTime(start);
    pattern.timeEnd = formatClockTime(end);
    pattern.action.lightId = lightId;
    pattern.action.eventType = eventType;
    pattern.confidence = std::min(1.0, stats.count / expectedOccurrences);
    pattern.occurrenceCount = stats.count;
    pattern.lastSeen = stats.lastSeen;
    pattern.description = displayName(names, lightId) + " " + actionVerb(eventType) +
                          " at " + pattern.timeStart + " on " + weekdayName(weekday) + "s";
    patterns.push_back(pattern);
  }

  return patterns;
}

// "When Hall turns on, Kitchen turns on within 90s"
std::vector<Pattern> PatternMiner::detectSequencePatterns(const std::vector<LightEvent>& events) const {
  std::vector<Pattern> patterns;
  std::vector<LightEvent> sorted = sortedByTime(events);
  std::map<std::string, std::string> names = collectNames(events);
  std::map<SequenceKey, GroupStats> groups;
  long windowSeconds = static_cast<long>(timeWindowMinutes) * 60;

  for (size_t i = 0; i + 1 < sorted.size(); i++) {
    const LightEvent& current = sorted[i];
    const LightEvent& next = sorted[i + 1];

    long delay = static_cast<long>(next.timestamp - current.timestamp);
    if (delay <= 0 || delay > windowSeconds) continue;
    if (current.lightId == next.lightId) continue;

    GroupStats& stats = groups[std::make_tuple(current.lightId, static_cast<int>(current.eventType),
                                               next.lightId, static_cast<int>(next.eventType))];
    stats.count++;
    stats.delays.push_back(delay);
    if (next.timestamp > stats.lastSeen) stats.lastSeen = next.timestamp;
  }

  for (const auto& group : groups) {
    const GroupStats& stats = group.second;
    if (stats.count < minOccurrences) continue;

    long total = 0;
    for (size_t i = 0; i < stats.delays.size(); i++) total += stats.delays[i];
    int averageDelay = static_cast<int>(total / static_cast<long>(stats.delays.size()));

    Pattern pattern;
    pattern.type = PATTERN_SEQUENCE;
    pattern.lightIds.push_back(std::get<0>(group.first));
    pattern.lightIds.push_back(std::get<2>(group.first));
    pattern.weekdays = allWeekdays();
    pattern.action.trigger.lightId = std::get<0>(group.first);
    pattern.action.trigger.eventType = static_cast<LightEventType>(std::get<1>(group.first));
    pattern.action.response.lightId = std::get<2>(group.first);
    pattern.action.response.eventType = static_cast<LightEventType>(std::get<3>(group.first));
    pattern.action.delaySeconds = averageDelay;
    pattern.confidence = std::min(1.0, stats.count / (2.0 * minOccurrences));
    pattern.occurrenceCount = stats.count;
    pattern.lastSeen = stats.lastSeen;
    pattern.description = "When " + displayName(names, pattern.action.trigger.lightId) + " " +
                          actionVerb(pattern.action.trigger.eventType) + ", " +
                          displayName(names, pattern.action.response.lightId) + " " +
                          actionVerb(pattern.action.response.eventType) +
                          " within " + std::to_string(averageDelay) + "s";
    patterns.push_back(pattern);
  }

  return patterns;
}

// "Living room and Dining room turn off together"
std::vector<Pattern> PatternMiner::detectCorrelationPatterns(const std::vector<LightEvent>& events) const {
  std::vector<Pattern> patterns;
  std::vector<LightEvent> sorted = sortedByTime(events);
  std::map<std::string, std::string> names = collectNames(events);
  std::map<CorrelationKey, GroupStats> groups;

  for (size_t i = 0; i + 1 < sorted.size(); i++) {
    const LightEvent& current = sorted[i];
    size_t last = std::min(i + CORRELATION_SCAN_DEPTH + 1, sorted.size());

    for (size_t j = i + 1; j < last; j++) {
      const LightEvent& other = sorted[j];
      if (other.timestamp - current.timestamp > CORRELATION_WINDOW_SECONDS) break;

      if (current.lightId != other.lightId && current.eventType == other.eventType) {
        const std::string& low = std::min(current.lightId, other.lightId);
        const std::string& high = std::max(current.lightId, other.lightId);
        GroupStats& stats = groups[std::make_tuple(low, high, static_cast<int>(current.eventType))];
        stats.count++;
        if (other.timestamp > stats.lastSeen) stats.lastSeen = other.timestamp;
      }
    }
  }

  for (const auto& group : groups) {
    const GroupStats& stats = group.second;
    if (stats.count < minOccurrences) continue;

    std::string first = std::get<0>(group.first);
    std::string second = std::get<1>(group.first);
    LightEventType eventType = static_cast<LightEventType>(std::get<2>(group.first));

    Pattern pattern;
    pattern.type = PATTERN_CORRELATION;
    pattern.lightIds.push_back(first);
    pattern.lightIds.push_back(second);
    pattern.weekdays = allWeekdays();
    pattern.action.eventType = eventType;
    pattern.action.lights.push_back(first);
    pattern.action.lights.push_back(second);
    pattern.confidence = std::min(1.0, stats.count / (3.0 * minOccurrences));
    pattern.occurrenceCount = stats.count;
    pattern.lastSeen = stats.lastSeen;
    pattern.description = displayName(names, first) + " and " + displayName(names, second) + " " +
                          pluralVerb(eventType) + " together";
    patterns.push_back(pattern);
  }

  return patterns;
}

std::string PatternMiner::getPatternSummary(const std::vector<Pattern>& patterns) const {
  if (patterns.empty()) {
    return "No patterns detected yet. Collect more data.";
  }

  std::string summary = "Detected patterns:\n";
  const PatternType order[] = {PATTERN_TIME_BASED, PATTERN_SEQUENCE, PATTERN_CORRELATION};
  const char* titles[] = {"Time based", "Sequences", "Correlations"};

  for (int t = 0; t < 3; t++) {
    std::vector<Pattern> ofType;
    for (const auto& pattern : patterns) {
      if (pattern.type == order[t]) ofType.push_back(pattern);
    }
    if (ofType.empty()) continue;

    std::stable_sort(ofType.begin(), ofType.end(),
      [](const Pattern& a, const Pattern& b) { return a.confidence > b.confidence; });

    summary += "\n" + std::string(titles[t]) + ":\n";
    for (size_t i = 0; i < ofType.size() && i < 5; i++) {
      char line[64];
      snprintf(line, sizeof(line), " (confidence: %.0f%%, seen %d times)",
               ofType[i].confidence * 100.0, ofType[i].occurrenceCount);
      summary += "  - " + ofType[i].description + line + "\n";
    }
  }

  return summary;
}
