#include "MemoryEventStore.h"

#include <algorithm>
#include <sstream>

// ===== IN-MEMORY EVENT STORE =====

MemoryEventStore::MemoryEventStore()
  : nextEventId(1), nextPatternId(1), nextAutomationId(1), available(true) {}

void MemoryEventStore::setAvailable(bool isAvailable) {
  std::lock_guard<std::mutex> lock(storeMutex);
  available = isAvailable;
}

std::string MemoryEventStore::patternSignature(const Pattern& pattern) {
  std::ostringstream key;
  key << patternTypeName(pattern.type) << "|" << joinIds(pattern.lightIds) << "|";
  for (size_t i = 0; i < pattern.weekdays.size(); i++) key << pattern.weekdays[i] << ",";
  key << "|" << pattern.timeStart << "|" << pattern.action.lightId << "|" << pattern.action.eventType
      << "|" << pattern.action.trigger.lightId << ":" << pattern.action.trigger.eventType
      << "|" << pattern.action.response.lightId << ":" << pattern.action.response.eventType
      << "|" << joinIds(pattern.action.lights);
  return key.str();
}

bool MemoryEventStore::appendEvent(const LightEvent& event) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  LightEvent stored = event;
  stored.id = nextEventId++;
  events.push_back(stored);
  return true;
}

bool MemoryEventStore::queryEvents(const EventQuery& query, std::vector<LightEvent>& out) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;

  out.clear();
  for (const auto& event : events) {
    if (!query.lightId.empty() && event.lightId != query.lightId) continue;
    if (query.eventType != EVENT_UNKNOWN && event.eventType != query.eventType) continue;
    if (query.start > 0 && event.timestamp < query.start) continue;
    if (query.end > 0 && event.timestamp > query.end) continue;
    out.push_back(event);
  }

  // Newest first, capped at the limit
  std::stable_sort(out.begin(), out.end(),
    [](const LightEvent& a, const LightEvent& b) { return a.timestamp > b.timestamp; });
  if (query.limit > 0 && out.size() > static_cast<size_t>(query.limit)) {
    out.resize(query.limit);
  }
  return true;
}

int MemoryEventStore::savePattern(const Pattern& pattern) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return -1;

  // A re-mined pattern refreshes the existing record, retired or not; confidence and isActive are left to feedback
  std::string signature = patternSignature(pattern);
  for (std::map<int, Pattern>::iterator it = patterns.begin(); it != patterns.end(); ++it) {
    if (patternSignature(it->second) == signature) {
      it->second.occurrenceCount = pattern.occurrenceCount;
      it->second.lastSeen = std::max(it->second.lastSeen, pattern.lastSeen);
      it->second.description = pattern.description;
      return it->first;
    }
  }

  Pattern stored = pattern;
  stored.id = nextPatternId++;
  stored.isActive = true;
  patterns[stored.id] = stored;
  DEBUG_INFO(STORE, "Saved pattern: " + stored.description);
  return stored.id;
}

bool MemoryEventStore::loadActivePatterns(std::vector<Pattern>& out) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  out.clear();
  for (std::map<int, Pattern>::const_iterator it = patterns.begin(); it != patterns.end(); ++it) {
    if (it->second.isActive) out.push_back(it->second);
  }
  return true;
}

bool MemoryEventStore::getPattern(int patternId, Pattern& out) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  std::map<int, Pattern>::const_iterator it = patterns.find(patternId);
  if (it == patterns.end()) return false;
  out = it->second;
  return true;
}

bool MemoryEventStore::updatePattern(const Pattern& pattern) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  std::map<int, Pattern>::iterator it = patterns.find(pattern.id);
  if (it == patterns.end()) return false;
  it->second = pattern;
  return true;
}

std::vector<Pattern> MemoryEventStore::allPatterns() const {
  std::lock_guard<std::mutex> lock(storeMutex);
  std::vector<Pattern> result;
  for (std::map<int, Pattern>::const_iterator it = patterns.begin(); it != patterns.end(); ++it) {
    result.push_back(it->second);
  }
  return result;
}

bool MemoryEventStore::loadEnabledAutomations(std::vector<Automation>& out) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  out.clear();
  for (std::map<int, Automation>::const_iterator it = automations.begin(); it != automations.end(); ++it) {
    if (it->second.isEnabled) out.push_back(it->second);
  }
  return true;
}

bool MemoryEventStore::getAutomation(int automationId, Automation& out) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  std::map<int, Automation>::const_iterator it = automations.find(automationId);
  if (it == automations.end()) return false;
  out = it->second;
  return true;
}

bool MemoryEventStore::recordTrigger(int automationId, time_t when) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  std::map<int, Automation>::iterator it = automations.find(automationId);
  if (it == automations.end()) return false;
  it->second.triggerCount++;
  it->second.lastTriggered = when;
  return true;
}

int MemoryEventStore::addAutomation(const Automation& automation) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return -1;
  Automation stored = automation;
  if (stored.id <= 0) {
    stored.id = nextAutomationId;
  }
  nextAutomationId = std::max(nextAutomationId, stored.id + 1);
  automations[stored.id] = stored;
  return stored.id;
}

bool MemoryEventStore::setAutomationEnabled(int automationId, bool enabled) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  std::map<int, Automation>::iterator it = automations.find(automationId);
  if (it == automations.end()) return false;
  it->second.isEnabled = enabled;
  return true;
}

bool MemoryEventStore::removeAutomation(int automationId) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;
  return automations.erase(automationId) > 0;
}

int MemoryEventStore::cleanupOldEvents(int retentionDays, time_t now) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return -1;
  time_t cutoff = now - static_cast<time_t>(retentionDays) * 24 * 3600;
  size_t before = events.size();
  events.erase(std::remove_if(events.begin(), events.end(),
    [cutoff](const LightEvent& e) { return e.timestamp < cutoff; }),
    events.end());
  int deleted = static_cast<int>(before - events.size());
  if (deleted > 0) {
    DEBUG_INFO(STORE, "Cleaned up " + std::to_string(deleted) + " old events");
  }
  return deleted;
}

bool MemoryEventStore::getStatistics(StoreStatistics& out) {
  std::lock_guard<std::mutex> lock(storeMutex);
  if (!available) return false;

  out = StoreStatistics();
  out.totalEvents = static_cast<int>(events.size());
  out.totalPatterns = static_cast<int>(patterns.size());
  out.automations = static_cast<int>(automations.size());
  for (std::map<int, Pattern>::const_iterator it = patterns.begin(); it != patterns.end(); ++it) {
    if (it->second.isActive) out.activePatterns++;
  }
  for (const auto& event : events) {
    if (out.oldestEvent == 0 || event.timestamp < out.oldestEvent) out.oldestEvent = event.timestamp;
    if (event.timestamp > out.newestEvent) out.newestEvent = event.timestamp;
  }
  return true;
}
