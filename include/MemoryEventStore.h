#ifndef MEMORY_EVENT_STORE_H
#define MEMORY_EVENT_STORE_H

#include "LightsOut.h"

// Thread-safe in-process EventStore
class MemoryEventStore : public EventStore {
private:
  mutable std::mutex storeMutex;
  std::vector<LightEvent> events;
  std::map<int, Pattern> patterns;
  std::map<int, Automation> automations;
  int nextEventId;
  int nextPatternId;
  int nextAutomationId;
  bool available;

  static std::string patternSignature(const Pattern& pattern);

public:
  MemoryEventStore();

  bool appendEvent(const LightEvent& event);
  bool queryEvents(const EventQuery& query, std::vector<LightEvent>& out);

  int savePattern(const Pattern& pattern);
  bool loadActivePatterns(std::vector<Pattern>& out);
  bool getPattern(int patternId, Pattern& out);
  bool updatePattern(const Pattern& pattern);

  bool loadEnabledAutomations(std::vector<Automation>& out);
  bool getAutomation(int automationId, Automation& out);
  bool recordTrigger(int automationId, time_t when);

  int cleanupOldEvents(int retentionDays, time_t now);
  bool getStatistics(StoreStatistics& out);

  // Management side
  int addAutomation(const Automation& automation);
  bool setAutomationEnabled(int automationId, bool enabled);
  bool removeAutomation(int automationId);
  std::vector<Pattern> allPatterns() const;

  // Simulates an outage: every call fails while unavailable
  void setAvailable(bool isAvailable);
};

#endif // MEMORY_EVENT_STORE_H
