#include <gtest/gtest.h>

#include "LightsOut.h"
#include "MemoryEventStore.h"
#include "TestTime.h"

namespace {

Pattern kitchenMorning(double confidence) {
  Pattern pattern;
  pattern.type = PATTERN_TIME_BASED;
  pattern.description = "Kitchen turns on at 07:00 on Mondays";
  pattern.lightIds.push_back("1");
  pattern.weekdays.push_back(0);
  pattern.timeStart = "07:00";
  pattern.timeEnd = "07:59";
  pattern.action.lightId = "1";
  pattern.action.eventType = EVENT_ON;
  pattern.confidence = confidence;
  pattern.occurrenceCount = 4;
  return pattern;
}

}

class MemoryEventStoreTest : public ::testing::Test {
protected:
  MemoryEventStore store;
  time_t base;

  MemoryEventStoreTest() : base(localDateTime(2025, 2, 3, 7, 0)) {}

  void addEvent(const std::string& lightId, LightEventType type, time_t when) {
    ASSERT_TRUE(store.appendEvent(makeLightEvent(lightId, "Light " + lightId, type, "", "", when)));
  }
};

TEST_F(MemoryEventStoreTest, QueryFiltersAndOrdersNewestFirst) {
  addEvent("1", EVENT_ON, base);
  addEvent("2", EVENT_ON, base + 10);
  addEvent("1", EVENT_OFF, base + 20);
  addEvent("1", EVENT_ON, base + 30);

  std::vector<LightEvent> events;
  EventQuery all;
  ASSERT_TRUE(store.queryEvents(all, events));
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].timestamp, base + 30);
  EXPECT_EQ(events[3].timestamp, base);
  EXPECT_GT(events[0].id, 0);

  EventQuery kitchenOn;
  kitchenOn.lightId = "1";
  kitchenOn.eventType = EVENT_ON;
  ASSERT_TRUE(store.queryEvents(kitchenOn, events));
  EXPECT_EQ(events.size(), 2u);

  EventQuery window;
  window.start = base + 10;
  window.end = base + 20;
  ASSERT_TRUE(store.queryEvents(window, events));
  EXPECT_EQ(events.size(), 2u);

  EventQuery limited;
  limited.limit = 1;
  ASSERT_TRUE(store.queryEvents(limited, events));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].timestamp, base + 30);
}

TEST_F(MemoryEventStoreTest, SavingSamePatternRefreshesExistingRecord) {
  int id = store.savePattern(kitchenMorning(0.75));
  ASSERT_GT(id, 0);

  Pattern adjusted;
  ASSERT_TRUE(store.getPattern(id, adjusted));
  adjusted.confidence = 0.9;
  ASSERT_TRUE(store.updatePattern(adjusted));

  Pattern remined = kitchenMorning(0.8);
  remined.occurrenceCount = 5;
  remined.lastSeen = base;
  EXPECT_EQ(store.savePattern(remined), id);

  Pattern stored;
  ASSERT_TRUE(store.getPattern(id, stored));
  EXPECT_DOUBLE_EQ(stored.confidence, 0.9);
  EXPECT_EQ(stored.occurrenceCount, 5);
  EXPECT_EQ(stored.lastSeen, base);
  EXPECT_EQ(store.allPatterns().size(), 1u);

  Pattern otherDay = kitchenMorning(0.8);
  otherDay.weekdays[0] = 1;
  EXPECT_NE(store.savePattern(otherDay), id);
}

TEST_F(MemoryEventStoreTest, InactivePatternsAreNotLoaded) {
  int id = store.savePattern(kitchenMorning(0.75));
  Pattern pattern;
  ASSERT_TRUE(store.getPattern(id, pattern));
  pattern.isActive = false;
  ASSERT_TRUE(store.updatePattern(pattern));

  std::vector<Pattern> active;
  ASSERT_TRUE(store.loadActivePatterns(active));
  EXPECT_TRUE(active.empty());

  // Re-mining a retired pattern refreshes it but keeps it retired
  Pattern remined = kitchenMorning(0.75);
  remined.occurrenceCount = 12;
  EXPECT_EQ(store.savePattern(remined), id);
  ASSERT_TRUE(store.loadActivePatterns(active));
  EXPECT_TRUE(active.empty());
  ASSERT_TRUE(store.getPattern(id, pattern));
  EXPECT_FALSE(pattern.isActive);
  EXPECT_EQ(pattern.occurrenceCount, 12);
}

TEST_F(MemoryEventStoreTest, CleanupRemovesEventsPastRetention) {
  addEvent("1", EVENT_ON, base - 100 * 24 * 3600);
  addEvent("1", EVENT_ON, base - 10 * 24 * 3600);
  addEvent("1", EVENT_ON, base);

  EXPECT_EQ(store.cleanupOldEvents(90, base), 1);
  EXPECT_EQ(store.cleanupOldEvents(90, base), 0);

  StoreStatistics stats;
  ASSERT_TRUE(store.getStatistics(stats));
  EXPECT_EQ(stats.totalEvents, 2);
  EXPECT_EQ(stats.oldestEvent, base - 10 * 24 * 3600);
  EXPECT_EQ(stats.newestEvent, base);
}

TEST_F(MemoryEventStoreTest, StatisticsCountEverything) {
  addEvent("1", EVENT_ON, base);
  store.savePattern(kitchenMorning(0.75));
  Automation automation;
  automation.name = "All off";
  store.addAutomation(automation);

  StoreStatistics stats;
  ASSERT_TRUE(store.getStatistics(stats));
  EXPECT_EQ(stats.totalEvents, 1);
  EXPECT_EQ(stats.totalPatterns, 1);
  EXPECT_EQ(stats.activePatterns, 1);
  EXPECT_EQ(stats.automations, 1);
}

TEST_F(MemoryEventStoreTest, AutomationTriggersAreRecorded) {
  Automation automation;
  automation.id = 12;
  automation.name = "Evening";
  EXPECT_EQ(store.addAutomation(automation), 12);

  Automation unnumbered;
  unnumbered.name = "Night";
  EXPECT_EQ(store.addAutomation(unnumbered), 13);

  ASSERT_TRUE(store.recordTrigger(12, base));
  Automation stored;
  ASSERT_TRUE(store.getAutomation(12, stored));
  EXPECT_EQ(stored.triggerCount, 1);
  EXPECT_EQ(stored.lastTriggered, base);
  EXPECT_FALSE(store.recordTrigger(99, base));

  ASSERT_TRUE(store.setAutomationEnabled(13, false));
  std::vector<Automation> enabled;
  ASSERT_TRUE(store.loadEnabledAutomations(enabled));
  ASSERT_EQ(enabled.size(), 1u);
  EXPECT_EQ(enabled[0].id, 12);

  EXPECT_TRUE(store.removeAutomation(12));
  EXPECT_FALSE(store.getAutomation(12, stored));
}

TEST_F(MemoryEventStoreTest, UnavailableStoreFailsEveryCall) {
  store.setAvailable(false);

  std::vector<LightEvent> events;
  std::vector<Pattern> patterns;
  StoreStatistics stats;
  EXPECT_FALSE(store.appendEvent(makeLightEvent("1", "Kitchen", EVENT_ON, "False", "True", base)));
  EXPECT_FALSE(store.queryEvents(EventQuery(), events));
  EXPECT_EQ(store.savePattern(kitchenMorning(0.8)), -1);
  EXPECT_FALSE(store.loadActivePatterns(patterns));
  EXPECT_EQ(store.cleanupOldEvents(90, base), -1);
  EXPECT_FALSE(store.getStatistics(stats));

  store.setAvailable(true);
  EXPECT_TRUE(store.queryEvents(EventQuery(), events));
}
