#include <gtest/gtest.h>

#include "LightsOut.h"
#include "TestTime.h"

namespace {

LightEvent on(const std::string& lightId, const std::string& name, time_t when) {
  return makeLightEvent(lightId, name, EVENT_ON, "False", "True", when);
}

LightEvent off(const std::string& lightId, const std::string& name, time_t when) {
  return makeLightEvent(lightId, name, EVENT_OFF, "True", "False", when);
}

const Pattern* findPattern(const std::vector<Pattern>& patterns, PatternType type, const std::string& lightId) {
  for (size_t i = 0; i < patterns.size(); i++) {
    if (patterns[i].type == type && !patterns[i].lightIds.empty() && patterns[i].lightIds[0] == lightId) {
      return &patterns[i];
    }
  }
  return nullptr;
}

}

TEST(PatternMinerTest, EmptyInputGivesNoPatterns) {
  PatternMiner miner;
  EXPECT_TRUE(miner.analyze(std::vector<LightEvent>()).empty());
}

TEST(PatternMinerTest, WeeklyHabitOverFourWeeksHasFullConfidence) {
  std::vector<LightEvent> events;
  // 2025-02-03 is a Monday; fill 28 days so the window spans four of each weekday
  for (int day = 0; day < 28; day++) {
    events.push_back(on("9", "Porch", localDateTime(2025, 2, 3 + day, 12, 0)));
  }
  for (int week = 0; week < 4; week++) {
    events.push_back(on("1", "Kitchen", localDateTime(2025, 2, 3 + week * 7, 7, 10 + week)));
  }

  PatternMiner miner(3, 15, 0.7);
  std::vector<Pattern> patterns = miner.detectTimePatterns(events);

  const Pattern* kitchen = findPattern(patterns, PATTERN_TIME_BASED, "1");
  ASSERT_NE(kitchen, nullptr);
  EXPECT_DOUBLE_EQ(kitchen->confidence, 1.0);
  EXPECT_EQ(kitchen->occurrenceCount, 4);
  ASSERT_EQ(kitchen->weekdays.size(), 1u);
  EXPECT_EQ(kitchen->weekdays[0], 0);
  EXPECT_EQ(kitchen->timeStart, "07:00");
  EXPECT_EQ(kitchen->timeEnd, "07:59");
  EXPECT_EQ(kitchen->action.lightId, "1");
  EXPECT_EQ(kitchen->action.eventType, EVENT_ON);
  EXPECT_EQ(kitchen->description, "Kitchen turns on at 07:00 on Mondays");
}

TEST(PatternMinerTest, TimeGroupsBelowMinimumAreDropped) {
  std::vector<LightEvent> events;
  events.push_back(on("2", "Hall", localDateTime(2025, 2, 3, 8, 0)));
  events.push_back(on("2", "Hall", localDateTime(2025, 2, 10, 8, 5)));

  PatternMiner miner(3, 15, 0.0);
  EXPECT_TRUE(miner.detectTimePatterns(events).empty());
}

TEST(PatternMinerTest, SequenceDelayIsTruncatedMean) {
  std::vector<LightEvent> events;
  const int delays[] = {60, 90, 120};
  for (int i = 0; i < 3; i++) {
    time_t start = localDateTime(2025, 2, 3 + i, 18, 0);
    events.push_back(on("1", "Hall", start));
    events.push_back(on("2", "Kitchen", start + delays[i]));
  }

  PatternMiner miner(3, 15, 0.5);
  std::vector<Pattern> patterns = miner.analyze(events);

  ASSERT_EQ(patterns.size(), 1u);
  const Pattern& sequence = patterns[0];
  EXPECT_EQ(sequence.type, PATTERN_SEQUENCE);
  EXPECT_EQ(sequence.action.delaySeconds, 90);
  EXPECT_DOUBLE_EQ(sequence.confidence, 0.5);
  EXPECT_EQ(sequence.occurrenceCount, 3);
  EXPECT_EQ(sequence.action.trigger.lightId, "1");
  EXPECT_EQ(sequence.action.trigger.eventType, EVENT_ON);
  EXPECT_EQ(sequence.action.response.lightId, "2");
  EXPECT_EQ(sequence.action.response.eventType, EVENT_ON);
  EXPECT_TRUE(sequence.timeStart.empty());
  EXPECT_EQ(sequence.description, "When Hall turns on, Kitchen turns on within 90s");
}

TEST(PatternMinerTest, SequenceBelowThresholdIsFiltered) {
  std::vector<LightEvent> events;
  for (int i = 0; i < 3; i++) {
    time_t start = localDateTime(2025, 2, 3 + i, 18, 0);
    events.push_back(on("1", "Hall", start));
    events.push_back(on("2", "Kitchen", start + 10 + i));
  }

  PatternMiner strict(3, 15, 0.7);
  EXPECT_TRUE(strict.analyze(events).empty());

  PatternMiner lenient(3, 15, 0.5);
  std::vector<Pattern> patterns = lenient.detectSequencePatterns(events);
  ASSERT_EQ(patterns.size(), 1u);
  EXPECT_EQ(patterns[0].action.delaySeconds, 11);
}

TEST(PatternMinerTest, SequenceIgnoresPairsOutsideWindow) {
  std::vector<LightEvent> events;
  for (int i = 0; i < 4; i++) {
    time_t start = localDateTime(2025, 2, 3 + i, 18, 0);
    events.push_back(on("1", "Hall", start));
    events.push_back(on("2", "Kitchen", start + 16 * 60));
  }

  PatternMiner miner(3, 15, 0.0);
  EXPECT_TRUE(miner.detectSequencePatterns(events).empty());
}

TEST(PatternMinerTest, CorrelationIsReportedOncePerUnorderedPair) {
  std::vector<LightEvent> events;
  time_t first = localDateTime(2025, 2, 3, 23, 0);
  time_t second = localDateTime(2025, 2, 4, 23, 0);
  time_t third = localDateTime(2025, 2, 5, 23, 0);
  events.push_back(off("3", "Living room", first));
  events.push_back(off("4", "Dining room", first + 1));
  events.push_back(off("4", "Dining room", second));
  events.push_back(off("3", "Living room", second + 2));
  events.push_back(off("3", "Living room", third));
  events.push_back(off("4", "Dining room", third + 2));

  PatternMiner miner(3, 15, 0.3);
  std::vector<Pattern> patterns = miner.analyze(events);

  ASSERT_EQ(patterns.size(), 1u);
  const Pattern& correlation = patterns[0];
  EXPECT_EQ(correlation.type, PATTERN_CORRELATION);
  EXPECT_EQ(correlation.occurrenceCount, 3);
  EXPECT_NEAR(correlation.confidence, 1.0 / 3.0, 1e-9);
  ASSERT_EQ(correlation.action.lights.size(), 2u);
  EXPECT_EQ(correlation.action.lights[0], "3");
  EXPECT_EQ(correlation.action.lights[1], "4");
  EXPECT_EQ(correlation.action.eventType, EVENT_OFF);
  EXPECT_EQ(correlation.description, "Living room and Dining room turn off together");
}

TEST(PatternMinerTest, CorrelationNeedsMatchingEventTypes) {
  std::vector<LightEvent> events;
  for (int i = 0; i < 3; i++) {
    time_t when = localDateTime(2025, 2, 3 + i, 23, 0);
    events.push_back(off("3", "Living room", when));
    events.push_back(on("4", "Dining room", when + 1));
  }

  PatternMiner miner(3, 15, 0.0);
  EXPECT_TRUE(miner.detectCorrelationPatterns(events).empty());
}

TEST(PatternMinerTest, MinedPatternsRespectInvariants) {
  std::vector<LightEvent> events;
  for (int day = 0; day < 21; day++) {
    time_t morning = localDateTime(2025, 3, 3 + day, 6, 30);
    events.push_back(on("1", "Hall", morning));
    events.push_back(on("2", "Kitchen", morning + 30));
    events.push_back(on("5", "Bath", morning + 31));
    time_t night = localDateTime(2025, 3, 3 + day, 22, 15);
    events.push_back(off("2", "Kitchen", night));
    events.push_back(off("1", "Hall", night + 1));
  }

  PatternMiner miner(3, 15, 0.0);
  std::vector<Pattern> patterns = miner.analyze(events);
  ASSERT_FALSE(patterns.empty());
  for (size_t i = 0; i < patterns.size(); i++) {
    EXPECT_GE(patterns[i].confidence, 0.0);
    EXPECT_LE(patterns[i].confidence, 1.0);
    EXPECT_GE(patterns[i].occurrenceCount, 3);
  }
}

TEST(PatternMinerTest, SummaryListsPatternsByType) {
  PatternMiner miner;
  EXPECT_NE(miner.getPatternSummary(std::vector<Pattern>()).find("No patterns detected yet"), std::string::npos);

  Pattern pattern;
  pattern.type = PATTERN_SEQUENCE;
  pattern.description = "When Hall turns on, Kitchen turns on within 90s";
  pattern.confidence = 0.84;
  pattern.occurrenceCount = 12;

  std::string summary = miner.getPatternSummary(std::vector<Pattern>(1, pattern));
  EXPECT_NE(summary.find("Sequences:"), std::string::npos);
  EXPECT_NE(summary.find("confidence: 84%"), std::string::npos);
  EXPECT_NE(summary.find("seen 12 times"), std::string::npos);
  EXPECT_EQ(summary.find("Time based:"), std::string::npos);
}
