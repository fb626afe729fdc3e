#include "LightsOut.h"

#include <algorithm>
#include <cstdio>

// ===== LIGHTING PREDICTOR =====

LightingPredictor::LightingPredictor(EventStore& store, double minConfidence, int lookaheadMinutes)
  : store(store), minConfidence(minConfidence), lookaheadMinutes(lookaheadMinutes) {}

// Active patterns from the store; the last good list when the store is unavailable
std::vector<Pattern> LightingPredictor::loadPatterns() {
  std::vector<Pattern> patterns;
  bool loaded = store.loadActivePatterns(patterns);

  std::lock_guard<std::mutex> lock(cacheMutex);
  if (loaded) {
    cachedPatterns = patterns;
    return patterns;
  }
  DEBUG_WARN(PREDICTOR, "Pattern store unavailable, using " + std::to_string(cachedPatterns.size()) + " cached patterns");
  return cachedPatterns;
}

bool LightingPredictor::matchPattern(const Pattern& pattern, time_t now, Prediction& out) const {
  if (!pattern.weekdays.empty() && !weekdayAllowed(pattern.weekdays, mondayWeekday(now))) {
    return false;
  }

  if (!pattern.timeStart.empty()) {
    ClockTime start;
    if (parseClockTime(pattern.timeStart, start)) {
      // Forward only: the start must lie in [now, now + lookahead]
      double minutesAhead = difftime(localTimeAt(now, start.hour, start.minute), now) / 60.0;
      if (minutesAhead < 0 || minutesAhead > lookaheadMinutes) return false;
    } else {
      DEBUG_WARN(PREDICTOR, "Ignoring malformed start time '" + pattern.timeStart +
                            "' on pattern " + std::to_string(pattern.id));
    }
  }

  out.patternId = pattern.id;
  out.patternType = pattern.type;
  out.description = pattern.description;
  out.action = pattern.action;
  out.confidence = pattern.confidence;
  out.triggerTime = now;
  return true;
}

std::vector<Prediction> LightingPredictor::getPredictions(time_t now) {
  std::vector<Prediction> predictions;
  std::vector<Pattern> patterns = loadPatterns();

  for (const auto& pattern : patterns) {
    if (!pattern.isActive || pattern.confidence < minConfidence) continue;

    Prediction prediction;
    if (matchPattern(pattern, now, prediction)) {
      predictions.push_back(prediction);
    }
  }

  DEBUG_VERBOSE(PREDICTOR, std::to_string(predictions.size()) + " predictions at " + formatTimestamp(now));
  return predictions;
}

std::vector<Recommendation> LightingPredictor::getRecommendations(time_t now) {
  std::vector<Recommendation> recommendations;
  std::vector<Prediction> predictions = getPredictions(now);

  for (const auto& prediction : predictions) {
    if (prediction.confidence < RECOMMENDATION_CONFIDENCE) continue;

    Recommendation recommendation;
    recommendation.patternId = prediction.patternId;
    recommendation.patternType = prediction.patternType;
    recommendation.message = "Based on your habits: " + prediction.description;
    recommendation.confidence = prediction.confidence;
    recommendation.action = prediction.action;
    recommendations.push_back(recommendation);
  }

  return recommendations;
}

std::vector<ReactiveAction> LightingPredictor::shouldTriggerSequence(const std::string& lightId, LightEventType eventType) {
  std::vector<ReactiveAction> actions;
  std::vector<Pattern> patterns = loadPatterns();

  for (const auto& pattern : patterns) {
    if (pattern.type != PATTERN_SEQUENCE || !pattern.isActive) continue;
    if (pattern.confidence < minConfidence) continue;

    const EventRef& trigger = pattern.action.trigger;
    if (trigger.lightId != lightId || trigger.eventType != eventType) continue;

    ReactiveAction action;
    action.patternId = pattern.id;
    action.lightId = pattern.action.response.lightId;
    action.eventType = pattern.action.response.eventType;
    action.delaySeconds = pattern.action.delaySeconds;
    action.confidence = pattern.confidence;
    actions.push_back(action);
  }

  return actions;
}

std::shared_ptr<std::mutex> LightingPredictor::lockFor(int patternId) {
  std::lock_guard<std::mutex> lock(lockTableMutex);
  std::shared_ptr<std::mutex>& entry = patternLocks[patternId];
  if (!entry) entry = std::shared_ptr<std::mutex>(new std::mutex());
  return entry;
}

bool LightingPredictor::updatePatternFromFeedback(int patternId, bool wasCorrect) {
  std::shared_ptr<std::mutex> patternLock = lockFor(patternId);
  std::lock_guard<std::mutex> lock(*patternLock);

  Pattern pattern;
  if (!store.getPattern(patternId, pattern)) {
    DEBUG_WARN(PREDICTOR, "Feedback for unknown pattern " + std::to_string(patternId));
    return false;
  }

  if (wasCorrect) {
    pattern.confidence = std::min(1.0, pattern.confidence + FEEDBACK_POSITIVE_STEP);
  } else {
    pattern.confidence = std::max(0.0, pattern.confidence - FEEDBACK_NEGATIVE_STEP);
  }

  if (pattern.confidence < PATTERN_DEACTIVATE_BELOW && pattern.isActive) {
    pattern.isActive = false;
    addLog("Deactivated low-confidence pattern: " + pattern.description);
  }

  if (!store.updatePattern(pattern)) {
    DEBUG_ERROR(PREDICTOR, "Failed to store feedback for pattern " + std::to_string(patternId));
    return false;
  }

  char buf[64];
  snprintf(buf, sizeof(buf), "%.2f", pattern.confidence);
  DEBUG_INFO(PREDICTOR, "Pattern " + std::to_string(patternId) + (wasCorrect ? " confirmed" : " rejected") +
                        ", confidence now " + buf);
  return true;
}
