#include "LightsOutService.h"

#include "JsonCodec.h"

// ===== LIGHTSOUT SERVICE =====

LightsOutService::LightsOutService(const LightsOutConfig& config, DeviceGateway& gateway, bool spawnAdaptiveWorkers)
  : config(config),
    gateway(gateway),
    sun(config.latitude, config.longitude),
    miner(config.minOccurrences, config.timeWindowMinutes, config.confidenceThreshold),
    predictor(store, config.minConfidence, config.lookaheadMinutes),
    eventLogger(store),
    automations(store, gateway, scheduler, sun),
    adaptive(gateway, config.adaptivePollMs, config.adaptiveBackoffMs, spawnAdaptiveWorkers),
    running(false),
    gatewayReachable(false) {
  if (config.timezoneMode == SUN_TZ_FIXED) {
    sun.setFixedOffset(config.utcOffsetMinutes);
  } else {
    sun.useLocalTimezone();
  }
}

LightsOutService::~LightsOutService() {
  end();
}

MiningResult LightsOutService::minePatterns(int daysBack) {
  return minePatterns(daysBack, time(nullptr));
}

MiningResult LightsOutService::minePatterns(int daysBack, time_t now) {
  MiningResult result;
  addLog("Running pattern analysis over " + std::to_string(daysBack) + " days");

  EventQuery query;
  query.start = now - static_cast<time_t>(daysBack) * 24 * 3600;
  query.end = now;
  query.limit = config.eventQueryLimit;

  std::vector<LightEvent> events;
  if (!store.queryEvents(query, events)) {
    result.reason = "Event store unavailable";
    DEBUG_ERROR(MINER, "Pattern analysis aborted: event store unavailable");
    return result;
  }
  DEBUG_INFO(MINER, "Analyzing " + std::to_string(events.size()) + " events");

  result.patterns = miner.analyze(events);
  for (auto& pattern : result.patterns) {
    int id = store.savePattern(pattern);
    if (id < 0) {
      DEBUG_ERROR(STORE, "Failed to save pattern: " + pattern.description);
      continue;
    }
    pattern.id = id;
    result.saved++;
  }

  int total = static_cast<int>(result.patterns.size());
  if (result.saved < total) {
    result.reason = std::to_string(result.saved) + " of " + std::to_string(total) + " patterns saved";
  } else {
    result.success = true;
    result.reason = "ok";
  }

  addLog("Pattern analysis found " + std::to_string(total) + " patterns");
  DEBUG_INFO(MINER, miner.getPatternSummary(result.patterns));
  return result;
}

std::vector<Prediction> LightsOutService::getPredictions(time_t now) {
  return predictor.getPredictions(now);
}

std::vector<Recommendation> LightsOutService::getRecommendations(time_t now) {
  return predictor.getRecommendations(now);
}

std::vector<ReactiveAction> LightsOutService::shouldTriggerSequence(const std::string& lightId, LightEventType eventType) {
  return predictor.shouldTriggerSequence(lightId, eventType);
}

bool LightsOutService::submitFeedback(int patternId, bool wasCorrect) {
  return predictor.updatePatternFromFeedback(patternId, wasCorrect);
}

int LightsOutService::reloadAutomations() {
  return automations.reload();
}

AutomationResult LightsOutService::executeAutomation(int automationId) {
  return automations.execute(automationId);
}

int LightsOutService::startAdaptive(const AdaptiveParams& params) {
  return adaptive.startSession(params);
}

int LightsOutService::stopAdaptive(int sessionId) {
  if (sessionId < 0) return adaptive.stopAll();
  return adaptive.stopSession(sessionId);
}

std::vector<AdaptiveSessionStatus> LightsOutService::adaptiveStatus() const {
  return adaptive.getStatus();
}

int LightsOutService::loadAutomations() {
  std::vector<Automation> definitions;
  if (!loadAutomationsFile(config.automationsFile, definitions)) {
    return 0;
  }

  int added = 0;
  for (const auto& automation : definitions) {
    if (store.addAutomation(automation) >= 0) {
      added++;
    } else {
      DEBUG_ERROR(STORE, "Failed to store automation '" + automation.name + "'");
    }
  }
  DEBUG_INFO(SERVICE, "Loaded " + std::to_string(added) + " automation definitions from " + config.automationsFile);
  return added;
}

bool LightsOutService::begin() {
  return begin(time(nullptr), true);
}

bool LightsOutService::begin(time_t now, bool startWorker) {
  if (running) return true;
  addLog("Starting LightsOut");

  // First snapshot; later polls diff against it
  if (pollNow(now) < 0) {
    DEBUG_ERROR(SERVICE, "Light gateway unreachable, not starting");
    return false;
  }

  automations.reload(now);

  driverJobs.push_back(scheduler.scheduleInterval(config.pollIntervalSeconds, [this]() {
    pollNow(time(nullptr));
  }, now));

  RecurringSpec analysis;
  analysis.hour = config.analysisHour;
  analysis.minute = 0;
  int days = config.analysisWindowDays;
  driverJobs.push_back(scheduler.scheduleRecurring(analysis, [this, days]() {
    minePatterns(days);
  }, now));

  RecurringSpec cleanup;
  cleanup.hour = 4;
  cleanup.minute = 0;
  cleanup.weekdays.push_back(6); // Sunday
  driverJobs.push_back(scheduler.scheduleRecurring(cleanup, [this]() {
    cleanupNow(time(nullptr));
  }, now));

  if (startWorker) scheduler.begin();
  running = true;

  StoreStatistics stats;
  if (store.getStatistics(stats)) {
    addLog("Service started. Polling every " + std::to_string(config.pollIntervalSeconds) + "s, " +
           std::to_string(stats.totalEvents) + " events, " + std::to_string(stats.activePatterns) + " active patterns");
  }
  return true;
}

void LightsOutService::end() {
  if (!running) return;
  addLog("Shutting down LightsOut");

  adaptive.stopAll();
  scheduler.end();
  for (size_t i = 0; i < driverJobs.size(); i++) {
    scheduler.cancel(driverJobs[i]);
  }
  driverJobs.clear();
  automations.clear();
  running = false;
}

int LightsOutService::pollNow(time_t now) {
  bool ok = false;
  std::vector<LightEvent> events = eventLogger.pollOnce(gateway, now, ok);
  gatewayReachable = ok;
  if (!ok) return -1;

  if (config.automationEnabled) {
    for (const auto& event : events) {
      handleSequenceReactions(event, now);
    }
  }
  return static_cast<int>(events.size());
}

void LightsOutService::handleSequenceReactions(const LightEvent& event, time_t now) {
  std::vector<ReactiveAction> actions = predictor.shouldTriggerSequence(event.lightId, event.eventType);

  for (const auto& action : actions) {
    if (action.eventType != EVENT_ON && action.eventType != EVENT_OFF) continue;

    std::string summary = "light " + action.lightId + " " + eventTypeName(action.eventType) +
                          " in " + std::to_string(action.delaySeconds) + "s (pattern " +
                          std::to_string(action.patternId) + ")";
    if (config.dryRun) {
      addLog("[DRY RUN] Would trigger: " + summary);
      continue;
    }

    std::string lightId = action.lightId;
    LightCommand command = makePowerCommand(action.eventType == EVENT_ON);
    scheduler.scheduleOnce(now + action.delaySeconds, [this, lightId, command, summary]() {
      if (gateway.setState(TARGET_LIGHT, lightId, command)) {
        addLog("Triggered automation: " + summary);
      } else {
        DEBUG_ERROR(SERVICE, "Failed to trigger " + summary);
      }
    });
  }
}

int LightsOutService::cleanupNow(time_t now) {
  addLog("Cleaning up data older than " + std::to_string(config.retentionDays) + " days");
  int deleted = store.cleanupOldEvents(config.retentionDays, now);
  if (deleted < 0) {
    DEBUG_ERROR(STORE, "Event cleanup failed: store unavailable");
  }
  return deleted;
}

std::string LightsOutService::getSunTimes(time_t date) const {
  return sunTimesToJson(sun.getSunrise(date), sun.getSunset(date), date);
}

std::string LightsOutService::getPatternSummary() {
  std::vector<Pattern> patterns;
  if (!store.loadActivePatterns(patterns)) {
    return "Pattern store unavailable";
  }
  return miner.getPatternSummary(patterns);
}

std::string LightsOutService::getStatusJson() {
  DynamicJsonDocument doc(2048);
  doc["running"] = running.load();
  doc["gateway_connected"] = gatewayReachable.load();

  StoreStatistics stats;
  JsonObject database = doc.createNestedObject("database_stats");
  if (store.getStatistics(stats)) {
    database["total_events"] = stats.totalEvents;
    database["total_patterns"] = stats.totalPatterns;
    database["active_patterns"] = stats.activePatterns;
    database["automations"] = stats.automations;
    if (stats.oldestEvent > 0) database["oldest_event"] = formatTimestamp(stats.oldestEvent);
    if (stats.newestEvent > 0) database["newest_event"] = formatTimestamp(stats.newestEvent);
  } else {
    database["error"] = "store unavailable";
  }

  doc["events_this_session"] = eventLogger.getTotalEventsLogged();
  doc["scheduled_automations"] = automations.scheduledCount();
  doc["adaptive_sessions"] = adaptive.activeCount();
  doc["automation_enabled"] = config.automationEnabled;
  doc["dry_run"] = config.dryRun;

  std::string json;
  serializeJson(doc, json);
  return json;
}
