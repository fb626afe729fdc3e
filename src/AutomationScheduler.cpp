#include "LightsOut.h"

#include <algorithm>

// ===== AUTOMATION SCHEDULER =====

AutomationScheduler::AutomationScheduler(EventStore& store, DeviceGateway& gateway,
                                         TaskScheduler& scheduler, const SunCalculator& sun)
  : store(store), gateway(gateway), scheduler(scheduler), sun(sun), nextSunToken(0) {}

AutomationScheduler::~AutomationScheduler() {
  clear();
}

int AutomationScheduler::reload() {
  return reload(time(nullptr));
}

int AutomationScheduler::reload(time_t now) {
  std::vector<Automation> automations;
  bool loaded = store.loadEnabledAutomations(automations);

  std::lock_guard<std::mutex> lock(registryMutex);
  if (!loaded) {
    DEBUG_ERROR(AUTOMATION, "Automation store unavailable, keeping " + std::to_string(jobs.size()) + " scheduled jobs");
    return -1;
  }

  for (std::map<int, int>::const_iterator it = jobs.begin(); it != jobs.end(); ++it) {
    scheduler.cancel(it->second);
  }
  jobs.clear();
  sunAutomations.clear();
  sunTokens.clear();

  int scheduled = 0;
  for (const auto& automation : automations) {
    if (scheduleLocked(automation, now)) scheduled++;
  }

  addLog("Loaded " + std::to_string(automations.size()) + " automations, " + std::to_string(scheduled) + " scheduled");
  return scheduled;
}

bool AutomationScheduler::scheduleAutomation(const Automation& automation, time_t now) {
  std::lock_guard<std::mutex> lock(registryMutex);
  return scheduleLocked(automation, now);
}

bool AutomationScheduler::unscheduleAutomation(int automationId) {
  std::lock_guard<std::mutex> lock(registryMutex);
  bool existed = jobs.find(automationId) != jobs.end();
  unscheduleLocked(automationId);
  return existed;
}

void AutomationScheduler::clear() {
  std::lock_guard<std::mutex> lock(registryMutex);
  for (std::map<int, int>::const_iterator it = jobs.begin(); it != jobs.end(); ++it) {
    scheduler.cancel(it->second);
  }
  jobs.clear();
  sunAutomations.clear();
  sunTokens.clear();
}

void AutomationScheduler::unscheduleLocked(int automationId) {
  std::map<int, int>::iterator it = jobs.find(automationId);
  if (it != jobs.end()) {
    scheduler.cancel(it->second);
    jobs.erase(it);
  }
  sunAutomations.erase(automationId);
  sunTokens.erase(automationId);
}

bool AutomationScheduler::scheduleLocked(const Automation& automation, time_t now) {
  if (!automation.isEnabled) {
    DEBUG_VERBOSE(AUTOMATION, "Skipping disabled automation " + std::to_string(automation.id));
    return false;
  }

  // Replace, never duplicate
  unscheduleLocked(automation.id);

  switch (automation.trigger.type) {
    case TRIGGER_TIME:
      return scheduleTimeTrigger(automation, now);
    case TRIGGER_SUNRISE:
    case TRIGGER_SUNSET:
      return scheduleSunTrigger(automation, now);
    case TRIGGER_MANUAL:
    default:
      return false;
  }
}

bool AutomationScheduler::scheduleTimeTrigger(const Automation& automation, time_t now) {
  RecurringSpec spec;
  spec.hour = automation.trigger.time.hour;
  spec.minute = automation.trigger.time.minute;
  spec.weekdays = automation.trigger.weekdays;

  int automationId = automation.id;
  int jobId = scheduler.scheduleRecurring(spec, [this, automationId]() {
    execute(automationId);
  }, now);
  if (jobId < 0) return false;

  jobs[automation.id] = jobId;
  DEBUG_INFO(AUTOMATION, "Scheduled automation '" + automation.name + "' at " +
                         formatClockTime(automation.trigger.time));
  return true;
}

time_t AutomationScheduler::nextSunFireTime(const AutomationTrigger& trigger, time_t now) const {
  // Each candidate day uses that day's own sun time
  for (int offset = 0; offset <= 7; offset++) {
    time_t day = addLocalDays(now, offset);
    if (!weekdayAllowed(trigger.weekdays, mondayWeekday(day))) continue;

    ClockTime sunTime = trigger.type == TRIGGER_SUNRISE ? sun.getSunrise(day) : sun.getSunset(day);
    time_t fireAt = localTimeAt(day, sunTime.hour, sunTime.minute) + trigger.offsetMinutes * 60;
    if (fireAt > now) return fireAt;
  }
  return 0;
}

bool AutomationScheduler::scheduleSunTrigger(const Automation& automation, time_t now) {
  time_t fireAt = nextSunFireTime(automation.trigger, now);
  if (fireAt == 0) {
    DEBUG_ERROR(AUTOMATION, "No upcoming " + triggerTypeName(automation.trigger.type) +
                            " for automation " + std::to_string(automation.id));
    return false;
  }

  int automationId = automation.id;
  unsigned long token = ++nextSunToken;
  int jobId = scheduler.scheduleOnce(fireAt, [this, automationId, token, fireAt]() {
    onSunJobFired(automationId, token, fireAt);
  });

  jobs[automation.id] = jobId;
  sunAutomations[automation.id] = automation;
  sunTokens[automation.id] = token;
  DEBUG_INFO(AUTOMATION, "Scheduled automation '" + automation.name + "' at " + triggerTypeName(automation.trigger.type) +
                         " (" + formatTimestamp(fireAt) + ", offset " + std::to_string(automation.trigger.offsetMinutes) + "min)");
  return true;
}

void AutomationScheduler::onSunJobFired(int automationId, unsigned long token, time_t firedAt) {
  execute(automationId);

  // Book the next day with its own sun time, unless a reload or reschedule replaced this job meanwhile
  std::lock_guard<std::mutex> lock(registryMutex);
  std::map<int, unsigned long>::const_iterator current = sunTokens.find(automationId);
  if (current == sunTokens.end() || current->second != token) return;
  std::map<int, Automation>::const_iterator it = sunAutomations.find(automationId);
  if (it == sunAutomations.end()) return;

  Automation automation = it->second;
  jobs.erase(automationId);
  scheduleSunTrigger(automation, firedAt);
}

time_t AutomationScheduler::nextFireTime(int automationId) const {
  std::lock_guard<std::mutex> lock(registryMutex);
  std::map<int, int>::const_iterator it = jobs.find(automationId);
  if (it == jobs.end()) return 0;
  return scheduler.nextRunTime(it->second);
}

size_t AutomationScheduler::scheduledCount() const {
  std::lock_guard<std::mutex> lock(registryMutex);
  return jobs.size();
}

int AutomationScheduler::applyCommand(TargetType targetType, const std::vector<std::string>& targetIds,
                                      const LightCommand& command) {
  int succeeded = 0;
  for (const auto& targetId : targetIds) {
    if (gateway.setState(targetType, targetId, command)) {
      succeeded++;
      DEBUG_VERBOSE(AUTOMATION, "Executed action on " + targetTypeName(targetType) + " " + targetId);
    } else {
      DEBUG_ERROR(AUTOMATION, "Failed to execute action on " + targetTypeName(targetType) + " " + targetId);
    }
  }
  return succeeded;
}

AutomationResult AutomationScheduler::execute(int automationId) {
  return execute(automationId, time(nullptr));
}

AutomationResult AutomationScheduler::execute(int automationId, time_t now) {
  AutomationResult result;
  result.automationId = automationId;

  Automation automation;
  if (!store.getAutomation(automationId, automation)) {
    result.reason = "Automation not found";
    DEBUG_WARN(AUTOMATION, "Automation " + std::to_string(automationId) + " not found");
    return result;
  }
  result.automationName = automation.name;

  if (!automation.isEnabled) {
    result.reason = "Automation disabled";
    DEBUG_WARN(AUTOMATION, "Automation " + std::to_string(automationId) + " is disabled");
    return result;
  }

  addLog("Executing automation: " + automation.name);

  const AutomationTarget target = automation.target;
  result.totalTargets = static_cast<int>(target.ids.size());

  int immediateSteps = 0;
  if (automation.action.type == ACTION_SEQUENCE) {
    for (const auto& step : automation.action.sequence) {
      if (step.delaySeconds > 0) {
        LightCommand command = step.command;
        scheduler.scheduleOnce(now + step.delaySeconds, [this, target, command]() {
          applyCommand(target.type, target.ids, command);
        });
        result.stepsScheduled++;
      } else {
        // The weakest immediate step is what gets reported
        int succeeded = applyCommand(target.type, target.ids, step.command);
        result.targetsSucceeded = immediateSteps == 0 ? succeeded : std::min(result.targetsSucceeded, succeeded);
        immediateSteps++;
      }
    }
    DEBUG_INFO(AUTOMATION, "Scheduled " + std::to_string(result.stepsScheduled) + " delayed steps for '" + automation.name + "'");
  } else {
    result.targetsSucceeded = applyCommand(target.type, target.ids, automation.action.command);
    immediateSteps = 1;
  }

  if (!store.recordTrigger(automationId, now)) {
    DEBUG_WARN(AUTOMATION, "Could not record trigger for automation " + std::to_string(automationId));
  }

  if (immediateSteps > 0 && result.totalTargets > 0 && result.targetsSucceeded < result.totalTargets) {
    result.success = false;
    result.reason = std::to_string(result.targetsSucceeded) + " of " + std::to_string(result.totalTargets) + " targets updated";
  } else {
    result.success = true;
    result.reason = "ok";
  }
  return result;
}
