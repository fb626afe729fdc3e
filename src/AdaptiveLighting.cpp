#include "LightsOut.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>

// ===== ADAPTIVE LIGHTING =====

AdaptiveLightingController::AdaptiveLightingController(DeviceGateway& gateway, int pollIntervalMs,
                                                       int errorBackoffMs, bool spawnWorkers)
  : gateway(gateway),
    pollIntervalMs(pollIntervalMs),
    errorBackoffMs(errorBackoffMs),
    spawnWorkers(spawnWorkers),
    nextSessionId(1) {}

AdaptiveLightingController::~AdaptiveLightingController() {
  stopAll();
}

// Hue light-level sensors report 10000 * log10(lux) + 1
double AdaptiveLightingController::lightLevelToLux(int lightLevel) {
  if (lightLevel <= 0) return 0.0;
  return pow(10.0, (lightLevel - 1) / 10000.0);
}

int AdaptiveLightingController::computeBrightness(double targetLux, double currentLux, int currentBrightness,
                                                  int minBrightness, int maxBrightness, int step, bool& targetReached) {
  double diff = targetLux - currentLux;
  if (fabs(diff) < ADAPTIVE_LUX_TOLERANCE) {
    targetReached = true;
    return currentBrightness;
  }
  targetReached = false;

  double adjustment = std::max(-static_cast<double>(step), std::min(static_cast<double>(step), diff / 2.0));
  int next = currentBrightness + static_cast<int>(adjustment);
  return std::max(minBrightness, std::min(maxBrightness, next));
}

int AdaptiveLightingController::startSession(const AdaptiveParams& params) {
  if (params.sensorId.empty() || params.lightIds.empty()) {
    DEBUG_ERROR(ADAPTIVE, "Adaptive session needs a sensor and at least one light");
    return -1;
  }
  if (params.minBrightness > params.maxBrightness || params.step <= 0 || params.targetLux < 0) {
    DEBUG_ERROR(ADAPTIVE, "Invalid adaptive parameters for sensor " + params.sensorId);
    return -1;
  }

  // Only one loop may drive a sensor's lights
  std::vector<std::shared_ptr<AdaptiveSession> > replaced;
  {
    std::lock_guard<std::mutex> lock(tableMutex);
    std::map<int, std::shared_ptr<AdaptiveSession> >::iterator it = sessions.begin();
    while (it != sessions.end()) {
      if (it->second->params.sensorId == params.sensorId) {
        replaced.push_back(it->second);
        it = sessions.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (size_t i = 0; i < replaced.size(); i++) {
    DEBUG_INFO(ADAPTIVE, "Replacing adaptive session " + std::to_string(replaced[i]->status.sessionId) +
                         " on sensor " + params.sensorId);
    cancelAndJoin(replaced[i]);
  }

  std::shared_ptr<AdaptiveSession> session(new AdaptiveSession());
  session->params = params;
  session->status.sensorId = params.sensorId;
  session->status.lightIds = params.lightIds;
  session->status.targetLux = params.targetLux;
  session->status.status = ADAPTIVE_STARTING;
  session->status.startedAt = time(nullptr);

  int sessionId;
  {
    std::lock_guard<std::mutex> lock(tableMutex);
    sessionId = nextSessionId++;
  }
  session->status.sessionId = sessionId;

  // The worker exists before the session becomes visible to stopSession()
  if (spawnWorkers) {
    session->worker = std::thread(&AdaptiveLightingController::sessionLoop, this, session);
  }

  {
    std::lock_guard<std::mutex> lock(tableMutex);
    sessions[sessionId] = session;
  }

  addLog("Adaptive lighting started on sensor " + params.sensorId + " for lights " + joinIds(params.lightIds) +
         " (target " + std::to_string(static_cast<int>(params.targetLux)) + " lux)");
  return sessionId;
}

void AdaptiveLightingController::cancelAndJoin(const std::shared_ptr<AdaptiveSession>& session) {
  {
    std::lock_guard<std::mutex> lock(session->wakeMutex);
    session->cancelled = true;
  }
  session->wakeSignal.notify_all();
  if (session->worker.joinable()) session->worker.join();

  std::lock_guard<std::mutex> lock(session->statusMutex);
  session->status.status = ADAPTIVE_STOPPED;
}

int AdaptiveLightingController::stopSession(int sessionId) {
  std::shared_ptr<AdaptiveSession> session;
  {
    std::lock_guard<std::mutex> lock(tableMutex);
    std::map<int, std::shared_ptr<AdaptiveSession> >::iterator it = sessions.find(sessionId);
    if (it == sessions.end()) return 0;
    session = it->second;
    sessions.erase(it);
  }
  cancelAndJoin(session);
  addLog("Adaptive lighting stopped: session " + std::to_string(sessionId));
  return 1;
}

int AdaptiveLightingController::stopAll() {
  std::map<int, std::shared_ptr<AdaptiveSession> > stopping;
  {
    std::lock_guard<std::mutex> lock(tableMutex);
    stopping.swap(sessions);
  }
  for (std::map<int, std::shared_ptr<AdaptiveSession> >::iterator it = stopping.begin(); it != stopping.end(); ++it) {
    cancelAndJoin(it->second);
  }
  if (!stopping.empty()) {
    addLog("Adaptive lighting stopped: " + std::to_string(stopping.size()) + " sessions");
  }
  return static_cast<int>(stopping.size());
}

std::vector<AdaptiveSessionStatus> AdaptiveLightingController::getStatus() const {
  std::vector<std::shared_ptr<AdaptiveSession> > snapshot;
  {
    std::lock_guard<std::mutex> lock(tableMutex);
    for (std::map<int, std::shared_ptr<AdaptiveSession> >::const_iterator it = sessions.begin(); it != sessions.end(); ++it) {
      snapshot.push_back(it->second);
    }
  }

  std::vector<AdaptiveSessionStatus> result;
  for (size_t i = 0; i < snapshot.size(); i++) {
    std::lock_guard<std::mutex> lock(snapshot[i]->statusMutex);
    result.push_back(snapshot[i]->status);
  }
  return result;
}

size_t AdaptiveLightingController::activeCount() const {
  std::lock_guard<std::mutex> lock(tableMutex);
  return sessions.size();
}

bool AdaptiveLightingController::runIteration(int sessionId) {
  std::shared_ptr<AdaptiveSession> session;
  {
    std::lock_guard<std::mutex> lock(tableMutex);
    std::map<int, std::shared_ptr<AdaptiveSession> >::iterator it = sessions.find(sessionId);
    if (it == sessions.end()) return false;
    session = it->second;
  }
  return iterate(*session);
}

void AdaptiveLightingController::sessionLoop(std::shared_ptr<AdaptiveSession> session) {
  while (!session->cancelled) {
    bool ok = iterate(*session);

    std::unique_lock<std::mutex> lock(session->wakeMutex);
    int waitMs = ok ? pollIntervalMs : errorBackoffMs;
    session->wakeSignal.wait_for(lock, std::chrono::milliseconds(waitMs),
                                 [&session] { return session->cancelled.load(); });
  }
}

bool AdaptiveLightingController::iterate(AdaptiveSession& session) {
  const AdaptiveParams& params = session.params;
  std::string error;
  int commands = 0;
  double lux = 0.0;
  int currentBrightness = 0;
  int newBrightness = 0;
  bool targetReached = false;

  try {
    int lightLevel = 0;
    std::map<std::string, DeviceState> states;

    if (!gateway.readLightLevel(params.sensorId, lightLevel)) {
      error = "Sensor " + params.sensorId + " unavailable";
    } else if (!gateway.readStates(states)) {
      error = "Light states unavailable";
    } else {
      lux = lightLevelToLux(lightLevel);

      int found = 0;
      for (const auto& lightId : params.lightIds) {
        std::map<std::string, DeviceState>::const_iterator it = states.find(lightId);
        if (it == states.end()) continue;
        if (found == 0) currentBrightness = it->second.isOn ? it->second.brightness : 0;
        found++;
      }

      if (found == 0) {
        error = "None of the session lights are known to the gateway";
      } else {
        newBrightness = computeBrightness(params.targetLux, lux, currentBrightness,
                                          params.minBrightness, params.maxBrightness, params.step, targetReached);

        if (!targetReached && newBrightness != currentBrightness) {
          LightCommand command = makeBrightnessCommand(newBrightness);
          command.hasOn = true;
          command.on = true;

          int failed = 0;
          for (const auto& lightId : params.lightIds) {
            if (gateway.setState(TARGET_LIGHT, lightId, command)) {
              commands++;
            } else {
              failed++;
            }
          }
          if (failed > 0) {
            error = std::to_string(failed) + " of " + std::to_string(params.lightIds.size()) + " lights did not accept brightness";
          }
        }
      }
    }
  } catch (const std::exception& e) {
    error = std::string("Adaptive iteration failed: ") + e.what();
  }

  std::lock_guard<std::mutex> lock(session.statusMutex);
  AdaptiveSessionStatus& status = session.status;
  status.iterations++;
  status.commandsSent += commands;

  if (!error.empty()) {
    status.status = ADAPTIVE_ERROR;
    status.lastError = error;
    DEBUG_WARN(ADAPTIVE, "Session " + std::to_string(status.sessionId) + ": " + error);
    return false;
  }

  status.currentLux = lux;
  status.lastError.clear();
  if (targetReached) {
    status.status = ADAPTIVE_TARGET_REACHED;
    status.currentBrightness = currentBrightness;
  } else {
    status.status = ADAPTIVE_ADJUSTING;
    status.currentBrightness = newBrightness;
    DEBUG_VERBOSE(ADAPTIVE, "Session " + std::to_string(status.sessionId) + ": brightness " +
                            std::to_string(currentBrightness) + " -> " + std::to_string(newBrightness));
  }
  return true;
}
