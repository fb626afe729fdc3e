#ifndef LIGHTS_OUT_SERVICE_H
#define LIGHTS_OUT_SERVICE_H

#include "Config.h"
#include "LightsOut.h"
#include "MemoryEventStore.h"

// Wires the components together and drives them from one TaskScheduler
class LightsOutService {
private:
  LightsOutConfig config;
  DeviceGateway& gateway;

  MemoryEventStore store;
  SunCalculator sun;
  PatternMiner miner;
  LightingPredictor predictor;
  EventLogger eventLogger;
  TaskScheduler scheduler;
  AutomationScheduler automations;
  AdaptiveLightingController adaptive;

  std::atomic<bool> running;
  std::atomic<bool> gatewayReachable;
  std::vector<int> driverJobs;

  void handleSequenceReactions(const LightEvent& event, time_t now);

public:
  LightsOutService(const LightsOutConfig& config, DeviceGateway& gateway, bool spawnAdaptiveWorkers = true);
  ~LightsOutService();

  // ===== Exposed operations =====
  MiningResult minePatterns(int daysBack);
  MiningResult minePatterns(int daysBack, time_t now);
  std::vector<Prediction> getPredictions(time_t now);
  std::vector<Recommendation> getRecommendations(time_t now);
  std::vector<ReactiveAction> shouldTriggerSequence(const std::string& lightId, LightEventType eventType);
  bool submitFeedback(int patternId, bool wasCorrect);
  int reloadAutomations();
  AutomationResult executeAutomation(int automationId);
  int startAdaptive(const AdaptiveParams& params);
  int stopAdaptive(int sessionId = -1); // -1 stops every session
  std::vector<AdaptiveSessionStatus> adaptiveStatus() const;

  // ===== Lifecycle =====
  int loadAutomations();
  bool begin();
  bool begin(time_t now, bool startWorker);
  void end();
  bool isRunning() const { return running; }

  // One gateway poll; returns the number of new events, -1 when the gateway is unreachable
  int pollNow(time_t now);
  int cleanupNow(time_t now);

  std::string getSunTimes(time_t date) const;
  std::string getStatusJson();
  std::string getPatternSummary();

  MemoryEventStore& getStore() { return store; }
  TaskScheduler& getScheduler() { return scheduler; }
  AutomationScheduler& getAutomationScheduler() { return automations; }
  const LightsOutConfig& getConfig() const { return config; }
};

#endif // LIGHTS_OUT_SERVICE_H
