#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>

#include "Config.h"
#include "LightsOut.h"
#include "LightsOutService.h"
#include "VirtualLightGateway.h"

// ===== GLOBALS =====

static volatile sig_atomic_t stopRequested = 0;

static void handleSignal(int) {
  stopRequested = 1;
}

static void printUsage(const char* program) {
  std::cout << "Usage: " << program << " [-c config.ini] [--analyze] [--status] [--simulate]\n"
            << "  -c, --config   configuration file (default: lightsout.ini)\n"
            << "  --analyze      run one pattern analysis and exit\n"
            << "  --status       print service status and exit\n"
            << "  --simulate     drive virtual lights instead of a physical gateway\n";
}

// ===== SIMULATION =====

static void setupVirtualHome(VirtualLightGateway& gateway) {
  gateway.addVirtualLight("1", "Kitchen", "kitchen");
  gateway.addVirtualLight("2", "Hall", "hall");
  gateway.addVirtualLight("3", "Living room", "living");
  gateway.addVirtualLight("4", "Dining room", "living");

  std::vector<std::string> sensed;
  sensed.push_back("3");
  sensed.push_back("4");
  gateway.addVirtualSensor("10", 40.0, sensed, 0.5);
}

// Four weeks of weekday mornings: hall on, kitchen follows, living area off together at night
static int seedVirtualHistory(EventStore& store, time_t now) {
  int seeded = 0;
  for (int day = 28; day >= 1; day--) {
    time_t date = addLocalDays(now, -day);
    int weekday = mondayWeekday(date);
    if (weekday > 4) continue;

    time_t morning = localTimeAt(date, 7, 2);
    time_t night = localTimeAt(date, 22, 30);

    LightEvent seeds[] = {
      makeLightEvent("2", "Hall", EVENT_ON, "False", "True", morning),
      makeLightEvent("1", "Kitchen", EVENT_ON, "False", "True", morning + 45 + day % 3 * 15),
      makeLightEvent("3", "Living room", EVENT_OFF, "True", "False", night),
      makeLightEvent("4", "Dining room", EVENT_OFF, "True", "False", night + 2),
    };
    for (size_t i = 0; i < sizeof(seeds) / sizeof(seeds[0]); i++) {
      if (store.appendEvent(seeds[i])) seeded++;
    }
  }
  return seeded;
}

// ===== MAIN =====

int main(int argc, char** argv) {
  std::string configPath = "lightsout.ini";
  bool analyzeOnly = false;
  bool statusOnly = false;
  bool simulate = false;

  for (int i = 1; i < argc; i++) {
    if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
      configPath = argv[++i];
    } else if (strcmp(argv[i], "--analyze") == 0) {
      analyzeOnly = true;
    } else if (strcmp(argv[i], "--status") == 0) {
      statusOnly = true;
    } else if (strcmp(argv[i], "--simulate") == 0) {
      simulate = true;
    } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << argv[i] << "\n";
      printUsage(argv[0]);
      return 2;
    }
  }

  LightsOutConfig config;
  loadConfig(configPath, config);
  setLogLevel(config.logLevel);

  if (!simulate) {
    DEBUG_ERROR(SERVICE, "No physical light gateway is compiled into this build; run with --simulate");
    return 1;
  }

  VirtualLightGateway gateway;
  setupVirtualHome(gateway);
  LightsOutService service(config, gateway);

  time_t now = time(nullptr);
  int seeded = seedVirtualHistory(service.getStore(), now);
  DEBUG_INFO(SERVICE, "Seeded " + std::to_string(seeded) + " simulated events");

  if (analyzeOnly) {
    MiningResult result = service.minePatterns(config.analysisWindowDays, now);
    if (!result.success) {
      std::cerr << "Analysis failed: " << result.reason << "\n";
      return 1;
    }
    PatternMiner summary(config.minOccurrences, config.timeWindowMinutes, config.confidenceThreshold);
    std::cout << summary.getPatternSummary(result.patterns) << std::endl;
    return 0;
  }

  if (statusOnly) {
    if (service.pollNow(now) < 0) {
      std::cerr << "Failed to reach light gateway\n";
      return 1;
    }
    std::cout << service.getStatusJson() << std::endl;
    std::cout << service.getSunTimes(now) << std::endl;
    return 0;
  }

  signal(SIGINT, handleSignal);
  signal(SIGTERM, handleSignal);

  service.loadAutomations();
  if (!service.begin()) {
    return 1;
  }
  service.minePatterns(config.analysisWindowDays);
  std::cout << service.getSunTimes(now) << std::endl;

  while (!stopRequested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  service.end();
  addLog("Goodbye");
  return 0;
}
