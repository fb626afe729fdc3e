#ifndef LIGHTS_OUT_H
#define LIGHTS_OUT_H

#include <atomic>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "DebugLog.h"

// ===== CONSTANTS =====

// Stockholm, Sweden
#define DEFAULT_LATITUDE 59.3293
#define DEFAULT_LONGITUDE 18.0686
#define DEFAULT_UTC_OFFSET_MINUTES 60

#define DEFAULT_MIN_OCCURRENCES 3
#define DEFAULT_TIME_WINDOW_MINUTES 15
#define DEFAULT_CONFIDENCE_THRESHOLD 0.7
#define DEFAULT_LOOKAHEAD_MINUTES 5

#define SUN_ZENITH 90.833
#define CORRELATION_WINDOW_SECONDS 5
#define CORRELATION_SCAN_DEPTH 4

#define RECOMMENDATION_CONFIDENCE 0.8
#define FEEDBACK_POSITIVE_STEP 0.05
#define FEEDBACK_NEGATIVE_STEP 0.10
#define PATTERN_DEACTIVATE_BELOW 0.3

#define ADAPTIVE_POLL_MS 3000
#define ADAPTIVE_BACKOFF_MS 5000
#define ADAPTIVE_LUX_TOLERANCE 5.0
#define MAX_BRIGHTNESS 254

// ===== ENUMS =====

enum LightEventType {
  EVENT_ON,
  EVENT_OFF,
  EVENT_BRIGHTNESS,
  EVENT_HUE,
  EVENT_COLOR_TEMP,
  EVENT_UNKNOWN
};

enum PatternType {
  PATTERN_TIME_BASED,
  PATTERN_SEQUENCE,
  PATTERN_CORRELATION
};

enum TriggerType {
  TRIGGER_TIME,
  TRIGGER_SUNRISE,
  TRIGGER_SUNSET,
  TRIGGER_MANUAL
};

enum TargetType {
  TARGET_LIGHT,
  TARGET_ROOM
};

enum AutomationActionType {
  ACTION_SINGLE,
  ACTION_SEQUENCE
};

enum AdaptiveStatus {
  ADAPTIVE_STARTING,
  ADAPTIVE_ADJUSTING,
  ADAPTIVE_TARGET_REACHED,
  ADAPTIVE_ERROR,
  ADAPTIVE_STOPPED
};

enum SunTimezoneMode {
  SUN_TZ_FIXED,
  SUN_TZ_LOCAL
};

// ===== STRUCTURES =====

struct ClockTime {
  int hour = 0;
  int minute = 0;
};

// Immutable record of a detected state delta on a fixture
struct LightEvent {
  int id = 0;
  std::string lightId;
  std::string lightName;
  time_t timestamp = 0;
  LightEventType eventType = EVENT_UNKNOWN;
  std::string oldValue;
  std::string newValue;
  int weekday = 0; // 0=Monday ... 6=Sunday
  int hour = 0;
  int minute = 0;
};

struct EventRef {
  std::string lightId;
  LightEventType eventType = EVENT_UNKNOWN;
};

// Tagged by Pattern::type:
//   time_based  -> lightId, eventType
//   sequence    -> trigger, response, delaySeconds
//   correlation -> eventType, lights
struct PatternAction {
  std::string lightId;
  LightEventType eventType = EVENT_UNKNOWN;
  EventRef trigger;
  EventRef response;
  int delaySeconds = 0;
  std::vector<std::string> lights;
};

struct Pattern {
  int id = -1;
  PatternType type = PATTERN_TIME_BASED;
  std::string description;
  std::vector<std::string> lightIds;
  std::vector<int> weekdays; // empty = all days
  std::string timeStart;     // "HH:MM", empty when not clock-triggered
  std::string timeEnd;
  PatternAction action;
  double confidence = 0.0;
  int occurrenceCount = 0;
  time_t lastSeen = 0;
  bool isActive = true;
};

// Partially populated device command. Unset fields are left untouched on the fixture.
struct LightCommand {
  bool hasOn = false;
  bool on = false;
  int brightness = -1;      // 1-254
  int hue = -1;             // 0-65535
  int saturation = -1;      // 0-254
  int colorTemp = -1;       // 153-500 mirek
  int transitionTime = -1;  // 100ms steps
  std::string alert;
  std::string effect;
  bool hasXy = false;
  float xy[2] = {0.0f, 0.0f};
  std::string scene;

  bool isEmpty() const;
};

struct SequenceStep {
  int delaySeconds = 0;
  LightCommand command;
};

struct AutomationTrigger {
  TriggerType type = TRIGGER_MANUAL;
  ClockTime time;            // TRIGGER_TIME
  int offsetMinutes = 0;     // TRIGGER_SUNRISE / TRIGGER_SUNSET
  std::vector<int> weekdays; // empty = every day
};

struct AutomationTarget {
  TargetType type = TARGET_LIGHT;
  std::vector<std::string> ids;
};

struct AutomationAction {
  AutomationActionType type = ACTION_SINGLE;
  LightCommand command;
  std::vector<SequenceStep> sequence;
};

struct Automation {
  int id = -1;
  std::string name;
  std::string description;
  AutomationTrigger trigger;
  AutomationTarget target;
  AutomationAction action;
  bool isEnabled = true;
  int triggerCount = 0;
  time_t lastTriggered = 0;
};

struct DeviceState {
  std::string lightId;
  std::string name;
  bool isOn = false;
  int brightness = 0;   // 0-254
  int hue = -1;
  int saturation = -1;
  int colorTemp = -1;
  bool reachable = true;
};

struct EventQuery {
  std::string lightId;                      // empty = any light
  LightEventType eventType = EVENT_UNKNOWN; // EVENT_UNKNOWN = any type
  time_t start = 0;
  time_t end = 0;                           // 0 = open ended
  int limit = 1000;
};

struct StoreStatistics {
  int totalEvents = 0;
  int totalPatterns = 0;
  int activePatterns = 0;
  int automations = 0;
  time_t oldestEvent = 0;
  time_t newestEvent = 0;
};

struct Prediction {
  int patternId = -1;
  PatternType patternType = PATTERN_TIME_BASED;
  std::string description;
  PatternAction action;
  double confidence = 0.0;
  time_t triggerTime = 0;
};

struct Recommendation {
  int patternId = -1;
  PatternType patternType = PATTERN_TIME_BASED;
  std::string type = "suggestion";
  std::string message;
  double confidence = 0.0;
  PatternAction action;
};

struct ReactiveAction {
  int patternId = -1;
  std::string lightId;
  LightEventType eventType = EVENT_UNKNOWN;
  int delaySeconds = 0;
  double confidence = 0.0;
};

struct AutomationResult {
  bool success = false;
  std::string reason;
  int automationId = -1;
  std::string automationName;
  int targetsSucceeded = 0;
  int totalTargets = 0;
  int stepsScheduled = 0;
};

struct MiningResult {
  bool success = false;
  std::string reason;
  std::vector<Pattern> patterns;
  int saved = 0;
};

struct AdaptiveParams {
  std::string sensorId;
  std::vector<std::string> lightIds;
  double targetLux = 0.0;
  int minBrightness = 1;
  int maxBrightness = MAX_BRIGHTNESS;
  int step = 20;
};

struct AdaptiveSessionStatus {
  int sessionId = -1;
  std::string sensorId;
  std::vector<std::string> lightIds;
  double targetLux = 0.0;
  double currentLux = 0.0;
  int currentBrightness = 0;
  AdaptiveStatus status = ADAPTIVE_STARTING;
  std::string lastError;
  int iterations = 0;
  int commandsSent = 0;
  time_t startedAt = 0;
};

// ===== COLLABORATOR INTERFACES =====

class EventStore {
public:
  virtual ~EventStore() {}

  virtual bool appendEvent(const LightEvent& event) = 0;
  virtual bool queryEvents(const EventQuery& query, std::vector<LightEvent>& out) = 0;

  // Returns the pattern id, -1 on failure
  virtual int savePattern(const Pattern& pattern) = 0;
  virtual bool loadActivePatterns(std::vector<Pattern>& out) = 0;
  virtual bool getPattern(int patternId, Pattern& out) = 0;
  virtual bool updatePattern(const Pattern& pattern) = 0;

  virtual bool loadEnabledAutomations(std::vector<Automation>& out) = 0;
  virtual bool getAutomation(int automationId, Automation& out) = 0;
  virtual bool recordTrigger(int automationId, time_t when) = 0;

  virtual int cleanupOldEvents(int retentionDays, time_t now) = 0;
  virtual bool getStatistics(StoreStatistics& out) = 0;
};

class DeviceGateway {
public:
  virtual ~DeviceGateway() {}

  virtual bool readStates(std::map<std::string, DeviceState>& out) = 0;
  virtual bool setState(TargetType targetType, const std::string& targetId, const LightCommand& command) = 0;
  virtual bool readLightLevel(const std::string& sensorId, int& lightLevel) = 0;
};

// ===== CORE CLASSES =====

class SunCalculator {
private:
  double latitude;
  double longitude;
  SunTimezoneMode timezoneMode;
  int utcOffsetMinutes;

  ClockTime calculateSunTime(time_t date, bool rising) const;
  int offsetMinutesFor(time_t date) const;

public:
  SunCalculator(double lat = DEFAULT_LATITUDE, double lon = DEFAULT_LONGITUDE);

  void setFixedOffset(int offsetMinutes);
  void useLocalTimezone();
  SunTimezoneMode getTimezoneMode() const { return timezoneMode; }
  double getLatitude() const { return latitude; }
  double getLongitude() const { return longitude; }

  ClockTime getSunrise(time_t date) const;
  ClockTime getSunset(time_t date) const;
};

class PatternMiner {
private:
  int minOccurrences;
  int timeWindowMinutes;
  double confidenceThreshold;

public:
  PatternMiner(int minOccurrences = DEFAULT_MIN_OCCURRENCES,
               int timeWindowMinutes = DEFAULT_TIME_WINDOW_MINUTES,
               double confidenceThreshold = DEFAULT_CONFIDENCE_THRESHOLD);

  std::vector<Pattern> analyze(const std::vector<LightEvent>& events) const;

  std::vector<Pattern> detectTimePatterns(const std::vector<LightEvent>& events) const;
  std::vector<Pattern> detectSequencePatterns(const std::vector<LightEvent>& events) const;
  std::vector<Pattern> detectCorrelationPatterns(const std::vector<LightEvent>& events) const;

  std::string getPatternSummary(const std::vector<Pattern>& patterns) const;

  int getMinOccurrences() const { return minOccurrences; }
  int getTimeWindowMinutes() const { return timeWindowMinutes; }
  double getConfidenceThreshold() const { return confidenceThreshold; }
};

class LightingPredictor {
private:
  EventStore& store;
  double minConfidence;
  int lookaheadMinutes;

  std::mutex cacheMutex;
  std::vector<Pattern> cachedPatterns;

  std::mutex lockTableMutex;
  std::map<int, std::shared_ptr<std::mutex> > patternLocks;

  std::vector<Pattern> loadPatterns();
  bool matchPattern(const Pattern& pattern, time_t now, Prediction& out) const;
  std::shared_ptr<std::mutex> lockFor(int patternId);

public:
  LightingPredictor(EventStore& store,
                    double minConfidence = DEFAULT_CONFIDENCE_THRESHOLD,
                    int lookaheadMinutes = DEFAULT_LOOKAHEAD_MINUTES);

  std::vector<Prediction> getPredictions(time_t now);
  std::vector<Recommendation> getRecommendations(time_t now);
  std::vector<ReactiveAction> shouldTriggerSequence(const std::string& lightId, LightEventType eventType);
  bool updatePatternFromFeedback(int patternId, bool wasCorrect);

  double getMinConfidence() const { return minConfidence; }
  int getLookaheadMinutes() const { return lookaheadMinutes; }
};

// ===== SCHEDULING =====

typedef std::function<void()> TaskCallback;

// Fires at hour:minute local time on the listed weekdays (0=Monday, empty = every day)
struct RecurringSpec {
  int hour = 0;
  int minute = 0;
  std::vector<int> weekdays;
};

class TaskScheduler {
private:
  enum JobKind {
    JOB_ONCE,
    JOB_RECURRING,
    JOB_INTERVAL
  };

  struct Job {
    int id = 0;
    JobKind kind = JOB_ONCE;
    RecurringSpec spec;
    int intervalSeconds = 0;
    time_t nextRun = 0;
    TaskCallback callback;
  };

  mutable std::mutex jobsMutex;
  std::map<int, Job> jobs;
  int nextJobId;

  std::thread worker;
  std::mutex wakeMutex;
  std::condition_variable wakeSignal;
  std::atomic<bool> running;
  int tickMs;

  void workerLoop();

public:
  explicit TaskScheduler(int tickMs = 1000);
  ~TaskScheduler();

  int scheduleRecurring(const RecurringSpec& spec, TaskCallback callback, time_t now);
  int scheduleInterval(int seconds, TaskCallback callback, time_t now);
  int scheduleOnce(time_t when, TaskCallback callback);
  bool cancel(int jobId);
  void cancelAll();

  time_t nextRunTime(int jobId) const; // 0 when the job does not exist
  size_t jobCount() const;

  // Runs every job due at `now`, returns how many ran
  int tick(time_t now);

  void begin();
  void end();
  bool isRunning() const { return running; }

  static time_t nextOccurrence(const RecurringSpec& spec, time_t after);
};

class AutomationScheduler {
private:
  EventStore& store;
  DeviceGateway& gateway;
  TaskScheduler& scheduler;
  const SunCalculator& sun;

  // Guards jobs, sunAutomations and sunTokens. Never held across store or gateway calls.
  mutable std::mutex registryMutex;
  std::map<int, int> jobs; // automation id -> job id
  std::map<int, Automation> sunAutomations;
  std::map<int, unsigned long> sunTokens; // automation id -> token of its live sun job
  unsigned long nextSunToken;

  bool scheduleLocked(const Automation& automation, time_t now);
  bool scheduleTimeTrigger(const Automation& automation, time_t now);
  bool scheduleSunTrigger(const Automation& automation, time_t now);
  void unscheduleLocked(int automationId);
  void onSunJobFired(int automationId, unsigned long token, time_t firedAt);
  int applyCommand(TargetType targetType, const std::vector<std::string>& targetIds, const LightCommand& command);

public:
  AutomationScheduler(EventStore& store, DeviceGateway& gateway, TaskScheduler& scheduler, const SunCalculator& sun);
  ~AutomationScheduler();

  int reload();
  int reload(time_t now);
  bool scheduleAutomation(const Automation& automation, time_t now);
  bool unscheduleAutomation(int automationId);
  void clear();

  AutomationResult execute(int automationId);
  AutomationResult execute(int automationId, time_t now);

  time_t nextFireTime(int automationId) const;
  size_t scheduledCount() const;
  time_t nextSunFireTime(const AutomationTrigger& trigger, time_t now) const;
};

// ===== ADAPTIVE LIGHTING =====

class AdaptiveLightingController {
private:
  struct AdaptiveSession {
    AdaptiveParams params;
    AdaptiveSessionStatus status;
    std::mutex statusMutex;
    std::atomic<bool> cancelled;
    std::mutex wakeMutex;
    std::condition_variable wakeSignal;
    std::thread worker;

    AdaptiveSession() : cancelled(false) {}
  };

  DeviceGateway& gateway;
  int pollIntervalMs;
  int errorBackoffMs;
  bool spawnWorkers;

  mutable std::mutex tableMutex;
  std::map<int, std::shared_ptr<AdaptiveSession> > sessions;
  int nextSessionId;

  void sessionLoop(std::shared_ptr<AdaptiveSession> session);
  bool iterate(AdaptiveSession& session);
  void cancelAndJoin(const std::shared_ptr<AdaptiveSession>& session);

public:
  AdaptiveLightingController(DeviceGateway& gateway,
                             int pollIntervalMs = ADAPTIVE_POLL_MS,
                             int errorBackoffMs = ADAPTIVE_BACKOFF_MS,
                             bool spawnWorkers = true);
  ~AdaptiveLightingController();

  int startSession(const AdaptiveParams& params); // -1 when params are invalid
  int stopSession(int sessionId);
  int stopAll();
  std::vector<AdaptiveSessionStatus> getStatus() const;
  size_t activeCount() const;

  // One control step on a session, outside the worker's timing
  bool runIteration(int sessionId);

  static double lightLevelToLux(int lightLevel);
  static int computeBrightness(double targetLux, double currentLux, int currentBrightness,
                               int minBrightness, int maxBrightness, int step, bool& targetReached);
};

// ===== EVENT CAPTURE =====

class EventLogger {
private:
  EventStore& store;
  std::mutex statesMutex;
  std::map<std::string, DeviceState> lastStates;
  std::atomic<int> eventCount;

  std::vector<LightEvent> detectChanges(const DeviceState& oldState, const DeviceState& newState, time_t timestamp);
  void storeEvents(const std::vector<LightEvent>& events);

public:
  explicit EventLogger(EventStore& store);

  std::vector<LightEvent> logStateChange(const DeviceState& oldState, const DeviceState& newState, time_t timestamp);
  std::vector<LightEvent> pollOnce(DeviceGateway& gateway, time_t now, bool& ok);
  int getTotalEventsLogged() const { return eventCount; }
};

// ===== UTILITY FUNCTIONS =====

LightEvent makeLightEvent(const std::string& lightId, const std::string& lightName, LightEventType type,
                          const std::string& oldValue, const std::string& newValue, time_t timestamp);
LightCommand makePowerCommand(bool on);
LightCommand makeBrightnessCommand(int brightness);

bool parseClockTime(const std::string& text, ClockTime& out);
std::string formatClockTime(const ClockTime& time);
std::string formatTimestamp(time_t timestamp);
std::string localDateKey(time_t timestamp);
int mondayWeekday(time_t timestamp);
time_t localTimeAt(time_t day, int hour, int minute);
time_t addLocalDays(time_t timestamp, int days);
bool weekdayAllowed(const std::vector<int>& weekdays, int weekday);

std::string eventTypeName(LightEventType type);
bool parseEventType(const std::string& name, LightEventType& out);
std::string patternTypeName(PatternType type);
std::string triggerTypeName(TriggerType type);
std::string targetTypeName(TargetType type);
std::string adaptiveStatusName(AdaptiveStatus status);
std::string weekdayName(int weekday);
std::string joinIds(const std::vector<std::string>& ids);

#endif // LIGHTS_OUT_H
