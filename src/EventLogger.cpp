#include "LightsOut.h"

#include <cstdio>
#include <cstdlib>

// ===== EVENT LOGGER =====

namespace {

std::string brightnessPercent(int brightness) {
  char buf[16];
  snprintf(buf, sizeof(buf), "%.1f", brightness * 100.0 / MAX_BRIGHTNESS);
  return std::string(buf);
}

}

EventLogger::EventLogger(EventStore& store) : store(store), eventCount(0) {}

void EventLogger::storeEvents(const std::vector<LightEvent>& events) {
  for (const auto& event : events) {
    if (!store.appendEvent(event)) {
      DEBUG_ERROR(STORE, "Failed to store " + eventTypeName(event.eventType) + " event for " + event.lightName);
    }
  }
  eventCount += static_cast<int>(events.size());
}

std::vector<LightEvent> EventLogger::logStateChange(const DeviceState& oldState, const DeviceState& newState, time_t timestamp) {
  std::vector<LightEvent> events = detectChanges(oldState, newState, timestamp);
  storeEvents(events);
  return events;
}

std::vector<LightEvent> EventLogger::detectChanges(const DeviceState& oldState, const DeviceState& newState, time_t timestamp) {
  std::vector<LightEvent> events;

  if (oldState.isOn != newState.isOn) {
    events.push_back(makeLightEvent(newState.lightId, newState.name, newState.isOn ? EVENT_ON : EVENT_OFF,
                                    oldState.isOn ? "True" : "False", newState.isOn ? "True" : "False", timestamp));
    addLog(newState.name + (newState.isOn ? " turned ON" : " turned OFF"));
  }

  // Colour and level changes only count while the light is lit
  if (newState.isOn) {
    if (abs(oldState.brightness - newState.brightness) > 5) {
      events.push_back(makeLightEvent(newState.lightId, newState.name, EVENT_BRIGHTNESS,
                                      brightnessPercent(oldState.brightness), brightnessPercent(newState.brightness), timestamp));
      DEBUG_INFO(GATEWAY, newState.name + ": brightness " + brightnessPercent(oldState.brightness) + "% -> " +
                          brightnessPercent(newState.brightness) + "%");
    }

    if (oldState.hue >= 0 && newState.hue >= 0 && abs(oldState.hue - newState.hue) > 1000) {
      events.push_back(makeLightEvent(newState.lightId, newState.name, EVENT_HUE,
                                      std::to_string(oldState.hue), std::to_string(newState.hue), timestamp));
      DEBUG_INFO(GATEWAY, newState.name + ": colour changed");
    }

    if (oldState.colorTemp >= 0 && newState.colorTemp >= 0 && abs(oldState.colorTemp - newState.colorTemp) > 10) {
      events.push_back(makeLightEvent(newState.lightId, newState.name, EVENT_COLOR_TEMP,
                                      std::to_string(oldState.colorTemp), std::to_string(newState.colorTemp), timestamp));
      DEBUG_INFO(GATEWAY, newState.name + ": colour temperature changed");
    }
  }

  return events;
}

std::vector<LightEvent> EventLogger::pollOnce(DeviceGateway& gateway, time_t now, bool& ok) {
  std::vector<LightEvent> events;
  std::map<std::string, DeviceState> states;

  ok = gateway.readStates(states);
  if (!ok) {
    DEBUG_WARN(GATEWAY, "Could not read light states");
    return events;
  }

  {
    std::lock_guard<std::mutex> lock(statesMutex);
    for (std::map<std::string, DeviceState>::const_iterator it = states.begin(); it != states.end(); ++it) {
      std::map<std::string, DeviceState>::const_iterator previous = lastStates.find(it->first);
      if (previous != lastStates.end()) {
        std::vector<LightEvent> changes = detectChanges(previous->second, it->second, now);
        events.insert(events.end(), changes.begin(), changes.end());
      }
      lastStates[it->first] = it->second;
    }
  }

  // Store writes happen after the snapshot lock is released
  storeEvents(events);
  return events;
}
