#ifndef FAKE_DEVICE_GATEWAY_H
#define FAKE_DEVICE_GATEWAY_H

#include <set>

#include "LightsOut.h"

// Records every command; individual targets or the whole gateway can be made to fail
class FakeDeviceGateway : public DeviceGateway {
public:
  struct SentCommand {
    TargetType targetType;
    std::string targetId;
    LightCommand command;
  };

  std::mutex mutex;
  std::map<std::string, DeviceState> states;
  std::map<std::string, int> lightLevels;
  std::vector<SentCommand> sent;
  std::set<std::string> failingTargets;
  bool online = true;
  bool applyCommands = true;
  // Runs before every setState, outside the fake's lock
  std::function<void()> beforeSetState;

  void addLight(const std::string& id, const std::string& name, bool isOn, int brightness) {
    std::lock_guard<std::mutex> lock(mutex);
    DeviceState state;
    state.lightId = id;
    state.name = name;
    state.isOn = isOn;
    state.brightness = brightness;
    states[id] = state;
  }

  size_t sentCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return sent.size();
  }

  std::vector<SentCommand> sentCommands() {
    std::lock_guard<std::mutex> lock(mutex);
    return sent;
  }

  bool readStates(std::map<std::string, DeviceState>& out) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!online) return false;
    out = states;
    return true;
  }

  bool setState(TargetType targetType, const std::string& targetId, const LightCommand& command) {
    if (beforeSetState) beforeSetState();
    std::lock_guard<std::mutex> lock(mutex);
    if (!online || failingTargets.count(targetId) > 0) return false;

    SentCommand record;
    record.targetType = targetType;
    record.targetId = targetId;
    record.command = command;
    sent.push_back(record);

    if (applyCommands && targetType == TARGET_LIGHT) {
      std::map<std::string, DeviceState>::iterator it = states.find(targetId);
      if (it != states.end()) {
        if (command.hasOn) it->second.isOn = command.on;
        if (command.brightness >= 0) it->second.brightness = command.brightness;
      }
    }
    return true;
  }

  bool readLightLevel(const std::string& sensorId, int& lightLevel) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!online) return false;
    std::map<std::string, int>::const_iterator it = lightLevels.find(sensorId);
    if (it == lightLevels.end()) return false;
    lightLevel = it->second;
    return true;
  }
};

#endif // FAKE_DEVICE_GATEWAY_H
