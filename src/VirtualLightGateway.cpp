#include "VirtualLightGateway.h"

#include <algorithm>
#include <cmath>

// ===== VIRTUAL LIGHT GATEWAY =====

VirtualLightGateway::VirtualLightGateway() : online(true), commandCount(0) {}

void VirtualLightGateway::addVirtualLight(const std::string& lightId, const std::string& name, const std::string& room) {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  DeviceState state;
  state.lightId = lightId;
  state.name = name;
  state.isOn = false;
  state.brightness = MAX_BRIGHTNESS;
  state.colorTemp = 366;
  lights[lightId] = state;
  if (!room.empty()) rooms[room].push_back(lightId);
  DEBUG_VERBOSE(GATEWAY, "Added virtual light " + lightId + " (" + name + ") in " + room);
}

void VirtualLightGateway::addVirtualSensor(const std::string& sensorId, double ambientLux,
                                           const std::vector<std::string>& lightIds, double luxPerBrightness) {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  VirtualSensor sensor;
  sensor.ambientLux = ambientLux;
  sensor.lightIds = lightIds;
  sensor.luxPerBrightness = luxPerBrightness;
  sensors[sensorId] = sensor;
}

void VirtualLightGateway::setAmbientLux(const std::string& sensorId, double lux) {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  std::map<std::string, VirtualSensor>::iterator it = sensors.find(sensorId);
  if (it != sensors.end()) it->second.ambientLux = lux;
}

void VirtualLightGateway::setOnline(bool isOnline) {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  online = isOnline;
  addLog(std::string("Virtual gateway ") + (isOnline ? "online" : "offline"));
}

bool VirtualLightGateway::isOnline() const {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  return online;
}

int VirtualLightGateway::getCommandCount() const {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  return commandCount;
}

std::vector<std::string> VirtualLightGateway::getRoomLights(const std::string& room) const {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  std::map<std::string, std::vector<std::string> >::const_iterator it = rooms.find(room);
  if (it == rooms.end()) return std::vector<std::string>();
  return it->second;
}

bool VirtualLightGateway::readStates(std::map<std::string, DeviceState>& out) {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  if (!online) return false;
  out = lights;
  return true;
}

bool VirtualLightGateway::applyToLight(const std::string& lightId, const LightCommand& command) {
  std::map<std::string, DeviceState>::iterator it = lights.find(lightId);
  if (it == lights.end()) {
    DEBUG_WARN(GATEWAY, "Light not found: " + lightId);
    return false;
  }

  DeviceState& state = it->second;
  if (command.hasOn) state.isOn = command.on;
  if (command.brightness >= 0) state.brightness = std::max(0, std::min(MAX_BRIGHTNESS, command.brightness));
  if (command.hue >= 0) state.hue = command.hue;
  if (command.saturation >= 0) state.saturation = command.saturation;
  if (command.colorTemp >= 0) state.colorTemp = command.colorTemp;
  commandCount++;
  return true;
}

bool VirtualLightGateway::setState(TargetType targetType, const std::string& targetId, const LightCommand& command) {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  if (!online) return false;

  if (targetType == TARGET_LIGHT) {
    return applyToLight(targetId, command);
  }

  std::map<std::string, std::vector<std::string> >::const_iterator room = rooms.find(targetId);
  if (room == rooms.end()) {
    DEBUG_WARN(GATEWAY, "Room not found: " + targetId);
    return false;
  }
  bool success = true;
  for (const auto& lightId : room->second) {
    if (!applyToLight(lightId, command)) success = false;
  }
  return success;
}

bool VirtualLightGateway::readLightLevel(const std::string& sensorId, int& lightLevel) {
  std::lock_guard<std::mutex> lock(gatewayMutex);
  if (!online) return false;

  std::map<std::string, VirtualSensor>::const_iterator it = sensors.find(sensorId);
  if (it == sensors.end()) {
    DEBUG_WARN(GATEWAY, "Sensor not found: " + sensorId);
    return false;
  }

  double lux = it->second.ambientLux;
  for (const auto& lightId : it->second.lightIds) {
    std::map<std::string, DeviceState>::const_iterator light = lights.find(lightId);
    if (light != lights.end() && light->second.isOn) {
      lux += light->second.brightness * it->second.luxPerBrightness;
    }
  }

  // Inverse of the sensor's 10000 * log10(lux) + 1 encoding
  lightLevel = lux <= 0.0 ? 0 : std::max(0, static_cast<int>(lround(10000.0 * log10(lux) + 1.0)));
  return true;
}
