#ifndef VIRTUAL_LIGHT_GATEWAY_H
#define VIRTUAL_LIGHT_GATEWAY_H

#include "LightsOut.h"

// In-process fixtures, rooms and light-level sensors
class VirtualLightGateway : public DeviceGateway {
private:
  struct VirtualSensor {
    double ambientLux = 0.0;
    std::vector<std::string> lightIds;
    double luxPerBrightness = 1.0;
  };

  mutable std::mutex gatewayMutex;
  std::map<std::string, DeviceState> lights;
  std::map<std::string, std::vector<std::string> > rooms;
  std::map<std::string, VirtualSensor> sensors;
  bool online;
  int commandCount;

  bool applyToLight(const std::string& lightId, const LightCommand& command);

public:
  VirtualLightGateway();

  void addVirtualLight(const std::string& lightId, const std::string& name, const std::string& room);
  void addVirtualSensor(const std::string& sensorId, double ambientLux,
                        const std::vector<std::string>& lightIds, double luxPerBrightness);
  void setAmbientLux(const std::string& sensorId, double lux);
  void setOnline(bool isOnline);
  bool isOnline() const;
  int getCommandCount() const;
  std::vector<std::string> getRoomLights(const std::string& room) const;

  bool readStates(std::map<std::string, DeviceState>& out);
  bool setState(TargetType targetType, const std::string& targetId, const LightCommand& command);
  bool readLightLevel(const std::string& sensorId, int& lightLevel);
};

#endif // VIRTUAL_LIGHT_GATEWAY_H
