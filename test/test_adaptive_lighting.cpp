#include <gtest/gtest.h>

#include <chrono>

#include "FakeDeviceGateway.h"
#include "LightsOut.h"

namespace {

AdaptiveParams livingRoom(double targetLux) {
  AdaptiveParams params;
  params.sensorId = "10";
  params.lightIds.push_back("3");
  params.lightIds.push_back("4");
  params.targetLux = targetLux;
  return params;
}

}

class AdaptiveLightingTest : public ::testing::Test {
protected:
  FakeDeviceGateway gateway;
  AdaptiveLightingController controller;

  AdaptiveLightingTest() : controller(gateway, 10, 10, false) {
    gateway.addLight("3", "Living room", true, 100);
    gateway.addLight("4", "Dining room", true, 100);
    gateway.lightLevels["10"] = 20001; // 100 lux
  }

  AdaptiveSessionStatus statusOf(int sessionId) {
    std::vector<AdaptiveSessionStatus> statuses = controller.getStatus();
    for (size_t i = 0; i < statuses.size(); i++) {
      if (statuses[i].sessionId == sessionId) return statuses[i];
    }
    return AdaptiveSessionStatus();
  }
};

TEST(AdaptiveMathTest, LightLevelConvertsToLux) {
  EXPECT_DOUBLE_EQ(AdaptiveLightingController::lightLevelToLux(0), 0.0);
  EXPECT_DOUBLE_EQ(AdaptiveLightingController::lightLevelToLux(-5), 0.0);
  EXPECT_NEAR(AdaptiveLightingController::lightLevelToLux(1), 1.0, 1e-9);
  EXPECT_NEAR(AdaptiveLightingController::lightLevelToLux(10001), 10.0, 1e-9);
  EXPECT_NEAR(AdaptiveLightingController::lightLevelToLux(20001), 100.0, 1e-9);
}

TEST(AdaptiveMathTest, BrightnessStepIsHalfTheErrorCappedByStep) {
  bool reached = true;
  EXPECT_EQ(AdaptiveLightingController::computeBrightness(100, 10, 100, 1, 254, 20, reached), 120);
  EXPECT_FALSE(reached);

  EXPECT_EQ(AdaptiveLightingController::computeBrightness(100, 90, 100, 1, 254, 20, reached), 105);
  EXPECT_FALSE(reached);

  EXPECT_EQ(AdaptiveLightingController::computeBrightness(100, 97, 80, 1, 254, 20, reached), 80);
  EXPECT_TRUE(reached);
}

TEST(AdaptiveMathTest, BrightnessIsClamped) {
  bool reached = false;
  EXPECT_EQ(AdaptiveLightingController::computeBrightness(1000, 0, 250, 1, 254, 20, reached), 254);
  EXPECT_EQ(AdaptiveLightingController::computeBrightness(0, 100, 10, 1, 254, 20, reached), 1);
  EXPECT_EQ(AdaptiveLightingController::computeBrightness(1000, 0, 100, 1, 110, 20, reached), 110);
}

TEST_F(AdaptiveLightingTest, TargetReachedSendsNothing) {
  int id = controller.startSession(livingRoom(102));
  ASSERT_GT(id, 0);

  EXPECT_TRUE(controller.runIteration(id));
  EXPECT_TRUE(controller.runIteration(id));

  EXPECT_EQ(gateway.sentCount(), 0u);
  AdaptiveSessionStatus status = statusOf(id);
  EXPECT_EQ(status.status, ADAPTIVE_TARGET_REACHED);
  EXPECT_EQ(status.iterations, 2);
  EXPECT_NEAR(status.currentLux, 100.0, 1e-6);
}

TEST_F(AdaptiveLightingTest, AdjustingDrivesEveryLight) {
  int id = controller.startSession(livingRoom(200));
  ASSERT_TRUE(controller.runIteration(id));

  std::vector<FakeDeviceGateway::SentCommand> sent = gateway.sentCommands();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].targetId, "3");
  EXPECT_EQ(sent[1].targetId, "4");
  EXPECT_EQ(sent[0].command.brightness, 120);
  EXPECT_TRUE(sent[0].command.hasOn);

  AdaptiveSessionStatus status = statusOf(id);
  EXPECT_EQ(status.status, ADAPTIVE_ADJUSTING);
  EXPECT_EQ(status.currentBrightness, 120);
  EXPECT_EQ(status.commandsSent, 2);
}

TEST_F(AdaptiveLightingTest, LightThatIsOffCountsAsZeroBrightness) {
  gateway.addLight("3", "Living room", false, 200);
  int id = controller.startSession(livingRoom(200));
  ASSERT_TRUE(controller.runIteration(id));

  EXPECT_EQ(statusOf(id).currentBrightness, 20);
}

TEST_F(AdaptiveLightingTest, GatewayFailureKeepsSessionAlive) {
  int id = controller.startSession(livingRoom(200));
  gateway.online = false;

  EXPECT_FALSE(controller.runIteration(id));
  AdaptiveSessionStatus status = statusOf(id);
  EXPECT_EQ(status.status, ADAPTIVE_ERROR);
  EXPECT_FALSE(status.lastError.empty());
  EXPECT_EQ(controller.activeCount(), 1u);

  gateway.online = true;
  EXPECT_TRUE(controller.runIteration(id));
  EXPECT_EQ(statusOf(id).status, ADAPTIVE_ADJUSTING);
  EXPECT_TRUE(statusOf(id).lastError.empty());
}

TEST_F(AdaptiveLightingTest, InvalidParamsAreRejected) {
  AdaptiveParams noLights = livingRoom(100);
  noLights.lightIds.clear();
  EXPECT_EQ(controller.startSession(noLights), -1);

  AdaptiveParams badRange = livingRoom(100);
  badRange.minBrightness = 200;
  badRange.maxBrightness = 100;
  EXPECT_EQ(controller.startSession(badRange), -1);

  AdaptiveParams noSensor = livingRoom(100);
  noSensor.sensorId.clear();
  EXPECT_EQ(controller.startSession(noSensor), -1);

  EXPECT_EQ(controller.activeCount(), 0u);
}

TEST_F(AdaptiveLightingTest, SameSensorReplacesOldSession) {
  int first = controller.startSession(livingRoom(100));
  int second = controller.startSession(livingRoom(300));

  EXPECT_NE(first, second);
  EXPECT_EQ(controller.activeCount(), 1u);
  EXPECT_FALSE(controller.runIteration(first));
  EXPECT_DOUBLE_EQ(statusOf(second).targetLux, 300.0);
}

TEST_F(AdaptiveLightingTest, StopSessionReportsWhetherItExisted) {
  int id = controller.startSession(livingRoom(100));
  EXPECT_EQ(controller.stopSession(id), 1);
  EXPECT_EQ(controller.stopSession(id), 0);
  EXPECT_EQ(controller.activeCount(), 0u);
}

TEST(AdaptiveWorkerTest, WorkerThreadAdjustsUntilStopped) {
  FakeDeviceGateway gateway;
  gateway.addLight("3", "Living room", true, 100);
  gateway.lightLevels["10"] = 20001;
  AdaptiveLightingController controller(gateway, 5, 5, true);

  AdaptiveParams params = livingRoom(400);
  params.lightIds.pop_back();
  int id = controller.startSession(params);
  ASSERT_GT(id, 0);

  for (int i = 0; i < 200 && gateway.sentCount() == 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_GT(gateway.sentCount(), 0u);

  EXPECT_EQ(controller.stopAll(), 1);
  size_t sentAfterStop = gateway.sentCount();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(gateway.sentCount(), sentAfterStop);
}
