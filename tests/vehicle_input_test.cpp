#include "gtest/gtest.h"

#include "drive_test_helper.h"
#include "input/vehicle_input.h"

#include <cmath>
#include <memory>

using namespace Drive;

TEST(NormalizeInputTest, KeyboardPassesThroughClamped) {
    DriveCommand cmd = normalizeInput(KeyboardInput{ 0.5f, -0.25f });
    EXPECT_FLOAT_EQ(cmd.throttle, 0.5f);
    EXPECT_FLOAT_EQ(cmd.steering, -0.25f);

    cmd = normalizeInput(KeyboardInput{ 3.f, -7.f });
    EXPECT_FLOAT_EQ(cmd.throttle, 1.f);
    EXPECT_FLOAT_EQ(cmd.steering, -1.f);
}

TEST(NormalizeInputTest, NonFiniteValuesBecomeZero) {
    DriveCommand cmd = normalizeInput(KeyboardInput{ std::nanf(""), INFINITY });
    EXPECT_FLOAT_EQ(cmd.throttle, 0.f);
    EXPECT_FLOAT_EQ(cmd.steering, 0.f);

    cmd = normalizeInput(DragInput{ glm::vec2(std::nanf(""), 0.5f) });
    EXPECT_FLOAT_EQ(cmd.throttle, 0.5f);
    EXPECT_FLOAT_EQ(cmd.steering, 0.f);
}

TEST(NormalizeInputTest, DragMagnitudeDrivesAndXSteers) {
    const DriveCommand cmd = normalizeInput(DragInput{ glm::vec2(0.6f, 0.8f) });
    EXPECT_NEAR(cmd.throttle, 1.f, 1e-6f);
    EXPECT_FLOAT_EQ(cmd.steering, 0.6f);

    // Pulling back still reads as positive throttle
    const DriveCommand back = normalizeInput(DragInput{ glm::vec2(0.f, -0.4f) });
    EXPECT_FLOAT_EQ(back.throttle, 0.4f);
    EXPECT_FLOAT_EQ(back.steering, 0.f);
}

TEST(NormalizeInputTest, DragThrottleNeverExceedsOne) {
    const DriveCommand cmd = normalizeInput(DragInput{ glm::vec2(1.f, 1.f) });
    EXPECT_FLOAT_EQ(cmd.throttle, 1.f);
    EXPECT_FLOAT_EQ(cmd.steering, 1.f);
}

TEST(InputAxisTest, RampsTowardTargetAtSensitivity) {
    InputAxis axis(3.f, 3.f, true);
    EXPECT_NEAR(axis.update(false, true, 0.1f), 0.3f, 1e-6f);
    EXPECT_NEAR(axis.update(false, true, 0.1f), 0.6f, 1e-6f);
    for (int i = 0; i < 10; ++i) axis.update(false, true, 0.1f);
    EXPECT_FLOAT_EQ(axis.getValue(), 1.f);
}

TEST(InputAxisTest, ReturnsToZeroAtGravity) {
    InputAxis axis(3.f, 3.f, true);
    for (int i = 0; i < 10; ++i) axis.update(false, true, 0.1f);

    EXPECT_NEAR(axis.update(false, false, 0.1f), 0.7f, 1e-6f);
    for (int i = 0; i < 10; ++i) axis.update(false, false, 0.1f);
    EXPECT_FLOAT_EQ(axis.getValue(), 0.f);
}

TEST(InputAxisTest, SnapsOnReversal) {
    InputAxis snapping(3.f, 3.f, true);
    for (int i = 0; i < 10; ++i) snapping.update(false, true, 0.1f);
    EXPECT_NEAR(snapping.update(true, false, 0.1f), -0.3f, 1e-6f);

    InputAxis smooth(3.f, 3.f, false);
    for (int i = 0; i < 10; ++i) smooth.update(false, true, 0.1f);
    EXPECT_NEAR(smooth.update(true, false, 0.1f), 0.7f, 1e-6f);
}

TEST(InputAxisTest, BothKeysCancel) {
    InputAxis axis;
    EXPECT_FLOAT_EQ(axis.update(true, true, 0.1f), 0.f);
}

TEST(JoystickTest, DisplacementClampedToHandleRange) {
    const glm::vec2 press(400.f, 300.f);

    glm::vec2 v = joystickVectorFromDrag(press, press + glm::vec2(75.f, 0.f), 150.f);
    EXPECT_FLOAT_EQ(v.x, 0.5f);
    EXPECT_FLOAT_EQ(v.y, 0.f);

    v = joystickVectorFromDrag(press, press + glm::vec2(0.f, 600.f), 150.f);
    EXPECT_FLOAT_EQ(glm::length(v), 1.f);
}

TEST(JoystickTest, ScreenUpDrivesForward) {
    const glm::vec2 v = joystickVectorFromDrag({ 100.f, 100.f }, { 100.f, 40.f }, 150.f);
    EXPECT_GT(v.y, 0.f);
    EXPECT_FLOAT_EQ(v.y, 0.4f);
}

TEST(JoystickTest, InvalidRangeIsNeutral) {
    EXPECT_EQ(joystickVectorFromDrag({ 0.f, 0.f }, { 50.f, 50.f }, 0.f), glm::vec2(0.f));
}

TEST(DragSmootherTest, FollowsRawVector) {
    DragSmoother smoother(80.f);
    // 80 * dt saturates at 60 Hz, so the value lands on the raw vector
    EXPECT_EQ(smoother.update({ 0.5f, 0.5f }, 1.f / 60.f), glm::vec2(0.5f, 0.5f));

    DragSmoother slow(10.f);
    const glm::vec2 v = slow.update({ 1.f, 0.f }, 0.05f);
    EXPECT_FLOAT_EQ(v.x, 0.5f);
}

TEST(InputRouterTest, NoSourceGivesZeroCommand) {
    InputRouter router;
    const DriveCommand cmd = router.poll(0.016f);
    EXPECT_FLOAT_EQ(cmd.throttle, 0.f);
    EXPECT_FLOAT_EQ(cmd.steering, 0.f);
    EXPECT_FALSE(router.hasSource());
}

TEST(InputRouterTest, SwapsSourcesWhole) {
    InputRouter router;
    auto keyboard = std::make_shared<FakeVehicleInput>(KeyboardInput{ 1.f, 0.f });
    auto drag = std::make_shared<FakeVehicleInput>(DragInput{ glm::vec2(-0.3f, 0.4f) });

    router.setSource(keyboard);
    EXPECT_FLOAT_EQ(router.poll(0.016f).throttle, 1.f);

    router.setSource(drag);
    const DriveCommand cmd = router.poll(0.016f);
    EXPECT_NEAR(cmd.throttle, 0.5f, 1e-6f);
    EXPECT_FLOAT_EQ(cmd.steering, -0.3f);
    EXPECT_EQ(keyboard->polls, 1);

    router.clearSource();
    EXPECT_FALSE(router.hasSource());
}
