/**
 * @file test_gesture_trigger.cpp
 * @brief Unit tests for the hold-to-arm trigger state machine
 */

#include <gtest/gtest.h>
#include <padpoint/trigger/GestureTrigger.hpp>
#include <padpoint/core/Logger.hpp>
#include <chrono>

using namespace padpoint::trigger;
using padpoint::core::TimePoint;

class GestureTriggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        padpoint::core::Logger::getInstance().setLogLevel(padpoint::core::LogLevel::WARNING);
        t0_ = padpoint::core::Clock::now();
    }

    TriggerInputs holding(int ms, std::uint64_t id = 7, double x = 500.0, double y = 300.0) const {
        TriggerInputs in;
        in.now = t0_ + std::chrono::milliseconds(ms);
        in.pose_valid = true;
        in.has_pointing = true;
        in.pointing_id = id;
        in.pointing_position = cv::Point2d(x, y);
        return in;
    }

    TriggerInputs lifted(int ms) const {
        TriggerInputs in;
        in.now = t0_ + std::chrono::milliseconds(ms);
        in.pose_valid = true;
        return in;
    }

    TimePoint t0_;
};

TEST_F(GestureTriggerTest, StartsIdle) {
    GestureTrigger trigger;
    EXPECT_EQ(trigger.get_phase(), TriggerPhase::IDLE);
    EXPECT_EQ(trigger.evaluate(lifted(0)), TriggerPhase::IDLE);
}

TEST_F(GestureTriggerTest, ArmsExactlyAtThreshold) {
    GestureTrigger trigger;
    EXPECT_EQ(trigger.evaluate(holding(0)), TriggerPhase::HOLDING);
    EXPECT_EQ(trigger.evaluate(holding(349)), TriggerPhase::HOLDING);
    EXPECT_EQ(trigger.evaluate(holding(350)), TriggerPhase::ARMED);
    EXPECT_TRUE(trigger.armed_this_tick());
    EXPECT_EQ(trigger.get_arm_count(), 1u);

    EXPECT_EQ(trigger.evaluate(holding(400)), TriggerPhase::ARMED);
    EXPECT_FALSE(trigger.armed_this_tick());
    EXPECT_EQ(trigger.get_arm_count(), 1u);
}

TEST_F(GestureTriggerTest, EarlyReleaseNeverArms) {
    GestureTrigger trigger;
    trigger.evaluate(holding(0));
    trigger.evaluate(holding(349));
    EXPECT_EQ(trigger.evaluate(lifted(350)), TriggerPhase::IDLE);
    EXPECT_FALSE(trigger.disarmed_this_tick());
    EXPECT_EQ(trigger.get_arm_count(), 0u);
}

TEST_F(GestureTriggerTest, PoseLossBreaksHold) {
    GestureTrigger trigger;
    trigger.evaluate(holding(0));
    TriggerInputs lost = holding(200);
    lost.pose_valid = false;
    EXPECT_EQ(trigger.evaluate(lost), TriggerPhase::IDLE);
}

TEST_F(GestureTriggerTest, MovingBeyondToleranceBreaksHold) {
    GestureTrigger trigger;
    trigger.evaluate(holding(0, 7, 500.0, 300.0));
    EXPECT_EQ(trigger.evaluate(holding(100, 7, 530.0, 300.0)), TriggerPhase::HOLDING);
    EXPECT_EQ(trigger.evaluate(holding(200, 7, 541.0, 300.0)), TriggerPhase::IDLE);
}

TEST_F(GestureTriggerTest, DifferentContactBreaksHold) {
    GestureTrigger trigger;
    trigger.evaluate(holding(0, 7));
    EXPECT_EQ(trigger.evaluate(holding(100, 8)), TriggerPhase::IDLE);
}

TEST_F(GestureTriggerTest, LiftWhileArmedDisarms) {
    GestureTrigger trigger;
    trigger.evaluate(holding(0));
    trigger.evaluate(holding(350));
    ASSERT_EQ(trigger.get_phase(), TriggerPhase::ARMED);

    // Armed pointer may move freely
    EXPECT_EQ(trigger.evaluate(holding(400, 7, 900.0, 50.0)), TriggerPhase::ARMED);

    EXPECT_EQ(trigger.evaluate(lifted(450)), TriggerPhase::IDLE);
    EXPECT_TRUE(trigger.disarmed_this_tick());
    EXPECT_EQ(trigger.get_previous_phase(), TriggerPhase::ARMED);
}

TEST_F(GestureTriggerTest, ZeroHoldArmsImmediately) {
    TriggerConfig config;
    config.gesture_hold_ms = 0;
    GestureTrigger trigger(config);
    EXPECT_EQ(trigger.evaluate(holding(0)), TriggerPhase::ARMED);
    EXPECT_TRUE(trigger.armed_this_tick());
}

TEST_F(GestureTriggerTest, KeyboardModeFollowsKey) {
    TriggerConfig config;
    config.mode = TriggerMode::KEYBOARD;
    GestureTrigger trigger(config);

    // Holding a finger does nothing without the key
    EXPECT_EQ(trigger.evaluate(holding(0)), TriggerPhase::IDLE);
    EXPECT_EQ(trigger.evaluate(holding(1000)), TriggerPhase::IDLE);

    TriggerInputs pressed = lifted(1010);
    pressed.key_pressed = true;
    EXPECT_EQ(trigger.evaluate(pressed), TriggerPhase::ARMED);
    EXPECT_EQ(trigger.evaluate(lifted(1020)), TriggerPhase::IDLE);
    EXPECT_TRUE(trigger.disarmed_this_tick());
}

TEST_F(GestureTriggerTest, BothModeAcceptsEither) {
    TriggerConfig config;
    config.mode = TriggerMode::BOTH;
    GestureTrigger trigger(config);

    trigger.evaluate(holding(0));
    EXPECT_EQ(trigger.evaluate(holding(350)), TriggerPhase::ARMED);
    EXPECT_EQ(trigger.evaluate(lifted(360)), TriggerPhase::IDLE);

    TriggerInputs key = lifted(400);
    key.key_pressed = true;
    EXPECT_EQ(trigger.evaluate(key), TriggerPhase::ARMED);
    EXPECT_EQ(trigger.get_arm_count(), 2u);
}

TEST_F(GestureTriggerTest, InvalidConfigFallsBack) {
    TriggerConfig config;
    config.gesture_hold_ms = -5;
    GestureTrigger trigger(config);
    EXPECT_EQ(trigger.get_config().gesture_hold_ms, 350);
}

TEST_F(GestureTriggerTest, HotkeyOnlyRequiredForKeyboardModes) {
    TriggerConfig config;
    config.hotkey.clear();
    config.gesture_hold_ms = 1000;
    EXPECT_TRUE(config.is_valid());
    EXPECT_EQ(GestureTrigger(config).get_config().gesture_hold_ms, 1000);

    config.mode = TriggerMode::KEYBOARD;
    EXPECT_FALSE(config.is_valid());
    config.mode = TriggerMode::BOTH;
    EXPECT_FALSE(config.is_valid());
}

TEST_F(GestureTriggerTest, ModeNamesParse) {
    TriggerMode mode = TriggerMode::GESTURE;
    EXPECT_TRUE(parse_trigger_mode("keyboard", mode));
    EXPECT_EQ(mode, TriggerMode::KEYBOARD);
    EXPECT_TRUE(parse_trigger_mode("both", mode));
    EXPECT_EQ(mode, TriggerMode::BOTH);
    EXPECT_FALSE(parse_trigger_mode("telepathy", mode));
    EXPECT_EQ(trigger_phase_to_string(TriggerPhase::HOLDING), "Holding");
}
