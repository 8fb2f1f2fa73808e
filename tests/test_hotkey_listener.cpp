/**
 * @file test_hotkey_listener.cpp
 * @brief Tests for hotkey name parsing
 */

#include <gtest/gtest.h>
#include <padpoint/io/HotkeyListener.hpp>
#include <padpoint/core/Logger.hpp>
#include <padpoint/core/exception.hpp>
#include <linux/input.h>

using padpoint::io::HotkeyListener;
using padpoint::core::ConfigException;

class HotkeyListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        padpoint::core::Logger::getInstance().setLogLevel(padpoint::core::LogLevel::WARNING);
    }
};

TEST_F(HotkeyListenerTest, ParsesKeyNames) {
    EXPECT_EQ(HotkeyListener::parseKeyCode("KEY_SPACE"), KEY_SPACE);
    EXPECT_EQ(HotkeyListener::parseKeyCode("KEY_F12"), KEY_F12);
    EXPECT_EQ(HotkeyListener::parseKeyCode("KEY_LEFTCTRL"), KEY_LEFTCTRL);
}

TEST_F(HotkeyListenerTest, ParsesNumericCodes) {
    EXPECT_EQ(HotkeyListener::parseKeyCode("57"), 57);
    EXPECT_EQ(HotkeyListener::parseKeyCode("1"), 1);
}

TEST_F(HotkeyListenerTest, RejectsUnknownOrOutOfRange) {
    EXPECT_THROW(HotkeyListener::parseKeyCode(""), ConfigException);
    EXPECT_THROW(HotkeyListener::parseKeyCode("KEY_NOPE"), ConfigException);
    EXPECT_THROW(HotkeyListener::parseKeyCode("key_space"), ConfigException);
    EXPECT_THROW(HotkeyListener::parseKeyCode("0"), ConfigException);
    EXPECT_THROW(HotkeyListener::parseKeyCode("-3"), ConfigException);
    EXPECT_THROW(HotkeyListener::parseKeyCode(std::to_string(KEY_MAX + 1)), ConfigException);
    EXPECT_THROW(HotkeyListener::parseKeyCode("99999999999999999999"), ConfigException);
}
