#include "input/core/InputConstants.h"
#include "input/mapping/AxisDerivation.h"

#include <gtest/gtest.h>

#include <string>

using namespace padmap::input;

TEST(GamepadTypes, SyntheticButtonsFollowMappableOnes) {
    EXPECT_EQ(NUM_BUTTONS, NUM_MAPPED_BUTTONS + NUM_SYNTHETIC_BUTTONS);
    EXPECT_TRUE(isMappableButton(GamepadButton::SPECIAL));
    EXPECT_FALSE(isMappableButton(GamepadButton::LEFT_STICK_UP));
    EXPECT_FALSE(isMappableButton(GamepadButton::RIGHT_STICK_RIGHT));
}

TEST(GamepadTypes, SticksAreConsecutiveAxisPairs) {
    EXPECT_EQ(stickAxisX(GamepadStick::LEFT_STICK), GamepadAxis::LEFT_X);
    EXPECT_EQ(stickAxisY(GamepadStick::LEFT_STICK), GamepadAxis::LEFT_Y);
    EXPECT_EQ(stickAxisX(GamepadStick::RIGHT_STICK), GamepadAxis::RIGHT_X);
    EXPECT_EQ(stickAxisY(GamepadStick::RIGHT_STICK), GamepadAxis::RIGHT_Y);
    EXPECT_EQ(stickAxisX(GamepadStick::DPAD), GamepadAxis::DPAD_X);
    EXPECT_EQ(stickAxisY(GamepadStick::DPAD), GamepadAxis::DPAD_Y);
}

TEST(GamepadTypes, NamesRoundTrip) {
    for (std::size_t i = 0; i < NUM_BUTTONS; ++i) {
        const auto button = static_cast<GamepadButton>(i);
        EXPECT_EQ(gamepadButtonFromString(gamepadButtonToString(button)), button);
    }
    for (std::size_t i = 0; i < NUM_GAMEPAD_TYPES; ++i) {
        const auto type = static_cast<GamepadType>(i);
        EXPECT_EQ(gamepadTypeFromString(gamepadTypeToString(type)), type);
    }

    EXPECT_EQ(gamepadPlatformFromString("Linux"), GamepadPlatform::LINUX);
    EXPECT_EQ(gamepadStickFromString("DPad"), GamepadStick::DPAD);
    EXPECT_EQ(gamepadAxisFromString("RightTrigger"), GamepadAxis::RIGHT_TRIGGER);
    EXPECT_FALSE(gamepadButtonFromString("Jump").has_value());
    EXPECT_STREQ(gamepadAxisToString(static_cast<GamepadAxis>(NUM_AXES)), "Unknown");
}

TEST(GamepadTypes, HandlesCompareById) {
    EXPECT_EQ(GamepadHandle(2, GamepadType::PS4), GamepadHandle(2, GamepadType::XBOX_ONE));
    EXPECT_NE(GamepadHandle(1, GamepadType::PS4), GamepadHandle(2, GamepadType::PS4));
}

TEST(GamepadTypes, GamepadIdValidity) {
    EXPECT_FALSE(isValidGamepadId(ANY_GAMEPAD_ID));
    EXPECT_TRUE(isValidGamepadId(1));
    EXPECT_TRUE(isValidGamepadId(4));
    EXPECT_FALSE(isValidGamepadId(5));
    EXPECT_FALSE(isValidGamepadId(-1));
}

TEST(GamepadTypes, DerivationTableIsSymmetric) {
    for (std::size_t i = 0; i < NUM_AXES; ++i) {
        const auto axis = static_cast<GamepadAxis>(i);

        const auto positive = positiveButtonFromAxis(axis);
        ASSERT_TRUE(positive.has_value());
        const auto fromPositive = derivationFromButton(*positive);
        ASSERT_TRUE(fromPositive.has_value());
        EXPECT_EQ(fromPositive->axis, axis);
        EXPECT_EQ(fromPositive->sign, 1);

        if (const auto negative = negativeButtonFromAxis(axis)) {
            const auto fromNegative = derivationFromButton(*negative);
            ASSERT_TRUE(fromNegative.has_value());
            EXPECT_EQ(fromNegative->axis, axis);
            EXPECT_EQ(fromNegative->sign, -1);
        }
        else {
            EXPECT_TRUE(isTriggerAxis(axis));
        }
    }
}

TEST(GamepadTypes, PlainButtonsHaveNoDerivation) {
    for (const auto button : {GamepadButton::SOUTH, GamepadButton::EAST, GamepadButton::LEFT_SHOULDER,
                              GamepadButton::LEFT_STICK, GamepadButton::BACK, GamepadButton::START,
                              GamepadButton::CENTER, GamepadButton::SPECIAL}) {
        EXPECT_FALSE(derivationFromButton(button).has_value()) << gamepadButtonToString(button);
    }
}
