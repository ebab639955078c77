/**
 * @file InputConstants.h
 * @brief Compile-time constants for the input system
 * @author Game Engine Team
 * @date 2024
 *
 * Central location for input system constants to avoid magic numbers
 * and ensure consistency across the codebase.
 */

#pragma once

#include "InputTypes.h"

#include <cstdint>

namespace padmap::input {
    // ============================================================================
    // Gamepad Slots
    // ============================================================================

    // Slot 0 addresses "any gamepad" and never holds raw data
    constexpr GamepadID ANY_GAMEPAD_ID = 0;
    constexpr GamepadID MIN_GAMEPAD_ID = 1;
    constexpr GamepadID MAX_GAMEPAD_ID = 4;
    constexpr std::size_t NUM_GAMEPAD_SLOTS = MAX_GAMEPAD_ID + 1; // 5

    // ============================================================================
    // Raw Layout
    // ============================================================================

    constexpr RawIndex MIN_RAW_BUTTON_ID = 0;
    constexpr RawIndex MAX_RAW_BUTTON_ID = 19;
    constexpr std::size_t NUM_RAW_BUTTONS = MAX_RAW_BUTTON_ID + 1; // 20

    constexpr RawIndex MIN_RAW_AXIS_ID = 0;
    constexpr RawIndex MAX_RAW_AXIS_ID = 12;
    constexpr std::size_t NUM_RAW_AXES = MAX_RAW_AXIS_ID + 1; // 13

    constexpr RawIndex UNMAPPED_INDEX = -1;

    // ============================================================================
    // Default Values
    // ============================================================================

    // Remapped axis magnitude at which a derived button reports pressed
    constexpr float DEFAULT_AXIS_PRESS_THRESHOLD = 0.3f;

    // ============================================================================
    // Validation Helpers
    // ============================================================================

    [[nodiscard]] constexpr bool isValidGamepadId(const GamepadID id) noexcept {
        return MIN_GAMEPAD_ID <= id && id <= MAX_GAMEPAD_ID;
    }

    [[nodiscard]] constexpr bool isValidRawButton(const RawIndex index) noexcept {
        return 0 <= index && index < static_cast<RawIndex>(NUM_RAW_BUTTONS);
    }

    [[nodiscard]] constexpr bool isValidRawAxis(const RawIndex index) noexcept {
        return 0 <= index && index < static_cast<RawIndex>(NUM_RAW_AXES);
    }
} // namespace padmap::input
