/**
 * @file GamepadState.h
 * @brief Raw gamepad state captured at one instant
 * @author Andrés Guerrero
 * @date 12-09-2025
 *
 * Layout-agnostic capture of every raw button and raw axis of one slot.
 * Logical meaning is only attached later through a mapping entry.
 */

#pragma once

#include "../../core/InputConstants.h"

#include <bitset>
#include <array>

namespace padmap::input {
    /**
     * @brief Raw state of one gamepad slot
     */
    struct GamepadRawState {
        GamepadID gamepadId;

        // Raw button states, indexed by raw button id
        std::bitset<NUM_RAW_BUTTONS> buttons;

        // Raw axis values as reported by the backend, indexed by raw axis id
        std::array<float, NUM_RAW_AXES> axes{};

        GamepadRawState() noexcept
            : gamepadId(ANY_GAMEPAD_ID) {
            axes.fill(0.0f);
        }

        /**
         * @brief Check if raw button is down
         * Out-of-range indices report released.
         */
        [[nodiscard]] bool isButtonDown(const RawIndex index) const noexcept {
            return isValidRawButton(index) && buttons[static_cast<std::size_t>(index)];
        }

        /**
         * @brief Get raw axis value
         * Out-of-range indices report 0.
         */
        [[nodiscard]] float getAxis(const RawIndex index) const noexcept {
            return isValidRawAxis(index) ? axes[static_cast<std::size_t>(index)] : 0.0f;
        }

        /**
         * @brief Reset to neutral
         */
        void reset() noexcept {
            buttons.reset();
            axes.fill(0.0f);
        }
    };
} // namespace padmap::input
