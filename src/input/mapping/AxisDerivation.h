/**
 * @file AxisDerivation.h
 * @brief Button/axis pairing used to derive one from the other
 * @author Andrés Guerrero
 * @date 15-09-2025
 *
 * Every signed axis is paired with a negative and a positive button. Triggers
 * only have a positive button. When a mapping lacks a direct binding, a button
 * is read from its axis, or an axis is built from its two buttons.
 */

#pragma once

#include "../core/InputTypes.h"

#include <optional>

namespace padmap::input {
    /**
     * @brief Axis and direction a button represents
     */
    struct ButtonDerivation {
        GamepadAxis axis;
        int sign; // -1 or +1
    };

    /**
     * @brief Get the axis a button can be derived from
     * @return Axis and sign, or nullopt for buttons with no axis
     */
    [[nodiscard]] constexpr std::optional<ButtonDerivation> derivationFromButton(const GamepadButton button) noexcept {
        switch (button) {
        case GamepadButton::LEFT_TRIGGER: return ButtonDerivation{GamepadAxis::LEFT_TRIGGER, +1};
        case GamepadButton::RIGHT_TRIGGER: return ButtonDerivation{GamepadAxis::RIGHT_TRIGGER, +1};

        case GamepadButton::DPAD_UP: return ButtonDerivation{GamepadAxis::DPAD_Y, +1};
        case GamepadButton::DPAD_DOWN: return ButtonDerivation{GamepadAxis::DPAD_Y, -1};
        case GamepadButton::DPAD_LEFT: return ButtonDerivation{GamepadAxis::DPAD_X, -1};
        case GamepadButton::DPAD_RIGHT: return ButtonDerivation{GamepadAxis::DPAD_X, +1};

        case GamepadButton::LEFT_STICK_UP: return ButtonDerivation{GamepadAxis::LEFT_Y, +1};
        case GamepadButton::LEFT_STICK_DOWN: return ButtonDerivation{GamepadAxis::LEFT_Y, -1};
        case GamepadButton::LEFT_STICK_LEFT: return ButtonDerivation{GamepadAxis::LEFT_X, -1};
        case GamepadButton::LEFT_STICK_RIGHT: return ButtonDerivation{GamepadAxis::LEFT_X, +1};

        case GamepadButton::RIGHT_STICK_UP: return ButtonDerivation{GamepadAxis::RIGHT_Y, +1};
        case GamepadButton::RIGHT_STICK_DOWN: return ButtonDerivation{GamepadAxis::RIGHT_Y, -1};
        case GamepadButton::RIGHT_STICK_LEFT: return ButtonDerivation{GamepadAxis::RIGHT_X, -1};
        case GamepadButton::RIGHT_STICK_RIGHT: return ButtonDerivation{GamepadAxis::RIGHT_X, +1};

        default: return std::nullopt;
        }
    }

    /**
     * @brief Get the button pushing an axis towards its negative end
     * @return Button, or nullopt for triggers
     */
    [[nodiscard]] constexpr std::optional<GamepadButton> negativeButtonFromAxis(const GamepadAxis axis) noexcept {
        switch (axis) {
        case GamepadAxis::LEFT_X: return GamepadButton::LEFT_STICK_LEFT;
        case GamepadAxis::LEFT_Y: return GamepadButton::LEFT_STICK_DOWN;
        case GamepadAxis::RIGHT_X: return GamepadButton::RIGHT_STICK_LEFT;
        case GamepadAxis::RIGHT_Y: return GamepadButton::RIGHT_STICK_DOWN;
        case GamepadAxis::DPAD_X: return GamepadButton::DPAD_LEFT;
        case GamepadAxis::DPAD_Y: return GamepadButton::DPAD_DOWN;
        default: return std::nullopt;
        }
    }

    /**
     * @brief Get the button pushing an axis towards its positive end
     */
    [[nodiscard]] constexpr std::optional<GamepadButton> positiveButtonFromAxis(const GamepadAxis axis) noexcept {
        switch (axis) {
        case GamepadAxis::LEFT_X: return GamepadButton::LEFT_STICK_RIGHT;
        case GamepadAxis::LEFT_Y: return GamepadButton::LEFT_STICK_UP;
        case GamepadAxis::RIGHT_X: return GamepadButton::RIGHT_STICK_RIGHT;
        case GamepadAxis::RIGHT_Y: return GamepadButton::RIGHT_STICK_UP;
        case GamepadAxis::DPAD_X: return GamepadButton::DPAD_RIGHT;
        case GamepadAxis::DPAD_Y: return GamepadButton::DPAD_UP;
        case GamepadAxis::LEFT_TRIGGER: return GamepadButton::LEFT_TRIGGER;
        case GamepadAxis::RIGHT_TRIGGER: return GamepadButton::RIGHT_TRIGGER;
        default: return std::nullopt;
        }
    }
} // namespace padmap::input
