/**
 * @file InputTypes.cpp
 * @brief Name tables for the logical input identifiers
 * @author Andrés Guerrero
 * @date 10-09-2024
 */

#include "InputTypes.h"

#include <array>

namespace padmap::input {
    namespace {
        constexpr std::array<const char*, NUM_BUTTONS> BUTTON_NAMES = {
            "South", "East", "West", "North",
            "DPad_Up", "DPad_Down", "DPad_Left", "DPad_Right",
            "LeftShoulder", "LeftTrigger", "LeftStick",
            "RightShoulder", "RightTrigger", "RightStick",
            "Back", "Start", "Center", "Special",
            "LeftStick_Up", "LeftStick_Down", "LeftStick_Left", "LeftStick_Right",
            "RightStick_Up", "RightStick_Down", "RightStick_Left", "RightStick_Right"
        };

        constexpr std::array<const char*, NUM_AXES> AXIS_NAMES = {
            "LeftX", "LeftY",
            "RightX", "RightY",
            "DPadX", "DPadY",
            "LeftTrigger", "RightTrigger"
        };

        constexpr std::array<const char*, NUM_STICKS> STICK_NAMES = {
            "LeftStick", "RightStick", "DPad"
        };

        constexpr std::array<const char*, NUM_GAMEPAD_TYPES> TYPE_NAMES = {
            "Xbox360", "XboxOne", "XboxSeries",
            "PS2", "PS3", "PS4", "PS5",
            "SteamController", "PcGamepad",
            "SwitchPro", "SwitchJoyconL", "SwitchJoyconR"
        };

        constexpr std::array<const char*, NUM_PLATFORMS> PLATFORM_NAMES = {
            "Windows", "MacOS", "Linux"
        };

        template <typename Enum, std::size_t N>
        std::optional<Enum> lookup(const std::array<const char*, N>& names, const std::string_view name) noexcept {
            for (std::size_t i = 0; i < N; ++i) {
                if (name == names[i]) {
                    return static_cast<Enum>(i);
                }
            }
            return std::nullopt;
        }

        template <std::size_t N>
        const char* nameAt(const std::array<const char*, N>& names, const std::size_t index) noexcept {
            return index < N ? names[index] : "Unknown";
        }
    }

    const char* gamepadButtonToString(const GamepadButton button) noexcept {
        return nameAt(BUTTON_NAMES, toIndex(button));
    }

    const char* gamepadAxisToString(const GamepadAxis axis) noexcept {
        return nameAt(AXIS_NAMES, toIndex(axis));
    }

    const char* gamepadStickToString(const GamepadStick stick) noexcept {
        return nameAt(STICK_NAMES, toIndex(stick));
    }

    const char* gamepadTypeToString(const GamepadType type) noexcept {
        return nameAt(TYPE_NAMES, toIndex(type));
    }

    const char* gamepadPlatformToString(const GamepadPlatform platform) noexcept {
        return nameAt(PLATFORM_NAMES, toIndex(platform));
    }

    std::optional<GamepadButton> gamepadButtonFromString(const std::string_view name) noexcept {
        return lookup<GamepadButton>(BUTTON_NAMES, name);
    }

    std::optional<GamepadAxis> gamepadAxisFromString(const std::string_view name) noexcept {
        return lookup<GamepadAxis>(AXIS_NAMES, name);
    }

    std::optional<GamepadStick> gamepadStickFromString(const std::string_view name) noexcept {
        return lookup<GamepadStick>(STICK_NAMES, name);
    }

    std::optional<GamepadType> gamepadTypeFromString(const std::string_view name) noexcept {
        return lookup<GamepadType>(TYPE_NAMES, name);
    }

    std::optional<GamepadPlatform> gamepadPlatformFromString(const std::string_view name) noexcept {
        return lookup<GamepadPlatform>(PLATFORM_NAMES, name);
    }
} // namespace padmap::input
