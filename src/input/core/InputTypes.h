/**
 * @file InputTypes.h
 * @brief Core type definitions for the gamepad input system
 * @author Andrés Guerrero
 * @date 10-09-2024
 *
 * Defines the logical identifiers (buttons, axes, sticks), controller families,
 * platforms and device handles used throughout the input system.
 * Platform-agnostic definitions only.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace padmap::input {
    // ============================================================================
    // Type Aliases
    // ============================================================================

    using GamepadID = std::int32_t;
    using RawIndex = std::int32_t;

    // ============================================================================
    // Logical Identifiers
    // ============================================================================

    /**
     * @brief Logical gamepad buttons
     *
     * The first NUM_MAPPED_BUTTONS entries can be bound to a raw button in a
     * mapping table. The trailing stick directions are synthetic and are always
     * derived from their stick axis.
     */
    enum class GamepadButton : std::uint8_t {
        // Face buttons
        SOUTH, // A on Xbox, Cross on PlayStation
        EAST, // B on Xbox, Circle on PlayStation
        WEST, // X on Xbox, Square on PlayStation
        NORTH, // Y on Xbox, Triangle on PlayStation

        // D-Pad
        DPAD_UP,
        DPAD_DOWN,
        DPAD_LEFT,
        DPAD_RIGHT,

        // Left cluster
        LEFT_SHOULDER, // L1
        LEFT_TRIGGER, // L2
        LEFT_STICK, // L3

        // Right cluster
        RIGHT_SHOULDER, // R1
        RIGHT_TRIGGER, // R2
        RIGHT_STICK, // R3

        // Special buttons
        BACK, // Select/Share
        START, // Options
        CENTER, // Xbox/PS button
        SPECIAL, // Capture/Touchpad click

        // Stick directions (synthetic)
        LEFT_STICK_UP,
        LEFT_STICK_DOWN,
        LEFT_STICK_LEFT,
        LEFT_STICK_RIGHT,
        RIGHT_STICK_UP,
        RIGHT_STICK_DOWN,
        RIGHT_STICK_LEFT,
        RIGHT_STICK_RIGHT
    };

    /**
     * @brief Logical gamepad axes
     * Consecutive pairs (2k, 2k+1) form the X/Y components of GamepadStick k.
     */
    enum class GamepadAxis : std::uint8_t {
        LEFT_X,
        LEFT_Y,
        RIGHT_X,
        RIGHT_Y,
        DPAD_X,
        DPAD_Y,
        LEFT_TRIGGER,
        RIGHT_TRIGGER
    };

    /**
     * @brief Logical two-dimensional sticks
     */
    enum class GamepadStick : std::uint8_t {
        LEFT_STICK,
        RIGHT_STICK,
        DPAD
    };

    /**
     * @brief Controller families with distinct raw layouts
     */
    enum class GamepadType : std::uint8_t {
        XBOX_360,
        XBOX_ONE,
        XBOX_SERIES,
        PS2,
        PS3,
        PS4,
        PS5,
        STEAM_CONTROLLER,
        PC_GAMEPAD,
        SWITCH_PRO,
        SWITCH_JOYCON_L,
        SWITCH_JOYCON_R
    };

    /**
     * @brief Operating systems with distinct raw layouts
     */
    enum class GamepadPlatform : std::uint8_t {
        WINDOWS,
        MACOS,
        LINUX
    };

    // ============================================================================
    // Counts
    // ============================================================================

    constexpr std::size_t NUM_BUTTONS = 26;
    constexpr std::size_t NUM_SYNTHETIC_BUTTONS = 8;
    constexpr std::size_t NUM_MAPPED_BUTTONS = NUM_BUTTONS - NUM_SYNTHETIC_BUTTONS;
    constexpr std::size_t NUM_AXES = 8;
    constexpr std::size_t NUM_MAPPED_AXES = NUM_AXES;
    constexpr std::size_t NUM_STICK_AXES = 6; // Axes below this ordinal are signed
    constexpr std::size_t NUM_STICKS = 3;
    constexpr std::size_t NUM_GAMEPAD_TYPES = 12;
    constexpr std::size_t NUM_PLATFORMS = 3;

    static_assert(static_cast<std::size_t>(GamepadButton::RIGHT_STICK_RIGHT) + 1 == NUM_BUTTONS);
    static_assert(static_cast<std::size_t>(GamepadButton::SPECIAL) + 1 == NUM_MAPPED_BUTTONS);
    static_assert(static_cast<std::size_t>(GamepadAxis::RIGHT_TRIGGER) + 1 == NUM_AXES);
    static_assert(static_cast<std::size_t>(GamepadStick::DPAD) + 1 == NUM_STICKS);
    static_assert(static_cast<std::size_t>(GamepadType::SWITCH_JOYCON_R) + 1 == NUM_GAMEPAD_TYPES);
    static_assert(static_cast<std::size_t>(GamepadPlatform::LINUX) + 1 == NUM_PLATFORMS);
    static_assert(NUM_STICKS * 2 == NUM_STICK_AXES);

    // ============================================================================
    // Device Handle
    // ============================================================================

    /**
     * @brief Identifies a physical gamepad slot and the layout it uses
     *
     * Identity is the id alone. The type only selects which mapping entry
     * translates the slot's raw data.
     */
    struct GamepadHandle {
        GamepadID id;
        GamepadType type;

        constexpr GamepadHandle() noexcept
            : id(0)
              , type(GamepadType::XBOX_360) {
        }

        constexpr GamepadHandle(const GamepadID id, const GamepadType type) noexcept
            : id(id)
              , type(type) {
        }

        constexpr bool operator==(const GamepadHandle& other) const noexcept {
            return id == other.id;
        }

        constexpr bool operator!=(const GamepadHandle& other) const noexcept {
            return id != other.id;
        }
    };

    // ============================================================================
    // Ordinal Helpers
    // ============================================================================

    [[nodiscard]] constexpr std::size_t toIndex(GamepadButton button) noexcept {
        return static_cast<std::size_t>(button);
    }

    [[nodiscard]] constexpr std::size_t toIndex(GamepadAxis axis) noexcept {
        return static_cast<std::size_t>(axis);
    }

    [[nodiscard]] constexpr std::size_t toIndex(GamepadStick stick) noexcept {
        return static_cast<std::size_t>(stick);
    }

    [[nodiscard]] constexpr std::size_t toIndex(GamepadType type) noexcept {
        return static_cast<std::size_t>(type);
    }

    [[nodiscard]] constexpr std::size_t toIndex(GamepadPlatform platform) noexcept {
        return static_cast<std::size_t>(platform);
    }

    /**
     * @brief Check if a button can be bound to a raw button index
     */
    [[nodiscard]] constexpr bool isMappableButton(GamepadButton button) noexcept {
        return toIndex(button) < NUM_MAPPED_BUTTONS;
    }

    /**
     * @brief Check if an axis reports in [0, 1] instead of [-1, 1]
     */
    [[nodiscard]] constexpr bool isTriggerAxis(GamepadAxis axis) noexcept {
        return toIndex(axis) >= NUM_STICK_AXES;
    }

    /**
     * @brief Get the horizontal axis of a stick
     */
    [[nodiscard]] constexpr GamepadAxis stickAxisX(GamepadStick stick) noexcept {
        return static_cast<GamepadAxis>(toIndex(stick) * 2);
    }

    /**
     * @brief Get the vertical axis of a stick
     */
    [[nodiscard]] constexpr GamepadAxis stickAxisY(GamepadStick stick) noexcept {
        return static_cast<GamepadAxis>(toIndex(stick) * 2 + 1);
    }

    // ============================================================================
    // String Conversion
    // ============================================================================

    // Names match the column headers and keys used in mapping and config files
    const char* gamepadButtonToString(GamepadButton button) noexcept;
    const char* gamepadAxisToString(GamepadAxis axis) noexcept;
    const char* gamepadStickToString(GamepadStick stick) noexcept;
    const char* gamepadTypeToString(GamepadType type) noexcept;
    const char* gamepadPlatformToString(GamepadPlatform platform) noexcept;

    [[nodiscard]] std::optional<GamepadButton> gamepadButtonFromString(std::string_view name) noexcept;
    [[nodiscard]] std::optional<GamepadAxis> gamepadAxisFromString(std::string_view name) noexcept;
    [[nodiscard]] std::optional<GamepadStick> gamepadStickFromString(std::string_view name) noexcept;
    [[nodiscard]] std::optional<GamepadType> gamepadTypeFromString(std::string_view name) noexcept;
    [[nodiscard]] std::optional<GamepadPlatform> gamepadPlatformFromString(std::string_view name) noexcept;

    /**
     * @brief Platform this binary was compiled for
     */
    [[nodiscard]] constexpr GamepadPlatform nativePlatform() noexcept {
#if defined(_WIN32)
        return GamepadPlatform::WINDOWS;
#elif defined(__APPLE__)
        return GamepadPlatform::MACOS;
#else
        return GamepadPlatform::LINUX;
#endif
    }
} // namespace padmap::input
