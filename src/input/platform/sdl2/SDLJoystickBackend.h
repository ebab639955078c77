/**
 * @file SDLJoystickBackend.h
 * @brief SDL2 raw joystick backend
 * @author Andrés Guerrero
 * @date 13-09-2025
 *
 * Exposes SDL joysticks as raw button and axis slots. No layout translation
 * happens here; SDL's own game controller mappings are deliberately bypassed
 * so the mapping table sees the device's native indices.
 */

#pragma once

#include "../../core/InputConstants.h"
#include "../../devices/base/IRawInputBackend.h"

#include <SDL2/SDL.h>

#include <array>
#include <mutex>
#include <string>

namespace padmap::input {
    namespace debug {
        class InputLogger;
    }

    /**
     * @brief SDL backend configuration
     */
    struct SDLBackendConfig {
        // SDL initialization flags
        Uint32 sdlInitFlags = SDL_INIT_EVENTS | SDL_INIT_JOYSTICK;

        // Event processing
        std::uint32_t maxEventsPerPoll = 64;

        // Open joysticks already present at initialization
        bool openAttachedJoysticks = true;
    };

    /**
     * @brief Raw input from SDL joysticks
     *
     * Joysticks are assigned to slots 1..4 in connection order. Raw axis slot
     * k reads SDL axis k - 1 normalized to [-1, 1]; slot 0 always reads 0.
     * Empty or disconnected slots report released buttons and zero axes.
     */
    class SDLJoystickBackend final : public IRawInputBackend {
    public:
        explicit SDLJoystickBackend(debug::InputLogger* logger = nullptr) noexcept;
        ~SDLJoystickBackend() override;

        // Disable copy and move, joystick handles are owned
        SDLJoystickBackend(const SDLJoystickBackend&) = delete;
        SDLJoystickBackend& operator=(const SDLJoystickBackend&) = delete;
        SDLJoystickBackend(SDLJoystickBackend&&) = delete;
        SDLJoystickBackend& operator=(SDLJoystickBackend&&) = delete;

        // ============================================================================
        // Lifecycle
        // ============================================================================

        /**
         * @brief Initialize SDL subsystems and open attached joysticks
         * @return False if SDL failed to initialize
         */
        bool initialize(const SDLBackendConfig& config = {});

        /**
         * @brief Close every joystick and quit SDL subsystems
         */
        void shutdown();

        [[nodiscard]] bool isInitialized() const noexcept { return initialized_; }

        /**
         * @brief Pump SDL events, opening and closing joysticks as they change
         * @return False once SDL reports a quit request
         */
        bool pollEvents();

        // ============================================================================
        // IRawInputBackend
        // ============================================================================

        [[nodiscard]] bool isButtonDown(GamepadID gamepadId, RawIndex button) const override;
        [[nodiscard]] float getAxisRaw(GamepadID gamepadId, RawIndex axis) const override;
        [[nodiscard]] const char* getName() const noexcept override { return "SDL2 Joystick"; }

        // ============================================================================
        // Slot Information
        // ============================================================================

        [[nodiscard]] bool isConnected(GamepadID gamepadId) const;

        /**
         * @brief Get the SDL name of the joystick in a slot, empty if none
         */
        [[nodiscard]] std::string getSlotName(GamepadID gamepadId) const;

    private:
        debug::InputLogger* logger_;
        SDLBackendConfig config_;
        bool initialized_ = false;

        // Index 0 is never populated
        std::array<SDL_Joystick*, NUM_GAMEPAD_SLOTS> slots_{};
        mutable std::mutex slotMutex_;

        void scanDevices();
        void openJoystick(int deviceIndex);
        void closeJoystick(SDL_JoystickID instanceId);

        [[nodiscard]] SDL_Joystick* getJoystick(GamepadID gamepadId) const;
    };
} // namespace padmap::input
