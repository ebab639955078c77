/**
 * @file SDLJoystickBackend.cpp
 * @brief SDL2 raw joystick backend implementation
 * @author Andrés Guerrero
 * @date 13-09-2025
 */

#include "SDLJoystickBackend.h"

#include "../../debug/InputLogger.h"

#include <algorithm>

namespace padmap::input {
    namespace {
        constexpr float AXIS_SCALE = 1.0f / 32767.0f;
    }

    SDLJoystickBackend::SDLJoystickBackend(debug::InputLogger* logger) noexcept
        : logger_(logger) {
    }

    SDLJoystickBackend::~SDLJoystickBackend() {
        shutdown();
    }

    // ============================================================================
    // Lifecycle
    // ============================================================================

    bool SDLJoystickBackend::initialize(const SDLBackendConfig& config) {
        if (initialized_) {
            return false;
        }

        config_ = config;

        if (SDL_InitSubSystem(config_.sdlInitFlags) != 0) {
            if (logger_) {
                logger_->log(debug::LogLevel::ERROR, debug::LogEntryType::DEVICE,
                             "Failed to initialize SDL", "Device", SDL_GetError());
            }
            return false;
        }

        initialized_ = true;

        if (config_.openAttachedJoysticks) {
            scanDevices();
        }

        return true;
    }

    void SDLJoystickBackend::shutdown() {
        if (!initialized_) {
            return;
        }

        {
            std::lock_guard lock(slotMutex_);
            for (auto& joystick : slots_) {
                if (joystick) {
                    SDL_JoystickClose(joystick);
                    joystick = nullptr;
                }
            }
        }

        SDL_QuitSubSystem(config_.sdlInitFlags);
        initialized_ = false;
    }

    bool SDLJoystickBackend::pollEvents() {
        if (!initialized_) {
            return false;
        }

        bool running = true;
        SDL_Event event;
        std::uint32_t processed = 0;

        while (processed < config_.maxEventsPerPoll && SDL_PollEvent(&event)) {
            ++processed;

            switch (event.type) {
            case SDL_QUIT:
                running = false;
                break;
            case SDL_JOYDEVICEADDED:
                openJoystick(event.jdevice.which);
                break;
            case SDL_JOYDEVICEREMOVED:
                closeJoystick(event.jdevice.which);
                break;
            default:
                break;
            }
        }

        // Joystick state is refreshed by the event pump
        SDL_PumpEvents();
        return running;
    }

    // ============================================================================
    // IRawInputBackend
    // ============================================================================

    bool SDLJoystickBackend::isButtonDown(const GamepadID gamepadId, const RawIndex button) const {
        SDL_Joystick* joystick = getJoystick(gamepadId);
        if (!joystick || button < 0 || button >= SDL_JoystickNumButtons(joystick)) {
            return false;
        }
        return SDL_JoystickGetButton(joystick, button) == 1;
    }

    float SDLJoystickBackend::getAxisRaw(const GamepadID gamepadId, const RawIndex axis) const {
        // Raw axis numbering is one-based, slot 0 has no SDL axis behind it
        const int sdlAxis = axis - 1;

        SDL_Joystick* joystick = getJoystick(gamepadId);
        if (!joystick || sdlAxis < 0 || sdlAxis >= SDL_JoystickNumAxes(joystick)) {
            return 0.0f;
        }

        const float value = static_cast<float>(SDL_JoystickGetAxis(joystick, sdlAxis)) * AXIS_SCALE;
        return std::clamp(value, -1.0f, 1.0f);
    }

    // ============================================================================
    // Slot Information
    // ============================================================================

    bool SDLJoystickBackend::isConnected(const GamepadID gamepadId) const {
        return getJoystick(gamepadId) != nullptr;
    }

    std::string SDLJoystickBackend::getSlotName(const GamepadID gamepadId) const {
        SDL_Joystick* joystick = getJoystick(gamepadId);
        if (!joystick) {
            return {};
        }
        const char* name = SDL_JoystickName(joystick);
        return name ? name : "";
    }

    // ============================================================================
    // Private Implementation
    // ============================================================================

    void SDLJoystickBackend::scanDevices() {
        const int numJoysticks = SDL_NumJoysticks();
        for (int i = 0; i < numJoysticks; ++i) {
            openJoystick(i);
        }
    }

    void SDLJoystickBackend::openJoystick(const int deviceIndex) {
        // Added events for joysticks opened by scanDevices() arrive as well
        const SDL_JoystickID instanceId = SDL_JoystickGetDeviceInstanceID(deviceIndex);

        std::lock_guard lock(slotMutex_);

        for (GamepadID id = MIN_GAMEPAD_ID; id <= MAX_GAMEPAD_ID; ++id) {
            SDL_Joystick* joystick = slots_[static_cast<std::size_t>(id)];
            if (joystick && SDL_JoystickInstanceID(joystick) == instanceId) {
                return;
            }
        }

        const auto freeSlot = std::find(slots_.begin() + MIN_GAMEPAD_ID, slots_.end(), nullptr);
        if (freeSlot == slots_.end()) {
            if (logger_) {
                logger_->log(debug::LogLevel::WARNING, debug::LogEntryType::DEVICE,
                             "No free gamepad slot, joystick ignored", "Device",
                             "device index " + std::to_string(deviceIndex));
            }
            return;
        }

        SDL_Joystick* joystick = SDL_JoystickOpen(deviceIndex);
        if (!joystick) {
            if (logger_) {
                logger_->log(debug::LogLevel::ERROR, debug::LogEntryType::DEVICE,
                             "Failed to open joystick", "Device", SDL_GetError());
            }
            return;
        }

        *freeSlot = joystick;

        if (logger_) {
            const char* name = SDL_JoystickName(joystick);
            logger_->log(debug::LogLevel::INFO, debug::LogEntryType::DEVICE,
                         "Joystick opened in slot " + std::to_string(freeSlot - slots_.begin()),
                         "Device",
                         std::string(name ? name : "unnamed") + ", " +
                         std::to_string(SDL_JoystickNumButtons(joystick)) + " buttons, " +
                         std::to_string(SDL_JoystickNumAxes(joystick)) + " axes");
        }
    }

    void SDLJoystickBackend::closeJoystick(const SDL_JoystickID instanceId) {
        std::lock_guard lock(slotMutex_);

        for (GamepadID id = MIN_GAMEPAD_ID; id <= MAX_GAMEPAD_ID; ++id) {
            SDL_Joystick*& joystick = slots_[static_cast<std::size_t>(id)];
            if (joystick && SDL_JoystickInstanceID(joystick) == instanceId) {
                SDL_JoystickClose(joystick);
                joystick = nullptr;

                if (logger_) {
                    logger_->log(debug::LogLevel::INFO, debug::LogEntryType::DEVICE,
                                 "Joystick closed in slot " + std::to_string(id), "Device");
                }
                return;
            }
        }
    }

    SDL_Joystick* SDLJoystickBackend::getJoystick(const GamepadID gamepadId) const {
        if (!isValidGamepadId(gamepadId)) {
            return nullptr;
        }

        std::lock_guard lock(slotMutex_);
        SDL_Joystick* joystick = slots_[static_cast<std::size_t>(gamepadId)];
        return joystick && SDL_JoystickGetAttached(joystick) ? joystick : nullptr;
    }
} // namespace padmap::input
