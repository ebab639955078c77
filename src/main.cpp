// SAMPLE - LOGICAL GAMEPAD POLLING

#include <SDL2/SDL.h>

#include <array>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "./input/GamepadInput.h"
#include "./input/debug/InputLogger.h"
#include "./input/platform/sdl2/SDLJoystickBackend.h"
#include "./input/utils/ConfigLoader.h"

using namespace padmap::input;

/**
 * @brief Polls the configured controls on every configured gamepad and logs them
 */
class PadmapSample {
public:
    PadmapSample() = default;
    ~PadmapSample() = default;

    bool initialize(const std::string& configPath) {
        utils::ConfigLoader loader;
        const auto config = loader.loadFromFile(configPath);
        if (!config) {
            std::cerr << "Failed to load configuration: " << loader.getLastError() << std::endl;
            return false;
        }
        config_ = *config;

        if (!logger_.initialize(config_.toLoggerConfig())) {
            std::cerr << "Failed to initialize logger" << std::endl;
            return false;
        }

        logger_.info("Configuration loaded", configPath);

        if (!backend_.initialize()) {
            logger_.error("Failed to initialize SDL joystick backend", SDL_GetError());
            return false;
        }

        input_ = std::make_unique<GamepadInput>(backend_, nullptr, &logger_, config_.platform);
        input_->setPressThreshold(config_.pressThreshold);

        if (!input_->loadMappingsFromFile(config_.mappingsFile)) {
            logger_.error("Failed to load gamepad mappings", input_->getLastError());
            return false;
        }

        logger_.info(std::string("Using ") + gamepadPlatformToString(config_.platform) + " mappings, " +
                     std::to_string(config_.devices.size()) + " device(s)");
        return true;
    }

    void run() {
        std::uint64_t frame = 0;

        while (backend_.pollEvents()) {
            input_->beginFrame();
            logger_.setFrameNumber(frame);

            for (const auto& device : config_.devices) {
                const GamepadHandle gamepad(device.id, device.type);
                reportConnection(gamepad);
                pollDevice(gamepad);
            }

            ++frame;
            if (config_.sample.frames != 0 && frame >= config_.sample.frames) {
                break;
            }

            SDL_Delay(config_.sample.frameDelayMs);
        }

        logger_.info("Sample finished after " + std::to_string(frame) + " frames");
    }

    void cleanup() {
        input_.reset();
        backend_.shutdown();

        if (logger_.isInitialized()) {
            const auto& stats = logger_.getStatistics();
            logger_.debug("Logger statistics",
                          "entries=" + std::to_string(stats.totalEntries.load()) +
                          " file=" + std::to_string(stats.fileWrites.load()) +
                          " console=" + std::to_string(stats.consoleWrites.load()));
        }
        logger_.shutdown();
    }

private:
    utils::PadmapConfig config_;
    debug::InputLogger logger_;
    SDLJoystickBackend backend_{&logger_};
    std::unique_ptr<GamepadInput> input_;
    std::array<bool, NUM_GAMEPAD_SLOTS> connected_{};

    void reportConnection(const GamepadHandle& gamepad) {
        const bool connected = backend_.isConnected(gamepad.id);
        bool& known = connected_[static_cast<std::size_t>(gamepad.id)];
        if (connected == known) {
            return;
        }

        known = connected;
        const std::string slot = "Gamepad " + std::to_string(gamepad.id);
        if (connected) {
            logger_.info(slot + " connected", backend_.getSlotName(gamepad.id));
        }
        else {
            logger_.info(slot + " disconnected");
        }
    }

    void pollDevice(const GamepadHandle& gamepad) {
        const std::string prefix = std::string("Gamepad ") + std::to_string(gamepad.id) + " (" +
            gamepadTypeToString(gamepad.type) + "): ";

        const auto& sample = config_.sample;
        const char* buttonName = gamepadButtonToString(sample.button);

        if (input_->getButtonDown(sample.button, gamepad)) {
            logger_.info(prefix + buttonName + " pressed");
        }
        if (input_->getButton(sample.button, gamepad)) {
            logger_.debug(prefix + buttonName + " held");
        }
        if (input_->getButtonUp(sample.button, gamepad)) {
            logger_.info(prefix + buttonName + " released");
        }

        if (const float value = input_->getAxis(sample.axis, gamepad); value != 0.0f) {
            logger_.info(prefix + gamepadAxisToString(sample.axis) + " = " + std::to_string(value));
        }

        if (const auto stick = input_->getStick(sample.stick, gamepad); stick.x != 0.0f || stick.y != 0.0f) {
            logger_.info(prefix + gamepadStickToString(sample.stick) + " = (" +
                         std::to_string(stick.x) + ", " + std::to_string(stick.y) + ")");
        }
    }
};

int main(int argc, char* argv[]) {
    std::string configPath = utils::defaults::CONFIG_FILE;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        }
        else {
            std::cerr << "Usage: " << argv[0] << " [--config <path>]" << std::endl;
            return -1;
        }
    }

    PadmapSample sample;

    if (!sample.initialize(configPath)) {
        std::cerr << "\nFailed to initialize sample!" << std::endl;
        sample.cleanup();
        return -1;
    }

    try {
        sample.run();
    } catch (const std::exception& e) {
        std::cerr << "\nException during sample loop: " << e.what() << std::endl;
        sample.cleanup();
        return -1;
    }

    sample.cleanup();
    return 0;
}
