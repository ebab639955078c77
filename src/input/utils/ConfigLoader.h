/**
 * @file ConfigLoader.h
 * @brief JSON configuration loading for the gamepad library and sample
 * @author Andrés Guerrero
 * @date 14-09-2024
 *
 * Parse and schema errors are recorded in a bounded error queue and the load
 * returns nullopt. Missing keys keep their defaults.
 */

#pragma once

#include "../core/InputConstants.h"
#include "../debug/InputLogger.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace padmap::input::utils {
    /**
     * @brief Gamepad slot the host application polls
     */
    struct DeviceConfig {
        GamepadID id = MIN_GAMEPAD_ID;
        GamepadType type = GamepadType::XBOX_360;
    };

    /**
     * @brief Logger settings
     */
    struct LoggingConfig {
        debug::LogLevel level = debug::LogLevel::INFO;
        debug::LogFormat format = debug::LogFormat::TEXT;
        bool console = true;
        bool file = false;
        std::string filePath = "padmap.log";
        bool timestamps = true;
        bool frameNumbers = true;
        bool flushEachEntry = false;
    };

    /**
     * @brief Controls watched by the sample application
     */
    struct SampleConfig {
        GamepadButton button = GamepadButton::SOUTH;
        GamepadAxis axis = GamepadAxis::DPAD_X;
        GamepadStick stick = GamepadStick::LEFT_STICK;
        std::uint32_t frames = 0; // 0 runs until quit
        std::uint32_t frameDelayMs = 16;
    };

    /**
     * @brief Complete configuration
     */
    struct PadmapConfig {
        GamepadPlatform platform = nativePlatform();
        std::string mappingsFile = "data/gamepad_mappings.tsv";
        float pressThreshold = DEFAULT_AXIS_PRESS_THRESHOLD;
        std::vector<DeviceConfig> devices{DeviceConfig{}};
        LoggingConfig logging;
        SampleConfig sample;

        /**
         * @brief Build the logger configuration for these settings
         */
        [[nodiscard]] debug::LoggerConfig toLoggerConfig() const;
    };

    /**
     * @brief Error information
     */
    struct ErrorInfo {
        std::string message;
        std::chrono::steady_clock::time_point timestamp;

        explicit ErrorInfo(std::string msg)
            : message(std::move(msg))
              , timestamp(std::chrono::steady_clock::now()) {
        }
    };

    /**
     * @brief Configuration loader
     */
    class ConfigLoader {
    public:
        ConfigLoader() = default;
        ~ConfigLoader() = default;

        // Disable copy and move, the error queue is guarded by a mutex
        ConfigLoader(const ConfigLoader&) = delete;
        ConfigLoader& operator=(const ConfigLoader&) = delete;
        ConfigLoader(ConfigLoader&&) = delete;
        ConfigLoader& operator=(ConfigLoader&&) = delete;

        // ============================================================================
        // Loading and Saving
        // ============================================================================

        /**
         * @brief Load configuration from a JSON file
         * @return Configuration, or nullopt when unreadable or invalid
         */
        [[nodiscard]] std::optional<PadmapConfig> loadFromFile(const std::filesystem::path& path) const;

        /**
         * @brief Load configuration from JSON text
         */
        [[nodiscard]] std::optional<PadmapConfig> loadFromString(const std::string& data) const;

        /**
         * @brief Write configuration as JSON
         * @param createBackup Copy an existing file to <path>.backup first
         */
        bool saveToFile(const PadmapConfig& config,
                        const std::filesystem::path& path,
                        bool createBackup = true) const;

        [[nodiscard]] static std::string serialize(const PadmapConfig& config);

        // ============================================================================
        // Error Handling
        // ============================================================================

        [[nodiscard]] std::vector<ErrorInfo> getErrors(std::size_t maxErrors = 100) const;
        [[nodiscard]] std::string getLastError() const;
        [[nodiscard]] bool hasErrors() const;
        void clearErrors();

    private:
        mutable std::queue<ErrorInfo> errorQueue_;
        mutable std::mutex errorMutex_;
        static constexpr std::size_t MAX_ERROR_QUEUE_SIZE = 64;

        void recordError(const std::string& message) const;

        [[nodiscard]] std::optional<PadmapConfig> parseJSON(const std::string& data) const;

        [[nodiscard]] static std::optional<std::string> readFileContents(const std::filesystem::path& path);
        static bool writeFileContents(const std::filesystem::path& path,
                                      const std::string& content,
                                      bool createBackup);
    };

    namespace defaults {
        constexpr auto CONFIG_FILE = "config/padmap.json";
    }
} // namespace padmap::input::utils
