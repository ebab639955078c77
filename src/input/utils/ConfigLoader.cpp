/**
 * @file ConfigLoader.cpp
 * @brief JSON configuration loading implementation
 * @author Andrés Guerrero
 * @date 14-09-2024
 */

#include "ConfigLoader.h"

#include <cmath>
#include <fstream>
#include <sstream>

// Using nlohmann/json for JSON parsing
#include <nlohmann/json.hpp>

namespace padmap::input::utils {
    using json = nlohmann::json;

    namespace {
        /**
         * @brief Resolve an enum name, recording an error for unknown names
         */
        template <typename Enum, typename Lookup>
        bool readEnum(const json& object, const char* key, Enum& out, Lookup lookup, std::string& error) {
            if (!object.contains(key)) {
                return true;
            }

            const auto name = object.at(key).get<std::string>();
            if (const auto value = lookup(name)) {
                out = *value;
                return true;
            }

            error = "Unknown value '" + name + "' for '" + key + "'";
            return false;
        }
    }

    debug::LoggerConfig PadmapConfig::toLoggerConfig() const {
        debug::LoggerConfig config;
        config.minLevel = logging.level;
        config.format = logging.format;
        config.logToConsole = logging.console;
        config.logToFile = logging.file;
        config.logFilePath = logging.filePath;
        config.includeTimestamp = logging.timestamps;
        config.includeFrameNumber = logging.frameNumbers;
        config.flushImmediately = logging.flushEachEntry;
        return config;
    }

    // ============================================================================
    // Loading and Saving
    // ============================================================================

    std::optional<PadmapConfig> ConfigLoader::loadFromFile(const std::filesystem::path& path) const {
        const auto contents = readFileContents(path);
        if (!contents) {
            recordError("Failed to read configuration file: " + path.string());
            return std::nullopt;
        }

        auto config = parseJSON(*contents);
        if (!config) {
            recordError("Invalid configuration file: " + path.string());
        }
        return config;
    }

    std::optional<PadmapConfig> ConfigLoader::loadFromString(const std::string& data) const {
        return parseJSON(data);
    }

    bool ConfigLoader::saveToFile(const PadmapConfig& config,
                                  const std::filesystem::path& path,
                                  const bool createBackup) const {
        if (!writeFileContents(path, serialize(config), createBackup)) {
            recordError("Failed to write configuration file: " + path.string());
            return false;
        }
        return true;
    }

    std::string ConfigLoader::serialize(const PadmapConfig& config) {
        json j;
        j["platform"] = gamepadPlatformToString(config.platform);
        j["mappingsFile"] = config.mappingsFile;
        j["pressThreshold"] = config.pressThreshold;

        j["devices"] = json::array();
        for (const auto& device : config.devices) {
            j["devices"].push_back({
                {"id", device.id},
                {"type", gamepadTypeToString(device.type)}
            });
        }

        j["logging"] = {
            {"level", debug::logLevelToString(config.logging.level)},
            {"format", debug::logFormatToString(config.logging.format)},
            {"console", config.logging.console},
            {"file", config.logging.file},
            {"filePath", config.logging.filePath},
            {"timestamps", config.logging.timestamps},
            {"frameNumbers", config.logging.frameNumbers},
            {"flushEachEntry", config.logging.flushEachEntry}
        };

        j["sample"] = {
            {"button", gamepadButtonToString(config.sample.button)},
            {"axis", gamepadAxisToString(config.sample.axis)},
            {"stick", gamepadStickToString(config.sample.stick)},
            {"frames", config.sample.frames},
            {"frameDelayMs", config.sample.frameDelayMs}
        };

        return j.dump(2);
    }

    // ============================================================================
    // Error Handling
    // ============================================================================

    void ConfigLoader::recordError(const std::string& message) const {
        std::lock_guard lock(errorMutex_);

        if (errorQueue_.size() >= MAX_ERROR_QUEUE_SIZE) {
            errorQueue_.pop();
        }

        errorQueue_.emplace(message);
    }

    std::vector<ErrorInfo> ConfigLoader::getErrors(const std::size_t maxErrors) const {
        std::lock_guard lock(errorMutex_);
        std::vector<ErrorInfo> errors;

        std::queue<ErrorInfo> tempQueue = errorQueue_;
        while (!tempQueue.empty() && errors.size() < maxErrors) {
            errors.push_back(tempQueue.front());
            tempQueue.pop();
        }

        return errors;
    }

    std::string ConfigLoader::getLastError() const {
        std::lock_guard lock(errorMutex_);
        return errorQueue_.empty() ? std::string() : errorQueue_.back().message;
    }

    bool ConfigLoader::hasErrors() const {
        std::lock_guard lock(errorMutex_);
        return !errorQueue_.empty();
    }

    void ConfigLoader::clearErrors() {
        std::lock_guard lock(errorMutex_);
        while (!errorQueue_.empty()) {
            errorQueue_.pop();
        }
    }

    // ============================================================================
    // Private Implementation
    // ============================================================================

    std::optional<PadmapConfig> ConfigLoader::parseJSON(const std::string& data) const {
        try {
            const auto j = json::parse(data);
            if (!j.is_object()) {
                recordError("Configuration root must be an object");
                return std::nullopt;
            }

            PadmapConfig config;
            std::string error;

            if (!readEnum(j, "platform", config.platform, gamepadPlatformFromString, error)) {
                recordError(error);
                return std::nullopt;
            }

            config.mappingsFile = j.value("mappingsFile", config.mappingsFile);
            config.pressThreshold = j.value("pressThreshold", config.pressThreshold);
            if (!std::isfinite(config.pressThreshold) || config.pressThreshold <= 0.0f || config.pressThreshold > 1.0f) {
                recordError("pressThreshold must be in (0, 1]");
                return std::nullopt;
            }

            if (j.contains("devices")) {
                config.devices.clear();
                for (const auto& deviceJson : j.at("devices")) {
                    DeviceConfig device;
                    device.id = deviceJson.value("id", device.id);
                    if (!isValidGamepadId(device.id)) {
                        recordError("Device id " + std::to_string(device.id) + " is outside " +
                            std::to_string(MIN_GAMEPAD_ID) + ".." + std::to_string(MAX_GAMEPAD_ID));
                        return std::nullopt;
                    }
                    if (!readEnum(deviceJson, "type", device.type, gamepadTypeFromString, error)) {
                        recordError(error);
                        return std::nullopt;
                    }
                    config.devices.push_back(device);
                }
            }

            if (j.contains("logging")) {
                const auto& logging = j.at("logging");
                if (!readEnum(logging, "level", config.logging.level, debug::logLevelFromString, error) ||
                    !readEnum(logging, "format", config.logging.format, debug::logFormatFromString, error)) {
                    recordError(error);
                    return std::nullopt;
                }
                config.logging.console = logging.value("console", config.logging.console);
                config.logging.file = logging.value("file", config.logging.file);
                config.logging.filePath = logging.value("filePath", config.logging.filePath);
                config.logging.timestamps = logging.value("timestamps", config.logging.timestamps);
                config.logging.frameNumbers = logging.value("frameNumbers", config.logging.frameNumbers);
                config.logging.flushEachEntry = logging.value("flushEachEntry", config.logging.flushEachEntry);
            }

            if (j.contains("sample")) {
                const auto& sample = j.at("sample");
                if (!readEnum(sample, "button", config.sample.button, gamepadButtonFromString, error) ||
                    !readEnum(sample, "axis", config.sample.axis, gamepadAxisFromString, error) ||
                    !readEnum(sample, "stick", config.sample.stick, gamepadStickFromString, error)) {
                    recordError(error);
                    return std::nullopt;
                }
                config.sample.frames = sample.value("frames", config.sample.frames);
                config.sample.frameDelayMs = sample.value("frameDelayMs", config.sample.frameDelayMs);
            }

            return config;
        }
        catch (const json::exception& e) {
            recordError("JSON parsing error: " + std::string(e.what()));
            return std::nullopt;
        }
    }

    std::optional<std::string> ConfigLoader::readFileContents(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return std::nullopt;
        }
        return buffer.str();
    }

    bool ConfigLoader::writeFileContents(const std::filesystem::path& path,
                                         const std::string& content,
                                         const bool createBackup) {
        std::error_code ec;
        if (createBackup && std::filesystem::exists(path, ec)) {
            auto backupPath = path;
            backupPath += ".backup";
            std::filesystem::copy_file(path, backupPath,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                return false;
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }

        file << content;
        return file.good();
    }
} // namespace padmap::input::utils
