/**
 * @file InputLogger.h
 * @brief Input system debug logging utilities
 * @author Andrés Guerrero
 * @date 13-09-2025
 *
 * Provides logging for mapping loads, frame advances, backend devices and
 * system state. Supports text, JSON and CSV output with filtering.
 */

#pragma once

#include "../devices/gamepad/GamepadState.h"

#include <string>
#include <fstream>
#include <functional>
#include <mutex>
#include <memory>
#include <vector>
#include <chrono>
#include <atomic>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace padmap::input::debug {
    /**
     * @brief Log level for input logging
     * Higher values are more verbose.
     */
    enum class LogLevel : std::uint8_t {
        NONE = 0,
        ERROR = 1,
        WARNING = 2,
        INFO = 3,
        DEBUG = 4,
        VERBOSE = 5
    };

    /**
     * @brief Log entry type
     */
    enum class LogEntryType : std::uint8_t {
        MAPPING,
        FRAME,
        DEVICE,
        CONFIG,
        ERROR,
        SYSTEM
    };

    /**
     * @brief Log output format
     */
    enum class LogFormat : std::uint8_t {
        TEXT,
        JSON,
        CSV
    };

    const char* logLevelToString(LogLevel level) noexcept;
    [[nodiscard]] std::optional<LogLevel> logLevelFromString(std::string_view name) noexcept;

    const char* logFormatToString(LogFormat format) noexcept;
    [[nodiscard]] std::optional<LogFormat> logFormatFromString(std::string_view name) noexcept;

    /**
     * @brief Log entry
     */
    struct LogEntry {
        LogLevel level;
        LogEntryType type;
        std::chrono::system_clock::time_point timestamp;
        std::uint64_t frameNumber;
        std::string message;
        std::string category;
        std::string details;

        LogEntry() noexcept
            : level(LogLevel::INFO)
              , type(LogEntryType::SYSTEM)
              , timestamp(std::chrono::system_clock::now())
              , frameNumber(0) {
        }
    };

    /**
     * @brief Logger configuration
     */
    struct LoggerConfig {
        LogLevel minLevel = LogLevel::INFO; // Most verbose level written
        LogFormat format = LogFormat::TEXT;
        bool logToFile = false;
        bool logToConsole = true;
        bool logToMemory = false;
        std::string logFilePath = "padmap.log";
        std::size_t maxMemoryEntries = 10000;
        bool includeTimestamp = true;
        bool includeFrameNumber = true;
        bool flushImmediately = false;

        LoggerConfig() = default;
    };

    /**
     * @brief Input system debug logger
     *
     * Thread-safe logger for debugging input system behavior.
     * Components hold a non-owning pointer and skip logging when it is null.
     */
    class InputLogger {
    public:
        using LogCallback = std::function<void(const LogEntry&)>;

        /**
         * @brief Constructor
         */
        explicit InputLogger() noexcept;

        /**
         * @brief Destructor
         */
        ~InputLogger();

        // Disable copy and move, components keep raw pointers to the logger
        InputLogger(const InputLogger&) = delete;
        InputLogger& operator=(const InputLogger&) = delete;
        InputLogger(InputLogger&&) = delete;
        InputLogger& operator=(InputLogger&&) = delete;

        // ============================================================================
        // Initialization
        // ============================================================================

        /**
         * @brief Initialize the logger
         * @param config Logger configuration
         * @return True if successful
         */
        bool initialize(const LoggerConfig& config = {});

        /**
         * @brief Shutdown the logger
         */
        void shutdown();

        [[nodiscard]] bool isInitialized() const noexcept {
            return initialized_.load(std::memory_order_acquire);
        }

        /**
         * @brief Get current configuration
         */
        [[nodiscard]] const LoggerConfig& getConfig() const noexcept {
            return config_;
        }

        // ============================================================================
        // State Logging
        // ============================================================================

        /**
         * @brief Log raw gamepad state
         * @param state Raw state to log
         * @param level Log level
         */
        void logRawState(const GamepadRawState& state, LogLevel level = LogLevel::VERBOSE);

        // ============================================================================
        // General Logging
        // ============================================================================

        /**
         * @brief Log message
         * @param level Log level
         * @param type Entry type
         * @param message Log message
         * @param category Optional category
         * @param details Optional details
         */
        void log(LogLevel level,
                 LogEntryType type,
                 const std::string& message,
                 const std::string& category = "",
                 const std::string& details = "");

        void error(const std::string& message, const std::string& details = "") {
            log(LogLevel::ERROR, LogEntryType::ERROR, message, "Error", details);
        }

        void warning(const std::string& message, const std::string& details = "") {
            log(LogLevel::WARNING, LogEntryType::SYSTEM, message, "Warning", details);
        }

        void info(const std::string& message, const std::string& details = "") {
            log(LogLevel::INFO, LogEntryType::SYSTEM, message, "Info", details);
        }

        void debug(const std::string& message, const std::string& details = "") {
            log(LogLevel::DEBUG, LogEntryType::SYSTEM, message, "Debug", details);
        }

        void verbose(const std::string& message, const std::string& details = "") {
            log(LogLevel::VERBOSE, LogEntryType::SYSTEM, message, "Verbose", details);
        }

        // ============================================================================
        // Output Management
        // ============================================================================

        /**
         * @brief Flush all pending log entries
         */
        void flush();

        /**
         * @brief Clear memory log
         */
        void clearMemoryLog();

        /**
         * @brief Get memory log entries
         * @param maxEntries Maximum entries to retrieve, 0 for all
         * @return Most recent log entries
         */
        [[nodiscard]] std::vector<LogEntry> getMemoryLog(std::size_t maxEntries = 0) const;

        /**
         * @brief Register custom log callback
         * @param callback Callback function
         */
        void registerCallback(LogCallback callback);

        // ============================================================================
        // Filtering
        // ============================================================================

        void setLogLevel(const LogLevel level) noexcept {
            config_.minLevel = level;
        }

        /**
         * @brief Check if a level would currently be written
         */
        [[nodiscard]] bool isLevelEnabled(const LogLevel level) const noexcept {
            return level != LogLevel::NONE && level <= config_.minLevel;
        }

        void setCategoryEnabled(const std::string& category, bool enabled);
        [[nodiscard]] bool isCategoryEnabled(const std::string& category) const;

        // ============================================================================
        // Statistics
        // ============================================================================

        struct Statistics {
            std::atomic<std::uint64_t> totalEntries{0};
            std::atomic<std::uint64_t> fileWrites{0};
            std::atomic<std::uint64_t> consoleWrites{0};

            void reset() noexcept {
                totalEntries = 0;
                fileWrites = 0;
                consoleWrites = 0;
            }
        };

        [[nodiscard]] const Statistics& getStatistics() const noexcept {
            return stats_;
        }

        // ============================================================================
        // Frame Management
        // ============================================================================

        void setFrameNumber(const std::uint64_t frameNumber) noexcept {
            currentFrame_.store(frameNumber, std::memory_order_release);
        }

    private:
        // Configuration
        LoggerConfig config_;
        std::atomic<bool> initialized_{false};

        // Output streams
        std::unique_ptr<std::ofstream> fileStream_;
        mutable std::mutex fileMutex_;

        // Memory log
        std::vector<LogEntry> memoryLog_;
        mutable std::mutex memoryMutex_;

        // Callbacks
        std::vector<LogCallback> callbacks_;
        mutable std::mutex callbackMutex_;

        // Category filters
        std::unordered_map<std::string, bool> categoryFilters_;
        mutable std::mutex filterMutex_;

        mutable Statistics stats_;

        std::atomic<std::uint64_t> currentFrame_{0};

        // ============================================================================
        // Internal Methods
        // ============================================================================

        void writeEntry(const LogEntry& entry);

        [[nodiscard]] std::string formatEntry(const LogEntry& entry) const;
        [[nodiscard]] std::string formatText(const LogEntry& entry) const;
        [[nodiscard]] std::string formatJSON(const LogEntry& entry) const;
        [[nodiscard]] std::string formatCSV(const LogEntry& entry) const;

        bool openLogFile();
        void closeLogFile();

        [[nodiscard]] bool shouldLog(const LogEntry& entry) const;
    };
} // namespace padmap::input::debug
