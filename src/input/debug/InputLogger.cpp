/**
 * @file InputLogger.cpp
 * @brief Input system debug logging utilities implementation
 * @author Andrés Guerrero
 * @date 13-09-2025
 */

#include "InputLogger.h"

#include <algorithm>
#include <array>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace padmap::input::debug {
    namespace {
        constexpr std::array<const char*, 6> LEVEL_NAMES = {
            "NONE", "ERROR", "WARN", "INFO", "DEBUG", "VERBOSE"
        };

        constexpr std::array<const char*, 3> FORMAT_NAMES = {"Text", "JSON", "CSV"};
    }

    const char* logLevelToString(const LogLevel level) noexcept {
        const auto index = static_cast<std::size_t>(level);
        return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "UNKNOWN";
    }

    std::optional<LogLevel> logLevelFromString(const std::string_view name) noexcept {
        if (name == "WARNING") {
            return LogLevel::WARNING;
        }
        for (std::size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
            if (name == LEVEL_NAMES[i]) {
                return static_cast<LogLevel>(i);
            }
        }
        return std::nullopt;
    }

    const char* logFormatToString(const LogFormat format) noexcept {
        const auto index = static_cast<std::size_t>(format);
        return index < FORMAT_NAMES.size() ? FORMAT_NAMES[index] : "Unknown";
    }

    std::optional<LogFormat> logFormatFromString(const std::string_view name) noexcept {
        for (std::size_t i = 0; i < FORMAT_NAMES.size(); ++i) {
            if (name == FORMAT_NAMES[i]) {
                return static_cast<LogFormat>(i);
            }
        }
        return std::nullopt;
    }

    InputLogger::InputLogger() noexcept = default;

    InputLogger::~InputLogger() {
        shutdown();
    }

    // ============================================================================
    // Initialization
    // ============================================================================

    bool InputLogger::initialize(const LoggerConfig& config) {
        if (initialized_.load(std::memory_order_acquire)) {
            return false;
        }

        config_ = config;

        // Open log file if needed
        if (config_.logToFile && !openLogFile()) {
            return false;
        }

        // Reserve memory log space
        if (config_.logToMemory) {
            std::lock_guard lock(memoryMutex_);
            memoryLog_.reserve(std::min<std::size_t>(config_.maxMemoryEntries, 1024));
        }

        initialized_.store(true, std::memory_order_release);
        return true;
    }

    void InputLogger::shutdown() {
        if (!initialized_.load(std::memory_order_acquire)) {
            return;
        }

        flush();
        closeLogFile();
        clearMemoryLog();

        {
            std::lock_guard lock(callbackMutex_);
            callbacks_.clear();
        }

        initialized_.store(false, std::memory_order_release);
    }

    // ============================================================================
    // State Logging
    // ============================================================================

    void InputLogger::logRawState(const GamepadRawState& state, const LogLevel level) {
        if (!initialized_.load(std::memory_order_acquire) || !isLevelEnabled(level)) {
            return;
        }

        LogEntry entry;
        entry.level = level;
        entry.type = LogEntryType::FRAME;
        entry.frameNumber = currentFrame_.load(std::memory_order_acquire);
        entry.category = "RawState";
        entry.message = "Gamepad " + std::to_string(state.gamepadId) + " raw state";

        std::stringstream details;
        details << "buttons=" << state.buttons.to_string() << " axes=[";
        for (std::size_t i = 0; i < state.axes.size(); ++i) {
            if (i > 0) details << ", ";
            details << std::fixed << std::setprecision(3) << state.axes[i];
        }
        details << "]";
        entry.details = details.str();

        writeEntry(entry);
    }

    // ============================================================================
    // General Logging
    // ============================================================================

    void InputLogger::log(const LogLevel level,
                          const LogEntryType type,
                          const std::string& message,
                          const std::string& category,
                          const std::string& details) {
        if (!initialized_.load(std::memory_order_acquire) || !isLevelEnabled(level)) {
            return;
        }

        LogEntry entry;
        entry.level = level;
        entry.type = type;
        entry.frameNumber = currentFrame_.load(std::memory_order_acquire);
        entry.message = message;
        entry.category = category;
        entry.details = details;

        writeEntry(entry);
    }

    // ============================================================================
    // Output Management
    // ============================================================================

    void InputLogger::flush() {
        std::lock_guard lock(fileMutex_);
        if (fileStream_) {
            fileStream_->flush();
        }
    }

    void InputLogger::clearMemoryLog() {
        std::lock_guard lock(memoryMutex_);
        memoryLog_.clear();
    }

    std::vector<LogEntry> InputLogger::getMemoryLog(const std::size_t maxEntries) const {
        std::lock_guard lock(memoryMutex_);

        if (maxEntries == 0 || maxEntries >= memoryLog_.size()) {
            return memoryLog_;
        }

        // Return the most recent entries
        const auto startIndex = static_cast<std::ptrdiff_t>(memoryLog_.size() - maxEntries);
        return std::vector<LogEntry>(memoryLog_.begin() + startIndex, memoryLog_.end());
    }

    void InputLogger::registerCallback(LogCallback callback) {
        std::lock_guard lock(callbackMutex_);
        callbacks_.push_back(std::move(callback));
    }

    // ============================================================================
    // Filtering
    // ============================================================================

    void InputLogger::setCategoryEnabled(const std::string& category, const bool enabled) {
        std::lock_guard lock(filterMutex_);
        categoryFilters_[category] = enabled;
    }

    bool InputLogger::isCategoryEnabled(const std::string& category) const {
        std::lock_guard lock(filterMutex_);
        const auto it = categoryFilters_.find(category);
        return it == categoryFilters_.end() || it->second; // Default enabled
    }

    // ============================================================================
    // Private Implementation
    // ============================================================================

    void InputLogger::writeEntry(const LogEntry& entry) {
        if (!shouldLog(entry)) {
            return;
        }

        stats_.totalEntries.fetch_add(1, std::memory_order_relaxed);

        const std::string formatted = formatEntry(entry);

        // Write to file
        {
            std::lock_guard lock(fileMutex_);
            if (config_.logToFile && fileStream_) {
                *fileStream_ << formatted << "\n";

                if (config_.flushImmediately) {
                    fileStream_->flush();
                }

                stats_.fileWrites.fetch_add(1, std::memory_order_relaxed);
            }
        }

        // Write to console
        if (config_.logToConsole) {
            // Use stderr for errors and warnings
            if (entry.level <= LogLevel::WARNING) {
                std::cerr << formatted << std::endl;
            }
            else {
                std::cout << formatted << std::endl;
            }

            stats_.consoleWrites.fetch_add(1, std::memory_order_relaxed);
        }

        // Store in memory
        if (config_.logToMemory) {
            std::lock_guard lock(memoryMutex_);

            if (memoryLog_.size() >= config_.maxMemoryEntries && !memoryLog_.empty()) {
                memoryLog_.erase(memoryLog_.begin()); // Remove oldest
            }

            memoryLog_.push_back(entry);
        }

        // Invoke callbacks
        {
            std::lock_guard lock(callbackMutex_);
            for (const auto& callback : callbacks_) {
                if (callback) {
                    callback(entry);
                }
            }
        }
    }

    std::string InputLogger::formatEntry(const LogEntry& entry) const {
        switch (config_.format) {
        case LogFormat::JSON:
            return formatJSON(entry);
        case LogFormat::CSV:
            return formatCSV(entry);
        case LogFormat::TEXT:
        default:
            return formatText(entry);
        }
    }

    std::string InputLogger::formatText(const LogEntry& entry) const {
        std::stringstream ss;
        const auto separate = [&ss] {
            if (ss.tellp() > 0) ss << ' ';
        };

        // Timestamp
        if (config_.includeTimestamp) {
            const auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
            std::tm localTime{};
#if defined(_WIN32)
            localtime_s(&localTime, &time);
#else
            localtime_r(&time, &localTime);
#endif
            ss << std::put_time(&localTime, "%H:%M:%S.")
                << std::setfill('0') << std::setw(3)
                << (std::chrono::duration_cast<std::chrono::milliseconds>(
                    entry.timestamp.time_since_epoch()).count() % 1000)
                << std::setfill(' ');
        }

        // Frame number
        if (config_.includeFrameNumber) {
            separate();
            ss << "[F" << entry.frameNumber << "]";
        }

        separate();
        ss << "[" << logLevelToString(entry.level) << "]";

        // Category
        if (!entry.category.empty()) {
            ss << " [" << entry.category << "]";
        }

        ss << " " << entry.message;

        if (!entry.details.empty()) {
            ss << "\n  Details: " << entry.details;
        }

        return ss.str();
    }

    std::string InputLogger::formatJSON(const LogEntry& entry) const {
        std::stringstream ss;
        ss << "{";
        ss << "\"timestamp\":" << entry.timestamp.time_since_epoch().count() << ",";
        ss << "\"level\":\"" << logLevelToString(entry.level) << "\",";
        ss << "\"type\":" << static_cast<int>(entry.type) << ",";
        ss << "\"frame\":" << entry.frameNumber << ",";
        ss << "\"category\":" << std::quoted(entry.category) << ",";
        ss << "\"message\":" << std::quoted(entry.message);
        if (!entry.details.empty()) {
            ss << ",\"details\":" << std::quoted(entry.details);
        }
        ss << "}";
        return ss.str();
    }

    std::string InputLogger::formatCSV(const LogEntry& entry) const {
        std::stringstream ss;
        ss << entry.timestamp.time_since_epoch().count() << ",";
        ss << logLevelToString(entry.level) << ",";
        ss << static_cast<int>(entry.type) << ",";
        ss << entry.frameNumber << ",";
        ss << std::quoted(entry.category, '"', '"') << ",";
        ss << std::quoted(entry.message, '"', '"') << ",";
        ss << std::quoted(entry.details, '"', '"');
        return ss.str();
    }

    bool InputLogger::openLogFile() {
        std::error_code ec;
        const std::filesystem::path logPath(config_.logFilePath);
        const std::filesystem::path directory = logPath.parent_path();

        if (!directory.empty()) {
            std::filesystem::create_directories(directory, ec);
            if (ec) {
                return false;
            }
        }

        std::lock_guard lock(fileMutex_);
        fileStream_ = std::make_unique<std::ofstream>(config_.logFilePath, std::ios::app);

        if (!fileStream_->is_open()) {
            fileStream_.reset();
            return false;
        }

        return true;
    }

    void InputLogger::closeLogFile() {
        std::lock_guard lock(fileMutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    bool InputLogger::shouldLog(const LogEntry& entry) const {
        return isLevelEnabled(entry.level) && isCategoryEnabled(entry.category);
    }
} // namespace padmap::input::debug
