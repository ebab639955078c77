/**
 * @file GamepadInput.cpp
 * @brief Logical gamepad query interface implementation
 * @author Andrés Guerrero
 * @date 16-09-2025
 */

#include "GamepadInput.h"

#include "debug/InputLogger.h"
#include "mapping/MappingParser.h"

namespace padmap::input {
    GamepadInput::GamepadInput(const IRawInputBackend& backend,
                               std::shared_ptr<const MappingTable> table,
                               debug::InputLogger* logger,
                               const GamepadPlatform platform)
        : logger_(logger)
          , history_(backend, logger)
          , table_(std::move(table))
          , platform_(platform) {
    }

    // ============================================================================
    // Queries
    // ============================================================================

    bool GamepadInput::getButton(const GamepadButton button, const GamepadHandle& gamepad) {
        const auto table = prepareQuery(gamepad);
        if (!table) {
            return false;
        }

        const GamepadMapping& mapping = table->getMapping(getPlatform(), gamepad.type);
        return resolver_.resolveButton(button, mapping, history_.getCurrent(gamepad.id));
    }

    bool GamepadInput::getButtonDown(const GamepadButton button, const GamepadHandle& gamepad) {
        const auto table = prepareQuery(gamepad);
        if (!table) {
            return false;
        }

        const GamepadMapping& mapping = table->getMapping(getPlatform(), gamepad.type);
        const auto frames = history_.getFrames(gamepad.id);
        return !resolver_.resolveButton(button, mapping, frames.previous) &&
            resolver_.resolveButton(button, mapping, frames.current);
    }

    bool GamepadInput::getButtonUp(const GamepadButton button, const GamepadHandle& gamepad) {
        const auto table = prepareQuery(gamepad);
        if (!table) {
            return false;
        }

        const GamepadMapping& mapping = table->getMapping(getPlatform(), gamepad.type);
        const auto frames = history_.getFrames(gamepad.id);
        return resolver_.resolveButton(button, mapping, frames.previous) &&
            !resolver_.resolveButton(button, mapping, frames.current);
    }

    float GamepadInput::getAxis(const GamepadAxis axis, const GamepadHandle& gamepad) {
        const auto table = prepareQuery(gamepad);
        if (!table) {
            return 0.0f;
        }

        const GamepadMapping& mapping = table->getMapping(getPlatform(), gamepad.type);
        return resolver_.resolveAxis(axis, mapping, history_.getCurrent(gamepad.id));
    }

    math::Vec2 GamepadInput::getStick(const GamepadStick stick, const GamepadHandle& gamepad) {
        const auto table = prepareQuery(gamepad);
        if (!table) {
            return math::VEC2_ZERO;
        }

        const GamepadMapping& mapping = table->getMapping(getPlatform(), gamepad.type);
        return resolver_.resolveStick(stick, mapping, history_.getCurrent(gamepad.id));
    }

    // ============================================================================
    // Frame Control
    // ============================================================================

    void GamepadInput::beginFrame() noexcept {
        history_.beginFrame();
    }

    void GamepadInput::advanceFrame() {
        history_.advance();
    }

    // ============================================================================
    // Mapping Management
    // ============================================================================

    bool GamepadInput::loadMappings(const std::string_view definition) {
        mapping::MappingParser parser(logger_);
        auto table = parser.parse(definition);
        if (!table) {
            std::lock_guard lock(tableMutex_);
            lastError_ = parser.getLastError();
            return false;
        }

        installTable(std::make_shared<const MappingTable>(std::move(*table)), "memory");
        return true;
    }

    bool GamepadInput::loadMappingsFromFile(const std::filesystem::path& path) {
        mapping::MappingParser parser(logger_);
        auto table = parser.parseFile(path);
        if (!table) {
            std::lock_guard lock(tableMutex_);
            lastError_ = parser.getLastError();
            return false;
        }

        installTable(std::make_shared<const MappingTable>(std::move(*table)), path.string());
        return true;
    }

    void GamepadInput::setMappingTable(std::shared_ptr<const MappingTable> table) {
        installTable(std::move(table), "caller");
    }

    std::string GamepadInput::getLastError() const {
        std::lock_guard lock(tableMutex_);
        return lastError_;
    }

    std::shared_ptr<const MappingTable> GamepadInput::getMappingTable() const {
        std::lock_guard lock(tableMutex_);
        return table_;
    }

    bool GamepadInput::hasMappings() const {
        std::lock_guard lock(tableMutex_);
        return table_ != nullptr;
    }

    // ============================================================================
    // Private Implementation
    // ============================================================================

    std::shared_ptr<const MappingTable> GamepadInput::prepareQuery(const GamepadHandle& gamepad) {
        if (!isValidGamepadId(gamepad.id)) {
            return nullptr;
        }

        history_.ensureFresh();
        return getMappingTable();
    }

    void GamepadInput::installTable(std::shared_ptr<const MappingTable> table, const std::string_view source) {
        const bool installed = table != nullptr;
        {
            std::lock_guard lock(tableMutex_);
            table_ = std::move(table);
            lastError_.clear();
        }

        if (logger_) {
            logger_->log(debug::LogLevel::INFO, debug::LogEntryType::MAPPING,
                         installed ? "Mapping table installed" : "Mapping table removed",
                         "Mapping", std::string(source));
        }
    }
} // namespace padmap::input
