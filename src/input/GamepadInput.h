/**
 * @file GamepadInput.h
 * @brief Logical gamepad query interface
 * @author Andrés Guerrero
 * @date 16-09-2025
 *
 * Entry point of the library. Ties together the raw backend, the frame
 * history, the installed mapping table and the resolution engine, and exposes
 * per-frame polling of logical buttons, axes and sticks.
 */

#pragma once

#include "core/InputTypes.h"
#include "mapping/GamepadMapping.h"
#include "processing/FrameHistory.h"
#include "processing/ResolutionEngine.h"

#include "../math/core/MathTypes.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace padmap::input {
    namespace debug {
        class InputLogger;
    }

    class IRawInputBackend;

    /**
     * @brief Logical gamepad input
     *
     * Queries never fail: an invalid gamepad id, a missing table or an
     * unmapped control resolves to false, 0 or (0, 0). The first query of a
     * frame advances the history; beginFrame() starts the next frame.
     *
     * The mapping table is shared and immutable. Loading a new definition
     * builds a new table and swaps it in, so a rejected definition leaves the
     * installed table untouched.
     *
     * Queries, settings and table swaps may run on different threads. Each
     * query reads the raw state through the history's lock and pins the table
     * it resolves against.
     */
    class GamepadInput {
    public:
        /**
         * @brief Constructor
         * @param backend Raw input source, must outlive this object
         * @param table Initial mapping table, may be null
         * @param logger Optional logger
         * @param platform Platform whose mappings are used
         */
        explicit GamepadInput(const IRawInputBackend& backend,
                              std::shared_ptr<const MappingTable> table = nullptr,
                              debug::InputLogger* logger = nullptr,
                              GamepadPlatform platform = nativePlatform());

        ~GamepadInput() = default;

        // Disable copy and move
        GamepadInput(const GamepadInput&) = delete;
        GamepadInput& operator=(const GamepadInput&) = delete;
        GamepadInput(GamepadInput&&) = delete;
        GamepadInput& operator=(GamepadInput&&) = delete;

        // ============================================================================
        // Queries
        // ============================================================================

        /**
         * @brief Check if a button is held this frame
         */
        [[nodiscard]] bool getButton(GamepadButton button, const GamepadHandle& gamepad);

        /**
         * @brief Check if a button went from released to held this frame
         */
        [[nodiscard]] bool getButtonDown(GamepadButton button, const GamepadHandle& gamepad);

        /**
         * @brief Check if a button went from held to released this frame
         */
        [[nodiscard]] bool getButtonUp(GamepadButton button, const GamepadHandle& gamepad);

        /**
         * @brief Get an axis in its canonical range
         * [-1, 1] for sticks and d-pad, [0, 1] for triggers
         */
        [[nodiscard]] float getAxis(GamepadAxis axis, const GamepadHandle& gamepad);

        /**
         * @brief Get a stick as (X axis, Y axis)
         */
        [[nodiscard]] math::Vec2 getStick(GamepadStick stick, const GamepadHandle& gamepad);

        // ============================================================================
        // Frame Control
        // ============================================================================

        /**
         * @brief Signal that a new frame has begun
         */
        void beginFrame() noexcept;

        /**
         * @brief Capture raw state now instead of on the first query
         */
        void advanceFrame();

        [[nodiscard]] const processing::FrameHistory& getHistory() const noexcept { return history_; }

        // ============================================================================
        // Mapping Management
        // ============================================================================

        /**
         * @brief Parse a definition and install it
         * @return False if the definition is malformed, the old table is kept
         */
        bool loadMappings(std::string_view definition);

        /**
         * @brief Read a definition file and install it
         * @return False if the file is unreadable or malformed, the old table is kept
         */
        bool loadMappingsFromFile(const std::filesystem::path& path);

        /**
         * @brief Install a prebuilt table, null uninstalls
         */
        void setMappingTable(std::shared_ptr<const MappingTable> table);

        [[nodiscard]] std::shared_ptr<const MappingTable> getMappingTable() const;

        [[nodiscard]] bool hasMappings() const;

        /**
         * @brief Get the error of the last failed load
         */
        [[nodiscard]] std::string getLastError() const;

        // ============================================================================
        // Settings
        // ============================================================================

        void setPlatform(const GamepadPlatform platform) noexcept {
            platform_.store(platform, std::memory_order_release);
        }

        [[nodiscard]] GamepadPlatform getPlatform() const noexcept {
            return platform_.load(std::memory_order_acquire);
        }

        void setPressThreshold(const float threshold) noexcept { resolver_.setPressThreshold(threshold); }
        [[nodiscard]] float getPressThreshold() const noexcept { return resolver_.getPressThreshold(); }

    private:
        debug::InputLogger* logger_;

        processing::FrameHistory history_;
        processing::ResolutionEngine resolver_;

        std::shared_ptr<const MappingTable> table_;
        mutable std::mutex tableMutex_;

        std::atomic<GamepadPlatform> platform_;
        std::string lastError_; // Guarded by tableMutex_

        /**
         * @brief Advance if needed and fetch the mapping for a gamepad
         * @return Null for invalid ids or when no table is installed
         */
        [[nodiscard]] std::shared_ptr<const MappingTable> prepareQuery(const GamepadHandle& gamepad);

        void installTable(std::shared_ptr<const MappingTable> table, std::string_view source);
    };
} // namespace padmap::input
