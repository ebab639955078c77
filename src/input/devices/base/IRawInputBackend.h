/**
 * @file IRawInputBackend.h
 * @brief Abstract interface for platform-specific raw gamepad sources
 * @details Defines the contract the mapping layer consumes: per-slot raw button
 *          and raw axis reads. Implementations own device access, hot-plug and
 *          any platform quirks.
 *
 * @author Andres Guerrero
 * @date Created on 2025-09-19
 */

#pragma once

#include "../../core/InputConstants.h"

namespace padmap::input {
    // =============================================================================
    // Raw Input Backend Interface
    // =============================================================================

    /**
     * @brief Abstract interface for raw gamepad state queries
     * @details Slot ids are 1..MAX_GAMEPAD_ID. Raw button ids are
     *          0..MAX_RAW_BUTTON_ID and raw axis ids are 0..MAX_RAW_AXIS_ID.
     *          A slot with no device behind it reports released buttons and
     *          zero axes.
     */
    class IRawInputBackend {
    public:
        /**
         * @brief Virtual destructor for proper cleanup
         */
        virtual ~IRawInputBackend() = default;

        /**
         * @brief Check if a raw button is currently held
         * @param gamepadId Gamepad slot
         * @param rawButton Raw button index
         */
        [[nodiscard]] virtual bool isButtonDown(GamepadID gamepadId, RawIndex rawButton) const = 0;

        /**
         * @brief Get the current value of a raw axis
         * @param gamepadId Gamepad slot
         * @param rawAxis Raw axis index
         * @return Raw value in the backend's native range
         */
        [[nodiscard]] virtual float getAxisRaw(GamepadID gamepadId, RawIndex rawAxis) const = 0;

        /**
         * @brief Get backend name for diagnostics
         */
        [[nodiscard]] virtual const char* getName() const noexcept = 0;
    };
} // namespace padmap::input
