/**
 * @file ResolutionEngine.h
 * @brief Resolves logical gamepad values from raw state through a mapping
 * @author Andrés Guerrero
 * @date 16-09-2025
 *
 * Pure computation over a mapping entry and one raw state capture. A direct
 * binding is always preferred; when it is absent the value is derived from the
 * paired control (button from axis, axis from a button pair).
 */

#pragma once

#include "../devices/gamepad/GamepadState.h"
#include "../mapping/GamepadMapping.h"

#include "../../math/core/MathTypes.h"

#include <atomic>

namespace padmap::input::processing {
    /**
     * @brief Logical value resolver
     *
     * Holds no per-frame state. The only setting is the press threshold used
     * when a button is derived from an axis.
     */
    class ResolutionEngine {
    public:
        explicit ResolutionEngine(float pressThreshold = DEFAULT_AXIS_PRESS_THRESHOLD) noexcept
            : pressThreshold_(pressThreshold) {
        }

        // ============================================================================
        // Resolution
        // ============================================================================

        /**
         * @brief Resolve a logical button
         * Direct binding first, then the derived axis compared against the
         * press threshold. Buttons with neither report false.
         */
        [[nodiscard]] bool resolveButton(GamepadButton button,
                                         const GamepadMapping& mapping,
                                         const GamepadRawState& state) const noexcept;

        /**
         * @brief Resolve a logical axis in its canonical range
         * Direct binding remapped from its native range, otherwise the sum of
         * the paired buttons (-1, 0 or +1).
         */
        [[nodiscard]] float resolveAxis(GamepadAxis axis,
                                        const GamepadMapping& mapping,
                                        const GamepadRawState& state) const noexcept;

        /**
         * @brief Resolve a stick as its X and Y axes
         */
        [[nodiscard]] math::Vec2 resolveStick(GamepadStick stick,
                                              const GamepadMapping& mapping,
                                              const GamepadRawState& state) const noexcept;

        /**
         * @brief Remap a raw axis value from its native range to the canonical one
         */
        [[nodiscard]] static float remapAxis(float rawValue, const AxisRange& from, GamepadAxis axis) noexcept;

        // ============================================================================
        // Configuration
        // ============================================================================

        [[nodiscard]] float getPressThreshold() const noexcept {
            return pressThreshold_.load(std::memory_order_acquire);
        }

        void setPressThreshold(const float threshold) noexcept {
            pressThreshold_.store(threshold, std::memory_order_release);
        }

    private:
        std::atomic<float> pressThreshold_;

        /**
         * @brief Read a button through its direct binding only
         */
        [[nodiscard]] static bool readDirectButton(GamepadButton button,
                                                   const GamepadMapping& mapping,
                                                   const GamepadRawState& state) noexcept;

        /**
         * @brief Read a button from the axis it is paired with
         */
        [[nodiscard]] bool readButtonFromAxis(GamepadButton button,
                                              const GamepadMapping& mapping,
                                              const GamepadRawState& state) const noexcept;
    };
} // namespace padmap::input::processing
