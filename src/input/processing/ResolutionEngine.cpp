/**
 * @file ResolutionEngine.cpp
 * @brief Logical gamepad value resolution implementation
 * @author Andrés Guerrero
 * @date 16-09-2025
 */

#include "ResolutionEngine.h"

#include "../mapping/AxisDerivation.h"

#include "../../math/core/MathFunctions.h"

namespace padmap::input::processing {
    // ============================================================================
    // Resolution
    // ============================================================================

    bool ResolutionEngine::resolveButton(const GamepadButton button,
                                         const GamepadMapping& mapping,
                                         const GamepadRawState& state) const noexcept {
        if (mapping.hasButton(button)) {
            return readDirectButton(button, mapping, state);
        }
        return readButtonFromAxis(button, mapping, state);
    }

    float ResolutionEngine::resolveAxis(const GamepadAxis axis,
                                        const GamepadMapping& mapping,
                                        const GamepadRawState& state) const noexcept {
        if (mapping.hasAxis(axis)) {
            // hasAxis guarantees the range is present
            const float raw = state.getAxis(mapping.getAxisIndex(axis));
            return remapAxis(raw, *mapping.getAxisRange(axis), axis);
        }

        float value = 0.0f;

        // Derived buttons are excluded here, they would read back this same axis
        if (const auto negative = negativeButtonFromAxis(axis)) {
            if (readDirectButton(*negative, mapping, state)) {
                value -= 1.0f;
            }
        }
        if (const auto positive = positiveButtonFromAxis(axis)) {
            if (readDirectButton(*positive, mapping, state)) {
                value += 1.0f;
            }
        }

        return value;
    }

    math::Vec2 ResolutionEngine::resolveStick(const GamepadStick stick,
                                              const GamepadMapping& mapping,
                                              const GamepadRawState& state) const noexcept {
        return {
            resolveAxis(stickAxisX(stick), mapping, state),
            resolveAxis(stickAxisY(stick), mapping, state)
        };
    }

    float ResolutionEngine::remapAxis(const float rawValue, const AxisRange& from, const GamepadAxis axis) noexcept {
        return math::remap(rawValue, from, canonicalRange(axis));
    }

    // ============================================================================
    // Private Implementation
    // ============================================================================

    bool ResolutionEngine::readDirectButton(const GamepadButton button,
                                            const GamepadMapping& mapping,
                                            const GamepadRawState& state) noexcept {
        return mapping.hasButton(button) && state.isButtonDown(mapping.getButtonIndex(button));
    }

    bool ResolutionEngine::readButtonFromAxis(const GamepadButton button,
                                              const GamepadMapping& mapping,
                                              const GamepadRawState& state) const noexcept {
        const auto derivation = derivationFromButton(button);
        if (!derivation || !mapping.hasAxis(derivation->axis)) {
            return false;
        }

        const float raw = state.getAxis(mapping.getAxisIndex(derivation->axis));
        const float value = remapAxis(raw, *mapping.getAxisRange(derivation->axis), derivation->axis);
        return value * static_cast<float>(derivation->sign) >= getPressThreshold();
    }
} // namespace padmap::input::processing
