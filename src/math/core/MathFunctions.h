/**
 * @file MathFunctions.h
 * @brief Core mathematical functions and utilities
 * @author Andrés Guerrero
 * @date 29-08-2025
 *
 * Comparison and interpolation helpers used for axis normalization.
 */

#pragma once

#include "MathTypes.h"
#include "MathConstants.h"

#include <cmath>
#include <type_traits>

namespace padmap::math {
    // ============================================================================
    // Comparison Functions with Epsilon
    // ============================================================================

    /**
     * @brief Check if two floating-point values are approximately equal
     * @param a First value
     * @param b Second value
     * @param epsilon Tolerance for comparison
     */
    template<typename T>
    [[nodiscard]] inline constexpr bool isNearlyEqual(T a, T b,
                                                      T epsilon = EPSILON) noexcept {
        static_assert(std::is_arithmetic_v<T>, "T must be an arithmetic type");
        return std::abs(a - b) <= epsilon;
    }

    // ============================================================================
    // Interpolation
    // ============================================================================

    /**
     * @brief Linear interpolation between two values
     * @param a Start value (t=0)
     * @param b End value (t=1)
     * @param t Interpolation factor, not clamped
     */
    template<typename T>
    [[nodiscard]] constexpr std::enable_if_t<std::is_arithmetic_v<T>, T>
    lerp(T a, T b, Float t) noexcept {
        return a + t * (b - a);
    }

    /**
     * @brief Inverse linear interpolation - get t value from lerp result
     * Returns the t value such that lerp(a, b, t) = value
     */
    template <typename T>
    [[nodiscard]] inline constexpr Float inverseLerp(T a, T b, T value) noexcept {
        if (isNearlyEqual(a, b)) return 0.0f;
        return static_cast<Float>((value - a) / (b - a));
    }

    /**
     * @brief Remap a value from one range to another
     * Values outside the input range extrapolate linearly.
     */
    template <typename T>
    [[nodiscard]] inline constexpr T remap(T value, T inMin, T inMax,
                                           T outMin, T outMax) noexcept {
        Float t = inverseLerp(inMin, inMax, value);
        return lerp(outMin, outMax, t);
    }

    /**
     * @brief Remap between two Range intervals
     */
    [[nodiscard]] inline constexpr Float remap(const Float value, const Range& from, const Range& to) noexcept {
        return remap(value, from.min, from.max, to.min, to.max);
    }
} // namespace padmap::math
