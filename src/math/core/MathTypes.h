/**
 * @file MathTypes.h
 * @brief Core mathematical type definitions and aliases
 * @author Andrés Guerrero
 * @date 27-08-2025
 */

#pragma once

#include <glm/glm.hpp>

namespace padmap::math {
    /**
     * This file provides the foundational mathematical types used by the input
     * layer. Vector types are GLM based so callers can feed stick values
     * straight into their own GLM math.
     */
    // ============================================================================
    // Base Type Aliases from GLM
    // ============================================================================

    using Float = float;
    using Vec2 = glm::vec2;

    // ============================================================================
    // Engine-Specific Types
    // ============================================================================

    /**
     * @brief Closed numeric interval
     * Used for axis ranges where min may be greater than max (inverted axes)
     */
    struct Range {
        Float min;
        Float max;

        constexpr Range() noexcept : min(0), max(0) {
        }

        constexpr Range(const Float min, const Float max) noexcept
            : min(min), max(max) {
        }

        constexpr bool operator==(const Range& other) const noexcept {
            return min == other.min && max == other.max;
        }

        constexpr bool operator!=(const Range& other) const noexcept {
            return !(*this == other);
        }
    };

    inline const Vec2 VEC2_ZERO{0.0f, 0.0f};
} // namespace padmap::math
