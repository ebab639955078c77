/**
 * @file MathConstants.h
 * @brief Mathematical constants and thresholds
 * @author Andrés Guerrero
 * @date 29-08-2025
 *
 * Epsilon values for floating-point comparisons.
 */

#pragma once

#include "MathTypes.h"

namespace padmap::math {
    // ============================================================================
    // Epsilon Values
    // ============================================================================

    // Standard epsilon for float comparisons
    inline constexpr Float EPSILON = 1e-6f;
} // namespace padmap::math
