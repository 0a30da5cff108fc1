#pragma once

/**
 * @file Constants.h
 * @brief Mathematical constants and tolerances for QiGeom
 */

#include <cmath>

namespace Qi::Geom {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;

constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

// =============================================================================
// Tolerances
// =============================================================================

/// Tolerance for every geometric predicate (distance, parameter, area, cross)
constexpr double EPSILON = 1e-10;

/// |a - b| <= tol
inline bool ApproxEqual(double a, double b, double tol = EPSILON) {
    return std::abs(a - b) <= tol;
}

} // namespace Qi::Geom
