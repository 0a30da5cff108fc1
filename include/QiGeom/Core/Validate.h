#pragma once

/**
 * @file Validate.h
 * @brief Argument validation utilities for QiGeom
 *
 * Design principles:
 * - Only caller contract violations throw (bad index, impossible factory
 *   parameters). Degenerate geometry is reported through return values.
 * - Consistent error message format: "<func>: <param> must be ..., got ..."
 */

#include <QiGeom/Core/Export.h>
#include <QiGeom/Core/Exception.h>

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <string>

namespace Qi::Geom::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format floating value with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(float val) {
    return FormatValue(static_cast<double>(val));
}

inline std::string FormatValue(long double val) {
    return FormatValue(static_cast<double>(val));
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is finite (not NaN, not infinite)
 */
template<typename T>
inline void RequireFinite(T value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 *
 * NaN fails the check.
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (!(value >= T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is at least minimum (>= min)
 */
template<typename T>
inline void RequireMin(T value, T minVal, const char* paramName, const char* funcName) {
    if (value < minVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= " +
            Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

// =============================================================================
// Index Validation
// =============================================================================

/**
 * @brief Validate index < size
 * @throws OutOfRangeException if index is past the end
 */
inline void RequireIndex(size_t index, size_t size, const char* funcName) {
    if (index >= size) {
        throw OutOfRangeException(
            std::string(funcName) + ": index " + std::to_string(index) +
            " out of range for size " + std::to_string(size));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

#define QIGEOM_REQUIRE_FINITE(val) \
    ::Qi::Geom::Validate::RequireFinite(val, #val, __func__)

#define QIGEOM_REQUIRE_NON_NEGATIVE(val) \
    ::Qi::Geom::Validate::RequireNonNegative(val, #val, __func__)

#define QIGEOM_REQUIRE_MIN(val, min) \
    ::Qi::Geom::Validate::RequireMin(val, min, #val, __func__)

#define QIGEOM_REQUIRE_INDEX(index, size) \
    ::Qi::Geom::Validate::RequireIndex(index, size, __func__)

} // namespace Qi::Geom::Validate
