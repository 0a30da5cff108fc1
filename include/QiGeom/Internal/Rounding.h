#pragma once

/**
 * @file Rounding.h
 * @brief Grid snapping kernels behind the quantized value type
 *
 * Rounding rule: round half away from zero (std::round). A value exactly
 * halfway between two grid points snaps to the one farther from zero, so
 * 0.005 on a 0.01 grid (when representable) goes to 0.01 and -0.005 to -0.01.
 *
 * Canonical form: quantized = ticks * quantum, where ticks is an integral
 * floating value. Two computations that land on the same tick therefore
 * produce bit-identical results, which is what keeps independently derived
 * boundaries exactly aligned.
 */

#include <QiGeom/Core/Export.h>

#include <cstdint>

namespace Qi::Geom::Internal {

/**
 * @brief Snap value to the nearest integer multiple of quantum
 *
 * @param value Value to snap
 * @param quantum Grid step; values <= 0 (or NaN) disable snapping
 * @return round(value / quantum) * quantum, or value unchanged when snapping
 *         is disabled or value is not finite
 */
QIGEOM_API float RoundToQuantum(float value, float quantum);
QIGEOM_API double RoundToQuantum(double value, double quantum);
QIGEOM_API long double RoundToQuantum(long double value, long double quantum);

/**
 * @brief Integer grid index of value: round(value / quantum)
 *
 * With snapping disabled the grid step is taken as 1. Non-finite values and
 * values whose index does not fit in int64_t saturate to the int64_t range
 * (NaN maps to 0).
 */
QIGEOM_API int64_t QuantumTicks(float value, float quantum);
QIGEOM_API int64_t QuantumTicks(double value, double quantum);
QIGEOM_API int64_t QuantumTicks(long double value, long double quantum);

} // namespace Qi::Geom::Internal
