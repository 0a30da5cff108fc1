/**
 * @file Rounding.cpp
 * @brief Implementation of grid snapping kernels
 */

#include <QiGeom/Internal/Rounding.h>

#include <cmath>
#include <limits>

namespace Qi::Geom::Internal {

namespace {

template<typename T>
T RoundToQuantumImpl(T value, T quantum) {
    if (!(quantum > T(0)) || !std::isfinite(value)) {
        return value;
    }
    return std::round(value / quantum) * quantum;
}

template<typename T>
int64_t QuantumTicksImpl(T value, T quantum) {
    T step = quantum > T(0) ? quantum : T(1);
    T ticks = std::round(value / step);

    if (std::isnan(ticks)) {
        return 0;
    }
    // 2^63 is exactly representable in every floating type used here
    const T limit = std::ldexp(T(1), 63);
    if (ticks >= limit) {
        return std::numeric_limits<int64_t>::max();
    }
    if (ticks < -limit) {
        return std::numeric_limits<int64_t>::min();
    }
    return static_cast<int64_t>(ticks);
}

} // anonymous namespace

float RoundToQuantum(float value, float quantum) {
    return RoundToQuantumImpl(value, quantum);
}

double RoundToQuantum(double value, double quantum) {
    return RoundToQuantumImpl(value, quantum);
}

long double RoundToQuantum(long double value, long double quantum) {
    return RoundToQuantumImpl(value, quantum);
}

int64_t QuantumTicks(float value, float quantum) {
    return QuantumTicksImpl(value, quantum);
}

int64_t QuantumTicks(double value, double quantum) {
    return QuantumTicksImpl(value, quantum);
}

int64_t QuantumTicks(long double value, long double quantum) {
    return QuantumTicksImpl(value, quantum);
}

} // namespace Qi::Geom::Internal
