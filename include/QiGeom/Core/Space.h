#pragma once

/**
 * @file Space.h
 * @brief Coordinate space tags and their quantum
 *
 * A space is an empty tag type used as a template parameter. It carries no
 * runtime payload. A space may declare a grid step:
 *
 * @code
 * struct PdfSpace {
 *     static constexpr double quantum = 0.01;   // 1/100 point
 * };
 *
 * Point<double, PdfSpace> p(1.234, 5.678);      // stored as (1.23, 5.68)
 * @endcode
 *
 * A space without a `quantum` member, or with quantum == 0, is pass-through.
 * Shapes in different spaces are distinct types and never mix implicitly.
 */

#include <QiGeom/Internal/Rounding.h>

#include <type_traits>

namespace Qi::Geom {

/**
 * @brief Default space: unconstrained coordinates
 */
struct Unquantized {};

// =============================================================================
// Space Traits
// =============================================================================

/**
 * @brief Detects a `quantum` static member on a space tag
 */
template<typename Space, typename = void>
struct HasQuantum : std::false_type {};

template<typename Space>
struct HasQuantum<Space, std::void_t<decltype(Space::quantum)>> : std::true_type {};

namespace Detail {

template<typename Space, bool = HasQuantum<Space>::value>
struct QuantumOf {
    static constexpr double value = 0.0;
};

template<typename Space>
struct QuantumOf<Space, true> {
    static_assert(static_cast<double>(Space::quantum) >= 0.0,
                  "space quantum must be non-negative");
    static constexpr double value = static_cast<double>(Space::quantum);
};

} // namespace Detail

/**
 * @brief Quantum and snapping rule of a space for scalar type T
 */
template<typename Space, typename T>
struct SpaceTraits {
    static_assert(std::is_floating_point<T>::value,
                  "QiGeom scalars must be floating-point types");

    /// True when the space snaps values to a grid
    static constexpr bool kQuantized = Detail::QuantumOf<Space>::value > 0.0;

    /// Grid step expressed in T (0 for pass-through spaces)
    static constexpr T Quantum() {
        return static_cast<T>(Detail::QuantumOf<Space>::value);
    }

    /// Snap value to the space grid (identity for pass-through spaces)
    static T Quantize(T value) {
        if constexpr (kQuantized) {
            return Internal::RoundToQuantum(value, Quantum());
        } else {
            return value;
        }
    }
};

/**
 * @brief Scalar type produced by a Map transform F applied to T
 */
template<typename F, typename T>
using MappedScalar = std::decay_t<std::invoke_result_t<F&, T>>;

/**
 * @brief Snap value to the grid of Space
 */
template<typename Space, typename T>
inline T Quantize(T value) {
    return SpaceTraits<Space, T>::Quantize(value);
}

} // namespace Qi::Geom
