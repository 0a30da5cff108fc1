#pragma once

/**
 * @file Quantized.h
 * @brief Scalar value bound to a coordinate space
 *
 * Quantized<T, Space> stores a T that is always on the grid of Space.
 * Construction snaps; every arithmetic result between quantized values (or
 * a quantized value and a raw factor) is snapped again. Reading the value
 * back is exact: two values on the same grid tick compare equal bit for bit.
 *
 * For pass-through spaces the type is a thin wrapper around T.
 */

#include <QiGeom/Core/Space.h>
#include <QiGeom/Internal/Rounding.h>

#include <cstdint>
#include <type_traits>
#include <utility>

namespace Qi::Geom {

template<typename T, typename Space = Unquantized>
class Quantized {
public:
    using ValueType = T;
    using SpaceType = Space;
    using Traits = SpaceTraits<Space, T>;

    Quantized() = default;

    /// Snap value to the grid of Space
    explicit Quantized(T value) : value_(Traits::Quantize(value)) {}

    /// Stored (grid-aligned) value
    T Value() const { return value_; }

    /// Integer grid index (value rounded to integer for pass-through spaces)
    int64_t Ticks() const { return Internal::QuantumTicks(value_, Traits::Quantum()); }

    static constexpr bool IsQuantized() { return Traits::kQuantized; }
    static constexpr T Quantum() { return Traits::Quantum(); }

    // =========================================================================
    // Arithmetic (every result re-snapped)
    // =========================================================================

    friend Quantized operator+(Quantized lhs, Quantized rhs) {
        return Quantized(lhs.value_ + rhs.value_);
    }

    friend Quantized operator-(Quantized lhs, Quantized rhs) {
        return Quantized(lhs.value_ - rhs.value_);
    }

    friend Quantized operator*(Quantized lhs, T factor) {
        return Quantized(lhs.value_ * factor);
    }

    friend Quantized operator*(T factor, Quantized rhs) {
        return Quantized(factor * rhs.value_);
    }

    friend Quantized operator/(Quantized lhs, T divisor) {
        return Quantized(lhs.value_ / divisor);
    }

    Quantized operator-() const { return Quantized(-value_); }

    Quantized& operator+=(Quantized other) { return *this = *this + other; }
    Quantized& operator-=(Quantized other) { return *this = *this - other; }
    Quantized& operator*=(T factor) { return *this = *this * factor; }
    Quantized& operator/=(T divisor) { return *this = *this / divisor; }

    // =========================================================================
    // Comparison (exact; grid values are canonical)
    // =========================================================================

    friend bool operator==(Quantized lhs, Quantized rhs) { return lhs.value_ == rhs.value_; }
    friend bool operator!=(Quantized lhs, Quantized rhs) { return lhs.value_ != rhs.value_; }
    friend bool operator<(Quantized lhs, Quantized rhs) { return lhs.value_ < rhs.value_; }
    friend bool operator<=(Quantized lhs, Quantized rhs) { return lhs.value_ <= rhs.value_; }
    friend bool operator>(Quantized lhs, Quantized rhs) { return lhs.value_ > rhs.value_; }
    friend bool operator>=(Quantized lhs, Quantized rhs) { return lhs.value_ >= rhs.value_; }

    // =========================================================================
    // Functorial Map
    // =========================================================================

    /**
     * @brief Convert the value through transform and re-bind it to DstSpace
     *
     * @param transform Callable T -> U (U floating-point)
     * @return Quantized<U, DstSpace>(transform(Value()))
     */
    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Quantized<MappedScalar<F, T>, DstSpace> {
        return Quantized<MappedScalar<F, T>, DstSpace>(transform(value_));
    }

private:
    T value_ = T(0);
};

} // namespace Qi::Geom
