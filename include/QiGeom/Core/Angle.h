#pragma once

/**
 * @file Angle.h
 * @brief Angle type in radians
 *
 * Angles are never quantized; they pass through Map unchanged.
 * Positive angles rotate counter-clockwise (y axis pointing up).
 */

#include <QiGeom/Core/Export.h>

namespace Qi::Geom {

/**
 * @brief Angle in radians
 */
class QIGEOM_API Radian {
public:
    Radian() = default;
    explicit Radian(double value) : value_(value) {}

    // =========================================================================
    // Factories
    // =========================================================================

    static Radian Zero() { return Radian(0.0); }
    static Radian HalfPi();
    static Radian Pi();
    static Radian TwoPi();
    static Radian FromDegrees(double degrees);

    // =========================================================================
    // Accessors
    // =========================================================================

    double Value() const { return value_; }
    double Degrees() const;

    double Cos() const;
    double Sin() const;
    double Tan() const;

    /// Equivalent angle in [-pi, pi)
    Radian Normalized() const;

    // =========================================================================
    // Arithmetic
    // =========================================================================

    Radian operator+(Radian other) const { return Radian(value_ + other.value_); }
    Radian operator-(Radian other) const { return Radian(value_ - other.value_); }
    Radian operator-() const { return Radian(-value_); }
    Radian operator*(double k) const { return Radian(value_ * k); }
    Radian operator/(double k) const { return Radian(value_ / k); }

    Radian& operator+=(Radian other) { value_ += other.value_; return *this; }
    Radian& operator-=(Radian other) { value_ -= other.value_; return *this; }

    bool operator==(Radian other) const { return value_ == other.value_; }
    bool operator!=(Radian other) const { return value_ != other.value_; }
    bool operator<(Radian other) const { return value_ < other.value_; }
    bool operator<=(Radian other) const { return value_ <= other.value_; }
    bool operator>(Radian other) const { return value_ > other.value_; }
    bool operator>=(Radian other) const { return value_ >= other.value_; }

private:
    double value_ = 0.0;
};

inline Radian operator*(double k, Radian angle) { return angle * k; }

} // namespace Qi::Geom
