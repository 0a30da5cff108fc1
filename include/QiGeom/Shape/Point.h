#pragma once

/**
 * @file Point.h
 * @brief 2D point and displacement vector
 *
 * Point and Vector are distinct types:
 *   Point - Point  = Vector
 *   Point + Vector = Point
 *   Point - Vector = Point
 *
 * Both store coordinates already snapped to the grid of Space; every
 * constructor and every derived result re-snaps.
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/QMatrix.h>
#include <QiGeom/Core/Quantized.h>
#include <QiGeom/Core/Space.h>

#include <cmath>
#include <optional>

namespace Qi::Geom {

// =============================================================================
// Vector
// =============================================================================

/**
 * @brief 2D displacement (dx, dy)
 */
template<typename T, typename Space = Unquantized>
class Vector {
public:
    using ValueType = T;
    using SpaceType = Space;
    using Scalar = Quantized<T, Space>;

    Vector() = default;
    Vector(T dx, T dy)
        : dx_(SpaceTraits<Space, T>::Quantize(dx)), dy_(SpaceTraits<Space, T>::Quantize(dy)) {}
    Vector(Scalar dx, Scalar dy) : dx_(dx.Value()), dy_(dy.Value()) {}

    static Vector Zero() { return Vector(T(0), T(0)); }

    T DX() const { return dx_; }
    T DY() const { return dy_; }
    Scalar QuantizedDX() const { return Scalar(dx_); }
    Scalar QuantizedDY() const { return Scalar(dy_); }

    bool IsValid() const { return std::isfinite(dx_) && std::isfinite(dy_); }
    bool IsZero() const { return dx_ == T(0) && dy_ == T(0); }

    T LengthSquared() const { return dx_ * dx_ + dy_ * dy_; }
    T Length() const { return std::hypot(dx_, dy_); }

    T Dot(const Vector& other) const { return dx_ * other.dx_ + dy_ * other.dy_; }

    /// 2D cross product (z component): positive when other is CCW from this
    T Cross(const Vector& other) const { return dx_ * other.dy_ - dy_ * other.dx_; }

    /**
     * @brief Unit vector in the same direction
     *
     * The components are snapped to the grid of Space like any other
     * vector, so in a coarse quantized space the result is only close to
     * unit length: with quantum 0.25, (1, 2) becomes (0.5, 1.0).
     * @return nullopt for a zero-length vector
     */
    std::optional<Vector> Normalized() const {
        T len = Length();
        if (!(len > T(0))) {
            return std::nullopt;
        }
        return Vector(dx_ / len, dy_ / len);
    }

    /// Rotated by +90 degrees: (-dy, dx)
    Vector Perpendicular() const { return Vector(-dy_, dx_); }

    Vector Rotated(Radian angle) const {
        return Transformed(QMatrix::Rotation(angle));
    }

    /// Linear part only; translation is ignored
    Vector Transformed(const QMatrix& m) const {
        double ox = 0.0;
        double oy = 0.0;
        m.ApplyVector(static_cast<double>(dx_), static_cast<double>(dy_), ox, oy);
        return Vector(static_cast<T>(ox), static_cast<T>(oy));
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Vector<MappedScalar<F, T>, DstSpace> {
        return Vector<MappedScalar<F, T>, DstSpace>(transform(dx_), transform(dy_));
    }

    // =========================================================================
    // Operators
    // =========================================================================

    Vector operator+(const Vector& other) const { return Vector(dx_ + other.dx_, dy_ + other.dy_); }
    Vector operator-(const Vector& other) const { return Vector(dx_ - other.dx_, dy_ - other.dy_); }
    Vector operator-() const { return Vector(-dx_, -dy_); }
    Vector operator*(T k) const { return Vector(dx_ * k, dy_ * k); }
    Vector operator/(T k) const { return Vector(dx_ / k, dy_ / k); }

    Vector& operator+=(const Vector& other) { return *this = *this + other; }
    Vector& operator-=(const Vector& other) { return *this = *this - other; }

    bool operator==(const Vector& other) const { return dx_ == other.dx_ && dy_ == other.dy_; }
    bool operator!=(const Vector& other) const { return !(*this == other); }

private:
    T dx_ = T(0);
    T dy_ = T(0);
};

template<typename T, typename Space>
inline Vector<T, Space> operator*(T k, const Vector<T, Space>& v) {
    return v * k;
}

// =============================================================================
// Point
// =============================================================================

/**
 * @brief 2D location (x, y)
 */
template<typename T, typename Space = Unquantized>
class Point {
public:
    using ValueType = T;
    using SpaceType = Space;
    using Scalar = Quantized<T, Space>;
    using VectorType = Vector<T, Space>;

    Point() = default;
    Point(T x, T y)
        : x_(SpaceTraits<Space, T>::Quantize(x)), y_(SpaceTraits<Space, T>::Quantize(y)) {}
    Point(Scalar x, Scalar y) : x_(x.Value()), y_(y.Value()) {}

    static Point Zero() { return Point(T(0), T(0)); }

    T X() const { return x_; }
    T Y() const { return y_; }
    Scalar QuantizedX() const { return Scalar(x_); }
    Scalar QuantizedY() const { return Scalar(y_); }

    bool IsValid() const { return std::isfinite(x_) && std::isfinite(y_); }

    T DistanceSquaredTo(const Point& other) const {
        T dx = x_ - other.x_;
        T dy = y_ - other.y_;
        return dx * dx + dy * dy;
    }

    T DistanceTo(const Point& other) const {
        return std::hypot(x_ - other.x_, y_ - other.y_);
    }

    /// Vector from the origin to this point
    VectorType ToVector() const { return VectorType(x_, y_); }

    Point Translated(const VectorType& offset) const { return *this + offset; }

    Point Rotated(Radian angle, const Point& about = Point::Zero()) const {
        return Transformed(QMatrix::Rotation(angle, static_cast<double>(about.x_),
                                             static_cast<double>(about.y_)));
    }

    /// about + k * (this - about)
    Point Scaled(T k, const Point& about = Point::Zero()) const {
        return Point(about.x_ + k * (x_ - about.x_), about.y_ + k * (y_ - about.y_));
    }

    Point Transformed(const QMatrix& m) const {
        double ox = 0.0;
        double oy = 0.0;
        m.Apply(static_cast<double>(x_), static_cast<double>(y_), ox, oy);
        return Point(static_cast<T>(ox), static_cast<T>(oy));
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Point<MappedScalar<F, T>, DstSpace> {
        return Point<MappedScalar<F, T>, DstSpace>(transform(x_), transform(y_));
    }

    // =========================================================================
    // Operators
    // =========================================================================

    VectorType operator-(const Point& other) const { return VectorType(x_ - other.x_, y_ - other.y_); }
    Point operator+(const VectorType& v) const { return Point(x_ + v.DX(), y_ + v.DY()); }
    Point operator-(const VectorType& v) const { return Point(x_ - v.DX(), y_ - v.DY()); }

    Point& operator+=(const VectorType& v) { return *this = *this + v; }
    Point& operator-=(const VectorType& v) { return *this = *this - v; }

    bool operator==(const Point& other) const { return x_ == other.x_ && y_ == other.y_; }
    bool operator!=(const Point& other) const { return !(*this == other); }

private:
    T x_ = T(0);
    T y_ = T(0);
};

// =============================================================================
// Type Aliases
// =============================================================================

using Point2d = Point<double>;
using Point2f = Point<float>;
using Vector2d = Vector<double>;
using Vector2f = Vector<float>;

} // namespace Qi::Geom
