#pragma once

/**
 * @file Circle.h
 * @brief Circle: center + radius (radius >= 0; zero allowed)
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Constants.h>
#include <QiGeom/Core/Quantized.h>
#include <QiGeom/Shape/Point.h>
#include <QiGeom/Shape/Rectangle.h>

#include <cmath>

namespace Qi::Geom {

template<typename T, typename Space = Unquantized>
class Circle {
public:
    using ValueType = T;
    using SpaceType = Space;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;
    using RectangleType = ::Qi::Geom::Rectangle<T, Space>;

    Circle() = default;
    Circle(const PointType& center, T radius)
        : center_(center), radius_(SpaceTraits<Space, T>::Quantize(radius)) {}

    /// Radius 1 at the origin
    static Circle Unit() { return Circle(PointType::Zero(), T(1)); }

    const PointType& Center() const { return center_; }
    T Radius() const { return radius_; }

    /// Finite center and radius, radius >= 0
    bool IsValid() const {
        return center_.IsValid() && std::isfinite(radius_) && radius_ >= T(0);
    }

    T Diameter() const { return T(2) * radius_; }
    T Circumference() const { return static_cast<T>(TWO_PI) * radius_; }
    T Area() const { return static_cast<T>(PI) * radius_ * radius_; }

    RectangleType BoundingBox() const {
        return RectangleType::FromCorners(center_.X() - radius_, center_.Y() - radius_,
                                          center_.X() + radius_, center_.Y() + radius_);
    }

    // =========================================================================
    // Containment
    // =========================================================================

    /// Closed disk (boundary within EPSILON included)
    bool Contains(const PointType& p) const {
        return center_.DistanceTo(p) <= radius_ + static_cast<T>(EPSILON);
    }

    /// Open disk (boundary within EPSILON excluded)
    bool ContainsInterior(const PointType& p) const {
        return center_.DistanceTo(p) < radius_ - static_cast<T>(EPSILON);
    }

    /// other lies entirely inside this circle
    bool Contains(const Circle& other) const {
        return center_.DistanceTo(other.center_) + other.radius_ <=
               radius_ + static_cast<T>(EPSILON);
    }

    /// Boundaries or disks touch (one circle inside the other does not count)
    bool Intersects(const Circle& other) const {
        T d = center_.DistanceTo(other.center_);
        T eps = static_cast<T>(EPSILON);
        return d <= radius_ + other.radius_ + eps &&
               d >= std::abs(radius_ - other.radius_) - eps;
    }

    // =========================================================================
    // Parametric Form
    // =========================================================================

    /// center + r * (cos a, sin a)
    PointType PointAt(Radian angle) const {
        return PointType(center_.X() + radius_ * static_cast<T>(angle.Cos()),
                         center_.Y() + radius_ * static_cast<T>(angle.Sin()));
    }

    /// Unit tangent in the counter-clockwise direction: (-sin a, cos a)
    VectorType TangentAt(Radian angle) const {
        return VectorType(static_cast<T>(-angle.Sin()), static_cast<T>(angle.Cos()));
    }

    /// Nearest point on the circle; the center maps to PointAt(0)
    PointType ClosestPoint(const PointType& p) const {
        T dx = p.X() - center_.X();
        T dy = p.Y() - center_.Y();
        T d = std::hypot(dx, dy);
        if (!(d > T(0))) {
            return PointAt(Radian::Zero());
        }
        return PointType(center_.X() + radius_ * dx / d, center_.Y() + radius_ * dy / d);
    }

    // =========================================================================
    // Transformations
    // =========================================================================

    Circle Translated(const VectorType& offset) const { return Circle(center_ + offset, radius_); }

    /// Radius scaled by |k|, center fixed
    Circle Scaled(T k) const { return Circle(center_, std::abs(k) * radius_); }

    Circle Scaled(T k, const PointType& about) const {
        return Circle(center_.Scaled(k, about), std::abs(k) * radius_);
    }

    Circle Rotated(Radian angle, const PointType& about = PointType::Zero()) const {
        return Circle(center_.Rotated(angle, about), radius_);
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Circle<MappedScalar<F, T>, DstSpace> {
        return Circle<MappedScalar<F, T>, DstSpace>(center_.template Map<DstSpace>(transform),
                                                    transform(radius_));
    }

    bool operator==(const Circle& other) const {
        return center_ == other.center_ && radius_ == other.radius_;
    }
    bool operator!=(const Circle& other) const { return !(*this == other); }

private:
    PointType center_;
    T radius_ = T(0);
};

using Circle2d = Circle<double>;

} // namespace Qi::Geom
