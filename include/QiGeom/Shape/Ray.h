#pragma once

/**
 * @file Ray.h
 * @brief Half-line: origin + t * direction, t >= 0
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Constants.h>
#include <QiGeom/Core/QMatrix.h>
#include <QiGeom/Shape/Line.h>
#include <QiGeom/Shape/Point.h>

#include <algorithm>
#include <cmath>
#include <optional>

namespace Qi::Geom {

/**
 * @brief Axis-aligned unit directions (y axis pointing up)
 */
enum class CardinalDirection {
    Right,  ///< (+1, 0)
    Up,     ///< (0, +1)
    Left,   ///< (-1, 0)
    Down    ///< (0, -1)
};

template<typename T, typename Space = Unquantized>
class Ray {
public:
    using ValueType = T;
    using SpaceType = Space;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;
    using LineType = ::Qi::Geom::Line<T, Space>;

    Ray() = default;
    Ray(const PointType& origin, const VectorType& direction)
        : origin_(origin), direction_(direction) {}

    /// Ray from origin passing through `through`
    static Ray FromPoints(const PointType& origin, const PointType& through) {
        return Ray(origin, through - origin);
    }

    /// Ray from origin along a unit axis direction
    static Ray FromDirection(const PointType& origin, CardinalDirection direction) {
        switch (direction) {
            case CardinalDirection::Right: return Ray(origin, VectorType(T(1), T(0)));
            case CardinalDirection::Up:    return Ray(origin, VectorType(T(0), T(1)));
            case CardinalDirection::Left:  return Ray(origin, VectorType(T(-1), T(0)));
            case CardinalDirection::Down:  return Ray(origin, VectorType(T(0), T(-1)));
        }
        return Ray(origin, VectorType(T(1), T(0)));
    }

    const PointType& Origin() const { return origin_; }
    const VectorType& Direction() const { return direction_; }

    bool IsValid() const { return origin_.IsValid() && direction_.IsValid(); }

    std::optional<VectorType> UnitDirection() const { return direction_.Normalized(); }

    /// origin + t * direction (any t; negative t lies behind the origin)
    PointType PointAt(T t) const {
        return PointType(origin_.X() + t * direction_.DX(), origin_.Y() + t * direction_.DY());
    }

    /**
     * @brief p lies on the ray
     *
     * Perpendicular distance to the supporting line <= EPSILON and projected
     * parameter t >= -EPSILON. A zero-direction ray contains only its origin.
     */
    bool Contains(const PointType& p) const {
        T dx = p.X() - origin_.X();
        T dy = p.Y() - origin_.Y();
        T lenSq = direction_.LengthSquared();
        if (!(lenSq > T(0))) {
            return std::hypot(dx, dy) <= static_cast<T>(EPSILON);
        }
        T len = std::sqrt(lenSq);
        T perp = std::abs(direction_.DX() * dy - direction_.DY() * dx) / len;
        if (perp > static_cast<T>(EPSILON)) {
            return false;
        }
        T t = (direction_.DX() * dx + direction_.DY() * dy) / lenSq;
        return t >= -static_cast<T>(EPSILON);
    }

    /// Nearest point on the ray (parameter clamped to t >= 0)
    PointType ClosestPoint(const PointType& p) const {
        T lenSq = direction_.LengthSquared();
        if (!(lenSq > T(0))) {
            return origin_;
        }
        T t = ((p.X() - origin_.X()) * direction_.DX() +
               (p.Y() - origin_.Y()) * direction_.DY()) / lenSq;
        return PointAt(std::max(t, T(0)));
    }

    T DistanceTo(const PointType& p) const {
        T lenSq = direction_.LengthSquared();
        if (!(lenSq > T(0))) {
            return p.DistanceTo(origin_);
        }
        T t = std::max(((p.X() - origin_.X()) * direction_.DX() +
                        (p.Y() - origin_.Y()) * direction_.DY()) / lenSq, T(0));
        return std::hypot(p.X() - (origin_.X() + t * direction_.DX()),
                          p.Y() - (origin_.Y() + t * direction_.DY()));
    }

    /// Supporting line
    LineType ToLine() const { return LineType(origin_, direction_); }

    Ray Translated(const VectorType& offset) const { return Ray(origin_ + offset, direction_); }

    Ray Rotated(Radian angle, const PointType& about = PointType::Zero()) const {
        return Ray(origin_.Rotated(angle, about), direction_.Rotated(angle));
    }

    /// Origin scaled about `about`, direction multiplied by k (k < 0 reverses the ray)
    Ray Scaled(T k, const PointType& about = PointType::Zero()) const {
        return Ray(origin_.Scaled(k, about), direction_ * k);
    }

    Ray Transformed(const QMatrix& m) const {
        return Ray(origin_.Transformed(m), direction_.Transformed(m));
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Ray<MappedScalar<F, T>, DstSpace> {
        return Ray<MappedScalar<F, T>, DstSpace>(origin_.template Map<DstSpace>(transform),
                                                 direction_.template Map<DstSpace>(transform));
    }

    bool operator==(const Ray& other) const {
        return origin_ == other.origin_ && direction_ == other.direction_;
    }
    bool operator!=(const Ray& other) const { return !(*this == other); }

private:
    PointType origin_;
    VectorType direction_;
};

using Ray2d = Ray<double>;

} // namespace Qi::Geom
