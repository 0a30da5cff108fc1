#pragma once

/**
 * @file Arc.h
 * @brief Circular arc: center, radius and an angle range
 *
 * The arc runs from startAngle to endAngle. A positive sweep
 * (end - start) turns counter-clockwise, a negative one clockwise.
 * A sweep of at least 2*pi covers the whole circle.
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Constants.h>
#include <QiGeom/Core/Quantized.h>
#include <QiGeom/Shape/Circle.h>
#include <QiGeom/Shape/Point.h>
#include <QiGeom/Shape/Rectangle.h>

#include <algorithm>
#include <cmath>

namespace Qi::Geom {

template<typename T, typename Space = Unquantized>
class Arc {
public:
    using ValueType = T;
    using SpaceType = Space;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;
    using RectangleType = ::Qi::Geom::Rectangle<T, Space>;
    using CircleType = ::Qi::Geom::Circle<T, Space>;

    Arc() = default;
    Arc(const PointType& center, T radius, Radian startAngle, Radian endAngle)
        : center_(center), radius_(SpaceTraits<Space, T>::Quantize(radius)),
          startAngle_(startAngle), endAngle_(endAngle) {}

    // =========================================================================
    // Factories
    // =========================================================================

    static Arc Semicircle(const PointType& center, T radius, Radian startAngle = Radian::Zero()) {
        return Arc(center, radius, startAngle, startAngle + Radian::Pi());
    }

    static Arc QuarterCircle(const PointType& center, T radius,
                             Radian startAngle = Radian::Zero()) {
        return Arc(center, radius, startAngle, startAngle + Radian::HalfPi());
    }

    /// 0 to 2*pi
    static Arc FullCircle(const PointType& center, T radius) {
        return Arc(center, radius, Radian::Zero(), Radian::TwoPi());
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    const PointType& Center() const { return center_; }
    T Radius() const { return radius_; }
    Radian StartAngle() const { return startAngle_; }
    Radian EndAngle() const { return endAngle_; }

    bool IsValid() const {
        return center_.IsValid() && std::isfinite(radius_) && radius_ >= T(0) &&
               std::isfinite(startAngle_.Value()) && std::isfinite(endAngle_.Value());
    }

    /// endAngle - startAngle
    Radian Sweep() const { return endAngle_ - startAngle_; }

    bool IsCounterClockwise() const { return Sweep() > Radian::Zero(); }

    bool IsFullCircle() const { return std::abs(Sweep().Value()) >= TWO_PI; }

    /// Circle the arc lies on
    CircleType SupportingCircle() const { return CircleType(center_, radius_); }

    /// r * |sweep|
    T Length() const { return radius_ * static_cast<T>(std::abs(Sweep().Value())); }

    // =========================================================================
    // Points and Tangents
    // =========================================================================

    PointType StartPoint() const { return PointOnCircle(startAngle_); }
    PointType EndPoint() const { return PointOnCircle(endAngle_); }
    PointType MidPoint() const { return PointOnCircle((startAngle_ + endAngle_) / 2.0); }

    /// Point at t in [0, 1] (0 = start, 1 = end)
    PointType PointAt(T t) const {
        return PointOnCircle(startAngle_ + Sweep() * static_cast<double>(t));
    }

    /// Unit tangent at t, pointing in the direction of travel
    VectorType TangentAt(T t) const {
        Radian angle = startAngle_ + Sweep() * static_cast<double>(t);
        double sign = Sweep().Value() >= 0.0 ? 1.0 : -1.0;
        return VectorType(static_cast<T>(-sign * angle.Sin()), static_cast<T>(sign * angle.Cos()));
    }

    // =========================================================================
    // Bounds and Containment
    // =========================================================================

    /**
     * @brief Axis-aligned bounding box
     *
     * Spans both endpoints, extended to center +/- r on each axis whose
     * extreme angle (0, pi/2, pi, 3pi/2) the arc passes through.
     */
    RectangleType BoundingBox() const {
        T cx = center_.X();
        T cy = center_.Y();
        if (IsFullCircle()) {
            return RectangleType::FromCorners(cx - radius_, cy - radius_, cx + radius_, cy + radius_);
        }

        PointType s = StartPoint();
        PointType e = EndPoint();
        T minX = std::min(s.X(), e.X());
        T maxX = std::max(s.X(), e.X());
        T minY = std::min(s.Y(), e.Y());
        T maxY = std::max(s.Y(), e.Y());

        if (SweepsThrough(Radian::Zero())) {
            maxX = std::max(maxX, cx + radius_);
        }
        if (SweepsThrough(Radian::HalfPi())) {
            maxY = std::max(maxY, cy + radius_);
        }
        if (SweepsThrough(Radian::Pi())) {
            minX = std::min(minX, cx - radius_);
        }
        if (SweepsThrough(Radian(1.5 * PI))) {
            minY = std::min(minY, cy - radius_);
        }
        return RectangleType::FromCorners(minX, minY, maxX, maxY);
    }

    /// p lies on the arc (radial distance and angular offset within EPSILON)
    bool Contains(const PointType& p) const {
        T dx = p.X() - center_.X();
        T dy = p.Y() - center_.Y();
        if (std::abs(std::hypot(dx, dy) - radius_) > static_cast<T>(EPSILON)) {
            return false;
        }
        if (!(radius_ > T(0))) {
            return true;
        }
        return SweepsThrough(Radian(std::atan2(static_cast<double>(dy), static_cast<double>(dx))));
    }

    /// Angle (any winding) falls inside the swept range, endpoints included
    bool SweepsThrough(Radian angle) const {
        double sweep = Sweep().Value();
        if (std::abs(sweep) >= TWO_PI) {
            return true;
        }
        double offset = sweep >= 0.0 ? WrapOffset(angle.Value() - startAngle_.Value())
                                     : WrapOffset(startAngle_.Value() - angle.Value());
        return offset <= std::abs(sweep) + EPSILON;
    }

    // =========================================================================
    // Transformations
    // =========================================================================

    /// Same points, traversed end to start
    Arc Reversed() const { return Arc(center_, radius_, endAngle_, startAngle_); }

    Arc Translated(const VectorType& offset) const {
        return Arc(center_ + offset, radius_, startAngle_, endAngle_);
    }

    /// Radius scaled by |k|, center fixed
    Arc Scaled(T k) const { return Arc(center_, std::abs(k) * radius_, startAngle_, endAngle_); }

    /// Center scaled about `about`; a negative k turns the arc by pi
    Arc Scaled(T k, const PointType& about) const {
        Radian turn = k < T(0) ? Radian::Pi() : Radian::Zero();
        return Arc(center_.Scaled(k, about), std::abs(k) * radius_, startAngle_ + turn,
                   endAngle_ + turn);
    }

    Arc Rotated(Radian angle, const PointType& about = PointType::Zero()) const {
        return Arc(center_.Rotated(angle, about), radius_, startAngle_ + angle, endAngle_ + angle);
    }

    /// Center and radius pass through transform; the angles are kept
    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Arc<MappedScalar<F, T>, DstSpace> {
        return Arc<MappedScalar<F, T>, DstSpace>(center_.template Map<DstSpace>(transform),
                                                 transform(radius_), startAngle_, endAngle_);
    }

    bool operator==(const Arc& other) const {
        return center_ == other.center_ && radius_ == other.radius_ &&
               startAngle_ == other.startAngle_ && endAngle_ == other.endAngle_;
    }
    bool operator!=(const Arc& other) const { return !(*this == other); }

private:
    PointType PointOnCircle(Radian angle) const {
        return PointType(center_.X() + radius_ * static_cast<T>(angle.Cos()),
                         center_.Y() + radius_ * static_cast<T>(angle.Sin()));
    }

    // Offset folded into [0, 2pi); values within EPSILON below 2pi fold to 0
    static double WrapOffset(double offset) {
        double wrapped = std::fmod(offset, TWO_PI);
        if (wrapped < 0.0) {
            wrapped += TWO_PI;
        }
        if (wrapped >= TWO_PI - EPSILON) {
            wrapped = 0.0;
        }
        return wrapped;
    }

    PointType center_;
    T radius_ = T(0);
    Radian startAngle_;
    Radian endAngle_;
};

using Arc2d = Arc<double>;

} // namespace Qi::Geom
