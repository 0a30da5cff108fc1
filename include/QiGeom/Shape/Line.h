#pragma once

/**
 * @file Line.h
 * @brief Infinite line and line segment
 *
 * Line:    point + t * direction, t in (-inf, +inf)
 * Segment: start + t * (end - start), t in [0, 1]
 *
 * A line with a zero direction is accepted; queries that need a direction
 * (distance, projection, reflection, unit direction) return nullopt for it.
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Constants.h>
#include <QiGeom/Core/QMatrix.h>
#include <QiGeom/Shape/Point.h>

#include <algorithm>
#include <cmath>
#include <optional>

namespace Qi::Geom {

// =============================================================================
// Line
// =============================================================================

template<typename T, typename Space = Unquantized>
class Line {
public:
    using ValueType = T;
    using SpaceType = Space;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;

    Line() = default;
    Line(const PointType& point, const VectorType& direction)
        : point_(point), direction_(direction) {}

    /// Line through from and to (direction = to - from)
    static Line FromPoints(const PointType& from, const PointType& to) {
        return Line(from, to - from);
    }

    const PointType& Point() const { return point_; }
    const VectorType& Direction() const { return direction_; }

    bool IsValid() const { return point_.IsValid() && direction_.IsValid(); }

    /// point + t * direction
    PointType PointAt(T t) const {
        return PointType(point_.X() + t * direction_.DX(), point_.Y() + t * direction_.DY());
    }

    std::optional<VectorType> UnitDirection() const { return direction_.Normalized(); }

    /// Perpendicular distance from p to the line
    std::optional<T> DistanceTo(const PointType& p) const {
        T len = direction_.Length();
        if (!(len > T(0))) {
            return std::nullopt;
        }
        return std::abs(direction_.Cross(p - point_)) / len;
    }

    /// Orthogonal projection of p onto the line
    std::optional<PointType> Projection(const PointType& p) const {
        T lenSq = direction_.LengthSquared();
        if (!(lenSq > T(0))) {
            return std::nullopt;
        }
        T t = direction_.Dot(p - point_) / lenSq;
        return PointAt(t);
    }

    /// Mirror image of p across the line
    std::optional<PointType> Reflection(const PointType& p) const {
        auto proj = Projection(p);
        if (!proj) {
            return std::nullopt;
        }
        return PointType(T(2) * proj->X() - p.X(), T(2) * proj->Y() - p.Y());
    }

    /// p lies on the line (distance <= EPSILON); a zero-direction line holds only its point
    bool Contains(const PointType& p) const {
        auto dist = DistanceTo(p);
        if (!dist) {
            return p.DistanceTo(point_) <= static_cast<T>(EPSILON);
        }
        return *dist <= static_cast<T>(EPSILON);
    }

    Line Translated(const VectorType& offset) const {
        return Line(point_ + offset, direction_);
    }

    Line Rotated(Radian angle, const PointType& about = PointType::Zero()) const {
        return Line(point_.Rotated(angle, about), direction_.Rotated(angle));
    }

    /// Anchor scaled about `about`, direction multiplied by k
    Line Scaled(T k, const PointType& about = PointType::Zero()) const {
        return Line(point_.Scaled(k, about), direction_ * k);
    }

    Line Transformed(const QMatrix& m) const {
        return Line(point_.Transformed(m), direction_.Transformed(m));
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Line<MappedScalar<F, T>, DstSpace> {
        return Line<MappedScalar<F, T>, DstSpace>(point_.template Map<DstSpace>(transform),
                                                  direction_.template Map<DstSpace>(transform));
    }

    bool operator==(const Line& other) const {
        return point_ == other.point_ && direction_ == other.direction_;
    }
    bool operator!=(const Line& other) const { return !(*this == other); }

private:
    PointType point_;
    VectorType direction_;
};

// =============================================================================
// Segment
// =============================================================================

template<typename T, typename Space = Unquantized>
class Segment {
public:
    using ValueType = T;
    using SpaceType = Space;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;
    using LineType = ::Qi::Geom::Line<T, Space>;

    Segment() = default;
    Segment(const PointType& start, const PointType& end) : start_(start), end_(end) {}

    const PointType& Start() const { return start_; }
    const PointType& End() const { return end_; }

    bool IsValid() const { return start_.IsValid() && end_.IsValid(); }

    /// Length <= EPSILON
    bool IsDegenerate() const { return Length() <= static_cast<T>(EPSILON); }

    /// end - start
    VectorType Vector() const { return end_ - start_; }

    T LengthSquared() const { return start_.DistanceSquaredTo(end_); }
    T Length() const { return start_.DistanceTo(end_); }

    PointType Midpoint() const {
        return PointType((start_.X() + end_.X()) / T(2), (start_.Y() + end_.Y()) / T(2));
    }

    /// start + t * (end - start); t outside [0, 1] extrapolates
    PointType PointAt(T t) const {
        return PointType(start_.X() + t * (end_.X() - start_.X()),
                         start_.Y() + t * (end_.Y() - start_.Y()));
    }

    /// Nearest point on the segment (projection clamped to [0, 1])
    PointType ClosestPoint(const PointType& p) const {
        T dx = end_.X() - start_.X();
        T dy = end_.Y() - start_.Y();
        T lenSq = dx * dx + dy * dy;
        if (!(lenSq > T(0))) {
            return start_;
        }
        T t = ((p.X() - start_.X()) * dx + (p.Y() - start_.Y()) * dy) / lenSq;
        t = std::clamp(t, T(0), T(1));
        return PointType(start_.X() + t * dx, start_.Y() + t * dy);
    }

    T DistanceTo(const PointType& p) const {
        T dx = end_.X() - start_.X();
        T dy = end_.Y() - start_.Y();
        T lenSq = dx * dx + dy * dy;
        if (!(lenSq > T(0))) {
            return p.DistanceTo(start_);
        }
        // Unsnapped foot point; distance must not pick up grid error
        T t = std::clamp(((p.X() - start_.X()) * dx + (p.Y() - start_.Y()) * dy) / lenSq,
                         T(0), T(1));
        return std::hypot(p.X() - (start_.X() + t * dx), p.Y() - (start_.Y() + t * dy));
    }

    bool Contains(const PointType& p) const {
        return DistanceTo(p) <= static_cast<T>(EPSILON);
    }

    Segment Reversed() const { return Segment(end_, start_); }

    /// Supporting line through start with direction end - start
    LineType ToLine() const { return LineType(start_, Vector()); }

    Segment Translated(const VectorType& offset) const {
        return Segment(start_ + offset, end_ + offset);
    }

    Segment Rotated(Radian angle, const PointType& about = PointType::Zero()) const {
        return Segment(start_.Rotated(angle, about), end_.Rotated(angle, about));
    }

    /// Scale about the midpoint
    Segment Scaled(T k) const { return Scaled(k, Midpoint()); }

    Segment Scaled(T k, const PointType& about) const {
        return Segment(start_.Scaled(k, about), end_.Scaled(k, about));
    }

    Segment Transformed(const QMatrix& m) const {
        return Segment(start_.Transformed(m), end_.Transformed(m));
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Segment<MappedScalar<F, T>, DstSpace> {
        return Segment<MappedScalar<F, T>, DstSpace>(start_.template Map<DstSpace>(transform),
                                                     end_.template Map<DstSpace>(transform));
    }

    bool operator==(const Segment& other) const {
        return start_ == other.start_ && end_ == other.end_;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }

private:
    PointType start_;
    PointType end_;
};

using Line2d = Line<double>;
using Segment2d = Segment<double>;

} // namespace Qi::Geom
