#pragma once

/**
 * @file Triangle.h
 * @brief Triangle (a, b, c): unit of polygon triangulation
 *
 * Positive signed area means counter-clockwise vertex order.
 * Constructions that divide by the area (incircle, circumcircle,
 * orthocenter, barycentric coordinates) return nullopt for collinear
 * vertices (|2 * area| <= EPSILON).
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Constants.h>
#include <QiGeom/Core/QMatrix.h>
#include <QiGeom/Shape/Circle.h>
#include <QiGeom/Shape/Line.h>
#include <QiGeom/Shape/Point.h>
#include <QiGeom/Shape/Rectangle.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>

namespace Qi::Geom {

template<typename T, typename Space = Unquantized>
class Triangle {
public:
    using ValueType = T;
    using SpaceType = Space;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;
    using SegmentType = ::Qi::Geom::Segment<T, Space>;
    using CircleType = ::Qi::Geom::Circle<T, Space>;
    using RectangleType = ::Qi::Geom::Rectangle<T, Space>;

    Triangle() = default;
    Triangle(const PointType& a, const PointType& b, const PointType& c) : a_(a), b_(b), c_(c) {}

    const PointType& A() const { return a_; }
    const PointType& B() const { return b_; }
    const PointType& C() const { return c_; }

    std::array<PointType, 3> Vertices() const { return {a_, b_, c_}; }

    /// Edges ab, bc, ca
    std::array<SegmentType, 3> Edges() const {
        return {SegmentType(a_, b_), SegmentType(b_, c_), SegmentType(c_, a_)};
    }

    bool IsValid() const { return a_.IsValid() && b_.IsValid() && c_.IsValid(); }

    // =========================================================================
    // Metrics
    // =========================================================================

    /// cross(b - a, c - a)
    T SignedDoubleArea() const {
        return (b_.X() - a_.X()) * (c_.Y() - a_.Y()) - (b_.Y() - a_.Y()) * (c_.X() - a_.X());
    }

    T SignedArea() const { return SignedDoubleArea() / T(2); }
    T Area() const { return std::abs(SignedArea()); }

    bool IsDegenerate() const { return std::abs(SignedDoubleArea()) <= static_cast<T>(EPSILON); }

    /// Side lengths opposite a, b, c: |bc|, |ca|, |ab|
    std::array<T, 3> SideLengths() const {
        return {b_.DistanceTo(c_), c_.DistanceTo(a_), a_.DistanceTo(b_)};
    }

    T Perimeter() const {
        auto s = SideLengths();
        return s[0] + s[1] + s[2];
    }

    /// Interior angles at a, b, c (sum pi for non-degenerate triangles)
    std::array<Radian, 3> Angles() const {
        return {AngleAt(a_, b_, c_), AngleAt(b_, c_, a_), AngleAt(c_, a_, b_)};
    }

    RectangleType BoundingBox() const {
        return RectangleType::FromCorners(std::min({a_.X(), b_.X(), c_.X()}),
                                          std::min({a_.Y(), b_.Y(), c_.Y()}),
                                          std::max({a_.X(), b_.X(), c_.X()}),
                                          std::max({a_.Y(), b_.Y(), c_.Y()}));
    }

    // =========================================================================
    // Centers
    // =========================================================================

    PointType Centroid() const {
        return PointType((a_.X() + b_.X() + c_.X()) / T(3), (a_.Y() + b_.Y() + c_.Y()) / T(3));
    }

    /**
     * @brief Inscribed circle
     *
     * Center = (la * a + lb * b + lc * c) / (la + lb + lc) with side lengths
     * opposite each vertex; radius = area / semiperimeter.
     */
    std::optional<CircleType> Incircle() const {
        if (IsDegenerate()) {
            return std::nullopt;
        }
        auto s = SideLengths();
        T perimeter = s[0] + s[1] + s[2];
        T cx = (s[0] * a_.X() + s[1] * b_.X() + s[2] * c_.X()) / perimeter;
        T cy = (s[0] * a_.Y() + s[1] * b_.Y() + s[2] * c_.Y()) / perimeter;
        return CircleType(PointType(cx, cy), Area() / (perimeter / T(2)));
    }

    /// Circle through a, b, c
    std::optional<CircleType> Circumcircle() const {
        T ux = 0;
        T uy = 0;
        if (!Circumcenter(ux, uy)) {
            return std::nullopt;
        }
        return CircleType(PointType(ux, uy), std::hypot(a_.X() - ux, a_.Y() - uy));
    }

    /// Intersection of the altitudes: H = a + b + c - 2 * circumcenter
    std::optional<PointType> Orthocenter() const {
        T ux = 0;
        T uy = 0;
        if (!Circumcenter(ux, uy)) {
            return std::nullopt;
        }
        return PointType(a_.X() + b_.X() + c_.X() - T(2) * ux,
                         a_.Y() + b_.Y() + c_.Y() - T(2) * uy);
    }

    // =========================================================================
    // Barycentric Coordinates
    // =========================================================================

    /// (u, v, w) with p = u*a + v*b + w*c and u + v + w = 1
    std::optional<std::array<T, 3>> Barycentric(const PointType& p) const {
        T d = SignedDoubleArea();
        if (std::abs(d) <= static_cast<T>(EPSILON)) {
            return std::nullopt;
        }
        T u = Cross(b_, c_, p) / d;
        T v = Cross(c_, a_, p) / d;
        return std::array<T, 3>{u, v, T(1) - u - v};
    }

    PointType PointFromBarycentric(T u, T v, T w) const {
        return PointType(u * a_.X() + v * b_.X() + w * c_.X(),
                         u * a_.Y() + v * b_.Y() + w * c_.Y());
    }

    /// Closed containment; a degenerate triangle contains the points of its edges
    bool Contains(const PointType& p) const {
        auto bary = Barycentric(p);
        if (!bary) {
            for (const auto& edge : Edges()) {
                if (edge.Contains(p)) {
                    return true;
                }
            }
            return false;
        }
        T eps = static_cast<T>(EPSILON);
        return (*bary)[0] >= -eps && (*bary)[1] >= -eps && (*bary)[2] >= -eps;
    }

    // =========================================================================
    // Transformations
    // =========================================================================

    Triangle Translated(const VectorType& offset) const {
        return Triangle(a_ + offset, b_ + offset, c_ + offset);
    }

    /// Scale about the centroid
    Triangle Scaled(T k) const { return Scaled(k, Centroid()); }

    Triangle Scaled(T k, const PointType& about) const {
        return Triangle(a_.Scaled(k, about), b_.Scaled(k, about), c_.Scaled(k, about));
    }

    Triangle Rotated(Radian angle, const PointType& about = PointType::Zero()) const {
        return Triangle(a_.Rotated(angle, about), b_.Rotated(angle, about),
                        c_.Rotated(angle, about));
    }

    Triangle Transformed(const QMatrix& m) const {
        return Triangle(a_.Transformed(m), b_.Transformed(m), c_.Transformed(m));
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Triangle<MappedScalar<F, T>, DstSpace> {
        return Triangle<MappedScalar<F, T>, DstSpace>(a_.template Map<DstSpace>(transform),
                                                      b_.template Map<DstSpace>(transform),
                                                      c_.template Map<DstSpace>(transform));
    }

    bool operator==(const Triangle& other) const {
        return a_ == other.a_ && b_ == other.b_ && c_ == other.c_;
    }
    bool operator!=(const Triangle& other) const { return !(*this == other); }

private:
    // cross(q - p, r - p)
    static T Cross(const PointType& q, const PointType& r, const PointType& p) {
        return (q.X() - p.X()) * (r.Y() - p.Y()) - (q.Y() - p.Y()) * (r.X() - p.X());
    }

    // Angle at vertex between rays to p and q
    static Radian AngleAt(const PointType& vertex, const PointType& p, const PointType& q) {
        T ux = p.X() - vertex.X();
        T uy = p.Y() - vertex.Y();
        T vx = q.X() - vertex.X();
        T vy = q.Y() - vertex.Y();
        T cross = ux * vy - uy * vx;
        T dot = ux * vx + uy * vy;
        return Radian(static_cast<double>(std::atan2(std::abs(cross), dot)));
    }

    bool Circumcenter(T& ux, T& uy) const {
        T d = T(2) * SignedDoubleArea();
        if (std::abs(d) <= static_cast<T>(EPSILON)) {
            return false;
        }
        // Relative to a for better conditioning
        T bx = b_.X() - a_.X();
        T by = b_.Y() - a_.Y();
        T cx = c_.X() - a_.X();
        T cy = c_.Y() - a_.Y();
        T bSq = bx * bx + by * by;
        T cSq = cx * cx + cy * cy;
        ux = a_.X() + (cy * bSq - by * cSq) / d;
        uy = a_.Y() + (bx * cSq - cx * bSq) / d;
        return true;
    }

    PointType a_;
    PointType b_;
    PointType c_;
};

using Triangle2d = Triangle<double>;

} // namespace Qi::Geom
