#pragma once

/**
 * @file Intersection.h
 * @brief Closed-form intersections between 2D primitives
 *
 * This module provides:
 * - Line / Ray / Segment pairwise intersections (2x2 linear system)
 * - Line / Ray / Segment with Circle and Ellipse (quadratic in t)
 * - Circle-Circle intersections
 * - Line / Ray / Segment with Polygon boundary
 *
 * Conventions:
 * - Single-point results are std::optional; multi-point results are
 *   std::vector ordered by increasing parameter along the first argument
 *   (for a circle: angle from +x in [0, 2 pi))
 * - Parallel linear primitives (|cross| <= EPSILON * |d1| * |d2|) have no
 *   intersection, collinear overlap included
 * - Ray parameters must be >= 0 and segment parameters in [0, 1], both
 *   with EPSILON slack
 * - Tangency is decided in geometric units: a line whose distance to the
 *   center differs from the radius by at most EPSILON touches once
 * - Result points are built in the space of the arguments (re-snapped)
 */

#include <QiGeom/Core/Constants.h>
#include <QiGeom/Shape/Circle.h>
#include <QiGeom/Shape/Ellipse.h>
#include <QiGeom/Shape/Line.h>
#include <QiGeom/Shape/Point.h>
#include <QiGeom/Shape/Polygon.h>
#include <QiGeom/Shape/Ray.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

namespace Qi::Geom {

namespace Internal {

// =============================================================================
// Parametric Form
// =============================================================================

/// Admissible parameter range of a linear primitive
enum class ParamRange {
    Unbounded,      ///< Line: t in (-inf, inf)
    NonNegative,    ///< Ray: t >= 0
    UnitInterval    ///< Segment: t in [0, 1]
};

/// p + t * d restricted to range
template<typename T>
struct Parametric {
    T px = T(0);
    T py = T(0);
    T dx = T(0);
    T dy = T(0);
    ParamRange range = ParamRange::Unbounded;
};

template<typename T, typename Space>
Parametric<T> ToParametric(const Line<T, Space>& line) {
    return {line.Point().X(), line.Point().Y(), line.Direction().DX(), line.Direction().DY(),
            ParamRange::Unbounded};
}

template<typename T, typename Space>
Parametric<T> ToParametric(const Ray<T, Space>& ray) {
    return {ray.Origin().X(), ray.Origin().Y(), ray.Direction().DX(), ray.Direction().DY(),
            ParamRange::NonNegative};
}

template<typename T, typename Space>
Parametric<T> ToParametric(const Segment<T, Space>& seg) {
    return {seg.Start().X(), seg.Start().Y(), seg.End().X() - seg.Start().X(),
            seg.End().Y() - seg.Start().Y(), ParamRange::UnitInterval};
}

/// t admissible for range (EPSILON slack); t is clamped into the range
template<typename T>
bool AcceptParam(T& t, ParamRange range) {
    T eps = static_cast<T>(EPSILON);
    switch (range) {
        case ParamRange::Unbounded:
            return true;
        case ParamRange::NonNegative:
            if (t < -eps) {
                return false;
            }
            t = std::max(t, T(0));
            return true;
        case ParamRange::UnitInterval:
            if (t < -eps || t > T(1) + eps) {
                return false;
            }
            t = std::clamp(t, T(0), T(1));
            return true;
    }
    return false;
}

template<typename T, typename Space>
Point<T, Space> PointAt(const Parametric<T>& p, T t) {
    return Point<T, Space>(p.px + t * p.dx, p.py + t * p.dy);
}

// =============================================================================
// Solvers
// =============================================================================

/**
 * @brief Solve p1 + t*d1 = p2 + u*d2
 * @return (t, u) inside both ranges, nullopt when parallel or out of range
 */
template<typename T>
std::optional<std::pair<T, T>> SolveLinear(const Parametric<T>& a, const Parametric<T>& b) {
    T cross = a.dx * b.dy - a.dy * b.dx;
    T lenA = std::hypot(a.dx, a.dy);
    T lenB = std::hypot(b.dx, b.dy);
    if (std::abs(cross) <= static_cast<T>(EPSILON) * lenA * lenB) {
        return std::nullopt;
    }
    T wx = b.px - a.px;
    T wy = b.py - a.py;
    T t = (wx * b.dy - wy * b.dx) / cross;
    T u = (wx * a.dy - wy * a.dx) / cross;
    if (!AcceptParam(t, a.range) || !AcceptParam(u, b.range)) {
        return std::nullopt;
    }
    return std::make_pair(t, u);
}

/**
 * @brief Parameters where p + t*d meets the circle |x - c| = r
 *
 * Quadratic |p - c + t d|^2 = r^2 in half-b form:
 *   a = d.d, h = d.(p - c), k = |p - c|^2 - r^2
 * disc / a = r^2 - dist(c, line)^2 decides the case:
 *   < -EPSILON: miss; within EPSILON: tangent (one root); otherwise two roots.
 *
 * @return Admissible roots in increasing order
 */
template<typename T>
std::vector<T> SolveCircle(const Parametric<T>& p, T cx, T cy, T r) {
    std::vector<T> roots;
    T eps = static_cast<T>(EPSILON);
    T ox = p.px - cx;
    T oy = p.py - cy;
    T a = p.dx * p.dx + p.dy * p.dy;

    if (!(a > T(0))) {
        // Zero direction: the primitive is a single point
        T t = T(0);
        if (std::abs(std::hypot(ox, oy) - r) <= eps && AcceptParam(t, p.range)) {
            roots.push_back(T(0));
        }
        return roots;
    }

    T h = p.dx * ox + p.dy * oy;
    T k = ox * ox + oy * oy - r * r;
    T disc = h * h - a * k;
    T lenD = std::sqrt(a);

    // Signed gap between radius and line distance, in length units
    T perp = std::abs(p.dx * oy - p.dy * ox) / lenD;
    if (perp > r + eps) {
        return roots;
    }
    if (std::abs(perp - r) <= eps || disc <= T(0)) {
        T t = -h / a;
        if (AcceptParam(t, p.range)) {
            roots.push_back(t);
        }
        return roots;
    }

    T sq = std::sqrt(disc);
    T t1 = (-h - sq) / a;
    T t2 = (-h + sq) / a;
    if (AcceptParam(t1, p.range)) {
        roots.push_back(t1);
    }
    if (AcceptParam(t2, p.range)) {
        roots.push_back(t2);
    }
    return roots;
}

/// Map the primitive into the ellipse frame where the ellipse is the unit circle
template<typename T, typename Space>
std::vector<T> SolveEllipse(const Parametric<T>& p, const Ellipse<T, Space>& e) {
    T a = e.SemiMajor();
    T b = e.SemiMinor();
    if (!(a > T(0)) || !(b > T(0))) {
        return {};
    }
    T c = static_cast<T>(e.Rotation().Cos());
    T s = static_cast<T>(e.Rotation().Sin());
    T ox = p.px - e.Center().X();
    T oy = p.py - e.Center().Y();

    // Rotate by -rotation, then scale axes by (1/a, 1/b); the map is affine so
    // the parameter t is unchanged
    Parametric<T> local;
    local.px = (ox * c + oy * s) / a;
    local.py = (-ox * s + oy * c) / b;
    local.dx = (p.dx * c + p.dy * s) / a;
    local.dy = (-p.dx * s + p.dy * c) / b;
    local.range = p.range;
    return SolveCircle(local, T(0), T(0), T(1));
}

/// Hits of a linear primitive with every polygon edge, sorted by t, duplicates merged
template<typename T, typename Space>
std::vector<Point<T, Space>> SolvePolygon(const Parametric<T>& p, const Polygon<T, Space>& poly) {
    std::vector<T> params;
    const auto& vertices = poly.Vertices();
    size_t n = vertices.size();
    if (n < 2) {
        return {};
    }
    for (size_t i = 0; i < n; ++i) {
        Parametric<T> edge = ToParametric(Segment<T, Space>(vertices[i], vertices[(i + 1) % n]));
        auto hit = SolveLinear(p, edge);
        if (hit) {
            params.push_back(hit->first);
        }
    }
    std::sort(params.begin(), params.end());

    // A hit through a shared vertex is reported by both edges
    std::vector<Point<T, Space>> points;
    T last = T(0);
    bool hasLast = false;
    for (T t : params) {
        if (hasLast && std::abs(t - last) <= static_cast<T>(EPSILON)) {
            continue;
        }
        points.push_back(PointAt<T, Space>(p, t));
        last = t;
        hasLast = true;
    }
    return points;
}

template<typename T, typename Space>
std::optional<Point<T, Space>> LinearHit(const Parametric<T>& a, const Parametric<T>& b) {
    auto hit = SolveLinear(a, b);
    if (!hit) {
        return std::nullopt;
    }
    return PointAt<T, Space>(a, hit->first);
}

template<typename T, typename Space>
std::vector<Point<T, Space>> PointsAt(const Parametric<T>& p, const std::vector<T>& params) {
    std::vector<Point<T, Space>> points;
    points.reserve(params.size());
    for (T t : params) {
        points.push_back(PointAt<T, Space>(p, t));
    }
    return points;
}

} // namespace Internal

// =============================================================================
// Linear - Linear
// =============================================================================

template<typename T, typename Space>
std::optional<Point<T, Space>> IntersectLineLine(const Line<T, Space>& l1,
                                                 const Line<T, Space>& l2) {
    return Internal::LinearHit<T, Space>(Internal::ToParametric(l1), Internal::ToParametric(l2));
}

template<typename T, typename Space>
std::optional<Point<T, Space>> IntersectRayLine(const Ray<T, Space>& ray,
                                                const Line<T, Space>& line) {
    return Internal::LinearHit<T, Space>(Internal::ToParametric(ray), Internal::ToParametric(line));
}

template<typename T, typename Space>
std::optional<Point<T, Space>> IntersectRayRay(const Ray<T, Space>& r1, const Ray<T, Space>& r2) {
    return Internal::LinearHit<T, Space>(Internal::ToParametric(r1), Internal::ToParametric(r2));
}

template<typename T, typename Space>
std::optional<Point<T, Space>> IntersectRaySegment(const Ray<T, Space>& ray,
                                                   const Segment<T, Space>& seg) {
    return Internal::LinearHit<T, Space>(Internal::ToParametric(ray), Internal::ToParametric(seg));
}

template<typename T, typename Space>
std::optional<Point<T, Space>> IntersectLineSegment(const Line<T, Space>& line,
                                                    const Segment<T, Space>& seg) {
    return Internal::LinearHit<T, Space>(Internal::ToParametric(line), Internal::ToParametric(seg));
}

template<typename T, typename Space>
std::optional<Point<T, Space>> IntersectSegmentSegment(const Segment<T, Space>& s1,
                                                       const Segment<T, Space>& s2) {
    return Internal::LinearHit<T, Space>(Internal::ToParametric(s1), Internal::ToParametric(s2));
}

// =============================================================================
// Linear - Circle
// =============================================================================

/**
 * @brief Ray-circle intersection
 *
 * - Miss: empty
 * - Tangent ahead of the origin: one point
 * - Secant: every root with t >= 0 (origin strictly inside gives exactly the
 *   exit point)
 */
template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectRayCircle(const Ray<T, Space>& ray,
                                                const Circle<T, Space>& circle) {
    auto p = Internal::ToParametric(ray);
    return Internal::PointsAt<T, Space>(
        p, Internal::SolveCircle(p, circle.Center().X(), circle.Center().Y(), circle.Radius()));
}

template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectLineCircle(const Line<T, Space>& line,
                                                 const Circle<T, Space>& circle) {
    auto p = Internal::ToParametric(line);
    return Internal::PointsAt<T, Space>(
        p, Internal::SolveCircle(p, circle.Center().X(), circle.Center().Y(), circle.Radius()));
}

template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectSegmentCircle(const Segment<T, Space>& seg,
                                                    const Circle<T, Space>& circle) {
    auto p = Internal::ToParametric(seg);
    return Internal::PointsAt<T, Space>(
        p, Internal::SolveCircle(p, circle.Center().X(), circle.Center().Y(), circle.Radius()));
}

// =============================================================================
// Circle - Circle
// =============================================================================

/**
 * @brief Boundary intersections of two circles
 *
 * Concentric circles (coincident included) return empty; externally or
 * internally tangent circles return one point. Points are ordered by angle
 * around c1's center, measured from +x in [0, 2 pi).
 */
template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectCircleCircle(const Circle<T, Space>& c1,
                                                   const Circle<T, Space>& c2) {
    std::vector<Point<T, Space>> points;
    T eps = static_cast<T>(EPSILON);
    T dx = c2.Center().X() - c1.Center().X();
    T dy = c2.Center().Y() - c1.Center().Y();
    T d = std::hypot(dx, dy);
    T r1 = c1.Radius();
    T r2 = c2.Radius();

    if (d <= eps || d > r1 + r2 + eps || d < std::abs(r1 - r2) - eps) {
        return points;
    }

    // Foot of the radical line on the center line, and half-chord length
    T a = (r1 * r1 - r2 * r2 + d * d) / (T(2) * d);
    T hSq = r1 * r1 - a * a;
    T h = hSq > T(0) ? std::sqrt(hSq) : T(0);
    T ux = dx / d;
    T uy = dy / d;
    T mx = c1.Center().X() + a * ux;
    T my = c1.Center().Y() + a * uy;

    bool tangent = std::abs(d - (r1 + r2)) <= eps || std::abs(d - std::abs(r1 - r2)) <= eps ||
                   h <= eps;
    if (tangent) {
        points.emplace_back(mx, my);
        return points;
    }

    std::pair<T, T> hits[2] = {{mx - h * uy, my + h * ux}, {mx + h * uy, my - h * ux}};
    auto angleOf = [&](const std::pair<T, T>& q) {
        T angle = std::atan2(q.second - c1.Center().Y(), q.first - c1.Center().X());
        return angle < T(0) ? angle + static_cast<T>(TWO_PI) : angle;
    };
    if (angleOf(hits[1]) < angleOf(hits[0])) {
        std::swap(hits[0], hits[1]);
    }
    points.emplace_back(hits[0].first, hits[0].second);
    points.emplace_back(hits[1].first, hits[1].second);
    return points;
}

// =============================================================================
// Linear - Ellipse
// =============================================================================

template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectLineEllipse(const Line<T, Space>& line,
                                                  const Ellipse<T, Space>& ellipse) {
    auto p = Internal::ToParametric(line);
    return Internal::PointsAt<T, Space>(p, Internal::SolveEllipse(p, ellipse));
}

template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectRayEllipse(const Ray<T, Space>& ray,
                                                 const Ellipse<T, Space>& ellipse) {
    auto p = Internal::ToParametric(ray);
    return Internal::PointsAt<T, Space>(p, Internal::SolveEllipse(p, ellipse));
}

template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectSegmentEllipse(const Segment<T, Space>& seg,
                                                     const Ellipse<T, Space>& ellipse) {
    auto p = Internal::ToParametric(seg);
    return Internal::PointsAt<T, Space>(p, Internal::SolveEllipse(p, ellipse));
}

// =============================================================================
// Linear - Polygon
// =============================================================================

/// Crossings with the polygon boundary; edges parallel to the line are skipped
template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectLinePolygon(const Line<T, Space>& line,
                                                  const Polygon<T, Space>& polygon) {
    return Internal::SolvePolygon(Internal::ToParametric(line), polygon);
}

template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectRayPolygon(const Ray<T, Space>& ray,
                                                 const Polygon<T, Space>& polygon) {
    return Internal::SolvePolygon(Internal::ToParametric(ray), polygon);
}

template<typename T, typename Space>
std::vector<Point<T, Space>> IntersectSegmentPolygon(const Segment<T, Space>& seg,
                                                     const Polygon<T, Space>& polygon) {
    return Internal::SolvePolygon(Internal::ToParametric(seg), polygon);
}

} // namespace Qi::Geom
