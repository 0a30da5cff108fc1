#pragma once

/**
 * @file Polygon.h
 * @brief Simple polygon engine: metrics, containment, triangulation
 *
 * Vertices are stored in order; the closing edge (last -> first) is
 * implicit. A polygon is valid with at least 3 vertices. Orientation is
 * derived from the shoelace signed area (positive = counter-clockwise).
 *
 * Triangulation:
 * - Convex polygons: fan from vertex 0, N - 2 triangles
 * - Simple concave polygons (either orientation): ear clipping
 * Self-intersecting polygons are not supported.
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Constants.h>
#include <QiGeom/Core/QMatrix.h>
#include <QiGeom/Core/Validate.h>
#include <QiGeom/Shape/Line.h>
#include <QiGeom/Shape/Point.h>
#include <QiGeom/Shape/Rectangle.h>
#include <QiGeom/Shape/Triangle.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

namespace Qi::Geom {

template<typename T, typename Space = Unquantized>
class Polygon {
public:
    using ValueType = T;
    using SpaceType = Space;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;
    using SegmentType = ::Qi::Geom::Segment<T, Space>;
    using TriangleType = ::Qi::Geom::Triangle<T, Space>;
    using RectangleType = ::Qi::Geom::Rectangle<T, Space>;

    Polygon() = default;
    explicit Polygon(std::vector<PointType> vertices) : vertices_(std::move(vertices)) {}
    Polygon(std::initializer_list<PointType> vertices) : vertices_(vertices) {}

    // =========================================================================
    // Factories
    // =========================================================================

    /**
     * @brief Regular polygon inscribed in a circle (counter-clockwise)
     *
     * Vertex k lies at center + r * (cos(rotation + 2 pi k / n), sin(...)).
     *
     * @throws InvalidArgumentException if sides < 3 or circumradius is
     *         negative or not finite
     */
    static Polygon Regular(const PointType& center, T circumradius, size_t sides,
                           Radian rotation = Radian::Zero()) {
        QIGEOM_REQUIRE_MIN(sides, static_cast<size_t>(3));
        QIGEOM_REQUIRE_FINITE(circumradius);
        QIGEOM_REQUIRE_NON_NEGATIVE(circumradius);

        std::vector<PointType> vertices;
        vertices.reserve(sides);
        for (size_t k = 0; k < sides; ++k) {
            Radian angle = rotation + Radian(TWO_PI * static_cast<double>(k) /
                                             static_cast<double>(sides));
            vertices.emplace_back(center.X() + circumradius * static_cast<T>(angle.Cos()),
                                  center.Y() + circumradius * static_cast<T>(angle.Sin()));
        }
        return Polygon(std::move(vertices));
    }

    /// Corners of the (normalized) rectangle, counter-clockwise from lower-left
    static Polygon FromRectangle(const RectangleType& rect) {
        RectangleType r = rect.Normalized();
        return Polygon({r.Corner(RectCorner::BottomLeft), r.Corner(RectCorner::BottomRight),
                        r.Corner(RectCorner::TopRight), r.Corner(RectCorner::TopLeft)});
    }

    // =========================================================================
    // Vertices and Edges
    // =========================================================================

    size_t VertexCount() const { return vertices_.size(); }
    bool IsEmpty() const { return vertices_.empty(); }
    bool IsValid() const { return vertices_.size() >= 3; }

    const std::vector<PointType>& Vertices() const { return vertices_; }

    /// @throws OutOfRangeException if index >= VertexCount()
    const PointType& Vertex(size_t index) const {
        QIGEOM_REQUIRE_INDEX(index, vertices_.size());
        return vertices_[index];
    }

    /// Edges i -> i+1 including the closing edge; empty below 2 vertices
    std::vector<SegmentType> Edges() const {
        std::vector<SegmentType> edges;
        size_t n = vertices_.size();
        if (n < 2) {
            return edges;
        }
        edges.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            edges.emplace_back(vertices_[i], vertices_[(i + 1) % n]);
        }
        return edges;
    }

    // =========================================================================
    // Metrics
    // =========================================================================

    /// Shoelace sum: sum(x_i * y_{i+1} - x_{i+1} * y_i); 0 below 3 vertices
    T SignedDoubleArea() const {
        size_t n = vertices_.size();
        if (n < 3) {
            return T(0);
        }
        T sum = T(0);
        for (size_t i = 0; i < n; ++i) {
            const PointType& p = vertices_[i];
            const PointType& q = vertices_[(i + 1) % n];
            sum += p.X() * q.Y() - q.X() * p.Y();
        }
        return sum;
    }

    T SignedArea() const { return SignedDoubleArea() / T(2); }
    T Area() const { return std::abs(SignedArea()); }

    T Perimeter() const {
        T sum = T(0);
        size_t n = vertices_.size();
        if (n < 2) {
            return sum;
        }
        for (size_t i = 0; i < n; ++i) {
            sum += vertices_[i].DistanceTo(vertices_[(i + 1) % n]);
        }
        return sum;
    }

    bool IsCounterClockwise() const { return SignedDoubleArea() > static_cast<T>(EPSILON); }
    bool IsClockwise() const { return SignedDoubleArea() < -static_cast<T>(EPSILON); }

    /**
     * @brief Area centroid
     *
     * C = 1 / (3 * 2A) * sum((p_i + p_{i+1}) * cross_i), 2A = SignedDoubleArea()
     *
     * @return nullopt below 3 vertices or when |2A| <= EPSILON
     */
    std::optional<PointType> Centroid() const {
        size_t n = vertices_.size();
        if (n < 3) {
            return std::nullopt;
        }
        T a = SignedDoubleArea();
        if (std::abs(a) <= static_cast<T>(EPSILON)) {
            return std::nullopt;
        }
        T cx = T(0);
        T cy = T(0);
        for (size_t i = 0; i < n; ++i) {
            const PointType& p = vertices_[i];
            const PointType& q = vertices_[(i + 1) % n];
            T cross = p.X() * q.Y() - q.X() * p.Y();
            cx += (p.X() + q.X()) * cross;
            cy += (p.Y() + q.Y()) * cross;
        }
        T factor = T(1) / (T(3) * a);
        return PointType(cx * factor, cy * factor);
    }

    /// nullopt for an empty polygon
    std::optional<RectangleType> BoundingBox() const {
        if (vertices_.empty()) {
            return std::nullopt;
        }
        T minX = vertices_[0].X();
        T maxX = minX;
        T minY = vertices_[0].Y();
        T maxY = minY;
        for (const auto& v : vertices_) {
            minX = std::min(minX, v.X());
            maxX = std::max(maxX, v.X());
            minY = std::min(minY, v.Y());
            maxY = std::max(maxY, v.Y());
        }
        return RectangleType::FromCorners(minX, minY, maxX, maxY);
    }

    /// All non-zero turn cross products share one sign; < 3 vertices counts as convex
    bool IsConvex() const {
        size_t n = vertices_.size();
        if (n < 4) {
            return true;
        }
        bool positive = false;
        bool first = true;
        for (size_t i = 0; i < n; ++i) {
            T cross = TurnCross(vertices_[i], vertices_[(i + 1) % n], vertices_[(i + 2) % n]);
            if (std::abs(cross) <= static_cast<T>(EPSILON)) {
                continue;
            }
            if (first) {
                positive = cross > T(0);
                first = false;
            } else if ((cross > T(0)) != positive) {
                return false;
            }
        }
        return true;
    }

    // =========================================================================
    // Containment
    // =========================================================================

    /// Point within EPSILON of some edge
    bool IsOnBoundary(const PointType& p) const {
        size_t n = vertices_.size();
        if (n == 0) {
            return false;
        }
        if (n == 1) {
            return p.DistanceTo(vertices_[0]) <= static_cast<T>(EPSILON);
        }
        for (size_t i = 0; i < n; ++i) {
            if (SegmentType(vertices_[i], vertices_[(i + 1) % n]).Contains(p)) {
                return true;
            }
        }
        return false;
    }

    /// Boundary inclusive; boundary test first, then ray-casting parity
    bool Contains(const PointType& p) const {
        size_t n = vertices_.size();
        if (n < 3) {
            return false;
        }
        if (IsOnBoundary(p)) {
            return true;
        }

        // Horizontal ray towards +x; count edge crossings
        bool inside = false;
        for (size_t i = 0; i < n; ++i) {
            const PointType& p1 = vertices_[i];
            const PointType& p2 = vertices_[(i + 1) % n];
            if ((p1.Y() <= p.Y() && p2.Y() > p.Y()) || (p2.Y() <= p.Y() && p1.Y() > p.Y())) {
                T t = (p.Y() - p1.Y()) / (p2.Y() - p1.Y());
                T xIntersect = p1.X() + t * (p2.X() - p1.X());
                if (p.X() < xIntersect) {
                    inside = !inside;
                }
            }
        }
        return inside;
    }

    // =========================================================================
    // Triangulation
    // =========================================================================

    /**
     * @brief Split into triangles covering the polygon
     *
     * Triangle areas sum to Area() within tolerance. Each triangle keeps the
     * polygon's orientation.
     *
     * @return Empty for fewer than 3 vertices
     */
    std::vector<TriangleType> Triangulate() const {
        std::vector<TriangleType> triangles;
        size_t n = vertices_.size();
        if (n < 3) {
            return triangles;
        }
        if (IsConvex()) {
            triangles.reserve(n - 2);
            for (size_t i = 1; i + 1 < n; ++i) {
                triangles.emplace_back(vertices_[0], vertices_[i], vertices_[i + 1]);
            }
            return triangles;
        }
        return EarClip();
    }

    // =========================================================================
    // Transformations
    // =========================================================================

    Polygon Translated(const VectorType& offset) const {
        return Apply([&](const PointType& v) { return v + offset; });
    }

    /// v' = about + k * (v - about)
    Polygon Scaled(T k, const PointType& about) const {
        return Apply([&](const PointType& v) { return v.Scaled(k, about); });
    }

    /// Scale about the centroid; nullopt when the centroid is undefined
    std::optional<Polygon> Scaled(T k) const {
        auto center = Centroid();
        if (!center) {
            return std::nullopt;
        }
        return Scaled(k, *center);
    }

    Polygon Rotated(Radian angle, const PointType& about = PointType::Zero()) const {
        return Apply([&](const PointType& v) { return v.Rotated(angle, about); });
    }

    Polygon Transformed(const QMatrix& m) const {
        return Apply([&](const PointType& v) { return v.Transformed(m); });
    }

    /// Same vertices in reverse order (orientation flips)
    Polygon Reversed() const {
        return Polygon(std::vector<PointType>(vertices_.rbegin(), vertices_.rend()));
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Polygon<MappedScalar<F, T>, DstSpace> {
        using DstPoint = ::Qi::Geom::Point<MappedScalar<F, T>, DstSpace>;
        std::vector<DstPoint> mapped;
        mapped.reserve(vertices_.size());
        for (const auto& v : vertices_) {
            mapped.push_back(v.template Map<DstSpace>(transform));
        }
        return Polygon<MappedScalar<F, T>, DstSpace>(std::move(mapped));
    }

    bool operator==(const Polygon& other) const { return vertices_ == other.vertices_; }
    bool operator!=(const Polygon& other) const { return !(*this == other); }

private:
    template<typename Fn>
    Polygon Apply(Fn&& fn) const {
        std::vector<PointType> out;
        out.reserve(vertices_.size());
        for (const auto& v : vertices_) {
            out.push_back(fn(v));
        }
        return Polygon(std::move(out));
    }

    // cross(b - a, c - b): positive for a left turn at b
    static T TurnCross(const PointType& a, const PointType& b, const PointType& c) {
        return (b.X() - a.X()) * (c.Y() - b.Y()) - (b.Y() - a.Y()) * (c.X() - b.X());
    }

    // Closed point-in-triangle test by edge signs (orientation independent)
    static bool InTriangle(const PointType& p, const PointType& a, const PointType& b,
                           const PointType& c) {
        T d1 = TurnCross(a, b, p);
        T d2 = TurnCross(b, c, p);
        T d3 = TurnCross(c, a, p);
        T eps = static_cast<T>(EPSILON);
        bool hasNeg = d1 < -eps || d2 < -eps || d3 < -eps;
        bool hasPos = d1 > eps || d2 > eps || d3 > eps;
        return !(hasNeg && hasPos);
    }

    std::vector<TriangleType> EarClip() const {
        std::vector<TriangleType> triangles;
        std::vector<size_t> remaining(vertices_.size());
        for (size_t i = 0; i < remaining.size(); ++i) {
            remaining[i] = i;
        }
        triangles.reserve(remaining.size() - 2);

        // Convex corners turn the same way as the polygon
        T orientation = SignedDoubleArea() >= T(0) ? T(1) : T(-1);
        T eps = static_cast<T>(EPSILON);

        while (remaining.size() > 3) {
            size_t m = remaining.size();
            bool clipped = false;
            for (size_t i = 0; i < m; ++i) {
                const PointType& prev = vertices_[remaining[(i + m - 1) % m]];
                const PointType& curr = vertices_[remaining[i]];
                const PointType& next = vertices_[remaining[(i + 1) % m]];

                if (orientation * TurnCross(prev, curr, next) <= eps) {
                    continue;
                }

                bool isEar = true;
                for (size_t j = 0; j < m; ++j) {
                    if (j == i || j == (i + m - 1) % m || j == (i + 1) % m) {
                        continue;
                    }
                    const PointType& q = vertices_[remaining[j]];
                    if (q == prev || q == curr || q == next) {
                        continue;
                    }
                    if (InTriangle(q, prev, curr, next)) {
                        isEar = false;
                        break;
                    }
                }
                if (!isEar) {
                    continue;
                }

                triangles.emplace_back(prev, curr, next);
                remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
                clipped = true;
                break;
            }

            if (!clipped) {
                // Not simple (or numerically collinear): fan the rest
                for (size_t i = 1; i + 1 < remaining.size(); ++i) {
                    triangles.emplace_back(vertices_[remaining[0]], vertices_[remaining[i]],
                                           vertices_[remaining[i + 1]]);
                }
                return triangles;
            }
        }

        triangles.emplace_back(vertices_[remaining[0]], vertices_[remaining[1]],
                               vertices_[remaining[2]]);
        return triangles;
    }

    std::vector<PointType> vertices_;
};

using Polygon2d = Polygon<double>;

} // namespace Qi::Geom
