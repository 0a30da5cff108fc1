#pragma once

/**
 * @file Rectangle.h
 * @brief Axis-aligned rectangle stored by its corners
 *
 * Storage is (llx, lly) lower-left and (urx, ury) upper-right, y axis up.
 * The (x, y, width, height) constructor computes the far corner with
 * quantized addition, so two rectangles built from the same grid values
 * share edges bit for bit:
 *
 * @code
 * struct Pdf { static constexpr double quantum = 0.01; };
 * Rectangle<double, Pdf> a(0.0, 84.0, 100.0, 21.8 * 3);
 * Rectangle<double, Pdf> b = a.StackedAbove(10.0);
 * // b.Lly() == a.Ury() exactly
 * @endcode
 *
 * Negative extents are stored as given: IsValid() is false, Area() is 0 and
 * Normalized() yields the equivalent rectangle with ordered corners. Point
 * and rectangle queries (Contains, Intersects, Union, Intersection) work on
 * the ordered bounds MinX/MaxX/MinY/MaxY.
 *
 * There is no Rotated: rotate Polygon::FromRectangle(rect) instead.
 */

#include <QiGeom/Core/Quantized.h>
#include <QiGeom/Core/Space.h>
#include <QiGeom/Shape/Point.h>

#include <algorithm>
#include <cmath>
#include <optional>

namespace Qi::Geom {

/**
 * @brief Rectangle corner selector
 */
enum class RectCorner {
    BottomLeft,
    BottomRight,
    TopRight,
    TopLeft
};

template<typename T, typename Space = Unquantized>
class Rectangle {
public:
    using ValueType = T;
    using SpaceType = Space;
    using Scalar = Quantized<T, Space>;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;

    Rectangle() = default;

    /// urx = Q(x) + Q(width), ury = Q(y) + Q(height)
    Rectangle(T x, T y, T width, T height)
        : llx_(Scalar(x).Value()), lly_(Scalar(y).Value()),
          urx_((Scalar(x) + Scalar(width)).Value()),
          ury_((Scalar(y) + Scalar(height)).Value()) {}

    static Rectangle FromCorners(T llx, T lly, T urx, T ury) {
        Rectangle r;
        r.llx_ = Scalar(llx).Value();
        r.lly_ = Scalar(lly).Value();
        r.urx_ = Scalar(urx).Value();
        r.ury_ = Scalar(ury).Value();
        return r;
    }

    static Rectangle FromCorners(const PointType& lowerLeft, const PointType& upperRight) {
        return FromCorners(lowerLeft.X(), lowerLeft.Y(), upperRight.X(), upperRight.Y());
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    T Llx() const { return llx_; }
    T Lly() const { return lly_; }
    T Urx() const { return urx_; }
    T Ury() const { return ury_; }

    /// urx - llx (quantized difference; negative when corners are swapped)
    T Width() const { return (Scalar(urx_) - Scalar(llx_)).Value(); }
    T Height() const { return (Scalar(ury_) - Scalar(lly_)).Value(); }

    PointType Origin() const { return PointType(llx_, lly_); }

    PointType Corner(RectCorner corner) const {
        switch (corner) {
            case RectCorner::BottomLeft:  return PointType(llx_, lly_);
            case RectCorner::BottomRight: return PointType(urx_, lly_);
            case RectCorner::TopRight:    return PointType(urx_, ury_);
            case RectCorner::TopLeft:     return PointType(llx_, ury_);
        }
        return PointType(llx_, lly_);
    }

    PointType Center() const {
        return PointType((llx_ + urx_) / T(2), (lly_ + ury_) / T(2));
    }

    T MinX() const { return std::min(llx_, urx_); }
    T MaxX() const { return std::max(llx_, urx_); }
    T MinY() const { return std::min(lly_, ury_); }
    T MaxY() const { return std::max(lly_, ury_); }

    /// Finite corners and non-negative width and height
    bool IsValid() const {
        return std::isfinite(llx_) && std::isfinite(lly_) && std::isfinite(urx_) &&
               std::isfinite(ury_) && urx_ >= llx_ && ury_ >= lly_;
    }

    /// width * height, 0 for invalid rectangles
    T Area() const { return IsValid() ? Width() * Height() : T(0); }

    /// Corners reordered so that width and height are non-negative
    Rectangle Normalized() const { return FromCorners(MinX(), MinY(), MaxX(), MaxY()); }

    // =========================================================================
    // Queries (closed bounds)
    // =========================================================================

    bool Contains(const PointType& p) const {
        return p.X() >= MinX() && p.X() <= MaxX() && p.Y() >= MinY() && p.Y() <= MaxY();
    }

    bool Contains(const Rectangle& other) const {
        return other.MinX() >= MinX() && other.MaxX() <= MaxX() &&
               other.MinY() >= MinY() && other.MaxY() <= MaxY();
    }

    /// Touching edges count as intersecting
    bool Intersects(const Rectangle& other) const {
        return MinX() <= other.MaxX() && MaxX() >= other.MinX() &&
               MinY() <= other.MaxY() && MaxY() >= other.MinY();
    }

    Rectangle Union(const Rectangle& other) const {
        return FromCorners(std::min(MinX(), other.MinX()), std::min(MinY(), other.MinY()),
                           std::max(MaxX(), other.MaxX()), std::max(MaxY(), other.MaxY()));
    }

    /// Overlap region (zero-area when only edges touch), nullopt when disjoint
    std::optional<Rectangle> Intersection(const Rectangle& other) const {
        if (!Intersects(other)) {
            return std::nullopt;
        }
        return FromCorners(std::max(MinX(), other.MinX()), std::max(MinY(), other.MinY()),
                           std::min(MaxX(), other.MaxX()), std::min(MaxY(), other.MaxY()));
    }

    // =========================================================================
    // Derived Rectangles
    // =========================================================================

    /// Move every edge inward by dx horizontally and dy vertically (negative grows)
    Rectangle Inset(T dx, T dy) const {
        Scalar qdx(dx);
        Scalar qdy(dy);
        return FromCorners((Scalar(llx_) + qdx).Value(), (Scalar(lly_) + qdy).Value(),
                           (Scalar(urx_) - qdx).Value(), (Scalar(ury_) - qdy).Value());
    }

    /// Same horizontal extent; bottom edge is exactly this rectangle's top edge
    Rectangle StackedAbove(T height) const {
        return FromCorners(llx_, ury_, urx_, (Scalar(ury_) + Scalar(height)).Value());
    }

    Rectangle Translated(const VectorType& offset) const {
        return FromCorners(llx_ + offset.DX(), lly_ + offset.DY(),
                           urx_ + offset.DX(), ury_ + offset.DY());
    }

    /// Corners scaled about `about`; a negative k swaps the stored corners
    Rectangle Scaled(T k, const PointType& about = PointType::Zero()) const {
        PointType ll = PointType(llx_, lly_).Scaled(k, about);
        PointType ur = PointType(urx_, ury_).Scaled(k, about);
        return FromCorners(ll, ur);
    }

    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Rectangle<MappedScalar<F, T>, DstSpace> {
        return Rectangle<MappedScalar<F, T>, DstSpace>::FromCorners(
            transform(llx_), transform(lly_), transform(urx_), transform(ury_));
    }

    bool operator==(const Rectangle& other) const {
        return llx_ == other.llx_ && lly_ == other.lly_ && urx_ == other.urx_ &&
               ury_ == other.ury_;
    }
    bool operator!=(const Rectangle& other) const { return !(*this == other); }

private:
    T llx_ = T(0);
    T lly_ = T(0);
    T urx_ = T(0);
    T ury_ = T(0);
};

using Rect2d = Rectangle<double>;

} // namespace Qi::Geom
