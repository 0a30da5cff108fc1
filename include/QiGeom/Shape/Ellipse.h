#pragma once

/**
 * @file Ellipse.h
 * @brief Rotated ellipse: center, semi-major a, semi-minor b, rotation
 *
 * Local frame: the major axis lies along the rotated x axis.
 *   P(theta) = center + R(rotation) * (a cos theta, b sin theta)
 *
 * A circle is an ellipse with a == b; FromCircle / ToCircle convert between
 * the two without loss.
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Constants.h>
#include <QiGeom/Core/Quantized.h>
#include <QiGeom/Shape/Circle.h>
#include <QiGeom/Shape/Point.h>
#include <QiGeom/Shape/Rectangle.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

namespace Qi::Geom {

template<typename T, typename Space = Unquantized>
class Ellipse {
public:
    using ValueType = T;
    using SpaceType = Space;
    using PointType = ::Qi::Geom::Point<T, Space>;
    using VectorType = ::Qi::Geom::Vector<T, Space>;
    using CircleType = ::Qi::Geom::Circle<T, Space>;
    using RectangleType = ::Qi::Geom::Rectangle<T, Space>;

    Ellipse() = default;

    Ellipse(const PointType& center, T semiMajor, T semiMinor, Radian rotation = Radian::Zero())
        : center_(center),
          semiMajor_(SpaceTraits<Space, T>::Quantize(semiMajor)),
          semiMinor_(SpaceTraits<Space, T>::Quantize(semiMinor)),
          rotation_(rotation) {}

    /// Circle as an ellipse with a == b and zero rotation
    explicit Ellipse(const CircleType& circle)
        : Ellipse(circle.Center(), circle.Radius(), circle.Radius()) {}

    static Ellipse FromCircle(const PointType& center, T radius) {
        return Ellipse(center, radius, radius);
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    const PointType& Center() const { return center_; }
    T SemiMajor() const { return semiMajor_; }
    T SemiMinor() const { return semiMinor_; }
    Radian Rotation() const { return rotation_; }

    /// Finite parameters with semiMajor >= semiMinor >= 0
    bool IsValid() const {
        return center_.IsValid() && std::isfinite(semiMajor_) && std::isfinite(semiMinor_) &&
               std::isfinite(rotation_.Value()) && semiMinor_ >= T(0) &&
               semiMajor_ >= semiMinor_;
    }

    T MajorAxis() const { return T(2) * semiMajor_; }
    T MinorAxis() const { return T(2) * semiMinor_; }

    /// |a - b| < EPSILON
    bool IsCircle() const {
        return std::abs(semiMajor_ - semiMinor_) < static_cast<T>(EPSILON);
    }

    std::optional<CircleType> ToCircle() const {
        if (!IsCircle()) {
            return std::nullopt;
        }
        return CircleType(center_, semiMajor_);
    }

    // =========================================================================
    // Metrics
    // =========================================================================

    /// sqrt(1 - (b/a)^2); 0 for a circle or a == 0
    T Eccentricity() const {
        if (!(semiMajor_ > T(0)) || !(semiMajor_ > semiMinor_)) {
            return T(0);
        }
        T ratio = semiMinor_ / semiMajor_;
        return std::sqrt(T(1) - ratio * ratio);
    }

    /// Center-to-focus distance sqrt(a^2 - b^2); 0 when a <= b
    T FocalDistance() const {
        if (!(semiMajor_ > semiMinor_)) {
            return T(0);
        }
        return std::sqrt(semiMajor_ * semiMajor_ - semiMinor_ * semiMinor_);
    }

    /// Both foci on the major axis (both at the center for a circle)
    std::pair<PointType, PointType> Foci() const {
        T c = FocalDistance();
        T ox = c * static_cast<T>(rotation_.Cos());
        T oy = c * static_cast<T>(rotation_.Sin());
        return {PointType(center_.X() - ox, center_.Y() - oy),
                PointType(center_.X() + ox, center_.Y() + oy)};
    }

    T Area() const { return static_cast<T>(PI) * semiMajor_ * semiMinor_; }

    /**
     * @brief Perimeter by Ramanujan's second approximation
     *
     * h = (a-b)^2 / (a+b)^2
     * P = pi (a+b) (1 + 3h / (10 + sqrt(4 - 3h)))
     *
     * Exact for circles (h = 0 gives 2 pi r).
     */
    T Perimeter() const {
        T sum = semiMajor_ + semiMinor_;
        if (!(sum > T(0))) {
            return T(0);
        }
        T diff = semiMajor_ - semiMinor_;
        T h = (diff * diff) / (sum * sum);
        return static_cast<T>(PI) * sum *
               (T(1) + T(3) * h / (T(10) + std::sqrt(T(4) - T(3) * h)));
    }

    // =========================================================================
    // Parametric Form
    // =========================================================================

    PointType PointAt(Radian theta) const {
        T lx = semiMajor_ * static_cast<T>(theta.Cos());
        T ly = semiMinor_ * static_cast<T>(theta.Sin());
        T c = static_cast<T>(rotation_.Cos());
        T s = static_cast<T>(rotation_.Sin());
        return PointType(center_.X() + c * lx - s * ly, center_.Y() + s * lx + c * ly);
    }

    /// dP/dtheta = R * (-a sin theta, b cos theta) (not normalized)
    VectorType TangentAt(Radian theta) const {
        T lx = -semiMajor_ * static_cast<T>(theta.Sin());
        T ly = semiMinor_ * static_cast<T>(theta.Cos());
        T c = static_cast<T>(rotation_.Cos());
        T s = static_cast<T>(rotation_.Sin());
        return VectorType(c * lx - s * ly, s * lx + c * ly);
    }

    /**
     * @brief Closed containment: (x/a)^2 + (y/b)^2 <= 1 in the local frame
     *
     * Degenerate ellipses (b == 0 or a == 0) contain their segment or center.
     */
    bool Contains(const PointType& p) const {
        T lx = 0;
        T ly = 0;
        ToLocal(p, lx, ly);
        T eps = static_cast<T>(EPSILON);
        if (!(semiMajor_ > T(0)) || !(semiMinor_ > T(0))) {
            T a = std::max(semiMajor_, semiMinor_);
            T b = std::min(semiMajor_, semiMinor_);
            bool alongMajor = semiMajor_ >= semiMinor_;
            T along = alongMajor ? lx : ly;
            T across = alongMajor ? ly : lx;
            return std::abs(across) <= b + eps && std::abs(along) <= a + eps;
        }
        T u = lx / semiMajor_;
        T v = ly / semiMinor_;
        return u * u + v * v <= T(1) + eps;
    }

    RectangleType BoundingBox() const {
        T c = static_cast<T>(rotation_.Cos());
        T s = static_cast<T>(rotation_.Sin());
        T aSq = semiMajor_ * semiMajor_;
        T bSq = semiMinor_ * semiMinor_;
        T halfWidth = std::sqrt(aSq * c * c + bSq * s * s);
        T halfHeight = std::sqrt(aSq * s * s + bSq * c * c);
        return RectangleType::FromCorners(center_.X() - halfWidth, center_.Y() - halfHeight,
                                          center_.X() + halfWidth, center_.Y() + halfHeight);
    }

    /// Swap axes (and turn by pi/2) when semiMinor > semiMajor
    Ellipse Normalized() const {
        if (semiMajor_ >= semiMinor_) {
            return *this;
        }
        return Ellipse(center_, semiMinor_, semiMajor_, rotation_ + Radian::HalfPi());
    }

    // =========================================================================
    // Transformations
    // =========================================================================

    Ellipse Translated(const VectorType& offset) const {
        return Ellipse(center_ + offset, semiMajor_, semiMinor_, rotation_);
    }

    /// Axes scaled by |k|, center fixed
    Ellipse Scaled(T k) const {
        return Ellipse(center_, std::abs(k) * semiMajor_, std::abs(k) * semiMinor_, rotation_);
    }

    Ellipse Scaled(T k, const PointType& about) const {
        return Ellipse(center_.Scaled(k, about), std::abs(k) * semiMajor_,
                       std::abs(k) * semiMinor_, rotation_);
    }

    /// Turn about the ellipse's own center
    Ellipse Rotated(Radian angle) const {
        return Ellipse(center_, semiMajor_, semiMinor_, rotation_ + angle);
    }

    Ellipse Rotated(Radian angle, const PointType& about) const {
        return Ellipse(center_.Rotated(angle, about), semiMajor_, semiMinor_, rotation_ + angle);
    }

    /// Scalars mapped; rotation carried over unchanged
    template<typename DstSpace = Space, typename F>
    auto Map(F&& transform) const -> Ellipse<MappedScalar<F, T>, DstSpace> {
        return Ellipse<MappedScalar<F, T>, DstSpace>(center_.template Map<DstSpace>(transform),
                                                     transform(semiMajor_),
                                                     transform(semiMinor_), rotation_);
    }

    bool operator==(const Ellipse& other) const {
        return center_ == other.center_ && semiMajor_ == other.semiMajor_ &&
               semiMinor_ == other.semiMinor_ && rotation_ == other.rotation_;
    }
    bool operator!=(const Ellipse& other) const { return !(*this == other); }

private:
    // Undo translation then rotation
    void ToLocal(const PointType& p, T& lx, T& ly) const {
        T dx = p.X() - center_.X();
        T dy = p.Y() - center_.Y();
        T c = static_cast<T>(rotation_.Cos());
        T s = static_cast<T>(rotation_.Sin());
        lx = dx * c + dy * s;
        ly = -dx * s + dy * c;
    }

    PointType center_;
    T semiMajor_ = T(0);
    T semiMinor_ = T(0);
    Radian rotation_;
};

using Ellipse2d = Ellipse<double>;

} // namespace Qi::Geom
