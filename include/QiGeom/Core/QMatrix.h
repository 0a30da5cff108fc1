#pragma once

/**
 * @file QMatrix.h
 * @brief 2D affine transformation matrix for QiGeom
 *
 * Represents a 2D affine transformation as a 3x3 matrix:
 * | m00  m01  m02 |   | a  b  tx |
 * | m10  m11  m12 | = | c  d  ty |
 * | 0    0    1   |   | 0  0  1  |
 *
 * Transforms point (x, y) to:
 *   x' = m00*x + m01*y + m02
 *   y' = m10*x + m11*y + m12
 *
 * The matrix works on raw doubles. Shapes apply it through their
 * Transformed() members, which re-quantize the result in their own space.
 */

#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Export.h>

#include <array>
#include <optional>

namespace Qi::Geom {

/**
 * @brief 2D affine transformation matrix (3x3, homogeneous)
 */
class QIGEOM_API QMatrix {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (identity matrix)
    QMatrix();

    /// Construct from 6 elements (row-major: m00, m01, m02, m10, m11, m12)
    QMatrix(double m00, double m01, double m02,
            double m10, double m11, double m12);

    // =========================================================================
    // Static Factory Methods
    // =========================================================================

    static QMatrix Identity();

    static QMatrix Translation(double tx, double ty);

    /// Counter-clockwise rotation around the origin
    static QMatrix Rotation(Radian angle);

    /// Counter-clockwise rotation around (cx, cy)
    static QMatrix Rotation(Radian angle, double cx, double cy);

    /// Uniform scaling around the origin
    static QMatrix Scaling(double scale);

    /// Non-uniform scaling around the origin
    static QMatrix Scaling(double sx, double sy);

    /// Scaling around (cx, cy)
    static QMatrix Scaling(double sx, double sy, double cx, double cy);

    // =========================================================================
    // Matrix Operations
    // =========================================================================

    /// Composition: (this * other) applies other first
    QMatrix operator*(const QMatrix& other) const;
    QMatrix& operator*=(const QMatrix& other);

    /// Element-wise comparison within EPSILON
    bool operator==(const QMatrix& other) const;
    bool operator!=(const QMatrix& other) const;

    /// Inverse transform (nullopt when |det| <= EPSILON)
    std::optional<QMatrix> Inverse() const;

    bool IsInvertible() const;

    /// Determinant of the linear part (m00*m11 - m01*m10)
    double Determinant() const;

    bool IsIdentity() const;

    // =========================================================================
    // Element Access
    // =========================================================================

    double M00() const { return m_[0]; }
    double M01() const { return m_[1]; }
    double M02() const { return m_[2]; }
    double M10() const { return m_[3]; }
    double M11() const { return m_[4]; }
    double M12() const { return m_[5]; }

    // =========================================================================
    // Application
    // =========================================================================

    /// Transform the point (x, y)
    void Apply(double x, double y, double& outX, double& outY) const;

    /// Transform the vector (dx, dy) (ignores translation)
    void ApplyVector(double dx, double dy, double& outDx, double& outDy) const;

private:
    // Storage: [m00, m01, m02, m10, m11, m12]
    // The third row is always [0, 0, 1]
    std::array<double, 6> m_;
};

} // namespace Qi::Geom
