#include <QiGeom/Core/QMatrix.h>
#include <QiGeom/Core/Constants.h>

#include <cmath>

namespace Qi::Geom {

// =============================================================================
// Constructors
// =============================================================================

QMatrix::QMatrix() : m_{1.0, 0.0, 0.0, 0.0, 1.0, 0.0} {}

QMatrix::QMatrix(double m00, double m01, double m02,
                 double m10, double m11, double m12)
    : m_{m00, m01, m02, m10, m11, m12} {}

// =============================================================================
// Static Factory Methods
// =============================================================================

QMatrix QMatrix::Identity() {
    return QMatrix();
}

QMatrix QMatrix::Translation(double tx, double ty) {
    return QMatrix(1.0, 0.0, tx, 0.0, 1.0, ty);
}

QMatrix QMatrix::Rotation(Radian angle) {
    double c = angle.Cos();
    double s = angle.Sin();
    return QMatrix(c, -s, 0.0, s, c, 0.0);
}

QMatrix QMatrix::Rotation(Radian angle, double cx, double cy) {
    // T(c) * R * T(-c)
    double c = angle.Cos();
    double s = angle.Sin();
    double tx = cx - c * cx + s * cy;
    double ty = cy - s * cx - c * cy;
    return QMatrix(c, -s, tx, s, c, ty);
}

QMatrix QMatrix::Scaling(double scale) {
    return Scaling(scale, scale);
}

QMatrix QMatrix::Scaling(double sx, double sy) {
    return QMatrix(sx, 0.0, 0.0, 0.0, sy, 0.0);
}

QMatrix QMatrix::Scaling(double sx, double sy, double cx, double cy) {
    return QMatrix(sx, 0.0, cx * (1.0 - sx), 0.0, sy, cy * (1.0 - sy));
}

// =============================================================================
// Matrix Operations
// =============================================================================

QMatrix QMatrix::operator*(const QMatrix& other) const {
    return QMatrix(
        m_[0] * other.m_[0] + m_[1] * other.m_[3],           // m00
        m_[0] * other.m_[1] + m_[1] * other.m_[4],           // m01
        m_[0] * other.m_[2] + m_[1] * other.m_[5] + m_[2],   // m02
        m_[3] * other.m_[0] + m_[4] * other.m_[3],           // m10
        m_[3] * other.m_[1] + m_[4] * other.m_[4],           // m11
        m_[3] * other.m_[2] + m_[4] * other.m_[5] + m_[5]    // m12
    );
}

QMatrix& QMatrix::operator*=(const QMatrix& other) {
    *this = *this * other;
    return *this;
}

bool QMatrix::operator==(const QMatrix& other) const {
    for (size_t i = 0; i < m_.size(); ++i) {
        if (!ApproxEqual(m_[i], other.m_[i])) {
            return false;
        }
    }
    return true;
}

bool QMatrix::operator!=(const QMatrix& other) const {
    return !(*this == other);
}

std::optional<QMatrix> QMatrix::Inverse() const {
    double det = Determinant();
    if (std::abs(det) <= EPSILON) {
        return std::nullopt;
    }

    double invDet = 1.0 / det;

    // | m11/det  -m01/det  (m01*m12-m02*m11)/det |
    // | -m10/det  m00/det  (m02*m10-m00*m12)/det |
    return QMatrix(
        m_[4] * invDet,
        -m_[1] * invDet,
        (m_[1] * m_[5] - m_[2] * m_[4]) * invDet,
        -m_[3] * invDet,
        m_[0] * invDet,
        (m_[2] * m_[3] - m_[0] * m_[5]) * invDet);
}

bool QMatrix::IsInvertible() const {
    return std::abs(Determinant()) > EPSILON;
}

double QMatrix::Determinant() const {
    return m_[0] * m_[4] - m_[1] * m_[3];
}

bool QMatrix::IsIdentity() const {
    return *this == Identity();
}

// =============================================================================
// Application
// =============================================================================

void QMatrix::Apply(double x, double y, double& outX, double& outY) const {
    double nx = m_[0] * x + m_[1] * y + m_[2];
    double ny = m_[3] * x + m_[4] * y + m_[5];
    outX = nx;
    outY = ny;
}

void QMatrix::ApplyVector(double dx, double dy, double& outDx, double& outDy) const {
    double nx = m_[0] * dx + m_[1] * dy;
    double ny = m_[3] * dx + m_[4] * dy;
    outDx = nx;
    outDy = ny;
}

} // namespace Qi::Geom
