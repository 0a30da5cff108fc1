#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/Constants.h>

#include <cmath>

namespace Qi::Geom {

Radian Radian::HalfPi() {
    return Radian(HALF_PI);
}

Radian Radian::Pi() {
    return Radian(PI);
}

Radian Radian::TwoPi() {
    return Radian(TWO_PI);
}

Radian Radian::FromDegrees(double degrees) {
    return Radian(degrees * DEG_TO_RAD);
}

double Radian::Degrees() const {
    return value_ * RAD_TO_DEG;
}

double Radian::Cos() const {
    return std::cos(value_);
}

double Radian::Sin() const {
    return std::sin(value_);
}

double Radian::Tan() const {
    return std::tan(value_);
}

Radian Radian::Normalized() const {
    if (!std::isfinite(value_)) {
        return *this;
    }
    double a = std::fmod(value_ + PI, TWO_PI);
    if (a < 0.0) {
        a += TWO_PI;
    }
    // fmod can land exactly on TWO_PI after the correction above
    if (a >= TWO_PI) {
        a -= TWO_PI;
    }
    return Radian(a - PI);
}

} // namespace Qi::Geom
