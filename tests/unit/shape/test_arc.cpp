/**
 * @file test_arc.cpp
 * @brief Unit tests for Shape/Arc
 */

#include <QiGeom/Shape/Arc.h>
#include <QiGeom/Core/Constants.h>
#include <gtest/gtest.h>

#include <cmath>

namespace Qi::Geom {
namespace {

struct PdfSpace {
    static constexpr double quantum = 0.01;
};

const double kHalfSqrt2 = std::sqrt(2.0) / 2.0;

bool NearEqual(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) < tol;
}

bool PointNearEqual(const Point2d& a, const Point2d& b, double tol = 1e-9) {
    return NearEqual(a.X(), b.X(), tol) && NearEqual(a.Y(), b.Y(), tol);
}

bool RectNearEqual(const Rect2d& r, double llx, double lly, double urx, double ury,
                   double tol = 1e-9) {
    return NearEqual(r.Llx(), llx, tol) && NearEqual(r.Lly(), lly, tol) &&
           NearEqual(r.Urx(), urx, tol) && NearEqual(r.Ury(), ury, tol);
}

class ArcTest : public ::testing::Test {
protected:
    // Unit quarter arc, counter-clockwise from +x to +y
    Arc2d quarter_ = Arc2d::QuarterCircle(Point2d(0.0, 0.0), 1.0);
};

// =============================================================================
// Construction / Angles
// =============================================================================

TEST_F(ArcTest, Factories) {
    Arc2d semi = Arc2d::Semicircle(Point2d(1.0, 1.0), 2.0);
    EXPECT_NEAR(semi.Sweep().Value(), PI, 1e-15);
    EXPECT_NEAR(semi.Length(), 2.0 * PI, 1e-12);
    EXPECT_FALSE(semi.IsFullCircle());

    Arc2d full = Arc2d::FullCircle(Point2d(0.0, 0.0), 3.0);
    EXPECT_TRUE(full.IsFullCircle());
    EXPECT_NEAR(full.Length(), full.SupportingCircle().Circumference(), 1e-12);

    EXPECT_NEAR(quarter_.Sweep().Value(), HALF_PI, 1e-15);
    EXPECT_TRUE(quarter_.IsCounterClockwise());
    EXPECT_TRUE(quarter_.IsValid());
}

TEST_F(ArcTest, QuantizedRadiusSnaps) {
    Arc<double, PdfSpace> arc(Point<double, PdfSpace>(0.0, 0.0), 1.2345, Radian::Zero(),
                              Radian::FromDegrees(45.0));
    EXPECT_DOUBLE_EQ(arc.Radius(), 1.23);

    Arc<double, PdfSpace> unit(Point<double, PdfSpace>(0.0, 0.0), 1.0, Radian::Zero(),
                               Radian::FromDegrees(45.0));
    EXPECT_DOUBLE_EQ(unit.EndPoint().X(), 0.71);
    EXPECT_DOUBLE_EQ(unit.EndPoint().Y(), 0.71);
}

TEST_F(ArcTest, ClockwiseSweep) {
    Arc2d cw(Point2d(0.0, 0.0), 1.0, Radian::HalfPi(), Radian::Zero());
    EXPECT_FALSE(cw.IsCounterClockwise());
    EXPECT_NEAR(cw.Sweep().Value(), -HALF_PI, 1e-15);
    EXPECT_NEAR(cw.Length(), HALF_PI, 1e-12);
}

// =============================================================================
// Points and Tangents
// =============================================================================

TEST_F(ArcTest, EndpointsAndMidpoint) {
    EXPECT_TRUE(PointNearEqual(quarter_.StartPoint(), Point2d(1.0, 0.0)));
    EXPECT_TRUE(PointNearEqual(quarter_.EndPoint(), Point2d(0.0, 1.0)));
    EXPECT_TRUE(PointNearEqual(quarter_.MidPoint(), Point2d(kHalfSqrt2, kHalfSqrt2)));
    EXPECT_TRUE(PointNearEqual(quarter_.PointAt(0.5), quarter_.MidPoint()));
}

TEST_F(ArcTest, TangentFollowsDirectionOfTravel) {
    Vector2d ccw = quarter_.TangentAt(0.0);
    EXPECT_NEAR(ccw.DX(), 0.0, 1e-12);
    EXPECT_NEAR(ccw.DY(), 1.0, 1e-12);

    // Reversed arc arrives at angle 0 moving downwards
    Vector2d cw = quarter_.Reversed().TangentAt(1.0);
    EXPECT_NEAR(cw.DX(), 0.0, 1e-12);
    EXPECT_NEAR(cw.DY(), -1.0, 1e-12);
}

TEST_F(ArcTest, Reversed) {
    Arc2d r = quarter_.Reversed();
    EXPECT_EQ(r.StartAngle(), quarter_.EndAngle());
    EXPECT_EQ(r.EndAngle(), quarter_.StartAngle());
    EXPECT_NEAR(r.Sweep().Value(), -HALF_PI, 1e-15);
    EXPECT_DOUBLE_EQ(r.Length(), quarter_.Length());
}

// =============================================================================
// Bounding Box
// =============================================================================

TEST_F(ArcTest, BoundingBox_NoAxisExtreme) {
    Arc2d arc(Point2d(0.0, 0.0), 2.0, Radian::FromDegrees(10.0), Radian::FromDegrees(80.0));
    Rect2d box = arc.BoundingBox();
    EXPECT_TRUE(RectNearEqual(box, 2.0 * std::cos(80.0 * DEG_TO_RAD),
                              2.0 * std::sin(10.0 * DEG_TO_RAD),
                              2.0 * std::cos(10.0 * DEG_TO_RAD),
                              2.0 * std::sin(80.0 * DEG_TO_RAD)));
}

TEST_F(ArcTest, BoundingBox_CrossesTop) {
    Arc2d arc(Point2d(0.0, 0.0), 2.0, Radian::FromDegrees(45.0), Radian::FromDegrees(135.0));
    double s = 2.0 * kHalfSqrt2;
    EXPECT_TRUE(RectNearEqual(arc.BoundingBox(), -s, s, s, 2.0));
}

TEST_F(ArcTest, BoundingBox_CrossesRightThroughZero) {
    Arc2d arc(Point2d(1.0, 1.0), 1.0, Radian::FromDegrees(-45.0), Radian::FromDegrees(45.0));
    EXPECT_TRUE(RectNearEqual(arc.BoundingBox(), 1.0 + kHalfSqrt2, 1.0 - kHalfSqrt2, 2.0,
                              1.0 + kHalfSqrt2));
}

TEST_F(ArcTest, BoundingBox_CrossesLeft) {
    Arc2d arc(Point2d(0.0, 0.0), 1.0, Radian::FromDegrees(135.0), Radian::FromDegrees(225.0));
    EXPECT_TRUE(RectNearEqual(arc.BoundingBox(), -1.0, -kHalfSqrt2, -kHalfSqrt2, kHalfSqrt2));
}

TEST_F(ArcTest, BoundingBox_ClockwiseHalf) {
    // Top, through the right, to the bottom
    Arc2d arc(Point2d(0.0, 0.0), 1.0, Radian::HalfPi(), -Radian::HalfPi());
    EXPECT_TRUE(RectNearEqual(arc.BoundingBox(), 0.0, -1.0, 1.0, 1.0));
}

TEST_F(ArcTest, BoundingBox_FullCircle) {
    Arc2d full = Arc2d::FullCircle(Point2d(1.0, -1.0), 2.0);
    EXPECT_EQ(full.BoundingBox(), full.SupportingCircle().BoundingBox());
}

// =============================================================================
// Containment
// =============================================================================

TEST_F(ArcTest, Contains_InsideSweep) {
    EXPECT_TRUE(quarter_.Contains(quarter_.PointAt(0.25)));
    EXPECT_TRUE(quarter_.Contains(Point2d(kHalfSqrt2, kHalfSqrt2)));
    EXPECT_TRUE(quarter_.Contains(quarter_.StartPoint()));
    EXPECT_TRUE(quarter_.Contains(quarter_.EndPoint()));
}

TEST_F(ArcTest, Contains_OutsideSweep) {
    // On the circle, wrong side of the sweep
    EXPECT_FALSE(quarter_.Contains(Point2d(0.0, -1.0)));
    EXPECT_FALSE(quarter_.Contains(Point2d(-1.0, 0.0)));
    // Inside the sweep, off the circle
    EXPECT_FALSE(quarter_.Contains(Point2d(0.5, 0.5)));
}

TEST_F(ArcTest, Contains_ClockwiseComplement) {
    // Clockwise from +x round to +y covers the three other quadrants
    Arc2d cw(Point2d(0.0, 0.0), 1.0, Radian::Zero(), Radian::FromDegrees(-270.0));
    EXPECT_TRUE(cw.Contains(Point2d(0.0, -1.0)));
    EXPECT_TRUE(cw.Contains(Point2d(-1.0, 0.0)));
    EXPECT_TRUE(cw.Contains(Point2d(0.0, 1.0)));
    EXPECT_FALSE(cw.Contains(Point2d(kHalfSqrt2, kHalfSqrt2)));
}

TEST_F(ArcTest, SweepsThroughAnyWinding) {
    EXPECT_TRUE(quarter_.SweepsThrough(Radian::FromDegrees(45.0 + 360.0)));
    EXPECT_TRUE(quarter_.SweepsThrough(Radian::FromDegrees(-315.0)));
    EXPECT_FALSE(quarter_.SweepsThrough(Radian::FromDegrees(-45.0)));
}

// =============================================================================
// Transformations
// =============================================================================

TEST_F(ArcTest, Transformations) {
    Arc2d moved = quarter_.Translated(Vector2d(2.0, 3.0));
    EXPECT_EQ(moved.Center(), Point2d(2.0, 3.0));
    EXPECT_EQ(moved.Sweep(), quarter_.Sweep());

    Arc2d big = quarter_.Scaled(3.0);
    EXPECT_EQ(big.Center(), quarter_.Center());
    EXPECT_DOUBLE_EQ(big.Radius(), 3.0);

    Arc2d turned = Arc2d(Point2d(1.0, 0.0), 1.0, Radian::Zero(), Radian::HalfPi())
                       .Rotated(Radian::HalfPi());
    EXPECT_TRUE(PointNearEqual(turned.Center(), Point2d(0.0, 1.0)));
    EXPECT_TRUE(PointNearEqual(turned.StartPoint(), Point2d(0.0, 2.0)));
}

TEST_F(ArcTest, ScaledByNegativeFactorMirrorsThroughCenter) {
    Arc2d arc(Point2d(1.0, 0.0), 1.0, Radian::Zero(), Radian::HalfPi());
    Arc2d flipped = arc.Scaled(-1.0, Point2d(0.0, 0.0));
    EXPECT_EQ(flipped.Center(), Point2d(-1.0, 0.0));
    EXPECT_DOUBLE_EQ(flipped.Radius(), 1.0);
    EXPECT_TRUE(PointNearEqual(flipped.StartPoint(), Point2d(-2.0, 0.0)));
    EXPECT_TRUE(PointNearEqual(flipped.EndPoint(), Point2d(-1.0, -1.0)));
}

// =============================================================================
// Map
// =============================================================================

TEST_F(ArcTest, MapKeepsAngles) {
    Arc2d arc(Point2d(1.0, -1.0), 1.5, Radian::FromDegrees(30.0), Radian::FromDegrees(200.0));
    Arc2d mapped = arc.Map([](double v) { return v * 2.0; });
    EXPECT_EQ(mapped.Center(), Point2d(2.0, -2.0));
    EXPECT_DOUBLE_EQ(mapped.Radius(), 3.0);
    EXPECT_EQ(mapped.StartAngle(), arc.StartAngle());
    EXPECT_EQ(mapped.EndAngle(), arc.EndAngle());
}

TEST_F(ArcTest, MapIntoQuantizedSpace) {
    Arc2d arc(Point2d(0.123, 0.456), 1.2345, Radian::Zero(), Radian::Pi());
    auto q = arc.Map<PdfSpace>([](double v) { return v; });
    EXPECT_DOUBLE_EQ(q.Center().X(), 0.12);
    EXPECT_DOUBLE_EQ(q.Center().Y(), 0.46);
    EXPECT_DOUBLE_EQ(q.Radius(), 1.23);
    EXPECT_EQ(q.Sweep(), arc.Sweep());
}

} // namespace
} // namespace Qi::Geom
