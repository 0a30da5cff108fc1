/**
 * @file test_ellipse.cpp
 * @brief Unit tests for Shape/Ellipse
 */

#include <QiGeom/Shape/Ellipse.h>
#include <QiGeom/Core/Constants.h>
#include <gtest/gtest.h>

#include <cmath>

namespace Qi::Geom {
namespace {

bool NearEqual(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) < tol;
}

bool PointNearEqual(const Point2d& a, const Point2d& b, double tol = 1e-9) {
    return NearEqual(a.X(), b.X(), tol) && NearEqual(a.Y(), b.Y(), tol);
}

class EllipseTest : public ::testing::Test {};

// =============================================================================
// Circle Duality
// =============================================================================

TEST_F(EllipseTest, FromCircle) {
    Ellipse2d e = Ellipse2d::FromCircle(Point2d(1.0, 1.0), 2.0);
    EXPECT_EQ(e.SemiMajor(), 2.0);
    EXPECT_EQ(e.SemiMinor(), 2.0);
    EXPECT_EQ(e.Rotation(), Radian::Zero());
    EXPECT_TRUE(e.IsCircle());

    Ellipse2d fromShape(Circle2d(Point2d(1.0, 1.0), 2.0));
    EXPECT_EQ(fromShape, e);
}

TEST_F(EllipseTest, ToCircle) {
    Circle2d c(Point2d(3.0, -1.0), 4.0);
    auto back = Ellipse2d(c).ToCircle();
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, c);

    EXPECT_FALSE(Ellipse2d(Point2d(0.0, 0.0), 3.0, 2.0).ToCircle().has_value());
}

TEST_F(EllipseTest, CircleMetricsAgree) {
    Circle2d c(Point2d(0.0, 0.0), 5.0);
    Ellipse2d e(c);
    EXPECT_NEAR(e.Perimeter(), c.Circumference(), 1e-12);
    EXPECT_NEAR(e.Area(), c.Area(), 1e-12);
    EXPECT_EQ(e.Eccentricity(), 0.0);
    auto foci = e.Foci();
    EXPECT_EQ(foci.first, c.Center());
    EXPECT_EQ(foci.second, c.Center());
}

// =============================================================================
// Metrics
// =============================================================================

TEST_F(EllipseTest, Axes) {
    Ellipse2d e(Point2d(0.0, 0.0), 5.0, 3.0);
    EXPECT_DOUBLE_EQ(e.MajorAxis(), 10.0);
    EXPECT_DOUBLE_EQ(e.MinorAxis(), 6.0);
    EXPECT_TRUE(e.IsValid());
    EXPECT_FALSE(e.IsCircle());
}

TEST_F(EllipseTest, EccentricityAndFoci) {
    Ellipse2d e(Point2d(1.0, 2.0), 5.0, 3.0);
    EXPECT_DOUBLE_EQ(e.Eccentricity(), 0.8);
    EXPECT_DOUBLE_EQ(e.FocalDistance(), 4.0);

    auto foci = e.Foci();
    EXPECT_TRUE(PointNearEqual(foci.first, Point2d(-3.0, 2.0)));
    EXPECT_TRUE(PointNearEqual(foci.second, Point2d(5.0, 2.0)));
}

TEST_F(EllipseTest, FociFollowRotation) {
    Ellipse2d e(Point2d(0.0, 0.0), 5.0, 3.0, Radian::HalfPi());
    auto foci = e.Foci();
    EXPECT_TRUE(PointNearEqual(foci.first, Point2d(0.0, -4.0)));
    EXPECT_TRUE(PointNearEqual(foci.second, Point2d(0.0, 4.0)));
}

TEST_F(EllipseTest, Area) {
    EXPECT_DOUBLE_EQ(Ellipse2d(Point2d(0.0, 0.0), 4.0, 2.0).Area(), 8.0 * PI);
}

TEST_F(EllipseTest, Perimeter) {
    // Reference value for a = 5, b = 3: 25.52699886...
    Ellipse2d e(Point2d(0.0, 0.0), 5.0, 3.0);
    EXPECT_NEAR(e.Perimeter(), 25.526998863, 1e-6);

    // Flat ellipse approaches a doubled segment (4a)
    Ellipse2d flat(Point2d(0.0, 0.0), 1.0, 0.0);
    EXPECT_NEAR(flat.Perimeter(), 4.0, 1e-2);

    EXPECT_EQ(Ellipse2d(Point2d(0.0, 0.0), 0.0, 0.0).Perimeter(), 0.0);
}

// =============================================================================
// Parametric Form / Containment
// =============================================================================

TEST_F(EllipseTest, PointAt) {
    Ellipse2d e(Point2d(1.0, 1.0), 4.0, 2.0);
    EXPECT_TRUE(PointNearEqual(e.PointAt(Radian::Zero()), Point2d(5.0, 1.0)));
    EXPECT_TRUE(PointNearEqual(e.PointAt(Radian::HalfPi()), Point2d(1.0, 3.0)));

    Ellipse2d rotated(Point2d(0.0, 0.0), 4.0, 2.0, Radian::HalfPi());
    EXPECT_TRUE(PointNearEqual(rotated.PointAt(Radian::Zero()), Point2d(0.0, 4.0)));
}

TEST_F(EllipseTest, PointsOnBoundaryAreContained) {
    Ellipse2d e(Point2d(2.0, -1.0), 4.0, 2.0, Radian::FromDegrees(30.0));
    for (int i = 0; i < 12; ++i) {
        Point2d p = e.PointAt(Radian::FromDegrees(30.0 * i));
        EXPECT_TRUE(e.Contains(p)) << "theta index " << i;
    }
}

TEST_F(EllipseTest, Contains) {
    Ellipse2d e(Point2d(0.0, 0.0), 4.0, 2.0);
    EXPECT_TRUE(e.Contains(Point2d(0.0, 0.0)));
    EXPECT_TRUE(e.Contains(Point2d(3.9, 0.0)));
    EXPECT_FALSE(e.Contains(Point2d(0.0, 2.1)));
    EXPECT_FALSE(e.Contains(Point2d(3.0, 1.5)));

    Ellipse2d rotated(Point2d(0.0, 0.0), 4.0, 2.0, Radian::HalfPi());
    EXPECT_TRUE(rotated.Contains(Point2d(0.0, 3.9)));
    EXPECT_FALSE(rotated.Contains(Point2d(3.9, 0.0)));
}

TEST_F(EllipseTest, DegenerateContainsSegment) {
    Ellipse2d flat(Point2d(0.0, 0.0), 2.0, 0.0);
    EXPECT_TRUE(flat.Contains(Point2d(1.5, 0.0)));
    EXPECT_FALSE(flat.Contains(Point2d(1.5, 0.1)));
    EXPECT_FALSE(flat.Contains(Point2d(2.5, 0.0)));
}

TEST_F(EllipseTest, BoundingBox) {
    Rect2d box = Ellipse2d(Point2d(1.0, 1.0), 4.0, 2.0).BoundingBox();
    EXPECT_EQ(box.Llx(), -3.0);
    EXPECT_EQ(box.Lly(), -1.0);
    EXPECT_EQ(box.Urx(), 5.0);
    EXPECT_EQ(box.Ury(), 3.0);

    Rect2d turned = Ellipse2d(Point2d(0.0, 0.0), 4.0, 2.0, Radian::HalfPi()).BoundingBox();
    EXPECT_NEAR(turned.Width(), 4.0, 1e-9);
    EXPECT_NEAR(turned.Height(), 8.0, 1e-9);
}

TEST_F(EllipseTest, Normalized) {
    Ellipse2d tall(Point2d(0.0, 0.0), 2.0, 4.0);
    EXPECT_FALSE(tall.IsValid());

    Ellipse2d n = tall.Normalized();
    EXPECT_TRUE(n.IsValid());
    EXPECT_EQ(n.SemiMajor(), 4.0);
    EXPECT_EQ(n.SemiMinor(), 2.0);
    EXPECT_NEAR(n.Rotation().Value(), HALF_PI, 1e-12);

    // Same point set
    EXPECT_TRUE(PointNearEqual(n.PointAt(Radian::Zero()), Point2d(0.0, 4.0)));
    EXPECT_TRUE(n.Contains(Point2d(0.0, 3.9)));
}

// =============================================================================
// Transformations
// =============================================================================

TEST_F(EllipseTest, Transformations) {
    Ellipse2d e(Point2d(1.0, 0.0), 4.0, 2.0);

    Ellipse2d moved = e.Translated(Vector2d(1.0, 2.0));
    EXPECT_EQ(moved.Center(), Point2d(2.0, 2.0));

    Ellipse2d scaled = e.Scaled(-0.5);
    EXPECT_EQ(scaled.SemiMajor(), 2.0);
    EXPECT_EQ(scaled.SemiMinor(), 1.0);
    EXPECT_EQ(scaled.Center(), e.Center());

    Ellipse2d spun = e.Rotated(Radian::HalfPi());
    EXPECT_EQ(spun.Center(), e.Center());
    EXPECT_NEAR(spun.Rotation().Value(), HALF_PI, 1e-12);

    Ellipse2d orbit = e.Rotated(Radian::HalfPi(), Point2d(0.0, 0.0));
    EXPECT_TRUE(PointNearEqual(orbit.Center(), Point2d(0.0, 1.0)));
    EXPECT_NEAR(orbit.Rotation().Value(), HALF_PI, 1e-12);
}

} // namespace
} // namespace Qi::Geom
