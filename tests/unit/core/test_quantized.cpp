/**
 * @file test_quantized.cpp
 * @brief Unit tests for Core/Space, Core/Quantized and Internal/Rounding
 */

#include <QiGeom/Core/Quantized.h>
#include <QiGeom/Core/Space.h>
#include <QiGeom/Internal/Rounding.h>
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace Qi::Geom {
namespace {

// =============================================================================
// Test Spaces
// =============================================================================

struct PdfSpace {
    static constexpr double quantum = 0.01;
};

struct QuarterSpace {
    static constexpr double quantum = 0.25;
};

struct ZeroQuantumSpace {
    static constexpr double quantum = 0.0;
};

struct PlainTagSpace {};

using PdfValue = Quantized<double, PdfSpace>;

// =============================================================================
// Space Traits
// =============================================================================

class SpaceTraitsTest : public ::testing::Test {};

TEST_F(SpaceTraitsTest, DetectsQuantum) {
    EXPECT_TRUE((HasQuantum<PdfSpace>::value));
    EXPECT_FALSE((HasQuantum<PlainTagSpace>::value));
    EXPECT_FALSE((HasQuantum<Unquantized>::value));
}

TEST_F(SpaceTraitsTest, QuantizedFlag) {
    EXPECT_TRUE((SpaceTraits<PdfSpace, double>::kQuantized));
    EXPECT_FALSE((SpaceTraits<ZeroQuantumSpace, double>::kQuantized));
    EXPECT_FALSE((SpaceTraits<PlainTagSpace, double>::kQuantized));
    EXPECT_FALSE((SpaceTraits<Unquantized, float>::kQuantized));
}

TEST_F(SpaceTraitsTest, QuantumValue) {
    EXPECT_DOUBLE_EQ((SpaceTraits<PdfSpace, double>::Quantum()), 0.01);
    EXPECT_FLOAT_EQ((SpaceTraits<PdfSpace, float>::Quantum()), 0.01f);
    EXPECT_EQ((SpaceTraits<Unquantized, double>::Quantum()), 0.0);
}

// =============================================================================
// Quantize
// =============================================================================

class QuantizeTest : public ::testing::Test {};

TEST_F(QuantizeTest, SnapsToNearestGridPoint) {
    EXPECT_DOUBLE_EQ(Quantize<PdfSpace>(1.234), 1.23);
    EXPECT_DOUBLE_EQ(Quantize<PdfSpace>(1.236), 1.24);
    EXPECT_DOUBLE_EQ(Quantize<PdfSpace>(-1.234), -1.23);
    EXPECT_EQ(Quantize<QuarterSpace>(0.3), 0.25);
    EXPECT_EQ(Quantize<QuarterSpace>(0.4), 0.5);
}

TEST_F(QuantizeTest, HalfwayRoundsAwayFromZero) {
    // 0.125 and -0.125 are exact halves of the 0.25 grid
    EXPECT_EQ(Quantize<QuarterSpace>(0.125), 0.25);
    EXPECT_EQ(Quantize<QuarterSpace>(-0.125), -0.25);
    EXPECT_EQ(Quantize<QuarterSpace>(0.375), 0.5);
    EXPECT_EQ(Quantize<QuarterSpace>(-0.375), -0.5);
}

TEST_F(QuantizeTest, Idempotent) {
    const double values[] = {1.234, -7.891, 84.0 + 21.8 * 3, 1e6 / 7.0, 0.005, -0.0049};
    for (double v : values) {
        double once = Quantize<PdfSpace>(v);
        EXPECT_EQ(Quantize<PdfSpace>(once), once) << "value " << v;
    }
}

TEST_F(QuantizeTest, PassThroughSpaces) {
    EXPECT_EQ(Quantize<Unquantized>(1.234), 1.234);
    EXPECT_EQ(Quantize<ZeroQuantumSpace>(1.234), 1.234);
    EXPECT_EQ(Quantize<PlainTagSpace>(-5.5555), -5.5555);
    EXPECT_EQ(Quantize<Unquantized>(0.1f), 0.1f);
}

TEST_F(QuantizeTest, NonFinitePassesThrough) {
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(Quantize<PdfSpace>(inf), inf);
    EXPECT_EQ(Quantize<PdfSpace>(-inf), -inf);
    EXPECT_TRUE(std::isnan(Quantize<PdfSpace>(std::nan(""))));
}

TEST_F(QuantizeTest, FloatScalar) {
    EXPECT_FLOAT_EQ(Quantize<PdfSpace>(1.234f), 1.23f);
}

// =============================================================================
// Quantized Value
// =============================================================================

class QuantizedTest : public ::testing::Test {};

TEST_F(QuantizedTest, ConstructionSnaps) {
    PdfValue v(1.234);
    EXPECT_DOUBLE_EQ(v.Value(), 1.23);
    EXPECT_EQ(v.Ticks(), 123);
    EXPECT_TRUE(PdfValue::IsQuantized());
    EXPECT_DOUBLE_EQ(PdfValue::Quantum(), 0.01);
}

TEST_F(QuantizedTest, DefaultIsZero) {
    PdfValue v;
    EXPECT_EQ(v.Value(), 0.0);
    EXPECT_EQ(v.Ticks(), 0);
}

TEST_F(QuantizedTest, UnquantizedTicksRoundToInteger) {
    Quantized<double> v(2.6);
    EXPECT_EQ(v.Value(), 2.6);
    EXPECT_EQ(v.Ticks(), 3);
    EXPECT_FALSE(Quantized<double>::IsQuantized());
}

TEST_F(QuantizedTest, StackedSumsAreBitExact) {
    // 21.8 * 3 is not exactly 65.4 in binary floating point
    PdfValue base(84.0);
    PdfValue viaProduct = base + PdfValue(21.8 * 3);
    PdfValue viaLiteral = base + PdfValue(65.4);

    EXPECT_EQ(viaProduct.Value(), viaLiteral.Value());
    EXPECT_EQ(viaProduct.Ticks(), 14940);
    EXPECT_EQ(viaProduct, viaLiteral);
}

TEST_F(QuantizedTest, ArithmeticRequantizes) {
    PdfValue third = PdfValue(1.0) / 3.0;
    EXPECT_DOUBLE_EQ(third.Value(), 0.33);
    EXPECT_EQ(third.Ticks(), 33);

    PdfValue half = PdfValue(0.1) * 0.5;
    EXPECT_EQ(half.Ticks(), 5);

    PdfValue scaled = 3.0 * PdfValue(0.01);
    EXPECT_EQ(scaled.Ticks(), 3);

    PdfValue diff = PdfValue(5.0) - PdfValue(1.234);
    EXPECT_DOUBLE_EQ(diff.Value(), 3.77);

    PdfValue neg = -PdfValue(1.234);
    EXPECT_DOUBLE_EQ(neg.Value(), -1.23);
}

TEST_F(QuantizedTest, CompoundAssignment) {
    PdfValue v(1.0);
    v += PdfValue(0.26);
    EXPECT_EQ(v.Ticks(), 126);
    v -= PdfValue(0.26);
    EXPECT_EQ(v.Ticks(), 100);
    v *= 2.0;
    EXPECT_EQ(v.Ticks(), 200);
    v /= 8.0;
    EXPECT_EQ(v.Ticks(), 25);
}

TEST_F(QuantizedTest, Comparison) {
    EXPECT_EQ(PdfValue(1.004), PdfValue(1.0));
    EXPECT_NE(PdfValue(1.006), PdfValue(1.0));
    EXPECT_LT(PdfValue(1.0), PdfValue(1.01));
    EXPECT_LE(PdfValue(1.0), PdfValue(1.001));
    EXPECT_GT(PdfValue(-1.0), PdfValue(-1.01));
    EXPECT_GE(PdfValue(2.0), PdfValue(1.999));
}

TEST_F(QuantizedTest, MapToOtherSpace) {
    Quantized<double> raw(1.234);
    auto mapped = raw.Map<PdfSpace>([](double v) { return v * 2.0; });

    static_assert(std::is_same<decltype(mapped), Quantized<double, PdfSpace>>::value,
                  "mapped type");
    EXPECT_DOUBLE_EQ(mapped.Value(), 2.47);
}

TEST_F(QuantizedTest, MapChangesScalarType) {
    PdfValue v(1.5);
    auto mapped = v.Map([](double x) { return static_cast<float>(x); });

    static_assert(std::is_same<decltype(mapped), Quantized<float, PdfSpace>>::value,
                  "mapped type");
    EXPECT_FLOAT_EQ(mapped.Value(), 1.5f);
}

TEST_F(QuantizedTest, MapPropagatesException) {
    PdfValue v(1.0);
    EXPECT_THROW(v.Map([](double) -> double { throw std::runtime_error("boom"); }),
                 std::runtime_error);
}

// =============================================================================
// Rounding Kernels
// =============================================================================

class RoundingTest : public ::testing::Test {};

TEST_F(RoundingTest, NonPositiveQuantumDisablesSnapping) {
    EXPECT_EQ(Internal::RoundToQuantum(1.234, 0.0), 1.234);
    EXPECT_EQ(Internal::RoundToQuantum(1.234, -0.01), 1.234);
    EXPECT_EQ(Internal::RoundToQuantum(1.234, std::nan("")), 1.234);
}

TEST_F(RoundingTest, TicksHandleExtremes) {
    EXPECT_EQ(Internal::QuantumTicks(std::nan(""), 0.01), 0);
    EXPECT_EQ(Internal::QuantumTicks(1e300, 1e-10), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(Internal::QuantumTicks(-1e300, 1e-10), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(Internal::QuantumTicks(-2.5, 0.0), -3);
}

} // namespace
} // namespace Qi::Geom
