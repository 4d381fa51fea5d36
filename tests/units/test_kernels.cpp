#include <gtest/gtest.h>
#include "cosmotag/kernels.hpp"
#include "cosmotag/errors.hpp"
#include <cmath>
#include <limits>
#include <numbers>
#include <vector>

using namespace cosmotag;
using namespace cosmotag::kernels;

namespace {

Quantity q(const std::vector<double>& values, const char* units = "",
           Dtype dtype = Dtype::float64) {
    return Quantity(values, Unit::parse(units), dtype);
}

} // anonymous namespace

// ─── Additive ─────────────────────────────────────────────────────────────────

TEST(Kernels_Additive, SecondOperandExpressedInFirstUnits) {
    Quantity r = binary(Ufunc::add, q({1.0, 2.0}, "kpc"), q({500.0, 1000.0}, "pc"));
    EXPECT_EQ(r.units().expr(), "kpc");
    EXPECT_NEAR(r.value()(0, 0), 1.5, 1e-12);
    EXPECT_NEAR(r.value()(1, 0), 3.0, 1e-12);
}

TEST(Kernels_Additive, IncompatibleUnits_Throws) {
    EXPECT_THROW((void)binary(Ufunc::subtract, q({1.0}, "kpc"), q({1.0}, "s")),
                 UnitIncompatible);
}

TEST(Kernels_Additive, RemainderFollowsDivisorSign) {
    Quantity r = binary(Ufunc::remainder, q({-7.0, 7.0}), q({3.0}));
    EXPECT_DOUBLE_EQ(r.value()(0, 0), 2.0);
    EXPECT_DOUBLE_EQ(r.value()(1, 0), 1.0);
    Quantity f = binary(Ufunc::fmod, q({-7.0}), q({3.0}));
    EXPECT_DOUBLE_EQ(f.value()(0, 0), -1.0);
}

TEST(Kernels_Additive, MaximumPropagatesNaN_FmaxIgnoresIt) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(std::isnan(binary(Ufunc::maximum, q({nan}), q({1.0})).value()(0, 0)));
    EXPECT_DOUBLE_EQ(binary(Ufunc::fmax, q({nan}), q({1.0})).value()(0, 0), 1.0);
}

// ─── Multiplicative ───────────────────────────────────────────────────────────

TEST(Kernels_Multiplicative, UnitsCombine) {
    Quantity r = binary(Ufunc::multiply, q({2.0}, "km"), q({3.0}, "s"));
    EXPECT_DOUBLE_EQ(r.value()(0, 0), 6.0);
    EXPECT_EQ(r.units(), Unit::parse("km*s"));

    Quantity v = binary(Ufunc::divide, q({10.0}, "km"), q({2.0}, "s"));
    EXPECT_DOUBLE_EQ(v.value()(0, 0), 5.0);
    EXPECT_EQ(v.units(), Unit::parse("km/s"));
}

TEST(Kernels_Multiplicative, FloorDivide) {
    Quantity r = binary(Ufunc::floor_divide, q({7.0, -7.0}), q({2.0}));
    EXPECT_DOUBLE_EQ(r.value()(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(r.value()(1, 0), -4.0);
}

TEST(Kernels_Power, DimensionedBaseScalarExponent) {
    Quantity r = binary(Ufunc::power, q({2.0, 3.0}, "cm"), q({2.0}));
    EXPECT_DOUBLE_EQ(r.value()(1, 0), 9.0);
    EXPECT_EQ(r.units().dimensions()[BaseDimension::length], Rational(2));
}

TEST(Kernels_Power, NonUniformExponentOnDimensionedBase_Throws) {
    EXPECT_THROW((void)binary(Ufunc::power, q({2.0, 3.0}, "cm"), q({1.0, 2.0})),
                 UnitIncompatible);
}

TEST(Kernels_Power, DimensionedExponent_Throws) {
    EXPECT_THROW((void)binary(Ufunc::power, q({2.0}), q({1.0}, "s")), UnitIncompatible);
}

TEST(Kernels_Matmul, MatrixVector) {
    Quantity m({{1.0, 2.0}, {3.0, 4.0}}, Unit::parse("km"));
    Quantity v = q({1.0, 1.0}, "s");
    Quantity r = binary(Ufunc::matmul, m, v);
    EXPECT_EQ(r.ndim(), 1);
    EXPECT_EQ(r.to_vector(), (std::vector<double>{3.0, 7.0}));
    EXPECT_EQ(r.units(), Unit::parse("km*s"));
}

TEST(Kernels_Matmul, DotProductIsScalar) {
    Quantity r = binary(Ufunc::matmul, q({1.0, 2.0, 3.0}), q({4.0, 5.0, 6.0}));
    EXPECT_EQ(r.ndim(), 0);
    EXPECT_DOUBLE_EQ(r.value()(0, 0), 32.0);
}

TEST(Kernels_Matmul, CoreDimensionMismatch_Throws) {
    EXPECT_THROW((void)binary(Ufunc::matmul, q({1.0, 2.0}), q({1.0, 2.0, 3.0})), ShapeMismatch);
}

// ─── Broadcasting ─────────────────────────────────────────────────────────────

TEST(Kernels_Broadcast, ScalarAgainstArray) {
    Quantity r = binary(Ufunc::multiply, Quantity::scalar(2.0), q({1.0, 2.0, 3.0}));
    EXPECT_EQ(r.ndim(), 1);
    EXPECT_EQ(r.to_vector(), (std::vector<double>{2.0, 4.0, 6.0}));
}

TEST(Kernels_Broadcast, IncompatibleShapes_Throws) {
    EXPECT_THROW((void)binary(Ufunc::add, q({1.0, 2.0}), q({1.0, 2.0, 3.0})), ShapeMismatch);
}

// ─── Unary ────────────────────────────────────────────────────────────────────

TEST(Kernels_Unary, UnitPreserving) {
    Quantity r = unary(Ufunc::absolute, q({-1.5, 2.0}, "kpc"));
    EXPECT_EQ(r.to_vector(), (std::vector<double>{1.5, 2.0}));
    EXPECT_EQ(r.units().expr(), "kpc");
    EXPECT_EQ(unary(Ufunc::negative, q({1.0}, "kpc")).value()(0, 0), -1.0);
}

TEST(Kernels_Unary, SqrtHalvesDimensions) {
    Quantity r = unary(Ufunc::sqrt, q({4.0}, "cm**2"));
    EXPECT_DOUBLE_EQ(r.value()(0, 0), 2.0);
    EXPECT_EQ(r.units().dimensions(), dimensions::length());
}

TEST(Kernels_Unary, TranscendentalRequiresDimensionless) {
    EXPECT_NEAR(unary(Ufunc::sin, q({std::numbers::pi / 2.0})).value()(0, 0), 1.0, 1e-15);
    EXPECT_THROW((void)unary(Ufunc::exp, q({1.0}, "kpc")), UnitIncompatible);
}

TEST(Kernels_Unary, DimensionlessRatioIsSimplified) {
    // kpc/pc is dimensionless with a factor of 1000.
    Quantity ratio(std::vector<double>{1.0}, Unit::parse("kpc/pc"));
    EXPECT_NEAR(unary(Ufunc::log10, ratio).value()(0, 0), 3.0, 1e-12);
}

TEST(Kernels_Unary, PredicatesAreBoolean) {
    const double inf = std::numeric_limits<double>::infinity();
    Quantity r = unary(Ufunc::isfinite, q({1.0, inf}, "kpc"));
    EXPECT_EQ(r.dtype(), Dtype::boolean);
    EXPECT_TRUE(r.units().is_dimensionless());
    EXPECT_EQ(r.to_vector(), (std::vector<double>{1.0, 0.0}));
}

TEST(Kernels_Unary, BinaryOperation_Throws) {
    EXPECT_THROW((void)unary(Ufunc::add, q({1.0})), DispatchUnsupported);
    EXPECT_THROW((void)binary(Ufunc::sin, q({1.0}), q({1.0})), DispatchUnsupported);
}

// ─── Comparisons ──────────────────────────────────────────────────────────────

TEST(Kernels_Comparison, ConvertsUnitsBeforeComparing) {
    Quantity r = binary(Ufunc::greater, q({1.0, 1.0}, "kpc"), q({500.0, 2000.0}, "pc"));
    EXPECT_EQ(r.dtype(), Dtype::boolean);
    EXPECT_EQ(r.to_vector(), (std::vector<double>{1.0, 0.0}));
}

// ─── Two outputs ──────────────────────────────────────────────────────────────

TEST(Kernels_Pair, ModfSplitsFraction) {
    auto [frac, whole] = unary_pair(Ufunc::modf, q({2.5, -1.25}, "kpc"));
    EXPECT_EQ(frac.to_vector(), (std::vector<double>{0.5, -0.25}));
    EXPECT_EQ(whole.to_vector(), (std::vector<double>{2.0, -1.0}));
    EXPECT_EQ(whole.units().expr(), "kpc");
}

TEST(Kernels_Pair, FrexpMantissaExponent) {
    auto [m, e] = unary_pair(Ufunc::frexp, q({8.0}));
    EXPECT_DOUBLE_EQ(m.value()(0, 0), 0.5);
    EXPECT_DOUBLE_EQ(e.value()(0, 0), 4.0);
}

TEST(Kernels_Pair, DivmodQuotientIsDimensionless) {
    auto [quot, rem] = binary_pair(Ufunc::divmod, q({7.0}, "kpc"), q({2000.0}, "pc"));
    EXPECT_DOUBLE_EQ(quot.value()(0, 0), 3.0);
    EXPECT_TRUE(quot.units().is_dimensionless());
    EXPECT_NEAR(rem.value()(0, 0), 1.0, 1e-12);
    EXPECT_EQ(rem.units().expr(), "kpc");
}

// ─── Clip / reduce ────────────────────────────────────────────────────────────

TEST(Kernels_Clip, ClampsToBounds) {
    Quantity r = clip(q({-1.0, 0.5, 3.0}, "kpc"), 0.0, 1.0);
    EXPECT_EQ(r.to_vector(), (std::vector<double>{0.0, 0.5, 1.0}));
}

TEST(Kernels_Reduce, SumAllAndAlongAxis) {
    Quantity m({{1.0, 2.0}, {3.0, 4.0}}, Unit::parse("g"));
    EXPECT_DOUBLE_EQ(reduce(Ufunc::add, m, std::nullopt).value()(0, 0), 10.0);
    EXPECT_EQ(reduce(Ufunc::add, m, 0).to_vector(), (std::vector<double>{4.0, 6.0}));
    EXPECT_EQ(reduce(Ufunc::add, m, 1).to_vector(), (std::vector<double>{3.0, 7.0}));
    EXPECT_THROW((void)reduce(Ufunc::add, m, 2), InvalidConstruction);
}

TEST(Kernels_Reduce, ProductRaisesUnits) {
    Quantity r = reduce(Ufunc::multiply, q({2.0, 3.0, 4.0}, "cm"), std::nullopt);
    EXPECT_DOUBLE_EQ(r.value()(0, 0), 24.0);
    EXPECT_EQ(r.units().dimensions()[BaseDimension::length], Rational(3));
}

TEST(Kernels_Reduce, EmptyMaximum_Throws) {
    EXPECT_THROW((void)reduce(Ufunc::maximum, q({}), std::nullopt), InvalidConstruction);
}

TEST(Kernels_Reduce, NoReduction_Throws) {
    EXPECT_THROW((void)reduce(Ufunc::sin, q({1.0}), std::nullopt), DispatchUnsupported);
}

// ─── Dtype promotion ──────────────────────────────────────────────────────────

TEST(Kernels_Promote, Float64Wins) {
    EXPECT_EQ(promote(Dtype::float32, Dtype::float64), Dtype::float64);
    EXPECT_EQ(promote(Dtype::float32, Dtype::float32), Dtype::float32);
    EXPECT_EQ(promote(Dtype::float32, Dtype::boolean), Dtype::float32);
    EXPECT_EQ(promote(Dtype::boolean, Dtype::boolean), Dtype::float64);
}
