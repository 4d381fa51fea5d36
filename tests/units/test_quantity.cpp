#include <gtest/gtest.h>
#include "cosmotag/quantity.hpp"
#include "cosmotag/errors.hpp"
#include <bit>
#include <cstdint>
#include <vector>

using namespace cosmotag;

namespace {

Quantity kpc(const std::vector<double>& values) {
    return Quantity(values, Unit::parse("kpc"));
}

} // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

TEST(Quantity_Construct, OneDimensional) {
    Quantity q = kpc({1.0, 2.0, 3.0});
    EXPECT_EQ(q.ndim(), 1);
    EXPECT_EQ(q.shape(), (Shape{3}));
    EXPECT_EQ(q.size(), 3);
    EXPECT_EQ(q.to_vector(), (std::vector<double>{1.0, 2.0, 3.0}));
}

TEST(Quantity_Construct, TwoDimensionalRowMajor) {
    Quantity q({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}}, Unit::parse("km"));
    EXPECT_EQ(q.ndim(), 2);
    EXPECT_EQ(q.shape(), (Shape{2, 3}));
    EXPECT_EQ(q.to_vector(), (std::vector<double>{1, 2, 3, 4, 5, 6}));
}

TEST(Quantity_Construct, RaggedRows_Throws) {
    EXPECT_THROW(Quantity({{1.0, 2.0}, {3.0}}, Unit()), InvalidConstruction);
}

TEST(Quantity_Construct, ScalarIsZeroDimensional) {
    Quantity q = Quantity::scalar(4.0, Unit::parse("s"));
    EXPECT_EQ(q.ndim(), 0);
    EXPECT_TRUE(q.shape().empty());
    EXPECT_DOUBLE_EQ(q.value()(0, 0), 4.0);
}

TEST(Quantity_Construct, Float32RoundsValues) {
    Quantity q(std::vector<double>{0.1}, Unit(), Dtype::float32);
    EXPECT_EQ(q.value()(0, 0), static_cast<double>(0.1f));
}

TEST(Quantity_Construct, BooleanMapsNonZeroToOne) {
    Quantity q({0.0, 2.5, -1.0}, Unit(), Dtype::boolean);
    EXPECT_EQ(q.to_vector(), (std::vector<double>{0.0, 1.0, 1.0}));
}

// ─── Unit conversion ──────────────────────────────────────────────────────────

TEST(Quantity_Units, InUnitsLeavesOriginalUntouched) {
    Quantity q = kpc({1.0, 2.0});
    Quantity p = q.in_units(Unit::parse("pc"));
    EXPECT_NEAR(p.value()(0, 0), 1000.0, 1e-9);
    EXPECT_NEAR(p.value()(1, 0), 2000.0, 1e-9);
    EXPECT_EQ(q.units().expr(), "kpc");
    EXPECT_DOUBLE_EQ(q.value()(0, 0), 1.0);
}

TEST(Quantity_Units, ConvertToBaseOfCosmoSystem) {
    Quantity q = kpc({1000.0});
    q.convert_to_base(UnitSystem::cosmo());
    EXPECT_NEAR(q.value()(0, 0), 1.0, 1e-12);
    EXPECT_EQ(q.units(), Unit::parse("Mpc"));
}

TEST(Quantity_Units, IncompatibleConversion_Throws) {
    EXPECT_THROW((void)kpc({1.0}).in_units(Unit::parse("g")), UnitIncompatible);
}

// ─── Shape accessors ──────────────────────────────────────────────────────────

TEST(Quantity_Shape, ElementOfOneDimensionalIsScalar) {
    Quantity e = kpc({1.0, 2.0, 3.0}).element(-1);
    EXPECT_EQ(e.ndim(), 0);
    EXPECT_DOUBLE_EQ(e.value()(0, 0), 3.0);
    EXPECT_EQ(e.units().expr(), "kpc");
}

TEST(Quantity_Shape, ElementOutOfRange_Throws) {
    EXPECT_THROW((void)kpc({1.0}).element(1), InvalidConstruction);
}

TEST(Quantity_Shape, RowOfTwoDimensional) {
    Quantity q({{1.0, 2.0}, {3.0, 4.0}}, Unit());
    Quantity row = q.element(1);
    EXPECT_EQ(row.ndim(), 1);
    EXPECT_EQ(row.to_vector(), (std::vector<double>{3.0, 4.0}));
    EXPECT_DOUBLE_EQ(q.element(0, 1).value()(0, 0), 2.0);
}

TEST(Quantity_Shape, SlicePythonSemantics) {
    Quantity q = kpc({0, 1, 2, 3, 4, 5});
    EXPECT_EQ(q.slice(1, 4).to_vector(), (std::vector<double>{1, 2, 3}));
    EXPECT_EQ(q.slice(0, 6, 2).to_vector(), (std::vector<double>{0, 2, 4}));
    EXPECT_EQ(q.slice(-2, 100).to_vector(), (std::vector<double>{4, 5}));
    EXPECT_EQ(q.slice(5, -7, -2).to_vector(), (std::vector<double>{5, 3, 1}));
    EXPECT_THROW((void)q.slice(0, 1, 0), InvalidConstruction);
}

TEST(Quantity_Shape, ReshapeAndFlatten) {
    Quantity q = kpc({1, 2, 3, 4, 5, 6});
    Quantity m = q.reshape(2, 3);
    EXPECT_EQ(m.shape(), (Shape{2, 3}));
    EXPECT_DOUBLE_EQ(m.value()(1, 0), 4.0);
    EXPECT_EQ(m.flatten().to_vector(), q.to_vector());
    EXPECT_THROW((void)q.reshape(4, 2), ShapeMismatch);
}

TEST(Quantity_Shape, TransposeSwapsAxes) {
    Quantity q({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}}, Unit());
    Quantity t = q.transpose();
    EXPECT_EQ(t.shape(), (Shape{3, 2}));
    EXPECT_DOUBLE_EQ(t.value()(2, 1), 6.0);
    EXPECT_EQ(q.swapaxes(0, 1).shape(), (Shape{3, 2}));
    EXPECT_THROW((void)q.swapaxes(0, 2), InvalidConstruction);
}

TEST(Quantity_Shape, TakeRepeatCompress) {
    Quantity q = kpc({10, 20, 30});
    EXPECT_EQ(q.take({2, 0, -1}).to_vector(), (std::vector<double>{30, 10, 30}));
    EXPECT_EQ(q.repeat(2).to_vector(), (std::vector<double>{10, 10, 20, 20, 30, 30}));
    EXPECT_EQ(q.compress({true, false, true}).to_vector(), (std::vector<double>{10, 30}));
    EXPECT_EQ(q.compress({false, true}).to_vector(), (std::vector<double>{20}));
    EXPECT_THROW((void)q.compress({true, true, true, true}), ShapeMismatch);
}

TEST(Quantity_Shape, Diagonal) {
    Quantity q({{1.0, 2.0}, {3.0, 4.0}}, Unit());
    EXPECT_EQ(q.diagonal().to_vector(), (std::vector<double>{1.0, 4.0}));
    EXPECT_THROW((void)kpc({1.0}).diagonal(), InvalidConstruction);
}

TEST(Quantity_Shape, ByteswapTwiceIsIdentity) {
    Quantity q = kpc({1.5, -2.25});
    Quantity s = q.byteswap();
    EXPECT_NE(s.value()(0, 0), 1.5);
    EXPECT_EQ(s.byteswap().to_vector(), q.to_vector());
}

TEST(Quantity_Shape, ByteswapUsesFloat32Width) {
    const Quantity q({1.0, -2.5}, Unit::parse("kpc"), Dtype::float32);
    const Quantity s = q.byteswap();
    EXPECT_EQ(s.dtype(), Dtype::float32);

    const auto b = std::bit_cast<std::uint32_t>(1.0f);
    const std::uint32_t swapped = (b >> 24) | ((b >> 8) & 0xFF00u)
                                | ((b << 8) & 0xFF0000u) | (b << 24);
    EXPECT_EQ(s.value()(0, 0), static_cast<double>(std::bit_cast<float>(swapped)));
    EXPECT_EQ(s.byteswap().to_vector(), q.to_vector());
}

TEST(Quantity_Shape, ByteswapLeavesBooleans) {
    const Quantity q({1.0, 0.0}, Unit(), Dtype::boolean);
    EXPECT_EQ(q.byteswap().to_vector(), q.to_vector());
}

TEST(Quantity_Shape, OnesLikeKeepsUnits) {
    Quantity o = kpc({3.0, 4.0}).ones_like();
    EXPECT_EQ(o.to_vector(), (std::vector<double>{1.0, 1.0}));
    EXPECT_EQ(o.units().expr(), "kpc");
}

// ─── State ────────────────────────────────────────────────────────────────────

TEST(Quantity_State, RestoresShapeUnitsAndDtype) {
    Quantity q({{1.0, 2.0}, {3.0, 4.0}}, Unit::parse("km/s"), Dtype::float32);
    Quantity r = Quantity::from_state(q.state());
    EXPECT_EQ(r.shape(), q.shape());
    EXPECT_EQ(r.units(), q.units());
    EXPECT_EQ(r.dtype(), Dtype::float32);
    EXPECT_EQ(r.to_vector(), q.to_vector());
}

TEST(Quantity_State, InconsistentShape_Throws) {
    QuantityState s{.units = "kpc", .dtype = Dtype::float64, .ndim = 1,
                    .rows = 3, .cols = 1, .values = {1.0}};
    EXPECT_THROW((void)Quantity::from_state(s), InvalidConstruction);
}
