#include <gtest/gtest.h>
#include "cosmotag/serialize.hpp"
#include <cstring>
#include <sstream>
#include <string>

using namespace cosmotag;

namespace {

CosmoArray density() {
    TagState tag{.comoving = false,
                 .cosmo_factor = ScaleFactorExponent(Rational(-3), 0.5),
                 .compression = "lossy"};
    return CosmoArray({{1.0, 2.0}, {3.0, 4.0}}, "g/cm**3", tag, Dtype::float32);
}

/// Offset of the units length field for an array with a cosmo_factor.
constexpr std::size_t UNITS_OFFSET = 4 + 4 + 1 + 1 + 8 + 8 + 8;

} // anonymous namespace

// ─── Round trip ───────────────────────────────────────────────────────────────

TEST(Serialize_RoundTrip, RestoresEverythingButCompression) {
    const CosmoArray x = density();
    const CosmoArray y = decode_state(encode_state(x));

    EXPECT_EQ(y.to_vector(), x.to_vector());
    EXPECT_EQ(y.shape(), x.shape());
    EXPECT_EQ(y.units().expr(), "g/cm**3");
    EXPECT_EQ(y.dtype(), Dtype::float32);
    EXPECT_FALSE(y.comoving());
    ASSERT_TRUE(y.cosmo_factor().has_value());
    EXPECT_TRUE(y.cosmo_factor()->identical_to(*x.cosmo_factor()));
    EXPECT_FALSE(y.compression().has_value());
}

TEST(Serialize_RoundTrip, WithoutCosmoFactor) {
    const CosmoArray x({1.5, -2.5}, "km/s");
    const CosmoArray y = decode_state(encode_state(x));
    EXPECT_FALSE(y.cosmo_factor().has_value());
    EXPECT_TRUE(y.comoving());
    EXPECT_EQ(y.to_vector(), x.to_vector());
}

TEST(Serialize_RoundTrip, ScalarAndEmpty) {
    const CosmoArray s = CosmoArray::scalar(7.0, Unit::parse("Msun"));
    EXPECT_EQ(decode_state(encode_state(s)).ndim(), 0);

    const CosmoArray e(std::vector<double>{}, "kpc");
    EXPECT_EQ(decode_state(encode_state(e)).size(), 0);
}

TEST(Serialize_Stream, SeveralArraysBackToBack) {
    std::stringstream buffer(std::ios::in | std::ios::out | std::ios::binary);
    write_state(buffer, CosmoArray(std::vector<double>{1.0}, "kpc"));
    write_state(buffer, density());
    EXPECT_EQ(read_state(buffer).units().expr(), "kpc");
    EXPECT_EQ(read_state(buffer).units().expr(), "g/cm**3");
}

TEST(Serialize_Layout, StartsWithMagicAndVersion) {
    const std::string bytes = encode_state(CosmoArray(std::vector<double>{1.0}, "kpc"));
    ASSERT_GE(bytes.size(), 8u);
    EXPECT_EQ(bytes.substr(0, 4), "CTAG");
    std::uint32_t version = 0;
    std::memcpy(&version, bytes.data() + 4, sizeof(version));
    EXPECT_EQ(version, 1u);
}

// ─── Corrupt input ────────────────────────────────────────────────────────────

TEST(Serialize_Corrupt, EmptyInput_Throws) {
    EXPECT_THROW((void)decode_state(""), StateFormatError);
}

TEST(Serialize_Corrupt, BadMagic_Throws) {
    std::string bytes = encode_state(density());
    bytes[0] = 'X';
    EXPECT_THROW((void)decode_state(bytes), StateFormatError);
}

TEST(Serialize_Corrupt, EveryTruncation_Throws) {
    const std::string bytes = encode_state(density());
    for (std::size_t n = 0; n < bytes.size(); ++n) {
        EXPECT_THROW((void)decode_state(bytes.substr(0, n)), StateFormatError) << "length " << n;
    }
}

TEST(Serialize_Corrupt, TrailingBytes_Throws) {
    EXPECT_THROW((void)decode_state(encode_state(density()) + "x"), StateFormatError);
}

TEST(Serialize_Corrupt, ZeroScaleFactor_Throws) {
    std::string bytes = encode_state(density());
    const double zero = 0.0;
    std::memcpy(bytes.data() + 4 + 4 + 1 + 1 + 8 + 8, &zero, sizeof(zero));
    EXPECT_THROW((void)decode_state(bytes), StateFormatError);
}

TEST(Serialize_Corrupt, InvalidFlag_Throws) {
    std::string bytes = encode_state(density());
    bytes[8] = 7;
    EXPECT_THROW((void)decode_state(bytes), StateFormatError);
}

TEST(Serialize_Corrupt, UnknownUnits_Throws) {
    std::string bytes = encode_state(density());
    bytes[UNITS_OFFSET + 4] = '?';
    EXPECT_THROW((void)decode_state(bytes), StateFormatError);
}

TEST(Serialize_Corrupt, HugeUnitsLength_Throws) {
    std::string bytes = encode_state(density());
    const std::uint32_t len = 0xFFFFFFFFu;
    std::memcpy(bytes.data() + UNITS_OFFSET, &len, sizeof(len));
    EXPECT_THROW((void)decode_state(bytes), StateFormatError);
}

TEST(Serialize_Corrupt, HugeShapeDoesNotAllocate) {
    std::string bytes = encode_state(density());
    const std::size_t shape_offset = UNITS_OFFSET + 4 + std::strlen("g/cm**3") + 1 + 1;
    const std::uint64_t rows = std::uint64_t{1} << 31;
    std::memcpy(bytes.data() + shape_offset, &rows, sizeof(rows));
    EXPECT_THROW((void)decode_state(bytes), StateFormatError);
}
