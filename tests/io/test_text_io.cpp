#include <gtest/gtest.h>
#include "cosmotag/text_io.hpp"
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

using namespace cosmotag;
using namespace cosmotag::io;

// ─── Parsing ──────────────────────────────────────────────────────────────────

TEST(TextIO_Parse, FullHeader) {
    const std::string text =
        "# units: kpc\n"
        "# dtype: float32\n"
        "# comoving: false\n"
        "# a_exponent: 1\n"
        "# scale_factor: 0.5\n"
        "# compression: lossy\n"
        "value\n"
        "1.0\n"
        "2.5\n";
    CosmoArray x = TextIO::parse_text(text);
    EXPECT_EQ(x.units().expr(), "kpc");
    EXPECT_EQ(x.dtype(), Dtype::float32);
    EXPECT_FALSE(x.comoving());
    ASSERT_TRUE(x.cosmo_factor().has_value());
    EXPECT_EQ(x.cosmo_factor()->expr(), Rational(1));
    EXPECT_DOUBLE_EQ(x.cosmo_factor()->scale_factor(), 0.5);
    EXPECT_EQ(x.compression(), std::optional<std::string>("lossy"));
    EXPECT_EQ(x.to_vector(), (std::vector<double>{1.0, 2.5}));
}

TEST(TextIO_Parse, DefaultsWhenHeaderMissing) {
    CosmoArray x = TextIO::parse_text("value\n3\n4\n");
    EXPECT_TRUE(x.units().is_dimensionless());
    EXPECT_TRUE(x.comoving());
    EXPECT_FALSE(x.cosmo_factor().has_value());
    EXPECT_EQ(x.ndim(), 1);
}

TEST(TextIO_Parse, SeveralColumnsGiveTwoDimensions) {
    CosmoArray x = TextIO::parse_text("# units: km/s\nvx,vy,vz\n1,2,3\n4,5,6\n");
    EXPECT_EQ(x.shape(), (Shape{2, 3}));
    EXPECT_DOUBLE_EQ(x.value()(1, 2), 6.0);
}

TEST(TextIO_Parse, FractionalExponent) {
    CosmoArray x = TextIO::parse_text(
        "# a_exponent: -3/2\n# scale_factor: 0.25\nvalue\n1\n");
    EXPECT_EQ(x.cosmo_factor()->expr(), Rational(-3, 2));
    CosmoArray y = TextIO::parse_text("# a_exponent: 0.5\n# scale_factor: 1\nvalue\n1\n");
    EXPECT_EQ(y.cosmo_factor()->expr(), Rational(1, 2));
}

TEST(TextIO_Parse, ZeroDimensional) {
    CosmoArray x = TextIO::parse_text("# ndim: 0\nvalue\n42\n");
    EXPECT_EQ(x.ndim(), 0);
    EXPECT_DOUBLE_EQ(x.value()(0, 0), 42.0);
    EXPECT_THROW((void)TextIO::parse_text("# ndim: 0\nvalue\n1\n2\n"), InvalidConstruction);
}

TEST(TextIO_Parse, CommentsAndBlankLinesIgnored) {
    CosmoArray x = TextIO::parse_text("# generated by hand\n\nvalue\n1\n\n# trailing\n2\n");
    EXPECT_EQ(x.to_vector(), (std::vector<double>{1.0, 2.0}));
}

TEST(TextIO_Parse, NonFiniteValues) {
    CosmoArray x = TextIO::parse_text("value\nnan\ninf\n");
    EXPECT_TRUE(std::isnan(x.value()(0, 0)));
    EXPECT_TRUE(std::isinf(x.value()(1, 0)));
}

// ─── Malformed input ──────────────────────────────────────────────────────────

TEST(TextIO_Malformed, BadNumber_Throws) {
    EXPECT_THROW((void)TextIO::parse_text("value\n1\nabc\n"), InvalidConstruction);
}

TEST(TextIO_Malformed, WrongColumnCount_Throws) {
    EXPECT_THROW((void)TextIO::parse_text("a,b\n1,2\n3\n"), InvalidConstruction);
}

TEST(TextIO_Malformed, EmptyField_Throws) {
    EXPECT_THROW((void)TextIO::parse_text("a,b\n1,\n"), InvalidConstruction);
}

TEST(TextIO_Malformed, NoColumnHeader_Throws) {
    EXPECT_THROW((void)TextIO::parse_text("# units: kpc\n"), InvalidConstruction);
    EXPECT_THROW((void)TextIO::parse_text(""), InvalidConstruction);
}

TEST(TextIO_Malformed, ExponentWithoutScaleFactor_Throws) {
    EXPECT_THROW((void)TextIO::parse_text("# a_exponent: 1\nvalue\n1\n"), InvalidConstruction);
}

TEST(TextIO_Malformed, BadHeaderValues_Throw) {
    EXPECT_THROW((void)TextIO::parse_text("# comoving: maybe\nvalue\n1\n"), InvalidConstruction);
    EXPECT_THROW((void)TextIO::parse_text("# dtype: int8\nvalue\n1\n"), InvalidConstruction);
    EXPECT_THROW((void)TextIO::parse_text("# units: parsecs\nvalue\n1\n"), InvalidConstruction);
    EXPECT_THROW((void)TextIO::parse_text("# ndim: 3\nvalue\n1\n"), InvalidConstruction);
    EXPECT_THROW((void)TextIO::parse_text(
                     "# a_exponent: 1\n# scale_factor: 0\nvalue\n1\n"),
                 InvalidConstruction);
    EXPECT_THROW((void)TextIO::parse_text(
                     "# a_exponent: 1e300/1\n# scale_factor: 1\nvalue\n1\n"),
                 InvalidConstruction);
}

// ─── Formatting ───────────────────────────────────────────────────────────────

TEST(TextIO_Format, HeaderLines) {
    TagState tag{.comoving = true,
                 .cosmo_factor = ScaleFactorExponent(Rational(1), 0.5),
                 .compression = std::nullopt};
    const std::string text = TextIO::format_text(CosmoArray({1.0, 2.0}, "kpc", tag));
    EXPECT_NE(text.find("# units: kpc\n"), std::string::npos);
    EXPECT_NE(text.find("# comoving: true\n"), std::string::npos);
    EXPECT_NE(text.find("# a_exponent: 1\n"), std::string::npos);
    EXPECT_NE(text.find("# scale_factor: 0.5\n"), std::string::npos);
    EXPECT_EQ(text.find("# compression"), std::string::npos);
    EXPECT_NE(text.find("value\n1\n2\n"), std::string::npos);
}

TEST(TextIO_Format, ParsesBackToEqualArray) {
    TagState tag{.comoving = false,
                 .cosmo_factor = ScaleFactorExponent(Rational(-3, 2), 0.3),
                 .compression = "lossy"};
    const CosmoArray x({{0.1, 1.0 / 3.0}, {-2e-300, 6.02e23}}, "g/cm**3", tag);
    const CosmoArray y = TextIO::parse_text(TextIO::format_text(x));

    EXPECT_EQ(y.to_vector(), x.to_vector());
    EXPECT_EQ(y.shape(), x.shape());
    EXPECT_EQ(y.units(), x.units());
    EXPECT_EQ(y.comoving(), x.comoving());
    EXPECT_TRUE(y.cosmo_factor()->identical_to(*x.cosmo_factor()));
    EXPECT_EQ(y.compression(), x.compression());
}

TEST(TextIO_Format, ScalarKeepsZeroDimensions) {
    const CosmoArray s = CosmoArray::scalar(2.0, Unit::parse("Msun"));
    EXPECT_EQ(TextIO::parse_text(TextIO::format_text(s)).ndim(), 0);
}

TEST(TextIO_Format, ZeroColumnsParseBack) {
    const CosmoArray x(std::vector<std::vector<double>>(3, std::vector<double>{}), "kpc");
    const std::string text = TextIO::format_text(x);
    EXPECT_NE(text.find("# rows: 3\n-\n"), std::string::npos);

    const CosmoArray y = TextIO::parse_text(text);
    EXPECT_EQ(y.ndim(), 2);
    EXPECT_EQ(y.shape(), x.shape());
    EXPECT_EQ(y.size(), 0);
}

TEST(TextIO_Format, NoRowsNoColumnsParseBack) {
    const CosmoArray x(Quantity(Buffer(0, 0), 2, Unit::parse("kpc")));
    const CosmoArray y = TextIO::parse_text(TextIO::format_text(x));
    EXPECT_EQ(y.ndim(), 2);
    EXPECT_EQ(y.shape(), x.shape());
}

TEST(TextIO_Malformed, ZeroColumnsWithDataRow_Throws) {
    EXPECT_THROW(TextIO::parse_text("# ndim: 2\n# rows: 1\n-\n1.0\n"), InvalidConstruction);
    EXPECT_THROW(TextIO::parse_text("# rows: -1\n-\n"), InvalidConstruction);
}

// ─── Files ────────────────────────────────────────────────────────────────────

TEST(TextIO_File, MissingFile_ReturnsNullopt) {
    EXPECT_FALSE(TextIO::load_text("/nonexistent/cosmotag/array.txt").has_value());
}

TEST(TextIO_File, SaveThenLoad) {
    const auto path = std::filesystem::temp_directory_path() / "cosmotag_text_io_test.txt";
    const CosmoArray x({1.0, 2.0, 3.0}, "Mpc",
                       TagState{.comoving = true,
                                .cosmo_factor = ScaleFactorExponent(Rational(1), 0.5)});
    ASSERT_TRUE(TextIO::save_text(x, path.string()));

    auto y = TextIO::load_text(path.string());
    ASSERT_TRUE(y.has_value());
    EXPECT_EQ(y->to_vector(), x.to_vector());
    EXPECT_EQ(y->units(), x.units());
    std::filesystem::remove(path);
}

TEST(TextIO_File, UnwritablePath_ReturnsFalse) {
    EXPECT_FALSE(TextIO::save_text(CosmoArray(std::vector<double>{1.0}, "kpc"), "/nonexistent/dir/out.txt"));
}
