#pragma once

/// @file include/cosmotag/types.hpp
/// @brief Shared primitive types for cosmotag.
///
/// Defines the exact rational number used for scale-factor and unit exponents,
/// the element dtype tag, and the Eigen-based storage alias shared by the
/// quantity and tagged-array layers.

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cosmotag {

// ─── Storage ──────────────────────────────────────────────────────────────────

/// Numeric storage for every array in the library. Row-major so that the
/// flattened element order matches C order.
using Buffer = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Array shape: empty for a scalar, {n} for 1-D, {rows, cols} for 2-D.
using Shape = std::vector<Eigen::Index>;

/// Element type of an array. Values are always held as double; float32 arrays
/// are rounded through float on every write, boolean arrays hold 0.0 / 1.0.
enum class Dtype : std::uint8_t {
    float64 = 0,
    float32 = 1,
    boolean = 2,
};

/// Lower-case name of a dtype ("float64", "float32", "bool").
[[nodiscard]] const char* to_string(Dtype dtype) noexcept;

/// Parse a dtype name. Accepts the names produced by `to_string` plus the
/// numpy aliases "f8", "f4", "double", "float".
[[nodiscard]] std::optional<Dtype> dtype_from_string(const std::string& name) noexcept;

// ─── Rational ─────────────────────────────────────────────────────────────────

/// Exact rational number p/q, always normalised (gcd 1, q > 0).
///
/// Exponents of the scale factor and of unit dimensions are rational in
/// practice (a³, a⁻¹, cm^½), so they are stored exactly instead of as doubles:
/// two exponents built along different arithmetic paths still compare equal.
class Rational {
public:
    constexpr Rational() noexcept = default;

    /// Construct num/den. Throws InvalidConstruction if den == 0.
    Rational(std::int64_t num, std::int64_t den = 1);

    /// Recover a rational from a double, e.g. 0.5 → 1/2.
    ///
    /// # Returns
    /// - `Some(r)` with |r − x| ≤ RATIONAL_TOLERANCE
    /// - `None` if x is non-finite or no denominator ≤ RATIONAL_MAX_DENOMINATOR fits
    [[nodiscard]] static std::optional<Rational> from_double(double x) noexcept;

    [[nodiscard]] std::int64_t numerator() const noexcept { return num_; }
    [[nodiscard]] std::int64_t denominator() const noexcept { return den_; }

    [[nodiscard]] double to_double() const noexcept {
        return static_cast<double>(num_) / static_cast<double>(den_);
    }

    [[nodiscard]] bool is_zero() const noexcept { return num_ == 0; }
    [[nodiscard]] bool is_integer() const noexcept { return den_ == 1; }

    /// "3", "-1", "3/2".
    [[nodiscard]] std::string to_string() const;

    /// Arithmetic is exact; a result whose numerator or denominator leaves
    /// int64 range throws InvalidConstruction.
    Rational operator-() const;
    friend Rational operator+(const Rational& a, const Rational& b);
    friend Rational operator-(const Rational& a, const Rational& b);
    friend Rational operator*(const Rational& a, const Rational& b);
    friend Rational operator/(const Rational& a, const Rational& b);

    friend bool operator==(const Rational& a, const Rational& b) noexcept {
        return a.num_ == b.num_ && a.den_ == b.den_;
    }
    friend bool operator!=(const Rational& a, const Rational& b) noexcept {
        return !(a == b);
    }
    friend bool operator<(const Rational& a, const Rational& b) noexcept;

private:
    std::int64_t num_ = 0;
    std::int64_t den_ = 1;
};

} // namespace cosmotag
