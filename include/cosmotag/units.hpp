#pragma once

/// @file include/cosmotag/units.hpp
/// @brief Units and unit systems: the dimensional collaborator of cosmotag.
///
/// # Module: Units
///
/// ## Responsibility
/// Just enough dimensional bookkeeping for the tagged-array layer:
///   - parse unit expressions such as "kpc", "km/s", "1e10*Msun", "g/cm**3"
///   - compute conversion factors between dimensionally equal units
///   - express a unit in the base units of a named unit system
///
/// ## Guarantees
/// - Dimensionally incompatible conversions raise `UnitIncompatible`
/// - Unknown symbols and malformed expressions raise `InvalidConstruction`
/// - All types are immutable values; copying is cheap
///
/// ## NOT Responsible For
/// - Offset units (°C), logarithmic units, or equivalencies
/// - The scale-factor exponent (see scale_factor_exponent.hpp)

#include "cosmotag/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cosmotag {

// ─── Dimensions ───────────────────────────────────────────────────────────────

/// The five base dimensions tracked by the library.
enum class BaseDimension : std::uint8_t {
    mass = 0,
    length = 1,
    time = 2,
    temperature = 3,
    current = 4,
};

static constexpr std::size_t BASE_DIMENSION_COUNT = 5;

/// Name of a base dimension ("mass", "length", ...).
[[nodiscard]] const char* to_string(BaseDimension dim) noexcept;

/// Rational exponents of each base dimension, e.g. velocity = L¹ T⁻¹.
class Dimensions {
public:
    /// Dimensionless.
    Dimensions() = default;

    /// L^1, M^1, ... for a single base dimension.
    [[nodiscard]] static Dimensions of(BaseDimension dim);

    [[nodiscard]] const Rational& operator[](BaseDimension dim) const noexcept {
        return exponents_[static_cast<std::size_t>(dim)];
    }

    [[nodiscard]] bool is_dimensionless() const noexcept;

    [[nodiscard]] Dimensions multiply(const Dimensions& other) const;
    [[nodiscard]] Dimensions divide(const Dimensions& other) const;
    [[nodiscard]] Dimensions pow(const Rational& p) const;

    /// "(length)/(time)", "(length)**2/(time)**2", "1".
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Dimensions& a, const Dimensions& b) noexcept {
        return a.exponents_ == b.exponents_;
    }
    friend bool operator!=(const Dimensions& a, const Dimensions& b) noexcept {
        return !(a == b);
    }

private:
    std::array<Rational, BASE_DIMENSION_COUNT> exponents_{};
};

/// Common compound dimensions.
namespace dimensions {
[[nodiscard]] Dimensions mass();
[[nodiscard]] Dimensions length();
[[nodiscard]] Dimensions time();
[[nodiscard]] Dimensions velocity();
[[nodiscard]] Dimensions specific_energy();
} // namespace dimensions

// ─── Unit ─────────────────────────────────────────────────────────────────────

/// A unit: a readable expression, its size in cgs, and its dimensions.
///
/// The size is held as mantissa · 2^exponent so that products and powers of
/// units (kpc**16, Msun**10) stay representable; it is only collapsed to a
/// double by `cgs_factor()` and `conversion_factor()`.
///
/// # Example
/// ```cpp
/// auto v = cosmotag::Unit::parse("km/s");
/// auto f = v.conversion_factor(cosmotag::Unit::parse("cm/s"));  // 1e5
/// ```
class Unit {
public:
    /// The dimensionless unit with factor 1.
    Unit();

    /// Assemble a unit directly. `expr` is only used for display.
    /// Throws `InvalidConstruction` unless `cgs_factor` is finite and positive.
    Unit(std::string expr, double cgs_factor, Dimensions dims);

    /// Parse a unit expression.
    ///
    /// Grammar: products and quotients of symbols, numbers and parenthesised
    /// sub-expressions, each optionally raised to a rational power with `**`
    /// (`**2`, `**-3`, `**(1/2)`). The empty string and "dimensionless" parse
    /// to the dimensionless unit.
    ///
    /// Throws `InvalidConstruction` for unknown symbols or malformed input.
    [[nodiscard]] static Unit parse(std::string_view expr);

    /// Is `symbol` a recognised unit symbol?
    [[nodiscard]] static bool is_known_symbol(std::string_view symbol) noexcept;

    [[nodiscard]] const std::string& expr() const noexcept { return expr_; }
    /// Size in cgs; `inf` or 0 when the size lies outside double range.
    [[nodiscard]] double cgs_factor() const noexcept;
    [[nodiscard]] const Dimensions& dimensions() const noexcept { return dims_; }
    [[nodiscard]] bool is_dimensionless() const noexcept { return dims_.is_dimensionless(); }

    /// Factor f such that value_in_this · f = value_in_`to`.
    /// Throws `UnitIncompatible` if the dimensions differ.
    [[nodiscard]] double conversion_factor(const Unit& to) const;

    [[nodiscard]] Unit multiply(const Unit& other) const;
    [[nodiscard]] Unit divide(const Unit& other) const;
    [[nodiscard]] Unit pow(const Rational& p) const;

    /// The same unit displayed as `expr`.
    [[nodiscard]] Unit renamed(std::string expr) const;

    /// Same dimensions and the same size (to FLOAT_EPSILON relative).
    friend bool operator==(const Unit& a, const Unit& b) noexcept;
    friend bool operator!=(const Unit& a, const Unit& b) noexcept { return !(a == b); }

private:
    Unit(std::string expr, double mantissa, std::int64_t exponent, Dimensions dims);

    std::string expr_;
    double mantissa_ = 0.5;       ///< in [0.5, 1)
    std::int64_t exponent_ = 1;   ///< size = mantissa_ · 2^exponent_
    Dimensions dims_;
};

// ─── UnitSystem ───────────────────────────────────────────────────────────────

/// A set of base units, one per base dimension.
class UnitSystem {
public:
    UnitSystem(std::string name,
               Unit mass,
               Unit length,
               Unit time,
               Unit temperature,
               Unit current);

    /// Centimetre–gram–second.
    [[nodiscard]] static UnitSystem cgs();

    /// Metre–kilogram–second.
    [[nodiscard]] static UnitSystem mks();

    /// Cosmological units: Mpc, 1e10 Msun, Gyr, K, A.
    [[nodiscard]] static UnitSystem cosmo();

    /// Look up a built-in system by name ("cgs", "mks", "cosmo").
    [[nodiscard]] static std::optional<UnitSystem> named(std::string_view name);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const Unit& base(BaseDimension dim) const noexcept {
        return base_[static_cast<std::size_t>(dim)];
    }

    /// The unit of this system with the given dimensions, e.g. Mpc/Gyr for a
    /// velocity in the cosmo system.
    [[nodiscard]] Unit unit_for(const Dimensions& dims) const;

private:
    std::string name_;
    std::array<Unit, BASE_DIMENSION_COUNT> base_;
};

} // namespace cosmotag
