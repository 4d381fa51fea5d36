#pragma once

/// @file include/cosmotag/scale_factor_exponent.hpp
/// @brief "This quantity scales as aⁿ": the cosmological tag of an array.
///
/// # Module: ScaleFactorExponent
///
/// ## Responsibility
/// Immutable pair (n, a₀): the rational exponent of the scale factor and the
/// scale factor at which the quantity was tagged. Converting a comoving value
/// to a physical one multiplies it by `a_factor() = a₀ⁿ`.
///
/// ## Guarantees
/// - Every combination returns a new instance; operands are never modified
/// - Additive combination demands identical exponent AND identical a₀
/// - Multiplicative combination demands identical a₀
/// - Mismatches raise `ScaleMismatch` carrying both operands; nothing is coerced
/// - Ordering and `==` compare the numeric `a_factor()`, not the exponent;
///   use `identical_to` for structural equality
///
/// # Example
/// ```cpp
/// cosmotag::ScaleFactorExponent density(cosmotag::Rational(-3), 0.5);
/// density.a_factor();   // 8.0
/// density.redshift();   // 1.0
/// ```

#include "cosmotag/errors.hpp"
#include "cosmotag/types.hpp"

#include <string>

namespace cosmotag {

class ScaleFactorExponent {
public:
    /// Throws `InvalidConstruction` unless `scale_factor` is finite and > 0.
    ScaleFactorExponent(Rational expr, double scale_factor);

    [[nodiscard]] const Rational& expr() const noexcept { return expr_; }
    [[nodiscard]] double scale_factor() const noexcept { return scale_factor_; }

    /// a₀ⁿ: the comoving → physical multiplier.
    [[nodiscard]] double a_factor() const noexcept;

    /// z = 1/a₀ − 1.
    [[nodiscard]] double redshift() const noexcept;

    // ── Algebra ──────────────────────────────────────────────────────────────

    /// Sum or difference of two tagged quantities: the tag is unchanged.
    /// Throws `ScaleMismatch` if the exponents or scale factors differ.
    [[nodiscard]] ScaleFactorExponent combine_additive(const ScaleFactorExponent& other) const;

    /// aᵐ · aⁿ = aᵐ⁺ⁿ. Throws `ScaleMismatch` if the scale factors differ.
    [[nodiscard]] ScaleFactorExponent combine_multiplicative(const ScaleFactorExponent& other) const;

    /// aᵐ / aⁿ = aᵐ⁻ⁿ. Throws `ScaleMismatch` if the scale factors differ.
    [[nodiscard]] ScaleFactorExponent divide(const ScaleFactorExponent& other) const;

    /// (aⁿ)ᵖ = aⁿᵖ.
    [[nodiscard]] ScaleFactorExponent raise_to_power(const Rational& p) const;

    /// −1, 0 or +1 by `a_factor()`.
    [[nodiscard]] int compare(const ScaleFactorExponent& other) const noexcept;

    /// Same exponent and same scale factor.
    [[nodiscard]] bool identical_to(const ScaleFactorExponent& other) const noexcept;

    /// "a**3 at a=0.5", "1/a at a=1", "1 at a=0.25".
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ScaleFactorExponent& a, const ScaleFactorExponent& b) noexcept {
        return a.compare(b) == 0;
    }
    friend bool operator!=(const ScaleFactorExponent& a, const ScaleFactorExponent& b) noexcept {
        return a.compare(b) != 0;
    }
    friend bool operator<(const ScaleFactorExponent& a, const ScaleFactorExponent& b) noexcept {
        return a.compare(b) < 0;
    }
    friend bool operator>(const ScaleFactorExponent& a, const ScaleFactorExponent& b) noexcept {
        return a.compare(b) > 0;
    }
    friend bool operator<=(const ScaleFactorExponent& a, const ScaleFactorExponent& b) noexcept {
        return a.compare(b) <= 0;
    }
    friend bool operator>=(const ScaleFactorExponent& a, const ScaleFactorExponent& b) noexcept {
        return a.compare(b) >= 0;
    }

private:
    Rational expr_;
    double scale_factor_;
};

/// Two exponents could not be combined. Carries both operands.
class ScaleMismatch : public CosmoError {
public:
    ScaleMismatch(const std::string& message,
                  ScaleFactorExponent lhs,
                  ScaleFactorExponent rhs);

    [[nodiscard]] const ScaleFactorExponent& lhs() const noexcept { return lhs_; }
    [[nodiscard]] const ScaleFactorExponent& rhs() const noexcept { return rhs_; }

private:
    ScaleFactorExponent lhs_;
    ScaleFactorExponent rhs_;
};

} // namespace cosmotag
