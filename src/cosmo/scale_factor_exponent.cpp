/// @file src/cosmo/scale_factor_exponent.cpp
/// @brief Scale-factor exponent algebra.

#include "cosmotag/scale_factor_exponent.hpp"

#include <fmt/format.h>

#include <cmath>

namespace cosmotag {

namespace {

void require_same_scale_factor(const char* verb,
                               const ScaleFactorExponent& a,
                               const ScaleFactorExponent& b) {
    if (a.scale_factor() != b.scale_factor()) {
        throw ScaleMismatch(
            fmt::format("Attempting to {} two cosmo factors with different scale factors {} and {}",
                        verb, a.scale_factor(), b.scale_factor()),
            a, b);
    }
}

std::string exponent_string(const Rational& n) {
    if (n.is_zero()) return "1";
    if (n == Rational(1)) return "a";
    if (n == Rational(-1)) return "1/a";
    if (n.is_integer() && n.numerator() > 0) return fmt::format("a**{}", n.numerator());
    return fmt::format("a**({})", n.to_string());
}

} // anonymous namespace

ScaleFactorExponent::ScaleFactorExponent(Rational expr, double scale_factor)
    : expr_(expr), scale_factor_(scale_factor) {
    if (!std::isfinite(scale_factor) || scale_factor <= 0.0) {
        throw InvalidConstruction(
            fmt::format("scale factor must be finite and positive, got {}", scale_factor));
    }
}

double ScaleFactorExponent::a_factor() const noexcept {
    if (expr_.is_zero()) return 1.0;
    if (expr_.is_integer()) {
        return std::pow(scale_factor_, static_cast<double>(expr_.numerator()));
    }
    return std::pow(scale_factor_, expr_.to_double());
}

double ScaleFactorExponent::redshift() const noexcept {
    return 1.0 / scale_factor_ - 1.0;
}

// ─── Algebra ──────────────────────────────────────────────────────────────────

ScaleFactorExponent
ScaleFactorExponent::combine_additive(const ScaleFactorExponent& other) const {
    require_same_scale_factor("add", *this, other);
    if (expr_ != other.expr_) {
        throw ScaleMismatch(
            fmt::format("Attempting to add two cosmo factors with different scale factor "
                        "dependence, {} and {}",
                        exponent_string(expr_), exponent_string(other.expr_)),
            *this, other);
    }
    return *this;
}

ScaleFactorExponent
ScaleFactorExponent::combine_multiplicative(const ScaleFactorExponent& other) const {
    require_same_scale_factor("multiply", *this, other);
    return ScaleFactorExponent(expr_ + other.expr_, scale_factor_);
}

ScaleFactorExponent ScaleFactorExponent::divide(const ScaleFactorExponent& other) const {
    require_same_scale_factor("divide", *this, other);
    return ScaleFactorExponent(expr_ - other.expr_, scale_factor_);
}

ScaleFactorExponent ScaleFactorExponent::raise_to_power(const Rational& p) const {
    return ScaleFactorExponent(expr_ * p, scale_factor_);
}

int ScaleFactorExponent::compare(const ScaleFactorExponent& other) const noexcept {
    const double a = a_factor();
    const double b = other.a_factor();
    if (a < b) return -1;
    if (a > b) return 1;
    return 0;
}

bool ScaleFactorExponent::identical_to(const ScaleFactorExponent& other) const noexcept {
    return expr_ == other.expr_ && scale_factor_ == other.scale_factor_;
}

std::string ScaleFactorExponent::to_string() const {
    return fmt::format("{} at a={}", exponent_string(expr_), scale_factor_);
}

// ─── ScaleMismatch ────────────────────────────────────────────────────────────

ScaleMismatch::ScaleMismatch(const std::string& message,
                             ScaleFactorExponent lhs,
                             ScaleFactorExponent rhs)
    : CosmoError("ScaleMismatch: " + message), lhs_(lhs), rhs_(rhs) {}

} // namespace cosmotag
