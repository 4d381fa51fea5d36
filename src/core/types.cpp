/// @file src/core/types.cpp
/// @brief Rational arithmetic and dtype names.

#include "cosmotag/types.hpp"
#include "cosmotag/constants.hpp"
#include "cosmotag/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <numeric>

namespace cosmotag {

// ─── Dtype ────────────────────────────────────────────────────────────────────

const char* to_string(Dtype dtype) noexcept {
    switch (dtype) {
    case Dtype::float64: return "float64";
    case Dtype::float32: return "float32";
    case Dtype::boolean: return "bool";
    }
    return "unknown";
}

std::optional<Dtype> dtype_from_string(const std::string& name) noexcept {
    if (name == "float64" || name == "f8" || name == "double") return Dtype::float64;
    if (name == "float32" || name == "f4" || name == "float")  return Dtype::float32;
    if (name == "bool" || name == "boolean")                    return Dtype::boolean;
    return std::nullopt;
}

// ─── Rational ─────────────────────────────────────────────────────────────────

Rational::Rational(std::int64_t num, std::int64_t den) {
    if (den == 0) {
        throw InvalidConstruction(
            fmt::format("rational exponent {}/0 has a zero denominator", num));
    }
    constexpr auto lowest = std::numeric_limits<std::int64_t>::min();
    if (num == lowest || den == lowest) {
        throw InvalidConstruction("rational exponent is out of range");
    }
    if (den < 0) {
        num = -num;
        den = -den;
    }
    const std::int64_t g = std::gcd(num, den);
    num_ = num / g;
    den_ = den / g;
}

std::optional<Rational> Rational::from_double(double x) noexcept {
    // Beyond 2^53 every double is an integer and may not fit in int64.
    if (!std::isfinite(x) || std::abs(x) > constants::MAX_EXACT_INTEGER) {
        return std::nullopt;
    }

    // Continued-fraction expansion; stop at the first convergent within
    // tolerance. h/k are the running convergents.
    std::int64_t h_prev = 1, h = static_cast<std::int64_t>(std::floor(x));
    std::int64_t k_prev = 0, k = 1;
    double frac = x - std::floor(x);

    for (int iter = 0; iter < 64; ++iter) {
        if (std::abs(static_cast<double>(h) / static_cast<double>(k) - x)
                <= constants::RATIONAL_TOLERANCE) {
            return Rational(h, k);
        }
        if (frac < 1e-15) {
            break;
        }
        const double inv = 1.0 / frac;
        const auto a = static_cast<std::int64_t>(std::floor(inv));
        frac = inv - std::floor(inv);

        const std::int64_t h_next = a * h + h_prev;
        const std::int64_t k_next = a * k + k_prev;
        if (k_next > constants::RATIONAL_MAX_DENOMINATOR) {
            break;
        }
        h_prev = h; h = h_next;
        k_prev = k; k = k_next;
    }
    return std::nullopt;
}

std::string Rational::to_string() const {
    if (den_ == 1) {
        return fmt::format("{}", num_);
    }
    return fmt::format("{}/{}", num_, den_);
}

Rational Rational::operator-() const {
    return Rational(-num_, den_);
}

namespace {

std::int64_t checked_mul(std::int64_t a, std::int64_t b) {
    std::int64_t r = 0;
    if (__builtin_mul_overflow(a, b, &r)) {
        throw InvalidConstruction(fmt::format("rational exponent overflow in {} * {}", a, b));
    }
    return r;
}

std::int64_t checked_add(std::int64_t a, std::int64_t b) {
    std::int64_t r = 0;
    if (__builtin_add_overflow(a, b, &r)) {
        throw InvalidConstruction(fmt::format("rational exponent overflow in {} + {}", a, b));
    }
    return r;
}

/// n1/d1 < n2/d2 for positive denominators, by continued-fraction
/// expansion so that no intermediate product is formed.
bool fraction_less(std::int64_t n1, std::int64_t d1, std::int64_t n2, std::int64_t d2) noexcept {
    for (;;) {
        std::int64_t q1 = n1 / d1, r1 = n1 % d1;
        std::int64_t q2 = n2 / d2, r2 = n2 % d2;
        if (r1 < 0) { --q1; r1 += d1; }
        if (r2 < 0) { --q2; r2 += d2; }
        if (q1 != q2) return q1 < q2;
        if (r1 == 0 || r2 == 0) return r1 == 0 && r2 != 0;
        // r1/d1 < r2/d2  ⇔  d2/r2 < d1/r1
        const std::int64_t next_n1 = d2, next_d1 = r2;
        const std::int64_t next_n2 = d1, next_d2 = r1;
        n1 = next_n1; d1 = next_d1;
        n2 = next_n2; d2 = next_d2;
    }
}

} // anonymous namespace

Rational operator+(const Rational& a, const Rational& b) {
    return Rational(checked_add(checked_mul(a.num_, b.den_), checked_mul(b.num_, a.den_)),
                    checked_mul(a.den_, b.den_));
}

Rational operator-(const Rational& a, const Rational& b) {
    return a + (-b);
}

Rational operator*(const Rational& a, const Rational& b) {
    // Cross-cancel first so that results which fit are never rejected.
    const std::int64_t g1 = std::gcd(a.num_, b.den_);
    const std::int64_t g2 = std::gcd(b.num_, a.den_);
    return Rational(checked_mul(a.num_ / g1, b.num_ / g2),
                    checked_mul(a.den_ / g2, b.den_ / g1));
}

Rational operator/(const Rational& a, const Rational& b) {
    if (b.is_zero()) {
        throw InvalidConstruction(fmt::format("division of {} by a zero exponent", a.to_string()));
    }
    return a * Rational(b.den_, b.num_);
}

bool operator<(const Rational& a, const Rational& b) noexcept {
    return fraction_less(a.num_, a.den_, b.num_, b.den_);
}

} // namespace cosmotag
