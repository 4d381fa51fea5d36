/// @file src/units/unit.cpp
/// @brief Dimensions, unit symbol table and the unit-expression parser.

#include "cosmotag/units.hpp"
#include "cosmotag/constants.hpp"
#include "cosmotag/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

namespace cosmotag {

// ─── Dimensions ───────────────────────────────────────────────────────────────

const char* to_string(BaseDimension dim) noexcept {
    switch (dim) {
    case BaseDimension::mass:        return "mass";
    case BaseDimension::length:      return "length";
    case BaseDimension::time:        return "time";
    case BaseDimension::temperature: return "temperature";
    case BaseDimension::current:     return "current";
    }
    return "unknown";
}

Dimensions Dimensions::of(BaseDimension dim) {
    Dimensions d;
    d.exponents_[static_cast<std::size_t>(dim)] = Rational(1);
    return d;
}

bool Dimensions::is_dimensionless() const noexcept {
    for (const auto& e : exponents_) {
        if (!e.is_zero()) return false;
    }
    return true;
}

Dimensions Dimensions::multiply(const Dimensions& other) const {
    Dimensions d;
    for (std::size_t i = 0; i < BASE_DIMENSION_COUNT; ++i) {
        d.exponents_[i] = exponents_[i] + other.exponents_[i];
    }
    return d;
}

Dimensions Dimensions::divide(const Dimensions& other) const {
    Dimensions d;
    for (std::size_t i = 0; i < BASE_DIMENSION_COUNT; ++i) {
        d.exponents_[i] = exponents_[i] - other.exponents_[i];
    }
    return d;
}

Dimensions Dimensions::pow(const Rational& p) const {
    Dimensions d;
    for (std::size_t i = 0; i < BASE_DIMENSION_COUNT; ++i) {
        d.exponents_[i] = exponents_[i] * p;
    }
    return d;
}

std::string Dimensions::to_string() const {
    std::string num;
    std::string den;
    for (std::size_t i = 0; i < BASE_DIMENSION_COUNT; ++i) {
        const Rational& e = exponents_[i];
        if (e.is_zero()) continue;

        const Rational mag = (e < Rational(0)) ? -e : e;
        std::string term = fmt::format("({})", cosmotag::to_string(static_cast<BaseDimension>(i)));
        if (mag != Rational(1)) {
            term += mag.is_integer() ? fmt::format("**{}", mag.to_string())
                                     : fmt::format("**({})", mag.to_string());
        }
        std::string& side = (e < Rational(0)) ? den : num;
        if (!side.empty()) side += "*";
        side += term;
    }
    if (num.empty() && den.empty()) return "1";
    if (num.empty()) num = "1";
    return den.empty() ? num : num + "/" + den;
}

namespace dimensions {

Dimensions mass()   { return Dimensions::of(BaseDimension::mass); }
Dimensions length() { return Dimensions::of(BaseDimension::length); }
Dimensions time()   { return Dimensions::of(BaseDimension::time); }

Dimensions velocity() {
    return length().divide(time());
}

Dimensions specific_energy() {
    return velocity().pow(Rational(2));
}

} // namespace dimensions

// ─── Symbol table ─────────────────────────────────────────────────────────────

namespace {

struct SymbolEntry {
    const char* symbol;
    double cgs_factor;
    Dimensions dims;
};

const std::vector<SymbolEntry>& symbol_table() {
    static const std::vector<SymbolEntry> table = [] {
        using namespace dimensions;
        const Dimensions L = length();
        const Dimensions M = mass();
        const Dimensions T = time();
        const Dimensions K = Dimensions::of(BaseDimension::temperature);
        const Dimensions I = Dimensions::of(BaseDimension::current);
        const Dimensions E = M.multiply(specific_energy());

        constexpr double PC = 3.0856775814913673e18;
        constexpr double YR = 3.15576e7;

        return std::vector<SymbolEntry>{
            {"dimensionless", 1.0, Dimensions{}},
            {"cm",   1.0,                     L},
            {"m",    1.0e2,                   L},
            {"km",   1.0e5,                   L},
            {"AU",   1.495978707e13,          L},
            {"pc",   PC,                      L},
            {"kpc",  PC * 1.0e3,              L},
            {"Mpc",  PC * 1.0e6,              L},
            {"g",    1.0,                     M},
            {"kg",   1.0e3,                   M},
            {"Msun", 1.98841586e33,           M},
            {"s",    1.0,                     T},
            {"yr",   YR,                      T},
            {"Myr",  YR * 1.0e6,              T},
            {"Gyr",  YR * 1.0e9,              T},
            {"K",    1.0,                     K},
            {"A",    1.0,                     I},
            {"erg",  1.0,                     E},
            {"J",    1.0e7,                   E},
        };
    }();
    return table;
}

const SymbolEntry* find_symbol(std::string_view symbol) noexcept {
    for (const auto& entry : symbol_table()) {
        if (symbol == entry.symbol) return &entry;
    }
    return nullptr;
}

bool needs_parens(const std::string& expr) {
    return expr.find_first_of("*/") != std::string::npos;
}

std::string parenthesise(const std::string& expr) {
    return needs_parens(expr) ? "(" + expr + ")" : expr;
}

// ─── Parser ───────────────────────────────────────────────────────────────────
//
//   expr   := term (('*' | '/') term)*
//   term   := factor ('**' power)?
//   factor := NUMBER | SYMBOL | '(' expr ')'
//   power  := SIGNED_RATIONAL | '(' SIGNED_RATIONAL ')'

class UnitParser {
public:
    explicit UnitParser(std::string_view text) : text_(text) {}

    Unit parse() {
        skip_ws();
        if (pos_ == text_.size()) {
            return Unit();
        }
        Unit u = parse_expr();
        skip_ws();
        if (pos_ != text_.size()) {
            fail("unexpected trailing characters");
        }
        return u.renamed(std::string(text_));
    }

private:
    Unit parse_expr() {
        Unit u = parse_term();
        for (;;) {
            skip_ws();
            if (peek_str("**")) {
                fail("misplaced '**'");
            }
            if (peek('*')) {
                ++pos_;
                u = u.multiply(parse_term());
            } else if (peek('/')) {
                ++pos_;
                u = u.divide(parse_term());
            } else {
                return u;
            }
        }
    }

    Unit parse_term() {
        Unit u = parse_factor();
        skip_ws();
        if (peek_str("**")) {
            pos_ += 2;
            u = u.pow(parse_power());
        }
        return u;
    }

    Unit parse_factor() {
        skip_ws();
        if (pos_ >= text_.size()) {
            fail("expected a unit symbol");
        }
        const char c = text_[pos_];
        if (c == '(') {
            ++pos_;
            Unit u = parse_expr();
            skip_ws();
            expect(')');
            return u;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            const double coeff = parse_number();
            return Unit(fmt::format("{}", coeff), coeff, Dimensions{});
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            const std::size_t start = pos_;
            while (pos_ < text_.size() &&
                   (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
                ++pos_;
            }
            const std::string_view symbol = text_.substr(start, pos_ - start);
            const SymbolEntry* entry = find_symbol(symbol);
            if (entry == nullptr) {
                throw InvalidConstruction(
                    fmt::format("unknown unit symbol '{}' in '{}'", symbol, text_));
            }
            return Unit(entry->symbol, entry->cgs_factor, entry->dims);
        }
        fail(fmt::format("unexpected character '{}'", c));
    }

    Rational parse_power() {
        skip_ws();
        const bool paren = peek('(');
        if (paren) ++pos_;
        skip_ws();

        bool negative = false;
        if (peek('-') || peek('+')) {
            negative = peek('-');
            ++pos_;
        }
        const std::int64_t num = parse_integer();
        std::int64_t den = 1;
        skip_ws();
        if (paren && peek('/')) {
            ++pos_;
            skip_ws();
            den = parse_integer();
        }
        if (paren) {
            skip_ws();
            expect(')');
        }
        if (den == 0) {
            fail("zero denominator in exponent");
        }
        return Rational(negative ? -num : num, den);
    }

    double parse_number() {
        const std::string rest(text_.substr(pos_));
        char* end = nullptr;
        const double v = std::strtod(rest.c_str(), &end);
        if (end == rest.c_str() || !std::isfinite(v)) {
            fail("malformed numeric coefficient");
        }
        pos_ += static_cast<std::size_t>(end - rest.c_str());
        return v;
    }

    std::int64_t parse_integer() {
        const std::size_t start = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (start == pos_ || pos_ - start > 12) {
            fail("malformed exponent");
        }
        return std::stoll(std::string(text_.substr(start, pos_ - start)));
    }

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool peek(char c) const noexcept {
        return pos_ < text_.size() && text_[pos_] == c;
    }

    bool peek_str(std::string_view s) const noexcept {
        return text_.substr(pos_, s.size()) == s;
    }

    void expect(char c) {
        if (!peek(c)) {
            fail(fmt::format("expected '{}'", c));
        }
        ++pos_;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw InvalidConstruction(
            fmt::format("cannot parse unit '{}': {} at position {}", text_, what, pos_));
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

// ─── Unit ─────────────────────────────────────────────────────────────────────

namespace {

/// Largest binary exponent a unit size may carry. Far beyond double range,
/// small enough that sums and differences of two exponents cannot overflow.
constexpr std::int64_t MAX_SCALE_EXPONENT = std::int64_t{1} << 50;

struct Scale {
    double mantissa;
    std::int64_t exponent;
};

Scale normalise(double mantissa, std::int64_t exponent, const std::string& expr) {
    int shift = 0;
    const double m = std::frexp(mantissa, &shift);
    if (!std::isfinite(m) || m <= 0.0) {
        throw InvalidConstruction(fmt::format("unit '{}' has a non-positive size", expr));
    }
    const std::int64_t e = exponent + shift;
    if (e > MAX_SCALE_EXPONENT || e < -MAX_SCALE_EXPONENT) {
        throw InvalidConstruction(fmt::format("unit '{}' has a size out of range", expr));
    }
    return Scale{m, e};
}

/// mantissa · 2^exponent as a double, saturating to inf or 0.
double materialise(double mantissa, std::int64_t exponent) noexcept {
    constexpr std::int64_t limit = 4096;
    const auto e = static_cast<int>(std::clamp(exponent, -limit, limit));
    return std::ldexp(mantissa, e);
}

} // anonymous namespace

Unit::Unit() : expr_("dimensionless"), dims_() {}

Unit::Unit(std::string expr, double cgs_factor, Dimensions dims)
    : expr_(std::move(expr)), dims_(dims) {
    if (!std::isfinite(cgs_factor) || cgs_factor <= 0.0) {
        throw InvalidConstruction(
            fmt::format("unit '{}' has a non-positive size {}", expr_, cgs_factor));
    }
    const Scale s = normalise(cgs_factor, 0, expr_);
    mantissa_ = s.mantissa;
    exponent_ = s.exponent;
}

Unit::Unit(std::string expr, double mantissa, std::int64_t exponent, Dimensions dims)
    : expr_(std::move(expr)), dims_(dims) {
    const Scale s = normalise(mantissa, exponent, expr_);
    mantissa_ = s.mantissa;
    exponent_ = s.exponent;
}

Unit Unit::parse(std::string_view expr) {
    if (expr == "dimensionless") {
        return Unit();
    }
    return UnitParser(expr).parse();
}

bool Unit::is_known_symbol(std::string_view symbol) noexcept {
    return find_symbol(symbol) != nullptr;
}

double Unit::cgs_factor() const noexcept {
    return materialise(mantissa_, exponent_);
}

double Unit::conversion_factor(const Unit& to) const {
    if (dims_ != to.dims_) {
        throw UnitIncompatible(fmt::format(
            "UnitIncompatible: cannot convert '{}' with dimensions {} to '{}' with dimensions {}",
            expr_, dims_.to_string(), to.expr_, to.dims_.to_string()));
    }
    return materialise(mantissa_ / to.mantissa_, exponent_ - to.exponent_);
}

Unit Unit::multiply(const Unit& other) const {
    const Dimensions d = dims_.multiply(other.dims_);
    const double m = mantissa_ * other.mantissa_;
    const std::int64_t e = exponent_ + other.exponent_;
    if (d.is_dimensionless() && std::abs(materialise(m, e) - 1.0) <= constants::FLOAT_EPSILON) {
        return Unit();
    }
    if (*this == Unit()) return Unit(other.expr_, m, e, d);
    if (other == Unit()) return Unit(expr_, m, e, d);
    return Unit(fmt::format("{}*{}", expr_, parenthesise(other.expr_)), m, e, d);
}

Unit Unit::divide(const Unit& other) const {
    const Dimensions d = dims_.divide(other.dims_);
    const double m = mantissa_ / other.mantissa_;
    const std::int64_t e = exponent_ - other.exponent_;
    if (d.is_dimensionless() && std::abs(materialise(m, e) - 1.0) <= constants::FLOAT_EPSILON) {
        return Unit();
    }
    if (other == Unit()) return Unit(expr_, m, e, d);
    const std::string lhs = (*this == Unit()) ? std::string("1") : expr_;
    return Unit(fmt::format("{}/{}", lhs, parenthesise(other.expr_)), m, e, d);
}

Unit Unit::pow(const Rational& p) const {
    if (p.is_zero() || *this == Unit()) {
        return Unit();
    }
    if (p == Rational(1)) {
        return *this;
    }
    const std::string power = p.is_integer() ? p.to_string() : "(" + p.to_string() + ")";
    const std::string expr = fmt::format("{}**{}", parenthesise(expr_), power);

    // Small integer powers stay exact to double rounding: 0.5^512 and
    // 2^512 are both representable.
    constexpr std::int64_t EXACT_POWER_LIMIT = 512;
    const std::int64_t n = p.numerator();
    if (p.is_integer() && n >= -EXACT_POWER_LIMIT && n <= EXACT_POWER_LIMIT) {
        return Unit(expr, std::pow(mantissa_, static_cast<double>(n)), exponent_ * n, dims_.pow(p));
    }

    // Otherwise split log2(size) · p into integer and fractional parts.
    const double log2_size = p.to_double() * (std::log2(mantissa_) + static_cast<double>(exponent_));
    if (!std::isfinite(log2_size) || std::abs(log2_size) > static_cast<double>(MAX_SCALE_EXPONENT)) {
        throw InvalidConstruction(fmt::format("unit '{}' has a size out of range", expr));
    }
    const double whole = std::floor(log2_size);
    return Unit(expr, std::exp2(log2_size - whole), static_cast<std::int64_t>(whole), dims_.pow(p));
}

Unit Unit::renamed(std::string expr) const {
    Unit u = *this;
    u.expr_ = std::move(expr);
    return u;
}

bool operator==(const Unit& a, const Unit& b) noexcept {
    if (a.dims_ != b.dims_) return false;
    const double ratio = materialise(a.mantissa_ / b.mantissa_, a.exponent_ - b.exponent_);
    return std::abs(ratio - 1.0) <= constants::FLOAT_EPSILON;
}

} // namespace cosmotag
