/// @file src/units/kernels.cpp
/// @brief Values, units and dtypes of every elementwise operation.

#include "cosmotag/kernels.hpp"
#include "cosmotag/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <string>
#include <vector>

namespace cosmotag::kernels {

namespace {

// ─── Helpers ──────────────────────────────────────────────────────────────────

std::string shape_string(const Shape& shape) {
    switch (shape.size()) {
    case 0:  return "()";
    case 1:  return fmt::format("({},)", shape[0]);
    default: return fmt::format("({}, {})", shape[0], shape[1]);
    }
}

/// Both operands expanded to a common shape.
struct Broadcast {
    Buffer a;
    Buffer b;
    int ndim;
};

Broadcast broadcast(const Quantity& x, const Quantity& y) {
    const Buffer& xv = x.value();
    const Buffer& yv = y.value();
    if (x.shape() == y.shape()) {
        return {xv, yv, x.ndim()};
    }
    if (yv.size() == 1 && (xv.size() != 1 || x.ndim() >= y.ndim())) {
        return {xv, Buffer::Constant(xv.rows(), xv.cols(), yv(0, 0)), x.ndim()};
    }
    if (xv.size() == 1) {
        return {Buffer::Constant(yv.rows(), yv.cols(), xv(0, 0)), yv, y.ndim()};
    }
    throw ShapeMismatch(fmt::format(
        "operands could not be broadcast together with shapes {} {}",
        shape_string(x.shape()), shape_string(y.shape())));
}

/// Float dtype a unary arithmetic result keeps.
Dtype float_dtype(Dtype d) noexcept {
    return d == Dtype::float32 ? Dtype::float32 : Dtype::float64;
}

/// x expressed in the plain dimensionless unit, or `UnitIncompatible`.
Quantity require_dimensionless(Ufunc op, const Quantity& x) {
    if (!x.units().is_dimensionless()) {
        throw UnitIncompatible(fmt::format(
            "{} requires a dimensionless argument, got '{}'", ufunc_name(op), x.units().expr()));
    }
    return x.in_units(Unit());
}

template <typename F>
Quantity map_unary(const Quantity& x, const Unit& units, Dtype dtype, F f) {
    Buffer out = x.value().unaryExpr([&f](double v) { return f(v); });
    return Quantity(std::move(out), x.ndim(), units, dtype);
}

template <typename F>
Quantity map_binary(const Quantity& x, const Quantity& y, const Unit& units, Dtype dtype, F f) {
    Broadcast bc = broadcast(x, y);
    Buffer out = bc.a.binaryExpr(bc.b, [&f](double a, double b) { return f(a, b); });
    return Quantity(std::move(out), bc.ndim, units, dtype);
}

double python_mod(double a, double b) noexcept {
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0.0) != (b < 0.0))) {
        r += b;
    }
    return r;
}

double heaviside(double x, double h0) noexcept {
    if (std::isnan(x)) return x;
    if (x < 0.0) return 0.0;
    if (x > 0.0) return 1.0;
    return h0;
}

double logaddexp(double a, double b) noexcept {
    if (a == b) return a + std::numbers::ln2;
    const double hi = std::max(a, b);
    return hi + std::log1p(std::exp(-std::abs(a - b)));
}

double logaddexp2(double a, double b) noexcept {
    if (a == b) return a + 1.0;
    const double hi = std::max(a, b);
    return hi + std::log2(1.0 + std::exp2(-std::abs(a - b)));
}

double nan_max(double a, double b) noexcept {
    if (std::isnan(a) || std::isnan(b)) return std::numeric_limits<double>::quiet_NaN();
    return std::max(a, b);
}

double nan_min(double a, double b) noexcept {
    if (std::isnan(a) || std::isnan(b)) return std::numeric_limits<double>::quiet_NaN();
    return std::min(a, b);
}

double truth(bool b) noexcept { return b ? 1.0 : 0.0; }

// ─── Binary families ──────────────────────────────────────────────────────────

Quantity power(const Quantity& x, const Quantity& y) {
    const Quantity e = require_dimensionless(Ufunc::power, y);
    const Dtype dtype = promote(x.dtype(), y.dtype());

    if (x.units().is_dimensionless()) {
        const Quantity base = x.in_units(Unit());
        return map_binary(base, e, Unit(), dtype,
                          [](double a, double b) { return std::pow(a, b); });
    }

    // A dimensioned base needs one rational exponent for the whole array.
    const Buffer& ev = e.value();
    if (ev.size() == 0) {
        throw UnitIncompatible("power of a dimensioned quantity needs an exponent");
    }
    const double p = ev(0, 0);
    for (Eigen::Index i = 0; i < ev.size(); ++i) {
        if (ev.data()[i] != p) {
            throw UnitIncompatible(fmt::format(
                "power of '{}' requires a single exponent for every element",
                x.units().expr()));
        }
    }
    const auto rational = Rational::from_double(p);
    if (!rational) {
        throw UnitIncompatible(fmt::format(
            "exponent {} of '{}' is not a rational number", p, x.units().expr()));
    }
    return map_binary(x, e, x.units().pow(*rational), dtype,
                      [p](double a, double) { return std::pow(a, p); });
}

Quantity matmul(const Quantity& x, const Quantity& y) {
    if (x.ndim() == 0 || y.ndim() == 0) {
        throw ShapeMismatch("matmul: input operand does not have enough dimensions");
    }
    const Unit units = x.units().multiply(y.units());
    const Dtype dtype = promote(x.dtype(), y.dtype());
    const auto a = x.value().matrix();
    const auto b = y.value().matrix();

    // 1-D operands are stored as columns; a leading 1-D operand acts as a row.
    const Eigen::Index inner_x = (x.ndim() == 1) ? a.rows() : a.cols();
    if (inner_x != b.rows()) {
        throw ShapeMismatch(fmt::format(
            "matmul: mismatch in core dimension ({} is different from {})",
            inner_x, b.rows()));
    }

    if (x.ndim() == 1 && y.ndim() == 1) {
        return Quantity::scalar(a.col(0).dot(b.col(0)), units, dtype);
    }
    if (x.ndim() == 1) {
        Buffer out = (a.transpose() * b).transpose().array();
        return Quantity(std::move(out), 1, units, dtype);
    }
    Buffer out = (a * b).array();
    return Quantity(std::move(out), y.ndim(), units, dtype);
}

/// Additive, extremum and comparison operations: y is expressed in x's units.
Quantity same_units(Ufunc op, const Quantity& x, const Quantity& y) {
    const Quantity yc = y.in_units(x.units());
    const Dtype dtype = promote(x.dtype(), y.dtype());
    const Unit& u = x.units();

    switch (op) {
    case Ufunc::add:
        return map_binary(x, yc, u, dtype, [](double a, double b) { return a + b; });
    case Ufunc::subtract:
        return map_binary(x, yc, u, dtype, [](double a, double b) { return a - b; });
    case Ufunc::remainder:
    case Ufunc::mod:
        return map_binary(x, yc, u, dtype, python_mod);
    case Ufunc::fmod:
        return map_binary(x, yc, u, dtype, [](double a, double b) { return std::fmod(a, b); });
    case Ufunc::hypot:
        return map_binary(x, yc, u, dtype, [](double a, double b) { return std::hypot(a, b); });
    case Ufunc::maximum:
        return map_binary(x, yc, u, dtype, nan_max);
    case Ufunc::minimum:
        return map_binary(x, yc, u, dtype, nan_min);
    case Ufunc::fmax:
        return map_binary(x, yc, u, dtype, [](double a, double b) { return std::fmax(a, b); });
    case Ufunc::fmin:
        return map_binary(x, yc, u, dtype, [](double a, double b) { return std::fmin(a, b); });
    case Ufunc::nextafter:
        return map_binary(x, yc, u, dtype,
                          [](double a, double b) { return std::nextafter(a, b); });
    case Ufunc::arctan2:
        return map_binary(x, yc, Unit(), promote(dtype, Dtype::float64),
                          [](double a, double b) { return std::atan2(a, b); });
    case Ufunc::greater:
        return map_binary(x, yc, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth(a > b); });
    case Ufunc::greater_equal:
        return map_binary(x, yc, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth(a >= b); });
    case Ufunc::less:
        return map_binary(x, yc, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth(a < b); });
    case Ufunc::less_equal:
        return map_binary(x, yc, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth(a <= b); });
    case Ufunc::not_equal:
        return map_binary(x, yc, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth(a != b); });
    case Ufunc::equal:
        return map_binary(x, yc, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth(a == b); });
    default:
        throw DispatchUnsupported(op, "not a same-unit binary operation");
    }
}

// ─── Reductions ───────────────────────────────────────────────────────────────

int normalise_axis(int axis, int ndim) {
    const int a = (axis < 0) ? axis + ndim : axis;
    if (a < 0 || a >= ndim) {
        throw InvalidConstruction(fmt::format(
            "axis {} is out of bounds for a quantity of dimension {}", axis, ndim));
    }
    return a;
}

double fold(Ufunc op, const std::vector<double>& xs) {
    switch (op) {
    case Ufunc::add: {
        double acc = 0.0;
        for (double v : xs) acc += v;
        return acc;
    }
    case Ufunc::multiply: {
        double acc = 1.0;
        for (double v : xs) acc *= v;
        return acc;
    }
    case Ufunc::logical_and: {
        for (double v : xs) if (v == 0.0) return 0.0;
        return 1.0;
    }
    case Ufunc::logical_or: {
        for (double v : xs) if (v != 0.0) return 1.0;
        return 0.0;
    }
    case Ufunc::maximum:
    case Ufunc::minimum:
    case Ufunc::fmax:
    case Ufunc::fmin: {
        if (xs.empty()) {
            throw InvalidConstruction(fmt::format(
                "zero-size array to reduction operation {} which has no identity",
                ufunc_name(op)));
        }
        double acc = xs.front();
        for (std::size_t i = 1; i < xs.size(); ++i) {
            switch (op) {
            case Ufunc::maximum: acc = nan_max(acc, xs[i]); break;
            case Ufunc::minimum: acc = nan_min(acc, xs[i]); break;
            case Ufunc::fmax:    acc = std::fmax(acc, xs[i]); break;
            default:             acc = std::fmin(acc, xs[i]); break;
            }
        }
        return acc;
    }
    default:
        throw DispatchUnsupported(op, "operation has no reduction");
    }
}

} // anonymous namespace

// ─── Public API ───────────────────────────────────────────────────────────────

Dtype promote(Dtype a, Dtype b) noexcept {
    if (a == Dtype::float64 || b == Dtype::float64) return Dtype::float64;
    if (a == Dtype::float32 || b == Dtype::float32) return Dtype::float32;
    return Dtype::float64;
}

Quantity unary(Ufunc op, const Quantity& x) {
    const Dtype fd = float_dtype(x.dtype());
    const Unit& u = x.units();

    switch (op) {
    // Unit-preserving.
    case Ufunc::negative:
        return map_unary(x, u, fd, [](double v) { return -v; });
    case Ufunc::positive:
    case Ufunc::conj:
        return map_unary(x, u, fd, [](double v) { return v; });
    case Ufunc::absolute:
    case Ufunc::fabs:
        return map_unary(x, u, fd, [](double v) { return std::fabs(v); });
    case Ufunc::rint:
        return map_unary(x, u, fd, [](double v) { return std::nearbyint(v); });
    case Ufunc::floor:
        return map_unary(x, u, fd, [](double v) { return std::floor(v); });
    case Ufunc::ceil:
        return map_unary(x, u, fd, [](double v) { return std::ceil(v); });
    case Ufunc::trunc:
        return map_unary(x, u, fd, [](double v) { return std::trunc(v); });
    case Ufunc::spacing:
        return map_unary(x, u, fd, [](double v) {
            return std::nextafter(v, std::copysign(std::numeric_limits<double>::infinity(), v)) - v;
        });
    case Ufunc::ones_like:
        return x.ones_like();

    // Unit-transforming.
    case Ufunc::sign:
        return map_unary(x, Unit(), fd, [](double v) {
            if (std::isnan(v)) return v;
            return (v > 0.0) ? 1.0 : (v < 0.0 ? -1.0 : 0.0);
        });
    case Ufunc::sqrt:
        return map_unary(x, u.pow(Rational(1, 2)), fd, [](double v) { return std::sqrt(v); });
    case Ufunc::square:
        return map_unary(x, u.pow(Rational(2)), fd, [](double v) { return v * v; });
    case Ufunc::reciprocal:
        return map_unary(x, Unit().divide(u), fd, [](double v) { return 1.0 / v; });

    // Dimensionless in, dimensionless out.
    case Ufunc::exp:
    case Ufunc::exp2:
    case Ufunc::log:
    case Ufunc::log2:
    case Ufunc::log10:
    case Ufunc::expm1:
    case Ufunc::log1p:
    case Ufunc::sin:
    case Ufunc::cos:
    case Ufunc::tan:
    case Ufunc::arcsin:
    case Ufunc::arccos:
    case Ufunc::arctan:
    case Ufunc::sinh:
    case Ufunc::cosh:
    case Ufunc::tanh:
    case Ufunc::arcsinh:
    case Ufunc::arccosh:
    case Ufunc::arctanh:
    case Ufunc::deg2rad:
    case Ufunc::rad2deg: {
        const Quantity d = require_dimensionless(op, x);
        double (*f)(double) = nullptr;
        switch (op) {
        case Ufunc::exp:     f = [](double v) { return std::exp(v); }; break;
        case Ufunc::exp2:    f = [](double v) { return std::exp2(v); }; break;
        case Ufunc::log:     f = [](double v) { return std::log(v); }; break;
        case Ufunc::log2:    f = [](double v) { return std::log2(v); }; break;
        case Ufunc::log10:   f = [](double v) { return std::log10(v); }; break;
        case Ufunc::expm1:   f = [](double v) { return std::expm1(v); }; break;
        case Ufunc::log1p:   f = [](double v) { return std::log1p(v); }; break;
        case Ufunc::sin:     f = [](double v) { return std::sin(v); }; break;
        case Ufunc::cos:     f = [](double v) { return std::cos(v); }; break;
        case Ufunc::tan:     f = [](double v) { return std::tan(v); }; break;
        case Ufunc::arcsin:  f = [](double v) { return std::asin(v); }; break;
        case Ufunc::arccos:  f = [](double v) { return std::acos(v); }; break;
        case Ufunc::arctan:  f = [](double v) { return std::atan(v); }; break;
        case Ufunc::sinh:    f = [](double v) { return std::sinh(v); }; break;
        case Ufunc::cosh:    f = [](double v) { return std::cosh(v); }; break;
        case Ufunc::tanh:    f = [](double v) { return std::tanh(v); }; break;
        case Ufunc::arcsinh: f = [](double v) { return std::asinh(v); }; break;
        case Ufunc::arccosh: f = [](double v) { return std::acosh(v); }; break;
        case Ufunc::arctanh: f = [](double v) { return std::atanh(v); }; break;
        case Ufunc::deg2rad: f = [](double v) { return v * std::numbers::pi / 180.0; }; break;
        default:             f = [](double v) { return v * 180.0 / std::numbers::pi; }; break;
        }
        return map_unary(d, Unit(), fd, f);
    }

    // Boolean predicates.
    case Ufunc::logical_not:
        return map_unary(x, Unit(), Dtype::boolean, [](double v) { return truth(v == 0.0); });
    case Ufunc::isreal:
        return map_unary(x, Unit(), Dtype::boolean, [](double) { return 1.0; });
    case Ufunc::iscomplex:
    case Ufunc::isnat:
        return map_unary(x, Unit(), Dtype::boolean, [](double) { return 0.0; });
    case Ufunc::isfinite:
        return map_unary(x, Unit(), Dtype::boolean, [](double v) { return truth(std::isfinite(v)); });
    case Ufunc::isinf:
        return map_unary(x, Unit(), Dtype::boolean, [](double v) { return truth(std::isinf(v)); });
    case Ufunc::isnan:
        return map_unary(x, Unit(), Dtype::boolean, [](double v) { return truth(std::isnan(v)); });
    case Ufunc::signbit:
        return map_unary(x, Unit(), Dtype::boolean, [](double v) { return truth(std::signbit(v)); });

    case Ufunc::modf:
    case Ufunc::frexp:
        throw DispatchUnsupported(op, "operation has two outputs");

    case Ufunc::add:
    case Ufunc::subtract:
    case Ufunc::multiply:
    case Ufunc::divide:
    case Ufunc::true_divide:
    case Ufunc::floor_divide:
    case Ufunc::power:
    case Ufunc::remainder:
    case Ufunc::mod:
    case Ufunc::fmod:
    case Ufunc::divmod:
    case Ufunc::heaviside:
    case Ufunc::matmul:
    case Ufunc::logaddexp:
    case Ufunc::logaddexp2:
    case Ufunc::arctan2:
    case Ufunc::hypot:
    case Ufunc::greater:
    case Ufunc::greater_equal:
    case Ufunc::less:
    case Ufunc::less_equal:
    case Ufunc::not_equal:
    case Ufunc::equal:
    case Ufunc::logical_and:
    case Ufunc::logical_or:
    case Ufunc::logical_xor:
    case Ufunc::maximum:
    case Ufunc::minimum:
    case Ufunc::fmax:
    case Ufunc::fmin:
    case Ufunc::copysign:
    case Ufunc::nextafter:
    case Ufunc::clip:
        break;
    }
    throw DispatchUnsupported(op, "not a unary operation");
}

Quantity binary(Ufunc op, const Quantity& x, const Quantity& y) {
    const Dtype dtype = promote(x.dtype(), y.dtype());

    switch (op) {
    case Ufunc::add:
    case Ufunc::subtract:
    case Ufunc::remainder:
    case Ufunc::mod:
    case Ufunc::fmod:
    case Ufunc::hypot:
    case Ufunc::maximum:
    case Ufunc::minimum:
    case Ufunc::fmax:
    case Ufunc::fmin:
    case Ufunc::nextafter:
    case Ufunc::arctan2:
    case Ufunc::greater:
    case Ufunc::greater_equal:
    case Ufunc::less:
    case Ufunc::less_equal:
    case Ufunc::not_equal:
    case Ufunc::equal:
        return same_units(op, x, y);

    case Ufunc::multiply:
        return map_binary(x, y, x.units().multiply(y.units()), dtype,
                          [](double a, double b) { return a * b; });
    case Ufunc::divide:
    case Ufunc::true_divide:
        return map_binary(x, y, x.units().divide(y.units()), dtype,
                          [](double a, double b) { return a / b; });
    case Ufunc::floor_divide:
        return map_binary(x, y, x.units().divide(y.units()), dtype,
                          [](double a, double b) { return std::floor(a / b); });
    case Ufunc::power:
        return power(x, y);
    case Ufunc::matmul:
        return matmul(x, y);

    case Ufunc::heaviside: {
        const Quantity h0 = require_dimensionless(op, y);
        return map_binary(x, h0, Unit(), dtype, heaviside);
    }
    case Ufunc::logaddexp:
        return map_binary(require_dimensionless(op, x), require_dimensionless(op, y),
                          Unit(), dtype, logaddexp);
    case Ufunc::logaddexp2:
        return map_binary(require_dimensionless(op, x), require_dimensionless(op, y),
                          Unit(), dtype, logaddexp2);
    case Ufunc::copysign:
        return map_binary(x, y, x.units(), dtype,
                          [](double a, double b) { return std::copysign(a, b); });

    case Ufunc::logical_and:
        return map_binary(x, y, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth(a != 0.0 && b != 0.0); });
    case Ufunc::logical_or:
        return map_binary(x, y, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth(a != 0.0 || b != 0.0); });
    case Ufunc::logical_xor:
        return map_binary(x, y, Unit(), Dtype::boolean,
                          [](double a, double b) { return truth((a != 0.0) != (b != 0.0)); });

    case Ufunc::divmod:
        throw DispatchUnsupported(op, "operation has two outputs");

    case Ufunc::negative:
    case Ufunc::positive:
    case Ufunc::absolute:
    case Ufunc::fabs:
    case Ufunc::rint:
    case Ufunc::sign:
    case Ufunc::conj:
    case Ufunc::exp:
    case Ufunc::exp2:
    case Ufunc::log:
    case Ufunc::log2:
    case Ufunc::log10:
    case Ufunc::expm1:
    case Ufunc::log1p:
    case Ufunc::sqrt:
    case Ufunc::square:
    case Ufunc::reciprocal:
    case Ufunc::sin:
    case Ufunc::cos:
    case Ufunc::tan:
    case Ufunc::arcsin:
    case Ufunc::arccos:
    case Ufunc::arctan:
    case Ufunc::sinh:
    case Ufunc::cosh:
    case Ufunc::tanh:
    case Ufunc::arcsinh:
    case Ufunc::arccosh:
    case Ufunc::arctanh:
    case Ufunc::deg2rad:
    case Ufunc::rad2deg:
    case Ufunc::logical_not:
    case Ufunc::isreal:
    case Ufunc::iscomplex:
    case Ufunc::isfinite:
    case Ufunc::isinf:
    case Ufunc::isnan:
    case Ufunc::isnat:
    case Ufunc::signbit:
    case Ufunc::spacing:
    case Ufunc::modf:
    case Ufunc::frexp:
    case Ufunc::floor:
    case Ufunc::ceil:
    case Ufunc::trunc:
    case Ufunc::ones_like:
    case Ufunc::clip:
        break;
    }
    throw DispatchUnsupported(op, "not a binary operation");
}

std::pair<Quantity, Quantity> unary_pair(Ufunc op, const Quantity& x) {
    const Dtype fd = float_dtype(x.dtype());
    if (op == Ufunc::modf) {
        Buffer frac = x.value().unaryExpr([](double v) {
            double ip = 0.0;
            return std::modf(v, &ip);
        });
        Buffer whole = x.value().unaryExpr([](double v) { return std::trunc(v); });
        return {Quantity(std::move(frac), x.ndim(), x.units(), fd),
                Quantity(std::move(whole), x.ndim(), x.units(), fd)};
    }
    if (op == Ufunc::frexp) {
        const Quantity d = require_dimensionless(op, x);
        Buffer mantissa = d.value().unaryExpr([](double v) {
            int e = 0;
            return std::frexp(v, &e);
        });
        Buffer exponent = d.value().unaryExpr([](double v) {
            int e = 0;
            (void)std::frexp(v, &e);
            return static_cast<double>(e);
        });
        return {Quantity(std::move(mantissa), x.ndim(), Unit(), fd),
                Quantity(std::move(exponent), x.ndim(), Unit(), Dtype::float64)};
    }
    throw DispatchUnsupported(op, "not a two-output unary operation");
}

std::pair<Quantity, Quantity> binary_pair(Ufunc op, const Quantity& x, const Quantity& y) {
    if (op != Ufunc::divmod) {
        throw DispatchUnsupported(op, "not a two-output binary operation");
    }
    const Quantity yc = y.in_units(x.units());
    const Dtype dtype = promote(x.dtype(), y.dtype());
    Quantity quotient = map_binary(x, yc, Unit(), dtype,
                                   [](double a, double b) { return std::floor(a / b); });
    Quantity rem = map_binary(x, yc, x.units(), dtype, python_mod);
    return {std::move(quotient), std::move(rem)};
}

Quantity clip(const Quantity& x, double lo, double hi) {
    return map_unary(x, x.units(), float_dtype(x.dtype()),
                     [lo, hi](double v) { return std::min(std::max(v, lo), hi); });
}

Eigen::Index reduction_length(const Quantity& x, std::optional<int> axis) {
    if (!axis) {
        return x.size();
    }
    const int a = normalise_axis(*axis, x.ndim());
    return (a == 0) ? x.value().rows() : x.value().cols();
}

Quantity reduce(Ufunc op, const Quantity& x, std::optional<int> axis) {
    Unit units = x.units();
    Dtype dtype = x.dtype();
    switch (op) {
    case Ufunc::add:
        dtype = float_dtype(x.dtype());
        break;
    case Ufunc::multiply:
        dtype = float_dtype(x.dtype());
        units = x.units().pow(Rational(static_cast<std::int64_t>(reduction_length(x, axis))));
        break;
    case Ufunc::maximum:
    case Ufunc::minimum:
    case Ufunc::fmax:
    case Ufunc::fmin:
        break;
    case Ufunc::logical_and:
    case Ufunc::logical_or:
        units = Unit();
        dtype = Dtype::boolean;
        break;
    default:
        throw DispatchUnsupported(op, "operation has no reduction");
    }

    const Buffer& v = x.value();
    if (!axis || x.ndim() == 1) {
        if (axis) (void)normalise_axis(*axis, x.ndim());
        return Quantity::scalar(fold(op, x.to_vector()), units, dtype);
    }

    const int a = normalise_axis(*axis, x.ndim());
    const Eigen::Index outer = (a == 0) ? v.cols() : v.rows();
    const Eigen::Index inner = (a == 0) ? v.rows() : v.cols();
    Buffer out(outer, 1);
    std::vector<double> lane(static_cast<std::size_t>(inner));
    for (Eigen::Index k = 0; k < outer; ++k) {
        for (Eigen::Index i = 0; i < inner; ++i) {
            lane[static_cast<std::size_t>(i)] = (a == 0) ? v(i, k) : v(k, i);
        }
        out(k, 0) = fold(op, lane);
    }
    return Quantity(std::move(out), 1, units, dtype);
}

} // namespace cosmotag::kernels
