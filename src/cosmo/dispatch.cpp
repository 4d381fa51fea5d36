/// @file src/cosmo/dispatch.cpp
/// @brief Rule table, frame resolution and tag derivation for elementwise ops.

#include "cosmotag/dispatch.hpp"
#include "cosmotag/kernels.hpp"

#include <fmt/format.h>

#include <array>
#include <span>

namespace cosmotag {

// ─── Rule table ───────────────────────────────────────────────────────────────

const char* to_string(CosmoRule rule) noexcept {
    switch (rule) {
    case CosmoRule::preserve:        return "preserve";
    case CosmoRule::passthrough:     return "passthrough";
    case CosmoRule::multiply:        return "multiply";
    case CosmoRule::divide:          return "divide";
    case CosmoRule::power:           return "power";
    case CosmoRule::strip:           return "strip";
    case CosmoRule::comparison:      return "comparison";
    case CosmoRule::not_implemented: return "not_implemented";
    }
    return "unknown";
}

CosmoRule rule_for(Ufunc op) noexcept {
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
    case Ufunc::heaviside:
    case Ufunc::ones_like:
        return CosmoRule::preserve;

    case Ufunc::negative:
    case Ufunc::positive:
    case Ufunc::absolute:
    case Ufunc::fabs:
    case Ufunc::conj:
    case Ufunc::copysign:
    case Ufunc::modf:
    case Ufunc::floor:
    case Ufunc::ceil:
    case Ufunc::trunc:
    case Ufunc::spacing:
    case Ufunc::divmod:
    case Ufunc::clip:
        return CosmoRule::passthrough;

    case Ufunc::multiply:
    case Ufunc::matmul:
        return CosmoRule::multiply;

    case Ufunc::divide:
    case Ufunc::true_divide:
    case Ufunc::floor_divide:
        return CosmoRule::divide;

    case Ufunc::power:
        return CosmoRule::power;

    case Ufunc::logaddexp:
    case Ufunc::logaddexp2:
    case Ufunc::rint:
    case Ufunc::sign:
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
    case Ufunc::sinh:
    case Ufunc::cosh:
    case Ufunc::tanh:
    case Ufunc::arcsin:
    case Ufunc::arccos:
    case Ufunc::arctan:
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
    case Ufunc::signbit:
    case Ufunc::frexp:
    case Ufunc::isnat:
        return CosmoRule::strip;

    case Ufunc::greater:
    case Ufunc::greater_equal:
    case Ufunc::less:
    case Ufunc::less_equal:
    case Ufunc::not_equal:
    case Ufunc::equal:
    case Ufunc::logical_and:
    case Ufunc::logical_or:
    case Ufunc::logical_xor:
        return CosmoRule::comparison;

    case Ufunc::sqrt:
    case Ufunc::square:
    case Ufunc::reciprocal:
    case Ufunc::arctan2:
        return CosmoRule::not_implemented;
    }
    return CosmoRule::not_implemented;
}

namespace {

/// Exponent arithmetic that leaves int64 range cannot produce a tag.
[[noreturn]] void exponent_out_of_range(Ufunc op, const InvalidConstruction& e) {
    throw DispatchUnsupported(op, fmt::format("scale-factor exponent out of range: {}", e.what()));
}

std::optional<ScaleFactorExponent>
derive_exponent(Ufunc op,
                const std::optional<ScaleFactorExponent>& cf1,
                const std::optional<ScaleFactorExponent>& cf2,
                const std::optional<Rational>& power) {
    switch (rule_for(op)) {
    case CosmoRule::preserve:
        if (cf1 && cf2) return cf1->combine_additive(*cf2);
        return cf1 ? cf1 : cf2;

    case CosmoRule::passthrough:
        return cf1;

    case CosmoRule::multiply:
        if (cf1 && cf2) return cf1->combine_multiplicative(*cf2);
        return cf1 ? cf1 : cf2;

    case CosmoRule::divide:
        if (cf1 && cf2) return cf1->divide(*cf2);
        if (cf1) return cf1;
        if (cf2) return cf2->raise_to_power(Rational(-1));
        return std::nullopt;

    case CosmoRule::power:
        if (!power) {
            throw DispatchUnsupported(op, "a power needs a scalar exponent");
        }
        if (cf1) return cf1->raise_to_power(*power);
        return std::nullopt;

    case CosmoRule::strip:
    case CosmoRule::comparison:
        return std::nullopt;

    case CosmoRule::not_implemented:
        break;
    }
    throw DispatchUnsupported(op, "scale-factor dependence of the result is not derivable");
}

} // anonymous namespace

std::optional<ScaleFactorExponent>
derive_cosmo_factor(Ufunc op,
                    const std::optional<ScaleFactorExponent>& cf1,
                    const std::optional<ScaleFactorExponent>& cf2,
                    const std::optional<Rational>& power) {
    try {
        return derive_exponent(op, cf1, cf2, power);
    } catch (const InvalidConstruction& e) {
        exponent_out_of_range(op, e);
    }
}

namespace {

// ─── Frame resolution ─────────────────────────────────────────────────────────

/// One input of an operation: a tagged array, or a plain number.
struct Operand {
    const CosmoArray* array = nullptr;
    double number = 0.0;

    [[nodiscard]] std::optional<ScaleFactorExponent> cosmo_factor() const {
        if (!array) return std::nullopt;
        return array->cosmo_factor();
    }
};

struct Frame {
    bool comoving = true;
    std::optional<std::string> compression;
};

/// Decide the result frame and compression of the tagged operands.
///
/// Only operands with a scale-factor exponent vote on the frame; exempt
/// arrays look the same in either frame. If nothing scales, every tagged
/// operand votes.
Frame resolve_frame(std::span<const Operand> operands) {
    bool any_scaling = false;
    for (const Operand& o : operands) {
        if (o.array && o.array->cosmo_factor()) any_scaling = true;
    }

    bool any_comoving = false;
    bool any_physical = false;
    bool first = true;
    Frame frame;
    for (const Operand& o : operands) {
        if (!o.array) continue;
        if (!any_scaling || o.array->cosmo_factor()) {
            (o.array->comoving() ? any_comoving : any_physical) = true;
        }
        if (first) {
            frame.compression = o.array->compression();
            first = false;
        } else if (frame.compression != o.array->compression()) {
            frame.compression = std::nullopt;
        }
    }
    frame.comoving = any_comoving || !any_physical;
    return frame;
}

/// Operand values expressed in `frame`. Plain numbers take the array
/// operand's float width so a float32 array stays float32.
Quantity values_in(const Operand& o, const Frame& frame, Dtype like) {
    if (!o.array) {
        const Dtype d = (like == Dtype::float32) ? Dtype::float32 : Dtype::float64;
        return Quantity::scalar(o.number, Unit(), d);
    }
    if (o.array->comoving() == frame.comoving || !o.array->cosmo_factor()) {
        return o.array->quantity();
    }
    return frame.comoving ? o.array->to_comoving().quantity()
                          : o.array->to_physical().quantity();
}

void require_derivable(Ufunc op) {
    if (rule_for(op) == CosmoRule::not_implemented) {
        throw DispatchUnsupported(op, "scale-factor dependence of the result is not derivable");
    }
}

/// The exponent of a power: uniform, dimensionless, untagged and rational.
Rational power_exponent(const Operand& e) {
    if (e.cosmo_factor()) {
        throw DispatchUnsupported(Ufunc::power,
                                  "the exponent operand carries a scale-factor dependence");
    }
    if (!e.array) {
        if (auto r = Rational::from_double(e.number)) return *r;
        throw DispatchUnsupported(Ufunc::power,
                                  fmt::format("exponent {} is not a rational number", e.number));
    }
    if (!e.array->units().is_dimensionless()) {
        throw DispatchUnsupported(Ufunc::power, "the exponent operand must be dimensionless");
    }
    const Quantity d = e.array->quantity().in_units(Unit());
    const Buffer& v = d.value();
    if (v.size() == 0) {
        throw DispatchUnsupported(Ufunc::power, "the exponent operand is empty");
    }
    for (Eigen::Index i = 1; i < v.size(); ++i) {
        if (v.data()[i] != v.data()[0]) {
            throw DispatchUnsupported(Ufunc::power, "the exponent operand must be a scalar");
        }
    }
    if (auto r = Rational::from_double(v.data()[0])) return *r;
    throw DispatchUnsupported(Ufunc::power,
                              fmt::format("exponent {} is not a rational number", v.data()[0]));
}

CosmoArray apply_binary(Ufunc op, const Operand& x, const Operand& y) {
    require_derivable(op);
    if (ufunc_arity(op) != 2 || ufunc_output_count(op) != 1) {
        throw DispatchUnsupported(op, "not a single-output binary operation");
    }

    std::optional<Rational> power;
    if (rule_for(op) == CosmoRule::power) {
        power = power_exponent(y);
    }

    const std::array<Operand, 2> operands{x, y};
    const Frame frame = resolve_frame(operands);
    auto cf = derive_cosmo_factor(op, x.cosmo_factor(), y.cosmo_factor(), power);

    const Dtype like = x.array ? x.array->dtype() : y.array->dtype();
    Quantity result = kernels::binary(op, values_in(x, frame, like), values_in(y, frame, like));
    return CosmoArray(std::move(result),
                      TagState{.comoving     = frame.comoving,
                               .cosmo_factor = std::move(cf),
                               .compression  = std::move(frame.compression)});
}

} // anonymous namespace

// ─── Operations ───────────────────────────────────────────────────────────────

CosmoArray apply(Ufunc op, const CosmoArray& x) {
    require_derivable(op);
    if (ufunc_arity(op) != 1 || ufunc_output_count(op) != 1 || op == Ufunc::clip) {
        throw DispatchUnsupported(op, "not a single-output unary operation");
    }
    auto cf = derive_cosmo_factor(op, x.cosmo_factor());
    Quantity result = kernels::unary(op, x.quantity());
    return CosmoArray(std::move(result),
                      TagState{.comoving     = x.comoving(),
                               .cosmo_factor = std::move(cf),
                               .compression  = x.compression()});
}

CosmoArray apply(Ufunc op, const CosmoArray& x, const CosmoArray& y) {
    return apply_binary(op, Operand{.array = &x}, Operand{.array = &y});
}

CosmoArray apply(Ufunc op, const CosmoArray& x, double y) {
    return apply_binary(op, Operand{.array = &x}, Operand{.number = y});
}

CosmoArray apply(Ufunc op, double x, const CosmoArray& y) {
    return apply_binary(op, Operand{.number = x}, Operand{.array = &y});
}

std::pair<CosmoArray, CosmoArray> apply_pair(Ufunc op, const CosmoArray& x) {
    require_derivable(op);
    if (op != Ufunc::modf && op != Ufunc::frexp) {
        throw DispatchUnsupported(op, "not a two-output unary operation");
    }
    const auto cf = derive_cosmo_factor(op, x.cosmo_factor());
    auto [first, second] = kernels::unary_pair(op, x.quantity());
    const TagState tag{.comoving = x.comoving(), .cosmo_factor = cf, .compression = x.compression()};
    return {CosmoArray(std::move(first), tag), CosmoArray(std::move(second), tag)};
}

std::pair<CosmoArray, CosmoArray> apply_pair(Ufunc op, const CosmoArray& x,
                                             const CosmoArray& y) {
    require_derivable(op);
    if (op != Ufunc::divmod) {
        throw DispatchUnsupported(op, "not a two-output binary operation");
    }
    const std::array<Operand, 2> operands{Operand{.array = &x}, Operand{.array = &y}};
    const Frame frame = resolve_frame(operands);
    const auto cf = derive_cosmo_factor(op, x.cosmo_factor(), y.cosmo_factor());

    auto [quotient, remainder] = kernels::binary_pair(
        op, values_in(operands[0], frame, x.dtype()), values_in(operands[1], frame, x.dtype()));
    const TagState tag{.comoving = frame.comoving, .cosmo_factor = cf,
                       .compression = frame.compression};
    return {CosmoArray(std::move(quotient), tag), CosmoArray(std::move(remainder), tag)};
}

CosmoArray clip(const CosmoArray& x, double lo, double hi) {
    auto cf = derive_cosmo_factor(Ufunc::clip, x.cosmo_factor());
    return CosmoArray(kernels::clip(x.quantity(), lo, hi),
                      TagState{.comoving     = x.comoving(),
                               .cosmo_factor = std::move(cf),
                               .compression  = x.compression()});
}

CosmoArray reduce(Ufunc op, const CosmoArray& x, std::optional<int> axis) {
    std::optional<ScaleFactorExponent> cf;
    switch (op) {
    case Ufunc::add:
    case Ufunc::maximum:
    case Ufunc::minimum:
    case Ufunc::fmax:
    case Ufunc::fmin:
        cf = x.cosmo_factor();
        break;
    case Ufunc::multiply:
        if (x.cosmo_factor()) {
            const auto n = static_cast<std::int64_t>(kernels::reduction_length(x.quantity(), axis));
            try {
                cf = x.cosmo_factor()->raise_to_power(Rational(n));
            } catch (const InvalidConstruction& e) {
                exponent_out_of_range(op, e);
            }
        }
        break;
    case Ufunc::logical_and:
    case Ufunc::logical_or:
        break;
    default:
        throw DispatchUnsupported(op, "operation has no scale-factor rule for reductions");
    }
    return CosmoArray(kernels::reduce(op, x.quantity(), axis),
                      TagState{.comoving     = x.comoving(),
                               .cosmo_factor = std::move(cf),
                               .compression  = x.compression()});
}

// ─── Operators ────────────────────────────────────────────────────────────────

CosmoArray operator-(const CosmoArray& x) { return apply(Ufunc::negative, x); }

CosmoArray operator+(const CosmoArray& x, const CosmoArray& y) {
    return apply(Ufunc::add, x, y);
}

CosmoArray operator-(const CosmoArray& x, const CosmoArray& y) {
    return apply(Ufunc::subtract, x, y);
}

CosmoArray operator*(const CosmoArray& x, const CosmoArray& y) {
    return apply(Ufunc::multiply, x, y);
}

CosmoArray operator/(const CosmoArray& x, const CosmoArray& y) {
    return apply(Ufunc::divide, x, y);
}

CosmoArray operator*(const CosmoArray& x, double y) { return apply(Ufunc::multiply, x, y); }
CosmoArray operator*(double x, const CosmoArray& y) { return apply(Ufunc::multiply, x, y); }
CosmoArray operator/(const CosmoArray& x, double y) { return apply(Ufunc::divide, x, y); }
CosmoArray operator/(double x, const CosmoArray& y) { return apply(Ufunc::divide, x, y); }

} // namespace cosmotag
