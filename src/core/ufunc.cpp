/// @file src/core/ufunc.cpp
/// @brief Names, arities and output counts of the elementwise operations.

#include "cosmotag/ufunc.hpp"

#include <array>

namespace cosmotag {

namespace {

constexpr std::array<Ufunc, UFUNC_COUNT> make_all() {
    std::array<Ufunc, UFUNC_COUNT> out{};
    for (std::size_t i = 0; i < UFUNC_COUNT; ++i) {
        out[i] = static_cast<Ufunc>(i);
    }
    return out;
}

constexpr std::array<Ufunc, UFUNC_COUNT> ALL_UFUNCS = make_all();

} // anonymous namespace

std::string_view ufunc_name(Ufunc op) noexcept {
    switch (op) {
    case Ufunc::add:           return "add";
    case Ufunc::subtract:      return "subtract";
    case Ufunc::multiply:      return "multiply";
    case Ufunc::divide:        return "divide";
    case Ufunc::true_divide:   return "true_divide";
    case Ufunc::floor_divide:  return "floor_divide";
    case Ufunc::negative:      return "negative";
    case Ufunc::positive:      return "positive";
    case Ufunc::power:         return "power";
    case Ufunc::remainder:     return "remainder";
    case Ufunc::mod:           return "mod";
    case Ufunc::fmod:          return "fmod";
    case Ufunc::divmod:        return "divmod";
    case Ufunc::absolute:      return "absolute";
    case Ufunc::fabs:          return "fabs";
    case Ufunc::rint:          return "rint";
    case Ufunc::sign:          return "sign";
    case Ufunc::heaviside:     return "heaviside";
    case Ufunc::conj:          return "conj";
    case Ufunc::matmul:        return "matmul";
    case Ufunc::exp:           return "exp";
    case Ufunc::exp2:          return "exp2";
    case Ufunc::log:           return "log";
    case Ufunc::log2:          return "log2";
    case Ufunc::log10:         return "log10";
    case Ufunc::expm1:         return "expm1";
    case Ufunc::log1p:         return "log1p";
    case Ufunc::logaddexp:     return "logaddexp";
    case Ufunc::logaddexp2:    return "logaddexp2";
    case Ufunc::sqrt:          return "sqrt";
    case Ufunc::square:        return "square";
    case Ufunc::reciprocal:    return "reciprocal";
    case Ufunc::sin:           return "sin";
    case Ufunc::cos:           return "cos";
    case Ufunc::tan:           return "tan";
    case Ufunc::arcsin:        return "arcsin";
    case Ufunc::arccos:        return "arccos";
    case Ufunc::arctan:        return "arctan";
    case Ufunc::arctan2:       return "arctan2";
    case Ufunc::hypot:         return "hypot";
    case Ufunc::sinh:          return "sinh";
    case Ufunc::cosh:          return "cosh";
    case Ufunc::tanh:          return "tanh";
    case Ufunc::arcsinh:       return "arcsinh";
    case Ufunc::arccosh:       return "arccosh";
    case Ufunc::arctanh:       return "arctanh";
    case Ufunc::deg2rad:       return "deg2rad";
    case Ufunc::rad2deg:       return "rad2deg";
    case Ufunc::greater:       return "greater";
    case Ufunc::greater_equal: return "greater_equal";
    case Ufunc::less:          return "less";
    case Ufunc::less_equal:    return "less_equal";
    case Ufunc::not_equal:     return "not_equal";
    case Ufunc::equal:         return "equal";
    case Ufunc::logical_and:   return "logical_and";
    case Ufunc::logical_or:    return "logical_or";
    case Ufunc::logical_xor:   return "logical_xor";
    case Ufunc::logical_not:   return "logical_not";
    case Ufunc::maximum:       return "maximum";
    case Ufunc::minimum:       return "minimum";
    case Ufunc::fmax:          return "fmax";
    case Ufunc::fmin:          return "fmin";
    case Ufunc::isreal:        return "isreal";
    case Ufunc::iscomplex:     return "iscomplex";
    case Ufunc::isfinite:      return "isfinite";
    case Ufunc::isinf:         return "isinf";
    case Ufunc::isnan:         return "isnan";
    case Ufunc::isnat:         return "isnat";
    case Ufunc::signbit:       return "signbit";
    case Ufunc::copysign:      return "copysign";
    case Ufunc::nextafter:     return "nextafter";
    case Ufunc::spacing:       return "spacing";
    case Ufunc::modf:          return "modf";
    case Ufunc::frexp:         return "frexp";
    case Ufunc::floor:         return "floor";
    case Ufunc::ceil:          return "ceil";
    case Ufunc::trunc:         return "trunc";
    case Ufunc::ones_like:     return "ones_like";
    case Ufunc::clip:          return "clip";
    }
    return "unknown";
}

std::optional<Ufunc> ufunc_from_name(std::string_view name) noexcept {
    for (Ufunc op : ALL_UFUNCS) {
        if (ufunc_name(op) == name) {
            return op;
        }
    }
    return std::nullopt;
}

int ufunc_arity(Ufunc op) noexcept {
    switch (op) {
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
        return 2;
    default:
        return 1;
    }
}

int ufunc_output_count(Ufunc op) noexcept {
    switch (op) {
    case Ufunc::modf:
    case Ufunc::frexp:
    case Ufunc::divmod:
        return 2;
    default:
        return 1;
    }
}

std::span<const Ufunc> all_ufuncs() noexcept {
    return ALL_UFUNCS;
}

} // namespace cosmotag
