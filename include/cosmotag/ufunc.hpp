#pragma once

/// @file include/cosmotag/ufunc.hpp
/// @brief Enumeration of the elementwise operations understood by cosmotag.
///
/// Every operation that can be applied to a Quantity or CosmoArray is one
/// enumerator here. The numeric kernels (units layer) and the cosmological
/// rule table (dispatch layer) both switch exhaustively over this enum, so a
/// new operation cannot be added to one layer and forgotten in the other
/// without a compiler warning.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace cosmotag {

enum class Ufunc : std::uint8_t {
    // arithmetic
    add,
    subtract,
    multiply,
    divide,
    true_divide,
    floor_divide,
    negative,
    positive,
    power,
    remainder,
    mod,
    fmod,
    divmod,
    absolute,
    fabs,
    rint,
    sign,
    heaviside,
    conj,
    matmul,
    // exponential / logarithmic
    exp,
    exp2,
    log,
    log2,
    log10,
    expm1,
    log1p,
    logaddexp,
    logaddexp2,
    sqrt,
    square,
    reciprocal,
    // trigonometric
    sin,
    cos,
    tan,
    arcsin,
    arccos,
    arctan,
    arctan2,
    hypot,
    sinh,
    cosh,
    tanh,
    arcsinh,
    arccosh,
    arctanh,
    deg2rad,
    rad2deg,
    // comparison / logical
    greater,
    greater_equal,
    less,
    less_equal,
    not_equal,
    equal,
    logical_and,
    logical_or,
    logical_xor,
    logical_not,
    maximum,
    minimum,
    fmax,
    fmin,
    // floating point
    isreal,
    iscomplex,
    isfinite,
    isinf,
    isnan,
    isnat,
    signbit,
    copysign,
    nextafter,
    spacing,
    modf,
    frexp,
    floor,
    ceil,
    trunc,
    // array helpers
    ones_like,
    clip,
};

/// Number of enumerators in `Ufunc`.
static constexpr std::size_t UFUNC_COUNT = static_cast<std::size_t>(Ufunc::clip) + 1;

/// numpy-style name of the operation ("add", "arctan2", ...).
[[nodiscard]] std::string_view ufunc_name(Ufunc op) noexcept;

/// Look up an operation by name. `None` for unknown names.
[[nodiscard]] std::optional<Ufunc> ufunc_from_name(std::string_view name) noexcept;

/// Number of array inputs: 1 or 2. `clip` counts as 1 (its bounds are
/// plain scalars).
[[nodiscard]] int ufunc_arity(Ufunc op) noexcept;

/// Number of array outputs: 2 for modf, frexp and divmod, otherwise 1.
[[nodiscard]] int ufunc_output_count(Ufunc op) noexcept;

/// Every operation, in declaration order.
[[nodiscard]] std::span<const Ufunc> all_ufuncs() noexcept;

} // namespace cosmotag
