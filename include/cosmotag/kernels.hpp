#pragma once

/// @file include/cosmotag/kernels.hpp
/// @brief Numeric and unit kernels for every elementwise operation.
///
/// # Module: Kernels
///
/// ## Responsibility
/// Evaluate a `Ufunc` on plain Quantities: compute the values, the result
/// units and the result dtype. Knows nothing about comoving/physical state;
/// the dispatch layer calls these after deciding the cosmological tag.
///
/// ## Guarantees
/// - Operands are never mutated
/// - Additive and comparison operations express the second operand in the
///   first operand's units before combining (`UnitIncompatible` otherwise)
/// - Transcendental operations require dimensionless input and produce
///   dimensionless output
/// - Comparisons, logical operations and `is*` predicates produce `Dtype::boolean`
/// - Operands broadcast only when their shapes are equal or one holds a
///   single element (`ShapeMismatch` otherwise)
///
/// ## NOT Responsible For
/// - Scale-factor exponents and frames (see dispatch.hpp)

#include "cosmotag/quantity.hpp"
#include "cosmotag/ufunc.hpp"

#include <optional>
#include <utility>

namespace cosmotag::kernels {

/// One-input, one-output operation.
/// Throws `DispatchUnsupported` if `op` is not a unary single-output operation.
[[nodiscard]] Quantity unary(Ufunc op, const Quantity& x);

/// Two-input, one-output operation.
/// Throws `DispatchUnsupported` if `op` is not a binary single-output operation.
[[nodiscard]] Quantity binary(Ufunc op, const Quantity& x, const Quantity& y);

/// modf → (fractional part, integral part), frexp → (mantissa, exponent).
[[nodiscard]] std::pair<Quantity, Quantity> unary_pair(Ufunc op, const Quantity& x);

/// divmod → (floor quotient, remainder).
[[nodiscard]] std::pair<Quantity, Quantity> binary_pair(Ufunc op, const Quantity& x,
                                                        const Quantity& y);

/// Clamp every element to [lo, hi], both bounds given in x's units.
[[nodiscard]] Quantity clip(const Quantity& x, double lo, double hi);

/// Reduce along `axis` (all elements when `nullopt`).
///
/// Supported: add, multiply, maximum, minimum, fmax, fmin, logical_and,
/// logical_or. Anything else throws `DispatchUnsupported`.
[[nodiscard]] Quantity reduce(Ufunc op, const Quantity& x, std::optional<int> axis);

/// Number of input elements folded into each output element of `reduce`.
[[nodiscard]] Eigen::Index reduction_length(const Quantity& x, std::optional<int> axis);

/// Result dtype of an arithmetic operation between the two dtypes.
[[nodiscard]] Dtype promote(Dtype a, Dtype b) noexcept;

} // namespace cosmotag::kernels
