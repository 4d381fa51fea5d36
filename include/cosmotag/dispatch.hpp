#pragma once

/// @file include/cosmotag/dispatch.hpp
/// @brief Elementwise operations on CosmoArrays and the tag rule table.
///
/// # Module: Dispatch
///
/// ## Responsibility
/// For every `Ufunc`, decide the cosmological tag of the result and then
/// delegate the numeric work to kernels.hpp:
///   1. reject operations whose scale-factor dependence is not derivable
///   2. resolve the frame: all comoving → comoving, all physical → physical,
///      mixed → physical operands are converted to comoving (on copies)
///   3. inherit the compression label only when every tagged operand agrees
///   4. derive the output exponent from the operation's `CosmoRule`
///
/// Plain numbers are neutral: they carry no frame, exponent or compression.
///
/// ## Guarantees
/// - Operands are never mutated
/// - `DispatchUnsupported` is raised before any value is computed
/// - `ScaleMismatch` propagates from the exponent algebra unchanged

#include "cosmotag/cosmo_array.hpp"
#include "cosmotag/ufunc.hpp"

#include <optional>
#include <utility>

namespace cosmotag {

/// How an operation transforms the scale-factor exponent.
enum class CosmoRule : std::uint8_t {
    preserve,         ///< operands additively compatible; exponent kept
    passthrough,      ///< first operand's exponent, no compatibility check
    multiply,         ///< exponents add
    divide,           ///< exponents subtract
    power,            ///< exponent scaled by a scalar power
    strip,            ///< result carries no exponent
    comparison,       ///< boolean result, no exponent
    not_implemented,  ///< always `DispatchUnsupported`
};

/// Lower-case rule name ("preserve", "not_implemented", ...).
[[nodiscard]] const char* to_string(CosmoRule rule) noexcept;

/// The rule table.
[[nodiscard]] CosmoRule rule_for(Ufunc op) noexcept;

/// Output exponent of a one- or two-operand operation given the operands'
/// exponents. `power` is required for `CosmoRule::power`.
///
/// # Throws
/// - `DispatchUnsupported` for `not_implemented` operations
/// - `ScaleMismatch` when the exponents cannot be combined
/// - `DispatchUnsupported` when the result exponent overflows the exact
///   rational range
[[nodiscard]] std::optional<ScaleFactorExponent>
derive_cosmo_factor(Ufunc op,
                    const std::optional<ScaleFactorExponent>& cf1,
                    const std::optional<ScaleFactorExponent>& cf2 = std::nullopt,
                    const std::optional<Rational>& power = std::nullopt);

// ─── Operations ───────────────────────────────────────────────────────────────

[[nodiscard]] CosmoArray apply(Ufunc op, const CosmoArray& x);
[[nodiscard]] CosmoArray apply(Ufunc op, const CosmoArray& x, const CosmoArray& y);
[[nodiscard]] CosmoArray apply(Ufunc op, const CosmoArray& x, double y);
[[nodiscard]] CosmoArray apply(Ufunc op, double x, const CosmoArray& y);

/// Two-output operations: modf and frexp.
[[nodiscard]] std::pair<CosmoArray, CosmoArray> apply_pair(Ufunc op, const CosmoArray& x);

/// Two-output operations: divmod.
[[nodiscard]] std::pair<CosmoArray, CosmoArray> apply_pair(Ufunc op, const CosmoArray& x,
                                                           const CosmoArray& y);

/// Clamp to [lo, hi], bounds in x's units and frame.
[[nodiscard]] CosmoArray clip(const CosmoArray& x, double lo, double hi);

/// Fold `op` along `axis` (every element when `nullopt`).
///
/// add, maximum, minimum, fmax and fmin keep the exponent; multiply raises it
/// to the number of elements folded together; logical_and and logical_or
/// give a boolean without exponent. Anything else raises `DispatchUnsupported`.
[[nodiscard]] CosmoArray reduce(Ufunc op, const CosmoArray& x,
                                std::optional<int> axis = std::nullopt);

// ─── Operators ────────────────────────────────────────────────────────────────

[[nodiscard]] CosmoArray operator-(const CosmoArray& x);
[[nodiscard]] CosmoArray operator+(const CosmoArray& x, const CosmoArray& y);
[[nodiscard]] CosmoArray operator-(const CosmoArray& x, const CosmoArray& y);
[[nodiscard]] CosmoArray operator*(const CosmoArray& x, const CosmoArray& y);
[[nodiscard]] CosmoArray operator/(const CosmoArray& x, const CosmoArray& y);
[[nodiscard]] CosmoArray operator*(const CosmoArray& x, double y);
[[nodiscard]] CosmoArray operator*(double x, const CosmoArray& y);
[[nodiscard]] CosmoArray operator/(const CosmoArray& x, double y);
[[nodiscard]] CosmoArray operator/(double x, const CosmoArray& y);

} // namespace cosmotag
