#pragma once

/// @file include/cosmotag/quantity.hpp
/// @brief Unit-bearing numeric array, the quantity collaborator of CosmoArray.
///
/// # Module: Quantity
///
/// ## Responsibility
/// Holds a numeric buffer (scalar, 1-D or 2-D), its `Unit` and its `Dtype`,
/// and provides the contract the tagged-array layer builds on:
///   - get numeric value / get units
///   - convert to other units or to the base units of a `UnitSystem`
///   - construct an array of given units and dtype
///   - shape accessors (slice, reshape, transpose, take, repeat, ...)
///   - elementwise kernels over every `Ufunc` (see kernels.hpp)
///
/// ## Guarantees
/// - Value semantics: every accessor returns an independent copy
/// - Dimension mismatches raise `UnitIncompatible`
/// - Malformed input raises `InvalidConstruction`
///
/// ## NOT Responsible For
/// - Comoving / physical state (see cosmo_array.hpp)

#include "cosmotag/types.hpp"
#include "cosmotag/units.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cosmotag {

/// Plain-data snapshot of a Quantity used by serialization.
struct QuantityState {
    std::string units;
    Dtype dtype = Dtype::float64;
    int ndim = 1;
    std::int64_t rows = 0;
    std::int64_t cols = 1;
    std::vector<double> values;  ///< row-major
};

class Quantity {
public:
    /// Empty 1-D dimensionless array.
    Quantity();

    /// 1-D array.
    Quantity(const std::vector<double>& values, Unit units, Dtype dtype = Dtype::float64);

    /// 2-D array from nested rows. Ragged rows raise `InvalidConstruction`.
    Quantity(const std::vector<std::vector<double>>& rows, Unit units,
             Dtype dtype = Dtype::float64);

    /// Direct construction. `ndim` is 0 (1×1 buffer), 1 (n×1 buffer) or 2.
    Quantity(Buffer values, int ndim, Unit units, Dtype dtype = Dtype::float64);

    /// A 0-d quantity.
    [[nodiscard]] static Quantity scalar(double value, Unit units = Unit(),
                                         Dtype dtype = Dtype::float64);

    // ── Contract ─────────────────────────────────────────────────────────────

    /// Numeric values in `units()`.
    [[nodiscard]] const Buffer& value() const noexcept { return values_; }

    /// Mutable access for in-place transformations. Callers must respect the
    /// dtype (use `apply_dtype()` after writing).
    [[nodiscard]] Buffer& mutable_value() noexcept { return values_; }

    [[nodiscard]] const Unit& units() const noexcept { return units_; }
    [[nodiscard]] Dtype dtype() const noexcept { return dtype_; }

    [[nodiscard]] int ndim() const noexcept { return ndim_; }
    [[nodiscard]] Shape shape() const;
    [[nodiscard]] Eigen::Index size() const noexcept { return values_.size(); }

    /// Values flattened in row-major order.
    [[nodiscard]] std::vector<double> to_vector() const;

    /// Copy expressed in other units. Throws `UnitIncompatible`.
    [[nodiscard]] Quantity in_units(const Unit& target) const;

    /// In-place conversion to other units. Throws `UnitIncompatible`.
    void convert_to_units(const Unit& target);

    /// In-place conversion to the base units of `system`.
    void convert_to_base(const UnitSystem& system);

    /// Copy with a different dtype (float32 rounds, bool maps non-zero to 1).
    [[nodiscard]] Quantity astype(Dtype dtype) const;

    /// Ones with the same shape, units and dtype.
    [[nodiscard]] Quantity ones_like() const;

    /// Round stored values to the dtype's precision.
    void apply_dtype();

    // ── Shape accessors ──────────────────────────────────────────────────────

    /// Element i of a 1-D array (0-d result), or row i of a 2-D array.
    [[nodiscard]] Quantity element(Eigen::Index i) const;

    /// Element (i, j) of a 2-D array (0-d result).
    [[nodiscard]] Quantity element(Eigen::Index i, Eigen::Index j) const;

    /// Python-style slice [start:stop:step] along axis 0. Negative bounds
    /// count from the end; step must be non-zero.
    [[nodiscard]] Quantity slice(Eigen::Index start, Eigen::Index stop,
                                 Eigen::Index step = 1) const;

    /// 2-D reshape; the element count must match.
    [[nodiscard]] Quantity reshape(Eigen::Index rows, Eigen::Index cols) const;

    /// 1-D reshape; the element count must match.
    [[nodiscard]] Quantity reshape(Eigen::Index n) const;

    [[nodiscard]] Quantity transpose() const;
    [[nodiscard]] Quantity swapaxes(int axis1, int axis2) const;
    [[nodiscard]] Quantity flatten() const;

    /// Elements at the given flat indices (negative indices count from the end).
    [[nodiscard]] Quantity take(const std::vector<Eigen::Index>& indices) const;

    /// Each flat element repeated `repeats` times.
    [[nodiscard]] Quantity repeat(Eigen::Index repeats) const;

    /// Flat elements where `mask` is true. A shorter mask selects from the
    /// leading elements only.
    [[nodiscard]] Quantity compress(const std::vector<bool>& mask) const;

    /// Main diagonal of a 2-D array.
    [[nodiscard]] Quantity diagonal() const;

    /// Reverse the byte order of every element at its dtype's width: 8 bytes
    /// for float64, 4 for float32. Booleans are a single byte and unchanged.
    [[nodiscard]] Quantity byteswap() const;

    // ── Serialization ────────────────────────────────────────────────────────

    [[nodiscard]] QuantityState state() const;
    [[nodiscard]] static Quantity from_state(const QuantityState& state);

private:
    Buffer values_;
    int ndim_;
    Unit units_;
    Dtype dtype_;
};

} // namespace cosmotag
