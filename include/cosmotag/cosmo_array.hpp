#pragma once

/// @file include/cosmotag/cosmo_array.hpp
/// @brief Unit-bearing array tagged with its comoving/physical state.
///
/// # Module: CosmoArray
///
/// ## Responsibility
/// Composes a `Quantity` (values, units, dtype) with a `TagState`:
///   - `comoving`: whether the values are comoving (default) or physical
///   - `cosmo_factor`: the scale-factor exponent, required for conversions
///   - `compression`: informational label describing how the data was stored
///
/// Owns the comoving ↔ physical conversion protocol, the compatibility
/// checks used before data is combined or written, every tag-propagating
/// shape accessor, and the state hooks used by serialization.
/// Elementwise operations live in dispatch.hpp.
///
/// ## Guarantees
/// - physical value = comoving value × `cosmo_factor()->a_factor()`
/// - Every accessor returning an array copies the tag by value; no two
///   arrays share a buffer or a tag
/// - Only `convert_to_*`, `convert_to_units`, `convert_to_base` and the
///   setters mutate the receiver
/// - An array without a `cosmo_factor` is exempt from scaling: it is
///   compatible with either frame, and converting it raises
///   `MissingCosmoFactor`
///
/// # Example
/// ```cpp
/// using namespace cosmotag;
/// CosmoArray r({1.0, 2.0, 3.0}, "kpc",
///              {.cosmo_factor = ScaleFactorExponent(Rational(1), 0.5)});
/// auto phys = r.to_physical();   // [0.5, 1, 1.5] kpc (Physical)
/// ```

#include "cosmotag/constants.hpp"
#include "cosmotag/quantity.hpp"
#include "cosmotag/scale_factor_exponent.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cosmotag {

/// The cosmological tag carried next to a Quantity.
struct TagState {
    bool comoving = constants::DEFAULT_COMOVING;
    std::optional<ScaleFactorExponent> cosmo_factor;
    std::optional<std::string> compression;
};

/// A quantity produced by another units library: raw magnitudes plus the
/// unit expression that library reports.
struct ExternalQuantity {
    std::vector<double> magnitude;
    std::string units;
};

/// First member of a serialized array: the part of the tag that survives a
/// save/restore round trip. Compression is informational and not stored.
struct TagRecord {
    std::optional<ScaleFactorExponent> cosmo_factor;
    bool comoving = constants::DEFAULT_COMOVING;
};

/// Complete serializable state: tag record first, then the quantity.
struct ArrayState {
    TagRecord tag;
    QuantityState quantity;
};

class CosmoArray {
public:
    /// Empty, dimensionless, comoving.
    CosmoArray() = default;

    /// 1-D array from values and units.
    CosmoArray(const std::vector<double>& values, const Unit& units,
               TagState tag = {}, Dtype dtype = Dtype::float64);
    CosmoArray(const std::vector<double>& values, std::string_view units,
               TagState tag = {}, Dtype dtype = Dtype::float64);

    /// 2-D array from nested rows. Ragged rows raise `InvalidConstruction`.
    CosmoArray(const std::vector<std::vector<double>>& rows, const Unit& units,
               TagState tag = {}, Dtype dtype = Dtype::float64);
    CosmoArray(const std::vector<std::vector<double>>& rows, std::string_view units,
               TagState tag = {}, Dtype dtype = Dtype::float64);

    /// Wrap an existing quantity.
    explicit CosmoArray(Quantity quantity, TagState tag = {});

    /// A 0-d array.
    [[nodiscard]] static CosmoArray scalar(double value, const Unit& units = Unit(),
                                           TagState tag = {});

    /// Wrap a quantity of this library's collaborator type.
    [[nodiscard]] static CosmoArray from_quantity(Quantity quantity, TagState tag = {});

    /// Import a quantity from a foreign units library. Unknown unit symbols
    /// raise `InvalidConstruction`.
    [[nodiscard]] static CosmoArray from_external(const ExternalQuantity& quantity,
                                                  TagState tag = {});

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] const Quantity& quantity() const noexcept { return quantity_; }
    [[nodiscard]] const Buffer& value() const noexcept { return quantity_.value(); }
    [[nodiscard]] const Unit& units() const noexcept { return quantity_.units(); }
    [[nodiscard]] Dtype dtype() const noexcept { return quantity_.dtype(); }
    [[nodiscard]] int ndim() const noexcept { return quantity_.ndim(); }
    [[nodiscard]] Shape shape() const { return quantity_.shape(); }
    [[nodiscard]] Eigen::Index size() const noexcept { return quantity_.size(); }
    [[nodiscard]] std::vector<double> to_vector() const { return quantity_.to_vector(); }

    [[nodiscard]] bool comoving() const noexcept { return tag_.comoving; }
    [[nodiscard]] const std::optional<ScaleFactorExponent>& cosmo_factor() const noexcept {
        return tag_.cosmo_factor;
    }
    [[nodiscard]] const std::optional<std::string>& compression() const noexcept {
        return tag_.compression;
    }
    [[nodiscard]] const TagState& tag() const noexcept { return tag_; }

    void set_cosmo_factor(std::optional<ScaleFactorExponent> cosmo_factor) {
        tag_.cosmo_factor = std::move(cosmo_factor);
    }
    /// Throws `InvalidConstruction` if the label spans more than one line.
    void set_compression(std::optional<std::string> compression);

    // ── Comoving / physical conversion ───────────────────────────────────────

    /// Divide by a_factor in place and mark comoving. No-op if already comoving.
    /// Throws `MissingCosmoFactor` if a conversion is needed but no exponent is set.
    void convert_to_comoving();

    /// Multiply by a_factor in place and mark physical. No-op if already physical.
    /// Throws `MissingCosmoFactor` if a conversion is needed but no exponent is set.
    void convert_to_physical();

    /// Converted copy; the receiver is untouched.
    [[nodiscard]] CosmoArray to_physical() const;
    [[nodiscard]] CosmoArray to_comoving() const;

    /// Comoving, or scale-independent (a_factor == 1), or exempt.
    [[nodiscard]] bool compatible_with_comoving() const noexcept;

    /// Physical, or scale-independent (a_factor == 1), or exempt.
    [[nodiscard]] bool compatible_with_physical() const noexcept;

    // ── Unit conversion ──────────────────────────────────────────────────────

    [[nodiscard]] CosmoArray in_units(const Unit& target) const;
    [[nodiscard]] CosmoArray in_units(std::string_view target) const;
    void convert_to_units(const Unit& target);
    void convert_to_base(const UnitSystem& system);

    // ── Tag-propagating accessors ────────────────────────────────────────────

    [[nodiscard]] CosmoArray element(Eigen::Index i) const;
    [[nodiscard]] CosmoArray element(Eigen::Index i, Eigen::Index j) const;
    [[nodiscard]] CosmoArray slice(Eigen::Index start, Eigen::Index stop,
                                   Eigen::Index step = 1) const;
    [[nodiscard]] CosmoArray reshape(Eigen::Index rows, Eigen::Index cols) const;
    [[nodiscard]] CosmoArray reshape(Eigen::Index n) const;
    [[nodiscard]] CosmoArray transpose() const;
    [[nodiscard]] CosmoArray T() const { return transpose(); }
    [[nodiscard]] CosmoArray swapaxes(int axis1, int axis2) const;
    [[nodiscard]] CosmoArray flatten() const;
    [[nodiscard]] CosmoArray ravel() const { return flatten(); }
    [[nodiscard]] CosmoArray take(const std::vector<Eigen::Index>& indices) const;
    [[nodiscard]] CosmoArray repeat(Eigen::Index repeats) const;
    [[nodiscard]] CosmoArray compress(const std::vector<bool>& mask) const;
    [[nodiscard]] CosmoArray diagonal() const;
    [[nodiscard]] CosmoArray byteswap() const;
    [[nodiscard]] CosmoArray astype(Dtype dtype) const;

    /// Ones with this array's shape, units and tag.
    [[nodiscard]] CosmoArray unit_array() const;

    /// "[1, 2, 3] kpc (Comoving)".
    [[nodiscard]] std::string to_string() const;

    // ── Serialization hooks ──────────────────────────────────────────────────

    [[nodiscard]] ArrayState reduce_state() const;
    [[nodiscard]] static CosmoArray from_state(const ArrayState& state);

private:
    /// Same tag around a new quantity.
    [[nodiscard]] CosmoArray with(Quantity quantity) const;

    Quantity quantity_;
    TagState tag_;
};

} // namespace cosmotag
