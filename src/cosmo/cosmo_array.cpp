/// @file src/cosmo/cosmo_array.cpp
/// @brief CosmoArray construction, frame conversion and tag propagation.

#include "cosmotag/cosmo_array.hpp"

#include <fmt/format.h>

#include <string>

namespace cosmotag {

namespace {

std::string format_values(const Quantity& q) {
    const Buffer& v = q.value();
    auto item = [&q](double x) {
        return q.dtype() == Dtype::boolean ? std::string(x != 0.0 ? "True" : "False")
                                           : fmt::format("{}", x);
    };
    if (q.ndim() == 0) {
        return item(v(0, 0));
    }
    auto row = [&](Eigen::Index r, bool column) {
        std::string out = "[";
        const Eigen::Index n = column ? v.rows() : v.cols();
        for (Eigen::Index k = 0; k < n; ++k) {
            if (k > 0) out += ", ";
            out += item(column ? v(k, 0) : v(r, k));
        }
        return out + "]";
    };
    if (q.ndim() == 1) {
        return row(0, true);
    }
    std::string out = "[";
    for (Eigen::Index r = 0; r < v.rows(); ++r) {
        if (r > 0) out += ", ";
        out += row(r, false);
    }
    return out + "]";
}

/// Compression labels are written on one header line of the text format.
TagState checked_tag(TagState tag) {
    if (tag.compression && tag.compression->find_first_of("\r\n") != std::string::npos) {
        throw InvalidConstruction(
            fmt::format("compression label must be a single line, got '{}'", *tag.compression));
    }
    return tag;
}

} // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

CosmoArray::CosmoArray(const std::vector<double>& values, const Unit& units,
                       TagState tag, Dtype dtype)
    : quantity_(values, units, dtype), tag_(checked_tag(std::move(tag))) {}

CosmoArray::CosmoArray(const std::vector<double>& values, std::string_view units,
                       TagState tag, Dtype dtype)
    : CosmoArray(values, Unit::parse(units), std::move(tag), dtype) {}

CosmoArray::CosmoArray(const std::vector<std::vector<double>>& rows, const Unit& units,
                       TagState tag, Dtype dtype)
    : quantity_(rows, units, dtype), tag_(checked_tag(std::move(tag))) {}

CosmoArray::CosmoArray(const std::vector<std::vector<double>>& rows, std::string_view units,
                       TagState tag, Dtype dtype)
    : CosmoArray(rows, Unit::parse(units), std::move(tag), dtype) {}

CosmoArray::CosmoArray(Quantity quantity, TagState tag)
    : quantity_(std::move(quantity)), tag_(checked_tag(std::move(tag))) {}

void CosmoArray::set_compression(std::optional<std::string> compression) {
    TagState tag = tag_;
    tag.compression = std::move(compression);
    tag_ = checked_tag(std::move(tag));
}

CosmoArray CosmoArray::scalar(double value, const Unit& units, TagState tag) {
    return CosmoArray(Quantity::scalar(value, units), std::move(tag));
}

CosmoArray CosmoArray::from_quantity(Quantity quantity, TagState tag) {
    return CosmoArray(std::move(quantity), std::move(tag));
}

CosmoArray CosmoArray::from_external(const ExternalQuantity& quantity, TagState tag) {
    return CosmoArray(quantity.magnitude, Unit::parse(quantity.units), std::move(tag));
}

CosmoArray CosmoArray::with(Quantity quantity) const {
    return CosmoArray(std::move(quantity), tag_);
}

// ─── Comoving / physical conversion ───────────────────────────────────────────

void CosmoArray::convert_to_comoving() {
    if (tag_.comoving) {
        return;
    }
    if (!tag_.cosmo_factor) {
        throw MissingCosmoFactor(
            "cannot convert to comoving: the array has no scale-factor exponent");
    }
    quantity_.mutable_value() /= tag_.cosmo_factor->a_factor();
    quantity_.apply_dtype();
    tag_.comoving = true;
}

void CosmoArray::convert_to_physical() {
    if (!tag_.comoving) {
        return;
    }
    if (!tag_.cosmo_factor) {
        throw MissingCosmoFactor(
            "cannot convert to physical: the array has no scale-factor exponent");
    }
    quantity_.mutable_value() *= tag_.cosmo_factor->a_factor();
    quantity_.apply_dtype();
    tag_.comoving = false;
}

CosmoArray CosmoArray::to_physical() const {
    CosmoArray copy = *this;
    copy.convert_to_physical();
    return copy;
}

CosmoArray CosmoArray::to_comoving() const {
    CosmoArray copy = *this;
    copy.convert_to_comoving();
    return copy;
}

bool CosmoArray::compatible_with_comoving() const noexcept {
    return tag_.comoving || !tag_.cosmo_factor || tag_.cosmo_factor->a_factor() == 1.0;
}

bool CosmoArray::compatible_with_physical() const noexcept {
    return !tag_.comoving || !tag_.cosmo_factor || tag_.cosmo_factor->a_factor() == 1.0;
}

// ─── Unit conversion ──────────────────────────────────────────────────────────

CosmoArray CosmoArray::in_units(const Unit& target) const {
    return with(quantity_.in_units(target));
}

CosmoArray CosmoArray::in_units(std::string_view target) const {
    return in_units(Unit::parse(target));
}

void CosmoArray::convert_to_units(const Unit& target) {
    quantity_.convert_to_units(target);
}

void CosmoArray::convert_to_base(const UnitSystem& system) {
    quantity_.convert_to_base(system);
}

// ─── Tag-propagating accessors ────────────────────────────────────────────────

CosmoArray CosmoArray::element(Eigen::Index i) const { return with(quantity_.element(i)); }

CosmoArray CosmoArray::element(Eigen::Index i, Eigen::Index j) const {
    return with(quantity_.element(i, j));
}

CosmoArray CosmoArray::slice(Eigen::Index start, Eigen::Index stop, Eigen::Index step) const {
    return with(quantity_.slice(start, stop, step));
}

CosmoArray CosmoArray::reshape(Eigen::Index rows, Eigen::Index cols) const {
    return with(quantity_.reshape(rows, cols));
}

CosmoArray CosmoArray::reshape(Eigen::Index n) const { return with(quantity_.reshape(n)); }
CosmoArray CosmoArray::transpose() const { return with(quantity_.transpose()); }

CosmoArray CosmoArray::swapaxes(int axis1, int axis2) const {
    return with(quantity_.swapaxes(axis1, axis2));
}

CosmoArray CosmoArray::flatten() const { return with(quantity_.flatten()); }

CosmoArray CosmoArray::take(const std::vector<Eigen::Index>& indices) const {
    return with(quantity_.take(indices));
}

CosmoArray CosmoArray::repeat(Eigen::Index repeats) const {
    return with(quantity_.repeat(repeats));
}

CosmoArray CosmoArray::compress(const std::vector<bool>& mask) const {
    return with(quantity_.compress(mask));
}

CosmoArray CosmoArray::diagonal() const { return with(quantity_.diagonal()); }
CosmoArray CosmoArray::byteswap() const { return with(quantity_.byteswap()); }
CosmoArray CosmoArray::astype(Dtype dtype) const { return with(quantity_.astype(dtype)); }
CosmoArray CosmoArray::unit_array() const { return with(quantity_.ones_like()); }

std::string CosmoArray::to_string() const {
    const std::string& expr = quantity_.units().expr();
    return fmt::format("{} {} {}", format_values(quantity_), expr.empty() ? "dimensionless" : expr,
                       tag_.comoving ? "(Comoving)" : "(Physical)");
}

// ─── Serialization hooks ──────────────────────────────────────────────────────

ArrayState CosmoArray::reduce_state() const {
    return ArrayState{
        .tag      = TagRecord{.cosmo_factor = tag_.cosmo_factor, .comoving = tag_.comoving},
        .quantity = quantity_.state(),
    };
}

CosmoArray CosmoArray::from_state(const ArrayState& state) {
    TagState tag{
        .comoving     = state.tag.comoving,
        .cosmo_factor = state.tag.cosmo_factor,
        .compression  = std::nullopt,
    };
    return CosmoArray(Quantity::from_state(state.quantity), std::move(tag));
}

} // namespace cosmotag
