/// @file src/units/quantity.cpp
/// @brief Quantity construction, unit conversion and shape accessors.

#include "cosmotag/quantity.hpp"
#include "cosmotag/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace cosmotag {

namespace {

/// `v` with its object representation in reverse byte order.
template <typename T>
T reverse_bytes(T v) noexcept {
    unsigned char bytes[sizeof(T)];
    std::memcpy(bytes, &v, sizeof(T));
    std::reverse(bytes, bytes + sizeof(T));
    std::memcpy(&v, bytes, sizeof(T));
    return v;
}

double round_to(Dtype dtype, double v) noexcept {
    switch (dtype) {
    case Dtype::float64: return v;
    case Dtype::float32: return static_cast<double>(static_cast<float>(v));
    case Dtype::boolean: return (v != 0.0) ? 1.0 : 0.0;
    }
    return v;
}

/// Buffer holding `flat` as an n×1 column (1-D layout).
Buffer column(const std::vector<double>& flat) {
    Buffer b(static_cast<Eigen::Index>(flat.size()), 1);
    for (std::size_t i = 0; i < flat.size(); ++i) {
        b(static_cast<Eigen::Index>(i), 0) = flat[i];
    }
    return b;
}

Eigen::Index normalise_index(Eigen::Index i, Eigen::Index n) {
    const Eigen::Index j = (i < 0) ? i + n : i;
    if (j < 0 || j >= n) {
        throw InvalidConstruction(
            fmt::format("index {} is out of bounds for axis of size {}", i, n));
    }
    return j;
}

} // anonymous namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Quantity::Quantity() : values_(0, 1), ndim_(1), units_(), dtype_(Dtype::float64) {}

Quantity::Quantity(const std::vector<double>& values, Unit units, Dtype dtype)
    : values_(column(values)), ndim_(1), units_(std::move(units)), dtype_(dtype) {
    apply_dtype();
}

Quantity::Quantity(const std::vector<std::vector<double>>& rows, Unit units, Dtype dtype)
    : ndim_(2), units_(std::move(units)), dtype_(dtype) {
    const std::size_t ncols = rows.empty() ? 0 : rows.front().size();
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != ncols) {
            throw InvalidConstruction(fmt::format(
                "ragged nested input: row {} has {} elements, expected {}",
                r, rows[r].size(), ncols));
        }
    }
    values_.resize(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(ncols));
    for (std::size_t r = 0; r < rows.size(); ++r) {
        for (std::size_t c = 0; c < ncols; ++c) {
            values_(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
        }
    }
    apply_dtype();
}

Quantity::Quantity(Buffer values, int ndim, Unit units, Dtype dtype)
    : values_(std::move(values)), ndim_(ndim), units_(std::move(units)), dtype_(dtype) {
    if (ndim_ < 0 || ndim_ > 2) {
        throw InvalidConstruction(fmt::format("unsupported number of dimensions {}", ndim_));
    }
    if (ndim_ == 0 && values_.size() != 1) {
        throw InvalidConstruction("a 0-d quantity must hold exactly one value");
    }
    if (ndim_ == 1 && values_.cols() != 1 && values_.size() != 0) {
        // Accept any 1-D payload but store it as a column.
        Buffer flat = Eigen::Map<const Buffer>(values_.data(), values_.size(), 1);
        values_ = std::move(flat);
    }
    apply_dtype();
}

Quantity Quantity::scalar(double value, Unit units, Dtype dtype) {
    Buffer b(1, 1);
    b(0, 0) = value;
    return Quantity(std::move(b), 0, std::move(units), dtype);
}

// ─── Contract ─────────────────────────────────────────────────────────────────

Shape Quantity::shape() const {
    switch (ndim_) {
    case 0:  return {};
    case 1:  return {values_.rows()};
    default: return {values_.rows(), values_.cols()};
    }
}

std::vector<double> Quantity::to_vector() const {
    return std::vector<double>(values_.data(), values_.data() + values_.size());
}

Quantity Quantity::in_units(const Unit& target) const {
    Quantity out = *this;
    out.convert_to_units(target);
    return out;
}

void Quantity::convert_to_units(const Unit& target) {
    const double factor = units_.conversion_factor(target);
    if (factor != 1.0) {
        values_ *= factor;
        apply_dtype();
    }
    units_ = target;
}

void Quantity::convert_to_base(const UnitSystem& system) {
    convert_to_units(system.unit_for(units_.dimensions()));
}

Quantity Quantity::astype(Dtype dtype) const {
    Quantity out = *this;
    out.dtype_ = dtype;
    out.apply_dtype();
    return out;
}

Quantity Quantity::ones_like() const {
    Buffer ones = Buffer::Ones(values_.rows(), values_.cols());
    return Quantity(std::move(ones), ndim_, units_, dtype_);
}

void Quantity::apply_dtype() {
    if (dtype_ == Dtype::float64) return;
    const Dtype d = dtype_;
    values_ = values_.unaryExpr([d](double v) { return round_to(d, v); });
}

// ─── Shape accessors ──────────────────────────────────────────────────────────

Quantity Quantity::element(Eigen::Index i) const {
    if (ndim_ == 0) {
        throw InvalidConstruction("cannot index a 0-d quantity");
    }
    const Eigen::Index r = normalise_index(i, values_.rows());
    if (ndim_ == 1) {
        return scalar(values_(r, 0), units_, dtype_);
    }
    Buffer row = values_.row(r).transpose();
    return Quantity(std::move(row), 1, units_, dtype_);
}

Quantity Quantity::element(Eigen::Index i, Eigen::Index j) const {
    if (ndim_ != 2) {
        throw InvalidConstruction(
            fmt::format("two indices given for a {}-d quantity", ndim_));
    }
    const Eigen::Index r = normalise_index(i, values_.rows());
    const Eigen::Index c = normalise_index(j, values_.cols());
    return scalar(values_(r, c), units_, dtype_);
}

Quantity Quantity::slice(Eigen::Index start, Eigen::Index stop, Eigen::Index step) const {
    if (ndim_ == 0) {
        throw InvalidConstruction("cannot slice a 0-d quantity");
    }
    if (step == 0) {
        throw InvalidConstruction("slice step cannot be zero");
    }
    const Eigen::Index n = values_.rows();
    auto clamp = [n, step](Eigen::Index v) {
        if (v < 0) v += n;
        return (step > 0) ? std::clamp<Eigen::Index>(v, 0, n)
                          : std::clamp<Eigen::Index>(v, -1, n - 1);
    };
    const Eigen::Index lo = clamp(start);
    const Eigen::Index hi = clamp(stop);

    std::vector<Eigen::Index> rows;
    if (step > 0) {
        for (Eigen::Index r = lo; r < hi; r += step) rows.push_back(r);
    } else {
        for (Eigen::Index r = lo; r > hi; r += step) rows.push_back(r);
    }

    Buffer out(static_cast<Eigen::Index>(rows.size()), values_.cols());
    for (std::size_t k = 0; k < rows.size(); ++k) {
        out.row(static_cast<Eigen::Index>(k)) = values_.row(rows[k]);
    }
    return Quantity(std::move(out), ndim_, units_, dtype_);
}

Quantity Quantity::reshape(Eigen::Index rows, Eigen::Index cols) const {
    if (rows < 0 || cols < 0 || rows * cols != values_.size()) {
        throw ShapeMismatch(fmt::format(
            "cannot reshape array of size {} into shape ({}, {})", values_.size(), rows, cols));
    }
    Buffer out = Eigen::Map<const Buffer>(values_.data(), rows, cols);
    return Quantity(std::move(out), 2, units_, dtype_);
}

Quantity Quantity::reshape(Eigen::Index n) const {
    if (n != values_.size()) {
        throw ShapeMismatch(fmt::format(
            "cannot reshape array of size {} into shape ({},)", values_.size(), n));
    }
    return flatten();
}

Quantity Quantity::transpose() const {
    if (ndim_ < 2) {
        return *this;
    }
    Buffer out = values_.transpose();
    return Quantity(std::move(out), 2, units_, dtype_);
}

Quantity Quantity::swapaxes(int axis1, int axis2) const {
    const int nd = std::max(ndim_, 1);
    if (axis1 < 0) axis1 += nd;
    if (axis2 < 0) axis2 += nd;
    if (axis1 < 0 || axis1 >= nd || axis2 < 0 || axis2 >= nd) {
        throw InvalidConstruction(fmt::format(
            "axes ({}, {}) out of range for a {}-d quantity", axis1, axis2, ndim_));
    }
    return (axis1 == axis2) ? *this : transpose();
}

Quantity Quantity::flatten() const {
    Buffer out = Eigen::Map<const Buffer>(values_.data(), values_.size(), 1);
    return Quantity(std::move(out), 1, units_, dtype_);
}

Quantity Quantity::take(const std::vector<Eigen::Index>& indices) const {
    const Eigen::Index n = values_.size();
    std::vector<double> out;
    out.reserve(indices.size());
    for (Eigen::Index i : indices) {
        out.push_back(values_.data()[normalise_index(i, n)]);
    }
    return Quantity(out, units_, dtype_);
}

Quantity Quantity::repeat(Eigen::Index repeats) const {
    if (repeats < 0) {
        throw InvalidConstruction("repeat count cannot be negative");
    }
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(values_.size() * repeats));
    for (Eigen::Index i = 0; i < values_.size(); ++i) {
        for (Eigen::Index k = 0; k < repeats; ++k) {
            out.push_back(values_.data()[i]);
        }
    }
    return Quantity(out, units_, dtype_);
}

Quantity Quantity::compress(const std::vector<bool>& mask) const {
    if (static_cast<Eigen::Index>(mask.size()) > values_.size()) {
        throw ShapeMismatch(fmt::format(
            "mask of length {} is longer than array of size {}", mask.size(), values_.size()));
    }
    std::vector<double> out;
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) out.push_back(values_.data()[i]);
    }
    return Quantity(out, units_, dtype_);
}

Quantity Quantity::diagonal() const {
    if (ndim_ != 2) {
        throw InvalidConstruction("diagonal requires a 2-d quantity");
    }
    const Eigen::Index n = std::min(values_.rows(), values_.cols());
    Buffer out(n, 1);
    for (Eigen::Index i = 0; i < n; ++i) {
        out(i, 0) = values_(i, i);
    }
    return Quantity(std::move(out), 1, units_, dtype_);
}

Quantity Quantity::byteswap() const {
    Quantity out = *this;
    double* data = out.values_.data();
    for (Eigen::Index i = 0; i < out.values_.size(); ++i) {
        switch (dtype_) {
        case Dtype::float64: data[i] = reverse_bytes(data[i]); break;
        case Dtype::float32:
            data[i] = static_cast<double>(reverse_bytes(static_cast<float>(data[i])));
            break;
        case Dtype::boolean: break;  // one byte per element
        }
    }
    return out;
}

// ─── Serialization ────────────────────────────────────────────────────────────

QuantityState Quantity::state() const {
    return QuantityState{
        .units  = units_.expr(),
        .dtype  = dtype_,
        .ndim   = ndim_,
        .rows   = static_cast<std::int64_t>(values_.rows()),
        .cols   = static_cast<std::int64_t>(values_.cols()),
        .values = to_vector(),
    };
}

Quantity Quantity::from_state(const QuantityState& state) {
    if (state.rows < 0 || state.cols < 0 ||
        static_cast<std::size_t>(state.rows * state.cols) != state.values.size()) {
        throw InvalidConstruction(fmt::format(
            "state shape ({}, {}) does not match {} stored values",
            state.rows, state.cols, state.values.size()));
    }
    Buffer values = Eigen::Map<const Buffer>(state.values.data(), state.rows, state.cols);
    return Quantity(std::move(values), state.ndim, Unit::parse(state.units), state.dtype);
}

} // namespace cosmotag
