#pragma once

/// @file include/cosmotag/errors.hpp
/// @brief Exception hierarchy for cosmotag.
///
/// Every error reflects a logical incompatibility the caller must resolve;
/// there is no transient failure class and nothing is retried. Lookups that
/// can simply miss (a unit system by name, a file that cannot be opened)
/// return std::optional instead.
///
/// `ScaleMismatch` lives in scale_factor_exponent.hpp next to the type whose
/// operands it carries.

#include "cosmotag/ufunc.hpp"

#include <stdexcept>
#include <string>

namespace cosmotag {

/// Root of the hierarchy. Catch this to handle any cosmotag failure.
class CosmoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// An elementwise operation has no cosmological rule, or its rule is not
/// derivable (sqrt, square, reciprocal, arctan2).
class DispatchUnsupported : public CosmoError {
public:
    DispatchUnsupported(Ufunc op, const std::string& reason);

    [[nodiscard]] Ufunc operation() const noexcept { return op_; }

private:
    Ufunc op_;
};

/// Dimensionally incompatible units met in a conversion or an additive
/// combination.
class UnitIncompatible : public CosmoError {
public:
    using CosmoError::CosmoError;
};

/// Malformed input where a unit-bearing value was required: ragged nested
/// lists, unknown unit symbols, boolean arrays used as physical quantities.
class InvalidConstruction : public CosmoError {
public:
    using CosmoError::CosmoError;
};

/// A comoving/physical conversion was requested on an array that carries no
/// scale-factor exponent.
class MissingCosmoFactor : public CosmoError {
public:
    using CosmoError::CosmoError;
};

/// Operand shapes cannot be broadcast against each other.
class ShapeMismatch : public CosmoError {
public:
    using CosmoError::CosmoError;
};

/// A writer particle dataset is incomplete or internally inconsistent.
class DatasetError : public CosmoError {
public:
    using CosmoError::CosmoError;
};

/// A serialized ArrayState is truncated or corrupt.
class StateFormatError : public CosmoError {
public:
    using CosmoError::CosmoError;
};

} // namespace cosmotag
