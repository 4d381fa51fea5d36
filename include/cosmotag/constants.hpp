#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/cosmotag/constants.hpp
/// @brief Library-wide defaults and numerical tolerances for cosmotag.

namespace cosmotag::constants {

// ─── Tag Defaults ─────────────────────────────────────────────────────────────

/// Arrays are assumed comoving unless the caller says otherwise.
static constexpr bool DEFAULT_COMOVING = true;

/// The present epoch: a = 1, z = 0.
static constexpr double PRESENT_SCALE_FACTOR = 1.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Relative tolerance used when comparing unit conversion factors.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Largest denominator accepted when recovering a rational exponent from a
/// floating-point power (e.g. 0.5 → 1/2, 0.333… → 1/3).
static constexpr std::int64_t RATIONAL_MAX_DENOMINATOR = 1'000'000;

/// Absolute tolerance for the rational recovery above.
static constexpr double RATIONAL_TOLERANCE = 1e-12;

/// Magnitude past which a double no longer holds every integer exactly.
static constexpr double MAX_EXACT_INTEGER = 9.0e15;

// ─── Serialization ────────────────────────────────────────────────────────────

/// Leading bytes of a binary ArrayState stream.
static constexpr char STATE_MAGIC[4] = {'C', 'T', 'A', 'G'};

/// Current binary state layout version.
static constexpr std::uint32_t STATE_VERSION = 1;

/// Upper bound on the element count of a decoded state. Protects the decoder
/// against corrupt headers that would request absurd allocations.
static constexpr std::uint64_t STATE_MAX_ELEMENTS = std::uint64_t{1} << 32;

/// Significant digits written by the text formatter (round-trips a double).
static constexpr int TEXT_PRECISION = 17;

// ─── Writer ───────────────────────────────────────────────────────────────────

/// Number of SWIFT particle types (gas … black holes).
static constexpr std::size_t PARTICLE_TYPE_COUNT = 6;

} // namespace cosmotag::constants
