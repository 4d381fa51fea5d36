#pragma once

/// @file include/cosmotag/serialize.hpp
/// @brief Binary encoding of a CosmoArray's ArrayState.
///
/// # Module: Serialize
///
/// ## Responsibility
/// Make the `reduce_state()` / `from_state()` round trip concrete as a
/// little-endian byte stream:
///
/// ```text
/// "CTAG"  u32 version
/// u8 comoving  u8 has_cosmo_factor  [i64 num  i64 den  f64 scale_factor]
/// u32 len  units[len]  u8 dtype  u8 ndim  u64 rows  u64 cols  f64 values[rows*cols]
/// ```
///
/// The tag record comes first, the quantity state follows.
///
/// ## Guarantees
/// - A decoded array has the same values, units, dtype, shape, `comoving`
///   flag and `cosmo_factor` as the encoded one; compression is not stored
/// - Truncated or corrupt input raises `StateFormatError`, never UB; the
///   decoder never allocates more than the bytes actually present justify

#include "cosmotag/cosmo_array.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace cosmotag {

/// Append the encoded state of `array` to `out`.
void write_state(std::ostream& out, const CosmoArray& array);

/// Read one encoded array from `in`. Throws `StateFormatError`.
[[nodiscard]] CosmoArray read_state(std::istream& in);

/// Encoded bytes of `array`.
[[nodiscard]] std::string encode_state(const CosmoArray& array);

/// Decode exactly one array; trailing bytes raise `StateFormatError`.
[[nodiscard]] CosmoArray decode_state(std::string_view bytes);

} // namespace cosmotag
