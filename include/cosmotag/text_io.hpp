#pragma once

/// @file include/cosmotag/text_io.hpp
/// @brief Plain-text representation of a CosmoArray.
///
/// # Module: TextIO
///
/// ## Responsibility
/// Read and write a CosmoArray, tag included, as a small commented CSV file.
///
/// ## Expected Format
/// ```
/// # units: kpc
/// # dtype: float64
/// # comoving: true
/// # a_exponent: 1
/// # scale_factor: 0.5
/// # compression: lossy
/// value
/// 1.0
/// 2.0
/// ```
/// Header directives are `# key: value` lines, all optional (`units`
/// defaults to dimensionless, `comoving` to true). `a_exponent` and
/// `scale_factor` come as a pair. An optional `# ndim: 0|1|2` forces the
/// dimensionality; otherwise one column gives a 1-D array and several give
/// a 2-D array. Other `#` lines are comments. The first non-comment line
/// names the columns and is skipped.
///
/// ## Guarantees
/// - A malformed row, header or value raises `InvalidConstruction`; rows
///   are never skipped, since dropping one would silently shift the data
/// - `format_text` output parses back to an equal array (values written
///   with round-trip precision)
/// - Only `load_text` / `save_text` touch the filesystem

#include "cosmotag/cosmo_array.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cosmotag::io {

/// Reads and writes CosmoArrays as commented CSV text.
class TextIO {
public:
    /// Load an array from a file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - The parsed array otherwise (malformed content throws)
    [[nodiscard]] static std::optional<CosmoArray> load_text(const std::string& filepath);

    /// Parse an array from text in the format above.
    [[nodiscard]] static CosmoArray parse_text(const std::string& content);

    /// Text form of `array`.
    [[nodiscard]] static std::string format_text(const CosmoArray& array);

    /// Write `format_text(array)` to `filepath`. Returns false if the file
    /// cannot be written.
    [[nodiscard]] static bool save_text(const CosmoArray& array, const std::string& filepath);

private:
    /// Comma-separated finite or non-finite numbers; exactly `expected` of them.
    [[nodiscard]] static std::vector<double>
    parse_row(const std::string& line, std::size_t expected, std::size_t line_number);
};

} // namespace cosmotag::io
