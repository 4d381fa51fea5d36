/// @file src/io/text_io.cpp
/// @brief Commented-CSV reader and writer for CosmoArray.

#include "cosmotag/text_io.hpp"
#include "cosmotag/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

namespace cosmotag::io {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

double parse_number(const std::string& token, std::size_t line_number) {
    const std::string t = trim(token);
    if (t.empty()) {
        throw InvalidConstruction(fmt::format("line {}: empty value", line_number));
    }
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || errno == ERANGE) {
        throw InvalidConstruction(fmt::format("line {}: '{}' is not a number", line_number, t));
    }
    return v;
}

bool parse_bool(const std::string& value) {
    if (value == "true" || value == "True" || value == "1") return true;
    if (value == "false" || value == "False" || value == "0") return false;
    throw InvalidConstruction(fmt::format("'{}' is not a boolean", value));
}

/// "3", "-3", "3/2" or a decimal such as "0.5".
Rational parse_exponent(const std::string& value) {
    const auto slash = value.find('/');
    if (slash != std::string::npos) {
        const double num = parse_number(value.substr(0, slash), 0);
        const double den = parse_number(value.substr(slash + 1), 0);
        if (num != std::trunc(num) || den != std::trunc(den)
            || std::fabs(num) > constants::MAX_EXACT_INTEGER
            || std::fabs(den) > constants::MAX_EXACT_INTEGER) {
            throw InvalidConstruction(fmt::format("'{}' is not a rational exponent", value));
        }
        return Rational(static_cast<std::int64_t>(num), static_cast<std::int64_t>(den));
    }
    const auto r = Rational::from_double(parse_number(value, 0));
    if (!r) {
        throw InvalidConstruction(fmt::format("'{}' is not a rational exponent", value));
    }
    return *r;
}

/// Column header of a 2-d array with no columns; its row count is in "# rows".
constexpr const char* NO_COLUMNS = "-";

std::string format_number(double v) {
    return fmt::format("{:.{}g}", v, constants::TEXT_PRECISION);
}

} // anonymous namespace

// ─── TextIO::parse_row ────────────────────────────────────────────────────────

std::vector<double>
TextIO::parse_row(const std::string& line, std::size_t expected, std::size_t line_number) {
    std::istringstream ss(line);
    std::string token;
    std::vector<double> fields;
    fields.reserve(expected);
    while (std::getline(ss, token, ',')) {
        fields.push_back(parse_number(token, line_number));
    }
    if (fields.size() != expected) {
        throw InvalidConstruction(fmt::format(
            "line {}: expected {} values, found {}", line_number, expected, fields.size()));
    }
    return fields;
}

// ─── TextIO::parse_text ───────────────────────────────────────────────────────

CosmoArray TextIO::parse_text(const std::string& content) {
    std::map<std::string, std::string> header;
    std::vector<std::vector<double>> rows;
    std::size_t columns = 0;
    bool header_skipped = false;

    std::istringstream stream(content);
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        const std::string t = trim(line);
        if (t.empty()) {
            continue;
        }
        if (t[0] == '#') {
            const auto colon = t.find(':');
            if (!header_skipped && colon != std::string::npos) {
                header[trim(t.substr(1, colon - 1))] = trim(t.substr(colon + 1));
            }
            continue;
        }
        if (!header_skipped) {
            // First non-comment line names the columns.
            columns = (t == NO_COLUMNS)
                ? 0 : static_cast<std::size_t>(std::count(t.begin(), t.end(), ',')) + 1;
            header_skipped = true;
            continue;
        }
        rows.push_back(parse_row(t, columns, line_number));
    }
    if (!header_skipped) {
        throw InvalidConstruction("text array has no column header line");
    }

    auto lookup = [&header](const char* key) -> std::optional<std::string> {
        const auto it = header.find(key);
        if (it == header.end()) return std::nullopt;
        return it->second;
    };

    const Unit units = Unit::parse(lookup("units").value_or("dimensionless"));

    Dtype dtype = Dtype::float64;
    if (const auto d = lookup("dtype")) {
        const auto parsed = dtype_from_string(*d);
        if (!parsed) {
            throw InvalidConstruction(fmt::format("unknown dtype '{}'", *d));
        }
        dtype = *parsed;
    }

    TagState tag;
    if (const auto c = lookup("comoving")) {
        tag.comoving = parse_bool(*c);
    }
    const auto exponent = lookup("a_exponent");
    const auto scale = lookup("scale_factor");
    if (exponent.has_value() != scale.has_value()) {
        throw InvalidConstruction("a_exponent and scale_factor must be given together");
    }
    if (exponent) {
        tag.cosmo_factor = ScaleFactorExponent(parse_exponent(*exponent), parse_number(*scale, 0));
    }
    if (const auto c = lookup("compression")) {
        tag.compression = *c;
    }

    int ndim = (columns == 1) ? 1 : 2;
    if (const auto n = lookup("ndim")) {
        if (*n == "0")      ndim = 0;
        else if (*n == "1") ndim = 1;
        else if (*n == "2") ndim = 2;
        else throw InvalidConstruction(fmt::format("unsupported ndim '{}'", *n));
    }
    if (ndim < 2 && columns != 1) {
        throw InvalidConstruction(fmt::format("a {}-d array must have one column", ndim));
    }

    if (ndim == 2) {
        if (columns == 0) {
            const double n = parse_number(lookup("rows").value_or("0"), 0);
            if (n < 0 || n != std::trunc(n) || n > constants::MAX_EXACT_INTEGER) {
                throw InvalidConstruction(fmt::format("'{}' is not a row count", n));
            }
            return CosmoArray(Quantity(Buffer(static_cast<Eigen::Index>(n), 0), 2, units, dtype),
                              std::move(tag));
        }
        Buffer values(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(columns));
        for (std::size_t r = 0; r < rows.size(); ++r) {
            for (std::size_t c = 0; c < columns; ++c) {
                values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
            }
        }
        return CosmoArray(Quantity(std::move(values), 2, units, dtype), std::move(tag));
    }

    std::vector<double> flat;
    flat.reserve(rows.size());
    for (const auto& row : rows) {
        flat.push_back(row.front());
    }
    if (ndim == 0) {
        if (flat.size() != 1) {
            throw InvalidConstruction(
                fmt::format("a 0-d array needs exactly one value, found {}", flat.size()));
        }
        return CosmoArray(Quantity::scalar(flat.front(), units, dtype), std::move(tag));
    }
    return CosmoArray(Quantity(flat, units, dtype), std::move(tag));
}

// ─── TextIO::load_text ────────────────────────────────────────────────────────

std::optional<CosmoArray> TextIO::load_text(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_text(contents.str());
}

// ─── TextIO::format_text ──────────────────────────────────────────────────────

std::string TextIO::format_text(const CosmoArray& array) {
    std::string out;
    out += fmt::format("# units: {}\n", array.units().expr());
    out += fmt::format("# dtype: {}\n", to_string(array.dtype()));
    out += fmt::format("# ndim: {}\n", array.ndim());
    out += fmt::format("# comoving: {}\n", array.comoving() ? "true" : "false");
    if (const auto& cf = array.cosmo_factor()) {
        out += fmt::format("# a_exponent: {}\n", cf->expr().to_string());
        out += fmt::format("# scale_factor: {}\n", format_number(cf->scale_factor()));
    }
    if (const auto& c = array.compression()) {
        out += fmt::format("# compression: {}\n", *c);
    }

    const Buffer& v = array.value();
    if (array.ndim() < 2) {
        out += "value\n";
    } else if (v.cols() == 0) {
        out += fmt::format("# rows: {}\n", v.rows());
        out += fmt::format("{}\n", NO_COLUMNS);
        return out;
    } else {
        for (Eigen::Index c = 0; c < v.cols(); ++c) {
            out += (c == 0) ? fmt::format("c{}", c) : fmt::format(",c{}", c);
        }
        out += '\n';
    }
    for (Eigen::Index r = 0; r < v.rows(); ++r) {
        for (Eigen::Index c = 0; c < v.cols(); ++c) {
            if (c > 0) out += ',';
            out += format_number(v(r, c));
        }
        out += '\n';
    }
    return out;
}

// ─── TextIO::save_text ────────────────────────────────────────────────────────

bool TextIO::save_text(const CosmoArray& array, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }
    file << format_text(array);
    return static_cast<bool>(file);
}

} // namespace cosmotag::io
