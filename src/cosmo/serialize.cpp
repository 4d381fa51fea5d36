/// @file src/cosmo/serialize.cpp
/// @brief Little-endian ArrayState codec.

#include "cosmotag/serialize.hpp"
#include "cosmotag/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <cstring>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>

namespace cosmotag {

namespace {

/// Longest unit expression accepted by the decoder.
constexpr std::uint32_t MAX_UNITS_LENGTH = 4096;

/// Values are read in chunks of this many elements.
constexpr std::size_t READ_CHUNK = 4096;

// ─── Primitive writers ────────────────────────────────────────────────────────

template <typename T>
void put(std::ostream& out, T value) {
    unsigned char bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    if constexpr (std::endian::native == std::endian::big) {
        std::reverse(bytes, bytes + sizeof(T));
    }
    out.write(reinterpret_cast<const char*>(bytes), sizeof(T));
}

// ─── Primitive readers ────────────────────────────────────────────────────────

template <typename T>
T get(std::istream& in, const char* field) {
    unsigned char bytes[sizeof(T)];
    if (!in.read(reinterpret_cast<char*>(bytes), sizeof(T))) {
        throw StateFormatError(fmt::format("truncated state while reading {}", field));
    }
    if constexpr (std::endian::native == std::endian::big) {
        std::reverse(bytes, bytes + sizeof(T));
    }
    T value;
    std::memcpy(&value, bytes, sizeof(T));
    return value;
}

bool get_flag(std::istream& in, const char* field) {
    const auto b = get<std::uint8_t>(in, field);
    if (b > 1) {
        throw StateFormatError(fmt::format("invalid {} flag {}", field, b));
    }
    return b == 1;
}

// ─── Records ──────────────────────────────────────────────────────────────────

TagRecord read_tag(std::istream& in) {
    TagRecord tag;
    tag.comoving = get_flag(in, "comoving");
    if (!get_flag(in, "cosmo_factor presence")) {
        return tag;
    }
    const auto num = get<std::int64_t>(in, "exponent numerator");
    const auto den = get<std::int64_t>(in, "exponent denominator");
    const auto a = get<double>(in, "scale factor");
    try {
        tag.cosmo_factor = ScaleFactorExponent(Rational(num, den), a);
    } catch (const InvalidConstruction& e) {
        throw StateFormatError(fmt::format("invalid cosmo_factor: {}", e.what()));
    }
    return tag;
}

QuantityState read_quantity(std::istream& in) {
    QuantityState q;

    const auto len = get<std::uint32_t>(in, "units length");
    if (len > MAX_UNITS_LENGTH) {
        throw StateFormatError(fmt::format("units length {} exceeds {}", len, MAX_UNITS_LENGTH));
    }
    q.units.resize(len);
    if (len > 0 && !in.read(q.units.data(), len)) {
        throw StateFormatError("truncated state while reading units");
    }

    const auto dtype = get<std::uint8_t>(in, "dtype");
    if (dtype > static_cast<std::uint8_t>(Dtype::boolean)) {
        throw StateFormatError(fmt::format("unknown dtype code {}", dtype));
    }
    q.dtype = static_cast<Dtype>(dtype);

    const auto ndim = get<std::uint8_t>(in, "ndim");
    if (ndim > 2) {
        throw StateFormatError(fmt::format("unsupported ndim {}", ndim));
    }
    q.ndim = ndim;

    const auto rows = get<std::uint64_t>(in, "rows");
    const auto cols = get<std::uint64_t>(in, "cols");
    if (cols != 0 && rows > constants::STATE_MAX_ELEMENTS / cols) {
        throw StateFormatError(fmt::format("shape ({}, {}) is too large", rows, cols));
    }
    const std::uint64_t count = rows * cols;
    if (count > constants::STATE_MAX_ELEMENTS) {
        throw StateFormatError(fmt::format("element count {} is too large", count));
    }
    if ((ndim == 0 && count != 1) || (ndim == 1 && cols != 1)) {
        throw StateFormatError(fmt::format("shape ({}, {}) is invalid for ndim {}", rows, cols, ndim));
    }
    q.rows = static_cast<std::int64_t>(rows);
    q.cols = static_cast<std::int64_t>(cols);

    // Grow with the data actually present rather than trusting the header.
    q.values.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(count, READ_CHUNK)));
    for (std::uint64_t i = 0; i < count; ++i) {
        q.values.push_back(get<double>(in, "values"));
    }
    return q;
}

} // anonymous namespace

// ─── Public API ───────────────────────────────────────────────────────────────

void write_state(std::ostream& out, const CosmoArray& array) {
    const ArrayState state = array.reduce_state();

    out.write(constants::STATE_MAGIC, sizeof(constants::STATE_MAGIC));
    put<std::uint32_t>(out, constants::STATE_VERSION);

    put<std::uint8_t>(out, state.tag.comoving ? 1 : 0);
    put<std::uint8_t>(out, state.tag.cosmo_factor ? 1 : 0);
    if (state.tag.cosmo_factor) {
        put<std::int64_t>(out, state.tag.cosmo_factor->expr().numerator());
        put<std::int64_t>(out, state.tag.cosmo_factor->expr().denominator());
        put<double>(out, state.tag.cosmo_factor->scale_factor());
    }

    const QuantityState& q = state.quantity;
    put<std::uint32_t>(out, static_cast<std::uint32_t>(q.units.size()));
    out.write(q.units.data(), static_cast<std::streamsize>(q.units.size()));
    put<std::uint8_t>(out, static_cast<std::uint8_t>(q.dtype));
    put<std::uint8_t>(out, static_cast<std::uint8_t>(q.ndim));
    put<std::uint64_t>(out, static_cast<std::uint64_t>(q.rows));
    put<std::uint64_t>(out, static_cast<std::uint64_t>(q.cols));
    for (double v : q.values) {
        put<double>(out, v);
    }
}

CosmoArray read_state(std::istream& in) {
    char magic[sizeof(constants::STATE_MAGIC)];
    if (!in.read(magic, sizeof(magic))) {
        throw StateFormatError("truncated state while reading magic");
    }
    if (std::memcmp(magic, constants::STATE_MAGIC, sizeof(magic)) != 0) {
        throw StateFormatError("bad magic: not a cosmotag array state");
    }
    const auto version = get<std::uint32_t>(in, "version");
    if (version != constants::STATE_VERSION) {
        throw StateFormatError(fmt::format("unsupported state version {}", version));
    }

    ArrayState state;
    state.tag = read_tag(in);
    state.quantity = read_quantity(in);

    try {
        return CosmoArray::from_state(state);
    } catch (const InvalidConstruction& e) {
        throw StateFormatError(fmt::format("invalid quantity state: {}", e.what()));
    }
}

std::string encode_state(const CosmoArray& array) {
    std::ostringstream out(std::ios::binary);
    write_state(out, array);
    return out.str();
}

CosmoArray decode_state(std::string_view bytes) {
    std::istringstream in(std::string(bytes), std::ios::binary);
    CosmoArray array = read_state(in);
    if (in.peek() != std::char_traits<char>::eof()) {
        throw StateFormatError("trailing bytes after array state");
    }
    return array;
}

} // namespace cosmotag
