/// @file src/writer/particle_dataset.cpp
/// @brief Particle-type metadata and per-type dataset validation.

#include "cosmotag/writer.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace cosmotag::writer {

// ─── Metadata ─────────────────────────────────────────────────────────────────

namespace {

constexpr std::array<ParticleType, constants::PARTICLE_TYPE_COUNT> ALL_TYPES{
    ParticleType::gas,   ParticleType::dark_matter, ParticleType::boundary,
    ParticleType::sinks, ParticleType::stars,       ParticleType::black_holes,
};

constexpr std::array<Field, 6> GAS_FIELDS{
    Field::coordinates,      Field::velocities,      Field::masses,
    Field::smoothing_length, Field::internal_energy, Field::particle_ids,
};

constexpr std::array<Field, 4> COLLISIONLESS_FIELDS{
    Field::coordinates, Field::velocities, Field::masses, Field::particle_ids,
};

constexpr std::array<Field, 5> SMOOTHED_FIELDS{
    Field::coordinates,      Field::velocities, Field::masses,
    Field::smoothing_length, Field::particle_ids,
};

} // anonymous namespace

const char* particle_name(ParticleType type) noexcept {
    switch (type) {
    case ParticleType::gas:         return "gas";
    case ParticleType::dark_matter: return "dark_matter";
    case ParticleType::boundary:    return "boundary";
    case ParticleType::sinks:       return "sinks";
    case ParticleType::stars:       return "stars";
    case ParticleType::black_holes: return "black_holes";
    }
    return "unknown";
}

std::string particle_handle(ParticleType type) {
    return fmt::format("PartType{}", static_cast<int>(type));
}

std::span<const ParticleType> all_particle_types() noexcept { return ALL_TYPES; }

const char* field_name(Field field) noexcept {
    switch (field) {
    case Field::coordinates:      return "coordinates";
    case Field::velocities:       return "velocities";
    case Field::masses:           return "masses";
    case Field::smoothing_length: return "smoothing_length";
    case Field::internal_energy:  return "internal_energy";
    case Field::particle_ids:     return "particle_ids";
    }
    return "unknown";
}

Dimensions field_dimensions(Field field) {
    switch (field) {
    case Field::coordinates:
    case Field::smoothing_length: return dimensions::length();
    case Field::velocities:       return dimensions::velocity();
    case Field::masses:           return dimensions::mass();
    case Field::internal_energy:  return dimensions::specific_energy();
    case Field::particle_ids:     return Dimensions();
    }
    return Dimensions();
}

std::span<const Field> required_fields(ParticleType type) noexcept {
    switch (type) {
    case ParticleType::gas:
        return GAS_FIELDS;
    case ParticleType::dark_matter:
    case ParticleType::boundary:
    case ParticleType::sinks:
        return COLLISIONLESS_FIELDS;
    case ParticleType::stars:
    case ParticleType::black_holes:
        return SMOOTHED_FIELDS;
    }
    return {};
}

bool requires_field(ParticleType type, Field field) noexcept {
    const auto fields = required_fields(type);
    return std::find(fields.begin(), fields.end(), field) != fields.end();
}

// ─── ParticleDataset ──────────────────────────────────────────────────────────

ParticleDataset::ParticleDataset(ParticleType type, UnitSystem unit_system)
    : type_(type), unit_system_(std::move(unit_system)) {}

const std::optional<CosmoArray>& ParticleDataset::get(Field field) const noexcept {
    return fields_[static_cast<std::size_t>(field)];
}

void ParticleDataset::set(Field field, CosmoArray value) {
    if (!requires_field(type_, field)) {
        throw DatasetError(fmt::format("{} particles have no field {}", name(), field_name(field)));
    }
    if (value.dtype() == Dtype::boolean) {
        throw InvalidConstruction(
            fmt::format("{}.{} must be a numeric quantity, not a boolean array",
                        name(), field_name(field)));
    }
    const Dimensions expected = field_dimensions(field);
    if (value.units().dimensions() != expected) {
        throw UnitIncompatible(fmt::format(
            "cannot assign '{}' with dimensions {} to {}.{}, which expects {}",
            value.units().expr(), value.units().dimensions().to_string(),
            name(), field_name(field), expected.to_string()));
    }
    if (field != Field::particle_ids) {
        value.convert_to_base(unit_system_);
    }
    fields_[static_cast<std::size_t>(field)] = std::move(value);
}

void ParticleDataset::clear(Field field) noexcept {
    fields_[static_cast<std::size_t>(field)].reset();
}

bool ParticleDataset::check_empty() const noexcept {
    for (Field f : required_fields(type_)) {
        if (get(f)) return false;
    }
    return true;
}

void ParticleDataset::check_consistent() {
    bool requires_ids = false;
    std::optional<Eigen::Index> length;
    Field first = Field::coordinates;

    for (Field f : required_fields(type_)) {
        const auto& value = get(f);
        if (!value) {
            if (f == Field::particle_ids) {
                requires_ids = true;
                continue;
            }
            throw DatasetError(fmt::format("required dataset {}.{} is not set", name(), field_name(f)));
        }
        if (!value->compatible_with_comoving()) {
            throw DatasetError(fmt::format(
                "{}.{} is physical and scale-dependent; convert it to comoving first",
                name(), field_name(f)));
        }
        const Eigen::Index n = (value->ndim() == 0) ? 1 : value->value().rows();
        if (!length) {
            length = n;
            first = f;
        } else if (*length != n) {
            throw DatasetError(fmt::format(
                "arrays passed to the {} dataset are not of the same size: {} has {}, {} has {}",
                name(), field_name(first), *length, field_name(f), n));
        }
    }

    n_part_ = length.value_or(0);
    requires_ids_ = requires_ids;
}

} // namespace cosmotag::writer
