#pragma once

/// @file include/cosmotag/writer.hpp
/// @brief Validation and planning for initial-condition particle datasets.
///
/// # Module: Writer
///
/// ## Responsibility
/// Collect the particle arrays needed to start a simulation, one
/// `ParticleDataset` per particle type, and check them before anything is
/// written:
///   - every field has the expected dimensions and is converted to the
///     dataset's unit system on assignment
///   - every required field (apart from particle IDs) is present
///   - all fields of a type have the same length
///   - all fields are usable as comoving data
///
/// `WriterDataset::plan()` then reports what a file writer would emit: the
/// particle types, per-type counts, whether IDs must be generated, and the
/// `Header` and `Units` attribute values.
///
/// ## Guarantees
/// - The field list of each particle type is fixed at compile time
/// - Invalid assignments raise `UnitIncompatible`, `InvalidConstruction`
///   or `DatasetError` and leave the dataset unchanged
///
/// ## NOT Responsible For
/// - HDF5 output and particle-ID generation

#include "cosmotag/constants.hpp"
#include "cosmotag/cosmo_array.hpp"
#include "cosmotag/units.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cosmotag::writer {

// ─── Metadata ─────────────────────────────────────────────────────────────────

enum class ParticleType : std::uint8_t {
    gas = 0,
    dark_matter = 1,
    boundary = 2,
    sinks = 3,
    stars = 4,
    black_holes = 5,
};

enum class Field : std::uint8_t {
    coordinates = 0,
    velocities = 1,
    masses = 2,
    smoothing_length = 3,
    internal_energy = 4,
    particle_ids = 5,
};

static constexpr std::size_t FIELD_COUNT = 6;

/// "gas", "dark_matter", ...
[[nodiscard]] const char* particle_name(ParticleType type) noexcept;

/// Group name in a snapshot file: "PartType0", "PartType1", ...
[[nodiscard]] std::string particle_handle(ParticleType type);

/// Every particle type, in type-number order.
[[nodiscard]] std::span<const ParticleType> all_particle_types() noexcept;

/// "coordinates", "velocities", ...
[[nodiscard]] const char* field_name(Field field) noexcept;

/// Expected dimensions of a field (particle IDs are dimensionless).
[[nodiscard]] Dimensions field_dimensions(Field field);

/// Required fields of a particle type, in write order.
[[nodiscard]] std::span<const Field> required_fields(ParticleType type) noexcept;

[[nodiscard]] bool requires_field(ParticleType type, Field field) noexcept;

// ─── ParticleDataset ──────────────────────────────────────────────────────────

/// The required arrays of one particle type.
class ParticleDataset {
public:
    ParticleDataset(ParticleType type, UnitSystem unit_system);

    [[nodiscard]] ParticleType type() const noexcept { return type_; }
    [[nodiscard]] const char* name() const noexcept { return particle_name(type_); }
    [[nodiscard]] const UnitSystem& unit_system() const noexcept { return unit_system_; }

    /// Stored value of a field, if set.
    [[nodiscard]] const std::optional<CosmoArray>& get(Field field) const noexcept;

    /// Validate and store a field, converted to the dataset's unit system.
    ///
    /// # Throws
    /// - `DatasetError` if this particle type does not use `field`
    /// - `InvalidConstruction` for boolean arrays
    /// - `UnitIncompatible` if the dimensions do not match
    void set(Field field, CosmoArray value);

    /// Forget a field.
    void clear(Field field) noexcept;

    // Typed accessors.
    [[nodiscard]] const std::optional<CosmoArray>& coordinates() const noexcept { return get(Field::coordinates); }
    [[nodiscard]] const std::optional<CosmoArray>& velocities() const noexcept { return get(Field::velocities); }
    [[nodiscard]] const std::optional<CosmoArray>& masses() const noexcept { return get(Field::masses); }
    [[nodiscard]] const std::optional<CosmoArray>& smoothing_length() const noexcept { return get(Field::smoothing_length); }
    [[nodiscard]] const std::optional<CosmoArray>& internal_energy() const noexcept { return get(Field::internal_energy); }
    [[nodiscard]] const std::optional<CosmoArray>& particle_ids() const noexcept { return get(Field::particle_ids); }

    void set_coordinates(CosmoArray v) { set(Field::coordinates, std::move(v)); }
    void set_velocities(CosmoArray v) { set(Field::velocities, std::move(v)); }
    void set_masses(CosmoArray v) { set(Field::masses, std::move(v)); }
    void set_smoothing_length(CosmoArray v) { set(Field::smoothing_length, std::move(v)); }
    void set_internal_energy(CosmoArray v) { set(Field::internal_energy, std::move(v)); }
    void set_particle_ids(CosmoArray v) { set(Field::particle_ids, std::move(v)); }

    void clear_coordinates() noexcept { clear(Field::coordinates); }
    void clear_velocities() noexcept { clear(Field::velocities); }
    void clear_masses() noexcept { clear(Field::masses); }
    void clear_smoothing_length() noexcept { clear(Field::smoothing_length); }
    void clear_internal_energy() noexcept { clear(Field::internal_energy); }
    void clear_particle_ids() noexcept { clear(Field::particle_ids); }

    /// No required field is set.
    [[nodiscard]] bool check_empty() const noexcept;

    /// Verify the dataset can be written; on success record `n_part()` and
    /// `requires_particle_ids_before_write()`.
    ///
    /// # Throws
    /// `DatasetError` if a required field other than particle_ids is missing,
    /// the fields differ in length, or a field is not comoving-compatible.
    void check_consistent();

    /// Particle count; zero until `check_consistent()` has succeeded.
    [[nodiscard]] std::int64_t n_part() const noexcept { return n_part_; }

    /// True when particle_ids was left unset.
    [[nodiscard]] bool requires_particle_ids_before_write() const noexcept {
        return requires_ids_;
    }

private:
    ParticleType type_;
    UnitSystem unit_system_;
    std::array<std::optional<CosmoArray>, FIELD_COUNT> fields_;
    std::int64_t n_part_ = 0;
    bool requires_ids_ = false;
};

// ─── WriterDataset ────────────────────────────────────────────────────────────

/// Runtime configuration of a writer.
struct WriterConfig {
    UnitSystem unit_system = UnitSystem::cgs();
    std::vector<double> box_size;  ///< in unit_system length units; one value or one per axis
    bool compress = true;
};

/// Values of the snapshot `Header` group.
struct HeaderAttributes {
    std::vector<double> box_size;
    std::array<std::int64_t, constants::PARTICLE_TYPE_COUNT> num_part_total{};
    std::array<std::int64_t, constants::PARTICLE_TYPE_COUNT> num_part_total_high_word{};
    int flag_entropy_ics = 0;
};

/// Values of the snapshot `Units` group: each base unit in cgs.
struct UnitsAttributes {
    double mass = 1.0;         ///< U_M
    double length = 1.0;       ///< U_L
    double time = 1.0;         ///< U_t
    double current = 1.0;      ///< U_I
    double temperature = 1.0;  ///< U_T
};

/// Everything a file writer needs besides the arrays themselves.
struct WritePlan {
    std::vector<ParticleType> types_to_write;
    bool generate_ids = false;
    HeaderAttributes header;
    UnitsAttributes units;
};

/// One ParticleDataset per particle type, sharing a unit system.
class WriterDataset {
public:
    /// Throws `InvalidConstruction` if the box size is empty or not positive.
    explicit WriterDataset(WriterConfig config);
    WriterDataset(UnitSystem unit_system, std::vector<double> box_size, bool compress = true);

    [[nodiscard]] ParticleDataset& dataset(ParticleType type) noexcept;
    [[nodiscard]] const ParticleDataset& dataset(ParticleType type) const noexcept;

    [[nodiscard]] ParticleDataset& gas() noexcept { return dataset(ParticleType::gas); }
    [[nodiscard]] ParticleDataset& dark_matter() noexcept { return dataset(ParticleType::dark_matter); }
    [[nodiscard]] ParticleDataset& boundary() noexcept { return dataset(ParticleType::boundary); }
    [[nodiscard]] ParticleDataset& sinks() noexcept { return dataset(ParticleType::sinks); }
    [[nodiscard]] ParticleDataset& stars() noexcept { return dataset(ParticleType::stars); }
    [[nodiscard]] ParticleDataset& black_holes() noexcept { return dataset(ParticleType::black_holes); }

    [[nodiscard]] const WriterConfig& config() const noexcept { return config_; }

    /// Check every non-empty dataset and describe the file to be written.
    /// Propagates `DatasetError` from `check_consistent()`.
    [[nodiscard]] WritePlan plan();

    /// `Units` attributes for the configured unit system.
    [[nodiscard]] UnitsAttributes units_attributes() const;

private:
    WriterConfig config_;
    std::vector<ParticleDataset> datasets_;
};

} // namespace cosmotag::writer
