#include <gtest/gtest.h>
#include "cosmotag/writer.hpp"
#include <cstdint>
#include <vector>

using namespace cosmotag;
using namespace cosmotag::writer;

namespace {

TagState comoving_a(std::int64_t n) {
    return TagState{.comoving = true, .cosmo_factor = ScaleFactorExponent(Rational(n), 0.5)};
}

CosmoArray positions(std::size_t n) {
    std::vector<std::vector<double>> rows(n, std::vector<double>{1.0, 2.0, 3.0});
    return CosmoArray(rows, "Mpc", comoving_a(1));
}

CosmoArray velocities(std::size_t n) {
    std::vector<std::vector<double>> rows(n, std::vector<double>{0.0, 1.0, 0.0});
    return CosmoArray(rows, "km/s", comoving_a(0));
}

CosmoArray masses(std::size_t n) {
    return CosmoArray(std::vector<double>(n, 1.0), "1e10*Msun", comoving_a(0));
}

void fill_dark_matter(ParticleDataset& d, std::size_t n) {
    d.set_coordinates(positions(n));
    d.set_velocities(velocities(n));
    d.set_masses(masses(n));
}

} // anonymous namespace

// ─── Metadata ─────────────────────────────────────────────────────────────────

TEST(Writer_Metadata, ParticleNamesAndHandles) {
    EXPECT_STREQ(particle_name(ParticleType::gas), "gas");
    EXPECT_STREQ(particle_name(ParticleType::black_holes), "black_holes");
    EXPECT_EQ(particle_handle(ParticleType::gas), "PartType0");
    EXPECT_EQ(particle_handle(ParticleType::black_holes), "PartType5");
    EXPECT_EQ(all_particle_types().size(), 6u);
}

TEST(Writer_Metadata, RequiredFieldsPerType) {
    EXPECT_TRUE(requires_field(ParticleType::gas, Field::internal_energy));
    EXPECT_TRUE(requires_field(ParticleType::gas, Field::smoothing_length));
    EXPECT_FALSE(requires_field(ParticleType::dark_matter, Field::smoothing_length));
    EXPECT_TRUE(requires_field(ParticleType::stars, Field::smoothing_length));
    EXPECT_FALSE(requires_field(ParticleType::stars, Field::internal_energy));
    for (ParticleType t : all_particle_types()) {
        EXPECT_TRUE(requires_field(t, Field::particle_ids)) << particle_name(t);
        EXPECT_TRUE(requires_field(t, Field::coordinates)) << particle_name(t);
    }
}

TEST(Writer_Metadata, FieldDimensions) {
    EXPECT_EQ(field_dimensions(Field::coordinates), dimensions::length());
    EXPECT_EQ(field_dimensions(Field::velocities), dimensions::velocity());
    EXPECT_EQ(field_dimensions(Field::internal_energy), dimensions::specific_energy());
    EXPECT_TRUE(field_dimensions(Field::particle_ids).is_dimensionless());
}

// ─── ParticleDataset::set ─────────────────────────────────────────────────────

TEST(Writer_Set, ConvertsToDatasetUnits) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cgs());
    d.set_masses(CosmoArray(std::vector<double>{1.0}, "g", comoving_a(0)));
    d.set_coordinates(CosmoArray(std::vector<std::vector<double>>{{1.0, 0.0, 0.0}}, "km", comoving_a(1)));
    ASSERT_TRUE(d.coordinates().has_value());
    EXPECT_EQ(d.coordinates()->units(), Unit::parse("cm"));
    EXPECT_NEAR(d.coordinates()->value()(0, 0), 1e5, 1e-6);
    EXPECT_TRUE(d.coordinates()->comoving());
}

TEST(Writer_Set, WrongDimensions_Throws) {
    ParticleDataset d(ParticleType::gas, UnitSystem::cgs());
    EXPECT_THROW(d.set_coordinates(CosmoArray(std::vector<double>{1.0}, "s")), UnitIncompatible);
    EXPECT_FALSE(d.coordinates().has_value());
    EXPECT_THROW(d.set_particle_ids(CosmoArray(std::vector<double>{1.0}, "kpc")), UnitIncompatible);
}

TEST(Writer_Set, BooleanArray_Throws) {
    ParticleDataset d(ParticleType::gas, UnitSystem::cgs());
    EXPECT_THROW(d.set_masses(CosmoArray(std::vector<double>{1.0}, "g", {}, Dtype::boolean)), InvalidConstruction);
}

TEST(Writer_Set, FieldNotUsedByType_Throws) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cgs());
    EXPECT_THROW(d.set_internal_energy(CosmoArray(std::vector<double>{1.0}, "km**2/s**2")), DatasetError);
}

TEST(Writer_Set, ParticleIdsAreNotConverted) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cosmo());
    d.set_particle_ids(CosmoArray({1.0, 2.0}, ""));
    EXPECT_EQ(d.particle_ids()->to_vector(), (std::vector<double>{1.0, 2.0}));
}

TEST(Writer_Set, ClearForgetsField) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cgs());
    d.set_masses(masses(2));
    d.clear_masses();
    EXPECT_FALSE(d.masses().has_value());
    EXPECT_TRUE(d.check_empty());
}

// ─── check_consistent ─────────────────────────────────────────────────────────

TEST(Writer_Consistent, CompleteDatasetRecordsCount) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cgs());
    fill_dark_matter(d, 4);
    EXPECT_FALSE(d.check_empty());
    d.check_consistent();
    EXPECT_EQ(d.n_part(), 4);
    EXPECT_TRUE(d.requires_particle_ids_before_write());

    d.set_particle_ids(CosmoArray({1.0, 2.0, 3.0, 4.0}, ""));
    d.check_consistent();
    EXPECT_FALSE(d.requires_particle_ids_before_write());
}

TEST(Writer_Consistent, MissingRequiredField_Throws) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cgs());
    d.set_coordinates(positions(2));
    d.set_masses(masses(2));
    EXPECT_THROW(d.check_consistent(), DatasetError);
}

TEST(Writer_Consistent, LengthMismatch_Throws) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cgs());
    d.set_coordinates(positions(3));
    d.set_velocities(velocities(3));
    d.set_masses(masses(2));
    EXPECT_THROW(d.check_consistent(), DatasetError);
}

TEST(Writer_Consistent, PhysicalScalingField_Throws) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cgs());
    fill_dark_matter(d, 2);
    d.set_coordinates(positions(2).to_physical());
    EXPECT_THROW(d.check_consistent(), DatasetError);
}

TEST(Writer_Consistent, PhysicalScaleFreeFieldAccepted) {
    ParticleDataset d(ParticleType::dark_matter, UnitSystem::cgs());
    fill_dark_matter(d, 2);
    CosmoArray m = masses(2);
    m.convert_to_physical();
    d.set_masses(m);
    EXPECT_NO_THROW(d.check_consistent());
}

// ─── WriterDataset ────────────────────────────────────────────────────────────

TEST(Writer_Dataset, InvalidBoxSize_Throws) {
    EXPECT_THROW(WriterDataset(UnitSystem::cgs(), {}), InvalidConstruction);
    EXPECT_THROW(WriterDataset(UnitSystem::cgs(), {1.0, -1.0, 1.0}), InvalidConstruction);
}

TEST(Writer_Dataset, DatasetsShareUnitSystem) {
    WriterDataset w(UnitSystem::cosmo(), {100.0});
    for (ParticleType t : all_particle_types()) {
        EXPECT_EQ(w.dataset(t).unit_system().name(), "cosmo");
        EXPECT_EQ(w.dataset(t).type(), t);
    }
    EXPECT_EQ(w.stars().type(), ParticleType::stars);
}

TEST(Writer_Plan, WritesOnlyNonEmptyTypes) {
    WriterDataset w(UnitSystem::cgs(), {1e25, 1e25, 1e25});
    fill_dark_matter(w.dark_matter(), 3);

    WritePlan plan = w.plan();
    ASSERT_EQ(plan.types_to_write.size(), 1u);
    EXPECT_EQ(plan.types_to_write[0], ParticleType::dark_matter);
    EXPECT_TRUE(plan.generate_ids);
    EXPECT_EQ(plan.header.num_part_total[1], 3);
    EXPECT_EQ(plan.header.num_part_total[0], 0);
    EXPECT_EQ(plan.header.num_part_total_high_word[1], 0);
    EXPECT_EQ(plan.header.box_size.size(), 3u);
    EXPECT_EQ(plan.header.flag_entropy_ics, 0);
}

TEST(Writer_Plan, GenerateIdsIfAnyTypeLacksThem) {
    WriterDataset w(UnitSystem::cgs(), {1.0});
    fill_dark_matter(w.dark_matter(), 2);
    w.dark_matter().set_particle_ids(CosmoArray({1.0, 2.0}, ""));
    fill_dark_matter(w.boundary(), 1);

    EXPECT_TRUE(w.plan().generate_ids);

    w.boundary().set_particle_ids(CosmoArray(std::vector<double>{3.0}, ""));
    EXPECT_FALSE(w.plan().generate_ids);
}

TEST(Writer_Plan, InconsistentTypePropagates) {
    WriterDataset w(UnitSystem::cgs(), {1.0});
    w.gas().set_coordinates(positions(2));
    EXPECT_THROW((void)w.plan(), DatasetError);
}

TEST(Writer_Units, CgsIsUnity) {
    UnitsAttributes u = WriterDataset(UnitSystem::cgs(), {1.0}).units_attributes();
    EXPECT_DOUBLE_EQ(u.mass, 1.0);
    EXPECT_DOUBLE_EQ(u.length, 1.0);
    EXPECT_DOUBLE_EQ(u.time, 1.0);
    EXPECT_DOUBLE_EQ(u.current, 1.0);
    EXPECT_DOUBLE_EQ(u.temperature, 1.0);
}

TEST(Writer_Units, CosmoSystemInCgs) {
    UnitsAttributes u = WriterDataset(UnitSystem::cosmo(), {1.0}).units_attributes();
    EXPECT_NEAR(u.length / 3.0856775814913673e24, 1.0, 1e-12);
    EXPECT_NEAR(u.mass / 1.98841586e43, 1.0, 1e-12);
    EXPECT_NEAR(u.time / 3.15576e16, 1.0, 1e-12);
}
