/// @file src/writer/writer_dataset.cpp
/// @brief Multi-type writer dataset and write planning.

#include "cosmotag/writer.hpp"

#include <fmt/format.h>

#include <cmath>

namespace cosmotag::writer {

WriterDataset::WriterDataset(WriterConfig config) : config_(std::move(config)) {
    if (config_.box_size.empty()) {
        throw InvalidConstruction("box size must have at least one value");
    }
    for (double b : config_.box_size) {
        if (!std::isfinite(b) || b <= 0.0) {
            throw InvalidConstruction(fmt::format("box size {} must be finite and positive", b));
        }
    }
    datasets_.reserve(constants::PARTICLE_TYPE_COUNT);
    for (ParticleType type : all_particle_types()) {
        datasets_.emplace_back(type, config_.unit_system);
    }
}

WriterDataset::WriterDataset(UnitSystem unit_system, std::vector<double> box_size, bool compress)
    : WriterDataset(WriterConfig{.unit_system = std::move(unit_system),
                                 .box_size    = std::move(box_size),
                                 .compress    = compress}) {}

ParticleDataset& WriterDataset::dataset(ParticleType type) noexcept {
    return datasets_[static_cast<std::size_t>(type)];
}

const ParticleDataset& WriterDataset::dataset(ParticleType type) const noexcept {
    return datasets_[static_cast<std::size_t>(type)];
}

WritePlan WriterDataset::plan() {
    WritePlan plan;
    plan.header.box_size = config_.box_size;

    for (ParticleDataset& d : datasets_) {
        if (d.check_empty()) {
            continue;
        }
        d.check_consistent();
        plan.types_to_write.push_back(d.type());
        plan.generate_ids = plan.generate_ids || d.requires_particle_ids_before_write();

        const auto n = static_cast<std::uint64_t>(d.n_part());
        const auto i = static_cast<std::size_t>(d.type());
        plan.header.num_part_total[i] = static_cast<std::int64_t>(n & 0xFFFFFFFFu);
        plan.header.num_part_total_high_word[i] = static_cast<std::int64_t>(n >> 32);
    }

    plan.units = units_attributes();
    return plan;
}

UnitsAttributes WriterDataset::units_attributes() const {
    const UnitSystem cgs = UnitSystem::cgs();
    auto to_cgs = [&](BaseDimension dim) {
        return config_.unit_system.base(dim).conversion_factor(cgs.base(dim));
    };
    return UnitsAttributes{
        .mass        = to_cgs(BaseDimension::mass),
        .length      = to_cgs(BaseDimension::length),
        .time        = to_cgs(BaseDimension::time),
        .current     = to_cgs(BaseDimension::current),
        .temperature = to_cgs(BaseDimension::temperature),
    };
}

} // namespace cosmotag::writer
