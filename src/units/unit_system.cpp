/// @file src/units/unit_system.cpp
/// @brief Built-in unit systems and base-unit lookup.

#include "cosmotag/units.hpp"

namespace cosmotag {

UnitSystem::UnitSystem(std::string name,
                       Unit mass,
                       Unit length,
                       Unit time,
                       Unit temperature,
                       Unit current)
    : name_(std::move(name))
    , base_{std::move(mass), std::move(length), std::move(time),
            std::move(temperature), std::move(current)} {}

UnitSystem UnitSystem::cgs() {
    return UnitSystem("cgs",
                      Unit::parse("g"), Unit::parse("cm"), Unit::parse("s"),
                      Unit::parse("K"), Unit::parse("A"));
}

UnitSystem UnitSystem::mks() {
    return UnitSystem("mks",
                      Unit::parse("kg"), Unit::parse("m"), Unit::parse("s"),
                      Unit::parse("K"), Unit::parse("A"));
}

UnitSystem UnitSystem::cosmo() {
    return UnitSystem("cosmo",
                      Unit::parse("1e10*Msun"), Unit::parse("Mpc"), Unit::parse("Gyr"),
                      Unit::parse("K"), Unit::parse("A"));
}

std::optional<UnitSystem> UnitSystem::named(std::string_view name) {
    if (name == "cgs")   return cgs();
    if (name == "mks")   return mks();
    if (name == "cosmo") return cosmo();
    return std::nullopt;
}

Unit UnitSystem::unit_for(const Dimensions& dims) const {
    Unit result;
    for (std::size_t i = 0; i < BASE_DIMENSION_COUNT; ++i) {
        const Rational& e = dims[static_cast<BaseDimension>(i)];
        if (e.is_zero()) continue;
        result = result.multiply(base_[i].pow(e));
    }
    return result;
}

} // namespace cosmotag
