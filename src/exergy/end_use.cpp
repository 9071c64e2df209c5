/// @file src/exergy/end_use.cpp
/// @brief EndUse names.

#include "execo/types.hpp"
#include "execo/exergy.hpp"

#include <array>
#include <utility>

namespace execo {

namespace {

constexpr std::array<std::pair<EndUse, std::string_view>, 6> kEndUseNames{{
    {EndUse::Electricity,    "electricity"},
    {EndUse::MechanicalWork, "mechanical_work"},
    {EndUse::HighTempHeat,   "high_temp_heat"},
    {EndUse::MediumTempHeat, "medium_temp_heat"},
    {EndUse::LowTempHeat,    "low_temp_heat"},
    {EndUse::Chemical,       "chemical"},
}};

} // namespace

std::string_view to_string(EndUse use) noexcept {
    for (const auto& [value, name] : kEndUseNames) {
        if (value == use) return name;
    }
    return "unknown";
}

std::optional<EndUse> parse_end_use(std::string_view name) {
    const std::string lowered = exergy::to_lower(name);
    for (const auto& [value, known] : kEndUseNames) {
        if (known == lowered) return value;
    }
    return std::nullopt;
}

} // namespace execo
