#pragma once

/// @file include/execo/types.hpp
/// @brief Closed enumerations shared by the exergy and valuation modules.

#include <optional>
#include <string_view>

namespace execo {

// ─── End Use ──────────────────────────────────────────────────────────────────

/// Service delivered by an energy-conversion process.
///
/// Each category carries a fixed exergy quality (work potential per unit of
/// energy delivered):
///
/// | EndUse          | quality |
/// |-----------------|---------|
/// | Electricity     | 1.0     |
/// | MechanicalWork  | 1.0     |
/// | HighTempHeat    | 0.6     |  > 400 °C industrial heat
/// | MediumTempHeat  | 0.4     |  100–400 °C process heat
/// | LowTempHeat     | 0.2     |  < 100 °C space / water heating
/// | Chemical        | 0.9     |
enum class EndUse {
    Electricity,
    MechanicalWork,
    HighTempHeat,
    MediumTempHeat,
    LowTempHeat,
    Chemical,
};

/// Fixed exergy quality of an end use.
[[nodiscard]] constexpr double end_use_quality(EndUse use) noexcept {
    switch (use) {
        case EndUse::Electricity:    return 1.0;
        case EndUse::MechanicalWork: return 1.0;
        case EndUse::HighTempHeat:   return 0.6;
        case EndUse::MediumTempHeat: return 0.4;
        case EndUse::LowTempHeat:    return 0.2;
        case EndUse::Chemical:       return 0.9;
    }
    return 1.0;
}

/// True for the three heat categories (exergy follows the Carnot factor when
/// an output temperature is known).
[[nodiscard]] constexpr bool is_heat(EndUse use) noexcept {
    return use == EndUse::HighTempHeat
        || use == EndUse::MediumTempHeat
        || use == EndUse::LowTempHeat;
}

/// snake_case identifier, e.g. "high_temp_heat".
[[nodiscard]] std::string_view to_string(EndUse use) noexcept;

/// Parse a snake_case identifier (case-insensitive).
///
/// # Returns
/// `nullopt` for anything outside the six known names. Callers decide how
/// to handle typos; there is no silent fallback to `Electricity`.
[[nodiscard]] std::optional<EndUse> parse_end_use(std::string_view name);

// ─── Source Category ──────────────────────────────────────────────────────────

/// How an energy source's input exergy relates to its input energy.
enum class SourceCategory {
    Fuel,    ///< Combustible; exergy = 1.06 × LHV
    Direct,  ///< Direct conversion (wind, solar, hydro, nuclear); exergy = energy
    Other,   ///< Everything else; exergy = energy
};

[[nodiscard]] std::string_view to_string(SourceCategory category) noexcept;

} // namespace execo
