#pragma once

/// @file include/execo/valuation.hpp
/// @brief Composition layer: exergy-adjusted value of energy production.
///
/// Joins the two engines: the exergy analysis of a year's output and the
/// nominal revenue it earns.
///
/// The premium multiplier is a coarse lookup by source class (clean 3.0,
/// fossil 1.0, other 1.5). It is not derived from the
/// second-law efficiency computed in the same call; the two numbers answer
/// different questions and callers see both.

#include "execo/constants.hpp"
#include "execo/exergy.hpp"
#include "execo/finance.hpp"

#include <string>
#include <string_view>

namespace execo::valuation {

/// Premium class of a source.
enum class PremiumClass {
    Clean,   ///< solar, wind, hydro, nuclear, geothermal
    Fossil,  ///< coal, oil, gas
    Other,   ///< everything else, including biomass
};

/// Case-insensitive classification of `source`.
[[nodiscard]] PremiumClass classify_premium(std::string_view source);

[[nodiscard]] constexpr double premium_factor(PremiumClass c) noexcept {
    switch (c) {
        case PremiumClass::Clean:  return constants::CLEAN_PREMIUM_FACTOR;
        case PremiumClass::Fossil: return constants::FOSSIL_PREMIUM_FACTOR;
        case PremiumClass::Other:  return constants::OTHER_PREMIUM_FACTOR;
    }
    return constants::OTHER_PREMIUM_FACTOR;
}

[[nodiscard]] std::string_view to_string(PremiumClass c) noexcept;

/// Exergy-economic value of one year of production.
struct ExergyValue {
    std::string  source;
    PremiumClass premium_class;

    double annual_production_mwh;
    double nominal_value;          ///< production × unit price
    double exergy_efficiency;      ///< η_II of the production as electricity
    double exergy_adjusted_value;  ///< nominal × η_II
    double premium_factor;         ///< class lookup, see PremiumClass
    double true_value;             ///< nominal × premium_factor

    [[nodiscard]] std::string insight() const;
    [[nodiscard]] std::string to_string() const;
};

/// Value `annual_production_mwh` of output from `source` sold at
/// `unit_price` ($/MWh).
[[nodiscard]] ExergyValue
compute_exergy_value(double annual_production_mwh, std::string_view source,
                     double unit_price = constants::DEFAULT_ELECTRICITY_PRICE,
                     const exergy::SourceTable& table = exergy::SourceTable::standard());

/// Financial and exergy view of the same project.
struct ProjectAssessment {
    finance::FinancialResult financials;
    ExergyValue              exergy_value;

    [[nodiscard]] std::string to_string() const;
};

/// Compute the financials of `assumptions` and value their annual production
/// as output of `source` at the project electricity price.
///
/// # Throws
/// `ValidationError` for invalid assumptions.
[[nodiscard]] ProjectAssessment
assess_project(const finance::ProjectAssumptions& assumptions,
               std::string_view source,
               const exergy::SourceTable& table = exergy::SourceTable::standard());

} // namespace execo::valuation
