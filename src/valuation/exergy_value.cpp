/// @file src/valuation/exergy_value.cpp
/// @brief Exergy-adjusted value of production, and the combined assessment.

#include "execo/valuation.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>

namespace execo::valuation {

namespace {

constexpr std::array<std::string_view, 5> kCleanSources{
    "solar", "wind", "hydro", "nuclear", "geothermal"};

constexpr std::array<std::string_view, 3> kFossilSources{"coal", "oil", "gas"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& names, std::string_view name) {
    for (auto n : names) {
        if (n == name) return true;
    }
    return false;
}

} // namespace

PremiumClass classify_premium(std::string_view source) {
    const std::string lowered = exergy::to_lower(source);
    if (contains(kCleanSources, lowered))  return PremiumClass::Clean;
    if (contains(kFossilSources, lowered)) return PremiumClass::Fossil;
    return PremiumClass::Other;
}

std::string_view to_string(PremiumClass c) noexcept {
    switch (c) {
        case PremiumClass::Clean:  return "clean";
        case PremiumClass::Fossil: return "fossil";
        case PremiumClass::Other:  return "other";
    }
    return "unknown";
}

// ─── compute_exergy_value ─────────────────────────────────────────────────────

ExergyValue compute_exergy_value(double annual_production_mwh,
                                 std::string_view source, double unit_price,
                                 const exergy::SourceTable& table) {
    const exergy::ExergyAnalyzer analyzer(table);
    const auto analysis = analyzer.analyze(exergy::EnergyProcessInput{
        .energy_source   = std::string(source),
        .input_energy_mj = annual_production_mwh * constants::MJ_PER_MWH,
        .output_temp_k   = std::nullopt,
        .end_use         = EndUse::Electricity,
        .process_steps   = {},
    });

    const PremiumClass cls = classify_premium(source);
    const double premium = premium_factor(cls);
    const double nominal = annual_production_mwh * unit_price;

    return ExergyValue{
        .source                = std::string(source),
        .premium_class         = cls,
        .annual_production_mwh = annual_production_mwh,
        .nominal_value         = nominal,
        .exergy_efficiency     = analysis.second_law_efficiency,
        .exergy_adjusted_value = nominal * analysis.second_law_efficiency,
        .premium_factor        = premium,
        .true_value            = nominal * premium,
    };
}

std::string ExergyValue::insight() const {
    if (premium_class == PremiumClass::Clean) {
        return fmt::format("This {} project delivers {:.1f}x more thermodynamic "
                           "value than equivalent fossil fuel generation.",
                           source, premium_factor);
    }
    return "Consider the thermodynamic advantage of clean alternatives.";
}

std::string ExergyValue::to_string() const {
    return fmt::format(
        "Source             {:>16} ({})\n"
        "Annual production  {:>16.0f} MWh\n"
        "Nominal value      {:>16.2f} $\n"
        "Exergy efficiency  {:>16.4f}\n"
        "Exergy-adjusted    {:>16.2f} $\n"
        "Premium factor     {:>16.1f}x\n"
        "True value         {:>16.2f} $\n"
        "{}",
        source, valuation::to_string(premium_class), annual_production_mwh,
        nominal_value, exergy_efficiency, exergy_adjusted_value, premium_factor,
        true_value, insight());
}

// ─── assess_project ───────────────────────────────────────────────────────────

ProjectAssessment assess_project(const finance::ProjectAssumptions& assumptions,
                                 std::string_view source,
                                 const exergy::SourceTable& table) {
    auto financials = finance::compute_financials(assumptions);
    auto value = compute_exergy_value(financials.annual_production_mwh, source,
                                      assumptions.electricity_price_per_mwh, table);
    return ProjectAssessment{
        .financials   = std::move(financials),
        .exergy_value = std::move(value),
    };
}

std::string ProjectAssessment::to_string() const {
    return fmt::format("{}\n\n{}", financials.to_string(), exergy_value.to_string());
}

} // namespace execo::valuation
