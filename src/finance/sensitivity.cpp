/// @file src/finance/sensitivity.cpp
/// @brief One-at-a-time sensitivity sweeps and tornado ranking.

#include "execo/finance.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <string>

namespace execo::finance {

// ─── Parameter names ──────────────────────────────────────────────────────────

namespace {

struct ParameterName {
    Parameter        parameter;
    std::string_view name;
};

constexpr std::array<ParameterName, 21> kParameterNames{{
    {Parameter::CapacityMw,             "capacity_mw"},
    {Parameter::CapacityFactor,         "capacity_factor"},
    {Parameter::AnnualProductionMwh,    "annual_production_mwh"},
    {Parameter::CapexPerKw,             "capex_per_kw"},
    {Parameter::InstallationFactor,     "installation_factor"},
    {Parameter::LandCost,               "land_cost"},
    {Parameter::GridConnectionCost,     "grid_connection_cost"},
    {Parameter::OpexPerKwYear,          "opex_per_kw_year"},
    {Parameter::FixedOpexAnnual,        "fixed_opex_annual"},
    {Parameter::VariableOpexPerMwh,     "variable_opex_per_mwh"},
    {Parameter::InsuranceRate,          "insurance_rate"},
    {Parameter::ProjectLifetimeYears,   "project_lifetime_years"},
    {Parameter::DiscountRate,           "discount_rate"},
    {Parameter::DebtRatio,              "debt_ratio"},
    {Parameter::InterestRate,           "interest_rate"},
    {Parameter::TaxRate,                "tax_rate"},
    {Parameter::DepreciationYears,      "depreciation_years"},
    {Parameter::ElectricityPricePerMwh, "electricity_price_per_mwh"},
    {Parameter::PriceEscalationRate,    "price_escalation_rate"},
    {Parameter::CarbonCreditPerTon,     "carbon_credit_per_ton"},
    {Parameter::CarbonIntensityAvoided, "carbon_intensity_avoided"},
}};

constexpr std::array<Parameter, 21> kAllParameters = [] {
    std::array<Parameter, 21> out{};
    for (std::size_t i = 0; i < kParameterNames.size(); ++i) {
        out[i] = kParameterNames[i].parameter;
    }
    return out;
}();

} // namespace

std::string_view to_string(Parameter p) noexcept {
    for (const auto& entry : kParameterNames) {
        if (entry.parameter == p) return entry.name;
    }
    return "unknown";
}

std::optional<Parameter> parse_parameter(std::string_view name) noexcept {
    for (const auto& entry : kParameterNames) {
        if (entry.name == name) return entry.parameter;
    }
    return std::nullopt;
}

std::span<const Parameter> all_parameters() noexcept {
    return kAllParameters;
}

// ─── Get / set ────────────────────────────────────────────────────────────────

double parameter_value(const ProjectAssumptions& a, Parameter p) noexcept {
    switch (p) {
        case Parameter::CapacityMw:             return a.capacity_mw;
        case Parameter::CapacityFactor:         return a.capacity_factor;
        case Parameter::AnnualProductionMwh:
            if (a.annual_production_mwh && *a.annual_production_mwh > 0.0) {
                return *a.annual_production_mwh;
            }
            return constants::HOURS_PER_YEAR * a.capacity_factor * a.capacity_mw;
        case Parameter::CapexPerKw:             return a.capex_per_kw;
        case Parameter::InstallationFactor:     return a.installation_factor;
        case Parameter::LandCost:               return a.land_cost;
        case Parameter::GridConnectionCost:     return a.grid_connection_cost;
        case Parameter::OpexPerKwYear:          return a.opex_per_kw_year;
        case Parameter::FixedOpexAnnual:        return a.fixed_opex_annual;
        case Parameter::VariableOpexPerMwh:     return a.variable_opex_per_mwh;
        case Parameter::InsuranceRate:          return a.insurance_rate;
        case Parameter::ProjectLifetimeYears:   return a.project_lifetime_years;
        case Parameter::DiscountRate:           return a.discount_rate;
        case Parameter::DebtRatio:              return a.debt_ratio;
        case Parameter::InterestRate:           return a.interest_rate;
        case Parameter::TaxRate:                return a.tax_rate;
        case Parameter::DepreciationYears:      return a.depreciation_years;
        case Parameter::ElectricityPricePerMwh: return a.electricity_price_per_mwh;
        case Parameter::PriceEscalationRate:    return a.price_escalation_rate;
        case Parameter::CarbonCreditPerTon:     return a.carbon_credit_per_ton;
        case Parameter::CarbonIntensityAvoided: return a.carbon_intensity_avoided;
    }
    return 0.0;
}

ProjectAssumptions with_parameter(ProjectAssumptions a, Parameter p, double value) {
    const auto as_int = [p](double v) {
        if (!(std::abs(v) <= static_cast<double>(std::numeric_limits<int>::max()))) {
            throw ValidationError(std::string(to_string(p)),
                                  fmt::format("{} is outside the integer range", v));
        }
        return static_cast<int>(std::lround(v));
    };

    // Zero production would read as "compute from capacity factor".
    if (p == Parameter::AnnualProductionMwh && !(value > 0.0)) {
        throw ValidationError("annual_production_mwh",
                              fmt::format("must be > 0 (got {})", value));
    }

    switch (p) {
        case Parameter::CapacityMw:             a.capacity_mw = value; break;
        case Parameter::CapacityFactor:         a.capacity_factor = value; break;
        case Parameter::AnnualProductionMwh:    a.annual_production_mwh = value; break;
        case Parameter::CapexPerKw:             a.capex_per_kw = value; break;
        case Parameter::InstallationFactor:     a.installation_factor = value; break;
        case Parameter::LandCost:               a.land_cost = value; break;
        case Parameter::GridConnectionCost:     a.grid_connection_cost = value; break;
        case Parameter::OpexPerKwYear:          a.opex_per_kw_year = value; break;
        case Parameter::FixedOpexAnnual:        a.fixed_opex_annual = value; break;
        case Parameter::VariableOpexPerMwh:     a.variable_opex_per_mwh = value; break;
        case Parameter::InsuranceRate:          a.insurance_rate = value; break;
        case Parameter::ProjectLifetimeYears:   a.project_lifetime_years = as_int(value); break;
        case Parameter::DiscountRate:           a.discount_rate = value; break;
        case Parameter::DebtRatio:              a.debt_ratio = value; break;
        case Parameter::InterestRate:           a.interest_rate = value; break;
        case Parameter::TaxRate:                a.tax_rate = value; break;
        case Parameter::DepreciationYears:      a.depreciation_years = as_int(value); break;
        case Parameter::ElectricityPricePerMwh: a.electricity_price_per_mwh = value; break;
        case Parameter::PriceEscalationRate:    a.price_escalation_rate = value; break;
        case Parameter::CarbonCreditPerTon:     a.carbon_credit_per_ton = value; break;
        case Parameter::CarbonIntensityAvoided: a.carbon_intensity_avoided = value; break;
    }
    return a;
}

// ─── run_sensitivity ──────────────────────────────────────────────────────────

SensitivityResult run_sensitivity(const ProjectAssumptions& base,
                                  Parameter parameter,
                                  std::span<const double> variations_pct) {
    if (auto err = validate(base)) throw *err;

    const double base_value = parameter_value(base, parameter);

    // Build and validate every scaled set up front: the constructor throws,
    // so nothing below can fail on input.
    std::vector<FinancialEngine> engines;
    engines.reserve(variations_pct.size());
    for (double pct : variations_pct) {
        const double scaled = base_value * (1.0 + pct / 100.0);
        engines.emplace_back(with_parameter(base, parameter, scaled));
    }

    SensitivityResult out{
        .parameter  = parameter,
        .variations = std::vector<double>(variations_pct.begin(), variations_pct.end()),
        .lcoe       = std::vector<double>(engines.size()),
        .npv        = std::vector<double>(engines.size()),
    };

    const auto count = static_cast<std::ptrdiff_t>(engines.size());
#ifdef EXECO_HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (std::ptrdiff_t i = 0; i < count; ++i) {
        const auto result = engines[static_cast<std::size_t>(i)].calculate();
        out.lcoe[static_cast<std::size_t>(i)] = result.lcoe;
        out.npv[static_cast<std::size_t>(i)]  = result.npv;
    }

    return out;
}

SensitivityResult run_sensitivity(const ProjectAssumptions& base,
                                  std::string_view parameter_name,
                                  std::span<const double> variations_pct) {
    const auto parameter = parse_parameter(parameter_name);
    if (!parameter) {
        throw ValidationError(std::string(parameter_name),
                              "unknown sensitivity parameter");
    }
    return run_sensitivity(base, *parameter, variations_pct);
}

// ─── Tornado ──────────────────────────────────────────────────────────────────

double TornadoBar::npv_swing() const noexcept {
    return std::abs(npv_high - npv_low);
}

std::vector<TornadoBar> run_tornado(const ProjectAssumptions& base,
                                    std::span<const Parameter> parameters,
                                    double pct) {
    const std::array<double, 2> range{-pct, pct};

    std::vector<TornadoBar> bars;
    bars.reserve(parameters.size());
    for (Parameter p : parameters) {
        const auto sweep = run_sensitivity(base, p, range);
        bars.push_back(TornadoBar{
            .parameter = p,
            .lcoe_low  = sweep.lcoe[0],
            .lcoe_high = sweep.lcoe[1],
            .npv_low   = sweep.npv[0],
            .npv_high  = sweep.npv[1],
        });
    }

    std::stable_sort(bars.begin(), bars.end(),
                     [](const TornadoBar& lhs, const TornadoBar& rhs) {
                         return lhs.npv_swing() > rhs.npv_swing();
                     });
    return bars;
}

} // namespace execo::finance
