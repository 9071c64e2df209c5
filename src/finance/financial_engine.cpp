/// @file src/finance/financial_engine.cpp
/// @brief FinancialEngine: validation, cost breakdown, cash flows, metrics.

#include "execo/finance.hpp"

#include "irr_solver.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace execo::finance {

// ─── Validation ───────────────────────────────────────────────────────────────

namespace {

/// First non-finite numeric field, if any.
std::optional<ValidationError> check_finite(const ProjectAssumptions& a) {
    const std::pair<const char*, double> fields[] = {
        {"capacity_mw",               a.capacity_mw},
        {"capacity_factor",           a.capacity_factor},
        {"capex_per_kw",              a.capex_per_kw},
        {"installation_factor",       a.installation_factor},
        {"land_cost",                 a.land_cost},
        {"grid_connection_cost",      a.grid_connection_cost},
        {"opex_per_kw_year",          a.opex_per_kw_year},
        {"fixed_opex_annual",         a.fixed_opex_annual},
        {"variable_opex_per_mwh",     a.variable_opex_per_mwh},
        {"insurance_rate",            a.insurance_rate},
        {"discount_rate",             a.discount_rate},
        {"debt_ratio",                a.debt_ratio},
        {"interest_rate",             a.interest_rate},
        {"tax_rate",                  a.tax_rate},
        {"electricity_price_per_mwh", a.electricity_price_per_mwh},
        {"price_escalation_rate",     a.price_escalation_rate},
        {"carbon_credit_per_ton",     a.carbon_credit_per_ton},
        {"carbon_intensity_avoided",  a.carbon_intensity_avoided},
    };
    for (const auto& [name, value] : fields) {
        if (!std::isfinite(value)) {
            return ValidationError(name, "must be a finite number");
        }
    }
    if (a.annual_production_mwh && !std::isfinite(*a.annual_production_mwh)) {
        return ValidationError("annual_production_mwh", "must be a finite number");
    }
    return std::nullopt;
}

/// First field that is negative, if any.
std::optional<ValidationError> check_non_negative(const ProjectAssumptions& a) {
    const std::pair<const char*, double> fields[] = {
        {"land_cost",                 a.land_cost},
        {"grid_connection_cost",      a.grid_connection_cost},
        {"opex_per_kw_year",          a.opex_per_kw_year},
        {"fixed_opex_annual",         a.fixed_opex_annual},
        {"variable_opex_per_mwh",     a.variable_opex_per_mwh},
        {"insurance_rate",            a.insurance_rate},
        {"interest_rate",             a.interest_rate},
        {"electricity_price_per_mwh", a.electricity_price_per_mwh},
        {"carbon_credit_per_ton",     a.carbon_credit_per_ton},
        {"carbon_intensity_avoided",  a.carbon_intensity_avoided},
    };
    for (const auto& [name, value] : fields) {
        if (value < 0.0) {
            return ValidationError(name, "must not be negative");
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<ValidationError> validate(const ProjectAssumptions& a) {
    // Primary constraints, in the order callers have always seen them.
    // The negated comparisons also reject NaN.
    if (!(a.capacity_mw > 0.0)) {
        return ValidationError("capacity_mw", "capacity must be greater than 0");
    }
    if (!(a.capex_per_kw > 0.0)) {
        return ValidationError("capex_per_kw", "CAPEX must be greater than 0");
    }
    if (!(a.capacity_factor > 0.0 && a.capacity_factor <= 1.0)) {
        return ValidationError("capacity_factor",
                               "capacity factor must be in (0, 1]");
    }
    if (!(a.discount_rate >= 0.0 && a.discount_rate <= 1.0)) {
        return ValidationError("discount_rate", "discount rate must be in [0, 1]");
    }

    if (auto err = check_finite(a)) return err;

    if (a.annual_production_mwh && *a.annual_production_mwh < 0.0) {
        return ValidationError("annual_production_mwh", "must not be negative");
    }
    if (a.installation_factor < 1.0) {
        return ValidationError("installation_factor", "must be at least 1");
    }
    if (auto err = check_non_negative(a)) return err;

    if (a.project_lifetime_years < 1) {
        return ValidationError("project_lifetime_years", "must be at least 1 year");
    }
    if (a.debt_ratio < 0.0 || a.debt_ratio > 1.0) {
        return ValidationError("debt_ratio", "must be in [0, 1]");
    }
    if (a.tax_rate < 0.0 || a.tax_rate > 1.0) {
        return ValidationError("tax_rate", "must be in [0, 1]");
    }
    if (a.depreciation_years < 1) {
        return ValidationError("depreciation_years", "must be at least 1 year");
    }
    if (a.price_escalation_rate <= -1.0) {
        return ValidationError("price_escalation_rate", "must be greater than -1");
    }
    return std::nullopt;
}

// ─── FinancialEngine ──────────────────────────────────────────────────────────

FinancialEngine::FinancialEngine(ProjectAssumptions assumptions)
    : assumptions_(std::move(assumptions)) {
    if (auto err = validate(assumptions_)) {
        throw *err;
    }
}

double FinancialEngine::annual_production() const noexcept {
    const auto& a = assumptions_;
    if (a.annual_production_mwh && *a.annual_production_mwh > 0.0) {
        return *a.annual_production_mwh;
    }
    return constants::HOURS_PER_YEAR * a.capacity_factor * a.capacity_mw;
}

CapexBreakdown FinancialEngine::capex() const noexcept {
    const auto& a = assumptions_;
    const double capacity_kw = a.capacity_mw * constants::KW_PER_MW;
    const double equipment = capacity_kw * a.capex_per_kw;

    return CapexBreakdown{
        .equipment       = equipment,
        .installation    = equipment * (a.installation_factor - 1.0),
        .land            = a.land_cost,
        .grid_connection = a.grid_connection_cost,
    };
}

OpexBreakdown FinancialEngine::opex(double annual_production_mwh) const noexcept {
    const auto& a = assumptions_;
    const double capacity_kw = a.capacity_mw * constants::KW_PER_MW;

    return OpexBreakdown{
        .capacity_based = capacity_kw * a.opex_per_kw_year,
        .fixed          = a.fixed_opex_annual,
        .variable       = annual_production_mwh * a.variable_opex_per_mwh,
        .insurance      = capex().total() * a.insurance_rate,
    };
}

double FinancialEngine::revenue(double annual_production_mwh,
                                int year) const noexcept {
    const auto& a = assumptions_;
    const double price = a.electricity_price_per_mwh
                       * std::pow(1.0 + a.price_escalation_rate, year - 1);
    const double energy_sales = annual_production_mwh * price;
    const double carbon_credits = annual_production_mwh
                                * a.carbon_intensity_avoided
                                * a.carbon_credit_per_ton;
    return energy_sales + carbon_credits;
}

std::vector<double>
FinancialEngine::cash_flows(double total_capex, double annual_opex,
                            double annual_production_mwh) const {
    const int n = assumptions_.project_lifetime_years;

    std::vector<double> flows;
    flows.reserve(static_cast<std::size_t>(n) + 1);
    flows.push_back(-total_capex);

    for (int year = 1; year <= n; ++year) {
        const double rev = revenue(annual_production_mwh, year);
        const double cost = annual_opex
                          * std::pow(1.0 + constants::OPEX_ESCALATION_RATE, year - 1);
        flows.push_back(rev - cost);
    }
    return flows;
}

double FinancialEngine::discounted_opex(double annual_opex) const noexcept {
    const double r = assumptions_.discount_rate;
    const int n = assumptions_.project_lifetime_years;

    double sum = 0.0;
    for (int t = 1; t <= n; ++t) {
        sum += annual_opex * std::pow(1.0 + constants::OPEX_ESCALATION_RATE, t - 1)
             / std::pow(1.0 + r, t);
    }
    return sum;
}

double FinancialEngine::npv(std::span<const double> flows) const noexcept {
    return net_present_value(flows, assumptions_.discount_rate);
}

// ─── Stateless helpers ────────────────────────────────────────────────────────

double FinancialEngine::levelized_cost(double total_capex, double annual_opex,
                                       double annual_production_mwh,
                                       double discount_rate,
                                       int lifetime_years) noexcept {
    double discounted_cost = total_capex;  // capital is spent at t = 0
    double discounted_energy = 0.0;

    for (int t = 1; t <= lifetime_years; ++t) {
        const double df = std::pow(1.0 + discount_rate, t);
        discounted_cost += annual_opex
                         * std::pow(1.0 + constants::OPEX_ESCALATION_RATE, t - 1) / df;
        discounted_energy += annual_production_mwh / df;
    }

    if (discounted_energy == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return discounted_cost / discounted_energy;
}

double FinancialEngine::net_present_value(std::span<const double> flows,
                                          double rate) noexcept {
    return IrrSolver::npv(flows, rate);
}

std::optional<double>
FinancialEngine::payback_period(std::span<const double> flows) noexcept {
    double cumulative = 0.0;
    for (std::size_t year = 0; year < flows.size(); ++year) {
        const double cf = flows[year];
        cumulative += cf;
        if (cumulative >= 0.0) {
            if (year > 0 && cf > 0.0) {
                // cumulative − cf is the (negative) balance entering the year;
                // the fraction of this year's inflow needed to clear it:
                const double fraction = (cf - cumulative) / cf;
                return static_cast<double>(year - 1) + fraction;
            }
            return static_cast<double>(year);
        }
    }
    return std::nullopt;
}

// ─── FinancialEngine::calculate ───────────────────────────────────────────────

FinancialResult FinancialEngine::calculate() const {
    const auto& a = assumptions_;
    const int n = a.project_lifetime_years;

    const double production = annual_production();
    const CapexBreakdown capex_bd = capex();
    const double total_capex = capex_bd.total();
    const OpexBreakdown opex_bd = opex(production);
    const double annual_opex = opex_bd.total();

    auto flows = cash_flows(total_capex, annual_opex, production);

    const IrrSolution irr = solve_irr(flows);
    const auto payback = payback_period(flows);

    double revenue_npv = 0.0;
    for (int t = 1; t <= n; ++t) {
        revenue_npv += revenue(production, t) / std::pow(1.0 + a.discount_rate, t);
    }

    return FinancialResult{
        .lcoe                    = levelized_cost(total_capex, annual_opex, production,
                                                  a.discount_rate, n),
        .npv                     = npv(flows),
        .irr                     = irr.has_rate() ? irr.rate : 0.0,
        .irr_solution            = irr,
        .payback_years           = payback.value_or(static_cast<double>(n)),
        .pays_back               = payback.has_value(),
        .total_capex             = total_capex,
        .annual_opex             = annual_opex,
        .total_lifetime_cost     = total_capex + discounted_opex(annual_opex),
        .annual_production_mwh   = production,
        .lifetime_production_mwh = production * static_cast<double>(n),
        .annual_revenue          = revenue(production, 1),
        .lifetime_revenue_npv    = revenue_npv,
        .capex_breakdown         = capex_bd,
        .opex_breakdown          = opex_bd,
        .cash_flows              = std::move(flows),
    };
}

FinancialResult compute_financials(const ProjectAssumptions& a) {
    return FinancialEngine(a).calculate();
}

// ─── FinancialResult::to_string ───────────────────────────────────────────────

std::string FinancialResult::to_string() const {
    std::string irr_text = irr_solution.has_rate()
        ? fmt::format("{:.2f} %", irr_percent())
        : std::string("n/a");
    if (irr_solution.status == IrrStatus::Stalled) irr_text += " (unverified)";

    const std::string payback_text = pays_back
        ? fmt::format("{:.1f} yr", payback_years)
        : fmt::format("never (> {:.0f} yr)", payback_years);

    return fmt::format(
        "LCOE               {:>16.2f} $/MWh\n"
        "NPV                {:>16.0f} $\n"
        "IRR                {:>16}\n"
        "Payback            {:>16}\n"
        "Total CAPEX        {:>16.0f} $\n"
        "  equipment        {:>16.0f} $\n"
        "  installation     {:>16.0f} $\n"
        "  land             {:>16.0f} $\n"
        "  grid connection  {:>16.0f} $\n"
        "Annual OPEX        {:>16.0f} $/yr\n"
        "  capacity-based   {:>16.0f} $/yr\n"
        "  fixed            {:>16.0f} $/yr\n"
        "  variable         {:>16.0f} $/yr\n"
        "  insurance        {:>16.0f} $/yr\n"
        "Lifetime cost (PV) {:>16.0f} $\n"
        "Annual production  {:>16.0f} MWh\n"
        "Lifetime production{:>16.0f} MWh\n"
        "Annual revenue     {:>16.0f} $\n"
        "Revenue NPV        {:>16.0f} $",
        lcoe, npv, irr_text, payback_text,
        total_capex, capex_breakdown.equipment, capex_breakdown.installation,
        capex_breakdown.land, capex_breakdown.grid_connection,
        annual_opex, opex_breakdown.capacity_based, opex_breakdown.fixed,
        opex_breakdown.variable, opex_breakdown.insurance,
        total_lifetime_cost, annual_production_mwh, lifetime_production_mwh,
        annual_revenue, lifetime_revenue_npv);
}

} // namespace execo::finance
