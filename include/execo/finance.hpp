#pragma once

/// @file include/execo/finance.hpp
/// @brief Financial Engine: techno-economic analysis of an energy asset.
///
/// # Module: Financial Engine
///
/// ## Responsibility
/// Turn the physical and financial assumptions of a generating asset into a
/// capital / operating cost breakdown, a year-indexed cash-flow sequence and
/// the summary metrics LCOE, NPV, IRR and payback period.
///
/// ## Cash-Flow Model
///     CF_0 = −CAPEX
///     CF_t = E·p·(1+g)^(t−1) + E·c·k − OPEX·1.02^(t−1)       t = 1…N
///
/// where E is annual production (MWh), p the electricity price, g the price
/// escalation rate, c the avoided carbon intensity (t/MWh) and k the carbon
/// credit price ($/t).
///
/// ## Metrics
///   - LCOE   = (CAPEX + Σ OPEX_t/(1+r)^t) / Σ E/(1+r)^t
///   - NPV    = Σ CF_t/(1+r)^t,  t = 0…N
///   - IRR    = r* such that NPV(r*) = 0 (see `IrrSolution`)
///   - Payback: first year the cumulative cash flow turns non-negative,
///              interpolated linearly inside that year
///
/// ## Guarantees
/// - Invalid assumptions throw `ValidationError` before any computation
/// - After validation nothing throws; degenerate cases map to sentinels
///   (LCOE = +∞, IRR = 0 with `IrrStatus::NonConvergent`, payback = N)
/// - No global mutable state: concurrent calls need no locking
///
/// ## NOT Responsible For
/// - Exergy accounting (see exergy.hpp)
/// - Parsing assumption files (see assumptions_loader.hpp)

#include "execo/constants.hpp"
#include "execo/errors.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace execo::finance {

// ─── Assumptions ──────────────────────────────────────────────────────────────

/// Physical and financial assumptions for one project.
///
/// Every field has a default; a caller only sets what it knows.
struct ProjectAssumptions {
    std::string project_name    = "Unnamed Project";
    std::string technology_type = "generic";

    double capacity_mw     = constants::DEFAULT_CAPACITY_MW;      ///< > 0
    double capacity_factor = constants::DEFAULT_CAPACITY_FACTOR;  ///< (0, 1]

    /// Explicit annual production (MWh). Unset or zero → 8760·CF·capacity.
    std::optional<double> annual_production_mwh;

    double capex_per_kw         = constants::DEFAULT_CAPEX_PER_KW;         ///< > 0
    double installation_factor  = constants::DEFAULT_INSTALLATION_FACTOR;  ///< ≥ 1
    double land_cost            = 0.0;
    double grid_connection_cost = 0.0;

    double opex_per_kw_year      = 0.0;
    double fixed_opex_annual     = 0.0;
    double variable_opex_per_mwh = 0.0;
    double insurance_rate        = constants::DEFAULT_INSURANCE_RATE;  ///< fraction of CAPEX

    int    project_lifetime_years = constants::DEFAULT_PROJECT_LIFETIME_YEARS;  ///< ≥ 1
    double discount_rate          = constants::DEFAULT_DISCOUNT_RATE;           ///< [0, 1]

    // Financing terms. Validated and carried, not used by the cash-flow model.
    double debt_ratio         = constants::DEFAULT_DEBT_RATIO;
    double interest_rate      = constants::DEFAULT_INTEREST_RATE;
    double tax_rate           = constants::DEFAULT_TAX_RATE;
    int    depreciation_years = constants::DEFAULT_DEPRECIATION_YEARS;

    double electricity_price_per_mwh = constants::DEFAULT_ELECTRICITY_PRICE;
    double price_escalation_rate     = constants::DEFAULT_PRICE_ESCALATION_RATE;
    double carbon_credit_per_ton     = 0.0;
    double carbon_intensity_avoided  = 0.0;  ///< t CO₂ per MWh
};

/// Check every range constraint on `a`.
///
/// The four primary constraints are checked first, in this order:
/// capacity_mw > 0, capex_per_kw > 0, capacity_factor ∈ (0, 1],
/// discount_rate ∈ [0, 1]. Secondary ranges and finiteness follow.
///
/// # Returns
/// The first violation found, or `nullopt` when `a` is valid.
[[nodiscard]] std::optional<ValidationError>
validate(const ProjectAssumptions& a);

// ─── Breakdowns ───────────────────────────────────────────────────────────────

/// Capital expenditure by category ($).
struct CapexBreakdown {
    double equipment;        ///< capacity_kW × capex_per_kW
    double installation;     ///< equipment × (installation_factor − 1)
    double land;
    double grid_connection;

    [[nodiscard]] double total() const noexcept {
        return equipment + installation + land + grid_connection;
    }
};

/// Year-1 operating expenditure by category ($/yr).
struct OpexBreakdown {
    double capacity_based;   ///< capacity_kW × opex_per_kW_year
    double fixed;
    double variable;         ///< production × variable_opex_per_MWh
    double insurance;        ///< total CAPEX × insurance_rate

    [[nodiscard]] double total() const noexcept {
        return capacity_based + fixed + variable + insurance;
    }
};

// ─── IRR ──────────────────────────────────────────────────────────────────────

/// Outcome class of an IRR solve.
enum class IrrStatus {
    Converged,      ///< NPV(rate) = 0 to solver tolerance
    Stalled,        ///< Newton stopped on a flat derivative or hit the iteration cap;
                    ///< `rate` is its last iterate, not a verified root
    NonConvergent,  ///< No real root found; `rate` is 0.0 by convention
};

/// Which stage of the solver produced the rate.
enum class IrrMethod {
    None,             ///< No stage ran (cash flows never change sign)
    CompanionMatrix,  ///< Eigenvalues of the NPV polynomial's companion matrix
    NewtonRaphson,    ///< Bounded Newton–Raphson fallback
};

/// Tagged IRR result.
///
/// A literal 0 % return and "no real root" both surface as `rate == 0.0`;
/// `status` is what separates them.
struct IrrSolution {
    IrrStatus status     = IrrStatus::NonConvergent;
    double    rate       = 0.0;
    IrrMethod method     = IrrMethod::None;
    int       iterations = 0;

    [[nodiscard]] bool has_rate() const noexcept {
        return status != IrrStatus::NonConvergent;
    }
};

[[nodiscard]] std::string_view to_string(IrrStatus status) noexcept;
[[nodiscard]] std::string_view to_string(IrrMethod method) noexcept;

/// Solve NPV(r) = 0 for a cash-flow sequence (index = year).
///
/// Stage 1 finds the real positive roots x of Σ CF_t·x^t (x = 1/(1+r)) as
/// eigenvalues of the companion matrix and keeps the rate of smallest
/// magnitude. Stage 2, used only when stage 1 finds nothing, runs
/// Newton–Raphson from r = 0.10 for at most 1000 steps.
///
/// Sequences whose entries never change sign have no IRR and return
/// `NonConvergent` without running either stage.
[[nodiscard]] IrrSolution solve_irr(std::span<const double> cash_flows);

// ─── Result ───────────────────────────────────────────────────────────────────

/// Complete output of one financial calculation.
struct FinancialResult {
    double lcoe;                     ///< $/MWh; +∞ if discounted production is 0
    double npv;                      ///< $ at the project discount rate
    double irr;                      ///< fraction; 0.0 when NonConvergent
    IrrSolution irr_solution;
    double payback_years;            ///< fractional; = lifetime if never paid back
    bool   pays_back;                ///< false when payback_years is the sentinel

    double total_capex;
    double annual_opex;              ///< year-1 OPEX
    double total_lifetime_cost;      ///< CAPEX + Σ discounted OPEX
    double annual_production_mwh;
    double lifetime_production_mwh;  ///< annual × N (undiscounted)
    double annual_revenue;           ///< year-1 revenue
    double lifetime_revenue_npv;     ///< Σ discounted revenue, t = 1…N

    CapexBreakdown capex_breakdown;
    OpexBreakdown  opex_breakdown;

    std::vector<double> cash_flows;  ///< length N + 1; [0] = −CAPEX

    [[nodiscard]] double irr_percent() const noexcept { return irr * 100.0; }

    /// Multi-line human-readable report.
    [[nodiscard]] std::string to_string() const;
};

// ─── FinancialEngine ──────────────────────────────────────────────────────────

/// Validated calculator bound to one assumption set.
///
/// Usage pattern:
/// ```cpp
/// ProjectAssumptions a;
/// a.capacity_mw     = 100.0;
/// a.capacity_factor = 0.25;
///
/// FinancialEngine engine(a);          // throws ValidationError if invalid
/// auto result = engine.calculate();
/// fmt::print("{}\n", result.to_string());
/// ```
class FinancialEngine {
public:
    /// Validate and bind `assumptions`.
    ///
    /// # Throws
    /// `ValidationError` naming the first field that violates its range.
    explicit FinancialEngine(ProjectAssumptions assumptions);

    /// Run the full calculation.
    [[nodiscard]] FinancialResult calculate() const;

    [[nodiscard]] const ProjectAssumptions& assumptions() const noexcept {
        return assumptions_;
    }

    /// Override if set and positive, else 8760 × CF × capacity (MWh).
    [[nodiscard]] double annual_production() const noexcept;

    [[nodiscard]] CapexBreakdown capex() const noexcept;

    [[nodiscard]] OpexBreakdown opex(double annual_production_mwh) const noexcept;

    /// Revenue in operating year `year` (1-based): escalated energy sales
    /// plus carbon credits.
    [[nodiscard]] double revenue(double annual_production_mwh,
                                 int year) const noexcept;

    /// Year 0…N cash flows.
    [[nodiscard]] std::vector<double>
    cash_flows(double total_capex, double annual_opex,
               double annual_production_mwh) const;

    /// Σ OPEX·1.02^(t−1)/(1+r)^t over t = 1…N.
    [[nodiscard]] double discounted_opex(double annual_opex) const noexcept;

    /// NPV of `flows` at the project discount rate.
    [[nodiscard]] double npv(std::span<const double> flows) const noexcept;

    // ── Stateless helpers ─────────────────────────────────────────────────────

    /// Levelized cost (capital at t = 0, escalating OPEX, flat production).
    ///
    /// # Returns
    /// +∞ when discounted production is zero.
    [[nodiscard]] static double
    levelized_cost(double total_capex, double annual_opex,
                   double annual_production_mwh, double discount_rate,
                   int lifetime_years) noexcept;

    /// Σ flows[t]/(1+rate)^t.
    [[nodiscard]] static double
    net_present_value(std::span<const double> flows, double rate) noexcept;

    /// Simple payback period.
    ///
    /// Walks the cumulative sum; in the first year t where it reaches ≥ 0,
    /// returns `t − 1 + (CF_t − cumulative_t)/CF_t` (or `t` when t = 0 or
    /// CF_t ≤ 0).
    ///
    /// # Returns
    /// `nullopt` if the cumulative sum never reaches zero.
    [[nodiscard]] static std::optional<double>
    payback_period(std::span<const double> flows) noexcept;

private:
    ProjectAssumptions assumptions_;
};

/// Validate and calculate in one call.
///
/// # Throws
/// `ValidationError` for invalid assumptions.
[[nodiscard]] FinancialResult compute_financials(const ProjectAssumptions& a);

// ─── Sensitivity ──────────────────────────────────────────────────────────────

/// Numeric assumption that a sensitivity sweep can scale.
enum class Parameter {
    CapacityMw,
    CapacityFactor,
    AnnualProductionMwh,
    CapexPerKw,
    InstallationFactor,
    LandCost,
    GridConnectionCost,
    OpexPerKwYear,
    FixedOpexAnnual,
    VariableOpexPerMwh,
    InsuranceRate,
    ProjectLifetimeYears,
    DiscountRate,
    DebtRatio,
    InterestRate,
    TaxRate,
    DepreciationYears,
    ElectricityPricePerMwh,
    PriceEscalationRate,
    CarbonCreditPerTon,
    CarbonIntensityAvoided,
};

/// snake_case field name, identical to the `ProjectAssumptions` member.
[[nodiscard]] std::string_view to_string(Parameter p) noexcept;

/// Inverse of `to_string(Parameter)`. Exact, case-sensitive match.
[[nodiscard]] std::optional<Parameter> parse_parameter(std::string_view name) noexcept;

/// Every sweepable parameter in declaration order.
[[nodiscard]] std::span<const Parameter> all_parameters() noexcept;

/// Current value of `p` in `a`. For an unset production override this is
/// the computed 8760·CF·capacity value.
[[nodiscard]] double parameter_value(const ProjectAssumptions& a, Parameter p) noexcept;

/// Copy of `a` with `p` set to `value` (integer fields rounded to nearest).
///
/// # Throws
/// `ValidationError` naming the field when an integer field's value does not
/// fit in `int`, or when `annual_production_mwh` is set to a value ≤ 0.
[[nodiscard]] ProjectAssumptions
with_parameter(ProjectAssumptions a, Parameter p, double value);

/// LCOE and NPV for each variation of one parameter.
struct SensitivityResult {
    Parameter           parameter;
    std::vector<double> variations;  ///< percentage changes, input order
    std::vector<double> lcoe;        ///< parallel to `variations`
    std::vector<double> npv;         ///< parallel to `variations`
};

/// Re-run the full calculation with `parameter` scaled by (1 + pct/100) for
/// each entry of `variations_pct`, all other inputs held fixed.
///
/// Variations are independent and run in parallel when OpenMP is enabled;
/// output order always matches input order.
///
/// # Throws
/// `ValidationError` if the base assumptions or any scaled assumption set is
/// invalid. Nothing is computed unless every set validates.
[[nodiscard]] SensitivityResult
run_sensitivity(const ProjectAssumptions& base, Parameter parameter,
                std::span<const double> variations_pct);

/// As above, with the parameter given by name.
///
/// # Throws
/// `ValidationError` (field = `parameter_name`) for an unknown name.
[[nodiscard]] SensitivityResult
run_sensitivity(const ProjectAssumptions& base, std::string_view parameter_name,
                std::span<const double> variations_pct);

/// One bar of a tornado chart: the response to ±pct on one parameter.
struct TornadoBar {
    Parameter parameter;
    double    lcoe_low;
    double    lcoe_high;
    double    npv_low;
    double    npv_high;

    [[nodiscard]] double npv_swing() const noexcept;
};

/// Sweep each parameter at −pct and +pct and rank by NPV swing, largest
/// first. Ties keep the input order.
///
/// # Throws
/// `ValidationError` if any scaled set is invalid (e.g. ±pct pushes the
/// capacity factor above 1).
[[nodiscard]] std::vector<TornadoBar>
run_tornado(const ProjectAssumptions& base, std::span<const Parameter> parameters,
            double pct);

} // namespace execo::finance
