#pragma once

#include <cstddef>

/// @file include/execo/constants.hpp
/// @brief Physical, financial and numerical constants for the execo engines.
///
/// Every tunable that appears in more than one translation unit lives here so
/// that the engines, the CLI and the test suites agree on a single value.

namespace execo::constants {

// ─── Unit Conversions ─────────────────────────────────────────────────────────

/// Hours in a (non-leap) year. Annual production = 8760 × CF × capacity.
static constexpr double HOURS_PER_YEAR = 8760.0;

/// Kilowatts per megawatt.
static constexpr double KW_PER_MW = 1000.0;

/// Megajoules per megawatt-hour (1 MWh = 3.6 GJ).
static constexpr double MJ_PER_MWH = 3600.0;

// ─── Financial Defaults ───────────────────────────────────────────────────────

/// Fixed annual escalation applied to operating cost in the cash-flow model.
static constexpr double OPEX_ESCALATION_RATE = 0.02;

static constexpr double DEFAULT_CAPACITY_MW              = 100.0;
static constexpr double DEFAULT_CAPACITY_FACTOR          = 0.25;
static constexpr double DEFAULT_CAPEX_PER_KW             = 1000.0;
static constexpr double DEFAULT_INSTALLATION_FACTOR      = 1.2;
static constexpr double DEFAULT_INSURANCE_RATE           = 0.01;
static constexpr int    DEFAULT_PROJECT_LIFETIME_YEARS   = 25;
static constexpr double DEFAULT_DISCOUNT_RATE            = 0.08;
static constexpr double DEFAULT_DEBT_RATIO               = 0.6;
static constexpr double DEFAULT_INTEREST_RATE            = 0.05;
static constexpr double DEFAULT_TAX_RATE                 = 0.21;
static constexpr int    DEFAULT_DEPRECIATION_YEARS       = 20;
static constexpr double DEFAULT_ELECTRICITY_PRICE        = 50.0;   ///< $/MWh
static constexpr double DEFAULT_PRICE_ESCALATION_RATE    = 0.02;

// ─── IRR Solver ───────────────────────────────────────────────────────────────

/// Newton–Raphson starting rate.
static constexpr double IRR_INITIAL_GUESS = 0.10;

/// Newton–Raphson iteration cap.
static constexpr int IRR_MAX_ITERATIONS = 1000;

/// |NPV(r)| below this is accepted as a root.
static constexpr double IRR_NPV_TOLERANCE = 1e-6;

/// |dNPV/dr| below this stops Newton–Raphson (flat NPV curve).
static constexpr double IRR_DERIVATIVE_FLOOR = 1e-10;

/// Companion-matrix eigenvalues with |Im λ| ≤ tol·max(1, |λ|) count as real.
static constexpr double IRR_ROOT_IMAG_TOLERANCE = 1e-10;

// ─── Reference Environment ────────────────────────────────────────────────────

/// Dead-state temperature T0 (25 °C).
static constexpr double REFERENCE_TEMPERATURE_K = 298.15;

/// Dead-state pressure P0 (1 atm).
static constexpr double REFERENCE_PRESSURE_KPA = 101.325;

// ─── Exergy Accounting ────────────────────────────────────────────────────────

/// Chemical exergy of a fuel relative to its lower heating value.
static constexpr double FUEL_EXERGY_FACTOR = 1.06;

/// Primary → useful efficiency for sources missing from the table.
static constexpr double FALLBACK_EFFICIENCY = 0.30;

/// Useful → service quality for sources missing from the table.
static constexpr double FALLBACK_QUALITY = 0.50;

/// Nominal primary input used when a comparison entry omits one.
static constexpr double DEFAULT_TECHNOLOGY_INPUT_MJ = 1000.0;

/// Tolerance for Σ destruction_share = 1.
static constexpr double SHARE_SUM_TOLERANCE = 1e-6;

// ─── Exergy Premium ───────────────────────────────────────────────────────────

static constexpr double CLEAN_PREMIUM_FACTOR  = 3.0;
static constexpr double FOSSIL_PREMIUM_FACTOR = 1.0;
static constexpr double OTHER_PREMIUM_FACTOR  = 1.5;

} // namespace execo::constants
