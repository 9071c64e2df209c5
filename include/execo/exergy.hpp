#pragma once

/// @file include/execo/exergy.hpp
/// @brief Exergy Engine: first- and second-law analysis of energy conversion.
///
/// # Module: Exergy Engine
///
/// ## Responsibility
/// Decompose an energy-conversion chain into what the first law sees (energy
/// quantity, always conserved) and what the second law sees (exergy, the work
/// potential that is destroyed by every irreversibility).
///
/// ## Accounting
///     Ex_in      = E_in × 1.06            (fuels)
///                = E_in                    (direct conversion, others)
///     E_useful   = E_in × η_source
///     Ex_useful  = E_useful × (1 − T0/T)   (heat end use with T known)
///                = E_useful × q_end_use    (otherwise)
///     η_I  = E_useful / E_in
///     η_II = Ex_useful / Ex_in
///
/// Energy loss and exergy destruction are the plain differences
/// E_in − E_useful and Ex_in − Ex_useful.
///
/// ## Guarantees
/// - `analyze` never throws for numeric input; unknown sources resolve to the
///   fallback properties (η = 0.30, q = 0.50)
/// - All ratios are zero-guarded
/// - The source table is immutable after construction and shared by const
///   reference, so analyzers can run concurrently without locks
///
/// ## NOT Responsible For
/// - Cash flows, discounting (see finance.hpp)
/// - Monetary valuation of exergy (see valuation.hpp)

#include "execo/constants.hpp"
#include "execo/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace execo::exergy {

// ─── Source Properties ────────────────────────────────────────────────────────

/// Conversion characteristics of one primary energy source.
struct SourceProperties {
    double         efficiency;  ///< primary → useful energy, (0, 1]
    double         quality;     ///< useful → energy-service quality, [0, 1]
    SourceCategory category;
};

/// Immutable name → properties lookup.
///
/// Names are stored lower-case; lookups are case-insensitive.
class SourceTable {
public:
    using Map = std::map<std::string, SourceProperties, std::less<>>;

    /// Build a table from explicit entries.
    ///
    /// # Throws
    /// `ValidationError` if an entry has efficiency outside (0, 1] or quality
    /// outside [0, 1], or if two names collide after lower-casing.
    explicit SourceTable(const Map& entries,
                         SourceProperties fallback = SourceProperties{
                             constants::FALLBACK_EFFICIENCY,
                             constants::FALLBACK_QUALITY,
                             SourceCategory::Other});

    /// The published table (coal, oil, gas, biomass, nuclear, hydro, wind,
    /// solar, geothermal). Built once on first use.
    [[nodiscard]] static const SourceTable& standard();

    /// Properties for `name`, or `nullopt` if it is not in the table.
    [[nodiscard]] std::optional<SourceProperties> find(std::string_view name) const;

    /// Properties for `name`, or the fallback for unknown names.
    [[nodiscard]] SourceProperties resolve(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] const Map& entries() const noexcept { return entries_; }
    [[nodiscard]] const SourceProperties& fallback() const noexcept { return fallback_; }

private:
    Map              entries_;
    SourceProperties fallback_;
};

/// Lower-case ASCII copy of `s`.
[[nodiscard]] std::string to_lower(std::string_view s);

// ─── Reference Environment ────────────────────────────────────────────────────

struct ExergyConfig {
    double reference_temperature_k = constants::REFERENCE_TEMPERATURE_K;  ///< T0
    double reference_pressure_kpa  = constants::REFERENCE_PRESSURE_KPA;   ///< P0
};

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// One stage of a conversion chain with measured exergy in and out (MJ).
struct ProcessStep {
    std::string name;
    double      input_exergy  = 0.0;
    double      output_exergy = 0.0;
};

/// Input to a single process analysis.
struct EnergyProcessInput {
    std::string               energy_source;
    double                    input_energy_mj = 0.0;
    std::optional<double>     output_temp_k;          ///< only meaningful for heat
    EndUse                    end_use = EndUse::Electricity;
    std::vector<ProcessStep>  process_steps;          ///< empty → no breakdown
};

// ─── Results ──────────────────────────────────────────────────────────────────

/// Destruction attributed to one process step.
struct ComponentExergy {
    std::string name;
    double      input_exergy;
    double      output_exergy;
    double      exergy_destruction;  ///< input − output
    double      destruction_share;   ///< destruction / Σ destruction (0 if Σ ≤ 0)
    double      efficiency;          ///< output / input (0 if input ≤ 0)
};

/// Complete first- and second-law decomposition (all energies in MJ).
struct ExergyResult {
    std::string energy_source;

    double input_energy_mj;
    double input_exergy_mj;
    double useful_energy_mj;
    double useful_exergy_mj;

    double energy_loss_mj;           ///< input_energy − useful_energy
    double exergy_destruction_mj;    ///< input_exergy − useful_exergy

    double first_law_efficiency;     ///< η_I
    double second_law_efficiency;    ///< η_II
    double exergy_destruction_ratio; ///< destruction / input_exergy

    /// Recoverable work under ideal operation: destruction × (1 − η_II).
    double improvement_potential_mj;

    /// η_II × 100.
    double thermodynamic_perfection;

    /// 1 − T0/T_out; present only when an output temperature was supplied.
    std::optional<double> carnot_factor;

    /// Present only when process steps were supplied; input order.
    std::optional<std::vector<ComponentExergy>> components;

    /// One-line narrative of destruction and improvement potential.
    [[nodiscard]] std::string insight() const;

    /// Multi-line human-readable report.
    [[nodiscard]] std::string to_string() const;
};

/// A technology to rank in a comparison.
struct TechnologySpec {
    std::string name;
    std::string source          = "generic";
    double      input_energy_mj = constants::DEFAULT_TECHNOLOGY_INPUT_MJ;
    EndUse      end_use         = EndUse::Electricity;
};

/// Per-technology row of a comparison.
struct TechnologySummary {
    std::string technology;
    std::string source;
    double      first_law_efficiency;
    double      second_law_efficiency;
    double      exergy_destruction_ratio;
    double      thermodynamic_perfection;
};

/// Technologies ranked by second-law efficiency, best first.
struct TechnologyComparison {
    std::vector<TechnologySummary> ranking;
    std::optional<std::string>     best_technology;  ///< nullopt for empty input

    [[nodiscard]] std::string to_string() const;
};

// ─── ExergyAnalyzer ───────────────────────────────────────────────────────────

/// Stateless analyzer over a source table and a reference environment.
///
/// Usage pattern:
/// ```cpp
/// ExergyAnalyzer analyzer;   // standard table, T0 = 298.15 K
/// auto r = analyzer.analyze({.energy_source = "coal", .input_energy_mj = 1000.0});
/// fmt::print("{}\n", r.insight());
/// ```
class ExergyAnalyzer {
public:
    /// `table` must outlive the analyzer.
    explicit ExergyAnalyzer(const SourceTable& table = SourceTable::standard(),
                            ExergyConfig config = ExergyConfig{});

    /// Full first/second-law decomposition of one process.
    [[nodiscard]] ExergyResult analyze(const EnergyProcessInput& input) const;

    /// Analyze each technology independently and rank by η_II descending.
    /// Ties keep input order.
    [[nodiscard]] TechnologyComparison
    compare(std::span<const TechnologySpec> technologies) const;

    /// Input exergy of `input_energy_mj` from `source`.
    [[nodiscard]] double input_exergy(std::string_view source,
                                      double input_energy_mj) const;

    /// Carnot factor 1 − T_cold/T_hot against the reference temperature.
    [[nodiscard]] double carnot_factor(double hot_temp_k) const noexcept;

    /// Work potential of `heat_mj` delivered at `temp_k`: Q × (1 − T0/T),
    /// zero at or below T0.
    [[nodiscard]] double heat_exergy(double heat_mj, double temp_k) const noexcept;

    /// Per-step destruction and share of total destruction.
    [[nodiscard]] static std::vector<ComponentExergy>
    analyze_components(std::span<const ProcessStep> steps);

    [[nodiscard]] const SourceTable&  table()  const noexcept { return table_; }
    [[nodiscard]] const ExergyConfig& config() const noexcept { return config_; }

private:
    const SourceTable& table_;
    ExergyConfig       config_;
};

// ─── Free functions ───────────────────────────────────────────────────────────

/// Carnot factor 1 − T_cold/T_hot; 0 when T_hot ≤ T_cold.
[[nodiscard]] double
carnot_factor(double hot_temp_k,
              double cold_temp_k = constants::REFERENCE_TEMPERATURE_K) noexcept;

/// `ExergyAnalyzer{}.analyze(input)` with the standard table.
[[nodiscard]] ExergyResult analyze_exergy(const EnergyProcessInput& input);

/// `ExergyAnalyzer{}.compare(technologies)` with the standard table.
[[nodiscard]] TechnologyComparison
compare_technologies(std::span<const TechnologySpec> technologies);

} // namespace execo::exergy
