/// @file src/exergy/exergy_analyzer.cpp
/// @brief ExergyAnalyzer: single-process first/second-law decomposition.

#include "execo/exergy.hpp"

#include <fmt/format.h>

#include <numeric>

namespace execo::exergy {

// ─── Carnot ───────────────────────────────────────────────────────────────────

double carnot_factor(double hot_temp_k, double cold_temp_k) noexcept {
    if (hot_temp_k <= cold_temp_k) return 0.0;
    return 1.0 - cold_temp_k / hot_temp_k;
}

// ─── ExergyAnalyzer ───────────────────────────────────────────────────────────

ExergyAnalyzer::ExergyAnalyzer(const SourceTable& table, ExergyConfig config)
    : table_(table), config_(config) {}

double ExergyAnalyzer::carnot_factor(double hot_temp_k) const noexcept {
    return exergy::carnot_factor(hot_temp_k, config_.reference_temperature_k);
}

double ExergyAnalyzer::heat_exergy(double heat_mj, double temp_k) const noexcept {
    return heat_mj * carnot_factor(temp_k);
}

double ExergyAnalyzer::input_exergy(std::string_view source,
                                    double input_energy_mj) const {
    const auto props = table_.resolve(source);
    if (props.category == SourceCategory::Fuel) {
        return input_energy_mj * constants::FUEL_EXERGY_FACTOR;
    }
    return input_energy_mj;
}

std::vector<ComponentExergy>
ExergyAnalyzer::analyze_components(std::span<const ProcessStep> steps) {
    std::vector<ComponentExergy> out;
    out.reserve(steps.size());

    for (const auto& step : steps) {
        out.push_back(ComponentExergy{
            .name               = step.name,
            .input_exergy       = step.input_exergy,
            .output_exergy      = step.output_exergy,
            .exergy_destruction = step.input_exergy - step.output_exergy,
            .destruction_share  = 0.0,
            .efficiency         = step.input_exergy > 0.0
                                      ? step.output_exergy / step.input_exergy
                                      : 0.0,
        });
    }

    const double total = std::accumulate(
        out.begin(), out.end(), 0.0,
        [](double acc, const ComponentExergy& c) { return acc + c.exergy_destruction; });

    if (total > 0.0) {
        for (auto& c : out) c.destruction_share = c.exergy_destruction / total;
    }
    return out;
}

ExergyResult ExergyAnalyzer::analyze(const EnergyProcessInput& input) const {
    const auto props = table_.resolve(input.energy_source);
    const double energy_in = input.input_energy_mj;
    const double exergy_in = input_exergy(input.energy_source, energy_in);

    const double useful_energy = energy_in * props.efficiency;

    // Heat with a known delivery temperature is worth its Carnot fraction;
    // every other service uses the fixed end-use quality.
    const double useful_exergy = (input.output_temp_k && is_heat(input.end_use))
        ? heat_exergy(useful_energy, *input.output_temp_k)
        : useful_energy * end_use_quality(input.end_use);

    const double destruction = exergy_in - useful_exergy;
    const double eta_1 = energy_in > 0.0 ? useful_energy / energy_in : 0.0;
    const double eta_2 = exergy_in > 0.0 ? useful_exergy / exergy_in : 0.0;

    ExergyResult r{
        .energy_source            = input.energy_source,
        .input_energy_mj          = energy_in,
        .input_exergy_mj          = exergy_in,
        .useful_energy_mj         = useful_energy,
        .useful_exergy_mj         = useful_exergy,
        .energy_loss_mj           = energy_in - useful_energy,
        .exergy_destruction_mj    = destruction,
        .first_law_efficiency     = eta_1,
        .second_law_efficiency    = eta_2,
        .exergy_destruction_ratio = exergy_in > 0.0 ? destruction / exergy_in : 0.0,
        .improvement_potential_mj = destruction * (1.0 - eta_2),
        .thermodynamic_perfection = eta_2 * 100.0,
        .carnot_factor            = std::nullopt,
        .components               = std::nullopt,
    };

    if (input.output_temp_k) {
        r.carnot_factor = carnot_factor(*input.output_temp_k);
    }
    if (!input.process_steps.empty()) {
        r.components = analyze_components(input.process_steps);
    }
    return r;
}

ExergyResult analyze_exergy(const EnergyProcessInput& input) {
    return ExergyAnalyzer{}.analyze(input);
}

// ─── ExergyResult ─────────────────────────────────────────────────────────────

std::string ExergyResult::insight() const {
    return fmt::format(
        "This {} process destroys {:.1f}% of input exergy. "
        "Improvement potential: {:.1f} MJ.",
        energy_source, exergy_destruction_ratio * 100.0, improvement_potential_mj);
}

std::string ExergyResult::to_string() const {
    std::string out = fmt::format(
        "Source             {:>14}\n"
        "Input energy       {:>14.2f} MJ\n"
        "Input exergy       {:>14.2f} MJ\n"
        "Useful energy      {:>14.2f} MJ\n"
        "Useful exergy      {:>14.2f} MJ\n"
        "Energy loss        {:>14.2f} MJ\n"
        "Exergy destruction {:>14.2f} MJ\n"
        "First-law eff.     {:>14.4f}\n"
        "Second-law eff.    {:>14.4f}\n"
        "Destruction ratio  {:>14.4f}\n"
        "Improvement pot.   {:>14.2f} MJ\n"
        "Perfection         {:>14.1f} %",
        energy_source, input_energy_mj, input_exergy_mj, useful_energy_mj,
        useful_exergy_mj, energy_loss_mj, exergy_destruction_mj,
        first_law_efficiency, second_law_efficiency, exergy_destruction_ratio,
        improvement_potential_mj, thermodynamic_perfection);

    if (carnot_factor) {
        out += fmt::format("\nCarnot factor      {:>14.4f}", *carnot_factor);
    }
    if (components) {
        out += "\nComponents:";
        for (const auto& c : *components) {
            out += fmt::format("\n  {:<16} in {:>10.2f}  out {:>10.2f}  "
                               "destroyed {:>10.2f} ({:5.1f}%)  eff {:.3f}",
                               c.name, c.input_exergy, c.output_exergy,
                               c.exergy_destruction, c.destruction_share * 100.0,
                               c.efficiency);
        }
    }
    return out;
}

} // namespace execo::exergy
