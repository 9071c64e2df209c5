/// @file src/exergy/technology_comparison.cpp
/// @brief Rank technologies by second-law efficiency.

#include "execo/exergy.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace execo::exergy {

TechnologyComparison
ExergyAnalyzer::compare(std::span<const TechnologySpec> technologies) const {
    TechnologyComparison out;
    out.ranking.reserve(technologies.size());

    for (const auto& tech : technologies) {
        const auto r = analyze(EnergyProcessInput{
            .energy_source   = tech.source,
            .input_energy_mj = tech.input_energy_mj,
            .output_temp_k   = std::nullopt,
            .end_use         = tech.end_use,
            .process_steps   = {},
        });
        out.ranking.push_back(TechnologySummary{
            .technology               = tech.name,
            .source                   = tech.source,
            .first_law_efficiency     = r.first_law_efficiency,
            .second_law_efficiency    = r.second_law_efficiency,
            .exergy_destruction_ratio = r.exergy_destruction_ratio,
            .thermodynamic_perfection = r.thermodynamic_perfection,
        });
    }

    std::stable_sort(out.ranking.begin(), out.ranking.end(),
                     [](const TechnologySummary& lhs, const TechnologySummary& rhs) {
                         return lhs.second_law_efficiency > rhs.second_law_efficiency;
                     });

    if (!out.ranking.empty()) {
        out.best_technology = out.ranking.front().technology;
    }
    return out;
}

TechnologyComparison compare_technologies(std::span<const TechnologySpec> technologies) {
    return ExergyAnalyzer{}.compare(technologies);
}

std::string TechnologyComparison::to_string() const {
    std::string out = fmt::format("{:<4} {:<20} {:<12} {:>8} {:>8} {:>10}",
                                  "rank", "technology", "source",
                                  "eta_I", "eta_II", "destroyed");
    int rank = 1;
    for (const auto& row : ranking) {
        out += fmt::format("\n{:<4} {:<20} {:<12} {:>8.4f} {:>8.4f} {:>9.1f}%",
                           rank++, row.technology, row.source,
                           row.first_law_efficiency, row.second_law_efficiency,
                           row.exergy_destruction_ratio * 100.0);
    }
    if (best_technology) {
        out += fmt::format("\nBest: {}", *best_technology);
    }
    return out;
}

} // namespace execo::exergy
