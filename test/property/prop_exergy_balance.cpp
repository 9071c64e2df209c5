/**
 * @file  prop_exergy_balance.cpp
 * @brief Property: exergy accounting is non-negative and balances exactly.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_exergy_balance
 *
 * For every known source, end use and input energy E ≥ 0:
 *   Ex_in ≥ 0,  Ex_useful ≥ 0,  Ex_useful ≤ Ex_in
 *   E_in − E_useful  = energy_loss
 *   Ex_in − Ex_useful = exergy_destruction
 *   0 ≤ η_II ≤ η_I·(quality ceiling) ≤ 1
 *
 * Component shares sum to 1 whenever total destruction is positive.
 */

#include <rapidcheck.h>

#include "execo/constants.hpp"
#include "execo/exergy.hpp"

#include <array>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

using namespace execo;
using namespace execo::exergy;

namespace {

const std::array<const char*, 10> kSources = {
    "coal", "oil", "gas", "biomass", "nuclear",
    "hydro", "wind", "solar", "geothermal", "unlisted"};

const std::array<EndUse, 6> kEndUses = {
    EndUse::Electricity, EndUse::MechanicalWork, EndUse::HighTempHeat,
    EndUse::MediumTempHeat, EndUse::LowTempHeat, EndUse::Chemical};

} // namespace

int main() {
    // ── Property 1: non-negativity and exact balance ─────────────────────────
    rc::check(
        "exergy_balance: outputs non-negative, losses are exact differences",
        [] {
            const auto src  = *rc::gen::inRange<std::size_t>(0, kSources.size());
            const auto use  = *rc::gen::inRange<std::size_t>(0, kEndUses.size());
            const auto mj   = *rc::gen::inRange(0, 10'000'000);
            const bool temp = *rc::gen::arbitrary<bool>();
            const auto t_k  = *rc::gen::inRange(1, 3000);

            EnergyProcessInput in{
                .energy_source   = kSources[src],
                .input_energy_mj = static_cast<double>(mj),
                .end_use         = kEndUses[use],
            };
            if (temp) in.output_temp_k = static_cast<double>(t_k);

            const auto r = analyze_exergy(in);

            RC_ASSERT(r.input_exergy_mj >= 0.0);
            RC_ASSERT(r.useful_energy_mj >= 0.0);
            RC_ASSERT(r.useful_exergy_mj >= 0.0);
            RC_ASSERT(r.useful_exergy_mj <= r.input_exergy_mj);
            RC_ASSERT(r.first_law_efficiency >= 0.0);
            RC_ASSERT(r.first_law_efficiency <= 1.0);
            RC_ASSERT(r.second_law_efficiency >= 0.0);
            RC_ASSERT(r.second_law_efficiency <= 1.0);

            RC_ASSERT(r.energy_loss_mj == r.input_energy_mj - r.useful_energy_mj);
            RC_ASSERT(r.exergy_destruction_mj == r.input_exergy_mj - r.useful_exergy_mj);
            RC_ASSERT(r.carnot_factor.has_value() == temp);
        });

    // ── Property 2: component shares sum to one ──────────────────────────────
    rc::check(
        "exergy_balance: component destruction shares sum to 1",
        [] {
            const auto n = *rc::gen::inRange(1, 12);
            std::vector<ProcessStep> steps;
            for (int i = 0; i < n; ++i) {
                const double in_ex  = *rc::gen::inRange(1, 100'000);
                const double kept   = *rc::gen::inRange(0, 100);  // percent retained
                steps.push_back(ProcessStep{
                    .name          = "step" + std::to_string(i),
                    .input_exergy  = in_ex,
                    .output_exergy = in_ex * kept / 100.0,
                });
            }

            const auto comps = ExergyAnalyzer::analyze_components(steps);
            RC_ASSERT(comps.size() == steps.size());

            double total = 0.0;
            double shares = 0.0;
            for (const auto& c : comps) {
                total  += c.exergy_destruction;
                shares += c.destruction_share;
                RC_ASSERT(c.efficiency >= 0.0);
                RC_ASSERT(c.efficiency <= 1.0);
            }
            if (total > 0.0) {
                RC_ASSERT(std::abs(shares - 1.0) < constants::SHARE_SUM_TOLERANCE);
            } else {
                RC_ASSERT(shares == 0.0);
            }
        });

    return 0;
}
