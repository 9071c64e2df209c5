/**
 * @file  bench/bench_financials.cpp
 * @brief Google Benchmark suite for the financial and exergy engines.
 *
 * Benchmarks
 * ----------
 *   BM_ComputeFinancials     : one full calculation, lifetime sweep
 *   BM_SolveIrr_Companion    : stage-1 eigenvalue solve, degree sweep
 *   BM_SolveIrr_Newton       : stage-2 fallback only
 *   BM_RunSensitivity        : capex sweep, variation-count sweep
 *   BM_Tornado_AllParameters : every parameter at ±10 %
 *   BM_AnalyzeExergy         : single process with component breakdown
 *
 * Build (CMake):
 *   cmake --build build --target bench_financials
 *   ./build/bench_financials --benchmark_format=json
 *
 * Throughput units: items/second (calculations or cash-flow years).
 */

#include "benchmark/benchmark.h"

// Internal solver header (needs src/ on include path)
#include "finance/irr_solver.hpp"

#include "execo/exergy.hpp"
#include "execo/finance.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace execo;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// A utility-scale solar project with every cost line populated.
static finance::ProjectAssumptions make_project(int lifetime) {
    finance::ProjectAssumptions a;
    a.project_name              = "Bench Solar";
    a.technology_type           = "solar";
    a.capacity_mw               = 250.0;
    a.capacity_factor           = 0.26;
    a.capex_per_kw              = 1050.0;
    a.land_cost                 = 3'000'000.0;
    a.grid_connection_cost      = 9'000'000.0;
    a.opex_per_kw_year          = 18.0;
    a.variable_opex_per_mwh     = 0.5;
    a.project_lifetime_years    = lifetime;
    a.discount_rate             = 0.07;
    a.electricity_price_per_mwh = 58.0;
    a.price_escalation_rate     = 0.02;
    a.carbon_credit_per_ton     = 30.0;
    a.carbon_intensity_avoided  = 0.4;
    return a;
}

/// −1000 followed by `years` equal inflows of 150: one sign change.
static std::vector<double> make_flows(std::size_t years) {
    std::vector<double> f(years + 1, 150.0);
    f[0] = -1000.0;
    return f;
}

static std::vector<double> make_variations(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = -30.0 + 60.0 * static_cast<double>(i) / static_cast<double>(n > 1 ? n - 1 : 1);
    }
    return v;
}

// ── Financials ─────────────────────────────────────────────────────────────────

static void BM_ComputeFinancials(benchmark::State& state) {
    const auto a = make_project(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto r = finance::compute_financials(a);
        benchmark::DoNotOptimize(r.npv);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_ComputeFinancials)->Arg(10)->Arg(25)->Arg(40)->Arg(60)
    ->Unit(benchmark::kMicrosecond);

// ── IRR ────────────────────────────────────────────────────────────────────────

static void BM_SolveIrr_Companion(benchmark::State& state) {
    const auto flows = make_flows(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto s = finance::solve_irr(flows);
        benchmark::DoNotOptimize(s.rate);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_SolveIrr_Companion)->RangeMultiplier(2)->Range(8, 64)
    ->Unit(benchmark::kMicrosecond);

static void BM_SolveIrr_Newton(benchmark::State& state) {
    const auto flows = make_flows(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto s = finance::IrrSolver::solve_newton(flows);
        benchmark::DoNotOptimize(s.rate);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_SolveIrr_Newton)->RangeMultiplier(2)->Range(8, 64)
    ->Unit(benchmark::kMicrosecond);

// ── Sensitivity ────────────────────────────────────────────────────────────────

static void BM_RunSensitivity(benchmark::State& state) {
    const auto a = make_project(25);
    const auto vars = make_variations(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto s = finance::run_sensitivity(a, finance::Parameter::CapexPerKw, vars);
        benchmark::DoNotOptimize(s.npv.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_RunSensitivity)->RangeMultiplier(4)->Range(4, 256)
    ->Unit(benchmark::kMicrosecond);

static void BM_Tornado_AllParameters(benchmark::State& state) {
    const auto a = make_project(25);
    const std::vector<finance::Parameter> params = {
        finance::Parameter::CapacityMw,
        finance::Parameter::CapacityFactor,
        finance::Parameter::CapexPerKw,
        finance::Parameter::OpexPerKwYear,
        finance::Parameter::DiscountRate,
        finance::Parameter::ElectricityPricePerMwh,
        finance::Parameter::PriceEscalationRate,
        finance::Parameter::CarbonCreditPerTon,
    };
    for (auto _ : state) {
        auto bars = finance::run_tornado(a, params, 10.0);
        benchmark::DoNotOptimize(bars.data());
    }
}
BENCHMARK(BM_Tornado_AllParameters)->Unit(benchmark::kMicrosecond);

// ── Exergy ─────────────────────────────────────────────────────────────────────

static void BM_AnalyzeExergy(benchmark::State& state) {
    exergy::EnergyProcessInput in{
        .energy_source   = "gas",
        .input_energy_mj = 1000.0,
        .output_temp_k   = 450.0,
        .end_use         = EndUse::MediumTempHeat,
    };
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        in.process_steps.push_back(exergy::ProcessStep{
            .name          = "stage" + std::to_string(i),
            .input_exergy  = 1000.0 - 10.0 * static_cast<double>(i),
            .output_exergy = 990.0 - 10.0 * static_cast<double>(i),
        });
    }
    const exergy::ExergyAnalyzer analyzer;
    for (auto _ : state) {
        auto r = analyzer.analyze(in);
        benchmark::DoNotOptimize(r.second_law_efficiency);
    }
}
BENCHMARK(BM_AnalyzeExergy)->Arg(0)->Arg(8)->Arg(64)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
