/// @file src/main.cpp
/// @brief execo CLI entry point.
///
/// Usage:
///   execo --tea <assumptions.csv>                   Financial report
///   execo --assess <assumptions.csv> <source>       Financial + exergy value
///   execo --sensitivity <assumptions.csv> <param> <pct,pct,...>
///   execo --tornado <assumptions.csv> [pct]         Rank parameters by NPV swing
///   execo --exergy <source> <input_mj> [end_use] [output_temp_k]
///   execo --compare <source>[,<source>...]          Rank sources at 1000 MJ
///   execo --value <annual_mwh> <source> [price]     Exergy-adjusted value
///   execo --sources                                 Print the source table
///   execo --help                                    Print usage
///
/// `--verbose` anywhere on the line lowers the log threshold to info.

#include "execo/assumptions_loader.hpp"
#include "execo/exergy.hpp"
#include "execo/finance.hpp"
#include "execo/log.hpp"
#include "execo/valuation.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using execo::core::AssumptionsLoader;
using execo::core::LogLevel;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  execo --tea <assumptions.csv>                  Financial report\n"
        "  execo --assess <assumptions.csv> <source>      Financial + exergy value\n"
        "  execo --sensitivity <assumptions.csv> <param> <pct,pct,...>\n"
        "  execo --tornado <assumptions.csv> [pct]        Rank parameters by NPV swing\n"
        "  execo --exergy <source> <input_mj> [end_use] [output_temp_k]\n"
        "  execo --compare <source>[,<source>...]         Rank sources at 1000 MJ\n"
        "  execo --value <annual_mwh> <source> [price]    Exergy-adjusted value\n"
        "  execo --sources                                Print the source table\n"
        "  execo --help                                   Show this help\n"
        "\n"
        "Options:\n"
        "  --verbose                                      Log progress to stderr\n"
        "\n"
        "Assumptions CSV format (header required):\n"
        "  key,value\n"
        "  capacity_mw,100\n"
        "  capacity_factor,0.25\n"
        "\n"
        "End uses: electricity, mechanical_work, high_temp_heat,\n"
        "          medium_temp_heat, low_temp_heat, chemical\n"
    );
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

std::optional<double> number_arg(std::string_view arg, std::string_view what) {
    auto value = AssumptionsLoader::parse_number(arg);
    if (!value) {
        fmt::print(stderr, "Error: {} '{}' is not a number\n", what, arg);
    }
    return value;
}

std::optional<execo::finance::ProjectAssumptions> load(const std::string& path) {
    auto loaded = AssumptionsLoader::load_csv(path);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", path);
        return std::nullopt;
    }
    if (!loaded->skipped.empty()) {
        fmt::print(stderr, "Warning: {} row(s) in '{}' were skipped\n",
                   loaded->skipped.size(), path);
    }
    execo::core::log(LogLevel::Info, "loaded '{}' ({})", path,
                     loaded->assumptions.project_name);
    return loaded->assumptions;
}

// ─── Commands ─────────────────────────────────────────────────────────────────

int run_tea(const std::string& path) {
    auto assumptions = load(path);
    if (!assumptions) return 1;

    const auto result = execo::finance::compute_financials(*assumptions);
    fmt::print("{} ({})\n\n{}\n", assumptions->project_name,
               assumptions->technology_type, result.to_string());
    execo::core::log(LogLevel::Info, "IRR {} via {} after {} iterations",
                     execo::finance::to_string(result.irr_solution.status),
                     execo::finance::to_string(result.irr_solution.method),
                     result.irr_solution.iterations);
    return 0;
}

int run_assess(const std::string& path, std::string_view source) {
    auto assumptions = load(path);
    if (!assumptions) return 1;

    const auto assessment = execo::valuation::assess_project(*assumptions, source);
    fmt::print("{}\n\n{}\n", assumptions->project_name, assessment.to_string());
    return 0;
}

int run_sensitivity(const std::string& path, std::string_view parameter,
                    std::string_view pct_list) {
    auto assumptions = load(path);
    if (!assumptions) return 1;

    std::vector<double> variations;
    for (auto token : split(pct_list, ',')) {
        auto pct = number_arg(token, "variation");
        if (!pct) return 1;
        variations.push_back(*pct);
    }

    const auto sweep = execo::finance::run_sensitivity(*assumptions, parameter, variations);

    fmt::print("Sensitivity of {}\n", execo::finance::to_string(sweep.parameter));
    fmt::print("{:>10} {:>16} {:>18}\n", "change %", "LCOE $/MWh", "NPV $");
    for (std::size_t i = 0; i < sweep.variations.size(); ++i) {
        fmt::print("{:>+10.1f} {:>16.2f} {:>18.0f}\n",
                   sweep.variations[i], sweep.lcoe[i], sweep.npv[i]);
    }
    return 0;
}

/// True when both ±pct variations of `p` are valid assumption sets.
bool sweepable(const execo::finance::ProjectAssumptions& a,
               execo::finance::Parameter p, double pct) {
    const double base = execo::finance::parameter_value(a, p);
    try {
        auto low  = execo::finance::with_parameter(a, p, base * (1.0 - pct / 100.0));
        auto high = execo::finance::with_parameter(a, p, base * (1.0 + pct / 100.0));
        return !execo::finance::validate(low) && !execo::finance::validate(high);
    } catch (const execo::ValidationError& e) {
        execo::core::log(LogLevel::Debug, "tornado: {}", e.what());
        return false;
    }
}

int run_tornado(const std::string& path, double pct) {
    auto assumptions = load(path);
    if (!assumptions) return 1;

    // Parameters whose ±pct can leave their valid range are swept only when
    // the base value leaves room for it.
    std::vector<execo::finance::Parameter> parameters;
    for (auto p : execo::finance::all_parameters()) {
        if (sweepable(*assumptions, p, pct)) {
            parameters.push_back(p);
        } else {
            execo::core::log(LogLevel::Info, "tornado: {} skipped at ±{}%",
                             execo::finance::to_string(p), pct);
        }
    }

    const auto bars = execo::finance::run_tornado(*assumptions, parameters, pct);

    fmt::print("NPV swing at ±{}%\n", pct);
    fmt::print("{:<28} {:>16} {:>16} {:>16}\n", "parameter", "NPV low", "NPV high", "swing");
    for (const auto& bar : bars) {
        fmt::print("{:<28} {:>16.0f} {:>16.0f} {:>16.0f}\n",
                   execo::finance::to_string(bar.parameter),
                   bar.npv_low, bar.npv_high, bar.npv_swing());
    }
    return 0;
}

int run_exergy(int argc, char* argv[]) {
    const std::string source(argv[2]);
    auto input_mj = number_arg(argv[3], "input energy");
    if (!input_mj) return 1;
    if (!(*input_mj > 0.0)) {
        fmt::print(stderr, "Error: input energy must be > 0 (got {})\n", *input_mj);
        return 1;
    }

    execo::exergy::EnergyProcessInput input{
        .energy_source   = source,
        .input_energy_mj = *input_mj,
    };

    if (argc > 4) {
        auto use = execo::parse_end_use(argv[4]);
        if (!use) {
            fmt::print(stderr, "Error: unknown end use '{}'\n", argv[4]);
            return 1;
        }
        input.end_use = *use;
    }
    if (argc > 5) {
        auto temp = number_arg(argv[5], "output temperature");
        if (!temp) return 1;
        input.output_temp_k = *temp;
    }

    const auto& table = execo::exergy::SourceTable::standard();
    if (!table.contains(source)) {
        execo::core::log(LogLevel::Warn, "unknown source '{}', using fallback properties",
                         source);
    }

    const auto result = execo::exergy::ExergyAnalyzer(table).analyze(input);
    fmt::print("{}\n\n{}\n", result.to_string(), result.insight());
    return 0;
}

int run_compare(std::string_view source_list) {
    std::vector<execo::exergy::TechnologySpec> specs;
    for (auto name : split(source_list, ',')) {
        if (name.empty()) continue;
        specs.push_back(execo::exergy::TechnologySpec{
            .name   = std::string(name),
            .source = std::string(name),
        });
    }
    if (specs.empty()) {
        fmt::print(stderr, "Error: --compare requires at least one source\n");
        return 1;
    }

    const auto comparison = execo::exergy::compare_technologies(specs);
    fmt::print("{}\n", comparison.to_string());
    return 0;
}

int run_value(int argc, char* argv[]) {
    auto production = number_arg(argv[2], "annual production");
    if (!production) return 1;

    double price = execo::constants::DEFAULT_ELECTRICITY_PRICE;
    if (argc > 4) {
        auto p = number_arg(argv[4], "price");
        if (!p) return 1;
        price = *p;
    }

    const auto value = execo::valuation::compute_exergy_value(*production, argv[3], price);
    fmt::print("{}\n", value.to_string());
    return 0;
}

int run_sources() {
    const auto& table = execo::exergy::SourceTable::standard();
    fmt::print("{:<12} {:>10} {:>8} {:>8}\n", "source", "efficiency", "quality", "category");
    for (const auto& [name, props] : table.entries()) {
        fmt::print("{:<12} {:>10.2f} {:>8.2f} {:>8}\n",
                   name, props.efficiency, props.quality, execo::to_string(props.category));
    }
    const auto& fb = table.fallback();
    fmt::print("{:<12} {:>10.2f} {:>8.2f} {:>8}\n",
               "(fallback)", fb.efficiency, fb.quality, execo::to_string(fb.category));
    fmt::print("\nReference environment: T0 = {} K, P0 = {} kPa\n",
               execo::constants::REFERENCE_TEMPERATURE_K,
               execo::constants::REFERENCE_PRESSURE_KPA);
    return 0;
}

int dispatch(int argc, char* argv[]) {
    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }
    if (mode == "--tea" && argc >= 3) {
        return run_tea(argv[2]);
    }
    if (mode == "--assess" && argc >= 4) {
        return run_assess(argv[2], argv[3]);
    }
    if (mode == "--sensitivity" && argc >= 5) {
        return run_sensitivity(argv[2], argv[3], argv[4]);
    }
    if (mode == "--tornado" && argc >= 3) {
        double pct = 10.0;
        if (argc >= 4) {
            auto p = number_arg(argv[3], "percentage");
            if (!p) return 1;
            pct = *p;
        }
        return run_tornado(argv[2], pct);
    }
    if (mode == "--exergy" && argc >= 4) {
        return run_exergy(argc, argv);
    }
    if (mode == "--compare" && argc >= 3) {
        return run_compare(argv[2]);
    }
    if (mode == "--value" && argc >= 4) {
        return run_value(argc, argv);
    }
    if (mode == "--sources") {
        return run_sources();
    }

    fmt::print(stderr, "Error: unknown option or missing arguments: {}\n", mode);
    print_usage();
    return 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    // Pull --verbose out before positional dispatch.
    std::vector<char*> args;
    for (int i = 0; i < argc; ++i) {
        if (i > 0 && std::string_view(argv[i]) == "--verbose") {
            execo::core::set_log_level(LogLevel::Info);
            continue;
        }
        args.push_back(argv[i]);
    }

    if (args.size() < 2) {
        print_usage();
        return 1;
    }

    try {
        return dispatch(static_cast<int>(args.size()), args.data());
    } catch (const execo::ValidationError& e) {
        fmt::print(stderr, "Error: invalid input: {}\n", e.what());
        return 1;
    }
}
