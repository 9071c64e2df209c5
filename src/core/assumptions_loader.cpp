/// @file src/core/assumptions_loader.cpp
/// @brief key,value CSV loader for ProjectAssumptions.

#include "execo/assumptions_loader.hpp"
#include "execo/log.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace execo::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

using DoubleField = double finance::ProjectAssumptions::*;
using IntField    = int finance::ProjectAssumptions::*;

struct DoubleKey { std::string_view key; DoubleField field; };
struct IntKey    { std::string_view key; IntField    field; };

constexpr DoubleKey kDoubleKeys[] = {
    {"capacity_mw",               &finance::ProjectAssumptions::capacity_mw},
    {"capacity_factor",           &finance::ProjectAssumptions::capacity_factor},
    {"capex_per_kw",              &finance::ProjectAssumptions::capex_per_kw},
    {"installation_factor",       &finance::ProjectAssumptions::installation_factor},
    {"land_cost",                 &finance::ProjectAssumptions::land_cost},
    {"grid_connection_cost",      &finance::ProjectAssumptions::grid_connection_cost},
    {"opex_per_kw_year",          &finance::ProjectAssumptions::opex_per_kw_year},
    {"fixed_opex_annual",         &finance::ProjectAssumptions::fixed_opex_annual},
    {"variable_opex_per_mwh",     &finance::ProjectAssumptions::variable_opex_per_mwh},
    {"insurance_rate",            &finance::ProjectAssumptions::insurance_rate},
    {"discount_rate",             &finance::ProjectAssumptions::discount_rate},
    {"debt_ratio",                &finance::ProjectAssumptions::debt_ratio},
    {"interest_rate",             &finance::ProjectAssumptions::interest_rate},
    {"tax_rate",                  &finance::ProjectAssumptions::tax_rate},
    {"electricity_price_per_mwh", &finance::ProjectAssumptions::electricity_price_per_mwh},
    {"price_escalation_rate",     &finance::ProjectAssumptions::price_escalation_rate},
    {"carbon_credit_per_ton",     &finance::ProjectAssumptions::carbon_credit_per_ton},
    {"carbon_intensity_avoided",  &finance::ProjectAssumptions::carbon_intensity_avoided},
};

constexpr IntKey kIntKeys[] = {
    {"project_lifetime_years", &finance::ProjectAssumptions::project_lifetime_years},
    {"depreciation_years",     &finance::ProjectAssumptions::depreciation_years},
};

} // namespace

// ─── AssumptionsLoader::parse_number ──────────────────────────────────────────

std::optional<double> AssumptionsLoader::parse_number(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) return std::nullopt;
    if (token.front() == '+') token.remove_prefix(1);

    double value = 0.0;
    const char* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;  // not a number, or trailing garbage
    }
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

// ─── AssumptionsLoader::apply ─────────────────────────────────────────────────

std::optional<std::string>
AssumptionsLoader::apply(finance::ProjectAssumptions& a, std::string_view key,
                         std::string_view value) {
    key = trim(key);
    value = trim(value);

    if (key == "project_name") {
        a.project_name = std::string(value);
        return std::nullopt;
    }
    if (key == "technology_type") {
        a.technology_type = std::string(value);
        return std::nullopt;
    }

    const auto number = parse_number(value);

    if (key == "annual_production_mwh") {
        if (!number) return fmt::format("'{}' is not a number", value);
        a.annual_production_mwh = *number;
        return std::nullopt;
    }
    for (const auto& entry : kDoubleKeys) {
        if (entry.key != key) continue;
        if (!number) return fmt::format("'{}' is not a number", value);
        a.*entry.field = *number;
        return std::nullopt;
    }
    for (const auto& entry : kIntKeys) {
        if (entry.key != key) continue;
        if (!number || std::trunc(*number) != *number
            || std::abs(*number) > 1e9) {
            return fmt::format("'{}' is not a whole number", value);
        }
        a.*entry.field = static_cast<int>(*number);
        return std::nullopt;
    }
    return fmt::format("unknown key '{}'", key);
}

// ─── AssumptionsLoader::parse_csv_string ──────────────────────────────────────

LoadedAssumptions AssumptionsLoader::parse_csv_string(const std::string& csv_content) {
    LoadedAssumptions out;
    std::istringstream stream(csv_content);
    std::string line;
    std::size_t line_number = 0;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        ++line_number;
        const std::string_view row = trim(line);

        // Blank and comment lines never count as the header.
        if (row.empty() || row.front() == '#') continue;

        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        const auto comma = row.find(',');
        if (comma == std::string_view::npos) {
            out.skipped.push_back({line_number, "expected key,value"});
            log(LogLevel::Warn, "line {}: expected key,value, skipped", line_number);
            continue;
        }

        if (auto reason = apply(out.assumptions, row.substr(0, comma),
                                row.substr(comma + 1))) {
            log(LogLevel::Warn, "line {}: {}, skipped", line_number, *reason);
            out.skipped.push_back({line_number, std::move(*reason)});
        }
    }

    log(LogLevel::Debug, "parsed {} lines, {} skipped", line_number, out.skipped.size());
    return out;
}

// ─── AssumptionsLoader::load_csv ──────────────────────────────────────────────

std::optional<LoadedAssumptions>
AssumptionsLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        log(LogLevel::Debug, "cannot open '{}'", filepath);
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    log(LogLevel::Info, "loading assumptions from '{}'", filepath);
    return parse_csv_string(contents.str());
}

} // namespace execo::core
