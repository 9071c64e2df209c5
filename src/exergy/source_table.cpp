/// @file src/exergy/source_table.cpp
/// @brief SourceTable: immutable energy-source property lookup.

#include "execo/exergy.hpp"
#include "execo/errors.hpp"

#include <algorithm>
#include <cctype>

namespace execo {

std::string_view to_string(SourceCategory category) noexcept {
    switch (category) {
        case SourceCategory::Fuel:   return "fuel";
        case SourceCategory::Direct: return "direct";
        case SourceCategory::Other:  return "other";
    }
    return "unknown";
}

} // namespace execo

namespace execo::exergy {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

namespace {

void check_properties(const std::string& name, const SourceProperties& p) {
    if (!(p.efficiency > 0.0 && p.efficiency <= 1.0)) {
        throw ValidationError(name + ".efficiency", "must be in (0, 1]");
    }
    if (!(p.quality >= 0.0 && p.quality <= 1.0)) {
        throw ValidationError(name + ".quality", "must be in [0, 1]");
    }
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

SourceTable::SourceTable(const Map& entries, SourceProperties fallback)
    : fallback_(fallback) {
    check_properties("fallback", fallback_);

    for (const auto& [name, props] : entries) {
        check_properties(name, props);
        if (!entries_.emplace(to_lower(name), props).second) {
            throw ValidationError(name, "duplicate source name (case-insensitive)");
        }
    }
}

const SourceTable& SourceTable::standard() {
    static const SourceTable table(Map{
        {"coal",       {0.32, 0.78, SourceCategory::Fuel}},
        {"oil",        {0.30, 0.82, SourceCategory::Fuel}},
        {"gas",        {0.52, 0.46, SourceCategory::Fuel}},
        {"biomass",    {0.20, 0.26, SourceCategory::Fuel}},
        {"nuclear",    {0.25, 0.95, SourceCategory::Direct}},
        {"hydro",      {0.87, 0.95, SourceCategory::Direct}},
        {"wind",       {0.88, 0.95, SourceCategory::Direct}},
        {"solar",      {0.85, 0.95, SourceCategory::Direct}},
        {"geothermal", {0.82, 0.54, SourceCategory::Other}},
    });
    return table;
}

// ─── Lookup ───────────────────────────────────────────────────────────────────

std::optional<SourceProperties> SourceTable::find(std::string_view name) const {
    const auto it = entries_.find(to_lower(name));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

SourceProperties SourceTable::resolve(std::string_view name) const {
    return find(name).value_or(fallback_);
}

bool SourceTable::contains(std::string_view name) const {
    return entries_.find(to_lower(name)) != entries_.end();
}

} // namespace execo::exergy
