#pragma once

/// @file include/execo/assumptions_loader.hpp
/// @brief key,value CSV loader for project assumptions.
///
/// # Module: AssumptionsLoader
///
/// ## Responsibility
/// Read a two-column CSV into a `ProjectAssumptions`, starting from the
/// struct defaults and overwriting each field that appears in the file.
///
/// ## Expected CSV Format
/// ```
/// key,value
/// # comment lines are ignored
/// project_name,Mesa Solar
/// capacity_mw,100
/// capacity_factor,0.25
/// capex_per_kw,1000
/// ```
/// The first non-comment line is treated as a header and skipped. Keys are
/// the `ProjectAssumptions` member names.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Unknown keys and unparseable values are skipped with a warning
/// - Range validation is left to `finance::validate` / `FinancialEngine`

#include "execo/finance.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execo::core {

/// A row the loader could not apply.
struct SkippedRow {
    std::size_t line_number;  ///< 1-based
    std::string reason;
};

/// Parsed assumptions plus the rows that were ignored.
struct LoadedAssumptions {
    finance::ProjectAssumptions assumptions;
    std::vector<SkippedRow>     skipped;
};

/// Loads `ProjectAssumptions` from key,value CSV files and strings.
class AssumptionsLoader {
public:
    /// Load from a file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Otherwise the parsed assumptions (defaults where keys are absent)
    [[nodiscard]] static std::optional<LoadedAssumptions>
    load_csv(const std::string& filepath);

    /// Parse CSV content held in memory (useful for testing).
    [[nodiscard]] static LoadedAssumptions
    parse_csv_string(const std::string& csv_content);

    /// Apply one key/value pair to `a`.
    ///
    /// # Returns
    /// An explanation if the key is unknown or the value does not parse;
    /// `nullopt` on success.
    [[nodiscard]] static std::optional<std::string>
    apply(finance::ProjectAssumptions& a, std::string_view key,
          std::string_view value);

    /// Strict finite-double parse of a whole token (no trailing garbage).
    [[nodiscard]] static std::optional<double>
    parse_number(std::string_view token) noexcept;
};

} // namespace execo::core
