#pragma once

/// @file include/execo/log.hpp
/// @brief Levelled stderr logging for the loader and the CLI.
///
/// The engines never log. Messages go to stderr via fmt, prefixed with the
/// level tag, and are dropped below the process-wide threshold.

#include <fmt/core.h>

#include <string_view>
#include <utility>

namespace execo::core {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Set the process-wide threshold (default `Warn`). Thread-safe.
void set_log_level(LogLevel level) noexcept;

[[nodiscard]] LogLevel log_level() noexcept;

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/// Write an already formatted line at `level`.
void log_line(LogLevel level, std::string_view message);

template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (level < log_level()) return;
    log_line(level, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace execo::core
