/// @file src/core/log.cpp
/// @brief Levelled stderr logging.

#include "execo/log.hpp"

#include <fmt/core.h>

#include <atomic>
#include <cstdio>

namespace execo::core {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};

} // namespace

void set_log_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

void log_line(LogLevel level, std::string_view message) {
    if (level < log_level() || level == LogLevel::Off) return;
    fmt::print(stderr, "[execo {}] {}\n", to_string(level), message);
}

} // namespace execo::core
