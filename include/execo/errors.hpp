#pragma once

/// @file include/execo/errors.hpp
/// @brief Exception types raised at the engine's input boundary.
///
/// Only input validation throws. Everything downstream of a validated input
/// reports degenerate cases through `std::optional` or documented sentinels.

#include <stdexcept>
#include <string>
#include <utility>

namespace execo {

/// An assumption failed a range or finiteness check.
///
/// `field()` names the offending input (e.g. "capacity_mw") so a caller can
/// map the failure back onto its own form or file.
class ValidationError : public std::invalid_argument {
public:
    ValidationError(std::string field, const std::string& message)
        : std::invalid_argument(field + ": " + message),
          field_(std::move(field)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

} // namespace execo
