// SPDX-License-Identifier: MIT
/**
 * @file compounding.hpp
 * @brief Compounding conventions, discount factors and rate conversion
 */

#pragma once

#include "spreadomatic/support/error_types.hpp"
#include <expected>
#include <string_view>

namespace spreadomatic {

/// Compounding convention of a quoted rate
enum class Compounding {
    Annual,
    Semiannual,
    Quarterly,
    Monthly,
    Continuous
};

/// Compounding periods per year (0 for Continuous)
int periods_per_year(Compounding comp);

/// Map a coupon frequency (1, 2, 4, 12) onto its periodic convention
std::expected<Compounding, ValidationError> compounding_from_frequency(int frequency);

/// Parse "annual", "semiannual", "quarterly", "monthly" or "continuous"
std::expected<Compounding, ValidationError> parse_compounding(std::string_view name);

std::string_view to_string(Compounding comp);

/// Discount factor for rate r over t years
///
/// Periodic: (1 + r/f)^(-f t). Continuous: exp(-r t).
double discount_factor(double rate, double t, Compounding comp);

/// Equivalent continuously compounded rate: f ln(1 + r/f)
double to_continuous(double rate, Compounding comp);

/// Inverse of to_continuous: f (exp(r/f) - 1)
double from_continuous(double rate, Compounding comp);

}  // namespace spreadomatic
