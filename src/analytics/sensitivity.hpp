// SPDX-License-Identifier: MIT
/**
 * @file sensitivity.hpp
 * @brief Bump-and-reprice duration, convexity and key-rate sensitivities
 */

#pragma once

#include "spreadomatic/curve/compounding.hpp"
#include "spreadomatic/curve/interpolation.hpp"
#include "spreadomatic/curve/zero_curve.hpp"
#include "spreadomatic/support/error_types.hpp"
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace spreadomatic {

/// Key-rate tenor: label and time in years
struct KeyRateTenor {
    std::string label;
    double years;
};

/// Sensitivity of price to one key-rate bump
struct KeyRateDuration {
    std::string label;
    double tenor;
    double duration;
};

/// 1M, 3M, 6M, 1Y, 2Y, 3Y, 4Y, 5Y, 7Y, 10Y, 20Y, 30Y, 50Y
std::vector<KeyRateTenor> default_key_rate_tenors();

/// Bump sizes and pricing conventions for sensitivities
struct SensitivityConfig {
    double duration_bump = 1e-4;    ///< 1bp parallel curve bump
    double convexity_bump = 1e-3;   ///< 10bp parallel curve bump
    double spread_bump = 1e-4;      ///< 1bp spread bump
    double key_rate_bump = 1e-4;    ///< 1bp single-tenor bump
    Compounding compounding = Compounding::Annual;
    InterpolationMethod interpolation = InterpolationMethod::Linear;
    std::vector<KeyRateTenor> key_rate_tenors = default_key_rate_tenors();
};

/// (P(-d) - P(+d)) / (2 d price) under whole-curve bumps
std::expected<double, AnalyticsError>
effective_duration(double price, std::span<const double> times,
                   std::span<const double> amounts, const ZeroCurve& curve,
                   const SensitivityConfig& config = {});

/// (P(+d) + P(-d) - 2 price) / (d^2 price) under whole-curve bumps
std::expected<double, AnalyticsError>
effective_convexity(double price, std::span<const double> times,
                    std::span<const double> amounts, const ZeroCurve& curve,
                    const SensitivityConfig& config = {});

/// (P(s - d) - P(s + d)) / (2 d price) with d applied to the spread
std::expected<double, AnalyticsError>
spread_duration(double price, std::span<const double> times,
                std::span<const double> amounts, const ZeroCurve& curve,
                double spread, const SensitivityConfig& config = {});

/// One duration per tenor, bumping that tenor alone (insert-or-shift)
///
/// Results follow the order of config.key_rate_tenors.
std::expected<std::vector<KeyRateDuration>, AnalyticsError>
key_rate_durations(double price, std::span<const double> times,
                   std::span<const double> amounts, const ZeroCurve& curve,
                   const SensitivityConfig& config = {});

/// PV-weighted average cashflow time at yield y (0 when PV is not positive)
double macaulay_duration(std::span<const double> times, std::span<const double> amounts,
                         double ytm, Compounding comp);

/// duration / (1 + ytm / frequency)
double modified_duration(double duration, double ytm, int frequency);

/// Macaulay duration at the YTM divided by (1 + ytm / frequency)
double modified_duration_standard(std::span<const double> times,
                                  std::span<const double> amounts,
                                  double ytm, Compounding comp, int frequency);

}  // namespace spreadomatic
