// SPDX-License-Identifier: MIT
#include "spreadomatic/analytics/sensitivity.hpp"
#include "spreadomatic/analytics/yield_solver.hpp"
#include "spreadomatic/curve/discount.hpp"
#include "spreadomatic/support/spreadomatic_trace.h"
#include <algorithm>
#include <cmath>

namespace spreadomatic {

namespace {

std::expected<void, AnalyticsError>
check_inputs(double price, std::span<const double> times, std::span<const double> amounts,
             const ZeroCurve& curve, double bump) {
    if (auto valid = validate_cashflow_inputs(price, times, amounts); !valid) {
        SPREADOMATIC_TRACE_VALIDATION_ERROR(MODULE_SENSITIVITY,
            static_cast<int>(valid.error().code), valid.error().value, valid.error().index);
        return std::unexpected(to_analytics_error(valid.error()));
    }
    if (curve.empty()) {
        return std::unexpected(AnalyticsError{.code = AnalyticsErrorCode::InvalidCurve});
    }
    if (!std::isfinite(bump) || bump <= 0.0) {
        return std::unexpected(AnalyticsError{
            .code = AnalyticsErrorCode::NumericalInstability, .last_value = bump});
    }
    return {};
}

double reprice(std::span<const double> times, std::span<const double> amounts,
               const ZeroCurve& curve, double spread, const SensitivityConfig& config) {
    return pv_cashflows(times, amounts, curve, spread, config.compounding, config.interpolation);
}

}  // namespace

std::vector<KeyRateTenor> default_key_rate_tenors() {
    return {
        {"1M", 1.0 / 12.0},
        {"3M", 0.25},
        {"6M", 0.5},
        {"1Y", 1.0},
        {"2Y", 2.0},
        {"3Y", 3.0},
        {"4Y", 4.0},
        {"5Y", 5.0},
        {"7Y", 7.0},
        {"10Y", 10.0},
        {"20Y", 20.0},
        {"30Y", 30.0},
        {"50Y", 50.0},
    };
}

std::expected<double, AnalyticsError>
effective_duration(double price, std::span<const double> times,
                   std::span<const double> amounts, const ZeroCurve& curve,
                   const SensitivityConfig& config) {
    const double d = config.duration_bump;
    if (auto ok = check_inputs(price, times, amounts, curve, d); !ok) {
        return std::unexpected(ok.error());
    }
    const double p_up = reprice(times, amounts, curve.shifted(d), 0.0, config);
    const double p_down = reprice(times, amounts, curve.shifted(-d), 0.0, config);
    return (p_down - p_up) / (2.0 * d * price);
}

std::expected<double, AnalyticsError>
effective_convexity(double price, std::span<const double> times,
                    std::span<const double> amounts, const ZeroCurve& curve,
                    const SensitivityConfig& config) {
    const double d = config.convexity_bump;
    if (auto ok = check_inputs(price, times, amounts, curve, d); !ok) {
        return std::unexpected(ok.error());
    }
    const double p_up = reprice(times, amounts, curve.shifted(d), 0.0, config);
    const double p_down = reprice(times, amounts, curve.shifted(-d), 0.0, config);
    return (p_up + p_down - 2.0 * price) / (d * d * price);
}

std::expected<double, AnalyticsError>
spread_duration(double price, std::span<const double> times,
                std::span<const double> amounts, const ZeroCurve& curve,
                double spread, const SensitivityConfig& config) {
    const double d = config.spread_bump;
    if (auto ok = check_inputs(price, times, amounts, curve, d); !ok) {
        return std::unexpected(ok.error());
    }
    const double p_up = reprice(times, amounts, curve, spread + d, config);
    const double p_down = reprice(times, amounts, curve, spread - d, config);
    return (p_down - p_up) / (2.0 * d * price);
}

std::expected<std::vector<KeyRateDuration>, AnalyticsError>
key_rate_durations(double price, std::span<const double> times,
                   std::span<const double> amounts, const ZeroCurve& curve,
                   const SensitivityConfig& config) {
    const double d = config.key_rate_bump;
    if (auto ok = check_inputs(price, times, amounts, curve, d); !ok) {
        return std::unexpected(ok.error());
    }

    SPREADOMATIC_TRACE_ALGO_START(MODULE_SENSITIVITY, config.key_rate_tenors.size(), price, d);

    std::vector<KeyRateDuration> durations;
    durations.reserve(config.key_rate_tenors.size());
    for (const auto& tenor : config.key_rate_tenors) {
        const ZeroCurve up = curve.with_tenor_bump(tenor.years, d, config.interpolation);
        const ZeroCurve down = curve.with_tenor_bump(tenor.years, -d, config.interpolation);
        const double p_up = reprice(times, amounts, up, 0.0, config);
        const double p_down = reprice(times, amounts, down, 0.0, config);
        durations.push_back(KeyRateDuration{
            .label = tenor.label,
            .tenor = tenor.years,
            .duration = (p_down - p_up) / (2.0 * d * price)
        });
    }

    SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_SENSITIVITY, durations.size(), price);
    return durations;
}

double macaulay_duration(std::span<const double> times, std::span<const double> amounts,
                         double ytm, Compounding comp) {
    const size_t n = std::min(times.size(), amounts.size());
    double pv_sum = 0.0;
    double weighted = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double pv = amounts[i] * discount_factor(ytm, times[i], comp);
        pv_sum += pv;
        weighted += times[i] * pv;
    }
    return pv_sum > 0.0 ? weighted / pv_sum : 0.0;
}

double modified_duration(double duration, double ytm, int frequency) {
    return duration / (1.0 + ytm / std::max(1, frequency));
}

double modified_duration_standard(std::span<const double> times,
                                  std::span<const double> amounts,
                                  double ytm, Compounding comp, int frequency) {
    return modified_duration(macaulay_duration(times, amounts, ytm, comp), ytm, frequency);
}

}  // namespace spreadomatic
