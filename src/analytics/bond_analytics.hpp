// SPDX-License-Identifier: MIT
/**
 * @file bond_analytics.hpp
 * @brief Per-instrument analytics bundle and its parallel batch form
 */

#pragma once

#include "spreadomatic/analytics/oas.hpp"
#include "spreadomatic/analytics/sensitivity.hpp"
#include "spreadomatic/analytics/yield_solver.hpp"
#include "spreadomatic/bond/cashflow_schedule.hpp"
#include "spreadomatic/bond/day_count.hpp"
#include "spreadomatic/curve/compounding.hpp"
#include "spreadomatic/curve/zero_curve.hpp"
#include "spreadomatic/math/numerical_config.hpp"
#include "spreadomatic/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace spreadomatic {

/// Schedule context needed for the next-call OAS
struct CallData {
    std::vector<ScheduledPayment> payments;
    Date valuation_date;
    DayBasis day_basis = DayBasis::ActAct;
    std::optional<CallScheduleEntry> next_call;
};

/// One instrument to analyse
struct BondAnalyticsRequest {
    double dirty_price;
    std::vector<double> times;      ///< Cashflow times in years
    std::vector<double> amounts;    ///< Cashflow totals
    ZeroCurve curve;
    /// Basis of the curve rates and of every spread
    Compounding compounding = Compounding::Annual;
    /// Coupon frequency; the YTM is compounded at this frequency
    int frequency = 2;
    /// Present for callable bonds; absent means no OAS is attempted
    std::optional<CallData> call_data = std::nullopt;
};

/// Knobs for compute_bond_analytics
struct AnalyticsConfig {
    NumericalConfig numerical{};
    /// Bump sizes, tenors and interpolation; its compounding is replaced
    /// by the request's
    SensitivityConfig sensitivity{};
    GSpreadBasis g_spread_basis = GSpreadBasis::Zero;
};

/// Analytics bundle with independent per-metric outcomes
///
/// A failing metric does not prevent the others; dependent metrics report
/// AnalyticsErrorCode::MissingInput when their input failed.
struct BondAnalytics {
    std::expected<SolveResult, AnalyticsError> ytm;
    std::expected<SolveResult, AnalyticsError> z_spread;
    std::expected<double, AnalyticsError> g_spread;
    std::expected<double, AnalyticsError> effective_duration;
    std::expected<double, AnalyticsError> modified_duration;
    std::expected<double, AnalyticsError> convexity;
    std::expected<double, AnalyticsError> spread_duration;
    std::expected<std::vector<KeyRateDuration>, AnalyticsError> key_rate_durations;
    /// Set only when the request carried call data
    std::optional<std::expected<SolveResult, AnalyticsError>> oas;
    /// Non-fatal conditions (non-convergence, degraded inputs)
    std::vector<std::string> warnings;

    /// True when every computed metric succeeded
    bool complete() const;
};

/// Batch analytics result
struct BatchAnalyticsResult {
    std::vector<BondAnalytics> results;  ///< Same order as the requests
    size_t failed_count;                 ///< Requests with at least one failed metric

    /// Check if all results succeeded
    bool all_succeeded() const {
        return failed_count == 0;
    }
};

/// Compute YTM, spreads, durations, convexity, key rates and OAS
///
/// Durations, convexity and key-rate durations are taken on the curve shifted
/// by the solved Z-spread, so the base curve reprices the market price. When
/// the Z-spread fails the unshifted curve is used and a warning recorded.
BondAnalytics compute_bond_analytics(const BondAnalyticsRequest& request,
                                     const AnalyticsConfig& config = {});

/// compute_bond_analytics over independent requests, in parallel when OpenMP is enabled
BatchAnalyticsResult compute_bond_analytics_batch(std::span<const BondAnalyticsRequest> requests,
                                                  const AnalyticsConfig& config = {});

/// Caller-facing message for a failed metric
std::string describe(const AnalyticsError& error);

}  // namespace spreadomatic
