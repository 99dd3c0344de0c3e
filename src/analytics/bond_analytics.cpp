// SPDX-License-Identifier: MIT
#include "spreadomatic/analytics/bond_analytics.hpp"
#include "spreadomatic/support/parallel.hpp"
#include "spreadomatic/support/spreadomatic_trace.h"
#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spreadomatic {

namespace {

std::unexpected<AnalyticsError> missing_input() {
    return std::unexpected(AnalyticsError{.code = AnalyticsErrorCode::MissingInput});
}

void note_convergence(std::vector<std::string>& warnings, std::string_view metric,
                      const std::expected<SolveResult, AnalyticsError>& result) {
    if (result && !result->converged) {
        std::string warning(metric);
        warning += " did not converge";
        if (result->warning) {
            warning += ": ";
            warning += *result->warning;
        }
        warnings.push_back(std::move(warning));
    }
}

}  // namespace

bool BondAnalytics::complete() const {
    const bool core = ytm && z_spread && g_spread && effective_duration &&
                      modified_duration && convexity && spread_duration &&
                      key_rate_durations;
    return core && (!oas || oas->has_value());
}

BondAnalytics compute_bond_analytics(const BondAnalyticsRequest& request,
                                     const AnalyticsConfig& config) {
    SPREADOMATIC_TRACE_ALGO_START(MODULE_BOND_ANALYTICS, request.times.size(),
                                  request.dirty_price, request.frequency);

    BondAnalytics out;
    const YieldSolver solver(config.numerical);
    SensitivityConfig sensitivity = config.sensitivity;
    sensitivity.compounding = request.compounding;
    const InterpolationMethod interp = sensitivity.interpolation;

    // Yield to maturity on the coupon frequency
    const auto ytm_comp = compounding_from_frequency(request.frequency);
    if (ytm_comp) {
        out.ytm = solver.solve_ytm(request.dirty_price, request.times, request.amounts, *ytm_comp);
    } else {
        out.ytm = std::unexpected(to_analytics_error(ytm_comp.error()));
    }
    note_convergence(out.warnings, "YTM", out.ytm);

    // Z-spread over the zero curve
    out.z_spread = solver.solve_spread(request.dirty_price, request.times, request.amounts,
                                       request.curve, request.compounding,
                                       0.01, interp);
    note_convergence(out.warnings, "Z-spread", out.z_spread);

    // G-spread against the benchmark at maturity
    if (out.ytm && !request.times.empty()) {
        const double maturity = *std::max_element(request.times.begin(), request.times.end());
        out.g_spread = g_spread(out.ytm->value, maturity, request.curve, *ytm_comp,
                                request.compounding, config.g_spread_basis, interp);
    } else {
        out.g_spread = missing_input();
    }

    // Risk curve reprices the market price when the Z-spread is known
    ZeroCurve risk_curve = request.curve;
    if (out.z_spread) {
        risk_curve = request.curve.shifted(out.z_spread->value);
    } else {
        out.warnings.emplace_back("Z-spread unavailable; durations use the unshifted curve");
    }

    out.effective_duration = effective_duration(request.dirty_price, request.times,
                                                request.amounts, risk_curve, sensitivity);
    out.convexity = effective_convexity(request.dirty_price, request.times,
                                        request.amounts, risk_curve, sensitivity);
    out.key_rate_durations = key_rate_durations(request.dirty_price, request.times,
                                                request.amounts, risk_curve, sensitivity);

    if (out.effective_duration && out.ytm) {
        out.modified_duration = modified_duration(*out.effective_duration, out.ytm->value,
                                                  request.frequency);
    } else {
        out.modified_duration = missing_input();
    }

    if (out.z_spread) {
        out.spread_duration = spread_duration(request.dirty_price, request.times, request.amounts,
                                              request.curve, out.z_spread->value, sensitivity);
    } else {
        out.spread_duration = missing_input();
    }

    // Next-call OAS for callable bonds
    if (request.call_data) {
        const CallData& call = *request.call_data;
        out.oas = compute_oas(call.payments, call.valuation_date, request.curve, call.day_basis,
                              request.dirty_price, call.next_call, request.compounding,
                              config.numerical);
        note_convergence(out.warnings, "OAS", *out.oas);
    }

    if (!out.complete()) {
        SPREADOMATIC_TRACE_RUNTIME_ERROR(MODULE_BOND_ANALYTICS,
            static_cast<int>(AnalyticsErrorCode::SolverFailed), request.dirty_price);
    } else {
        SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_BOND_ANALYTICS, out.warnings.size(),
                                         out.ytm->value);
    }
    return out;
}

BatchAnalyticsResult compute_bond_analytics_batch(std::span<const BondAnalyticsRequest> requests,
                                                  const AnalyticsConfig& config) {
    std::vector<BondAnalytics> results(requests.size());
    size_t failed_count = 0;

    // Requests are independent; each iteration writes only its own slot
    SPREADOMATIC_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < requests.size(); ++i) {
        results[i] = compute_bond_analytics(requests[i], config);
        if (!results[i].complete()) {
            SPREADOMATIC_PRAGMA_ATOMIC
            ++failed_count;
        }
    }

    return BatchAnalyticsResult{
        .results = std::move(results),
        .failed_count = failed_count
    };
}

std::string describe(const AnalyticsError& error) {
    std::string reason;
    switch (error.code) {
        case AnalyticsErrorCode::InvalidPrice:
            reason = "the price is missing or not positive";
            break;
        case AnalyticsErrorCode::InvalidCashflows:
            reason = "the cashflow schedule is empty or malformed";
            break;
        case AnalyticsErrorCode::InvalidCurve:
            reason = "the zero curve is missing or malformed";
            break;
        case AnalyticsErrorCode::InvalidSchedule:
            reason = "the bond terms are invalid";
            break;
        case AnalyticsErrorCode::MissingCallData:
            reason = "no future call date is available";
            break;
        case AnalyticsErrorCode::BracketingFailed:
            reason = "no solution exists in the search range";
            break;
        case AnalyticsErrorCode::NumericalInstability:
            reason = "the pricing function produced non-finite values";
            break;
        case AnalyticsErrorCode::SolverFailed:
            reason = "the solver failed to converge";
            break;
        case AnalyticsErrorCode::MissingInput:
            reason = "a metric it depends on could not be calculated";
            break;
    }
    return "Could not calculate analytics for this instrument: " + reason;
}

}  // namespace spreadomatic
