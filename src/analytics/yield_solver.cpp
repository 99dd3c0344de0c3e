// SPDX-License-Identifier: MIT
#include "spreadomatic/analytics/yield_solver.hpp"
#include "spreadomatic/curve/discount.hpp"
#include "spreadomatic/support/spreadomatic_trace.h"
#include <algorithm>
#include <cmath>

namespace spreadomatic {

namespace {

SolveResult to_solve_result(const RootFindingResult& root) {
    return SolveResult{
        .value = root.root,
        .iterations = root.iterations,
        .final_error = root.final_error,
        .converged = root.converged,
        .warning = root.diagnostic
    };
}

std::unexpected<AnalyticsError> validation_failure(const ValidationError& error) {
    SPREADOMATIC_TRACE_VALIDATION_ERROR(MODULE_YIELD_SOLVER,
        static_cast<int>(error.code), error.value, error.index);
    return std::unexpected(to_analytics_error(error));
}

}  // namespace

std::expected<void, ValidationError>
validate_cashflow_inputs(double price, std::span<const double> times,
                         std::span<const double> amounts) {
    if (!std::isfinite(price) || price <= 0.0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidPrice, price));
    }
    if (times.empty()) {
        return std::unexpected(ValidationError(ValidationErrorCode::EmptyCashflows));
    }
    if (times.size() != amounts.size()) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::CashflowSizeMismatch,
            static_cast<double>(amounts.size()), times.size()));
    }
    for (size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i]) || times[i] <= 0.0) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::NonPositiveCashflowTime, times[i], i));
        }
        if (!std::isfinite(amounts[i])) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::NonFiniteCashflow, amounts[i], i));
        }
    }
    return {};
}

std::expected<SolveResult, AnalyticsError>
YieldSolver::solve_ytm(double price,
                       std::span<const double> times,
                       std::span<const double> amounts,
                       Compounding comp,
                       double initial_guess) const {
    if (auto valid = validate_numerical_config(config_); !valid) {
        return validation_failure(valid.error());
    }
    if (auto valid = validate_cashflow_inputs(price, times, amounts); !valid) {
        return validation_failure(valid.error());
    }

    SPREADOMATIC_TRACE_ALGO_START(MODULE_YIELD_SOLVER, times.size(), price, initial_guess);

    auto objective = [&](double y) { return pv_at_yield(times, amounts, y, comp) - price; };
    auto derivative = [&](double y) { return pv_at_yield_derivative(times, amounts, y, comp); };

    auto newton = newton_find_root(objective, derivative, initial_guess, kYtmNewtonBounds, config_);
    if (newton) {
        SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_YIELD_SOLVER, newton->iterations, newton->root);
        return to_solve_result(*newton);
    }

    SPREADOMATIC_TRACE_NEWTON_FALLBACK(detail::newton_break_reason(newton.error().code),
                                       newton.error().iterations, newton.error().last_x);

    auto brent = brent_solve(objective, initial_guess, kYtmBrentBounds, config_);
    if (!brent) {
        SPREADOMATIC_TRACE_RUNTIME_ERROR(MODULE_YIELD_SOLVER,
            static_cast<int>(brent.error().code), brent.error().last_x);
        return std::unexpected(to_analytics_error(brent.error()));
    }

    SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_YIELD_SOLVER, brent->iterations, brent->root);
    SolveResult result = to_solve_result(*brent);
    result.iterations += newton.error().iterations;
    return result;
}

std::expected<SolveResult, AnalyticsError>
YieldSolver::solve_spread(double price,
                          std::span<const double> times,
                          std::span<const double> amounts,
                          const ZeroCurve& curve,
                          Compounding comp,
                          double initial_guess,
                          InterpolationMethod interp) const {
    if (auto valid = validate_numerical_config(config_); !valid) {
        return validation_failure(valid.error());
    }
    if (auto valid = validate_cashflow_inputs(price, times, amounts); !valid) {
        return validation_failure(valid.error());
    }
    if (curve.empty()) {
        return validation_failure(ValidationError(ValidationErrorCode::InsufficientCurvePoints));
    }

    SPREADOMATIC_TRACE_ALGO_START(MODULE_YIELD_SOLVER, times.size(), price, initial_guess);

    auto objective = [&](double s) {
        return pv_cashflows(times, amounts, curve, s, comp, interp) - price;
    };

    auto brent = brent_solve(objective, initial_guess, kZSpreadBounds, config_);
    if (!brent) {
        SPREADOMATIC_TRACE_RUNTIME_ERROR(MODULE_YIELD_SOLVER,
            static_cast<int>(brent.error().code), brent.error().last_x);
        return std::unexpected(to_analytics_error(brent.error()));
    }

    SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_YIELD_SOLVER, brent->iterations, brent->root);
    return to_solve_result(*brent);
}

std::expected<double, AnalyticsError>
par_yield(const ZeroCurve& curve, double maturity, int frequency,
          Compounding curve_comp, InterpolationMethod interp) {
    if (frequency <= 0 || !std::isfinite(maturity)) {
        return std::unexpected(AnalyticsError{
            .code = AnalyticsErrorCode::MissingInput, .last_value = maturity});
    }
    const double f = static_cast<double>(frequency);
    const double period = 1.0 / f;

    double annuity = 0.0;
    for (double t = maturity; t > 1e-9; t -= period) {
        // The earliest coupon may close a short stub
        const double weight = std::min(t, period) / period;
        annuity += weight * discount_factor(curve.rate_at(t, interp), t, curve_comp);
    }
    if (!(annuity > 0.0) || !std::isfinite(annuity)) {
        return std::unexpected(AnalyticsError{
            .code = AnalyticsErrorCode::MissingInput, .last_value = maturity});
    }
    const double df_maturity = discount_factor(curve.rate_at(maturity, interp), maturity, curve_comp);
    return f * (1.0 - df_maturity) / annuity;
}

std::expected<double, AnalyticsError>
g_spread(double ytm, double maturity, const ZeroCurve& curve,
         Compounding ytm_comp, Compounding curve_comp,
         GSpreadBasis basis, InterpolationMethod interp) {
    if (!std::isfinite(ytm) || !std::isfinite(maturity) || maturity <= 0.0) {
        return std::unexpected(AnalyticsError{
            .code = AnalyticsErrorCode::MissingInput,
            .last_value = std::isfinite(ytm) ? maturity : ytm
        });
    }
    if (curve.empty()) {
        return std::unexpected(AnalyticsError{.code = AnalyticsErrorCode::InvalidCurve});
    }

    double benchmark_continuous = 0.0;
    if (basis == GSpreadBasis::Zero) {
        benchmark_continuous = to_continuous(curve.rate_at(maturity, interp), curve_comp);
    } else {
        // Continuous YTMs are compared against an annual-pay par bond
        const Compounding par_comp = ytm_comp == Compounding::Continuous
            ? Compounding::Annual : ytm_comp;
        auto par = par_yield(curve, maturity, periods_per_year(par_comp), curve_comp, interp);
        if (!par) {
            return std::unexpected(par.error());
        }
        benchmark_continuous = to_continuous(*par, par_comp);
    }

    const double spread_continuous = to_continuous(ytm, ytm_comp) - benchmark_continuous;
    return from_continuous(spread_continuous, ytm_comp);
}

}  // namespace spreadomatic
