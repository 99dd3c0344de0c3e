// SPDX-License-Identifier: MIT
/**
 * @file yield_solver.hpp
 * @brief Yield-to-maturity, Z-spread and G-spread solvers
 */

#pragma once

#include "spreadomatic/curve/compounding.hpp"
#include "spreadomatic/curve/interpolation.hpp"
#include "spreadomatic/curve/zero_curve.hpp"
#include "spreadomatic/math/numerical_config.hpp"
#include "spreadomatic/math/root_finding.hpp"
#include "spreadomatic/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace spreadomatic {

/// Solved yield or spread with convergence diagnostics
struct SolveResult {
    double value;
    size_t iterations;
    double final_error;
    bool converged;
    /// Set when the solver returned a non-converged best estimate
    std::optional<std::string> warning;
};

/// Benchmark rate used by g_spread
enum class GSpreadBasis {
    Zero,  ///< Interpolated zero rate at maturity
    Par    ///< Par yield implied by the curve for the same maturity
};

/// Newton search interval for YTM
inline constexpr Bounds kYtmNewtonBounds{0.0, 1.0};

/// Brent fallback interval for YTM
inline constexpr Bounds kYtmBrentBounds{0.001, 0.5};

/// Brent interval for the Z-spread
inline constexpr Bounds kZSpreadBounds{-0.1, 0.2};

/// Reject non-positive prices and malformed cashflow streams
///
/// Requires a positive finite price, non-empty equal-length arrays,
/// strictly positive finite times and finite amounts.
std::expected<void, ValidationError>
validate_cashflow_inputs(double price, std::span<const double> times,
                         std::span<const double> amounts);

/// Solves for the single rate that reprices a cashflow stream
///
/// Stateless apart from the numerical configuration; safe to share
/// between threads.
class YieldSolver {
public:
    explicit YieldSolver(const NumericalConfig& config = {}) : config_(config) {}

    /// Yield to maturity: pv_at_yield(times, amounts, y, comp) == price
    ///
    /// Safeguarded Newton with the analytic derivative on kYtmNewtonBounds;
    /// when Newton breaks, Brent on kYtmBrentBounds.
    std::expected<SolveResult, AnalyticsError>
    solve_ytm(double price,
              std::span<const double> times,
              std::span<const double> amounts,
              Compounding comp = Compounding::Semiannual,
              double initial_guess = 0.05) const;

    /// Z-spread: pv_cashflows(times, amounts, curve, s, comp) == price
    ///
    /// Brent on kZSpreadBounds, repaired outward if the bracket holds no root.
    std::expected<SolveResult, AnalyticsError>
    solve_spread(double price,
                 std::span<const double> times,
                 std::span<const double> amounts,
                 const ZeroCurve& curve,
                 Compounding comp = Compounding::Annual,
                 double initial_guess = 0.01,
                 InterpolationMethod interp = InterpolationMethod::Linear) const;

    const NumericalConfig& config() const { return config_; }

private:
    NumericalConfig config_;
};

/// Par yield of a bullet bond maturing at `maturity` paying `frequency` times a year
///
/// frequency * (1 - DF(T)) / sum w_i DF(t_i) over the coupon grid T, T - 1/f, ... > 0.
/// Every period has weight 1 except a short first stub, weighted by its
/// length over 1/f. The result is compounded at `frequency`. A maturity or
/// frequency that leaves no coupon on the grid is MissingInput.
std::expected<double, AnalyticsError>
par_yield(const ZeroCurve& curve, double maturity, int frequency,
          Compounding curve_comp = Compounding::Annual,
          InterpolationMethod interp = InterpolationMethod::Linear);

/// G-spread: YTM over the benchmark rate at maturity
///
/// Both rates are converted to continuous compounding, differenced, and the
/// difference is re-expressed on ytm_comp.
std::expected<double, AnalyticsError>
g_spread(double ytm, double maturity, const ZeroCurve& curve,
         Compounding ytm_comp = Compounding::Semiannual,
         Compounding curve_comp = Compounding::Annual,
         GSpreadBasis basis = GSpreadBasis::Zero,
         InterpolationMethod interp = InterpolationMethod::Linear);

}  // namespace spreadomatic
