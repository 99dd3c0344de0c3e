// SPDX-License-Identifier: MIT
/**
 * @file discount.hpp
 * @brief Present value of cashflow streams on a zero curve or a flat yield
 */

#pragma once

#include "spreadomatic/curve/compounding.hpp"
#include "spreadomatic/curve/interpolation.hpp"
#include "spreadomatic/curve/zero_curve.hpp"
#include <span>

namespace spreadomatic {

/// Present value on a zero curve plus an additive spread
///
/// sum_i amounts[i] * discount_factor(curve.rate_at(times[i]) + spread, times[i], comp).
/// The spread is quoted on the same compounding basis as the curve.
double pv_cashflows(std::span<const double> times,
                    std::span<const double> amounts,
                    const ZeroCurve& curve,
                    double spread = 0.0,
                    Compounding comp = Compounding::Annual,
                    InterpolationMethod interp = InterpolationMethod::Linear);

/// Present value at a single yield (flat curve at `yield`)
double pv_at_yield(std::span<const double> times,
                   std::span<const double> amounts,
                   double yield,
                   Compounding comp);

/// Analytic dP/dy of pv_at_yield
double pv_at_yield_derivative(std::span<const double> times,
                              std::span<const double> amounts,
                              double yield,
                              Compounding comp);

}  // namespace spreadomatic
