// SPDX-License-Identifier: MIT
#include "spreadomatic/curve/discount.hpp"
#include <algorithm>
#include <cmath>

namespace spreadomatic {

double pv_cashflows(std::span<const double> times,
                    std::span<const double> amounts,
                    const ZeroCurve& curve,
                    double spread,
                    Compounding comp,
                    InterpolationMethod interp) {
    const size_t n = std::min(times.size(), amounts.size());
    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double r = curve.rate_at(times[i], interp) + spread;
        total += amounts[i] * discount_factor(r, times[i], comp);
    }
    return total;
}

double pv_at_yield(std::span<const double> times,
                   std::span<const double> amounts,
                   double yield,
                   Compounding comp) {
    const size_t n = std::min(times.size(), amounts.size());
    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        total += amounts[i] * discount_factor(yield, times[i], comp);
    }
    return total;
}

double pv_at_yield_derivative(std::span<const double> times,
                              std::span<const double> amounts,
                              double yield,
                              Compounding comp) {
    const size_t n = std::min(times.size(), amounts.size());
    double total = 0.0;
    if (comp == Compounding::Continuous) {
        for (size_t i = 0; i < n; ++i) {
            total -= amounts[i] * times[i] * std::exp(-yield * times[i]);
        }
        return total;
    }

    const double f = static_cast<double>(periods_per_year(comp));
    const double base = 1.0 + yield / f;
    for (size_t i = 0; i < n; ++i) {
        // d/dy (1 + y/f)^(-f t) = -t (1 + y/f)^(-f t - 1)
        total -= amounts[i] * times[i] * std::pow(base, -f * times[i] - 1.0);
    }
    return total;
}

}  // namespace spreadomatic
