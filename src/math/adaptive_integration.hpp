// SPDX-License-Identifier: MIT
/**
 * @file adaptive_integration.hpp
 * @brief Globally adaptive Gauss-Kronrod quadrature with trapezoid fallback
 */

#pragma once

#include "spreadomatic/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <functional>

namespace spreadomatic {

/// Result of a definite integral
struct IntegrationResult {
    double value;
    /// |K15 - G7| summed over subintervals; +inf on the trapezoid fallback
    double error_estimate;
    size_t subdivisions;
    bool converged;
};

/// Adaptive 7/15-point Gauss-Kronrod integrator
///
/// Repeatedly bisects the subinterval with the largest error estimate until
/// the total error is at most max(tolerance, tolerance * |I|) or
/// max_subdivisions is reached. Hitting the limit returns the best estimate
/// with converged == false.
///
/// A non-finite integrand value on the primary path switches to a
/// 1000-interval composite trapezoid rule. Only a non-finite trapezoid
/// result is reported as IntegrationError.
///
/// Example:
/// ```cpp
/// AdaptiveIntegrator integrator;
/// auto r = integrator.integrate([](double x) { return std::exp(-x * x); }, 0.0, 5.0);
/// // r->value ~ sqrt(pi) / 2
/// ```
class AdaptiveIntegrator {
public:
    explicit AdaptiveIntegrator(double tolerance = 1e-8, size_t max_subdivisions = 50)
        : tolerance_(tolerance), max_subdivisions_(max_subdivisions) {}

    std::expected<IntegrationResult, IntegrationError>
    integrate(const std::function<double(double)>& f, double a, double b) const;

    double tolerance() const { return tolerance_; }
    size_t max_subdivisions() const { return max_subdivisions_; }

private:
    double tolerance_;
    size_t max_subdivisions_;
};

/// Number of trapezoid intervals used by the fallback path
inline constexpr size_t kTrapezoidFallbackIntervals = 1000;

/// Composite trapezoid rule on n equal intervals
double trapezoid_rule(const std::function<double(double)>& f, double a, double b, size_t n);

/// Convenience wrapper returning only the value
std::expected<double, IntegrationError>
adaptive_quadrature(const std::function<double(double)>& f, double a, double b,
                    double tolerance = 1e-8);

}  // namespace spreadomatic
