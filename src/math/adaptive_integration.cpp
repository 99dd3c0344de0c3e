// SPDX-License-Identifier: MIT
#include "spreadomatic/math/adaptive_integration.hpp"
#include "spreadomatic/support/spreadomatic_trace.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <vector>

namespace spreadomatic {

namespace {

// Kronrod abscissae; odd indices are the 7-point Gauss nodes, last is the centre
constexpr std::array<double, 8> kXgk = {
    0.991455371120812639206854697526329,
    0.949107912342758524526189684047851,
    0.864864423359769072789712788640926,
    0.741531185599394439863864773280788,
    0.586087235467691130294144845693013,
    0.405845151377397166906606412076961,
    0.207784955007898467600689403773245,
    0.000000000000000000000000000000000
};

constexpr std::array<double, 8> kWgk = {
    0.022935322010529224963732008058970,
    0.063092092629978553290700663189204,
    0.104790010322250183839876322541518,
    0.140653259715525918745189590510238,
    0.169004726639267902826583426598550,
    0.190350578064785409913256402421014,
    0.204432940075298892414161999234649,
    0.209482141084727828012999174891714
};

constexpr std::array<double, 4> kWg = {
    0.129484966168869693270611432679082,
    0.279705391489276667901467771423780,
    0.381830050505118944950369775488975,
    0.417959183673469387755102040816327
};

struct Segment {
    double a;
    double b;
    double value;
    double error;
};

Segment gauss_kronrod_15(const std::function<double(double)>& f, double a, double b) {
    const double center = 0.5 * (a + b);
    const double half = 0.5 * (b - a);

    const double fc = f(center);
    double kronrod = fc * kWgk[7];
    double gauss = fc * kWg[3];

    for (size_t j = 0; j < 3; ++j) {
        const size_t k = 2 * j + 1;
        const double dx = half * kXgk[k];
        const double sum = f(center - dx) + f(center + dx);
        gauss += kWg[j] * sum;
        kronrod += kWgk[k] * sum;
    }
    for (size_t j = 0; j < 4; ++j) {
        const size_t k = 2 * j;
        const double dx = half * kXgk[k];
        kronrod += kWgk[k] * (f(center - dx) + f(center + dx));
    }

    return Segment{
        .a = a,
        .b = b,
        .value = kronrod * half,
        .error = std::abs((kronrod - gauss) * half)
    };
}

bool segment_is_finite(const Segment& s) {
    return std::isfinite(s.value) && std::isfinite(s.error);
}

}  // namespace

double trapezoid_rule(const std::function<double(double)>& f, double a, double b, size_t n) {
    const double h = (b - a) / static_cast<double>(n);
    double sum = 0.5 * (f(a) + f(b));
    for (size_t i = 1; i < n; ++i) {
        sum += f(a + static_cast<double>(i) * h);
    }
    return sum * h;
}

std::expected<IntegrationResult, IntegrationError>
AdaptiveIntegrator::integrate(const std::function<double(double)>& f, double a, double b) const {
    if (!std::isfinite(a) || !std::isfinite(b)) {
        SPREADOMATIC_TRACE_VALIDATION_ERROR(MODULE_INTEGRATION,
            static_cast<int>(IntegrationErrorCode::InvalidInterval), a, b);
        return std::unexpected(IntegrationError{
            .code = IntegrationErrorCode::InvalidInterval, .lower = a, .upper = b});
    }
    if (a == b) {
        return IntegrationResult{.value = 0.0, .error_estimate = 0.0, .subdivisions = 0, .converged = true};
    }
    if (a > b) {
        auto flipped = integrate(f, b, a);
        if (flipped) {
            flipped->value = -flipped->value;
        }
        return flipped;
    }

    SPREADOMATIC_TRACE_ALGO_START(MODULE_INTEGRATION, max_subdivisions_, tolerance_, b - a);

    std::vector<Segment> segments;
    segments.reserve(max_subdivisions_ + 1);
    segments.push_back(gauss_kronrod_15(f, a, b));

    bool finite = segment_is_finite(segments.front());
    double total = segments.front().value;
    double total_error = segments.front().error;
    size_t subdivisions = 0;

    while (finite &&
           total_error > std::max(tolerance_, tolerance_ * std::abs(total)) &&
           subdivisions < max_subdivisions_) {
        auto worst = std::max_element(segments.begin(), segments.end(),
            [](const Segment& lhs, const Segment& rhs) { return lhs.error < rhs.error; });
        const Segment parent = *worst;
        const double mid = 0.5 * (parent.a + parent.b);

        const Segment left = gauss_kronrod_15(f, parent.a, mid);
        const Segment right = gauss_kronrod_15(f, mid, parent.b);
        if (!segment_is_finite(left) || !segment_is_finite(right)) {
            finite = false;
            break;
        }

        *worst = left;
        segments.push_back(right);
        ++subdivisions;

        total = 0.0;
        total_error = 0.0;
        for (const auto& s : segments) {
            total += s.value;
            total_error += s.error;
        }
    }

    if (finite) {
        const bool converged = total_error <= std::max(tolerance_, tolerance_ * std::abs(total));
        if (!converged) {
            SPREADOMATIC_TRACE_CONVERGENCE_FAILED(MODULE_INTEGRATION, subdivisions, total, total_error);
        } else {
            SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_INTEGRATION, subdivisions, total);
        }
        return IntegrationResult{
            .value = total,
            .error_estimate = total_error,
            .subdivisions = subdivisions,
            .converged = converged
        };
    }

    SPREADOMATIC_TRACE_INTEGRATION_FALLBACK(a, b, subdivisions);
    const double fallback = trapezoid_rule(f, a, b, kTrapezoidFallbackIntervals);
    if (!std::isfinite(fallback)) {
        SPREADOMATIC_TRACE_RUNTIME_ERROR(MODULE_INTEGRATION,
            static_cast<int>(IntegrationErrorCode::NonFiniteIntegrand), fallback);
        return std::unexpected(IntegrationError{
            .code = IntegrationErrorCode::NonFiniteIntegrand, .lower = a, .upper = b});
    }
    return IntegrationResult{
        .value = fallback,
        .error_estimate = std::numeric_limits<double>::infinity(),
        .subdivisions = subdivisions,
        .converged = false
    };
}

std::expected<double, IntegrationError>
adaptive_quadrature(const std::function<double(double)>& f, double a, double b, double tolerance) {
    AdaptiveIntegrator integrator(tolerance);
    auto result = integrator.integrate(f, a, b);
    if (!result) {
        return std::unexpected(result.error());
    }
    return result->value;
}

}  // namespace spreadomatic
