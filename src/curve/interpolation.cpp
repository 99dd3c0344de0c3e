// SPDX-License-Identifier: MIT
#include "spreadomatic/curve/interpolation.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>

namespace spreadomatic {

std::string_view to_string(InterpolationMethod method) {
    switch (method) {
        case InterpolationMethod::Linear:        return "linear";
        case InterpolationMethod::MonotoneCubic: return "monotone_cubic";
    }
    return "unknown";
}

namespace {

double secant_slope(std::span<const double> xs, std::span<const double> ys, size_t k) {
    return (ys[k + 1] - ys[k]) / (xs[k + 1] - xs[k]);
}

double end_slope(double h0, double h1, double d0, double d1) {
    double slope = ((2.0 * h0 + h1) * d0 - h0 * d1) / (h0 + h1);
    if (std::signbit(slope) != std::signbit(d0) || d0 == 0.0) {
        slope = 0.0;
    } else if (std::signbit(d0) != std::signbit(d1) && std::abs(slope) > 3.0 * std::abs(d0)) {
        slope = 3.0 * d0;
    }
    return slope;
}

}  // namespace

double pchip_slope(std::span<const double> xs, std::span<const double> ys, size_t i) {
    const size_t n = xs.size();
    if (n < 2) return 0.0;
    if (n == 2) return secant_slope(xs, ys, 0);

    if (i == 0) {
        return end_slope(xs[1] - xs[0], xs[2] - xs[1],
                         secant_slope(xs, ys, 0), secant_slope(xs, ys, 1));
    }
    if (i == n - 1) {
        return end_slope(xs[n - 1] - xs[n - 2], xs[n - 2] - xs[n - 3],
                         secant_slope(xs, ys, n - 2), secant_slope(xs, ys, n - 3));
    }

    const double d_left = secant_slope(xs, ys, i - 1);
    const double d_right = secant_slope(xs, ys, i);
    if (d_left * d_right <= 0.0) {
        return 0.0;  // local extremum or flat segment
    }
    const double h_left = xs[i] - xs[i - 1];
    const double h_right = xs[i + 1] - xs[i];
    const double w1 = 2.0 * h_right + h_left;
    const double w2 = h_right + 2.0 * h_left;
    return (w1 + w2) / (w1 / d_left + w2 / d_right);
}

double interpolate(std::span<const double> xs, std::span<const double> ys,
                   double x, InterpolationMethod method) {
    const size_t n = std::min(xs.size(), ys.size());
    if (n == 0) return 0.0;
    if (n == 1) return ys[0];

    if (x <= xs[0]) return ys[0];
    if (x >= xs[n - 1]) return ys[n - 1];

    auto it = std::upper_bound(xs.begin(), xs.begin() + static_cast<std::ptrdiff_t>(n), x);
    const size_t k = static_cast<size_t>(std::distance(xs.begin(), it)) - 1;

    const double h = xs[k + 1] - xs[k];
    const double t = (x - xs[k]) / h;

    if (method == InterpolationMethod::Linear) {
        return ys[k] + t * (ys[k + 1] - ys[k]);
    }

    const auto knots = xs.first(n);
    const auto values = ys.first(n);
    const double m0 = pchip_slope(knots, values, k);
    const double m1 = pchip_slope(knots, values, k + 1);

    const double t2 = t * t;
    const double t3 = t2 * t;
    const double h00 = 2.0 * t3 - 3.0 * t2 + 1.0;
    const double h10 = t3 - 2.0 * t2 + t;
    const double h01 = -2.0 * t3 + 3.0 * t2;
    const double h11 = t3 - t2;
    return h00 * ys[k] + h10 * h * m0 + h01 * ys[k + 1] + h11 * h * m1;
}

}  // namespace spreadomatic
