// SPDX-License-Identifier: MIT
/**
 * @file interpolation.hpp
 * @brief One-dimensional interpolation on sorted knots
 */

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace spreadomatic {

/// Interpolation scheme for curve lookups
enum class InterpolationMethod {
    Linear,         ///< Piecewise linear (default)
    MonotoneCubic   ///< Shape-preserving PCHIP (Fritsch-Carlson)
};

std::string_view to_string(InterpolationMethod method);

/// Interpolate ys(xs) at x
///
/// xs must be strictly increasing and the same length as ys.
/// Outside [xs.front(), xs.back()] the nearest end value is returned (flat
/// extrapolation). A single knot returns its value; no knots return 0.
/// Lookup is a binary search, O(log n).
double interpolate(std::span<const double> xs, std::span<const double> ys,
                   double x, InterpolationMethod method = InterpolationMethod::Linear);

/// PCHIP derivative at knot i (Fritsch-Carlson weighted harmonic mean)
///
/// Zero at local extrema, one-sided three-point formula at the ends with
/// sign and overshoot limiting.
double pchip_slope(std::span<const double> xs, std::span<const double> ys, size_t i);

}  // namespace spreadomatic
