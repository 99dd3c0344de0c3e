// SPDX-License-Identifier: MIT
/**
 * @file zero_curve.hpp
 * @brief Zero-coupon rate curve with parallel and key-rate bumps
 */

#pragma once

#include "spreadomatic/curve/compounding.hpp"
#include "spreadomatic/curve/interpolation.hpp"
#include "spreadomatic/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace spreadomatic {

/// Point on a zero curve: tenor and zero rate
struct CurvePoint {
    double time;  // Years from valuation (>= 0)
    double rate;  // Decimal zero rate
};

/// Zero-coupon rate curve
///
/// Knot times are non-negative and strictly increasing, rates finite. Curves
/// are immutable; bumps return new curves. Lookups between knots interpolate
/// the rate, outside the knot range they extrapolate flat.
class ZeroCurve {
    std::vector<double> times_;
    std::vector<double> rates_;

public:
    /// Default constructor (empty curve, every rate is 0)
    ZeroCurve() = default;

    /// Validated construction from (time, rate) points
    ///
    /// Requires at least two points, non-negative strictly increasing times
    /// and finite rates.
    static std::expected<ZeroCurve, ValidationError>
    from_points(std::span<const CurvePoint> points);

    /// Validated construction from parallel arrays
    static std::expected<ZeroCurve, ValidationError>
    from_vectors(std::span<const double> times, std::span<const double> rates);

    /// Construct flat curve (constant rate)
    static ZeroCurve flat(double rate) {
        ZeroCurve curve;
        // Two knots: t=0 and t=100 (far future)
        curve.times_ = {0.0, 100.0};
        curve.rates_ = {rate, rate};
        return curve;
    }

    /// Zero rate at time t
    double rate_at(double t, InterpolationMethod method = InterpolationMethod::Linear) const {
        return interpolate(times_, rates_, t, method);
    }

    /// Curve with every rate shifted by `shift` (parallel bump)
    ZeroCurve shifted(double shift) const;

    /// Curve with the rate at `tenor` moved by `bump`
    ///
    /// An existing knot within 1e-9 years of `tenor` is shifted; otherwise a
    /// knot is inserted at `tenor` with the interpolated rate plus `bump`.
    /// All other knots keep their rates.
    ZeroCurve with_tenor_bump(double tenor, double bump,
                              InterpolationMethod method = InterpolationMethod::Linear) const;

    /// Simple annualised forward rate between t1 and t2
    ///
    /// (DF(t1) / DF(t2) - 1) / (t2 - t1), discount factors under `comp`.
    std::expected<double, ValidationError>
    forward_rate(double t1, double t2, Compounding comp = Compounding::Continuous,
                 InterpolationMethod method = InterpolationMethod::Linear) const;

    std::span<const double> times() const { return times_; }
    std::span<const double> rates() const { return rates_; }
    size_t size() const { return times_.size(); }
    bool empty() const { return times_.empty(); }
};

/// Knot match distance used by key-rate bumps
inline constexpr double kTenorMatchTolerance = 1e-9;

}  // namespace spreadomatic
