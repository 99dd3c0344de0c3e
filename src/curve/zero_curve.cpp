// SPDX-License-Identifier: MIT
#include "spreadomatic/curve/zero_curve.hpp"
#include "spreadomatic/support/spreadomatic_trace.h"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace spreadomatic {

namespace {

std::expected<void, ValidationError> validate_knots(std::span<const double> times,
                                                    std::span<const double> rates) {
    if (times.size() != rates.size()) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::CurveSizeMismatch,
            static_cast<double>(rates.size()), times.size()));
    }
    if (times.size() < 2) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InsufficientCurvePoints,
            static_cast<double>(times.size())));
    }
    for (size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i]) || times[i] < 0.0) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::NegativeCurveTime, times[i], i));
        }
        if (!std::isfinite(rates[i])) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::NonFiniteCurveRate, rates[i], i));
        }
        if (i > 0 && times[i] <= times[i - 1]) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnsortedCurve, times[i], i));
        }
    }
    return {};
}

}  // namespace

std::expected<ZeroCurve, ValidationError>
ZeroCurve::from_vectors(std::span<const double> times, std::span<const double> rates) {
    if (auto valid = validate_knots(times, rates); !valid) {
        SPREADOMATIC_TRACE_VALIDATION_ERROR(MODULE_ZERO_CURVE,
            static_cast<int>(valid.error().code), valid.error().value, valid.error().index);
        return std::unexpected(valid.error());
    }
    ZeroCurve curve;
    curve.times_.assign(times.begin(), times.end());
    curve.rates_.assign(rates.begin(), rates.end());
    return curve;
}

std::expected<ZeroCurve, ValidationError>
ZeroCurve::from_points(std::span<const CurvePoint> points) {
    std::vector<double> times;
    std::vector<double> rates;
    times.reserve(points.size());
    rates.reserve(points.size());
    for (const auto& p : points) {
        times.push_back(p.time);
        rates.push_back(p.rate);
    }
    return from_vectors(times, rates);
}

ZeroCurve ZeroCurve::shifted(double shift) const {
    ZeroCurve curve = *this;
    for (double& r : curve.rates_) {
        r += shift;
    }
    return curve;
}

ZeroCurve ZeroCurve::with_tenor_bump(double tenor, double bump,
                                     InterpolationMethod method) const {
    ZeroCurve curve = *this;
    auto it = std::lower_bound(curve.times_.begin(), curve.times_.end(), tenor);
    const auto idx = std::distance(curve.times_.begin(), it);

    if (it != curve.times_.end() && std::abs(*it - tenor) < kTenorMatchTolerance) {
        curve.rates_[static_cast<size_t>(idx)] += bump;
        return curve;
    }
    if (idx > 0 && std::abs(curve.times_[static_cast<size_t>(idx) - 1] - tenor) < kTenorMatchTolerance) {
        curve.rates_[static_cast<size_t>(idx) - 1] += bump;
        return curve;
    }

    const double base = rate_at(tenor, method);
    curve.times_.insert(it, tenor);
    curve.rates_.insert(curve.rates_.begin() + idx, base + bump);
    return curve;
}

std::expected<double, ValidationError>
ZeroCurve::forward_rate(double t1, double t2, Compounding comp,
                        InterpolationMethod method) const {
    if (!std::isfinite(t1) || !std::isfinite(t2) || t1 < 0.0 || t2 <= t1) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidForwardPeriod, t2 - t1));
    }
    const double df1 = discount_factor(rate_at(t1, method), t1, comp);
    const double df2 = discount_factor(rate_at(t2, method), t2, comp);
    return (df1 / df2 - 1.0) / (t2 - t1);
}

}  // namespace spreadomatic
