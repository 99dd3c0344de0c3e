// SPDX-License-Identifier: MIT
/**
 * @file root_finding.hpp
 * @brief Bracketed Brent solver and safeguarded Newton-Raphson with Brent fallback
 *
 * Two layers:
 * - Template free functions (brent_find_root, brent_solve, newton_find_root,
 *   newton_raphson_robust) used directly by the analytics code. No type
 *   erasure on the hot path.
 * - RootFindingMethod strategy interface with BrentMethod and
 *   NewtonRaphsonRobust implementations for callers that select the method
 *   at runtime.
 *
 * Failures travel through std::expected. Running out of iterations is not a
 * failure: the best estimate is returned with converged == false and a
 * diagnostic, and the convergence_failed probe fires.
 */

#pragma once

#include "spreadomatic/math/numerical_config.hpp"
#include "spreadomatic/support/error_types.hpp"
#include "spreadomatic/support/spreadomatic_trace.h"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace spreadomatic {

/// Closed search interval [lower, upper]
struct Bounds {
    double lower;
    double upper;
};

/// Result from any root-finding method
struct RootFindingResult {
    /// Best root estimate
    double root;

    /// False when the iteration budget ran out before tolerance was met
    bool converged;

    /// Number of iterations performed
    size_t iterations;

    /// |f(root)|
    double final_error;

    /// Non-convergence warning text (set only when converged == false)
    std::optional<std::string> diagnostic;
};

using RootFindingOutcome = std::expected<RootFindingResult, RootFindingError>;

/// Concept for objective functions (scalar functions f: R -> R)
///
/// Works with any callable that takes a double and returns a double.
/// This includes lambdas, function objects, function pointers, and std::function.
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Concept for derivative functions (scalar functions df: R -> R)
///
/// Same signature as ObjectiveFunction but semantically represents a derivative.
template<typename DF>
concept DerivativeFunction = requires(DF df, double x) {
    { df(x) } -> std::convertible_to<double>;
};

/// Flat-region guard for Newton steps
inline constexpr double kNewtonMinDerivative = 1e-14;

/// Newton steps larger than this multiple of |x| are rejected
inline constexpr double kNewtonMaxStepRatio = 100.0;

namespace detail {

/// True when [fa, fb] straddles zero (an exact zero at either end counts)
inline bool brackets_root(double fa, double fb) {
    if (!std::isfinite(fa) || !std::isfinite(fb)) return false;
    if (fa == 0.0 || fb == 0.0) return true;
    return std::signbit(fa) != std::signbit(fb);
}

}  // namespace detail

/// Central-difference derivative with h = max(|x| 1e-8, 1e-8)
template<ObjectiveFunction F>
double central_difference(F&& f, double x) {
    const double h = std::max(std::abs(x) * 1e-8, 1e-8);
    return (f(x + h) - f(x - h)) / (2.0 * h);
}

/// Find a sign-changing bracket by symmetric expansion around x0
///
/// Tries [x0 - h, x0 + h] with h = initial_bracket_size, multiplying h by
/// bracket_expansion_factor after each miss, at most kMaxAutoBracketExpansions
/// times.
template<ObjectiveFunction F>
std::expected<Bounds, RootFindingError>
auto_bracket(F&& f, double x0, const NumericalConfig& config) {
    double h = config.initial_bracket_size;
    double a = x0 - h;
    double b = x0 + h;
    double fa = f(a);
    double fb = f(b);

    for (size_t attempt = 0; attempt < kMaxAutoBracketExpansions; ++attempt) {
        if (detail::brackets_root(fa, fb)) {
            return Bounds{a, b};
        }
        h *= config.bracket_expansion_factor;
        a = x0 - h;
        b = x0 + h;
        SPREADOMATIC_TRACE_BRACKET_EXPAND(attempt, a, b);
        fa = f(a);
        fb = f(b);
    }

    if (detail::brackets_root(fa, fb)) {
        return Bounds{a, b};
    }

    SPREADOMATIC_TRACE_RUNTIME_ERROR(MODULE_BRENT_ROOT,
        static_cast<int>(RootFindingErrorCode::BracketingFailed), x0);
    return std::unexpected(RootFindingError{
        .code = RootFindingErrorCode::BracketingFailed,
        .iterations = kMaxAutoBracketExpansions,
        .last_x = x0,
        .final_error = std::min(std::abs(fa), std::abs(fb))
    });
}

/// Repair a bracket that does not change sign
///
/// Expands asymmetrically toward the endpoint with the smaller |f|, doubling
/// the width each time, at most kMaxBracketRepairs times.
template<ObjectiveFunction F>
std::expected<Bounds, RootFindingError>
expand_bracket(F&& f, Bounds bounds, const NumericalConfig& /*config*/) {
    double a = bounds.lower;
    double b = bounds.upper;
    double fa = f(a);
    double fb = f(b);

    for (size_t attempt = 0; attempt < kMaxBracketRepairs; ++attempt) {
        if (detail::brackets_root(fa, fb)) {
            return Bounds{a, b};
        }
        const double width = b - a;
        if (std::abs(fa) < std::abs(fb)) {
            a -= width;
            fa = f(a);
        } else {
            b += width;
            fb = f(b);
        }
        SPREADOMATIC_TRACE_BRACKET_EXPAND(attempt, a, b);
    }

    if (detail::brackets_root(fa, fb)) {
        return Bounds{a, b};
    }

    SPREADOMATIC_TRACE_RUNTIME_ERROR(MODULE_BRENT_ROOT,
        static_cast<int>(RootFindingErrorCode::BracketingFailed), b - a);
    return std::unexpected(RootFindingError{
        .code = RootFindingErrorCode::BracketingFailed,
        .iterations = kMaxBracketRepairs,
        .last_x = std::abs(fa) < std::abs(fb) ? a : b,
        .final_error = std::min(std::abs(fa), std::abs(fb))
    });
}

/// Find root using Brent's method on a sign-changing bracket
///
/// Combines bisection, secant, and inverse quadratic interpolation.
/// Maintains b (current best, |f(b)| <= |f(c)|), a (previous best) and
/// c (the point that brackets the root together with b). An interpolated
/// step p/q is accepted only if 2p < min(3mq - |tol q|, |e q|), i.e. it lands
/// inside the bracket and shrinks faster than half of the step before last;
/// otherwise the iteration bisects.
///
/// Converges when |f(b)| < tolerance or the bracket half-width
/// m = (c - b)/2 satisfies |m| <= 2 eps |b| + tolerance/2.
///
/// **Precondition:** f(a) and f(b) must have opposite signs
///
/// Reference: Brent, R. (1973). "Algorithms for Minimization without Derivatives"
template<ObjectiveFunction F>
RootFindingOutcome brent_find_root(F&& f, double a, double b,
                                   const NumericalConfig& config) {
    if (!std::isfinite(a) || !std::isfinite(b) || a == b) {
        return std::unexpected(RootFindingError{
            .code = RootFindingErrorCode::InvalidBounds,
            .iterations = 0,
            .last_x = a,
            .final_error = std::numeric_limits<double>::quiet_NaN()
        });
    }

    double fa = f(a);
    double fb = f(b);

    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return std::unexpected(RootFindingError{
            .code = RootFindingErrorCode::NonFiniteValue,
            .iterations = 0,
            .last_x = std::isfinite(fa) ? b : a,
            .final_error = std::numeric_limits<double>::quiet_NaN()
        });
    }

    if (!detail::brackets_root(fa, fb)) {
        return std::unexpected(RootFindingError{
            .code = RootFindingErrorCode::BracketingFailed,
            .iterations = 0,
            .last_x = std::abs(fa) < std::abs(fb) ? a : b,
            .final_error = std::min(std::abs(fa), std::abs(fb))
        });
    }

    SPREADOMATIC_TRACE_BRENT_START(a, b, config.tolerance, config.max_iterations);

    // Ensure |f(a)| >= |f(b)|
    if (std::abs(fa) < std::abs(fb)) {
        std::swap(a, b);
        std::swap(fa, fb);
    }

    constexpr double eps = std::numeric_limits<double>::epsilon();
    double c = a;
    double fc = fa;
    double d = b - a;
    double e = d;

    for (size_t iter = 0; iter < config.max_iterations; ++iter) {
        // Keep b as the best estimate
        if (std::abs(fc) < std::abs(fb)) {
            a = b;
            b = c;
            c = a;
            fa = fb;
            fb = fc;
            fc = fa;
        }

        const double tol1 = 2.0 * eps * std::abs(b) + 0.5 * config.tolerance;
        const double m = 0.5 * (c - b);

        SPREADOMATIC_TRACE_BRENT_ITER(iter, b, fb, std::abs(c - b));

        if (std::abs(fb) < config.tolerance || std::abs(m) <= tol1) {
            SPREADOMATIC_TRACE_BRENT_COMPLETE(b, iter);
            return RootFindingResult{
                .root = b,
                .converged = true,
                .iterations = iter,
                .final_error = std::abs(fb),
                .diagnostic = std::nullopt
            };
        }

        if (std::abs(e) >= tol1 && std::abs(fa) > std::abs(fb)) {
            double p;
            double q;
            const double s = fb / fa;
            if (a == c) {
                // Secant (linear interpolation)
                p = 2.0 * m * s;
                q = 1.0 - s;
            } else {
                // Inverse quadratic interpolation
                const double qa = fa / fc;
                const double r = fb / fc;
                p = s * (2.0 * m * qa * (qa - r) - (b - a) * (r - 1.0));
                q = (qa - 1.0) * (r - 1.0) * (s - 1.0);
            }
            if (p > 0.0) {
                q = -q;
            } else {
                p = -p;
            }

            const double e_prev = e;
            e = d;
            if (2.0 * p < std::min(3.0 * m * q - std::abs(tol1 * q), std::abs(e_prev * q))) {
                d = p / q;
            } else {
                d = m;
                e = d;
            }
        } else {
            d = m;
            e = d;
        }

        a = b;
        fa = fb;
        b += (std::abs(d) > tol1) ? d : std::copysign(tol1, m);
        fb = f(b);

        if (!std::isfinite(fb)) {
            SPREADOMATIC_TRACE_RUNTIME_ERROR(MODULE_BRENT_ROOT,
                static_cast<int>(RootFindingErrorCode::NonFiniteValue), b);
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::NonFiniteValue,
                .iterations = iter + 1,
                .last_x = b,
                .final_error = std::numeric_limits<double>::quiet_NaN()
            });
        }

        // Re-establish the bracket [b, c]
        if ((fb > 0.0 && fc > 0.0) || (fb < 0.0 && fc < 0.0)) {
            c = a;
            fc = fa;
            d = b - a;
            e = d;
        }
    }

    SPREADOMATIC_TRACE_CONVERGENCE_FAILED(MODULE_BRENT_ROOT, config.max_iterations, b, std::abs(fb));
    return RootFindingResult{
        .root = b,
        .converged = false,
        .iterations = config.max_iterations,
        .final_error = std::abs(fb),
        .diagnostic = "Brent's method did not converge after "
                      + std::to_string(config.max_iterations) + " iterations"
    };
}

/// Brent's method with bracket discovery
///
/// Without bounds, brackets the root by symmetric expansion around
/// initial_guess. With bounds that do not change sign, expands them
/// toward the smaller |f| endpoint first. Fails with BracketingFailed when no
/// sign change can be found.
template<ObjectiveFunction F>
RootFindingOutcome brent_solve(F&& f, double initial_guess,
                               std::optional<Bounds> bounds,
                               const NumericalConfig& config) {
    std::expected<Bounds, RootFindingError> bracket = bounds
        ? [&]() -> std::expected<Bounds, RootFindingError> {
              if (!std::isfinite(bounds->lower) || !std::isfinite(bounds->upper) ||
                  bounds->lower >= bounds->upper) {
                  return std::unexpected(RootFindingError{
                      .code = RootFindingErrorCode::InvalidBounds,
                      .iterations = 0,
                      .last_x = initial_guess,
                      .final_error = std::numeric_limits<double>::quiet_NaN()
                  });
              }
              return expand_bracket(f, *bounds, config);
          }()
        : auto_bracket(f, initial_guess, config);

    if (!bracket) {
        return std::unexpected(bracket.error());
    }
    return brent_find_root(f, bracket->lower, bracket->upper, config);
}

/// Bounded Newton-Raphson iteration without fallback
///
/// Returns a typed failure instead of continuing when:
/// - |f'(x)| < kNewtonMinDerivative (DerivativeTooSmall)
/// - the step exceeds kNewtonMaxStepRatio |x| (StepTooLarge)
/// - f or f' is not finite (NonFiniteValue)
/// - the iterate stalls at a bound (RootOutsideBounds)
/// - max_iterations pass without |f(x)| < tol or |dx| < tol (1 + |x|)
///   (MaxIterationsExceeded)
///
/// Updates are clamped into bounds when bounds are given.
template<ObjectiveFunction F, DerivativeFunction DF>
RootFindingOutcome newton_find_root(F&& f, DF&& df, double x0,
                                    std::optional<Bounds> bounds,
                                    const NumericalConfig& config) {
    double x = x0;
    double fx = std::numeric_limits<double>::quiet_NaN();

    SPREADOMATIC_TRACE_ALGO_START(MODULE_NEWTON_ROOT, config.max_iterations, config.tolerance, x0);

    auto failure = [&](RootFindingErrorCode code, size_t iterations) {
        return std::unexpected(RootFindingError{
            .code = code,
            .iterations = iterations,
            .last_x = x,
            .final_error = std::abs(fx)
        });
    };

    for (size_t iter = 0; iter < config.max_iterations; ++iter) {
        fx = f(x);
        if (!std::isfinite(fx)) {
            return failure(RootFindingErrorCode::NonFiniteValue, iter + 1);
        }

        if (std::abs(fx) < config.tolerance) {
            SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_NEWTON_ROOT, iter, x);
            return RootFindingResult{
                .root = x,
                .converged = true,
                .iterations = iter,
                .final_error = std::abs(fx),
                .diagnostic = std::nullopt
            };
        }

        const double dfx = df(x);
        if (!std::isfinite(dfx)) {
            return failure(RootFindingErrorCode::NonFiniteValue, iter + 1);
        }
        if (std::abs(dfx) < kNewtonMinDerivative) {
            return failure(RootFindingErrorCode::DerivativeTooSmall, iter + 1);
        }

        double x_new = x - fx / dfx;
        if (!std::isfinite(x_new)) {
            return failure(RootFindingErrorCode::NonFiniteValue, iter + 1);
        }
        bool pinned = false;
        if (bounds) {
            const double clamped = std::clamp(x_new, bounds->lower, bounds->upper);
            pinned = clamped != x_new;
            x_new = clamped;
        }

        const double step = std::abs(x_new - x);
        if (step > kNewtonMaxStepRatio * std::abs(x)) {
            return failure(RootFindingErrorCode::StepTooLarge, iter + 1);
        }

        if (step < config.tolerance * (1.0 + std::abs(x))) {
            // Stalled against a bound: the root lies outside
            if (pinned) {
                return failure(RootFindingErrorCode::RootOutsideBounds, iter + 1);
            }
            const double f_new = f(x_new);
            SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_NEWTON_ROOT, iter + 1, x_new);
            return RootFindingResult{
                .root = x_new,
                .converged = true,
                .iterations = iter + 1,
                .final_error = std::abs(f_new),
                .diagnostic = std::nullopt
            };
        }

        x = x_new;
    }

    return failure(RootFindingErrorCode::MaxIterationsExceeded, config.max_iterations);
}

namespace detail {

inline int newton_break_reason(RootFindingErrorCode code) {
    switch (code) {
        case RootFindingErrorCode::DerivativeTooSmall: return NEWTON_BREAK_DERIVATIVE_TOO_SMALL;
        case RootFindingErrorCode::StepTooLarge:       return NEWTON_BREAK_STEP_TOO_LARGE;
        case RootFindingErrorCode::NonFiniteValue:     return NEWTON_BREAK_NON_FINITE;
        case RootFindingErrorCode::RootOutsideBounds:  return NEWTON_BREAK_OUT_OF_BOUNDS;
        default:                                       return NEWTON_BREAK_MAX_ITERATIONS;
    }
}

}  // namespace detail

/// Safeguarded Newton-Raphson with automatic Brent fallback
///
/// Runs newton_find_root; any break condition hands over to brent_solve with
/// the same initial_guess and bounds. Only a failure of both methods is
/// returned as an error (NewtonAndBrentFailed).
///
/// **Example:**
/// ```cpp
/// auto f  = [](double x) { return x*x*x - x - 1.0; };
/// auto df = [](double x) { return 3.0*x*x - 1.0; };
/// auto result = newton_raphson_robust(f, df, 1.5, std::nullopt, NumericalConfig{});
/// // result->root ~ 1.3247179572
/// ```
template<ObjectiveFunction F, DerivativeFunction DF>
RootFindingOutcome newton_raphson_robust(F&& f, DF&& df, double initial_guess,
                                         std::optional<Bounds> bounds,
                                         const NumericalConfig& config) {
    auto newton = newton_find_root(f, df, initial_guess, bounds, config);
    if (newton) {
        return newton;
    }

    const RootFindingError& newton_error = newton.error();
    SPREADOMATIC_TRACE_NEWTON_FALLBACK(detail::newton_break_reason(newton_error.code),
                                       newton_error.iterations, newton_error.last_x);

    auto brent = brent_solve(f, initial_guess, bounds, config);
    if (brent) {
        return brent;
    }

    return std::unexpected(RootFindingError{
        .code = RootFindingErrorCode::NewtonAndBrentFailed,
        .iterations = newton_error.iterations + brent.error().iterations,
        .last_x = brent.error().last_x,
        .final_error = brent.error().final_error
    });
}

/// Safeguarded Newton-Raphson using a central-difference derivative
template<ObjectiveFunction F>
RootFindingOutcome newton_raphson_robust(F&& f, double initial_guess,
                                         std::optional<Bounds> bounds,
                                         const NumericalConfig& config) {
    auto numerical_derivative = [&f](double x) { return central_difference(f, x); };
    return newton_raphson_robust(f, numerical_derivative, initial_guess, bounds, config);
}

using ScalarFunction = std::function<double(double)>;

/// Runtime-selectable root-finding strategy
class RootFindingMethod {
public:
    virtual ~RootFindingMethod() = default;

    /// Solve f(x) = 0 starting from initial_guess, optionally within bounds
    virtual RootFindingOutcome solve(const ScalarFunction& f,
                                     double initial_guess,
                                     std::optional<Bounds> bounds = std::nullopt) const = 0;

    const NumericalConfig& config() const { return config_; }

protected:
    explicit RootFindingMethod(const NumericalConfig& config) : config_(config) {}

    NumericalConfig config_;
};

/// Brent's method with automatic bracketing
class BrentMethod final : public RootFindingMethod {
public:
    explicit BrentMethod(const NumericalConfig& config = {})
        : RootFindingMethod(config) {}

    RootFindingOutcome solve(const ScalarFunction& f,
                             double initial_guess,
                             std::optional<Bounds> bounds = std::nullopt) const override;
};

/// Newton-Raphson with safeguards and Brent fallback
///
/// Uses the analytic derivative when one is supplied, a central difference
/// otherwise.
class NewtonRaphsonRobust final : public RootFindingMethod {
public:
    explicit NewtonRaphsonRobust(const NumericalConfig& config = {},
                                 ScalarFunction derivative = {})
        : RootFindingMethod(config)
        , derivative_(std::move(derivative)) {}

    RootFindingOutcome solve(const ScalarFunction& f,
                             double initial_guess,
                             std::optional<Bounds> bounds = std::nullopt) const override;

    bool has_analytic_derivative() const { return static_cast<bool>(derivative_); }

private:
    ScalarFunction derivative_;
};

}  // namespace spreadomatic
