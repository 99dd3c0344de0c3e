// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace spreadomatic {

/// Error codes for scalar root-finding failures
enum class RootFindingErrorCode {
    BracketingFailed,        ///< No sign change after all expansion attempts
    InvalidBounds,           ///< lower >= upper or non-finite bounds
    NonFiniteValue,          ///< Objective returned NaN or Inf
    DerivativeTooSmall,      ///< |f'(x)| below the flat-region guard
    StepTooLarge,            ///< Newton step exceeded 100 |x|
    RootOutsideBounds,       ///< Newton iterate stalled against a bound
    MaxIterationsExceeded,   ///< Newton iteration budget exhausted
    NewtonAndBrentFailed     ///< Newton broke and the Brent fallback failed too
};

/// Detailed root-finding error passed through the expected failure path
struct RootFindingError {
    RootFindingErrorCode code;
    size_t iterations = 0;     ///< Iterations performed before failure
    double last_x = 0.0;       ///< Last abscissa evaluated
    double final_error = 0.0;  ///< |f(last_x)| when known
};

/// Error codes for degenerate or malformed inputs
enum class ValidationErrorCode {
    InvalidPrice,
    EmptyCashflows,
    CashflowSizeMismatch,
    NonPositiveCashflowTime,
    NonFiniteCashflow,
    InsufficientCurvePoints,
    CurveSizeMismatch,
    UnsortedCurve,
    NegativeCurveTime,
    NonFiniteCurveRate,
    InvalidFrequency,
    InvalidCompounding,
    InvalidDayBasis,
    InvalidDate,
    InvalidDateOrder,
    InvalidCouponRate,
    InvalidNotional,
    InvalidTolerance,
    InvalidIterationLimit,
    InvalidBracketConfig,
    InvalidForwardPeriod
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Optional index for array errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Error codes for numerical integration failures
enum class IntegrationErrorCode {
    InvalidInterval,
    NonFiniteIntegrand
};

/// Integration error raised only when the trapezoid fallback fails as well
struct IntegrationError {
    IntegrationErrorCode code;
    double lower = 0.0;
    double upper = 0.0;
};

/// Analytics-layer error categories, one per metric failure
enum class AnalyticsErrorCode {
    // Validation errors
    InvalidPrice,
    InvalidCashflows,
    InvalidCurve,
    InvalidSchedule,
    MissingCallData,

    // Convergence errors
    BracketingFailed,
    NumericalInstability,
    SolverFailed,

    // Dependent metric could not be computed
    MissingInput
};

/// Detailed analytics error with diagnostics
struct AnalyticsError {
    AnalyticsErrorCode code;
    size_t iterations = 0;              ///< Iterations before failure
    double final_error = 0.0;           ///< Residual at failure
    std::optional<double> last_value = std::nullopt;  ///< Last yield/spread candidate tried
};

/// Combined error type that can hold any of our specific error types
using ErrorVariant = std::variant<
    ValidationError,
    RootFindingError,
    IntegrationError,
    AnalyticsError
>;

/// Get error code as integer for diagnostics
inline int error_code(const ErrorVariant& error) {
    return std::visit([](const auto& e) -> int {
        return static_cast<int>(e.code);
    }, error);
}

std::string_view to_string(RootFindingErrorCode code);
std::string_view to_string(ValidationErrorCode code);
std::string_view to_string(IntegrationErrorCode code);
std::string_view to_string(AnalyticsErrorCode code);

/// Map a root-finding failure onto the analytics taxonomy
AnalyticsError to_analytics_error(const RootFindingError& err);

/// Map a validation failure onto the analytics taxonomy
AnalyticsError to_analytics_error(const ValidationError& err);

std::ostream& operator<<(std::ostream& os, const RootFindingError& err);
std::ostream& operator<<(std::ostream& os, const ValidationError& err);
std::ostream& operator<<(std::ostream& os, const IntegrationError& err);
std::ostream& operator<<(std::ostream& os, const AnalyticsError& err);

}  // namespace spreadomatic
