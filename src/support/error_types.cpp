// SPDX-License-Identifier: MIT
#include "spreadomatic/support/error_types.hpp"

namespace spreadomatic {

std::string_view to_string(RootFindingErrorCode code) {
    switch (code) {
        case RootFindingErrorCode::BracketingFailed:      return "BracketingFailed";
        case RootFindingErrorCode::InvalidBounds:         return "InvalidBounds";
        case RootFindingErrorCode::NonFiniteValue:        return "NonFiniteValue";
        case RootFindingErrorCode::DerivativeTooSmall:    return "DerivativeTooSmall";
        case RootFindingErrorCode::StepTooLarge:          return "StepTooLarge";
        case RootFindingErrorCode::RootOutsideBounds:     return "RootOutsideBounds";
        case RootFindingErrorCode::MaxIterationsExceeded: return "MaxIterationsExceeded";
        case RootFindingErrorCode::NewtonAndBrentFailed:  return "NewtonAndBrentFailed";
    }
    return "Unknown";
}

std::string_view to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidPrice:            return "InvalidPrice";
        case ValidationErrorCode::EmptyCashflows:          return "EmptyCashflows";
        case ValidationErrorCode::CashflowSizeMismatch:    return "CashflowSizeMismatch";
        case ValidationErrorCode::NonPositiveCashflowTime: return "NonPositiveCashflowTime";
        case ValidationErrorCode::NonFiniteCashflow:       return "NonFiniteCashflow";
        case ValidationErrorCode::InsufficientCurvePoints: return "InsufficientCurvePoints";
        case ValidationErrorCode::CurveSizeMismatch:       return "CurveSizeMismatch";
        case ValidationErrorCode::UnsortedCurve:           return "UnsortedCurve";
        case ValidationErrorCode::NegativeCurveTime:       return "NegativeCurveTime";
        case ValidationErrorCode::NonFiniteCurveRate:      return "NonFiniteCurveRate";
        case ValidationErrorCode::InvalidFrequency:        return "InvalidFrequency";
        case ValidationErrorCode::InvalidCompounding:      return "InvalidCompounding";
        case ValidationErrorCode::InvalidDayBasis:         return "InvalidDayBasis";
        case ValidationErrorCode::InvalidDate:             return "InvalidDate";
        case ValidationErrorCode::InvalidDateOrder:        return "InvalidDateOrder";
        case ValidationErrorCode::InvalidCouponRate:       return "InvalidCouponRate";
        case ValidationErrorCode::InvalidNotional:         return "InvalidNotional";
        case ValidationErrorCode::InvalidTolerance:        return "InvalidTolerance";
        case ValidationErrorCode::InvalidIterationLimit:   return "InvalidIterationLimit";
        case ValidationErrorCode::InvalidBracketConfig:    return "InvalidBracketConfig";
        case ValidationErrorCode::InvalidForwardPeriod:    return "InvalidForwardPeriod";
    }
    return "Unknown";
}

std::string_view to_string(IntegrationErrorCode code) {
    switch (code) {
        case IntegrationErrorCode::InvalidInterval:    return "InvalidInterval";
        case IntegrationErrorCode::NonFiniteIntegrand: return "NonFiniteIntegrand";
    }
    return "Unknown";
}

std::string_view to_string(AnalyticsErrorCode code) {
    switch (code) {
        case AnalyticsErrorCode::InvalidPrice:         return "InvalidPrice";
        case AnalyticsErrorCode::InvalidCashflows:     return "InvalidCashflows";
        case AnalyticsErrorCode::InvalidCurve:         return "InvalidCurve";
        case AnalyticsErrorCode::InvalidSchedule:      return "InvalidSchedule";
        case AnalyticsErrorCode::MissingCallData:      return "MissingCallData";
        case AnalyticsErrorCode::BracketingFailed:     return "BracketingFailed";
        case AnalyticsErrorCode::NumericalInstability: return "NumericalInstability";
        case AnalyticsErrorCode::SolverFailed:         return "SolverFailed";
        case AnalyticsErrorCode::MissingInput:         return "MissingInput";
    }
    return "Unknown";
}

AnalyticsError to_analytics_error(const RootFindingError& err) {
    AnalyticsErrorCode code = AnalyticsErrorCode::SolverFailed;
    switch (err.code) {
        case RootFindingErrorCode::BracketingFailed:
            code = AnalyticsErrorCode::BracketingFailed;
            break;
        case RootFindingErrorCode::NonFiniteValue:
            code = AnalyticsErrorCode::NumericalInstability;
            break;
        default:
            break;
    }
    return AnalyticsError{
        .code = code,
        .iterations = err.iterations,
        .final_error = err.final_error,
        .last_value = err.last_x
    };
}

AnalyticsError to_analytics_error(const ValidationError& err) {
    AnalyticsErrorCode code = AnalyticsErrorCode::InvalidCashflows;
    switch (err.code) {
        case ValidationErrorCode::InvalidPrice:
            code = AnalyticsErrorCode::InvalidPrice;
            break;
        case ValidationErrorCode::InsufficientCurvePoints:
        case ValidationErrorCode::CurveSizeMismatch:
        case ValidationErrorCode::UnsortedCurve:
        case ValidationErrorCode::NegativeCurveTime:
        case ValidationErrorCode::NonFiniteCurveRate:
            code = AnalyticsErrorCode::InvalidCurve;
            break;
        case ValidationErrorCode::InvalidFrequency:
        case ValidationErrorCode::InvalidCompounding:
        case ValidationErrorCode::InvalidDayBasis:
        case ValidationErrorCode::InvalidDate:
        case ValidationErrorCode::InvalidDateOrder:
        case ValidationErrorCode::InvalidCouponRate:
        case ValidationErrorCode::InvalidNotional:
            code = AnalyticsErrorCode::InvalidSchedule;
            break;
        case ValidationErrorCode::InvalidTolerance:
        case ValidationErrorCode::InvalidIterationLimit:
        case ValidationErrorCode::InvalidBracketConfig:
            code = AnalyticsErrorCode::SolverFailed;
            break;
        default:
            break;
    }
    return AnalyticsError{
        .code = code,
        .iterations = 0,
        .final_error = 0.0,
        .last_value = err.value
    };
}

std::ostream& operator<<(std::ostream& os, const RootFindingError& err) {
    os << "RootFindingError{code=" << to_string(err.code)
       << ", iterations=" << err.iterations
       << ", last_x=" << err.last_x
       << ", final_error=" << err.final_error << "}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const IntegrationError& err) {
    os << "IntegrationError{code=" << to_string(err.code)
       << ", interval=[" << err.lower << ", " << err.upper << "]}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const AnalyticsError& err) {
    os << "AnalyticsError{code=" << to_string(err.code)
       << ", iterations=" << err.iterations
       << ", final_error=" << err.final_error;
    if (err.last_value) {
        os << ", last_value=" << *err.last_value;
    }
    os << "}";
    return os;
}

}  // namespace spreadomatic
