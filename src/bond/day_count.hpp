// SPDX-License-Identifier: MIT
/**
 * @file day_count.hpp
 * @brief Calendar dates and day-count conventions
 */

#pragma once

#include "spreadomatic/support/error_types.hpp"
#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace spreadomatic {

/// Calendar date (no time of day)
using Date = std::chrono::year_month_day;

/// Day-count basis for accrual and time measurement
enum class DayBasis {
    ActAct,       ///< Actual/Actual ISDA (split by calendar year)
    Act360,       ///< Actual/360
    Act365,       ///< Actual/365 Fixed
    Thirty360,    ///< 30/360 bond basis
    Thirty360E,   ///< 30E/360 (Eurobond)
    Thirty360US   ///< 30/360 US with end-of-February rules
};

/// Year fraction from start to end under basis
///
/// Negative when end precedes start.
double year_fraction(Date start, Date end, DayBasis basis);

/// Actual days from start to end (negative when end precedes start)
int days_between(Date start, Date end);

/// Add calendar months, clamping the day to the end of the target month
Date add_months(Date date, int months);

/// Parse an ISO-8601 date "YYYY-MM-DD" (a trailing time part is ignored)
std::expected<Date, ValidationError> parse_date(std::string_view text);

/// Parse a day-count label such as "ACT/ACT", "ACT/360", "30/360", "30E/360"
std::expected<DayBasis, ValidationError> parse_day_basis(std::string_view text);

std::string_view to_string(DayBasis basis);

/// Format as "YYYY-MM-DD"
std::string format_date(Date date);

}  // namespace spreadomatic
