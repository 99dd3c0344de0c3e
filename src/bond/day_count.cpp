// SPDX-License-Identifier: MIT
#include "spreadomatic/bond/day_count.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace spreadomatic {

namespace {

struct DateParts {
    int year;
    int month;
    int day;
};

DateParts split(Date date) {
    return DateParts{
        .year = static_cast<int>(date.year()),
        .month = static_cast<int>(static_cast<unsigned>(date.month())),
        .day = static_cast<int>(static_cast<unsigned>(date.day()))
    };
}

bool is_last_day_of_february(Date date) {
    return date.month() == std::chrono::February &&
           date.day() == std::chrono::year_month_day_last(
               date.year(), std::chrono::month_day_last(std::chrono::February)).day();
}

double thirty_360_fraction(const DateParts& s, int d1, const DateParts& e, int d2) {
    return (360.0 * (e.year - s.year) + 30.0 * (e.month - s.month) + (d2 - d1)) / 360.0;
}

double days_in_year(std::chrono::year y) {
    return y.is_leap() ? 366.0 : 365.0;
}

double act_act_isda(Date start, Date end) {
    double fraction = 0.0;
    std::chrono::sys_days cursor{start};
    const std::chrono::sys_days stop{end};
    while (cursor < stop) {
        const std::chrono::year y = Date{cursor}.year();
        const std::chrono::sys_days next_year{(y + std::chrono::years{1}) / std::chrono::January / 1};
        const std::chrono::sys_days period_end = std::min(next_year, stop);
        fraction += static_cast<double>((period_end - cursor).count()) / days_in_year(y);
        cursor = period_end;
    }
    return fraction;
}

}  // namespace

int days_between(Date start, Date end) {
    return static_cast<int>((std::chrono::sys_days{end} - std::chrono::sys_days{start}).count());
}

double year_fraction(Date start, Date end, DayBasis basis) {
    if (std::chrono::sys_days{end} < std::chrono::sys_days{start}) {
        return -year_fraction(end, start, basis);
    }

    const DateParts s = split(start);
    const DateParts e = split(end);

    switch (basis) {
        case DayBasis::ActAct:
            return act_act_isda(start, end);
        case DayBasis::Act360:
            return days_between(start, end) / 360.0;
        case DayBasis::Act365:
            return days_between(start, end) / 365.0;
        case DayBasis::Thirty360: {
            const int d1 = std::min(s.day, 30);
            const int d2 = (d1 == 30) ? std::min(e.day, 30) : e.day;
            return thirty_360_fraction(s, d1, e, d2);
        }
        case DayBasis::Thirty360E:
            return thirty_360_fraction(s, std::min(s.day, 30), e, std::min(e.day, 30));
        case DayBasis::Thirty360US: {
            int d1 = s.day;
            int d2 = e.day;
            const bool start_feb_end = is_last_day_of_february(start);
            if (start_feb_end) {
                d1 = 30;
                if (is_last_day_of_february(end)) d2 = 30;
            }
            if (d1 == 31) d1 = 30;
            if (d2 == 31 && d1 == 30) d2 = 30;
            return thirty_360_fraction(s, d1, e, d2);
        }
    }
    return 0.0;
}

Date add_months(Date date, int months) {
    const std::chrono::year_month ym =
        std::chrono::year_month{date.year(), date.month()} + std::chrono::months{months};
    const Date candidate{ym / date.day()};
    if (candidate.ok()) {
        return candidate;
    }
    return Date{ym / std::chrono::last};
}

std::expected<Date, ValidationError> parse_date(std::string_view text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-' ||
        (text.size() > 10 && text[10] != 'T' && text[10] != ' ')) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidDate));
    }

    int year = 0;
    int month = 0;
    int day = 0;
    auto r1 = std::from_chars(text.data(), text.data() + 4, year);
    auto r2 = std::from_chars(text.data() + 5, text.data() + 7, month);
    auto r3 = std::from_chars(text.data() + 8, text.data() + 10, day);

    if (r1.ec != std::errc{} || r2.ec != std::errc{} || r3.ec != std::errc{} ||
        r1.ptr != text.data() + 4 || r2.ptr != text.data() + 7 || r3.ptr != text.data() + 10) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidDate));
    }

    const Date date{std::chrono::year{year},
                    std::chrono::month{static_cast<unsigned>(month)},
                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidDate, static_cast<double>(day), static_cast<size_t>(month)));
    }
    return date;
}

std::expected<DayBasis, ValidationError> parse_day_basis(std::string_view text) {
    std::string label;
    label.reserve(text.size());
    for (char c : text) {
        if (c == ' ' || c == '_') continue;
        label.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (label == "ACT/ACT" || label == "ACT" || label == "ACT/ACT-ISDA" ||
        label == "ISDA" || label == "ACTUAL/ACTUAL") {
        return DayBasis::ActAct;
    }
    if (label == "ACT/360" || label == "ACTUAL/360") return DayBasis::Act360;
    if (label == "ACT/365" || label == "ACT/365F" || label == "ACTUAL/365") return DayBasis::Act365;
    if (label == "30/360") return DayBasis::Thirty360;
    if (label == "30E/360" || label == "30/360E") return DayBasis::Thirty360E;
    if (label == "30/360US" || label == "30/360-US" || label == "US30/360" || label == "30/360U") {
        return DayBasis::Thirty360US;
    }
    return std::unexpected(ValidationError(ValidationErrorCode::InvalidDayBasis));
}

std::string_view to_string(DayBasis basis) {
    switch (basis) {
        case DayBasis::ActAct:      return "ACT/ACT";
        case DayBasis::Act360:      return "ACT/360";
        case DayBasis::Act365:      return "ACT/365";
        case DayBasis::Thirty360:   return "30/360";
        case DayBasis::Thirty360E:  return "30E/360";
        case DayBasis::Thirty360US: return "30/360-US";
    }
    return "unknown";
}

std::string format_date(Date date) {
    const DateParts p = split(date);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", p.year, p.month, p.day);
    return buffer;
}

}  // namespace spreadomatic
