// SPDX-License-Identifier: MIT
#include "spreadomatic/bond/day_count.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace std::chrono;
using spreadomatic::Date;
using spreadomatic::DayBasis;
using spreadomatic::ValidationErrorCode;

namespace {

constexpr Date ymd(int y, unsigned m, unsigned d) {
    return Date{year{y}, month{m}, day{d}};
}

}  // namespace

// ===========================================================================
// Year fractions
// ===========================================================================

TEST(DayCountTest, ActualActualSplitsAcrossYears) {
    const double yf = spreadomatic::year_fraction(ymd(2023, 7, 1), ymd(2024, 7, 1), DayBasis::ActAct);

    EXPECT_NEAR(yf, 184.0 / 365.0 + 182.0 / 366.0, 1e-15);
}

TEST(DayCountTest, ActualActualWithinLeapYear) {
    const double yf = spreadomatic::year_fraction(ymd(2024, 1, 1), ymd(2025, 1, 1), DayBasis::ActAct);

    EXPECT_NEAR(yf, 1.0, 1e-15);
}

TEST(DayCountTest, ActualFixedDenominators) {
    const Date start = ymd(2024, 1, 15);
    const Date end = ymd(2024, 7, 15);  // 182 days

    EXPECT_EQ(spreadomatic::days_between(start, end), 182);
    EXPECT_NEAR(spreadomatic::year_fraction(start, end, DayBasis::Act360), 182.0 / 360.0, 1e-15);
    EXPECT_NEAR(spreadomatic::year_fraction(start, end, DayBasis::Act365), 182.0 / 365.0, 1e-15);
}

TEST(DayCountTest, ThirtyThreeSixtyEndOfMonth) {
    EXPECT_NEAR(spreadomatic::year_fraction(ymd(2024, 1, 31), ymd(2024, 2, 28), DayBasis::Thirty360),
                28.0 / 360.0, 1e-15);
}

TEST(DayCountTest, ThirtyThreeSixtyVersusEurobond) {
    const Date start = ymd(2024, 1, 15);
    const Date end = ymd(2024, 3, 31);

    // Bond basis keeps day 31 unless the start day was already adjusted
    EXPECT_NEAR(spreadomatic::year_fraction(start, end, DayBasis::Thirty360), 76.0 / 360.0, 1e-15);
    EXPECT_NEAR(spreadomatic::year_fraction(start, end, DayBasis::Thirty360E), 75.0 / 360.0, 1e-15);
}

TEST(DayCountTest, ThirtyThreeSixtyUSFebruaryRule) {
    EXPECT_NEAR(spreadomatic::year_fraction(ymd(2024, 2, 29), ymd(2024, 8, 29), DayBasis::Thirty360US),
                179.0 / 360.0, 1e-15);
    EXPECT_NEAR(spreadomatic::year_fraction(ymd(2023, 2, 28), ymd(2024, 2, 29), DayBasis::Thirty360US),
                1.0, 1e-15);
}

TEST(DayCountTest, RegularSemiannualPeriodIsHalfYear) {
    EXPECT_DOUBLE_EQ(spreadomatic::year_fraction(ymd(2024, 1, 15), ymd(2024, 7, 15), DayBasis::Thirty360), 0.5);
}

TEST(DayCountTest, ReversedDatesAreNegative) {
    const Date a = ymd(2024, 1, 15);
    const Date b = ymd(2025, 3, 20);

    for (auto basis : {DayBasis::ActAct, DayBasis::Act360, DayBasis::Thirty360}) {
        EXPECT_DOUBLE_EQ(spreadomatic::year_fraction(b, a, basis),
                         -spreadomatic::year_fraction(a, b, basis));
    }
    EXPECT_EQ(spreadomatic::days_between(b, a), -spreadomatic::days_between(a, b));
    EXPECT_DOUBLE_EQ(spreadomatic::year_fraction(a, a, DayBasis::ActAct), 0.0);
}

// ===========================================================================
// Month arithmetic
// ===========================================================================

TEST(DayCountTest, AddMonthsClampsToMonthEnd) {
    EXPECT_EQ(spreadomatic::add_months(ymd(2024, 1, 31), 1), ymd(2024, 2, 29));
    EXPECT_EQ(spreadomatic::add_months(ymd(2024, 8, 31), 6), ymd(2025, 2, 28));
    EXPECT_EQ(spreadomatic::add_months(ymd(2024, 8, 31), 3), ymd(2024, 11, 30));
    EXPECT_EQ(spreadomatic::add_months(ymd(2024, 1, 15), 24), ymd(2026, 1, 15));
    EXPECT_EQ(spreadomatic::add_months(ymd(2024, 3, 15), -3), ymd(2023, 12, 15));
}

// ===========================================================================
// Parsing and formatting
// ===========================================================================

TEST(DayCountTest, ParseIsoDate) {
    auto d = spreadomatic::parse_date("2025-01-15");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, ymd(2025, 1, 15));

    auto with_time = spreadomatic::parse_date("2025-01-15T09:30:00");
    ASSERT_TRUE(with_time.has_value());
    EXPECT_EQ(*with_time, ymd(2025, 1, 15));
}

TEST(DayCountTest, ParseRejectsMalformedDates) {
    for (const char* text : {"2025/01/15", "2025-1-15", "2025-02-30", "20250115", "2025-01-15X", ""}) {
        auto d = spreadomatic::parse_date(text);
        ASSERT_FALSE(d.has_value()) << text;
        EXPECT_EQ(d.error().code, ValidationErrorCode::InvalidDate) << text;
    }
}

TEST(DayCountTest, ParseDayBasisAliases) {
    EXPECT_EQ(spreadomatic::parse_day_basis("ACT/ACT").value(), DayBasis::ActAct);
    EXPECT_EQ(spreadomatic::parse_day_basis("act/360").value(), DayBasis::Act360);
    EXPECT_EQ(spreadomatic::parse_day_basis("ACT/365F").value(), DayBasis::Act365);
    EXPECT_EQ(spreadomatic::parse_day_basis("30/360").value(), DayBasis::Thirty360);
    EXPECT_EQ(spreadomatic::parse_day_basis("30e/360").value(), DayBasis::Thirty360E);
    EXPECT_EQ(spreadomatic::parse_day_basis("30/360 US").value(), DayBasis::Thirty360US);

    auto bad = spreadomatic::parse_day_basis("BUS/252");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ValidationErrorCode::InvalidDayBasis);
}

TEST(DayCountTest, FormatDate) {
    EXPECT_EQ(spreadomatic::format_date(ymd(2025, 3, 7)), "2025-03-07");
    EXPECT_EQ(spreadomatic::to_string(DayBasis::Thirty360E), "30E/360");
}
