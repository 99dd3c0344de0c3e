// SPDX-License-Identifier: MIT
#include "spreadomatic/analytics/oas.hpp"
#include "spreadomatic/curve/discount.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

using namespace std::chrono;
using spreadomatic::AnalyticsErrorCode;
using spreadomatic::BondSchedule;
using spreadomatic::CallScheduleEntry;
using spreadomatic::Date;
using spreadomatic::DayBasis;
using spreadomatic::ScheduledPayment;
using spreadomatic::ZeroCurve;

namespace {

constexpr Date ymd(int y, unsigned m, unsigned d) {
    return Date{year{y}, month{m}, day{d}};
}

// 10-year 5% semiannual bond issued 2020-01-15, valued five years in
std::vector<ScheduledPayment> ten_year_payments() {
    BondSchedule schedule{
        .issue_date = ymd(2020, 1, 15),
        .first_coupon_date = ymd(2020, 7, 15),
        .maturity_date = ymd(2030, 1, 15),
        .coupon_frequency = 2,
        .day_basis = DayBasis::Thirty360
    };
    return spreadomatic::generate_fixed_schedule(schedule, 0.05).value();
}

constexpr Date kValuation = ymd(2025, 1, 15);

}  // namespace

// ===========================================================================
// Truncated cashflows
// ===========================================================================

TEST(OasTest, CashflowsToCallOnCouponDate) {
    auto payments = ten_year_payments();
    CallScheduleEntry call{.date = ymd(2027, 1, 15), .price = 101.0};

    auto cashflows = spreadomatic::cashflows_to_call(payments, kValuation, call, DayBasis::ActAct);

    ASSERT_EQ(cashflows.size(), 4u);
    EXPECT_EQ(cashflows.back().date, ymd(2027, 1, 15));
    EXPECT_DOUBLE_EQ(cashflows.back().coupon, 2.5);
    EXPECT_DOUBLE_EQ(cashflows.back().principal, 101.0);
    EXPECT_DOUBLE_EQ(cashflows.back().total, 103.5);
    EXPECT_DOUBLE_EQ(cashflows.front().principal, 0.0);
}

TEST(OasTest, CashflowsToMidPeriodCallAppendsRedemption) {
    auto payments = ten_year_payments();
    CallScheduleEntry call{.date = ymd(2026, 4, 15), .price = 100.0};

    auto cashflows = spreadomatic::cashflows_to_call(payments, kValuation, call, DayBasis::ActAct);

    ASSERT_EQ(cashflows.size(), 3u);
    EXPECT_EQ(cashflows[1].date, ymd(2026, 1, 15));
    EXPECT_EQ(cashflows[2].date, ymd(2026, 4, 15));
    EXPECT_DOUBLE_EQ(cashflows[2].coupon, 0.0);
    EXPECT_DOUBLE_EQ(cashflows[2].total, 100.0);
    EXPECT_GT(cashflows[2].time_years, cashflows[1].time_years);
}

// ===========================================================================
// Next-call OAS
// ===========================================================================

TEST(OasTest, RecoversSpreadOfTruncatedStream) {
    auto payments = ten_year_payments();
    auto curve = ZeroCurve::flat(0.03);
    CallScheduleEntry call{.date = ymd(2027, 1, 15), .price = 100.0};

    auto cashflows = spreadomatic::cashflows_to_call(payments, kValuation, call, DayBasis::ActAct);
    auto times = spreadomatic::cashflow_times(cashflows);
    auto amounts = spreadomatic::cashflow_amounts(cashflows);
    const double price = spreadomatic::pv_cashflows(times, amounts, curve, 0.015);

    auto oas = spreadomatic::compute_oas(payments, kValuation, curve, DayBasis::ActAct, price, call);

    ASSERT_TRUE(oas.has_value());
    EXPECT_TRUE(oas->converged);
    EXPECT_NEAR(oas->value, 0.015, 1e-6);
}

TEST(OasTest, MissingCallIsReported) {
    auto payments = ten_year_payments();

    auto oas = spreadomatic::compute_oas(payments, kValuation, ZeroCurve::flat(0.03),
                                         DayBasis::ActAct, 100.0, std::nullopt);

    ASSERT_FALSE(oas.has_value());
    EXPECT_EQ(oas.error().code, AnalyticsErrorCode::MissingCallData);
}

TEST(OasTest, CallOnOrBeforeValuationIsReported) {
    auto payments = ten_year_payments();
    CallScheduleEntry same_day{.date = kValuation, .price = 100.0};
    CallScheduleEntry past{.date = ymd(2024, 1, 15), .price = 100.0};

    auto a = spreadomatic::compute_oas(payments, kValuation, ZeroCurve::flat(0.03),
                                       DayBasis::ActAct, 100.0, same_day);
    auto b = spreadomatic::compute_oas(payments, kValuation, ZeroCurve::flat(0.03),
                                       DayBasis::ActAct, 100.0, past);

    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, AnalyticsErrorCode::MissingCallData);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, AnalyticsErrorCode::MissingCallData);
}

TEST(OasTest, CallAfterFinalPaymentIsReported) {
    BondSchedule schedule{
        .issue_date = ymd(2024, 1, 15),
        .first_coupon_date = ymd(2024, 7, 15),
        .maturity_date = ymd(2026, 1, 15),
        .coupon_frequency = 2,
        .day_basis = DayBasis::Thirty360
    };
    auto payments = spreadomatic::generate_fixed_schedule(schedule, 0.05).value();
    CallScheduleEntry late{.date = ymd(2027, 1, 15), .price = 100.0};

    auto oas = spreadomatic::compute_oas(payments, ymd(2024, 1, 15), ZeroCurve::flat(0.03),
                                         DayBasis::ActAct, 101.0, late);
    auto ytc = spreadomatic::yield_to_call(payments, ymd(2024, 1, 15), 101.0, late,
                                           DayBasis::ActAct);

    ASSERT_FALSE(oas.has_value());
    EXPECT_EQ(oas.error().code, AnalyticsErrorCode::MissingCallData);
    ASSERT_FALSE(ytc.has_value());
    EXPECT_EQ(ytc.error().code, AnalyticsErrorCode::MissingCallData);
}

TEST(OasTest, CallOnMaturityDateIsAccepted) {
    auto payments = ten_year_payments();
    CallScheduleEntry at_maturity{.date = ymd(2030, 1, 15), .price = 100.0};

    auto oas = spreadomatic::compute_oas(payments, kValuation, ZeroCurve::flat(0.03),
                                         DayBasis::ActAct, 100.0, at_maturity);

    EXPECT_TRUE(oas.has_value());
}

// ===========================================================================
// Yield to call and yield to worst
// ===========================================================================

TEST(OasTest, YieldToCallAtParIsCoupon) {
    auto payments = ten_year_payments();
    CallScheduleEntry call{.date = ymd(2027, 1, 15), .price = 100.0};

    auto ytc = spreadomatic::yield_to_call(payments, kValuation, 100.0, call, DayBasis::ActAct);

    ASSERT_TRUE(ytc.has_value());
    EXPECT_NEAR(ytc->value, 0.05, 2e-3);
}

TEST(OasTest, YieldToCallRejectsPastCall) {
    auto payments = ten_year_payments();
    CallScheduleEntry call{.date = ymd(2024, 7, 15), .price = 100.0};

    auto ytc = spreadomatic::yield_to_call(payments, kValuation, 100.0, call, DayBasis::ActAct);

    ASSERT_FALSE(ytc.has_value());
    EXPECT_EQ(ytc.error().code, AnalyticsErrorCode::MissingCallData);
}

TEST(OasTest, YieldToWorstPicksCallForPremiumBond) {
    auto payments = ten_year_payments();
    std::vector<CallScheduleEntry> calls = {
        {.date = ymd(2024, 1, 15), .price = 100.0},  // already passed
        {.date = ymd(2027, 1, 15), .price = 100.0},
        {.date = ymd(2028, 1, 15), .price = 100.0},
    };

    auto ytw = spreadomatic::yield_to_worst(payments, kValuation, 105.0, calls, DayBasis::ActAct);

    ASSERT_TRUE(ytw.has_value());
    EXPECT_TRUE(ytw->is_call);
    EXPECT_EQ(ytw->workout_date, ymd(2027, 1, 15));
    EXPECT_DOUBLE_EQ(ytw->workout_price, 100.0);
    ASSERT_EQ(ytw->candidates.size(), 3u);
    EXPECT_FALSE(ytw->candidates.front().is_call);
    for (const auto& c : ytw->candidates) {
        EXPECT_GE(c.yield, ytw->yield);
    }
}

TEST(OasTest, YieldToWorstPicksMaturityForDiscountBond) {
    auto payments = ten_year_payments();
    std::vector<CallScheduleEntry> calls = {
        {.date = ymd(2027, 1, 15), .price = 100.0},
        {.date = ymd(2031, 1, 15), .price = 100.0},  // after maturity
    };

    auto ytw = spreadomatic::yield_to_worst(payments, kValuation, 95.0, calls, DayBasis::ActAct);

    ASSERT_TRUE(ytw.has_value());
    EXPECT_FALSE(ytw->is_call);
    EXPECT_EQ(ytw->workout_date, ymd(2030, 1, 15));
    EXPECT_EQ(ytw->candidates.size(), 2u);
}

TEST(OasTest, YieldToWorstWithoutFutureCashflowsFails) {
    auto payments = ten_year_payments();
    std::vector<CallScheduleEntry> calls;

    auto ytw = spreadomatic::yield_to_worst(payments, ymd(2031, 1, 1), 100.0, calls, DayBasis::ActAct);

    ASSERT_FALSE(ytw.has_value());
    EXPECT_EQ(ytw.error().code, AnalyticsErrorCode::InvalidCashflows);
}
