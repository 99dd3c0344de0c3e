#include "spreadomatic/analytics/sensitivity.hpp"
#include "spreadomatic/curve/discount.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>

using spreadomatic::AnalyticsErrorCode;
using spreadomatic::Compounding;
using spreadomatic::CurvePoint;
using spreadomatic::ZeroCurve;

namespace {

// 5-year 4% annual bullet
const std::vector<double> kTimes = {1.0, 2.0, 3.0, 4.0, 5.0};
const std::vector<double> kAmounts = {4.0, 4.0, 4.0, 4.0, 104.0};

ZeroCurve knotted_curve(double rate) {
    std::vector<CurvePoint> points = {
        {1.0, rate}, {2.0, rate}, {3.0, rate}, {4.0, rate}, {5.0, rate}};
    return ZeroCurve::from_points(points).value();
}

}  // namespace

// ===========================================================================
// Parallel-bump measures
// ===========================================================================

TEST(SensitivityTest, EffectiveDurationMatchesModifiedDurationOnFlatCurve) {
    auto curve = ZeroCurve::flat(0.05);
    const double price = spreadomatic::pv_cashflows(kTimes, kAmounts, curve);

    auto ed = spreadomatic::effective_duration(price, kTimes, kAmounts, curve);
    const double md = spreadomatic::modified_duration_standard(kTimes, kAmounts, 0.05,
                                                               Compounding::Annual, 1);

    ASSERT_TRUE(ed.has_value());
    EXPECT_GT(*ed, 0.0);
    EXPECT_NEAR(*ed, md, 1e-5);
}

TEST(SensitivityTest, ConvexityIsPositiveForBullet) {
    auto curve = ZeroCurve::flat(0.05);
    const double price = spreadomatic::pv_cashflows(kTimes, kAmounts, curve);

    auto convexity = spreadomatic::effective_convexity(price, kTimes, kAmounts, curve);

    ASSERT_TRUE(convexity.has_value());
    EXPECT_GT(*convexity, 0.0);
    // Closed form for annual compounding: sum t(t+1) PV_t / (P (1+y)^2)
    double expected = 0.0;
    for (size_t i = 0; i < kTimes.size(); ++i) {
        const double t = kTimes[i];
        expected += t * (t + 1.0) * kAmounts[i] * std::pow(1.05, -t - 2.0);
    }
    expected /= price;
    EXPECT_NEAR(*convexity, expected, 1e-3 * expected);
}

TEST(SensitivityTest, SpreadDurationEqualsEffectiveDurationOnFlatCurve) {
    auto curve = ZeroCurve::flat(0.04);
    const double price = spreadomatic::pv_cashflows(kTimes, kAmounts, curve);

    auto ed = spreadomatic::effective_duration(price, kTimes, kAmounts, curve);
    auto sd = spreadomatic::spread_duration(price, kTimes, kAmounts, curve, 0.0);

    ASSERT_TRUE(ed.has_value());
    ASSERT_TRUE(sd.has_value());
    EXPECT_NEAR(*sd, *ed, 1e-10);
}

TEST(SensitivityTest, SensitivitiesDivideByMarketPrice) {
    auto curve = ZeroCurve::flat(0.04);
    const double model_price = spreadomatic::pv_cashflows(kTimes, kAmounts, curve);

    auto at_model = spreadomatic::effective_duration(model_price, kTimes, kAmounts, curve);
    auto at_double = spreadomatic::effective_duration(2.0 * model_price, kTimes, kAmounts, curve);

    ASSERT_TRUE(at_model.has_value());
    ASSERT_TRUE(at_double.has_value());
    EXPECT_NEAR(*at_double, 0.5 * *at_model, 1e-12);
}

TEST(SensitivityTest, MacaulayDurationOfZeroCouponIsMaturity) {
    std::vector<double> times = {7.0};
    std::vector<double> amounts = {100.0};

    EXPECT_NEAR(spreadomatic::macaulay_duration(times, amounts, 0.06, Compounding::Semiannual),
                7.0, 1e-14);
    EXPECT_NEAR(spreadomatic::modified_duration(7.0, 0.06, 2), 7.0 / 1.03, 1e-14);
}

TEST(SensitivityTest, MacaulayDurationOfEmptyStreamIsZero) {
    std::vector<double> none;

    EXPECT_DOUBLE_EQ(spreadomatic::macaulay_duration(none, none, 0.05, Compounding::Annual), 0.0);
}

TEST(SensitivityTest, RejectsInvalidPrice) {
    auto curve = ZeroCurve::flat(0.04);

    auto ed = spreadomatic::effective_duration(-1.0, kTimes, kAmounts, curve);
    auto krd = spreadomatic::key_rate_durations(0.0, kTimes, kAmounts, curve);

    ASSERT_FALSE(ed.has_value());
    EXPECT_EQ(ed.error().code, AnalyticsErrorCode::InvalidPrice);
    ASSERT_FALSE(krd.has_value());
    EXPECT_EQ(krd.error().code, AnalyticsErrorCode::InvalidPrice);
}

TEST(SensitivityTest, RejectsEmptyCurveAndBadBump) {
    spreadomatic::SensitivityConfig config;
    config.duration_bump = 0.0;

    auto no_curve = spreadomatic::effective_duration(100.0, kTimes, kAmounts, ZeroCurve{});
    auto bad_bump = spreadomatic::effective_duration(100.0, kTimes, kAmounts,
                                                     ZeroCurve::flat(0.04), config);

    ASSERT_FALSE(no_curve.has_value());
    EXPECT_EQ(no_curve.error().code, AnalyticsErrorCode::InvalidCurve);
    ASSERT_FALSE(bad_bump.has_value());
    EXPECT_EQ(bad_bump.error().code, AnalyticsErrorCode::NumericalInstability);
}

// ===========================================================================
// Key-rate durations
// ===========================================================================

TEST(SensitivityTest, KeyRateDurationsFollowTenorOrder) {
    auto curve = knotted_curve(0.04);
    const double price = spreadomatic::pv_cashflows(kTimes, kAmounts, curve);

    auto krd = spreadomatic::key_rate_durations(price, kTimes, kAmounts, curve);

    ASSERT_TRUE(krd.has_value());
    ASSERT_EQ(krd->size(), 13u);
    EXPECT_EQ(krd->front().label, "1M");
    EXPECT_NEAR(krd->front().tenor, 1.0 / 12.0, 1e-15);
    EXPECT_EQ((*krd)[7].label, "5Y");
    EXPECT_EQ(krd->back().label, "50Y");
}

TEST(SensitivityTest, KeyRateDurationsSumToEffectiveDuration) {
    auto curve = knotted_curve(0.04);
    const double price = spreadomatic::pv_cashflows(kTimes, kAmounts, curve);

    auto krd = spreadomatic::key_rate_durations(price, kTimes, kAmounts, curve);
    auto ed = spreadomatic::effective_duration(price, kTimes, kAmounts, curve);

    ASSERT_TRUE(krd.has_value());
    ASSERT_TRUE(ed.has_value());
    double total = 0.0;
    for (const auto& k : *krd) {
        total += k.duration;
    }
    EXPECT_NEAR(total, *ed, 1e-6);
}

TEST(SensitivityTest, KeyRatesBeyondLastCashflowAreZero) {
    auto curve = knotted_curve(0.04);
    const double price = spreadomatic::pv_cashflows(kTimes, kAmounts, curve);

    auto krd = spreadomatic::key_rate_durations(price, kTimes, kAmounts, curve);

    ASSERT_TRUE(krd.has_value());
    for (const auto& k : *krd) {
        if (k.tenor > 5.0) {
            EXPECT_DOUBLE_EQ(k.duration, 0.0) << k.label;
        }
    }
    // The 5Y point carries the principal
    double largest = 0.0;
    std::string largest_label;
    for (const auto& k : *krd) {
        if (k.duration > largest) {
            largest = k.duration;
            largest_label = k.label;
        }
    }
    EXPECT_EQ(largest_label, "5Y");
}

TEST(SensitivityTest, CustomTenorList) {
    auto curve = knotted_curve(0.04);
    const double price = spreadomatic::pv_cashflows(kTimes, kAmounts, curve);
    spreadomatic::SensitivityConfig config;
    config.key_rate_tenors = {{"2Y", 2.0}, {"4Y", 4.0}};

    auto krd = spreadomatic::key_rate_durations(price, kTimes, kAmounts, curve, config);

    ASSERT_TRUE(krd.has_value());
    ASSERT_EQ(krd->size(), 2u);
    EXPECT_EQ((*krd)[0].label, "2Y");
    EXPECT_GT((*krd)[0].duration, 0.0);
    EXPECT_GT((*krd)[1].duration, (*krd)[0].duration);
}
