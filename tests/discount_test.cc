#include "spreadomatic/curve/compounding.hpp"
#include "spreadomatic/curve/discount.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

using spreadomatic::Compounding;
using spreadomatic::ValidationErrorCode;
using spreadomatic::ZeroCurve;

// ===========================================================================
// Compounding conventions
// ===========================================================================

TEST(CompoundingTest, DiscountFactors) {
    EXPECT_NEAR(spreadomatic::discount_factor(0.05, 2.0, Compounding::Annual),
                1.0 / (1.05 * 1.05), 1e-15);
    EXPECT_NEAR(spreadomatic::discount_factor(0.05, 1.0, Compounding::Semiannual),
                1.0 / (1.025 * 1.025), 1e-15);
    EXPECT_NEAR(spreadomatic::discount_factor(0.05, 3.0, Compounding::Continuous),
                std::exp(-0.15), 1e-15);
    EXPECT_DOUBLE_EQ(spreadomatic::discount_factor(0.05, 0.0, Compounding::Quarterly), 1.0);
}

TEST(CompoundingTest, ContinuousConversionRoundTrip) {
    for (auto comp : {Compounding::Annual, Compounding::Semiannual,
                      Compounding::Quarterly, Compounding::Monthly}) {
        const double cc = spreadomatic::to_continuous(0.05, comp);
        EXPECT_LT(cc, 0.05);
        EXPECT_NEAR(spreadomatic::from_continuous(cc, comp), 0.05, 1e-15);
        // Same discount factor either way
        EXPECT_NEAR(spreadomatic::discount_factor(cc, 7.0, Compounding::Continuous),
                    spreadomatic::discount_factor(0.05, 7.0, comp), 1e-14);
    }
    EXPECT_DOUBLE_EQ(spreadomatic::to_continuous(0.05, Compounding::Continuous), 0.05);
}

TEST(CompoundingTest, FrequencyMapping) {
    EXPECT_EQ(spreadomatic::compounding_from_frequency(1).value(), Compounding::Annual);
    EXPECT_EQ(spreadomatic::compounding_from_frequency(2).value(), Compounding::Semiannual);
    EXPECT_EQ(spreadomatic::compounding_from_frequency(4).value(), Compounding::Quarterly);
    EXPECT_EQ(spreadomatic::compounding_from_frequency(12).value(), Compounding::Monthly);

    auto bad = spreadomatic::compounding_from_frequency(3);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ValidationErrorCode::InvalidFrequency);
    EXPECT_DOUBLE_EQ(bad.error().value, 3.0);
}

TEST(CompoundingTest, ParseNames) {
    EXPECT_EQ(spreadomatic::parse_compounding("continuous").value(), Compounding::Continuous);
    EXPECT_EQ(spreadomatic::parse_compounding("semiannual").value(), Compounding::Semiannual);
    EXPECT_EQ(spreadomatic::to_string(Compounding::Monthly), "monthly");
    EXPECT_EQ(spreadomatic::periods_per_year(Compounding::Continuous), 0);

    auto bad = spreadomatic::parse_compounding("weekly");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ValidationErrorCode::InvalidCompounding);
}

// ===========================================================================
// Present value
// ===========================================================================

TEST(DiscountTest, FlatCurveMatchesYieldPricing) {
    std::vector<double> times = {0.5, 1.0, 1.5, 2.0};
    std::vector<double> amounts = {2.5, 2.5, 2.5, 102.5};
    auto curve = ZeroCurve::flat(0.04);

    const double on_curve = spreadomatic::pv_cashflows(times, amounts, curve, 0.0, Compounding::Annual);
    const double at_yield = spreadomatic::pv_at_yield(times, amounts, 0.04, Compounding::Annual);

    EXPECT_NEAR(on_curve, at_yield, 1e-12);
}

TEST(DiscountTest, SpreadAddsToCurveRate) {
    std::vector<double> times = {1.0, 2.0, 3.0};
    std::vector<double> amounts = {5.0, 5.0, 105.0};
    auto curve = ZeroCurve::flat(0.03);

    const double spread_pv = spreadomatic::pv_cashflows(times, amounts, curve, 0.01);
    const double shifted_pv = spreadomatic::pv_cashflows(times, amounts, curve.shifted(0.01));

    EXPECT_NEAR(spread_pv, shifted_pv, 1e-12);
    EXPECT_LT(spread_pv, spreadomatic::pv_cashflows(times, amounts, curve));
}

TEST(DiscountTest, ParBondPricesAtPar) {
    // 5% annual coupon discounted at 5% annual
    std::vector<double> times = {1.0, 2.0, 3.0, 4.0, 5.0};
    std::vector<double> amounts = {5.0, 5.0, 5.0, 5.0, 105.0};

    EXPECT_NEAR(spreadomatic::pv_at_yield(times, amounts, 0.05, Compounding::Annual), 100.0, 1e-10);
}

TEST(DiscountTest, YieldDerivativeMatchesFiniteDifference) {
    std::vector<double> times = {0.5, 1.0, 1.5, 2.0, 2.5};
    std::vector<double> amounts = {3.0, 3.0, 3.0, 3.0, 103.0};
    constexpr double y = 0.045;
    constexpr double h = 1e-6;

    for (auto comp : {Compounding::Semiannual, Compounding::Continuous}) {
        const double numeric =
            (spreadomatic::pv_at_yield(times, amounts, y + h, comp) -
             spreadomatic::pv_at_yield(times, amounts, y - h, comp)) / (2.0 * h);
        const double analytic = spreadomatic::pv_at_yield_derivative(times, amounts, y, comp);

        EXPECT_LT(analytic, 0.0);
        EXPECT_NEAR(analytic, numeric, 1e-5 * std::abs(numeric));
    }
}

TEST(DiscountTest, EmptyStreamIsZero) {
    std::vector<double> none;

    EXPECT_DOUBLE_EQ(spreadomatic::pv_at_yield(none, none, 0.05, Compounding::Annual), 0.0);
    EXPECT_DOUBLE_EQ(spreadomatic::pv_cashflows(none, none, ZeroCurve::flat(0.05)), 0.0);
}
