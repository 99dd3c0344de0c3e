#include "spreadomatic/math/adaptive_integration.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <numbers>

TEST(AdaptiveIntegratorTest, GaussianTail) {
    spreadomatic::AdaptiveIntegrator integrator;

    auto result = integrator.integrate([](double x) { return std::exp(-x * x); }, 0.0, 5.0);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->converged);
    EXPECT_NEAR(result->value, std::sqrt(std::numbers::pi) / 2.0, 1e-6);
    EXPECT_LT(result->error_estimate, 1e-6);
}

TEST(AdaptiveIntegratorTest, PolynomialIsExactWithoutSubdivision) {
    spreadomatic::AdaptiveIntegrator integrator;

    auto result = integrator.integrate([](double x) { return x * x * x; }, 0.0, 2.0);

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->value, 4.0, 1e-12);
    EXPECT_EQ(result->subdivisions, 0u);
}

TEST(AdaptiveIntegratorTest, ReversedLimitsNegate) {
    spreadomatic::AdaptiveIntegrator integrator;
    auto f = [](double x) { return std::sin(x); };

    auto forward = integrator.integrate(f, 0.0, std::numbers::pi);
    auto backward = integrator.integrate(f, std::numbers::pi, 0.0);

    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(backward.has_value());
    EXPECT_NEAR(forward->value, 2.0, 1e-10);
    EXPECT_DOUBLE_EQ(backward->value, -forward->value);
}

TEST(AdaptiveIntegratorTest, EqualLimitsGiveZero) {
    spreadomatic::AdaptiveIntegrator integrator;

    auto result = integrator.integrate([](double x) { return 1.0 / x; }, 1.5, 1.5);

    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->value, 0.0);
    EXPECT_TRUE(result->converged);
}

TEST(AdaptiveIntegratorTest, SubdivisionLimitReturnsBestEstimate) {
    spreadomatic::AdaptiveIntegrator integrator(1e-15, 1);

    auto result = integrator.integrate([](double x) { return std::sqrt(x); }, 0.0, 1.0);

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->converged);
    EXPECT_EQ(result->subdivisions, 1u);
    EXPECT_NEAR(result->value, 2.0 / 3.0, 1e-3);
}

TEST(AdaptiveIntegratorTest, SingularNodeFallsBackToTrapezoid) {
    // Infinite at one Kronrod node of [0, 1], finite on the trapezoid grid
    const double node = 0.5 + 0.5 * 0.207784955007898467600689403773245;
    auto f = [node](double x) {
        return std::abs(x - node) < 1e-6 ? std::numeric_limits<double>::infinity() : 1.0;
    };
    spreadomatic::AdaptiveIntegrator integrator;

    auto result = integrator.integrate(f, 0.0, 1.0);

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->converged);
    EXPECT_TRUE(std::isinf(result->error_estimate));
    EXPECT_NEAR(result->value, 1.0, 1e-12);
}

TEST(AdaptiveIntegratorTest, FailingFallbackPropagatesError) {
    spreadomatic::AdaptiveIntegrator integrator;

    auto result = integrator.integrate(
        [](double) { return std::numeric_limits<double>::quiet_NaN(); }, 0.0, 1.0);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, spreadomatic::IntegrationErrorCode::NonFiniteIntegrand);
}

TEST(AdaptiveIntegratorTest, NonFiniteLimitsRejected) {
    spreadomatic::AdaptiveIntegrator integrator;

    auto result = integrator.integrate([](double x) { return x; }, 0.0,
                                       std::numeric_limits<double>::infinity());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, spreadomatic::IntegrationErrorCode::InvalidInterval);
}

TEST(AdaptiveQuadratureTest, ConvenienceWrapper) {
    auto value = spreadomatic::adaptive_quadrature([](double x) { return std::exp(x); }, 0.0, 1.0);

    ASSERT_TRUE(value.has_value());
    EXPECT_NEAR(*value, std::exp(1.0) - 1.0, 1e-10);
}

TEST(TrapezoidRuleTest, LinearIntegrandIsExact) {
    double value = spreadomatic::trapezoid_rule([](double x) { return 3.0 * x + 1.0; }, 0.0, 2.0, 10);

    EXPECT_NEAR(value, 8.0, 1e-12);
}
