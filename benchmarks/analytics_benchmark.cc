// SPDX-License-Identifier: MIT
/**
 * @file analytics_benchmark.cc
 * @brief Latency of the yield solvers and the full analytics bundle
 *
 * Measures:
 * - YTM solve (Newton path) and Z-spread solve (Brent path) for a 10-year bullet
 * - Full per-instrument bundle including 13 key-rate durations
 * - Batch throughput over N instruments (parallel when OpenMP is enabled)
 */

#include <benchmark/benchmark.h>
#include "spreadomatic/analytics/bond_analytics.hpp"
#include "spreadomatic/curve/discount.hpp"
#include <cstdint>
#include <vector>

namespace {

spreadomatic::ZeroCurve make_curve() {
    std::vector<spreadomatic::CurvePoint> points = {
        {0.25, 0.030}, {0.5, 0.031}, {1.0, 0.032}, {2.0, 0.034}, {3.0, 0.0355},
        {5.0, 0.038}, {7.0, 0.0395}, {10.0, 0.041}, {20.0, 0.043}, {30.0, 0.044}};
    return spreadomatic::ZeroCurve::from_points(points).value();
}

// 10-year semiannual bullet priced over the curve
spreadomatic::BondAnalyticsRequest make_request(double coupon, double spread) {
    spreadomatic::BondAnalyticsRequest request{
        .dirty_price = 0.0,
        .times = {},
        .amounts = {},
        .curve = make_curve(),
        .compounding = spreadomatic::Compounding::Annual,
        .frequency = 2
    };
    for (int i = 1; i <= 20; ++i) {
        request.times.push_back(0.5 * i);
        request.amounts.push_back(100.0 * coupon / 2.0 + (i == 20 ? 100.0 : 0.0));
    }
    request.dirty_price = spreadomatic::pv_cashflows(request.times, request.amounts,
                                                     request.curve, spread);
    return request;
}

static void BM_SolveYtm(benchmark::State& state) {
    auto request = make_request(0.05, 0.01);
    spreadomatic::YieldSolver solver;

    for (auto _ : state) {
        auto result = solver.solve_ytm(request.dirty_price, request.times, request.amounts);
        benchmark::DoNotOptimize(result);
        if (!result.has_value()) {
            state.SkipWithError("YTM solve failed");
            break;
        }
    }
}
BENCHMARK(BM_SolveYtm)->Unit(benchmark::kMicrosecond);

static void BM_SolveZSpread(benchmark::State& state) {
    auto request = make_request(0.05, 0.01);
    spreadomatic::YieldSolver solver;

    for (auto _ : state) {
        auto result = solver.solve_spread(request.dirty_price, request.times, request.amounts,
                                          request.curve);
        benchmark::DoNotOptimize(result);
        if (!result.has_value()) {
            state.SkipWithError("Z-spread solve failed");
            break;
        }
    }
}
BENCHMARK(BM_SolveZSpread)->Unit(benchmark::kMicrosecond);

static void BM_BondAnalytics_Single(benchmark::State& state) {
    auto request = make_request(0.045, 0.008);

    for (auto _ : state) {
        auto result = spreadomatic::compute_bond_analytics(request);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_BondAnalytics_Single)->Unit(benchmark::kMicrosecond);

static void BM_BondAnalytics_Batch(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<spreadomatic::BondAnalyticsRequest> requests;
    requests.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        requests.push_back(make_request(0.03 + 0.0005 * static_cast<double>(i % 40),
                                        0.002 * static_cast<double>(i % 10)));
    }

    for (auto _ : state) {
        auto batch = spreadomatic::compute_bond_analytics_batch(requests);
        benchmark::DoNotOptimize(batch);
        if (!batch.all_succeeded()) {
            state.SkipWithError("Batch had failures");
            break;
        }
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_BondAnalytics_Batch)->Arg(16)->Arg(256)->Arg(4096)->Unit(benchmark::kMillisecond);

}  // namespace

BENCHMARK_MAIN();
