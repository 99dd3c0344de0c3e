// SPDX-License-Identifier: MIT
#include "spreadomatic/analytics/oas.hpp"
#include "spreadomatic/support/spreadomatic_trace.h"
#include <algorithm>
#include <chrono>
#include <utility>

namespace spreadomatic {

namespace {

bool after(Date lhs, Date rhs) {
    return std::chrono::sys_days{lhs} > std::chrono::sys_days{rhs};
}

std::unexpected<AnalyticsError> missing_call(double value) {
    SPREADOMATIC_TRACE_RUNTIME_ERROR(MODULE_OAS,
        static_cast<int>(AnalyticsErrorCode::MissingCallData), value);
    return std::unexpected(AnalyticsError{
        .code = AnalyticsErrorCode::MissingCallData, .last_value = value});
}

// A call must fall strictly after valuation and no later than the last payment
std::expected<void, AnalyticsError>
check_call_window(std::span<const ScheduledPayment> payments, Date valuation_date,
                  Date call_date, DayBasis day_basis) {
    if (!after(call_date, valuation_date)) {
        return missing_call(year_fraction(valuation_date, call_date, day_basis));
    }
    if (payments.empty() || after(call_date, payments.back().date)) {
        return missing_call(year_fraction(valuation_date, call_date, day_basis));
    }
    return {};
}

std::expected<SolveResult, AnalyticsError>
solve_stream_yield(std::span<const Cashflow> cashflows, double dirty_price,
                   Compounding comp, const NumericalConfig& config) {
    if (cashflows.empty()) {
        return std::unexpected(AnalyticsError{.code = AnalyticsErrorCode::InvalidCashflows});
    }
    const auto times = cashflow_times(cashflows);
    const auto amounts = cashflow_amounts(cashflows);
    return YieldSolver(config).solve_ytm(dirty_price, times, amounts, comp);
}

}  // namespace

std::vector<Cashflow> cashflows_to_call(std::span<const ScheduledPayment> payments,
                                        Date valuation_date,
                                        const CallScheduleEntry& call,
                                        DayBasis day_basis) {
    std::vector<Cashflow> cashflows = extract_cashflows(payments, valuation_date, day_basis, call.date);

    // Whatever principal was due on the call date is replaced by the call price
    bool redeemed = false;
    for (auto& cf : cashflows) {
        if (cf.date == call.date) {
            cf.principal = redeemed ? 0.0 : call.price;
            cf.total = cf.coupon + cf.principal;
            redeemed = true;
        }
    }
    if (!redeemed) {
        cashflows.push_back(Cashflow{
            .date = call.date,
            .time_years = year_fraction(valuation_date, call.date, day_basis),
            .coupon = 0.0,
            .principal = call.price,
            .total = call.price,
            .accrual_period = 0.0
        });
    }
    return cashflows;
}

std::expected<SolveResult, AnalyticsError>
compute_oas(std::span<const ScheduledPayment> payments,
            Date valuation_date,
            const ZeroCurve& curve,
            DayBasis day_basis,
            double dirty_price,
            std::optional<CallScheduleEntry> next_call,
            Compounding comp,
            const NumericalConfig& config) {
    if (!next_call) {
        return missing_call(0.0);
    }
    if (auto window = check_call_window(payments, valuation_date, next_call->date, day_basis);
        !window) {
        return std::unexpected(window.error());
    }

    SPREADOMATIC_TRACE_ALGO_START(MODULE_OAS, payments.size(), dirty_price, next_call->price);

    const auto cashflows = cashflows_to_call(payments, valuation_date, *next_call, day_basis);
    const auto times = cashflow_times(cashflows);
    const auto amounts = cashflow_amounts(cashflows);

    auto spread = YieldSolver(config).solve_spread(dirty_price, times, amounts, curve, comp);
    if (spread) {
        SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_OAS, spread->iterations, spread->value);
    }
    return spread;
}

std::expected<SolveResult, AnalyticsError>
yield_to_call(std::span<const ScheduledPayment> payments,
              Date valuation_date,
              double dirty_price,
              const CallScheduleEntry& call,
              DayBasis day_basis,
              Compounding comp,
              const NumericalConfig& config) {
    if (auto window = check_call_window(payments, valuation_date, call.date, day_basis); !window) {
        return std::unexpected(window.error());
    }
    const auto cashflows = cashflows_to_call(payments, valuation_date, call, day_basis);
    return solve_stream_yield(cashflows, dirty_price, comp, config);
}

std::expected<YieldToWorstResult, AnalyticsError>
yield_to_worst(std::span<const ScheduledPayment> payments,
               Date valuation_date,
               double dirty_price,
               std::span<const CallScheduleEntry> calls,
               DayBasis day_basis,
               Compounding comp,
               const NumericalConfig& config) {
    const auto cashflows = extract_cashflows(payments, valuation_date, day_basis);
    if (cashflows.empty()) {
        return std::unexpected(AnalyticsError{.code = AnalyticsErrorCode::InvalidCashflows});
    }
    const Cashflow& final_payment = cashflows.back();

    std::vector<WorkoutYield> candidates;
    candidates.reserve(calls.size() + 1);

    auto to_maturity = solve_stream_yield(cashflows, dirty_price, comp, config);
    if (to_maturity) {
        candidates.push_back(WorkoutYield{
            .date = final_payment.date,
            .price = final_payment.principal,
            .yield = to_maturity->value,
            .is_call = false
        });
    }

    for (const auto& call : calls) {
        if (!after(call.date, valuation_date) || after(call.date, final_payment.date)) {
            continue;
        }
        auto to_call = yield_to_call(payments, valuation_date, dirty_price, call,
                                     day_basis, comp, config);
        if (!to_call) {
            continue;
        }
        candidates.push_back(WorkoutYield{
            .date = call.date,
            .price = call.price,
            .yield = to_call->value,
            .is_call = true
        });
    }

    if (candidates.empty()) {
        return std::unexpected(to_maturity.error());
    }

    const auto worst = std::min_element(candidates.begin(), candidates.end(),
        [](const WorkoutYield& lhs, const WorkoutYield& rhs) { return lhs.yield < rhs.yield; });
    return YieldToWorstResult{
        .yield = worst->yield,
        .workout_date = worst->date,
        .workout_price = worst->price,
        .is_call = worst->is_call,
        .candidates = std::move(candidates)
    };
}

}  // namespace spreadomatic
