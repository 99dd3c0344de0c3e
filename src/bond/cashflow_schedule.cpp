// SPDX-License-Identifier: MIT
#include "spreadomatic/bond/cashflow_schedule.hpp"
#include "spreadomatic/support/spreadomatic_trace.h"
#include <cmath>

namespace spreadomatic {

namespace {

bool valid_frequency(int frequency) {
    return frequency == 1 || frequency == 2 || frequency == 4 || frequency == 12;
}

std::chrono::sys_days as_days(Date date) {
    return std::chrono::sys_days{date};
}

}  // namespace

std::expected<void, ValidationError>
validate_bond_schedule(const BondSchedule& schedule, double coupon_rate, double notional) {
    auto fail = [](ValidationError error) -> std::expected<void, ValidationError> {
        SPREADOMATIC_TRACE_VALIDATION_ERROR(MODULE_CASHFLOWS,
            static_cast<int>(error.code), error.value, error.index);
        return std::unexpected(error);
    };

    if (!valid_frequency(schedule.coupon_frequency)) {
        return fail(ValidationError(ValidationErrorCode::InvalidFrequency,
                                    static_cast<double>(schedule.coupon_frequency)));
    }
    if (!schedule.issue_date.ok() || !schedule.first_coupon_date.ok() ||
        !schedule.maturity_date.ok()) {
        return fail(ValidationError(ValidationErrorCode::InvalidDate));
    }
    if (as_days(schedule.first_coupon_date) <= as_days(schedule.issue_date)) {
        return fail(ValidationError(ValidationErrorCode::InvalidDateOrder, 0.0, 0));
    }
    if (as_days(schedule.maturity_date) < as_days(schedule.first_coupon_date)) {
        return fail(ValidationError(ValidationErrorCode::InvalidDateOrder, 0.0, 1));
    }
    if (!std::isfinite(coupon_rate) || coupon_rate < 0.0) {
        return fail(ValidationError(ValidationErrorCode::InvalidCouponRate, coupon_rate));
    }
    if (!std::isfinite(notional) || notional <= 0.0) {
        return fail(ValidationError(ValidationErrorCode::InvalidNotional, notional));
    }
    return {};
}

std::expected<std::vector<ScheduledPayment>, ValidationError>
generate_fixed_schedule(const BondSchedule& schedule, double coupon_rate, double notional) {
    if (auto valid = validate_bond_schedule(schedule, coupon_rate, notional); !valid) {
        return std::unexpected(valid.error());
    }

    const int frequency = schedule.coupon_frequency;
    const int step_months = 12 / frequency;
    const double regular_period = 1.0 / frequency;
    const double regular_coupon = notional * coupon_rate / frequency;

    std::vector<ScheduledPayment> payments;
    Date prev = schedule.issue_date;
    Date next = schedule.first_coupon_date;
    int k = 0;

    while (as_days(next) < as_days(schedule.maturity_date)) {
        // Stub coupon right before maturity folds into the final payment
        if (days_between(next, schedule.maturity_date) <= kMaturityMergeWindowDays) {
            break;
        }

        double coupon = regular_coupon;
        if (k == 0) {
            const double accrual = year_fraction(prev, next, schedule.day_basis);
            if (std::abs(accrual - regular_period) > kIrregularPeriodTolerance) {
                coupon = notional * coupon_rate * accrual;
            }
        }
        payments.push_back(ScheduledPayment{
            .date = next,
            .coupon = coupon,
            .principal = 0.0,
            .accrual_start = prev
        });

        prev = next;
        ++k;
        next = add_months(schedule.first_coupon_date, k * step_months);
    }

    const double final_accrual = year_fraction(prev, schedule.maturity_date, schedule.day_basis);
    double final_coupon = regular_coupon;
    if (std::abs(final_accrual - regular_period) > kIrregularPeriodTolerance) {
        final_coupon = notional * coupon_rate * final_accrual;
    }
    // A maturity payment of bare principal on a coupon bond lost its last coupon
    if (final_coupon == 0.0 && coupon_rate > 0.0) {
        final_coupon = regular_coupon;
    }

    payments.push_back(ScheduledPayment{
        .date = schedule.maturity_date,
        .coupon = final_coupon,
        .principal = notional,
        .accrual_start = prev
    });

    SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_CASHFLOWS, payments.size(), final_coupon);
    return payments;
}

std::vector<Cashflow> extract_cashflows(std::span<const ScheduledPayment> payments,
                                        Date valuation_date,
                                        DayBasis time_basis,
                                        std::optional<Date> last_date) {
    std::vector<Cashflow> cashflows;
    cashflows.reserve(payments.size());

    for (const auto& payment : payments) {
        if (as_days(payment.date) <= as_days(valuation_date)) continue;
        if (last_date && as_days(payment.date) > as_days(*last_date)) continue;

        const double accrual = payment.accrual_start
            ? year_fraction(*payment.accrual_start, payment.date, time_basis)
            : 0.0;
        cashflows.push_back(Cashflow{
            .date = payment.date,
            .time_years = year_fraction(valuation_date, payment.date, time_basis),
            .coupon = payment.coupon,
            .principal = payment.principal,
            .total = payment.total(),
            .accrual_period = accrual
        });
    }
    return cashflows;
}

std::expected<std::vector<Cashflow>, ValidationError>
project_cashflows(const BondSchedule& schedule, double coupon_rate, Date valuation_date,
                  double notional, DayBasis time_basis) {
    auto payments = generate_fixed_schedule(schedule, coupon_rate, notional);
    if (!payments) {
        return std::unexpected(payments.error());
    }
    return extract_cashflows(*payments, valuation_date, time_basis);
}

double accrued_interest(std::span<const ScheduledPayment> payments,
                        const BondSchedule& schedule, Date valuation_date) {
    Date period_start = schedule.issue_date;
    for (const auto& payment : payments) {
        if (as_days(payment.date) <= as_days(valuation_date)) {
            period_start = payment.date;
            continue;
        }
        const Date start = payment.accrual_start.value_or(period_start);
        if (as_days(valuation_date) <= as_days(start)) {
            return 0.0;
        }
        const double full = year_fraction(start, payment.date, schedule.day_basis);
        if (full <= 0.0) {
            return 0.0;
        }
        const double elapsed = year_fraction(start, valuation_date, schedule.day_basis);
        return payment.coupon * elapsed / full;
    }
    return 0.0;
}

std::vector<double> cashflow_times(std::span<const Cashflow> cashflows) {
    std::vector<double> times;
    times.reserve(cashflows.size());
    for (const auto& cf : cashflows) {
        times.push_back(cf.time_years);
    }
    return times;
}

std::vector<double> cashflow_amounts(std::span<const Cashflow> cashflows) {
    std::vector<double> amounts;
    amounts.reserve(cashflows.size());
    for (const auto& cf : cashflows) {
        amounts.push_back(cf.total);
    }
    return amounts;
}

}  // namespace spreadomatic
