// SPDX-License-Identifier: MIT
/**
 * @file cashflow_schedule.hpp
 * @brief Fixed-rate coupon schedules and valuation-date cashflow extraction
 */

#pragma once

#include "spreadomatic/bond/day_count.hpp"
#include "spreadomatic/support/error_types.hpp"
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace spreadomatic {

/// Contractual terms of a fixed-rate bond
struct BondSchedule {
    Date issue_date;
    Date first_coupon_date;
    Date maturity_date;
    int coupon_frequency = 2;  ///< 1, 2, 4 or 12
    DayBasis day_basis = DayBasis::Thirty360;
};

/// Contractual payment before filtering by valuation date
struct ScheduledPayment {
    Date date;
    double coupon = 0.0;
    double principal = 0.0;
    /// Start of the coupon accrual period (unset for hand-built payments)
    std::optional<Date> accrual_start = std::nullopt;

    double total() const { return coupon + principal; }
};

/// Payment strictly after the valuation date
struct Cashflow {
    Date date;
    double time_years;      ///< From the valuation date
    double coupon;
    double principal;
    double total;           ///< coupon + principal
    double accrual_period;  ///< Coupon accrual in years (0 if unknown)
};

/// One call date with its redemption price
struct CallScheduleEntry {
    Date date;
    double price;
};

/// Coupons within this many calendar days of maturity merge into the final payment
inline constexpr int kMaturityMergeWindowDays = 7;

/// Accrual mismatch (years) above which a period counts as irregular
inline constexpr double kIrregularPeriodTolerance = 0.01;

/// Validate frequency, date ordering and coupon terms
std::expected<void, ValidationError>
validate_bond_schedule(const BondSchedule& schedule, double coupon_rate, double notional);

/// Generate the full coupon schedule of a fixed-rate bond
///
/// Coupon dates are first_coupon_date + k * 12/frequency months with
/// end-of-month clamping, strictly before maturity. A regular period pays
/// notional * coupon_rate / frequency. The first and final periods are paid
/// on actual accrual (notional * coupon_rate * accrual) when their accrual
/// differs from 1/frequency by more than kIrregularPeriodTolerance. The
/// maturity payment carries the final coupon plus the notional.
std::expected<std::vector<ScheduledPayment>, ValidationError>
generate_fixed_schedule(const BondSchedule& schedule, double coupon_rate,
                        double notional = 100.0);

/// Payments strictly after valuation_date (and on or before last_date when set)
///
/// time_years is measured from valuation_date under time_basis.
std::vector<Cashflow> extract_cashflows(std::span<const ScheduledPayment> payments,
                                        Date valuation_date,
                                        DayBasis time_basis = DayBasis::ActAct,
                                        std::optional<Date> last_date = std::nullopt);

/// generate_fixed_schedule followed by extract_cashflows
std::expected<std::vector<Cashflow>, ValidationError>
project_cashflows(const BondSchedule& schedule, double coupon_rate, Date valuation_date,
                  double notional = 100.0, DayBasis time_basis = DayBasis::ActAct);

/// Coupon accrued from the start of the current period to valuation_date
///
/// Uses the schedule's day basis. Zero before the first accrual start and
/// on or after maturity.
double accrued_interest(std::span<const ScheduledPayment> payments,
                        const BondSchedule& schedule, Date valuation_date);

/// Time column of a cashflow stream
std::vector<double> cashflow_times(std::span<const Cashflow> cashflows);

/// Total-amount column of a cashflow stream
std::vector<double> cashflow_amounts(std::span<const Cashflow> cashflows);

}  // namespace spreadomatic
