// SPDX-License-Identifier: MIT
/**
 * @file oas.hpp
 * @brief Next-call option-adjusted spread proxy, yield to call and yield to worst
 *
 * The OAS here is a deterministic spread-to-next-call: the bond is assumed
 * to be redeemed at the next call date for the call price, and the Z-spread
 * of that truncated stream is reported. It approximates a model OAS only
 * when exercise at the next call is close to certain.
 */

#pragma once

#include "spreadomatic/analytics/yield_solver.hpp"
#include "spreadomatic/bond/cashflow_schedule.hpp"
#include "spreadomatic/bond/day_count.hpp"
#include "spreadomatic/curve/compounding.hpp"
#include "spreadomatic/curve/zero_curve.hpp"
#include "spreadomatic/math/numerical_config.hpp"
#include "spreadomatic/support/error_types.hpp"
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace spreadomatic {

/// Yield to one workout date (maturity or a call)
struct WorkoutYield {
    Date date;
    double price;      ///< Redemption price at the workout date
    double yield;
    bool is_call;
};

/// Minimum yield over maturity and every future call
struct YieldToWorstResult {
    double yield;
    Date workout_date;
    double workout_price;
    bool is_call;
    /// Every workout date that solved, maturity first
    std::vector<WorkoutYield> candidates;
};

/// Cashflows up to a call, redeemed at the call price
///
/// Keeps payments strictly after valuation_date and on or before call.date;
/// principal due on the call date is replaced by call.price. time_years is
/// measured under day_basis.
std::vector<Cashflow> cashflows_to_call(std::span<const ScheduledPayment> payments,
                                        Date valuation_date,
                                        const CallScheduleEntry& call,
                                        DayBasis day_basis);

/// Z-spread of the stream truncated at the next call
///
/// MissingCallData when no call is given, it is not after valuation_date, or
/// it falls after the last scheduled payment.
std::expected<SolveResult, AnalyticsError>
compute_oas(std::span<const ScheduledPayment> payments,
            Date valuation_date,
            const ZeroCurve& curve,
            DayBasis day_basis,
            double dirty_price,
            std::optional<CallScheduleEntry> next_call,
            Compounding comp = Compounding::Annual,
            const NumericalConfig& config = {});

/// Yield of the stream truncated at `call`
///
/// Rejects calls outside (valuation_date, last payment] as compute_oas does.
std::expected<SolveResult, AnalyticsError>
yield_to_call(std::span<const ScheduledPayment> payments,
              Date valuation_date,
              double dirty_price,
              const CallScheduleEntry& call,
              DayBasis day_basis,
              Compounding comp = Compounding::Semiannual,
              const NumericalConfig& config = {});

/// Minimum of the yield to maturity and the yields to each future call
///
/// Calls on or before valuation_date or after maturity are ignored. Calls
/// whose yield does not solve are left out of the candidates.
std::expected<YieldToWorstResult, AnalyticsError>
yield_to_worst(std::span<const ScheduledPayment> payments,
               Date valuation_date,
               double dirty_price,
               std::span<const CallScheduleEntry> calls,
               DayBasis day_basis,
               Compounding comp = Compounding::Semiannual,
               const NumericalConfig& config = {});

}  // namespace spreadomatic
