// SPDX-License-Identifier: MIT
/**
 * @file schedule_metrics.hpp
 * @brief Totals, savings and lookups over a generated schedule
 */

#pragma once

#include <expected>
#include <optional>

#include "src/amortization/amortization_engine.hpp"
#include "src/support/error_types.hpp"
#include "src/value/payment_month.hpp"

namespace hypo {

/// Aggregates of one schedule (euros)
struct ScheduleMetrics {
    double total_interest_paid;
    double total_principal_paid;    ///< Includes extra payments
    double total_extra_payments;
    double total_payments;          ///< Interest plus principal plus extras
    int actual_term_months;
    int term_reduction_months;      ///< Configured term minus actual term, floored at 0
    double interest_saved;          ///< payment * term - amount - actual interest, floored at 0
    double effective_interest_rate; ///< interest_saved / extras * 100, or the nominal rate without extras
    double average_monthly_payment;
    double largest_monthly_payment;
    double smallest_monthly_payment;
    int payoff_year;                ///< Loan year of the last entry
    int payoff_month;               ///< Month 1..12 within that year
};

/// EmptySchedule when the schedule has no entries
[[nodiscard]] std::expected<ScheduleMetrics, AmortizationError>
compute_schedule_metrics(const AmortizationSchedule& schedule);

struct ScheduleComparison {
    double interest_savings;      ///< base interest - candidate interest, floored at 0
    int term_reduction_months;    ///< base term - candidate term, floored at 0
    double return_on_investment;  ///< savings / candidate extras * 100, 0 without extras
    bool is_worthwhile;           ///< savings > 0 and ROI above kWorthwhileRoiPercent
};

/// ROI threshold (percent) above which extra payments are worthwhile
inline constexpr double kWorthwhileRoiPercent = 2.0;

[[nodiscard]] std::expected<ScheduleComparison, AmortizationError>
compare_schedules(const AmortizationSchedule& base, const AmortizationSchedule& candidate);

/// Entry for `month`, or nullopt when the schedule ended earlier
[[nodiscard]] std::optional<PaymentDetail> schedule_entry(const AmortizationSchedule& schedule,
                                                          PaymentMonth month);

/// Balance after `month`; MonthNotInSchedule when the schedule ended earlier
[[nodiscard]] std::expected<double, AmortizationError> remaining_balance(const AmortizationSchedule& schedule,
                                                                         PaymentMonth month);

} // namespace hypo
