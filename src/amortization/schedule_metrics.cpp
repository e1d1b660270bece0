// SPDX-License-Identifier: MIT
#include "src/amortization/schedule_metrics.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>

namespace hypo {

namespace {

std::unexpected<AmortizationError> reject(AmortizationErrorCode code, double value) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_AMORTIZATION, static_cast<int>(code), value, 0.0);
    return std::unexpected(AmortizationError(code, value));
}

}  // namespace

std::expected<ScheduleMetrics, AmortizationError>
compute_schedule_metrics(const AmortizationSchedule& schedule) {
    if (schedule.entries.empty()) {
        return reject(AmortizationErrorCode::EmptySchedule, 0.0);
    }

    double extras = 0.0;
    double payments = 0.0;
    double largest = 0.0;
    double smallest = schedule.entries.front().total_payment();
    for (const auto& entry : schedule.entries) {
        const double outlay = entry.total_payment();
        extras += entry.extra_payment;
        payments += outlay;
        largest = std::max(largest, outlay);
        smallest = std::min(smallest, outlay);
    }

    const PaymentDetail& last = schedule.entries.back();
    const LoanTerms& terms = schedule.terms;
    const int actual_term = last.month;

    const double baseline_interest =
        terms.monthly_payment * static_cast<double>(terms.term_months) - terms.amount;
    const double saved = std::max(0.0, baseline_interest - last.cumulative_interest);
    const double effective_rate = extras > 0.0 ? saved / extras * 100.0 : terms.annual_rate;

    return ScheduleMetrics{
        .total_interest_paid = last.cumulative_interest,
        .total_principal_paid = last.cumulative_principal,
        .total_extra_payments = extras,
        .total_payments = payments,
        .actual_term_months = actual_term,
        .term_reduction_months = std::max(0, terms.term_months - actual_term),
        .interest_saved = saved,
        .effective_interest_rate = effective_rate,
        .average_monthly_payment = payments / static_cast<double>(schedule.entries.size()),
        .largest_monthly_payment = largest,
        .smallest_monthly_payment = smallest,
        .payoff_year = (actual_term + 11) / 12,
        .payoff_month = (actual_term - 1) % 12 + 1
    };
}

std::expected<ScheduleComparison, AmortizationError>
compare_schedules(const AmortizationSchedule& base, const AmortizationSchedule& candidate) {
    auto base_metrics = compute_schedule_metrics(base);
    if (!base_metrics.has_value()) {
        return std::unexpected(base_metrics.error());
    }
    auto candidate_metrics = compute_schedule_metrics(candidate);
    if (!candidate_metrics.has_value()) {
        return std::unexpected(candidate_metrics.error());
    }

    const double savings = std::max(0.0, base_metrics->total_interest_paid -
                                         candidate_metrics->total_interest_paid);
    const int term_reduction = std::max(0, base_metrics->actual_term_months -
                                           candidate_metrics->actual_term_months);
    const double extras = candidate_metrics->total_extra_payments;
    const double roi = extras > 0.0 ? savings / extras * 100.0 : 0.0;

    return ScheduleComparison{
        .interest_savings = savings,
        .term_reduction_months = term_reduction,
        .return_on_investment = roi,
        .is_worthwhile = savings > 0.0 && roi > kWorthwhileRoiPercent
    };
}

std::optional<PaymentDetail> schedule_entry(const AmortizationSchedule& schedule, PaymentMonth month) {
    const auto index = static_cast<std::size_t>(month.value() - 1);
    if (index >= schedule.entries.size()) {
        return std::nullopt;
    }
    return schedule.entries[index];
}

std::expected<double, AmortizationError> remaining_balance(const AmortizationSchedule& schedule,
                                                           PaymentMonth month) {
    auto entry = schedule_entry(schedule, month);
    if (!entry.has_value()) {
        return reject(AmortizationErrorCode::MonthNotInSchedule, static_cast<double>(month.value()));
    }
    return entry->remaining_balance;
}

} // namespace hypo
