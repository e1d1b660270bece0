// SPDX-License-Identifier: MIT
#include "src/amortization/amortization_engine.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>
#include <cmath>

namespace hypo {

namespace {

// Balances below this are treated as repaid (floating-point dust)
constexpr double kBalanceEpsilon = 1e-6;

/// The installment matches the annuity closely enough that the final
/// residual is rounding and not a shortfall
bool installment_is_consistent(const LoanTerms& terms, const ConsistencyTolerances& tolerances) {
    const double c = terms.monthly_rate();
    const double expected = annuity_payment(terms.amount, c, terms.term_months);
    const double tolerance = c == 0.0 ? tolerances.zero_rate_euros : tolerances.annuity_euros;
    return std::abs(terms.monthly_payment - expected) <= tolerance;
}

std::unexpected<AmortizationError> reject(AmortizationErrorCode code, double value, double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_AMORTIZATION, static_cast<int>(code), value, bound);
    return std::unexpected(AmortizationError(code, value));
}

int remaining_installments(double balance, double monthly_rate, double payment) {
    if (balance <= 0.0) {
        return 0;
    }
    if (monthly_rate == 0.0) {
        return static_cast<int>(std::ceil(balance / payment));
    }
    const double ratio = balance * monthly_rate / payment;
    if (ratio >= 1.0) {
        return -1;
    }
    return static_cast<int>(std::ceil(-std::log(1.0 - ratio) / std::log(1.0 + monthly_rate)));
}

}  // namespace

std::expected<void, AmortizationError>
AmortizationEngine::validate(const LoanTerms& terms, std::span<const ExtraPayment> extras) const {
    auto valid = validate_loan_terms(terms);
    if (!valid.has_value()) {
        return reject(AmortizationErrorCode::InvalidLoanTerms, valid.error().value);
    }

    const double first_interest = terms.amount * terms.monthly_rate();
    if (terms.monthly_rate() > 0.0 && terms.monthly_payment <= first_interest) {
        return reject(AmortizationErrorCode::PaymentBelowInterest, terms.monthly_payment, first_interest);
    }

    for (std::size_t i = 1; i < extras.size(); ++i) {
        const std::int64_t prev = extras[i - 1].month().value();
        const std::int64_t curr = extras[i].month().value();
        if (curr == prev) {
            return reject(AmortizationErrorCode::DuplicateExtraPayment, static_cast<double>(curr));
        }
        if (curr < prev) {
            return reject(AmortizationErrorCode::UnorderedExtraPayments,
                          static_cast<double>(curr), static_cast<double>(prev));
        }
    }
    return {};
}

std::vector<PaymentDetail>
AmortizationEngine::run(const LoanTerms& terms, std::span<const ExtraPayment> extras, int last_month) const {
    const double c = terms.monthly_rate();
    const bool zero_rate = c == 0.0;
    const double straight_line = terms.amount / static_cast<double>(terms.term_months);
    const bool settle = config_.settle_final_installment &&
                        installment_is_consistent(terms, config_.settlement_tolerances);

    std::vector<PaymentDetail> entries;
    entries.reserve(static_cast<std::size_t>(std::max(last_month, 0)));

    double balance = terms.amount;
    double cumulative_interest = 0.0;
    double cumulative_principal = 0.0;
    auto next_extra = extras.begin();

    for (int month = 1; month <= last_month && balance > 0.0; ++month) {
        const double opening = balance;
        const double interest = zero_rate ? 0.0 : opening * c;

        double principal = zero_rate ? straight_line : terms.monthly_payment - interest;
        const bool final_installment = settle && month == terms.term_months;
        if (final_installment || principal > opening) {
            principal = opening;
        }

        while (next_extra != extras.end() && next_extra->month().value() < month) {
            ++next_extra;
        }
        double extra = 0.0;
        if (next_extra != extras.end() && next_extra->month().value() == month) {
            extra = std::min(next_extra->euros(), opening - principal);
            ++next_extra;
        }

        balance = std::max(0.0, opening - principal - extra);
        if (balance < kBalanceEpsilon) {
            principal += balance;
            balance = 0.0;
        }

        cumulative_interest += interest;
        cumulative_principal += principal + extra;

        entries.push_back(PaymentDetail{
            .month = month,
            .starting_balance = opening,
            .interest = interest,
            .principal = principal,
            .extra_payment = extra,
            .remaining_balance = balance,
            .cumulative_interest = cumulative_interest,
            .cumulative_principal = cumulative_principal
        });
    }
    return entries;
}

std::expected<AmortizationSchedule, AmortizationError>
AmortizationEngine::generate(const LoanTerms& terms, std::span<const ExtraPayment> extras) const {
    auto valid = validate(terms, extras);
    if (!valid.has_value()) {
        return std::unexpected(valid.error());
    }

    HYPO_TRACE_ALGO_START(MODULE_AMORTIZATION, terms.amount, terms.term_months, terms.annual_rate);
    AmortizationSchedule schedule{terms, run(terms, extras, terms.term_months)};
    HYPO_TRACE_ALGO_COMPLETE(MODULE_AMORTIZATION, schedule.entries.size(), schedule.final_balance());

    return schedule;
}

std::expected<LoanStatus, AmortizationError>
AmortizationEngine::status(const LoanTerms& terms, std::span<const ExtraPayment> extras,
                           Date start_date, Date as_of) const {
    auto valid = validate(terms, extras);
    if (!valid.has_value()) {
        return std::unexpected(valid.error());
    }

    const int months_elapsed = std::max(0, months_between(start_date, as_of));
    const int replay = std::min(months_elapsed, terms.term_months);
    const std::vector<PaymentDetail> elapsed = run(terms, extras, replay);

    const int payments_made = static_cast<int>(elapsed.size());
    const double balance = elapsed.empty() ? terms.amount : elapsed.back().remaining_balance;
    const double interest_paid = elapsed.empty() ? 0.0 : elapsed.back().cumulative_interest;

    double total_paid = 0.0;
    for (const auto& entry : elapsed) {
        total_paid += entry.total_payment();
    }

    const double c = terms.monthly_rate();
    int remaining = remaining_installments(balance, c, terms.monthly_payment);
    const int contractual_left = terms.term_months - payments_made;
    const bool settle = config_.settle_final_installment &&
                        installment_is_consistent(terms, config_.settlement_tolerances);
    if (remaining < 0 || (settle && remaining > contractual_left)) {
        remaining = contractual_left;
    }

    const Date payoff = balance > 0.0 ? add_months(as_of, remaining)
                                      : add_months(start_date, payments_made);
    const double remaining_interest =
        c == 0.0 ? 0.0 : std::max(0.0, remaining * terms.monthly_payment - balance);

    LoanStatus status{
        .current_balance = balance,
        .months_elapsed = months_elapsed,
        .payments_made = payments_made,
        .remaining_months = remaining,
        .payoff_date = payoff,
        .total_interest_paid = interest_paid,
        .total_paid = total_paid,
        .remaining_interest = remaining_interest,
        .schedule = std::nullopt
    };

    if (config_.materialize_schedule) {
        status.schedule = AmortizationSchedule{terms, run(terms, extras, terms.term_months)};
    }
    return status;
}

} // namespace hypo
