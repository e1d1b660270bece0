// SPDX-License-Identifier: MIT
/**
 * @file amortization_engine.hpp
 * @brief Month-by-month annuity schedule with extra payments
 *
 * Each month the engine charges interest on the opening balance, applies
 * the regular installment's principal share, then any extra payment for
 * that month, flooring the balance at zero:
 *
 *   interest  = balance * c                (c = annual_rate / 1200)
 *   principal = min(payment - interest, balance)
 *   extra     = min(extra, balance - principal)
 *
 * A zero-rate loan repays amount / term each month instead. With
 * settle_final_installment the last month of the term repays the whole
 * remaining balance, which absorbs the rounding of a cent-rounded
 * installment. Settlement applies only while the installment is within
 * settlement_tolerances of the annuity installment; an underfunded loan
 * stops at the end of the term with its balance outstanding.
 *
 * Usage:
 *   AmortizationEngine engine;
 *   auto schedule = engine.generate(config.terms(), extras);
 *   if (schedule.has_value()) {
 *       double last = schedule->final_balance();
 *   }
 *
 *   auto status = engine.status(config.terms(), extras, start, today());
 *
 * The mid-schedule query replays min(months_elapsed, term) months and
 * derives the rest from the closed form, so only the elapsed part is
 * computed unless materialize_schedule is set.
 */

#pragma once

#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "src/loan/extra_payment.hpp"
#include "src/loan/loan_configuration.hpp"
#include "src/loan/loan_terms.hpp"
#include "src/sondertilgung/sondertilgung_plan.hpp"
#include "src/support/calendar.hpp"
#include "src/support/error_types.hpp"

namespace hypo {

/// Configuration for the amortization engine
struct AmortizationConfig {
    /// The last month of the term repays whatever balance remains
    bool settle_final_installment = true;

    /// Installment deviation from the annuity up to which settlement applies
    ConsistencyTolerances settlement_tolerances{};

    /// Attach the full schedule to LoanStatus results
    bool materialize_schedule = false;
};

/// One month of a schedule (euros)
struct PaymentDetail {
    int month;                    ///< 1-based schedule month
    double starting_balance;      ///< Balance before this month
    double interest;              ///< Interest charged this month
    double principal;             ///< Regular principal share of the installment
    double extra_payment;         ///< Extra payment actually applied
    double remaining_balance;     ///< Balance after this month
    double cumulative_interest;   ///< Interest paid through this month
    double cumulative_principal;  ///< Principal repaid through this month, extras included

    /// Total principal reduction of the month
    [[nodiscard]] double principal_component() const noexcept { return principal + extra_payment; }

    /// Regular installment part plus extra payment
    [[nodiscard]] double total_payment() const noexcept { return interest + principal + extra_payment; }
};

struct AmortizationSchedule {
    LoanTerms terms;
    std::vector<PaymentDetail> entries;

    [[nodiscard]] bool is_paid_off() const noexcept {
        return !entries.empty() && entries.back().remaining_balance <= 0.0;
    }

    [[nodiscard]] double final_balance() const noexcept {
        return entries.empty() ? terms.amount : entries.back().remaining_balance;
    }
};

/// Position of a loan on a given date
struct LoanStatus {
    double current_balance;      ///< Outstanding principal
    int months_elapsed;          ///< Calendar months since the start, floored at 0
    int payments_made;           ///< Schedule months replayed
    int remaining_months;        ///< Installments still due
    Date payoff_date;            ///< Expected or actual payoff month
    double total_interest_paid;  ///< Interest paid so far
    double total_paid;           ///< Installments and extras paid so far
    double remaining_interest;   ///< remaining_months * payment - balance, floored at 0

    /// Full schedule, set only with AmortizationConfig::materialize_schedule
    std::optional<AmortizationSchedule> schedule;

    [[nodiscard]] bool is_paid_off() const noexcept { return current_balance <= 0.0; }
};

/// Annuity amortization engine
///
/// Stateless apart from its configuration; one instance may be shared
/// between threads.
class AmortizationEngine {
public:
    explicit AmortizationEngine(const AmortizationConfig& config = {})
        : config_(config) {}

    /// Full schedule from month 1 until payoff or the end of the term
    ///
    /// Extra payments must be strictly increasing in month
    /// (UnorderedExtraPayments, DuplicateExtraPayment); those past the
    /// term are ignored. InvalidLoanTerms when the terms fail
    /// validate_loan_terms, PaymentBelowInterest when the installment does
    /// not cover the first month's interest.
    [[nodiscard]] std::expected<AmortizationSchedule, AmortizationError>
    generate(const LoanTerms& terms, std::span<const ExtraPayment> extras = {}) const;

    [[nodiscard]] std::expected<AmortizationSchedule, AmortizationError>
    generate(const LoanConfiguration& config, std::span<const ExtraPayment> extras = {}) const {
        return generate(config.terms(), extras);
    }

    [[nodiscard]] std::expected<AmortizationSchedule, AmortizationError>
    generate(const LoanConfiguration& config, const SondertilgungPlan& plan) const {
        return generate(config.terms(), plan.payments());
    }

    /// Loan position on `as_of` for a loan whose first installment month
    /// follows `start_date`
    [[nodiscard]] std::expected<LoanStatus, AmortizationError>
    status(const LoanTerms& terms, std::span<const ExtraPayment> extras,
           Date start_date, Date as_of) const;

    [[nodiscard]] const AmortizationConfig& config() const noexcept { return config_; }

private:
    AmortizationConfig config_;

    /// Shared checks of generate() and status()
    [[nodiscard]] std::expected<void, AmortizationError>
    validate(const LoanTerms& terms, std::span<const ExtraPayment> extras) const;

    /// Schedule months 1..last_month, stopping early at payoff
    [[nodiscard]] std::vector<PaymentDetail>
    run(const LoanTerms& terms, std::span<const ExtraPayment> extras, int last_month) const;
};

} // namespace hypo
