// SPDX-License-Identifier: MIT
/**
 * @file loan_calculations.hpp
 * @brief Closed-form annuity calculations and the implied-rate solve
 *
 * All functions are pure. The implied annual rate is found by bisection
 * (see src/math/root_finding.hpp) since the annuity equation has no
 * closed-form inverse in the rate.
 */

#pragma once

#include <expected>
#include <span>
#include <vector>

#include "src/loan/loan_configuration.hpp"
#include "src/loan/monthly_payment.hpp"
#include "src/math/root_finding.hpp"
#include "src/support/error_types.hpp"
#include "src/value/interest_rate.hpp"
#include "src/value/loan_amount.hpp"
#include "src/value/money.hpp"
#include "src/value/month_count.hpp"

namespace hypo {

/// Bracket of annual rates (as fractions) searched by calculate_interest_rate
inline constexpr double kImpliedRateLowerBound = 0.0001;
inline constexpr double kImpliedRateUpperBound = 0.30;

/// Annuity installment split for the first month (interest = L * c)
[[nodiscard]] std::expected<MonthlyPayment, CalculationError>
calculate_monthly_payment(const LoanConfiguration& config);

/// Number of installments needed to repay `amount` with `payment`
///
/// InsufficientPayment when the payment does not exceed the first month's
/// interest; InvalidParameters when the result lies outside [1, 480].
[[nodiscard]] std::expected<MonthCount, CalculationError>
calculate_loan_term(LoanAmount amount, InterestRate rate, Money payment);

/// Annual rate at which `payment` amortizes `amount` over `term`
[[nodiscard]] std::expected<InterestRate, CalculationError>
calculate_interest_rate(LoanAmount amount, MonthCount term, Money payment,
                        const RootFindingConfig& config = {});

/// payment * n - amount over the full term
[[nodiscard]] std::expected<Money, CalculationError>
calculate_total_interest(const LoanConfiguration& config);

/// Outstanding principal after `payments_made` regular installments
[[nodiscard]] std::expected<Money, CalculationError>
calculate_remaining_balance(const LoanConfiguration& config, int payments_made);

/// Months until refinancing `costs` are recovered by the lower installment
///
/// InsufficientPayment when the new configuration does not save anything.
[[nodiscard]] std::expected<MonthCount, CalculationError>
calculate_break_even_point(const LoanConfiguration& current, const LoanConfiguration& refinanced,
                           Money costs);

/// Variation of a base configuration
struct PaymentScenario {
    /// Multiplies the loan amount
    double amount_multiplier = 1.0;

    /// Added to the annual rate, in percentage points
    double rate_adjustment = 0.0;

    /// Added to the term, in months
    int term_adjustment = 0;
};

/// First-month breakdown for each scenario, in input order
[[nodiscard]] std::expected<std::vector<MonthlyPayment>, CalculationError>
calculate_payment_scenarios(const LoanConfiguration& base, std::span<const PaymentScenario> scenarios);

} // namespace hypo
