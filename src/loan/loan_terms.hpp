// SPDX-License-Identifier: MIT
/**
 * @file loan_terms.hpp
 * @brief Plain loan parameters consumed by the amortization engine
 *
 * LoanTerms carries raw numbers so that a zero-rate loan (below the
 * InterestRate minimum) can still be amortized. LoanConfiguration::terms()
 * is the usual way to obtain one.
 */

#pragma once

#include <cmath>
#include <expected>

#include "src/support/error_types.hpp"

namespace hypo {

struct LoanTerms {
    /// Principal in euros
    double amount = 0.0;

    /// Nominal annual rate in percent (0 is allowed)
    double annual_rate = 0.0;

    /// Contractual number of monthly payments
    int term_months = 0;

    /// Regular monthly installment in euros
    double monthly_payment = 0.0;

    [[nodiscard]] constexpr double monthly_rate() const noexcept {
        return annual_rate / 100.0 / 12.0;
    }
};

/// Checks finiteness and ranges: amount > 0, rate in [0, 100),
/// term in [1, 480], payment > 0. Fails with InvalidParameters.
[[nodiscard]] std::expected<void, CalculationError> validate_loan_terms(const LoanTerms& terms);

/// Annuity installment L*c*(1+c)^n / ((1+c)^n - 1), or L/n when c == 0
[[nodiscard]] inline double annuity_payment(double amount, double monthly_rate, int months) {
    if (monthly_rate == 0.0) {
        return amount / static_cast<double>(months);
    }
    const double growth = std::pow(1.0 + monthly_rate, static_cast<double>(months));
    return amount * monthly_rate * growth / (growth - 1.0);
}

/// Closed-form balance after k annuity payments:
/// L*((1+c)^n - (1+c)^k) / ((1+c)^n - 1), straight-line when c == 0
[[nodiscard]] inline double annuity_balance(double amount, double monthly_rate, int months,
                                            int payments_made) {
    if (payments_made <= 0) {
        return amount;
    }
    if (payments_made >= months) {
        return 0.0;
    }
    if (monthly_rate == 0.0) {
        return amount * static_cast<double>(months - payments_made) / static_cast<double>(months);
    }
    const double growth_n = std::pow(1.0 + monthly_rate, static_cast<double>(months));
    const double growth_k = std::pow(1.0 + monthly_rate, static_cast<double>(payments_made));
    return amount * (growth_n - growth_k) / (growth_n - 1.0);
}

} // namespace hypo
