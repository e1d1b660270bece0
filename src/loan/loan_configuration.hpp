// SPDX-License-Identifier: MIT
/**
 * @file loan_configuration.hpp
 * @brief Amount, rate, term and installment of an annuity loan
 *
 * The four fields are only accepted together when the installment matches
 * the annuity formula within ConsistencyTolerances. A configuration is
 * immutable; recalculation produces a new one.
 */

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

#include "src/loan/loan_terms.hpp"
#include "src/support/error_types.hpp"
#include "src/value/interest_rate.hpp"
#include "src/value/loan_amount.hpp"
#include "src/value/money.hpp"
#include "src/value/month_count.hpp"

namespace hypo {

/// Allowed deviation between the stated and the computed installment
struct ConsistencyTolerances {
    /// Annuity loans, euros
    double annuity_euros = 1.0;

    /// Straight-line (zero-rate) loans, euros
    double zero_rate_euros = 0.01;
};

/// Unvalidated user input. term_in_months wins over term_in_years.
struct LoanInput {
    std::optional<double> amount;
    std::optional<double> annual_rate;
    std::optional<double> term_in_months;
    std::optional<double> term_in_years;
    std::optional<double> monthly_payment;
};

class LoanConfiguration {
public:
    [[nodiscard]] static std::expected<LoanConfiguration, LoanConfigurationError>
    create(LoanAmount amount, InterestRate rate, MonthCount term, Money monthly_payment,
           const ConsistencyTolerances& tolerances = {});

    [[nodiscard]] static std::expected<LoanConfiguration, LoanConfigurationError>
    from_input(const LoanInput& input, const ConsistencyTolerances& tolerances = {});

    /// Installment computed from the annuity formula, rounded to cents
    [[nodiscard]] static std::expected<LoanConfiguration, LoanConfigurationError>
    with_calculated_payment(LoanAmount amount, InterestRate rate, MonthCount term);

    [[nodiscard]] constexpr LoanAmount amount() const noexcept { return amount_; }
    [[nodiscard]] constexpr InterestRate annual_rate() const noexcept { return rate_; }
    [[nodiscard]] constexpr MonthCount term() const noexcept { return term_; }
    [[nodiscard]] constexpr Money monthly_payment() const noexcept { return payment_; }

    [[nodiscard]] LoanTerms terms() const noexcept;

    friend constexpr bool operator==(const LoanConfiguration&, const LoanConfiguration&) = default;

private:
    constexpr LoanConfiguration(LoanAmount amount, InterestRate rate, MonthCount term,
                                Money payment) noexcept
        : amount_(amount), rate_(rate), term_(term), payment_(payment) {}

    LoanAmount amount_;
    InterestRate rate_;
    MonthCount term_;
    Money payment_;
};

/// Field-wise differences (b - a)
struct LoanConfigurationDelta {
    double amount_difference;
    double rate_difference;
    std::int64_t term_difference;
    double payment_difference;
};

[[nodiscard]] LoanConfigurationDelta compare_loan_configurations(const LoanConfiguration& a,
                                                                 const LoanConfiguration& b);

/// "Darlehen: 300.000,00 €, Zinssatz: 3,50 %, Laufzeit: 25 Jahre, Monatliche Rate: 1.501,87 €"
std::string format_loan_configuration(const LoanConfiguration& config);

} // namespace hypo
