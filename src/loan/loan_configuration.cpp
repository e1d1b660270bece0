// SPDX-License-Identifier: MIT
#include "src/loan/loan_configuration.hpp"
#include "src/support/hypo_trace.h"

#include <cmath>

namespace hypo {

namespace {

std::unexpected<LoanConfigurationError> reject(LoanConfigurationErrorCode code, double value,
                                               double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_LOAN, static_cast<int>(code), value, bound);
    return std::unexpected(LoanConfigurationError(code, value));
}

}  // namespace

std::expected<LoanConfiguration, LoanConfigurationError>
LoanConfiguration::create(LoanAmount amount, InterestRate rate, MonthCount term,
                          Money monthly_payment, const ConsistencyTolerances& tolerances) {
    const double monthly_rate = rate.to_monthly_rate();
    const int months = static_cast<int>(term.value());
    const double expected_payment = annuity_payment(amount.euros(), monthly_rate, months);
    const double tolerance =
        monthly_rate == 0.0 ? tolerances.zero_rate_euros : tolerances.annuity_euros;

    const double deviation = std::abs(monthly_payment.euros() - expected_payment);
    if (!(deviation <= tolerance)) {
        return reject(LoanConfigurationErrorCode::InconsistentParameters,
                      monthly_payment.euros(), expected_payment);
    }
    return LoanConfiguration{amount, rate, term, monthly_payment};
}

std::expected<LoanConfiguration, LoanConfigurationError>
LoanConfiguration::from_input(const LoanInput& input, const ConsistencyTolerances& tolerances) {
    if (!input.amount || !input.annual_rate || !input.monthly_payment ||
        (!input.term_in_months && !input.term_in_years)) {
        return reject(LoanConfigurationErrorCode::InconsistentParameters, 0.0);
    }

    auto amount = LoanAmount::create(*input.amount);
    if (!amount.has_value()) {
        return reject(LoanConfigurationErrorCode::InvalidLoanAmount, *input.amount);
    }
    auto rate = InterestRate::create(*input.annual_rate);
    if (!rate.has_value()) {
        return reject(LoanConfigurationErrorCode::InvalidInterestRate, *input.annual_rate);
    }
    auto term = input.term_in_months ? MonthCount::create(*input.term_in_months)
                                     : MonthCount::from_years(*input.term_in_years);
    if (!term.has_value()) {
        return reject(LoanConfigurationErrorCode::InvalidTerm,
                      input.term_in_months.value_or(input.term_in_years.value_or(0.0)));
    }
    auto payment = Money::create(*input.monthly_payment);
    if (!payment.has_value()) {
        return reject(LoanConfigurationErrorCode::InvalidMonthlyPayment, *input.monthly_payment);
    }

    return create(*amount, *rate, *term, *payment, tolerances);
}

std::expected<LoanConfiguration, LoanConfigurationError>
LoanConfiguration::with_calculated_payment(LoanAmount amount, InterestRate rate, MonthCount term) {
    const double payment = annuity_payment(amount.euros(), rate.to_monthly_rate(),
                                           static_cast<int>(term.value()));
    auto money = Money::create(payment);
    if (!money.has_value()) {
        return reject(LoanConfigurationErrorCode::InvalidMonthlyPayment, payment);
    }
    return create(amount, rate, term, *money);
}

LoanTerms LoanConfiguration::terms() const noexcept {
    return LoanTerms{
        .amount = amount_.euros(),
        .annual_rate = rate_.value(),
        .term_months = static_cast<int>(term_.value()),
        .monthly_payment = payment_.euros()
    };
}

LoanConfigurationDelta compare_loan_configurations(const LoanConfiguration& a,
                                                   const LoanConfiguration& b) {
    return LoanConfigurationDelta{
        .amount_difference = b.amount().euros() - a.amount().euros(),
        .rate_difference = b.annual_rate().value() - a.annual_rate().value(),
        .term_difference = b.term().value() - a.term().value(),
        .payment_difference = b.monthly_payment().euros() - a.monthly_payment().euros()
    };
}

std::string format_loan_configuration(const LoanConfiguration& config) {
    return "Darlehen: " + format_loan_amount(config.amount()) +
           ", Zinssatz: " + format_interest_rate(config.annual_rate()) +
           ", Laufzeit: " + format_month_count(config.term()) +
           ", Monatliche Rate: " + format_money(config.monthly_payment());
}

} // namespace hypo
