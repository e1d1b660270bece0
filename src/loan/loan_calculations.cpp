// SPDX-License-Identifier: MIT
#include "src/loan/loan_calculations.hpp"
#include "src/loan/loan_terms.hpp"
#include "src/support/hypo_trace.h"

#include <cmath>

namespace hypo {

namespace {

std::unexpected<CalculationError> reject(CalculationErrorCode code, double value, double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_LOAN_CALCULATIONS, static_cast<int>(code), value, bound);
    return std::unexpected(CalculationError(code, value));
}

std::expected<MonthlyPayment, CalculationError>
first_month_breakdown(double amount, double monthly_rate, int months) {
    const double payment = annuity_payment(amount, monthly_rate, months);
    const double interest = amount * monthly_rate;
    if (!std::isfinite(payment)) {
        return reject(CalculationErrorCode::MathematicalError, payment);
    }
    auto breakdown = MonthlyPayment::create(payment - interest, interest, payment);
    if (!breakdown.has_value()) {
        return reject(CalculationErrorCode::InvalidParameters, payment);
    }
    return *breakdown;
}

}  // namespace

std::expected<MonthlyPayment, CalculationError>
calculate_monthly_payment(const LoanConfiguration& config) {
    return first_month_breakdown(config.amount().euros(), config.annual_rate().to_monthly_rate(),
                                 static_cast<int>(config.term().value()));
}

std::expected<MonthCount, CalculationError>
calculate_loan_term(LoanAmount amount, InterestRate rate, Money payment) {
    const double principal = amount.euros();
    const double installment = payment.euros();
    const double c = rate.to_monthly_rate();

    if (installment <= 0.0) {
        return reject(CalculationErrorCode::InsufficientPayment, installment);
    }

    double months = 0.0;
    if (c == 0.0) {
        months = std::ceil(principal / installment);
    } else {
        if (installment <= principal * c) {
            return reject(CalculationErrorCode::InsufficientPayment, installment, principal * c);
        }
        months = std::ceil(-std::log(1.0 - principal * c / installment) / std::log(1.0 + c));
    }

    if (!std::isfinite(months)) {
        return reject(CalculationErrorCode::MathematicalError, months);
    }
    auto term = MonthCount::create(months);
    if (!term.has_value()) {
        return reject(CalculationErrorCode::InvalidParameters, months);
    }
    return *term;
}

std::expected<InterestRate, CalculationError>
calculate_interest_rate(LoanAmount amount, MonthCount term, Money payment,
                        const RootFindingConfig& config) {
    const double principal = amount.euros();
    const int months = static_cast<int>(term.value());
    const double target = payment.euros();

    auto objective = [&](double annual) {
        return annuity_payment(principal, annual / 12.0, months) - target;
    };

    HYPO_TRACE_ALGO_START(MODULE_LOAN_CALCULATIONS, principal, months, target);
    const RootFindingResult result =
        bisect_find_root(objective, kImpliedRateLowerBound, kImpliedRateUpperBound, config);

    if (!result.converged || !result.root.has_value()) {
        HYPO_TRACE_RUNTIME_ERROR(MODULE_LOAN_CALCULATIONS,
            static_cast<int>(CalculationErrorCode::ConvergenceFailure), result.final_error);
        return std::unexpected(CalculationError(CalculationErrorCode::ConvergenceFailure,
                                                result.final_error));
    }
    HYPO_TRACE_ALGO_COMPLETE(MODULE_LOAN_CALCULATIONS, result.iterations, result.final_error);

    auto rate = InterestRate::from_decimal(*result.root);
    if (!rate.has_value()) {
        return reject(CalculationErrorCode::InvalidParameters, *result.root * 100.0);
    }
    return *rate;
}

std::expected<Money, CalculationError> calculate_total_interest(const LoanConfiguration& config) {
    const double total_paid = config.monthly_payment().euros() * static_cast<double>(config.term().value());
    const double interest = total_paid - config.amount().euros();
    auto money = Money::create(interest < 0.0 ? 0.0 : interest);
    if (!money.has_value()) {
        return reject(CalculationErrorCode::MathematicalError, interest);
    }
    return *money;
}

std::expected<Money, CalculationError>
calculate_remaining_balance(const LoanConfiguration& config, int payments_made) {
    if (payments_made < 0) {
        return reject(CalculationErrorCode::InvalidParameters, payments_made);
    }
    const double balance = annuity_balance(config.amount().euros(),
                                           config.annual_rate().to_monthly_rate(),
                                           static_cast<int>(config.term().value()), payments_made);
    auto money = Money::create(balance < 0.0 ? 0.0 : balance);
    if (!money.has_value()) {
        return reject(CalculationErrorCode::MathematicalError, balance);
    }
    return *money;
}

std::expected<MonthCount, CalculationError>
calculate_break_even_point(const LoanConfiguration& current, const LoanConfiguration& refinanced,
                           Money costs) {
    const double savings = current.monthly_payment().euros() - refinanced.monthly_payment().euros();
    if (savings <= 0.0) {
        return reject(CalculationErrorCode::InsufficientPayment, savings);
    }
    const double months = std::ceil(costs.euros() / savings);
    auto term = MonthCount::create(months < 1.0 ? 1.0 : months);
    if (!term.has_value()) {
        return reject(CalculationErrorCode::InvalidParameters, months);
    }
    return *term;
}

std::expected<std::vector<MonthlyPayment>, CalculationError>
calculate_payment_scenarios(const LoanConfiguration& base, std::span<const PaymentScenario> scenarios) {
    std::vector<MonthlyPayment> results;
    results.reserve(scenarios.size());

    for (const auto& scenario : scenarios) {
        auto amount = LoanAmount::create(base.amount().euros() * scenario.amount_multiplier);
        auto rate = InterestRate::create(base.annual_rate().value() + scenario.rate_adjustment);
        auto term = MonthCount::create(static_cast<double>(base.term().value() + scenario.term_adjustment));
        if (!amount.has_value() || !rate.has_value() || !term.has_value()) {
            return reject(CalculationErrorCode::InvalidParameters, scenario.amount_multiplier);
        }

        auto breakdown = first_month_breakdown(amount->euros(), rate->to_monthly_rate(),
                                               static_cast<int>(term->value()));
        if (!breakdown.has_value()) {
            return std::unexpected(breakdown.error());
        }
        results.push_back(*breakdown);
    }
    return results;
}

} // namespace hypo
