// SPDX-License-Identifier: MIT
#include "src/value/loan_amount.hpp"
#include "src/support/hypo_trace.h"

#include <stdexcept>

namespace hypo {

std::expected<LoanAmount, LoanAmountError> LoanAmount::create(double euros) {
    auto money = Money::create(euros);
    if (!money.has_value()) {
        return std::unexpected(LoanAmountError(LoanAmountErrorCode::MoneyValidationError, euros));
    }
    return from_money(*money);
}

std::expected<LoanAmount, LoanAmountError> LoanAmount::from_money(Money money) {
    const double euros = money.euros();
    if (euros < kMinimumEuros) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(LoanAmountErrorCode::BelowMinimum), euros, kMinimumEuros);
        return std::unexpected(LoanAmountError(LoanAmountErrorCode::BelowMinimum, euros));
    }
    if (euros > kMaximumEuros) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(LoanAmountErrorCode::AboveMaximum), euros, kMaximumEuros);
        return std::unexpected(LoanAmountError(LoanAmountErrorCode::AboveMaximum, euros));
    }
    return LoanAmount{money};
}

LoanAmount LoanAmount::minimum() {
    auto amount = create(kMinimumEuros);
    if (!amount.has_value()) {
        throw std::logic_error("LoanAmount::minimum: constant out of range");
    }
    return *amount;
}

LoanAmount LoanAmount::maximum() {
    auto amount = create(kMaximumEuros);
    if (!amount.has_value()) {
        throw std::logic_error("LoanAmount::maximum: constant out of range");
    }
    return *amount;
}

std::string format_loan_amount(LoanAmount amount) {
    return format_money(amount.to_money());
}

} // namespace hypo
