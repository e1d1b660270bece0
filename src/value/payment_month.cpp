// SPDX-License-Identifier: MIT
#include "src/value/payment_month.hpp"
#include "src/support/hypo_trace.h"

namespace hypo {

std::expected<PaymentMonth, PaymentMonthError> PaymentMonth::create(double month) {
    auto value = PositiveInteger::create(month);
    if (!value.has_value()) {
        return std::unexpected(
            PaymentMonthError(PaymentMonthErrorCode::PositiveIntegerValidationError, month));
    }
    if (value->value() > kMaximumMonth) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(PaymentMonthErrorCode::InvalidPaymentMonth), month, kMaximumMonth);
        return std::unexpected(PaymentMonthError(PaymentMonthErrorCode::InvalidPaymentMonth, month));
    }
    return PaymentMonth{*value};
}

std::expected<PaymentMonth, PaymentMonthError>
PaymentMonth::from_year_and_month(int year, int month_in_year) {
    if (year < 1 || year > 40) {
        return std::unexpected(PaymentMonthError(PaymentMonthErrorCode::InvalidPaymentMonth, year));
    }
    if (month_in_year < 1 || month_in_year > 12) {
        return std::unexpected(
            PaymentMonthError(PaymentMonthErrorCode::InvalidPaymentMonth, month_in_year));
    }
    return create(static_cast<double>((year - 1) * 12 + month_in_year));
}

std::expected<PaymentMonth, PaymentMonthError> PaymentMonth::add_months(std::int64_t months) const {
    return create(static_cast<double>(value() + months));
}

std::string format_payment_month(PaymentMonth month) {
    return "Monat " + std::to_string(month.value()) +
           " (Jahr " + std::to_string(month.payment_year()) +
           ", " + std::to_string(month.month_in_year()) + ". Monat)";
}

} // namespace hypo
