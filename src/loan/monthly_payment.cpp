// SPDX-License-Identifier: MIT
#include "src/loan/monthly_payment.hpp"
#include "src/support/hypo_trace.h"

#include <cstdlib>

namespace hypo {

namespace {

std::unexpected<MonthlyPaymentError> reject(MonthlyPaymentErrorCode code, double value) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_LOAN, static_cast<int>(code), value, 0.0);
    return std::unexpected(MonthlyPaymentError(code, value));
}

}  // namespace

std::expected<MonthlyPayment, MonthlyPaymentError>
MonthlyPayment::create(double principal, double interest, double total) {
    auto principal_money = Money::create(principal);
    if (!principal_money.has_value()) {
        return reject(MonthlyPaymentErrorCode::InvalidPrincipal, principal);
    }
    auto interest_money = Money::create(interest);
    if (!interest_money.has_value()) {
        return reject(MonthlyPaymentErrorCode::InvalidInterest, interest);
    }
    auto total_money = Money::create(total);
    if (!total_money.has_value()) {
        return reject(MonthlyPaymentErrorCode::InvalidTotal, total);
    }

    // Compared on the unrounded inputs; the stored parts are whole cents
    const double difference = std::abs(principal + interest - total);
    if (difference > kConsistencyTolerance + 1e-9) {
        return reject(MonthlyPaymentErrorCode::InconsistentAmounts, difference);
    }

    return MonthlyPayment{*principal_money, *interest_money, *total_money};
}

std::expected<MonthlyPayment, MonthlyPaymentError>
MonthlyPayment::from_components(double principal, double interest) {
    return create(principal, interest, principal + interest);
}

double MonthlyPayment::principal_ratio() const noexcept {
    if (total_.is_zero()) {
        return 0.0;
    }
    return principal_.euros() / total_.euros();
}

double MonthlyPayment::interest_ratio() const noexcept {
    if (total_.is_zero()) {
        return 0.0;
    }
    return interest_.euros() / total_.euros();
}

std::string format_monthly_payment(const MonthlyPayment& payment) {
    return "Monatliche Rate: " + format_money(payment.total()) +
           " (Tilgung: " + format_money(payment.principal()) +
           ", Zinsen: " + format_money(payment.interest()) + ")";
}

} // namespace hypo
