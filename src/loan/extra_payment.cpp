// SPDX-License-Identifier: MIT
#include "src/loan/extra_payment.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>
#include <iterator>

namespace hypo {

namespace {

std::unexpected<ExtraPaymentError> reject(ExtraPaymentErrorCode code, double value) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_LOAN, static_cast<int>(code), value, 0.0);
    return std::unexpected(ExtraPaymentError(code, value));
}

}  // namespace

std::expected<ExtraPayment, ExtraPaymentError> ExtraPayment::create(PaymentMonth month, double euros) {
    auto money = Money::create(euros);
    if (!money.has_value()) {
        return reject(ExtraPaymentErrorCode::InvalidAmount, euros);
    }
    return from_money(month, *money);
}

std::expected<ExtraPayment, ExtraPaymentError> ExtraPayment::from_money(PaymentMonth month, Money amount) {
    if (amount.euros() < kMinimumEuros || amount.euros() > kMaximumEuros) {
        return reject(ExtraPaymentErrorCode::AmountTooLarge, amount.euros());
    }
    return ExtraPayment{month, amount};
}

std::expected<ExtraPayment, ExtraPaymentError>
combine_extra_payments(const ExtraPayment& a, const ExtraPayment& b) {
    if (a.month() != b.month()) {
        return reject(ExtraPaymentErrorCode::InvalidPaymentMonth, static_cast<double>(b.month().value()));
    }
    auto sum = a.amount().add(b.amount());
    if (!sum.has_value()) {
        return reject(ExtraPaymentErrorCode::InvalidAmount, a.euros() + b.euros());
    }
    return ExtraPayment::from_money(a.month(), *sum);
}

std::expected<Money, ExtraPaymentError> total_extra_payments(std::span<const ExtraPayment> payments) {
    Money total = Money::zero();
    for (const auto& payment : payments) {
        auto sum = total.add(payment.amount());
        if (!sum.has_value()) {
            return reject(ExtraPaymentErrorCode::InvalidAmount, total.euros() + payment.euros());
        }
        total = *sum;
    }
    return total;
}

std::expected<std::vector<ExtraPayment>, ExtraPaymentError>
group_extra_payments_by_month(std::span<const ExtraPayment> payments) {
    std::vector<ExtraPayment> sorted(payments.begin(), payments.end());
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const ExtraPayment& a, const ExtraPayment& b) { return a.month() < b.month(); });

    std::vector<ExtraPayment> grouped;
    grouped.reserve(sorted.size());
    for (const auto& payment : sorted) {
        if (!grouped.empty() && grouped.back().month() == payment.month()) {
            auto combined = combine_extra_payments(grouped.back(), payment);
            if (!combined.has_value()) {
                return std::unexpected(combined.error());
            }
            grouped.back() = *combined;
        } else {
            grouped.push_back(payment);
        }
    }
    return grouped;
}

std::vector<ExtraPayment>
filter_extra_payments_by_year(std::span<const ExtraPayment> payments, std::int64_t year) {
    std::vector<ExtraPayment> result;
    std::copy_if(payments.begin(), payments.end(), std::back_inserter(result),
        [year](const ExtraPayment& p) { return p.month().payment_year() == year; });
    return result;
}

std::string format_extra_payment(const ExtraPayment& payment) {
    return "Sondertilgung: " + format_money(payment.amount()) + " in " +
           format_payment_month(payment.month());
}

} // namespace hypo
