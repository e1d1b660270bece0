// SPDX-License-Identifier: MIT
/**
 * @file extra_payment.hpp
 * @brief Unscheduled principal payment (Sondertilgung) in a given month
 */

#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "src/support/error_types.hpp"
#include "src/value/money.hpp"
#include "src/value/payment_month.hpp"

namespace hypo {

class ExtraPayment {
public:
    static constexpr double kMinimumEuros = 1.0;
    static constexpr double kMaximumEuros = 1'000'000.0;

    /// Payments of at least this size count as large
    static constexpr double kLargeThresholdEuros = 10'000.0;

    /// Money failure gives InvalidAmount, outside [1, 1,000,000] AmountTooLarge
    [[nodiscard]] static std::expected<ExtraPayment, ExtraPaymentError>
    create(PaymentMonth month, double euros);

    [[nodiscard]] static std::expected<ExtraPayment, ExtraPaymentError>
    from_money(PaymentMonth month, Money amount);

    [[nodiscard]] constexpr PaymentMonth month() const noexcept { return month_; }
    [[nodiscard]] constexpr Money amount() const noexcept { return amount_; }
    [[nodiscard]] constexpr double euros() const noexcept { return amount_.euros(); }

    [[nodiscard]] constexpr bool is_large() const noexcept {
        return amount_.euros() >= kLargeThresholdEuros;
    }
    [[nodiscard]] constexpr bool is_in_first_year() const noexcept { return month_.is_first_year(); }

    friend constexpr bool operator==(const ExtraPayment&, const ExtraPayment&) = default;

private:
    constexpr ExtraPayment(PaymentMonth month, Money amount) noexcept
        : month_(month), amount_(amount) {}

    PaymentMonth month_;
    Money amount_;
};

/// Sum of two payments in the same month; InvalidPaymentMonth otherwise
[[nodiscard]] std::expected<ExtraPayment, ExtraPaymentError>
combine_extra_payments(const ExtraPayment& a, const ExtraPayment& b);

[[nodiscard]] std::expected<Money, ExtraPaymentError>
total_extra_payments(std::span<const ExtraPayment> payments);

/// Sorted by month with same-month payments summed
[[nodiscard]] std::expected<std::vector<ExtraPayment>, ExtraPaymentError>
group_extra_payments_by_month(std::span<const ExtraPayment> payments);

/// Payments whose loan year (ceil(month / 12)) equals year
[[nodiscard]] std::vector<ExtraPayment>
filter_extra_payments_by_year(std::span<const ExtraPayment> payments, std::int64_t year);

/// "Sondertilgung: 5.000,00 € in Monat 12 (Jahr 1, 12. Monat)"
std::string format_extra_payment(const ExtraPayment& payment);

} // namespace hypo
