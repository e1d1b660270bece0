// SPDX-License-Identifier: MIT
/**
 * @file payment_month.hpp
 * @brief 1-based month index within a payment schedule, in [1, 480]
 */

#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"
#include "src/value/positive_integer.hpp"

namespace hypo {

class PaymentMonth {
public:
    static constexpr std::int64_t kMaximumMonth = 480;

    /// Any PositiveInteger failure maps to PositiveIntegerValidationError;
    /// months above 480 give InvalidPaymentMonth
    [[nodiscard]] static std::expected<PaymentMonth, PaymentMonthError> create(double month);

    /// Loan year 1..40 and month 1..12 within it
    [[nodiscard]] static std::expected<PaymentMonth, PaymentMonthError>
    from_year_and_month(int year, int month_in_year);

    [[nodiscard]] constexpr std::int64_t value() const noexcept { return month_.value(); }

    /// Loan year containing this month: ceil(month / 12)
    [[nodiscard]] constexpr std::int64_t payment_year() const noexcept {
        return (month_.value() + 11) / 12;
    }

    /// Position within the loan year, 1..12
    [[nodiscard]] constexpr std::int64_t month_in_year() const noexcept {
        const std::int64_t m = month_.value() % 12;
        return m == 0 ? 12 : m;
    }

    [[nodiscard]] constexpr bool is_first_year() const noexcept { return month_.value() <= 12; }
    [[nodiscard]] constexpr bool is_end_of_year() const noexcept { return month_.value() % 12 == 0; }

    [[nodiscard]] std::expected<PaymentMonth, PaymentMonthError> add_months(std::int64_t months) const;

    [[nodiscard]] constexpr int compare(PaymentMonth other) const noexcept {
        return month_.compare(other.month_);
    }

    friend constexpr auto operator<=>(const PaymentMonth&, const PaymentMonth&) = default;

private:
    explicit constexpr PaymentMonth(PositiveInteger month) noexcept : month_(month) {}

    PositiveInteger month_;
};

/// "Monat 14 (Jahr 2, 2. Monat)"
std::string format_payment_month(PaymentMonth month);

} // namespace hypo
