// SPDX-License-Identifier: MIT
/**
 * @file loan_amount.hpp
 * @brief Mortgage principal: Money narrowed to [1.000 €, 10.000.000 €]
 */

#pragma once

#include <compare>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"
#include "src/value/money.hpp"

namespace hypo {

class LoanAmount {
public:
    static constexpr double kMinimumEuros = 1'000.0;
    static constexpr double kMaximumEuros = 10'000'000.0;

    /// Any Money failure maps to MoneyValidationError, then the bounds are
    /// checked (BelowMinimum, AboveMaximum)
    [[nodiscard]] static std::expected<LoanAmount, LoanAmountError> create(double euros);

    /// Narrow an existing Money value
    [[nodiscard]] static std::expected<LoanAmount, LoanAmountError> from_money(Money money);

    [[nodiscard]] static LoanAmount minimum();
    [[nodiscard]] static LoanAmount maximum();

    [[nodiscard]] constexpr Money to_money() const noexcept { return money_; }
    [[nodiscard]] constexpr double euros() const noexcept { return money_.euros(); }

    [[nodiscard]] constexpr int compare(LoanAmount other) const noexcept {
        return money_.compare(other.money_);
    }

    friend constexpr auto operator<=>(const LoanAmount&, const LoanAmount&) = default;

private:
    explicit constexpr LoanAmount(Money money) noexcept : money_(money) {}

    Money money_;
};

/// Same format as Money: "300.000,00 €"
std::string format_loan_amount(LoanAmount amount);

} // namespace hypo
