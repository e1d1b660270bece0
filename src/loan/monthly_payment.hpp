// SPDX-License-Identifier: MIT
/**
 * @file monthly_payment.hpp
 * @brief One installment split into principal and interest
 */

#pragma once

#include <expected>
#include <string>

#include "src/support/error_types.hpp"
#include "src/value/money.hpp"

namespace hypo {

class MonthlyPayment {
public:
    /// Largest tolerated |principal + interest - total| in euros
    static constexpr double kConsistencyTolerance = 0.01;

    /// Share above which one component dominates the installment
    static constexpr double kHeavyShare = 0.6;

    [[nodiscard]] static std::expected<MonthlyPayment, MonthlyPaymentError>
    create(double principal, double interest, double total);

    /// Total is principal + interest
    [[nodiscard]] static std::expected<MonthlyPayment, MonthlyPaymentError>
    from_components(double principal, double interest);

    [[nodiscard]] constexpr Money principal() const noexcept { return principal_; }
    [[nodiscard]] constexpr Money interest() const noexcept { return interest_; }
    [[nodiscard]] constexpr Money total() const noexcept { return total_; }

    /// Fractions of the total in [0, 1]; 0 for a zero installment
    [[nodiscard]] double principal_ratio() const noexcept;
    [[nodiscard]] double interest_ratio() const noexcept;

    [[nodiscard]] double principal_percentage() const noexcept { return principal_ratio() * 100.0; }
    [[nodiscard]] double interest_percentage() const noexcept { return interest_ratio() * 100.0; }

    [[nodiscard]] bool is_principal_heavy() const noexcept { return principal_ratio() > kHeavyShare; }
    [[nodiscard]] bool is_interest_heavy() const noexcept { return interest_ratio() > kHeavyShare; }

    friend constexpr bool operator==(const MonthlyPayment&, const MonthlyPayment&) = default;

private:
    constexpr MonthlyPayment(Money principal, Money interest, Money total) noexcept
        : principal_(principal), interest_(interest), total_(total) {}

    Money principal_;
    Money interest_;
    Money total_;
};

/// "Monatliche Rate: 1.501,87 € (Tilgung: 626,87 €, Zinsen: 875,00 €)"
std::string format_monthly_payment(const MonthlyPayment& payment);

} // namespace hypo
