// SPDX-License-Identifier: MIT
/**
 * @file interest_rate.hpp
 * @brief Nominal annual mortgage rate: Percentage narrowed to [0.1, 25.0]
 */

#pragma once

#include <compare>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"
#include "src/value/percentage.hpp"

namespace hypo {

class InterestRate {
public:
    static constexpr double kMinimumPercent = 0.1;
    static constexpr double kMaximumPercent = 25.0;

    /// Any Percentage failure maps to PercentageValidationError, then the
    /// bounds are checked (BelowMinimumRate, AboveMaximumRate)
    [[nodiscard]] static std::expected<InterestRate, InterestRateError> create(double percent);

    /// 0.035 -> 3.5 %
    [[nodiscard]] static std::expected<InterestRate, InterestRateError> from_decimal(double fraction);

    /// Monthly decimal rate -> annual rate (0.035 / 12 -> 3.5 %)
    [[nodiscard]] static std::expected<InterestRate, InterestRateError> from_monthly_rate(double monthly);

    // Reference rates for the German market. These never fail; a throw
    // (std::logic_error) means the constant itself is out of range.
    [[nodiscard]] static InterestRate typical_low();      ///< 1.5 %
    [[nodiscard]] static InterestRate typical_current();  ///< 3.5 %
    [[nodiscard]] static InterestRate typical_high();     ///< 6.0 %
    [[nodiscard]] static InterestRate stress_test();      ///< 10.0 %

    /// Rate in percent (3.5)
    [[nodiscard]] constexpr double value() const noexcept { return rate_.value(); }
    [[nodiscard]] constexpr Percentage to_percentage() const noexcept { return rate_; }
    [[nodiscard]] constexpr double to_decimal() const noexcept { return rate_.to_decimal(); }
    [[nodiscard]] constexpr double to_monthly_rate() const noexcept { return rate_.to_decimal() / 12.0; }

    /// Shift by basis points (100 bp = 1 percentage point)
    [[nodiscard]] std::expected<InterestRate, InterestRateError> add_basis_points(double basis_points) const;

    [[nodiscard]] constexpr int compare(InterestRate other) const noexcept {
        return rate_.compare(other.rate_);
    }

    friend constexpr auto operator<=>(const InterestRate&, const InterestRate&) = default;

private:
    explicit constexpr InterestRate(Percentage rate) noexcept : rate_(rate) {}

    Percentage rate_;
};

/// "3,50 %"
std::string format_interest_rate(InterestRate rate);

} // namespace hypo
