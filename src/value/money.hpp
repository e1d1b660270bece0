// SPDX-License-Identifier: MIT
/**
 * @file money.hpp
 * @brief Non-negative euro amount with cent precision
 */

#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"

namespace hypo {

/**
 * @brief Euro amount in [0, 999.999.999,00], stored as integer cents
 *
 * Created only through the validating factories. Arithmetic that can leave
 * the valid range returns std::expected; comparisons are exact on cents.
 */
class Money {
public:
    /// Largest representable amount in cents (999.999.999,00 €)
    static constexpr std::int64_t kMaxCents = 99'999'999'900;

    /// Create from euros, rounding to the nearest cent
    ///
    /// Checks, in order: finite (InvalidAmount), non-negative
    /// (NegativeAmount), at most kMaxCents (ExceedsMaximum).
    [[nodiscard]] static std::expected<Money, MoneyError> create(double euros);

    /// Create from euros, rejecting sub-cent precision (TooManyDecimals)
    [[nodiscard]] static std::expected<Money, MoneyError> create_exact(double euros);

    /// Create from integer cents
    [[nodiscard]] static std::expected<Money, MoneyError> from_cents(std::int64_t cents);

    static constexpr Money zero() noexcept { return Money{0}; }

    [[nodiscard]] constexpr std::int64_t cents() const noexcept { return cents_; }
    [[nodiscard]] constexpr double euros() const noexcept {
        return static_cast<double>(cents_) / 100.0;
    }
    [[nodiscard]] constexpr bool is_zero() const noexcept { return cents_ == 0; }

    /// Sum; fails with ExceedsMaximum
    [[nodiscard]] std::expected<Money, MoneyError> add(Money other) const;

    /// Difference; fails with NegativeAmount when other > *this
    [[nodiscard]] std::expected<Money, MoneyError> subtract(Money other) const;

    /// Scale by a non-negative finite factor, rounding to cents
    [[nodiscard]] std::expected<Money, MoneyError> multiply(double factor) const;

    /// -1, 0 or 1
    [[nodiscard]] constexpr int compare(Money other) const noexcept {
        return cents_ < other.cents_ ? -1 : (cents_ > other.cents_ ? 1 : 0);
    }

    friend constexpr auto operator<=>(const Money&, const Money&) = default;

private:
    explicit constexpr Money(std::int64_t cents) noexcept : cents_(cents) {}

    std::int64_t cents_;
};

/// German currency format: "1.234,56 €"
std::string format_money(Money money);

} // namespace hypo
