// SPDX-License-Identifier: MIT
/**
 * @file positive_decimal.hpp
 * @brief Strictly positive real number
 */

#pragma once

#include <compare>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"

namespace hypo {

class PositiveDecimal {
public:
    /// Checks, in order: finite (InvalidValue), > 0 (NotPositive)
    [[nodiscard]] static std::expected<PositiveDecimal, PositiveDecimalError> create(double value);

    [[nodiscard]] constexpr double value() const noexcept { return value_; }

    /// Results go through `create`: overflow to infinity fails with
    /// InvalidValue, underflow to 0 with NotPositive
    [[nodiscard]] std::expected<PositiveDecimal, PositiveDecimalError> add(PositiveDecimal other) const;
    [[nodiscard]] std::expected<PositiveDecimal, PositiveDecimalError> multiply(PositiveDecimal other) const;
    [[nodiscard]] std::expected<PositiveDecimal, PositiveDecimalError> divide(PositiveDecimal other) const;

    /// Fails with NotPositive when other >= *this
    [[nodiscard]] std::expected<PositiveDecimal, PositiveDecimalError> subtract(PositiveDecimal other) const;

    /// Scale by a raw factor; fails with InvalidValue for non-finite or
    /// non-positive factors
    [[nodiscard]] std::expected<PositiveDecimal, PositiveDecimalError> multiply_by_factor(double factor) const;

    /// Round half away from zero; fails when the result rounds to 0
    [[nodiscard]] std::expected<PositiveDecimal, PositiveDecimalError> round(int places) const;

    [[nodiscard]] bool is_equal(PositiveDecimal other, double epsilon = 1e-10) const noexcept;

    [[nodiscard]] constexpr int compare(PositiveDecimal other) const noexcept {
        return value_ < other.value_ ? -1 : (value_ > other.value_ ? 1 : 0);
    }

    friend constexpr auto operator<=>(const PositiveDecimal&, const PositiveDecimal&) = default;

private:
    explicit constexpr PositiveDecimal(double value) noexcept : value_(value) {}

    double value_;
};

std::string format_positive_decimal(PositiveDecimal value, int decimals = 2);

} // namespace hypo
