// SPDX-License-Identifier: MIT
/**
 * @file percentage.hpp
 * @brief Percentage value in [0, 100]
 */

#pragma once

#include <compare>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"

namespace hypo {

/// Percentage expressed in percent units (3.5 means 3.5 %)
class Percentage {
public:
    /// Checks, in order: finite (InvalidValue), within [0, 100] (OutOfRange)
    [[nodiscard]] static std::expected<Percentage, PercentageError> create(double value);

    /// Create from a decimal fraction (0.035 -> 3.5 %)
    [[nodiscard]] static std::expected<Percentage, PercentageError> from_decimal(double fraction);

    static constexpr Percentage zero() noexcept { return Percentage{0.0}; }

    [[nodiscard]] constexpr double value() const noexcept { return value_; }
    [[nodiscard]] constexpr double to_decimal() const noexcept { return value_ / 100.0; }

    [[nodiscard]] std::expected<Percentage, PercentageError> add(Percentage other) const;
    [[nodiscard]] std::expected<Percentage, PercentageError> subtract(Percentage other) const;
    [[nodiscard]] std::expected<Percentage, PercentageError> multiply(double factor) const;

    [[nodiscard]] constexpr int compare(Percentage other) const noexcept {
        return value_ < other.value_ ? -1 : (value_ > other.value_ ? 1 : 0);
    }

    /// Equal within 0.001 percentage points
    [[nodiscard]] bool equals(Percentage other) const noexcept;

    friend constexpr auto operator<=>(const Percentage&, const Percentage&) = default;

private:
    explicit constexpr Percentage(double value) noexcept : value_(value) {}

    double value_;
};

/// German percent format: "3,50 %"
std::string format_percentage(Percentage percentage, int decimals = 2);

} // namespace hypo
