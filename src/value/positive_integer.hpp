// SPDX-License-Identifier: MIT
/**
 * @file positive_integer.hpp
 * @brief Strictly positive whole number, base of the month and year counts
 */

#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"

namespace hypo {

class PositiveInteger {
public:
    /// Checks, in order: finite (InvalidValue), > 0 (NotPositive),
    /// whole (NotInteger)
    [[nodiscard]] static std::expected<PositiveInteger, PositiveIntegerError> create(double value);

    static constexpr PositiveInteger one() noexcept { return PositiveInteger{1}; }
    static constexpr PositiveInteger twelve() noexcept { return PositiveInteger{12}; }

    [[nodiscard]] constexpr std::int64_t value() const noexcept { return value_; }

    /// Largest value `create` accepts (2^53)
    static constexpr std::int64_t kMaxValue = std::int64_t{1} << 53;

    /// Fails with Overflow when the sum exceeds kMaxValue
    [[nodiscard]] std::expected<PositiveInteger, PositiveIntegerError> add(PositiveInteger other) const;

    /// Fails with Overflow when the product exceeds kMaxValue
    [[nodiscard]] std::expected<PositiveInteger, PositiveIntegerError> multiply(PositiveInteger other) const;

    /// Fails with NotPositive when other >= *this
    [[nodiscard]] std::expected<PositiveInteger, PositiveIntegerError> subtract(PositiveInteger other) const;

    /// Floor division; fails with NotPositive when the quotient is 0
    [[nodiscard]] std::expected<PositiveInteger, PositiveIntegerError> divide(PositiveInteger other) const;

    [[nodiscard]] constexpr int compare(PositiveInteger other) const noexcept {
        return value_ < other.value_ ? -1 : (value_ > other.value_ ? 1 : 0);
    }

    friend constexpr auto operator<=>(const PositiveInteger&, const PositiveInteger&) = default;

private:
    explicit constexpr PositiveInteger(std::int64_t value) noexcept : value_(value) {}

    std::int64_t value_;
};

/// German grouping: "1.234"
std::string format_positive_integer(PositiveInteger value);

} // namespace hypo
