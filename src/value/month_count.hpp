// SPDX-License-Identifier: MIT
/**
 * @file month_count.hpp
 * @brief Loan term in months: PositiveInteger narrowed to [1, 480]
 */

#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"
#include "src/value/positive_integer.hpp"

namespace hypo {

class MonthCount {
public:
    static constexpr std::int64_t kMinimumMonths = 1;
    static constexpr std::int64_t kMaximumMonths = 480;

    /// Any PositiveInteger failure maps to PositiveIntegerValidationError,
    /// then the bounds are checked (BelowMinimumTerm, AboveMaximumTerm)
    [[nodiscard]] static std::expected<MonthCount, TermError> create(double months);

    /// round(years * 12)
    [[nodiscard]] static std::expected<MonthCount, TermError> from_years(double years);

    [[nodiscard]] static MonthCount minimum();
    [[nodiscard]] static MonthCount maximum();
    [[nodiscard]] static MonthCount short_term();             ///< 60 months
    [[nodiscard]] static MonthCount medium_term();            ///< 180 months
    [[nodiscard]] static MonthCount long_term();              ///< 300 months
    [[nodiscard]] static MonthCount maximum_standard_term();  ///< 360 months

    [[nodiscard]] constexpr std::int64_t value() const noexcept { return months_.value(); }
    [[nodiscard]] constexpr PositiveInteger to_positive_integer() const noexcept { return months_; }
    [[nodiscard]] constexpr double to_years() const noexcept {
        return static_cast<double>(months_.value()) / 12.0;
    }

    [[nodiscard]] std::expected<MonthCount, TermError> add_months(std::int64_t months) const;
    [[nodiscard]] std::expected<MonthCount, TermError> subtract_months(std::int64_t months) const;

    [[nodiscard]] constexpr int compare(MonthCount other) const noexcept {
        return months_.compare(other.months_);
    }

    friend constexpr auto operator<=>(const MonthCount&, const MonthCount&) = default;

private:
    explicit constexpr MonthCount(PositiveInteger months) noexcept : months_(months) {}

    PositiveInteger months_;
};

/// total - elapsed; fails when nothing remains
[[nodiscard]] std::expected<MonthCount, TermError> remaining_months(MonthCount total, MonthCount elapsed);

/// Whether `months` is a whole number inside [1, 480]
[[nodiscard]] bool is_valid_term_range(double months);

/// "7 Monate", "25 Jahre", "1 Jahr 6 Monate"
std::string format_month_count(MonthCount count);

} // namespace hypo
