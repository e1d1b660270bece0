// SPDX-License-Identifier: MIT
/**
 * @file year_count.hpp
 * @brief Loan term in years: PositiveInteger narrowed to [1, 40]
 */

#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <string>

#include "src/support/error_types.hpp"
#include "src/value/positive_integer.hpp"

namespace hypo {

class YearCount {
public:
    static constexpr std::int64_t kMinimumYears = 1;
    static constexpr std::int64_t kMaximumYears = 40;

    /// Same error kinds as MonthCount, over [1, 40]
    [[nodiscard]] static std::expected<YearCount, TermError> create(double years);

    /// round(months / 12)
    [[nodiscard]] static std::expected<YearCount, TermError> from_months(double months);

    [[nodiscard]] static YearCount minimum();
    [[nodiscard]] static YearCount maximum();
    [[nodiscard]] static YearCount short_term();             ///< 5 years
    [[nodiscard]] static YearCount medium_term();            ///< 15 years
    [[nodiscard]] static YearCount long_term();              ///< 25 years
    [[nodiscard]] static YearCount maximum_standard_term();  ///< 30 years

    [[nodiscard]] constexpr std::int64_t value() const noexcept { return years_.value(); }
    [[nodiscard]] constexpr std::int64_t to_months() const noexcept { return years_.value() * 12; }

    [[nodiscard]] std::expected<YearCount, TermError> add_years(std::int64_t years) const;
    [[nodiscard]] std::expected<YearCount, TermError> subtract_years(std::int64_t years) const;

    [[nodiscard]] constexpr int compare(YearCount other) const noexcept {
        return years_.compare(other.years_);
    }

    friend constexpr auto operator<=>(const YearCount&, const YearCount&) = default;

private:
    explicit constexpr YearCount(PositiveInteger years) noexcept : years_(years) {}

    PositiveInteger years_;
};

[[nodiscard]] std::expected<YearCount, TermError> remaining_years(YearCount total, YearCount elapsed);

/// "1 Jahr", "25 Jahre"
std::string format_year_count(YearCount count);

} // namespace hypo
