// SPDX-License-Identifier: MIT
/**
 * @file fixed_rate_period.hpp
 * @brief Zinsbindung: the span during which the contract rate is fixed
 */

#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "src/support/calendar.hpp"
#include "src/support/error_types.hpp"
#include "src/value/interest_rate.hpp"
#include "src/value/year_count.hpp"

namespace hypo {

enum class FixedRateType {
    Fixed,         ///< Festzins for the whole loan
    InitialFixed,  ///< Zinsbindung, renegotiated afterwards
    CapFixed       ///< Zinsobergrenze
};

/// "Festzins", "Zinsbindung", "Zinsobergrenze"
std::string_view to_label(FixedRateType type);

class FixedRatePeriod {
public:
    /// PeriodTooShort below 1 year, PeriodTooLong above 40,
    /// InvalidPeriodLength for a non-integer length, InvalidInterestRate
    /// when the rate is outside the InterestRate range
    [[nodiscard]] static std::expected<FixedRatePeriod, FixedRatePeriodError>
    create(double years, double rate_percent, FixedRateType type, Date start_date);

    [[nodiscard]] constexpr YearCount period_years() const noexcept { return years_; }
    [[nodiscard]] constexpr InterestRate initial_rate() const noexcept { return rate_; }
    [[nodiscard]] constexpr FixedRateType type() const noexcept { return type_; }
    [[nodiscard]] constexpr Date start_date() const noexcept { return start_; }

    /// start + years
    [[nodiscard]] Date end_date() const;

    /// start <= on < end
    [[nodiscard]] bool is_active(Date on) const;

    /// Days left / 365.25, rounded to 2 decimals; 0 when not active
    [[nodiscard]] double remaining_years(Date on) const;

    /// 5, 10, 15, 20, 25 or 30 years
    [[nodiscard]] bool is_typical_period() const noexcept;

    /// Signed day count until end_date()
    [[nodiscard]] long days_until_expiry(Date on) const;

    /// Ends within `months` (30-day months) and has not ended yet
    [[nodiscard]] bool is_expiring_soon(Date on, int months = 12) const;

    friend constexpr bool operator==(const FixedRatePeriod&, const FixedRatePeriod&) = default;

private:
    constexpr FixedRatePeriod(YearCount years, InterestRate rate, FixedRateType type,
                              Date start) noexcept
        : years_(years), rate_(rate), type_(type), start_(start) {}

    YearCount years_;
    InterestRate rate_;
    FixedRateType type_;
    Date start_;
};

/// "10 Jahre Zinsbindung @ 3,50 %"
std::string format_fixed_rate_period(const FixedRatePeriod& period);

} // namespace hypo
