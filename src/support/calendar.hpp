// SPDX-License-Identifier: MIT
/**
 * @file calendar.hpp
 * @brief Calendar-date helpers for loan start dates, valuations and rate periods
 */

#pragma once

#include <chrono>

namespace hypo {

/// Calendar date without time of day
using Date = std::chrono::year_month_day;

/// Today's date in UTC
inline Date today() {
    return Date{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

/// Build a date from numeric components
inline constexpr Date make_date(int year, unsigned month, unsigned day) {
    return Date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
}

/// Whole calendar months from `from` to `to`, ignoring the day of month
///
/// Negative when `to` lies in an earlier month than `from`.
inline constexpr int months_between(const Date& from, const Date& to) {
    const int years = static_cast<int>(to.year()) - static_cast<int>(from.year());
    const int months = static_cast<int>(static_cast<unsigned>(to.month())) -
                       static_cast<int>(static_cast<unsigned>(from.month()));
    return years * 12 + months;
}

/// Signed number of days from `from` to `to`
inline constexpr long days_between(const Date& from, const Date& to) {
    return (std::chrono::sys_days{to} - std::chrono::sys_days{from}).count();
}

/// Shift by whole months; the day is clamped to the target month's length
inline constexpr Date add_months(const Date& date, int months) {
    const std::chrono::year_month shifted =
        std::chrono::year_month{date.year(), date.month()} + std::chrono::months{months};
    const std::chrono::day last = std::chrono::year_month_day_last{
        shifted.year(), std::chrono::month_day_last{shifted.month()}}.day();
    return Date{shifted.year(), shifted.month(), date.day() > last ? last : date.day()};
}

/// Shift by whole years (29 February clamps to 28 February)
inline constexpr Date add_years(const Date& date, int years) {
    return add_months(date, years * 12);
}

/// True for the last calendar day of the month
inline constexpr bool is_last_day_of_month(const Date& date) {
    return date.day() == std::chrono::year_month_day_last{
        date.year(), std::chrono::month_day_last{date.month()}}.day();
}

} // namespace hypo
