// SPDX-License-Identifier: MIT
/**
 * @file german_format.hpp
 * @brief Locale-fixed German number, currency and date formatting
 *
 * Output matches the de-DE conventions used by German banks: '.' groups
 * thousands, ',' separates decimals, and the unit follows after a space
 * ("1.234,56 €", "3,50 %"). Formatting never consults the process locale.
 */

#pragma once

#include <cstdint>
#include <string>

#include "src/support/calendar.hpp"

namespace hypo {

/// Format an integer with '.' thousands grouping ("1.234.567")
std::string format_grouped_integer(std::int64_t value);

/// Format a number with grouping and a fixed number of decimals ("1.234,50")
///
/// Rounds half away from zero. `decimals` is clamped to [0, 9].
std::string format_grouped_decimal(double value, int decimals);

/// Format integer cents as euros ("1.234,56 €")
std::string format_euro_cents(std::int64_t cents);

/// Format a value already expressed in percent ("3,50 %")
std::string format_percent_value(double percent, int decimals);

/// Abbreviated German month and year ("Jan. 2031", "Mai 2031")
std::string format_month_year(const Date& date);

} // namespace hypo
