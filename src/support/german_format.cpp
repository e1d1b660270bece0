// SPDX-License-Identifier: MIT
#include "src/support/german_format.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string_view>

namespace hypo {

namespace {

constexpr std::array<std::int64_t, 10> kPowersOfTen = {
    1, 10, 100, 1'000, 10'000, 100'000, 1'000'000,
    10'000'000, 100'000'000, 1'000'000'000};

// Digits of a non-negative integer with '.' inserted every three places
std::string group_digits(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string grouped;
    grouped.reserve(digits.size() + digits.size() / 3);
    const size_t lead = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i + 3 - lead) % 3 == 0) {
            grouped.push_back('.');
        }
        grouped.push_back(digits[i]);
    }
    return grouped;
}

// Integer and fractional parts of a scaled magnitude, joined with ','
std::string join_scaled(bool negative, std::uint64_t scaled, int decimals) {
    const auto scale = static_cast<std::uint64_t>(kPowersOfTen[decimals]);
    std::string out = negative ? "-" : "";
    out += group_digits(scaled / scale);
    if (decimals > 0) {
        std::string frac = std::to_string(scaled % scale);
        out.push_back(',');
        out.append(static_cast<size_t>(decimals) - frac.size(), '0');
        out += frac;
    }
    return out;
}

}  // namespace

std::string format_grouped_integer(std::int64_t value) {
    const bool negative = value < 0;
    const std::uint64_t magnitude = negative
        ? static_cast<std::uint64_t>(-(value + 1)) + 1
        : static_cast<std::uint64_t>(value);
    return (negative ? "-" : "") + group_digits(magnitude);
}

std::string format_grouped_decimal(double value, int decimals) {
    decimals = std::clamp(decimals, 0, 9);
    if (!std::isfinite(value)) {
        return std::isnan(value) ? "NaN" : (value < 0 ? "-∞" : "∞");
    }
    const double scaled = std::round(std::abs(value) * static_cast<double>(kPowersOfTen[decimals]));
    const auto magnitude = static_cast<std::uint64_t>(scaled);
    // "-0,00" is printed as "0,00"
    return join_scaled(value < 0 && magnitude != 0, magnitude, decimals);
}

std::string format_euro_cents(std::int64_t cents) {
    const bool negative = cents < 0;
    const std::uint64_t magnitude = negative
        ? static_cast<std::uint64_t>(-(cents + 1)) + 1
        : static_cast<std::uint64_t>(cents);
    return join_scaled(negative, magnitude, 2) + " €";
}

std::string format_percent_value(double percent, int decimals) {
    return format_grouped_decimal(percent, decimals) + " %";
}

std::string format_month_year(const Date& date) {
    static constexpr std::array<std::string_view, 12> kMonths = {
        "Jan.", "Feb.", "März", "Apr.", "Mai", "Juni",
        "Juli", "Aug.", "Sept.", "Okt.", "Nov.", "Dez."};
    const unsigned month = static_cast<unsigned>(date.month());
    std::string out{kMonths[(month == 0 ? 1 : std::min(month, 12u)) - 1]};
    out.push_back(' ');
    out += std::to_string(static_cast<int>(date.year()));
    return out;
}

} // namespace hypo
