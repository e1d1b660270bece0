// SPDX-License-Identifier: MIT
#include "src/value/month_count.hpp"
#include "src/support/hypo_trace.h"

#include <cmath>
#include <stdexcept>

namespace hypo {

namespace {

MonthCount make_constant(double months) {
    auto count = MonthCount::create(months);
    if (!count.has_value()) {
        throw std::logic_error("MonthCount constant out of range: " + std::to_string(months));
    }
    return *count;
}

std::string pluralize(std::int64_t n, const char* singular, const char* plural) {
    return std::to_string(n) + " " + (n == 1 ? singular : plural);
}

}  // namespace

std::expected<MonthCount, TermError> MonthCount::create(double months) {
    auto value = PositiveInteger::create(months);
    if (!value.has_value()) {
        return std::unexpected(TermError(TermErrorCode::PositiveIntegerValidationError, months));
    }
    if (value->value() < kMinimumMonths) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(TermErrorCode::BelowMinimumTerm), months, kMinimumMonths);
        return std::unexpected(TermError(TermErrorCode::BelowMinimumTerm, months));
    }
    if (value->value() > kMaximumMonths) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(TermErrorCode::AboveMaximumTerm), months, kMaximumMonths);
        return std::unexpected(TermError(TermErrorCode::AboveMaximumTerm, months));
    }
    return MonthCount{*value};
}

std::expected<MonthCount, TermError> MonthCount::from_years(double years) {
    return create(std::round(years * 12.0));
}

MonthCount MonthCount::minimum() { return make_constant(kMinimumMonths); }
MonthCount MonthCount::maximum() { return make_constant(kMaximumMonths); }
MonthCount MonthCount::short_term() { return make_constant(60); }
MonthCount MonthCount::medium_term() { return make_constant(180); }
MonthCount MonthCount::long_term() { return make_constant(300); }
MonthCount MonthCount::maximum_standard_term() { return make_constant(360); }

std::expected<MonthCount, TermError> MonthCount::add_months(std::int64_t months) const {
    return create(static_cast<double>(value() + months));
}

std::expected<MonthCount, TermError> MonthCount::subtract_months(std::int64_t months) const {
    return create(static_cast<double>(value() - months));
}

std::expected<MonthCount, TermError> remaining_months(MonthCount total, MonthCount elapsed) {
    return total.subtract_months(elapsed.value());
}

bool is_valid_term_range(double months) {
    return months >= MonthCount::kMinimumMonths &&
           months <= MonthCount::kMaximumMonths &&
           std::trunc(months) == months;
}

std::string format_month_count(MonthCount count) {
    const std::int64_t months = count.value();
    const std::int64_t years = months / 12;
    const std::int64_t rest = months % 12;

    if (months < 12) {
        return pluralize(months, "Monat", "Monate");
    }
    if (rest == 0) {
        return pluralize(years, "Jahr", "Jahre");
    }
    return pluralize(years, "Jahr", "Jahre") + " " + pluralize(rest, "Monat", "Monate");
}

} // namespace hypo
