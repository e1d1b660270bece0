// SPDX-License-Identifier: MIT
#include "src/value/year_count.hpp"
#include "src/support/hypo_trace.h"

#include <cmath>
#include <stdexcept>

namespace hypo {

namespace {

YearCount make_constant(double years) {
    auto count = YearCount::create(years);
    if (!count.has_value()) {
        throw std::logic_error("YearCount constant out of range: " + std::to_string(years));
    }
    return *count;
}

}  // namespace

std::expected<YearCount, TermError> YearCount::create(double years) {
    auto value = PositiveInteger::create(years);
    if (!value.has_value()) {
        return std::unexpected(TermError(TermErrorCode::PositiveIntegerValidationError, years));
    }
    if (value->value() < kMinimumYears) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(TermErrorCode::BelowMinimumTerm), years, kMinimumYears);
        return std::unexpected(TermError(TermErrorCode::BelowMinimumTerm, years));
    }
    if (value->value() > kMaximumYears) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(TermErrorCode::AboveMaximumTerm), years, kMaximumYears);
        return std::unexpected(TermError(TermErrorCode::AboveMaximumTerm, years));
    }
    return YearCount{*value};
}

std::expected<YearCount, TermError> YearCount::from_months(double months) {
    return create(std::round(months / 12.0));
}

YearCount YearCount::minimum() { return make_constant(kMinimumYears); }
YearCount YearCount::maximum() { return make_constant(kMaximumYears); }
YearCount YearCount::short_term() { return make_constant(5); }
YearCount YearCount::medium_term() { return make_constant(15); }
YearCount YearCount::long_term() { return make_constant(25); }
YearCount YearCount::maximum_standard_term() { return make_constant(30); }

std::expected<YearCount, TermError> YearCount::add_years(std::int64_t years) const {
    return create(static_cast<double>(value() + years));
}

std::expected<YearCount, TermError> YearCount::subtract_years(std::int64_t years) const {
    return create(static_cast<double>(value() - years));
}

std::expected<YearCount, TermError> remaining_years(YearCount total, YearCount elapsed) {
    return total.subtract_years(elapsed.value());
}

std::string format_year_count(YearCount count) {
    return count.value() == 1 ? "1 Jahr" : std::to_string(count.value()) + " Jahre";
}

} // namespace hypo
