// SPDX-License-Identifier: MIT
#include "src/value/interest_rate.hpp"
#include "src/support/hypo_trace.h"

#include <stdexcept>

namespace hypo {

namespace {

InterestRate make_constant(double percent) {
    auto rate = InterestRate::create(percent);
    if (!rate.has_value()) {
        throw std::logic_error("InterestRate constant out of range: " + std::to_string(percent));
    }
    return *rate;
}

}  // namespace

std::expected<InterestRate, InterestRateError> InterestRate::create(double percent) {
    auto rate = Percentage::create(percent);
    if (!rate.has_value()) {
        return std::unexpected(
            InterestRateError(InterestRateErrorCode::PercentageValidationError, percent));
    }
    if (percent < kMinimumPercent) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(InterestRateErrorCode::BelowMinimumRate), percent, kMinimumPercent);
        return std::unexpected(InterestRateError(InterestRateErrorCode::BelowMinimumRate, percent));
    }
    if (percent > kMaximumPercent) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(InterestRateErrorCode::AboveMaximumRate), percent, kMaximumPercent);
        return std::unexpected(InterestRateError(InterestRateErrorCode::AboveMaximumRate, percent));
    }
    return InterestRate{*rate};
}

std::expected<InterestRate, InterestRateError> InterestRate::from_decimal(double fraction) {
    return create(fraction * 100.0);
}

std::expected<InterestRate, InterestRateError> InterestRate::from_monthly_rate(double monthly) {
    return create(monthly * 12.0 * 100.0);
}

InterestRate InterestRate::typical_low() {
    static const InterestRate rate = make_constant(1.5);
    return rate;
}

InterestRate InterestRate::typical_current() {
    static const InterestRate rate = make_constant(3.5);
    return rate;
}

InterestRate InterestRate::typical_high() {
    static const InterestRate rate = make_constant(6.0);
    return rate;
}

InterestRate InterestRate::stress_test() {
    static const InterestRate rate = make_constant(10.0);
    return rate;
}

std::expected<InterestRate, InterestRateError>
InterestRate::add_basis_points(double basis_points) const {
    return create(value() + basis_points / 100.0);
}

std::string format_interest_rate(InterestRate rate) {
    return format_percentage(rate.to_percentage(), 2);
}

} // namespace hypo
