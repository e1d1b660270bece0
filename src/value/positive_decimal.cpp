// SPDX-License-Identifier: MIT
#include "src/value/positive_decimal.hpp"
#include "src/support/german_format.hpp"
#include "src/support/hypo_trace.h"

#include <cmath>

namespace hypo {

std::expected<PositiveDecimal, PositiveDecimalError> PositiveDecimal::create(double value) {
    if (!std::isfinite(value)) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(PositiveDecimalErrorCode::InvalidValue), value, 0.0);
        return std::unexpected(PositiveDecimalError(PositiveDecimalErrorCode::InvalidValue, value));
    }
    if (value <= 0.0) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(PositiveDecimalErrorCode::NotPositive), value, 0.0);
        return std::unexpected(PositiveDecimalError(PositiveDecimalErrorCode::NotPositive, value));
    }
    return PositiveDecimal{value};
}

std::expected<PositiveDecimal, PositiveDecimalError>
PositiveDecimal::add(PositiveDecimal other) const {
    return create(value_ + other.value_);
}

std::expected<PositiveDecimal, PositiveDecimalError>
PositiveDecimal::multiply(PositiveDecimal other) const {
    return create(value_ * other.value_);
}

std::expected<PositiveDecimal, PositiveDecimalError>
PositiveDecimal::divide(PositiveDecimal other) const {
    return create(value_ / other.value_);
}

std::expected<PositiveDecimal, PositiveDecimalError>
PositiveDecimal::subtract(PositiveDecimal other) const {
    return create(value_ - other.value_);
}

std::expected<PositiveDecimal, PositiveDecimalError>
PositiveDecimal::multiply_by_factor(double factor) const {
    if (!std::isfinite(factor) || factor <= 0.0) {
        return std::unexpected(PositiveDecimalError(PositiveDecimalErrorCode::InvalidValue, factor));
    }
    return create(value_ * factor);
}

std::expected<PositiveDecimal, PositiveDecimalError> PositiveDecimal::round(int places) const {
    const double scale = std::pow(10.0, places);
    return create(std::round(value_ * scale) / scale);
}

bool PositiveDecimal::is_equal(PositiveDecimal other, double epsilon) const noexcept {
    return std::abs(value_ - other.value_) < epsilon;
}

std::string format_positive_decimal(PositiveDecimal value, int decimals) {
    return format_grouped_decimal(value.value(), decimals);
}

} // namespace hypo
