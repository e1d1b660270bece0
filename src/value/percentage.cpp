// SPDX-License-Identifier: MIT
#include "src/value/percentage.hpp"
#include "src/support/german_format.hpp"
#include "src/support/hypo_trace.h"

#include <cmath>

namespace hypo {

namespace {

constexpr double kEqualityTolerance = 0.001;

}  // namespace

std::expected<Percentage, PercentageError> Percentage::create(double value) {
    if (!std::isfinite(value)) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(PercentageErrorCode::InvalidValue), value, 0.0);
        return std::unexpected(PercentageError(PercentageErrorCode::InvalidValue, value));
    }
    if (value < 0.0 || value > 100.0) {
        HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES,
            static_cast<int>(PercentageErrorCode::OutOfRange), value, 100.0);
        return std::unexpected(PercentageError(PercentageErrorCode::OutOfRange, value));
    }
    return Percentage{value};
}

std::expected<Percentage, PercentageError> Percentage::from_decimal(double fraction) {
    return create(fraction * 100.0);
}

std::expected<Percentage, PercentageError> Percentage::add(Percentage other) const {
    return create(value_ + other.value_);
}

std::expected<Percentage, PercentageError> Percentage::subtract(Percentage other) const {
    return create(value_ - other.value_);
}

std::expected<Percentage, PercentageError> Percentage::multiply(double factor) const {
    return create(value_ * factor);
}

bool Percentage::equals(Percentage other) const noexcept {
    return std::abs(value_ - other.value_) < kEqualityTolerance;
}

std::string format_percentage(Percentage percentage, int decimals) {
    return format_percent_value(percentage.value(), decimals);
}

} // namespace hypo
