// SPDX-License-Identifier: MIT
#include "src/value/positive_integer.hpp"
#include "src/support/german_format.hpp"
#include "src/support/hypo_trace.h"

#include <cmath>

namespace hypo {

namespace {

std::unexpected<PositiveIntegerError> reject(PositiveIntegerErrorCode code, double value) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES, static_cast<int>(code), value, 0.0);
    return std::unexpected(PositiveIntegerError(code, value));
}

}  // namespace

std::expected<PositiveInteger, PositiveIntegerError> PositiveInteger::create(double value) {
    if (!std::isfinite(value)) {
        return reject(PositiveIntegerErrorCode::InvalidValue, value);
    }
    if (value <= 0.0) {
        return reject(PositiveIntegerErrorCode::NotPositive, value);
    }
    if (std::trunc(value) != value) {
        return reject(PositiveIntegerErrorCode::NotInteger, value);
    }
    // 2^53 is the largest range where every integer is exactly representable
    if (value > static_cast<double>(kMaxValue)) {
        return reject(PositiveIntegerErrorCode::InvalidValue, value);
    }
    return PositiveInteger{static_cast<std::int64_t>(value)};
}

std::expected<PositiveInteger, PositiveIntegerError>
PositiveInteger::add(PositiveInteger other) const {
    // Both operands are at most 2^53, so the sum fits in int64_t
    const std::int64_t sum = value_ + other.value_;
    if (sum > kMaxValue) {
        return reject(PositiveIntegerErrorCode::Overflow, static_cast<double>(sum));
    }
    return PositiveInteger{sum};
}

std::expected<PositiveInteger, PositiveIntegerError>
PositiveInteger::multiply(PositiveInteger other) const {
    if (value_ > kMaxValue / other.value_) {
        return reject(PositiveIntegerErrorCode::Overflow,
                      static_cast<double>(value_) * static_cast<double>(other.value_));
    }
    return PositiveInteger{value_ * other.value_};
}

std::expected<PositiveInteger, PositiveIntegerError>
PositiveInteger::subtract(PositiveInteger other) const {
    const std::int64_t difference = value_ - other.value_;
    if (difference <= 0) {
        return reject(PositiveIntegerErrorCode::NotPositive, static_cast<double>(difference));
    }
    return PositiveInteger{difference};
}

std::expected<PositiveInteger, PositiveIntegerError>
PositiveInteger::divide(PositiveInteger other) const {
    const std::int64_t quotient = value_ / other.value_;
    if (quotient <= 0) {
        return reject(PositiveIntegerErrorCode::NotPositive, static_cast<double>(quotient));
    }
    return PositiveInteger{quotient};
}

std::string format_positive_integer(PositiveInteger value) {
    return format_grouped_integer(value.value());
}

} // namespace hypo
