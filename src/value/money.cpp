// SPDX-License-Identifier: MIT
#include "src/value/money.hpp"
#include "src/support/german_format.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>
#include <cmath>

namespace hypo {

namespace {

std::unexpected<MoneyError> reject(MoneyErrorCode code, double value) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_VALUE_TYPES, static_cast<int>(code), value, 0.0);
    return std::unexpected(MoneyError(code, value));
}

// Sub-cent residue tolerated by create_exact (binary rounding of decimal input)
constexpr double kCentResidueTolerance = 1e-6;

}  // namespace

std::expected<Money, MoneyError> Money::create(double euros) {
    if (!std::isfinite(euros)) {
        return reject(MoneyErrorCode::InvalidAmount, euros);
    }
    if (euros < 0.0) {
        return reject(MoneyErrorCode::NegativeAmount, euros);
    }
    const double cents = std::round(euros * 100.0);
    if (cents > static_cast<double>(kMaxCents)) {
        return reject(MoneyErrorCode::ExceedsMaximum, euros);
    }
    return Money{static_cast<std::int64_t>(cents)};
}

std::expected<Money, MoneyError> Money::create_exact(double euros) {
    if (!std::isfinite(euros)) {
        return reject(MoneyErrorCode::InvalidAmount, euros);
    }
    if (euros < 0.0) {
        return reject(MoneyErrorCode::NegativeAmount, euros);
    }
    const double scaled = euros * 100.0;
    if (std::abs(scaled - std::round(scaled)) > kCentResidueTolerance * std::max(1.0, scaled)) {
        return reject(MoneyErrorCode::TooManyDecimals, euros);
    }
    return create(euros);
}

std::expected<Money, MoneyError> Money::from_cents(std::int64_t cents) {
    if (cents < 0) {
        return reject(MoneyErrorCode::NegativeAmount, static_cast<double>(cents) / 100.0);
    }
    if (cents > kMaxCents) {
        return reject(MoneyErrorCode::ExceedsMaximum, static_cast<double>(cents) / 100.0);
    }
    return Money{cents};
}

std::expected<Money, MoneyError> Money::add(Money other) const {
    // Both operands are <= kMaxCents, so the sum cannot overflow int64
    const std::int64_t sum = cents_ + other.cents_;
    if (sum > kMaxCents) {
        return reject(MoneyErrorCode::ExceedsMaximum, static_cast<double>(sum) / 100.0);
    }
    return Money{sum};
}

std::expected<Money, MoneyError> Money::subtract(Money other) const {
    if (other.cents_ > cents_) {
        return reject(MoneyErrorCode::NegativeAmount,
                      static_cast<double>(cents_ - other.cents_) / 100.0);
    }
    return Money{cents_ - other.cents_};
}

std::expected<Money, MoneyError> Money::multiply(double factor) const {
    if (!std::isfinite(factor) || factor < 0.0) {
        return reject(MoneyErrorCode::InvalidAmount, factor);
    }
    const double product = std::round(static_cast<double>(cents_) * factor);
    if (product > static_cast<double>(kMaxCents)) {
        return reject(MoneyErrorCode::ExceedsMaximum, product / 100.0);
    }
    return Money{static_cast<std::int64_t>(product)};
}

std::string format_money(Money money) {
    return format_euro_cents(money.cents());
}

} // namespace hypo
