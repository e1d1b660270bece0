// SPDX-License-Identifier: MIT
/**
 * @file sondertilgung_engine.hpp
 * @brief Validation, fees and strategy for extra payments under bank rules
 *
 * A payment is checked against the amount bounds, the yearly percentage
 * cap (largest allowed tier of the original loan amount per loan year),
 * and, when the caller supplies the dates, against the grace period,
 * blackout windows, payment-date restriction and notice period.
 */

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "src/loan/extra_payment.hpp"
#include "src/loan/fixed_rate_period.hpp"
#include "src/sondertilgung/sondertilgung_rules.hpp"
#include "src/support/calendar.hpp"
#include "src/support/error_types.hpp"
#include "src/value/loan_amount.hpp"
#include "src/value/money.hpp"

namespace hypo {

/// Optional dates for the timing checks; each check runs only when its inputs are present
struct SondertilgungContext {
    std::optional<FixedRatePeriod> fixed_rate_period;

    /// Date the payment is made (evaluation date)
    std::optional<Date> payment_date;

    /// Date the lender was notified
    std::optional<Date> notice_date;
};

[[nodiscard]] std::expected<void, SondertilgungError>
validate_sondertilgung_payment(const GermanSondertilgungRules& rules, const ExtraPayment& payment,
                               LoanAmount loan_amount, std::span<const ExtraPayment> existing,
                               const SondertilgungContext& context = {});

/// Fee for `payment` given the payments already made in its loan year
[[nodiscard]] std::expected<Money, SondertilgungError>
calculate_sondertilgung_fees(const GermanSondertilgungRules& rules, const ExtraPayment& payment,
                             LoanAmount loan_amount, std::span<const ExtraPayment> existing);

enum class StrategyRisk {
    Niedrig,
    Mittel,
    Hoch
};

std::string_view to_string(StrategyRisk risk);

struct SondertilgungStrategy {
    /// Largest affordable tier in percent of the loan
    double recommended_percentage;

    Money recommended_amount;

    /// "Sofort", "Während der Zinsbindung" or "Vor Zinsbindungsende"
    std::string optimal_timing;

    /// Rough interest saved: 3 % p.a. over 10 years, whole euros
    double expected_savings;

    StrategyRisk risk;

    /// Human-readable assessment starting with the risk label
    std::string risk_assessment;
};

[[nodiscard]] SondertilgungStrategy
get_recommended_strategy(const GermanSondertilgungRules& rules, LoanAmount loan_amount,
                         Money available_funds, const std::optional<FixedRatePeriod>& fixed_rate_period,
                         Date as_of);

/// loan_amount * max tier / 100
[[nodiscard]] Money max_allowed_amount(const GermanSondertilgungRules& rules, LoanAmount loan_amount);

/// Cap minus the payments already made in `year`, floored at 0
[[nodiscard]] Money remaining_yearly_allowance(const GermanSondertilgungRules& rules,
                                               LoanAmount loan_amount,
                                               std::span<const ExtraPayment> existing,
                                               std::int64_t year);

} // namespace hypo
