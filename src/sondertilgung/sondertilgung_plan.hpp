// SPDX-License-Identifier: MIT
/**
 * @file sondertilgung_plan.hpp
 * @brief Planned extra payments under a yearly contractual limit
 */

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "src/loan/extra_payment.hpp"
#include "src/support/error_types.hpp"
#include "src/value/loan_amount.hpp"
#include "src/value/money.hpp"
#include "src/value/percentage.hpp"

namespace hypo {

/// Yearly cap as a percentage of the original loan, or unlimited
struct SondertilgungLimit {
    std::optional<Percentage> percentage;

    [[nodiscard]] static SondertilgungLimit of(Percentage p) { return SondertilgungLimit{p}; }
    [[nodiscard]] static SondertilgungLimit unlimited() { return SondertilgungLimit{std::nullopt}; }

    [[nodiscard]] bool is_unlimited() const noexcept { return !percentage.has_value(); }

    /// loan * p / 100; nullopt when unlimited
    [[nodiscard]] std::optional<Money> yearly_amount(LoanAmount loan) const;
};

struct YearlySondertilgungSummary {
    std::int64_t year;
    Money total;
    std::size_t count;
    Money average;
};

class SondertilgungPlan {
public:
    /// Sorts by month. NoPayments for an empty list, DuplicatePaymentMonth
    /// when two payments share a month.
    [[nodiscard]] static std::expected<SondertilgungPlan, SondertilgungPlanError>
    create(SondertilgungLimit limit, std::vector<ExtraPayment> payments);

    [[nodiscard]] const SondertilgungLimit& limit() const noexcept { return limit_; }
    [[nodiscard]] std::span<const ExtraPayment> payments() const noexcept { return payments_; }

    /// ExceedsYearlyLimit when any loan year's total exceeds the limit
    [[nodiscard]] std::expected<void, SondertilgungPlanError> validate_against(LoanAmount loan) const;

    /// One entry per loan year that has payments, ascending
    [[nodiscard]] std::vector<YearlySondertilgungSummary> yearly_summaries() const;

    [[nodiscard]] bool can_add_payment(const ExtraPayment& payment, LoanAmount loan) const;

    /// Unused allowance in `year`, floored at 0; nullopt when unlimited
    [[nodiscard]] std::optional<Money> remaining_yearly_limit(std::int64_t year, LoanAmount loan) const;

    [[nodiscard]] std::expected<SondertilgungPlan, SondertilgungPlanError>
    with_payment(const ExtraPayment& payment, LoanAmount loan) const;

    /// NoPayments when the removal would empty the plan
    [[nodiscard]] std::expected<SondertilgungPlan, SondertilgungPlanError>
    without_payment(PaymentMonth month) const;

    [[nodiscard]] std::expected<Money, SondertilgungPlanError> total() const;

private:
    SondertilgungPlan(SondertilgungLimit limit, std::vector<ExtraPayment> payments)
        : limit_(limit), payments_(std::move(payments)) {}

    SondertilgungLimit limit_;
    std::vector<ExtraPayment> payments_;
};

/// "Maximal 5,00 % der Darlehenssumme pro Jahr" or "Unbegrenzte Sondertilgungen"
std::string format_sondertilgung_limit(const SondertilgungLimit& limit);

/// "Sondertilgungsplan: 2 Zahlungen, Gesamt: 15.000,00 € (...)"
std::string format_sondertilgung_plan(const SondertilgungPlan& plan);

} // namespace hypo
