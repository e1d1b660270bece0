// SPDX-License-Identifier: MIT
#include "src/sondertilgung/sondertilgung_plan.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <utility>

namespace hypo {

namespace {

std::unexpected<SondertilgungPlanError> reject(SondertilgungPlanErrorCode code, double value,
                                               double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_SONDERTILGUNG, static_cast<int>(code), value, bound);
    return std::unexpected(SondertilgungPlanError(code, value));
}

/// Cents per loan year
std::map<std::int64_t, std::int64_t> yearly_cents(std::span<const ExtraPayment> payments) {
    std::map<std::int64_t, std::int64_t> totals;
    for (const auto& payment : payments) {
        totals[payment.month().payment_year()] += payment.amount().cents();
    }
    return totals;
}

std::int64_t cap_cents(LoanAmount loan, Percentage pct) {
    return std::llround(static_cast<double>(loan.to_money().cents()) * pct.to_decimal());
}

}  // namespace

std::optional<Money> SondertilgungLimit::yearly_amount(LoanAmount loan) const {
    if (!percentage) {
        return std::nullopt;
    }
    auto money = Money::from_cents(cap_cents(loan, *percentage));
    if (!money.has_value()) {
        return std::nullopt;
    }
    return *money;
}

std::expected<SondertilgungPlan, SondertilgungPlanError>
SondertilgungPlan::create(SondertilgungLimit limit, std::vector<ExtraPayment> payments) {
    if (payments.empty()) {
        return reject(SondertilgungPlanErrorCode::NoPayments, 0.0);
    }
    std::stable_sort(payments.begin(), payments.end(),
        [](const ExtraPayment& a, const ExtraPayment& b) { return a.month() < b.month(); });

    auto duplicate = std::adjacent_find(payments.begin(), payments.end(),
        [](const ExtraPayment& a, const ExtraPayment& b) { return a.month() == b.month(); });
    if (duplicate != payments.end()) {
        return reject(SondertilgungPlanErrorCode::DuplicatePaymentMonth,
                      static_cast<double>(duplicate->month().value()));
    }
    return SondertilgungPlan{limit, std::move(payments)};
}

std::expected<void, SondertilgungPlanError> SondertilgungPlan::validate_against(LoanAmount loan) const {
    if (limit_.is_unlimited()) {
        return {};
    }
    const std::int64_t cap = cap_cents(loan, *limit_.percentage);
    for (const auto& [year, cents] : yearly_cents(payments_)) {
        if (cents > cap) {
            return reject(SondertilgungPlanErrorCode::ExceedsYearlyLimit,
                          static_cast<double>(cents) / 100.0, static_cast<double>(cap) / 100.0);
        }
    }
    return {};
}

std::vector<YearlySondertilgungSummary> SondertilgungPlan::yearly_summaries() const {
    std::map<std::int64_t, std::pair<std::int64_t, std::size_t>> by_year;
    for (const auto& payment : payments_) {
        auto& [cents, count] = by_year[payment.month().payment_year()];
        cents += payment.amount().cents();
        ++count;
    }

    std::vector<YearlySondertilgungSummary> summaries;
    summaries.reserve(by_year.size());
    for (const auto& [year, entry] : by_year) {
        const auto [cents, count] = entry;
        // Each payment is at most €1,000,000 and a year has at most 12 of them
        const Money total = Money::from_cents(cents).value_or(Money::zero());
        const Money average = Money::from_cents(
            std::llround(static_cast<double>(cents) / static_cast<double>(count))).value_or(Money::zero());
        summaries.push_back(YearlySondertilgungSummary{year, total, count, average});
    }
    return summaries;
}

bool SondertilgungPlan::can_add_payment(const ExtraPayment& payment, LoanAmount loan) const {
    if (limit_.is_unlimited()) {
        return true;
    }
    const std::int64_t year = payment.month().payment_year();
    const auto totals = yearly_cents(payments_);
    const auto it = totals.find(year);
    const std::int64_t used = it == totals.end() ? 0 : it->second;
    return used + payment.amount().cents() <= cap_cents(loan, *limit_.percentage);
}

std::optional<Money> SondertilgungPlan::remaining_yearly_limit(std::int64_t year, LoanAmount loan) const {
    if (limit_.is_unlimited()) {
        return std::nullopt;
    }
    const auto totals = yearly_cents(payments_);
    const auto it = totals.find(year);
    const std::int64_t used = it == totals.end() ? 0 : it->second;
    const std::int64_t remaining = std::max<std::int64_t>(0, cap_cents(loan, *limit_.percentage) - used);
    return Money::from_cents(remaining).value_or(Money::zero());
}

std::expected<SondertilgungPlan, SondertilgungPlanError>
SondertilgungPlan::with_payment(const ExtraPayment& payment, LoanAmount loan) const {
    const bool taken = std::any_of(payments_.begin(), payments_.end(),
        [&](const ExtraPayment& p) { return p.month() == payment.month(); });
    if (taken) {
        return reject(SondertilgungPlanErrorCode::DuplicatePaymentMonth,
                      static_cast<double>(payment.month().value()));
    }
    if (!can_add_payment(payment, loan)) {
        return reject(SondertilgungPlanErrorCode::ExceedsYearlyLimit, payment.euros());
    }

    std::vector<ExtraPayment> updated = payments_;
    updated.push_back(payment);
    return create(limit_, std::move(updated));
}

std::expected<SondertilgungPlan, SondertilgungPlanError>
SondertilgungPlan::without_payment(PaymentMonth month) const {
    std::vector<ExtraPayment> updated;
    updated.reserve(payments_.size());
    std::copy_if(payments_.begin(), payments_.end(), std::back_inserter(updated),
        [month](const ExtraPayment& p) { return p.month() != month; });
    return create(limit_, std::move(updated));
}

std::expected<Money, SondertilgungPlanError> SondertilgungPlan::total() const {
    auto total = total_extra_payments(payments_);
    if (!total.has_value()) {
        return reject(SondertilgungPlanErrorCode::InvalidPaymentAmount, total.error().value);
    }
    return *total;
}

std::string format_sondertilgung_limit(const SondertilgungLimit& limit) {
    if (limit.is_unlimited()) {
        return "Unbegrenzte Sondertilgungen";
    }
    return "Maximal " + format_percentage(*limit.percentage) + " der Darlehenssumme pro Jahr";
}

std::string format_sondertilgung_plan(const SondertilgungPlan& plan) {
    const auto total_result = plan.total();
    const std::string total = total_result ? format_money(*total_result) : std::string("?");
    return "Sondertilgungsplan: " + std::to_string(plan.payments().size()) +
           " Zahlungen, Gesamt: " + total + " (" + format_sondertilgung_limit(plan.limit()) + ")";
}

} // namespace hypo
