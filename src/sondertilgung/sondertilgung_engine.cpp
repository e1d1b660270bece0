// SPDX-License-Identifier: MIT
#include "src/sondertilgung/sondertilgung_engine.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>
#include <variant>

namespace hypo {

namespace {

constexpr double kAssumedSavingsRate = 0.03;
constexpr double kAssumedSavingsYears = 10.0;
constexpr double kDefaultRecommendedPercentage = 5.0;
constexpr double kTimingThresholdYears = 5.0;

std::unexpected<SondertilgungError> reject(SondertilgungErrorCode code, double value, double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_SONDERTILGUNG, static_cast<int>(code), value, bound);
    return std::unexpected(SondertilgungError(code, value));
}

std::int64_t tier_cents(LoanAmount loan_amount, double percentage) {
    return std::llround(static_cast<double>(loan_amount.to_money().cents()) * percentage / 100.0);
}

std::int64_t cap_cents(const GermanSondertilgungRules& rules, LoanAmount loan_amount) {
    return tier_cents(loan_amount, rules.max_allowed_percentage());
}

/// Cents paid in `year` by `existing`
std::int64_t year_cents(std::span<const ExtraPayment> existing, std::int64_t year) {
    std::int64_t total = 0;
    for (const auto& p : existing) {
        if (p.month().payment_year() == year) {
            total += p.amount().cents();
        }
    }
    return total;
}

bool is_allowed_payment_date(PaymentDateRestriction restriction, const Date& date) {
    const unsigned month = static_cast<unsigned>(date.month());
    switch (restriction) {
        case PaymentDateRestriction::AnyTime:
            return true;
        case PaymentDateRestriction::MonthEnd:
            return is_last_day_of_month(date);
        case PaymentDateRestriction::QuarterEnd:
            return month % 3 == 0 && is_last_day_of_month(date);
        case PaymentDateRestriction::YearEnd:
            return month == 12 && date.day() == std::chrono::day{31};
    }
    return false;
}

/// Fee before the min/max clamp, in euros
struct FeeVisitor {
    double amount;
    double excess;

    double operator()(const NoFee&) const { return 0.0; }
    double operator()(const PercentageFee& fee) const { return amount * fee.rate / 100.0; }
    double operator()(const FixedFee& fee) const { return fee.amount.euros(); }
    double operator()(const TieredFee& fee) const {
        return amount * fee.base_rate / 100.0 + excess * fee.excess_rate / 100.0;
    }
    double operator()(const ExcessOnlyFee& fee) const { return excess * fee.excess_rate / 100.0; }
};

}  // namespace

std::string_view to_string(StrategyRisk risk) {
    switch (risk) {
        case StrategyRisk::Niedrig:
            return "Niedrig";
        case StrategyRisk::Mittel:
            return "Mittel";
        case StrategyRisk::Hoch:
            return "Hoch";
    }
    return "Unknown";
}

std::expected<void, SondertilgungError>
validate_sondertilgung_payment(const GermanSondertilgungRules& rules, const ExtraPayment& payment,
                               LoanAmount loan_amount, std::span<const ExtraPayment> existing,
                               const SondertilgungContext& context) {
    if (payment.amount() < rules.minimum_amount()) {
        return reject(SondertilgungErrorCode::BelowMinimumAmount,
                      payment.euros(), rules.minimum_amount().euros());
    }
    if (rules.maximum_amount() && payment.amount() > *rules.maximum_amount()) {
        return reject(SondertilgungErrorCode::AboveMaximumAmount,
                      payment.euros(), rules.maximum_amount()->euros());
    }

    const std::int64_t year = payment.month().payment_year();
    const std::int64_t yearly_total = year_cents(existing, year) + payment.amount().cents();
    const std::int64_t cap = cap_cents(rules, loan_amount);
    if (yearly_total > cap) {
        return reject(SondertilgungErrorCode::ExceedsAllowedPercentage,
                      static_cast<double>(yearly_total) / 100.0, static_cast<double>(cap) / 100.0);
    }

    const TimingRestrictions& timing = rules.timing();
    if (context.payment_date) {
        const Date& date = *context.payment_date;

        if (context.fixed_rate_period) {
            const Date grace_end = add_months(context.fixed_rate_period->start_date(),
                                              timing.grace_period_months);
            if (date < grace_end) {
                return reject(SondertilgungErrorCode::WithinGracePeriod,
                              static_cast<double>(days_between(date, grace_end)),
                              timing.grace_period_months);
            }
        }

        const std::int64_t month = payment.month().value();
        for (const auto& blackout : timing.blackout_periods) {
            if (blackout.contains(month)) {
                return reject(SondertilgungErrorCode::DuringBlackoutPeriod,
                              static_cast<double>(month), blackout.start_month);
            }
        }

        if (!is_allowed_payment_date(timing.allowed_payment_dates, date)) {
            return reject(SondertilgungErrorCode::InvalidPaymentDate,
                          static_cast<double>(static_cast<unsigned>(date.day())),
                          static_cast<int>(timing.allowed_payment_dates));
        }

        if (context.notice_date) {
            const long notice_days = days_between(*context.notice_date, date);
            if (notice_days < timing.notice_required_days) {
                return reject(SondertilgungErrorCode::InsufficientNotice,
                              static_cast<double>(notice_days), timing.notice_required_days);
            }
        }
    }

    return {};
}

std::expected<Money, SondertilgungError>
calculate_sondertilgung_fees(const GermanSondertilgungRules& rules, const ExtraPayment& payment,
                             LoanAmount loan_amount, std::span<const ExtraPayment> existing) {
    const std::int64_t year = payment.month().payment_year();
    const std::int64_t yearly_total = year_cents(existing, year) + payment.amount().cents();
    const std::int64_t excess_cents = std::max<std::int64_t>(0, yearly_total - cap_cents(rules, loan_amount));

    const FeeStructure& fees = rules.fees();
    double fee = std::visit(FeeVisitor{payment.euros(), static_cast<double>(excess_cents) / 100.0}, fees.type);

    if (fees.minimum_fee) {
        fee = std::max(fee, fees.minimum_fee->euros());
    }
    if (fees.maximum_fee) {
        fee = std::min(fee, fees.maximum_fee->euros());
    }

    auto money = Money::create(fee);
    if (!money.has_value()) {
        return reject(SondertilgungErrorCode::ExcessiveFeeAmount, fee);
    }
    return *money;
}

SondertilgungStrategy
get_recommended_strategy(const GermanSondertilgungRules& rules, LoanAmount loan_amount,
                         Money available_funds, const std::optional<FixedRatePeriod>& fixed_rate_period,
                         Date as_of) {
    double recommended = kDefaultRecommendedPercentage;
    for (double pct : rules.allowed_percentages()) {
        if (tier_cents(loan_amount, pct) <= available_funds.cents()) {
            recommended = pct;
        }
    }

    std::string timing = "Sofort";
    if (fixed_rate_period && fixed_rate_period->is_active(as_of)) {
        timing = fixed_rate_period->remaining_years(as_of) > kTimingThresholdYears
                     ? "Während der Zinsbindung"
                     : "Vor Zinsbindungsende";
    }

    // LoanAmount tops out at €10M, so any tier up to 100 % fits in Money
    const Money recommended_amount =
        Money::from_cents(tier_cents(loan_amount, recommended)).value_or(Money::zero());
    const double recommended_euros = recommended_amount.euros();

    StrategyRisk risk = StrategyRisk::Hoch;
    std::string assessment = "Hoch - Finanzielle Flexibilität prüfen";
    if (recommended <= 10.0) {
        risk = StrategyRisk::Niedrig;
        assessment = "Niedrig";
    } else if (recommended <= 20.0) {
        risk = StrategyRisk::Mittel;
        assessment = "Mittel - Liquidität beachten";
    }

    return SondertilgungStrategy{
        .recommended_percentage = recommended,
        .recommended_amount = recommended_amount,
        .optimal_timing = std::move(timing),
        .expected_savings = std::round(recommended_euros * kAssumedSavingsRate * kAssumedSavingsYears),
        .risk = risk,
        .risk_assessment = std::move(assessment)
    };
}

Money max_allowed_amount(const GermanSondertilgungRules& rules, LoanAmount loan_amount) {
    return Money::from_cents(cap_cents(rules, loan_amount)).value_or(Money::zero());
}

Money remaining_yearly_allowance(const GermanSondertilgungRules& rules, LoanAmount loan_amount,
                                 std::span<const ExtraPayment> existing, std::int64_t year) {
    const std::int64_t remaining =
        std::max<std::int64_t>(0, cap_cents(rules, loan_amount) - year_cents(existing, year));
    return Money::from_cents(remaining).value_or(Money::zero());
}

} // namespace hypo
