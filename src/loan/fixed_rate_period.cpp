// SPDX-License-Identifier: MIT
#include "src/loan/fixed_rate_period.hpp"
#include "src/support/hypo_trace.h"

#include <array>
#include <algorithm>
#include <cmath>

namespace hypo {

namespace {

std::unexpected<FixedRatePeriodError> reject(FixedRatePeriodErrorCode code, double value,
                                             double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_LOAN, static_cast<int>(code), value, bound);
    return std::unexpected(FixedRatePeriodError(code, value));
}

constexpr double kDaysPerYear = 365.25;
constexpr long kDaysPerMonth = 30;
constexpr std::array<std::int64_t, 6> kTypicalPeriods = {5, 10, 15, 20, 25, 30};

}  // namespace

std::string_view to_label(FixedRateType type) {
    switch (type) {
        case FixedRateType::Fixed:
            return "Festzins";
        case FixedRateType::InitialFixed:
            return "Zinsbindung";
        case FixedRateType::CapFixed:
            return "Zinsobergrenze";
    }
    return "Unknown";
}

std::expected<FixedRatePeriod, FixedRatePeriodError>
FixedRatePeriod::create(double years, double rate_percent, FixedRateType type, Date start_date) {
    if (years < static_cast<double>(YearCount::kMinimumYears)) {
        return reject(FixedRatePeriodErrorCode::PeriodTooShort, years,
                      static_cast<double>(YearCount::kMinimumYears));
    }
    if (years > static_cast<double>(YearCount::kMaximumYears)) {
        return reject(FixedRatePeriodErrorCode::PeriodTooLong, years,
                      static_cast<double>(YearCount::kMaximumYears));
    }
    auto period_years = YearCount::create(years);
    if (!period_years.has_value()) {
        return reject(FixedRatePeriodErrorCode::InvalidPeriodLength, years);
    }
    auto rate = InterestRate::create(rate_percent);
    if (!rate.has_value()) {
        return reject(FixedRatePeriodErrorCode::InvalidInterestRate, rate_percent);
    }
    return FixedRatePeriod{*period_years, *rate, type, start_date};
}

Date FixedRatePeriod::end_date() const {
    return add_years(start_, static_cast<int>(years_.value()));
}

bool FixedRatePeriod::is_active(Date on) const {
    return on >= start_ && on < end_date();
}

double FixedRatePeriod::remaining_years(Date on) const {
    if (!is_active(on)) {
        return 0.0;
    }
    const double years = static_cast<double>(days_between(on, end_date())) / kDaysPerYear;
    return std::round(years * 100.0) / 100.0;
}

bool FixedRatePeriod::is_typical_period() const noexcept {
    return std::find(kTypicalPeriods.begin(), kTypicalPeriods.end(), years_.value()) !=
           kTypicalPeriods.end();
}

long FixedRatePeriod::days_until_expiry(Date on) const {
    return days_between(on, end_date());
}

bool FixedRatePeriod::is_expiring_soon(Date on, int months) const {
    const long days = days_until_expiry(on);
    return days > 0 && days <= static_cast<long>(months) * kDaysPerMonth;
}

std::string format_fixed_rate_period(const FixedRatePeriod& period) {
    return format_year_count(period.period_years()) + " " + std::string(to_label(period.type())) +
           " @ " + format_interest_rate(period.initial_rate());
}

} // namespace hypo
