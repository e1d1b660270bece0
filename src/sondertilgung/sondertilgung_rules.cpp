// SPDX-License-Identifier: MIT
#include "src/sondertilgung/sondertilgung_rules.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>
#include <array>
#include <map>
#include <stdexcept>
#include <utility>

namespace hypo {

namespace {

constexpr std::array<BankType, 7> kBankTypes = {
    BankType::Sparkasse,
    BankType::Volksbank,
    BankType::Privatbank,
    BankType::Bausparkasse,
    BankType::Hypothekenbank,
    BankType::OnlineBank,
    BankType::Genossenschaftsbank,
};

constexpr std::int64_t kDefaultMinimumEuros = 1'000;

std::unexpected<SondertilgungError> reject(SondertilgungErrorCode code, double value, double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_SONDERTILGUNG, static_cast<int>(code), value, bound);
    return std::unexpected(SondertilgungError(code, value));
}

Money euros(std::int64_t whole_euros) {
    auto money = Money::from_cents(whole_euros * 100);
    if (!money.has_value()) {
        throw std::logic_error("Bank table amount out of range: " + std::to_string(whole_euros));
    }
    return *money;
}

struct BankDefaults {
    std::vector<double> allowed_percentages;
    int grace_period_months;
    int notice_required_days;
    PaymentDateRestriction allowed_payment_dates;
    FeeType fee;
};

BankDefaults bank_defaults(BankType bank) {
    switch (bank) {
        case BankType::Sparkasse:
            return {{5.0, 10.0}, 12, 30, PaymentDateRestriction::MonthEnd, PercentageFee{1.0}};
        case BankType::Volksbank:
            return {{5.0, 10.0}, 12, 30, PaymentDateRestriction::MonthEnd, PercentageFee{1.0}};
        case BankType::Privatbank:
            return {{5.0, 10.0, 20.0}, 6, 14, PaymentDateRestriction::AnyTime, FixedFee{euros(250)}};
        case BankType::Bausparkasse:
            return {{5.0}, 24, 60, PaymentDateRestriction::YearEnd, TieredFee{0.5, 2.0}};
        case BankType::Hypothekenbank:
            return {{10.0, 20.0}, 6, 30, PaymentDateRestriction::QuarterEnd, FixedFee{euros(500)}};
        case BankType::OnlineBank:
            return {{10.0, 20.0, 50.0}, 3, 7, PaymentDateRestriction::AnyTime, NoFee{}};
        case BankType::Genossenschaftsbank:
            return {{5.0, 10.0}, 12, 30, PaymentDateRestriction::MonthEnd, PercentageFee{0.75}};
    }
    throw std::logic_error("Unknown bank type");
}

bool valid_percentages(const std::vector<double>& percentages) {
    return !percentages.empty() &&
           std::all_of(percentages.begin(), percentages.end(),
                       [](double p) { return p > 0.0 && p <= 100.0; });
}

}  // namespace

/// Sole writer of GermanSondertilgungRules fields
struct SondertilgungRulesBuilder {
    static GermanSondertilgungRules from_defaults(BankType bank) {
        BankDefaults defaults = bank_defaults(bank);
        GermanSondertilgungRules rules;
        rules.bank_type_ = bank;
        rules.allowed_percentages_ = std::move(defaults.allowed_percentages);
        rules.minimum_amount_ = euros(kDefaultMinimumEuros);
        rules.timing_.grace_period_months = defaults.grace_period_months;
        rules.timing_.notice_required_days = defaults.notice_required_days;
        rules.timing_.allowed_payment_dates = defaults.allowed_payment_dates;
        rules.fees_.type = defaults.fee;
        return rules;
    }

    static std::expected<GermanSondertilgungRules, SondertilgungError>
    apply(GermanSondertilgungRules rules, const SondertilgungOverrides& overrides) {
        if (overrides.allowed_percentages) {
            if (!valid_percentages(*overrides.allowed_percentages)) {
                return reject(SondertilgungErrorCode::NotAllowedForBankType,
                              overrides.allowed_percentages->empty()
                                  ? 0.0 : overrides.allowed_percentages->front());
            }
            rules.allowed_percentages_ = *overrides.allowed_percentages;
        }
        if (overrides.minimum_amount) {
            rules.minimum_amount_ = *overrides.minimum_amount;
        }
        if (overrides.maximum_amount) {
            rules.maximum_amount_ = *overrides.maximum_amount;
        }
        if (rules.maximum_amount_ && rules.minimum_amount_ > *rules.maximum_amount_) {
            return reject(SondertilgungErrorCode::BelowMinimumAmount,
                          rules.maximum_amount_->euros(), rules.minimum_amount_.euros());
        }
        if (overrides.timing) {
            const TimingRestrictions& timing = *overrides.timing;
            if (timing.grace_period_months < 0 || timing.notice_required_days < 0) {
                return reject(SondertilgungErrorCode::NotAllowedForBankType,
                              std::min(timing.grace_period_months, timing.notice_required_days));
            }
            for (const auto& blackout : timing.blackout_periods) {
                if (blackout.start_month < 1 || blackout.end_month < blackout.start_month) {
                    return reject(SondertilgungErrorCode::NotAllowedForBankType,
                                  blackout.start_month, blackout.end_month);
                }
            }
            rules.timing_ = timing;
        }
        if (overrides.fees) {
            const FeeStructure& fees = *overrides.fees;
            if (fees.minimum_fee && fees.maximum_fee && *fees.minimum_fee > *fees.maximum_fee) {
                return reject(SondertilgungErrorCode::NotAllowedForBankType,
                              fees.minimum_fee->euros(), fees.maximum_fee->euros());
            }
            rules.fees_ = fees;
        }
        std::sort(rules.allowed_percentages_.begin(), rules.allowed_percentages_.end());
        return rules;
    }
};

const GermanSondertilgungRules& default_sondertilgung_rules(BankType bank) {
    static const std::map<BankType, GermanSondertilgungRules> table = [] {
        std::map<BankType, GermanSondertilgungRules> rules;
        for (BankType type : kBankTypes) {
            rules.emplace(type, SondertilgungRulesBuilder::from_defaults(type));
        }
        return rules;
    }();
    return table.at(bank);
}

std::expected<GermanSondertilgungRules, SondertilgungError>
make_sondertilgung_rules(BankType bank, const SondertilgungOverrides& overrides) {
    return SondertilgungRulesBuilder::apply(default_sondertilgung_rules(bank), overrides);
}

std::span<const BankType> available_bank_types() noexcept {
    return kBankTypes;
}

bool supports_unlimited_sondertilgung(BankType bank) {
    const auto percentages = default_sondertilgung_rules(bank).allowed_percentages();
    return std::find(percentages.begin(), percentages.end(), 100.0) != percentages.end();
}

std::string_view format_bank_type(BankType bank) {
    switch (bank) {
        case BankType::Sparkasse:
            return "Sparkasse";
        case BankType::Volksbank:
            return "Volksbank/Raiffeisenbank";
        case BankType::Privatbank:
            return "Private Geschäftsbank";
        case BankType::Bausparkasse:
            return "Bausparkasse";
        case BankType::Hypothekenbank:
            return "Hypothekenbank";
        case BankType::OnlineBank:
            return "Online-Bank";
        case BankType::Genossenschaftsbank:
            return "Genossenschaftsbank";
    }
    return "Unknown";
}

} // namespace hypo
