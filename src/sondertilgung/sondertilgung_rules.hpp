// SPDX-License-Identifier: MIT
/**
 * @file sondertilgung_rules.hpp
 * @brief Contractual extra-payment terms of German lender types
 *
 * Each BankType has a constant default rule set held in a lazily built,
 * immutable table. make_sondertilgung_rules copies an entry and applies
 * validated per-contract overrides.
 */

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "src/support/error_types.hpp"
#include "src/value/money.hpp"

namespace hypo {

/// Version of the built-in bank table; bumped whenever its data changes
inline constexpr int kSondertilgungRulesVersion = 1;

enum class BankType {
    Sparkasse,
    Volksbank,
    Privatbank,
    Bausparkasse,
    Hypothekenbank,
    OnlineBank,
    Genossenschaftsbank
};

enum class PaymentDateRestriction {
    AnyTime,
    MonthEnd,
    QuarterEnd,
    YearEnd
};

/// Inclusive range of schedule months in which no extra payment is accepted
struct BlackoutPeriod {
    int start_month;
    int end_month;
    std::string reason;

    [[nodiscard]] bool contains(std::int64_t month) const noexcept {
        return month >= start_month && month <= end_month;
    }
};

struct TimingRestrictions {
    /// Months after the fixed-rate period starts before the first extra payment
    int grace_period_months = 0;

    /// Days of advance notice the lender requires
    int notice_required_days = 0;

    PaymentDateRestriction allowed_payment_dates = PaymentDateRestriction::AnyTime;

    std::vector<BlackoutPeriod> blackout_periods;
};

struct NoFee {};

/// amount * rate / 100
struct PercentageFee {
    double rate;
};

struct FixedFee {
    Money amount;
};

/// amount * base_rate / 100 + excess * excess_rate / 100
struct TieredFee {
    double base_rate;
    double excess_rate;
};

/// excess * excess_rate / 100
struct ExcessOnlyFee {
    double excess_rate;
};

using FeeType = std::variant<NoFee, PercentageFee, FixedFee, TieredFee, ExcessOnlyFee>;

struct FeeStructure {
    FeeType type = NoFee{};
    std::optional<Money> minimum_fee;
    std::optional<Money> maximum_fee;
};

class GermanSondertilgungRules {
public:
    [[nodiscard]] BankType bank_type() const noexcept { return bank_type_; }

    /// Ascending, each in (0, 100]
    [[nodiscard]] std::span<const double> allowed_percentages() const noexcept {
        return allowed_percentages_;
    }

    /// Largest listed tier; the yearly cap
    [[nodiscard]] double max_allowed_percentage() const noexcept { return allowed_percentages_.back(); }

    [[nodiscard]] Money minimum_amount() const noexcept { return minimum_amount_; }
    [[nodiscard]] const std::optional<Money>& maximum_amount() const noexcept { return maximum_amount_; }
    [[nodiscard]] const TimingRestrictions& timing() const noexcept { return timing_; }
    [[nodiscard]] const FeeStructure& fees() const noexcept { return fees_; }

private:
    friend struct SondertilgungRulesBuilder;

    GermanSondertilgungRules() = default;

    BankType bank_type_ = BankType::Sparkasse;
    std::vector<double> allowed_percentages_;
    Money minimum_amount_ = Money::zero();
    std::optional<Money> maximum_amount_;
    TimingRestrictions timing_;
    FeeStructure fees_;
};

/// Per-contract deviations from the bank default
struct SondertilgungOverrides {
    std::optional<Money> minimum_amount;
    std::optional<Money> maximum_amount;
    std::optional<std::vector<double>> allowed_percentages;
    std::optional<TimingRestrictions> timing;
    std::optional<FeeStructure> fees;
};

/// Default rules of `bank`; lives for the whole program
[[nodiscard]] const GermanSondertilgungRules& default_sondertilgung_rules(BankType bank);

/// NotAllowedForBankType for empty or out-of-range percentages,
/// a negative timing value or a minimum fee above the maximum fee;
/// BelowMinimumAmount when the minimum amount exceeds the maximum
[[nodiscard]] std::expected<GermanSondertilgungRules, SondertilgungError>
make_sondertilgung_rules(BankType bank, const SondertilgungOverrides& overrides = {});

/// All bank types in declaration order
[[nodiscard]] std::span<const BankType> available_bank_types() noexcept;

/// True when some tier of the default rules allows 100 % per year
[[nodiscard]] bool supports_unlimited_sondertilgung(BankType bank);

/// German display name ("Volksbank/Raiffeisenbank", "Online-Bank", ...)
std::string_view format_bank_type(BankType bank);

} // namespace hypo
