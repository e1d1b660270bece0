// SPDX-License-Identifier: MIT
/**
 * @file loan_to_value.hpp
 * @brief Beleihungsauslauf: outstanding loan over current property value
 *
 * LTV = loan / current value * 100. Lending caps depend on the property:
 * investment-class properties (Mehrfamilienhaus, Gewerbeimmobilie) 70 %,
 * premium locations 90 %, everything else 80 %. A ratio is only created
 * while it stays within the cap plus the approval buffer.
 */

#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "src/property/property_valuation.hpp"
#include "src/support/error_types.hpp"
#include "src/value/loan_amount.hpp"
#include "src/value/percentage.hpp"

namespace hypo {

/// Lending thresholds, all in percent LTV except the minimum value
struct LtvPolicy {
    double standard_max = 80.0;
    double premium_location_max = 90.0;
    double investment_property_max = 70.0;

    /// Tolerated excess over the cap at creation
    double approval_buffer = 10.0;

    /// Smallest property value (euros) accepted as collateral
    double minimum_property_value = 50'000.0;

    /// Above this, mortgage insurance is required
    double insurance_threshold = 80.0;

    /// At or below this, refinancing is considered safe
    double refinancing_threshold = 75.0;

    /// At or below this, the best rates apply
    double best_rate_threshold = 60.0;
};

enum class LtvRiskCategory {
    VeryLow,   ///< <= 60
    Low,       ///< <= 70
    Medium,    ///< <= 80
    High,      ///< <= 90
    VeryHigh   ///< > 90
};

[[nodiscard]] LtvRiskCategory classify_ltv(double ltv_percent) noexcept;

/// "Sehr niedrig", "Niedrig", "Mittel", "Hoch", "Sehr hoch"
std::string_view to_label(LtvRiskCategory category);

/// Label with band and lending consequence, e.g. "Mittel (70-80%) - Standard Konditionen"
std::string_view risk_category_description(LtvRiskCategory category);

/// Cap for the valuation's property type and location
[[nodiscard]] double max_allowed_ltv(const PropertyValuation& valuation, const LtvPolicy& policy = {});

class LoanToValueRatio {
public:
    /// PropertyValuationNotAcceptable, PropertyValueTooLow, LTVTooHigh in
    /// that order; InvalidLoanAmount when an LTV exceeds 100 %
    [[nodiscard]] static std::expected<LoanToValueRatio, LoanToValueError>
    create(LoanAmount loan_amount, const PropertyValuation& valuation,
           std::optional<LoanAmount> original_loan_amount = std::nullopt,
           const LtvPolicy& policy = {});

    [[nodiscard]] double current_ltv() const noexcept { return current_.value(); }
    [[nodiscard]] double original_ltv() const noexcept { return original_.value(); }
    [[nodiscard]] Percentage current_percentage() const noexcept { return current_; }
    [[nodiscard]] LtvRiskCategory risk_category() const noexcept { return risk_; }
    [[nodiscard]] LoanAmount loan_amount() const noexcept { return loan_; }
    [[nodiscard]] const PropertyValuation& valuation() const noexcept { return valuation_; }
    [[nodiscard]] const LtvPolicy& policy() const noexcept { return policy_; }

    [[nodiscard]] double max_allowed() const { return max_allowed_ltv(valuation_, policy_); }

    /// Rate surcharge in percentage points: 0, 0.10, 0.25, 0.50, 1.00 by band
    [[nodiscard]] double interest_rate_premium() const noexcept;

    [[nodiscard]] bool requires_mortgage_insurance() const noexcept {
        return current_ltv() > policy_.insurance_threshold;
    }
    [[nodiscard]] bool is_acceptable_for_mortgage() const { return current_ltv() <= max_allowed(); }
    [[nodiscard]] bool qualifies_for_best_rates() const noexcept {
        return current_ltv() <= policy_.best_rate_threshold;
    }
    [[nodiscard]] bool is_safe_for_refinancing() const noexcept {
        return current_ltv() <= policy_.refinancing_threshold;
    }

    /// Property value minus loan, floored at 0
    [[nodiscard]] double equity() const noexcept;
    [[nodiscard]] double equity_percentage() const noexcept { return 100.0 - current_ltv(); }

    /// original - current, positive when the position improved
    [[nodiscard]] double improvement() const noexcept { return original_ltv() - current_ltv(); }
    [[nodiscard]] bool has_improved() const noexcept { return improvement() > 0.0; }

    /// Repayment needed to bring the LTV down to `target_percent`, floored at 0
    [[nodiscard]] double amount_to_reach_target(double target_percent) const noexcept;

    /// Extra borrowing possible until the LTV reaches `target_percent`, floored at 0
    [[nodiscard]] double max_additional_borrowing(double target_percent = 80.0) const noexcept;

    /// Same property, new loan; this ratio's current LTV becomes the original
    [[nodiscard]] std::expected<LoanToValueRatio, LoanToValueError>
    with_loan_amount(LoanAmount new_amount) const;

    /// Same loan, new valuation; this ratio's current LTV becomes the original
    [[nodiscard]] std::expected<LoanToValueRatio, LoanToValueError>
    with_valuation(const PropertyValuation& new_valuation) const;

private:
    LoanToValueRatio(Percentage current, Percentage original, LtvRiskCategory risk,
                     LoanAmount loan, PropertyValuation valuation, const LtvPolicy& policy)
        : current_(current), original_(original), risk_(risk), loan_(loan),
          valuation_(std::move(valuation)), policy_(policy) {}

    /// Shared validation; original LTV given directly in percent
    [[nodiscard]] static std::expected<LoanToValueRatio, LoanToValueError>
    build(LoanAmount loan_amount, const PropertyValuation& valuation, double original_ltv,
          const LtvPolicy& policy);

    Percentage current_;
    Percentage original_;
    LtvRiskCategory risk_;
    LoanAmount loan_;
    PropertyValuation valuation_;
    LtvPolicy policy_;
};

/// "LTV: 80,00 % (Risiko: Mittel)"
std::string format_loan_to_value(const LoanToValueRatio& ratio);

} // namespace hypo
