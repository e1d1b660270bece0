// SPDX-License-Identifier: MIT
#include "src/property/loan_to_value.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>

namespace hypo {

namespace {

std::unexpected<LoanToValueError> reject(LoanToValueErrorCode code, double value, double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_LOAN_TO_VALUE, static_cast<int>(code), value, bound);
    return std::unexpected(LoanToValueError(code, value));
}

bool is_investment_property(PropertyType type) {
    return type == PropertyType::Mehrfamilienhaus || type == PropertyType::Gewerbeimmobilie;
}

}  // namespace

LtvRiskCategory classify_ltv(double ltv_percent) noexcept {
    if (ltv_percent <= 60.0) return LtvRiskCategory::VeryLow;
    if (ltv_percent <= 70.0) return LtvRiskCategory::Low;
    if (ltv_percent <= 80.0) return LtvRiskCategory::Medium;
    if (ltv_percent <= 90.0) return LtvRiskCategory::High;
    return LtvRiskCategory::VeryHigh;
}

std::string_view to_label(LtvRiskCategory category) {
    switch (category) {
        case LtvRiskCategory::VeryLow:
            return "Sehr niedrig";
        case LtvRiskCategory::Low:
            return "Niedrig";
        case LtvRiskCategory::Medium:
            return "Mittel";
        case LtvRiskCategory::High:
            return "Hoch";
        case LtvRiskCategory::VeryHigh:
            return "Sehr hoch";
    }
    return "Unbekannt";
}

std::string_view risk_category_description(LtvRiskCategory category) {
    switch (category) {
        case LtvRiskCategory::VeryLow:
            return "Sehr niedrig (≤60%) - Beste Konditionen";
        case LtvRiskCategory::Low:
            return "Niedrig (60-70%) - Gute Konditionen";
        case LtvRiskCategory::Medium:
            return "Mittel (70-80%) - Standard Konditionen";
        case LtvRiskCategory::High:
            return "Hoch (80-90%) - Erhöhte Zinsen";
        case LtvRiskCategory::VeryHigh:
            return "Sehr hoch (>90%) - Hohe Zinsen, schwierige Finanzierung";
    }
    return "Unbekannt";
}

double max_allowed_ltv(const PropertyValuation& valuation, const LtvPolicy& policy) {
    if (is_investment_property(valuation.type())) {
        return policy.investment_property_max;
    }
    if (valuation.location().quality == LocationQuality::Premium) {
        return policy.premium_location_max;
    }
    return policy.standard_max;
}

std::expected<LoanToValueRatio, LoanToValueError>
LoanToValueRatio::build(LoanAmount loan_amount, const PropertyValuation& valuation,
                        double original_ltv, const LtvPolicy& policy) {
    if (!valuation.is_acceptable_for_mortgage()) {
        return reject(LoanToValueErrorCode::PropertyValuationNotAcceptable,
                      static_cast<double>(valuation.reliability_score()));
    }

    const double property_value = valuation.current_value().euros();
    if (property_value < policy.minimum_property_value) {
        return reject(LoanToValueErrorCode::PropertyValueTooLow,
                      property_value, policy.minimum_property_value);
    }

    const double current_ltv = loan_amount.euros() / property_value * 100.0;
    const double cap = max_allowed_ltv(valuation, policy);
    if (current_ltv > cap + policy.approval_buffer) {
        return reject(LoanToValueErrorCode::LTVTooHigh, current_ltv, cap + policy.approval_buffer);
    }

    auto current = Percentage::create(current_ltv);
    if (!current.has_value()) {
        return reject(LoanToValueErrorCode::InvalidLoanAmount, current_ltv);
    }
    auto original = Percentage::create(original_ltv);
    if (!original.has_value()) {
        return reject(LoanToValueErrorCode::InvalidLoanAmount, original_ltv);
    }

    return LoanToValueRatio{*current, *original, classify_ltv(current_ltv), loan_amount,
                            valuation, policy};
}

std::expected<LoanToValueRatio, LoanToValueError>
LoanToValueRatio::create(LoanAmount loan_amount, const PropertyValuation& valuation,
                         std::optional<LoanAmount> original_loan_amount, const LtvPolicy& policy) {
    const LoanAmount original = original_loan_amount.value_or(loan_amount);
    const double original_ltv = original.euros() / valuation.current_value().euros() * 100.0;
    return build(loan_amount, valuation, original_ltv, policy);
}

double LoanToValueRatio::interest_rate_premium() const noexcept {
    switch (risk_) {
        case LtvRiskCategory::VeryLow:
            return 0.0;
        case LtvRiskCategory::Low:
            return 0.10;
        case LtvRiskCategory::Medium:
            return 0.25;
        case LtvRiskCategory::High:
            return 0.50;
        case LtvRiskCategory::VeryHigh:
            return 1.00;
    }
    return 0.50;
}

double LoanToValueRatio::equity() const noexcept {
    return std::max(0.0, valuation_.current_value().euros() - loan_.euros());
}

double LoanToValueRatio::amount_to_reach_target(double target_percent) const noexcept {
    const double target_balance = valuation_.current_value().euros() * target_percent / 100.0;
    return std::max(0.0, loan_.euros() - target_balance);
}

double LoanToValueRatio::max_additional_borrowing(double target_percent) const noexcept {
    const double target_balance = valuation_.current_value().euros() * target_percent / 100.0;
    return std::max(0.0, target_balance - loan_.euros());
}

std::expected<LoanToValueRatio, LoanToValueError>
LoanToValueRatio::with_loan_amount(LoanAmount new_amount) const {
    return build(new_amount, valuation_, current_ltv(), policy_);
}

std::expected<LoanToValueRatio, LoanToValueError>
LoanToValueRatio::with_valuation(const PropertyValuation& new_valuation) const {
    return build(loan_, new_valuation, current_ltv(), policy_);
}

std::string format_loan_to_value(const LoanToValueRatio& ratio) {
    return "LTV: " + format_percentage(ratio.current_percentage()) +
           " (Risiko: " + std::string(to_label(ratio.risk_category())) + ")";
}

} // namespace hypo
