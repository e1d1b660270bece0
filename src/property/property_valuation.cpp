// SPDX-License-Identifier: MIT
#include "src/property/property_valuation.hpp"
#include "src/support/german_format.hpp"
#include "src/support/hypo_trace.h"

#include <algorithm>
#include <cmath>

namespace hypo {

namespace {

std::unexpected<PropertyValuationError> reject(PropertyValuationErrorCode code, double value,
                                               double bound = 0.0) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_PROPERTY, static_cast<int>(code), value, bound);
    return std::unexpected(PropertyValuationError(code, value));
}

bool in_value_range(double euros) {
    return euros >= PropertyValuation::kMinimumValueEuros &&
           euros <= PropertyValuation::kMaximumValueEuros;
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; });
}

}  // namespace

std::string_view to_string(ValuationMethod method) {
    switch (method) {
        case ValuationMethod::BankAppraisal:
            return "BankAppraisal";
        case ValuationMethod::IndependentAppraisal:
            return "IndependentAppraisal";
        case ValuationMethod::OnlineEstimate:
            return "OnlineEstimate";
        case ValuationMethod::ComparativeMarketAnalysis:
            return "ComparativeMarketAnalysis";
        case ValuationMethod::SelfAssessment:
            return "SelfAssessment";
        case ValuationMethod::InsuranceValuation:
            return "InsuranceValuation";
    }
    return "Unknown";
}

std::string_view to_string(PropertyType type) {
    switch (type) {
        case PropertyType::Eigenheim:
            return "Eigenheim";
        case PropertyType::Eigentumswohnung:
            return "Eigentumswohnung";
        case PropertyType::Reihenhaus:
            return "Reihenhaus";
        case PropertyType::Doppelhaushaelfte:
            return "Doppelhaushälfte";
        case PropertyType::Mehrfamilienhaus:
            return "Mehrfamilienhaus";
        case PropertyType::Baugrundstueck:
            return "Baugrundstück";
        case PropertyType::Gewerbeimmobilie:
            return "Gewerbeimmobilie";
    }
    return "Unknown";
}

std::string_view location_quality_description(LocationQuality quality) {
    switch (quality) {
        case LocationQuality::Premium:
            return "Erstklassige Lage (Top-Städte)";
        case LocationQuality::Good:
            return "Gute Wohnlage";
        case LocationQuality::Average:
            return "Normale Wohnlage";
        case LocationQuality::BelowAverage:
            return "Einfache Lage";
        case LocationQuality::Rural:
            return "Ländliche Lage";
    }
    return "Unbekannte Lage";
}

bool is_valid_german_postal_code(std::string_view postal_code) {
    return postal_code.size() == 5 &&
           std::all_of(postal_code.begin(), postal_code.end(),
                       [](char ch) { return ch >= '0' && ch <= '9'; });
}

std::expected<PropertyValuation, PropertyValuationError>
PropertyValuation::create(double current_value, double purchase_price, Date valuation_date,
                          ValuationMethod method, PropertyType type, PropertyLocation location,
                          Date as_of, std::string notes) {
    if (!in_value_range(current_value)) {
        return reject(PropertyValuationErrorCode::InvalidCurrentValue, current_value, kMinimumValueEuros);
    }
    if (!in_value_range(purchase_price)) {
        return reject(PropertyValuationErrorCode::InvalidPurchasePrice, purchase_price, kMinimumValueEuros);
    }
    auto current_money = Money::create(current_value);
    auto purchase_money = Money::create(purchase_price);
    if (!current_money.has_value() || !purchase_money.has_value()) {
        return reject(PropertyValuationErrorCode::InvalidCurrentValue, current_value);
    }

    if (valuation_date > as_of) {
        return reject(PropertyValuationErrorCode::FutureValuationDate,
                      static_cast<double>(days_between(as_of, valuation_date)));
    }
    if (valuation_date < add_months(as_of, -kMaximumAgeMonths)) {
        return reject(PropertyValuationErrorCode::ValuationTooOld,
                      static_cast<double>(months_between(valuation_date, as_of)), kMaximumAgeMonths);
    }

    if (current_value < purchase_price) {
        const double decrease = (purchase_price - current_value) / purchase_price * 100.0;
        if (decrease > kMaximumDecreasePercent) {
            return reject(PropertyValuationErrorCode::ValueDecreaseTooSevere,
                          decrease, kMaximumDecreasePercent);
        }
    }

    if (is_blank(location.city) || is_blank(location.state) ||
        !is_valid_german_postal_code(location.postal_code)) {
        return reject(PropertyValuationErrorCode::InvalidLocation, 0.0);
    }

    return PropertyValuation{*current_money, *purchase_money, valuation_date, method, type,
                             std::move(location), std::move(notes)};
}

double PropertyValuation::value_change() const noexcept {
    return current_value_.euros() - purchase_price_.euros();
}

double PropertyValuation::value_change_percentage() const noexcept {
    // purchase_price_ is at least kMinimumValueEuros
    return value_change() / purchase_price_.euros() * 100.0;
}

int PropertyValuation::reliability_score() const noexcept {
    switch (method_) {
        case ValuationMethod::BankAppraisal:
            return 95;
        case ValuationMethod::IndependentAppraisal:
            return 90;
        case ValuationMethod::InsuranceValuation:
            return 80;
        case ValuationMethod::ComparativeMarketAnalysis:
            return 70;
        case ValuationMethod::OnlineEstimate:
            return 60;
        case ValuationMethod::SelfAssessment:
            return 40;
    }
    return 50;
}

bool PropertyValuation::is_acceptable_for_mortgage() const noexcept {
    return method_ == ValuationMethod::BankAppraisal ||
           method_ == ValuationMethod::IndependentAppraisal ||
           method_ == ValuationMethod::InsuranceValuation;
}

bool PropertyValuation::is_current_enough(Date on) const {
    return valuation_date_ >= add_months(on, -kMaximumAgeMonths);
}

std::expected<PropertyValuation, PropertyValuationError>
PropertyValuation::conservative(Date as_of, double percent) const {
    const double reduced = current_value_.euros() * (1.0 - percent / 100.0);
    std::string note = "Conservative estimate (" + format_grouped_decimal(percent, 0) +
                       " % reduction applied)";
    if (!notes_.empty()) {
        note += ". " + notes_;
    }
    return create(reduced, purchase_price_.euros(), valuation_date_, method_, type_, location_,
                  as_of, std::move(note));
}

bool is_same_property(const PropertyValuation& a, const PropertyValuation& b) {
    return a.location().postal_code == b.location().postal_code &&
           a.location().city == b.location().city &&
           a.type() == b.type();
}

std::string format_property_valuation(const PropertyValuation& valuation) {
    return std::string(to_string(valuation.type())) + " in " + valuation.location().city + ": " +
           format_money(valuation.current_value()) + " (" +
           std::string(to_string(valuation.method())) + ")";
}

} // namespace hypo
