// SPDX-License-Identifier: MIT
/**
 * @file property_valuation.hpp
 * @brief Dated market valuation of a German residential or commercial property
 */

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include "src/support/calendar.hpp"
#include "src/support/error_types.hpp"
#include "src/value/money.hpp"

namespace hypo {

enum class ValuationMethod {
    BankAppraisal,
    IndependentAppraisal,
    OnlineEstimate,
    ComparativeMarketAnalysis,
    SelfAssessment,
    InsuranceValuation
};

enum class PropertyType {
    Eigenheim,
    Eigentumswohnung,
    Reihenhaus,
    Doppelhaushaelfte,
    Mehrfamilienhaus,
    Baugrundstueck,
    Gewerbeimmobilie
};

enum class LocationQuality {
    Premium,
    Good,
    Average,
    BelowAverage,
    Rural
};

struct PropertyLocation {
    std::string city;
    std::string state;        ///< Bundesland
    std::string postal_code;  ///< Five digits
    LocationQuality quality = LocationQuality::Average;

    friend bool operator==(const PropertyLocation&, const PropertyLocation&) = default;
};

std::string_view to_string(ValuationMethod method);

/// German name, e.g. "Doppelhaushälfte"
std::string_view to_string(PropertyType type);

/// "Erstklassige Lage (Top-Städte)", "Gute Wohnlage", ...
std::string_view location_quality_description(LocationQuality quality);

/// Exactly five ASCII digits
[[nodiscard]] bool is_valid_german_postal_code(std::string_view postal_code);

class PropertyValuation {
public:
    static constexpr double kMinimumValueEuros = 10'000.0;
    static constexpr double kMaximumValueEuros = 50'000'000.0;
    static constexpr int kMaximumAgeMonths = 24;
    static constexpr double kMaximumDecreasePercent = 50.0;

    /// Checks, in order: value bounds of current value then purchase price,
    /// a valuation date after `as_of`, a valuation older than 24 months,
    /// a drop of more than 50 % from the purchase price, and the location
    [[nodiscard]] static std::expected<PropertyValuation, PropertyValuationError>
    create(double current_value, double purchase_price, Date valuation_date,
           ValuationMethod method, PropertyType type, PropertyLocation location,
           Date as_of, std::string notes = {});

    [[nodiscard]] Money current_value() const noexcept { return current_value_; }
    [[nodiscard]] Money purchase_price() const noexcept { return purchase_price_; }
    [[nodiscard]] Date valuation_date() const noexcept { return valuation_date_; }
    [[nodiscard]] ValuationMethod method() const noexcept { return method_; }
    [[nodiscard]] PropertyType type() const noexcept { return type_; }
    [[nodiscard]] const PropertyLocation& location() const noexcept { return location_; }
    [[nodiscard]] const std::string& notes() const noexcept { return notes_; }

    /// current - purchase, euros
    [[nodiscard]] double value_change() const noexcept;
    [[nodiscard]] double value_change_percentage() const noexcept;

    [[nodiscard]] bool has_appreciated() const noexcept { return value_change() > 0.0; }
    [[nodiscard]] bool has_depreciated() const noexcept { return value_change() < 0.0; }

    /// 40 (self assessment) to 95 (bank appraisal)
    [[nodiscard]] int reliability_score() const noexcept;

    /// Bank, independent and insurance valuations only
    [[nodiscard]] bool is_acceptable_for_mortgage() const noexcept;

    /// At most 24 months old on `on`
    [[nodiscard]] bool is_current_enough(Date on) const;

    /// Copy with the current value reduced by `percent`; re-validated as of `as_of`
    [[nodiscard]] std::expected<PropertyValuation, PropertyValuationError>
    conservative(Date as_of, double percent = 10.0) const;

private:
    PropertyValuation(Money current_value, Money purchase_price, Date valuation_date,
                      ValuationMethod method, PropertyType type, PropertyLocation location,
                      std::string notes)
        : current_value_(current_value), purchase_price_(purchase_price),
          valuation_date_(valuation_date), method_(method), type_(type),
          location_(std::move(location)), notes_(std::move(notes)) {}

    Money current_value_;
    Money purchase_price_;
    Date valuation_date_;
    ValuationMethod method_;
    PropertyType type_;
    PropertyLocation location_;
    std::string notes_;
};

/// Same postal code, city and property type
[[nodiscard]] bool is_same_property(const PropertyValuation& a, const PropertyValuation& b);

/// "Eigentumswohnung in München: 500.000,00 € (BankAppraisal)"
std::string format_property_valuation(const PropertyValuation& valuation);

} // namespace hypo
