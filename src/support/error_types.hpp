// SPDX-License-Identifier: MIT
/**
 * @file error_types.hpp
 * @brief Closed error-code sets and the error carrier used by every factory
 */

#pragma once

#include <concepts>
#include <ostream>
#include <string_view>
#include <type_traits>

namespace hypo {

/// Error codes for Money construction and arithmetic
enum class MoneyErrorCode {
    NegativeAmount,
    InvalidAmount,
    ExceedsMaximum,
    TooManyDecimals
};

/// Error codes for Percentage construction and arithmetic
enum class PercentageErrorCode {
    InvalidValue,
    OutOfRange
};

/// Error codes for PositiveInteger construction and arithmetic
enum class PositiveIntegerErrorCode {
    InvalidValue,
    NotPositive,
    NotInteger,
    Overflow
};

/// Error codes for PositiveDecimal construction and arithmetic
enum class PositiveDecimalErrorCode {
    InvalidValue,
    NotPositive
};

/// Error codes for LoanAmount
enum class LoanAmountErrorCode {
    MoneyValidationError,
    BelowMinimum,
    AboveMaximum
};

/// Error codes for InterestRate
enum class InterestRateErrorCode {
    PercentageValidationError,
    BelowMinimumRate,
    AboveMaximumRate
};

/// Error codes shared by MonthCount and YearCount
enum class TermErrorCode {
    PositiveIntegerValidationError,
    BelowMinimumTerm,
    AboveMaximumTerm
};

/// Error codes for PaymentMonth
enum class PaymentMonthErrorCode {
    PositiveIntegerValidationError,
    InvalidPaymentMonth
};

/// Error codes for MonthlyPayment
enum class MonthlyPaymentErrorCode {
    InvalidPrincipal,
    InvalidInterest,
    InvalidTotal,
    InconsistentAmounts
};

/// Error codes for LoanConfiguration
enum class LoanConfigurationErrorCode {
    InvalidLoanAmount,
    InvalidInterestRate,
    InvalidTerm,
    InvalidMonthlyPayment,
    InconsistentParameters
};

/// Error codes for ExtraPayment
enum class ExtraPaymentErrorCode {
    InvalidPaymentMonth,
    InvalidAmount,
    AmountTooLarge
};

/// Error codes for FixedRatePeriod
enum class FixedRatePeriodErrorCode {
    InvalidPeriodLength,
    InvalidInterestRate,
    PeriodTooShort,
    PeriodTooLong
};

/// Error codes for closed-form loan calculations
enum class CalculationErrorCode {
    InvalidParameters,
    InsufficientPayment,
    ConvergenceFailure,
    MathematicalError
};

/// Error codes for schedule generation and queries
enum class AmortizationErrorCode {
    InvalidLoanTerms,
    PaymentBelowInterest,
    UnorderedExtraPayments,
    DuplicateExtraPayment,
    MonthNotInSchedule,
    EmptySchedule,
    AmountOverflow
};

/// Error codes for PropertyValuation
enum class PropertyValuationErrorCode {
    InvalidCurrentValue,
    InvalidPurchasePrice,
    FutureValuationDate,
    ValuationTooOld,
    ValueDecreaseTooSevere,
    InvalidLocation
};

/// Error codes for LoanToValueRatio
enum class LoanToValueErrorCode {
    InvalidLoanAmount,
    PropertyValuationNotAcceptable,
    PropertyValueTooLow,
    LTVTooHigh
};

/// Error codes for Sondertilgung rule validation and pricing
enum class SondertilgungErrorCode {
    ExceedsAllowedPercentage,
    BelowMinimumAmount,
    AboveMaximumAmount,
    WithinGracePeriod,
    InsufficientNotice,
    InvalidPaymentDate,
    DuringBlackoutPeriod,
    ExcessiveFeeAmount,
    NotAllowedForBankType
};

/// Error codes for Sondertilgung plans
enum class SondertilgungPlanErrorCode {
    NoPayments,
    DuplicatePaymentMonth,
    ExceedsYearlyLimit,
    InvalidPaymentAmount
};

/// Error codes for portfolio aggregation
enum class PortfolioErrorCode {
    InvalidMortgageEntry,
    DuplicateLoanId
};

std::string_view to_string(MoneyErrorCode code);
std::string_view to_string(PercentageErrorCode code);
std::string_view to_string(PositiveIntegerErrorCode code);
std::string_view to_string(PositiveDecimalErrorCode code);
std::string_view to_string(LoanAmountErrorCode code);
std::string_view to_string(InterestRateErrorCode code);
std::string_view to_string(TermErrorCode code);
std::string_view to_string(PaymentMonthErrorCode code);
std::string_view to_string(MonthlyPaymentErrorCode code);
std::string_view to_string(LoanConfigurationErrorCode code);
std::string_view to_string(ExtraPaymentErrorCode code);
std::string_view to_string(FixedRatePeriodErrorCode code);
std::string_view to_string(CalculationErrorCode code);
std::string_view to_string(AmortizationErrorCode code);
std::string_view to_string(PropertyValuationErrorCode code);
std::string_view to_string(LoanToValueErrorCode code);
std::string_view to_string(SondertilgungErrorCode code);
std::string_view to_string(SondertilgungPlanErrorCode code);
std::string_view to_string(PortfolioErrorCode code);

/// Error code enums that have a to_string overload
template <typename Code>
concept ErrorCode = std::is_enum_v<Code> && requires(Code c) {
    { to_string(c) } -> std::convertible_to<std::string_view>;
};

/// Detailed error passed through the expected failure path
template <ErrorCode Code>
struct DomainError {
    Code code;
    double value;  // The rejected input (0 if not applicable)

    DomainError(Code code, double value = 0.0)
        : code(code), value(value) {}
};

using MoneyError = DomainError<MoneyErrorCode>;
using PercentageError = DomainError<PercentageErrorCode>;
using PositiveIntegerError = DomainError<PositiveIntegerErrorCode>;
using PositiveDecimalError = DomainError<PositiveDecimalErrorCode>;
using LoanAmountError = DomainError<LoanAmountErrorCode>;
using InterestRateError = DomainError<InterestRateErrorCode>;
using TermError = DomainError<TermErrorCode>;
using PaymentMonthError = DomainError<PaymentMonthErrorCode>;
using MonthlyPaymentError = DomainError<MonthlyPaymentErrorCode>;
using LoanConfigurationError = DomainError<LoanConfigurationErrorCode>;
using ExtraPaymentError = DomainError<ExtraPaymentErrorCode>;
using FixedRatePeriodError = DomainError<FixedRatePeriodErrorCode>;
using CalculationError = DomainError<CalculationErrorCode>;
using AmortizationError = DomainError<AmortizationErrorCode>;
using PropertyValuationError = DomainError<PropertyValuationErrorCode>;
using LoanToValueError = DomainError<LoanToValueErrorCode>;
using SondertilgungError = DomainError<SondertilgungErrorCode>;
using SondertilgungPlanError = DomainError<SondertilgungPlanErrorCode>;
using PortfolioError = DomainError<PortfolioErrorCode>;

/// Output stream operator for error codes
template <ErrorCode Code>
std::ostream& operator<<(std::ostream& os, Code code) {
    return os << to_string(code);
}

/// Output stream operator for DomainError
template <ErrorCode Code>
std::ostream& operator<<(std::ostream& os, const DomainError<Code>& err) {
    os << "DomainError{code=" << to_string(err.code)
       << ", value=" << err.value << "}";
    return os;
}

} // namespace hypo
