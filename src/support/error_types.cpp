// SPDX-License-Identifier: MIT
#include "src/support/error_types.hpp"

namespace hypo {

std::string_view to_string(MoneyErrorCode code) {
    switch (code) {
        case MoneyErrorCode::NegativeAmount: return "NegativeAmount";
        case MoneyErrorCode::InvalidAmount: return "InvalidAmount";
        case MoneyErrorCode::ExceedsMaximum: return "ExceedsMaximum";
        case MoneyErrorCode::TooManyDecimals: return "TooManyDecimals";
    }
    return "Unknown";
}

std::string_view to_string(PercentageErrorCode code) {
    switch (code) {
        case PercentageErrorCode::InvalidValue: return "InvalidValue";
        case PercentageErrorCode::OutOfRange: return "OutOfRange";
    }
    return "Unknown";
}

std::string_view to_string(PositiveIntegerErrorCode code) {
    switch (code) {
        case PositiveIntegerErrorCode::InvalidValue: return "InvalidValue";
        case PositiveIntegerErrorCode::NotPositive: return "NotPositive";
        case PositiveIntegerErrorCode::NotInteger: return "NotInteger";
        case PositiveIntegerErrorCode::Overflow: return "Overflow";
    }
    return "Unknown";
}

std::string_view to_string(PositiveDecimalErrorCode code) {
    switch (code) {
        case PositiveDecimalErrorCode::InvalidValue: return "InvalidValue";
        case PositiveDecimalErrorCode::NotPositive: return "NotPositive";
    }
    return "Unknown";
}

std::string_view to_string(LoanAmountErrorCode code) {
    switch (code) {
        case LoanAmountErrorCode::MoneyValidationError: return "MoneyValidationError";
        case LoanAmountErrorCode::BelowMinimum: return "BelowMinimum";
        case LoanAmountErrorCode::AboveMaximum: return "AboveMaximum";
    }
    return "Unknown";
}

std::string_view to_string(InterestRateErrorCode code) {
    switch (code) {
        case InterestRateErrorCode::PercentageValidationError: return "PercentageValidationError";
        case InterestRateErrorCode::BelowMinimumRate: return "BelowMinimumRate";
        case InterestRateErrorCode::AboveMaximumRate: return "AboveMaximumRate";
    }
    return "Unknown";
}

std::string_view to_string(TermErrorCode code) {
    switch (code) {
        case TermErrorCode::PositiveIntegerValidationError: return "PositiveIntegerValidationError";
        case TermErrorCode::BelowMinimumTerm: return "BelowMinimumTerm";
        case TermErrorCode::AboveMaximumTerm: return "AboveMaximumTerm";
    }
    return "Unknown";
}

std::string_view to_string(PaymentMonthErrorCode code) {
    switch (code) {
        case PaymentMonthErrorCode::PositiveIntegerValidationError: return "PositiveIntegerValidationError";
        case PaymentMonthErrorCode::InvalidPaymentMonth: return "InvalidPaymentMonth";
    }
    return "Unknown";
}

std::string_view to_string(MonthlyPaymentErrorCode code) {
    switch (code) {
        case MonthlyPaymentErrorCode::InvalidPrincipal: return "InvalidPrincipal";
        case MonthlyPaymentErrorCode::InvalidInterest: return "InvalidInterest";
        case MonthlyPaymentErrorCode::InvalidTotal: return "InvalidTotal";
        case MonthlyPaymentErrorCode::InconsistentAmounts: return "InconsistentAmounts";
    }
    return "Unknown";
}

std::string_view to_string(LoanConfigurationErrorCode code) {
    switch (code) {
        case LoanConfigurationErrorCode::InvalidLoanAmount: return "InvalidLoanAmount";
        case LoanConfigurationErrorCode::InvalidInterestRate: return "InvalidInterestRate";
        case LoanConfigurationErrorCode::InvalidTerm: return "InvalidTerm";
        case LoanConfigurationErrorCode::InvalidMonthlyPayment: return "InvalidMonthlyPayment";
        case LoanConfigurationErrorCode::InconsistentParameters: return "InconsistentParameters";
    }
    return "Unknown";
}

std::string_view to_string(ExtraPaymentErrorCode code) {
    switch (code) {
        case ExtraPaymentErrorCode::InvalidPaymentMonth: return "InvalidPaymentMonth";
        case ExtraPaymentErrorCode::InvalidAmount: return "InvalidAmount";
        case ExtraPaymentErrorCode::AmountTooLarge: return "AmountTooLarge";
    }
    return "Unknown";
}

std::string_view to_string(FixedRatePeriodErrorCode code) {
    switch (code) {
        case FixedRatePeriodErrorCode::InvalidPeriodLength: return "InvalidPeriodLength";
        case FixedRatePeriodErrorCode::InvalidInterestRate: return "InvalidInterestRate";
        case FixedRatePeriodErrorCode::PeriodTooShort: return "PeriodTooShort";
        case FixedRatePeriodErrorCode::PeriodTooLong: return "PeriodTooLong";
    }
    return "Unknown";
}

std::string_view to_string(CalculationErrorCode code) {
    switch (code) {
        case CalculationErrorCode::InvalidParameters: return "InvalidParameters";
        case CalculationErrorCode::InsufficientPayment: return "InsufficientPayment";
        case CalculationErrorCode::ConvergenceFailure: return "ConvergenceFailure";
        case CalculationErrorCode::MathematicalError: return "MathematicalError";
    }
    return "Unknown";
}

std::string_view to_string(AmortizationErrorCode code) {
    switch (code) {
        case AmortizationErrorCode::InvalidLoanTerms: return "InvalidLoanTerms";
        case AmortizationErrorCode::PaymentBelowInterest: return "PaymentBelowInterest";
        case AmortizationErrorCode::UnorderedExtraPayments: return "UnorderedExtraPayments";
        case AmortizationErrorCode::DuplicateExtraPayment: return "DuplicateExtraPayment";
        case AmortizationErrorCode::MonthNotInSchedule: return "MonthNotInSchedule";
        case AmortizationErrorCode::EmptySchedule: return "EmptySchedule";
        case AmortizationErrorCode::AmountOverflow: return "AmountOverflow";
    }
    return "Unknown";
}

std::string_view to_string(PropertyValuationErrorCode code) {
    switch (code) {
        case PropertyValuationErrorCode::InvalidCurrentValue: return "InvalidCurrentValue";
        case PropertyValuationErrorCode::InvalidPurchasePrice: return "InvalidPurchasePrice";
        case PropertyValuationErrorCode::FutureValuationDate: return "FutureValuationDate";
        case PropertyValuationErrorCode::ValuationTooOld: return "ValuationTooOld";
        case PropertyValuationErrorCode::ValueDecreaseTooSevere: return "ValueDecreaseTooSevere";
        case PropertyValuationErrorCode::InvalidLocation: return "InvalidLocation";
    }
    return "Unknown";
}

std::string_view to_string(LoanToValueErrorCode code) {
    switch (code) {
        case LoanToValueErrorCode::InvalidLoanAmount: return "InvalidLoanAmount";
        case LoanToValueErrorCode::PropertyValuationNotAcceptable: return "PropertyValuationNotAcceptable";
        case LoanToValueErrorCode::PropertyValueTooLow: return "PropertyValueTooLow";
        case LoanToValueErrorCode::LTVTooHigh: return "LTVTooHigh";
    }
    return "Unknown";
}

std::string_view to_string(SondertilgungErrorCode code) {
    switch (code) {
        case SondertilgungErrorCode::ExceedsAllowedPercentage: return "ExceedsAllowedPercentage";
        case SondertilgungErrorCode::BelowMinimumAmount: return "BelowMinimumAmount";
        case SondertilgungErrorCode::AboveMaximumAmount: return "AboveMaximumAmount";
        case SondertilgungErrorCode::WithinGracePeriod: return "WithinGracePeriod";
        case SondertilgungErrorCode::InsufficientNotice: return "InsufficientNotice";
        case SondertilgungErrorCode::InvalidPaymentDate: return "InvalidPaymentDate";
        case SondertilgungErrorCode::DuringBlackoutPeriod: return "DuringBlackoutPeriod";
        case SondertilgungErrorCode::ExcessiveFeeAmount: return "ExcessiveFeeAmount";
        case SondertilgungErrorCode::NotAllowedForBankType: return "NotAllowedForBankType";
    }
    return "Unknown";
}

std::string_view to_string(SondertilgungPlanErrorCode code) {
    switch (code) {
        case SondertilgungPlanErrorCode::NoPayments: return "NoPayments";
        case SondertilgungPlanErrorCode::DuplicatePaymentMonth: return "DuplicatePaymentMonth";
        case SondertilgungPlanErrorCode::ExceedsYearlyLimit: return "ExceedsYearlyLimit";
        case SondertilgungPlanErrorCode::InvalidPaymentAmount: return "InvalidPaymentAmount";
    }
    return "Unknown";
}

std::string_view to_string(PortfolioErrorCode code) {
    switch (code) {
        case PortfolioErrorCode::InvalidMortgageEntry: return "InvalidMortgageEntry";
        case PortfolioErrorCode::DuplicateLoanId: return "DuplicateLoanId";
    }
    return "Unknown";
}

} // namespace hypo
