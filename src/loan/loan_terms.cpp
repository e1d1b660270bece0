// SPDX-License-Identifier: MIT
#include "src/loan/loan_terms.hpp"
#include "src/support/hypo_trace.h"

#include <cmath>

namespace hypo {

namespace {

std::unexpected<CalculationError> reject(double value, double bound) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_AMORTIZATION,
        static_cast<int>(CalculationErrorCode::InvalidParameters), value, bound);
    return std::unexpected(CalculationError(CalculationErrorCode::InvalidParameters, value));
}

}  // namespace

std::expected<void, CalculationError> validate_loan_terms(const LoanTerms& terms) {
    if (!std::isfinite(terms.amount) || terms.amount <= 0.0) {
        return reject(terms.amount, 0.0);
    }
    if (!std::isfinite(terms.annual_rate) || terms.annual_rate < 0.0 || terms.annual_rate >= 100.0) {
        return reject(terms.annual_rate, 100.0);
    }
    if (terms.term_months < 1 || terms.term_months > 480) {
        return reject(static_cast<double>(terms.term_months), 480.0);
    }
    if (!std::isfinite(terms.monthly_payment) || terms.monthly_payment <= 0.0) {
        return reject(terms.monthly_payment, 0.0);
    }
    return {};
}

} // namespace hypo
