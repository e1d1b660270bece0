// SPDX-License-Identifier: MIT
/**
 * @file portfolio.hpp
 * @brief Aggregation, optimization hints and batch status over several loans
 *
 * Only active loans enter the summary, the optimization analysis and the
 * cash-flow projection. compute_portfolio_status() evaluates every loan,
 * active or not, and runs the per-loan queries in parallel when built
 * with OpenMP.
 */

#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "src/amortization/amortization_engine.hpp"
#include "src/loan/extra_payment.hpp"
#include "src/loan/loan_configuration.hpp"
#include "src/support/calendar.hpp"
#include "src/support/error_types.hpp"
#include "src/value/money.hpp"

namespace hypo {

struct PortfolioLoan {
    std::string id;
    std::string name;
    LoanConfiguration configuration;
    Date start_date;
    bool active = true;

    /// Sorted by month without duplicates
    std::vector<ExtraPayment> extra_payments = {};
};

/// InvalidMortgageEntry for an empty id, DuplicateLoanId for a repeated one
[[nodiscard]] std::expected<void, PortfolioError> validate_portfolio(std::span<const PortfolioLoan> loans);

struct PortfolioSummary {
    Money total_principal;
    Money total_monthly_payment;
    double average_interest_rate;  ///< Amount-weighted, percent, 2 decimals; 0 without active loans
    std::size_t active_loans;
    std::size_t total_loans;
};

/// InvalidMortgageEntry when a total leaves the Money range
[[nodiscard]] std::expected<PortfolioSummary, PortfolioError>
summarize_portfolio(std::span<const PortfolioLoan> loans);

/// Thresholds of analyze_portfolio_optimization
struct OptimizationThresholds {
    /// Points above the plain average active rate that flag refinancing
    double refinancing_margin = 1.0;

    /// Loans below this amount (euros) are consolidation candidates
    double consolidation_amount = 100'000.0;

    /// Rates above this (percent) count as high interest
    double high_interest_rate = 5.0;
};

struct PortfolioOptimization {
    std::vector<PortfolioLoan> refinancing_candidates;
    std::vector<PortfolioLoan> consolidation_candidates;
    std::vector<PortfolioLoan> high_interest_loans;
};

[[nodiscard]] PortfolioOptimization
analyze_portfolio_optimization(std::span<const PortfolioLoan> loans,
                               const OptimizationThresholds& thresholds = {});

/// Batch mid-schedule query result, one entry per input loan
struct BatchLoanStatusResult {
    std::vector<std::expected<LoanStatus, AmortizationError>> results;
    std::size_t failed_count;  ///< Number of failed queries

    /// Check if all queries succeeded
    bool all_succeeded() const { return failed_count == 0; }
};

[[nodiscard]] BatchLoanStatusResult
compute_portfolio_status(std::span<const PortfolioLoan> loans, Date as_of,
                         const AmortizationConfig& config = {});

/// Month-by-month totals over the active loans (euros, rounded to cents)
struct PortfolioCashFlow {
    std::vector<double> monthly_payments;     ///< Installments due in month m
    std::vector<double> monthly_interest;     ///< Interest share of month m
    std::vector<double> cumulative_interest;  ///< Interest through month m
    std::vector<double> remaining_balance;    ///< Outstanding after month m
};

/// Closed-form projection for months 1..months; loans drop out after their term
[[nodiscard]] PortfolioCashFlow project_portfolio_cash_flow(std::span<const PortfolioLoan> loans, int months);

} // namespace hypo
