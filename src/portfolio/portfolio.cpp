// SPDX-License-Identifier: MIT
#include "src/portfolio/portfolio.hpp"
#include "src/loan/loan_terms.hpp"
#include "src/support/hypo_trace.h"
#include "src/support/parallel.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <utility>

namespace hypo {

namespace {

std::unexpected<PortfolioError> reject(PortfolioErrorCode code, double value) {
    HYPO_TRACE_VALIDATION_ERROR(MODULE_PORTFOLIO, static_cast<int>(code), value, 0.0);
    return std::unexpected(PortfolioError(code, value));
}

double round_cents(double euros) {
    return std::round(euros * 100.0) / 100.0;
}

std::vector<PortfolioLoan> active_loans(std::span<const PortfolioLoan> loans) {
    std::vector<PortfolioLoan> active;
    std::copy_if(loans.begin(), loans.end(), std::back_inserter(active),
                 [](const PortfolioLoan& loan) { return loan.active; });
    return active;
}

}  // namespace

std::expected<void, PortfolioError> validate_portfolio(std::span<const PortfolioLoan> loans) {
    std::set<std::string> seen;
    for (std::size_t i = 0; i < loans.size(); ++i) {
        if (loans[i].id.empty()) {
            return reject(PortfolioErrorCode::InvalidMortgageEntry, static_cast<double>(i));
        }
        if (!seen.insert(loans[i].id).second) {
            return reject(PortfolioErrorCode::DuplicateLoanId, static_cast<double>(i));
        }
    }
    return {};
}

std::expected<PortfolioSummary, PortfolioError> summarize_portfolio(std::span<const PortfolioLoan> loans) {
    Money principal = Money::zero();
    Money payment = Money::zero();
    double weighted_rate = 0.0;
    std::size_t active = 0;

    for (const auto& loan : loans) {
        if (!loan.active) {
            continue;
        }
        const LoanConfiguration& config = loan.configuration;
        auto next_principal = principal.add(config.amount().to_money());
        auto next_payment = payment.add(config.monthly_payment());
        if (!next_principal.has_value() || !next_payment.has_value()) {
            return reject(PortfolioErrorCode::InvalidMortgageEntry, config.amount().euros());
        }
        principal = *next_principal;
        payment = *next_payment;
        weighted_rate += config.amount().euros() * config.annual_rate().value();
        ++active;
    }

    const double average = principal.is_zero() ? 0.0 : weighted_rate / principal.euros();

    return PortfolioSummary{
        .total_principal = principal,
        .total_monthly_payment = payment,
        .average_interest_rate = std::round(average * 100.0) / 100.0,
        .active_loans = active,
        .total_loans = loans.size()
    };
}

PortfolioOptimization analyze_portfolio_optimization(std::span<const PortfolioLoan> loans,
                                                     const OptimizationThresholds& thresholds) {
    const std::vector<PortfolioLoan> active = active_loans(loans);
    PortfolioOptimization result;
    if (active.empty()) {
        return result;
    }

    double rate_sum = 0.0;
    for (const auto& loan : active) {
        rate_sum += loan.configuration.annual_rate().value();
    }
    const double average_rate = rate_sum / static_cast<double>(active.size());

    for (const auto& loan : active) {
        const double rate = loan.configuration.annual_rate().value();
        if (rate > average_rate + thresholds.refinancing_margin) {
            result.refinancing_candidates.push_back(loan);
        }
        if (loan.configuration.amount().euros() < thresholds.consolidation_amount) {
            result.consolidation_candidates.push_back(loan);
        }
        if (rate > thresholds.high_interest_rate) {
            result.high_interest_loans.push_back(loan);
        }
    }
    return result;
}

BatchLoanStatusResult compute_portfolio_status(std::span<const PortfolioLoan> loans, Date as_of,
                                               const AmortizationConfig& config) {
    if (loans.empty()) {
        return BatchLoanStatusResult{.results = {}, .failed_count = 0};
    }

    // Pre-sized so each iteration writes only its own slot
    std::vector<std::expected<LoanStatus, AmortizationError>> results(
        loans.size(), std::unexpected(AmortizationError(AmortizationErrorCode::InvalidLoanTerms)));
    std::size_t failed_count = 0;

    const AmortizationEngine engine(config);
    HYPO_TRACE_ALGO_START(MODULE_PORTFOLIO, loans.size(), 0, 0);

    HYPO_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (std::size_t i = 0; i < loans.size(); ++i) {
        const PortfolioLoan& loan = loans[i];
        results[i] = engine.status(loan.configuration.terms(), loan.extra_payments,
                                   loan.start_date, as_of);
        if (!results[i].has_value()) {
            HYPO_PRAGMA_ATOMIC
            ++failed_count;
        }
    }

    HYPO_TRACE_ALGO_COMPLETE(MODULE_PORTFOLIO, loans.size(), failed_count);
    return BatchLoanStatusResult{
        .results = std::move(results),
        .failed_count = failed_count
    };
}

PortfolioCashFlow project_portfolio_cash_flow(std::span<const PortfolioLoan> loans, int months) {
    PortfolioCashFlow flow;
    if (months <= 0) {
        return flow;
    }
    flow.monthly_payments.reserve(static_cast<std::size_t>(months));
    flow.monthly_interest.reserve(static_cast<std::size_t>(months));
    flow.cumulative_interest.reserve(static_cast<std::size_t>(months));
    flow.remaining_balance.reserve(static_cast<std::size_t>(months));

    const std::vector<PortfolioLoan> active = active_loans(loans);
    double cumulative = 0.0;

    for (int month = 1; month <= months; ++month) {
        double payment = 0.0;
        double interest = 0.0;
        double balance = 0.0;

        for (const auto& loan : active) {
            const LoanTerms terms = loan.configuration.terms();
            if (month > terms.term_months) {
                continue;
            }
            const double c = terms.monthly_rate();
            const double opening = annuity_balance(terms.amount, c, terms.term_months, month - 1);
            payment += terms.monthly_payment;
            interest += opening * c;
            balance += annuity_balance(terms.amount, c, terms.term_months, month);
        }

        cumulative += interest;
        flow.monthly_payments.push_back(round_cents(payment));
        flow.monthly_interest.push_back(round_cents(interest));
        flow.cumulative_interest.push_back(round_cents(cumulative));
        flow.remaining_balance.push_back(round_cents(balance));
    }
    return flow;
}

} // namespace hypo
