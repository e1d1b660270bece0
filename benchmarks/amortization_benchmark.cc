#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

#include "src/amortization/amortization_engine.hpp"
#include "src/loan/loan_calculations.hpp"
#include "src/portfolio/portfolio.hpp"

using namespace hypo;

namespace {

LoanConfiguration make_loan(double amount, double rate, double months) {
    return LoanConfiguration::with_calculated_payment(
        LoanAmount::create(amount).value(),
        InterestRate::create(rate).value(),
        MonthCount::create(months).value()).value();
}

std::vector<ExtraPayment> yearly_extras(int count) {
    std::vector<ExtraPayment> extras;
    for (int year = 1; year <= count; ++year) {
        extras.push_back(ExtraPayment::create(PaymentMonth::create(year * 12).value(), 5000.0).value());
    }
    return extras;
}

std::vector<PortfolioLoan> make_portfolio(std::size_t n_loans) {
    std::vector<PortfolioLoan> loans;
    loans.reserve(n_loans);
    for (std::size_t i = 0; i < n_loans; ++i) {
        loans.push_back(PortfolioLoan{
            .id = "loan-" + std::to_string(i),
            .name = "Darlehen " + std::to_string(i),
            .configuration = make_loan(100000.0 + 1000.0 * static_cast<double>(i % 200),
                                       2.0 + 0.01 * static_cast<double>(i % 300),
                                       120.0 + static_cast<double>(12 * (i % 20))),
            .start_date = make_date(2020, 1, 1),
        });
    }
    return loans;
}

}  // namespace

// Benchmark: full schedule for a 300-month annuity, with and without yearly extras
static void BM_Amortization_Schedule(benchmark::State& state) {
    const LoanConfiguration config = make_loan(300000.0, 3.5, 300.0);
    const std::vector<ExtraPayment> extras = yearly_extras(static_cast<int>(state.range(0)));
    const AmortizationEngine engine;

    for (auto _ : state) {
        auto schedule = engine.generate(config, extras);
        benchmark::DoNotOptimize(schedule);
    }

    state.SetItemsProcessed(state.iterations() * 300);
    state.SetLabel(std::to_string(extras.size()) + " extras");
}

// Benchmark: mid-schedule status, replay plus closed-form remainder
static void BM_Amortization_Status(benchmark::State& state) {
    const LoanTerms terms = make_loan(300000.0, 3.5, 300.0).terms();
    const AmortizationEngine engine;
    const Date start = make_date(2020, 1, 1);
    const Date as_of = add_months(start, static_cast<int>(state.range(0)));

    for (auto _ : state) {
        auto status = engine.status(terms, {}, start, as_of);
        benchmark::DoNotOptimize(status);
    }

    state.SetItemsProcessed(state.iterations());
}

// Benchmark: implied rate via bisection
static void BM_ImpliedInterestRate(benchmark::State& state) {
    const LoanConfiguration config = make_loan(300000.0, 3.5, 300.0);

    for (auto _ : state) {
        auto rate = calculate_interest_rate(config.amount(), config.term(), config.monthly_payment());
        benchmark::DoNotOptimize(rate);
    }

    state.SetItemsProcessed(state.iterations());
}

// Benchmark: batch status over a portfolio (OpenMP parallel when enabled)
static void BM_Portfolio_Status(benchmark::State& state) {
    const std::vector<PortfolioLoan> loans = make_portfolio(static_cast<std::size_t>(state.range(0)));
    const Date as_of = make_date(2026, 6, 30);

    for (auto _ : state) {
        BatchLoanStatusResult batch = compute_portfolio_status(loans, as_of);
        benchmark::DoNotOptimize(batch.failed_count);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(loans.size()));
}

// Benchmark: 30-year cash-flow projection over a portfolio
static void BM_Portfolio_CashFlow(benchmark::State& state) {
    const std::vector<PortfolioLoan> loans = make_portfolio(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        PortfolioCashFlow flow = project_portfolio_cash_flow(loans, 360);
        benchmark::DoNotOptimize(flow.remaining_balance.data());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(loans.size()));
}

BENCHMARK(BM_Amortization_Schedule)->Arg(0)->Arg(5)->Arg(20);
BENCHMARK(BM_Amortization_Status)->Arg(12)->Arg(120)->Arg(300);
BENCHMARK(BM_ImpliedInterestRate);
BENCHMARK(BM_Portfolio_Status)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_Portfolio_CashFlow)->Arg(10)->Arg(100);
