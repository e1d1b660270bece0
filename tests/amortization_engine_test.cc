/**
 * @file amortization_engine_test.cc
 * @brief Schedule generation and mid-schedule status queries
 *
 * Validates:
 * - Annuity schedule for the standard €300,000 / 3.5 % / 300 month loan
 * - Conservation of principal and per-month payment identity
 * - Extra payments (ordering, clamping, past-term, shorter terms)
 * - Zero-rate straight-line amortization
 * - LoanStatus replay, payoff dates and the materialized schedule
 */

#include <gtest/gtest.h>
#include "src/amortization/amortization_engine.hpp"

#include <vector>

using namespace hypo;

namespace {

LoanConfiguration standard_loan() {
    return LoanConfiguration::with_calculated_payment(
        LoanAmount::create(300000.0).value(),
        InterestRate::create(3.5).value(),
        MonthCount::create(300.0).value()).value();
}

ExtraPayment extra(int month, double euros) {
    return ExtraPayment::create(PaymentMonth::create(month).value(), euros).value();
}

double total_principal(const AmortizationSchedule& schedule) {
    double sum = 0.0;
    for (const auto& entry : schedule.entries) {
        sum += entry.principal_component();
    }
    return sum;
}

}  // namespace

// ===========================================================================
// Schedule generation
// ===========================================================================

TEST(AmortizationEngineTest, StandardLoanPaysOffWithinTerm) {
    const LoanConfiguration config = standard_loan();
    EXPECT_NEAR(config.monthly_payment().euros(), annuity_payment(300000.0, 0.035 / 12.0, 300), 1.0);

    AmortizationEngine engine;
    auto schedule = engine.generate(config);
    ASSERT_TRUE(schedule.has_value());

    EXPECT_LE(schedule->entries.size(), 300u);
    EXPECT_GE(schedule->entries.size(), 299u);
    EXPECT_TRUE(schedule->is_paid_off());
    EXPECT_DOUBLE_EQ(schedule->final_balance(), 0.0);

    const PaymentDetail& first = schedule->entries.front();
    EXPECT_EQ(first.month, 1);
    EXPECT_DOUBLE_EQ(first.starting_balance, 300000.0);
    EXPECT_NEAR(first.interest, 875.0, 1e-9);
}

TEST(AmortizationEngineTest, PrincipalIsConserved) {
    AmortizationEngine engine;
    const std::vector<ExtraPayment> extras = {extra(12, 10000.0), extra(60, 25000.0)};

    for (const auto& plan : {std::vector<ExtraPayment>{}, extras}) {
        auto schedule = engine.generate(standard_loan(), plan);
        ASSERT_TRUE(schedule.has_value());
        EXPECT_NEAR(total_principal(*schedule), 300000.0, 1.0);
        EXPECT_NEAR(schedule->entries.back().cumulative_principal, 300000.0, 1.0);
    }
}

TEST(AmortizationEngineTest, MonthlyPaymentIdentity) {
    AmortizationEngine engine;
    const LoanConfiguration config = standard_loan();
    auto schedule = engine.generate(config);
    ASSERT_TRUE(schedule.has_value());

    const double payment = config.monthly_payment().euros();
    for (size_t i = 0; i + 1 < schedule->entries.size(); ++i) {
        const PaymentDetail& entry = schedule->entries[i];
        EXPECT_NEAR(entry.interest + entry.principal, payment, 1e-9) << "month " << entry.month;
        EXPECT_NEAR(entry.interest + entry.principal_component(), entry.total_payment(), 1e-9);
        EXPECT_NEAR(entry.starting_balance - entry.principal_component(), entry.remaining_balance, 1e-6);
    }
}

TEST(AmortizationEngineTest, ExtraPaymentsShortenTheSchedule) {
    AmortizationEngine engine;
    auto base = engine.generate(standard_loan());
    auto faster = engine.generate(standard_loan(), std::vector<ExtraPayment>{extra(12, 20000.0)});
    ASSERT_TRUE(base.has_value());
    ASSERT_TRUE(faster.has_value());

    EXPECT_LT(faster->entries.size(), base->entries.size());
    EXPECT_DOUBLE_EQ(faster->entries[11].extra_payment, 20000.0);
    EXPECT_LT(faster->entries.back().cumulative_interest, base->entries.back().cumulative_interest);
}

TEST(AmortizationEngineTest, ExtraPaymentIsClampedToBalance) {
    AmortizationEngine engine;
    auto schedule = engine.generate(standard_loan(), std::vector<ExtraPayment>{extra(1, 1'000'000.0)});
    ASSERT_TRUE(schedule.has_value());

    ASSERT_EQ(schedule->entries.size(), 1u);
    const PaymentDetail& only = schedule->entries.front();
    EXPECT_DOUBLE_EQ(only.remaining_balance, 0.0);
    EXPECT_NEAR(only.principal_component(), 300000.0, 1e-6);
    EXPECT_LT(only.extra_payment, 300000.0);
}

TEST(AmortizationEngineTest, ExtraPaymentsPastTermAreIgnored) {
    const LoanConfiguration short_loan = LoanConfiguration::with_calculated_payment(
        LoanAmount::create(50000.0).value(),
        InterestRate::create(4.0).value(),
        MonthCount::create(60.0).value()).value();

    AmortizationEngine engine;
    auto base = engine.generate(short_loan);
    auto with_late = engine.generate(short_loan, std::vector<ExtraPayment>{extra(120, 5000.0)});
    ASSERT_TRUE(base.has_value());
    ASSERT_TRUE(with_late.has_value());
    EXPECT_EQ(with_late->entries.size(), base->entries.size());
    EXPECT_DOUBLE_EQ(total_principal(*with_late), total_principal(*base));
}

TEST(AmortizationEngineTest, ZeroRateIsStraightLine) {
    const LoanTerms terms{.amount = 12000.0, .annual_rate = 0.0, .term_months = 12, .monthly_payment = 1000.0};

    AmortizationEngine engine;
    auto schedule = engine.generate(terms);
    ASSERT_TRUE(schedule.has_value());
    ASSERT_EQ(schedule->entries.size(), 12u);
    for (const auto& entry : schedule->entries) {
        EXPECT_DOUBLE_EQ(entry.interest, 0.0);
        EXPECT_NEAR(entry.principal, 1000.0, 1e-9);
    }
    EXPECT_DOUBLE_EQ(schedule->final_balance(), 0.0);
}

TEST(AmortizationEngineTest, UnsettledFinalInstallmentLeavesDust) {
    // Installment rounded down one cent: without settlement a remainder is left
    LoanTerms terms = standard_loan().terms();
    terms.monthly_payment = annuity_payment(terms.amount, terms.monthly_rate(), terms.term_months) - 0.01;

    AmortizationEngine settled;
    AmortizationEngine unsettled(AmortizationConfig{.settle_final_installment = false});

    auto a = settled.generate(terms);
    auto b = unsettled.generate(terms);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_DOUBLE_EQ(a->final_balance(), 0.0);
    EXPECT_EQ(b->entries.size(), 300u);
    EXPECT_GT(b->final_balance(), 0.0);
    EXPECT_LT(b->final_balance(), 10.0);
}

TEST(AmortizationEngineTest, UnderfundedInstallmentIsNotSettled) {
    // 500 € a month cannot repay 100.000 € in 12 months at 5 %
    const LoanTerms terms{.amount = 100000.0, .annual_rate = 5.0, .term_months = 12, .monthly_payment = 500.0};

    AmortizationEngine engine;
    auto schedule = engine.generate(terms);
    ASSERT_TRUE(schedule.has_value());
    ASSERT_EQ(schedule->entries.size(), 12u);
    EXPECT_FALSE(schedule->is_paid_off());
    EXPECT_GT(schedule->final_balance(), 98000.0);

    for (const auto& entry : schedule->entries) {
        EXPECT_NEAR(entry.interest + entry.principal, 500.0, 1e-9) << entry.month;
        EXPECT_DOUBLE_EQ(entry.total_payment(), entry.interest + entry.principal);
    }
    EXPECT_NEAR(schedule->entries.back().total_payment(), 500.0, 1e-9);

    // Within the tolerance the same loan is settled in month 12
    LoanTerms funded = terms;
    funded.monthly_payment = annuity_payment(terms.amount, terms.monthly_rate(), terms.term_months) - 0.5;
    auto settled = engine.generate(funded);
    ASSERT_TRUE(settled.has_value());
    EXPECT_TRUE(settled->is_paid_off());
    EXPECT_EQ(settled->entries.size(), 12u);
}

TEST(AmortizationEngineTest, RejectsInvalidInput) {
    AmortizationEngine engine;

    LoanTerms low_payment = standard_loan().terms();
    low_payment.monthly_payment = 800.0;
    EXPECT_EQ(engine.generate(low_payment).error().code, AmortizationErrorCode::PaymentBelowInterest);

    LoanTerms no_amount = standard_loan().terms();
    no_amount.amount = 0.0;
    EXPECT_EQ(engine.generate(no_amount).error().code, AmortizationErrorCode::InvalidLoanTerms);

    const std::vector<ExtraPayment> unordered = {extra(12, 1000.0), extra(6, 1000.0)};
    EXPECT_EQ(engine.generate(standard_loan(), unordered).error().code,
              AmortizationErrorCode::UnorderedExtraPayments);

    const std::vector<ExtraPayment> duplicate = {extra(6, 1000.0), extra(6, 2000.0)};
    EXPECT_EQ(engine.generate(standard_loan(), duplicate).error().code,
              AmortizationErrorCode::DuplicateExtraPayment);
}

TEST(AmortizationEngineTest, GeneratesFromSondertilgungPlan) {
    auto plan = SondertilgungPlan::create(SondertilgungLimit::of(Percentage::create(5.0).value()),
                                          {extra(24, 5000.0), extra(12, 5000.0)});
    ASSERT_TRUE(plan.has_value());

    AmortizationEngine engine;
    auto schedule = engine.generate(standard_loan(), *plan);
    ASSERT_TRUE(schedule.has_value());
    EXPECT_DOUBLE_EQ(schedule->entries[11].extra_payment, 5000.0);
    EXPECT_DOUBLE_EQ(schedule->entries[23].extra_payment, 5000.0);
}

// ===========================================================================
// Mid-schedule status
// ===========================================================================

TEST(LoanStatusTest, ReplaysElapsedMonths) {
    const LoanConfiguration config = standard_loan();
    AmortizationEngine engine;
    auto schedule = engine.generate(config);
    auto status = engine.status(config.terms(), {}, make_date(2024, 1, 1), make_date(2025, 1, 15));
    ASSERT_TRUE(schedule.has_value());
    ASSERT_TRUE(status.has_value());

    EXPECT_EQ(status->months_elapsed, 12);
    EXPECT_EQ(status->payments_made, 12);
    EXPECT_DOUBLE_EQ(status->current_balance, schedule->entries[11].remaining_balance);
    EXPECT_DOUBLE_EQ(status->total_interest_paid, schedule->entries[11].cumulative_interest);
    EXPECT_NEAR(status->total_paid, 12.0 * config.monthly_payment().euros(), 1e-6);
    EXPECT_EQ(status->remaining_months, 288);
    EXPECT_EQ(status->payoff_date, make_date(2049, 1, 15));
    EXPECT_GT(status->remaining_interest, 0.0);
    EXPECT_FALSE(status->schedule.has_value());
    EXPECT_FALSE(status->is_paid_off());
}

TEST(LoanStatusTest, BeforeStartNothingIsPaid) {
    AmortizationEngine engine;
    auto status = engine.status(standard_loan().terms(), {}, make_date(2024, 6, 1), make_date(2024, 1, 1));
    ASSERT_TRUE(status.has_value());

    EXPECT_EQ(status->months_elapsed, 0);
    EXPECT_EQ(status->payments_made, 0);
    EXPECT_DOUBLE_EQ(status->current_balance, 300000.0);
    EXPECT_EQ(status->remaining_months, 300);
    EXPECT_DOUBLE_EQ(status->total_paid, 0.0);
}

TEST(LoanStatusTest, PaidOffLoanReportsActualPayoffMonth) {
    AmortizationEngine engine;
    auto status = engine.status(standard_loan().terms(), {}, make_date(2024, 1, 1), make_date(2060, 1, 1));
    ASSERT_TRUE(status.has_value());

    EXPECT_TRUE(status->is_paid_off());
    EXPECT_EQ(status->remaining_months, 0);
    EXPECT_DOUBLE_EQ(status->remaining_interest, 0.0);
    EXPECT_EQ(status->payoff_date, add_months(make_date(2024, 1, 1), status->payments_made));
}

TEST(LoanStatusTest, ExtraPaymentNeverIncreasesRemainingMonths) {
    AmortizationEngine engine;
    const LoanTerms terms = standard_loan().terms();
    const Date start = make_date(2024, 1, 1);
    const Date as_of = make_date(2027, 1, 1);

    auto base = engine.status(terms, {}, start, as_of);
    ASSERT_TRUE(base.has_value());

    for (double amount : {1000.0, 10000.0, 50000.0}) {
        const std::vector<ExtraPayment> extras = {extra(6, amount)};
        auto with_extra = engine.status(terms, extras, start, as_of);
        ASSERT_TRUE(with_extra.has_value());
        EXPECT_LE(with_extra->remaining_months, base->remaining_months);
        EXPECT_LT(with_extra->current_balance, base->current_balance);
        EXPECT_NEAR(with_extra->total_paid, base->total_paid + amount, 1e-6);
    }
}

TEST(LoanStatusTest, ZeroRateRemainingMonths) {
    const LoanTerms terms{.amount = 12000.0, .annual_rate = 0.0, .term_months = 12, .monthly_payment = 1000.0};

    AmortizationEngine engine;
    auto status = engine.status(terms, {}, make_date(2024, 1, 1), make_date(2024, 5, 1));
    ASSERT_TRUE(status.has_value());
    EXPECT_NEAR(status->current_balance, 8000.0, 1e-9);
    EXPECT_EQ(status->remaining_months, 8);
    EXPECT_DOUBLE_EQ(status->remaining_interest, 0.0);
}

TEST(LoanStatusTest, MaterializedSchedule) {
    AmortizationEngine engine(AmortizationConfig{.materialize_schedule = true});
    auto status = engine.status(standard_loan().terms(), {}, make_date(2024, 1, 1), make_date(2025, 1, 1));
    ASSERT_TRUE(status.has_value());
    ASSERT_TRUE(status->schedule.has_value());
    EXPECT_TRUE(status->schedule->is_paid_off());
}

TEST(LoanStatusTest, PropagatesValidationErrors) {
    AmortizationEngine engine;
    LoanTerms terms = standard_loan().terms();
    terms.term_months = 0;
    auto status = engine.status(terms, {}, make_date(2024, 1, 1), make_date(2025, 1, 1));
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, AmortizationErrorCode::InvalidLoanTerms);
}
