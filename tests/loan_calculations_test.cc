/**
 * @file loan_calculations_test.cc
 * @brief Closed-form loan calculations and the implied-rate solver
 */

#include <gtest/gtest.h>
#include "src/loan/loan_calculations.hpp"

#include <cmath>
#include <cstdint>
#include <vector>

using namespace hypo;

namespace {

LoanConfiguration make_loan(double amount, double rate, double months) {
    return LoanConfiguration::with_calculated_payment(
        LoanAmount::create(amount).value(),
        InterestRate::create(rate).value(),
        MonthCount::create(months).value()).value();
}

}  // namespace

TEST(LoanCalculationsTest, FirstMonthBreakdown) {
    const LoanConfiguration config = make_loan(300000.0, 3.5, 300.0);

    auto payment = calculate_monthly_payment(config);
    ASSERT_TRUE(payment.has_value());
    EXPECT_EQ(payment->interest().cents(), 87500);
    EXPECT_NEAR(payment->total().euros(), annuity_payment(300000.0, 0.035 / 12.0, 300), 0.01);
    EXPECT_NEAR(payment->principal().euros() + payment->interest().euros(),
                payment->total().euros(), 0.011);
}

TEST(LoanCalculationsTest, LoanTermFromPayment) {
    const LoanAmount amount = LoanAmount::create(300000.0).value();
    const InterestRate rate = InterestRate::create(3.5).value();
    const double installment = annuity_payment(300000.0, 0.035 / 12.0, 300);

    auto term = calculate_loan_term(amount, rate, Money::create(installment + 0.01).value());
    ASSERT_TRUE(term.has_value());
    EXPECT_EQ(term->value(), 300);

    auto single = calculate_loan_term(amount, rate, Money::create(400000.0).value());
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->value(), 1);
}

TEST(LoanCalculationsTest, LoanTermErrors) {
    const LoanAmount amount = LoanAmount::create(300000.0).value();
    const InterestRate rate = InterestRate::create(3.5).value();

    // Interest alone is 875 per month
    EXPECT_EQ(calculate_loan_term(amount, rate, Money::create(800.0).value()).error().code,
              CalculationErrorCode::InsufficientPayment);
    EXPECT_EQ(calculate_loan_term(amount, rate, Money::zero()).error().code,
              CalculationErrorCode::InsufficientPayment);
    // Barely above the interest: thousands of months
    EXPECT_EQ(calculate_loan_term(amount, rate, Money::create(876.0).value()).error().code,
              CalculationErrorCode::InvalidParameters);
}

TEST(LoanCalculationsTest, ImpliedInterestRate) {
    const LoanConfiguration config = make_loan(300000.0, 3.5, 300.0);

    auto rate = calculate_interest_rate(config.amount(), config.term(), config.monthly_payment());
    ASSERT_TRUE(rate.has_value());
    EXPECT_NEAR(rate->value(), 3.5, 0.01);
}

TEST(LoanCalculationsTest, ImpliedRateOutsideBracketFails) {
    // 900 per month never repays 300,000 in 300 months at a positive rate
    auto rate = calculate_interest_rate(LoanAmount::create(300000.0).value(),
                                        MonthCount::create(300.0).value(),
                                        Money::create(900.0).value());
    ASSERT_FALSE(rate.has_value());
    EXPECT_EQ(rate.error().code, CalculationErrorCode::ConvergenceFailure);
}

TEST(LoanCalculationsTest, TotalInterestAndRemainingBalance) {
    const LoanConfiguration config = make_loan(300000.0, 3.5, 300.0);

    auto interest = calculate_total_interest(config);
    ASSERT_TRUE(interest.has_value());
    EXPECT_NEAR(interest->euros(), config.monthly_payment().euros() * 300.0 - 300000.0, 0.01);

    EXPECT_DOUBLE_EQ(calculate_remaining_balance(config, 0)->euros(), 300000.0);
    EXPECT_DOUBLE_EQ(calculate_remaining_balance(config, 300)->euros(), 0.0);

    auto halfway = calculate_remaining_balance(config, 150);
    ASSERT_TRUE(halfway.has_value());
    EXPECT_GT(halfway->euros(), 150000.0);  // annuity repays slowly at first
    EXPECT_LT(halfway->euros(), 300000.0);

    EXPECT_EQ(calculate_remaining_balance(config, -1).error().code, CalculationErrorCode::InvalidParameters);
}

TEST(LoanCalculationsTest, BreakEvenPoint) {
    const LoanConfiguration current = make_loan(300000.0, 4.5, 300.0);
    const LoanConfiguration refinanced = make_loan(300000.0, 3.5, 300.0);
    const double savings = current.monthly_payment().euros() - refinanced.monthly_payment().euros();

    auto months = calculate_break_even_point(current, refinanced, Money::create(3000.0).value());
    ASSERT_TRUE(months.has_value());
    EXPECT_EQ(months->value(), static_cast<std::int64_t>(std::ceil(3000.0 / savings)));

    EXPECT_EQ(calculate_break_even_point(refinanced, current, Money::create(3000.0).value()).error().code,
              CalculationErrorCode::InsufficientPayment);
}

TEST(LoanCalculationsTest, PaymentScenarios) {
    const LoanConfiguration base = make_loan(300000.0, 3.5, 300.0);
    const std::vector<PaymentScenario> scenarios = {
        {},
        {.amount_multiplier = 1.2},
        {.rate_adjustment = 1.0},
        {.term_adjustment = -60},
    };

    auto results = calculate_payment_scenarios(base, scenarios);
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 4u);

    const double base_total = (*results)[0].total().euros();
    EXPECT_NEAR((*results)[1].total().euros(), base_total * 1.2, 0.02);
    EXPECT_GT((*results)[2].total().euros(), base_total);
    EXPECT_GT((*results)[3].total().euros(), base_total);

    const std::vector<PaymentScenario> invalid = {{.rate_adjustment = 30.0}};
    EXPECT_EQ(calculate_payment_scenarios(base, invalid).error().code,
              CalculationErrorCode::InvalidParameters);
}
