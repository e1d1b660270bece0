/**
 * @file value_types_test.cc
 * @brief Validated numeric wrappers: Money, Percentage, counts and rates
 */

#include <gtest/gtest.h>
#include "src/value/interest_rate.hpp"
#include "src/value/loan_amount.hpp"
#include "src/value/money.hpp"
#include "src/value/month_count.hpp"
#include "src/value/payment_month.hpp"
#include "src/value/percentage.hpp"
#include "src/value/positive_decimal.hpp"
#include "src/value/positive_integer.hpp"
#include "src/value/year_count.hpp"

#include <cmath>
#include <limits>

using namespace hypo;

namespace {

Money money(double euros) {
    return Money::create(euros).value();
}

Percentage percent(double value) {
    return Percentage::create(value).value();
}

}  // namespace

// ===========================================================================
// Money
// ===========================================================================

TEST(MoneyTest, RoundsToNearestCent) {
    auto m = Money::create(1234.567);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->cents(), 123457);
    EXPECT_DOUBLE_EQ(m->euros(), 1234.57);
}

TEST(MoneyTest, RejectsInvalidInput) {
    auto nan = Money::create(std::numeric_limits<double>::quiet_NaN());
    ASSERT_FALSE(nan.has_value());
    EXPECT_EQ(nan.error().code, MoneyErrorCode::InvalidAmount);

    auto negative = Money::create(-0.01);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, MoneyErrorCode::NegativeAmount);
    EXPECT_DOUBLE_EQ(negative.error().value, -0.01);

    auto huge = Money::create(1e12);
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error().code, MoneyErrorCode::ExceedsMaximum);
}

TEST(MoneyTest, CreateExactRejectsSubCentPrecision) {
    auto exact = Money::create_exact(19.99);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->cents(), 1999);

    auto sub_cent = Money::create_exact(1.234);
    ASSERT_FALSE(sub_cent.has_value());
    EXPECT_EQ(sub_cent.error().code, MoneyErrorCode::TooManyDecimals);
}

TEST(MoneyTest, FromCentsChecksRange) {
    EXPECT_TRUE(Money::from_cents(0).has_value());
    EXPECT_EQ(Money::from_cents(-1).error().code, MoneyErrorCode::NegativeAmount);
    EXPECT_EQ(Money::from_cents(Money::kMaxCents + 1).error().code, MoneyErrorCode::ExceedsMaximum);
}

TEST(MoneyTest, AdditionLaws) {
    const Money a = money(1234.56);
    const Money b = money(789.01);
    const Money c = money(0.99);

    EXPECT_EQ(a.add(b).value(), b.add(a).value());
    EXPECT_EQ(a.add(b).value().add(c).value(), a.add(b.add(c).value()).value());
    EXPECT_EQ(a.add(Money::zero()).value(), a);
    EXPECT_EQ(a.multiply(1.0).value(), a);
    EXPECT_EQ(a.add(b).value().subtract(b).value(), a);
}

TEST(MoneyTest, ArithmeticFailures) {
    const Money max = Money::from_cents(Money::kMaxCents).value();
    EXPECT_EQ(max.add(money(0.01)).error().code, MoneyErrorCode::ExceedsMaximum);
    EXPECT_EQ(money(1.0).subtract(money(2.0)).error().code, MoneyErrorCode::NegativeAmount);
    EXPECT_EQ(money(1.0).multiply(-1.0).error().code, MoneyErrorCode::InvalidAmount);
    EXPECT_EQ(max.multiply(2.0).error().code, MoneyErrorCode::ExceedsMaximum);
}

TEST(MoneyTest, CompareAndFormat) {
    EXPECT_EQ(money(1.0).compare(money(2.0)), -1);
    EXPECT_EQ(money(2.0).compare(money(2.0)), 0);
    EXPECT_EQ(money(3.0).compare(money(2.0)), 1);

    EXPECT_EQ(format_money(money(1234.56)), "1.234,56 €");
    EXPECT_EQ(format_money(Money::zero()), "0,00 €");
    EXPECT_EQ(format_money(money(300000.0)), "300.000,00 €");
}

// ===========================================================================
// Percentage
// ===========================================================================

TEST(PercentageTest, BoundsAndConversion) {
    EXPECT_TRUE(Percentage::create(0.0).has_value());
    EXPECT_TRUE(Percentage::create(100.0).has_value());
    EXPECT_EQ(Percentage::create(100.1).error().code, PercentageErrorCode::OutOfRange);
    EXPECT_EQ(Percentage::create(-0.1).error().code, PercentageErrorCode::OutOfRange);
    EXPECT_EQ(Percentage::create(std::numeric_limits<double>::infinity()).error().code,
              PercentageErrorCode::InvalidValue);

    auto p = Percentage::from_decimal(0.035);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->value(), 3.5, 1e-12);
    EXPECT_NEAR(p->to_decimal(), 0.035, 1e-12);
}

TEST(PercentageTest, AdditionLaws) {
    const Percentage a = percent(12.5);
    const Percentage b = percent(30.25);
    const Percentage c = percent(7.0);

    EXPECT_TRUE(a.add(b)->equals(*b.add(a)));
    EXPECT_TRUE(a.add(b)->add(c)->equals(*a.add(*b.add(c))));
    EXPECT_TRUE(a.add(Percentage::zero())->equals(a));
    EXPECT_TRUE(a.multiply(1.0)->equals(a));
    EXPECT_TRUE(a.add(b)->subtract(b)->equals(a));

    EXPECT_EQ(percent(80.0).add(percent(30.0)).error().code, PercentageErrorCode::OutOfRange);
    EXPECT_EQ(percent(10.0).subtract(percent(30.0)).error().code, PercentageErrorCode::OutOfRange);
}

TEST(PercentageTest, GermanFormat) {
    EXPECT_EQ(format_percentage(percent(3.5)), "3,50 %");
    EXPECT_EQ(format_percentage(percent(80.0), 1), "80,0 %");
    EXPECT_EQ(format_percentage(percent(0.125), 3), "0,125 %");
}

// ===========================================================================
// PositiveInteger / PositiveDecimal
// ===========================================================================

TEST(PositiveIntegerTest, Validation) {
    EXPECT_EQ(PositiveInteger::create(7.0)->value(), 7);
    EXPECT_EQ(PositiveInteger::create(0.0).error().code, PositiveIntegerErrorCode::NotPositive);
    EXPECT_EQ(PositiveInteger::create(-3.0).error().code, PositiveIntegerErrorCode::NotPositive);
    EXPECT_EQ(PositiveInteger::create(2.5).error().code, PositiveIntegerErrorCode::NotInteger);
    EXPECT_EQ(PositiveInteger::create(std::numeric_limits<double>::quiet_NaN()).error().code,
              PositiveIntegerErrorCode::InvalidValue);
}

TEST(PositiveIntegerTest, Arithmetic) {
    const PositiveInteger twelve = PositiveInteger::twelve();
    const PositiveInteger five = PositiveInteger::create(5.0).value();

    EXPECT_EQ(twelve.add(five)->value(), 17);
    EXPECT_EQ(twelve.multiply(five)->value(), 60);
    EXPECT_EQ(twelve.subtract(five)->value(), 7);
    EXPECT_EQ(five.subtract(twelve).error().code, PositiveIntegerErrorCode::NotPositive);
    EXPECT_EQ(twelve.divide(five)->value(), 2);
    EXPECT_EQ(five.divide(twelve).error().code, PositiveIntegerErrorCode::NotPositive);
    EXPECT_EQ(format_positive_integer(PositiveInteger::create(1234567.0).value()), "1.234.567");
}

TEST(PositiveIntegerTest, ArithmeticStaysWithinRange) {
    const PositiveInteger big = PositiveInteger::create(17592186044416.0).value();  // 2^44
    auto squared = big.multiply(big);
    ASSERT_FALSE(squared.has_value());
    EXPECT_EQ(squared.error().code, PositiveIntegerErrorCode::Overflow);

    const PositiveInteger max = PositiveInteger::create(9007199254740992.0).value();  // 2^53
    EXPECT_EQ(max.value(), PositiveInteger::kMaxValue);
    EXPECT_EQ(max.add(PositiveInteger::one()).error().code, PositiveIntegerErrorCode::Overflow);
    EXPECT_EQ(max.multiply(PositiveInteger::one())->value(), PositiveInteger::kMaxValue);
    EXPECT_EQ(PositiveInteger::create(9007199254740994.0).error().code, PositiveIntegerErrorCode::InvalidValue);

    const PositiveInteger half = PositiveInteger::create(4503599627370496.0).value();  // 2^52
    EXPECT_EQ(half.add(half)->value(), PositiveInteger::kMaxValue);
    EXPECT_EQ(half.multiply(PositiveInteger::create(2.0).value())->value(), PositiveInteger::kMaxValue);
    EXPECT_EQ(half.multiply(PositiveInteger::create(3.0).value()).error().code,
              PositiveIntegerErrorCode::Overflow);
}

TEST(PositiveDecimalTest, ValidationAndRounding) {
    EXPECT_EQ(PositiveDecimal::create(0.0).error().code, PositiveDecimalErrorCode::NotPositive);
    EXPECT_EQ(PositiveDecimal::create(std::numeric_limits<double>::infinity()).error().code,
              PositiveDecimalErrorCode::InvalidValue);

    const PositiveDecimal x = PositiveDecimal::create(2.345).value();
    const PositiveDecimal y = PositiveDecimal::create(0.5).value();
    EXPECT_NEAR(x.add(y)->value(), 2.845, 1e-12);
    EXPECT_NEAR(x.divide(y)->value(), 4.69, 1e-12);
    EXPECT_NEAR(x.multiply(y)->value(), 1.1725, 1e-12);
    EXPECT_EQ(y.subtract(x).error().code, PositiveDecimalErrorCode::NotPositive);
    EXPECT_EQ(x.multiply_by_factor(0.0).error().code, PositiveDecimalErrorCode::InvalidValue);
    EXPECT_FALSE(PositiveDecimal::create(0.004)->round(2).has_value());
    EXPECT_TRUE(x.round(1)->is_equal(PositiveDecimal::create(2.3).value()));
    EXPECT_EQ(format_positive_decimal(PositiveDecimal::create(1234.5).value()), "1.234,50");
}

TEST(PositiveDecimalTest, ArithmeticLeavingRangeFails) {
    const PositiveDecimal huge = PositiveDecimal::create(std::numeric_limits<double>::max()).value();
    const PositiveDecimal tiny = PositiveDecimal::create(std::numeric_limits<double>::denorm_min()).value();
    const PositiveDecimal two = PositiveDecimal::create(2.0).value();

    EXPECT_EQ(huge.add(huge).error().code, PositiveDecimalErrorCode::InvalidValue);
    EXPECT_EQ(huge.multiply(two).error().code, PositiveDecimalErrorCode::InvalidValue);
    EXPECT_EQ(huge.divide(tiny).error().code, PositiveDecimalErrorCode::InvalidValue);
    EXPECT_EQ(tiny.multiply(tiny).error().code, PositiveDecimalErrorCode::NotPositive);
    EXPECT_EQ(tiny.divide(huge).error().code, PositiveDecimalErrorCode::NotPositive);
}

// ===========================================================================
// LoanAmount / InterestRate
// ===========================================================================

TEST(LoanAmountTest, Bounds) {
    EXPECT_TRUE(LoanAmount::create(1000.0).has_value());
    EXPECT_TRUE(LoanAmount::create(10'000'000.0).has_value());
    EXPECT_EQ(LoanAmount::create(999.99).error().code, LoanAmountErrorCode::BelowMinimum);
    EXPECT_EQ(LoanAmount::create(10'000'000.01).error().code, LoanAmountErrorCode::AboveMaximum);
    EXPECT_EQ(LoanAmount::create(-5.0).error().code, LoanAmountErrorCode::MoneyValidationError);

    EXPECT_EQ(LoanAmount::minimum().euros(), 1000.0);
    EXPECT_EQ(format_loan_amount(LoanAmount::create(300000.0).value()), "300.000,00 €");
}

TEST(InterestRateTest, RejectsOutOfRangeRates) {
    auto negative = InterestRate::create(-0.1);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, InterestRateErrorCode::PercentageValidationError);

    auto too_high = InterestRate::create(25.1);
    ASSERT_FALSE(too_high.has_value());
    EXPECT_EQ(too_high.error().code, InterestRateErrorCode::AboveMaximumRate);

    EXPECT_EQ(InterestRate::create(0.05).error().code, InterestRateErrorCode::BelowMinimumRate);
    EXPECT_TRUE(InterestRate::create(0.1).has_value());
    EXPECT_TRUE(InterestRate::create(25.0).has_value());
}

TEST(InterestRateTest, DecimalRoundTrip) {
    for (double pct : {0.1, 1.5, 3.5, 4.25, 6.0, 12.75, 25.0}) {
        const InterestRate r = InterestRate::create(pct).value();
        auto back = InterestRate::from_decimal(r.to_decimal());
        ASSERT_TRUE(back.has_value()) << pct;
        EXPECT_NEAR(back->value(), r.value(), 1e-9);
    }
}

TEST(InterestRateTest, ConversionsAndConstants) {
    const InterestRate r = InterestRate::typical_current();
    EXPECT_DOUBLE_EQ(r.value(), 3.5);
    EXPECT_NEAR(r.to_monthly_rate(), 0.035 / 12.0, 1e-15);
    EXPECT_NEAR(InterestRate::from_monthly_rate(0.035 / 12.0)->value(), 3.5, 1e-9);

    EXPECT_LT(InterestRate::typical_low(), InterestRate::typical_high());
    EXPECT_DOUBLE_EQ(InterestRate::stress_test().value(), 10.0);

    auto bumped = r.add_basis_points(50.0);
    ASSERT_TRUE(bumped.has_value());
    EXPECT_NEAR(bumped->value(), 4.0, 1e-12);
    EXPECT_EQ(r.add_basis_points(-500.0).error().code, InterestRateErrorCode::PercentageValidationError);

    EXPECT_EQ(format_interest_rate(r), "3,50 %");
}

// ===========================================================================
// MonthCount / YearCount / PaymentMonth
// ===========================================================================

TEST(MonthCountTest, Validation) {
    EXPECT_EQ(MonthCount::create(300.0)->value(), 300);
    EXPECT_EQ(MonthCount::create(481.0).error().code, TermErrorCode::AboveMaximumTerm);
    EXPECT_EQ(MonthCount::create(0.0).error().code, TermErrorCode::PositiveIntegerValidationError);
    EXPECT_EQ(MonthCount::create(12.5).error().code, TermErrorCode::PositiveIntegerValidationError);

    EXPECT_TRUE(is_valid_term_range(480.0));
    EXPECT_FALSE(is_valid_term_range(480.5));
    EXPECT_FALSE(is_valid_term_range(0.0));
}

TEST(MonthCountTest, YearsRoundTrip) {
    for (double months : {1.0, 7.0, 12.0, 18.0, 300.0, 359.0, 480.0}) {
        const MonthCount m = MonthCount::create(months).value();
        auto back = MonthCount::from_years(m.to_years());
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(back.value(), m);
    }
}

TEST(MonthCountTest, ArithmeticAndFormat) {
    const MonthCount term = MonthCount::long_term();
    EXPECT_EQ(term.value(), 300);
    EXPECT_EQ(remaining_months(term, MonthCount::short_term())->value(), 240);
    EXPECT_FALSE(remaining_months(MonthCount::short_term(), term).has_value());
    EXPECT_EQ(term.add_months(200).error().code, TermErrorCode::AboveMaximumTerm);

    EXPECT_EQ(format_month_count(MonthCount::create(7.0).value()), "7 Monate");
    EXPECT_EQ(format_month_count(MonthCount::create(1.0).value()), "1 Monat");
    EXPECT_EQ(format_month_count(term), "25 Jahre");
    EXPECT_EQ(format_month_count(MonthCount::create(18.0).value()), "1 Jahr 6 Monate");
}

TEST(YearCountTest, ValidationAndFormat) {
    EXPECT_EQ(YearCount::create(41.0).error().code, TermErrorCode::AboveMaximumTerm);
    EXPECT_EQ(YearCount::from_months(300.0)->value(), 25);
    EXPECT_EQ(YearCount::long_term().to_months(), 300);
    EXPECT_EQ(remaining_years(YearCount::maximum_standard_term(), YearCount::short_term())->value(), 25);
    EXPECT_EQ(format_year_count(YearCount::minimum()), "1 Jahr");
    EXPECT_EQ(format_year_count(YearCount::medium_term()), "15 Jahre");
}

TEST(PaymentMonthTest, YearDecomposition) {
    const PaymentMonth m14 = PaymentMonth::create(14.0).value();
    EXPECT_EQ(m14.payment_year(), 2);
    EXPECT_EQ(m14.month_in_year(), 2);
    EXPECT_FALSE(m14.is_first_year());

    const PaymentMonth m12 = PaymentMonth::create(12.0).value();
    EXPECT_EQ(m12.payment_year(), 1);
    EXPECT_EQ(m12.month_in_year(), 12);
    EXPECT_TRUE(m12.is_end_of_year());

    EXPECT_EQ(PaymentMonth::from_year_and_month(3, 5)->value(), 29);
    EXPECT_EQ(PaymentMonth::create(481.0).error().code, PaymentMonthErrorCode::InvalidPaymentMonth);
    EXPECT_EQ(PaymentMonth::create(0.0).error().code, PaymentMonthErrorCode::PositiveIntegerValidationError);
    EXPECT_EQ(format_payment_month(m14), "Monat 14 (Jahr 2, 2. Monat)");
}

TEST(ErrorTypesTest, CodesPrintByName) {
    EXPECT_EQ(to_string(MoneyErrorCode::TooManyDecimals), "TooManyDecimals");
    EXPECT_EQ(to_string(InterestRateErrorCode::AboveMaximumRate), "AboveMaximumRate");
    EXPECT_EQ(to_string(TermErrorCode::BelowMinimumTerm), "BelowMinimumTerm");
}
