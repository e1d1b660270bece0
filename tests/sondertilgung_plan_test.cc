#include <gtest/gtest.h>
#include "src/sondertilgung/sondertilgung_plan.hpp"

#include <vector>

using namespace hypo;

namespace {

ExtraPayment extra(int month, double euros) {
    return ExtraPayment::create(PaymentMonth::create(month).value(), euros).value();
}

SondertilgungLimit five_percent() {
    return SondertilgungLimit::of(Percentage::create(5.0).value());
}

const LoanAmount kLoan = LoanAmount::create(300000.0).value();

}  // namespace

TEST(SondertilgungLimitTest, YearlyAmount) {
    auto cap = five_percent().yearly_amount(kLoan);
    ASSERT_TRUE(cap.has_value());
    EXPECT_EQ(cap->cents(), 1500000);
    EXPECT_FALSE(SondertilgungLimit::unlimited().yearly_amount(kLoan).has_value());
    EXPECT_TRUE(SondertilgungLimit::unlimited().is_unlimited());
}

TEST(SondertilgungPlanTest, CreateSortsAndRejectsDuplicates) {
    auto plan = SondertilgungPlan::create(five_percent(), {extra(24, 3000.0), extra(6, 2000.0), extra(12, 1000.0)});
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->payments().size(), 3u);
    EXPECT_EQ(plan->payments()[0].month().value(), 6);
    EXPECT_EQ(plan->payments()[1].month().value(), 12);
    EXPECT_EQ(plan->payments()[2].month().value(), 24);

    EXPECT_EQ(SondertilgungPlan::create(five_percent(), {}).error().code,
              SondertilgungPlanErrorCode::NoPayments);
    EXPECT_EQ(SondertilgungPlan::create(five_percent(), {extra(6, 1000.0), extra(6, 500.0)}).error().code,
              SondertilgungPlanErrorCode::DuplicatePaymentMonth);
}

TEST(SondertilgungPlanTest, ValidateAgainstYearlyLimit) {
    // 15,000 per year at 5 % of 300,000
    auto within = SondertilgungPlan::create(five_percent(), {extra(3, 10000.0), extra(9, 5000.0)});
    ASSERT_TRUE(within.has_value());
    EXPECT_TRUE(within->validate_against(kLoan).has_value());

    auto over = SondertilgungPlan::create(five_percent(), {extra(3, 10000.0), extra(9, 5000.01)});
    ASSERT_TRUE(over.has_value());
    auto result = over->validate_against(kLoan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SondertilgungPlanErrorCode::ExceedsYearlyLimit);

    // Same amounts split across two loan years
    auto split = SondertilgungPlan::create(five_percent(), {extra(12, 10000.0), extra(13, 10000.0)});
    ASSERT_TRUE(split.has_value());
    EXPECT_TRUE(split->validate_against(kLoan).has_value());

    auto unlimited = SondertilgungPlan::create(SondertilgungLimit::unlimited(), {extra(1, 200000.0)});
    ASSERT_TRUE(unlimited.has_value());
    EXPECT_TRUE(unlimited->validate_against(kLoan).has_value());
}

TEST(SondertilgungPlanTest, YearlySummaries) {
    auto plan = SondertilgungPlan::create(five_percent(),
                                          {extra(2, 1000.0), extra(5, 2000.0), extra(30, 4000.0)});
    ASSERT_TRUE(plan.has_value());

    const auto summaries = plan->yearly_summaries();
    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].year, 1);
    EXPECT_EQ(summaries[0].count, 2u);
    EXPECT_EQ(summaries[0].total.cents(), 300000);
    EXPECT_EQ(summaries[0].average.cents(), 150000);
    EXPECT_EQ(summaries[1].year, 3);
    EXPECT_EQ(summaries[1].count, 1u);
    EXPECT_EQ(summaries[1].total.cents(), 400000);
}

TEST(SondertilgungPlanTest, RemainingAllowance) {
    auto plan = SondertilgungPlan::create(five_percent(), {extra(4, 12000.0)});
    ASSERT_TRUE(plan.has_value());

    EXPECT_EQ(plan->remaining_yearly_limit(1, kLoan)->cents(), 300000);
    EXPECT_EQ(plan->remaining_yearly_limit(2, kLoan)->cents(), 1500000);
    EXPECT_TRUE(plan->can_add_payment(extra(8, 3000.0), kLoan));
    EXPECT_FALSE(plan->can_add_payment(extra(8, 3000.01), kLoan));
    EXPECT_TRUE(plan->can_add_payment(extra(14, 15000.0), kLoan));
}

TEST(SondertilgungPlanTest, WithAndWithoutPayment) {
    auto plan = SondertilgungPlan::create(five_percent(), {extra(12, 5000.0)});
    ASSERT_TRUE(plan.has_value());

    auto added = plan->with_payment(extra(6, 5000.0), kLoan);
    ASSERT_TRUE(added.has_value());
    ASSERT_EQ(added->payments().size(), 2u);
    EXPECT_EQ(added->payments()[0].month().value(), 6);
    EXPECT_EQ(plan->payments().size(), 1u);

    EXPECT_EQ(plan->with_payment(extra(12, 100.0), kLoan).error().code,
              SondertilgungPlanErrorCode::DuplicatePaymentMonth);
    EXPECT_EQ(plan->with_payment(extra(3, 10000.01), kLoan).error().code,
              SondertilgungPlanErrorCode::ExceedsYearlyLimit);

    auto removed = added->without_payment(PaymentMonth::create(12).value());
    ASSERT_TRUE(removed.has_value());
    ASSERT_EQ(removed->payments().size(), 1u);
    EXPECT_EQ(removed->payments()[0].month().value(), 6);

    EXPECT_EQ(plan->without_payment(PaymentMonth::create(12).value()).error().code,
              SondertilgungPlanErrorCode::NoPayments);
}

TEST(SondertilgungPlanTest, TotalAndFormat) {
    auto plan = SondertilgungPlan::create(five_percent(), {extra(6, 5000.0), extra(18, 10000.0)});
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->total()->cents(), 1500000);

    EXPECT_EQ(format_sondertilgung_limit(five_percent()), "Maximal 5,00 % der Darlehenssumme pro Jahr");
    EXPECT_EQ(format_sondertilgung_limit(SondertilgungLimit::unlimited()), "Unbegrenzte Sondertilgungen");
    EXPECT_EQ(format_sondertilgung_plan(*plan),
              "Sondertilgungsplan: 2 Zahlungen, Gesamt: 15.000,00 € "
              "(Maximal 5,00 % der Darlehenssumme pro Jahr)");
}
