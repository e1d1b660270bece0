#include <gtest/gtest.h>
#include "src/loan/fixed_rate_period.hpp"

using namespace hypo;

namespace {

FixedRatePeriod ten_years() {
    return FixedRatePeriod::create(10.0, 3.5, FixedRateType::InitialFixed, make_date(2024, 1, 15)).value();
}

}  // namespace

TEST(FixedRatePeriodTest, ValidationOrder) {
    EXPECT_EQ(FixedRatePeriod::create(0.5, 3.5, FixedRateType::Fixed, make_date(2024, 1, 1)).error().code,
              FixedRatePeriodErrorCode::PeriodTooShort);
    EXPECT_EQ(FixedRatePeriod::create(41.0, 3.5, FixedRateType::Fixed, make_date(2024, 1, 1)).error().code,
              FixedRatePeriodErrorCode::PeriodTooLong);
    EXPECT_EQ(FixedRatePeriod::create(10.5, 3.5, FixedRateType::Fixed, make_date(2024, 1, 1)).error().code,
              FixedRatePeriodErrorCode::InvalidPeriodLength);
    EXPECT_EQ(FixedRatePeriod::create(10.0, 30.0, FixedRateType::Fixed, make_date(2024, 1, 1)).error().code,
              FixedRatePeriodErrorCode::InvalidInterestRate);
    // Length is checked before the rate
    EXPECT_EQ(FixedRatePeriod::create(0.0, 30.0, FixedRateType::Fixed, make_date(2024, 1, 1)).error().code,
              FixedRatePeriodErrorCode::PeriodTooShort);
}

TEST(FixedRatePeriodTest, ActivityWindow) {
    const FixedRatePeriod period = ten_years();
    EXPECT_EQ(period.end_date(), make_date(2034, 1, 15));

    EXPECT_FALSE(period.is_active(make_date(2024, 1, 14)));
    EXPECT_TRUE(period.is_active(make_date(2024, 1, 15)));
    EXPECT_TRUE(period.is_active(make_date(2034, 1, 14)));
    EXPECT_FALSE(period.is_active(make_date(2034, 1, 15)));
}

TEST(FixedRatePeriodTest, RemainingTime) {
    const FixedRatePeriod period = ten_years();

    EXPECT_DOUBLE_EQ(period.remaining_years(make_date(2029, 1, 15)), 5.0);
    EXPECT_DOUBLE_EQ(period.remaining_years(make_date(2035, 1, 1)), 0.0);
    EXPECT_EQ(period.days_until_expiry(make_date(2034, 1, 5)), 10);
    EXPECT_EQ(period.days_until_expiry(make_date(2034, 1, 25)), -10);

    EXPECT_TRUE(period.is_expiring_soon(make_date(2033, 6, 1)));
    EXPECT_FALSE(period.is_expiring_soon(make_date(2030, 6, 1)));
    EXPECT_FALSE(period.is_expiring_soon(make_date(2034, 2, 1)));
    EXPECT_TRUE(period.is_expiring_soon(make_date(2033, 11, 1), 3));
}

TEST(FixedRatePeriodTest, TypicalPeriods) {
    EXPECT_TRUE(ten_years().is_typical_period());
    auto seven = FixedRatePeriod::create(7.0, 3.0, FixedRateType::Fixed, make_date(2024, 1, 1));
    ASSERT_TRUE(seven.has_value());
    EXPECT_FALSE(seven->is_typical_period());
}

TEST(FixedRatePeriodTest, Format) {
    EXPECT_EQ(format_fixed_rate_period(ten_years()), "10 Jahre Zinsbindung @ 3,50 %");
    EXPECT_EQ(to_label(FixedRateType::Fixed), "Festzins");
    EXPECT_EQ(to_label(FixedRateType::CapFixed), "Zinsobergrenze");
}
