#include <limits>

#include <gtest/gtest.h>

#include "coop_ledger/core/fixed_decimal.h"

namespace coop_ledger {

TEST(FixedDecimalTest, ToCentsRoundsBinaryNoiseAway) {
    EXPECT_EQ(FixedDecimal::ToCents(0.1 + 0.2), 30);
    EXPECT_EQ(FixedDecimal::ToCents(4950.0), 495000);
    EXPECT_EQ(FixedDecimal::ToCents(-50.004), -5000);
    EXPECT_EQ(FixedDecimal::ToCents(0.005), 1);
}

TEST(FixedDecimalTest, SummingCentsStaysExact) {
    Cents total = 0;
    for (int i = 0; i < 1000; ++i) {
        total += FixedDecimal::ToCents(0.1);
    }
    EXPECT_EQ(total, 10000);
    EXPECT_DOUBLE_EQ(FixedDecimal::FromCents(total), 100.0);
}

TEST(FixedDecimalTest, FormatCentsKeepsTwoFractionDigits) {
    EXPECT_EQ(FixedDecimal::FormatCents(0), "0.00");
    EXPECT_EQ(FixedDecimal::FormatCents(5), "0.05");
    EXPECT_EQ(FixedDecimal::FormatCents(495000), "4950.00");
    EXPECT_EQ(FixedDecimal::FormatCents(-5050), "-50.50");
}

TEST(FixedDecimalTest, ToCentsRoundsHalfAwayFromZero) {
    EXPECT_EQ(FixedDecimal::ToCents(1.125), 113);
    EXPECT_EQ(FixedDecimal::ToCents(-1.125), -113);
    EXPECT_EQ(FixedDecimal::ToCents(1.124), 112);
}

TEST(FixedDecimalTest, ToCentsClampsOutOfRangeAmounts) {
    EXPECT_EQ(FixedDecimal::ToCents(1e30), std::numeric_limits<Cents>::max());
    EXPECT_EQ(FixedDecimal::ToCents(-1e30), std::numeric_limits<Cents>::min());
}

TEST(FixedDecimalTest, ValidAmountsAreFiniteAndFitNumericColumns) {
    EXPECT_TRUE(FixedDecimal::IsValidAmount(0.0));
    EXPECT_TRUE(FixedDecimal::IsValidAmount(-4950.25));
    EXPECT_TRUE(FixedDecimal::IsValidAmount(9e15));
    EXPECT_FALSE(FixedDecimal::IsValidAmount(1e17));
    EXPECT_FALSE(FixedDecimal::IsValidAmount(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(FixedDecimal::IsValidAmount(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(FixedDecimal::IsValidAmount(-std::numeric_limits<double>::infinity()));
}

TEST(FixedDecimalTest, NaNConvertsToZeroCents) {
    EXPECT_EQ(FixedDecimal::ToCents(std::numeric_limits<double>::quiet_NaN()), 0);
}

}  // namespace coop_ledger
