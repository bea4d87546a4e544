#include <string>

#include <gtest/gtest.h>

#include "coop_ledger/core/business_clock.h"

namespace coop_ledger {

TEST(BusinessClockTest, AcceptsOnlyRealCalendarDays) {
    EXPECT_TRUE(IsValidBusinessDate("2025-03-14"));
    EXPECT_TRUE(IsValidBusinessDate("2024-02-29"));
    EXPECT_FALSE(IsValidBusinessDate("2025-02-29"));
    EXPECT_FALSE(IsValidBusinessDate("2025-13-01"));
    EXPECT_FALSE(IsValidBusinessDate("2025-3-14"));
    EXPECT_FALSE(IsValidBusinessDate("14-03-2025"));
    EXPECT_FALSE(IsValidBusinessDate(""));
}

TEST(BusinessClockTest, PreviousDateCrossesMonthAndYear) {
    EXPECT_EQ(PreviousBusinessDate("2025-03-01"), "2025-02-28");
    EXPECT_EQ(PreviousBusinessDate("2025-01-01"), "2024-12-31");
    EXPECT_EQ(BusinessDateYear("2025-03-14"), 2025);
}

TEST(BusinessClockTest, FormatsEpochNanosInUtc) {
    // 2025-03-14T12:00:00Z
    const EpochNanos ts_ns = 1741953600LL * 1'000'000'000LL;
    EXPECT_EQ(BusinessDateFromEpochNanos(ts_ns, false), "2025-03-14");
}

TEST(BusinessClockTest, FixedClockCanAdvance) {
    FixedBusinessClock clock("2025-03-14");
    EXPECT_EQ(clock.Today(), "2025-03-14");
    clock.SetToday("2025-03-15");
    EXPECT_EQ(clock.Today(), "2025-03-15");
}

TEST(BusinessClockTest, SystemClockProducesValidDate) {
    SystemBusinessClock clock(false);
    EXPECT_TRUE(IsValidBusinessDate(clock.Today()));
}

}  // namespace coop_ledger
