#include <string>

#include <gtest/gtest.h>

#include "ledger_test_support.h"
#include "coop_ledger/services/day_report_service.h"
#include "coop_ledger/services/teller_settlement_service.h"

namespace coop_ledger {

using test_support::LedgerTestBed;

TEST(DayReportServiceTest, CollectsEntriesSettlementsAndTotals) {
    LedgerTestBed bed;
    bed.SetUpBranch();
    const auto day = bed.StartDay();
    bed.FundTeller(5000.0);
    // Dated on another day; stays out of the report.
    bed.Transfer(bed.vault.id, bed.capital.id, 10.0, "2025-03-13");

    TellerSettlementService settlements(bed.store, bed.events, bed.audit, bed.runtime);
    SettlementRequest request;
    request.tenant_id = bed.tenant;
    request.teller_id = "teller-1";
    request.physical_cash = 4960.0;
    request.actor = "teller-1";
    SettlementOutcome outcome;
    ControlError error;
    ASSERT_TRUE(settlements.Settle(request, &outcome, &error)) << error.message;

    DayReportService reports(bed.store);
    DayReport report;
    ASSERT_TRUE(reports.BuildDayReport(bed.tenant, "2025-03-14", &report, &error)) << error.message;
    EXPECT_EQ(report.day_book.id, day.id);
    ASSERT_EQ(report.settlements.size(), 1U);
    EXPECT_EQ(report.settlements[0].id, outcome.settlement.id);
    ASSERT_EQ(report.entries.size(), 4U);
    for (const auto& view : report.entries) {
        EXPECT_EQ(view.entry.effective_date, "2025-03-14");
        EXPECT_EQ(view.lines.size(), 2U);
    }
    // 5000 + 5000 funding, 40 shortage, 4960 vault transfer.
    EXPECT_DOUBLE_EQ(report.total_debit, 15000.0);
    EXPECT_DOUBLE_EQ(report.total_credit, 15000.0);
}

TEST(DayReportServiceTest, RejectsInvalidDateAndMissingDay) {
    LedgerTestBed bed;
    bed.StartDay();
    DayReportService reports(bed.store);
    DayReport report;
    ControlError error;
    EXPECT_FALSE(reports.BuildDayReport(bed.tenant, "14/03/2025", &report, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidArgument);

    EXPECT_FALSE(reports.BuildDayReport(bed.tenant, "2025-03-10", &report, &error));
    EXPECT_EQ(error.code, ErrorCode::kNoDayForToday);

    EXPECT_FALSE(reports.BuildDayReport("", "2025-03-14", &report, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidArgument);
}

TEST(DayReportServiceTest, EmptyDayHasZeroTotals) {
    LedgerTestBed bed;
    bed.StartDay();
    DayReportService reports(bed.store);
    DayReport report;
    ControlError error;
    ASSERT_TRUE(reports.BuildDayReport(bed.tenant, "2025-03-14", &report, &error)) << error.message;
    EXPECT_TRUE(report.entries.empty());
    EXPECT_TRUE(report.settlements.empty());
    EXPECT_DOUBLE_EQ(report.total_debit, 0.0);
}

}  // namespace coop_ledger
