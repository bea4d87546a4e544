#include <string>

#include <gtest/gtest.h>

#include "ledger_test_support.h"
#include "coop_ledger/services/day_book_state_machine.h"
#include "coop_ledger/services/day_close_orchestrator.h"

namespace coop_ledger {

using test_support::LedgerTestBed;

namespace {

DayBookStateMachine MakeMachine(const LedgerTestBed& bed) {
    return DayBookStateMachine(bed.store, bed.events, bed.clock, bed.audit, bed.runtime);
}

DayBook CloseDay(LedgerTestBed* bed) {
    DayCloseOrchestrator closer(bed->store, bed->events, bed->clock, bed->audit, bed->runtime);
    DayBook closed;
    ControlError error;
    EXPECT_TRUE(closer.CloseDay(bed->tenant, "manager", &closed, &error)) << error.message;
    return closed;
}

}  // namespace

TEST(DayBookStateMachineTest, ReportsNoDayOpenForNewTenant) {
    LedgerTestBed bed;
    auto machine = MakeMachine(bed);
    DayStatusView view;
    ControlError error;
    ASSERT_TRUE(machine.GetDayStatus(bed.tenant, &view, &error));
    EXPECT_FALSE(view.has_day);
    EXPECT_EQ(view.status, "NO_DAY_OPEN");
}

TEST(DayBookStateMachineTest, StartsTodayWhenDateOmitted) {
    LedgerTestBed bed;
    const auto day = bed.StartDay();
    EXPECT_EQ(day.date, "2025-03-14");
    EXPECT_EQ(day.status, DayStatus::kOpen);
    EXPECT_EQ(day.version, 1);
    EXPECT_EQ(day.day_begin_by, "manager");
    EXPECT_DOUBLE_EQ(day.opening_cash, 0.0);

    auto machine = MakeMachine(bed);
    DayStatusView view;
    ControlError error;
    ASSERT_TRUE(machine.GetDayStatus(bed.tenant, &view, &error));
    EXPECT_TRUE(view.has_day);
    EXPECT_EQ(view.status, "OPEN");
    EXPECT_EQ(view.day_book.id, day.id);

    const auto records = bed.audit->records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].action, "day_start");
    EXPECT_TRUE(records[0].success);
}

TEST(DayBookStateMachineTest, RejectsSecondStartWhileOpen) {
    LedgerTestBed bed;
    bed.StartDay();
    auto machine = MakeMachine(bed);
    DayBook day;
    ControlError error;
    EXPECT_FALSE(machine.StartDay(bed.tenant, "", "manager", &day, &error));
    EXPECT_EQ(error.code, ErrorCode::kDayAlreadyOpen);

    const auto records = bed.audit->records();
    ASSERT_EQ(records.size(), 2U);
    EXPECT_FALSE(records[1].success);
}

TEST(DayBookStateMachineTest, RequiresPreviousDayClosed) {
    LedgerTestBed bed;
    bed.StartDay("2025-03-13");
    auto machine = MakeMachine(bed);
    DayBook day;
    ControlError error;
    EXPECT_FALSE(machine.StartDay(bed.tenant, "2025-03-14", "manager", &day, &error));
    EXPECT_EQ(error.code, ErrorCode::kPreviousDayNotClosed);
    EXPECT_NE(error.message.find("2025-03-13"), std::string::npos);
}

TEST(DayBookStateMachineTest, CarriesClosingCashIntoNextOpening) {
    LedgerTestBed bed;
    bed.SetUpBranch();
    bed.StartDay("2025-03-13");
    bed.Transfer(bed.vault.id, bed.capital.id, 1500.0, "2025-03-13");
    const auto closed = CloseDay(&bed);
    EXPECT_DOUBLE_EQ(closed.closing_cash, 1500.0);

    const auto next = bed.StartDay();
    EXPECT_EQ(next.date, "2025-03-14");
    EXPECT_DOUBLE_EQ(next.opening_cash, 1500.0);
}

TEST(DayBookStateMachineTest, ClosedPastDayCannotBeStartedAgain) {
    LedgerTestBed bed;
    bed.SetUpBranch();
    bed.StartDay("2025-03-13");
    CloseDay(&bed);

    auto machine = MakeMachine(bed);
    DayBook day;
    ControlError error;
    EXPECT_FALSE(machine.StartDay(bed.tenant, "2025-03-13", "manager", &day, &error));
    EXPECT_EQ(error.code, ErrorCode::kCannotStartPastDay);
}

TEST(DayBookStateMachineTest, StartingClosedTodayReopensIt) {
    LedgerTestBed bed;
    bed.SetUpBranch();
    const auto first = bed.StartDay();
    const auto closed = CloseDay(&bed);
    EXPECT_EQ(closed.version, 3);

    auto machine = MakeMachine(bed);
    DayBook reopened;
    ControlError error;
    ASSERT_TRUE(machine.StartDay(bed.tenant, "", "supervisor", &reopened, &error)) << error.message;
    EXPECT_EQ(reopened.id, first.id);
    EXPECT_EQ(reopened.status, DayStatus::kOpen);
    EXPECT_EQ(reopened.version, 4);
    EXPECT_EQ(reopened.day_begin_by, "supervisor");
}

TEST(DayBookStateMachineTest, ValidatesArguments) {
    LedgerTestBed bed;
    auto machine = MakeMachine(bed);
    DayBook day;
    ControlError error;
    EXPECT_FALSE(machine.StartDay(bed.tenant, "2025-13-01", "manager", &day, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidArgument);
    EXPECT_FALSE(machine.StartDay(bed.tenant, "", "", &day, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidArgument);
}

TEST(DayBookStateMachineTest, AllowsOnlyForwardTransitionsAndReopen) {
    EXPECT_TRUE(DayBookStateMachine::IsTransitionAllowed(DayStatus::kOpen, DayStatus::kEodInProgress));
    EXPECT_TRUE(DayBookStateMachine::IsTransitionAllowed(DayStatus::kEodInProgress, DayStatus::kClosed));
    EXPECT_TRUE(DayBookStateMachine::IsTransitionAllowed(DayStatus::kClosed, DayStatus::kOpen));
    EXPECT_FALSE(DayBookStateMachine::IsTransitionAllowed(DayStatus::kOpen, DayStatus::kClosed));
    EXPECT_FALSE(DayBookStateMachine::IsTransitionAllowed(DayStatus::kEodInProgress, DayStatus::kOpen));
    EXPECT_FALSE(DayBookStateMachine::IsTransitionAllowed(DayStatus::kClosed, DayStatus::kEodInProgress));
}

TEST(DayBookStateMachineTest, TransitionRejectsIllegalMoveWithoutWriting) {
    LedgerTestBed bed;
    const auto day = bed.StartDay();
    UnitOfWork uow(bed.store, bed.events, &bed.runtime);
    std::string store_error;
    ASSERT_TRUE(uow.Begin(&store_error));
    DayBook updated;
    CasOutcome outcome = CasOutcome::kNotFound;
    ControlError error;
    EXPECT_FALSE(DayBookStateMachine::Transition(
        &uow.store(), day, DayStatus::kClosed, nullptr, &updated, &outcome, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidArgument);

    DayBook stale = day;
    stale.version = 7;
    ASSERT_TRUE(DayBookStateMachine::Transition(
        &uow.store(), stale, DayStatus::kEodInProgress, nullptr, &updated, &outcome, &error));
    EXPECT_EQ(outcome, CasOutcome::kContention);
    ASSERT_TRUE(uow.Rollback(&store_error));
}

TEST(DayBookStateMachineTest, RequireOpenDayFailsWithoutOpenDay) {
    LedgerTestBed bed;
    DayBook day;
    ControlError error;
    EXPECT_FALSE(DayBookStateMachine::RequireOpenDay(*bed.store, bed.tenant, &day, &error));
    EXPECT_EQ(error.code, ErrorCode::kNoActiveDay);

    const auto started = bed.StartDay();
    ASSERT_TRUE(DayBookStateMachine::RequireOpenDay(*bed.store, bed.tenant, &day, &error));
    EXPECT_EQ(day.id, started.id);
}

}  // namespace coop_ledger
