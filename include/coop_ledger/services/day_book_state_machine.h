#pragma once

#include <functional>
#include <memory>
#include <string>

#include "coop_ledger/contracts/errors.h"
#include "coop_ledger/contracts/types.h"
#include "coop_ledger/core/ledger_config.h"
#include "coop_ledger/core/unit_of_work.h"
#include "coop_ledger/interfaces/audit_sink.h"
#include "coop_ledger/interfaces/business_clock.h"
#include "coop_ledger/interfaces/ledger_event_sink.h"
#include "coop_ledger/interfaces/ledger_store.h"
#include "coop_ledger/services/operation_audit.h"

namespace coop_ledger {

constexpr char kNoDayOpenStatus[] = "NO_DAY_OPEN";

struct DayStatusView {
    bool has_day{false};
    // OPEN, EOD_IN_PROGRESS, CLOSED or NO_DAY_OPEN.
    std::string status;
    DayBook day_book;
};

// OPEN -> EOD_IN_PROGRESS -> CLOSED, and CLOSED -> OPEN for today's day book.
// Every write bumps `version` through a compare-and-swap on (id, status,
// version).
class DayBookStateMachine {
public:
    DayBookStateMachine(std::shared_ptr<ILedgerStore> store,
                        std::shared_ptr<ILedgerEventSink> event_sink,
                        std::shared_ptr<IBusinessClock> clock,
                        std::shared_ptr<IAuditSink> audit_sink = nullptr,
                        LedgerRuntimeConfig runtime = {});

    bool GetDayStatus(const std::string& tenant_id,
                      DayStatusView* out,
                      ControlError* error) const;

    // An empty `date` means today.
    bool StartDay(const std::string& tenant_id,
                  const std::string& date,
                  const std::string& actor,
                  DayBook* out,
                  ControlError* error);

    static bool IsTransitionAllowed(DayStatus from, DayStatus to);

    // CAS from `current` to `next`. `mutate` may fill in extra fields on the
    // candidate row before it is written.
    static bool Transition(ILedgerStore* store,
                           const DayBook& current,
                           DayStatus next,
                           const std::function<void(DayBook*)>& mutate,
                           DayBook* updated,
                           CasOutcome* outcome,
                           ControlError* error);

    // Fails with kNoActiveDay unless the tenant has an OPEN day book.
    static bool RequireOpenDay(const ILedgerStore& store,
                               const std::string& tenant_id,
                               DayBook* out,
                               ControlError* error);

private:
    bool StartDayInTransaction(UnitOfWork* uow,
                               const std::string& tenant_id,
                               const std::string& date,
                               const std::string& today,
                               const std::string& actor,
                               DayBook* out,
                               bool* reopened,
                               ControlError* error) const;

    std::shared_ptr<ILedgerStore> store_;
    std::shared_ptr<ILedgerEventSink> event_sink_;
    std::shared_ptr<IBusinessClock> clock_;
    LedgerRuntimeConfig runtime_;
    OperationAudit audit_;
};

}  // namespace coop_ledger
