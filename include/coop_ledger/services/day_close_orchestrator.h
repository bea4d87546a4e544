#pragma once

#include <cstddef>
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
#include "coop_ledger/services/chart_of_accounts.h"
#include "coop_ledger/services/ledger_posting_engine.h"
#include "coop_ledger/services/operation_audit.h"

namespace coop_ledger {

struct ForceCloseSummary {
    DayBook day_book;
    std::size_t zeroed_accounts{0};
    std::size_t force_closed_settlements{0};
};

// Ends the business day. Each close runs in one unit of work: the day book is
// first locked with an OPEN -> EOD_IN_PROGRESS compare-and-swap, and any
// failure after that rolls the lock back together with everything else.
class DayCloseOrchestrator {
public:
    DayCloseOrchestrator(std::shared_ptr<ILedgerStore> store,
                         std::shared_ptr<ILedgerEventSink> event_sink,
                         std::shared_ptr<IBusinessClock> clock,
                         std::shared_ptr<IAuditSink> audit_sink = nullptr,
                         LedgerRuntimeConfig runtime = {});

    // Fails with kTellerPendingSettlement, listing the accounts, while any
    // teller cash account still carries a balance.
    bool CloseDay(const std::string& tenant_id,
                  const std::string& actor,
                  DayBook* out,
                  ControlError* error);

    // Sweeps remaining teller balances into the suspense account before
    // closing.
    bool ForceCloseDay(const std::string& tenant_id,
                       const std::string& actor,
                       const std::string& reason,
                       const std::string& approver,
                       ForceCloseSummary* out,
                       ControlError* error);

    // Only today's CLOSED day book may be reopened. An empty `date` means
    // today.
    bool ReopenDay(const std::string& tenant_id,
                   const std::string& actor,
                   const std::string& reason,
                   const std::string& approver,
                   const std::string& date,
                   DayBook* out,
                   ControlError* error);

private:
    bool LockOpenDay(UnitOfWork* uow,
                     const std::string& tenant_id,
                     bool force,
                     DayBook* locked,
                     ControlError* error) const;
    bool FinalizeClose(UnitOfWork* uow,
                       const DayBook& locked,
                       const std::string& actor,
                       const std::string& reason,
                       const std::string& approver,
                       DayBook* out,
                       ControlError* error) const;
    bool ZeroTellerBalances(UnitOfWork* uow,
                            const DayBook& locked,
                            const std::string& reason,
                            std::size_t* zeroed,
                            ControlError* error) const;
    bool MarkSettlementsForceClosed(UnitOfWork* uow,
                                    const DayBook& locked,
                                    std::size_t* marked,
                                    ControlError* error) const;

    std::shared_ptr<ILedgerStore> store_;
    std::shared_ptr<ILedgerEventSink> event_sink_;
    std::shared_ptr<IBusinessClock> clock_;
    LedgerRuntimeConfig runtime_;
    OperationAudit audit_;
    ChartOfAccountsRegistry accounts_;
    LedgerPostingEngine posting_engine_;
};

}  // namespace coop_ledger
