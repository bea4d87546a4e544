#pragma once

#include <memory>
#include <string>
#include <vector>

#include "coop_ledger/contracts/errors.h"
#include "coop_ledger/contracts/types.h"
#include "coop_ledger/core/ledger_config.h"
#include "coop_ledger/interfaces/audit_sink.h"
#include "coop_ledger/interfaces/ledger_event_sink.h"
#include "coop_ledger/interfaces/ledger_store.h"
#include "coop_ledger/services/chart_of_accounts.h"
#include "coop_ledger/services/ledger_posting_engine.h"
#include "coop_ledger/services/operation_audit.h"

namespace coop_ledger {

struct SettlementRequest {
    std::string tenant_id;
    std::string teller_id;
    double physical_cash{0.0};
    std::string actor;
    std::vector<Denomination> denominations;
    std::string attachment_ref;
    std::string idempotency_key;
};

struct SettlementPlan {
    DayBook day_book;
    Account teller_account;
    double physical_cash{0.0};
    double system_cash{0.0};
    double difference{0.0};
    bool requires_approval{false};
    // Entries in post order: variance adjustment (if any), then vault transfer.
    std::vector<PostingRequest> entries;
};

struct SettlementOutcome {
    TellerSettlement settlement;
    bool replayed{false};
    std::vector<PostingResult> postings;
};

class TellerSettlementService {
public:
    TellerSettlementService(std::shared_ptr<ILedgerStore> store,
                            std::shared_ptr<ILedgerEventSink> event_sink,
                            std::shared_ptr<IAuditSink> audit_sink = nullptr,
                            LedgerRuntimeConfig runtime = {});

    // Computes the settlement against current balances without writing.
    bool Preview(const SettlementRequest& request,
                 SettlementPlan* out,
                 ControlError* error) const;

    // A request whose idempotency key matches an earlier settlement of the
    // tenant returns that settlement with `replayed` set and writes nothing.
    bool Settle(const SettlementRequest& request,
                SettlementOutcome* out,
                ControlError* error);

    // Reverses every entry of the settlement, latest first, and marks it
    // REVERTED.
    bool Unsettle(const std::string& tenant_id,
                  const std::string& settlement_id,
                  const std::string& actor,
                  const std::string& reason,
                  TellerSettlement* out,
                  ControlError* error);

    bool ListSettlements(const SettlementFilter& filter,
                         std::vector<TellerSettlement>* out,
                         ControlError* error) const;

    static bool RequiresApproval(double system_cash,
                                 double difference,
                                 double abs_threshold,
                                 double pct_threshold);

private:
    bool BuildPlan(const ILedgerStore& store,
                   const SettlementRequest& request,
                   SettlementPlan* plan,
                   ControlError* error) const;
    bool FindReplay(const ILedgerStore& store,
                    const SettlementRequest& request,
                    TellerSettlement* out,
                    bool* found,
                    ControlError* error) const;

    std::shared_ptr<ILedgerStore> store_;
    std::shared_ptr<ILedgerEventSink> event_sink_;
    LedgerRuntimeConfig runtime_;
    OperationAudit audit_;
    ChartOfAccountsRegistry accounts_;
    LedgerPostingEngine posting_engine_;
};

}  // namespace coop_ledger
