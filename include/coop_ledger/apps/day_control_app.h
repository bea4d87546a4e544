#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "coop_ledger/apps/cli_support.h"
#include "coop_ledger/contracts/errors.h"
#include "coop_ledger/core/ledger_config.h"
#include "coop_ledger/interfaces/audit_sink.h"
#include "coop_ledger/interfaces/business_clock.h"
#include "coop_ledger/interfaces/ledger_event_sink.h"
#include "coop_ledger/interfaces/ledger_store.h"
#include "coop_ledger/services/chart_of_accounts.h"
#include "coop_ledger/services/day_book_state_machine.h"
#include "coop_ledger/services/day_close_orchestrator.h"
#include "coop_ledger/services/day_report_service.h"
#include "coop_ledger/services/ledger_posting_engine.h"
#include "coop_ledger/services/teller_settlement_service.h"

namespace coop_ledger::apps {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitDomainFailure = 2;

struct DayControlDependencies {
    std::shared_ptr<ILedgerStore> store;
    std::shared_ptr<ILedgerEventSink> event_sink;
    std::shared_ptr<IBusinessClock> clock;
    std::shared_ptr<IAuditSink> audit_sink;
    LedgerRuntimeConfig runtime;
};

// Subcommand dispatcher behind coop_ledger_day_control. Results are printed
// to `out` as key=value lines; domain failures print error_code and message.
class DayControlApp {
public:
    explicit DayControlApp(DayControlDependencies deps);

    int Run(const std::string& command, const ArgMap& args, std::ostream& out);

    // One command per line, '#' starts a comment. Stops at the first failure.
    int RunBatch(std::istream& in, const ArgMap& defaults, std::ostream& out);

    static std::vector<std::string> CommandNames();

private:
    int Status(const ArgMap& args, std::ostream& out);
    int Start(const ArgMap& args, std::ostream& out);
    int CreateAccount(const ArgMap& args, std::ostream& out);
    int BindRole(const ArgMap& args, std::ostream& out);
    int ApplyBindings(const ArgMap& args, std::ostream& out);
    int Post(const ArgMap& args, std::ostream& out);
    int Balance(const ArgMap& args, std::ostream& out);
    int SettlePreview(const ArgMap& args, std::ostream& out);
    int Settle(const ArgMap& args, std::ostream& out);
    int Unsettle(const ArgMap& args, std::ostream& out);
    int Settlements(const ArgMap& args, std::ostream& out);
    int Close(const ArgMap& args, std::ostream& out);
    int ForceClose(const ArgMap& args, std::ostream& out);
    int Reopen(const ArgMap& args, std::ostream& out);
    int Report(const ArgMap& args, std::ostream& out);

    bool BuildSettlementRequest(const ArgMap& args,
                                SettlementRequest* request,
                                std::string* error) const;
    bool ResolveAccountArg(const ArgMap& args,
                           const std::string& id_key,
                           const std::string& code_key,
                           Account* out,
                           ControlError* error) const;
    int Fail(const ControlError& error, std::ostream& out) const;
    int UsageError(const std::string& message, std::ostream& out) const;

    DayControlDependencies deps_;
    ChartOfAccountsRegistry accounts_;
    LedgerPostingEngine posting_engine_;
    DayBookStateMachine day_books_;
    TellerSettlementService settlements_;
    DayCloseOrchestrator day_close_;
    DayReportService reports_;
};

bool ParseDenominations(const std::string& text,
                        std::vector<Denomination>* out,
                        std::string* error);

}  // namespace coop_ledger::apps
