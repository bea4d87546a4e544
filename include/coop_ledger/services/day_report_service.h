#pragma once

#include <memory>
#include <string>
#include <vector>

#include "coop_ledger/contracts/errors.h"
#include "coop_ledger/contracts/types.h"
#include "coop_ledger/interfaces/ledger_store.h"

namespace coop_ledger {

struct JournalEntryView {
    JournalEntry entry;
    std::vector<LedgerLine> lines;
};

struct DayReport {
    DayBook day_book;
    std::vector<TellerSettlement> settlements;
    std::vector<JournalEntryView> entries;
    double total_debit{0.0};
    double total_credit{0.0};
};

// Read-only data source for the end-of-day report.
class DayReportService {
public:
    explicit DayReportService(std::shared_ptr<ILedgerStore> store);

    bool BuildDayReport(const std::string& tenant_id,
                        const std::string& date,
                        DayReport* out,
                        ControlError* error) const;

private:
    std::shared_ptr<ILedgerStore> store_;
};

}  // namespace coop_ledger
