#include "coop_ledger/services/day_report_service.h"

#include <utility>

#include "coop_ledger/core/business_clock.h"
#include "coop_ledger/core/fixed_decimal.h"

namespace coop_ledger {
namespace {

bool StorageFailure(ControlError* error, const std::string& what, const std::string& detail) {
    SetControlError(error, ErrorCode::kStorageError, what + ": " + detail);
    return false;
}

}  // namespace

DayReportService::DayReportService(std::shared_ptr<ILedgerStore> store) : store_(std::move(store)) {}

bool DayReportService::BuildDayReport(const std::string& tenant_id,
                                      const std::string& date,
                                      DayReport* out,
                                      ControlError* error) const {
    if (out == nullptr || tenant_id.empty()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "tenant and output are required");
        return false;
    }
    if (!IsValidBusinessDate(date)) {
        SetControlError(error, ErrorCode::kInvalidArgument, "invalid date: " + date);
        return false;
    }

    DayReport report;
    bool found = false;
    std::string store_error;
    if (!store_->GetDayBookByDate(tenant_id, date, &report.day_book, &found, &store_error)) {
        return StorageFailure(error, "day lookup failed", store_error);
    }
    if (!found) {
        SetControlError(error, ErrorCode::kNoDayForToday, "no day book for " + date);
        return false;
    }

    SettlementFilter filter;
    filter.tenant_id = tenant_id;
    filter.day_book_id = report.day_book.id;
    if (!store_->ListSettlements(filter, &report.settlements, &store_error)) {
        return StorageFailure(error, "list settlements failed", store_error);
    }

    std::vector<JournalEntry> entries;
    if (!store_->ListJournalEntriesForDate(tenant_id, date, &entries, &store_error)) {
        return StorageFailure(error, "list journal entries failed", store_error);
    }
    Cents debit = 0;
    Cents credit = 0;
    report.entries.reserve(entries.size());
    for (auto& entry : entries) {
        JournalEntryView view;
        if (!store_->ListLedgerLines(entry.id, &view.lines, &store_error)) {
            return StorageFailure(error, "list ledger lines failed", store_error);
        }
        for (const auto& line : view.lines) {
            debit += FixedDecimal::ToCents(line.debit);
            credit += FixedDecimal::ToCents(line.credit);
        }
        view.entry = std::move(entry);
        report.entries.push_back(std::move(view));
    }
    report.total_debit = FixedDecimal::FromCents(debit);
    report.total_credit = FixedDecimal::FromCents(credit);

    *out = std::move(report);
    return true;
}

}  // namespace coop_ledger
