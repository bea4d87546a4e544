#include "coop_ledger/services/ledger_posting_engine.h"

#include <cstdlib>
#include <string>
#include <unordered_map>
#include <utility>

#include "coop_ledger/core/business_clock.h"
#include "coop_ledger/core/fixed_decimal.h"
#include "coop_ledger/core/record_id.h"
#include "coop_ledger/core/structured_log.h"
#include "coop_ledger/monitoring/metric_registry.h"

namespace coop_ledger {
namespace {

bool StorageFailure(ControlError* error, const std::string& what, const std::string& detail) {
    SetControlError(error, ErrorCode::kStorageError, what + ": " + detail);
    return false;
}

}  // namespace

LedgerPostingEngine::LedgerPostingEngine(LedgerRuntimeConfig runtime)
    : runtime_(std::move(runtime)) {}

std::string LedgerPostingEngine::FormatEntryNumber(const std::string& prefix,
                                                   int year,
                                                   std::int64_t sequence) {
    std::string seq = std::to_string(sequence);
    if (seq.size() < 6) {
        seq.insert(0, 6 - seq.size(), '0');
    }
    return prefix + "-" + std::to_string(year) + "-" + seq;
}

bool LedgerPostingEngine::ValidateAccounts(const ILedgerStore& store,
                                           const PostingRequest& request,
                                           std::vector<Account>* accounts,
                                           ControlError* error) const {
    if (request.tenant_id.empty()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "tenant id is required");
        return false;
    }
    if (request.description.empty()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "description is required");
        return false;
    }
    if (!IsValidBusinessDate(request.effective_date)) {
        SetControlError(error,
                        ErrorCode::kInvalidArgument,
                        "invalid effective date: " + request.effective_date);
        return false;
    }
    if (request.lines.empty()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "posting requires at least one line");
        return false;
    }

    Cents total_debit = 0;
    Cents total_credit = 0;
    std::unordered_map<std::string, Account> cache;
    accounts->clear();
    accounts->reserve(request.lines.size());
    for (std::size_t i = 0; i < request.lines.size(); ++i) {
        const auto& line = request.lines[i];
        if (!FixedDecimal::IsValidAmount(line.debit) || !FixedDecimal::IsValidAmount(line.credit)) {
            SetControlError(error,
                            ErrorCode::kInvalidArgument,
                            "line " + std::to_string(i + 1) + " has an invalid amount");
            return false;
        }
        const Cents debit = FixedDecimal::ToCents(line.debit);
        const Cents credit = FixedDecimal::ToCents(line.credit);
        if (debit < 0 || credit < 0) {
            SetControlError(error,
                            ErrorCode::kInvalidArgument,
                            "line " + std::to_string(i + 1) + " has a negative amount");
            return false;
        }
        if (debit == 0 && credit == 0) {
            SetControlError(error,
                            ErrorCode::kInvalidArgument,
                            "line " + std::to_string(i + 1) + " has neither debit nor credit");
            return false;
        }
        if (debit > kMaxAmountCents - total_debit || credit > kMaxAmountCents - total_credit) {
            SetControlError(error,
                            ErrorCode::kInvalidArgument,
                            "posting total exceeds the maximum amount");
            return false;
        }
        total_debit += debit;
        total_credit += credit;

        auto cached = cache.find(line.account_id);
        if (cached == cache.end()) {
            Account account;
            bool found = false;
            std::string store_error;
            if (!store.GetAccount(line.account_id, &account, &found, &store_error)) {
                return StorageFailure(error, "account lookup failed", store_error);
            }
            if (!found || account.tenant_id != request.tenant_id) {
                SetControlError(error,
                                ErrorCode::kAccountNotFound,
                                "account not found: " + line.account_id);
                return false;
            }
            if (account.is_group || !account.is_active) {
                SetControlError(error,
                                ErrorCode::kAccountNotPostable,
                                "account is not postable: " + account.code);
                return false;
            }
            cached = cache.emplace(line.account_id, std::move(account)).first;
        }
        accounts->push_back(cached->second);
    }

    const Cents epsilon = FixedDecimal::ToCents(runtime_.posting_epsilon);
    if (std::llabs(total_debit - total_credit) > epsilon) {
        SetControlError(error,
                        ErrorCode::kDoubleEntryMismatch,
                        "debits " + FixedDecimal::FormatCents(total_debit) + " != credits " +
                            FixedDecimal::FormatCents(total_credit));
        return false;
    }
    return true;
}

bool LedgerPostingEngine::Validate(const ILedgerStore& store,
                                   const PostingRequest& request,
                                   ControlError* error) const {
    std::vector<Account> accounts;
    return ValidateAccounts(store, request, &accounts, error);
}

bool LedgerPostingEngine::Post(UnitOfWork* uow,
                               const PostingRequest& request,
                               PostingResult* result,
                               ControlError* error) const {
    if (uow == nullptr || !uow->active()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "active unit of work required");
        return false;
    }
    auto& store = uow->store();

    std::vector<Account> accounts;
    if (!ValidateAccounts(store, request, &accounts, error)) {
        EmitStructuredLog(&runtime_,
                          "coop_ledger",
                          "warn",
                          "posting_rejected",
                          {{"tenant_id", request.tenant_id},
                           {"description", request.description},
                           {"code", error != nullptr ? ErrorCodeName(error->code) : ""}});
        return false;
    }

    const int year = BusinessDateYear(request.effective_date);
    std::int64_t existing = 0;
    std::string store_error;
    if (!store.CountJournalEntriesForYear(request.tenant_id, year, &existing, &store_error)) {
        return StorageFailure(error, "count journal entries failed", store_error);
    }

    PostingResult posted;
    auto& entry = posted.journal_entry;
    entry.id = NewRecordId("je");
    entry.tenant_id = request.tenant_id;
    entry.entry_number = FormatEntryNumber(runtime_.entry_number_prefix, year, existing + 1);
    entry.description = request.description;
    entry.effective_date = request.effective_date;
    entry.reverses_entry_id = request.reverses_entry_id;
    entry.created_ts_ns = NowEpochNanos();
    if (!store.InsertJournalEntry(entry, &store_error)) {
        return StorageFailure(error, "insert journal entry failed", store_error);
    }

    Cents total_debit = 0;
    posted.ledger_lines.reserve(request.lines.size());
    for (std::size_t i = 0; i < request.lines.size(); ++i) {
        const auto& line = request.lines[i];
        const auto& account = accounts[i];
        const Cents debit = FixedDecimal::ToCents(line.debit);
        const Cents credit = FixedDecimal::ToCents(line.credit);
        total_debit += debit;
        const Cents delta = IsDebitNormal(account.type) ? debit - credit : credit - debit;

        LedgerLine ledger_line;
        ledger_line.id = NewRecordId("ll");
        ledger_line.journal_entry_id = entry.id;
        ledger_line.tenant_id = request.tenant_id;
        ledger_line.account_id = account.id;
        ledger_line.debit = FixedDecimal::FromCents(debit);
        ledger_line.credit = FixedDecimal::FromCents(credit);
        ledger_line.sequence = static_cast<std::int64_t>(i + 1);
        ledger_line.created_ts_ns = entry.created_ts_ns;
        if (!store.ApplyBalanceDelta(account.id,
                                     FixedDecimal::FromCents(delta),
                                     &ledger_line.balance,
                                     &store_error)) {
            return StorageFailure(error, "balance update failed", store_error);
        }
        if (!store.InsertLedgerLine(ledger_line, &store_error)) {
            return StorageFailure(error, "insert ledger line failed", store_error);
        }
        posted.ledger_lines.push_back(std::move(ledger_line));
    }

    JournalPostedEvent event;
    event.tenant_id = entry.tenant_id;
    event.journal_entry_id = entry.id;
    event.entry_number = entry.entry_number;
    event.description = entry.description;
    event.effective_date = entry.effective_date;
    event.total_debit = FixedDecimal::FromCents(total_debit);
    event.lines = posted.ledger_lines;
    uow->StageEvent(std::move(event));

    EmitStructuredLog(&runtime_,
                      "coop_ledger",
                      "debug",
                      "journal_posted",
                      {{"tenant_id", entry.tenant_id},
                       {"entry_number", entry.entry_number},
                       {"lines", std::to_string(posted.ledger_lines.size())},
                       {"total", FixedDecimal::FormatCents(total_debit)}});
    RecordJournalPosted(entry.tenant_id, posted.ledger_lines.size());
    if (result != nullptr) {
        *result = std::move(posted);
    }
    return true;
}

bool LedgerPostingEngine::Reverse(UnitOfWork* uow,
                                  const std::string& tenant_id,
                                  const std::string& entry_id,
                                  const std::string& description_prefix,
                                  const std::string& effective_date,
                                  PostingResult* result,
                                  ControlError* error) const {
    if (uow == nullptr || !uow->active()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "active unit of work required");
        return false;
    }
    auto& store = uow->store();
    JournalEntry original;
    bool found = false;
    std::string store_error;
    if (!store.GetJournalEntry(entry_id, &original, &found, &store_error)) {
        return StorageFailure(error, "journal entry lookup failed", store_error);
    }
    if (!found || original.tenant_id != tenant_id) {
        SetControlError(error, ErrorCode::kInvalidArgument, "journal entry not found: " + entry_id);
        return false;
    }
    std::vector<LedgerLine> lines;
    if (!store.ListLedgerLines(entry_id, &lines, &store_error)) {
        return StorageFailure(error, "ledger line lookup failed", store_error);
    }

    PostingRequest request;
    request.tenant_id = tenant_id;
    request.description =
        (description_prefix.empty() ? std::string("Reversal") : description_prefix) + ": " +
        original.description;
    request.effective_date = effective_date.empty() ? original.effective_date : effective_date;
    request.reverses_entry_id = original.id;
    request.lines.reserve(lines.size());
    for (const auto& line : lines) {
        PostingLine reversed;
        reversed.account_id = line.account_id;
        reversed.debit = line.credit;
        reversed.credit = line.debit;
        request.lines.push_back(std::move(reversed));
    }
    return Post(uow, request, result, error);
}

}  // namespace coop_ledger
