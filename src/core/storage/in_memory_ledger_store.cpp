#include "coop_ledger/core/in_memory_ledger_store.h"

#include <algorithm>
#include <utility>

namespace coop_ledger {
namespace {

template <typename T>
bool AssignFound(const T* item, T* out, bool* found, std::string* error) {
    if (out == nullptr || found == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    *found = item != nullptr;
    if (item != nullptr) {
        *out = *item;
    }
    return true;
}

bool IsActiveStatus(DayStatus status) {
    return status == DayStatus::kOpen || status == DayStatus::kEodInProgress;
}

bool MatchesFilter(const TellerSettlement& settlement, const SettlementFilter& filter) {
    if (settlement.tenant_id != filter.tenant_id) {
        return false;
    }
    if (!filter.day_book_id.empty() && settlement.day_book_id != filter.day_book_id) {
        return false;
    }
    if (!filter.teller_id.empty() && settlement.teller_id != filter.teller_id) {
        return false;
    }
    if (filter.has_status && settlement.status != filter.status) {
        return false;
    }
    return true;
}

}  // namespace

bool InMemoryLedgerStore::BeginTransaction(std::string* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_transaction_ && transaction_owner_ == std::this_thread::get_id()) {
            if (error != nullptr) {
                *error = "nested transaction is not supported";
            }
            return false;
        }
    }
    transaction_mutex_.lock();
    std::lock_guard<std::mutex> lock(mutex_);
    in_transaction_ = true;
    transaction_owner_ = std::this_thread::get_id();
    snapshot_ = state_;
    return true;
}

bool InMemoryLedgerStore::CommitTransaction(std::string* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_transaction_ || transaction_owner_ != std::this_thread::get_id()) {
            if (error != nullptr) {
                *error = "no active transaction";
            }
            return false;
        }
        in_transaction_ = false;
        transaction_owner_ = std::thread::id();
        snapshot_ = State();
    }
    transaction_mutex_.unlock();
    return true;
}

bool InMemoryLedgerStore::RollbackTransaction(std::string* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_transaction_ || transaction_owner_ != std::this_thread::get_id()) {
            if (error != nullptr) {
                *error = "no active transaction";
            }
            return false;
        }
        state_ = std::move(snapshot_);
        snapshot_ = State();
        in_transaction_ = false;
        transaction_owner_ = std::thread::id();
    }
    transaction_mutex_.unlock();
    return true;
}

bool InMemoryLedgerStore::RequireTransaction(std::string* error) const {
    if (!in_transaction_ || transaction_owner_ != std::this_thread::get_id()) {
        if (error != nullptr) {
            *error = "write outside of transaction";
        }
        return false;
    }
    return true;
}

const InMemoryLedgerStore::State& InMemoryLedgerStore::VisibleState() const {
    if (in_transaction_ && transaction_owner_ != std::this_thread::get_id()) {
        return snapshot_;
    }
    return state_;
}

std::string InMemoryLedgerStore::RoleKey(const std::string& tenant_id, AccountRole role) {
    return tenant_id + "|" + ToString(role);
}

bool InMemoryLedgerStore::GetAccount(const std::string& account_id,
                                     Account* out,
                                     bool* found,
                                     std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = view.accounts.find(account_id);
    return AssignFound(it == view.accounts.end() ? nullptr : &it->second, out, found, error);
}

bool InMemoryLedgerStore::GetAccountByCode(const std::string& tenant_id,
                                           const std::string& code,
                                           Account* out,
                                           bool* found,
                                           std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const Account* match = nullptr;
    for (const auto& [id, account] : view.accounts) {
        (void)id;
        if (account.tenant_id == tenant_id && account.code == code) {
            match = &account;
            break;
        }
    }
    return AssignFound(match, out, found, error);
}

bool InMemoryLedgerStore::ListAccounts(const std::string& tenant_id,
                                       std::vector<Account>* out,
                                       std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    out->clear();
    for (const auto& id : view.account_order) {
        const auto& account = view.accounts.at(id);
        if (account.tenant_id == tenant_id) {
            out->push_back(account);
        }
    }
    return true;
}

bool InMemoryLedgerStore::InsertAccount(const Account& account, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    if (account.id.empty()) {
        if (error != nullptr) {
            *error = "account id is empty";
        }
        return false;
    }
    if (state_.accounts.count(account.id) != 0) {
        if (error != nullptr) {
            *error = "duplicate account id: " + account.id;
        }
        return false;
    }
    for (const auto& [id, existing] : state_.accounts) {
        (void)id;
        if (existing.tenant_id == account.tenant_id && existing.code == account.code) {
            if (error != nullptr) {
                *error = "duplicate account code: " + account.code;
            }
            return false;
        }
    }
    state_.accounts.emplace(account.id, account);
    state_.account_order.push_back(account.id);
    return true;
}

bool InMemoryLedgerStore::GetRoleBinding(const std::string& tenant_id,
                                         AccountRole role,
                                         AccountRoleBinding* out,
                                         bool* found,
                                         std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = view.role_bindings.find(RoleKey(tenant_id, role));
    return AssignFound(
        it == view.role_bindings.end() ? nullptr : &it->second, out, found, error);
}

bool InMemoryLedgerStore::UpsertRoleBinding(const AccountRoleBinding& binding,
                                            std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    state_.role_bindings[RoleKey(binding.tenant_id, binding.role)] = binding;
    return true;
}

bool InMemoryLedgerStore::CountJournalEntriesForYear(const std::string& tenant_id,
                                                     int year,
                                                     std::int64_t* out,
                                                     std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    const std::string year_prefix = std::to_string(year) + "-";
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    *out = std::count_if(view.journal_entries.begin(),
                         view.journal_entries.end(),
                         [&](const JournalEntry& entry) {
                             return entry.tenant_id == tenant_id &&
                                    entry.effective_date.rfind(year_prefix, 0) == 0;
                         });
    return true;
}

bool InMemoryLedgerStore::CountJournalEntriesForDate(const std::string& tenant_id,
                                                     const std::string& date,
                                                     std::int64_t* out,
                                                     std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    *out = std::count_if(view.journal_entries.begin(),
                         view.journal_entries.end(),
                         [&](const JournalEntry& entry) {
                             return entry.tenant_id == tenant_id && entry.effective_date == date;
                         });
    return true;
}

bool InMemoryLedgerStore::InsertJournalEntry(const JournalEntry& entry, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    for (const auto& existing : state_.journal_entries) {
        if (existing.id == entry.id) {
            if (error != nullptr) {
                *error = "duplicate journal entry id: " + entry.id;
            }
            return false;
        }
        if (existing.tenant_id == entry.tenant_id && existing.entry_number == entry.entry_number) {
            if (error != nullptr) {
                *error = "duplicate entry number: " + entry.entry_number;
            }
            return false;
        }
    }
    state_.journal_entries.push_back(entry);
    return true;
}

bool InMemoryLedgerStore::GetJournalEntry(const std::string& entry_id,
                                          JournalEntry* out,
                                          bool* found,
                                          std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = std::find_if(view.journal_entries.begin(),
                                 view.journal_entries.end(),
                                 [&](const JournalEntry& entry) { return entry.id == entry_id; });
    return AssignFound(
        it == view.journal_entries.end() ? nullptr : &*it, out, found, error);
}

bool InMemoryLedgerStore::ListJournalEntriesForDate(const std::string& tenant_id,
                                                    const std::string& date,
                                                    std::vector<JournalEntry>* out,
                                                    std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    out->clear();
    for (const auto& entry : view.journal_entries) {
        if (entry.tenant_id == tenant_id && entry.effective_date == date) {
            out->push_back(entry);
        }
    }
    return true;
}

bool InMemoryLedgerStore::InsertLedgerLine(const LedgerLine& line, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    state_.ledger_lines.push_back(line);
    return true;
}

bool InMemoryLedgerStore::ListLedgerLines(const std::string& journal_entry_id,
                                          std::vector<LedgerLine>* out,
                                          std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    out->clear();
    for (const auto& line : view.ledger_lines) {
        if (line.journal_entry_id == journal_entry_id) {
            out->push_back(line);
        }
    }
    std::stable_sort(out->begin(), out->end(), [](const LedgerLine& lhs, const LedgerLine& rhs) {
        return lhs.sequence < rhs.sequence;
    });
    return true;
}

bool InMemoryLedgerStore::ApplyBalanceDelta(const std::string& account_id,
                                            double delta,
                                            double* new_balance,
                                            std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    auto& cents = state_.balances[account_id];
    cents += FixedDecimal::ToCents(delta);
    if (new_balance != nullptr) {
        *new_balance = FixedDecimal::FromCents(cents);
    }
    return true;
}

bool InMemoryLedgerStore::GetBalance(const std::string& account_id,
                                     double* out,
                                     std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = view.balances.find(account_id);
    *out = it == view.balances.end() ? 0.0 : FixedDecimal::FromCents(it->second);
    return true;
}

bool InMemoryLedgerStore::GetDayBookByDate(const std::string& tenant_id,
                                           const std::string& date,
                                           DayBook* out,
                                           bool* found,
                                           std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = std::find_if(view.day_books.begin(),
                                 view.day_books.end(),
                                 [&](const DayBook& day) {
                                     return day.tenant_id == tenant_id && day.date == date;
                                 });
    return AssignFound(it == view.day_books.end() ? nullptr : &*it, out, found, error);
}

bool InMemoryLedgerStore::GetDayBook(const std::string& day_book_id,
                                     DayBook* out,
                                     bool* found,
                                     std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = std::find_if(view.day_books.begin(),
                                 view.day_books.end(),
                                 [&](const DayBook& day) { return day.id == day_book_id; });
    return AssignFound(it == view.day_books.end() ? nullptr : &*it, out, found, error);
}

bool InMemoryLedgerStore::FindActiveDayBook(const std::string& tenant_id,
                                            DayBook* out,
                                            bool* found,
                                            std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = std::find_if(view.day_books.begin(),
                                 view.day_books.end(),
                                 [&](const DayBook& day) {
                                     return day.tenant_id == tenant_id &&
                                            IsActiveStatus(day.status);
                                 });
    return AssignFound(it == view.day_books.end() ? nullptr : &*it, out, found, error);
}

bool InMemoryLedgerStore::FindLatestDayBook(const std::string& tenant_id,
                                            DayBook* out,
                                            bool* found,
                                            std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const DayBook* latest = nullptr;
    for (const auto& day : view.day_books) {
        if (day.tenant_id == tenant_id && (latest == nullptr || day.date > latest->date)) {
            latest = &day;
        }
    }
    return AssignFound(latest, out, found, error);
}

bool InMemoryLedgerStore::FindLatestDayBookBefore(const std::string& tenant_id,
                                                  const std::string& date,
                                                  DayBook* out,
                                                  bool* found,
                                                  std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const DayBook* latest = nullptr;
    for (const auto& day : view.day_books) {
        if (day.tenant_id != tenant_id || day.date >= date) {
            continue;
        }
        if (latest == nullptr || day.date > latest->date) {
            latest = &day;
        }
    }
    return AssignFound(latest, out, found, error);
}

bool InMemoryLedgerStore::InsertDayBook(const DayBook& day_book, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    for (const auto& existing : state_.day_books) {
        if (existing.tenant_id != day_book.tenant_id) {
            continue;
        }
        if (existing.id == day_book.id || existing.date == day_book.date) {
            if (error != nullptr) {
                *error = "day book already exists for " + day_book.date;
            }
            return false;
        }
        if (IsActiveStatus(existing.status) && IsActiveStatus(day_book.status)) {
            if (error != nullptr) {
                *error = "tenant already has an active day book: " + existing.date;
            }
            return false;
        }
    }
    state_.day_books.push_back(day_book);
    return true;
}

bool InMemoryLedgerStore::CompareAndSetDayBook(const DayBook& updated,
                                               DayStatus expected_status,
                                               std::int64_t expected_version,
                                               CasOutcome* outcome,
                                               std::string* error) {
    if (outcome == nullptr) {
        if (error != nullptr) {
            *error = "outcome pointer is null";
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    const auto it = std::find_if(state_.day_books.begin(),
                                 state_.day_books.end(),
                                 [&](const DayBook& day) { return day.id == updated.id; });
    if (it == state_.day_books.end()) {
        *outcome = CasOutcome::kNotFound;
        return true;
    }
    if (it->status != expected_status || it->version != expected_version) {
        *outcome = CasOutcome::kContention;
        return true;
    }
    if (IsActiveStatus(updated.status) && !IsActiveStatus(it->status)) {
        for (const auto& other : state_.day_books) {
            if (other.id != updated.id && other.tenant_id == updated.tenant_id &&
                IsActiveStatus(other.status)) {
                if (error != nullptr) {
                    *error = "tenant already has an active day book: " + other.date;
                }
                return false;
            }
        }
    }
    *it = updated;
    *outcome = CasOutcome::kApplied;
    return true;
}

bool InMemoryLedgerStore::InsertSettlement(const TellerSettlement& settlement,
                                           std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    for (const auto& existing : state_.settlements) {
        if (existing.id == settlement.id) {
            if (error != nullptr) {
                *error = "duplicate settlement id: " + settlement.id;
            }
            return false;
        }
        if (existing.tenant_id == settlement.tenant_id &&
            existing.settlement_ref == settlement.settlement_ref) {
            if (error != nullptr) {
                *error = "duplicate settlement ref: " + settlement.settlement_ref;
            }
            return false;
        }
    }
    state_.settlements.push_back(settlement);
    return true;
}

bool InMemoryLedgerStore::GetSettlement(const std::string& settlement_id,
                                        TellerSettlement* out,
                                        bool* found,
                                        std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = std::find_if(
        view.settlements.begin(),
        view.settlements.end(),
        [&](const TellerSettlement& settlement) { return settlement.id == settlement_id; });
    return AssignFound(it == view.settlements.end() ? nullptr : &*it, out, found, error);
}

bool InMemoryLedgerStore::FindSettlementByRef(const std::string& tenant_id,
                                              const std::string& settlement_ref,
                                              TellerSettlement* out,
                                              bool* found,
                                              std::string* error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    const auto it = std::find_if(view.settlements.begin(),
                                 view.settlements.end(),
                                 [&](const TellerSettlement& settlement) {
                                     return settlement.tenant_id == tenant_id &&
                                            settlement.settlement_ref == settlement_ref;
                                 });
    return AssignFound(it == view.settlements.end() ? nullptr : &*it, out, found, error);
}

bool InMemoryLedgerStore::ListSettlements(const SettlementFilter& filter,
                                          std::vector<TellerSettlement>* out,
                                          std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const State& view = VisibleState();
    out->clear();
    for (const auto& settlement : view.settlements) {
        if (MatchesFilter(settlement, filter)) {
            out->push_back(settlement);
        }
    }
    std::stable_sort(out->begin(),
                     out->end(),
                     [](const TellerSettlement& lhs, const TellerSettlement& rhs) {
                         return lhs.executed_ts_ns < rhs.executed_ts_ns;
                     });
    return true;
}

bool InMemoryLedgerStore::UpdateSettlement(const TellerSettlement& settlement,
                                           std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RequireTransaction(error)) {
        return false;
    }
    const auto it = std::find_if(
        state_.settlements.begin(),
        state_.settlements.end(),
        [&](const TellerSettlement& existing) { return existing.id == settlement.id; });
    if (it == state_.settlements.end()) {
        if (error != nullptr) {
            *error = "settlement not found: " + settlement.id;
        }
        return false;
    }
    *it = settlement;
    return true;
}

}  // namespace coop_ledger
