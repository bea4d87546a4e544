#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "coop_ledger/core/fixed_decimal.h"
#include "coop_ledger/interfaces/ledger_store.h"

namespace coop_ledger {

// Serializes transactions across threads: BeginTransaction blocks until the
// previous transaction commits or rolls back. Rollback restores the snapshot
// taken at begin. Reads from threads other than the transaction owner see
// only committed state.
class InMemoryLedgerStore : public ILedgerStore {
public:
    InMemoryLedgerStore() = default;

    bool BeginTransaction(std::string* error) override;
    bool CommitTransaction(std::string* error) override;
    bool RollbackTransaction(std::string* error) override;

    bool GetAccount(const std::string& account_id,
                    Account* out,
                    bool* found,
                    std::string* error) const override;
    bool GetAccountByCode(const std::string& tenant_id,
                          const std::string& code,
                          Account* out,
                          bool* found,
                          std::string* error) const override;
    bool ListAccounts(const std::string& tenant_id,
                      std::vector<Account>* out,
                      std::string* error) const override;
    bool InsertAccount(const Account& account, std::string* error) override;

    bool GetRoleBinding(const std::string& tenant_id,
                        AccountRole role,
                        AccountRoleBinding* out,
                        bool* found,
                        std::string* error) const override;
    bool UpsertRoleBinding(const AccountRoleBinding& binding, std::string* error) override;

    bool CountJournalEntriesForYear(const std::string& tenant_id,
                                    int year,
                                    std::int64_t* out,
                                    std::string* error) const override;
    bool CountJournalEntriesForDate(const std::string& tenant_id,
                                    const std::string& date,
                                    std::int64_t* out,
                                    std::string* error) const override;
    bool InsertJournalEntry(const JournalEntry& entry, std::string* error) override;
    bool GetJournalEntry(const std::string& entry_id,
                         JournalEntry* out,
                         bool* found,
                         std::string* error) const override;
    bool ListJournalEntriesForDate(const std::string& tenant_id,
                                   const std::string& date,
                                   std::vector<JournalEntry>* out,
                                   std::string* error) const override;
    bool InsertLedgerLine(const LedgerLine& line, std::string* error) override;
    bool ListLedgerLines(const std::string& journal_entry_id,
                         std::vector<LedgerLine>* out,
                         std::string* error) const override;

    bool ApplyBalanceDelta(const std::string& account_id,
                           double delta,
                           double* new_balance,
                           std::string* error) override;
    bool GetBalance(const std::string& account_id, double* out, std::string* error) const override;

    bool GetDayBookByDate(const std::string& tenant_id,
                          const std::string& date,
                          DayBook* out,
                          bool* found,
                          std::string* error) const override;
    bool GetDayBook(const std::string& day_book_id,
                    DayBook* out,
                    bool* found,
                    std::string* error) const override;
    bool FindActiveDayBook(const std::string& tenant_id,
                           DayBook* out,
                           bool* found,
                           std::string* error) const override;
    bool FindLatestDayBook(const std::string& tenant_id,
                           DayBook* out,
                           bool* found,
                           std::string* error) const override;
    bool FindLatestDayBookBefore(const std::string& tenant_id,
                                 const std::string& date,
                                 DayBook* out,
                                 bool* found,
                                 std::string* error) const override;
    bool InsertDayBook(const DayBook& day_book, std::string* error) override;
    bool CompareAndSetDayBook(const DayBook& updated,
                              DayStatus expected_status,
                              std::int64_t expected_version,
                              CasOutcome* outcome,
                              std::string* error) override;

    bool InsertSettlement(const TellerSettlement& settlement, std::string* error) override;
    bool GetSettlement(const std::string& settlement_id,
                       TellerSettlement* out,
                       bool* found,
                       std::string* error) const override;
    bool FindSettlementByRef(const std::string& tenant_id,
                             const std::string& settlement_ref,
                             TellerSettlement* out,
                             bool* found,
                             std::string* error) const override;
    bool ListSettlements(const SettlementFilter& filter,
                         std::vector<TellerSettlement>* out,
                         std::string* error) const override;
    bool UpdateSettlement(const TellerSettlement& settlement, std::string* error) override;

private:
    struct State {
        std::unordered_map<std::string, Account> accounts;
        std::vector<std::string> account_order;
        std::map<std::string, AccountRoleBinding> role_bindings;
        std::vector<JournalEntry> journal_entries;
        std::vector<LedgerLine> ledger_lines;
        std::unordered_map<std::string, Cents> balances;
        std::vector<DayBook> day_books;
        std::vector<TellerSettlement> settlements;
    };

    bool RequireTransaction(std::string* error) const;
    // Caller holds mutex_.
    const State& VisibleState() const;
    static std::string RoleKey(const std::string& tenant_id, AccountRole role);

    std::mutex transaction_mutex_;
    mutable std::mutex mutex_;
    bool in_transaction_{false};
    std::thread::id transaction_owner_;
    State state_;
    State snapshot_;
};

}  // namespace coop_ledger
