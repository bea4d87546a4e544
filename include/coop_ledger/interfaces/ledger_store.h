#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "coop_ledger/contracts/types.h"

namespace coop_ledger {

enum class CasOutcome {
    kApplied,
    kNotFound,
    kContention,
};

struct SettlementFilter {
    std::string tenant_id;
    std::string day_book_id;
    std::string teller_id;
    bool has_status{false};
    SettlementStatus status{SettlementStatus::kAutoApproved};
};

// Transactional persistence for accounts, journal entries, day books and
// teller settlements. Lookups report absence through `found` and reserve a
// false return for storage failures. All mutating calls require an open
// transaction.
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual bool BeginTransaction(std::string* error) = 0;
    virtual bool CommitTransaction(std::string* error) = 0;
    virtual bool RollbackTransaction(std::string* error) = 0;

    virtual bool GetAccount(const std::string& account_id,
                            Account* out,
                            bool* found,
                            std::string* error) const = 0;
    virtual bool GetAccountByCode(const std::string& tenant_id,
                                  const std::string& code,
                                  Account* out,
                                  bool* found,
                                  std::string* error) const = 0;
    virtual bool ListAccounts(const std::string& tenant_id,
                              std::vector<Account>* out,
                              std::string* error) const = 0;
    virtual bool InsertAccount(const Account& account, std::string* error) = 0;

    virtual bool GetRoleBinding(const std::string& tenant_id,
                                AccountRole role,
                                AccountRoleBinding* out,
                                bool* found,
                                std::string* error) const = 0;
    virtual bool UpsertRoleBinding(const AccountRoleBinding& binding, std::string* error) = 0;

    virtual bool CountJournalEntriesForYear(const std::string& tenant_id,
                                            int year,
                                            std::int64_t* out,
                                            std::string* error) const = 0;
    virtual bool CountJournalEntriesForDate(const std::string& tenant_id,
                                            const std::string& date,
                                            std::int64_t* out,
                                            std::string* error) const = 0;
    virtual bool InsertJournalEntry(const JournalEntry& entry, std::string* error) = 0;
    virtual bool GetJournalEntry(const std::string& entry_id,
                                 JournalEntry* out,
                                 bool* found,
                                 std::string* error) const = 0;
    virtual bool ListJournalEntriesForDate(const std::string& tenant_id,
                                           const std::string& date,
                                           std::vector<JournalEntry>* out,
                                           std::string* error) const = 0;
    virtual bool InsertLedgerLine(const LedgerLine& line, std::string* error) = 0;
    virtual bool ListLedgerLines(const std::string& journal_entry_id,
                                 std::vector<LedgerLine>* out,
                                 std::string* error) const = 0;

    // Adds `delta` to the account's running balance and returns the new value.
    virtual bool ApplyBalanceDelta(const std::string& account_id,
                                   double delta,
                                   double* new_balance,
                                   std::string* error) = 0;
    virtual bool GetBalance(const std::string& account_id,
                            double* out,
                            std::string* error) const = 0;

    virtual bool GetDayBookByDate(const std::string& tenant_id,
                                  const std::string& date,
                                  DayBook* out,
                                  bool* found,
                                  std::string* error) const = 0;
    virtual bool GetDayBook(const std::string& day_book_id,
                            DayBook* out,
                            bool* found,
                            std::string* error) const = 0;
    // Day book in OPEN or EOD_IN_PROGRESS.
    virtual bool FindActiveDayBook(const std::string& tenant_id,
                                   DayBook* out,
                                   bool* found,
                                   std::string* error) const = 0;
    virtual bool FindLatestDayBook(const std::string& tenant_id,
                                   DayBook* out,
                                   bool* found,
                                   std::string* error) const = 0;
    virtual bool FindLatestDayBookBefore(const std::string& tenant_id,
                                         const std::string& date,
                                         DayBook* out,
                                         bool* found,
                                         std::string* error) const = 0;
    virtual bool InsertDayBook(const DayBook& day_book, std::string* error) = 0;
    // Writes `updated` only while the stored row still matches id, status and
    // version. `updated.version` must already carry the incremented value.
    virtual bool CompareAndSetDayBook(const DayBook& updated,
                                      DayStatus expected_status,
                                      std::int64_t expected_version,
                                      CasOutcome* outcome,
                                      std::string* error) = 0;

    virtual bool InsertSettlement(const TellerSettlement& settlement, std::string* error) = 0;
    virtual bool GetSettlement(const std::string& settlement_id,
                               TellerSettlement* out,
                               bool* found,
                               std::string* error) const = 0;
    virtual bool FindSettlementByRef(const std::string& tenant_id,
                                     const std::string& settlement_ref,
                                     TellerSettlement* out,
                                     bool* found,
                                     std::string* error) const = 0;
    virtual bool ListSettlements(const SettlementFilter& filter,
                                 std::vector<TellerSettlement>* out,
                                 std::string* error) const = 0;
    virtual bool UpdateSettlement(const TellerSettlement& settlement, std::string* error) = 0;
};

}  // namespace coop_ledger
