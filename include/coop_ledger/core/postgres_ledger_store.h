#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "coop_ledger/core/sql_session.h"
#include "coop_ledger/interfaces/ledger_store.h"

namespace coop_ledger {

// ILedgerStore over a single SQL session using the tables in sql/schema.sql.
// A transaction owns the session from BEGIN to COMMIT/ROLLBACK; statements
// from other threads wait for it to finish.
class PostgresLedgerStore : public ILedgerStore {
public:
    PostgresLedgerStore(std::shared_ptr<ISqlSession> session, std::string schema = "ledger");

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

    static bool ValidateSchemaName(const std::string& schema, std::string* error);
    static std::string EncodeDenominations(const std::vector<Denomination>& denominations);
    static bool DecodeDenominations(const std::string& text,
                                    std::vector<Denomination>* out,
                                    std::string* error);

private:
    bool Run(const std::string& sql,
             const std::vector<std::string>& params,
             std::vector<SqlRow>* rows,
             std::string* error) const;
    bool RunWrite(const std::string& sql,
                  const std::vector<std::string>& params,
                  std::vector<SqlRow>* rows,
                  std::string* error);
    bool OwnsTransaction() const;
    std::string Table(const char* name) const;

    bool QueryDayBook(const std::string& where_clause,
                      const std::vector<std::string>& params,
                      DayBook* out,
                      bool* found,
                      std::string* error) const;
    bool QuerySettlements(const std::string& where_clause,
                          const std::vector<std::string>& params,
                          std::vector<TellerSettlement>* out,
                          std::string* error) const;
    bool QueryAccounts(const std::string& where_clause,
                       const std::vector<std::string>& params,
                       std::vector<Account>* out,
                       std::string* error) const;

    std::shared_ptr<ISqlSession> session_;
    std::string schema_;
    std::string config_error_;
    mutable std::mutex transaction_mutex_;
    mutable std::mutex state_mutex_;
    bool in_transaction_{false};
    std::thread::id transaction_owner_;
};

}  // namespace coop_ledger
