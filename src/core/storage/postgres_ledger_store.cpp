#include "coop_ledger/core/postgres_ledger_store.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <utility>

#include "coop_ledger/core/fixed_decimal.h"

namespace coop_ledger {
namespace {

constexpr char kAccountColumns[] =
    "id, tenant_id, code, name, type, is_group, is_active, "
    "COALESCE(bound_operator_id, '') AS bound_operator_id, created_ts_ns";
constexpr char kJournalColumns[] =
    "id, tenant_id, entry_number, description, "
    "to_char(effective_date, 'YYYY-MM-DD') AS effective_date, "
    "COALESCE(reverses_entry_id, '') AS reverses_entry_id, created_ts_ns";
constexpr char kLineColumns[] =
    "id, journal_entry_id, tenant_id, account_id, debit::text AS debit, "
    "credit::text AS credit, balance::text AS balance, sequence, created_ts_ns";
constexpr char kDayBookColumns[] =
    "id, tenant_id, to_char(business_date, 'YYYY-MM-DD') AS business_date, status, "
    "opening_cash::text AS opening_cash, closing_cash::text AS closing_cash, "
    "transactions_count, COALESCE(day_begin_by, '') AS day_begin_by, "
    "COALESCE(day_end_by, '') AS day_end_by, version, "
    "COALESCE(last_override_reason, '') AS last_override_reason, "
    "COALESCE(last_override_approver, '') AS last_override_approver, "
    "created_ts_ns, updated_ts_ns";
constexpr char kSettlementColumns[] =
    "id, day_book_id, tenant_id, teller_id, physical_cash::text AS physical_cash, "
    "system_cash::text AS system_cash, difference::text AS difference, status, "
    "settlement_ref, is_force_closed, COALESCE(attachment_ref, '') AS attachment_ref, "
    "denominations, journal_entry_ids, executed_by, executed_ts_ns, "
    "COALESCE(rejection_reason, '') AS rejection_reason, "
    "COALESCE(reverted_by, '') AS reverted_by";

std::string Field(const SqlRow& row, const char* name) {
    const auto it = row.find(name);
    return it == row.end() ? std::string() : it->second;
}

bool ParseDoubleField(const SqlRow& row, const char* name, double* out, std::string* error) {
    const std::string text = Field(row, name);
    if (text.empty()) {
        *out = 0.0;
        return true;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        if (error != nullptr) {
            *error = std::string("invalid numeric column ") + name + ": " + text;
        }
        return false;
    }
    *out = value;
    return true;
}

bool ParseInt64Field(const SqlRow& row, const char* name, std::int64_t* out, std::string* error) {
    const std::string text = Field(row, name);
    if (text.empty()) {
        *out = 0;
        return true;
    }
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        if (error != nullptr) {
            *error = std::string("invalid integer column ") + name + ": " + text;
        }
        return false;
    }
    *out = static_cast<std::int64_t>(value);
    return true;
}

bool ParseBoolField(const SqlRow& row, const char* name) {
    const std::string text = Field(row, name);
    return text == "t" || text == "true" || text == "1";
}

const char* BoolParam(bool value) { return value ? "true" : "false"; }

std::string MoneyParam(double amount) {
    return FixedDecimal::FormatCents(FixedDecimal::ToCents(amount));
}

std::vector<std::string> SplitList(const std::string& text, char delimiter) {
    std::vector<std::string> out;
    if (text.empty()) {
        return out;
    }
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(delimiter, start);
        out.push_back(text.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return out;
}

std::string JoinList(const std::vector<std::string>& items, char delimiter) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out.push_back(delimiter);
        }
        out += items[i];
    }
    return out;
}

bool RowToAccount(const SqlRow& row, Account* out, std::string* error) {
    out->id = Field(row, "id");
    out->tenant_id = Field(row, "tenant_id");
    out->code = Field(row, "code");
    out->name = Field(row, "name");
    if (!ParseAccountType(Field(row, "type"), &out->type)) {
        if (error != nullptr) {
            *error = "invalid account type: " + Field(row, "type");
        }
        return false;
    }
    out->is_group = ParseBoolField(row, "is_group");
    out->is_active = ParseBoolField(row, "is_active");
    out->bound_operator_id = Field(row, "bound_operator_id");
    return ParseInt64Field(row, "created_ts_ns", &out->created_ts_ns, error);
}

bool RowToJournalEntry(const SqlRow& row, JournalEntry* out, std::string* error) {
    out->id = Field(row, "id");
    out->tenant_id = Field(row, "tenant_id");
    out->entry_number = Field(row, "entry_number");
    out->description = Field(row, "description");
    out->effective_date = Field(row, "effective_date");
    out->reverses_entry_id = Field(row, "reverses_entry_id");
    return ParseInt64Field(row, "created_ts_ns", &out->created_ts_ns, error);
}

bool RowToLedgerLine(const SqlRow& row, LedgerLine* out, std::string* error) {
    out->id = Field(row, "id");
    out->journal_entry_id = Field(row, "journal_entry_id");
    out->tenant_id = Field(row, "tenant_id");
    out->account_id = Field(row, "account_id");
    return ParseDoubleField(row, "debit", &out->debit, error) &&
           ParseDoubleField(row, "credit", &out->credit, error) &&
           ParseDoubleField(row, "balance", &out->balance, error) &&
           ParseInt64Field(row, "sequence", &out->sequence, error) &&
           ParseInt64Field(row, "created_ts_ns", &out->created_ts_ns, error);
}

bool RowToDayBook(const SqlRow& row, DayBook* out, std::string* error) {
    out->id = Field(row, "id");
    out->tenant_id = Field(row, "tenant_id");
    out->date = Field(row, "business_date");
    if (!ParseDayStatus(Field(row, "status"), &out->status)) {
        if (error != nullptr) {
            *error = "invalid day book status: " + Field(row, "status");
        }
        return false;
    }
    out->day_begin_by = Field(row, "day_begin_by");
    out->day_end_by = Field(row, "day_end_by");
    out->last_override_reason = Field(row, "last_override_reason");
    out->last_override_approver = Field(row, "last_override_approver");
    return ParseDoubleField(row, "opening_cash", &out->opening_cash, error) &&
           ParseDoubleField(row, "closing_cash", &out->closing_cash, error) &&
           ParseInt64Field(row, "transactions_count", &out->transactions_count, error) &&
           ParseInt64Field(row, "version", &out->version, error) &&
           ParseInt64Field(row, "created_ts_ns", &out->created_ts_ns, error) &&
           ParseInt64Field(row, "updated_ts_ns", &out->updated_ts_ns, error);
}

bool RowToSettlement(const SqlRow& row, TellerSettlement* out, std::string* error) {
    out->id = Field(row, "id");
    out->day_book_id = Field(row, "day_book_id");
    out->tenant_id = Field(row, "tenant_id");
    out->teller_id = Field(row, "teller_id");
    if (!ParseSettlementStatus(Field(row, "status"), &out->status)) {
        if (error != nullptr) {
            *error = "invalid settlement status: " + Field(row, "status");
        }
        return false;
    }
    out->settlement_ref = Field(row, "settlement_ref");
    out->is_force_closed = ParseBoolField(row, "is_force_closed");
    out->attachment_ref = Field(row, "attachment_ref");
    out->journal_entry_ids = SplitList(Field(row, "journal_entry_ids"), ',');
    out->executed_by = Field(row, "executed_by");
    out->rejection_reason = Field(row, "rejection_reason");
    out->reverted_by = Field(row, "reverted_by");
    return PostgresLedgerStore::DecodeDenominations(
               Field(row, "denominations"), &out->denominations, error) &&
           ParseDoubleField(row, "physical_cash", &out->physical_cash, error) &&
           ParseDoubleField(row, "system_cash", &out->system_cash, error) &&
           ParseDoubleField(row, "difference", &out->difference, error) &&
           ParseInt64Field(row, "executed_ts_ns", &out->executed_ts_ns, error);
}

bool RequireOutputs(const void* out, const bool* found, std::string* error) {
    if (out == nullptr || found == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    return true;
}

}  // namespace

PostgresLedgerStore::PostgresLedgerStore(std::shared_ptr<ISqlSession> session, std::string schema)
    : session_(std::move(session)), schema_(std::move(schema)) {
    if (session_ == nullptr) {
        config_error_ = "sql session is null";
    } else {
        ValidateSchemaName(schema_, &config_error_);
    }
}

bool PostgresLedgerStore::ValidateSchemaName(const std::string& schema, std::string* error) {
    bool valid = !schema.empty() &&
                 (std::isalpha(static_cast<unsigned char>(schema.front())) || schema.front() == '_');
    for (char ch : schema) {
        if (!(std::isalnum(static_cast<unsigned char>(ch)) || ch == '_')) {
            valid = false;
        }
    }
    if (!valid && error != nullptr) {
        *error = "invalid schema identifier: " + schema;
    }
    return valid;
}

std::string PostgresLedgerStore::EncodeDenominations(const std::vector<Denomination>& denominations) {
    std::vector<std::string> items;
    items.reserve(denominations.size());
    for (const auto& note : denominations) {
        items.push_back(MoneyParam(note.denomination) + ":" + std::to_string(note.count));
    }
    return JoinList(items, ';');
}

bool PostgresLedgerStore::DecodeDenominations(const std::string& text,
                                              std::vector<Denomination>* out,
                                              std::string* error) {
    out->clear();
    for (const auto& item : SplitList(text, ';')) {
        const auto colon = item.find(':');
        if (colon == std::string::npos) {
            if (error != nullptr) {
                *error = "invalid denomination entry: " + item;
            }
            return false;
        }
        SqlRow parts{{"denomination", item.substr(0, colon)}, {"count", item.substr(colon + 1)}};
        Denomination note;
        std::int64_t count = 0;
        if (!ParseDoubleField(parts, "denomination", &note.denomination, error) ||
            !ParseInt64Field(parts, "count", &count, error)) {
            return false;
        }
        note.count = static_cast<std::int32_t>(count);
        out->push_back(note);
    }
    return true;
}

std::string PostgresLedgerStore::Table(const char* name) const { return schema_ + "." + name; }

bool PostgresLedgerStore::OwnsTransaction() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return in_transaction_ && transaction_owner_ == std::this_thread::get_id();
}

bool PostgresLedgerStore::Run(const std::string& sql,
                              const std::vector<std::string>& params,
                              std::vector<SqlRow>* rows,
                              std::string* error) const {
    if (!config_error_.empty()) {
        if (error != nullptr) {
            *error = config_error_;
        }
        return false;
    }
    if (OwnsTransaction()) {
        return session_->Execute(sql, params, rows, error);
    }
    std::lock_guard<std::mutex> lock(transaction_mutex_);
    return session_->Execute(sql, params, rows, error);
}

bool PostgresLedgerStore::RunWrite(const std::string& sql,
                                   const std::vector<std::string>& params,
                                   std::vector<SqlRow>* rows,
                                   std::string* error) {
    if (!OwnsTransaction()) {
        if (error != nullptr) {
            *error = "write outside of transaction";
        }
        return false;
    }
    return session_->Execute(sql, params, rows, error);
}

bool PostgresLedgerStore::BeginTransaction(std::string* error) {
    if (!config_error_.empty()) {
        if (error != nullptr) {
            *error = config_error_;
        }
        return false;
    }
    if (OwnsTransaction()) {
        if (error != nullptr) {
            *error = "nested transaction is not supported";
        }
        return false;
    }
    transaction_mutex_.lock();
    if (!session_->Execute("BEGIN", {}, nullptr, error)) {
        transaction_mutex_.unlock();
        return false;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    in_transaction_ = true;
    transaction_owner_ = std::this_thread::get_id();
    return true;
}

bool PostgresLedgerStore::CommitTransaction(std::string* error) {
    if (!OwnsTransaction()) {
        if (error != nullptr) {
            *error = "no active transaction";
        }
        return false;
    }
    std::string commit_error;
    bool ok = session_->Execute("COMMIT", {}, nullptr, &commit_error);
    if (!ok) {
        std::string rollback_error;
        if (!session_->Execute("ROLLBACK", {}, nullptr, &rollback_error)) {
            commit_error += "; rollback failed: " + rollback_error;
        }
        if (error != nullptr) {
            *error = commit_error;
        }
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        in_transaction_ = false;
        transaction_owner_ = std::thread::id();
    }
    transaction_mutex_.unlock();
    return ok;
}

bool PostgresLedgerStore::RollbackTransaction(std::string* error) {
    if (!OwnsTransaction()) {
        if (error != nullptr) {
            *error = "no active transaction";
        }
        return false;
    }
    const bool ok = session_->Execute("ROLLBACK", {}, nullptr, error);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        in_transaction_ = false;
        transaction_owner_ = std::thread::id();
    }
    transaction_mutex_.unlock();
    return ok;
}

bool PostgresLedgerStore::QueryAccounts(const std::string& where_clause,
                                        const std::vector<std::string>& params,
                                        std::vector<Account>* out,
                                        std::string* error) const {
    std::vector<SqlRow> rows;
    const std::string sql = std::string("SELECT ") + kAccountColumns + " FROM " +
                            Table("accounts") + " WHERE " + where_clause +
                            " ORDER BY created_ts_ns, id";
    if (!Run(sql, params, &rows, error)) {
        return false;
    }
    out->clear();
    out->reserve(rows.size());
    for (const auto& row : rows) {
        Account account;
        if (!RowToAccount(row, &account, error)) {
            return false;
        }
        out->push_back(std::move(account));
    }
    return true;
}

bool PostgresLedgerStore::GetAccount(const std::string& account_id,
                                     Account* out,
                                     bool* found,
                                     std::string* error) const {
    if (!RequireOutputs(out, found, error)) {
        return false;
    }
    std::vector<Account> accounts;
    if (!QueryAccounts("id = $1", {account_id}, &accounts, error)) {
        return false;
    }
    *found = !accounts.empty();
    if (*found) {
        *out = std::move(accounts.front());
    }
    return true;
}

bool PostgresLedgerStore::GetAccountByCode(const std::string& tenant_id,
                                           const std::string& code,
                                           Account* out,
                                           bool* found,
                                           std::string* error) const {
    if (!RequireOutputs(out, found, error)) {
        return false;
    }
    std::vector<Account> accounts;
    if (!QueryAccounts("tenant_id = $1 AND code = $2", {tenant_id, code}, &accounts, error)) {
        return false;
    }
    *found = !accounts.empty();
    if (*found) {
        *out = std::move(accounts.front());
    }
    return true;
}

bool PostgresLedgerStore::ListAccounts(const std::string& tenant_id,
                                       std::vector<Account>* out,
                                       std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    return QueryAccounts("tenant_id = $1", {tenant_id}, out, error);
}

bool PostgresLedgerStore::InsertAccount(const Account& account, std::string* error) {
    return RunWrite("INSERT INTO " + Table("accounts") +
                        " (id, tenant_id, code, name, type, is_group, is_active, "
                        "bound_operator_id, created_ts_ns) "
                        "VALUES ($1, $2, $3, $4, $5, $6::boolean, $7::boolean, NULLIF($8, ''), "
                        "$9::bigint)",
                    {account.id,
                     account.tenant_id,
                     account.code,
                     account.name,
                     ToString(account.type),
                     BoolParam(account.is_group),
                     BoolParam(account.is_active),
                     account.bound_operator_id,
                     std::to_string(account.created_ts_ns)},
                    nullptr,
                    error);
}

bool PostgresLedgerStore::GetRoleBinding(const std::string& tenant_id,
                                         AccountRole role,
                                         AccountRoleBinding* out,
                                         bool* found,
                                         std::string* error) const {
    if (!RequireOutputs(out, found, error)) {
        return false;
    }
    std::vector<SqlRow> rows;
    if (!Run("SELECT account_id FROM " + Table("account_role_bindings") +
                 " WHERE tenant_id = $1 AND role = $2",
             {tenant_id, ToString(role)},
             &rows,
             error)) {
        return false;
    }
    *found = !rows.empty();
    if (*found) {
        out->tenant_id = tenant_id;
        out->role = role;
        out->account_id = Field(rows.front(), "account_id");
    }
    return true;
}

bool PostgresLedgerStore::UpsertRoleBinding(const AccountRoleBinding& binding, std::string* error) {
    return RunWrite("INSERT INTO " + Table("account_role_bindings") +
                        " (tenant_id, role, account_id) VALUES ($1, $2, $3) "
                        "ON CONFLICT (tenant_id, role) DO UPDATE SET account_id = EXCLUDED.account_id",
                    {binding.tenant_id, ToString(binding.role), binding.account_id},
                    nullptr,
                    error);
}

bool PostgresLedgerStore::CountJournalEntriesForYear(const std::string& tenant_id,
                                                     int year,
                                                     std::int64_t* out,
                                                     std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    // Serializes numbering per tenant until the surrounding transaction ends.
    if (OwnsTransaction() &&
        !Run("SELECT pg_advisory_xact_lock(hashtext($1)) AS locked",
             {tenant_id + ":journal_number"},
             nullptr,
             error)) {
        return false;
    }
    std::vector<SqlRow> rows;
    if (!Run("SELECT COUNT(*) AS n FROM " + Table("journal_entries") +
                 " WHERE tenant_id = $1 AND effective_date >= make_date($2::int, 1, 1) "
                 "AND effective_date < make_date($2::int + 1, 1, 1)",
             {tenant_id, std::to_string(year)},
             &rows,
             error)) {
        return false;
    }
    if (rows.empty()) {
        *out = 0;
        return true;
    }
    return ParseInt64Field(rows.front(), "n", out, error);
}

bool PostgresLedgerStore::CountJournalEntriesForDate(const std::string& tenant_id,
                                                     const std::string& date,
                                                     std::int64_t* out,
                                                     std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::vector<SqlRow> rows;
    if (!Run("SELECT COUNT(*) AS n FROM " + Table("journal_entries") +
                 " WHERE tenant_id = $1 AND effective_date = $2::date",
             {tenant_id, date},
             &rows,
             error)) {
        return false;
    }
    if (rows.empty()) {
        *out = 0;
        return true;
    }
    return ParseInt64Field(rows.front(), "n", out, error);
}

bool PostgresLedgerStore::InsertJournalEntry(const JournalEntry& entry, std::string* error) {
    return RunWrite("INSERT INTO " + Table("journal_entries") +
                        " (id, tenant_id, entry_number, description, effective_date, "
                        "reverses_entry_id, created_ts_ns) "
                        "VALUES ($1, $2, $3, $4, $5::date, NULLIF($6, ''), $7::bigint)",
                    {entry.id,
                     entry.tenant_id,
                     entry.entry_number,
                     entry.description,
                     entry.effective_date,
                     entry.reverses_entry_id,
                     std::to_string(entry.created_ts_ns)},
                    nullptr,
                    error);
}

bool PostgresLedgerStore::GetJournalEntry(const std::string& entry_id,
                                          JournalEntry* out,
                                          bool* found,
                                          std::string* error) const {
    if (!RequireOutputs(out, found, error)) {
        return false;
    }
    std::vector<SqlRow> rows;
    if (!Run(std::string("SELECT ") + kJournalColumns + " FROM " + Table("journal_entries") +
                 " WHERE id = $1",
             {entry_id},
             &rows,
             error)) {
        return false;
    }
    *found = !rows.empty();
    return !*found || RowToJournalEntry(rows.front(), out, error);
}

bool PostgresLedgerStore::ListJournalEntriesForDate(const std::string& tenant_id,
                                                    const std::string& date,
                                                    std::vector<JournalEntry>* out,
                                                    std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::vector<SqlRow> rows;
    if (!Run(std::string("SELECT ") + kJournalColumns + " FROM " + Table("journal_entries") +
                 " WHERE tenant_id = $1 AND effective_date = $2::date "
                 "ORDER BY created_ts_ns, entry_number",
             {tenant_id, date},
             &rows,
             error)) {
        return false;
    }
    out->clear();
    out->reserve(rows.size());
    for (const auto& row : rows) {
        JournalEntry entry;
        if (!RowToJournalEntry(row, &entry, error)) {
            return false;
        }
        out->push_back(std::move(entry));
    }
    return true;
}

bool PostgresLedgerStore::InsertLedgerLine(const LedgerLine& line, std::string* error) {
    return RunWrite("INSERT INTO " + Table("ledger_lines") +
                        " (id, journal_entry_id, tenant_id, account_id, debit, credit, balance, "
                        "sequence, created_ts_ns) VALUES ($1, $2, $3, $4, $5::numeric, "
                        "$6::numeric, $7::numeric, $8::bigint, $9::bigint)",
                    {line.id,
                     line.journal_entry_id,
                     line.tenant_id,
                     line.account_id,
                     MoneyParam(line.debit),
                     MoneyParam(line.credit),
                     MoneyParam(line.balance),
                     std::to_string(line.sequence),
                     std::to_string(line.created_ts_ns)},
                    nullptr,
                    error);
}

bool PostgresLedgerStore::ListLedgerLines(const std::string& journal_entry_id,
                                          std::vector<LedgerLine>* out,
                                          std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::vector<SqlRow> rows;
    if (!Run(std::string("SELECT ") + kLineColumns + " FROM " + Table("ledger_lines") +
                 " WHERE journal_entry_id = $1 ORDER BY sequence",
             {journal_entry_id},
             &rows,
             error)) {
        return false;
    }
    out->clear();
    out->reserve(rows.size());
    for (const auto& row : rows) {
        LedgerLine line;
        if (!RowToLedgerLine(row, &line, error)) {
            return false;
        }
        out->push_back(std::move(line));
    }
    return true;
}

bool PostgresLedgerStore::ApplyBalanceDelta(const std::string& account_id,
                                            double delta,
                                            double* new_balance,
                                            std::string* error) {
    std::vector<SqlRow> rows;
    if (!RunWrite("INSERT INTO " + Table("account_balances") +
                      " AS b (account_id, balance) VALUES ($1, $2::numeric) "
                      "ON CONFLICT (account_id) DO UPDATE SET balance = b.balance + EXCLUDED.balance "
                      "RETURNING balance::text AS balance",
                  {account_id, MoneyParam(delta)},
                  &rows,
                  error)) {
        return false;
    }
    if (rows.empty()) {
        if (error != nullptr) {
            *error = "balance update returned no row";
        }
        return false;
    }
    double balance = 0.0;
    if (!ParseDoubleField(rows.front(), "balance", &balance, error)) {
        return false;
    }
    if (new_balance != nullptr) {
        *new_balance = balance;
    }
    return true;
}

bool PostgresLedgerStore::GetBalance(const std::string& account_id,
                                     double* out,
                                     std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::vector<SqlRow> rows;
    if (!Run("SELECT balance::text AS balance FROM " + Table("account_balances") +
                 " WHERE account_id = $1",
             {account_id},
             &rows,
             error)) {
        return false;
    }
    if (rows.empty()) {
        *out = 0.0;
        return true;
    }
    return ParseDoubleField(rows.front(), "balance", out, error);
}

bool PostgresLedgerStore::QueryDayBook(const std::string& where_clause,
                                       const std::vector<std::string>& params,
                                       DayBook* out,
                                       bool* found,
                                       std::string* error) const {
    if (!RequireOutputs(out, found, error)) {
        return false;
    }
    std::vector<SqlRow> rows;
    if (!Run(std::string("SELECT ") + kDayBookColumns + " FROM " + Table("day_books") + " WHERE " +
                 where_clause,
             params,
             &rows,
             error)) {
        return false;
    }
    *found = !rows.empty();
    return !*found || RowToDayBook(rows.front(), out, error);
}

bool PostgresLedgerStore::GetDayBookByDate(const std::string& tenant_id,
                                           const std::string& date,
                                           DayBook* out,
                                           bool* found,
                                           std::string* error) const {
    return QueryDayBook(
        "tenant_id = $1 AND business_date = $2::date", {tenant_id, date}, out, found, error);
}

bool PostgresLedgerStore::GetDayBook(const std::string& day_book_id,
                                     DayBook* out,
                                     bool* found,
                                     std::string* error) const {
    return QueryDayBook("id = $1", {day_book_id}, out, found, error);
}

bool PostgresLedgerStore::FindActiveDayBook(const std::string& tenant_id,
                                            DayBook* out,
                                            bool* found,
                                            std::string* error) const {
    return QueryDayBook(
        "tenant_id = $1 AND status IN ('OPEN', 'EOD_IN_PROGRESS') "
        "ORDER BY business_date DESC LIMIT 1",
        {tenant_id},
        out,
        found,
        error);
}

bool PostgresLedgerStore::FindLatestDayBook(const std::string& tenant_id,
                                            DayBook* out,
                                            bool* found,
                                            std::string* error) const {
    return QueryDayBook(
        "tenant_id = $1 ORDER BY business_date DESC LIMIT 1", {tenant_id}, out, found, error);
}

bool PostgresLedgerStore::FindLatestDayBookBefore(const std::string& tenant_id,
                                                  const std::string& date,
                                                  DayBook* out,
                                                  bool* found,
                                                  std::string* error) const {
    return QueryDayBook(
        "tenant_id = $1 AND business_date < $2::date ORDER BY business_date DESC LIMIT 1",
        {tenant_id, date},
        out,
        found,
        error);
}

bool PostgresLedgerStore::InsertDayBook(const DayBook& day_book, std::string* error) {
    return RunWrite(
        "INSERT INTO " + Table("day_books") +
            " (id, tenant_id, business_date, status, opening_cash, closing_cash, "
            "transactions_count, day_begin_by, day_end_by, version, last_override_reason, "
            "last_override_approver, created_ts_ns, updated_ts_ns) VALUES ($1, $2, $3::date, $4, "
            "$5::numeric, $6::numeric, $7::bigint, NULLIF($8, ''), NULLIF($9, ''), $10::bigint, "
            "NULLIF($11, ''), NULLIF($12, ''), $13::bigint, $14::bigint)",
        {day_book.id,
         day_book.tenant_id,
         day_book.date,
         ToString(day_book.status),
         MoneyParam(day_book.opening_cash),
         MoneyParam(day_book.closing_cash),
         std::to_string(day_book.transactions_count),
         day_book.day_begin_by,
         day_book.day_end_by,
         std::to_string(day_book.version),
         day_book.last_override_reason,
         day_book.last_override_approver,
         std::to_string(day_book.created_ts_ns),
         std::to_string(day_book.updated_ts_ns)},
        nullptr,
        error);
}

bool PostgresLedgerStore::CompareAndSetDayBook(const DayBook& updated,
                                               DayStatus expected_status,
                                               std::int64_t expected_version,
                                               CasOutcome* outcome,
                                               std::string* error) {
    if (outcome == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::vector<SqlRow> rows;
    if (!RunWrite("UPDATE " + Table("day_books") +
                      " SET status = $4, opening_cash = $5::numeric, closing_cash = $6::numeric, "
                      "transactions_count = $7::bigint, day_begin_by = NULLIF($8, ''), "
                      "day_end_by = NULLIF($9, ''), version = $10::bigint, "
                      "last_override_reason = NULLIF($11, ''), "
                      "last_override_approver = NULLIF($12, ''), updated_ts_ns = $13::bigint "
                      "WHERE id = $1 AND status = $2 AND version = $3::bigint RETURNING id",
                  {updated.id,
                   ToString(expected_status),
                   std::to_string(expected_version),
                   ToString(updated.status),
                   MoneyParam(updated.opening_cash),
                   MoneyParam(updated.closing_cash),
                   std::to_string(updated.transactions_count),
                   updated.day_begin_by,
                   updated.day_end_by,
                   std::to_string(updated.version),
                   updated.last_override_reason,
                   updated.last_override_approver,
                   std::to_string(updated.updated_ts_ns)},
                  &rows,
                  error)) {
        return false;
    }
    if (!rows.empty()) {
        *outcome = CasOutcome::kApplied;
        return true;
    }
    std::vector<SqlRow> existing;
    if (!RunWrite("SELECT id FROM " + Table("day_books") + " WHERE id = $1",
                  {updated.id},
                  &existing,
                  error)) {
        return false;
    }
    *outcome = existing.empty() ? CasOutcome::kNotFound : CasOutcome::kContention;
    return true;
}

bool PostgresLedgerStore::QuerySettlements(const std::string& where_clause,
                                           const std::vector<std::string>& params,
                                           std::vector<TellerSettlement>* out,
                                           std::string* error) const {
    std::vector<SqlRow> rows;
    if (!Run(std::string("SELECT ") + kSettlementColumns + " FROM " +
                 Table("teller_settlements") + " WHERE " + where_clause +
                 " ORDER BY executed_ts_ns, id",
             params,
             &rows,
             error)) {
        return false;
    }
    out->clear();
    out->reserve(rows.size());
    for (const auto& row : rows) {
        TellerSettlement settlement;
        if (!RowToSettlement(row, &settlement, error)) {
            return false;
        }
        out->push_back(std::move(settlement));
    }
    return true;
}

bool PostgresLedgerStore::InsertSettlement(const TellerSettlement& settlement, std::string* error) {
    return RunWrite(
        "INSERT INTO " + Table("teller_settlements") +
            " (id, day_book_id, tenant_id, teller_id, physical_cash, system_cash, difference, "
            "status, settlement_ref, is_force_closed, attachment_ref, denominations, "
            "journal_entry_ids, executed_by, executed_ts_ns, rejection_reason, reverted_by) "
            "VALUES ($1, $2, $3, $4, $5::numeric, $6::numeric, $7::numeric, $8, $9, $10::boolean, "
            "NULLIF($11, ''), $12, $13, $14, $15::bigint, NULLIF($16, ''), NULLIF($17, ''))",
        {settlement.id,
         settlement.day_book_id,
         settlement.tenant_id,
         settlement.teller_id,
         MoneyParam(settlement.physical_cash),
         MoneyParam(settlement.system_cash),
         MoneyParam(settlement.difference),
         ToString(settlement.status),
         settlement.settlement_ref,
         BoolParam(settlement.is_force_closed),
         settlement.attachment_ref,
         EncodeDenominations(settlement.denominations),
         JoinList(settlement.journal_entry_ids, ','),
         settlement.executed_by,
         std::to_string(settlement.executed_ts_ns),
         settlement.rejection_reason,
         settlement.reverted_by},
        nullptr,
        error);
}

bool PostgresLedgerStore::GetSettlement(const std::string& settlement_id,
                                        TellerSettlement* out,
                                        bool* found,
                                        std::string* error) const {
    if (!RequireOutputs(out, found, error)) {
        return false;
    }
    std::vector<TellerSettlement> settlements;
    if (!QuerySettlements("id = $1", {settlement_id}, &settlements, error)) {
        return false;
    }
    *found = !settlements.empty();
    if (*found) {
        *out = std::move(settlements.front());
    }
    return true;
}

bool PostgresLedgerStore::FindSettlementByRef(const std::string& tenant_id,
                                              const std::string& settlement_ref,
                                              TellerSettlement* out,
                                              bool* found,
                                              std::string* error) const {
    if (!RequireOutputs(out, found, error)) {
        return false;
    }
    std::vector<TellerSettlement> settlements;
    if (!QuerySettlements("tenant_id = $1 AND settlement_ref = $2",
                          {tenant_id, settlement_ref},
                          &settlements,
                          error)) {
        return false;
    }
    *found = !settlements.empty();
    if (*found) {
        *out = std::move(settlements.front());
    }
    return true;
}

bool PostgresLedgerStore::ListSettlements(const SettlementFilter& filter,
                                          std::vector<TellerSettlement>* out,
                                          std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    std::ostringstream where;
    std::vector<std::string> params{filter.tenant_id};
    where << "tenant_id = $1";
    if (!filter.day_book_id.empty()) {
        params.push_back(filter.day_book_id);
        where << " AND day_book_id = $" << params.size();
    }
    if (!filter.teller_id.empty()) {
        params.push_back(filter.teller_id);
        where << " AND teller_id = $" << params.size();
    }
    if (filter.has_status) {
        params.push_back(ToString(filter.status));
        where << " AND status = $" << params.size();
    }
    return QuerySettlements(where.str(), params, out, error);
}

bool PostgresLedgerStore::UpdateSettlement(const TellerSettlement& settlement, std::string* error) {
    std::vector<SqlRow> rows;
    if (!RunWrite("UPDATE " + Table("teller_settlements") +
                      " SET status = $2, is_force_closed = $3::boolean, "
                      "journal_entry_ids = $4, rejection_reason = NULLIF($5, ''), "
                      "reverted_by = NULLIF($6, ''), attachment_ref = NULLIF($7, '') "
                      "WHERE id = $1 RETURNING id",
                  {settlement.id,
                   ToString(settlement.status),
                   BoolParam(settlement.is_force_closed),
                   JoinList(settlement.journal_entry_ids, ','),
                   settlement.rejection_reason,
                   settlement.reverted_by,
                   settlement.attachment_ref},
                  &rows,
                  error)) {
        return false;
    }
    if (rows.empty()) {
        if (error != nullptr) {
            *error = "settlement not found: " + settlement.id;
        }
        return false;
    }
    return true;
}

}  // namespace coop_ledger
