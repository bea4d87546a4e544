#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "coop_ledger/core/sql_session.h"
#include "coop_ledger/core/storage_connection_config.h"

namespace coop_ledger {

class LibpqLibrary;

// libpq is loaded with dlopen on first use. The connection is opened lazily
// and reopened after it breaks, except inside a transaction: there every
// statement fails until ROLLBACK.
class LibpqSqlSession : public ISqlSession {
public:
    explicit LibpqSqlSession(PostgresConnectionConfig config);
    ~LibpqSqlSession() override;

    LibpqSqlSession(const LibpqSqlSession&) = delete;
    LibpqSqlSession& operator=(const LibpqSqlSession&) = delete;

    bool Execute(const std::string& sql,
                 const std::vector<std::string>& params,
                 std::vector<SqlRow>* rows,
                 std::string* error) override;
    bool Ping(std::string* error) override;

    std::string BuildConnInfo() const;

private:
    static const LibpqLibrary& Library();
    static std::string EscapeConnInfoValue(const std::string& value);
    static std::vector<SqlRow> ParseRows(const LibpqLibrary& lib, void* result_ptr);

    bool EnsureConnected(std::string* error);
    bool ConnectOnce(std::string* error);
    void Disconnect();

    PostgresConnectionConfig config_;
    std::mutex mutex_;
    void* conn_{nullptr};
    bool in_transaction_{false};
    bool transaction_lost_{false};
};

}  // namespace coop_ledger
