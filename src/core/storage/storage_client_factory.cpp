#include "coop_ledger/core/storage_client_factory.h"

#include <utility>
#include <vector>

#include "coop_ledger/core/in_memory_ledger_store.h"
#include "coop_ledger/core/libpq_sql_session.h"
#include "coop_ledger/core/postgres_ledger_store.h"

namespace coop_ledger {

namespace {

class UnavailableSqlSession : public ISqlSession {
public:
    explicit UnavailableSqlSession(std::string reason) : reason_(std::move(reason)) {}

    bool Execute(const std::string& sql,
                 const std::vector<std::string>& params,
                 std::vector<SqlRow>* rows,
                 std::string* error) override {
        (void)sql;
        (void)params;
        (void)rows;
        if (error != nullptr) {
            *error = reason_;
        }
        return false;
    }

    bool Ping(std::string* error) override {
        if (error != nullptr) {
            *error = reason_;
        }
        return false;
    }

private:
    std::string reason_;
};

std::string BuildExternalDisabledMessage(const char* component) {
    return std::string("external ") + component + " driver not enabled in current build";
}

}  // namespace

std::shared_ptr<ISqlSession> StorageClientFactory::CreateSqlSession(
    const StorageConnectionConfig& config,
    std::string* error) {
#if defined(COOP_LEDGER_ENABLE_POSTGRES) && COOP_LEDGER_ENABLE_POSTGRES
    auto session = std::make_shared<LibpqSqlSession>(config.postgres);
    std::string ping_error;
    if (session->Ping(&ping_error)) {
        return session;
    }
    const std::string reason = std::string("external postgres unavailable: ") + ping_error;
    if (error != nullptr) {
        *error = reason;
    }
    return std::make_shared<UnavailableSqlSession>(reason);
#else
    (void)config;
    const auto reason = BuildExternalDisabledMessage("postgres");
    if (error != nullptr) {
        *error = reason;
    }
    return std::make_shared<UnavailableSqlSession>(reason);
#endif
}

std::shared_ptr<ILedgerStore> StorageClientFactory::CreateLedgerStore(
    const StorageConnectionConfig& config,
    std::string* error) {
    if (config.postgres.mode == StorageBackendMode::kInMemory) {
        return std::make_shared<InMemoryLedgerStore>();
    }
    std::string session_error;
    auto session = CreateSqlSession(config, &session_error);
    if (session_error.empty()) {
        return std::make_shared<PostgresLedgerStore>(std::move(session),
                                                     config.postgres.ledger_schema);
    }
    if (error != nullptr) {
        *error = session_error;
    }
    if (config.allow_inmemory_fallback) {
        return std::make_shared<InMemoryLedgerStore>();
    }
    return std::make_shared<PostgresLedgerStore>(std::move(session),
                                                 config.postgres.ledger_schema);
}

}  // namespace coop_ledger
