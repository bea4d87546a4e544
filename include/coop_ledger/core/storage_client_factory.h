#pragma once

#include <memory>
#include <string>

#include "coop_ledger/core/sql_session.h"
#include "coop_ledger/core/storage_connection_config.h"
#include "coop_ledger/interfaces/ledger_store.h"

namespace coop_ledger {

class StorageClientFactory {
public:
    // Never returns null. When the external store cannot be used, `error`
    // carries the reason and the result is either the in-memory store (if
    // fallback is allowed) or a store whose every call fails with it.
    static std::shared_ptr<ILedgerStore> CreateLedgerStore(const StorageConnectionConfig& config,
                                                           std::string* error);

    static std::shared_ptr<ISqlSession> CreateSqlSession(const StorageConnectionConfig& config,
                                                         std::string* error);
};

}  // namespace coop_ledger
