#pragma once

#include <string>

#include "coop_ledger/core/storage_retry_policy.h"

namespace coop_ledger {

enum class StorageBackendMode {
    kInMemory,
    kExternal,
};

struct PostgresConnectionConfig {
    StorageBackendMode mode{StorageBackendMode::kInMemory};
    std::string dsn;
    std::string host{"127.0.0.1"};
    int port{5432};
    std::string database{"coop_ledger"};
    std::string user;
    std::string password;
    std::string ssl_mode{"disable"};
    int connect_timeout_ms{2000};
    std::string ledger_schema{"ledger"};
    StorageRetryPolicy connect_retry;
};

struct StorageConnectionConfig {
    PostgresConnectionConfig postgres;
    bool allow_inmemory_fallback{true};

    static StorageConnectionConfig FromEnvironment();
};

}  // namespace coop_ledger
