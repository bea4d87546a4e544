#include <gtest/gtest.h>

#include "coop_ledger/core/storage_connection_config.h"
#include "ledger_test_support.h"

namespace coop_ledger {

using test_support::ScopedEnvVar;

TEST(StorageConnectionConfigTest, DefaultsToInMemoryWithFallback) {
    const ScopedEnvVar mode("COOP_LEDGER_STORE_MODE", nullptr);
    const ScopedEnvVar fallback("COOP_LEDGER_STORAGE_ALLOW_FALLBACK", nullptr);

    const auto config = StorageConnectionConfig::FromEnvironment();
    EXPECT_EQ(config.postgres.mode, StorageBackendMode::kInMemory);
    EXPECT_TRUE(config.allow_inmemory_fallback);
    EXPECT_EQ(config.postgres.ledger_schema, "ledger");
    EXPECT_EQ(config.postgres.connect_retry.max_attempts, 3);
}

TEST(StorageConnectionConfigTest, LoadsConnectionConfigFromEnvironment) {
    const ScopedEnvVar mode("COOP_LEDGER_STORE_MODE", "postgres");
    const ScopedEnvVar dsn("COOP_LEDGER_PG_DSN", "postgres://teller:pwd@db:5432/coop");
    const ScopedEnvVar host("COOP_LEDGER_PG_HOST", "db.internal");
    const ScopedEnvVar port("COOP_LEDGER_PG_PORT", "6543");
    const ScopedEnvVar db("COOP_LEDGER_PG_DB", "coop");
    const ScopedEnvVar user("COOP_LEDGER_PG_USER", "teller");
    const ScopedEnvVar ssl("COOP_LEDGER_PG_SSLMODE", "require");
    const ScopedEnvVar timeout("COOP_LEDGER_PG_CONNECT_TIMEOUT_MS", "750");
    const ScopedEnvVar schema("COOP_LEDGER_PG_SCHEMA", "ledger_test");
    const ScopedEnvVar attempts("COOP_LEDGER_PG_CONNECT_ATTEMPTS", "0");
    const ScopedEnvVar fallback("COOP_LEDGER_STORAGE_ALLOW_FALLBACK", "off");

    const auto config = StorageConnectionConfig::FromEnvironment();
    EXPECT_EQ(config.postgres.mode, StorageBackendMode::kExternal);
    EXPECT_EQ(config.postgres.dsn, "postgres://teller:pwd@db:5432/coop");
    EXPECT_EQ(config.postgres.host, "db.internal");
    EXPECT_EQ(config.postgres.port, 6543);
    EXPECT_EQ(config.postgres.database, "coop");
    EXPECT_EQ(config.postgres.user, "teller");
    EXPECT_EQ(config.postgres.ssl_mode, "require");
    EXPECT_EQ(config.postgres.connect_timeout_ms, 750);
    EXPECT_EQ(config.postgres.ledger_schema, "ledger_test");
    EXPECT_EQ(config.postgres.connect_retry.max_attempts, 1);
    EXPECT_FALSE(config.allow_inmemory_fallback);
}

TEST(StorageConnectionConfigTest, IgnoresMalformedNumbers) {
    const ScopedEnvVar port("COOP_LEDGER_PG_PORT", "not-a-port");
    const auto config = StorageConnectionConfig::FromEnvironment();
    EXPECT_EQ(config.postgres.port, 5432);
}

}  // namespace coop_ledger
