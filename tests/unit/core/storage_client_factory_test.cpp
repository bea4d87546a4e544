#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "coop_ledger/core/storage_client_factory.h"

namespace coop_ledger {

namespace {

StorageConnectionConfig UnreachableExternalConfig(bool allow_fallback) {
    StorageConnectionConfig config;
    config.postgres.mode = StorageBackendMode::kExternal;
    config.postgres.host = "127.0.0.1";
    config.postgres.port = 1;
    config.postgres.connect_timeout_ms = 1000;
    config.postgres.connect_retry.max_attempts = 1;
    config.postgres.connect_retry.initial_backoff_ms = 0;
    config.allow_inmemory_fallback = allow_fallback;
    return config;
}

}  // namespace

TEST(StorageClientFactoryTest, CreatesInMemoryStoreByDefault) {
    StorageConnectionConfig config;
    std::string error;
    auto store = StorageClientFactory::CreateLedgerStore(config, &error);
    ASSERT_NE(store, nullptr);
    EXPECT_TRUE(error.empty());
    EXPECT_TRUE(store->BeginTransaction(&error)) << error;
    EXPECT_TRUE(store->CommitTransaction(&error)) << error;
}

TEST(StorageClientFactoryTest, FallsBackToInMemoryWhenEnabled) {
    std::string error;
    auto store = StorageClientFactory::CreateLedgerStore(UnreachableExternalConfig(true), &error);
    ASSERT_NE(store, nullptr);
    EXPECT_NE(error.find("external postgres"), std::string::npos);

    std::string call_error;
    EXPECT_TRUE(store->BeginTransaction(&call_error)) << call_error;
    EXPECT_TRUE(store->CommitTransaction(&call_error)) << call_error;
}

TEST(StorageClientFactoryTest, ExternalModeWithoutFallbackReturnsFailingStore) {
    std::string error;
    auto store = StorageClientFactory::CreateLedgerStore(UnreachableExternalConfig(false), &error);
    ASSERT_NE(store, nullptr);
    EXPECT_NE(error.find("external postgres"), std::string::npos);

    std::string call_error;
    EXPECT_FALSE(store->BeginTransaction(&call_error));
    EXPECT_NE(call_error.find("external postgres"), std::string::npos);

    double balance = 0.0;
    EXPECT_FALSE(store->GetBalance("acct-1", &balance, &call_error));
}

TEST(StorageClientFactoryTest, UnavailableSessionReportsReasonOnPing) {
    std::string error;
    auto session = StorageClientFactory::CreateSqlSession(UnreachableExternalConfig(false), &error);
    ASSERT_NE(session, nullptr);
    EXPECT_FALSE(error.empty());
    std::string ping_error;
    EXPECT_FALSE(session->Ping(&ping_error));
    EXPECT_EQ(ping_error, error);
}

}  // namespace coop_ledger
