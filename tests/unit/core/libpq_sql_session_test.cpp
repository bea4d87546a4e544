#include <string>

#include <gtest/gtest.h>

#include "coop_ledger/core/libpq_sql_session.h"
#include "coop_ledger/core/storage_connection_config.h"

namespace coop_ledger {

namespace {

PostgresConnectionConfig BuildConfig() {
    PostgresConnectionConfig config;
    config.mode = StorageBackendMode::kExternal;
    config.host = "127.0.0.1";
    config.port = 1;
    config.database = "coop_ledger";
    config.user = "teller";
    config.password = "it's";
    config.connect_timeout_ms = 200;
    config.connect_retry.max_attempts = 1;
    config.connect_retry.initial_backoff_ms = 0;
    return config;
}

}  // namespace

TEST(LibpqSqlSessionTest, BuildsConnInfoFromFields) {
    LibpqSqlSession session(BuildConfig());
    const auto conn_info = session.BuildConnInfo();
    EXPECT_NE(conn_info.find("host='127.0.0.1'"), std::string::npos);
    EXPECT_NE(conn_info.find("port='1'"), std::string::npos);
    EXPECT_NE(conn_info.find("dbname='coop_ledger'"), std::string::npos);
    EXPECT_NE(conn_info.find("password='it\\'s'"), std::string::npos);
    EXPECT_NE(conn_info.find("sslmode='disable'"), std::string::npos);
    // Sub-second timeouts round up to libpq's one second minimum.
    EXPECT_NE(conn_info.find("connect_timeout='1'"), std::string::npos);
}

TEST(LibpqSqlSessionTest, DsnTakesPrecedenceOverFields) {
    auto config = BuildConfig();
    config.dsn = "postgres://teller@db.internal:5432/coop";
    LibpqSqlSession session(config);
    EXPECT_EQ(session.BuildConnInfo(), "postgres://teller@db.internal:5432/coop");
}

TEST(LibpqSqlSessionTest, PingReturnsFalseWhenServerUnavailable) {
    LibpqSqlSession session(BuildConfig());
    std::string error;
    EXPECT_FALSE(session.Ping(&error));
    EXPECT_FALSE(error.empty());
}

TEST(LibpqSqlSessionTest, ExecuteFailsWithoutServer) {
    LibpqSqlSession session(BuildConfig());
    std::vector<SqlRow> rows;
    std::string error;
    EXPECT_FALSE(session.Execute("SELECT 1 AS ok", {}, &rows, &error));
    EXPECT_TRUE(rows.empty());
    EXPECT_FALSE(error.empty());
}

}  // namespace coop_ledger
