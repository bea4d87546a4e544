#include "coop_ledger/core/storage_connection_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>

namespace coop_ledger {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

std::string GetEnvOrDefault(const char* key, const std::string& default_value) {
    const char* raw = std::getenv(key);
    if (raw == nullptr) {
        return default_value;
    }
    return std::string(raw);
}

int GetEnvOrDefaultInt(const char* key, int default_value) {
    const char* raw = std::getenv(key);
    if (raw == nullptr) {
        return default_value;
    }
    try {
        return std::stoi(raw);
    } catch (const std::exception&) {
        return default_value;
    }
}

bool ParseBoolWithDefault(const std::string& raw, bool default_value) {
    const auto value = ToLower(raw);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return default_value;
}

StorageBackendMode ParseMode(const std::string& raw, StorageBackendMode default_mode) {
    const auto value = ToLower(raw);
    if (value == "external" || value == "postgres") {
        return StorageBackendMode::kExternal;
    }
    if (value == "in_memory" || value == "inmemory" || value == "memory") {
        return StorageBackendMode::kInMemory;
    }
    return default_mode;
}

}  // namespace

StorageConnectionConfig StorageConnectionConfig::FromEnvironment() {
    StorageConnectionConfig config;
    auto& pg = config.postgres;
    pg.mode = ParseMode(GetEnvOrDefault("COOP_LEDGER_STORE_MODE", "in_memory"),
                        StorageBackendMode::kInMemory);
    pg.dsn = GetEnvOrDefault("COOP_LEDGER_PG_DSN", pg.dsn);
    pg.host = GetEnvOrDefault("COOP_LEDGER_PG_HOST", pg.host);
    pg.port = GetEnvOrDefaultInt("COOP_LEDGER_PG_PORT", pg.port);
    pg.database = GetEnvOrDefault("COOP_LEDGER_PG_DB", pg.database);
    pg.user = GetEnvOrDefault("COOP_LEDGER_PG_USER", pg.user);
    pg.password = GetEnvOrDefault("COOP_LEDGER_PG_PASSWORD", pg.password);
    pg.ssl_mode = GetEnvOrDefault("COOP_LEDGER_PG_SSLMODE", pg.ssl_mode);
    pg.connect_timeout_ms =
        GetEnvOrDefaultInt("COOP_LEDGER_PG_CONNECT_TIMEOUT_MS", pg.connect_timeout_ms);
    pg.ledger_schema = GetEnvOrDefault("COOP_LEDGER_PG_SCHEMA", pg.ledger_schema);
    pg.connect_retry.max_attempts = std::max(
        1, GetEnvOrDefaultInt("COOP_LEDGER_PG_CONNECT_ATTEMPTS", pg.connect_retry.max_attempts));

    config.allow_inmemory_fallback = ParseBoolWithDefault(
        GetEnvOrDefault("COOP_LEDGER_STORAGE_ALLOW_FALLBACK", "true"), true);
    return config;
}

}  // namespace coop_ledger
