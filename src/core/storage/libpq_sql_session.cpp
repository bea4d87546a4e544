#include "coop_ledger/core/libpq_sql_session.h"

#include <dlfcn.h>

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <thread>
#include <utility>

namespace coop_ledger {

extern "C" {
struct pg_conn;
struct pg_result;
}

using PGconn = pg_conn;
using PGresult = pg_result;

// libpq-fe.h status values the session acts on.
constexpr int kConnectionOk = 0;
constexpr int kCommandOk = 1;
constexpr int kTuplesOk = 2;
constexpr int kSingleTuple = 9;

// Owns the dlopen handle. Entry points stay null unless every one of them
// resolved.
class LibpqLibrary {
public:
    using ClearFn = void (*)(PGresult*);

    LibpqLibrary();
    ~LibpqLibrary();

    LibpqLibrary(const LibpqLibrary&) = delete;
    LibpqLibrary& operator=(const LibpqLibrary&) = delete;

    bool available() const { return handle_ != nullptr; }
    const std::string& load_error() const { return load_error_; }

    PGconn* (*connectdb)(const char*){nullptr};
    int (*status)(const PGconn*){nullptr};
    char* (*error_message)(const PGconn*){nullptr};
    void (*finish)(PGconn*){nullptr};
    PGresult* (*exec_params)(PGconn*,
                             const char*,
                             int,
                             const unsigned int*,
                             const char* const*,
                             const int*,
                             const int*,
                             int){nullptr};
    int (*result_status)(const PGresult*){nullptr};
    char* (*result_error_message)(const PGresult*){nullptr};
    ClearFn clear{nullptr};
    int (*ntuples)(const PGresult*){nullptr};
    int (*nfields)(const PGresult*){nullptr};
    char* (*fname)(const PGresult*, int){nullptr};
    char* (*getvalue)(const PGresult*, int, int){nullptr};
    int (*getisnull)(const PGresult*, int, int){nullptr};

private:
    void* handle_{nullptr};
    std::string load_error_;
};

LibpqLibrary::LibpqLibrary() {
    for (const char* soname : {"libpq.so.5", "libpq.so"}) {
        handle_ = ::dlopen(soname, RTLD_NOW | RTLD_LOCAL);
        if (handle_ != nullptr) {
            break;
        }
    }
    if (handle_ == nullptr) {
        const char* dl_error = ::dlerror();
        load_error_ = dl_error != nullptr ? dl_error : "libpq.so not found";
        return;
    }

    const struct {
        const char* name;
        void** slot;
    } entry_points[] = {
        {"PQconnectdb", reinterpret_cast<void**>(&connectdb)},
        {"PQstatus", reinterpret_cast<void**>(&status)},
        {"PQerrorMessage", reinterpret_cast<void**>(&error_message)},
        {"PQfinish", reinterpret_cast<void**>(&finish)},
        {"PQexecParams", reinterpret_cast<void**>(&exec_params)},
        {"PQresultStatus", reinterpret_cast<void**>(&result_status)},
        {"PQresultErrorMessage", reinterpret_cast<void**>(&result_error_message)},
        {"PQclear", reinterpret_cast<void**>(&clear)},
        {"PQntuples", reinterpret_cast<void**>(&ntuples)},
        {"PQnfields", reinterpret_cast<void**>(&nfields)},
        {"PQfname", reinterpret_cast<void**>(&fname)},
        {"PQgetvalue", reinterpret_cast<void**>(&getvalue)},
        {"PQgetisnull", reinterpret_cast<void**>(&getisnull)},
    };
    for (const auto& entry : entry_points) {
        *entry.slot = ::dlsym(handle_, entry.name);
        if (*entry.slot == nullptr) {
            load_error_ = std::string("libpq has no ") + entry.name;
            for (const auto& reset : entry_points) {
                *reset.slot = nullptr;
            }
            (void)::dlclose(handle_);
            handle_ = nullptr;
            return;
        }
    }
}

LibpqLibrary::~LibpqLibrary() {
    if (handle_ != nullptr) {
        (void)::dlclose(handle_);
    }
}

namespace {

std::string ConnOrResultError(const LibpqLibrary& lib,
                              const PGconn* conn,
                              const PGresult* result,
                              const std::string& fallback) {
    if (result != nullptr) {
        const char* result_error = lib.result_error_message(result);
        if (result_error != nullptr && *result_error != '\0') {
            return std::string(result_error);
        }
    }
    if (conn != nullptr) {
        const char* conn_error = lib.error_message(conn);
        if (conn_error != nullptr && *conn_error != '\0') {
            return std::string(conn_error);
        }
    }
    return fallback;
}

}  // namespace

LibpqSqlSession::LibpqSqlSession(PostgresConnectionConfig config) : config_(std::move(config)) {}

LibpqSqlSession::~LibpqSqlSession() { Disconnect(); }

const LibpqLibrary& LibpqSqlSession::Library() {
    static const LibpqLibrary library;
    return library;
}

std::string LibpqSqlSession::EscapeConnInfoValue(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '\\' || ch == '\'') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    return out;
}

std::string LibpqSqlSession::BuildConnInfo() const {
    if (!config_.dsn.empty()) {
        return config_.dsn;
    }

    auto append_field = [](std::ostringstream* stream,
                           const std::string& key,
                           const std::string& value) {
        if (value.empty()) {
            return;
        }
        *stream << key << "='" << EscapeConnInfoValue(value) << "' ";
    };

    std::ostringstream conn_info;
    append_field(&conn_info, "host", config_.host);
    conn_info << "port='" << config_.port << "' ";
    append_field(&conn_info, "dbname", config_.database);
    append_field(&conn_info, "user", config_.user);
    append_field(&conn_info, "password", config_.password);
    append_field(&conn_info, "sslmode", config_.ssl_mode);
    conn_info << "connect_timeout='" << std::max(1, config_.connect_timeout_ms / 1000) << "'";
    return conn_info.str();
}

void LibpqSqlSession::Disconnect() {
    if (conn_ != nullptr) {
        Library().finish(static_cast<PGconn*>(conn_));
        conn_ = nullptr;
    }
}

bool LibpqSqlSession::ConnectOnce(std::string* error) {
    const auto& lib = Library();
    PGconn* conn = lib.connectdb(BuildConnInfo().c_str());
    if (conn == nullptr) {
        if (error != nullptr) {
            *error = "PQconnectdb returned null";
        }
        return false;
    }
    if (lib.status(conn) != kConnectionOk) {
        if (error != nullptr) {
            *error = ConnOrResultError(lib, conn, nullptr, "PQconnectdb failed");
        }
        lib.finish(conn);
        return false;
    }
    conn_ = conn;
    return true;
}

bool LibpqSqlSession::EnsureConnected(std::string* error) {
    if (conn_ != nullptr) {
        return true;
    }
    const auto& lib = Library();
    if (!lib.available()) {
        if (error != nullptr) {
            *error = "libpq unavailable: " + lib.load_error();
        }
        return false;
    }

    const int attempts = std::max(1, config_.connect_retry.max_attempts);
    int backoff_ms = std::max(0, config_.connect_retry.initial_backoff_ms);
    std::string last_error;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (ConnectOnce(&last_error)) {
            return true;
        }
        if (attempt < attempts && backoff_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms = std::min(backoff_ms * 2, std::max(1, config_.connect_retry.max_backoff_ms));
        }
    }
    if (error != nullptr) {
        *error = "connect failed after " + std::to_string(attempts) + " attempt(s): " + last_error;
    }
    return false;
}

std::vector<SqlRow> LibpqSqlSession::ParseRows(const LibpqLibrary& lib, void* result_ptr) {
    auto* result = static_cast<PGresult*>(result_ptr);
    const int rows = std::max(0, lib.ntuples(result));
    const int fields = std::max(0, lib.nfields(result));

    std::vector<SqlRow> out;
    out.reserve(static_cast<std::size_t>(rows));
    for (int row = 0; row < rows; ++row) {
        SqlRow item;
        for (int col = 0; col < fields; ++col) {
            const char* name = lib.fname(result, col);
            if (name == nullptr) {
                continue;
            }
            if (lib.getisnull(result, row, col) != 0) {
                item[name] = "";
                continue;
            }
            const char* value = lib.getvalue(result, row, col);
            item[name] = value != nullptr ? std::string(value) : "";
        }
        out.push_back(std::move(item));
    }
    return out;
}

bool LibpqSqlSession::Execute(const std::string& sql,
                              const std::vector<std::string>& params,
                              std::vector<SqlRow>* rows,
                              std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transaction_lost_) {
        if (sql == "ROLLBACK") {
            transaction_lost_ = false;
            in_transaction_ = false;
            return true;
        }
        if (error != nullptr) {
            *error = "connection lost inside transaction; rollback required";
        }
        return false;
    }
    if (!EnsureConnected(error)) {
        return false;
    }

    const auto& lib = Library();
    auto* conn = static_cast<PGconn*>(conn_);
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }
    PGresult* result = lib.exec_params(conn,
                                       sql.c_str(),
                                       static_cast<int>(values.size()),
                                       nullptr,
                                       values.empty() ? nullptr : values.data(),
                                       nullptr,
                                       nullptr,
                                       0);
    if (result == nullptr) {
        if (error != nullptr) {
            *error = ConnOrResultError(lib, conn, nullptr, "PQexecParams failed");
        }
        if (lib.status(conn) != kConnectionOk) {
            Disconnect();
            transaction_lost_ = in_transaction_;
        }
        return false;
    }

    std::unique_ptr<PGresult, LibpqLibrary::ClearFn> result_guard(result, lib.clear);
    const int status = lib.result_status(result);
    const bool tuples = status == kTuplesOk || status == kSingleTuple;
    if (!tuples && status != kCommandOk) {
        if (error != nullptr) {
            *error = ConnOrResultError(
                lib, conn, result, "unexpected result status " + std::to_string(status));
        }
        if (lib.status(conn) != kConnectionOk) {
            result_guard.reset();
            Disconnect();
            transaction_lost_ = in_transaction_;
        }
        return false;
    }

    if (sql == "BEGIN") {
        in_transaction_ = true;
    } else if (sql == "COMMIT" || sql == "ROLLBACK") {
        in_transaction_ = false;
    }
    if (rows != nullptr) {
        if (tuples) {
            *rows = ParseRows(lib, result);
        } else {
            rows->clear();
        }
    }
    return true;
}

bool LibpqSqlSession::Ping(std::string* error) {
    std::vector<SqlRow> rows;
    if (!Execute("SELECT 1 AS ok", {}, &rows, error)) {
        return false;
    }
    if (rows.empty()) {
        if (error != nullptr) {
            *error = "SELECT 1 returned no rows";
        }
        return false;
    }
    return true;
}

}  // namespace coop_ledger
