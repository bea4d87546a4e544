#pragma once

#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "coop_ledger/core/ledger_config.h"

namespace coop_ledger {

using LogFields = std::vector<std::pair<std::string, std::string>>;

enum class LogLevel {
    kDebug = 10,
    kInfo = 20,
    kWarn = 30,
    kError = 40,
};

inline const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
    }
    return "info";
}

// Accepts any case and the "warning" spelling.
inline bool ParseLogLevel(const std::string& text, LogLevel* out) {
    std::string lowered;
    lowered.reserve(text.size());
    for (const char ch : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    LogLevel level;
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    if (out != nullptr) {
        *out = level;
    }
    return true;
}

// Connection strings and credentials never reach the log sink.
inline bool IsRedactedLogKey(const std::string& key) {
    return key == "password" || key == "dsn" || key == "conninfo";
}

inline void AppendLogValue(std::ostringstream* line, const std::string& value) {
    (*line) << '"';
    for (const char ch : value) {
        if (ch == '"' || ch == '\\') {
            (*line) << '\\';
        }
        if (ch == '\n') {
            (*line) << "\\n";
            continue;
        }
        (*line) << ch;
    }
    (*line) << '"';
}

inline std::mutex& StructuredLogMutex() {
    static std::mutex mutex;
    return mutex;
}

inline void EmitStructuredLog(const LedgerRuntimeConfig* runtime,
                              const std::string& app,
                              const std::string& level,
                              const std::string& event,
                              const LogFields& fields = {}) {
    LogLevel event_level = LogLevel::kInfo;
    if (!ParseLogLevel(level, &event_level)) {
        event_level = LogLevel::kInfo;
    }
    LogLevel threshold = LogLevel::kInfo;
    if (runtime != nullptr && !ParseLogLevel(runtime->log_level, &threshold)) {
        threshold = LogLevel::kInfo;
    }
    if (static_cast<int>(event_level) < static_cast<int>(threshold)) {
        return;
    }

    std::ostringstream line;
    line << "ts_ns=" << NowEpochNanos() << " level=" << LogLevelName(event_level)
         << " app=" << app << " event=" << event;
    for (const auto& [key, value] : fields) {
        line << ' ' << key << '=';
        AppendLogValue(&line, IsRedactedLogKey(key) ? std::string("***") : value);
    }
    line << '\n';

    std::ostream& out =
        runtime != nullptr && runtime->log_sink == "stdout" ? std::cout : std::cerr;
    std::lock_guard<std::mutex> lock(StructuredLogMutex());
    out << line.str();
}

}  // namespace coop_ledger
