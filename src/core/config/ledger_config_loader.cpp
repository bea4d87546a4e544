#include "coop_ledger/core/ledger_config_loader.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "coop_ledger/core/structured_log.h"

namespace coop_ledger {
namespace {

constexpr char kRolePrefix[] = "role.";

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Lowercase(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::unordered_map<std::string, std::string> LoadSimpleYaml(const std::string& path,
                                                            std::string* error) {
    std::unordered_map<std::string, std::string> kv;
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open config: " + path;
        }
        return kv;
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = Trim(line);
        if (line.empty() || line == "ledger:") {
            continue;
        }

        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const auto key = Trim(line.substr(0, pos));
        auto value = Trim(line.substr(pos + 1));
        if (!key.empty()) {
            kv[key] = value;
        }
    }
    return kv;
}

bool ParseDoubleValue(const std::string& value, double* out) {
    if (out == nullptr) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        *out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool SetOptionalNonNegativeDouble(const std::unordered_map<std::string, std::string>& kv,
                                  const char* key,
                                  double* target,
                                  std::string* error) {
    const auto it = kv.find(key);
    if (it == kv.end()) {
        return true;
    }
    double parsed = 0.0;
    if (!ParseDoubleValue(it->second, &parsed) || parsed < 0.0) {
        if (error != nullptr) {
            *error = std::string("invalid non-negative number for key: ") + key;
        }
        return false;
    }
    *target = parsed;
    return true;
}

bool IsValidEntryPrefix(const std::string& prefix) {
    if (prefix.empty()) {
        return false;
    }
    return std::all_of(prefix.begin(), prefix.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_';
    });
}

// role.<tenant>.<role>: <account_id>
bool ParseRoleBinding(const std::string& key,
                      const std::string& value,
                      AccountRoleBinding* out,
                      std::string* error) {
    const std::string body = key.substr(sizeof(kRolePrefix) - 1);
    const auto dot = body.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= body.size()) {
        if (error != nullptr) {
            *error = "invalid role binding key: " + key;
        }
        return false;
    }
    AccountRoleBinding binding;
    binding.tenant_id = body.substr(0, dot);
    if (!ParseAccountRole(Lowercase(body.substr(dot + 1)), &binding.role)) {
        if (error != nullptr) {
            *error = "unknown account role in key: " + key;
        }
        return false;
    }
    if (value.empty()) {
        if (error != nullptr) {
            *error = "empty account id for role binding: " + key;
        }
        return false;
    }
    binding.account_id = value;
    *out = std::move(binding);
    return true;
}

}  // namespace

std::string GetEnvOrDefault(const std::string& key, const std::string& fallback) {
    const char* raw = std::getenv(key.c_str());
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    return std::string(raw);
}

bool LedgerConfigLoader::LoadFromYaml(const std::string& path,
                                      LedgerFileConfig* config,
                                      std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    std::string load_error;
    const auto kv = LoadSimpleYaml(path, &load_error);
    if (!load_error.empty()) {
        if (error != nullptr) {
            *error = load_error;
        }
        return false;
    }

    LedgerFileConfig loaded;

    auto get_value = [&](const char* key) -> std::string {
        const auto it = kv.find(key);
        if (it == kv.end()) {
            return "";
        }
        return it->second;
    };

    loaded.default_tenant_id = get_value("tenant_id");

    if (!get_value("log_level").empty()) {
        LogLevel level = LogLevel::kInfo;
        if (!ParseLogLevel(get_value("log_level"), &level)) {
            if (error != nullptr) {
                *error = "invalid log_level: " + get_value("log_level");
            }
            return false;
        }
        loaded.runtime.log_level = LogLevelName(level);
    }
    if (!get_value("log_sink").empty()) {
        const auto sink = Lowercase(get_value("log_sink"));
        if (sink != "stderr" && sink != "stdout") {
            if (error != nullptr) {
                *error = "invalid log_sink: " + sink;
            }
            return false;
        }
        loaded.runtime.log_sink = sink;
    }

    if (const auto it = kv.find("posting_epsilon"); it != kv.end()) {
        double epsilon = 0.0;
        if (!ParseDoubleValue(it->second, &epsilon) || epsilon <= 0.0 || epsilon >= 1.0) {
            if (error != nullptr) {
                *error = "posting_epsilon must be in (0, 1)";
            }
            return false;
        }
        loaded.runtime.posting_epsilon = epsilon;
    }

    if (!get_value("entry_number_prefix").empty()) {
        const auto prefix = get_value("entry_number_prefix");
        if (!IsValidEntryPrefix(prefix)) {
            if (error != nullptr) {
                *error = "invalid entry_number_prefix: " + prefix;
            }
            return false;
        }
        loaded.runtime.entry_number_prefix = prefix;
    }

    if (!SetOptionalNonNegativeDouble(kv,
                                      "approval_abs_threshold",
                                      &loaded.runtime.approval_abs_threshold,
                                      error) ||
        !SetOptionalNonNegativeDouble(kv,
                                      "approval_pct_threshold",
                                      &loaded.runtime.approval_pct_threshold,
                                      error)) {
        return false;
    }

    if (!get_value("suspense_account_code").empty()) {
        loaded.runtime.suspense_account_code = get_value("suspense_account_code");
    }
    if (!get_value("suspense_account_name").empty()) {
        loaded.runtime.suspense_account_name = get_value("suspense_account_name");
    }
    loaded.runtime.event_wal_path = get_value("event_wal_path");

    for (const auto& [key, value] : kv) {
        if (key.rfind(kRolePrefix, 0) != 0) {
            continue;
        }
        AccountRoleBinding binding;
        if (!ParseRoleBinding(key, value, &binding, error)) {
            return false;
        }
        loaded.runtime.role_bindings.push_back(std::move(binding));
    }
    std::sort(loaded.runtime.role_bindings.begin(),
              loaded.runtime.role_bindings.end(),
              [](const AccountRoleBinding& lhs, const AccountRoleBinding& rhs) {
                  if (lhs.tenant_id != rhs.tenant_id) {
                      return lhs.tenant_id < rhs.tenant_id;
                  }
                  return static_cast<int>(lhs.role) < static_cast<int>(rhs.role);
              });

    *config = std::move(loaded);
    return true;
}

}  // namespace coop_ledger
