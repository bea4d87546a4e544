#pragma once

#include <string>

#include "coop_ledger/core/ledger_config.h"

namespace coop_ledger {

struct LedgerFileConfig {
    LedgerRuntimeConfig runtime;
    std::string default_tenant_id;
};

std::string GetEnvOrDefault(const std::string& key, const std::string& fallback);

class LedgerConfigLoader {
public:
    static bool LoadFromYaml(const std::string& path, LedgerFileConfig* config, std::string* error);
};

}  // namespace coop_ledger
