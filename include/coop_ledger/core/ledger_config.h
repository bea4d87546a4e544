#pragma once

#include <string>
#include <vector>

#include "coop_ledger/contracts/types.h"

namespace coop_ledger {

struct LedgerRuntimeConfig {
    std::string log_level{"info"};
    std::string log_sink{"stderr"};

    double posting_epsilon{0.01};
    std::string entry_number_prefix{"JE"};

    double approval_abs_threshold{1000.0};
    double approval_pct_threshold{0.01};

    std::string suspense_account_code{"00-10300-01-00001"};
    std::string suspense_account_name{"Suspense Account (Manager Liability)"};

    // Empty keeps journal events in process memory only.
    std::string event_wal_path;

    std::vector<AccountRoleBinding> role_bindings;
};

}  // namespace coop_ledger
