#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "coop_ledger/contracts/errors.h"
#include "coop_ledger/core/ledger_config.h"
#include "coop_ledger/interfaces/audit_sink.h"

namespace coop_ledger {

struct AuditTarget {
    std::string tenant_id;
    std::string actor;
    std::string action;
    std::string resource_type;
    std::string resource_id;
};

// Audit and failure logging shared by the day control services. The audit
// sink is optional.
class OperationAudit {
public:
    OperationAudit(std::shared_ptr<IAuditSink> sink, const LedgerRuntimeConfig* runtime)
        : sink_(std::move(sink)), runtime_(runtime) {}

    void Succeeded(const AuditTarget& target,
                   std::vector<std::pair<std::string, std::string>> details = {}) const;

    // Logs at warn and records a failed audit entry. Always returns false.
    bool Failed(const AuditTarget& target, const ControlError& error) const;

private:
    std::shared_ptr<IAuditSink> sink_;
    const LedgerRuntimeConfig* runtime_{nullptr};
};

}  // namespace coop_ledger
