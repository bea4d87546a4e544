#include "coop_ledger/core/structured_log_audit_sink.h"

#include <string>

#include "coop_ledger/core/structured_log.h"

namespace coop_ledger {

void StructuredLogAuditSink::Record(const AuditRecord& record) {
    LogFields fields;
    fields.reserve(record.details.size() + 6);
    fields.emplace_back("tenant_id", record.tenant_id);
    fields.emplace_back("actor", record.actor);
    fields.emplace_back("action", record.action);
    fields.emplace_back("resource_type", record.resource_type);
    fields.emplace_back("resource_id", record.resource_id);
    fields.emplace_back("success", record.success ? "true" : "false");
    for (const auto& detail : record.details) {
        fields.push_back(detail);
    }
    EmitStructuredLog(runtime_, "coop_ledger_audit", record.success ? "info" : "warn", "audit",
                      fields);
}

}  // namespace coop_ledger
