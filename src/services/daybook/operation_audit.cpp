#include "coop_ledger/services/operation_audit.h"

#include "coop_ledger/core/fixed_decimal.h"
#include "coop_ledger/core/structured_log.h"

namespace coop_ledger {

void OperationAudit::Succeeded(const AuditTarget& target,
                               std::vector<std::pair<std::string, std::string>> details) const {
    if (sink_ == nullptr) {
        return;
    }
    AuditRecord record;
    record.tenant_id = target.tenant_id;
    record.actor = target.actor;
    record.action = target.action;
    record.resource_type = target.resource_type;
    record.resource_id = target.resource_id;
    record.success = true;
    record.details = std::move(details);
    record.ts_ns = NowEpochNanos();
    sink_->Record(record);
}

bool OperationAudit::Failed(const AuditTarget& target, const ControlError& error) const {
    LogFields fields{{"tenant_id", target.tenant_id},
                     {"actor", target.actor},
                     {"resource_id", target.resource_id},
                     {"code", ErrorCodeName(error.code)},
                     {"message", error.message}};
    for (const auto& pending : error.pending_tellers) {
        fields.emplace_back("pending_account",
                            pending.account_code + "=" +
                                FixedDecimal::FormatCents(FixedDecimal::ToCents(pending.balance)));
    }
    EmitStructuredLog(runtime_, "coop_ledger", "warn", target.action + "_failed", fields);

    if (sink_ != nullptr) {
        AuditRecord record;
        record.tenant_id = target.tenant_id;
        record.actor = target.actor;
        record.action = target.action;
        record.resource_type = target.resource_type;
        record.resource_id = target.resource_id;
        record.success = false;
        record.details = {{"code", ErrorCodeName(error.code)}, {"message", error.message}};
        record.ts_ns = NowEpochNanos();
        sink_->Record(record);
    }
    return false;
}

}  // namespace coop_ledger
