#pragma once

#include "coop_ledger/core/ledger_config.h"
#include "coop_ledger/interfaces/audit_sink.h"

namespace coop_ledger {

class StructuredLogAuditSink : public IAuditSink {
public:
    explicit StructuredLogAuditSink(const LedgerRuntimeConfig* runtime) : runtime_(runtime) {}

    void Record(const AuditRecord& record) override;

private:
    const LedgerRuntimeConfig* runtime_{nullptr};
};

}  // namespace coop_ledger
