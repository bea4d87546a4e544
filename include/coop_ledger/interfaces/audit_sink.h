#pragma once

#include "coop_ledger/contracts/types.h"

namespace coop_ledger {

class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    virtual void Record(const AuditRecord& record) = 0;
};

}  // namespace coop_ledger
