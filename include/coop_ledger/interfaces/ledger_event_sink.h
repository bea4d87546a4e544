#pragma once

#include "coop_ledger/contracts/types.h"

namespace coop_ledger {

// Receives one event per committed journal entry. Delivery happens after the
// owning transaction commits; rolled back work never reaches a sink.
class ILedgerEventSink {
public:
    virtual ~ILedgerEventSink() = default;

    virtual bool PublishJournalPosted(const JournalPostedEvent& event) = 0;
    virtual bool Flush() = 0;
};

}  // namespace coop_ledger
