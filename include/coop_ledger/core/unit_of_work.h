#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "coop_ledger/contracts/types.h"
#include "coop_ledger/core/ledger_config.h"
#include "coop_ledger/interfaces/ledger_event_sink.h"
#include "coop_ledger/interfaces/ledger_store.h"

namespace coop_ledger {

// One store transaction per logical operation. Journal events staged during
// the transaction are published only after a successful commit. Destroying an
// uncommitted unit of work rolls the transaction back.
class UnitOfWork {
public:
    UnitOfWork(std::shared_ptr<ILedgerStore> store,
               std::shared_ptr<ILedgerEventSink> event_sink,
               const LedgerRuntimeConfig* runtime = nullptr);
    ~UnitOfWork();

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    bool Begin(std::string* error);
    bool Commit(std::string* error);
    bool Rollback(std::string* error);

    ILedgerStore& store() { return *store_; }
    const ILedgerStore& store() const { return *store_; }
    bool active() const { return active_; }

    void StageEvent(JournalPostedEvent event);
    std::size_t staged_event_count() const { return staged_events_.size(); }
    std::size_t undelivered_event_count() const { return undelivered_events_; }

private:
    void PublishStagedEvents();

    std::shared_ptr<ILedgerStore> store_;
    std::shared_ptr<ILedgerEventSink> event_sink_;
    const LedgerRuntimeConfig* runtime_{nullptr};
    bool active_{false};
    std::vector<JournalPostedEvent> staged_events_;
    std::size_t undelivered_events_{0};
};

}  // namespace coop_ledger
