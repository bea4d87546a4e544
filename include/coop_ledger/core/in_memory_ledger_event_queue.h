#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "coop_ledger/interfaces/ledger_event_sink.h"

namespace coop_ledger {

class InMemoryLedgerEventQueue : public ILedgerEventSink {
public:
    explicit InMemoryLedgerEventQueue(std::size_t capacity = 4096) : capacity_(capacity) {}

    bool PublishJournalPosted(const JournalPostedEvent& event) override;
    bool Flush() override { return true; }

    // Removes and returns every queued event in publish order.
    std::vector<JournalPostedEvent> Drain();
    std::size_t size() const;
    std::size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::size_t capacity_{4096};
    std::deque<JournalPostedEvent> events_;
    std::size_t dropped_{0};
};

}  // namespace coop_ledger
