#include "coop_ledger/core/in_memory_ledger_event_queue.h"

#include <iterator>

namespace coop_ledger {

bool InMemoryLedgerEventQueue::PublishJournalPosted(const JournalPostedEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ > 0 && events_.size() >= capacity_) {
        ++dropped_;
        return false;
    }
    events_.push_back(event);
    return true;
}

std::vector<JournalPostedEvent> InMemoryLedgerEventQueue::Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JournalPostedEvent> out(std::make_move_iterator(events_.begin()),
                                       std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

std::size_t InMemoryLedgerEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::size_t InMemoryLedgerEventQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

}  // namespace coop_ledger
