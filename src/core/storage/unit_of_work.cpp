#include "coop_ledger/core/unit_of_work.h"

#include <utility>

#include "coop_ledger/core/structured_log.h"

namespace coop_ledger {

UnitOfWork::UnitOfWork(std::shared_ptr<ILedgerStore> store,
                       std::shared_ptr<ILedgerEventSink> event_sink,
                       const LedgerRuntimeConfig* runtime)
    : store_(std::move(store)), event_sink_(std::move(event_sink)), runtime_(runtime) {}

UnitOfWork::~UnitOfWork() {
    if (!active_) {
        return;
    }
    std::string rollback_error;
    if (!Rollback(&rollback_error)) {
        EmitStructuredLog(runtime_,
                          "coop_ledger",
                          "error",
                          "unit_of_work_rollback_failed",
                          {{"error", rollback_error}});
    }
}

bool UnitOfWork::Begin(std::string* error) {
    if (store_ == nullptr) {
        if (error != nullptr) {
            *error = "ledger store is null";
        }
        return false;
    }
    if (active_) {
        if (error != nullptr) {
            *error = "unit of work already active";
        }
        return false;
    }
    if (!store_->BeginTransaction(error)) {
        return false;
    }
    active_ = true;
    staged_events_.clear();
    return true;
}

bool UnitOfWork::Commit(std::string* error) {
    if (!active_) {
        if (error != nullptr) {
            *error = "unit of work is not active";
        }
        return false;
    }
    std::string commit_error;
    if (!store_->CommitTransaction(&commit_error)) {
        std::string rollback_error;
        (void)store_->RollbackTransaction(&rollback_error);
        active_ = false;
        staged_events_.clear();
        if (error != nullptr) {
            *error = "commit failed: " + commit_error;
        }
        return false;
    }
    active_ = false;
    PublishStagedEvents();
    return true;
}

bool UnitOfWork::Rollback(std::string* error) {
    if (!active_) {
        return true;
    }
    active_ = false;
    staged_events_.clear();
    return store_->RollbackTransaction(error);
}

void UnitOfWork::StageEvent(JournalPostedEvent event) {
    staged_events_.push_back(std::move(event));
}

void UnitOfWork::PublishStagedEvents() {
    auto events = std::move(staged_events_);
    staged_events_.clear();
    if (event_sink_ == nullptr) {
        return;
    }
    const EpochNanos committed_ts_ns = NowEpochNanos();
    for (auto& event : events) {
        event.committed_ts_ns = committed_ts_ns;
        if (!event_sink_->PublishJournalPosted(event)) {
            ++undelivered_events_;
            EmitStructuredLog(runtime_,
                              "coop_ledger",
                              "warn",
                              "journal_event_publish_failed",
                              {{"tenant_id", event.tenant_id},
                               {"journal_entry_id", event.journal_entry_id},
                               {"entry_number", event.entry_number}});
        }
    }
    if (!event_sink_->Flush()) {
        EmitStructuredLog(runtime_, "coop_ledger", "warn", "journal_event_flush_failed");
    }
}

}  // namespace coop_ledger
