#include "coop_ledger/services/day_book_state_machine.h"

#include <utility>

#include "coop_ledger/core/business_clock.h"
#include "coop_ledger/core/fixed_decimal.h"
#include "coop_ledger/core/record_id.h"
#include "coop_ledger/core/structured_log.h"
#include "coop_ledger/monitoring/metric_registry.h"

namespace coop_ledger {
namespace {

bool StorageFailure(ControlError* error, const std::string& what, const std::string& detail) {
    SetControlError(error, ErrorCode::kStorageError, what + ": " + detail);
    return false;
}

bool IsActive(DayStatus status) {
    return status == DayStatus::kOpen || status == DayStatus::kEodInProgress;
}

}  // namespace

DayBookStateMachine::DayBookStateMachine(std::shared_ptr<ILedgerStore> store,
                                         std::shared_ptr<ILedgerEventSink> event_sink,
                                         std::shared_ptr<IBusinessClock> clock,
                                         std::shared_ptr<IAuditSink> audit_sink,
                                         LedgerRuntimeConfig runtime)
    : store_(std::move(store)),
      event_sink_(std::move(event_sink)),
      clock_(std::move(clock)),
      runtime_(std::move(runtime)),
      audit_(std::move(audit_sink), &runtime_) {}

bool DayBookStateMachine::IsTransitionAllowed(DayStatus from, DayStatus to) {
    switch (from) {
        case DayStatus::kOpen:
            return to == DayStatus::kEodInProgress;
        case DayStatus::kEodInProgress:
            return to == DayStatus::kClosed;
        case DayStatus::kClosed:
            return to == DayStatus::kOpen;
    }
    return false;
}

bool DayBookStateMachine::Transition(ILedgerStore* store,
                                     const DayBook& current,
                                     DayStatus next,
                                     const std::function<void(DayBook*)>& mutate,
                                     DayBook* updated,
                                     CasOutcome* outcome,
                                     ControlError* error) {
    if (store == nullptr || outcome == nullptr) {
        SetControlError(error, ErrorCode::kInvalidArgument, "store and outcome are required");
        return false;
    }
    if (!IsTransitionAllowed(current.status, next)) {
        SetControlError(error,
                        ErrorCode::kInvalidArgument,
                        std::string("illegal day book transition ") + ToString(current.status) +
                            " -> " + ToString(next));
        return false;
    }

    DayBook candidate = current;
    candidate.status = next;
    candidate.version = current.version + 1;
    candidate.updated_ts_ns = NowEpochNanos();
    if (mutate) {
        mutate(&candidate);
    }

    std::string store_error;
    if (!store->CompareAndSetDayBook(
            candidate, current.status, current.version, outcome, &store_error)) {
        return StorageFailure(error, "day book update failed", store_error);
    }
    if (*outcome == CasOutcome::kApplied && updated != nullptr) {
        *updated = std::move(candidate);
    }
    return true;
}

bool DayBookStateMachine::RequireOpenDay(const ILedgerStore& store,
                                         const std::string& tenant_id,
                                         DayBook* out,
                                         ControlError* error) {
    DayBook active;
    bool found = false;
    std::string store_error;
    if (!store.FindActiveDayBook(tenant_id, &active, &found, &store_error)) {
        return StorageFailure(error, "active day lookup failed", store_error);
    }
    if (!found || active.status != DayStatus::kOpen) {
        SetControlError(error, ErrorCode::kNoActiveDay, "no open day book for tenant " + tenant_id);
        return false;
    }
    if (out != nullptr) {
        *out = std::move(active);
    }
    return true;
}

bool DayBookStateMachine::GetDayStatus(const std::string& tenant_id,
                                       DayStatusView* out,
                                       ControlError* error) const {
    if (out == nullptr) {
        SetControlError(error, ErrorCode::kInvalidArgument, "output pointer is null");
        return false;
    }
    DayStatusView view;
    bool found = false;
    std::string store_error;
    if (!store_->FindActiveDayBook(tenant_id, &view.day_book, &found, &store_error)) {
        return StorageFailure(error, "active day lookup failed", store_error);
    }
    if (!found && !store_->FindLatestDayBook(tenant_id, &view.day_book, &found, &store_error)) {
        return StorageFailure(error, "latest day lookup failed", store_error);
    }
    view.has_day = found;
    view.status = found ? ToString(view.day_book.status) : kNoDayOpenStatus;
    if (!found) {
        view.day_book = DayBook();
    }
    *out = std::move(view);
    return true;
}

bool DayBookStateMachine::StartDay(const std::string& tenant_id,
                                   const std::string& date,
                                   const std::string& actor,
                                   DayBook* out,
                                   ControlError* error) {
    ControlError local_error;
    ControlError* err = error != nullptr ? error : &local_error;
    const std::string today = clock_->Today();
    const std::string target_date = date.empty() ? today : date;
    const AuditTarget target{tenant_id, actor, "day_start", "day_book", target_date};

    if (tenant_id.empty() || actor.empty()) {
        SetControlError(err, ErrorCode::kInvalidArgument, "tenant and actor are required");
        return audit_.Failed(target, *err);
    }
    if (!IsValidBusinessDate(target_date)) {
        SetControlError(err, ErrorCode::kInvalidArgument, "invalid date: " + target_date);
        return audit_.Failed(target, *err);
    }

    UnitOfWork uow(store_, event_sink_, &runtime_);
    std::string tx_error;
    if (!uow.Begin(&tx_error)) {
        StorageFailure(err, "begin transaction failed", tx_error);
        return audit_.Failed(target, *err);
    }

    DayBook started;
    bool reopened = false;
    if (!StartDayInTransaction(&uow, tenant_id, target_date, today, actor, &started, &reopened, err)) {
        return audit_.Failed(target, *err);
    }
    if (!uow.Commit(&tx_error)) {
        StorageFailure(err, "commit failed", tx_error);
        return audit_.Failed(target, *err);
    }

    EmitStructuredLog(&runtime_,
                      "coop_ledger",
                      "info",
                      reopened ? "day_reopened_on_start" : "day_started",
                      {{"tenant_id", tenant_id},
                       {"date", started.date},
                       {"day_book_id", started.id},
                       {"version", std::to_string(started.version)},
                       {"opening_cash",
                        FixedDecimal::FormatCents(FixedDecimal::ToCents(started.opening_cash))},
                       {"actor", actor}});
    RecordDayTransition(tenant_id, reopened ? "reopen_on_start" : "start");
    audit_.Succeeded({tenant_id, actor, "day_start", "day_book", started.id},
                     {{"date", started.date}, {"reopened", reopened ? "true" : "false"}});
    if (out != nullptr) {
        *out = std::move(started);
    }
    return true;
}

bool DayBookStateMachine::StartDayInTransaction(UnitOfWork* uow,
                                                const std::string& tenant_id,
                                                const std::string& date,
                                                const std::string& today,
                                                const std::string& actor,
                                                DayBook* out,
                                                bool* reopened,
                                                ControlError* error) const {
    auto& store = uow->store();
    std::string store_error;

    DayBook previous;
    bool has_previous = false;
    if (!store.FindLatestDayBookBefore(tenant_id, date, &previous, &has_previous, &store_error)) {
        return StorageFailure(error, "previous day lookup failed", store_error);
    }
    if (has_previous && previous.status != DayStatus::kClosed) {
        SetControlError(error,
                        ErrorCode::kPreviousDayNotClosed,
                        "previous day " + previous.date + " is " + ToString(previous.status));
        return false;
    }

    DayBook existing;
    bool has_existing = false;
    if (!store.GetDayBookByDate(tenant_id, date, &existing, &has_existing, &store_error)) {
        return StorageFailure(error, "day lookup failed", store_error);
    }
    if (has_existing && IsActive(existing.status)) {
        SetControlError(error,
                        ErrorCode::kDayAlreadyOpen,
                        "day " + date + " is already " + ToString(existing.status));
        return false;
    }

    DayBook active;
    bool has_active = false;
    if (!store.FindActiveDayBook(tenant_id, &active, &has_active, &store_error)) {
        return StorageFailure(error, "active day lookup failed", store_error);
    }
    if (has_active) {
        SetControlError(error,
                        ErrorCode::kDayAlreadyOpen,
                        "day " + active.date + " is still " + ToString(active.status));
        return false;
    }

    if (has_existing) {
        if (date != today) {
            SetControlError(error,
                            ErrorCode::kCannotStartPastDay,
                            "day " + date + " is closed and is not today");
            return false;
        }
        CasOutcome outcome = CasOutcome::kNotFound;
        if (!Transition(&store,
                        existing,
                        DayStatus::kOpen,
                        [&actor](DayBook* candidate) { candidate->day_begin_by = actor; },
                        out,
                        &outcome,
                        error)) {
            return false;
        }
        if (outcome != CasOutcome::kApplied) {
            SetControlError(error,
                            ErrorCode::kConcurrentModification,
                            "day book " + existing.id + " changed concurrently");
            return false;
        }
        *reopened = true;
        return true;
    }

    DayBook created;
    created.id = NewRecordId("day");
    created.tenant_id = tenant_id;
    created.date = date;
    created.status = DayStatus::kOpen;
    created.opening_cash = has_previous ? previous.closing_cash : 0.0;
    created.day_begin_by = actor;
    created.version = 1;
    created.created_ts_ns = NowEpochNanos();
    created.updated_ts_ns = created.created_ts_ns;
    if (!store.InsertDayBook(created, &store_error)) {
        return StorageFailure(error, "insert day book failed", store_error);
    }
    *reopened = false;
    *out = std::move(created);
    return true;
}

}  // namespace coop_ledger
