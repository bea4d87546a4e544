#include "coop_ledger/services/day_close_orchestrator.h"

#include <cstdlib>
#include <utility>
#include <vector>

#include "coop_ledger/core/fixed_decimal.h"
#include "coop_ledger/core/structured_log.h"
#include "coop_ledger/monitoring/metric_registry.h"
#include "coop_ledger/services/day_book_state_machine.h"

namespace coop_ledger {
namespace {

bool StorageFailure(ControlError* error, const std::string& what, const std::string& detail) {
    SetControlError(error, ErrorCode::kStorageError, what + ": " + detail);
    return false;
}

std::string FormatAmount(double amount) {
    return FixedDecimal::FormatCents(FixedDecimal::ToCents(amount));
}

}  // namespace

DayCloseOrchestrator::DayCloseOrchestrator(std::shared_ptr<ILedgerStore> store,
                                           std::shared_ptr<ILedgerEventSink> event_sink,
                                           std::shared_ptr<IBusinessClock> clock,
                                           std::shared_ptr<IAuditSink> audit_sink,
                                           LedgerRuntimeConfig runtime)
    : store_(std::move(store)),
      event_sink_(std::move(event_sink)),
      clock_(std::move(clock)),
      runtime_(std::move(runtime)),
      audit_(std::move(audit_sink), &runtime_),
      accounts_(runtime_),
      posting_engine_(runtime_) {}

bool DayCloseOrchestrator::LockOpenDay(UnitOfWork* uow,
                                       const std::string& tenant_id,
                                       bool force,
                                       DayBook* locked,
                                       ControlError* error) const {
    auto& store = uow->store();
    std::string store_error;
    DayBook active;
    bool found = false;
    if (!store.FindActiveDayBook(tenant_id, &active, &found, &store_error)) {
        return StorageFailure(error, "active day lookup failed", store_error);
    }
    if (!found || active.status != DayStatus::kOpen) {
        if (force || !found) {
            if (!force) {
                DayBook latest;
                bool has_latest = false;
                if (!store.FindLatestDayBook(tenant_id, &latest, &has_latest, &store_error)) {
                    return StorageFailure(error, "latest day lookup failed", store_error);
                }
                if (has_latest && latest.status == DayStatus::kClosed) {
                    SetControlError(error,
                                    ErrorCode::kAlreadyClosed,
                                    "day " + latest.date + " is already closed");
                    return false;
                }
            }
            SetControlError(error, ErrorCode::kNoActiveDay, "no open day book for tenant " + tenant_id);
            return false;
        }
        SetControlError(error,
                        ErrorCode::kConcurrentCloseInProgress,
                        "day " + active.date + " is already being closed");
        return false;
    }

    CasOutcome outcome = CasOutcome::kNotFound;
    if (!DayBookStateMachine::Transition(
            &store, active, DayStatus::kEodInProgress, nullptr, locked, &outcome, error)) {
        return false;
    }
    if (outcome == CasOutcome::kApplied) {
        return true;
    }

    DayBook current;
    if (!store.GetDayBook(active.id, &current, &found, &store_error)) {
        return StorageFailure(error, "day book lookup failed", store_error);
    }
    if (found && current.status == DayStatus::kEodInProgress) {
        SetControlError(error,
                        ErrorCode::kConcurrentCloseInProgress,
                        "day " + active.date + " is already being closed");
    } else if (found && current.status == DayStatus::kClosed) {
        SetControlError(error, ErrorCode::kAlreadyClosed, "day " + active.date + " is already closed");
    } else {
        SetControlError(error,
                        ErrorCode::kConcurrentModification,
                        "day book " + active.id + " changed concurrently");
    }
    return false;
}

bool DayCloseOrchestrator::FinalizeClose(UnitOfWork* uow,
                                         const DayBook& locked,
                                         const std::string& actor,
                                         const std::string& reason,
                                         const std::string& approver,
                                         DayBook* out,
                                         ControlError* error) const {
    auto& store = uow->store();
    Account vault;
    if (!accounts_.ResolveRole(store, locked.tenant_id, AccountRole::kVaultCash, &vault, error)) {
        return false;
    }
    std::string store_error;
    double closing_cash = 0.0;
    if (!store.GetBalance(vault.id, &closing_cash, &store_error)) {
        return StorageFailure(error, "vault balance lookup failed", store_error);
    }
    std::int64_t transactions = 0;
    if (!store.CountJournalEntriesForDate(
            locked.tenant_id, locked.date, &transactions, &store_error)) {
        return StorageFailure(error, "count journal entries failed", store_error);
    }

    CasOutcome outcome = CasOutcome::kNotFound;
    const auto finalize = [&](DayBook* candidate) {
        candidate->closing_cash = closing_cash;
        candidate->transactions_count = transactions;
        candidate->day_end_by = actor;
        if (!reason.empty()) {
            candidate->last_override_reason = reason;
            candidate->last_override_approver = approver;
        }
    };
    if (!DayBookStateMachine::Transition(
            &store, locked, DayStatus::kClosed, finalize, out, &outcome, error)) {
        return false;
    }
    if (outcome != CasOutcome::kApplied) {
        SetControlError(error,
                        ErrorCode::kConcurrentModification,
                        "day book " + locked.id + " changed during close");
        return false;
    }
    return true;
}

bool DayCloseOrchestrator::CloseDay(const std::string& tenant_id,
                                    const std::string& actor,
                                    DayBook* out,
                                    ControlError* error) {
    ControlError local_error;
    ControlError* err = error != nullptr ? error : &local_error;
    AuditTarget target{tenant_id, actor, "day_close", "day_book", ""};
    if (tenant_id.empty() || actor.empty()) {
        SetControlError(err, ErrorCode::kInvalidArgument, "tenant and actor are required");
        return audit_.Failed(target, *err);
    }

    UnitOfWork uow(store_, event_sink_, &runtime_);
    std::string tx_error;
    if (!uow.Begin(&tx_error)) {
        StorageFailure(err, "begin transaction failed", tx_error);
        return audit_.Failed(target, *err);
    }

    DayBook locked;
    if (!LockOpenDay(&uow, tenant_id, false, &locked, err)) {
        return audit_.Failed(target, *err);
    }
    target.resource_id = locked.id;

    std::vector<Account> tellers;
    if (!accounts_.ListTellerCashAccounts(uow.store(), tenant_id, &tellers, err)) {
        return audit_.Failed(target, *err);
    }
    const Cents epsilon = FixedDecimal::ToCents(runtime_.posting_epsilon);
    std::vector<PendingTellerBalance> pending;
    for (const auto& teller : tellers) {
        double balance = 0.0;
        std::string store_error;
        if (!uow.store().GetBalance(teller.id, &balance, &store_error)) {
            StorageFailure(err, "teller balance lookup failed", store_error);
            return audit_.Failed(target, *err);
        }
        if (std::llabs(FixedDecimal::ToCents(balance)) > epsilon) {
            pending.push_back(
                PendingTellerBalance{teller.id, teller.code, teller.name, teller.bound_operator_id, balance});
        }
    }
    if (!pending.empty()) {
        SetControlError(err,
                        ErrorCode::kTellerPendingSettlement,
                        std::to_string(pending.size()) + " teller account(s) not settled");
        err->pending_tellers = std::move(pending);
        return audit_.Failed(target, *err);
    }

    DayBook closed;
    if (!FinalizeClose(&uow, locked, actor, "", "", &closed, err)) {
        return audit_.Failed(target, *err);
    }
    if (!uow.Commit(&tx_error)) {
        StorageFailure(err, "commit failed", tx_error);
        return audit_.Failed(target, *err);
    }

    EmitStructuredLog(&runtime_,
                      "coop_ledger",
                      "info",
                      "day_closed",
                      {{"tenant_id", tenant_id},
                       {"date", closed.date},
                       {"day_book_id", closed.id},
                       {"closing_cash", FormatAmount(closed.closing_cash)},
                       {"transactions_count", std::to_string(closed.transactions_count)},
                       {"version", std::to_string(closed.version)},
                       {"actor", actor}});
    RecordDayTransition(tenant_id, "close");
    audit_.Succeeded(target,
                     {{"date", closed.date}, {"closing_cash", FormatAmount(closed.closing_cash)}});
    if (out != nullptr) {
        *out = std::move(closed);
    }
    return true;
}

bool DayCloseOrchestrator::ZeroTellerBalances(UnitOfWork* uow,
                                              const DayBook& locked,
                                              const std::string& reason,
                                              std::size_t* zeroed,
                                              ControlError* error) const {
    *zeroed = 0;
    std::vector<Account> tellers;
    if (!accounts_.ListTellerCashAccounts(uow->store(), locked.tenant_id, &tellers, error)) {
        return false;
    }
    Account suspense;
    bool suspense_resolved = false;
    for (const auto& teller : tellers) {
        double balance = 0.0;
        std::string store_error;
        if (!uow->store().GetBalance(teller.id, &balance, &store_error)) {
            return StorageFailure(error, "teller balance lookup failed", store_error);
        }
        const Cents cents = FixedDecimal::ToCents(balance);
        if (cents == 0) {
            continue;
        }
        if (!suspense_resolved) {
            if (!accounts_.ResolveOrCreateSuspense(uow, locked.tenant_id, &suspense, error)) {
                return false;
            }
            suspense_resolved = true;
        }

        const double amount = FixedDecimal::FromCents(std::llabs(cents));
        PostingRequest request;
        request.tenant_id = locked.tenant_id;
        request.description = "Force Close Adjustment - " + teller.name + " - " + reason;
        request.effective_date = locked.date;
        if (cents > 0) {
            request.lines.push_back(PostingLine{suspense.id, amount, 0.0});
            request.lines.push_back(PostingLine{teller.id, 0.0, amount});
        } else {
            request.lines.push_back(PostingLine{teller.id, amount, 0.0});
            request.lines.push_back(PostingLine{suspense.id, 0.0, amount});
        }
        if (!posting_engine_.Post(uow, request, nullptr, error)) {
            return false;
        }
        EmitStructuredLog(&runtime_,
                          "coop_ledger",
                          "warn",
                          "teller_balance_suspended",
                          {{"tenant_id", locked.tenant_id},
                           {"account_id", teller.id},
                           {"account_code", teller.code},
                           {"balance", FixedDecimal::FormatCents(cents)}});
        ++*zeroed;
    }
    return true;
}

bool DayCloseOrchestrator::MarkSettlementsForceClosed(UnitOfWork* uow,
                                                      const DayBook& locked,
                                                      std::size_t* marked,
                                                      ControlError* error) const {
    *marked = 0;
    SettlementFilter filter;
    filter.tenant_id = locked.tenant_id;
    filter.day_book_id = locked.id;
    std::vector<TellerSettlement> settlements;
    std::string store_error;
    if (!uow->store().ListSettlements(filter, &settlements, &store_error)) {
        return StorageFailure(error, "list settlements failed", store_error);
    }
    for (auto& settlement : settlements) {
        if (settlement.status == SettlementStatus::kApproved ||
            settlement.status == SettlementStatus::kReverted || settlement.is_force_closed) {
            continue;
        }
        settlement.is_force_closed = true;
        if (!uow->store().UpdateSettlement(settlement, &store_error)) {
            return StorageFailure(error, "update settlement failed", store_error);
        }
        ++*marked;
    }
    return true;
}

bool DayCloseOrchestrator::ForceCloseDay(const std::string& tenant_id,
                                         const std::string& actor,
                                         const std::string& reason,
                                         const std::string& approver,
                                         ForceCloseSummary* out,
                                         ControlError* error) {
    ControlError local_error;
    ControlError* err = error != nullptr ? error : &local_error;
    AuditTarget target{tenant_id, actor, "day_force_close", "day_book", ""};
    if (tenant_id.empty() || actor.empty()) {
        SetControlError(err, ErrorCode::kInvalidArgument, "tenant and actor are required");
        return audit_.Failed(target, *err);
    }

    UnitOfWork uow(store_, event_sink_, &runtime_);
    std::string tx_error;
    if (!uow.Begin(&tx_error)) {
        StorageFailure(err, "begin transaction failed", tx_error);
        return audit_.Failed(target, *err);
    }

    DayBook locked;
    if (!LockOpenDay(&uow, tenant_id, true, &locked, err)) {
        return audit_.Failed(target, *err);
    }
    target.resource_id = locked.id;

    ForceCloseSummary summary;
    if (!ZeroTellerBalances(&uow, locked, reason, &summary.zeroed_accounts, err)) {
        return audit_.Failed(target, *err);
    }
    if (!MarkSettlementsForceClosed(&uow, locked, &summary.force_closed_settlements, err)) {
        return audit_.Failed(target, *err);
    }
    // An empty reason still marks the close as overridden.
    const std::string recorded_reason = reason.empty() ? "force close" : reason;
    if (!FinalizeClose(&uow, locked, actor, recorded_reason, approver, &summary.day_book, err)) {
        return audit_.Failed(target, *err);
    }
    if (!uow.Commit(&tx_error)) {
        StorageFailure(err, "commit failed", tx_error);
        return audit_.Failed(target, *err);
    }

    EmitStructuredLog(&runtime_,
                      "coop_ledger",
                      "warn",
                      "day_force_closed",
                      {{"tenant_id", tenant_id},
                       {"date", summary.day_book.date},
                       {"day_book_id", summary.day_book.id},
                       {"zeroed_accounts", std::to_string(summary.zeroed_accounts)},
                       {"force_closed_settlements", std::to_string(summary.force_closed_settlements)},
                       {"reason", reason},
                       {"approver", approver},
                       {"actor", actor}});
    RecordDayTransition(tenant_id, "force_close");
    audit_.Succeeded(target,
                     {{"date", summary.day_book.date}, {"reason", reason}, {"approver", approver}});
    if (out != nullptr) {
        *out = std::move(summary);
    }
    return true;
}

bool DayCloseOrchestrator::ReopenDay(const std::string& tenant_id,
                                     const std::string& actor,
                                     const std::string& reason,
                                     const std::string& approver,
                                     const std::string& date,
                                     DayBook* out,
                                     ControlError* error) {
    ControlError local_error;
    ControlError* err = error != nullptr ? error : &local_error;
    const std::string today = clock_->Today();
    AuditTarget target{tenant_id, actor, "day_reopen", "day_book", date.empty() ? today : date};
    if (tenant_id.empty() || actor.empty()) {
        SetControlError(err, ErrorCode::kInvalidArgument, "tenant and actor are required");
        return audit_.Failed(target, *err);
    }
    if (!date.empty() && date != today) {
        SetControlError(err,
                        ErrorCode::kCannotReopenPastDay,
                        "only today's day book (" + today + ") can be reopened, got " + date);
        return audit_.Failed(target, *err);
    }

    UnitOfWork uow(store_, event_sink_, &runtime_);
    std::string tx_error;
    if (!uow.Begin(&tx_error)) {
        StorageFailure(err, "begin transaction failed", tx_error);
        return audit_.Failed(target, *err);
    }

    DayBook current;
    bool found = false;
    std::string store_error;
    if (!uow.store().GetDayBookByDate(tenant_id, today, &current, &found, &store_error)) {
        StorageFailure(err, "day lookup failed", store_error);
        return audit_.Failed(target, *err);
    }
    if (!found) {
        SetControlError(err, ErrorCode::kNoDayForToday, "no day book for " + today);
        return audit_.Failed(target, *err);
    }
    target.resource_id = current.id;
    if (current.status != DayStatus::kClosed) {
        SetControlError(err,
                        ErrorCode::kNotClosed,
                        "day " + today + " is " + ToString(current.status) + ", not CLOSED");
        return audit_.Failed(target, *err);
    }

    DayBook active;
    bool has_active = false;
    if (!uow.store().FindActiveDayBook(tenant_id, &active, &has_active, &store_error)) {
        StorageFailure(err, "active day lookup failed", store_error);
        return audit_.Failed(target, *err);
    }
    if (has_active) {
        SetControlError(err,
                        ErrorCode::kDayAlreadyOpen,
                        "day " + active.date + " is still " + ToString(active.status));
        return audit_.Failed(target, *err);
    }

    DayBook reopened;
    CasOutcome outcome = CasOutcome::kNotFound;
    const auto record_override = [&](DayBook* candidate) {
        candidate->last_override_reason = reason;
        candidate->last_override_approver = approver;
    };
    if (!DayBookStateMachine::Transition(
            &uow.store(), current, DayStatus::kOpen, record_override, &reopened, &outcome, err)) {
        return audit_.Failed(target, *err);
    }
    if (outcome != CasOutcome::kApplied) {
        SetControlError(err,
                        ErrorCode::kConcurrentModification,
                        "day book " + current.id + " changed concurrently");
        return audit_.Failed(target, *err);
    }
    if (!uow.Commit(&tx_error)) {
        StorageFailure(err, "commit failed", tx_error);
        return audit_.Failed(target, *err);
    }

    EmitStructuredLog(&runtime_,
                      "coop_ledger",
                      "warn",
                      "day_reopened",
                      {{"tenant_id", tenant_id},
                       {"date", reopened.date},
                       {"day_book_id", reopened.id},
                       {"version", std::to_string(reopened.version)},
                       {"reason", reason},
                       {"approver", approver},
                       {"actor", actor}});
    RecordDayTransition(tenant_id, "reopen");
    audit_.Succeeded(target, {{"reason", reason}, {"approver", approver}});
    if (out != nullptr) {
        *out = std::move(reopened);
    }
    return true;
}

}  // namespace coop_ledger
