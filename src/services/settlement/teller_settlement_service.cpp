#include "coop_ledger/services/teller_settlement_service.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

#include "coop_ledger/core/fixed_decimal.h"
#include "coop_ledger/core/record_id.h"
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

PostingRequest TwoLineEntry(const std::string& tenant_id,
                            const std::string& description,
                            const std::string& date,
                            const std::string& debit_account,
                            const std::string& credit_account,
                            Cents amount) {
    PostingRequest request;
    request.tenant_id = tenant_id;
    request.description = description;
    request.effective_date = date;
    const double value = FixedDecimal::FromCents(amount);
    request.lines.push_back(PostingLine{debit_account, value, 0.0});
    request.lines.push_back(PostingLine{credit_account, 0.0, value});
    return request;
}

}  // namespace

TellerSettlementService::TellerSettlementService(std::shared_ptr<ILedgerStore> store,
                                                 std::shared_ptr<ILedgerEventSink> event_sink,
                                                 std::shared_ptr<IAuditSink> audit_sink,
                                                 LedgerRuntimeConfig runtime)
    : store_(std::move(store)),
      event_sink_(std::move(event_sink)),
      runtime_(std::move(runtime)),
      audit_(std::move(audit_sink), &runtime_),
      accounts_(runtime_),
      posting_engine_(runtime_) {}

bool TellerSettlementService::RequiresApproval(double system_cash,
                                               double difference,
                                               double abs_threshold,
                                               double pct_threshold) {
    const Cents system = FixedDecimal::ToCents(system_cash);
    const Cents variance = std::llabs(FixedDecimal::ToCents(difference));
    if (variance > FixedDecimal::ToCents(abs_threshold)) {
        return true;
    }
    if (system <= 0) {
        return false;
    }
    return static_cast<long double>(variance) / static_cast<long double>(system) >
           static_cast<long double>(pct_threshold);
}

bool TellerSettlementService::FindReplay(const ILedgerStore& store,
                                         const SettlementRequest& request,
                                         TellerSettlement* out,
                                         bool* found,
                                         ControlError* error) const {
    *found = false;
    if (request.idempotency_key.empty()) {
        return true;
    }
    std::string store_error;
    if (!store.FindSettlementByRef(
            request.tenant_id, request.idempotency_key, out, found, &store_error)) {
        return StorageFailure(error, "settlement lookup failed", store_error);
    }
    return true;
}

bool TellerSettlementService::BuildPlan(const ILedgerStore& store,
                                        const SettlementRequest& request,
                                        SettlementPlan* plan,
                                        ControlError* error) const {
    if (request.tenant_id.empty() || request.teller_id.empty()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "tenant and teller are required");
        return false;
    }
    if (!FixedDecimal::IsValidAmount(request.physical_cash)) {
        SetControlError(error, ErrorCode::kInvalidArgument, "physical cash is not a valid amount");
        return false;
    }
    const Cents physical = FixedDecimal::ToCents(request.physical_cash);
    if (physical < 0) {
        SetControlError(error, ErrorCode::kInvalidArgument, "physical cash must not be negative");
        return false;
    }

    if (!DayBookStateMachine::RequireOpenDay(store, request.tenant_id, &plan->day_book, error)) {
        return false;
    }

    if (!request.denominations.empty()) {
        Cents counted = 0;
        for (const auto& note : request.denominations) {
            if (!FixedDecimal::IsValidAmount(note.denomination) || note.denomination <= 0.0 ||
                note.count < 0) {
                SetControlError(error,
                                ErrorCode::kInvalidArgument,
                                "denominations must be positive with non-negative counts");
                return false;
            }
            const Cents face = FixedDecimal::ToCents(note.denomination);
            if (face > 0 && note.count > (kMaxAmountCents - counted) / face) {
                SetControlError(error,
                                ErrorCode::kInvalidArgument,
                                "denominations total exceeds the maximum amount");
                return false;
            }
            counted += face * note.count;
        }
        if (std::llabs(counted - physical) > FixedDecimal::ToCents(runtime_.posting_epsilon)) {
            SetControlError(error,
                            ErrorCode::kDenominationMismatch,
                            "denominations total " + FixedDecimal::FormatCents(counted) +
                                " but physical cash is " + FixedDecimal::FormatCents(physical));
            return false;
        }
    }

    if (!accounts_.FindTellerAccount(
            store, request.tenant_id, request.teller_id, &plan->teller_account, error)) {
        return false;
    }

    double system_balance = 0.0;
    std::string store_error;
    if (!store.GetBalance(plan->teller_account.id, &system_balance, &store_error)) {
        return StorageFailure(error, "teller balance lookup failed", store_error);
    }
    const Cents system = FixedDecimal::ToCents(system_balance);
    const Cents difference = physical - system;

    Account vault;
    if (!accounts_.ResolveRole(store, request.tenant_id, AccountRole::kVaultCash, &vault, error)) {
        return false;
    }

    const std::string& date = plan->day_book.date;
    const std::string& teller_account_id = plan->teller_account.id;
    plan->entries.clear();
    if (difference < 0) {
        Account receivable;
        if (!accounts_.ResolveRole(
                store, request.tenant_id, AccountRole::kStaffReceivable, &receivable, error)) {
            return false;
        }
        plan->entries.push_back(TwoLineEntry(request.tenant_id,
                                             "Cash Shortage Adjustment - " + date + " - Teller " +
                                                 request.teller_id,
                                             date,
                                             receivable.id,
                                             teller_account_id,
                                             -difference));
    } else if (difference > 0) {
        Account sundry;
        if (!accounts_.ResolveRole(
                store, request.tenant_id, AccountRole::kSundryIncome, &sundry, error)) {
            return false;
        }
        plan->entries.push_back(TwoLineEntry(request.tenant_id,
                                             "Cash Overage Adjustment - " + date + " - Teller " +
                                                 request.teller_id,
                                             date,
                                             teller_account_id,
                                             sundry.id,
                                             difference));
    }
    if (physical > 0) {
        plan->entries.push_back(TwoLineEntry(request.tenant_id,
                                             "Vault Transfer - Teller " + request.teller_id,
                                             date,
                                             vault.id,
                                             teller_account_id,
                                             physical));
    }

    plan->physical_cash = FixedDecimal::FromCents(physical);
    plan->system_cash = FixedDecimal::FromCents(system);
    plan->difference = FixedDecimal::FromCents(difference);
    plan->requires_approval = RequiresApproval(plan->system_cash,
                                               plan->difference,
                                               runtime_.approval_abs_threshold,
                                               runtime_.approval_pct_threshold);
    return true;
}

bool TellerSettlementService::Preview(const SettlementRequest& request,
                                      SettlementPlan* out,
                                      ControlError* error) const {
    if (out == nullptr) {
        SetControlError(error, ErrorCode::kInvalidArgument, "output pointer is null");
        return false;
    }
    SettlementPlan plan;
    if (!BuildPlan(*store_, request, &plan, error)) {
        return false;
    }
    for (const auto& entry : plan.entries) {
        if (!posting_engine_.Validate(*store_, entry, error)) {
            return false;
        }
    }
    *out = std::move(plan);
    return true;
}

bool TellerSettlementService::Settle(const SettlementRequest& request,
                                     SettlementOutcome* out,
                                     ControlError* error) {
    ControlError local_error;
    ControlError* err = error != nullptr ? error : &local_error;
    const AuditTarget target{
        request.tenant_id, request.actor, "teller_settle", "teller_settlement", request.teller_id};
    if (request.actor.empty()) {
        SetControlError(err, ErrorCode::kInvalidArgument, "actor is required");
        return audit_.Failed(target, *err);
    }

    SettlementOutcome outcome;
    bool replay_found = false;
    if (!FindReplay(*store_, request, &outcome.settlement, &replay_found, err)) {
        return audit_.Failed(target, *err);
    }
    if (replay_found) {
        outcome.replayed = true;
        EmitStructuredLog(&runtime_,
                          "coop_ledger",
                          "info",
                          "settlement_replayed",
                          {{"tenant_id", request.tenant_id},
                           {"settlement_id", outcome.settlement.id},
                           {"settlement_ref", outcome.settlement.settlement_ref}});
        if (out != nullptr) {
            *out = std::move(outcome);
        }
        return true;
    }

    UnitOfWork uow(store_, event_sink_, &runtime_);
    std::string tx_error;
    if (!uow.Begin(&tx_error)) {
        StorageFailure(err, "begin transaction failed", tx_error);
        return audit_.Failed(target, *err);
    }
    auto& store = uow.store();

    // A concurrent request with the same key may have committed since the
    // unlocked check above.
    if (!FindReplay(store, request, &outcome.settlement, &replay_found, err)) {
        return audit_.Failed(target, *err);
    }
    if (replay_found) {
        outcome.replayed = true;
        if (!uow.Rollback(&tx_error)) {
            StorageFailure(err, "rollback failed", tx_error);
            return audit_.Failed(target, *err);
        }
        if (out != nullptr) {
            *out = std::move(outcome);
        }
        return true;
    }

    SettlementPlan plan;
    if (!BuildPlan(store, request, &plan, err)) {
        return audit_.Failed(target, *err);
    }

    auto& settlement = outcome.settlement;
    settlement.id = NewRecordId("stl");
    settlement.day_book_id = plan.day_book.id;
    settlement.tenant_id = request.tenant_id;
    settlement.teller_id = request.teller_id;
    settlement.physical_cash = plan.physical_cash;
    settlement.system_cash = plan.system_cash;
    settlement.difference = plan.difference;
    settlement.status =
        plan.requires_approval ? SettlementStatus::kRequiresApproval : SettlementStatus::kAutoApproved;
    settlement.executed_ts_ns = NowEpochNanos();
    settlement.settlement_ref = !request.idempotency_key.empty()
                                    ? request.idempotency_key
                                    : "SETTLE-" + plan.day_book.id + "-" + request.teller_id + "-" +
                                          std::to_string(settlement.executed_ts_ns);
    settlement.attachment_ref = request.attachment_ref;
    settlement.denominations = request.denominations;
    settlement.executed_by = request.actor;

    for (const auto& entry : plan.entries) {
        PostingResult posted;
        if (!posting_engine_.Post(&uow, entry, &posted, err)) {
            return audit_.Failed(target, *err);
        }
        settlement.journal_entry_ids.push_back(posted.journal_entry.id);
        outcome.postings.push_back(std::move(posted));
    }

    std::string store_error;
    if (!store.InsertSettlement(settlement, &store_error)) {
        StorageFailure(err, "insert settlement failed", store_error);
        return audit_.Failed(target, *err);
    }
    if (!uow.Commit(&tx_error)) {
        StorageFailure(err, "commit failed", tx_error);
        return audit_.Failed(target, *err);
    }

    EmitStructuredLog(&runtime_,
                      "coop_ledger",
                      "info",
                      "settlement_created",
                      {{"tenant_id", settlement.tenant_id},
                       {"settlement_id", settlement.id},
                       {"teller_id", settlement.teller_id},
                       {"physical_cash", FormatAmount(settlement.physical_cash)},
                       {"system_cash", FormatAmount(settlement.system_cash)},
                       {"difference", FormatAmount(settlement.difference)},
                       {"status", ToString(settlement.status)}});
    RecordSettlementOutcome(settlement.tenant_id, ToString(settlement.status));
    RecordSettlementVariance(settlement.tenant_id, settlement.difference);
    audit_.Succeeded({request.tenant_id,
                      request.actor,
                      "teller_settle",
                      "teller_settlement",
                      settlement.id},
                     {{"teller_id", settlement.teller_id},
                      {"difference", FormatAmount(settlement.difference)},
                      {"status", ToString(settlement.status)}});
    if (out != nullptr) {
        *out = std::move(outcome);
    }
    return true;
}

bool TellerSettlementService::Unsettle(const std::string& tenant_id,
                                       const std::string& settlement_id,
                                       const std::string& actor,
                                       const std::string& reason,
                                       TellerSettlement* out,
                                       ControlError* error) {
    ControlError local_error;
    ControlError* err = error != nullptr ? error : &local_error;
    const AuditTarget target{tenant_id, actor, "teller_unsettle", "teller_settlement", settlement_id};
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
    auto& store = uow.store();

    TellerSettlement settlement;
    bool found = false;
    std::string store_error;
    if (!store.GetSettlement(settlement_id, &settlement, &found, &store_error)) {
        StorageFailure(err, "settlement lookup failed", store_error);
        return audit_.Failed(target, *err);
    }
    if (!found || settlement.tenant_id != tenant_id) {
        SetControlError(err, ErrorCode::kSettlementNotFound, "settlement not found: " + settlement_id);
        return audit_.Failed(target, *err);
    }

    DayBook day_book;
    if (!store.GetDayBook(settlement.day_book_id, &day_book, &found, &store_error)) {
        StorageFailure(err, "day book lookup failed", store_error);
        return audit_.Failed(target, *err);
    }
    if (!found || day_book.status != DayStatus::kOpen) {
        SetControlError(err,
                        ErrorCode::kDayNotOpen,
                        "settlement day " + (found ? day_book.date : settlement.day_book_id) +
                            " is not open");
        return audit_.Failed(target, *err);
    }
    if (settlement.status == SettlementStatus::kApproved) {
        SetControlError(err, ErrorCode::kAlreadyApproved, "settlement is already approved");
        return audit_.Failed(target, *err);
    }
    if (settlement.status == SettlementStatus::kReverted) {
        SetControlError(err, ErrorCode::kAlreadyReverted, "settlement is already reverted");
        return audit_.Failed(target, *err);
    }

    for (auto it = settlement.journal_entry_ids.rbegin(); it != settlement.journal_entry_ids.rend();
         ++it) {
        if (!posting_engine_.Reverse(&uow, tenant_id, *it, "Reversal", day_book.date, nullptr, err)) {
            return audit_.Failed(target, *err);
        }
    }

    settlement.status = SettlementStatus::kReverted;
    settlement.rejection_reason = reason;
    settlement.reverted_by = actor;
    if (!store.UpdateSettlement(settlement, &store_error)) {
        StorageFailure(err, "update settlement failed", store_error);
        return audit_.Failed(target, *err);
    }
    if (!uow.Commit(&tx_error)) {
        StorageFailure(err, "commit failed", tx_error);
        return audit_.Failed(target, *err);
    }

    EmitStructuredLog(&runtime_,
                      "coop_ledger",
                      "info",
                      "settlement_reverted",
                      {{"tenant_id", tenant_id},
                       {"settlement_id", settlement.id},
                       {"teller_id", settlement.teller_id},
                       {"reversed_entries", std::to_string(settlement.journal_entry_ids.size())},
                       {"actor", actor}});
    audit_.Succeeded(target, {{"reason", reason}});
    if (out != nullptr) {
        *out = std::move(settlement);
    }
    return true;
}

bool TellerSettlementService::ListSettlements(const SettlementFilter& filter,
                                              std::vector<TellerSettlement>* out,
                                              ControlError* error) const {
    if (out == nullptr || filter.tenant_id.empty()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "tenant and output are required");
        return false;
    }
    std::string store_error;
    if (!store_->ListSettlements(filter, out, &store_error)) {
        return StorageFailure(error, "list settlements failed", store_error);
    }
    return true;
}

}  // namespace coop_ledger
