#include "coop_ledger/apps/day_control_app.h"

#include <functional>
#include <istream>
#include <ostream>
#include <utility>

#include "coop_ledger/core/fixed_decimal.h"
#include "coop_ledger/core/unit_of_work.h"

namespace coop_ledger::apps {
namespace {

using Fields = std::vector<std::pair<std::string, std::string>>;

std::string FormatAmount(double amount) {
    return FixedDecimal::FormatCents(FixedDecimal::ToCents(amount));
}

void PrintLine(std::ostream& out, const Fields& fields) {
    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) {
            out << ' ';
        }
        out << key << '=' << QuoteOutputValue(value);
        first = false;
    }
    out << '\n';
}

Fields DayBookFields(const DayBook& day_book) {
    return {{"day_book_id", day_book.id},
            {"date", day_book.date},
            {"status", ToString(day_book.status)},
            {"version", std::to_string(day_book.version)},
            {"opening_cash", FormatAmount(day_book.opening_cash)},
            {"closing_cash", FormatAmount(day_book.closing_cash)},
            {"transactions_count", std::to_string(day_book.transactions_count)}};
}

Fields SettlementFields(const TellerSettlement& settlement) {
    return {{"settlement_id", settlement.id},
            {"teller_id", settlement.teller_id},
            {"physical_cash", FormatAmount(settlement.physical_cash)},
            {"system_cash", FormatAmount(settlement.system_cash)},
            {"difference", FormatAmount(settlement.difference)},
            {"status", ToString(settlement.status)},
            {"settlement_ref", settlement.settlement_ref},
            {"force_closed", settlement.is_force_closed ? "true" : "false"},
            {"entries", std::to_string(settlement.journal_entry_ids.size())}};
}

bool RunInUnitOfWork(const DayControlDependencies& deps,
                     const std::function<bool(UnitOfWork*, ControlError*)>& body,
                     ControlError* error) {
    UnitOfWork uow(deps.store, deps.event_sink, &deps.runtime);
    std::string tx_error;
    if (!uow.Begin(&tx_error)) {
        SetControlError(error, ErrorCode::kStorageError, "begin transaction failed: " + tx_error);
        return false;
    }
    if (!body(&uow, error)) {
        return false;
    }
    if (!uow.Commit(&tx_error)) {
        SetControlError(error, ErrorCode::kStorageError, tx_error);
        return false;
    }
    return true;
}

}  // namespace

bool ParseDenominations(const std::string& text,
                        std::vector<Denomination>* out,
                        std::string* error) {
    out->clear();
    if (text.empty()) {
        return true;
    }
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const std::string item =
            text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        const auto x_pos = item.find('x');
        double value = 0.0;
        double count = 0.0;
        if (x_pos == std::string::npos || !ParseDoubleText(item.substr(0, x_pos), &value) ||
            !ParseDoubleText(item.substr(x_pos + 1), &count) || count < 0 ||
            count != static_cast<double>(static_cast<std::int32_t>(count))) {
            if (error != nullptr) {
                *error = "invalid denomination '" + item + "', expected <value>x<count>";
            }
            return false;
        }
        out->push_back(Denomination{value, static_cast<std::int32_t>(count)});
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return true;
}

DayControlApp::DayControlApp(DayControlDependencies deps)
    : deps_(std::move(deps)),
      accounts_(deps_.runtime),
      posting_engine_(deps_.runtime),
      day_books_(deps_.store, deps_.event_sink, deps_.clock, deps_.audit_sink, deps_.runtime),
      settlements_(deps_.store, deps_.event_sink, deps_.audit_sink, deps_.runtime),
      day_close_(deps_.store, deps_.event_sink, deps_.clock, deps_.audit_sink, deps_.runtime),
      reports_(deps_.store) {}

std::vector<std::string> DayControlApp::CommandNames() {
    return {"status",
            "start",
            "create-account",
            "bind-role",
            "apply-bindings",
            "post",
            "balance",
            "settle-preview",
            "settle",
            "unsettle",
            "settlements",
            "close",
            "force-close",
            "reopen",
            "report"};
}

int DayControlApp::Run(const std::string& command, const ArgMap& args, std::ostream& out) {
    if (GetArg(args, "tenant").empty()) {
        return UsageError("--tenant is required", out);
    }
    using Handler = int (DayControlApp::*)(const ArgMap&, std::ostream&);
    const std::vector<std::pair<std::string, Handler>> handlers = {
        {"status", &DayControlApp::Status},
        {"start", &DayControlApp::Start},
        {"create-account", &DayControlApp::CreateAccount},
        {"bind-role", &DayControlApp::BindRole},
        {"apply-bindings", &DayControlApp::ApplyBindings},
        {"post", &DayControlApp::Post},
        {"balance", &DayControlApp::Balance},
        {"settle-preview", &DayControlApp::SettlePreview},
        {"settle", &DayControlApp::Settle},
        {"unsettle", &DayControlApp::Unsettle},
        {"settlements", &DayControlApp::Settlements},
        {"close", &DayControlApp::Close},
        {"force-close", &DayControlApp::ForceClose},
        {"reopen", &DayControlApp::Reopen},
        {"report", &DayControlApp::Report},
    };
    for (const auto& [name, handler] : handlers) {
        if (name == command) {
            return (this->*handler)(args, out);
        }
    }
    return UsageError("unknown command: " + command, out);
}

int DayControlApp::RunBatch(std::istream& in, const ArgMap& defaults, std::ostream& out) {
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        std::vector<std::string> tokens;
        std::string split_error;
        if (!SplitCommandLine(line, &tokens, &split_error)) {
            return UsageError("line " + std::to_string(line_number) + ": " + split_error, out);
        }
        std::vector<std::string> positional;
        ArgMap args = ParseArgs(tokens, &positional);
        if (positional.empty()) {
            return UsageError("line " + std::to_string(line_number) + ": missing command", out);
        }
        for (const auto& [key, value] : defaults) {
            args.emplace(key, value);
        }
        out << "# " << positional.front() << '\n';
        const int rc = Run(positional.front(), args, out);
        if (rc != kExitOk) {
            PrintLine(out, {{"failed_line", std::to_string(line_number)}});
            return rc;
        }
    }
    return kExitOk;
}

int DayControlApp::Fail(const ControlError& error, std::ostream& out) const {
    PrintLine(out, {{"error_code", ErrorCodeName(error.code)}, {"message", error.message}});
    for (const auto& pending : error.pending_tellers) {
        PrintLine(out,
                  {{"pending_account_id", pending.account_id},
                   {"account_code", pending.account_code},
                   {"account_name", pending.account_name},
                   {"teller_id", pending.teller_id},
                   {"balance", FormatAmount(pending.balance)}});
    }
    if (error.code == ErrorCode::kInvalidArgument) {
        return kExitUsage;
    }
    return kExitDomainFailure;
}

int DayControlApp::UsageError(const std::string& message, std::ostream& out) const {
    PrintLine(out, {{"error_code", ErrorCodeName(ErrorCode::kInvalidArgument)}, {"message", message}});
    return kExitUsage;
}

int DayControlApp::Status(const ArgMap& args, std::ostream& out) {
    DayStatusView view;
    ControlError error;
    if (!day_books_.GetDayStatus(GetArg(args, "tenant"), &view, &error)) {
        return Fail(error, out);
    }
    if (!view.has_day) {
        PrintLine(out, {{"status", view.status}});
        return kExitOk;
    }
    PrintLine(out, DayBookFields(view.day_book));
    return kExitOk;
}

int DayControlApp::Start(const ArgMap& args, std::ostream& out) {
    DayBook day_book;
    ControlError error;
    if (!day_books_.StartDay(
            GetArg(args, "tenant"), GetArg(args, "date"), GetArg(args, "actor"), &day_book, &error)) {
        return Fail(error, out);
    }
    PrintLine(out, DayBookFields(day_book));
    return kExitOk;
}

int DayControlApp::CreateAccount(const ArgMap& args, std::ostream& out) {
    NewAccountRequest request;
    request.tenant_id = GetArg(args, "tenant");
    request.name = GetArg(args, "name");
    if (request.name.empty()) {
        return UsageError("--name is required", out);
    }
    if (!ParseAccountType(GetArg(args, "type", "asset"), &request.type)) {
        return UsageError("invalid --type: " + GetArg(args, "type"), out);
    }
    request.code = GetArg(args, "code");
    request.branch = GetArg(args, "branch", "00");
    request.sub_type = GetArg(args, "sub-type", "00");
    request.is_group = GetArg(args, "group") == "true";
    request.bound_operator_id = GetArg(args, "operator");

    Account created;
    ControlError error;
    const bool ok = RunInUnitOfWork(
        deps_,
        [&](UnitOfWork* uow, ControlError* err) {
            return accounts_.CreateAccount(uow, request, &created, err);
        },
        &error);
    if (!ok) {
        return Fail(error, out);
    }
    PrintLine(out,
              {{"account_id", created.id},
               {"code", created.code},
               {"name", created.name},
               {"type", ToString(created.type)},
               {"operator", created.bound_operator_id}});
    return kExitOk;
}

bool DayControlApp::ResolveAccountArg(const ArgMap& args,
                                      const std::string& id_key,
                                      const std::string& code_key,
                                      Account* out,
                                      ControlError* error) const {
    const std::string tenant_id = GetArg(args, "tenant");
    bool found = false;
    std::string store_error;
    if (HasArg(args, id_key)) {
        if (!deps_.store->GetAccount(GetArg(args, id_key), out, &found, &store_error)) {
            SetControlError(error, ErrorCode::kStorageError, store_error);
            return false;
        }
    } else if (HasArg(args, code_key)) {
        if (!deps_.store->GetAccountByCode(
                tenant_id, GetArg(args, code_key), out, &found, &store_error)) {
            SetControlError(error, ErrorCode::kStorageError, store_error);
            return false;
        }
    } else {
        SetControlError(error,
                        ErrorCode::kInvalidArgument,
                        "--" + id_key + " or --" + code_key + " is required");
        return false;
    }
    if (!found || out->tenant_id != tenant_id) {
        SetControlError(error, ErrorCode::kAccountNotFound, "account not found");
        return false;
    }
    return true;
}

int DayControlApp::BindRole(const ArgMap& args, std::ostream& out) {
    AccountRole role = AccountRole::kVaultCash;
    if (!ParseAccountRole(GetArg(args, "role"), &role)) {
        return UsageError("invalid --role: " + GetArg(args, "role"), out);
    }
    Account account;
    ControlError error;
    if (!ResolveAccountArg(args, "account-id", "account-code", &account, &error)) {
        return Fail(error, out);
    }
    const std::string tenant_id = GetArg(args, "tenant");
    const bool ok = RunInUnitOfWork(
        deps_,
        [&](UnitOfWork* uow, ControlError* err) {
            return accounts_.BindRole(uow, tenant_id, role, account.id, err);
        },
        &error);
    if (!ok) {
        return Fail(error, out);
    }
    PrintLine(out, {{"role", ToString(role)}, {"account_id", account.id}, {"code", account.code}});
    return kExitOk;
}

int DayControlApp::ApplyBindings(const ArgMap& args, std::ostream& out) {
    const std::string tenant_id = GetArg(args, "tenant");
    std::size_t applied = 0;
    ControlError error;
    const bool ok = RunInUnitOfWork(
        deps_,
        [&](UnitOfWork* uow, ControlError* err) {
            return accounts_.ApplyConfiguredBindings(uow, tenant_id, &applied, err);
        },
        &error);
    if (!ok) {
        return Fail(error, out);
    }
    PrintLine(out, {{"applied", std::to_string(applied)}});
    return kExitOk;
}

int DayControlApp::Post(const ArgMap& args, std::ostream& out) {
    double amount = 0.0;
    if (!ParseDoubleText(GetArg(args, "amount"), &amount)) {
        return UsageError("--amount must be a number", out);
    }
    Account debit;
    Account credit;
    ControlError error;
    if (!ResolveAccountArg(args, "debit-id", "debit-code", &debit, &error) ||
        !ResolveAccountArg(args, "credit-id", "credit-code", &credit, &error)) {
        return Fail(error, out);
    }

    PostingRequest request;
    request.tenant_id = GetArg(args, "tenant");
    request.description = GetArg(args, "description", "Manual posting");
    request.effective_date = GetArg(args, "date", deps_.clock->Today());
    request.lines.push_back(PostingLine{debit.id, amount, 0.0});
    request.lines.push_back(PostingLine{credit.id, 0.0, amount});

    PostingResult result;
    const bool ok = RunInUnitOfWork(
        deps_,
        [&](UnitOfWork* uow, ControlError* err) {
            return posting_engine_.Post(uow, request, &result, err);
        },
        &error);
    if (!ok) {
        return Fail(error, out);
    }
    PrintLine(out,
              {{"journal_entry_id", result.journal_entry.id},
               {"entry_number", result.journal_entry.entry_number},
               {"effective_date", result.journal_entry.effective_date}});
    for (const auto& line : result.ledger_lines) {
        PrintLine(out,
                  {{"account_id", line.account_id},
                   {"debit", FormatAmount(line.debit)},
                   {"credit", FormatAmount(line.credit)},
                   {"balance", FormatAmount(line.balance)}});
    }
    return kExitOk;
}

int DayControlApp::Balance(const ArgMap& args, std::ostream& out) {
    Account account;
    ControlError error;
    if (!ResolveAccountArg(args, "account-id", "account-code", &account, &error)) {
        return Fail(error, out);
    }
    double balance = 0.0;
    std::string store_error;
    if (!deps_.store->GetBalance(account.id, &balance, &store_error)) {
        SetControlError(&error, ErrorCode::kStorageError, store_error);
        return Fail(error, out);
    }
    PrintLine(out,
              {{"account_id", account.id}, {"code", account.code}, {"balance", FormatAmount(balance)}});
    return kExitOk;
}

bool DayControlApp::BuildSettlementRequest(const ArgMap& args,
                                           SettlementRequest* request,
                                           std::string* error) const {
    request->tenant_id = GetArg(args, "tenant");
    request->teller_id = GetArg(args, "teller");
    request->actor = GetArg(args, "actor");
    request->attachment_ref = GetArg(args, "attachment-ref");
    request->idempotency_key = GetArg(args, "idempotency-key");
    if (request->teller_id.empty()) {
        if (error != nullptr) {
            *error = "--teller is required";
        }
        return false;
    }
    if (!ParseDoubleText(GetArg(args, "physical-cash"), &request->physical_cash)) {
        if (error != nullptr) {
            *error = "--physical-cash must be a number";
        }
        return false;
    }
    return ParseDenominations(GetArg(args, "denominations"), &request->denominations, error);
}

int DayControlApp::SettlePreview(const ArgMap& args, std::ostream& out) {
    SettlementRequest request;
    std::string parse_error;
    if (!BuildSettlementRequest(args, &request, &parse_error)) {
        return UsageError(parse_error, out);
    }
    SettlementPlan plan;
    ControlError error;
    if (!settlements_.Preview(request, &plan, &error)) {
        return Fail(error, out);
    }
    PrintLine(out,
              {{"teller_id", request.teller_id},
               {"account_code", plan.teller_account.code},
               {"physical_cash", FormatAmount(plan.physical_cash)},
               {"system_cash", FormatAmount(plan.system_cash)},
               {"difference", FormatAmount(plan.difference)},
               {"requires_approval", plan.requires_approval ? "true" : "false"},
               {"entries", std::to_string(plan.entries.size())}});
    for (const auto& entry : plan.entries) {
        PrintLine(out,
                  {{"description", entry.description},
                   {"amount", FormatAmount(entry.lines.front().debit)}});
    }
    return kExitOk;
}

int DayControlApp::Settle(const ArgMap& args, std::ostream& out) {
    SettlementRequest request;
    std::string parse_error;
    if (!BuildSettlementRequest(args, &request, &parse_error)) {
        return UsageError(parse_error, out);
    }
    SettlementOutcome outcome;
    ControlError error;
    if (!settlements_.Settle(request, &outcome, &error)) {
        return Fail(error, out);
    }
    auto fields = SettlementFields(outcome.settlement);
    fields.emplace_back("replayed", outcome.replayed ? "true" : "false");
    PrintLine(out, fields);
    for (const auto& posting : outcome.postings) {
        PrintLine(out,
                  {{"entry_number", posting.journal_entry.entry_number},
                   {"description", posting.journal_entry.description}});
    }
    return kExitOk;
}

int DayControlApp::Unsettle(const ArgMap& args, std::ostream& out) {
    const std::string settlement_id = GetArg(args, "settlement-id");
    if (settlement_id.empty()) {
        return UsageError("--settlement-id is required", out);
    }
    TellerSettlement settlement;
    ControlError error;
    if (!settlements_.Unsettle(GetArg(args, "tenant"),
                               settlement_id,
                               GetArg(args, "actor"),
                               GetArg(args, "reason"),
                               &settlement,
                               &error)) {
        return Fail(error, out);
    }
    PrintLine(out, SettlementFields(settlement));
    return kExitOk;
}

int DayControlApp::Settlements(const ArgMap& args, std::ostream& out) {
    SettlementFilter filter;
    filter.tenant_id = GetArg(args, "tenant");
    filter.day_book_id = GetArg(args, "day-book-id");
    filter.teller_id = GetArg(args, "teller");
    if (HasArg(args, "status")) {
        filter.has_status = true;
        if (!ParseSettlementStatus(GetArg(args, "status"), &filter.status)) {
            return UsageError("invalid --status: " + GetArg(args, "status"), out);
        }
    }
    std::vector<TellerSettlement> settlements;
    ControlError error;
    if (!settlements_.ListSettlements(filter, &settlements, &error)) {
        return Fail(error, out);
    }
    PrintLine(out, {{"count", std::to_string(settlements.size())}});
    for (const auto& settlement : settlements) {
        PrintLine(out, SettlementFields(settlement));
    }
    return kExitOk;
}

int DayControlApp::Close(const ArgMap& args, std::ostream& out) {
    DayBook closed;
    ControlError error;
    if (!day_close_.CloseDay(GetArg(args, "tenant"), GetArg(args, "actor"), &closed, &error)) {
        return Fail(error, out);
    }
    PrintLine(out, DayBookFields(closed));
    return kExitOk;
}

int DayControlApp::ForceClose(const ArgMap& args, std::ostream& out) {
    const std::string reason = GetArg(args, "reason");
    const std::string approver = GetArg(args, "approver");
    if (reason.empty() || approver.empty()) {
        return UsageError("--reason and --approver are required", out);
    }
    ForceCloseSummary summary;
    ControlError error;
    if (!day_close_.ForceCloseDay(
            GetArg(args, "tenant"), GetArg(args, "actor"), reason, approver, &summary, &error)) {
        return Fail(error, out);
    }
    auto fields = DayBookFields(summary.day_book);
    fields.emplace_back("zeroed_accounts", std::to_string(summary.zeroed_accounts));
    fields.emplace_back("force_closed_settlements", std::to_string(summary.force_closed_settlements));
    PrintLine(out, fields);
    return kExitOk;
}

int DayControlApp::Reopen(const ArgMap& args, std::ostream& out) {
    const std::string reason = GetArg(args, "reason");
    const std::string approver = GetArg(args, "approver");
    if (reason.empty() || approver.empty()) {
        return UsageError("--reason and --approver are required", out);
    }
    DayBook reopened;
    ControlError error;
    if (!day_close_.ReopenDay(GetArg(args, "tenant"),
                              GetArg(args, "actor"),
                              reason,
                              approver,
                              GetArg(args, "date"),
                              &reopened,
                              &error)) {
        return Fail(error, out);
    }
    PrintLine(out, DayBookFields(reopened));
    return kExitOk;
}

int DayControlApp::Report(const ArgMap& args, std::ostream& out) {
    DayReport report;
    ControlError error;
    if (!reports_.BuildDayReport(
            GetArg(args, "tenant"), GetArg(args, "date", deps_.clock->Today()), &report, &error)) {
        return Fail(error, out);
    }
    auto fields = DayBookFields(report.day_book);
    fields.emplace_back("settlements", std::to_string(report.settlements.size()));
    fields.emplace_back("entries", std::to_string(report.entries.size()));
    fields.emplace_back("total_debit", FormatAmount(report.total_debit));
    fields.emplace_back("total_credit", FormatAmount(report.total_credit));
    PrintLine(out, fields);
    for (const auto& settlement : report.settlements) {
        PrintLine(out, SettlementFields(settlement));
    }
    for (const auto& view : report.entries) {
        PrintLine(out,
                  {{"entry_number", view.entry.entry_number},
                   {"description", view.entry.description},
                   {"lines", std::to_string(view.lines.size())}});
    }
    return kExitOk;
}

}  // namespace coop_ledger::apps
