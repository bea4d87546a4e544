#include "coop_ledger/services/chart_of_accounts.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "coop_ledger/core/record_id.h"
#include "coop_ledger/core/structured_log.h"

namespace coop_ledger {
namespace {

constexpr std::size_t kCodeDigits = 14;

std::string StripDashes(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    for (const char ch : code) {
        if (ch != '-') {
            out.push_back(ch);
        }
    }
    return out;
}

bool AllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

std::string PadSerial(int serial) {
    std::string text = std::to_string(serial);
    if (text.size() < 5) {
        text.insert(0, 5 - text.size(), '0');
    }
    return text;
}

bool StorageFailure(ControlError* error, const std::string& what, const std::string& detail) {
    SetControlError(error, ErrorCode::kStorageError, what + ": " + detail);
    return false;
}

}  // namespace

ChartOfAccountsRegistry::ChartOfAccountsRegistry(LedgerRuntimeConfig runtime)
    : runtime_(std::move(runtime)) {}

bool ChartOfAccountsRegistry::ParseAccountCode(const std::string& code, AccountCodeParts* out) {
    const auto clean = StripDashes(code);
    if (clean.size() != kCodeDigits || !AllDigits(clean)) {
        return false;
    }
    if (out != nullptr) {
        out->branch = clean.substr(0, 2);
        out->gl_head = clean.substr(2, 5);
        out->sub_type = clean.substr(7, 2);
        out->serial = clean.substr(9, 5);
    }
    return true;
}

bool ChartOfAccountsRegistry::ValidateAccountCode(const std::string& code, std::string* error) {
    AccountCodeParts parts;
    if (!ParseAccountCode(code, &parts)) {
        if (error != nullptr) {
            *error = "account code must be 14 digits (format: BB-GGGGG-SS-SSSSS)";
        }
        return false;
    }
    const char head = parts.gl_head.front();
    if (head < '1' || head > '5') {
        if (error != nullptr) {
            *error = "GL head must start with 1-5";
        }
        return false;
    }
    return true;
}

std::string ChartOfAccountsRegistry::FormatAccountCode(const AccountCodeParts& parts) {
    return parts.branch + "-" + parts.gl_head + "-" + parts.sub_type + "-" + parts.serial;
}

std::string ChartOfAccountsRegistry::GlHeadForType(AccountType type) {
    switch (type) {
        case AccountType::kAsset:
            return "10000";
        case AccountType::kLiability:
            return "20000";
        case AccountType::kEquity:
            return "30000";
        case AccountType::kRevenue:
            return "40000";
        case AccountType::kExpense:
            return "50000";
    }
    return "00000";
}

bool ChartOfAccountsRegistry::GenerateAccountCode(const ILedgerStore& store,
                                                  const std::string& tenant_id,
                                                  AccountType type,
                                                  const std::string& sub_type,
                                                  const std::string& branch,
                                                  std::string* code,
                                                  ControlError* error) const {
    if (code == nullptr) {
        SetControlError(error, ErrorCode::kInvalidArgument, "code output pointer is null");
        return false;
    }
    if (branch.size() != 2 || !AllDigits(branch) || sub_type.size() != 2 || !AllDigits(sub_type)) {
        SetControlError(error,
                        ErrorCode::kInvalidAccountCode,
                        "branch and sub type must be two digits each");
        return false;
    }

    std::vector<Account> accounts;
    std::string store_error;
    if (!store.ListAccounts(tenant_id, &accounts, &store_error)) {
        return StorageFailure(error, "list accounts failed", store_error);
    }

    const std::string gl_head = GlHeadForType(type);
    const std::string prefix = branch + gl_head + sub_type;
    int highest = 0;
    for (const auto& account : accounts) {
        if (!account.is_active) {
            continue;
        }
        const auto clean = StripDashes(account.code);
        if (clean.size() != kCodeDigits || clean.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const auto serial_text = clean.substr(9, 5);
        if (!AllDigits(serial_text)) {
            continue;
        }
        highest = std::max(highest, std::stoi(serial_text));
    }
    if (highest >= 99999) {
        SetControlError(error,
                        ErrorCode::kInvalidAccountCode,
                        "serial range exhausted for " + branch + "-" + gl_head + "-" + sub_type);
        return false;
    }

    AccountCodeParts parts;
    parts.branch = branch;
    parts.gl_head = gl_head;
    parts.sub_type = sub_type;
    parts.serial = PadSerial(highest + 1);
    *code = FormatAccountCode(parts);
    return true;
}

bool ChartOfAccountsRegistry::CreateAccount(UnitOfWork* uow,
                                            const NewAccountRequest& request,
                                            Account* out,
                                            ControlError* error) const {
    if (uow == nullptr || !uow->active()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "active unit of work required");
        return false;
    }
    if (request.tenant_id.empty() || request.name.empty()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "tenant and name are required");
        return false;
    }

    auto& store = uow->store();
    std::string code = request.code;
    if (code.empty()) {
        if (!GenerateAccountCode(store,
                                 request.tenant_id,
                                 request.type,
                                 request.sub_type,
                                 request.branch,
                                 &code,
                                 error)) {
            return false;
        }
    } else {
        std::string validation_error;
        if (!ValidateAccountCode(code, &validation_error)) {
            SetControlError(error, ErrorCode::kInvalidAccountCode, validation_error);
            return false;
        }
        AccountCodeParts parts;
        (void)ParseAccountCode(code, &parts);
        if (parts.gl_head.front() != GlHeadForType(request.type).front()) {
            SetControlError(error,
                            ErrorCode::kInvalidAccountCode,
                            std::string("account type '") + ToString(request.type) +
                                "' requires GL head starting with '" +
                                GlHeadForType(request.type).front() + "'");
            return false;
        }
        code = FormatAccountCode(parts);
    }

    Account existing;
    bool found = false;
    std::string store_error;
    if (!store.GetAccountByCode(request.tenant_id, code, &existing, &found, &store_error)) {
        return StorageFailure(error, "account lookup failed", store_error);
    }
    if (found) {
        SetControlError(error, ErrorCode::kDuplicateAccountCode, "account code exists: " + code);
        return false;
    }

    Account account;
    account.id = NewRecordId("acct");
    account.tenant_id = request.tenant_id;
    account.code = code;
    account.name = request.name;
    account.type = request.type;
    account.is_group = request.is_group;
    account.is_active = true;
    account.bound_operator_id = request.bound_operator_id;
    account.created_ts_ns = NowEpochNanos();
    if (!store.InsertAccount(account, &store_error)) {
        return StorageFailure(error, "insert account failed", store_error);
    }

    EmitStructuredLog(&runtime_,
                      "coop_ledger",
                      "info",
                      "account_created",
                      {{"tenant_id", account.tenant_id},
                       {"account_id", account.id},
                       {"code", account.code},
                       {"type", ToString(account.type)}});
    if (out != nullptr) {
        *out = std::move(account);
    }
    return true;
}

bool ChartOfAccountsRegistry::BindRole(UnitOfWork* uow,
                                       const std::string& tenant_id,
                                       AccountRole role,
                                       const std::string& account_id,
                                       ControlError* error) const {
    if (uow == nullptr || !uow->active()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "active unit of work required");
        return false;
    }
    auto& store = uow->store();
    Account account;
    bool found = false;
    std::string store_error;
    if (!store.GetAccount(account_id, &account, &found, &store_error)) {
        return StorageFailure(error, "account lookup failed", store_error);
    }
    if (!found || account.tenant_id != tenant_id) {
        SetControlError(error, ErrorCode::kAccountNotFound, "account not found: " + account_id);
        return false;
    }
    if (account.is_group || !account.is_active) {
        SetControlError(error,
                        ErrorCode::kAccountNotPostable,
                        "role target must be an active leaf account: " + account.code);
        return false;
    }

    AccountRoleBinding binding;
    binding.tenant_id = tenant_id;
    binding.role = role;
    binding.account_id = account_id;
    if (!store.UpsertRoleBinding(binding, &store_error)) {
        return StorageFailure(error, "bind role failed", store_error);
    }
    return true;
}

bool ChartOfAccountsRegistry::ResolveRole(const ILedgerStore& store,
                                          const std::string& tenant_id,
                                          AccountRole role,
                                          Account* out,
                                          ControlError* error) const {
    AccountRoleBinding binding;
    bool found = false;
    std::string store_error;
    if (!store.GetRoleBinding(tenant_id, role, &binding, &found, &store_error)) {
        return StorageFailure(error, "role lookup failed", store_error);
    }
    if (!found) {
        SetControlError(error,
                        ErrorCode::kAccountRoleNotConfigured,
                        std::string("no account bound to role ") + ToString(role));
        return false;
    }

    Account account;
    if (!store.GetAccount(binding.account_id, &account, &found, &store_error)) {
        return StorageFailure(error, "account lookup failed", store_error);
    }
    if (!found || account.tenant_id != tenant_id) {
        SetControlError(error,
                        ErrorCode::kAccountRoleNotConfigured,
                        std::string("role ") + ToString(role) +
                            " is bound to a missing account: " + binding.account_id);
        return false;
    }
    if (out != nullptr) {
        *out = std::move(account);
    }
    return true;
}

bool ChartOfAccountsRegistry::ResolveOrCreateSuspense(UnitOfWork* uow,
                                                      const std::string& tenant_id,
                                                      Account* out,
                                                      ControlError* error) const {
    if (uow == nullptr || !uow->active()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "active unit of work required");
        return false;
    }
    ControlError resolve_error;
    if (ResolveRole(uow->store(), tenant_id, AccountRole::kSuspense, out, &resolve_error)) {
        return true;
    }
    if (resolve_error.code != ErrorCode::kAccountRoleNotConfigured) {
        if (error != nullptr) {
            *error = resolve_error;
        }
        return false;
    }

    auto& store = uow->store();
    Account suspense;
    bool found = false;
    std::string store_error;
    if (!store.GetAccountByCode(
            tenant_id, runtime_.suspense_account_code, &suspense, &found, &store_error)) {
        return StorageFailure(error, "suspense lookup failed", store_error);
    }
    if (!found) {
        NewAccountRequest request;
        request.tenant_id = tenant_id;
        request.name = runtime_.suspense_account_name;
        request.type = AccountType::kAsset;
        request.code = runtime_.suspense_account_code;
        if (!CreateAccount(uow, request, &suspense, error)) {
            return false;
        }
    }
    if (!BindRole(uow, tenant_id, AccountRole::kSuspense, suspense.id, error)) {
        return false;
    }
    if (out != nullptr) {
        *out = std::move(suspense);
    }
    return true;
}

bool ChartOfAccountsRegistry::FindTellerAccount(const ILedgerStore& store,
                                                const std::string& tenant_id,
                                                const std::string& teller_id,
                                                Account* out,
                                                ControlError* error) const {
    if (teller_id.empty()) {
        SetControlError(error, ErrorCode::kInvalidArgument, "teller id is required");
        return false;
    }
    std::vector<Account> accounts;
    std::string store_error;
    if (!store.ListAccounts(tenant_id, &accounts, &store_error)) {
        return StorageFailure(error, "list accounts failed", store_error);
    }
    const Account* match = nullptr;
    std::size_t matches = 0;
    for (const auto& account : accounts) {
        if (account.bound_operator_id == teller_id && account.is_active && !account.is_group) {
            match = &account;
            ++matches;
        }
    }
    if (matches != 1) {
        SetControlError(error,
                        ErrorCode::kTellerAccountNotMapped,
                        matches == 0 ? "no cash account bound to teller " + teller_id
                                     : "multiple cash accounts bound to teller " + teller_id);
        return false;
    }
    if (out != nullptr) {
        *out = *match;
    }
    return true;
}

bool ChartOfAccountsRegistry::ListTellerCashAccounts(const ILedgerStore& store,
                                                     const std::string& tenant_id,
                                                     std::vector<Account>* out,
                                                     ControlError* error) const {
    if (out == nullptr) {
        SetControlError(error, ErrorCode::kInvalidArgument, "output pointer is null");
        return false;
    }
    std::vector<Account> accounts;
    std::string store_error;
    if (!store.ListAccounts(tenant_id, &accounts, &store_error)) {
        return StorageFailure(error, "list accounts failed", store_error);
    }
    out->clear();
    for (auto& account : accounts) {
        if (!account.bound_operator_id.empty() && account.is_active && !account.is_group) {
            out->push_back(std::move(account));
        }
    }
    return true;
}

bool ChartOfAccountsRegistry::ApplyConfiguredBindings(UnitOfWork* uow,
                                                      const std::string& tenant_id,
                                                      std::size_t* applied,
                                                      ControlError* error) const {
    std::size_t count = 0;
    for (const auto& binding : runtime_.role_bindings) {
        if (binding.tenant_id != tenant_id) {
            continue;
        }
        ControlError bind_error;
        if (!BindRole(uow, tenant_id, binding.role, binding.account_id, &bind_error)) {
            if (bind_error.code == ErrorCode::kAccountNotFound) {
                EmitStructuredLog(&runtime_,
                                  "coop_ledger",
                                  "warn",
                                  "role_binding_skipped",
                                  {{"tenant_id", tenant_id},
                                   {"role", ToString(binding.role)},
                                   {"account_id", binding.account_id}});
                continue;
            }
            if (error != nullptr) {
                *error = bind_error;
            }
            return false;
        }
        ++count;
    }
    if (applied != nullptr) {
        *applied = count;
    }
    return true;
}

}  // namespace coop_ledger
