#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "coop_ledger/contracts/errors.h"
#include "coop_ledger/contracts/types.h"
#include "coop_ledger/core/ledger_config.h"
#include "coop_ledger/core/unit_of_work.h"
#include "coop_ledger/interfaces/ledger_store.h"

namespace coop_ledger {

// BB-GGGGG-SS-SSSSS: branch, GL head, sub type, serial.
struct AccountCodeParts {
    std::string branch;
    std::string gl_head;
    std::string sub_type;
    std::string serial;
};

struct NewAccountRequest {
    std::string tenant_id;
    std::string name;
    AccountType type{AccountType::kAsset};
    // Generated from type, branch and sub_type when empty.
    std::string code;
    std::string branch{"00"};
    std::string sub_type{"00"};
    bool is_group{false};
    std::string bound_operator_id;
};

class ChartOfAccountsRegistry {
public:
    explicit ChartOfAccountsRegistry(LedgerRuntimeConfig runtime = {});

    static bool ParseAccountCode(const std::string& code, AccountCodeParts* out);
    static bool ValidateAccountCode(const std::string& code, std::string* error);
    static std::string FormatAccountCode(const AccountCodeParts& parts);
    static std::string GlHeadForType(AccountType type);

    bool GenerateAccountCode(const ILedgerStore& store,
                             const std::string& tenant_id,
                             AccountType type,
                             const std::string& sub_type,
                             const std::string& branch,
                             std::string* code,
                             ControlError* error) const;

    bool CreateAccount(UnitOfWork* uow,
                       const NewAccountRequest& request,
                       Account* out,
                       ControlError* error) const;

    bool BindRole(UnitOfWork* uow,
                  const std::string& tenant_id,
                  AccountRole role,
                  const std::string& account_id,
                  ControlError* error) const;

    // Fails with kAccountRoleNotConfigured when the tenant has no binding.
    bool ResolveRole(const ILedgerStore& store,
                     const std::string& tenant_id,
                     AccountRole role,
                     Account* out,
                     ControlError* error) const;

    // Creates and binds the suspense account on first use.
    bool ResolveOrCreateSuspense(UnitOfWork* uow,
                                 const std::string& tenant_id,
                                 Account* out,
                                 ControlError* error) const;

    // Exactly one active leaf account bound to the operator.
    bool FindTellerAccount(const ILedgerStore& store,
                           const std::string& tenant_id,
                           const std::string& teller_id,
                           Account* out,
                           ControlError* error) const;

    bool ListTellerCashAccounts(const ILedgerStore& store,
                                const std::string& tenant_id,
                                std::vector<Account>* out,
                                ControlError* error) const;

    // Writes the role bindings from configuration, skipping accounts that do
    // not exist yet.
    bool ApplyConfiguredBindings(UnitOfWork* uow,
                                 const std::string& tenant_id,
                                 std::size_t* applied,
                                 ControlError* error) const;

private:
    LedgerRuntimeConfig runtime_;
};

}  // namespace coop_ledger
