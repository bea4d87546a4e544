#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ledger_test_support.h"
#include "coop_ledger/services/chart_of_accounts.h"

namespace coop_ledger {

using test_support::LedgerTestBed;

TEST(ChartOfAccountsTest, ParsesCodeWithOrWithoutDashes) {
    AccountCodeParts parts;
    ASSERT_TRUE(ChartOfAccountsRegistry::ParseAccountCode("01-40000-02-00017", &parts));
    EXPECT_EQ(parts.branch, "01");
    EXPECT_EQ(parts.gl_head, "40000");
    EXPECT_EQ(parts.sub_type, "02");
    EXPECT_EQ(parts.serial, "00017");

    ASSERT_TRUE(ChartOfAccountsRegistry::ParseAccountCode("01400000200017", &parts));
    EXPECT_EQ(ChartOfAccountsRegistry::FormatAccountCode(parts), "01-40000-02-00017");

    EXPECT_FALSE(ChartOfAccountsRegistry::ParseAccountCode("01-4000-02-00017", &parts));
    EXPECT_FALSE(ChartOfAccountsRegistry::ParseAccountCode("01-4000A-02-00017", &parts));
}

TEST(ChartOfAccountsTest, ValidatesGlHeadRange) {
    std::string error;
    EXPECT_TRUE(ChartOfAccountsRegistry::ValidateAccountCode("00-50000-00-00001", &error));
    EXPECT_FALSE(ChartOfAccountsRegistry::ValidateAccountCode("00-60000-00-00001", &error));
    EXPECT_EQ(error, "GL head must start with 1-5");
    EXPECT_FALSE(ChartOfAccountsRegistry::ValidateAccountCode("not-a-code", &error));
    EXPECT_NE(error.find("14 digits"), std::string::npos);
}

TEST(ChartOfAccountsTest, GeneratedSerialFollowsHighestExisting) {
    LedgerTestBed bed;
    const auto first = bed.CreateAccount("Cash A", AccountType::kAsset);
    const auto second = bed.CreateAccount("Cash B", AccountType::kAsset);
    const auto fees = bed.CreateAccount("Fees", AccountType::kRevenue, "03");
    EXPECT_EQ(first.code, "00-10000-00-00001");
    EXPECT_EQ(second.code, "00-10000-00-00002");
    EXPECT_EQ(fees.code, "00-40000-03-00001");

    ChartOfAccountsRegistry registry(bed.runtime);
    std::string code;
    ControlError error;
    ASSERT_TRUE(registry.GenerateAccountCode(
        *bed.store, bed.tenant, AccountType::kAsset, "00", "00", &code, &error));
    EXPECT_EQ(code, "00-10000-00-00003");

    EXPECT_FALSE(registry.GenerateAccountCode(
        *bed.store, bed.tenant, AccountType::kAsset, "0", "00", &code, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidAccountCode);
}

TEST(ChartOfAccountsTest, RejectsDuplicateAndMismatchedCodes) {
    LedgerTestBed bed;
    ChartOfAccountsRegistry registry(bed.runtime);
    UnitOfWork uow(bed.store, bed.events, &bed.runtime);
    std::string store_error;
    ASSERT_TRUE(uow.Begin(&store_error));

    NewAccountRequest request;
    request.tenant_id = bed.tenant;
    request.name = "Loans";
    request.type = AccountType::kAsset;
    request.code = "00100000100001";
    Account account;
    ControlError error;
    ASSERT_TRUE(registry.CreateAccount(&uow, request, &account, &error)) << error.message;
    EXPECT_EQ(account.code, "00-10000-01-00001");

    request.code = "00-10000-01-00001";
    EXPECT_FALSE(registry.CreateAccount(&uow, request, &account, &error));
    EXPECT_EQ(error.code, ErrorCode::kDuplicateAccountCode);

    request.code = "00-20000-01-00001";
    EXPECT_FALSE(registry.CreateAccount(&uow, request, &account, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidAccountCode);
    EXPECT_NE(error.message.find("GL head starting with '1'"), std::string::npos);

    request.name.clear();
    EXPECT_FALSE(registry.CreateAccount(&uow, request, &account, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidArgument);
    ASSERT_TRUE(uow.Commit(&store_error));
}

TEST(ChartOfAccountsTest, CreateRequiresActiveUnitOfWork) {
    LedgerTestBed bed;
    ChartOfAccountsRegistry registry(bed.runtime);
    UnitOfWork uow(bed.store, bed.events, &bed.runtime);
    NewAccountRequest request;
    request.tenant_id = bed.tenant;
    request.name = "Cash";
    ControlError error;
    EXPECT_FALSE(registry.CreateAccount(&uow, request, nullptr, &error));
    EXPECT_EQ(error.code, ErrorCode::kInvalidArgument);
}

TEST(ChartOfAccountsTest, ResolvesBoundRoles) {
    LedgerTestBed bed;
    bed.SetUpBranch();
    ChartOfAccountsRegistry registry(bed.runtime);

    Account vault;
    ControlError error;
    ASSERT_TRUE(registry.ResolveRole(*bed.store, bed.tenant, AccountRole::kVaultCash, &vault, &error));
    EXPECT_EQ(vault.id, bed.vault.id);

    EXPECT_FALSE(registry.ResolveRole(*bed.store, bed.tenant, AccountRole::kSuspense, &vault, &error));
    EXPECT_EQ(error.code, ErrorCode::kAccountRoleNotConfigured);
    EXPECT_FALSE(registry.ResolveRole(*bed.store, "branch-02", AccountRole::kVaultCash, &vault, &error));
    EXPECT_EQ(error.code, ErrorCode::kAccountRoleNotConfigured);
}

TEST(ChartOfAccountsTest, BindRoleRejectsForeignAndGroupAccounts) {
    LedgerTestBed bed;
    bed.SetUpBranch();
    ChartOfAccountsRegistry registry(bed.runtime);
    UnitOfWork uow(bed.store, bed.events, &bed.runtime);
    std::string store_error;
    ASSERT_TRUE(uow.Begin(&store_error));

    ControlError error;
    EXPECT_FALSE(registry.BindRole(&uow, "branch-02", AccountRole::kVaultCash, bed.vault.id, &error));
    EXPECT_EQ(error.code, ErrorCode::kAccountNotFound);

    NewAccountRequest request;
    request.tenant_id = bed.tenant;
    request.name = "Assets";
    request.is_group = true;
    Account group;
    ASSERT_TRUE(registry.CreateAccount(&uow, request, &group, &error)) << error.message;
    EXPECT_FALSE(registry.BindRole(&uow, bed.tenant, AccountRole::kVaultCash, group.id, &error));
    EXPECT_EQ(error.code, ErrorCode::kAccountNotPostable);
    ASSERT_TRUE(uow.Rollback(&store_error));
}

TEST(ChartOfAccountsTest, FindsExactlyOneTellerAccount) {
    LedgerTestBed bed;
    bed.SetUpBranch();
    ChartOfAccountsRegistry registry(bed.runtime);

    Account teller;
    ControlError error;
    ASSERT_TRUE(registry.FindTellerAccount(*bed.store, bed.tenant, "teller-1", &teller, &error));
    EXPECT_EQ(teller.id, bed.teller.id);

    EXPECT_FALSE(registry.FindTellerAccount(*bed.store, bed.tenant, "teller-9", &teller, &error));
    EXPECT_EQ(error.code, ErrorCode::kTellerAccountNotMapped);

    bed.CreateAccount("Teller 1 Spare", AccountType::kAsset, "00", "teller-1");
    EXPECT_FALSE(registry.FindTellerAccount(*bed.store, bed.tenant, "teller-1", &teller, &error));
    EXPECT_EQ(error.code, ErrorCode::kTellerAccountNotMapped);
    EXPECT_NE(error.message.find("multiple"), std::string::npos);

    std::vector<Account> drawers;
    ASSERT_TRUE(registry.ListTellerCashAccounts(*bed.store, bed.tenant, &drawers, &error));
    EXPECT_EQ(drawers.size(), 2U);
}

TEST(ChartOfAccountsTest, CreatesSuspenseOnFirstUse) {
    LedgerTestBed bed;
    ChartOfAccountsRegistry registry(bed.runtime);
    UnitOfWork uow(bed.store, bed.events, &bed.runtime);
    std::string store_error;
    ASSERT_TRUE(uow.Begin(&store_error));

    Account first;
    ControlError error;
    ASSERT_TRUE(registry.ResolveOrCreateSuspense(&uow, bed.tenant, &first, &error)) << error.message;
    EXPECT_EQ(first.code, "00-10300-01-00001");
    EXPECT_EQ(first.type, AccountType::kAsset);

    Account second;
    ASSERT_TRUE(registry.ResolveOrCreateSuspense(&uow, bed.tenant, &second, &error));
    EXPECT_EQ(second.id, first.id);
    ASSERT_TRUE(uow.Commit(&store_error));

    Account resolved;
    ASSERT_TRUE(registry.ResolveRole(*bed.store, bed.tenant, AccountRole::kSuspense, &resolved, &error));
    EXPECT_EQ(resolved.id, first.id);
}

TEST(ChartOfAccountsTest, AppliesConfiguredBindingsSkippingMissingAccounts) {
    LedgerTestBed bed;
    const auto vault = bed.CreateAccount("Main Vault", AccountType::kAsset);
    bed.runtime.role_bindings = {
        AccountRoleBinding{bed.tenant, AccountRole::kVaultCash, vault.id},
        AccountRoleBinding{bed.tenant, AccountRole::kSundryIncome, "acct-missing"},
        AccountRoleBinding{"branch-02", AccountRole::kVaultCash, vault.id},
    };
    ChartOfAccountsRegistry registry(bed.runtime);
    UnitOfWork uow(bed.store, bed.events, &bed.runtime);
    std::string store_error;
    ASSERT_TRUE(uow.Begin(&store_error));
    std::size_t applied = 0;
    ControlError error;
    ASSERT_TRUE(registry.ApplyConfiguredBindings(&uow, bed.tenant, &applied, &error)) << error.message;
    ASSERT_TRUE(uow.Commit(&store_error));
    EXPECT_EQ(applied, 1U);

    Account resolved;
    ASSERT_TRUE(registry.ResolveRole(*bed.store, bed.tenant, AccountRole::kVaultCash, &resolved, &error));
    EXPECT_EQ(resolved.id, vault.id);
}

}  // namespace coop_ledger
