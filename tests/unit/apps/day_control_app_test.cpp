#include <memory>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "ledger_test_support.h"
#include "coop_ledger/apps/day_control_app.h"

namespace coop_ledger::apps {

namespace {

constexpr char kBranchSetup[] = R"(# branch bootstrap
create-account --name "Vault Cash" --type asset --sub-type 01
create-account --name "Teller One Cash" --type asset --sub-type 01 --operator teller-1
create-account --name "Staff Receivable" --type asset --sub-type 02
create-account --name "Sundry Income" --type revenue
create-account --name "Share Capital" --type equity
bind-role --role vault_cash --account-code 00-10000-01-00001
bind-role --role staff_receivable --account-code 00-10000-02-00001
bind-role --role sundry_income --account-code 00-40000-00-00001

start
post --debit-code 00-10000-01-00001 --credit-code 00-30000-00-00001 --amount 20000 --description "Opening capital"
post --debit-code 00-10000-01-00002 --credit-code 00-10000-01-00001 --amount 5000 --description "Teller float"
)";

class DayControlAppTest : public ::testing::Test {
protected:
    DayControlAppTest() {
        DayControlDependencies deps;
        deps.store = std::make_shared<InMemoryLedgerStore>();
        deps.event_sink = std::make_shared<InMemoryLedgerEventQueue>();
        deps.clock = std::make_shared<FixedBusinessClock>("2025-03-14");
        deps.audit_sink = std::make_shared<test_support::RecordingAuditSink>();
        deps.runtime.log_level = "error";
        app_ = std::make_unique<DayControlApp>(deps);
        defaults_["tenant"] = "coop-demo";
        defaults_["actor"] = "manager";
    }

    int Batch(const std::string& script) {
        std::istringstream in(script);
        return app_->RunBatch(in, defaults_, out_);
    }

    int Command(const std::string& command, ArgMap args) {
        for (const auto& [key, value] : defaults_) {
            args.emplace(key, value);
        }
        return app_->Run(command, args, out_);
    }

    bool Printed(const std::string& fragment) const {
        return out_.str().find(fragment) != std::string::npos;
    }

    std::unique_ptr<DayControlApp> app_;
    ArgMap defaults_;
    std::ostringstream out_;
};

}  // namespace

TEST_F(DayControlAppTest, RunsFullDayFromBatch) {
    ASSERT_EQ(Batch(kBranchSetup), kExitOk) << out_.str();
    ASSERT_EQ(Batch("settle --teller teller-1 --physical-cash 4950 "
                    "--denominations 1000x4,500x1,50x9 --idempotency-key demo-settle-1\n"
                    "close\n"
                    "report\n"),
              kExitOk)
        << out_.str();

    EXPECT_TRUE(Printed("entry_number=JE-2025-000001"));
    EXPECT_TRUE(Printed("difference=-50.00"));
    EXPECT_TRUE(Printed("settlement_ref=demo-settle-1"));
    EXPECT_TRUE(Printed("description=\"Vault Transfer - Teller teller-1\""));
    EXPECT_TRUE(Printed("status=CLOSED version=3 opening_cash=0.00 closing_cash=19950.00 "
                        "transactions_count=4"));
    EXPECT_TRUE(Printed("settlements=1 entries=4 total_debit=30000.00 total_credit=30000.00"));
}

TEST_F(DayControlAppTest, BatchStopsAtFirstFailure) {
    EXPECT_EQ(Batch("# comment\nstart\n\nstart\nstatus\n"), kExitDomainFailure);
    EXPECT_TRUE(Printed("error_code=DAY_ALREADY_OPEN"));
    EXPECT_TRUE(Printed("failed_line=4"));
    EXPECT_FALSE(Printed("# status"));
}

TEST_F(DayControlAppTest, BatchRejectsMalformedLines) {
    EXPECT_EQ(Batch("post --description \"unterminated\n"), kExitUsage);
    EXPECT_TRUE(Printed("line 1: unterminated quote"));

    out_.str("");
    EXPECT_EQ(Batch("--tenant other\n"), kExitUsage);
    EXPECT_TRUE(Printed("line 1: missing command"));
}

TEST_F(DayControlAppTest, ReportsStatusBeforeAnyDay) {
    EXPECT_EQ(Command("status", {}), kExitOk);
    EXPECT_EQ(out_.str(), "status=NO_DAY_OPEN\n");
}

TEST_F(DayControlAppTest, RequiresTenantAndKnownCommand) {
    std::ostringstream out;
    EXPECT_EQ(app_->Run("status", {}, out), kExitUsage);
    EXPECT_NE(out.str().find("--tenant is required"), std::string::npos);

    EXPECT_EQ(Command("rollover", {}), kExitUsage);
    EXPECT_TRUE(Printed("unknown command: rollover"));
}

TEST_F(DayControlAppTest, CloseListsPendingTellers) {
    ASSERT_EQ(Batch(kBranchSetup), kExitOk) << out_.str();
    out_.str("");
    EXPECT_EQ(Command("close", {}), kExitDomainFailure);
    EXPECT_TRUE(Printed("error_code=TELLER_PENDING_SETTLEMENT"));
    EXPECT_TRUE(Printed("account_code=00-10000-01-00002"));
    EXPECT_TRUE(Printed("teller_id=teller-1 balance=5000.00"));

    out_.str("");
    EXPECT_EQ(Command("status", {}), kExitOk);
    EXPECT_TRUE(Printed("status=OPEN"));
}

TEST_F(DayControlAppTest, ValidatesCommandArguments) {
    EXPECT_EQ(Command("start", {{"date", "2025-02-30"}}), kExitUsage);
    EXPECT_TRUE(Printed("error_code=INVALID_ARGUMENT"));

    EXPECT_EQ(Command("force-close", {{"reason", "absent"}}), kExitUsage);
    EXPECT_EQ(Command("reopen", {{"approver", "head"}}), kExitUsage);
    EXPECT_EQ(Command("settle", {{"teller", "teller-1"}, {"physical-cash", "ten"}}), kExitUsage);
    EXPECT_EQ(Command("settle",
                      {{"teller", "teller-1"}, {"physical-cash", "10"}, {"denominations", "10*1"}}),
              kExitUsage);
    EXPECT_EQ(Command("bind-role", {{"role", "treasurer"}, {"account-code", "00-10000-01-00001"}}),
              kExitUsage);
    EXPECT_EQ(Command("settlements", {{"status", "PENDING"}}), kExitUsage);
    EXPECT_EQ(Command("balance", {}), kExitUsage);
    EXPECT_EQ(Command("balance", {{"account-code", "00-10000-01-00009"}}), kExitDomainFailure);
    EXPECT_TRUE(Printed("error_code=ACCOUNT_NOT_FOUND"));
}

TEST_F(DayControlAppTest, ForceCloseAndReopenFromCommands) {
    ASSERT_EQ(Batch(kBranchSetup), kExitOk) << out_.str();
    out_.str("");
    ASSERT_EQ(Command("force-close", {{"reason", "teller absent"}, {"approver", "branch-head"}}),
              kExitOk)
        << out_.str();
    EXPECT_TRUE(Printed("status=CLOSED"));
    EXPECT_TRUE(Printed("zeroed_accounts=1 force_closed_settlements=0"));

    out_.str("");
    ASSERT_EQ(Command("balance", {{"account-code", "00-10300-01-00001"}}), kExitOk) << out_.str();
    EXPECT_TRUE(Printed("balance=5000.00"));

    out_.str("");
    ASSERT_EQ(Command("reopen", {{"reason", "late deposit"}, {"approver", "branch-head"}}), kExitOk)
        << out_.str();
    EXPECT_TRUE(Printed("status=OPEN version=4"));
}

TEST_F(DayControlAppTest, UnsettleRestoresTellerBalance) {
    ASSERT_EQ(Batch(kBranchSetup), kExitOk) << out_.str();
    ASSERT_EQ(Batch("settle --teller teller-1 --physical-cash 5000\n"), kExitOk) << out_.str();
    out_.str("");
    ASSERT_EQ(Command("settlements", {{"teller", "teller-1"}}), kExitOk);
    const std::string listing = out_.str();
    const auto id_pos = listing.find("settlement_id=");
    ASSERT_NE(id_pos, std::string::npos);
    const auto id_start = id_pos + std::string("settlement_id=").size();
    const std::string settlement_id = listing.substr(id_start, listing.find(' ', id_start) - id_start);

    out_.str("");
    ASSERT_EQ(Command("unsettle", {{"settlement-id", settlement_id}, {"reason", "recount"}}), kExitOk)
        << out_.str();
    EXPECT_TRUE(Printed("status=REVERTED"));

    out_.str("");
    ASSERT_EQ(Command("balance", {{"account-code", "00-10000-01-00002"}}), kExitOk);
    EXPECT_TRUE(Printed("balance=5000.00"));
}

}  // namespace coop_ledger::apps
