#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "coop_ledger/core/business_clock.h"
#include "coop_ledger/core/in_memory_ledger_event_queue.h"
#include "coop_ledger/core/in_memory_ledger_store.h"
#include "coop_ledger/core/unit_of_work.h"
#include "coop_ledger/interfaces/audit_sink.h"
#include "coop_ledger/services/chart_of_accounts.h"
#include "coop_ledger/services/day_book_state_machine.h"
#include "coop_ledger/services/ledger_posting_engine.h"

namespace coop_ledger::test_support {

class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, const char* value) : key_(std::move(key)) {
        const char* previous = std::getenv(key_.c_str());
        if (previous != nullptr) {
            had_previous_ = true;
            previous_value_ = previous;
        }
        if (value == nullptr) {
            unsetenv(key_.c_str());
        } else {
            setenv(key_.c_str(), value, 1);
        }
    }

    ~ScopedEnvVar() {
        if (had_previous_) {
            setenv(key_.c_str(), previous_value_.c_str(), 1);
            return;
        }
        unsetenv(key_.c_str());
    }

private:
    std::string key_;
    bool had_previous_{false};
    std::string previous_value_;
};

inline std::filesystem::path TempPath(const std::string& stem, const std::string& extension) {
    const auto token =
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    return std::filesystem::temp_directory_path() /
           ("coop_ledger_" + stem + "_" + token + extension);
}

inline std::filesystem::path WriteTempFile(const std::string& stem,
                                           const std::string& extension,
                                           const std::string& body) {
    const auto path = TempPath(stem, extension);
    std::ofstream out(path);
    out << body;
    return path;
}

class RecordingAuditSink : public IAuditSink {
public:
    void Record(const AuditRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    std::vector<AuditRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

// A branch with one vault, one teller drawer bound to "teller-1", a staff
// receivable, sundry income and an equity account to fund the vault from.
class LedgerTestBed {
public:
    explicit LedgerTestBed(std::string today = "2025-03-14")
        : store(std::make_shared<InMemoryLedgerStore>()),
          events(std::make_shared<InMemoryLedgerEventQueue>()),
          clock(std::make_shared<FixedBusinessClock>(std::move(today))),
          audit(std::make_shared<RecordingAuditSink>()) {
        runtime.log_level = "error";
    }

    Account CreateAccount(const std::string& name,
                          AccountType type,
                          const std::string& sub_type = "00",
                          const std::string& operator_id = "") {
        ChartOfAccountsRegistry registry(runtime);
        NewAccountRequest request;
        request.tenant_id = tenant;
        request.name = name;
        request.type = type;
        request.sub_type = sub_type;
        request.bound_operator_id = operator_id;

        UnitOfWork uow(store, events, &runtime);
        std::string error;
        EXPECT_TRUE(uow.Begin(&error)) << error;
        Account account;
        ControlError control_error;
        EXPECT_TRUE(registry.CreateAccount(&uow, request, &account, &control_error))
            << control_error.message;
        EXPECT_TRUE(uow.Commit(&error)) << error;
        return account;
    }

    void Bind(AccountRole role, const std::string& account_id) {
        ChartOfAccountsRegistry registry(runtime);
        UnitOfWork uow(store, events, &runtime);
        std::string error;
        EXPECT_TRUE(uow.Begin(&error)) << error;
        ControlError control_error;
        EXPECT_TRUE(registry.BindRole(&uow, tenant, role, account_id, &control_error))
            << control_error.message;
        EXPECT_TRUE(uow.Commit(&error)) << error;
    }

    void SetUpBranch() {
        vault = CreateAccount("Main Vault", AccountType::kAsset);
        teller = CreateAccount("Teller 1 Cash", AccountType::kAsset, "00", "teller-1");
        receivable = CreateAccount("Staff Receivable", AccountType::kAsset, "02");
        sundry = CreateAccount("Sundry Income", AccountType::kRevenue);
        capital = CreateAccount("Share Capital", AccountType::kEquity);
        Bind(AccountRole::kVaultCash, vault.id);
        Bind(AccountRole::kStaffReceivable, receivable.id);
        Bind(AccountRole::kSundryIncome, sundry.id);
    }

    DayBook StartDay(const std::string& date = "") {
        DayBookStateMachine machine(store, events, clock, audit, runtime);
        DayBook day;
        ControlError error;
        EXPECT_TRUE(machine.StartDay(tenant, date, "manager", &day, &error)) << error.message;
        return day;
    }

    PostingResult Transfer(const std::string& debit_account_id,
                           const std::string& credit_account_id,
                           double amount,
                           const std::string& date = "2025-03-14") {
        LedgerPostingEngine engine(runtime);
        PostingRequest request;
        request.tenant_id = tenant;
        request.description = "Transfer";
        request.effective_date = date;
        request.lines.push_back(PostingLine{debit_account_id, amount, 0.0});
        request.lines.push_back(PostingLine{credit_account_id, 0.0, amount});

        UnitOfWork uow(store, events, &runtime);
        std::string error;
        EXPECT_TRUE(uow.Begin(&error)) << error;
        PostingResult result;
        ControlError control_error;
        EXPECT_TRUE(engine.Post(&uow, request, &result, &control_error))
            << control_error.message;
        EXPECT_TRUE(uow.Commit(&error)) << error;
        return result;
    }

    // Funds the vault from capital and hands `amount` to the teller drawer.
    void FundTeller(double amount) {
        Transfer(vault.id, capital.id, amount);
        Transfer(teller.id, vault.id, amount);
    }

    double Balance(const std::string& account_id) const {
        double balance = 0.0;
        std::string error;
        EXPECT_TRUE(store->GetBalance(account_id, &balance, &error)) << error;
        return balance;
    }

    std::string tenant{"branch-01"};
    LedgerRuntimeConfig runtime;
    std::shared_ptr<InMemoryLedgerStore> store;
    std::shared_ptr<InMemoryLedgerEventQueue> events;
    std::shared_ptr<FixedBusinessClock> clock;
    std::shared_ptr<RecordingAuditSink> audit;

    Account vault;
    Account teller;
    Account receivable;
    Account sundry;
    Account capital;
};

}  // namespace coop_ledger::test_support
