#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace coop_ledger {

using EpochNanos = std::int64_t;

inline EpochNanos NowEpochNanos();

enum class AccountType {
    kAsset,
    kLiability,
    kEquity,
    kRevenue,
    kExpense,
};

enum class DayStatus {
    kOpen,
    kEodInProgress,
    kClosed,
};

enum class SettlementStatus {
    kAutoApproved,
    kRequiresApproval,
    kApproved,
    kReverted,
};

// Chart-of-accounts roles resolved through explicit per-tenant bindings.
enum class AccountRole {
    kVaultCash,
    kStaffReceivable,
    kSundryIncome,
    kSuspense,
};

struct Account {
    std::string id;
    std::string tenant_id;
    std::string code;
    std::string name;
    AccountType type{AccountType::kAsset};
    bool is_group{false};
    bool is_active{true};
    std::string bound_operator_id;
    EpochNanos created_ts_ns{0};
};

struct AccountRoleBinding {
    std::string tenant_id;
    AccountRole role{AccountRole::kVaultCash};
    std::string account_id;
};

struct PostingLine {
    std::string account_id;
    double debit{0.0};
    double credit{0.0};
};

struct JournalEntry {
    std::string id;
    std::string tenant_id;
    std::string entry_number;
    std::string description;
    std::string effective_date;
    std::string reverses_entry_id;
    EpochNanos created_ts_ns{0};
};

struct LedgerLine {
    std::string id;
    std::string journal_entry_id;
    std::string tenant_id;
    std::string account_id;
    double debit{0.0};
    double credit{0.0};
    double balance{0.0};
    std::int64_t sequence{0};
    EpochNanos created_ts_ns{0};
};

struct DayBook {
    std::string id;
    std::string tenant_id;
    std::string date;
    DayStatus status{DayStatus::kOpen};
    double opening_cash{0.0};
    double closing_cash{0.0};
    std::int64_t transactions_count{0};
    std::string day_begin_by;
    std::string day_end_by;
    std::int64_t version{1};
    std::string last_override_reason;
    std::string last_override_approver;
    EpochNanos created_ts_ns{0};
    EpochNanos updated_ts_ns{0};
};

struct Denomination {
    double denomination{0.0};
    std::int32_t count{0};
};

struct TellerSettlement {
    std::string id;
    std::string day_book_id;
    std::string tenant_id;
    std::string teller_id;
    double physical_cash{0.0};
    double system_cash{0.0};
    double difference{0.0};
    SettlementStatus status{SettlementStatus::kAutoApproved};
    std::string settlement_ref;
    bool is_force_closed{false};
    std::string attachment_ref;
    std::vector<Denomination> denominations;
    std::vector<std::string> journal_entry_ids;
    std::string executed_by;
    EpochNanos executed_ts_ns{0};
    std::string rejection_reason;
    std::string reverted_by;
};

struct JournalPostedEvent {
    std::string tenant_id;
    std::string journal_entry_id;
    std::string entry_number;
    std::string description;
    std::string effective_date;
    double total_debit{0.0};
    std::vector<LedgerLine> lines;
    EpochNanos committed_ts_ns{0};
};

struct AuditRecord {
    std::string tenant_id;
    std::string actor;
    std::string action;
    std::string resource_type;
    std::string resource_id;
    bool success{true};
    std::vector<std::pair<std::string, std::string>> details;
    EpochNanos ts_ns{0};
};

inline EpochNanos NowEpochNanos() {
    const auto now = std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
    return now.time_since_epoch().count();
}

inline bool IsDebitNormal(AccountType type) {
    return type == AccountType::kAsset || type == AccountType::kExpense;
}

inline const char* ToString(AccountType type) {
    switch (type) {
        case AccountType::kAsset:
            return "asset";
        case AccountType::kLiability:
            return "liability";
        case AccountType::kEquity:
            return "equity";
        case AccountType::kRevenue:
            return "revenue";
        case AccountType::kExpense:
            return "expense";
    }
    return "asset";
}

inline const char* ToString(DayStatus status) {
    switch (status) {
        case DayStatus::kOpen:
            return "OPEN";
        case DayStatus::kEodInProgress:
            return "EOD_IN_PROGRESS";
        case DayStatus::kClosed:
            return "CLOSED";
    }
    return "OPEN";
}

inline const char* ToString(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::kAutoApproved:
            return "AUTO_APPROVED";
        case SettlementStatus::kRequiresApproval:
            return "REQUIRES_APPROVAL";
        case SettlementStatus::kApproved:
            return "APPROVED";
        case SettlementStatus::kReverted:
            return "REVERTED";
    }
    return "AUTO_APPROVED";
}

inline const char* ToString(AccountRole role) {
    switch (role) {
        case AccountRole::kVaultCash:
            return "vault_cash";
        case AccountRole::kStaffReceivable:
            return "staff_receivable";
        case AccountRole::kSundryIncome:
            return "sundry_income";
        case AccountRole::kSuspense:
            return "suspense";
    }
    return "vault_cash";
}

inline bool ParseAccountType(const std::string& raw, AccountType* out) {
    if (out == nullptr) {
        return false;
    }
    if (raw == "asset") {
        *out = AccountType::kAsset;
    } else if (raw == "liability") {
        *out = AccountType::kLiability;
    } else if (raw == "equity") {
        *out = AccountType::kEquity;
    } else if (raw == "revenue" || raw == "income") {
        *out = AccountType::kRevenue;
    } else if (raw == "expense") {
        *out = AccountType::kExpense;
    } else {
        return false;
    }
    return true;
}

inline bool ParseDayStatus(const std::string& raw, DayStatus* out) {
    if (out == nullptr) {
        return false;
    }
    if (raw == "OPEN") {
        *out = DayStatus::kOpen;
    } else if (raw == "EOD_IN_PROGRESS") {
        *out = DayStatus::kEodInProgress;
    } else if (raw == "CLOSED") {
        *out = DayStatus::kClosed;
    } else {
        return false;
    }
    return true;
}

inline bool ParseSettlementStatus(const std::string& raw, SettlementStatus* out) {
    if (out == nullptr) {
        return false;
    }
    if (raw == "AUTO_APPROVED") {
        *out = SettlementStatus::kAutoApproved;
    } else if (raw == "REQUIRES_APPROVAL") {
        *out = SettlementStatus::kRequiresApproval;
    } else if (raw == "APPROVED") {
        *out = SettlementStatus::kApproved;
    } else if (raw == "REVERTED") {
        *out = SettlementStatus::kReverted;
    } else {
        return false;
    }
    return true;
}

inline bool ParseAccountRole(const std::string& raw, AccountRole* out) {
    if (out == nullptr) {
        return false;
    }
    if (raw == "vault_cash") {
        *out = AccountRole::kVaultCash;
    } else if (raw == "staff_receivable") {
        *out = AccountRole::kStaffReceivable;
    } else if (raw == "sundry_income") {
        *out = AccountRole::kSundryIncome;
    } else if (raw == "suspense") {
        *out = AccountRole::kSuspense;
    } else {
        return false;
    }
    return true;
}

}  // namespace coop_ledger
