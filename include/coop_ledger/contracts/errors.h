#pragma once

#include <string>
#include <utility>
#include <vector>

namespace coop_ledger {

enum class ErrorCode {
    kNone,
    kInvalidArgument,
    kStorageError,
    kAccountNotFound,
    kAccountNotPostable,
    kDoubleEntryMismatch,
    kPreviousDayNotClosed,
    kDayAlreadyOpen,
    kCannotStartPastDay,
    kNoActiveDay,
    kTellerAccountNotMapped,
    kDenominationMismatch,
    kAccountRoleNotConfigured,
    kSettlementNotFound,
    kDayNotOpen,
    kAlreadyApproved,
    kAlreadyReverted,
    kTellerPendingSettlement,
    kConcurrentCloseInProgress,
    kAlreadyClosed,
    kConcurrentModification,
    kNoDayForToday,
    kCannotReopenPastDay,
    kNotClosed,
    kDuplicateAccountCode,
    kInvalidAccountCode,
};

struct PendingTellerBalance {
    std::string account_id;
    std::string account_code;
    std::string account_name;
    std::string teller_id;
    double balance{0.0};
};

struct ControlError {
    ErrorCode code{ErrorCode::kNone};
    std::string message;
    // Populated for kTellerPendingSettlement only.
    std::vector<PendingTellerBalance> pending_tellers;
};

inline const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNone:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kStorageError:
            return "STORAGE_ERROR";
        case ErrorCode::kAccountNotFound:
            return "ACCOUNT_NOT_FOUND";
        case ErrorCode::kAccountNotPostable:
            return "ACCOUNT_NOT_POSTABLE";
        case ErrorCode::kDoubleEntryMismatch:
            return "DOUBLE_ENTRY_MISMATCH";
        case ErrorCode::kPreviousDayNotClosed:
            return "PREVIOUS_DAY_NOT_CLOSED";
        case ErrorCode::kDayAlreadyOpen:
            return "DAY_ALREADY_OPEN";
        case ErrorCode::kCannotStartPastDay:
            return "CANNOT_START_PAST_DAY";
        case ErrorCode::kNoActiveDay:
            return "NO_ACTIVE_DAY";
        case ErrorCode::kTellerAccountNotMapped:
            return "TELLER_ACCOUNT_NOT_MAPPED";
        case ErrorCode::kDenominationMismatch:
            return "DENOMINATION_MISMATCH";
        case ErrorCode::kAccountRoleNotConfigured:
            return "ACCOUNT_ROLE_NOT_CONFIGURED";
        case ErrorCode::kSettlementNotFound:
            return "SETTLEMENT_NOT_FOUND";
        case ErrorCode::kDayNotOpen:
            return "DAY_NOT_OPEN";
        case ErrorCode::kAlreadyApproved:
            return "ALREADY_APPROVED";
        case ErrorCode::kAlreadyReverted:
            return "ALREADY_REVERTED";
        case ErrorCode::kTellerPendingSettlement:
            return "TELLER_PENDING_SETTLEMENT";
        case ErrorCode::kConcurrentCloseInProgress:
            return "CONCURRENT_CLOSE_IN_PROGRESS";
        case ErrorCode::kAlreadyClosed:
            return "ALREADY_CLOSED";
        case ErrorCode::kConcurrentModification:
            return "CONCURRENT_MODIFICATION";
        case ErrorCode::kNoDayForToday:
            return "NO_DAY_FOR_TODAY";
        case ErrorCode::kCannotReopenPastDay:
            return "CANNOT_REOPEN_PAST_DAY";
        case ErrorCode::kNotClosed:
            return "NOT_CLOSED";
        case ErrorCode::kDuplicateAccountCode:
            return "DUPLICATE_ACCOUNT_CODE";
        case ErrorCode::kInvalidAccountCode:
            return "INVALID_ACCOUNT_CODE";
    }
    return "UNKNOWN";
}

// Contention codes mean "retry the whole operation"; nothing was written.
inline bool IsContention(ErrorCode code) {
    return code == ErrorCode::kConcurrentCloseInProgress ||
           code == ErrorCode::kConcurrentModification;
}

inline bool IsPrecondition(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNone:
        case ErrorCode::kStorageError:
        case ErrorCode::kDoubleEntryMismatch:
        case ErrorCode::kConcurrentCloseInProgress:
        case ErrorCode::kConcurrentModification:
            return false;
        default:
            return true;
    }
}

inline void SetControlError(ControlError* error, ErrorCode code, std::string message) {
    if (error == nullptr) {
        return;
    }
    error->code = code;
    error->message = std::move(message);
    error->pending_tellers.clear();
}

}  // namespace coop_ledger
