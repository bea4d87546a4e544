#pragma once

#include <mutex>
#include <string>
#include <utility>

#include "coop_ledger/contracts/types.h"
#include "coop_ledger/interfaces/business_clock.h"

namespace coop_ledger {

// Strict YYYY-MM-DD that names a real calendar day.
bool IsValidBusinessDate(const std::string& date);
int BusinessDateYear(const std::string& date);
std::string PreviousBusinessDate(const std::string& date);
std::string BusinessDateFromEpochNanos(EpochNanos ts_ns, bool use_local_time);

class SystemBusinessClock : public IBusinessClock {
public:
    explicit SystemBusinessClock(bool use_local_time = true) : use_local_time_(use_local_time) {}

    std::string Today() const override;

private:
    bool use_local_time_{true};
};

class FixedBusinessClock : public IBusinessClock {
public:
    explicit FixedBusinessClock(std::string today) : today_(std::move(today)) {}

    std::string Today() const override;
    void SetToday(std::string today);

private:
    mutable std::mutex mutex_;
    std::string today_;
};

}  // namespace coop_ledger
