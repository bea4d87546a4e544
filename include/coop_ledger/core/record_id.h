#pragma once

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

#include "coop_ledger/contracts/types.h"

namespace coop_ledger {

// Process-unique identifier: <prefix>-<epoch ns hex>-<sequence hex>.
inline std::string NewRecordId(const std::string& prefix) {
    static std::atomic<std::uint64_t> sequence{0};
    const auto seq = sequence.fetch_add(1, std::memory_order_relaxed) + 1;
    std::ostringstream oss;
    oss << prefix << '-' << std::hex << static_cast<std::uint64_t>(NowEpochNanos()) << '-' << seq;
    return oss.str();
}

}  // namespace coop_ledger
