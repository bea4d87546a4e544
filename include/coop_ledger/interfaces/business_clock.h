#pragma once

#include <string>

namespace coop_ledger {

class IBusinessClock {
public:
    virtual ~IBusinessClock() = default;

    // Current business date as YYYY-MM-DD.
    virtual std::string Today() const = 0;
};

}  // namespace coop_ledger
