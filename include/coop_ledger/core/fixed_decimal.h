#pragma once

#include <cstdint>
#include <string>

namespace coop_ledger {

using Cents = std::int64_t;

// Largest magnitude a NUMERIC(18,2) column holds: 9999999999999999.99.
constexpr Cents kMaxAmountCents = 999'999'999'999'999'999;

// Amounts travel as double at the edges and are compared and summed as
// integral cents. Conversion rounds half away from zero, maps NaN to zero and
// clamps out-of-range values, so callers check IsValidAmount first.
class FixedDecimal {
public:
    static bool IsValidAmount(double amount);
    static Cents ToCents(double amount);
    static double FromCents(Cents cents);
    static std::string FormatCents(Cents cents);
};

}  // namespace coop_ledger
