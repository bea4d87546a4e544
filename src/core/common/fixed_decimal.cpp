#include "coop_ledger/core/fixed_decimal.h"

#include <cmath>
#include <limits>
#include <string>

namespace coop_ledger {
namespace {

constexpr long double kCentsPerUnit = 100.0L;

Cents ClampToCents(long double value) {
    constexpr long double kMax = static_cast<long double>(std::numeric_limits<Cents>::max());
    constexpr long double kMin = static_cast<long double>(std::numeric_limits<Cents>::min());
    if (value >= kMax) {
        return std::numeric_limits<Cents>::max();
    }
    if (value <= kMin) {
        return std::numeric_limits<Cents>::min();
    }
    return static_cast<Cents>(value);
}

}  // namespace

bool FixedDecimal::IsValidAmount(double amount) {
    if (!std::isfinite(amount)) {
        return false;
    }
    return std::fabs(static_cast<long double>(amount)) * kCentsPerUnit <=
           static_cast<long double>(kMaxAmountCents);
}

Cents FixedDecimal::ToCents(double amount) {
    if (std::isnan(amount)) {
        return 0;
    }
    const long double scaled = static_cast<long double>(amount) * kCentsPerUnit;
    if (scaled >= 0) {
        return ClampToCents(std::floor(scaled + 0.5L));
    }
    return ClampToCents(std::ceil(scaled - 0.5L));
}

double FixedDecimal::FromCents(Cents cents) {
    return static_cast<double>(static_cast<long double>(cents) / kCentsPerUnit);
}

std::string FixedDecimal::FormatCents(Cents cents) {
    const bool negative = cents < 0;
    const auto magnitude = static_cast<std::uint64_t>(negative ? -(cents + 1) : cents) +
                           (negative ? 1U : 0U);
    const auto whole = magnitude / 100U;
    const auto fraction = magnitude % 100U;
    std::string out = negative ? "-" : "";
    out += std::to_string(whole);
    out.push_back('.');
    out.push_back(static_cast<char>('0' + fraction / 10U));
    out.push_back(static_cast<char>('0' + fraction % 10U));
    return out;
}

}  // namespace coop_ledger
