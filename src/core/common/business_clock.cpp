#include "coop_ledger/core/business_clock.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace coop_ledger {
namespace {

bool ParseDate(const std::string& text, std::tm* out) {
    if (out == nullptr) {
        return false;
    }
    std::tm value{};
    std::istringstream stream(text);
    stream >> std::get_time(&value, "%Y-%m-%d");
    if (stream.fail()) {
        return false;
    }
    *out = value;
    return true;
}

std::int64_t TimegmPortable(std::tm* utc_tm) {
#if defined(_WIN32)
    return static_cast<std::int64_t>(_mkgmtime(utc_tm));
#else
    return static_cast<std::int64_t>(timegm(utc_tm));
#endif
}

std::string FormatDate(const std::tm& value) {
    char buffer[11] = {0};
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &value) == 0) {
        return "";
    }
    return std::string(buffer);
}

}  // namespace

bool IsValidBusinessDate(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return false;
    }
    for (std::size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(date[i])) == 0) {
            return false;
        }
    }
    std::tm parsed{};
    if (!ParseDate(date, &parsed)) {
        return false;
    }
    // timegm normalizes out-of-range days, so 2025-02-30 comes back as March.
    std::tm normalized = parsed;
    const std::time_t seconds = static_cast<std::time_t>(TimegmPortable(&normalized));
    std::tm round_trip{};
#if defined(_WIN32)
    gmtime_s(&round_trip, &seconds);
#else
    gmtime_r(&seconds, &round_trip);
#endif
    return FormatDate(round_trip) == date;
}

int BusinessDateYear(const std::string& date) {
    std::tm parsed{};
    if (!ParseDate(date, &parsed)) {
        return 0;
    }
    return parsed.tm_year + 1900;
}

std::string PreviousBusinessDate(const std::string& date) {
    std::tm tm_utc{};
    if (!ParseDate(date, &tm_utc)) {
        return date;
    }
    const auto day_seconds = TimegmPortable(&tm_utc) - 24 * 3600;
    std::time_t ts = static_cast<std::time_t>(day_seconds);
    std::tm prev{};
#if defined(_WIN32)
    gmtime_s(&prev, &ts);
#else
    gmtime_r(&ts, &prev);
#endif
    const auto formatted = FormatDate(prev);
    return formatted.empty() ? date : formatted;
}

std::string BusinessDateFromEpochNanos(EpochNanos ts_ns, bool use_local_time) {
    const std::time_t seconds = static_cast<std::time_t>(ts_ns / 1'000'000'000LL);
    std::tm value{};
#if defined(_WIN32)
    if (use_local_time) {
        localtime_s(&value, &seconds);
    } else {
        gmtime_s(&value, &seconds);
    }
#else
    if (use_local_time) {
        localtime_r(&seconds, &value);
    } else {
        gmtime_r(&seconds, &value);
    }
#endif
    const auto formatted = FormatDate(value);
    return formatted.empty() ? "1970-01-01" : formatted;
}

std::string SystemBusinessClock::Today() const {
    return BusinessDateFromEpochNanos(NowEpochNanos(), use_local_time_);
}

std::string FixedBusinessClock::Today() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return today_;
}

void FixedBusinessClock::SetToday(std::string today) {
    std::lock_guard<std::mutex> lock(mutex_);
    today_ = std::move(today);
}

}  // namespace coop_ledger
