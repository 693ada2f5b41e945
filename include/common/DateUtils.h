#pragma once

#include <string>
#include "common/Types.h"

namespace quantsim {
namespace utils {

constexpr long long MS_PER_DAY = 86400000LL;

// Calendar day index (days since 1970-01-01, UTC)
inline long long dayKey(Timestamp ts) {
    long long day = ts / MS_PER_DAY;
    if (ts < 0 && (ts % MS_PER_DAY) != 0) {
        --day;
    }
    return day;
}

inline bool isSameDay(Timestamp a, Timestamp b) {
    return dayKey(a) == dayKey(b);
}

// "YYYY-MM-DD" -> epoch ms at 00:00 UTC. Throws ValidationError on malformed input.
Timestamp parseDate(const std::string& date);

// epoch ms -> "YYYY-MM-DD"
std::string formatDate(Timestamp ts);

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or an integer epoch (s or ms)
Timestamp parseTimestamp(const std::string& value);

} // namespace utils
} // namespace quantsim
