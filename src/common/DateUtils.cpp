#include "common/DateUtils.h"
#include "common/Errors.h"

#include <cctype>
#include <cstdio>
#include <string>

namespace quantsim {
namespace utils {

namespace {
// Civil date <-> days since epoch (proleptic Gregorian)
long long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (m <= 2 ? 1 : 0);
}

bool allDigits(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) {
        return false;
    }
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}
}

Timestamp parseDate(const std::string& date) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (date.size() < 10 || std::sscanf(date.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) {
        throw ValidationError("malformed date: " + date);
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        throw ValidationError("date out of range: " + date);
    }
    return daysFromCivil(y, m, d) * MS_PER_DAY;
}

std::string formatDate(Timestamp ts) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(dayKey(ts), y, m, d);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", y, m, d);
    return buffer;
}

Timestamp parseTimestamp(const std::string& value) {
    if (allDigits(value)) {
        long long raw = std::stoll(value);
        // Seconds-resolution epochs are promoted to ms
        if (raw > -100000000000LL && raw < 100000000000LL) {
            raw *= 1000;
        }
        return raw;
    }

    Timestamp day = parseDate(value);
    if (value.size() >= 19) {
        int hh = 0;
        int mm = 0;
        int ss = 0;
        if (std::sscanf(value.c_str() + 11, "%2d:%2d:%2d", &hh, &mm, &ss) == 3) {
            day += (static_cast<long long>(hh) * 3600 + mm * 60 + ss) * 1000LL;
        }
    }
    return day;
}

} // namespace utils
} // namespace quantsim
