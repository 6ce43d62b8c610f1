#include "CalendarUtils.h"

#include <cstdio>

namespace CalendarUtils {
namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}
} // namespace

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t floorDiv(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    int64_t r = value % divisor;
    if (r != 0 && ((r > 0) != (divisor > 0))) {
        --q;
    }
    return q;
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int y = static_cast<int>(yoe) + static_cast<int>(era) * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
    return {y, m, d};
}

int weekdayMonday0(int64_t days) {
    // 1970-01-01 was a Thursday.
    int weekday = static_cast<int>((days + 3) % 7);
    if (weekday < 0) weekday += 7;
    return weekday;
}

IsoWeek isoWeek(int64_t days) {
    // The ISO week belongs to the year that contains its Thursday.
    const int64_t thursday = days - weekdayMonday0(days) + 3;
    const CivilDate t = civilFromDays(thursday);
    const int64_t jan1 = daysFromCivil(t.year, 1, 1);
    IsoWeek out;
    out.year = t.year;
    out.week = static_cast<unsigned>((thursday - jan1) / 7 + 1);
    return out;
}

std::string formatDate(int64_t days) {
    const CivilDate c = civilFromDays(days);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", c.year, c.month, c.day);
    return buf;
}

std::string formatYearMonth(int64_t days) {
    const CivilDate c = civilFromDays(days);
    char buf[12];
    std::snprintf(buf, sizeof(buf), "%04d-%02u", c.year, c.month);
    return buf;
}

bool parseIsoDate(const std::string& text, int64_t& outDays) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') return false;
    int year = 0;
    int month = 0;
    int day = 0;
    if (!parseFixedInt(text, 0, 4, year) ||
        !parseFixedInt(text, 5, 2, month) ||
        !parseFixedInt(text, 8, 2, day)) {
        return false;
    }
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    outDays = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return true;
}

} // namespace CalendarUtils
