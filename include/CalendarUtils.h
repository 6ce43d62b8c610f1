#pragma once

#include <cstdint>
#include <string>

// Proleptic Gregorian calendar helpers. Dates are carried as day numbers
// relative to 1970-01-01.
namespace CalendarUtils {

struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
};

struct IsoWeek {
    int year = 1970;
    unsigned week = 1;
};

bool isLeapYear(int year);
int daysInMonth(int year, int month);
int64_t floorDiv(int64_t value, int64_t divisor);

int64_t daysFromCivil(int y, unsigned m, unsigned d);
CivilDate civilFromDays(int64_t days);

/**
 * @brief Day of week with Monday = 0 and Sunday = 6.
 */
int weekdayMonday0(int64_t days);
IsoWeek isoWeek(int64_t days);

std::string formatDate(int64_t days);
std::string formatYearMonth(int64_t days);

/**
 * @brief Parses a strict YYYY-MM-DD string.
 * @return false when the text is not a valid calendar date.
 */
bool parseIsoDate(const std::string& text, int64_t& outDays);

} // namespace CalendarUtils
