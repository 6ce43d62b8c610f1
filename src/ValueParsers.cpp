#include "ValueParsers.h"
#include "CalendarUtils.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <unordered_map>
#include <vector>

namespace {
bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool parseInt(const std::string& s, int& out) {
    if (!allDigits(s)) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

std::string normalizeSeparators(const std::string& cleaned, NumericSeparatorPolicy policy) {
    const auto toUS = [](const std::string& s) {
        std::string out;
        for (char ch : s) if (ch != ',') out.push_back(ch);
        return out;
    };
    const auto toEuropean = [](const std::string& s) {
        std::string out;
        for (char ch : s) {
            if (ch == '.') continue;
            out.push_back(ch == ',' ? '.' : ch);
        }
        return out;
    };

    if (policy == NumericSeparatorPolicy::US_THOUSANDS) return toUS(cleaned);
    if (policy == NumericSeparatorPolicy::EUROPEAN) return toEuropean(cleaned);

    const size_t lastDot = cleaned.find_last_of('.');
    const size_t lastComma = cleaned.find_last_of(',');
    if (lastDot != std::string::npos && lastComma != std::string::npos) {
        return lastComma > lastDot ? toEuropean(cleaned) : toUS(cleaned);
    }
    if (lastComma != std::string::npos) {
        const size_t commaCount = static_cast<size_t>(std::count(cleaned.begin(), cleaned.end(), ','));
        const size_t digitsAfter = cleaned.size() - lastComma - 1;
        // A single comma followed by exactly three digits reads as a thousands separator.
        if (commaCount == 1 && digitsAfter >= 1 && digitsAfter <= 2) {
            std::string out = cleaned;
            out[lastComma] = '.';
            return out;
        }
        return toUS(cleaned);
    }
    if (lastDot != std::string::npos && std::count(cleaned.begin(), cleaned.end(), '.') > 1) {
        return toEuropean(cleaned);
    }
    return cleaned;
}

bool buildDays(int year, int month, int day, int64_t& outDays) {
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > CalendarUtils::daysInMonth(year, month)) return false;
    outDays = CalendarUtils::daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return true;
}

bool parseIsoWeekDate(const std::string& s, int64_t& outDays) {
    // YYYY-Www-D
    if (s.size() != 10 || s[4] != '-' || (s[5] != 'W' && s[5] != 'w') || s[8] != '-') return false;
    int isoYear = 0;
    int week = 0;
    int weekday = 0;
    if (!parseInt(s.substr(0, 4), isoYear) || !parseInt(s.substr(6, 2), week) || !parseInt(s.substr(9, 1), weekday)) {
        return false;
    }
    if (week < 1 || week > 53 || weekday < 1 || weekday > 7) return false;

    const int64_t jan4 = CalendarUtils::daysFromCivil(isoYear, 1, 4);
    const int64_t week1Monday = jan4 - CalendarUtils::weekdayMonday0(jan4);
    const int64_t days = week1Monday + static_cast<int64_t>((week - 1) * 7 + (weekday - 1));
    if (CalendarUtils::isoWeek(days).year != isoYear) return false;
    outDays = days;
    return true;
}

bool parseEpochSeconds(const std::string& s, int64_t& outDays) {
    if (s.size() < 9 || s.size() > 10 || !allDigits(s)) return false;
    int64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), seconds, 10);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return false;
    constexpr int64_t kEpochMax = 4102444800; // 2100-01-01T00:00:00Z
    if (seconds > kEpochMax) return false;
    outDays = CalendarUtils::floorDiv(seconds, 86400);
    return true;
}

std::vector<std::string> splitDateParts(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}
} // namespace

namespace ValueParsers {

DateLocaleHint dateLocaleHintFromString(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "dmy") return DateLocaleHint::DMY;
    if (v == "mdy") return DateLocaleHint::MDY;
    return DateLocaleHint::AUTO;
}

NumericSeparatorPolicy numericPolicyFromString(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "us") return NumericSeparatorPolicy::US_THOUSANDS;
    if (v == "eu") return NumericSeparatorPolicy::EUROPEAN;
    return NumericSeparatorPolicy::AUTO;
}

bool parseAmount(const std::string& raw, NumericSeparatorPolicy policy, double& out) {
    std::string s = CommonUtils::trim(raw);
    if (CommonUtils::isMissingToken(s)) return false;

    bool negative = false;
    if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
        negative = true;
        s = CommonUtils::trim(s.substr(1, s.size() - 2));
    }

    // Drop currency symbols and codes: any non-ASCII byte, '$', and leading/trailing letters.
    std::string kept;
    kept.reserve(s.size());
    for (char ch : s) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (uch >= 0x80 || ch == '$' || ch == '_' || std::isspace(uch) || ch == '\'') continue;
        kept.push_back(ch);
    }
    size_t b = 0;
    while (b < kept.size() && std::isalpha(static_cast<unsigned char>(kept[b]))) ++b;
    size_t e = kept.size();
    while (e > b && std::isalpha(static_cast<unsigned char>(kept[e - 1]))) --e;
    std::string cleaned = kept.substr(b, e - b);

    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (!cleaned.empty() && cleaned.front() == '-') {
        negative = !negative;
        cleaned.erase(cleaned.begin());
    }
    if (cleaned.empty()) return false;
    if (!std::isdigit(static_cast<unsigned char>(cleaned.front())) && cleaned.front() != '.' && cleaned.front() != ',') {
        return false;
    }

    cleaned = normalizeSeparators(cleaned, policy);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(cleaned.data(), cleaned.data() + cleaned.size(), value, std::chars_format::fixed);
    if (ec != std::errc{} || ptr != cleaned.data() + cleaned.size() || !std::isfinite(value)) return false;

    out = negative ? -value : value;
    return true;
}

bool parseDate(const std::string& raw, DateLocaleHint hint, int64_t& outDays) {
    const std::string s = CommonUtils::trim(raw);
    if (CommonUtils::isMissingToken(s)) return false;
    if (parseEpochSeconds(s, outDays)) return true;

    std::string datePart = s;
    const size_t timeSep = s.find_first_of(" T");
    if (timeSep != std::string::npos) datePart = s.substr(0, timeSep);
    if (parseIsoWeekDate(datePart, outDays)) return true;

    char sep = 0;
    for (char candidate : {'-', '/', '.'}) {
        if (datePart.find(candidate) != std::string::npos) {
            sep = candidate;
            break;
        }
    }
    if (sep == 0) return false;

    const std::vector<std::string> parts = splitDateParts(datePart, sep);
    if (parts.size() != 3) return false;
    int p0 = 0;
    int p1 = 0;
    int p2 = 0;
    if (!parseInt(parts[0], p0) || !parseInt(parts[1], p1) || !parseInt(parts[2], p2)) return false;

    if (parts[0].size() == 4) {
        return parts[1].size() <= 2 && parts[2].size() <= 2 && buildDays(p0, p1, p2, outDays);
    }
    if (parts[0].size() > 2 || parts[1].size() > 2) return false;

    int year = p2;
    if (parts[2].size() == 2) year = (p2 >= 70) ? 1900 + p2 : 2000 + p2;
    else if (parts[2].size() != 4) return false;

    bool dayFirst = false;
    if (hint == DateLocaleHint::DMY) {
        dayFirst = true;
    } else if (hint == DateLocaleHint::MDY) {
        dayFirst = false;
    } else if (p0 > 12 && p1 <= 12) {
        dayFirst = true;
    } else if (p1 > 12 && p0 <= 12) {
        dayFirst = false;
    } else {
        // Dash and dot dates default to day-first; slash dates to month-first.
        dayFirst = (sep != '/');
    }
    return dayFirst ? buildDays(year, p1, p0, outDays) : buildDays(year, p0, p1, outDays);
}

std::string canonicalColumnName(const std::string& raw) {
    const std::string trimmed = CommonUtils::trim(raw);
    std::string snake;
    snake.reserve(trimmed.size() + 4);
    for (size_t i = 0; i < trimmed.size(); ++i) {
        const unsigned char ch = static_cast<unsigned char>(trimmed[i]);
        if (std::isupper(ch)) {
            if (i > 0) {
                const unsigned char prev = static_cast<unsigned char>(trimmed[i - 1]);
                if (std::islower(prev) || std::isdigit(prev)) snake.push_back('_');
            }
            snake.push_back(static_cast<char>(std::tolower(ch)));
        } else if (std::isalnum(ch)) {
            snake.push_back(static_cast<char>(ch));
        } else {
            snake.push_back('_');
        }
    }

    std::string collapsed;
    for (char ch : snake) {
        if (ch == '_' && (collapsed.empty() || collapsed.back() == '_')) continue;
        collapsed.push_back(ch);
    }
    while (!collapsed.empty() && collapsed.back() == '_') collapsed.pop_back();

    static const std::unordered_map<std::string, std::string> synonyms = {
        {"category", "transaction_category"},
        {"credit", "credit_amount"},
        {"debit", "debit_amount"},
        {"description", "transaction_description"},
        {"id", "transaction_id"},
        {"transactiondate", "transaction_date"},
        {"date", "transaction_date"},
        {"currency_code", "currency"}
    };
    const auto it = synonyms.find(collapsed);
    return it == synonyms.end() ? collapsed : it->second;
}

} // namespace ValueParsers
