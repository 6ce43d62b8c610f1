#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

inline bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return false;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

// Splits a comma separated list, trimming items and dropping empty ones.
inline std::vector<std::string> splitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            std::string t = trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

inline bool isMissingToken(std::string_view raw) {
    const std::string s = toLower(trim(raw));
    return s.empty() || s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

inline double roundToCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

inline double quantileByNth(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    if (q <= 0.0) return *std::min_element(values.begin(), values.end());
    if (q >= 1.0) return *std::max_element(values.begin(), values.end());

    const long double pos = static_cast<long double>(q) * static_cast<long double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));

    std::nth_element(values.begin(), values.begin() + lo, values.end());
    const double loVal = values[lo];
    if (hi == lo) return loVal;

    std::nth_element(values.begin(), values.begin() + hi, values.end());
    const double hiVal = values[hi];
    const long double frac = pos - static_cast<long double>(lo);
    const long double out = static_cast<long double>(loVal) * (1.0L - frac) + static_cast<long double>(hiVal) * frac;
    return static_cast<double>(out);
}

} // namespace CommonUtils
