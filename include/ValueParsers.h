#pragma once
#include <cstdint>
#include <string>

enum class DateLocaleHint { AUTO, DMY, MDY };
enum class NumericSeparatorPolicy { AUTO, US_THOUSANDS, EUROPEAN };

// Cell-level parsing for raw transaction fields. Functions return false
// instead of throwing; a rejected cell becomes a null value upstream.
namespace ValueParsers {

DateLocaleHint dateLocaleHintFromString(const std::string& value);
NumericSeparatorPolicy numericPolicyFromString(const std::string& value);

/**
 * @brief Removes currency symbols/codes and thousands separators, then parses.
 * @details `(12.50)` is negative. The result is not rounded.
 */
bool parseAmount(const std::string& raw, NumericSeparatorPolicy policy, double& out);

/**
 * @brief Parses a calendar date to a day number (days since 1970-01-01).
 * @details Accepts ISO, slash, dash and dot dates, ISO week dates, epoch
 *          seconds, and any of those followed by a time of day (dropped).
 */
bool parseDate(const std::string& raw, DateLocaleHint hint, int64_t& outDays);

/**
 * @brief snake_case form of a raw header, mapped onto canonical transaction field names.
 */
std::string canonicalColumnName(const std::string& raw);

} // namespace ValueParsers
