#include "EnrichmentCache.h"
#include "CalendarUtils.h"

void HolidayCalendar::store(const std::string& countryCode, int year, std::optional<std::set<int64_t>> days) {
    entries_[{countryCode, year}] = std::move(days);
}

bool HolidayCalendar::contains(const std::string& countryCode, int year) const {
    return entries_.count({countryCode, year}) > 0;
}

bool HolidayCalendar::available(const std::string& countryCode, int year) const {
    const auto it = entries_.find({countryCode, year});
    return it != entries_.end() && it->second.has_value();
}

bool HolidayCalendar::isHoliday(const std::string& countryCode, int64_t day) const {
    const int year = CalendarUtils::civilFromDays(day).year;
    const auto it = entries_.find({countryCode, year});
    if (it == entries_.end() || !it->second) return false;
    return it->second->count(day) > 0;
}

size_t HolidayCalendar::unavailableCount() const {
    size_t count = 0;
    for (const auto& entry : entries_) if (!entry.second) ++count;
    return count;
}

void FxRateTable::store(const Key& key, std::optional<double> rate) {
    entries_[key] = rate;
}

std::optional<double> FxRateTable::rate(const Key& key) const {
    const auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

size_t FxRateTable::unavailableCount() const {
    size_t count = 0;
    for (const auto& entry : entries_) if (!entry.second) ++count;
    return count;
}
