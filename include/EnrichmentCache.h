#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>

/**
 * @brief Run-scoped holiday cache keyed by (country, year). A key stored as
 *        std::nullopt is known to be unavailable and is not fetched again.
 */
class HolidayCalendar {
public:
    using Key = std::pair<std::string, int>;

    void store(const std::string& countryCode, int year, std::optional<std::set<int64_t>> days);
    bool contains(const std::string& countryCode, int year) const;
    bool available(const std::string& countryCode, int year) const;
    bool isHoliday(const std::string& countryCode, int64_t day) const;
    size_t size() const { return entries_.size(); }
    size_t unavailableCount() const;

private:
    std::map<Key, std::optional<std::set<int64_t>>> entries_;
};

/**
 * @brief Run-scoped FX cache keyed by (quote day, source, target).
 */
class FxRateTable {
public:
    struct Key {
        int64_t day = 0;
        std::string source;
        std::string target;

        bool operator<(const Key& other) const {
            return std::tie(day, source, target) < std::tie(other.day, other.source, other.target);
        }
    };

    void store(const Key& key, std::optional<double> rate);
    bool contains(const Key& key) const { return entries_.count(key) > 0; }
    std::optional<double> rate(const Key& key) const;
    size_t size() const { return entries_.size(); }
    size_t unavailableCount() const;

private:
    std::map<Key, std::optional<double>> entries_;
};
