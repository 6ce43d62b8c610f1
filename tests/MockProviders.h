#ifndef LEDGERLINE_MOCK_PROVIDERS_H
#define LEDGERLINE_MOCK_PROVIDERS_H

#include "EnrichmentProviders.h"
#include "LedgerExceptions.h"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>

class MockHolidayProvider : public HolidayProvider {
public:
    std::map<std::pair<std::string, int>, std::set<int64_t>> calendars;
    bool unreachable = false;
    bool throwOnFetch = false;

    std::optional<std::set<int64_t>> fetchHolidays(const std::string& countryCode, int year) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_[{countryCode, year}];
        }
        if (throwOnFetch) throw Ledgerline::EnrichmentException("simulated holiday outage");
        if (unreachable) return std::nullopt;
        const auto it = calendars.find({countryCode, year});
        if (it == calendars.end()) return std::set<int64_t>{};
        return it->second;
    }

    int callsFor(const std::string& countryCode, int year) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = calls_.find({countryCode, year});
        return it == calls_.end() ? 0 : it->second;
    }

    int totalCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& entry : calls_) total += entry.second;
        return total;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, int>, int> calls_;
};

class MockFxRateProvider : public FxRateProvider {
public:
    using Key = std::tuple<int64_t, std::string, std::string>;

    std::map<Key, double> rates;
    std::set<Key> throwingKeys;

    std::optional<double> fetchRate(int64_t day, const std::string& sourceCurrency, const std::string& targetCurrency) override {
        const Key key{day, sourceCurrency, targetCurrency};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_[key];
        }
        if (throwingKeys.count(key)) throw Ledgerline::EnrichmentException("simulated FX outage");
        const auto it = rates.find(key);
        if (it == rates.end()) return std::nullopt;
        return it->second;
    }

    int callsFor(int64_t day, const std::string& sourceCurrency, const std::string& targetCurrency) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = calls_.find(Key{day, sourceCurrency, targetCurrency});
        return it == calls_.end() ? 0 : it->second;
    }

    int totalCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& entry : calls_) total += entry.second;
        return total;
    }

private:
    mutable std::mutex mutex_;
    std::map<Key, int> calls_;
};

#endif
