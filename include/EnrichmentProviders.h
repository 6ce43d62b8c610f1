#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>

/**
 * @brief Public-holiday lookup: (country, year) -> set of holiday day numbers.
 * @details Implementations signal failure by returning std::nullopt or by
 *          throwing; callers treat both as "unavailable". Calls may arrive
 *          concurrently from several threads.
 */
class HolidayProvider {
public:
    virtual ~HolidayProvider() = default;
    virtual std::optional<std::set<int64_t>> fetchHolidays(const std::string& countryCode, int year) = 0;
};

/**
 * @brief Point-in-time FX lookup: (day, source, target) -> rate, where
 *        amount_in_target = amount_in_source * rate.
 */
class FxRateProvider {
public:
    virtual ~FxRateProvider() = default;
    virtual std::optional<double> fetchRate(int64_t day, const std::string& sourceCurrency, const std::string& targetCurrency) = 0;
};
