#pragma once
#include "AppConfig.h"
#include "EnrichmentProviders.h"
#include <optional>
#include <string>

/**
 * @brief Nager.Date public holiday API (`/api/v3/PublicHolidays/{year}/{country}`).
 */
class NagerHolidayProvider : public HolidayProvider {
public:
    explicit NagerHolidayProvider(HttpConfig config);
    std::optional<std::set<int64_t>> fetchHolidays(const std::string& countryCode, int year) override;

    /**
     * @throws Ledgerline::EnrichmentException on malformed JSON.
     */
    static std::set<int64_t> parseHolidays(const std::string& body);

private:
    HttpConfig config_;
};

/**
 * @brief Frankfurter FX API (`/{date}?from={SRC}&to={TGT}`).
 */
class FrankfurterFxProvider : public FxRateProvider {
public:
    explicit FrankfurterFxProvider(HttpConfig config);
    std::optional<double> fetchRate(int64_t day, const std::string& sourceCurrency, const std::string& targetCurrency) override;

    /**
     * @throws Ledgerline::EnrichmentException on malformed JSON.
     */
    static std::optional<double> parseRate(const std::string& body, const std::string& targetCurrency);

private:
    HttpConfig config_;
};

/**
 * @brief GET with bounded retry and linear backoff. Returns the body of a 200
 *        response, std::nullopt when the resource does not exist or every
 *        attempt failed.
 */
std::optional<std::string> httpGetWithRetry(const std::string& host, const std::string& path, const HttpConfig& config);
