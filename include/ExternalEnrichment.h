#pragma once
#include "AppConfig.h"
#include "EnrichmentCache.h"
#include "EnrichmentProviders.h"
#include "TypedDataset.h"
#include <memory>
#include <string>
#include <vector>

struct EnrichmentReport {
    bool holidaysApplied = false;
    size_t holidayKeys = 0;
    size_t holidayKeysUnavailable = 0;
    size_t holidayRows = 0;

    bool fxApplied = false;
    bool fxSkippedNoCurrency = false;
    size_t fxKeys = 0;
    size_t fxKeysUnavailable = 0;
    size_t fxRowsUnresolved = 0;
    std::vector<std::string> fxMissingFields;
};

/**
 * @brief Stage 7: holiday flags and currency-normalized amounts from external
 *        lookups. Every lookup failure degrades only the rows of that key.
 * @details Distinct keys are fetched once each, possibly concurrently; the
 *          cache is filled by the calling thread after all fetches finish.
 */
class ExternalEnrichment {
public:
    ExternalEnrichment(std::shared_ptr<HolidayProvider> holidays, std::shared_ptr<FxRateProvider> fx);

    EnrichmentReport run(TypedDataset& data, const EnrichmentConfig& config) const;

private:
    HolidayCalendar loadHolidays(const std::vector<HolidayCalendar::Key>& keys, const EnrichmentConfig& config) const;
    FxRateTable loadRates(const std::vector<FxRateTable::Key>& keys, const EnrichmentConfig& config) const;

    void applyHolidays(TypedDataset& data, const EnrichmentConfig& config, EnrichmentReport& report) const;
    void applyFx(TypedDataset& data, const EnrichmentConfig& config, EnrichmentReport& report) const;

    std::shared_ptr<HolidayProvider> holidays_;
    std::shared_ptr<FxRateProvider> fx_;
};
