#include "ExternalEnrichment.h"
#include "CalendarUtils.h"
#include "CommonUtils.h"

#include <iostream>
#include <optional>
#include <set>

#ifdef USE_OPENMP
#include <omp.h>
#endif

ExternalEnrichment::ExternalEnrichment(std::shared_ptr<HolidayProvider> holidays, std::shared_ptr<FxRateProvider> fx)
    : holidays_(std::move(holidays)), fx_(std::move(fx)) {}

HolidayCalendar ExternalEnrichment::loadHolidays(const std::vector<HolidayCalendar::Key>& keys,
                                                 const EnrichmentConfig& config) const {
    std::vector<std::optional<std::set<int64_t>>> results(keys.size());
    std::vector<std::string> errors(keys.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic) num_threads(config.fetchWorkers)
    #endif
    for (long i = 0; i < static_cast<long>(keys.size()); ++i) {
        const size_t idx = static_cast<size_t>(i);
        try {
            results[idx] = holidays_->fetchHolidays(keys[idx].first, keys[idx].second);
        } catch (const std::exception& ex) {
            results[idx] = std::nullopt;
            errors[idx] = ex.what();
        }
    }

    HolidayCalendar calendar;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (!results[i] && config.verbose) {
            std::cout << "[Ledgerline][Warning] Holidays unavailable for " << keys[i].first << " " << keys[i].second
                      << (errors[i].empty() ? std::string() : ": " + errors[i]) << "\n";
        }
        calendar.store(keys[i].first, keys[i].second, std::move(results[i]));
    }
    return calendar;
}

FxRateTable ExternalEnrichment::loadRates(const std::vector<FxRateTable::Key>& keys,
                                          const EnrichmentConfig& config) const {
    std::vector<std::optional<double>> results(keys.size());
    std::vector<std::string> errors(keys.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic) num_threads(config.fetchWorkers)
    #endif
    for (long i = 0; i < static_cast<long>(keys.size()); ++i) {
        const size_t idx = static_cast<size_t>(i);
        try {
            results[idx] = fx_->fetchRate(keys[idx].day, keys[idx].source, keys[idx].target);
        } catch (const std::exception& ex) {
            results[idx] = std::nullopt;
            errors[idx] = ex.what();
        }
    }

    FxRateTable table;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (!results[i] && config.verbose) {
            std::cout << "[Ledgerline][Warning] No FX rate for " << keys[i].source << "->" << keys[i].target
                      << " on " << CalendarUtils::formatDate(keys[i].day)
                      << (errors[i].empty() ? std::string() : ": " + errors[i]) << "\n";
        }
        table.store(keys[i], results[i]);
    }
    return table;
}

void ExternalEnrichment::applyHolidays(TypedDataset& data, const EnrichmentConfig& config, EnrichmentReport& report) const {
    const size_t n = data.rowCount();
    const IntVec& dates = data.integers("transaction_date");
    const std::string& country = config.holidayCountry;

    std::set<HolidayCalendar::Key> distinct;
    for (size_t r = 0; r < n; ++r) {
        if (data.isMissing("transaction_date", r)) continue;
        distinct.insert({country, CalendarUtils::civilFromDays(dates[r]).year});
    }
    const std::vector<HolidayCalendar::Key> keys(distinct.begin(), distinct.end());

    HolidayCalendar calendar;
    if (holidays_) {
        calendar = loadHolidays(keys, config);
    } else {
        for (const auto& key : keys) calendar.store(key.first, key.second, std::nullopt);
    }

    std::vector<bool> holiday(n, false);
    for (size_t r = 0; r < n; ++r) {
        if (data.isMissing("transaction_date", r)) continue;
        holiday[r] = calendar.isHoliday(country, dates[r]);
        if (holiday[r]) ++report.holidayRows;
    }
    data.addBooleanColumn("is_public_holiday", holiday);

    report.holidaysApplied = true;
    report.holidayKeys = calendar.size();
    report.holidayKeysUnavailable = calendar.unavailableCount();
    if (report.holidayKeysUnavailable > 0) {
        std::cout << "[Ledgerline][Warning] Holiday calendar unavailable for " << report.holidayKeysUnavailable
                  << " of " << report.holidayKeys << " (country, year) keys; affected rows are marked non-holiday\n";
    }
}

void ExternalEnrichment::applyFx(TypedDataset& data, const EnrichmentConfig& config, EnrichmentReport& report) const {
    if (!data.hasColumn("currency")) {
        report.fxSkippedNoCurrency = true;
        std::cout << "[Ledgerline][Warning] FX enrichment enabled but the batch has no currency column; skipped\n";
        return;
    }

    std::vector<std::string> fields;
    for (const auto& field : config.fxAmountFields) {
        if (data.hasColumn(field) && data.column(field).type == ColumnType::NUMERIC) {
            fields.push_back(field);
        } else {
            report.fxMissingFields.push_back(field);
            std::cout << "[Ledgerline][Warning] FX amount field '" << field << "' is not a numeric column; skipped\n";
        }
    }

    const size_t n = data.rowCount();
    const std::string& target = config.fxTargetCurrency;
    const StrVec& currency = data.categorical("currency");
    const IntVec& dates = data.integers("transaction_date");

    std::vector<std::optional<FxRateTable::Key>> rowKeys(n);
    std::set<FxRateTable::Key> distinct;
    for (size_t r = 0; r < n; ++r) {
        if (data.isMissing("currency", r) || data.isMissing("transaction_date", r)) continue;
        const std::string source = CommonUtils::toUpper(currency[r]);
        if (source == target) continue;
        FxRateTable::Key key{dates[r], source, target};
        distinct.insert(key);
        rowKeys[r] = std::move(key);
    }
    const std::vector<FxRateTable::Key> keys(distinct.begin(), distinct.end());

    FxRateTable table;
    if (fx_) {
        table = loadRates(keys, config);
    } else {
        for (const auto& key : keys) table.store(key, std::nullopt);
    }

    NumVec rate(n, 0.0);
    MissingMask rateMissing(n, static_cast<uint8_t>(1));
    for (size_t r = 0; r < n; ++r) {
        if (data.isMissing("currency", r) || data.isMissing("transaction_date", r)) {
            ++report.fxRowsUnresolved;
            continue;
        }
        std::optional<double> resolved = rowKeys[r] ? table.rate(*rowKeys[r]) : std::optional<double>(1.0);
        if (!resolved) {
            ++report.fxRowsUnresolved;
            continue;
        }
        rate[r] = *resolved;
        rateMissing[r] = 0;
    }

    for (const auto& field : fields) {
        const NumVec& values = data.numeric(field);
        const MissingMask& valueMissing = data.missing(field);
        NumVec converted(n, 0.0);
        MissingMask convertedMissing(n, static_cast<uint8_t>(1));
        for (size_t r = 0; r < n; ++r) {
            if (rateMissing[r] || valueMissing[r]) continue;
            converted[r] = CommonUtils::roundToCents(values[r] * rate[r]);
            convertedMissing[r] = 0;
        }
        data.addNumericColumn(field + "_" + target, std::move(converted), std::move(convertedMissing));
    }
    data.addNumericColumn("fx_rate_" + target, std::move(rate), std::move(rateMissing));

    report.fxApplied = true;
    report.fxKeys = table.size();
    report.fxKeysUnavailable = table.unavailableCount();
    if (report.fxRowsUnresolved > 0) {
        std::cout << "[Ledgerline][Warning] " << report.fxRowsUnresolved << " rows have no " << target
                  << " rate; their converted amounts are null\n";
    }
}

EnrichmentReport ExternalEnrichment::run(TypedDataset& data, const EnrichmentConfig& config) const {
    EnrichmentReport report;
    if (config.enableHolidays) applyHolidays(data, config, report);
    if (config.enableFx) applyFx(data, config, report);

    std::cout << "[Ledgerline][Enrichment] holidays " << (report.holidaysApplied ? "on" : "off")
              << " (" << report.holidayKeys << " keys), fx " << (report.fxApplied ? "on" : "off")
              << " (" << report.fxKeys << " keys)\n";
    return report;
}
