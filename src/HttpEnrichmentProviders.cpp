#include "HttpEnrichmentProviders.h"
#include "CalendarUtils.h"
#include "LedgerExceptions.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <thread>

using json = nlohmann::json;

std::optional<std::string> httpGetWithRetry(const std::string& host, const std::string& path, const HttpConfig& config) {
    httplib::Client cli(host);
    cli.set_connection_timeout(config.timeoutSeconds, 0);
    cli.set_read_timeout(config.timeoutSeconds, 0);
    cli.set_follow_location(true);

    const int attempts = config.retries + 1;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto res = cli.Get(path.c_str());
        if (res && res->status == 200) return res->body;

        if (res) {
            // 4xx means the key itself is unsupported; retrying will not help.
            if (res->status >= 400 && res->status < 500) {
                std::cerr << "[Ledgerline][HTTP] " << host << path << " returned " << res->status << "\n";
                return std::nullopt;
            }
            std::cerr << "[Ledgerline][HTTP] " << host << path << " returned " << res->status
                      << " (attempt " << attempt << "/" << attempts << ")\n";
        } else {
            std::cerr << "[Ledgerline][HTTP] " << host << path << " connection failed: "
                      << httplib::to_string(res.error()) << " (attempt " << attempt << "/" << attempts << ")\n";
        }
        if (attempt < attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int64_t>(config.retryBackoffMs) * attempt));
        }
    }
    return std::nullopt;
}

NagerHolidayProvider::NagerHolidayProvider(HttpConfig config) : config_(std::move(config)) {}

std::optional<std::set<int64_t>> NagerHolidayProvider::fetchHolidays(const std::string& countryCode, int year) {
    const std::string path = "/api/v3/PublicHolidays/" + std::to_string(year) + "/" + countryCode;
    const auto body = httpGetWithRetry(config_.holidayHost, path, config_);
    if (!body) return std::nullopt;
    return parseHolidays(*body);
}

std::set<int64_t> NagerHolidayProvider::parseHolidays(const std::string& body) {
    std::set<int64_t> days;
    try {
        const json doc = json::parse(body);
        if (!doc.is_array()) throw Ledgerline::EnrichmentException("holiday response is not an array");
        for (const auto& entry : doc) {
            if (!entry.is_object() || !entry.contains("date") || !entry["date"].is_string()) continue;
            int64_t day = 0;
            if (CalendarUtils::parseIsoDate(entry["date"].get<std::string>(), day)) days.insert(day);
        }
    } catch (const json::exception& ex) {
        throw Ledgerline::EnrichmentException(std::string("holiday response parse error: ") + ex.what());
    }
    return days;
}

FrankfurterFxProvider::FrankfurterFxProvider(HttpConfig config) : config_(std::move(config)) {}

std::optional<double> FrankfurterFxProvider::fetchRate(int64_t day, const std::string& sourceCurrency, const std::string& targetCurrency) {
    const std::string path = "/" + CalendarUtils::formatDate(day) + "?from=" + sourceCurrency + "&to=" + targetCurrency;
    const auto body = httpGetWithRetry(config_.fxHost, path, config_);
    if (!body) return std::nullopt;
    return parseRate(*body, targetCurrency);
}

std::optional<double> FrankfurterFxProvider::parseRate(const std::string& body, const std::string& targetCurrency) {
    try {
        const json doc = json::parse(body);
        if (!doc.is_object() || !doc.contains("rates") || !doc["rates"].is_object()) {
            throw Ledgerline::EnrichmentException("FX response has no rates object");
        }
        const json& rates = doc["rates"];
        if (!rates.contains(targetCurrency) || !rates[targetCurrency].is_number()) return std::nullopt;
        const double rate = rates[targetCurrency].get<double>();
        if (!(rate > 0.0)) return std::nullopt;
        return rate;
    } catch (const json::exception& ex) {
        throw Ledgerline::EnrichmentException(std::string("FX response parse error: ") + ex.what());
    }
}
