#include "AppConfig.h"
#include "AnomalyDetector.h"
#include "CommonUtils.h"
#include "LedgerExceptions.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Ledgerline::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Ledgerline::LedgerException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Ledgerline::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const int parsed = parseNumericStrict<int>(
        CommonUtils::trim(value),
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Ledgerline::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        CommonUtils::trim(value),
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Ledgerline::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Ledgerline::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

// Drops JSON braces and a trailing comma so `"key": "value",` lines parse like YAML.
std::string stripStructuralTokens(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t last = out.find_last_not_of(" \t\r\n");
    if (last != std::string::npos && out[last] == ',') out.erase(last, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        else if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

bool isIn(const std::string& value, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

std::string upperAlphaCode(const std::string& value, const std::string& key) {
    std::string code = CommonUtils::toUpper(CommonUtils::trim(value));
    const bool alpha = std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
    if (code.empty() || !alpha) {
        throw Ledgerline::ConfigurationException(key + " must be an alphabetic code: " + value);
    }
    return code;
}
} // namespace

void AppConfig::set(const std::string& rawKey, const std::string& value) {
    const std::string key = normalizeConfigKey(rawKey);

    if (key == "delimiter") {
        const std::string v = (value == "\\t" || CommonUtils::toLower(value) == "tab") ? "\t" : value;
        if (v.size() != 1) throw Ledgerline::ConfigurationException("delimiter expects a single character");
        delimiter = v[0];
        return;
    }
    if (key == "anomaly_rules") {
        anomaly.rules.clear();
        for (const auto& rule : CommonUtils::splitList(value)) anomaly.rules.push_back(CommonUtils::toLower(rule));
        return;
    }
    if (key == "subscription_keywords") {
        recurrence.subscriptionKeywords.clear();
        for (const auto& word : CommonUtils::splitList(value)) {
            recurrence.subscriptionKeywords.push_back(CommonUtils::toLower(word));
        }
        return;
    }
    if (key == "fx_amount_fields") {
        enrichment.fxAmountFields = CommonUtils::splitList(value);
        return;
    }
    if (key == "holiday_country") {
        enrichment.holidayCountry = upperAlphaCode(value, key);
        return;
    }
    if (key == "fx_target_currency") {
        enrichment.fxTargetCurrency = upperAlphaCode(value, key);
        return;
    }
    if (key == "category_rarity_max_rows") {
        anomaly.categoryRarityMaxRows = static_cast<size_t>(parseIntStrict(value, key, 1));
        return;
    }
    if (key == "min_description_length") {
        quality.minDescriptionLength = static_cast<size_t>(parseIntStrict(value, key, 0));
        return;
    }
    if (key == "verbose") {
        verbose = parseBoolStrict(value, key);
        enrichment.verbose = verbose;
        return;
    }

    static const std::unordered_map<std::string, std::string AppConfig::*> rawStringFields = {
        {"input", &AppConfig::inputPath},
        {"output", &AppConfig::outputPath},
        {"category_map", &AppConfig::categoryMapPath}
    };
    static const std::unordered_map<std::string, std::string AppConfig::*> lowerStringFields = {
        {"input_format", &AppConfig::inputFormat},
        {"output_format", &AppConfig::outputFormat}
    };
    static const std::unordered_map<std::string, std::string NormalizerOptions::*> normalizerFields = {
        {"date_locale_hint", &NormalizerOptions::dateLocaleHint},
        {"numeric_locale_hint", &NormalizerOptions::numericLocaleHint}
    };

    struct AnomalyDoubleRule {
        double AnomalyConfig::*member;
        double minValue;
    };
    struct RecurrenceIntRule {
        int RecurrenceConfig::*member;
        int minValue;
    };
    struct QualityDoubleRule {
        double QualityConfig::*member;
    };
    struct HttpIntRule {
        int HttpConfig::*member;
        int minValue;
    };

    static const std::unordered_map<std::string, AnomalyDoubleRule> anomalyDoubleFields = {
        {"large_amount_threshold", {&AnomalyConfig::largeAmountThreshold, 0.0}},
        {"iqr_multiplier", {&AnomalyConfig::iqrMultiplier, 0.0}}
    };
    static const std::unordered_map<std::string, RecurrenceIntRule> recurrenceIntFields = {
        {"recurring_min_frequency", {&RecurrenceConfig::minFrequency, 1}},
        {"duplicate_window_days", {&RecurrenceConfig::duplicateWindowDays, 0}}
    };
    static const std::unordered_map<std::string, QualityDoubleRule> qualityDoubleFields = {
        {"quality_weight_date", {&QualityConfig::weightDate}},
        {"quality_weight_amount", {&QualityConfig::weightAmount}},
        {"quality_weight_category", {&QualityConfig::weightCategory}},
        {"quality_weight_description", {&QualityConfig::weightDescription}},
        {"quality_weight_id", {&QualityConfig::weightId}}
    };
    static const std::unordered_map<std::string, bool EnrichmentConfig::*> enrichmentBoolFields = {
        {"enable_holidays", &EnrichmentConfig::enableHolidays},
        {"enable_fx", &EnrichmentConfig::enableFx}
    };
    static const std::unordered_map<std::string, HttpIntRule> httpIntFields = {
        {"http_timeout_seconds", {&HttpConfig::timeoutSeconds, 1}},
        {"http_retries", {&HttpConfig::retries, 0}},
        {"http_retry_backoff_ms", {&HttpConfig::retryBackoffMs, 0}}
    };

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        this->*(it->second) = CommonUtils::trim(value);
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        this->*(it->second) = CommonUtils::toLower(CommonUtils::trim(value));
        return;
    }
    if (const auto it = normalizerFields.find(key); it != normalizerFields.end()) {
        normalizer.*(it->second) = CommonUtils::toLower(CommonUtils::trim(value));
        return;
    }
    if (const auto it = anomalyDoubleFields.find(key); it != anomalyDoubleFields.end()) {
        anomaly.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = recurrenceIntFields.find(key); it != recurrenceIntFields.end()) {
        recurrence.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }
    if (key == "duplicate_amount_epsilon") {
        recurrence.duplicateAmountEpsilon = parseDoubleStrict(value, key, 0.0);
        return;
    }
    if (const auto it = qualityDoubleFields.find(key); it != qualityDoubleFields.end()) {
        quality.*(it->second.member) = parseDoubleStrict(value, key, 0.0);
        return;
    }
    if (const auto it = enrichmentBoolFields.find(key); it != enrichmentBoolFields.end()) {
        enrichment.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (key == "fetch_workers") {
        enrichment.fetchWorkers = parseIntStrict(value, key, 1);
        return;
    }
    if (const auto it = httpIntFields.find(key); it != httpIntFields.end()) {
        http.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }

    throw Ledgerline::ConfigurationException("Unknown configuration key: " + rawKey);
}

AppConfig AppConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Ledgerline::ConfigurationException("Usage: " + usage());
    }

    std::string configPath;
    for (int i = 2; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") configPath = argv[i + 1];
    }

    AppConfig config;
    if (!configPath.empty()) config = fromFile(configPath, config);
    config.inputPath = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.size() <= 2) {
            throw Ledgerline::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Ledgerline::ConfigurationException("Missing value for " + arg);
        }
        const std::string value = argv[++i];
        if (arg == "--config") continue;
        config.set(arg.substr(2), value);
    }

    config.validate();
    return config;
}

AppConfig AppConfig::fromFile(const std::string& configPath, const AppConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Ledgerline::ConfigurationException("Could not open config file: " + configPath);

    AppConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokens(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            config.set(key, value);
        } catch (const Ledgerline::LedgerException& ex) {
            throw Ledgerline::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void AnomalyConfig::validate() const {
    if (iqrMultiplier <= 0.0) {
        throw Ledgerline::ConfigurationException("iqr_multiplier must be > 0");
    }
    for (const auto& name : rules) AnomalyDetector::makeRule(name);
}

void RecurrenceConfig::validate() const {
    if (minFrequency < 1) {
        throw Ledgerline::ConfigurationException("recurring_min_frequency must be >= 1");
    }
    if (duplicateWindowDays < 0) {
        throw Ledgerline::ConfigurationException("duplicate_window_days must be >= 0");
    }
    if (duplicateAmountEpsilon < 0.0) {
        throw Ledgerline::ConfigurationException("duplicate_amount_epsilon must be >= 0");
    }
}

void QualityConfig::validate() const {
    const double weights[] = {weightDate, weightAmount, weightCategory, weightDescription, weightId};
    double total = 0.0;
    for (double w : weights) {
        if (w < 0.0 || w > 1.0) {
            throw Ledgerline::ConfigurationException("quality weights must be within [0,1]");
        }
        total += w;
    }
    if (total <= 0.0) {
        throw Ledgerline::ConfigurationException("at least one quality weight must be > 0");
    }
}

void EnrichmentConfig::validate() const {
    if (enableHolidays && holidayCountry.size() != 2) {
        throw Ledgerline::ConfigurationException("holiday_country must be a two-letter country code");
    }
    if (enableFx && fxTargetCurrency.size() != 3) {
        throw Ledgerline::ConfigurationException("fx_target_currency must be a three-letter currency code");
    }
    if (enableFx && fxAmountFields.empty()) {
        throw Ledgerline::ConfigurationException("fx_amount_fields must name at least one column");
    }
    if (fetchWorkers < 1) {
        throw Ledgerline::ConfigurationException("fetch_workers must be >= 1");
    }
}

void AppConfig::validate() const {
    if (inputPath.empty()) {
        throw Ledgerline::ConfigurationException("input path is required");
    }
    if (outputPath.empty()) {
        throw Ledgerline::ConfigurationException("output path is required");
    }
    if (!isIn(inputFormat, {"auto", "csv", "json"})) {
        throw Ledgerline::ConfigurationException("input_format must be one of: auto, csv, json");
    }
    if (!isIn(outputFormat, {"auto", "csv", "parquet"})) {
        throw Ledgerline::ConfigurationException("output_format must be one of: auto, csv, parquet");
    }
    if (!isIn(normalizer.dateLocaleHint, {"auto", "dmy", "mdy"})) {
        throw Ledgerline::ConfigurationException("date_locale_hint must be one of: auto, dmy, mdy");
    }
    if (!isIn(normalizer.numericLocaleHint, {"auto", "us", "eu"})) {
        throw Ledgerline::ConfigurationException("numeric_locale_hint must be one of: auto, us, eu");
    }
    if (delimiter == '\n' || delimiter == '\r' || delimiter == '"') {
        throw Ledgerline::ConfigurationException("delimiter cannot be a quote or line break");
    }

    anomaly.validate();
    recurrence.validate();
    quality.validate();
    enrichment.validate();
}

std::string AppConfig::usage() {
    return "ledgerline <transactions.csv|json> [--config path] [--output path] "
           "[--input-format auto|csv|json] [--output-format auto|csv|parquet] [--delimiter ,] "
           "[--date-locale-hint auto|dmy|mdy] [--numeric-locale-hint auto|us|eu] [--category-map path] "
           "[--large-amount-threshold N] "
           "[--anomaly-rules category_rarity,iqr] [--category-rarity-max-rows N] "
           "[--iqr-multiplier N] [--subscription-keywords a,b,c] [--recurring-min-frequency N] "
           "[--duplicate-window-days N] [--duplicate-amount-epsilon N] [--min-description-length N] "
           "[--quality-weight-date|amount|category|description|id 0..1] "
           "[--enable-holidays true|false] [--holiday-country CC] [--enable-fx true|false] "
           "[--fx-target-currency CUR] [--fx-amount-fields a,b] [--fetch-workers N] "
           "[--http-timeout-seconds N] [--http-retries N] [--http-retry-backoff-ms N] [--verbose true|false]";
}
