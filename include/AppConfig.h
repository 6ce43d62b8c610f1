#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct NormalizerOptions {
    std::string dateLocaleHint = "auto";    // auto|dmy|mdy
    std::string numericLocaleHint = "auto"; // auto|us|eu
};

struct AnomalyConfig {
    // Strict greater-than cutoff on abs_amount.
    double largeAmountThreshold = 500.0;
    // Rules evaluated on top of the zscore and large_amount baseline, which always run.
    std::vector<std::string> rules;
    // category_rarity fires for categories with at most this many rows.
    size_t categoryRarityMaxRows = 1;
    double iqrMultiplier = 1.5;

    void validate() const;
};

struct RecurrenceConfig {
    std::vector<std::string> subscriptionKeywords = {
        "netflix", "spotify", "subscription", "suscripcion", "membership",
        "hulu", "disney", "prime video", "icloud", "patreon", "gym"
    };
    // Recurring when a group has strictly more rows than this.
    int minFrequency = 2;
    int duplicateWindowDays = 1;
    double duplicateAmountEpsilon = 0.01;

    void validate() const;
};

struct QualityConfig {
    double weightDate = 0.30;
    double weightAmount = 0.30;
    double weightCategory = 0.15;
    double weightDescription = 0.15;
    double weightId = 0.10;
    size_t minDescriptionLength = 3;

    void validate() const;
};

struct HttpConfig {
    std::string holidayHost = "https://date.nager.at";
    std::string fxHost = "https://api.frankfurter.app";
    int timeoutSeconds = 10;
    int retries = 2;
    int retryBackoffMs = 250;
};

struct EnrichmentConfig {
    bool enableHolidays = true;
    std::string holidayCountry = "US";
    bool enableFx = false;
    std::string fxTargetCurrency = "USD";
    std::vector<std::string> fxAmountFields = {"net_amount", "credit_amount", "debit_amount"};
    int fetchWorkers = 4;
    bool verbose = false;

    void validate() const;
};

struct AppConfig {
    std::string inputPath;
    std::string inputFormat = "auto";   // auto|csv|json
    char delimiter = ',';
    std::string outputPath = "enriched_transactions.csv";
    std::string outputFormat = "auto";  // auto|csv|parquet
    std::string categoryMapPath;
    bool verbose = false;

    NormalizerOptions normalizer;
    AnomalyConfig anomaly;
    RecurrenceConfig recurrence;
    QualityConfig quality;
    EnrichmentConfig enrichment;
    HttpConfig http;

    /**
     * @brief Builds config from CLI args. A `--config` file is loaded first and
     *        command-line flags override its values.
     * @pre argv[1] is the input path, or `--help`.
     * @post Returns a validated config object.
     * @throws Ledgerline::ConfigurationException on invalid arguments or values.
     */
    static AppConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Ledgerline::ConfigurationException on parse/validation failures.
     */
    static AppConfig fromFile(const std::string& configPath, const AppConfig& base);

    /**
     * @brief Applies a single normalized key (see usage()) to the config.
     * @throws Ledgerline::ConfigurationException on unknown keys or invalid values.
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws Ledgerline::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage();
};
