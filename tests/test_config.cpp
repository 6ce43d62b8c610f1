#include <catch2/catch.hpp>

#include "AppConfig.h"
#include "LedgerExceptions.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {
AppConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "ledgerline");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return AppConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

std::string writeTempFile(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}
} // namespace

TEST_CASE("Defaults match the documented configuration", "[config]") {
    const AppConfig config = parseArgs({"input.csv"});
    CHECK(config.inputPath == "input.csv");
    CHECK(config.anomaly.largeAmountThreshold == Approx(500.0));
    CHECK(config.anomaly.rules.empty());
    CHECK(config.recurrence.minFrequency == 2);
    CHECK(config.recurrence.duplicateWindowDays == 1);
    CHECK(config.quality.minDescriptionLength == 3u);
    CHECK(config.enrichment.enableHolidays);
    CHECK(config.enrichment.holidayCountry == "US");
    CHECK_FALSE(config.enrichment.enableFx);
    CHECK(config.enrichment.fxTargetCurrency == "USD");
    CHECK(config.http.retries == 2);
}

TEST_CASE("Command-line flags set typed values", "[config]") {
    const AppConfig config = parseArgs({"input.json", "--output", "out.csv", "--enable-fx", "true",
                                        "--fx-target-currency", "eur", "--anomaly-rules", "zscore, iqr",
                                        "--duplicate-window-days", "0", "--delimiter", ";"});
    CHECK(config.outputPath == "out.csv");
    CHECK(config.enrichment.enableFx);
    CHECK(config.enrichment.fxTargetCurrency == "EUR");
    CHECK(config.anomaly.rules == std::vector<std::string>({"zscore", "iqr"}));
    CHECK(config.recurrence.duplicateWindowDays == 0);
    CHECK(config.delimiter == ';');
}

TEST_CASE("Config file values are overridden by command-line flags", "[config]") {
    const std::string path = writeTempFile("ledgerline_test_config.yaml",
                                           "# enrichment settings\n"
                                           "holiday_country: \"DE\"\n"
                                           "large-amount-threshold: 750\n"
                                           "{\"verbose\": \"true\",\n"
                                           "\"recurring_min_frequency\": 4}\n");
    const AppConfig config = parseArgs({"input.csv", "--config", path, "--large-amount-threshold", "1000"});
    CHECK(config.enrichment.holidayCountry == "DE");
    CHECK(config.anomaly.largeAmountThreshold == Approx(1000.0));
    CHECK(config.verbose);
    CHECK(config.recurrence.minFrequency == 4);
}

TEST_CASE("Invalid configuration is rejected", "[config]") {
    CHECK_THROWS_AS(parseArgs({}), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(parseArgs({"input.csv", "--unknown-key", "1"}), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(parseArgs({"input.csv", "--outlier-z-threshold", "2"}), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(parseArgs({"input.csv", "--enable-holidays", "maybe"}), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(parseArgs({"input.csv", "--date-locale-hint", "ymd"}), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(parseArgs({"input.csv", "--holiday-country", "USA"}), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(parseArgs({"input.csv", "--quality-weight-date", "1.5"}), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(parseArgs({"input.csv", "--output"}), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(AppConfig::fromFile("/nonexistent/ledgerline.yaml", AppConfig{}), Ledgerline::ConfigurationException);
}

TEST_CASE("Anomaly rule names are checked when the configuration is validated", "[config]") {
    CHECK_THROWS_AS(parseArgs({"input.csv", "--anomaly-rules", "zscore,isolation_forest"}),
                    Ledgerline::ConfigurationException);
    CHECK_NOTHROW(parseArgs({"input.csv", "--anomaly-rules", "Category_Rarity, iqr"}));

    AnomalyConfig anomaly;
    anomaly.rules = {"iqr", "nope"};
    CHECK_THROWS_AS(anomaly.validate(), Ledgerline::ConfigurationException);
    anomaly.rules.clear();
    CHECK_NOTHROW(anomaly.validate());
}
