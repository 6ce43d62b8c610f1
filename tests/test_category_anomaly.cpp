#include <catch2/catch.hpp>

#include "AnomalyDetector.h"
#include "CategoryProfiler.h"
#include "LedgerExceptions.h"
#include "Normalizer.h"
#include "TestBatches.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace {
struct ProfiledBatch {
    TypedDataset data;
    CategoryProfileMap profiles;
};

ProfiledBatch profile(std::vector<std::vector<std::string>> rows) {
    ProfiledBatch out{Normalizer::run(makeTransactions(std::move(rows)), NormalizerOptions{}).data, {}};
    out.profiles = CategoryProfiler::run(out.data, CategoryLookup::builtin());
    return out;
}

std::vector<std::vector<std::string>> debitsInCategory(const std::string& category, const std::vector<std::string>& debits) {
    std::vector<std::vector<std::string>> rows;
    for (size_t i = 0; i < debits.size(); ++i) {
        rows.push_back({"T" + std::to_string(i), "2024-02-01", "Purchase " + std::to_string(i), category, "", debits[i]});
    }
    return rows;
}
} // namespace

TEST_CASE("Built-in lookup knows the card export categories", "[category]") {
    const CategoryLookup lookup = CategoryLookup::builtin();
    CHECK(lookup.size() == 17);

    const CategoryMetadata& health = lookup.lookup("Health Care");
    CHECK(health.type == "healthcare");
    CHECK(health.taxDeductible);
    CHECK(health.priority == 1);

    CHECK(lookup.lookup("Dining").type == "food_beverage");
    CHECK(lookup.lookup("taxi").taxDeductible);
    CHECK_FALSE(lookup.contains("dining"));

    const CategoryMetadata& missing = lookup.lookup("Space Travel");
    CHECK(missing.type == "unknown");
    CHECK_FALSE(missing.taxDeductible);
    CHECK(missing.priority == 3);
    CHECK(CategoryLookup::priorityLabel(1) == "high");
    CHECK(CategoryLookup::priorityLabel(2) == "medium");
    CHECK(CategoryLookup::priorityLabel(3) == "low");
}

TEST_CASE("Category map files extend the built-in lookup", "[category]") {
    const auto path = (std::filesystem::temp_directory_path() / "ledgerline_category_map.csv").string();
    {
        std::ofstream out(path);
        out << "category,type,tax_deductible,priority\n"
            << "Groceries,food_beverage,no,medium\n"
            << "\"Office, Supplies\",business,yes,1\n";
    }
    const CategoryLookup lookup = CategoryLookup::fromFile(path, CategoryLookup::builtin());
    CHECK(lookup.size() == 19);
    CHECK(lookup.lookup("Groceries").priority == 2);
    CHECK(lookup.lookup("Office, Supplies").taxDeductible);
    CHECK(lookup.lookup("Office, Supplies").type == "business");

    {
        std::ofstream out(path);
        out << "Groceries,food_beverage,no,urgent\n";
    }
    CHECK_THROWS_AS(CategoryLookup::fromFile(path, CategoryLookup::builtin()), Ledgerline::ConfigurationException);
    CHECK_THROWS_AS(CategoryLookup::fromFile("/nonexistent/categories.csv", CategoryLookup{}), Ledgerline::IOException);
}

TEST_CASE("Category profiling joins metadata and population statistics", "[category]") {
    ProfiledBatch batch = profile({
        {"T1", "2024-02-01", "Dinner", "Dining", "", "10"},
        {"T2", "2024-02-02", "Lunch", "Dining", "", "20"},
        {"T3", "2024-02-03", "Brunch", "Dining", "", "30"},
        {"T4", "2024-02-04", "Card fee", "Fee/Interest Charge", "", "5"},
        {"T5", "2024-02-05", "Mystery", "Space Travel", "", "80"},
        {"T6", "2024-02-06", "Thank you", "Payment/Credit", "250", ""},
        {"T7", "2024-02-07", "No category", "", "", "15"}
    });
    const TypedDataset& data = batch.data;

    const CategoryProfile& dining = batch.profiles.at("Dining");
    CHECK(dining.known);
    CHECK(dining.rowCount == 3);
    CHECK(dining.meanNet == Approx(-20.0));
    CHECK(dining.stdNet == Approx(std::sqrt(200.0 / 3.0)));
    CHECK(batch.profiles.at("Fee/Interest Charge").stdNet == Approx(0.0));
    CHECK_FALSE(batch.profiles.at("Space Travel").known);
    CHECK(batch.profiles.count("") == 1);

    CHECK(data.categorical("category_type")[0] == "food_beverage");
    CHECK(data.integers("category_priority")[0] == 3);
    CHECK(data.categorical("category_priority_label")[0] == "low");
    CHECK(data.integers("cat_row_count")[0] == 3);
    CHECK(data.numeric("cat_net_mean")[1] == Approx(-20.0));
    CHECK(data.integers("is_discretionary")[0] == 1);

    CHECK(data.integers("is_fee_transaction")[3] == 1);
    CHECK(data.categorical("category_type")[4] == "unknown");
    CHECK(data.integers("category_tax_deductible")[4] == 0);
    CHECK(data.integers("category_priority")[4] == 3);

    CHECK(data.integers("is_payment_transaction")[5] == 1);
    CHECK(data.integers("is_refund")[5] == 0);
    CHECK(data.categorical("category_type")[6] == "unknown");
}

TEST_CASE("Z-scores are computed against the category baseline", "[anomaly]") {
    ProfiledBatch batch = profile({
        {"T1", "2024-02-01", "Dinner", "Dining", "", "10"},
        {"T2", "2024-02-02", "Lunch", "Dining", "", "20"},
        {"T3", "2024-02-03", "Brunch", "Dining", "", "30"},
        {"T4", "2024-02-04", "Card fee", "Fee/Interest Charge", "", "5"},
        {"T5", "2024-02-05", "Broken", "Dining", "", "abc"}
    });
    AnomalyDetector::run(batch.data, batch.profiles, AnomalyConfig{});
    const TypedDataset& data = batch.data;

    const double stddev = std::sqrt(200.0 / 3.0);
    const auto& z = data.numeric("cat_net_zscore");
    CHECK(z[0] == Approx(10.0 / stddev));
    CHECK(z[1] == Approx(0.0).margin(1e-12));
    CHECK(z[2] == Approx(-10.0 / stddev));
    CHECK(z[3] == Approx(0.0));
    CHECK_FALSE(data.isMissing("cat_net_zscore", 3));
    CHECK(data.isMissing("cat_net_zscore", 4));
    CHECK(data.integers("is_outlier")[4] == 0);
    CHECK(data.isMissing("transaction_size", 4));
}

TEST_CASE("A single extreme debit in a category is an outlier", "[anomaly]") {
    ProfiledBatch batch = profile(debitsInCategory("Merchandise", {
        "100", "102", "98", "5000", "99", "101", "100", "100", "99", "101", "100", "100", "100"
    }));
    const AnomalyReport report = AnomalyDetector::run(batch.data, batch.profiles, AnomalyConfig{});
    const TypedDataset& data = batch.data;

    const auto& outlier = data.integers("is_outlier");
    const auto& large = data.integers("is_large_transaction");
    for (size_t r = 0; r < data.rowCount(); ++r) {
        INFO("row " << r);
        CHECK(outlier[r] == (r == 3 ? 1 : 0));
        CHECK(large[r] == (r == 3 ? 1 : 0));
        CHECK(data.integers("is_anomaly")[r] == (r == 3 ? 1 : 0));
    }
    CHECK(data.numeric("cat_net_zscore")[3] < -3.0);
    CHECK(data.categorical("anomaly_reasons")[3] == "zscore|large_amount");
    CHECK(data.isMissing("anomaly_reasons", 0));
    CHECK(data.categorical("transaction_size")[3] == "very_large");
    CHECK(data.categorical("transaction_size")[0] == "medium");
    CHECK(report.outliers == 1);
    CHECK(report.largeTransactions == 1);
    CHECK(report.anomalies == 1);
}

TEST_CASE("Large transactions use a strict threshold", "[anomaly]") {
    ProfiledBatch batch = profile({
        {"T1", "2024-02-01", "Laptop", "Merchandise", "", "500.00"},
        {"T2", "2024-02-02", "Laptop", "Merchandise", "", "500.01"},
        {"T3", "2024-02-03", "Salary", "Other", "2000", ""}
    });
    AnomalyDetector::run(batch.data, batch.profiles, AnomalyConfig{});
    const auto& large = batch.data.integers("is_large_transaction");
    CHECK(large[0] == 0);
    CHECK(large[1] == 1);
    CHECK(large[2] == 1);
    CHECK(batch.data.categorical("transaction_size")[0] == "large");
}

TEST_CASE("Extra anomaly rules add to the baseline rules", "[anomaly]") {
    ProfiledBatch batch = profile({
        {"T1", "2024-02-01", "Dinner", "Dining", "", "10"},
        {"T2", "2024-02-02", "Lunch", "Dining", "", "11"},
        {"T3", "2024-02-03", "Brunch", "Dining", "", "12"},
        {"T4", "2024-02-04", "Dinner", "Dining", "", "10"},
        {"T5", "2024-02-05", "Lunch", "Dining", "", "11"},
        {"T6", "2024-02-06", "Flight", "Other Travel", "", "300"}
    });

    AnomalyConfig config;
    config.rules = {"large_amount", "category_rarity", "iqr", "iqr"};
    const AnomalyReport report = AnomalyDetector::run(batch.data, batch.profiles, config);
    const TypedDataset& data = batch.data;

    CHECK(data.integers("is_anomaly")[5] == 1);
    CHECK(data.categorical("anomaly_reasons")[5] == "category_rarity|iqr");
    for (size_t r = 0; r < 5; ++r) {
        INFO("row " << r);
        CHECK(data.integers("is_anomaly")[r] == 0);
    }
    CHECK(report.ruleHits.at("iqr") == 1);
    CHECK(report.ruleHits.at("category_rarity") == 1);
    CHECK(report.ruleHits.at("large_amount") == 0);
    CHECK(report.ruleHits.at("zscore") == 0);
    CHECK(report.ruleHits.size() == 4);
}

TEST_CASE("Outliers and large transactions stay anomalies whatever extra rules are configured", "[anomaly]") {
    ProfiledBatch batch = profile(debitsInCategory("Merchandise", {
        "100", "102", "98", "5000", "99", "101", "100", "100", "99", "101", "100", "100", "100"
    }));
    AnomalyConfig config;
    config.rules = {"category_rarity"};
    const AnomalyReport report = AnomalyDetector::run(batch.data, batch.profiles, config);
    const TypedDataset& data = batch.data;

    const auto& outlier = data.integers("is_outlier");
    const auto& large = data.integers("is_large_transaction");
    const auto& anomaly = data.integers("is_anomaly");
    for (size_t r = 0; r < data.rowCount(); ++r) {
        INFO("row " << r);
        CHECK(anomaly[r] >= std::max(outlier[r], large[r]));
    }
    CHECK(outlier[3] == 1);
    CHECK(anomaly[3] == 1);
    CHECK(data.categorical("anomaly_reasons")[3] == "zscore|large_amount");
    CHECK(report.ruleHits.at("category_rarity") == 0);
    CHECK(report.anomalies == 1);
}

TEST_CASE("Rule factory rejects unknown names", "[anomaly]") {
    CHECK(AnomalyDetector::makeRule("ZScore")->name() == "zscore");
    CHECK(AnomalyDetector::makeRule(" iqr ")->name() == "iqr");
    CHECK_THROWS_AS(AnomalyDetector::makeRule("isolation_forest"), Ledgerline::ConfigurationException);

    AnomalyConfig config;
    config.rules = {"zscore", "nope"};
    ProfiledBatch batch = profile({{"T1", "2024-02-01", "Dinner", "Dining", "", "10"}});
    CHECK_THROWS_AS(AnomalyDetector::run(batch.data, batch.profiles, config), Ledgerline::ConfigurationException);
}

TEST_CASE("Size buckets follow the absolute amount", "[anomaly]") {
    CHECK(AnomalyDetector::sizeBucket(0.0) == "micro");
    CHECK(AnomalyDetector::sizeBucket(9.99) == "micro");
    CHECK(AnomalyDetector::sizeBucket(10.0) == "small");
    CHECK(AnomalyDetector::sizeBucket(49.99) == "small");
    CHECK(AnomalyDetector::sizeBucket(50.0) == "medium");
    CHECK(AnomalyDetector::sizeBucket(200.0) == "large");
    CHECK(AnomalyDetector::sizeBucket(1000.0) == "very_large");
}
