#include <catch2/catch.hpp>

#include "DataQualityScorer.h"
#include "Normalizer.h"
#include "TestBatches.h"

namespace {
TypedDataset score(std::vector<std::vector<std::string>> rows, const QualityConfig& config, QualityReport* report = nullptr) {
    TypedDataset data = Normalizer::run(makeTransactions(std::move(rows)), NormalizerOptions{}).data;
    const QualityReport result = DataQualityScorer::run(data, config);
    if (report) *report = result;
    return data;
}
} // namespace

TEST_CASE("Quality score penalizes missing fields by weight", "[quality]") {
    QualityReport report;
    const TypedDataset data = score({
        {"T1", "2024-01-01", "Coffee", "Dining", "", "4"},
        {"T2", "", "Coffee", "Dining", "", ""},
        {"T3", "2024-01-01", "ab", "Dining", "", "4"},
        {"", "", "", "", "", ""},
        {"", "2024-01-01", "Coffee", "", "", "4"}
    }, QualityConfig{}, &report);

    const auto& s = data.numeric("data_quality_score");
    CHECK(s[0] == Approx(1.0));
    CHECK(s[1] == Approx(0.4));
    CHECK(s[2] == Approx(0.85));
    CHECK(s[3] == Approx(0.0));
    CHECK(s[4] == Approx(0.75));
    CHECK(s[1] < s[2]);

    for (size_t r = 0; r < data.rowCount(); ++r) {
        CHECK(s[r] >= 0.0);
        CHECK(s[r] <= 1.0);
        CHECK_FALSE(data.isMissing("data_quality_score", r));
    }

    CHECK(report.missingDate == 2);
    CHECK(report.missingAmount == 2);
    CHECK(report.missingCategory == 2);
    CHECK(report.shortDescription == 2);
    CHECK(report.missingId == 2);
    CHECK(report.meanScore == Approx((1.0 + 0.4 + 0.85 + 0.0 + 0.75) / 5.0));
}

TEST_CASE("Quality weights and description length are configurable", "[quality]") {
    QualityConfig config;
    config.weightId = 0.0;
    config.minDescriptionLength = 10;
    const TypedDataset data = score({
        {"", "2024-01-01", "Coffee", "Dining", "", "4"},
        {"T2", "2024-01-01", "Coffee beans", "Dining", "", "4"}
    }, config);

    CHECK(data.numeric("data_quality_score")[0] == Approx(0.85));
    CHECK(data.numeric("data_quality_score")[1] == Approx(1.0));
}
