#include "DataQualityScorer.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

QualityReport DataQualityScorer::run(TypedDataset& data, const QualityConfig& config) {
    const size_t n = data.rowCount();
    const StrVec& descriptions = data.categorical("transaction_description");
    QualityReport report;

    NumVec score(n, 1.0);
    double total = 0.0;
    for (size_t r = 0; r < n; ++r) {
        const bool noDate = data.isMissing("transaction_date", r);
        const bool noAmount = data.isMissing("net_amount", r);
        const bool noCategory = data.isMissing("transaction_category", r);
        const bool shortDescription = data.isMissing("transaction_description", r) ||
                                      CommonUtils::trim(descriptions[r]).size() < config.minDescriptionLength;
        const bool noId = data.isMissing("transaction_id", r);

        double penalty = 0.0;
        if (noDate) { penalty += config.weightDate; ++report.missingDate; }
        if (noAmount) { penalty += config.weightAmount; ++report.missingAmount; }
        if (noCategory) { penalty += config.weightCategory; ++report.missingCategory; }
        if (shortDescription) { penalty += config.weightDescription; ++report.shortDescription; }
        if (noId) { penalty += config.weightId; ++report.missingId; }

        const double clamped = std::clamp(1.0 - penalty, 0.0, 1.0);
        score[r] = std::round(clamped * 10000.0) / 10000.0;
        total += score[r];
    }
    report.meanScore = n > 0 ? total / static_cast<double>(n) : 0.0;

    data.addNumericColumn("data_quality_score", std::move(score), MissingMask(n, static_cast<uint8_t>(0)));

    std::cout << "[Ledgerline][Quality] Mean score " << std::fixed << std::setprecision(3) << report.meanScore
              << std::defaultfloat << " (missing date " << report.missingDate << ", missing amount " << report.missingAmount
              << ", missing category " << report.missingCategory << ", short description " << report.shortDescription
              << ", missing id " << report.missingId << ")\n";
    return report;
}
