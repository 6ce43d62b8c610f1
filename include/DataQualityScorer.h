#pragma once
#include "AppConfig.h"
#include "TypedDataset.h"

struct QualityReport {
    size_t missingDate = 0;
    size_t missingAmount = 0;
    size_t missingCategory = 0;
    size_t shortDescription = 0;
    size_t missingId = 0;
    double meanScore = 0.0;
};

/**
 * @brief Stage 6: data_quality_score = clamp(1 - sum(weight * penalty), 0, 1).
 */
class DataQualityScorer {
public:
    static QualityReport run(TypedDataset& data, const QualityConfig& config);
};
