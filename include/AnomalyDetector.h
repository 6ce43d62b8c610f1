#pragma once
#include "AppConfig.h"
#include "CategoryProfiler.h"
#include "TypedDataset.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

struct AnomalyContext {
    const TypedDataset& data;
    const CategoryProfileMap& profiles;
    const NumVec& zScores;
    const MissingMask& zMissing;
    const AnomalyConfig& config;
};

/**
 * @brief One independent anomaly signal. Rules never see each other's output.
 */
class AnomalyRule {
public:
    virtual ~AnomalyRule() = default;
    virtual std::string name() const = 0;
    virtual std::vector<bool> evaluate(const AnomalyContext& ctx) const = 0;
};

// Fixed cutoff on |cat_net_zscore| for is_outlier.
constexpr double kOutlierZThreshold = 3.0;

// |cat_net_zscore| >= kOutlierZThreshold.
class ZScoreOutlierRule : public AnomalyRule {
public:
    std::string name() const override { return "zscore"; }
    std::vector<bool> evaluate(const AnomalyContext& ctx) const override;
};

// abs_amount > largeAmountThreshold.
class LargeAmountRule : public AnomalyRule {
public:
    std::string name() const override { return "large_amount"; }
    std::vector<bool> evaluate(const AnomalyContext& ctx) const override;
};

// Category seen on at most categoryRarityMaxRows rows of the batch.
class CategoryRarityRule : public AnomalyRule {
public:
    std::string name() const override { return "category_rarity"; }
    std::vector<bool> evaluate(const AnomalyContext& ctx) const override;
};

// Tukey fence on net_amount over the whole batch.
class IqrFenceRule : public AnomalyRule {
public:
    std::string name() const override { return "iqr"; }
    std::vector<bool> evaluate(const AnomalyContext& ctx) const override;
};

struct AnomalyReport {
    std::map<std::string, size_t> ruleHits;
    size_t outliers = 0;
    size_t largeTransactions = 0;
    size_t anomalies = 0;
};

/**
 * @brief Stage 4: per-row z-score against the category baseline. is_anomaly is
 *        the union of the zscore and large_amount baseline rules and any extra
 *        rules named in AnomalyConfig::rules.
 */
class AnomalyDetector {
public:
    /**
     * @throws Ledgerline::ConfigurationException for an unknown rule name.
     */
    static std::unique_ptr<AnomalyRule> makeRule(const std::string& name);

    /**
     * @brief z = (net - mean) / std for the row's category; 0 when std is 0,
     *        null when net_amount is null.
     */
    static void computeZScores(const TypedDataset& data,
                               const CategoryProfileMap& profiles,
                               NumVec& zScores,
                               MissingMask& zMissing);

    static std::string sizeBucket(double absAmount);

    static AnomalyReport run(TypedDataset& data, const CategoryProfileMap& profiles, const AnomalyConfig& config);
};
