#include "AnomalyDetector.h"
#include "CommonUtils.h"
#include "LedgerExceptions.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <unordered_map>

namespace {
std::string categoryKey(const TypedDataset& data, const StrVec& categories, size_t row) {
    return data.isMissing("transaction_category", row) ? std::string() : categories[row];
}
} // namespace

std::vector<bool> ZScoreOutlierRule::evaluate(const AnomalyContext& ctx) const {
    std::vector<bool> flags(ctx.zScores.size(), false);
    for (size_t r = 0; r < ctx.zScores.size(); ++r) {
        if (ctx.zMissing[r]) continue;
        flags[r] = std::abs(ctx.zScores[r]) >= kOutlierZThreshold;
    }
    return flags;
}

std::vector<bool> LargeAmountRule::evaluate(const AnomalyContext& ctx) const {
    const NumVec& absAmount = ctx.data.numeric("abs_amount");
    const MissingMask& missing = ctx.data.missing("abs_amount");
    std::vector<bool> flags(absAmount.size(), false);
    for (size_t r = 0; r < absAmount.size(); ++r) {
        if (missing[r]) continue;
        flags[r] = absAmount[r] > ctx.config.largeAmountThreshold;
    }
    return flags;
}

std::vector<bool> CategoryRarityRule::evaluate(const AnomalyContext& ctx) const {
    const StrVec& categories = ctx.data.categorical("transaction_category");
    std::vector<bool> flags(ctx.data.rowCount(), false);
    for (size_t r = 0; r < flags.size(); ++r) {
        if (ctx.data.isMissing("transaction_category", r)) continue;
        const auto it = ctx.profiles.find(categories[r]);
        if (it == ctx.profiles.end()) continue;
        flags[r] = it->second.rowCount <= ctx.config.categoryRarityMaxRows;
    }
    return flags;
}

std::vector<bool> IqrFenceRule::evaluate(const AnomalyContext& ctx) const {
    const NumVec& net = ctx.data.numeric("net_amount");
    const MissingMask& missing = ctx.data.missing("net_amount");
    std::vector<bool> flags(net.size(), false);

    NumVec observed;
    observed.reserve(net.size());
    for (size_t r = 0; r < net.size(); ++r) {
        if (!missing[r]) observed.push_back(net[r]);
    }
    if (observed.size() < 4) return flags;

    const double q1 = CommonUtils::quantileByNth(observed, 0.25);
    const double q3 = CommonUtils::quantileByNth(observed, 0.75);
    const double iqr = q3 - q1;
    const double lo = q1 - ctx.config.iqrMultiplier * iqr;
    const double hi = q3 + ctx.config.iqrMultiplier * iqr;
    for (size_t r = 0; r < net.size(); ++r) {
        if (missing[r]) continue;
        flags[r] = net[r] < lo || net[r] > hi;
    }
    return flags;
}

std::unique_ptr<AnomalyRule> AnomalyDetector::makeRule(const std::string& name) {
    static const std::unordered_map<std::string, std::function<std::unique_ptr<AnomalyRule>()>> factory = {
        {"zscore", []() { return std::make_unique<ZScoreOutlierRule>(); }},
        {"large_amount", []() { return std::make_unique<LargeAmountRule>(); }},
        {"category_rarity", []() { return std::make_unique<CategoryRarityRule>(); }},
        {"iqr", []() { return std::make_unique<IqrFenceRule>(); }}
    };
    const auto it = factory.find(CommonUtils::toLower(CommonUtils::trim(name)));
    if (it == factory.end()) {
        throw Ledgerline::ConfigurationException(
            "Unknown anomaly rule '" + name + "' (allowed: zscore, large_amount, category_rarity, iqr)");
    }
    return it->second();
}

void AnomalyDetector::computeZScores(const TypedDataset& data,
                                     const CategoryProfileMap& profiles,
                                     NumVec& zScores,
                                     MissingMask& zMissing) {
    const size_t n = data.rowCount();
    const StrVec& categories = data.categorical("transaction_category");
    const NumVec& net = data.numeric("net_amount");
    zScores.assign(n, 0.0);
    zMissing.assign(n, static_cast<uint8_t>(0));

    for (size_t r = 0; r < n; ++r) {
        if (data.isMissing("net_amount", r)) {
            zMissing[r] = 1;
            continue;
        }
        const auto it = profiles.find(categoryKey(data, categories, r));
        if (it == profiles.end() || it->second.stdNet <= 0.0) continue;
        zScores[r] = (net[r] - it->second.meanNet) / it->second.stdNet;
    }
}

std::string AnomalyDetector::sizeBucket(double absAmount) {
    if (absAmount < 10.0) return "micro";
    if (absAmount < 50.0) return "small";
    if (absAmount < 200.0) return "medium";
    if (absAmount < 1000.0) return "large";
    return "very_large";
}

AnomalyReport AnomalyDetector::run(TypedDataset& data, const CategoryProfileMap& profiles, const AnomalyConfig& config) {
    const size_t n = data.rowCount();
    AnomalyReport report;

    NumVec zScores;
    MissingMask zMissing;
    computeZScores(data, profiles, zScores, zMissing);

    std::vector<std::unique_ptr<AnomalyRule>> rules;
    rules.push_back(std::make_unique<ZScoreOutlierRule>());
    rules.push_back(std::make_unique<LargeAmountRule>());
    for (const auto& name : config.rules) {
        auto rule = makeRule(name);
        const bool duplicate = std::any_of(rules.begin(), rules.end(), [&](const std::unique_ptr<AnomalyRule>& r) {
            return r->name() == rule->name();
        });
        if (!duplicate) rules.push_back(std::move(rule));
    }

    const AnomalyContext ctx{data, profiles, zScores, zMissing, config};
    std::vector<bool> outlier(n, false);
    std::vector<bool> large(n, false);
    std::vector<bool> anomaly(n, false);
    std::vector<std::string> reasons(n);
    for (const auto& rule : rules) {
        const std::vector<bool> flags = rule->evaluate(ctx);
        if (rule->name() == "zscore") outlier = flags;
        if (rule->name() == "large_amount") large = flags;
        size_t hits = 0;
        for (size_t r = 0; r < n; ++r) {
            if (!flags[r]) continue;
            ++hits;
            anomaly[r] = true;
            if (!reasons[r].empty()) reasons[r] += "|";
            reasons[r] += rule->name();
        }
        report.ruleHits[rule->name()] = hits;
    }

    const NumVec& absAmount = data.numeric("abs_amount");
    const MissingMask amountMissing = data.missing("abs_amount");
    StrVec size(n);
    MissingMask reasonsMissing(n, static_cast<uint8_t>(0));
    for (size_t r = 0; r < n; ++r) {
        if (!amountMissing[r]) size[r] = sizeBucket(absAmount[r]);
        if (reasons[r].empty()) reasonsMissing[r] = 1;
        if (outlier[r]) ++report.outliers;
        if (large[r]) ++report.largeTransactions;
        if (anomaly[r]) ++report.anomalies;
    }

    data.addNumericColumn("cat_net_zscore", std::move(zScores), std::move(zMissing));
    data.addBooleanColumn("is_outlier", outlier);
    data.addBooleanColumn("is_large_transaction", large);
    data.addCategoricalColumn("transaction_size", std::move(size), amountMissing);
    data.addBooleanColumn("is_anomaly", anomaly);
    data.addCategoricalColumn("anomaly_reasons", std::move(reasons), std::move(reasonsMissing));

    std::cout << "[Ledgerline][Anomaly] " << report.anomalies << " anomalous rows ("
              << report.outliers << " z-score outliers, " << report.largeTransactions << " large transactions)\n";
    return report;
}
