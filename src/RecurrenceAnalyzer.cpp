#include "RecurrenceAnalyzer.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_map>
#include <vector>

namespace {
bool matchesVocabulary(const std::string& normalized, const std::vector<std::string>& keywords) {
    return std::any_of(keywords.begin(), keywords.end(), [&](const std::string& keyword) {
        return CommonUtils::containsIgnoreCase(normalized, keyword);
    });
}
} // namespace

std::string RecurrenceAnalyzer::normalizeDescription(const std::string& description) {
    return CommonUtils::toLower(CommonUtils::trim(description));
}

RecurrenceReport RecurrenceAnalyzer::run(TypedDataset& data, const RecurrenceConfig& config) {
    const size_t n = data.rowCount();
    const StrVec& descriptions = data.categorical("transaction_description");
    const IntVec& dates = data.integers("transaction_date");
    const NumVec& net = data.numeric("net_amount");

    StrVec normalized(n);
    MissingMask normalizedMissing(n, static_cast<uint8_t>(0));
    std::unordered_map<std::string, std::vector<size_t>> groups;
    std::vector<std::string> groupOrder;
    for (size_t r = 0; r < n; ++r) {
        if (data.isMissing("transaction_description", r)) {
            normalizedMissing[r] = 1;
            continue;
        }
        normalized[r] = normalizeDescription(descriptions[r]);
        auto& rows = groups[normalized[r]];
        if (rows.empty()) groupOrder.push_back(normalized[r]);
        rows.push_back(r);
    }

    IntVec frequency(n, 0);
    IntVec gap(n, 0);
    MissingMask gapMissing(n, static_cast<uint8_t>(1));
    std::vector<bool> keyword(n, false), recurring(n, false), duplicate(n, false);
    RecurrenceReport report;
    report.groups = groups.size();

    for (const auto& key : groupOrder) {
        const std::vector<size_t>& rows = groups.at(key);
        const bool keywordHit = matchesVocabulary(key, config.subscriptionKeywords);
        const bool isRecurring = keywordHit || rows.size() > static_cast<size_t>(config.minFrequency);
        if (keywordHit) ++report.keywordGroups;
        if (isRecurring) ++report.recurringGroups;

        std::vector<size_t> dated;
        dated.reserve(rows.size());
        for (size_t r : rows) {
            frequency[r] = static_cast<int64_t>(rows.size());
            keyword[r] = keywordHit;
            recurring[r] = isRecurring;
            if (!data.isMissing("transaction_date", r)) dated.push_back(r);
        }
        // rows are already in ascending index order, so a stable sort breaks date ties by index.
        std::stable_sort(dated.begin(), dated.end(), [&](size_t a, size_t b) { return dates[a] < dates[b]; });

        for (size_t k = 1; k < dated.size(); ++k) {
            const size_t cur = dated[k];
            const size_t prev = dated[k - 1];
            const int64_t days = dates[cur] - dates[prev];
            gap[cur] = days;
            gapMissing[cur] = 0;

            const bool amountsKnown = !data.isMissing("net_amount", cur) && !data.isMissing("net_amount", prev);
            // 1e-9 absorbs binary rounding of cent values.
            const bool nearEqual = amountsKnown && std::abs(net[cur] - net[prev]) <= config.duplicateAmountEpsilon + 1e-9;
            if (days <= config.duplicateWindowDays && nearEqual) {
                duplicate[cur] = true;
                ++report.duplicateCandidates;
            }
        }
    }

    data.addCategoricalColumn("description_normalized", std::move(normalized), std::move(normalizedMissing));
    data.addIntegerColumn("description_frequency", std::move(frequency), MissingMask(n, static_cast<uint8_t>(0)));
    data.addIntegerColumn("days_since_prev_same_description", std::move(gap), std::move(gapMissing));
    data.addBooleanColumn("has_keyword_subscription", keyword);
    data.addBooleanColumn("is_recurring_description", recurring);
    data.addBooleanColumn("is_duplicate_candidate", duplicate);

    std::cout << "[Ledgerline][Recurrence] " << report.groups << " description groups, "
              << report.recurringGroups << " recurring, " << report.duplicateCandidates << " duplicate candidates\n";
    return report;
}
