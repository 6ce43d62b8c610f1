#pragma once
#include "AppConfig.h"
#include "TypedDataset.h"
#include <string>

struct RecurrenceReport {
    size_t groups = 0;
    size_t recurringGroups = 0;
    size_t keywordGroups = 0;
    size_t duplicateCandidates = 0;
};

/**
 * @brief Stage 5: groups rows by normalized description and derives
 *        frequency, gap to the previous occurrence, recurring and
 *        duplicate-candidate flags.
 * @details Within a group, dated rows are ordered by (date, original row index).
 */
class RecurrenceAnalyzer {
public:
    static std::string normalizeDescription(const std::string& description);
    static RecurrenceReport run(TypedDataset& data, const RecurrenceConfig& config);
};
