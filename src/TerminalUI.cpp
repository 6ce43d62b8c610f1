#include "TerminalUI.h"
#include "LedgerPipeline.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

void TerminalUI::printCategoryProfiles(const CategoryProfileMap& profiles) {
    size_t maxNameLen = 15;
    for (const auto& entry : profiles) maxNameLen = std::max(maxNameLen, entry.first.length());

    const int w = static_cast<int>(maxNameLen) + 2;
    std::cout << "\n============================================ CATEGORY PROFILES ============================================\n";
    std::cout << std::left
              << std::setw(w) << "Category"
              << std::setw(16) << "Type"
              << std::setw(10) << "Priority"
              << std::setw(8) << "TaxDed"
              << std::setw(8) << "Rows"
              << std::setw(14) << "MeanNet"
              << "StdNet\n";
    std::cout << std::string(w + 16 + 10 + 8 + 8 + 14 + 12, '-') << "\n";

    for (const auto& entry : profiles) {
        const CategoryProfile& p = entry.second;
        std::cout << std::left << std::setw(w) << (p.category.empty() ? "(none)" : p.category)
                  << std::setw(16) << p.metadata.type
                  << std::setw(10) << CategoryLookup::priorityLabel(p.metadata.priority)
                  << std::setw(8) << (p.metadata.taxDeductible ? "yes" : "no")
                  << std::setw(8) << p.rowCount
                  << std::right << std::fixed << std::setprecision(2)
                  << std::setw(12) << p.meanNet << "  "
                  << std::setw(10) << p.stdNet << "\n";
        std::cout << std::defaultfloat;
    }
    std::cout << "===========================================================================================================\n";
}

void TerminalUI::printRunSummary(const PipelineReport& report, const TypedDataset& data) {
    const auto line = [](const std::string& label, const auto& value) {
        std::cout << "  " << std::left << std::setw(36) << label << value << "\n";
    };

    std::cout << "\n================ RUN SUMMARY ================\n";
    line("Rows", data.rowCount());
    line("Columns", data.colCount());
    line("Missing dates", report.normalize.missingDates);
    line("Unparseable dates", report.normalize.unparseableDates);
    line("Missing amounts", report.normalize.missingAmounts);
    line("Unparseable amounts", report.normalize.unparseableAmounts);
    line("Zero net rows", report.normalize.zeroNetRows);
    line("Rows with credit and debit", report.normalize.bothSidesNonZero);
    line("Z-score outliers", report.anomaly.outliers);
    line("Large transactions", report.anomaly.largeTransactions);
    line("Anomalies", report.anomaly.anomalies);
    for (const auto& hit : report.anomaly.ruleHits) line("  rule " + hit.first, hit.second);
    line("Description groups", report.recurrence.groups);
    line("Recurring groups", report.recurrence.recurringGroups);
    line("Duplicate candidates", report.recurrence.duplicateCandidates);
    line("Short descriptions", report.quality.shortDescription);
    line("Missing categories", report.quality.missingCategory);
    line("Missing ids", report.quality.missingId);
    {
        std::ostringstream os;
        os << std::fixed << std::setprecision(3) << report.quality.meanScore;
        line("Mean quality score", os.str());
    }
    if (report.enrichment.holidaysApplied) {
        line("Holiday keys (unavailable)", std::to_string(report.enrichment.holidayKeys) + " (" +
                                               std::to_string(report.enrichment.holidayKeysUnavailable) + ")");
        line("Holiday rows", report.enrichment.holidayRows);
    }
    if (report.enrichment.fxSkippedNoCurrency) line("FX", std::string("skipped (no currency column)"));
    if (report.enrichment.fxApplied) {
        line("FX keys (unavailable)", std::to_string(report.enrichment.fxKeys) + " (" +
                                          std::to_string(report.enrichment.fxKeysUnavailable) + ")");
        line("FX unresolved rows", report.enrichment.fxRowsUnresolved);
    }
    std::cout << "=============================================\n";
}
