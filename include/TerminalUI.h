#pragma once
#include "CategoryProfiler.h"
#include "TypedDataset.h"

struct PipelineReport;

class TerminalUI {
public:
    static void printCategoryProfiles(const CategoryProfileMap& profiles);
    static void printRunSummary(const PipelineReport& report, const TypedDataset& data);
};
