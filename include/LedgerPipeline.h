#pragma once

#include "AnomalyDetector.h"
#include "AppConfig.h"
#include "CategoryProfiler.h"
#include "DatasetSink.h"
#include "DataQualityScorer.h"
#include "EnrichmentProviders.h"
#include "ExternalEnrichment.h"
#include "Normalizer.h"
#include "RecordSource.h"
#include "RecurrenceAnalyzer.h"
#include "TypedDataset.h"

#include <memory>

struct PipelineReport {
    NormalizeReport normalize;
    AnomalyReport anomaly;
    RecurrenceReport recurrence;
    QualityReport quality;
    EnrichmentReport enrichment;
};

struct PipelineResult {
    TypedDataset data;
    CategoryProfileMap profiles;
    PipelineReport report;
};

/**
 * @brief Runs the seven enrichment stages in order over one batch.
 * @details Holds only configuration and collaborators; every call to
 *          process() starts from the raw batch it is given.
 */
class LedgerPipeline final {
public:
    LedgerPipeline(AppConfig config,
                   CategoryLookup categories,
                   std::shared_ptr<HolidayProvider> holidays,
                   std::shared_ptr<FxRateProvider> fx);

    /**
     * @throws Ledgerline::DatasetException for an empty or unrecognizable batch.
     */
    PipelineResult process(const RawBatch& batch) const;

    /**
     * @brief Source -> process -> sink, then prints the run summary.
     * @return process exit code (0 on success).
     */
    int run(RecordSource& source, DatasetSink& sink) const;

    /**
     * @brief Wires file source, HTTP providers and file sink from the config.
     */
    static int runFromConfig(const AppConfig& config);

private:
    AppConfig config_;
    CategoryLookup categories_;
    ExternalEnrichment enrichment_;
};
