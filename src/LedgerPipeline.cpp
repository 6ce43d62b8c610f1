#include "LedgerPipeline.h"

#include "DatasetSink.h"
#include "HttpEnrichmentProviders.h"
#include "TemporalFeatures.h"
#include "TerminalUI.h"

#include <iostream>

LedgerPipeline::LedgerPipeline(AppConfig config,
                               CategoryLookup categories,
                               std::shared_ptr<HolidayProvider> holidays,
                               std::shared_ptr<FxRateProvider> fx)
    : config_(std::move(config)),
      categories_(std::move(categories)),
      enrichment_(std::move(holidays), std::move(fx)) {}

PipelineResult LedgerPipeline::process(const RawBatch& batch) const {
    PipelineResult result;

    NormalizeResult normalized = Normalizer::run(batch, config_.normalizer);
    result.data = std::move(normalized.data);
    result.report.normalize = std::move(normalized.report);
    if (config_.verbose) {
        for (const auto& rename : result.report.normalize.renamedColumns) {
            std::cout << "[Ledgerline][Normalizer] renamed " << rename << "\n";
        }
    }
    std::cout << "[Ledgerline][Normalizer] " << result.data.rowCount() << " rows, "
              << result.report.normalize.unparseableDates << " unparseable dates, "
              << result.report.normalize.unparseableAmounts << " unparseable amounts\n";

    TemporalFeatureGenerator::run(result.data);
    result.profiles = CategoryProfiler::run(result.data, categories_);
    result.report.anomaly = AnomalyDetector::run(result.data, result.profiles, config_.anomaly);
    result.report.recurrence = RecurrenceAnalyzer::run(result.data, config_.recurrence);
    result.report.quality = DataQualityScorer::run(result.data, config_.quality);
    result.report.enrichment = enrichment_.run(result.data, config_.enrichment);
    return result;
}

int LedgerPipeline::run(RecordSource& source, DatasetSink& sink) const {
    const RawBatch batch = source.read();
    std::cout << "[Ledgerline][Source] Read " << batch.rows.size() << " rows, "
              << batch.header.size() << " columns\n";

    const PipelineResult result = process(batch);
    sink.write(result.data);
    std::cout << "[Ledgerline][Sink] Wrote " << result.data.rowCount() << " rows, "
              << result.data.colCount() << " columns to " << config_.outputPath << "\n";

    TerminalUI::printCategoryProfiles(result.profiles);
    TerminalUI::printRunSummary(result.report, result.data);
    return 0;
}

int LedgerPipeline::runFromConfig(const AppConfig& config) {
    CategoryLookup categories = CategoryLookup::builtin();
    if (!config.categoryMapPath.empty()) {
        categories = CategoryLookup::fromFile(config.categoryMapPath, categories);
        std::cout << "[Ledgerline][Category] Loaded category map " << config.categoryMapPath
                  << " (" << categories.size() << " categories)\n";
    }

    auto source = makeRecordSource(config.inputFormat, config.inputPath, config.delimiter);
    auto sink = makeDatasetSink(config.outputFormat, config.outputPath, config.delimiter);

    LedgerPipeline pipeline(config,
                            std::move(categories),
                            std::make_shared<NagerHolidayProvider>(config.http),
                            std::make_shared<FrankfurterFxProvider>(config.http));
    return pipeline.run(*source, *sink);
}
