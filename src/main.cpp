#include "AppConfig.h"
#include "LedgerExceptions.h"
#include "LedgerPipeline.h"

#include <iostream>
#include <string>

namespace {
void printUsage() {
    std::cout << "Usage: " << AppConfig::usage() << "\n"
              << "\nEnriches a transaction batch (CSV or JSON) with temporal, category, anomaly,\n"
              << "recurrence, data quality, holiday and FX columns and writes CSV or Parquet.\n"
              << "Every option can also be set in a --config file as `key: value` (e.g. enable_fx: true).\n";
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage();
        return 0;
    }

    try {
        const AppConfig config = AppConfig::fromArgs(argc, argv);
        std::cout << "[Ledgerline] Enriching " << config.inputPath << "\n";
        return LedgerPipeline::runFromConfig(config);
    } catch (const Ledgerline::LedgerException& e) {
        std::cerr << "[Ledgerline][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Ledgerline][Exception] " << e.what() << "\n";
        return 1;
    }
}
