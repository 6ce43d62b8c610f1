#pragma once
#include "AppConfig.h"
#include "RecordSource.h"
#include "TypedDataset.h"
#include <string>
#include <vector>

struct NormalizeReport {
    size_t rowCount = 0;
    size_t unparseableDates = 0;
    size_t missingDates = 0;
    size_t unparseableAmounts = 0;
    size_t missingAmounts = 0;
    size_t zeroNetRows = 0;
    // Rows with both credit and debit non-zero; net_amount is their difference.
    size_t bothSidesNonZero = 0;
    bool signedAmountColumn = false;
    std::vector<std::string> renamedColumns; // "raw -> canonical"
    std::vector<std::string> createdColumns;
};

struct NormalizeResult {
    TypedDataset data;
    NormalizeReport report;
};

/**
 * @brief Stage 1: maps a raw batch onto the canonical transaction schema.
 * @details Produces transaction_id, transaction_description, transaction_category,
 *          transaction_date (DATE), credit_amount, debit_amount, net_amount,
 *          abs_amount, their reporting aliases, is_income, is_expense and currency
 *          when present. Other raw columns pass through as categorical columns.
 */
class Normalizer {
public:
    /**
     * @throws Ledgerline::DatasetException when the batch has no rows, no date
     *         column or no amount column.
     */
    static NormalizeResult run(const RawBatch& batch, const NormalizerOptions& options);
};
