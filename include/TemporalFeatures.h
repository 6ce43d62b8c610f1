#pragma once
#include "TypedDataset.h"

/**
 * @brief Stage 2: calendar fields derived from transaction_date.
 * @details Emits year, month, year_month, day_of_week (0 = Monday), day_name,
 *          quarter, week_of_year (ISO 8601), is_weekend, is_month_start,
 *          is_month_end and the transaction_* aliases. Null dates give null fields.
 */
class TemporalFeatureGenerator {
public:
    static void run(TypedDataset& data);
};
