#pragma once
#include "TypedDataset.h"
#include <memory>
#include <ostream>
#include <string>

class DatasetSink {
public:
    virtual ~DatasetSink() = default;

    /**
     * @throws Ledgerline::IOException when the output cannot be written.
     */
    virtual void write(const TypedDataset& data) = 0;
};

/**
 * @brief CSV output: booleans as 1/0, dates as YYYY-MM-DD, nulls as empty cells.
 */
class CsvDatasetSink : public DatasetSink {
public:
    CsvDatasetSink(std::string path, char delimiter);
    void write(const TypedDataset& data) override;

    static void writeTo(std::ostream& out, const TypedDataset& data, char delimiter);
    static std::string formatCell(const TypedColumn& column, size_t row);

private:
    std::string path_;
    char delimiter_;
};

/**
 * @brief Parquet output through Apache Arrow. Builds without
 *        LEDGERLINE_USE_NATIVE_PARQUET reject this sink at construction.
 */
class ParquetDatasetSink : public DatasetSink {
public:
    /**
     * @throws Ledgerline::ConfigurationException when built without Parquet support.
     */
    explicit ParquetDatasetSink(std::string path);
    void write(const TypedDataset& data) override;

private:
    std::string path_;
};

/**
 * @brief Creates a sink for `format` (csv|parquet|auto). `auto` picks by file extension.
 * @throws Ledgerline::ConfigurationException on an unknown or unsupported format.
 */
std::unique_ptr<DatasetSink> makeDatasetSink(const std::string& format, const std::string& path, char delimiter);
