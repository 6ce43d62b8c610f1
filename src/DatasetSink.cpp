#include "DatasetSink.h"
#include "CSVUtils.h"
#include "CalendarUtils.h"
#include "CommonUtils.h"
#include "LedgerExceptions.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#ifdef LEDGERLINE_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

CsvDatasetSink::CsvDatasetSink(std::string path, char delimiter)
    : path_(std::move(path)), delimiter_(delimiter) {}

std::string CsvDatasetSink::formatCell(const TypedColumn& column, size_t row) {
    if (row < column.missing.size() && column.missing[row]) return "";
    switch (column.type) {
        case ColumnType::NUMERIC: {
            std::ostringstream os;
            os << std::setprecision(15) << std::get<NumVec>(column.values)[row];
            return os.str();
        }
        case ColumnType::DATE:
            return CalendarUtils::formatDate(std::get<IntVec>(column.values)[row]);
        case ColumnType::BOOLEAN:
            return std::get<IntVec>(column.values)[row] != 0 ? "1" : "0";
        case ColumnType::INTEGER:
            return std::to_string(std::get<IntVec>(column.values)[row]);
        case ColumnType::CATEGORICAL:
            return std::get<StrVec>(column.values)[row];
    }
    return "";
}

void CsvDatasetSink::writeTo(std::ostream& out, const TypedDataset& data, char delimiter) {
    const auto& cols = data.columns();
    std::vector<std::string> fields;
    fields.reserve(cols.size());
    for (const auto& col : cols) fields.push_back(col.name);
    out << CSVUtils::joinRecord(fields, delimiter) << '\n';

    for (size_t r = 0; r < data.rowCount(); ++r) {
        fields.clear();
        for (const auto& col : cols) fields.push_back(formatCell(col, r));
        out << CSVUtils::joinRecord(fields, delimiter) << '\n';
    }
}

void CsvDatasetSink::write(const TypedDataset& data) {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) throw Ledgerline::IOException("Unable to write output file: " + path_);
    writeTo(out, data, delimiter_);
    out.flush();
    if (!out) throw Ledgerline::IOException("Write failed for output file: " + path_);
}

#ifdef LEDGERLINE_USE_NATIVE_PARQUET
namespace {
void checkArrow(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw Ledgerline::IOException(what + ": " + status.ToString());
}

template <typename Builder, typename Values, typename Convert>
std::shared_ptr<arrow::Array> buildArray(const TypedColumn& col, size_t rows, const Values& values, Convert convert) {
    Builder builder;
    for (size_t r = 0; r < rows; ++r) {
        if (col.missing[r]) {
            checkArrow(builder.AppendNull(), "Failed to append null for column '" + col.name + "'");
        } else {
            checkArrow(builder.Append(convert(values[r])), "Failed to append value for column '" + col.name + "'");
        }
    }
    std::shared_ptr<arrow::Array> arr;
    checkArrow(builder.Finish(&arr), "Failed to finalize Arrow array for column '" + col.name + "'");
    return arr;
}
} // namespace

ParquetDatasetSink::ParquetDatasetSink(std::string path) : path_(std::move(path)) {}

void ParquetDatasetSink::write(const TypedDataset& data) {
    const size_t rows = data.rowCount();
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    for (const auto& col : data.columns()) {
        switch (col.type) {
            case ColumnType::NUMERIC:
                arrays.push_back(buildArray<arrow::DoubleBuilder>(col, rows, std::get<NumVec>(col.values),
                                                                  [](double v) { return v; }));
                fields.push_back(arrow::field(col.name, arrow::float64(), true));
                break;
            case ColumnType::DATE:
                arrays.push_back(buildArray<arrow::Date32Builder>(col, rows, std::get<IntVec>(col.values),
                                                                  [](int64_t v) { return static_cast<int32_t>(v); }));
                fields.push_back(arrow::field(col.name, arrow::date32(), true));
                break;
            case ColumnType::BOOLEAN:
                arrays.push_back(buildArray<arrow::BooleanBuilder>(col, rows, std::get<IntVec>(col.values),
                                                                   [](int64_t v) { return v != 0; }));
                fields.push_back(arrow::field(col.name, arrow::boolean(), true));
                break;
            case ColumnType::INTEGER:
                arrays.push_back(buildArray<arrow::Int64Builder>(col, rows, std::get<IntVec>(col.values),
                                                                 [](int64_t v) { return v; }));
                fields.push_back(arrow::field(col.name, arrow::int64(), true));
                break;
            case ColumnType::CATEGORICAL:
                arrays.push_back(buildArray<arrow::StringBuilder>(col, rows, std::get<StrVec>(col.values),
                                                                  [](const std::string& v) { return v; }));
                fields.push_back(arrow::field(col.name, arrow::utf8(), true));
                break;
        }
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(rows));

    auto outRes = arrow::io::FileOutputStream::Open(path_);
    if (!outRes.ok()) {
        throw Ledgerline::IOException("Failed to open parquet output path: " + outRes.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(rows)));
    checkArrow(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows), "Parquet write failed");
    checkArrow(sink->Close(), "Failed to close parquet output stream");
}
#else
ParquetDatasetSink::ParquetDatasetSink(std::string path) : path_(std::move(path)) {
    throw Ledgerline::ConfigurationException(
        "Parquet output requested for " + path_ + ", but this build was compiled without native parquet support. "
        "Rebuild with Arrow/Parquet libraries enabled or use --output-format csv");
}

void ParquetDatasetSink::write(const TypedDataset&) {
    throw Ledgerline::ConfigurationException("Parquet output is not available in this build");
}
#endif

std::unique_ptr<DatasetSink> makeDatasetSink(const std::string& format, const std::string& path, char delimiter) {
    std::string resolved = CommonUtils::toLower(format);
    if (resolved == "auto") {
        const std::string ext = CommonUtils::toLower(std::filesystem::path(path).extension().string());
        resolved = (ext == ".parquet") ? "parquet" : "csv";
    }
    if (resolved == "csv") return std::make_unique<CsvDatasetSink>(path, delimiter);
    if (resolved == "parquet") return std::make_unique<ParquetDatasetSink>(path);
    throw Ledgerline::ConfigurationException("output_format must be one of: auto, csv, parquet");
}
