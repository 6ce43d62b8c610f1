#include "RecordSource.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "LedgerExceptions.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>

// ordered_json keeps record keys in document order.
using json = nlohmann::ordered_json;

namespace {
bool isBlankRecord(const std::vector<std::string>& record) {
    for (const auto& cell : record) {
        if (!cell.empty()) return false;
    }
    return true;
}

std::string cellText(const json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    return value.dump();
}

const json* locateRecords(const json& doc) {
    if (doc.is_array()) return &doc;
    if (!doc.is_object()) return nullptr;
    for (const char* key : {"data", "records", "transactions"}) {
        auto it = doc.find(key);
        if (it != doc.end() && it->is_array()) return &(*it);
    }
    return nullptr;
}
} // namespace

CsvRecordSource::CsvRecordSource(std::string path, char delimiter)
    : path_(std::move(path)), delimiter_(delimiter) {}

RawBatch CsvRecordSource::read() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) throw Ledgerline::IOException("Could not open input file: " + path_);

    ParseStats stats;
    RawBatch batch = parse(in, delimiter_, &stats);
    if (stats.paddedRows > 0 || stats.truncatedRows > 0 || stats.malformedRows > 0) {
        std::cout << "[Ledgerline][Warning] " << path_ << ": padded " << stats.paddedRows
                  << " short rows, truncated " << stats.truncatedRows
                  << " long rows, " << stats.malformedRows << " rows with unterminated quotes\n";
    }
    return batch;
}

RawBatch CsvRecordSource::parse(std::istream& in, char delimiter, ParseStats* stats) {
    ParseStats local;
    CSVUtils::skipBOM(in);

    RawBatch batch;
    bool headerRead = false;
    while (in.peek() != EOF) {
        bool malformed = false;
        std::vector<std::string> record = CSVUtils::readRecord(in, delimiter, &malformed);
        if (record.empty() || isBlankRecord(record)) continue;
        if (malformed) ++local.malformedRows;

        if (!headerRead) {
            batch.header = std::move(record);
            headerRead = true;
            continue;
        }

        const size_t width = batch.header.size();
        if (record.size() < width) {
            ++local.paddedRows;
            record.resize(width);
        } else if (record.size() > width) {
            ++local.truncatedRows;
            record.resize(width);
        }
        batch.rows.push_back(std::move(record));
    }

    if (stats) *stats = local;
    return batch;
}

JsonRecordSource::JsonRecordSource(std::string path) : path_(std::move(path)) {}

RawBatch JsonRecordSource::read() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) throw Ledgerline::IOException("Could not open input file: " + path_);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

RawBatch JsonRecordSource::parse(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw Ledgerline::IOException(std::string("Malformed JSON input: ") + ex.what());
    }

    const json* records = locateRecords(doc);
    if (records == nullptr) {
        throw Ledgerline::IOException("JSON input must be an array of records or an object with a data/records/transactions array");
    }

    RawBatch batch;
    std::unordered_map<std::string, size_t> columnIndex;
    std::vector<std::unordered_map<size_t, std::string>> sparseRows;
    sparseRows.reserve(records->size());

    for (const auto& record : *records) {
        if (!record.is_object()) {
            throw Ledgerline::IOException("JSON records must be objects");
        }
        std::unordered_map<size_t, std::string> cells;
        for (auto it = record.begin(); it != record.end(); ++it) {
            auto found = columnIndex.find(it.key());
            size_t idx = 0;
            if (found == columnIndex.end()) {
                idx = batch.header.size();
                columnIndex.emplace(it.key(), idx);
                batch.header.push_back(it.key());
            } else {
                idx = found->second;
            }
            cells[idx] = cellText(it.value());
        }
        sparseRows.push_back(std::move(cells));
    }

    batch.rows.reserve(sparseRows.size());
    for (auto& cells : sparseRows) {
        std::vector<std::string> row(batch.header.size());
        for (auto& entry : cells) row[entry.first] = std::move(entry.second);
        batch.rows.push_back(std::move(row));
    }
    return batch;
}

std::unique_ptr<RecordSource> makeRecordSource(const std::string& format, const std::string& path, char delimiter) {
    std::string resolved = CommonUtils::toLower(format);
    if (resolved == "auto") {
        const std::string ext = CommonUtils::toLower(std::filesystem::path(path).extension().string());
        resolved = (ext == ".json") ? "json" : "csv";
    }
    if (resolved == "csv") return std::make_unique<CsvRecordSource>(path, delimiter);
    if (resolved == "json") return std::make_unique<JsonRecordSource>(path);
    throw Ledgerline::ConfigurationException("input_format must be one of: auto, csv, json");
}
