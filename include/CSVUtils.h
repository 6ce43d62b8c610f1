#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// RFC 4180 record tokenization for transaction files.
// This module does not interpret field contents.
struct ReadLimits {
	size_t maxFieldBytes = 4 * 1024 * 1024;
	size_t maxColumns = 4096;
};

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record, following quoted fields across line breaks.
 * @param malformed set when the record ends inside an open quote.
 * @return empty vector at end of input or for a blank line.
 * @throws Ledgerline::IOException when a record exceeds the read limits.
 */
std::vector<std::string> readRecord(std::istream& is,
									char delimiter,
									bool* malformed = nullptr,
									const ReadLimits& limits = ReadLimits{});

/**
 * @brief Makes header names unique: empty names become column_N, repeats get _2, _3 suffixes.
 */
std::vector<std::string> uniqueHeader(const std::vector<std::string>& header);

/**
 * @brief Quotes a field when it contains the delimiter, a quote or a line break.
 */
std::string escapeField(const std::string& value, char delimiter);
std::string joinRecord(const std::vector<std::string>& fields, char delimiter);
}
