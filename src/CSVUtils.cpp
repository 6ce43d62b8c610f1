#include "CSVUtils.h"
#include "CommonUtils.h"
#include "LedgerExceptions.h"

#include <unordered_set>

namespace CSVUtils {
void skipBOM(std::istream& is) {
    static const unsigned char bom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    for (unsigned char expected : bom) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
        is.get();
    }
}

std::vector<std::string> readRecord(std::istream& is,
                                    char delimiter,
                                    bool* malformed,
                                    const ReadLimits& limits) {
    if (malformed) *malformed = false;

    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawContent = false;

    auto pushField = [&]() {
        fields.push_back(fieldQuoted ? field : CommonUtils::trim(field));
        if (limits.maxColumns > 0 && fields.size() > limits.maxColumns) {
            throw Ledgerline::IOException("CSV record exceeds " + std::to_string(limits.maxColumns) + " columns");
        }
        field.clear();
        fieldQuoted = false;
    };

    auto appendChar = [&](char c) {
        field.push_back(c);
        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) {
            throw Ledgerline::IOException("CSV field exceeds size limit");
        }
    };

    char c;
    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    appendChar('"');
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                appendChar('\n');
            } else {
                appendChar(c);
            }
            continue;
        }

        if (c == '"' && CommonUtils::trim(field).empty()) {
            field.clear();
            inQuotes = true;
            fieldQuoted = true;
            sawContent = true;
        } else if (c == delimiter) {
            pushField();
            sawContent = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            appendChar(c);
            sawContent = true;
        }
    }

    if (inQuotes && malformed) *malformed = true;
    if (!sawContent) return {};
    pushField();
    return fields;
}

std::vector<std::string> uniqueHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);

        const std::string base = out[i];
        size_t suffix = 2;
        while (seen.count(out[i])) {
            out[i] = base + "_" + std::to_string(suffix++);
        }
        seen.insert(out[i]);
    }
    return out;
}

std::string escapeField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find_first_of("\"\r\n") != std::string::npos;
    if (!needsQuotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string joinRecord(const std::vector<std::string>& fields, char delimiter) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out.push_back(delimiter);
        out += escapeField(fields[i], delimiter);
    }
    return out;
}
} // namespace CSVUtils
