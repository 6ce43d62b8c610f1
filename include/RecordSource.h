#pragma once
#include <istream>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Raw transaction batch as delivered by a source: free-form header
 *        names and row-aligned string cells.
 * @invariant every row has header.size() cells.
 */
struct RawBatch {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

class RecordSource {
public:
    virtual ~RecordSource() = default;

    /**
     * @brief Reads the complete batch.
     * @throws Ledgerline::IOException when the underlying input is unreadable.
     */
    virtual RawBatch read() = 0;
};

class CsvRecordSource : public RecordSource {
public:
    CsvRecordSource(std::string path, char delimiter);
    RawBatch read() override;

    struct ParseStats {
        size_t paddedRows = 0;
        size_t truncatedRows = 0;
        size_t malformedRows = 0;
    };

    /**
     * @brief Parses CSV text. Short rows are padded with empty cells, long rows
     *        are truncated, blank lines are skipped.
     */
    static RawBatch parse(std::istream& in, char delimiter, ParseStats* stats = nullptr);

private:
    std::string path_;
    char delimiter_;
};

class JsonRecordSource : public RecordSource {
public:
    explicit JsonRecordSource(std::string path);
    RawBatch read() override;

    /**
     * @brief Accepts a top-level array of objects or an object wrapping one in
     *        `data`, `records` or `transactions`. The header is the union of
     *        keys in first-seen order.
     * @throws Ledgerline::IOException on malformed JSON or an unsupported shape.
     */
    static RawBatch parse(const std::string& text);

private:
    std::string path_;
};

/**
 * @brief Creates a source for `format` (csv|json|auto). `auto` picks by file extension.
 * @throws Ledgerline::ConfigurationException on an unknown format.
 */
std::unique_ptr<RecordSource> makeRecordSource(const std::string& format, const std::string& path, char delimiter);
