#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// DATE, INTEGER and BOOLEAN columns all store int64_t values. DATE values are
// day numbers relative to 1970-01-01; BOOLEAN values are 0 or 1.
enum class ColumnType { NUMERIC, CATEGORICAL, DATE, INTEGER, BOOLEAN };
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;
using IntVec = std::vector<int64_t>;
using ColumnStorage = std::variant<NumVec, StrVec, IntVec>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = StrVec{};
    MissingMask missing;
};

/**
 * @brief Column-oriented transaction table passed between pipeline stages.
 * @details Stages append columns; the row count is fixed at construction so
 *          every column stays row-aligned with the input batch.
 */
class TypedDataset {
public:
    TypedDataset() = default;
    explicit TypedDataset(size_t rowCount) : rowCount_(rowCount) {}

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return findColumnIndex(name) >= 0; }

    /**
     * @throws Ledgerline::DatasetException when the column is absent.
     */
    const TypedColumn& column(const std::string& name) const;

    /**
     * @brief Typed accessors.
     * @throws Ledgerline::DatasetException when the column is absent or its
     *         storage does not match the requested type.
     */
    const NumVec& numeric(const std::string& name) const;
    const StrVec& categorical(const std::string& name) const;
    const IntVec& integers(const std::string& name) const;
    const MissingMask& missing(const std::string& name) const;
    bool isMissing(const std::string& name, size_t row) const;

    void addNumericColumn(std::string name, NumVec values, MissingMask missing);
    void addCategoricalColumn(std::string name, StrVec values, MissingMask missing);
    void addIntegerColumn(std::string name, IntVec values, MissingMask missing, ColumnType type = ColumnType::INTEGER);
    void addBooleanColumn(std::string name, const std::vector<bool>& flags);

    /**
     * @brief Appends a column, or replaces an existing column of the same name in place.
     * @pre column storage and missing mask sizes equal rowCount().
     * @throws Ledgerline::DatasetException on size mismatch.
     */
    void setColumn(TypedColumn column);

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
