#include "TypedDataset.h"
#include "LedgerExceptions.h"

#include <utility>

namespace {
size_t storageSize(const ColumnStorage& storage) {
    return std::visit([](const auto& values) { return values.size(); }, storage);
}

bool storageMatchesType(const TypedColumn& col) {
    switch (col.type) {
        case ColumnType::NUMERIC: return std::holds_alternative<NumVec>(col.values);
        case ColumnType::CATEGORICAL: return std::holds_alternative<StrVec>(col.values);
        case ColumnType::DATE:
        case ColumnType::INTEGER:
        case ColumnType::BOOLEAN: return std::holds_alternative<IntVec>(col.values);
    }
    return false;
}
} // namespace

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

const TypedColumn& TypedDataset::column(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Ledgerline::DatasetException("Column not found: " + name);
    return columns_[static_cast<size_t>(idx)];
}

const NumVec& TypedDataset::numeric(const std::string& name) const {
    const TypedColumn& col = column(name);
    if (col.type != ColumnType::NUMERIC) throw Ledgerline::DatasetException("Column is not numeric: " + name);
    return std::get<NumVec>(col.values);
}

const StrVec& TypedDataset::categorical(const std::string& name) const {
    const TypedColumn& col = column(name);
    if (col.type != ColumnType::CATEGORICAL) throw Ledgerline::DatasetException("Column is not categorical: " + name);
    return std::get<StrVec>(col.values);
}

const IntVec& TypedDataset::integers(const std::string& name) const {
    const TypedColumn& col = column(name);
    if (!std::holds_alternative<IntVec>(col.values)) {
        throw Ledgerline::DatasetException("Column does not hold integer storage: " + name);
    }
    return std::get<IntVec>(col.values);
}

const MissingMask& TypedDataset::missing(const std::string& name) const {
    return column(name).missing;
}

bool TypedDataset::isMissing(const std::string& name, size_t row) const {
    const MissingMask& mask = missing(name);
    return row < mask.size() && mask[row] != 0;
}

void TypedDataset::addNumericColumn(std::string name, NumVec values, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    col.values = std::move(values);
    col.missing = std::move(missing);
    setColumn(std::move(col));
}

void TypedDataset::addCategoricalColumn(std::string name, StrVec values, MissingMask missing) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::CATEGORICAL;
    col.values = std::move(values);
    col.missing = std::move(missing);
    setColumn(std::move(col));
}

void TypedDataset::addIntegerColumn(std::string name, IntVec values, MissingMask missing, ColumnType type) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = type;
    col.values = std::move(values);
    col.missing = std::move(missing);
    setColumn(std::move(col));
}

void TypedDataset::addBooleanColumn(std::string name, const std::vector<bool>& flags) {
    IntVec values(flags.size(), 0);
    for (size_t i = 0; i < flags.size(); ++i) values[i] = flags[i] ? 1 : 0;
    addIntegerColumn(std::move(name), std::move(values), MissingMask(flags.size(), static_cast<uint8_t>(0)), ColumnType::BOOLEAN);
}

void TypedDataset::setColumn(TypedColumn column) {
    if (!storageMatchesType(column)) {
        throw Ledgerline::DatasetException("Storage does not match declared type for column: " + column.name);
    }
    if (storageSize(column.values) != rowCount_ || column.missing.size() != rowCount_) {
        throw Ledgerline::DatasetException("Row count mismatch for column: " + column.name);
    }

    const int idx = findColumnIndex(column.name);
    if (idx >= 0) {
        columns_[static_cast<size_t>(idx)] = std::move(column);
        return;
    }
    columns_.push_back(std::move(column));
}
