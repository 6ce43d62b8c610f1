#include "Normalizer.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "LedgerExceptions.h"
#include "ValueParsers.h"

#include <cmath>
#include <iostream>
#include <unordered_set>

namespace {
struct AmountCell {
    double value = 0.0;
    bool blank = true;
    bool invalid = false;
};

AmountCell readAmount(const std::string& raw, NumericSeparatorPolicy policy) {
    AmountCell cell;
    if (CommonUtils::isMissingToken(raw)) return cell;
    cell.blank = false;
    double parsed = 0.0;
    if (ValueParsers::parseAmount(raw, policy, parsed)) {
        cell.value = CommonUtils::roundToCents(parsed);
    } else {
        cell.invalid = true;
    }
    return cell;
}

int indexOf(const std::vector<std::string>& names, const std::string& name) {
    for (size_t i = 0; i < names.size(); ++i) if (names[i] == name) return static_cast<int>(i);
    return -1;
}

const std::string& cellAt(const RawBatch& batch, size_t row, int col) {
    static const std::string empty;
    if (col < 0) return empty;
    const auto& cells = batch.rows[row];
    return static_cast<size_t>(col) < cells.size() ? cells[static_cast<size_t>(col)] : empty;
}

void addTextColumn(TypedDataset& data, const RawBatch& batch, int col, const std::string& name, bool upper = false) {
    const size_t n = batch.rows.size();
    StrVec values(n);
    MissingMask missing(n, static_cast<uint8_t>(0));
    for (size_t r = 0; r < n; ++r) {
        const std::string& raw = cellAt(batch, r, col);
        if (CommonUtils::isMissingToken(raw)) {
            missing[r] = 1;
            continue;
        }
        values[r] = upper ? CommonUtils::toUpper(CommonUtils::trim(raw)) : CommonUtils::trim(raw);
    }
    data.addCategoricalColumn(name, std::move(values), std::move(missing));
}

// Columns the normalizer derives itself; raw columns with these names are not passed through.
const std::unordered_set<std::string>& derivedNames() {
    static const std::unordered_set<std::string> names = {
        "transaction_id", "transaction_description", "transaction_category", "transaction_date",
        "credit_amount", "debit_amount", "amount", "net_amount", "abs_amount",
        "net_transaction_amount", "amount_abs", "is_income", "is_expense", "currency"
    };
    return names;
}
} // namespace

NormalizeResult Normalizer::run(const RawBatch& batch, const NormalizerOptions& options) {
    if (batch.rows.empty()) {
        throw Ledgerline::DatasetException("Input batch has no rows");
    }

    NormalizeReport report;
    report.rowCount = batch.rows.size();

    std::vector<std::string> canonical;
    canonical.reserve(batch.header.size());
    for (const auto& raw : batch.header) canonical.push_back(ValueParsers::canonicalColumnName(raw));
    canonical = CSVUtils::uniqueHeader(canonical);
    for (size_t i = 0; i < canonical.size(); ++i) {
        if (canonical[i] != batch.header[i]) report.renamedColumns.push_back(batch.header[i] + " -> " + canonical[i]);
    }

    const int dateCol = indexOf(canonical, "transaction_date");
    const int creditCol = indexOf(canonical, "credit_amount");
    const int debitCol = indexOf(canonical, "debit_amount");
    const int amountCol = indexOf(canonical, "amount");
    if (dateCol < 0) {
        throw Ledgerline::DatasetException("No recognizable date column (expected transaction_date or date)");
    }
    if (creditCol < 0 && debitCol < 0 && amountCol < 0) {
        throw Ledgerline::DatasetException("No recognizable amount column (expected credit_amount, debit_amount or amount)");
    }
    const bool signedAmount = (creditCol < 0 && debitCol < 0);
    report.signedAmountColumn = signedAmount;

    const size_t n = batch.rows.size();
    const DateLocaleHint dateHint = ValueParsers::dateLocaleHintFromString(options.dateLocaleHint);
    const NumericSeparatorPolicy numericPolicy = ValueParsers::numericPolicyFromString(options.numericLocaleHint);

    TypedDataset data(n);

    const std::pair<const char*, int> textFields[] = {
        {"transaction_id", indexOf(canonical, "transaction_id")},
        {"transaction_description", indexOf(canonical, "transaction_description")},
        {"transaction_category", indexOf(canonical, "transaction_category")}
    };
    for (const auto& field : textFields) {
        if (field.second < 0) report.createdColumns.push_back(field.first);
        addTextColumn(data, batch, field.second, field.first);
    }

    IntVec dates(n, 0);
    MissingMask dateMissing(n, static_cast<uint8_t>(0));
    for (size_t r = 0; r < n; ++r) {
        const std::string& raw = cellAt(batch, r, dateCol);
        if (CommonUtils::isMissingToken(raw)) {
            dateMissing[r] = 1;
            ++report.missingDates;
        } else if (!ValueParsers::parseDate(raw, dateHint, dates[r])) {
            dateMissing[r] = 1;
            ++report.unparseableDates;
        }
    }
    data.addIntegerColumn("transaction_date", std::move(dates), std::move(dateMissing), ColumnType::DATE);

    NumVec credit(n, 0.0), debit(n, 0.0), net(n, 0.0), absAmount(n, 0.0);
    MissingMask creditMissing(n, static_cast<uint8_t>(0));
    MissingMask debitMissing(n, static_cast<uint8_t>(0));
    MissingMask netMissing(n, static_cast<uint8_t>(0));
    std::vector<bool> isIncome(n, false), isExpense(n, false);

    for (size_t r = 0; r < n; ++r) {
        AmountCell c;
        AmountCell d;
        if (signedAmount) {
            const AmountCell signedCell = readAmount(cellAt(batch, r, amountCol), numericPolicy);
            c = signedCell;
            d = signedCell;
            c.value = signedCell.value > 0.0 ? signedCell.value : 0.0;
            d.value = signedCell.value < 0.0 ? -signedCell.value : 0.0;
        } else {
            c = readAmount(cellAt(batch, r, creditCol), numericPolicy);
            d = readAmount(cellAt(batch, r, debitCol), numericPolicy);
            c.value = std::abs(c.value);
            d.value = std::abs(d.value);
        }

        credit[r] = c.value;
        debit[r] = d.value;
        creditMissing[r] = c.invalid ? 1 : 0;
        debitMissing[r] = d.invalid ? 1 : 0;

        if (c.invalid || d.invalid) {
            netMissing[r] = 1;
            ++report.unparseableAmounts;
            continue;
        }
        if (c.blank && d.blank) {
            netMissing[r] = 1;
            creditMissing[r] = 1;
            debitMissing[r] = 1;
            ++report.missingAmounts;
            continue;
        }

        if (!signedAmount && credit[r] != 0.0 && debit[r] != 0.0) ++report.bothSidesNonZero;
        net[r] = CommonUtils::roundToCents(credit[r] - debit[r]);
        absAmount[r] = std::abs(net[r]);
        isIncome[r] = net[r] > 0.0;
        isExpense[r] = net[r] < 0.0;
        if (net[r] == 0.0) ++report.zeroNetRows;
    }

    data.addNumericColumn("credit_amount", std::move(credit), std::move(creditMissing));
    data.addNumericColumn("debit_amount", std::move(debit), std::move(debitMissing));
    data.addNumericColumn("net_amount", net, netMissing);
    data.addNumericColumn("abs_amount", absAmount, netMissing);
    data.addNumericColumn("net_transaction_amount", std::move(net), netMissing);
    data.addNumericColumn("amount_abs", std::move(absAmount), std::move(netMissing));
    data.addBooleanColumn("is_income", isIncome);
    data.addBooleanColumn("is_expense", isExpense);

    const int currencyCol = indexOf(canonical, "currency");
    if (currencyCol >= 0) addTextColumn(data, batch, currencyCol, "currency", true);

    const auto& reserved = derivedNames();
    for (size_t c = 0; c < canonical.size(); ++c) {
        if (reserved.count(canonical[c]) || data.hasColumn(canonical[c])) continue;
        addTextColumn(data, batch, static_cast<int>(c), canonical[c]);
    }

    if (report.bothSidesNonZero > 0) {
        std::cout << "[Ledgerline][Normalizer] " << report.bothSidesNonZero
                  << " rows carry both a credit and a debit; net_amount is their difference\n";
    }
    if (report.zeroNetRows > 0) {
        std::cout << "[Ledgerline][Normalizer] " << report.zeroNetRows
                  << " rows have net_amount == 0 and are neither income nor expense\n";
    }
    return {std::move(data), std::move(report)};
}
