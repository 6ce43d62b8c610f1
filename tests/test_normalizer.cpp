#include <catch2/catch.hpp>

#include "LedgerExceptions.h"
#include "Normalizer.h"
#include "TestBatches.h"

#include <algorithm>
#include <cmath>

TEST_CASE("Normalizer derives canonical amount columns", "[normalizer]") {
    const RawBatch batch = makeTransactions({
        {"T1", "2024-03-15", "Salary March", "Income", "2,500.00", ""},
        {"T2", "2024-03-16", "Coffee", "Food", "", "4.50"},
        {"T3", "2024-03-17", "Refund", "Shopping", "20", "-5"},
        {"T4", "2024-03-18", "Transfer", "Transfer", "10", "10"}
    });
    const NormalizeResult result = Normalizer::run(batch, NormalizerOptions{});
    const TypedDataset& data = result.data;

    REQUIRE(data.rowCount() == 4);
    const auto& credit = data.numeric("credit_amount");
    const auto& debit = data.numeric("debit_amount");
    const auto& net = data.numeric("net_amount");
    const auto& absAmount = data.numeric("abs_amount");

    CHECK(credit[0] == Approx(2500.0));
    CHECK(debit[1] == Approx(4.5));
    CHECK(credit[1] == Approx(0.0));
    CHECK(debit[2] == Approx(5.0));
    CHECK(net[2] == Approx(15.0));
    CHECK(net[1] == Approx(-4.5));

    for (size_t r = 0; r < data.rowCount(); ++r) {
        INFO("row " << r);
        CHECK(credit[r] >= 0.0);
        CHECK(debit[r] >= 0.0);
        CHECK(net[r] == Approx(credit[r] - debit[r]));
        CHECK(absAmount[r] == Approx(std::abs(net[r])));
        CHECK(data.numeric("net_transaction_amount")[r] == Approx(net[r]));
        CHECK(data.numeric("amount_abs")[r] == Approx(absAmount[r]));
    }

    const auto& income = data.integers("is_income");
    const auto& expense = data.integers("is_expense");
    CHECK(income == IntVec({1, 0, 1, 0}));
    CHECK(expense == IntVec({0, 1, 0, 0}));
    CHECK(data.column("is_income").type == ColumnType::BOOLEAN);
    CHECK(result.report.zeroNetRows == 1);
    CHECK(result.report.bothSidesNonZero == 2);
}

TEST_CASE("Normalizer maps raw headers and parses dates", "[normalizer]") {
    const RawBatch batch = makeBatch({"Date", "Description", "Amount", "Currency Code", "Merchant Name"}, {
        {"15/03/2024", "Groceries", "-42.10", "eur", "Market"},
        {"2024-03-16", "Paycheck", "1000", "usd", ""},
        {"garbage", "Unknown", "abc", "", "Shop"}
    });
    const NormalizeResult result = Normalizer::run(batch, NormalizerOptions{});
    const TypedDataset& data = result.data;

    CHECK(result.report.signedAmountColumn);
    CHECK(result.report.bothSidesNonZero == 0);
    CHECK(data.column("transaction_date").type == ColumnType::DATE);
    CHECK(data.integers("transaction_date")[0] == dayNumber(2024, 3, 15));
    CHECK(data.integers("transaction_date")[1] == dayNumber(2024, 3, 16));
    CHECK(data.isMissing("transaction_date", 2));
    CHECK(result.report.unparseableDates == 1);

    CHECK(data.numeric("debit_amount")[0] == Approx(42.10));
    CHECK(data.numeric("credit_amount")[0] == Approx(0.0));
    CHECK(data.numeric("credit_amount")[1] == Approx(1000.0));
    CHECK(data.isMissing("net_amount", 2));
    CHECK(result.report.unparseableAmounts == 1);

    CHECK(data.categorical("currency")[0] == "EUR");
    CHECK(data.categorical("currency")[1] == "USD");
    CHECK(data.isMissing("currency", 2));

    REQUIRE(data.hasColumn("merchant_name"));
    CHECK(data.categorical("merchant_name")[0] == "Market");
    CHECK(data.isMissing("merchant_name", 1));
    CHECK_FALSE(data.hasColumn("amount"));

    const auto& created = result.report.createdColumns;
    CHECK(std::find(created.begin(), created.end(), "transaction_id") != created.end());
    CHECK(std::find(created.begin(), created.end(), "transaction_category") != created.end());
    CHECK(data.isMissing("transaction_id", 0));
    CHECK(data.isMissing("transaction_category", 1));
}

TEST_CASE("Rows with both amount sides blank have a missing net amount", "[normalizer]") {
    const RawBatch batch = makeTransactions({
        {"T1", "2024-01-02", "Nothing", "Other", "", ""},
        {"T2", "2024-01-03", "Lunch", "Food", "NA", "12"}
    });
    const NormalizeResult result = Normalizer::run(batch, NormalizerOptions{});

    CHECK(result.data.isMissing("net_amount", 0));
    CHECK(result.data.isMissing("abs_amount", 0));
    CHECK(result.data.integers("is_income")[0] == 0);
    CHECK(result.data.integers("is_expense")[0] == 0);
    CHECK(result.report.missingAmounts == 1);

    CHECK_FALSE(result.data.isMissing("net_amount", 1));
    CHECK(result.data.numeric("net_amount")[1] == Approx(-12.0));
}

TEST_CASE("Normalizer rejects batches it cannot interpret", "[normalizer]") {
    CHECK_THROWS_AS(Normalizer::run(makeTransactions({}), NormalizerOptions{}), Ledgerline::DatasetException);
    CHECK_THROWS_AS(Normalizer::run(makeBatch({"description", "amount"}, {{"x", "1"}}), NormalizerOptions{}),
                    Ledgerline::DatasetException);
    CHECK_THROWS_AS(Normalizer::run(makeBatch({"date", "description"}, {{"2024-01-01", "x"}}), NormalizerOptions{}),
                    Ledgerline::DatasetException);
}

TEST_CASE("Locale hints steer ambiguous dates and amounts", "[normalizer]") {
    const RawBatch batch = makeBatch({"date", "amount"}, {{"04/03/2024", "1.234,50"}});

    NormalizerOptions options;
    options.dateLocaleHint = "dmy";
    options.numericLocaleHint = "eu";
    const NormalizeResult dmy = Normalizer::run(batch, options);
    CHECK(dmy.data.integers("transaction_date")[0] == dayNumber(2024, 3, 4));
    CHECK(dmy.data.numeric("credit_amount")[0] == Approx(1234.50));

    options.dateLocaleHint = "mdy";
    const NormalizeResult mdy = Normalizer::run(batch, options);
    CHECK(mdy.data.integers("transaction_date")[0] == dayNumber(2024, 4, 3));
}
