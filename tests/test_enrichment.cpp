#include <catch2/catch.hpp>

#include "ExternalEnrichment.h"
#include "HttpEnrichmentProviders.h"
#include "LedgerExceptions.h"
#include "MockProviders.h"
#include "Normalizer.h"
#include "TestBatches.h"

#include <algorithm>
#include <memory>

namespace {
TypedDataset normalized(const RawBatch& batch) {
    return Normalizer::run(batch, NormalizerOptions{}).data;
}

RawBatch holidayBatch() {
    return makeTransactions({
        {"T1", "2024-07-04", "Fireworks", "Merchandise", "", "40"},
        {"T2", "2024-07-05", "Groceries", "food", "", "60"},
        {"T3", "2023-12-25", "Gift", "Merchandise", "", "25"},
        {"T4", "", "Undated", "Other", "", "5"}
    });
}

RawBatch fxBatch() {
    return makeBatch({"id", "date", "description", "category", "amount", "currency"}, {
        {"F1", "2024-03-15", "Hotel", "Other Travel", "-10", "eur"},
        {"F2", "2024-03-15", "Dinner", "Dining", "-20", "EUR"},
        {"F3", "2024-03-15", "Taxi", "taxi", "-5", "GBP"},
        {"F4", "2024-03-15", "Coffee", "Dining", "-3", "USD"},
        {"F5", "2024-03-15", "Unknown", "Other", "-7", ""}
    });
}

EnrichmentConfig fxOnly() {
    EnrichmentConfig config;
    config.enableHolidays = false;
    config.enableFx = true;
    config.fxTargetCurrency = "USD";
    return config;
}
} // namespace

TEST_CASE("Holiday flags come from one lookup per country and year", "[enrichment]") {
    auto holidays = std::make_shared<MockHolidayProvider>();
    holidays->calendars[{"US", 2024}] = {dayNumber(2024, 7, 4)};
    holidays->calendars[{"US", 2023}] = {dayNumber(2023, 12, 25)};

    TypedDataset data = normalized(holidayBatch());
    const EnrichmentReport report = ExternalEnrichment(holidays, nullptr).run(data, EnrichmentConfig{});

    const auto& flag = data.integers("is_public_holiday");
    CHECK(flag == IntVec({1, 0, 1, 0}));
    CHECK(data.column("is_public_holiday").type == ColumnType::BOOLEAN);
    CHECK(holidays->callsFor("US", 2024) == 1);
    CHECK(holidays->callsFor("US", 2023) == 1);
    CHECK(holidays->totalCalls() == 2);
    CHECK(report.holidaysApplied);
    CHECK(report.holidayKeys == 2);
    CHECK(report.holidayKeysUnavailable == 0);
    CHECK(report.holidayRows == 2);
    CHECK_FALSE(data.hasColumn("fx_rate_USD"));
}

TEST_CASE("Holiday lookup failures degrade to non-holiday rows", "[enrichment]") {
    TypedDataset data = normalized(holidayBatch());
    const size_t before = data.colCount();
    EnrichmentReport report;

    SECTION("unreachable provider") {
        auto holidays = std::make_shared<MockHolidayProvider>();
        holidays->unreachable = true;
        holidays->calendars[{"US", 2024}] = {dayNumber(2024, 7, 4)};
        report = ExternalEnrichment(holidays, nullptr).run(data, EnrichmentConfig{});
        CHECK(holidays->totalCalls() == 2);
    }
    SECTION("throwing provider") {
        auto holidays = std::make_shared<MockHolidayProvider>();
        holidays->throwOnFetch = true;
        report = ExternalEnrichment(holidays, nullptr).run(data, EnrichmentConfig{});
    }
    SECTION("no provider") {
        report = ExternalEnrichment(nullptr, nullptr).run(data, EnrichmentConfig{});
    }

    CHECK(data.colCount() == before + 1);
    CHECK(data.integers("is_public_holiday") == IntVec({0, 0, 0, 0}));
    CHECK(report.holidayKeysUnavailable == 2);
    CHECK(report.holidayRows == 0);
}

TEST_CASE("Holiday country is configurable", "[enrichment]") {
    auto holidays = std::make_shared<MockHolidayProvider>();
    holidays->calendars[{"DE", 2024}] = {dayNumber(2024, 7, 5)};

    EnrichmentConfig config;
    config.holidayCountry = "DE";
    TypedDataset data = normalized(holidayBatch());
    ExternalEnrichment(holidays, nullptr).run(data, config);

    CHECK(data.integers("is_public_holiday") == IntVec({0, 1, 0, 0}));
    CHECK(holidays->callsFor("US", 2024) == 0);
}

TEST_CASE("FX conversion nulls only the rows whose rate is unavailable", "[enrichment]") {
    const int64_t day = dayNumber(2024, 3, 15);
    auto fx = std::make_shared<MockFxRateProvider>();
    fx->rates[{day, "EUR", "USD"}] = 1.1;
    fx->throwingKeys.insert({day, "GBP", "USD"});

    TypedDataset data = normalized(fxBatch());
    const EnrichmentReport report = ExternalEnrichment(nullptr, fx).run(data, fxOnly());

    const auto& rate = data.numeric("fx_rate_USD");
    CHECK(rate[0] == Approx(1.1));
    CHECK(rate[1] == Approx(1.1));
    CHECK(data.isMissing("fx_rate_USD", 2));
    CHECK(rate[3] == Approx(1.0));
    CHECK(data.isMissing("fx_rate_USD", 4));

    const auto& net = data.numeric("net_amount_USD");
    CHECK(net[0] == Approx(-11.0));
    CHECK(net[1] == Approx(-22.0));
    CHECK(data.isMissing("net_amount_USD", 2));
    CHECK(net[3] == Approx(-3.0));
    CHECK(data.isMissing("net_amount_USD", 4));
    CHECK(data.numeric("debit_amount_USD")[0] == Approx(11.0));
    CHECK(data.numeric("credit_amount_USD")[0] == Approx(0.0));

    CHECK(data.numeric("net_amount")[0] == Approx(-10.0));
    CHECK(fx->callsFor(day, "EUR", "USD") == 1);
    CHECK(fx->callsFor(day, "GBP", "USD") == 1);
    CHECK(fx->totalCalls() == 2);

    CHECK(report.fxApplied);
    CHECK(report.fxKeys == 2);
    CHECK(report.fxKeysUnavailable == 1);
    CHECK(report.fxRowsUnresolved == 2);
    CHECK_FALSE(report.holidaysApplied);
    CHECK_FALSE(data.hasColumn("is_public_holiday"));
}

TEST_CASE("FX conversion is skipped without a currency column", "[enrichment]") {
    auto fx = std::make_shared<MockFxRateProvider>();
    TypedDataset data = normalized(holidayBatch());
    const size_t before = data.colCount();

    const EnrichmentReport report = ExternalEnrichment(nullptr, fx).run(data, fxOnly());

    CHECK(report.fxSkippedNoCurrency);
    CHECK_FALSE(report.fxApplied);
    CHECK(data.colCount() == before);
    CHECK(fx->totalCalls() == 0);
}

TEST_CASE("FX amount fields that are not numeric columns are reported", "[enrichment]") {
    const int64_t day = dayNumber(2024, 3, 15);
    auto fx = std::make_shared<MockFxRateProvider>();
    fx->rates[{day, "EUR", "USD"}] = 2.0;
    fx->rates[{day, "GBP", "USD"}] = 1.25;

    EnrichmentConfig config = fxOnly();
    config.fxAmountFields = {"abs_amount", "tip_amount", "transaction_description"};
    TypedDataset data = normalized(fxBatch());
    const EnrichmentReport report = ExternalEnrichment(nullptr, fx).run(data, config);

    CHECK(data.numeric("abs_amount_USD")[0] == Approx(20.0));
    CHECK(data.numeric("abs_amount_USD")[2] == Approx(6.25));
    CHECK_FALSE(data.hasColumn("tip_amount_USD"));
    CHECK_FALSE(data.hasColumn("transaction_description_USD"));
    CHECK(report.fxMissingFields == std::vector<std::string>({"tip_amount", "transaction_description"}));
}

TEST_CASE("Enrichment caches record unavailable keys", "[enrichment]") {
    HolidayCalendar calendar;
    calendar.store("US", 2024, std::set<int64_t>{dayNumber(2024, 1, 1)});
    calendar.store("US", 2025, std::nullopt);
    CHECK(calendar.contains("US", 2025));
    CHECK_FALSE(calendar.available("US", 2025));
    CHECK(calendar.isHoliday("US", dayNumber(2024, 1, 1)));
    CHECK_FALSE(calendar.isHoliday("US", dayNumber(2025, 1, 1)));
    CHECK_FALSE(calendar.isHoliday("FR", dayNumber(2024, 1, 1)));
    CHECK(calendar.unavailableCount() == 1);

    FxRateTable table;
    const FxRateTable::Key key{dayNumber(2024, 1, 2), "EUR", "USD"};
    table.store(key, 1.09);
    table.store({dayNumber(2024, 1, 2), "JPY", "USD"}, std::nullopt);
    REQUIRE(table.rate(key).has_value());
    CHECK(*table.rate(key) == Approx(1.09));
    CHECK_FALSE(table.rate({dayNumber(2024, 1, 2), "JPY", "USD"}).has_value());
    CHECK_FALSE(table.rate({dayNumber(2024, 1, 3), "EUR", "USD"}).has_value());
    CHECK(table.unavailableCount() == 1);
}

TEST_CASE("HTTP provider responses reject unexpected shapes", "[enrichment]") {
    const auto days = NagerHolidayProvider::parseHolidays(
        R"([{"date":"2024-01-01","name":"New Year's Day"},{"date":"2024-07-04"},{"name":"no date"}])");
    const std::set<int64_t> expected = {dayNumber(2024, 1, 1), dayNumber(2024, 7, 4)};
    CHECK(days == expected);
    CHECK_THROWS_AS(NagerHolidayProvider::parseHolidays("{\"message\":\"x\"}"), Ledgerline::EnrichmentException);
    CHECK_THROWS_AS(NagerHolidayProvider::parseHolidays("<html>"), Ledgerline::EnrichmentException);

    const auto rate = FrankfurterFxProvider::parseRate(
        R"({"amount":1.0,"base":"EUR","date":"2024-03-15","rates":{"USD":1.0892}})", "USD");
    REQUIRE(rate.has_value());
    CHECK(*rate == Approx(1.0892));
    CHECK_FALSE(FrankfurterFxProvider::parseRate(R"({"rates":{"GBP":0.85}})", "USD").has_value());
    CHECK_THROWS_AS(FrankfurterFxProvider::parseRate(R"({"message":"not found"})", "USD"),
                    Ledgerline::EnrichmentException);
    CHECK_THROWS_AS(FrankfurterFxProvider::parseRate("", "USD"), Ledgerline::EnrichmentException);
}
