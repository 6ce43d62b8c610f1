#include "TemporalFeatures.h"
#include "CalendarUtils.h"

#include <array>
#include <iostream>

namespace {
const std::array<const char*, 7>& dayNames() {
    static const std::array<const char*, 7> names = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
    };
    return names;
}
} // namespace

void TemporalFeatureGenerator::run(TypedDataset& data) {
    const IntVec& dates = data.integers("transaction_date");
    const MissingMask missing = data.missing("transaction_date");
    const size_t n = data.rowCount();

    IntVec year(n, 0), month(n, 0), dayOfWeek(n, 0), quarter(n, 0), weekOfYear(n, 0);
    IntVec weekend(n, 0), monthStart(n, 0), monthEnd(n, 0);
    StrVec yearMonth(n), dayName(n);

    for (size_t r = 0; r < n; ++r) {
        if (missing[r]) continue;
        const int64_t days = dates[r];
        const CalendarUtils::CivilDate civil = CalendarUtils::civilFromDays(days);
        const int weekday = CalendarUtils::weekdayMonday0(days);

        year[r] = civil.year;
        month[r] = static_cast<int64_t>(civil.month);
        yearMonth[r] = CalendarUtils::formatYearMonth(days);
        dayOfWeek[r] = weekday;
        dayName[r] = dayNames()[static_cast<size_t>(weekday)];
        quarter[r] = static_cast<int64_t>((civil.month - 1) / 3 + 1);
        weekOfYear[r] = static_cast<int64_t>(CalendarUtils::isoWeek(days).week);
        weekend[r] = weekday >= 5 ? 1 : 0;
        monthStart[r] = civil.day == 1 ? 1 : 0;
        monthEnd[r] = static_cast<int>(civil.day) == CalendarUtils::daysInMonth(civil.year, static_cast<int>(civil.month)) ? 1 : 0;
    }

    data.addIntegerColumn("year", year, missing);
    data.addIntegerColumn("month", month, missing);
    data.addCategoricalColumn("year_month", yearMonth, missing);
    data.addIntegerColumn("day_of_week", std::move(dayOfWeek), missing);
    data.addCategoricalColumn("day_name", dayName, missing);
    data.addIntegerColumn("quarter", quarter, missing);
    data.addIntegerColumn("week_of_year", std::move(weekOfYear), missing);
    data.addIntegerColumn("is_weekend", std::move(weekend), missing, ColumnType::BOOLEAN);
    data.addIntegerColumn("is_month_start", std::move(monthStart), missing, ColumnType::BOOLEAN);
    data.addIntegerColumn("is_month_end", std::move(monthEnd), missing, ColumnType::BOOLEAN);

    data.addIntegerColumn("transaction_year", std::move(year), missing);
    data.addIntegerColumn("transaction_month", std::move(month), missing);
    data.addIntegerColumn("transaction_quarter", std::move(quarter), missing);
    data.addCategoricalColumn("transaction_day_of_week", std::move(dayName), missing);

    std::cout << "[Ledgerline][Temporal] Derived calendar fields for " << n << " rows\n";
}
