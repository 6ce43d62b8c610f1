#include "CategoryProfiler.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "LedgerExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

namespace {
int parsePriority(const std::string& raw, const std::string& context) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(raw));
    if (v == "high" || v == "1") return 1;
    if (v == "medium" || v == "2") return 2;
    if (v == "low" || v == "3") return 3;
    throw Ledgerline::ConfigurationException("Invalid priority '" + raw + "' for " + context);
}

bool parseDeductible(const std::string& raw, const std::string& context) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(raw));
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no" || v.empty()) return false;
    throw Ledgerline::ConfigurationException("Invalid tax_deductible '" + raw + "' for " + context);
}

// Welford accumulator; variance is the population variance.
struct RunningMoments {
    size_t count = 0;
    double mean = 0.0;
    double m2 = 0.0;

    void push(double x) {
        ++count;
        const double delta = x - mean;
        mean += delta / static_cast<double>(count);
        m2 += delta * (x - mean);
    }

    double populationStd() const {
        if (count < 2) return 0.0;
        return std::sqrt(std::max(0.0, m2 / static_cast<double>(count)));
    }
};

std::string categoryKey(const TypedDataset& data, const StrVec& categories, size_t row) {
    return data.isMissing("transaction_category", row) ? std::string() : categories[row];
}
} // namespace

CategoryLookup CategoryLookup::builtin() {
    CategoryLookup lookup;
    lookup.set("Other Services", {"service", false, 2});
    lookup.set("Health Care", {"healthcare", true, 1});
    lookup.set("Payment/Credit", {"payment", false, 1});
    lookup.set("Merchandise", {"retail", false, 3});
    lookup.set("Phone/Cable", {"utilities", false, 2});
    lookup.set("Fee/Interest Charge", {"fee", false, 1});
    lookup.set("Other", {"miscellaneous", false, 3});
    lookup.set("Dining", {"food_beverage", false, 3});
    lookup.set("Gas/Automotive", {"transportation", true, 2});
    lookup.set("Other Travel", {"travel", true, 2});
    lookup.set("restaurants", {"food_beverage", false, 3});
    lookup.set("beauty", {"personal_care", false, 3});
    lookup.set("fuel", {"transportation", true, 2});
    lookup.set("air", {"transportation", true, 2});
    lookup.set("gaz", {"transportation", true, 2});
    lookup.set("food", {"food_beverage", false, 3});
    lookup.set("taxi", {"transportation", true, 2});
    return lookup;
}

CategoryLookup CategoryLookup::fromFile(const std::string& path, const CategoryLookup& base) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Ledgerline::IOException("Could not open category map: " + path);

    CategoryLookup lookup = base;
    CSVUtils::skipBOM(in);
    bool headerSeen = false;
    size_t lineNo = 0;
    while (in.peek() != EOF) {
        std::vector<std::string> record = CSVUtils::readRecord(in, ',');
        ++lineNo;
        if (record.empty()) continue;
        if (!headerSeen) {
            headerSeen = true;
            if (CommonUtils::toLower(record.front()) == "category") continue;
        }
        if (record.size() < 4 || record[0].empty()) {
            throw Ledgerline::ConfigurationException(
                "Category map line " + std::to_string(lineNo) + " needs category,type,tax_deductible,priority");
        }
        const std::string context = "category '" + record[0] + "'";
        CategoryMetadata meta;
        meta.type = CommonUtils::toLower(record[1]);
        meta.taxDeductible = parseDeductible(record[2], context);
        meta.priority = parsePriority(record[3], context);
        lookup.set(record[0], std::move(meta));
    }
    return lookup;
}

const CategoryMetadata& CategoryLookup::unknown() {
    static const CategoryMetadata meta{};
    return meta;
}

std::string CategoryLookup::priorityLabel(int priority) {
    switch (priority) {
        case 1: return "high";
        case 2: return "medium";
        default: return "low";
    }
}

void CategoryLookup::set(const std::string& category, CategoryMetadata metadata) {
    entries_[category] = std::move(metadata);
}

const CategoryMetadata& CategoryLookup::lookup(const std::string& category) const {
    const auto it = entries_.find(category);
    return it == entries_.end() ? unknown() : it->second;
}

CategoryProfileMap CategoryProfiler::buildProfiles(const TypedDataset& data, const CategoryLookup& lookup) {
    const StrVec& categories = data.categorical("transaction_category");
    const NumVec& net = data.numeric("net_amount");

    CategoryProfileMap profiles;
    std::map<std::string, RunningMoments> moments;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        const std::string key = categoryKey(data, categories, r);
        CategoryProfile& profile = profiles[key];
        if (profile.rowCount == 0) {
            profile.category = key;
            profile.known = !key.empty() && lookup.contains(key);
            profile.metadata = key.empty() ? CategoryLookup::unknown() : lookup.lookup(key);
        }
        ++profile.rowCount;
        if (!data.isMissing("net_amount", r)) moments[key].push(net[r]);
    }

    for (auto& entry : profiles) {
        const auto it = moments.find(entry.first);
        if (it == moments.end()) continue;
        entry.second.amountCount = it->second.count;
        entry.second.meanNet = it->second.mean;
        entry.second.stdNet = it->second.populationStd();
    }
    return profiles;
}

CategoryProfileMap CategoryProfiler::run(TypedDataset& data, const CategoryLookup& lookup) {
    CategoryProfileMap profiles = buildProfiles(data, lookup);

    const size_t n = data.rowCount();
    const StrVec categories = data.categorical("transaction_category");
    const IntVec isIncome = data.integers("is_income");
    const IntVec isExpense = data.integers("is_expense");

    StrVec type(n), priorityLabel(n);
    IntVec priority(n, 3), rowCount(n, 0);
    NumVec mean(n, 0.0), stddev(n, 0.0);
    MissingMask none(n, static_cast<uint8_t>(0));
    MissingMask statsMissing(n, static_cast<uint8_t>(0));
    std::vector<bool> deductible(n, false), fee(n, false), payment(n, false);
    std::vector<bool> discretionary(n, false), refund(n, false);

    size_t unknownRows = 0;
    for (size_t r = 0; r < n; ++r) {
        const CategoryProfile& profile = profiles.at(categoryKey(data, categories, r));
        const CategoryMetadata& meta = profile.metadata;
        if (!profile.known) ++unknownRows;

        type[r] = meta.type;
        deductible[r] = meta.taxDeductible;
        priority[r] = meta.priority;
        priorityLabel[r] = CategoryLookup::priorityLabel(meta.priority);
        rowCount[r] = static_cast<int64_t>(profile.rowCount);
        if (profile.amountCount == 0) {
            statsMissing[r] = 1;
        } else {
            mean[r] = profile.meanNet;
            stddev[r] = profile.stdNet;
        }

        fee[r] = CommonUtils::containsIgnoreCase(profile.category, "fee");
        payment[r] = CommonUtils::containsIgnoreCase(profile.category, "payment");
        discretionary[r] = meta.priority == 3 && isExpense[r] != 0;
        refund[r] = isIncome[r] != 0 && meta.type != "payment";
    }

    data.addCategoricalColumn("category_type", std::move(type), none);
    data.addBooleanColumn("category_tax_deductible", deductible);
    data.addIntegerColumn("category_priority", std::move(priority), none);
    data.addCategoricalColumn("category_priority_label", std::move(priorityLabel), none);
    data.addIntegerColumn("cat_row_count", std::move(rowCount), none);
    data.addNumericColumn("cat_net_mean", std::move(mean), statsMissing);
    data.addNumericColumn("cat_net_std", std::move(stddev), statsMissing);
    data.addBooleanColumn("is_fee_transaction", fee);
    data.addBooleanColumn("is_payment_transaction", payment);
    data.addBooleanColumn("is_discretionary", discretionary);
    data.addBooleanColumn("is_refund", refund);

    std::cout << "[Ledgerline][Category] Profiled " << profiles.size() << " categories";
    if (unknownRows > 0) std::cout << " (" << unknownRows << " rows with unmapped category)";
    std::cout << "\n";
    return profiles;
}
