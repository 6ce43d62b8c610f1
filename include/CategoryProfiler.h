#pragma once
#include "TypedDataset.h"
#include <map>
#include <string>
#include <unordered_map>

struct CategoryMetadata {
    std::string type = "unknown";
    bool taxDeductible = false;
    int priority = 3; // 1 = high, 2 = medium, 3 = low
};

/**
 * @brief Static category -> metadata lookup keyed by the exact category string.
 */
class CategoryLookup {
public:
    /**
     * @brief The seventeen categories of the card export format.
     */
    static CategoryLookup builtin();

    /**
     * @brief Reads `category,type,tax_deductible,priority` rows on top of `base`.
     * @throws Ledgerline::IOException when the file cannot be opened.
     * @throws Ledgerline::ConfigurationException on an invalid row.
     */
    static CategoryLookup fromFile(const std::string& path, const CategoryLookup& base);

    static const CategoryMetadata& unknown();
    static std::string priorityLabel(int priority);

    void set(const std::string& category, CategoryMetadata metadata);
    const CategoryMetadata& lookup(const std::string& category) const;
    bool contains(const std::string& category) const { return entries_.count(category) > 0; }
    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, CategoryMetadata> entries_;
};

struct CategoryProfile {
    std::string category; // empty for rows without a category
    CategoryMetadata metadata;
    bool known = false;
    size_t rowCount = 0;
    size_t amountCount = 0; // rows with a non-null net_amount
    double meanNet = 0.0;
    double stdNet = 0.0;    // population standard deviation, 0 below two amounts
};

using CategoryProfileMap = std::map<std::string, CategoryProfile>;

/**
 * @brief Stage 3: category metadata join, per-category net_amount baselines
 *        and business flags.
 */
class CategoryProfiler {
public:
    static CategoryProfileMap run(TypedDataset& data, const CategoryLookup& lookup);

    /**
     * @brief Population mean/std of net_amount per category, skipping null amounts.
     */
    static CategoryProfileMap buildProfiles(const TypedDataset& data, const CategoryLookup& lookup);
};
