/// @file src/nutrients/nutrient_ordering.cpp
/// @brief NutrientOrdering implementation.

#include "fce/nutrient_ordering.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"
#include "fce/units.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <iterator>
#include <tuple>

#include <fmt/format.h>

namespace fce::nutrients {

using units::UnitConverter;

// ─── Classification tables ────────────────────────────────────────────────────

namespace {

template <typename Range>
bool in(std::string_view needle, const Range& set) {
    return std::find(std::begin(set), std::end(set), needle) != std::end(set);
}

bool in(std::string_view needle, std::initializer_list<std::string_view> set) {
    return std::find(set.begin(), set.end(), needle) != set.end();
}

template <typename Range>
bool contains_any(std::string_view haystack, const Range& needles) {
    return std::any_of(std::begin(needles), std::end(needles),
                       [haystack](std::string_view n) { return text::contains(haystack, n); });
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

constexpr auto AMINO_ACIDS = std::to_array<std::string_view>({
    "tryptophan", "threonine", "isoleucine", "leucine",  "lysine",
    "methionine", "phenylalanine", "tyrosine", "valine", "arginine",
    "histidine",  "alanine", "aspartic acid", "glutamic acid", "glycine",
    "proline",    "serine",  "hydroxyproline", "cysteine", "cystine",
});

constexpr auto ORGANIC_ACIDS = std::to_array<std::string_view>({
    "citric acid", "malic acid", "oxalic acid", "quinic acid",
});

constexpr auto OLIGOSACCHARIDES = std::to_array<std::string_view>({
    "raffinose", "stachyose", "verbascose",
});

constexpr auto ISOFLAVONES = std::to_array<std::string_view>({
    "daidzein", "genistein", "daidzin", "genistin", "glycitin",
});

constexpr auto VITAMIN_MARKERS = std::to_array<std::string_view>({
    "tocopherol", "tocotrienol", "carotene", "lycopene", "lutein", "zeaxanthin",
    "retinol", "folate", "folic acid", "betaine", "choline", "caffeine", "theobromine",
});

constexpr auto MACRO_HINTS = std::to_array<std::string_view>({
    "water", "protein", "lipid", "fat", "ash", "carbohydrate", "fiber", "sugar",
    "starch", "nitrogen", "fatty acids", "sfa", "mufa", "pufa",
});

constexpr auto SIMPLE_SUGARS = std::to_array<std::string_view>({
    "sucrose", "glucose", "fructose", "lactose", "maltose", "galactose",
});

/// Default unit by source nutrient number.
std::string_view unit_for_number(std::string_view number) {
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 13> TABLE = {{
        {"255", "g"},     // Water
        {"203", "g"},     // Protein
        {"204", "g"},     // Total lipid (fat)
        {"298", "g"},     // Total fat (NLEA)
        {"202", "g"},     // Nitrogen
        {"207", "g"},     // Ash
        {"205", "g"},     // Carbohydrate, by difference
        {"291", "g"},     // Fiber, total dietary
        {"269", "g"},     // Sugars, total
        {"268", "kJ"},    // Energy
        {"208", "kcal"},  // Energy
        {"951", "g"},     // Proximates
        {"956", "g"},     // Carbohydrates
    }};
    for (const auto& [num, unit] : TABLE) {
        if (num == number) return unit;
    }
    return {};
}

int alias_priority(std::string_view lower_name) {
    if (lower_name == "carbohydrate, by difference") return 2;
    if (lower_name == "carbohydrate, by summation") return 1;
    if (lower_name == "carbohydrate by summation") return 1;
    if (lower_name == "sugars, total") return 2;
    if (lower_name == "total sugars") return 1;
    return 0;
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

NutrientOrdering::NutrientOrdering() : NutrientOrdering(build_nutrient_catalog()) {}

NutrientOrdering::NutrientOrdering(NutrientCatalog catalog)
    : catalog_(std::move(catalog))
    , unit_map_(build_nutrient_unit_map()) {
    for (std::size_t idx = 0; idx < catalog_.size(); ++idx) {
        const auto& category = catalog_[idx];
        for (std::size_t offset = 0; offset < category.nutrients.size(); ++offset) {
            const std::string key = text::fold(category.nutrients[offset]);
            order_map_[key] = static_cast<long long>(idx) * constants::CATEGORY_ORDER_STRIDE +
                              static_cast<long long>(offset);
            category_map_[key] = category.name;
        }
    }
}

std::optional<long long> NutrientOrdering::order_for_name(std::string_view name) const {
    if (const auto it = order_map_.find(text::fold(name)); it != order_map_.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─── Identity ─────────────────────────────────────────────────────────────────

std::string NutrientOrdering::nutrient_key(const NutrientRecord& record) {
    const std::string name = text::fold(record.name);
    const std::string unit = text::fold(record.unit);

    if (name == "energy" && !unit.empty()) {
        return "energy:" + unit;
    }
    if (name == "water") {
        return "water|" + unit;
    }
    if (record.id) {
        return fmt::format("id:{}", *record.id);
    }
    if (record.number && !record.number->empty()) {
        return "num:" + *record.number;
    }
    return name.empty() ? std::string() : "name:" + name;
}

HeaderKey NutrientOrdering::header_key(const NutrientRecord& record) const {
    const std::string name = canonical_alias_name(record.name);
    const std::string unit = UnitConverter::canonical_unit(infer_unit(record));

    const std::string unit_part = text::fold(unit);
    const std::string name_part = text::fold(name);
    if (!name_part.empty()) {
        return HeaderKey{.key = name_part + "|" + unit_part, .name = name, .unit = unit};
    }

    const std::string base_key = nutrient_key(record);
    if (base_key.empty()) {
        return HeaderKey{.key = {}, .name = name, .unit = unit};
    }
    return HeaderKey{.key = base_key + "|" + unit_part, .name = name, .unit = unit};
}

HeaderTotals
NutrientOrdering::normalize_totals_by_header_key(const std::vector<NutrientTotal>& totals) const {
    HeaderTotals normalized;
    std::unordered_map<std::string, std::size_t> slot;     // header key -> index in normalized
    std::unordered_map<std::string, int>         best;     // header key -> priority held

    for (const auto& entry : totals) {
        const NutrientRecord probe{.name = entry.name, .unit = entry.unit};
        const HeaderKey hk = header_key(probe);
        if (hk.key.empty()) {
            continue;
        }

        const int priority = alias_priority(text::fold(entry.name));
        const auto held = best.find(hk.key);
        if (held != best.end() && priority < held->second) {
            continue;
        }
        best[hk.key] = priority;

        NutrientTotal value{
            .name   = hk.name.empty() ? entry.name : hk.name,
            .unit   = hk.unit.empty() ? entry.unit : hk.unit,
            .amount = entry.amount,
        };
        if (const auto it = slot.find(hk.key); it != slot.end()) {
            normalized[it->second].second = std::move(value);
        } else {
            slot.emplace(hk.key, normalized.size());
            normalized.emplace_back(hk.key, std::move(value));
        }
    }
    return normalized;
}

// ─── Reference hints ──────────────────────────────────────────────────────────

void NutrientOrdering::update_reference_from_details(const FoodRecord& details) {
    std::optional<std::string> current_category;

    for (const auto& row : details.nutrients) {
        const std::string key = nutrient_key(row);
        if (key.empty()) {
            continue;
        }

        if (!row.amount) {
            // Header row: names the category of what follows.
            if (std::string heading = text::trim(row.name); !heading.empty()) {
                current_category = std::move(heading);
            }
            reference_map_.try_emplace(
                key, ReferenceHint{.rank = row.rank, .category = current_category, .unit = row.unit});
            continue;
        }

        reference_map_[key] =
            ReferenceHint{.rank = row.rank, .category = current_category, .unit = row.unit};
    }
}

std::optional<ReferenceHint> NutrientOrdering::reference_info(const NutrientRecord& record) const {
    if (const auto it = reference_map_.find(nutrient_key(record)); it != reference_map_.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─── Ordering ─────────────────────────────────────────────────────────────────

long long NutrientOrdering::nutrient_order(const NutrientRecord& record, long long fallback) const {
    if (record.rank) {
        return *record.rank;
    }
    if (const auto ref = reference_info(record); ref && ref->rank) {
        return *ref->rank;
    }
    if (const auto order = order_for_name(record.name)) {
        return *order;
    }
    return fallback;
}

std::vector<NutrientRecord>
NutrientOrdering::sort_nutrients_for_display(std::vector<NutrientRecord> records) const {
    struct Keyed {
        long long      order;
        std::size_t    index;
        NutrientRecord record;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto fallback =
            static_cast<long long>(i + constants::DISPLAY_ORDER_FALLBACK_BASE);
        keyed.push_back(Keyed{nutrient_order(records[i], fallback), i, std::move(records[i])});
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
        return std::tie(a.order, a.index) < std::tie(b.order, b.index);
    });

    std::vector<NutrientRecord> sorted;
    sorted.reserve(keyed.size());
    for (auto& k : keyed) {
        sorted.push_back(std::move(k.record));
    }
    return sorted;
}

// ─── Classification ───────────────────────────────────────────────────────────

std::string NutrientOrdering::classify(const std::string& lower) const {
    if (const auto it = category_map_.find(lower); it != category_map_.end()) {
        return it->second;
    }

    // Pattern rules, first match wins.
    if (starts_with(lower, "vitamin ") || contains_any(lower, VITAMIN_MARKERS)) {
        return "Vitamins and Other Components";
    }
    if (in(lower, AMINO_ACIDS)) {
        return "Amino acids";
    }
    if (text::contains(lower, "fatty acids") || starts_with(lower, "sfa ") ||
        starts_with(lower, "mufa ") || starts_with(lower, "pufa ") ||
        in(lower, {"cholesterol", "total lipid (fat)", "total fat (nlea)"})) {
        return "Lipids";
    }
    if (text::contains(lower, "sterol")) {
        return "Phytosterols";
    }
    if (in(lower, ORGANIC_ACIDS) || ends_with(lower, "acid")) {
        return "Organic acids";
    }
    if (in(lower, OLIGOSACCHARIDES)) {
        return "Oligosaccharides";
    }
    if (in(lower, ISOFLAVONES)) {
        return "Isoflavones";
    }
    return {};
}

std::string NutrientOrdering::category_for_nutrient(std::string_view name) const {
    std::string category = classify(text::fold(name));
    return category.empty() ? std::string(constants::FALLBACK_CATEGORY) : category;
}

std::string NutrientOrdering::category_for_nutrient(std::string_view name,
                                                    const NutrientRecord& record) const {
    std::string category = classify(text::fold(name));
    if (!category.empty()) {
        return category;
    }
    if (const auto ref = reference_info(record); ref && ref->category && !ref->category->empty()) {
        return *ref->category;
    }
    return std::string(constants::FALLBACK_CATEGORY);
}

std::string NutrientOrdering::infer_unit(const NutrientRecord& record) {
    if (!text::is_blank(record.unit)) {
        return record.unit;
    }

    const std::string number = record.number ? text::trim(*record.number) : std::string();
    if (const auto by_number = unit_for_number(number); !by_number.empty()) {
        return std::string(by_number);
    }

    const std::string name = text::to_lower(record.name);
    if (text::contains(name, "energy") && text::contains(name, "kcal")) {
        return "kcal";
    }
    if (text::contains(name, "energy") && text::contains(name, "kj")) {
        return "kJ";
    }
    if (contains_any(name, MACRO_HINTS) || text::contains(name, ":")) {
        return "g";
    }
    if (in(name, AMINO_ACIDS) || in(name, SIMPLE_SUGARS) || name == "alcohol, ethyl") {
        return "g";
    }
    return {};
}

std::string NutrientOrdering::unit_for_name(std::string_view name) const {
    const std::string lower = text::fold(name);
    if (lower.empty()) {
        return {};
    }
    if (const auto it = unit_map_.find(lower); it != unit_map_.end()) {
        return UnitConverter::canonical_unit(it->second);
    }
    const std::string inferred = infer_unit(NutrientRecord{.name = std::string(name)});
    const std::string canonical = UnitConverter::canonical_unit(inferred);
    return canonical.empty() ? inferred : canonical;
}

}  // namespace fce::nutrients
