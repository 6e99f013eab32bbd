#pragma once

/// @file include/fce/nutrient_ordering.hpp
/// @brief NutrientOrdering: catalog order, identity keys, header keys,
///        category and unit inference.
///
/// # Module: Nutrient Ordering & Categorization
///
/// ## Responsibility
/// Give every nutrient record a stable place and identity so records from
/// heterogeneous sources can be merged without duplicate rows or columns:
///   - display order: explicit rank -> reference rank -> catalog order -> fallback
///   - identity key:  energy:<unit> | water|<unit> | id:<id> | num:<number> | name:<name>
///   - header key:    canonical_name|canonical_unit (export column identity)
///   - category:      catalog -> ordered pattern rules -> reference hint -> "Other"
///   - unit:          number table -> name heuristics -> "" (unknown)
///
/// ## Catalog
/// Ten categories in fixed order (Proximates, Carbohydrates, Minerals,
/// Vitamins and Other Components, Lipids, Amino acids, Phytosterols, Organic
/// acids, Oligosaccharides, Isoflavones). A catalogued name's order is
/// `category_index * 1000 + position_in_category`.
///
/// ## Guarantees
/// - All lookups are case-insensitive on trimmed names
/// - `sort_nutrients_for_display` is stable
/// - The only mutable state is the reference-hint map, written by
///   `update_reference_from_details`
///
/// ## NOT Responsible For
/// - Merging or rewriting records (see normalizer.hpp)

#include "fce/nutrient_record.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fce::nutrients {

// ─── Catalog data ─────────────────────────────────────────────────────────────

/// One category of the static catalog, nutrient names in display order.
struct CatalogCategory {
    std::string              name;
    std::vector<std::string> nutrients;
};

using NutrientCatalog = std::vector<CatalogCategory>;

/// The built-in ten-category catalog.
[[nodiscard]] NutrientCatalog build_nutrient_catalog();

/// Default unit per lower-cased nutrient name (mg, µg, iu, g, kcal).
[[nodiscard]] std::unordered_map<std::string, std::string> build_nutrient_unit_map();

/// Display name for a known alias, so one export column is used:
/// "total sugars" -> "Sugars, Total", "carbohydrate, by summation" ->
/// "Carbohydrate, by difference", the two Atwater energy rows -> "" (dropped).
/// Unknown names are returned unchanged.
[[nodiscard]] std::string canonical_alias_name(std::string_view name);

// ─── Result types ─────────────────────────────────────────────────────────────

/// Hints recorded from a reference lookup result.
struct ReferenceHint {
    std::optional<long long>   rank;
    std::optional<std::string> category;
    std::string                unit;
};

/// Export-column identity of a record.
struct HeaderKey {
    std::string key;   ///< "name|unit" lower-cased; empty = unmergeable
    std::string name;  ///< canonical display name
    std::string unit;  ///< canonical unit
};

/// Totals re-keyed by header key, in first-seen order.
using HeaderTotals = std::vector<std::pair<std::string, NutrientTotal>>;

// ─── NutrientOrdering ─────────────────────────────────────────────────────────

class NutrientOrdering {
public:
    /// Use the built-in catalog.
    NutrientOrdering();

    explicit NutrientOrdering(NutrientCatalog catalog);

    [[nodiscard]] const NutrientCatalog& catalog() const noexcept { return catalog_; }

    /// Catalog order of a name, `nullopt` when uncatalogued.
    [[nodiscard]] std::optional<long long> order_for_name(std::string_view name) const;

    // ── Identity ──────────────────────────────────────────────────────────────

    /// Identity key of a record. Priority:
    /// 1. name "energy" with a unit -> "energy:<unit>"
    /// 2. name "water"              -> "water|<unit>"
    /// 3. source id                 -> "id:<id>"
    /// 4. source number             -> "num:<number>"
    /// 5. non-empty name            -> "name:<name>"
    /// otherwise "" (unmergeable). Name and unit are trimmed and lower-cased.
    [[nodiscard]] static std::string nutrient_key(const NutrientRecord& record);

    /// Export-column key built from `canonical_alias_name` and the canonical
    /// unit (inferred when the record has none). When the canonical name is
    /// empty the identity key stands in for it; when that is empty too the
    /// key is empty.
    [[nodiscard]] HeaderKey header_key(const NutrientRecord& record) const;

    /// Re-key totals by header key. Among aliases of one column a
    /// lower-priority alias never replaces a higher one; priority is
    /// `carbohydrate, by difference` 2, `carbohydrate[,] by summation` 1,
    /// `sugars, total` 2, `total sugars` 1, anything else 0. At equal
    /// priority the later entry replaces the earlier one in place.
    [[nodiscard]] HeaderTotals
    normalize_totals_by_header_key(const std::vector<NutrientTotal>& totals) const;

    // ── Reference hints ───────────────────────────────────────────────────────

    /// Record rank, category and unit hints from a lookup result. Rows with
    /// no amount are category headers: they name the category of the rows
    /// that follow and only fill a hint that is not yet recorded.
    void update_reference_from_details(const FoodRecord& details);

    [[nodiscard]] std::optional<ReferenceHint> reference_info(const NutrientRecord& record) const;

    // ── Ordering ──────────────────────────────────────────────────────────────

    /// Explicit rank, else reference rank, else catalog order, else `fallback`.
    [[nodiscard]] long long nutrient_order(const NutrientRecord& record, long long fallback) const;

    /// Stable sort by `(nutrient_order(r, index + 10000), index)`.
    [[nodiscard]] std::vector<NutrientRecord>
    sort_nutrients_for_display(std::vector<NutrientRecord> records) const;

    // ── Classification ────────────────────────────────────────────────────────

    /// Category of a name; the record (when given) supplies the reference
    /// hint consulted before the "Other" fallback.
    [[nodiscard]] std::string category_for_nutrient(std::string_view name) const;
    [[nodiscard]] std::string category_for_nutrient(std::string_view name,
                                                    const NutrientRecord& record) const;

    /// Unit of a record whose source omitted it. Returns the record's own unit
    /// when present, otherwise the number table, then name heuristics, else "".
    [[nodiscard]] static std::string infer_unit(const NutrientRecord& record);

    /// Default unit for a bare name: the per-name unit map, else
    /// `infer_unit`, canonicalized.
    [[nodiscard]] std::string unit_for_name(std::string_view name) const;

private:
    [[nodiscard]] std::string classify(const std::string& lower) const;

    NutrientCatalog                                catalog_;
    std::unordered_map<std::string, long long>     order_map_;
    std::unordered_map<std::string, std::string>   category_map_;
    std::unordered_map<std::string, std::string>   unit_map_;
    std::unordered_map<std::string, ReferenceHint> reference_map_;
};

}  // namespace fce::nutrients
