#pragma once

/// @file include/fce/normalizer.hpp
/// @brief NutrientNormalizer: fixed-order augmentation pipeline for raw
///        nutrient lists.
///
/// # Module: Nutrient Normalizer
///
/// ## Responsibility
/// Fill in the nutrients a data source omitted and collapse the duplicates it
/// delivered, so every food reaches the calculator with one row per nutrient
/// and a consistent energy figure.
///
/// ## Pipeline
///   1. Fat equivalence   "Total lipid (fat)" <-> "Total fat (NLEA)"
///   2. Canonical units   ug / mcg / μg -> µg, kj -> kJ, ...
///   3. Alias merge       one row per canonical name; Atwater energy rows dropped
///   4. Nitrogen          Protein / 6.25 when no Nitrogen amount is present
///   5. Branded water     100 - (fat + protein + carbs + ash + fiber), floor 0
///   6. Energy            kcal = 4P + 4C + 9F, kJ = kcal * 4.184, always recomputed
///
/// ## Guarantees
/// - Steps 1-5 are idempotent; step 6 recomputes but converges, so
///   `normalize(normalize(x)) == normalize(x)`
/// - Every step returns a new list; the input is never mutated
/// - Positions are preserved: derived rows are inserted next to the rows
///   they derive from
/// - Static methods only
///
/// ## NOT Responsible For
/// - Display order or categories (see nutrient_ordering.hpp)
/// - Validating records into model::Nutrient (see core::Engine::build_food)

#include "fce/nutrient_record.hpp"

#include <string_view>
#include <vector>

namespace fce::nutrients {

using NutrientList = std::vector<NutrientRecord>;

/// Nutrient list augmentation pipeline.
class NutrientNormalizer {
public:
    NutrientNormalizer() = delete;  // pure static

    /// Run all six steps in order.
    ///
    /// # Arguments
    /// * `records`   - Raw rows of one food, in source order
    /// * `data_type` - Provenance of the food; only "branded" (any case)
    ///                 enables the water estimate
    [[nodiscard]] static NutrientList normalize(const NutrientList& records,
                                                std::string_view data_type);

    // ── Individual steps ──────────────────────────────────────────────────────

    /// Mirror "Total lipid (fat)" and "Total fat (NLEA)".
    ///
    /// A name counts as present when its first row has an amount.
    /// - neither present: input returned unchanged
    /// - one present: the other is cloned from it (id and number stripped)
    ///   and placed right after or before it, lipid first
    /// - both present: first row of each kept in place
    /// Later duplicates of either name are always removed.
    [[nodiscard]] static NutrientList augment_fat_nutrients(const NutrientList& records);

    /// Rewrite every non-blank unit through `UnitConverter::canonical_unit`.
    [[nodiscard]] static NutrientList canonicalize_units(const NutrientList& records);

    /// Merge alias rows (total sugars / sugars, total; cystine / cysteine;
    /// carbohydrate by summation -> by difference; phosphotidyl ->
    /// phosphatidyl) into the first row of their canonical name, which takes
    /// the canonical name and the first non-null amount. The Atwater energy
    /// rows are dropped. Energy rows merge per unit only.
    [[nodiscard]] static NutrientList merge_aliases(const NutrientList& records);

    /// Insert `Nitrogen = Protein / 6.25` (g) at the Protein row's index when
    /// no Nitrogen row carries an amount and a Protein row does.
    [[nodiscard]] static NutrientList augment_nitrogen(const NutrientList& records);

    /// For branded foods without a Water amount, insert the water estimate at
    /// the earliest macro row (or first).
    [[nodiscard]] static NutrientList augment_branded_water(const NutrientList& records,
                                                            std::string_view data_type);

    /// Keep the first kcal and first kJ Energy rows (ids stripped), drop every
    /// other Energy row, and set both from the Atwater formula. Missing rows
    /// are inserted at the earliest macro row, kJ right after kcal.
    [[nodiscard]] static NutrientList augment_energy(const NutrientList& records);
};

}  // namespace fce::nutrients
