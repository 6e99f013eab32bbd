#pragma once

/// @file include/fce/calculator.hpp
/// @brief NutrientCalculator: formulation-level nutrient totals.
///
/// # Module: Nutrient Calculator
///
/// ## Responsibility
/// Aggregate the per-100 g nutrient values of each ingredient's food into
/// totals per 100 g of the finished formulation:
///
///   total[n] = Σ_i amount_i[n] * (grams_i / 100)  *  100 / Σ_i grams_i
///
/// expressed as one product of the ingredient x nutrient matrix with the
/// ingredient weight vector.
///
/// ## Guarantees
/// - Empty formulation or zero total weight -> empty result, never a division
/// - Columns are identified by (name, unit) in first-seen order, so kcal and
///   kJ Energy rows are never summed together
/// - Exact: all arithmetic is Decimal
///
/// ## NOT Responsible For
/// - Normalizing the food nutrient lists (see normalizer.hpp)

#include "fce/model.hpp"
#include "fce/nutrient_record.hpp"

#include <string_view>
#include <vector>

namespace fce::nutrients {

/// Aggregated nutrient values, one entry per (name, unit), first-seen order.
using NutrientTotals = std::vector<NutrientTotal>;

/// Energy derived from macro-nutrients.
struct Energy {
    Decimal kcal;
    Decimal kj;
};

/// Nutrient aggregation utilities.
class NutrientCalculator {
public:
    NutrientCalculator() = delete;  // pure static

    /// Totals per 100 g of the finished formulation. Entries are grouped by
    /// nutrient name and case-folded unit, not by name alone, so "Energy" in
    /// kcal and in kJ come back as two entries.
    ///
    /// # Returns
    /// Empty for an empty formulation or one whose total weight is 0.
    [[nodiscard]] static NutrientTotals
    calculate_totals_per_100g(const model::Formulation& formulation);

    /// Absolute nutrient amounts contributed by each ingredient (not per
    /// 100 g), indexed like `formulation.ingredients()`.
    [[nodiscard]] static std::vector<NutrientTotals>
    calculate_per_ingredient(const model::Formulation& formulation);

    /// Atwater energy: kcal = 4P + 4C + 9F, kJ = kcal * 4.184.
    [[nodiscard]] static Energy calculate_energy(const Decimal& protein_g,
                                                 const Decimal& carbohydrate_g,
                                                 const Decimal& fat_g);

    /// Amount of the first total whose name matches case-insensitively (and
    /// whose unit matches, when `unit` is given); 0 when absent.
    [[nodiscard]] static Decimal get_nutrient_value(const NutrientTotals& totals,
                                                    std::string_view name,
                                                    std::string_view unit = {});
};

}  // namespace fce::nutrients
