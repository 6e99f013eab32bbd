/// @file src/nutrients/calculator.cpp
/// @brief NutrientCalculator implementation.

#include "fce/calculator.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"
#include "fce/types.hpp"

#include <string>
#include <unordered_map>

namespace fce::nutrients {

namespace {

/// Column layout of the ingredient x nutrient matrix.
struct Columns {
    std::vector<NutrientTotal>                   heads;  ///< name/unit, amount unused
    std::unordered_map<std::string, Eigen::Index> index;

    Eigen::Index at(const model::Nutrient& n) {
        std::string key = n.name() + '\x1f' + text::fold(n.unit());
        if (const auto it = index.find(key); it != index.end()) {
            return it->second;
        }
        const auto col = static_cast<Eigen::Index>(heads.size());
        heads.push_back(NutrientTotal{.name = n.name(), .unit = n.unit(), .amount = Decimal()});
        index.emplace(std::move(key), col);
        return col;
    }
};

}  // namespace

// ─── Totals ───────────────────────────────────────────────────────────────────

NutrientTotals NutrientCalculator::calculate_totals_per_100g(const model::Formulation& formulation) {
    if (formulation.is_empty()) {
        return {};
    }
    const Decimal total_weight = formulation.total_weight();
    if (total_weight.is_zero()) {
        return {};
    }

    const auto& ingredients = formulation.ingredients();

    // Pass 1: discover the nutrient columns.
    Columns columns;
    for (const auto& ing : ingredients) {
        for (const auto& n : ing.food().nutrients()) {
            (void)columns.at(n);
        }
    }

    // Pass 2: fill the per-100 g matrix and the weight vector.
    const auto rows = static_cast<Eigen::Index>(ingredients.size());
    const auto cols = static_cast<Eigen::Index>(columns.heads.size());
    NutrientMatrix per_100g = NutrientMatrix::Zero(rows, cols);
    DecimalVector  grams(rows);

    for (Eigen::Index r = 0; r < rows; ++r) {
        const auto& ing = ingredients[static_cast<std::size_t>(r)];
        grams(r) = ing.amount_g();
        for (const auto& n : ing.food().nutrients()) {
            // Duplicate rows within one food accumulate, as they would when summed by name.
            per_100g(r, columns.at(n)) += n.amount();
        }
    }

    // Σ amount * grams / 100, re-expressed per 100 g of batch: / total * 100.
    const DecimalVector weighted = per_100g.transpose() * grams;

    NutrientTotals totals = std::move(columns.heads);
    for (Eigen::Index c = 0; c < cols; ++c) {
        totals[static_cast<std::size_t>(c)].amount = weighted(c) / total_weight;
    }
    return totals;
}

std::vector<NutrientTotals>
NutrientCalculator::calculate_per_ingredient(const model::Formulation& formulation) {
    const Decimal basis(constants::NUTRIENT_BASIS_G);

    std::vector<NutrientTotals> result;
    result.reserve(formulation.ingredient_count());
    for (const auto& ing : formulation.ingredients()) {
        const Decimal factor = ing.amount_g() / basis;
        NutrientTotals amounts;
        amounts.reserve(ing.food().nutrients().size());
        for (const auto& n : ing.food().nutrients()) {
            amounts.push_back(NutrientTotal{.name = n.name(), .unit = n.unit(), .amount = n.amount() * factor});
        }
        result.push_back(std::move(amounts));
    }
    return result;
}

// ─── Energy ───────────────────────────────────────────────────────────────────

Energy NutrientCalculator::calculate_energy(const Decimal& protein_g,
                                            const Decimal& carbohydrate_g,
                                            const Decimal& fat_g) {
    const Decimal kcal = protein_g * Decimal(constants::ATWATER_PROTEIN) +
                         carbohydrate_g * Decimal(constants::ATWATER_CARBOHYDRATE) +
                         fat_g * Decimal(constants::ATWATER_FAT);
    return Energy{.kcal = kcal, .kj = kcal * Decimal(constants::KCAL_TO_KJ)};
}

// ─── Lookup ───────────────────────────────────────────────────────────────────

Decimal NutrientCalculator::get_nutrient_value(const NutrientTotals& totals,
                                               std::string_view name,
                                               std::string_view unit) {
    const std::string wanted      = text::to_lower(name);
    const std::string wanted_unit = text::fold(unit);
    for (const auto& t : totals) {
        if (text::to_lower(t.name) != wanted) {
            continue;
        }
        if (!wanted_unit.empty() && text::fold(t.unit) != wanted_unit) {
            continue;
        }
        return t.amount;
    }
    return Decimal();
}

}  // namespace fce::nutrients
