/// @file src/model/ingredient.cpp
/// @brief Ingredient entity and the ScaleType parser.

#include "fce/model.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"

namespace fce::model {

// ─── Ingredient ───────────────────────────────────────────────────────────────

Ingredient::Ingredient(std::shared_ptr<const Food> food, Decimal amount_g, bool locked)
    : food_(std::move(food))
    , amount_g_(std::move(amount_g))
    , locked_(locked) {}

std::optional<Ingredient>
Ingredient::make(std::shared_ptr<const Food> food, Decimal amount_g, bool locked) {
    if (!food || amount_g.is_negative()) {
        return std::nullopt;
    }
    return Ingredient(std::move(food), std::move(amount_g), locked);
}

bool Ingredient::set_amount_g(Decimal amount) {
    if (amount.is_negative()) {
        return false;
    }
    amount_g_ = std::move(amount);
    return true;
}

Decimal Ingredient::calculate_percentage(const Decimal& total_weight) const {
    if (total_weight.is_zero()) {
        return Decimal();
    }
    return amount_g_ / total_weight * Decimal(100);
}

Decimal Ingredient::get_nutrient_amount(std::string_view nutrient_name) const {
    const auto nutrient = food_->get_nutrient(nutrient_name);
    if (!nutrient) {
        return Decimal();
    }
    return nutrient->amount() * (amount_g_ / Decimal(constants::NUTRIENT_BASIS_G));
}

// ─── ScaleType ────────────────────────────────────────────────────────────────

std::optional<ScaleType> parse_scale_type(std::string_view text) {
    const std::string folded = text::fold(text);
    if (folded == "fixed")           return ScaleType::Fixed;
    if (folded == "variable_per_kg") return ScaleType::VariablePerKg;
    if (folded == "mixed")           return ScaleType::Mixed;
    return std::nullopt;
}

}  // namespace fce::model
