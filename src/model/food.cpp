/// @file src/model/food.cpp
/// @brief Nutrient and Food value types.

#include "fce/model.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"

namespace fce::model {

// ─── Nutrient ─────────────────────────────────────────────────────────────────

Nutrient::Nutrient(std::string name, std::string unit, Decimal amount,
                   std::optional<long long> id, std::optional<std::string> number)
    : name_(std::move(name))
    , unit_(std::move(unit))
    , amount_(std::move(amount))
    , id_(id)
    , number_(std::move(number)) {}

std::optional<Nutrient>
Nutrient::make(std::string name,
               std::string unit,
               Decimal amount,
               std::optional<long long> id,
               std::optional<std::string> number) {
    if (text::is_blank(name) || text::is_blank(unit)) {
        return std::nullopt;
    }
    if (amount.is_negative()) {
        return std::nullopt;
    }
    return Nutrient(std::move(name), std::move(unit), std::move(amount), id, std::move(number));
}

std::optional<Nutrient> Nutrient::scale(const Decimal& factor) const {
    return make(name_, unit_, amount_ * factor, id_, number_);
}

// ─── Food ─────────────────────────────────────────────────────────────────────

Food::Food(long long fdc_id, std::string description, std::string data_type,
           std::vector<Nutrient> nutrients, std::string brand_owner)
    : fdc_id_(fdc_id)
    , description_(std::move(description))
    , data_type_(std::move(data_type))
    , nutrients_(std::move(nutrients))
    , brand_owner_(std::move(brand_owner)) {}

std::optional<Food>
Food::make(long long fdc_id,
           std::string description,
           std::string data_type,
           std::vector<Nutrient> nutrients,
           std::string brand_owner) {
    // User-entered foods carry no database id.
    if (fdc_id <= 0 && text::fold(data_type) != constants::DATA_TYPE_MANUAL) {
        return std::nullopt;
    }
    if (text::is_blank(description) || text::is_blank(data_type)) {
        return std::nullopt;
    }
    return Food(fdc_id, std::move(description), std::move(data_type),
                std::move(nutrients), std::move(brand_owner));
}

std::optional<Nutrient> Food::get_nutrient(std::string_view name) const {
    const std::string wanted = text::to_lower(name);
    for (const auto& n : nutrients_) {
        if (text::to_lower(n.name()) == wanted) {
            return n;
        }
    }
    return std::nullopt;
}

bool Food::has_nutrient(std::string_view name) const {
    return get_nutrient(name).has_value();
}

}  // namespace fce::model
