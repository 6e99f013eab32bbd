/// @file src/model/formulation.cpp
/// @brief Formulation entity: ingredient list, settings and currency rates.

#include "fce/model.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"

#include <algorithm>
#include <unordered_set>

namespace fce::model {

namespace {

CurrencyRate base_currency() {
    return CurrencyRate{
        .name         = std::string(constants::BASE_CURRENCY_NAME),
        .symbol       = std::string(constants::BASE_CURRENCY_SYMBOL),
        .rate_to_base = Decimal(1),
    };
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Formulation::Formulation(std::string name, QuantityMode mode)
    : name_(std::move(name))
    , quantity_mode_(mode)
    , yield_percent_(constants::DEFAULT_YIELD_PERCENT)
    , currency_rates_{base_currency()} {}

std::optional<Formulation>
Formulation::make(std::string name, QuantityMode mode, Decimal yield_percent) {
    if (text::is_blank(name)) {
        return std::nullopt;
    }
    Formulation f(std::move(name), mode);
    f.set_yield_percent(yield_percent);
    return f;
}

std::optional<Formulation>
Formulation::make(std::string name, std::string_view quantity_mode, Decimal yield_percent) {
    const auto mode = parse_quantity_mode(quantity_mode);
    if (!mode) {
        return std::nullopt;
    }
    return make(std::move(name), *mode, std::move(yield_percent));
}

void Formulation::set_yield_percent(const Decimal& percent) {
    const Decimal ceiling(constants::DEFAULT_YIELD_PERCENT);
    if (!percent.is_positive() || percent > ceiling) {
        yield_percent_ = ceiling;
        return;
    }
    yield_percent_ = percent;
}

// ─── Ingredients ──────────────────────────────────────────────────────────────

void Formulation::add_ingredient(Ingredient ingredient) {
    ingredients_.push_back(std::move(ingredient));
}

bool Formulation::remove_ingredient(std::size_t index) {
    if (index >= ingredients_.size()) {
        return false;
    }
    ingredients_.erase(ingredients_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

std::optional<Ingredient> Formulation::ingredient(std::size_t index) const {
    if (index >= ingredients_.size()) {
        return std::nullopt;
    }
    return ingredients_[index];
}

std::vector<IndexedIngredient> Formulation::locked_ingredients() const {
    std::vector<IndexedIngredient> out;
    for (std::size_t i = 0; i < ingredients_.size(); ++i) {
        if (ingredients_[i].locked()) {
            out.emplace_back(i, std::cref(ingredients_[i]));
        }
    }
    return out;
}

std::vector<IndexedIngredient> Formulation::unlocked_ingredients() const {
    std::vector<IndexedIngredient> out;
    for (std::size_t i = 0; i < ingredients_.size(); ++i) {
        if (!ingredients_[i].locked()) {
            out.emplace_back(i, std::cref(ingredients_[i]));
        }
    }
    return out;
}

Decimal Formulation::total_weight() const {
    Decimal total;
    for (const auto& ing : ingredients_) {
        total += ing.amount_g();
    }
    return total;
}

Decimal Formulation::locked_weight() const {
    Decimal total;
    for (const auto& ing : ingredients_) {
        if (ing.locked()) {
            total += ing.amount_g();
        }
    }
    return total;
}

// ─── Currency rates ───────────────────────────────────────────────────────────

void Formulation::set_currency_rates(std::vector<CurrencyRate> rates) {
    std::unordered_set<std::string> seen;
    std::vector<CurrencyRate> cleaned;
    cleaned.reserve(rates.size() + 1);

    for (auto& rate : rates) {
        std::string symbol = text::trim(rate.symbol);
        if (symbol.empty()) {
            continue;
        }
        if (seen.count(symbol) != 0) {
            continue;
        }
        if (symbol == constants::BASE_CURRENCY_SYMBOL) {
            rate = base_currency();
        } else {
            rate.symbol = symbol;
        }
        seen.insert(symbol);
        cleaned.push_back(std::move(rate));
    }

    if (seen.count(std::string(constants::BASE_CURRENCY_SYMBOL)) == 0) {
        cleaned.insert(cleaned.begin(), base_currency());
    }
    currency_rates_ = std::move(cleaned);
}

void Formulation::add_currency_rate(CurrencyRate rate) {
    std::vector<CurrencyRate> rates = currency_rates_;
    rates.push_back(std::move(rate));
    set_currency_rates(std::move(rates));
}

}  // namespace fce::model
