#pragma once

/// @file include/fce/model.hpp
/// @brief Entity model: Nutrient, Food, Ingredient, ProcessCost, PackagingItem,
///        CurrencyRate and Formulation.
///
/// # Module: Entity Model
///
/// ## Responsibility
/// Hold the validated in-memory state the services operate on. Value types
/// (`Nutrient`, `Food`) are immutable once built; `Ingredient` and
/// `Formulation` are mutated in place by the redistribution service and the
/// cost engine.
///
/// ## Guarantees
/// - Invariant-bearing types are only constructible through `make(...)`,
///   which returns `nullopt` instead of building an invalid object
/// - `Ingredient::amount_g()` is never negative
/// - `Formulation::currency_rates()` always holds exactly one "$" entry with
///   rate 1, first in the list when it had to be added, and unique symbols
/// - `Formulation::yield_percent()` is always in (0, 100]; out-of-range input
///   is reset to 100 rather than rejected
///
/// ## NOT Responsible For
/// - Redistribution or cost arithmetic (see formulation.hpp and cost.hpp)
/// - Persistence; the entity shapes are the serialization contract only

#include "fce/decimal.hpp"
#include "fce/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fce::model {

// ─── Nutrient ─────────────────────────────────────────────────────────────────

/// A nutrient amount per 100 g of the food it belongs to.
class Nutrient {
public:
    /// # Returns
    /// `nullopt` if `name` or `unit` is blank or `amount` is negative.
    [[nodiscard]] static std::optional<Nutrient>
    make(std::string name,
         std::string unit,
         Decimal amount,
         std::optional<long long> id = std::nullopt,
         std::optional<std::string> number = std::nullopt);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& unit() const noexcept { return unit_; }
    [[nodiscard]] const Decimal& amount() const noexcept { return amount_; }
    [[nodiscard]] const std::optional<long long>& id() const noexcept { return id_; }
    [[nodiscard]] const std::optional<std::string>& number() const noexcept { return number_; }

    /// Copy with `amount * factor`. `nullopt` for a negative factor.
    [[nodiscard]] std::optional<Nutrient> scale(const Decimal& factor) const;

private:
    Nutrient(std::string name, std::string unit, Decimal amount,
             std::optional<long long> id, std::optional<std::string> number);

    std::string                name_;
    std::string                unit_;
    Decimal                    amount_;
    std::optional<long long>   id_;
    std::optional<std::string> number_;
};

// ─── Food ─────────────────────────────────────────────────────────────────────

/// A food item with its per-100 g nutrient list.
class Food {
public:
    /// # Returns
    /// `nullopt` if `description` or `data_type` is blank, or if
    /// `fdc_id <= 0` and the data type is not "manual" (case-insensitive).
    [[nodiscard]] static std::optional<Food>
    make(long long fdc_id,
         std::string description,
         std::string data_type,
         std::vector<Nutrient> nutrients = {},
         std::string brand_owner = {});

    [[nodiscard]] long long fdc_id() const noexcept { return fdc_id_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const std::string& data_type() const noexcept { return data_type_; }
    [[nodiscard]] const std::string& brand_owner() const noexcept { return brand_owner_; }
    [[nodiscard]] const std::vector<Nutrient>& nutrients() const noexcept { return nutrients_; }

    /// First nutrient whose name matches case-insensitively.
    [[nodiscard]] std::optional<Nutrient> get_nutrient(std::string_view name) const;
    [[nodiscard]] bool has_nutrient(std::string_view name) const;

private:
    Food(long long fdc_id, std::string description, std::string data_type,
         std::vector<Nutrient> nutrients, std::string brand_owner);

    long long             fdc_id_;
    std::string           description_;
    std::string           data_type_;
    std::vector<Nutrient> nutrients_;
    std::string           brand_owner_;
};

// ─── Ingredient ───────────────────────────────────────────────────────────────

/// Purchase data for an ingredient. Every field may be missing; the cost
/// engine reports gaps as completeness, never as errors.
struct IngredientCost {
    std::optional<Decimal>     pack_amount;      ///< size of one purchase pack
    std::optional<std::string> pack_unit;        ///< mass unit of `pack_amount`
    std::optional<Decimal>     value;            ///< price of one pack
    std::optional<std::string> currency_symbol;  ///< currency of `value`
    std::optional<Decimal>     per_g_base;       ///< derived: base currency per gram
};

/// A food at a given mass inside one formulation.
class Ingredient {
public:
    /// # Returns
    /// `nullopt` for a null food or a negative amount.
    [[nodiscard]] static std::optional<Ingredient>
    make(std::shared_ptr<const Food> food, Decimal amount_g, bool locked = false);

    [[nodiscard]] const Food& food() const noexcept { return *food_; }
    [[nodiscard]] const std::shared_ptr<const Food>& food_ptr() const noexcept { return food_; }
    [[nodiscard]] long long fdc_id() const noexcept { return food_->fdc_id(); }
    [[nodiscard]] const std::string& description() const noexcept { return food_->description(); }

    [[nodiscard]] const Decimal& amount_g() const noexcept { return amount_g_; }

    /// Replace the amount. Returns false, leaving the amount unchanged, when
    /// `amount` is negative.
    [[nodiscard]] bool set_amount_g(Decimal amount);

    [[nodiscard]] bool locked() const noexcept { return locked_; }
    void set_locked(bool locked) noexcept { locked_ = locked; }

    [[nodiscard]] IngredientCost& cost() noexcept { return cost_; }
    [[nodiscard]] const IngredientCost& cost() const noexcept { return cost_; }

    /// Share of `total_weight` in percent; 0 when the total is 0.
    [[nodiscard]] Decimal calculate_percentage(const Decimal& total_weight) const;

    /// Amount of the named nutrient contained in `amount_g` grams of the
    /// food (source values are per 100 g); 0 when the food lacks it.
    [[nodiscard]] Decimal get_nutrient_amount(std::string_view nutrient_name) const;

private:
    Ingredient(std::shared_ptr<const Food> food, Decimal amount_g, bool locked);

    std::shared_ptr<const Food> food_;
    Decimal                     amount_g_;
    bool                        locked_;
    IngredientCost              cost_;
};

// ─── Process cost ─────────────────────────────────────────────────────────────

/// Billing model of a production process.
enum class ScaleType {
    Fixed,          ///< time x hourly rate, independent of batch size
    VariablePerKg,  ///< time-per-kg x batch kg x hourly rate
    Mixed,          ///< (setup time + time-per-kg x batch kg) x hourly rate
};

[[nodiscard]] constexpr const char* to_string(ScaleType t) noexcept {
    switch (t) {
        case ScaleType::Fixed:         return "FIXED";
        case ScaleType::VariablePerKg: return "VARIABLE_PER_KG";
        case ScaleType::Mixed:         return "MIXED";
    }
    return "UNKNOWN";
}

/// Parse "FIXED", "VARIABLE_PER_KG" or "MIXED" (case-insensitive).
[[nodiscard]] std::optional<ScaleType> parse_scale_type(std::string_view text);

/// A production step billed by time. All numeric fields are optional; the
/// cost engine back-solves or reports the step as incomplete.
struct ProcessCost {
    std::string                name;
    ScaleType                  scale_type = ScaleType::Fixed;
    std::optional<Decimal>     time_value;         ///< FIXED duration, or time per kg
    std::optional<std::string> time_unit;          ///< "min" or "h"
    std::optional<Decimal>     cost_per_hour;      ///< base currency per hour
    std::optional<Decimal>     total_cost;         ///< base currency, FIXED only
    std::optional<Decimal>     setup_time_value;   ///< MIXED setup duration
    std::optional<std::string> setup_time_unit;
    std::optional<Decimal>     time_per_kg_value;  ///< per-kg duration in `time_unit`
    std::optional<std::string> notes;
};

// ─── Packaging ────────────────────────────────────────────────────────────────

/// Packaging consumed per finished pack.
struct PackagingItem {
    std::string                name;
    Decimal                    quantity_per_pack;
    Decimal                    unit_cost;
    std::optional<std::string> currency_symbol;  ///< absent = base currency
    std::optional<std::string> notes;
};

// ─── Currency ─────────────────────────────────────────────────────────────────

/// Exchange rate of a currency to the base ("$") currency.
struct CurrencyRate {
    std::string name;
    std::string symbol;
    Decimal     rate_to_base;
};

// ─── Formulation ──────────────────────────────────────────────────────────────

/// Index / ingredient pair, as returned by the lock queries.
using IndexedIngredient = std::pair<std::size_t, std::reference_wrapper<const Ingredient>>;

/// A named mixture of ingredients with its production and packaging costs.
class Formulation {
public:
    /// # Returns
    /// `nullopt` for a blank name. An out-of-range yield is reset to 100.
    [[nodiscard]] static std::optional<Formulation>
    make(std::string name,
         QuantityMode mode = QuantityMode::Grams,
         Decimal yield_percent = Decimal(100));

    /// As above, with the quantity mode given as text. `nullopt` unless the
    /// mode is exactly "g" or "%".
    [[nodiscard]] static std::optional<Formulation>
    make(std::string name, std::string_view quantity_mode, Decimal yield_percent = Decimal(100));

    // ── Identity & settings ───────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] QuantityMode quantity_mode() const noexcept { return quantity_mode_; }
    void set_quantity_mode(QuantityMode mode) noexcept { quantity_mode_ = mode; }

    [[nodiscard]] const Decimal& yield_percent() const noexcept { return yield_percent_; }

    /// Values outside (0, 100] reset the yield to 100.
    void set_yield_percent(const Decimal& percent);

    // ── Ingredients ───────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<Ingredient>& ingredients() const noexcept { return ingredients_; }
    [[nodiscard]] std::vector<Ingredient>& ingredients() noexcept { return ingredients_; }

    void add_ingredient(Ingredient ingredient);

    /// Returns false when `index` is out of range.
    [[nodiscard]] bool remove_ingredient(std::size_t index);

    /// Copy of the ingredient at `index`, or `nullopt` when out of range.
    [[nodiscard]] std::optional<Ingredient> ingredient(std::size_t index) const;

    [[nodiscard]] std::vector<IndexedIngredient> locked_ingredients() const;
    [[nodiscard]] std::vector<IndexedIngredient> unlocked_ingredients() const;

    /// Sum of every ingredient amount, in grams.
    [[nodiscard]] Decimal total_weight() const;

    /// Sum of locked ingredient amounts, in grams.
    [[nodiscard]] Decimal locked_weight() const;

    [[nodiscard]] std::size_t ingredient_count() const noexcept { return ingredients_.size(); }
    [[nodiscard]] bool is_empty() const noexcept { return ingredients_.empty(); }

    /// Remove every ingredient. Costs and rates are kept.
    void clear() noexcept { ingredients_.clear(); }

    // ── Costs ─────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<ProcessCost>& process_costs() const noexcept { return process_costs_; }
    [[nodiscard]] std::vector<ProcessCost>& process_costs() noexcept { return process_costs_; }
    void add_process_cost(ProcessCost process) { process_costs_.push_back(std::move(process)); }

    [[nodiscard]] const std::vector<PackagingItem>& packaging_items() const noexcept { return packaging_items_; }
    [[nodiscard]] std::vector<PackagingItem>& packaging_items() noexcept { return packaging_items_; }
    void add_packaging_item(PackagingItem item) { packaging_items_.push_back(std::move(item)); }

    // ── Currency rates ────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<CurrencyRate>& currency_rates() const noexcept { return currency_rates_; }

    /// Replace the rate list, repairing it on the way in: blank symbols are
    /// dropped, later duplicates of a symbol are dropped, the "$" entry is
    /// forced to the base name and rate 1, and "$" is inserted first when
    /// absent.
    void set_currency_rates(std::vector<CurrencyRate> rates);

    /// Append (or, for a symbol already present, ignore) one rate.
    void add_currency_rate(CurrencyRate rate);

private:
    Formulation(std::string name, QuantityMode mode);

    std::string                name_;
    QuantityMode               quantity_mode_;
    Decimal                    yield_percent_;
    std::vector<Ingredient>    ingredients_;
    std::vector<ProcessCost>   process_costs_;
    std::vector<PackagingItem> packaging_items_;
    std::vector<CurrencyRate>  currency_rates_;
};

}  // namespace fce::model
