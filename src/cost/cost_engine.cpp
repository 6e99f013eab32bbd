/// @file src/cost/cost_engine.cpp
/// @brief CostEngine implementation.

#include "fce/cost.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"
#include "fce/units.hpp"

namespace fce::cost {

using model::CurrencyRate;
using model::Formulation;
using model::ProcessCost;
using model::ScaleType;
using units::UnitConverter;

namespace {

const std::string BASE_SYMBOL{constants::BASE_CURRENCY_SYMBOL};

std::optional<Decimal> hours(const std::optional<Decimal>& value,
                             const std::optional<std::string>& unit) {
    if (!value) {
        return std::nullopt;
    }
    return UnitConverter::time_to_hours(*value, unit.value_or(std::string{}));
}

std::optional<Decimal> rate_for(const RateMap& rates, const std::string& symbol) {
    const auto it = rates.find(symbol);
    if (it == rates.end() || !it->second.is_positive()) {
        return std::nullopt;
    }
    return it->second;
}

Decimal batch_mass_kg(const Formulation& formulation) {
    return UnitConverter::mass_to_kg(formulation.total_weight(), "g").value_or(Decimal());
}

Completeness completeness(std::size_t defined, std::size_t missing) {
    Completeness c{.defined = defined, .missing = missing, .percent = Decimal()};
    const std::size_t total = defined + missing;
    if (total > 0) {
        c.percent = Decimal(static_cast<long long>(defined)) /
                    Decimal(static_cast<long long>(total)) * Decimal(100);
    }
    return c;
}

}  // namespace

// ─── Currency ─────────────────────────────────────────────────────────────────

RateMap CostEngine::build_rate_map(const std::vector<CurrencyRate>& rates) {
    RateMap map;
    map.emplace(BASE_SYMBOL, Decimal(1));
    for (const auto& rate : rates) {
        std::string symbol = text::trim(rate.symbol);
        if (symbol.empty() || symbol == BASE_SYMBOL) {
            continue;
        }
        if (!rate.rate_to_base.is_positive()) {
            continue;
        }
        map.insert_or_assign(std::move(symbol), rate.rate_to_base);
    }
    return map;
}

std::optional<Decimal> CostEngine::convert_currency_to_base(const Decimal& value,
                                                            std::string_view symbol,
                                                            const std::vector<CurrencyRate>& rates) {
    std::string currency = text::trim(symbol);
    if (currency.empty()) {
        currency = BASE_SYMBOL;
    }
    const auto rate = rate_for(build_rate_map(rates), currency);
    if (!rate) {
        return std::nullopt;
    }
    return value * *rate;
}

// ─── Ingredients ──────────────────────────────────────────────────────────────

std::optional<Decimal> CostEngine::ingredient_cost_per_g(const model::IngredientCost& cost,
                                                         const std::vector<CurrencyRate>& rates) {
    if (!cost.pack_amount || !cost.value) {
        return std::nullopt;
    }
    if (!cost.pack_amount->is_positive() || !cost.value->is_positive()) {
        return std::nullopt;
    }

    const std::string unit = UnitConverter::normalize_mass_unit(cost.pack_unit.value_or(std::string{}));
    if (unit.empty()) {
        return std::nullopt;
    }
    const auto pack_g = UnitConverter::mass_to_g(*cost.pack_amount, unit);
    if (!pack_g || !pack_g->is_positive()) {
        return std::nullopt;
    }

    // Unlike packaging, an ingredient price with no currency is not assumed
    // to be in base currency.
    const std::string symbol = text::trim(cost.currency_symbol.value_or(std::string{}));
    if (symbol.empty()) {
        return std::nullopt;
    }
    const auto rate = rate_for(build_rate_map(rates), symbol);
    if (!rate) {
        return std::nullopt;
    }
    return *cost.value * *rate / *pack_g;
}

void CostEngine::update_ingredient_cost_fields(model::Ingredient& ingredient,
                                               const std::vector<CurrencyRate>& rates) {
    auto& cost = ingredient.cost();

    std::string unit = UnitConverter::normalize_mass_unit(cost.pack_unit.value_or(std::string{}));
    cost.pack_unit = unit.empty() ? std::nullopt : std::optional<std::string>(std::move(unit));

    std::string symbol = text::trim(cost.currency_symbol.value_or(std::string{}));
    cost.currency_symbol = symbol.empty() ? std::nullopt : std::optional<std::string>(std::move(symbol));

    cost.per_g_base = ingredient_cost_per_g(cost, rates);
}

void CostEngine::refresh_ingredient_costs(Formulation& formulation) {
    const auto rates = formulation.currency_rates();
    for (auto& ingredient : formulation.ingredients()) {
        update_ingredient_cost_fields(ingredient, rates);
    }
}

BatchCost CostEngine::total_ingredients_cost_batch(const Formulation& formulation) {
    BatchCost batch;
    for (const auto& ingredient : formulation.ingredients()) {
        const auto per_g = ingredient_cost_per_g(ingredient.cost(), formulation.currency_rates());
        if (!per_g) {
            ++batch.missing;
            continue;
        }
        batch.total += *per_g * ingredient.amount_g();
    }
    return batch;
}

// ─── Processes ────────────────────────────────────────────────────────────────

ResolvedFixedProcess CostEngine::resolve_fixed_process(const ProcessCost& process) {
    ResolvedFixedProcess r{
        .time_h        = hours(process.time_value, process.time_unit),
        .cost_per_hour = process.cost_per_hour,
        .total         = process.total_cost,
    };

    const int present = int{r.time_h.has_value()} + int{r.cost_per_hour.has_value()} +
                        int{r.total.has_value()};
    if (present < 2) {
        return r;
    }

    if (!r.total && r.time_h && r.cost_per_hour) {
        r.total = *r.time_h * *r.cost_per_hour;
    } else if (!r.cost_per_hour && r.time_h && r.total && r.time_h->is_positive()) {
        r.cost_per_hour = *r.total / *r.time_h;
    } else if (!r.time_h && r.cost_per_hour && r.total && r.cost_per_hour->is_positive()) {
        r.time_h = *r.total / *r.cost_per_hour;
    }
    return r;
}

std::optional<Decimal> CostEngine::process_total_cost(const ProcessCost& process,
                                                      const Decimal& batch_mass_kg) {
    switch (process.scale_type) {
        case ScaleType::Fixed:
            return resolve_fixed_process(process).total;

        case ScaleType::VariablePerKg: {
            const auto per_kg_h = hours(process.time_per_kg_value, process.time_unit);
            if (!per_kg_h || !process.cost_per_hour) {
                return std::nullopt;
            }
            return *per_kg_h * batch_mass_kg * *process.cost_per_hour;
        }

        case ScaleType::Mixed: {
            const auto setup_h  = hours(process.setup_time_value, process.setup_time_unit);
            const auto per_kg_h = hours(process.time_per_kg_value, process.time_unit);
            if (!setup_h || !per_kg_h || !process.cost_per_hour) {
                return std::nullopt;
            }
            return (*setup_h + *per_kg_h * batch_mass_kg) * *process.cost_per_hour;
        }
    }
    return std::nullopt;
}

BatchCost CostEngine::total_process_cost_batch(const Formulation& formulation) {
    const Decimal kg = batch_mass_kg(formulation);
    BatchCost batch;
    for (const auto& process : formulation.process_costs()) {
        const auto cost = process_total_cost(process, kg);
        if (!cost) {
            ++batch.missing;
            continue;
        }
        batch.total += *cost;
    }
    return batch;
}

// ─── Packaging ────────────────────────────────────────────────────────────────

std::optional<Decimal> CostEngine::packaging_unit_cost(const model::PackagingItem& item,
                                                       const std::vector<CurrencyRate>& rates) {
    return convert_currency_to_base(item.unit_cost, item.currency_symbol.value_or(std::string{}), rates);
}

Decimal CostEngine::packaging_cost_per_pack(const Formulation& formulation) {
    Decimal total;
    for (const auto& item : formulation.packaging_items()) {
        const auto unit_cost = packaging_unit_cost(item, formulation.currency_rates());
        total += item.quantity_per_pack * unit_cost.value_or(Decimal());
    }
    return total;
}

// ─── Aggregates ───────────────────────────────────────────────────────────────

Decimal CostEngine::total_batch_cost(const Formulation& formulation) {
    return total_ingredients_cost_batch(formulation).total +
           total_process_cost_batch(formulation).total;
}

Completeness CostEngine::ingredient_cost_completeness(const Formulation& formulation) {
    const BatchCost batch = total_ingredients_cost_batch(formulation);
    return completeness(formulation.ingredient_count() - batch.missing, batch.missing);
}

Completeness CostEngine::process_cost_completeness(const Formulation& formulation) {
    const BatchCost batch = total_process_cost_batch(formulation);
    return completeness(formulation.process_costs().size() - batch.missing, batch.missing);
}

UnitCostBreakdown CostEngine::unit_costs_for_target_mass(const Formulation& formulation,
                                                         const Decimal& target_value,
                                                         std::string_view target_unit) {
    UnitCostBreakdown out;
    out.batch_mass_g = formulation.total_weight();

    out.target_mass_g = UnitConverter::mass_to_g(target_value, target_unit).value_or(Decimal());
    if (!out.target_mass_g.is_positive()) {
        out.target_mass_g = Decimal();
    }

    const Decimal hundred(100);
    const Decimal yield = fce::max(Decimal(), fce::min(formulation.yield_percent(), hundred));
    out.sellable_mass_g = out.batch_mass_g * yield / hundred;

    if (out.target_mass_g.is_positive() && out.sellable_mass_g.is_positive()) {
        out.units_count = out.sellable_mass_g / out.target_mass_g;
    }

    if (out.units_count.is_positive()) {
        out.ingredients_cost_per_unit = total_ingredients_cost_batch(formulation).total / out.units_count;
        out.process_cost_per_unit     = total_process_cost_batch(formulation).total / out.units_count;
    }
    out.total_cost_per_unit     = out.ingredients_cost_per_unit + out.process_cost_per_unit;
    out.packaging_cost_per_pack = packaging_cost_per_pack(formulation);
    out.total_pack_cost         = out.total_cost_per_unit + out.packaging_cost_per_pack;
    return out;
}

}  // namespace fce::cost
