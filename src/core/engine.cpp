/// @file src/core/engine.cpp
/// @brief Formulation engine facade.

#include "fce/engine.hpp"
#include "fce/text.hpp"

#include <fmt/core.h>

#include <utility>
#include <vector>

namespace fce::core {

using formulation::FormulationService;
using formulation::Status;
using nutrients::NutrientList;
using nutrients::NutrientNormalizer;
using nutrients::NutrientOrdering;
using nutrients::NutrientRecord;

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

// ─── Foods ────────────────────────────────────────────────────────────────────

NutrientList Engine::normalize_nutrients(const NutrientList& raw, std::string_view data_type) const {
    return NutrientNormalizer::normalize(raw, data_type);
}

std::optional<model::Food> Engine::build_food(const nutrients::FoodRecord& record) {
    // ── Step 1: Reference hints ───────────────────────────────────────────────
    ordering_.update_reference_from_details(record);

    // ── Step 2: Normalize ─────────────────────────────────────────────────────
    NutrientList rows = NutrientNormalizer::normalize(record.nutrients, record.data_type);

    // ── Step 3: Display order ─────────────────────────────────────────────────
    rows = ordering_.sort_nutrients_for_display(std::move(rows));

    // ── Step 4: Validate rows ─────────────────────────────────────────────────
    std::vector<model::Nutrient> nutrients;
    nutrients.reserve(rows.size());
    std::size_t skipped = 0;

    for (const auto& row : rows) {
        // Category header row.
        if (!row.amount && text::is_blank(row.unit)) {
            ++skipped;
            continue;
        }
        std::string unit = NutrientOrdering::infer_unit(row);
        if (unit.empty()) {
            unit = ordering_.unit_for_name(row.name);
        }
        auto nutrient = model::Nutrient::make(row.name, std::move(unit), row.amount.value_or(Decimal()),
                                              row.id, row.number);
        if (!nutrient) {
            ++skipped;
            continue;
        }
        nutrients.push_back(std::move(*nutrient));
    }

    if (config_.verbose && skipped > 0) {
        fmt::print(stderr, "[fce] '{}': skipped {} header or unit-less nutrient row(s)\n",
                   record.description, skipped);
    }

    // ── Step 5: Food ──────────────────────────────────────────────────────────
    auto food = model::Food::make(record.fdc_id, record.description, record.data_type,
                                  std::move(nutrients), record.brand_owner);
    if (!food && config_.verbose) {
        fmt::print(stderr, "[fce] rejected food fdc_id={} description='{}' data_type='{}'\n",
                   record.fdc_id, record.description, record.data_type);
    }
    return food;
}

std::optional<model::Formulation> Engine::new_formulation(std::string name) const {
    return model::Formulation::make(std::move(name), config_.default_quantity_mode,
                                    config_.default_yield_percent);
}

// ─── Nutrients ────────────────────────────────────────────────────────────────

nutrients::NutrientTotals
Engine::calculate_totals_per_100g(const model::Formulation& formulation) const {
    return nutrients::NutrientCalculator::calculate_totals_per_100g(formulation);
}

nutrients::HeaderTotals Engine::display_totals(const model::Formulation& formulation) const {
    const auto totals = calculate_totals_per_100g(formulation);

    std::vector<NutrientRecord> records;
    records.reserve(totals.size());
    for (const auto& t : totals) {
        records.push_back(NutrientRecord{.name = t.name, .unit = t.unit, .amount = t.amount});
    }
    records = ordering_.sort_nutrients_for_display(std::move(records));

    nutrients::NutrientTotals sorted;
    sorted.reserve(records.size());
    for (auto& r : records) {
        sorted.push_back(nutrients::NutrientTotal{
            .name   = std::move(r.name),
            .unit   = std::move(r.unit),
            .amount = r.amount.value_or(Decimal()),
        });
    }
    return ordering_.normalize_totals_by_header_key(sorted);
}

// ─── Redistribution ───────────────────────────────────────────────────────────

Status Engine::adjust_to_target_weight(model::Formulation& formulation, const Decimal& target) const {
    return report("adjust_to_target_weight",
                  FormulationService::adjust_to_target_weight(formulation, target));
}

Status Engine::set_ingredient_amount(model::Formulation& formulation,
                                     std::size_t index,
                                     const Decimal& amount,
                                     bool maintain_total) const {
    return report("set_ingredient_amount",
                  FormulationService::set_ingredient_amount(formulation, index, amount, maintain_total));
}

Status Engine::apply_percent_edit(model::Formulation& formulation,
                                  std::size_t index,
                                  const Decimal& target_percent) const {
    return report("apply_percent_edit",
                  FormulationService::apply_percent_edit(formulation, index, target_percent));
}

// ─── Costs ────────────────────────────────────────────────────────────────────

cost::BatchCost Engine::total_ingredients_cost_batch(model::Formulation& formulation) const {
    cost::CostEngine::refresh_ingredient_costs(formulation);
    const auto batch = cost::CostEngine::total_ingredients_cost_batch(formulation);
    if (config_.verbose && batch.missing > 0) {
        fmt::print(stderr, "[fce] {} of {} ingredient(s) have no usable cost\n",
                   batch.missing, formulation.ingredient_count());
    }
    return batch;
}

cost::BatchCost Engine::total_process_cost_batch(const model::Formulation& formulation) const {
    const auto batch = cost::CostEngine::total_process_cost_batch(formulation);
    if (config_.verbose && batch.missing > 0) {
        fmt::print(stderr, "[fce] {} of {} process(es) are incomplete\n",
                   batch.missing, formulation.process_costs().size());
    }
    return batch;
}

cost::UnitCostBreakdown Engine::unit_costs_for_target_mass(model::Formulation& formulation,
                                                           const Decimal& target_value,
                                                           std::string_view target_unit) const {
    cost::CostEngine::refresh_ingredient_costs(formulation);
    const auto breakdown = cost::CostEngine::unit_costs_for_target_mass(formulation, target_value, target_unit);
    if (config_.verbose && breakdown.units_count.is_zero()) {
        fmt::print(stderr, "[fce] target mass {} '{}' yields no units; per-unit costs are 0\n",
                   target_value, target_unit);
    }
    return breakdown;
}

// ─── Engine::report ───────────────────────────────────────────────────────────

Status Engine::report(std::string_view operation, Status status) const {
    if (config_.verbose && status != Status::Ok) {
        fmt::print(stderr, "[fce] {} failed: {}\n", operation, formulation::to_string(status));
    }
    return status;
}

}  // namespace fce::core
