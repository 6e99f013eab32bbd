#pragma once

/// @file include/fce/engine.hpp
/// @brief Formulation engine facade: the operations a GUI or batch driver calls.
///
/// # Module: Engine
///
/// ## Responsibility
/// Wire the calculation modules into the operations exposed to callers:
///   FoodRecord -> NutrientNormalizer -> NutrientOrdering -> model::Food
///   Formulation -> NutrientCalculator / FormulationService / CostEngine
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto loaded = FormulationLoader::load_csv("batch.csv", engine);
/// if (loaded) {
///     const auto totals = engine.calculate_totals_per_100g(*loaded);
///     const auto cost   = engine.total_ingredients_cost_batch(*loaded);
/// }
/// ```
///
/// ## Guarantees
/// - Never throws for bad user data: construction failures are `nullopt`,
///   redistribution failures are `formulation::Status`
/// - Diagnostics go to stderr only when `EngineConfig::verbose` is set
/// - The engine owns the nutrient ordering state (reference hints); a
///   formulation is owned by the caller and mutated in place

#include "fce/calculator.hpp"
#include "fce/constants.hpp"
#include "fce/cost.hpp"
#include "fce/decimal.hpp"
#include "fce/formulation.hpp"
#include "fce/model.hpp"
#include "fce/normalizer.hpp"
#include "fce/nutrient_ordering.hpp"
#include "fce/nutrient_record.hpp"
#include "fce/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fce::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration parameters for the engine.
struct EngineConfig {
    /// Quantity mode given to formulations created by `new_formulation`.
    QuantityMode default_quantity_mode = QuantityMode::Grams;

    /// Yield given to formulations created by `new_formulation`.
    Decimal default_yield_percent = Decimal(constants::DEFAULT_YIELD_PERCENT);

    /// If true, emit diagnostics for skipped data and failed operations to stderr.
    bool verbose = false;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const nutrients::NutrientOrdering& ordering() const noexcept { return ordering_; }

    // ── Foods ─────────────────────────────────────────────────────────────────

    /// Run the six-step normalizer over one food's raw rows.
    [[nodiscard]] nutrients::NutrientList
    normalize_nutrients(const nutrients::NutrientList& raw, std::string_view data_type) const;

    /// Turn a lookup result into a validated food.
    ///
    /// # Pipeline
    /// 1. Record the result's rank/category/unit hints in the ordering.
    /// 2. Normalize the nutrient rows.
    /// 3. Fill missing units (`NutrientOrdering::infer_unit`, then the
    ///    per-name unit map). A missing amount counts as 0; rows with
    ///    neither amount nor unit are category headers and are skipped, as
    ///    are rows whose unit cannot be resolved.
    /// 4. Sort for display and build `model::Food`.
    ///
    /// # Returns
    /// `nullopt` if the food itself is invalid (see `model::Food::make`).
    [[nodiscard]] std::optional<model::Food> build_food(const nutrients::FoodRecord& record);

    /// Empty formulation with the configured mode and yield.
    [[nodiscard]] std::optional<model::Formulation> new_formulation(std::string name) const;

    // ── Nutrients ─────────────────────────────────────────────────────────────

    [[nodiscard]] nutrients::NutrientTotals
    calculate_totals_per_100g(const model::Formulation& formulation) const;

    /// Per-100 g totals merged by export column and sorted for display.
    [[nodiscard]] nutrients::HeaderTotals
    display_totals(const model::Formulation& formulation) const;

    // ── Redistribution ────────────────────────────────────────────────────────

    [[nodiscard]] formulation::Status
    adjust_to_target_weight(model::Formulation& formulation, const Decimal& target) const;

    [[nodiscard]] formulation::Status
    set_ingredient_amount(model::Formulation& formulation,
                          std::size_t index,
                          const Decimal& amount,
                          bool maintain_total) const;

    [[nodiscard]] formulation::Status
    apply_percent_edit(model::Formulation& formulation,
                       std::size_t index,
                       const Decimal& target_percent) const;

    // ── Costs ─────────────────────────────────────────────────────────────────

    /// Refreshes every ingredient's derived cost fields, then totals them.
    [[nodiscard]] cost::BatchCost total_ingredients_cost_batch(model::Formulation& formulation) const;

    [[nodiscard]] cost::BatchCost total_process_cost_batch(const model::Formulation& formulation) const;

    [[nodiscard]] cost::UnitCostBreakdown
    unit_costs_for_target_mass(model::Formulation& formulation,
                               const Decimal& target_value,
                               std::string_view target_unit) const;

private:
    /// Report a failed operation when verbose.
    formulation::Status report(std::string_view operation, formulation::Status status) const;

    EngineConfig                config_;
    nutrients::NutrientOrdering ordering_;
};

}  // namespace fce::core
