#pragma once

/// @file include/fce/cost.hpp
/// @brief CostEngine: ingredient, process and packaging costs in base currency.
///
/// # Module: Cost Engine
///
/// ## Responsibility
/// Turn the purchase, process and packaging data attached to a formulation
/// into batch totals and per-unit economics, all in the base currency ("$").
///
/// ## Partial-data policy
/// Missing or invalid cost inputs are not errors. A cost that cannot be
/// resolved is `nullopt` for that item, is left out of the totals, and is
/// counted as missing in the completeness figures.
///
/// ## Guarantees
/// - `build_rate_map` always maps "$" to 1
/// - Pure functions over their inputs, except `update_ingredient_cost_fields`
///   and `refresh_ingredient_costs`, which write the derived fields back
///
/// ## NOT Responsible For
/// - Fetching exchange rates; rates come from the formulation

#include "fce/decimal.hpp"
#include "fce/model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fce::cost {

/// Currency symbol -> rate to base currency.
using RateMap = std::unordered_map<std::string, Decimal>;

/// A batch total and the number of items that could not be priced.
struct BatchCost {
    Decimal     total;
    std::size_t missing = 0;
};

/// FIXED process figures after back-solving.
struct ResolvedFixedProcess {
    std::optional<Decimal> time_h;
    std::optional<Decimal> cost_per_hour;
    std::optional<Decimal> total;
};

/// How many items of a list carry a resolvable cost.
struct Completeness {
    std::size_t defined = 0;
    std::size_t missing = 0;
    Decimal     percent;  ///< defined / (defined + missing) * 100, 0 for an empty list
};

/// Per-unit economics of a formulation for a target unit mass.
struct UnitCostBreakdown {
    Decimal batch_mass_g;
    Decimal sellable_mass_g;            ///< batch mass x yield
    Decimal target_mass_g;              ///< 0 when the target is invalid
    Decimal units_count;                ///< sellable / target, 0 when undefined
    Decimal ingredients_cost_per_unit;
    Decimal process_cost_per_unit;
    Decimal total_cost_per_unit;        ///< ingredients + process
    Decimal packaging_cost_per_pack;
    Decimal total_pack_cost;            ///< total_cost_per_unit + packaging
};

class CostEngine {
public:
    CostEngine() = delete;  // pure static

    // ── Currency ──────────────────────────────────────────────────────────────

    /// "$" -> 1, plus every rate with a non-blank symbol and a positive rate.
    /// A "$" entry in `rates` cannot override the base rate.
    [[nodiscard]] static RateMap build_rate_map(const std::vector<model::CurrencyRate>& rates);

    /// `value * rate(symbol)`; a blank symbol means the base currency.
    ///
    /// # Returns
    /// `nullopt` when the symbol has no rate.
    [[nodiscard]] static std::optional<Decimal>
    convert_currency_to_base(const Decimal& value,
                             std::string_view symbol,
                             const std::vector<model::CurrencyRate>& rates);

    // ── Ingredients ───────────────────────────────────────────────────────────

    /// Base currency per gram: `value * rate / pack_amount_g`.
    ///
    /// # Returns
    /// `nullopt` unless the pack amount and value are positive, the pack unit
    /// is a formulation mass unit, and the (non-blank) currency has a rate.
    [[nodiscard]] static std::optional<Decimal>
    ingredient_cost_per_g(const model::IngredientCost& cost,
                          const std::vector<model::CurrencyRate>& rates);

    /// Canonicalize the stored pack unit and currency symbol (blank -> absent)
    /// and recompute `per_g_base`.
    static void update_ingredient_cost_fields(model::Ingredient& ingredient,
                                              const std::vector<model::CurrencyRate>& rates);

    /// `update_ingredient_cost_fields` for every ingredient of `formulation`.
    static void refresh_ingredient_costs(model::Formulation& formulation);

    /// `Σ cost_per_g * amount_g` over the ingredients that can be priced.
    [[nodiscard]] static BatchCost total_ingredients_cost_batch(const model::Formulation& formulation);

    // ── Processes ─────────────────────────────────────────────────────────────

    /// Back-solve a FIXED process. With at least two of {hours, rate, total}
    /// present, the missing one is derived, `total` first. Division by a
    /// non-positive figure is never attempted.
    [[nodiscard]] static ResolvedFixedProcess resolve_fixed_process(const model::ProcessCost& process);

    /// Cost of one process for a batch of `batch_mass_kg`.
    ///
    /// - FIXED: resolved total
    /// - VARIABLE_PER_KG: time_per_kg_h * kg * rate
    /// - MIXED: (setup_h + time_per_kg_h * kg) * rate
    ///
    /// # Returns
    /// `nullopt` when a required figure is missing.
    [[nodiscard]] static std::optional<Decimal>
    process_total_cost(const model::ProcessCost& process, const Decimal& batch_mass_kg);

    /// Sum of every process that can be costed at the formulation's batch mass.
    [[nodiscard]] static BatchCost total_process_cost_batch(const model::Formulation& formulation);

    // ── Packaging ─────────────────────────────────────────────────────────────

    /// Unit cost of a packaging item in base currency; `nullopt` for an
    /// unknown currency.
    [[nodiscard]] static std::optional<Decimal>
    packaging_unit_cost(const model::PackagingItem& item,
                        const std::vector<model::CurrencyRate>& rates);

    /// `Σ quantity_per_pack * unit_cost` over the packaging items; items with
    /// no resolvable unit cost contribute 0.
    [[nodiscard]] static Decimal packaging_cost_per_pack(const model::Formulation& formulation);

    // ── Aggregates ────────────────────────────────────────────────────────────

    /// Ingredient batch cost + process batch cost.
    [[nodiscard]] static Decimal total_batch_cost(const model::Formulation& formulation);

    [[nodiscard]] static Completeness ingredient_cost_completeness(const model::Formulation& formulation);
    [[nodiscard]] static Completeness process_cost_completeness(const model::Formulation& formulation);

    /// Per-unit costs when the sellable batch is split into units of
    /// `target_value` `target_unit`.
    [[nodiscard]] static UnitCostBreakdown
    unit_costs_for_target_mass(const model::Formulation& formulation,
                               const Decimal& target_value,
                               std::string_view target_unit);
};

}  // namespace fce::cost
