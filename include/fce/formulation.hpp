#pragma once

/// @file include/fce/formulation.hpp
/// @brief FormulationService: lock-aware redistribution of ingredient amounts.
///
/// # Module: Formulation Redistribution Service
///
/// ## Responsibility
/// Mutate the ingredient amounts of a `model::Formulation` in place while
/// honouring locks:
///   - scale the unlocked group so the batch reaches a target weight
///   - edit one amount, optionally letting the others absorb the change
///   - edit one ingredient's percentage, rebalancing the free ingredients
///   - plain proportional scaling (locks ignored)
///
/// ## Failure model
/// Every mutating operation returns a `[[nodiscard]] Status`. On anything
/// other than `Status::Ok` the formulation is exactly as it was before the
/// call; there is no partial mutation.
///
/// ## Guarantees
/// - After a successful `adjust_to_target_weight(f, T)`, `f.total_weight() == T`
///   exactly and every locked amount is unchanged
/// - A lock temporarily forced by `set_ingredient_amount` is restored on
///   every exit path (`ScopedLockOverride`)
/// - Static methods only; single-writer use of a formulation is assumed
///
/// ## NOT Responsible For
/// - Costs (see cost.hpp) or nutrient totals (see calculator.hpp)

#include "fce/decimal.hpp"
#include "fce/model.hpp"

#include <cstddef>

namespace fce::formulation {

// ─── Status ───────────────────────────────────────────────────────────────────

/// Outcome of a redistribution operation. Every failure is user-correctable.
enum class Status {
    Ok,
    TargetNotPositive,           ///< target weight <= 0
    LockedExceedsTarget,         ///< locked weight > target
    AllLockedCannotReachTarget,  ///< nothing unlocked and total != target
    UnlockedZeroWeight,          ///< unlocked subtotal is 0
    NegativeAmount,              ///< requested amount < 0
    InvalidIndex,                ///< ingredient index out of range
    FactorNotPositive,           ///< scale factor <= 0
    PercentOutOfRange,           ///< requested percent outside [0, 100]
    LockedPercentExceedsLimit,   ///< other locked ingredients exceed 100 %
    PercentBudgetNegative,       ///< 100 - locked - requested < 0
    NoFreeIngredients,           ///< budget left but nothing unlocked to take it
    NegativeResult,              ///< rebalancing would produce a negative share
};

/// Human-readable condition, e.g. "target must be positive".
[[nodiscard]] const char* to_string(Status s) noexcept;

// ─── ScopedLockOverride ───────────────────────────────────────────────────────

/// Force an ingredient's lock state for the guard's lifetime and restore the
/// original state on destruction.
///
/// The guarded ingredient must outlive the guard and must not be moved (no
/// insertion or removal in its formulation) while the guard is alive.
class ScopedLockOverride {
public:
    ScopedLockOverride(model::Ingredient& ingredient, bool locked) noexcept;
    ~ScopedLockOverride();

    ScopedLockOverride(const ScopedLockOverride&)            = delete;
    ScopedLockOverride& operator=(const ScopedLockOverride&) = delete;

private:
    model::Ingredient& ingredient_;
    bool               previous_;
};

// ─── FormulationService ───────────────────────────────────────────────────────

class FormulationService {
public:
    FormulationService() = delete;  // pure static

    /// Scale the unlocked ingredients so the total weight equals `target`.
    ///
    /// `scale = (target - locked_weight) / unlocked_subtotal`; locked
    /// amounts are untouched. The 28-digit rounding residual is settled on an
    /// unlocked ingredient (the largest where possible) so that
    /// `total_weight()`, summed in index order, equals `target` exactly.
    ///
    /// # Returns
    /// - `TargetNotPositive` if `target <= 0`
    /// - `LockedExceedsTarget` if the locked weight exceeds `target`
    /// - `AllLockedCannotReachTarget` if nothing is unlocked and the total
    ///   differs from `target` (Ok when it already matches)
    /// - `UnlockedZeroWeight` if the unlocked subtotal is 0
    [[nodiscard]] static Status adjust_to_target_weight(model::Formulation& formulation,
                                                        const Decimal& target);

    /// Set one ingredient's amount.
    ///
    /// With `maintain_total`, the edited ingredient is locked for the
    /// duration of the call and the other unlocked ingredients absorb the
    /// change so the total weight stays what it was before the edit.
    ///
    /// # Returns
    /// `NegativeAmount`, `InvalidIndex`, or any failure of
    /// `adjust_to_target_weight`, in which case the edit is rolled back.
    [[nodiscard]] static Status set_ingredient_amount(model::Formulation& formulation,
                                                      std::size_t index,
                                                      const Decimal& amount,
                                                      bool maintain_total);

    /// Set one ingredient to `target_percent` of the batch and rebalance.
    ///
    /// `base_total` is the current total weight (100 when it is 0). The other
    /// locked ingredients keep their share; the unlocked ones ("free") are
    /// rescaled in proportion to their current shares to fill
    /// `100 - locked - target_percent`. When the free shares sum to 0, the
    /// first free ingredient takes the whole budget. Amounts are then
    /// recomputed as `percent * base_total / 100`.
    ///
    /// # Returns
    /// `PercentOutOfRange`, `InvalidIndex`, `LockedPercentExceedsLimit`,
    /// `PercentBudgetNegative`, `NoFreeIngredients` or `NegativeResult`,
    /// each checked before anything is written.
    [[nodiscard]] static Status apply_percent_edit(model::Formulation& formulation,
                                                   std::size_t index,
                                                   const Decimal& target_percent);

    /// Scale every ingredient (locks ignored) so the total is exactly 100 g.
    /// No-op when the total is 0 or already 100.
    [[nodiscard]] static Status normalize_to_100g(model::Formulation& formulation);

    /// Multiply every amount by `factor` (locks ignored).
    /// `FactorNotPositive` for `factor <= 0`.
    [[nodiscard]] static Status scale_all(model::Formulation& formulation, const Decimal& factor);

    /// Re-express the current percentages against `target_total` grams
    /// (locks ignored). `TargetNotPositive` for `target_total <= 0`; no-op
    /// for an empty or zero-weight formulation.
    [[nodiscard]] static Status distribute_percentages(model::Formulation& formulation,
                                                       const Decimal& target_total);

    [[nodiscard]] static Status lock_ingredient(model::Formulation& formulation, std::size_t index);
    [[nodiscard]] static Status unlock_ingredient(model::Formulation& formulation, std::size_t index);
    [[nodiscard]] static Status toggle_lock(model::Formulation& formulation, std::size_t index);
};

}  // namespace fce::formulation
