/// @file src/formulation/formulation_service.cpp
/// @brief FormulationService implementation.
///
/// Every operation computes the complete set of new amounts first, validates
/// it, and only then writes, so a failing call never leaves a half-edited
/// formulation behind.

#include "fce/formulation.hpp"
#include "fce/constants.hpp"

#include <optional>
#include <vector>

namespace fce::formulation {

using model::Formulation;
using model::Ingredient;

// ─── Status ───────────────────────────────────────────────────────────────────

const char* to_string(Status s) noexcept {
    switch (s) {
        case Status::Ok:                         return "ok";
        case Status::TargetNotPositive:          return "target must be positive";
        case Status::LockedExceedsTarget:        return "locked exceeds target";
        case Status::AllLockedCannotReachTarget: return "cannot reach target, all locked";
        case Status::UnlockedZeroWeight:         return "unlocked ingredients have zero weight";
        case Status::NegativeAmount:             return "amount cannot be negative";
        case Status::InvalidIndex:               return "invalid ingredient index";
        case Status::FactorNotPositive:          return "scale factor must be positive";
        case Status::PercentOutOfRange:          return "percent must be between 0 and 100";
        case Status::LockedPercentExceedsLimit:  return "locked percentages exceed 100";
        case Status::PercentBudgetNegative:      return "remaining percent budget is negative";
        case Status::NoFreeIngredients:          return "no unlocked ingredients to absorb the remaining percent";
        case Status::NegativeResult:             return "redistribution would produce a negative amount";
    }
    return "unknown";
}

// ─── ScopedLockOverride ───────────────────────────────────────────────────────

ScopedLockOverride::ScopedLockOverride(Ingredient& ingredient, bool locked) noexcept
    : ingredient_(ingredient)
    , previous_(ingredient.locked()) {
    ingredient_.set_locked(locked);
}

ScopedLockOverride::~ScopedLockOverride() {
    ingredient_.set_locked(previous_);
}

// ─── Helpers (file-local) ─────────────────────────────────────────────────────

namespace {

std::vector<Decimal> snapshot(const Formulation& f) {
    std::vector<Decimal> amounts;
    amounts.reserve(f.ingredient_count());
    for (const auto& ing : f.ingredients()) {
        amounts.push_back(ing.amount_g());
    }
    return amounts;
}

/// Write a full set of amounts. All values are checked before the first write.
Status commit(Formulation& f, const std::vector<Decimal>& amounts) {
    for (const auto& a : amounts) {
        if (a.is_negative()) {
            return Status::NegativeResult;
        }
    }
    auto& ingredients = f.ingredients();
    for (std::size_t i = 0; i < ingredients.size(); ++i) {
        if (!ingredients[i].set_amount_g(amounts[i])) {
            return Status::NegativeResult;
        }
    }
    return Status::Ok;
}

/// Multiply `amounts[i]` by `factor` for every selected index. When
/// `exact_sum` is given, the rounding residual `exact_sum - Σ selected` goes
/// to the largest selected amount.
void rescale(std::vector<Decimal>& amounts,
             const std::vector<std::size_t>& selected,
             const Decimal& factor,
             const std::optional<Decimal>& exact_sum) {
    if (selected.empty()) {
        return;
    }

    Decimal sum;
    std::size_t largest = selected.front();
    for (const auto i : selected) {
        amounts[i] *= factor;
        sum += amounts[i];
        if (amounts[i] > amounts[largest]) {
            largest = i;
        }
    }

    if (exact_sum) {
        const Decimal residual = *exact_sum - sum;
        if (!residual.is_zero()) {
            amounts[largest] += residual;
        }
    }
}

/// Sum in index order, the order `Formulation::total_weight()` uses, so both
/// round identically.
Decimal ordered_sum(const std::vector<Decimal>& amounts) {
    Decimal sum;
    for (const auto& a : amounts) {
        sum += a;
    }
    return sum;
}

/// Nudge one selected amount until the ordered sum of every amount, locked
/// rows included, equals `target`. The step follows the residual and is
/// halved on overshoot, which gets past half-even ties in the running sum.
/// Candidates are the largest selected row, then the others from the last
/// index down.
void reconcile(std::vector<Decimal>& amounts,
               const std::vector<std::size_t>& selected,
               const Decimal& target) {
    if (selected.empty()) {
        return;
    }

    std::size_t largest = selected.front();
    for (const auto i : selected) {
        if (amounts[i] > amounts[largest]) {
            largest = i;
        }
    }
    std::vector<std::size_t> candidates{largest};
    for (auto it = selected.rbegin(); it != selected.rend(); ++it) {
        if (*it != largest) {
            candidates.push_back(*it);
        }
    }

    const Decimal two(2);
    for (const auto row : candidates) {
        Decimal residual = target - ordered_sum(amounts);
        if (residual.is_zero()) {
            return;
        }
        const Decimal original = amounts[row];
        Decimal step = residual;
        for (int pass = 0; pass < constants::MAX_RECONCILE_PASSES; ++pass) {
            if ((amounts[row] + step).is_negative()) {
                break;
            }
            amounts[row] += step;
            residual = target - ordered_sum(amounts);
            if (residual.is_zero()) {
                return;
            }
            const bool overshot = residual.is_positive() != step.is_positive();
            step = overshot ? -step / two : residual;
        }
        amounts[row] = original;
    }
}

std::vector<std::size_t> all_indices(const Formulation& f) {
    std::vector<std::size_t> out(f.ingredient_count());
    for (std::size_t i = 0; i < out.size(); ++i) out[i] = i;
    return out;
}

}  // namespace

// ─── adjust_to_target_weight ──────────────────────────────────────────────────

Status FormulationService::adjust_to_target_weight(Formulation& formulation, const Decimal& target) {
    if (!target.is_positive()) {
        return Status::TargetNotPositive;
    }

    const Decimal locked = formulation.locked_weight();
    if (locked > target) {
        return Status::LockedExceedsTarget;
    }

    std::vector<std::size_t> unlocked;
    Decimal unlocked_weight;
    for (const auto& [index, ing] : formulation.unlocked_ingredients()) {
        unlocked.push_back(index);
        unlocked_weight += ing.get().amount_g();
    }

    if (unlocked.empty()) {
        return formulation.total_weight() == target ? Status::Ok
                                                    : Status::AllLockedCannotReachTarget;
    }
    if (unlocked_weight.is_zero()) {
        return Status::UnlockedZeroWeight;
    }

    const Decimal available = target - locked;
    std::vector<Decimal> amounts = snapshot(formulation);
    rescale(amounts, unlocked, available / unlocked_weight, std::nullopt);
    reconcile(amounts, unlocked, target);
    return commit(formulation, amounts);
}

// ─── set_ingredient_amount ────────────────────────────────────────────────────

Status FormulationService::set_ingredient_amount(Formulation& formulation,
                                                 std::size_t index,
                                                 const Decimal& amount,
                                                 bool maintain_total) {
    if (amount.is_negative()) {
        return Status::NegativeAmount;
    }
    if (index >= formulation.ingredient_count()) {
        return Status::InvalidIndex;
    }

    Ingredient& edited = formulation.ingredients()[index];
    if (!maintain_total) {
        return edited.set_amount_g(amount) ? Status::Ok : Status::NegativeAmount;
    }

    const std::vector<Decimal> before = snapshot(formulation);
    const Decimal old_total = formulation.total_weight();

    if (!edited.set_amount_g(amount)) {
        return Status::NegativeAmount;
    }

    Status status = Status::Ok;
    {
        const ScopedLockOverride guard(edited, true);
        status = adjust_to_target_weight(formulation, old_total);
    }

    if (status != Status::Ok) {
        // Roll back the direct edit; adjust_to_target_weight wrote nothing.
        const Status restored = commit(formulation, before);
        if (restored != Status::Ok) {
            return restored;
        }
    }
    return status;
}

// ─── apply_percent_edit ───────────────────────────────────────────────────────

Status FormulationService::apply_percent_edit(Formulation& formulation,
                                              std::size_t index,
                                              const Decimal& target_percent) {
    const Decimal hundred(100);
    if (target_percent.is_negative() || target_percent > hundred) {
        return Status::PercentOutOfRange;
    }
    if (index >= formulation.ingredient_count()) {
        return Status::InvalidIndex;
    }

    const auto& ingredients = formulation.ingredients();
    Decimal base_total = formulation.total_weight();
    if (base_total.is_zero()) {
        base_total = hundred;
    }

    std::vector<Decimal> percent;
    percent.reserve(ingredients.size());
    for (const auto& ing : ingredients) {
        percent.push_back(ing.amount_g() / base_total * hundred);
    }

    Decimal locked_sum;
    Decimal free_sum;
    std::vector<std::size_t> free;
    for (std::size_t i = 0; i < ingredients.size(); ++i) {
        if (i == index) continue;
        if (ingredients[i].locked()) {
            locked_sum += percent[i];
        } else {
            free.push_back(i);
            free_sum += percent[i];
        }
    }

    if (locked_sum > hundred) {
        return Status::LockedPercentExceedsLimit;
    }
    const Decimal remaining = hundred - locked_sum - target_percent;
    if (remaining.is_negative()) {
        return Status::PercentBudgetNegative;
    }
    if (!remaining.is_zero() && free.empty()) {
        return Status::NoFreeIngredients;
    }

    percent[index] = target_percent;
    if (!free.empty()) {
        if (free_sum.is_zero()) {
            for (const auto i : free) percent[i] = Decimal();
            percent[free.front()] = remaining;
        } else {
            rescale(percent, free, remaining / free_sum, remaining);
        }
    }

    // Other locked ingredients keep their exact amounts.
    std::vector<Decimal> amounts = snapshot(formulation);
    for (std::size_t i = 0; i < percent.size(); ++i) {
        if (percent[i].is_negative()) {
            return Status::NegativeResult;
        }
        if (i != index && ingredients[i].locked()) {
            continue;
        }
        amounts[i] = percent[i] * base_total / hundred;
    }
    reconcile(amounts, free, base_total);
    return commit(formulation, amounts);
}

// ─── Proportional scaling ─────────────────────────────────────────────────────

Status FormulationService::normalize_to_100g(Formulation& formulation) {
    const Decimal total = formulation.total_weight();
    const Decimal basis(constants::NUTRIENT_BASIS_G);
    if (total.is_zero() || total == basis) {
        return Status::Ok;
    }

    std::vector<Decimal> amounts = snapshot(formulation);
    const auto all = all_indices(formulation);
    rescale(amounts, all, basis / total, std::nullopt);
    reconcile(amounts, all, basis);
    return commit(formulation, amounts);
}

Status FormulationService::scale_all(Formulation& formulation, const Decimal& factor) {
    if (!factor.is_positive()) {
        return Status::FactorNotPositive;
    }
    std::vector<Decimal> amounts = snapshot(formulation);
    rescale(amounts, all_indices(formulation), factor, std::nullopt);
    return commit(formulation, amounts);
}

Status FormulationService::distribute_percentages(Formulation& formulation,
                                                  const Decimal& target_total) {
    if (!target_total.is_positive()) {
        return Status::TargetNotPositive;
    }
    const Decimal total = formulation.total_weight();
    if (formulation.is_empty() || total.is_zero()) {
        return Status::Ok;
    }

    // percent_i * target / 100 == amount_i * target / total
    std::vector<Decimal> amounts = snapshot(formulation);
    const auto all = all_indices(formulation);
    rescale(amounts, all, target_total / total, std::nullopt);
    reconcile(amounts, all, target_total);
    return commit(formulation, amounts);
}

// ─── Locks ────────────────────────────────────────────────────────────────────

Status FormulationService::lock_ingredient(Formulation& formulation, std::size_t index) {
    if (index >= formulation.ingredient_count()) {
        return Status::InvalidIndex;
    }
    formulation.ingredients()[index].set_locked(true);
    return Status::Ok;
}

Status FormulationService::unlock_ingredient(Formulation& formulation, std::size_t index) {
    if (index >= formulation.ingredient_count()) {
        return Status::InvalidIndex;
    }
    formulation.ingredients()[index].set_locked(false);
    return Status::Ok;
}

Status FormulationService::toggle_lock(Formulation& formulation, std::size_t index) {
    if (index >= formulation.ingredient_count()) {
        return Status::InvalidIndex;
    }
    auto& ing = formulation.ingredients()[index];
    ing.set_locked(!ing.locked());
    return Status::Ok;
}

}  // namespace fce::formulation
