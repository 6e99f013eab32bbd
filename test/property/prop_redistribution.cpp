/**
 * @file  prop_redistribution.cpp
 * @brief Property: ∀ amounts, locks, target: adjust_to_target_weight either
 *        reaches the target exactly with locked amounts untouched, or fails
 *        and leaves every amount as it was.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_redistribution
 *
 * Basis:
 *   scale = (T − locked) / Σ unlocked
 *   The 28-digit quotient may round; the residual goes to the largest
 *   unlocked amount, so Σ amounts == T holds with no tolerance.
 */

#include <rapidcheck.h>

#include <cstddef>
#include <memory>
#include <vector>

#include "fce/formulation.hpp"
#include "fce/model.hpp"

using namespace fce;
using namespace fce::formulation;

namespace {

/// Centigram integer -> grams.
Decimal grams(int centigrams) {
    return Decimal(centigrams) / Decimal(100);
}

model::Formulation build(const std::vector<int>& centigrams, const std::vector<int>& locks) {
    auto f = *model::Formulation::make("Property batch");
    for (std::size_t i = 0; i < centigrams.size(); ++i) {
        auto food = std::make_shared<const model::Food>(*model::Food::make(0, "Item", "Manual"));
        f.add_ingredient(*model::Ingredient::make(food, grams(centigrams[i]), locks[i] != 0));
    }
    return f;
}

std::vector<Decimal> amounts_of(const model::Formulation& f) {
    std::vector<Decimal> out;
    for (const auto& ing : f.ingredients()) out.push_back(ing.amount_g());
    return out;
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: success reaches the target exactly ───────────────────────
    ok &= rc::check(
        "redistribution: Ok implies total == target and locks untouched",
        [] {
            const auto n = *rc::gen::inRange<std::size_t>(1, 12);
            const auto centigrams = *rc::gen::container<std::vector<int>>(n, rc::gen::inRange(0, 1000000));
            const auto locks = *rc::gen::container<std::vector<int>>(n, rc::gen::inRange(0, 2));
            const Decimal target = grams(*rc::gen::inRange(-1000, 5000000));

            auto f = build(centigrams, locks);
            const auto before = amounts_of(f);
            const Status status = FormulationService::adjust_to_target_weight(f, target);
            const auto after = amounts_of(f);

            if (status == Status::Ok) {
                RC_ASSERT(f.total_weight() == target);
                for (std::size_t i = 0; i < n; ++i) {
                    RC_ASSERT(!after[i].is_negative());
                    if (locks[i] != 0) RC_ASSERT(after[i] == before[i]);
                }
            } else {
                RC_ASSERT(after == before);
            }
        }
    );

    // ── Property 2: maintain_total keeps the old total or rolls back ─────────
    ok &= rc::check(
        "redistribution: set_ingredient_amount(maintain_total) keeps the total",
        [] {
            const auto n = *rc::gen::inRange<std::size_t>(2, 10);
            const auto centigrams = *rc::gen::container<std::vector<int>>(n, rc::gen::inRange(1, 100000));
            const auto locks = *rc::gen::container<std::vector<int>>(n, rc::gen::inRange(0, 2));
            const auto index = *rc::gen::inRange<std::size_t>(0, n);
            const Decimal amount = grams(*rc::gen::inRange(0, 200000));

            auto f = build(centigrams, locks);
            const Decimal old_total = f.total_weight();
            const auto before = amounts_of(f);
            const Status status = FormulationService::set_ingredient_amount(f, index, amount, true);

            RC_ASSERT(f.ingredients()[index].locked() == (locks[index] != 0));
            if (status == Status::Ok) {
                RC_ASSERT(f.total_weight() == old_total);
                RC_ASSERT(f.ingredients()[index].amount_g() == amount);
            } else {
                RC_ASSERT(amounts_of(f) == before);
            }
        }
    );

    return ok ? 0 : 1;
}
