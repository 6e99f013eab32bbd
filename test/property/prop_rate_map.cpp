/**
 * @file  prop_rate_map.cpp
 * @brief Property: ∀ currency rate lists:
 *        the rate map holds "$" → 1, every rate in it is positive, and the
 *        formulation's repaired list keeps exactly one "$" entry.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_rate_map
 */

#include <rapidcheck.h>

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "fce/cost.hpp"
#include "fce/model.hpp"

using namespace fce;
using namespace fce::cost;

namespace {

constexpr std::array<const char*, 6> SYMBOLS = {"$", "USD", "EUR", " EUR ", "", "MXN"};

std::vector<model::CurrencyRate> random_rates() {
    const auto n = *rc::gen::inRange<std::size_t>(0, 8);
    std::vector<model::CurrencyRate> rates;
    for (std::size_t i = 0; i < n; ++i) {
        rates.push_back(model::CurrencyRate{
            .name         = "Rate",
            .symbol       = *rc::gen::elementOf(SYMBOLS),
            .rate_to_base = Decimal(*rc::gen::inRange(-500, 5000)) / Decimal(100),
        });
    }
    return rates;
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: base rate is pinned, all rates positive ──────────────────
    ok &= rc::check(
        "rate_map: $ maps to 1 and every rate is positive",
        [] {
            const RateMap map = CostEngine::build_rate_map(random_rates());
            RC_ASSERT(map.count("$") == 1u);
            RC_ASSERT(map.at("$") == Decimal(1));
            for (const auto& [symbol, rate] : map) {
                RC_ASSERT(!symbol.empty());
                RC_ASSERT(rate.is_positive());
            }
        }
    );

    // ── Property 2: blank symbol converts at the base rate ───────────────────
    ok &= rc::check(
        "rate_map: blank currency symbol converts 1:1",
        [] {
            const Decimal value = Decimal(*rc::gen::inRange(0, 1000000)) / Decimal(100);
            const auto converted = CostEngine::convert_currency_to_base(value, "  ", random_rates());
            RC_ASSERT(converted.has_value());
            RC_ASSERT(*converted == value);
        }
    );

    // ── Property 3: repaired formulation list has exactly one "$" ────────────
    ok &= rc::check(
        "rate_map: formulation keeps a single base entry at rate 1",
        [] {
            auto f = *model::Formulation::make("Rates");
            f.set_currency_rates(random_rates());
            const auto& rates = f.currency_rates();
            const auto bases = std::count_if(rates.begin(), rates.end(),
                                             [](const model::CurrencyRate& r) { return r.symbol == "$"; });
            RC_ASSERT(bases == 1);
            for (const auto& r : rates) {
                RC_ASSERT(!r.symbol.empty());
                if (r.symbol == "$") RC_ASSERT(r.rate_to_base == Decimal(1));
            }
        }
    );

    return ok ? 0 : 1;
}
