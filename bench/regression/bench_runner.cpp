/**
 * @file  bench_runner.cpp
 * @brief Standalone micro-benchmark runner for performance regression suite.
 *
 * Usage:
 *   ./bench_runner <benchmark_name>
 *
 * Outputs a single double: nanoseconds per operation, to stdout.
 * Returns 0 on success, 1 on unknown benchmark name.
 *
 * Each benchmark runs for a wall-clock duration of at least 500ms to get
 * stable measurements, then divides total time by iteration count.
 */

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "fce/calculator.hpp"
#include "fce/cost.hpp"
#include "fce/data_loader.hpp"
#include "fce/engine.hpp"
#include "fce/formulation.hpp"
#include "fce/normalizer.hpp"

using namespace fce;
using namespace std::chrono;

// ── Timing harness ────────────────────────────────────────────────────────────

template<typename Fn>
double measure_ns_per_op(Fn&& fn, long min_iters = 100) {
    // Warmup
    for (long i = 0; i < std::min(min_iters / 10L, 1000L); ++i) fn();

    // Measure until we have at least 500ms of wall time
    long iters      = 0;
    double total_ns = 0.0;

    const auto deadline = steady_clock::now() + milliseconds(500);
    do {
        const auto t0 = steady_clock::now();
        fn();
        fn(); fn(); fn(); fn(); fn();  // batch 5 to reduce timer overhead
        const auto t1 = steady_clock::now();
        total_ns += static_cast<double>(duration_cast<nanoseconds>(t1 - t0).count());
        iters += 5;
    } while (steady_clock::now() < deadline || iters < min_iters);

    return total_ns / static_cast<double>(iters);
}

// ── Fixtures ──────────────────────────────────────────────────────────────────

/// Batch of `n` manual ingredients with three macros each.
model::Formulation make_batch(core::Engine& engine, int n) {
    auto f = *engine.new_formulation("Bench batch");
    for (int i = 0; i < n; ++i) {
        nutrients::FoodRecord record{
            .fdc_id      = -(i + 1),
            .description = "Ingredient " + std::to_string(i + 1),
            .data_type   = "Manual",
            .nutrients   = {
                {.name = "Protein", .unit = "g", .amount = Decimal(i % 30)},
                {.name = "Carbohydrate, by difference", .unit = "g", .amount = Decimal(i % 70)},
                {.name = "Total lipid (fat)", .unit = "g", .amount = Decimal(i % 20)},
            },
        };
        auto food = std::make_shared<const model::Food>(*engine.build_food(record));
        auto ing = *model::Ingredient::make(food, Decimal(10 + i), i % 3 == 0);
        ing.cost() = model::IngredientCost{
            .pack_amount     = Decimal(1),
            .pack_unit       = "kg",
            .value           = Decimal(2 + i % 5),
            .currency_symbol = "$",
        };
        f.add_ingredient(std::move(ing));
    }
    return f;
}

// ── Benchmark implementations ─────────────────────────────────────────────────

double bench_decimal_mul_div_1M() {
    const Decimal a("12.345");
    const Decimal b("0.0371");
    volatile bool sink = false;
    return measure_ns_per_op([&]() {
        const Decimal r = a * b / Decimal(3);
        sink = sink ^ r.is_positive();
    }, 1'000'000);
}

double bench_normalize_food() {
    const nutrients::NutrientList raw{
        {.name = "Protein", .unit = "g", .amount = Decimal(10)},
        {.name = "Total fat (NLEA)", .unit = "g", .amount = Decimal(5)},
        {.name = "Carbohydrate, by summation", .unit = "g", .amount = Decimal(20)},
        {.name = "Fiber, total dietary", .unit = "g", .amount = Decimal(3)},
        {.name = "Vitamin D (D2 + D3)", .unit = "mcg", .amount = Decimal(2)},
        {.name = "Energy", .unit = "KCAL", .amount = Decimal(170)},
    };
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += nutrients::NutrientNormalizer::normalize(raw, "Branded").size();
    });
}

double bench_totals_50_ingredients() {
    core::Engine engine;
    const auto f = make_batch(engine, 50);
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += nutrients::NutrientCalculator::calculate_totals_per_100g(f).size();
    });
}

double bench_adjust_to_target_50_ingredients() {
    core::Engine engine;
    auto f = make_batch(engine, 50);
    bool up = true;
    volatile bool sink = false;
    return measure_ns_per_op([&]() {
        up = !up;
        const auto s = formulation::FormulationService::adjust_to_target_weight(f, Decimal(up ? 5000 : 3000));
        sink = sink ^ (s == formulation::Status::Ok);
    });
}

double bench_batch_cost_50_ingredients() {
    core::Engine engine;
    const auto f = make_batch(engine, 50);
    volatile bool sink = false;
    return measure_ns_per_op([&]() {
        sink = sink ^ cost::CostEngine::total_batch_cost(f).is_positive();
    });
}

double bench_csv_load_20_rows() {
    std::string csv = "description,amount_g,locked,protein_g,carbohydrate_g,fat_g,pack_amount,pack_unit,cost_value,currency\n";
    for (int i = 0; i < 20; ++i) {
        csv += "Item " + std::to_string(i) + ",10,0,5,60,3,1,kg,2.50,$\n";
    }
    csv += "@process,Mixing,FIXED,30,min,12,,,,\n";
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        core::Engine engine;
        const auto f = core::FormulationLoader::parse_csv_string(csv, engine, "bench");
        sink += f ? f->ingredient_count() : 0;
    });
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <benchmark_name>\n", argv[0]);
        return 1;
    }

    const std::string name = argv[1];
    double result = -1.0;

    if (name == "decimal_mul_div_1M")              result = bench_decimal_mul_div_1M();
    else if (name == "normalize_food")             result = bench_normalize_food();
    else if (name == "totals_50_ingredients")      result = bench_totals_50_ingredients();
    else if (name == "adjust_to_target_50_ingredients") result = bench_adjust_to_target_50_ingredients();
    else if (name == "batch_cost_50_ingredients")  result = bench_batch_cost_50_ingredients();
    else if (name == "csv_load_20_rows")           result = bench_csv_load_20_rows();
    else {
        std::fprintf(stderr, "Unknown benchmark: %s\n", name.c_str());
        return 1;
    }

    std::printf("%.2f\n", result);
    return 0;
}
