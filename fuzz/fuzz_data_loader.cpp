/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV loader and everything downstream
 *
 * Build:
 *   cmake -DFCE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no uncaught exception for any byte sequence.
 *   2. Every loaded amount is non-negative; yield is in (0, 100].
 *   3. Totals, costs and a normalize_to_100g pass run without failure.
 *
 * Fuzzer strategy:
 *   Input is passed as the CSV text. The loader must handle binary garbage,
 *   ragged rows, unknown directives and numbers in either decimal convention.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "fce/cost.hpp"
#include "fce/data_loader.hpp"
#include "fce/engine.hpp"
#include "fce/formulation.hpp"

using namespace fce;
using namespace fce::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    Engine engine;
    auto f = FormulationLoader::parse_csv_string(input, engine, "fuzz");
    assert(f.has_value());

    for (const auto& ing : f->ingredients()) {
        assert(!ing.amount_g().is_negative());
    }
    assert(f->yield_percent().is_positive());
    assert(f->yield_percent() <= Decimal(100));

    (void)engine.display_totals(*f);
    (void)engine.total_ingredients_cost_batch(*f);
    (void)engine.total_process_cost_batch(*f);
    (void)engine.unit_costs_for_target_mass(*f, Decimal(250), "g");

    const auto status = formulation::FormulationService::normalize_to_100g(*f);
    assert(status == formulation::Status::Ok);
    (void)status;
    return 0;
}
