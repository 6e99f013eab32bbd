/**
 * @file  fuzz_normalizer.cpp
 * @brief libFuzzer target for NutrientNormalizer::normalize
 *
 * Build:
 *   cmake -DFCE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_normalizer
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB for any nutrient list.
 *   2. No negative amount in the output.
 *   3. normalize(normalize(x)) == normalize(x).
 *
 * Fuzzer strategy:
 *   Each input line is one record: "name|unit|amount". Blank or unparseable
 *   amounts become category-header rows (no amount). The first line is the
 *   data type.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "fce/normalizer.hpp"
#include "fce/text.hpp"
#include "fce/units.hpp"

using namespace fce;
using namespace fce::nutrients;

namespace {

bool same(const NutrientList& a, const NutrientList& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].name != b[i].name || a[i].unit != b[i].unit || a[i].amount != b[i].amount) {
            return false;
        }
    }
    return true;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};
    const auto lines = text::split(input, '\n');

    const std::string data_type = lines.empty() ? std::string() : lines.front();
    NutrientList records;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto parts = text::split(lines[i], '|');
        NutrientRecord r{.name = parts[0]};
        if (parts.size() > 1) r.unit = parts[1];
        if (parts.size() > 2) {
            auto amount = units::UnitConverter::parse_user_number(parts[2]);
            // Source amounts are never negative by the time they reach a food.
            if (amount && amount->is_negative()) amount = -*amount;
            r.amount = amount;
        }
        records.push_back(std::move(r));
    }

    const NutrientList once = NutrientNormalizer::normalize(records, data_type);
    for (const auto& r : once) {
        assert(!r.amount || !r.amount->is_negative());
    }

    const NutrientList twice = NutrientNormalizer::normalize(once, data_type);
    assert(same(once, twice));
    return 0;
}
