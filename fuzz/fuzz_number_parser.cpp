/**
 * @file  fuzz_number_parser.cpp
 * @brief libFuzzer target for UnitConverter::parse_user_number and Decimal::parse
 *
 * Build:
 *   cmake -DFCE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_number_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_number_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no uncaught exception for any byte sequence.
 *   2. A parsed value is finite and survives to_string → parse unchanged.
 *   3. quantize(4) of a parsed value never throws.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "fce/decimal.hpp"
#include "fce/units.hpp"

using fce::Decimal;
using fce::units::UnitConverter;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto parsed = UnitConverter::parse_user_number(input);
    if (parsed) {
        // Invariant 2: round trip through the canonical text form.
        const auto again = Decimal::parse(parsed->to_string());
        assert(again.has_value());
        assert(*again == *parsed);

        // Invariant 3
        (void)parsed->quantize(4);
    }

    (void)Decimal::parse(input);
    return 0;
}
