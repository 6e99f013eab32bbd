#pragma once

/// @file include/fce/nutrient_record.hpp
/// @brief Raw nutrient and food records as delivered by a food-lookup source.
///
/// A record is the tagged, typed form of one `foodNutrients` entry of a
/// lookup result: a nutrient descriptor plus an amount that may be absent.
/// Records flow through the normalizer and ordering modules before they are
/// turned into validated `model::Food` / `model::Nutrient` values.

#include "fce/decimal.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fce::nutrients {

/// One nutrient row of a lookup result.
struct NutrientRecord {
    std::string                name;    ///< e.g. "Total lipid (fat)"
    std::string                unit;    ///< source spelling; may be empty
    std::optional<Decimal>     amount;  ///< per 100 g; absent for category headers
    std::optional<long long>   id;      ///< source nutrient id
    std::optional<std::string> number;  ///< source nutrient number, e.g. "204"
    std::optional<long long>   rank;    ///< source display rank
};

/// A lookup result for one food.
struct FoodRecord {
    long long                   fdc_id = 0;
    std::string                 description;
    std::string                 data_type;
    std::string                 brand_owner;
    std::vector<NutrientRecord> nutrients;
};

/// One aggregated nutrient value (a formulation total or an export column).
struct NutrientTotal {
    std::string name;
    std::string unit;
    Decimal     amount;
};

}  // namespace fce::nutrients
