#pragma once

#include <cstddef>
#include <string_view>

/// @file include/fce/constants.hpp
/// @brief Numeric and domain constants for the Formulation Calculation Engine.
///
/// Decimal-valued constants are kept as strings and converted once by the
/// consumers; binary floating point never enters a quantity computation.

namespace fce::constants {

// ─── Decimal Arithmetic ───────────────────────────────────────────────────────

/// Significant digits carried by every Decimal operation.
static constexpr int DECIMAL_PRECISION = 28;

// ─── Energy & Nitrogen ────────────────────────────────────────────────────────

/// Atwater factors, kcal per gram of macro-nutrient.
static constexpr int ATWATER_PROTEIN      = 4;
static constexpr int ATWATER_CARBOHYDRATE = 4;
static constexpr int ATWATER_FAT          = 9;

/// 1 kcal = 4.184 kJ.
static constexpr std::string_view KCAL_TO_KJ = "4.184";

/// Nitrogen = Protein / 6.25 (Jones general factor).
static constexpr std::string_view PROTEIN_TO_NITROGEN = "6.25";

// ─── Mass ─────────────────────────────────────────────────────────────────────

/// Gram equivalents of the supported mass units.
static constexpr std::string_view GRAMS_PER_MICROGRAM = "0.000001";
static constexpr std::string_view GRAMS_PER_MILLIGRAM = "0.001";
static constexpr std::string_view GRAMS_PER_KILOGRAM  = "1000";
static constexpr std::string_view GRAMS_PER_TON       = "1000000";
static constexpr std::string_view GRAMS_PER_POUND     = "453.59237";
static constexpr std::string_view GRAMS_PER_OUNCE     = "28.349523125";

/// Canonical micro-gram symbol (U+00B5 MICRO SIGN followed by 'g').
static constexpr std::string_view MICROGRAM_SYMBOL = "\xC2\xB5g";

/// Source values are expressed per this many grams of food.
static constexpr int NUTRIENT_BASIS_G = 100;

// ─── Formulation ──────────────────────────────────────────────────────────────

static constexpr std::string_view QUANTITY_MODE_GRAMS   = "g";
static constexpr std::string_view QUANTITY_MODE_PERCENT = "%";

/// Default and upper bound of the sellable yield.
static constexpr int DEFAULT_YIELD_PERCENT = 100;

/// Passes allowed per row when settling the last-digit rounding residual of
/// a proportional redistribution.
static constexpr int MAX_RECONCILE_PASSES = 16;

static constexpr std::string_view DATA_TYPE_MANUAL  = "manual";
static constexpr std::string_view DATA_TYPE_BRANDED = "branded";

// ─── Currency ─────────────────────────────────────────────────────────────────

/// Base ("national") currency. Always present with rate 1.
static constexpr std::string_view BASE_CURRENCY_SYMBOL = "$";
static constexpr std::string_view BASE_CURRENCY_NAME   = "Moneda Nacional";

// ─── Nutrient Ordering ────────────────────────────────────────────────────────

/// Catalog order key = category_index * stride + intra-category rank.
static constexpr int CATEGORY_ORDER_STRIDE = 1000;

/// Fallback order base for rows with no rank, reference or catalog entry.
static constexpr std::size_t DISPLAY_ORDER_FALLBACK_BASE = 10000;

/// Bucket for nutrients no rule or hint can place.
static constexpr std::string_view FALLBACK_CATEGORY = "Other";

}  // namespace fce::constants
