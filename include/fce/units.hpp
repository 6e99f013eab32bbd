#pragma once

/// @file include/fce/units.hpp
/// @brief Number parsing and unit conversion.
///
/// # Module: Number & Unit Conversion
///
/// ## Responsibility
/// Turn user- or source-supplied numeric text into a Decimal regardless of
/// decimal convention, map unit spellings to one canonical token, and convert
/// amounts between mass units (µg/mg/g/kg/ton/lb/oz), energy units
/// (kcal/kJ) and time units (min/h).
///
/// ## Guarantees
/// - Static methods only, no state
/// - Every fallible conversion returns `std::optional`; nothing throws except
///   `std::bad_alloc`
/// - Converting between two spellings of the same unit returns the value
///   unchanged (no factor round-trip)
///
/// ## NOT Responsible For
/// - Display formatting of quantities
/// - Volume units (a formulation is mass-based)

#include "fce/decimal.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fce::units {

/// Unit parsing and conversion utilities.
class UnitConverter {
public:
    UnitConverter() = delete;  // pure static

    // ── Numbers ───────────────────────────────────────────────────────────────

    /// Parse a number written in either decimal convention.
    ///
    /// Spaces are removed. If the text contains a comma, every period is a
    /// thousands separator and the comma is the decimal point
    /// ("1.234,5" -> 1234.5); otherwise commas are thousands separators
    /// ("1,234.5" -> 1234.5).
    ///
    /// # Returns
    /// `nullopt` for blank text or text that is still not a finite decimal.
    [[nodiscard]] static std::optional<Decimal>
    parse_user_number(std::string_view text);

    // ── Unit tokens ───────────────────────────────────────────────────────────

    /// Canonical spelling of a unit token.
    ///
    /// - micro aliases (ug, mcg, µg, μg, æg) -> "µg"
    /// - kj / kilojoule(s) -> "kJ"; kcal / kilocalorie(s) -> "kcal"; iu -> "iu"
    /// - mass aliases (grams, kilogramo, lbs, onzas, ...) -> g, kg, ton, lb, oz, mg
    /// - anything else -> trimmed and lower-cased
    /// - blank -> ""
    [[nodiscard]] static std::string canonical_unit(std::string_view unit);

    /// Formulation mass unit (g, kg, ton, lb, oz) for a token, or "" when the
    /// token is not one. "mg" is a known mass unit but not a formulation unit.
    [[nodiscard]] static std::string normalize_mass_unit(std::string_view unit);

    /// True when `canonical_unit(unit)` has a gram factor.
    [[nodiscard]] static bool is_mass_unit(std::string_view unit);

    // ── Conversion ────────────────────────────────────────────────────────────

    /// `value * factor(from) / factor(to)` over the gram table.
    ///
    /// # Returns
    /// - `value` unchanged when both tokens canonicalize to the same unit
    /// - `nullopt` when either token is blank or not a mass unit
    [[nodiscard]] static std::optional<Decimal>
    convert_mass(const Decimal& value, std::string_view from, std::string_view to);

    /// Mass-to-mass, or kcal <-> kJ at 4.184 kJ/kcal. `nullopt` otherwise.
    [[nodiscard]] static std::optional<Decimal>
    convert_amount(const Decimal& value, std::string_view from, std::string_view to);

    [[nodiscard]] static std::optional<Decimal>
    mass_to_g(const Decimal& value, std::string_view unit);

    [[nodiscard]] static std::optional<Decimal>
    mass_to_kg(const Decimal& value, std::string_view unit);

    /// Duration in hours: "h" as-is, "min" / 60.
    ///
    /// # Returns
    /// `nullopt` for a non-positive value or any other unit.
    [[nodiscard]] static std::optional<Decimal>
    time_to_hours(const Decimal& value, std::string_view unit);

private:
    /// Gram equivalent of one unit of a canonical mass token.
    [[nodiscard]] static std::optional<Decimal> grams_per_unit(std::string_view canonical);
};

}  // namespace fce::units
