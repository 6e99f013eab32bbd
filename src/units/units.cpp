/// @file src/units/units.cpp
/// @brief Number parsing and unit conversion implementation.

#include "fce/units.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <utility>

namespace fce::units {

// ─── Lookup tables ────────────────────────────────────────────────────────────

namespace {

/// Every spelling of the micro-gram symbol seen in source data, after ASCII
/// lower-casing (U+00B5, U+03BC, and the mojibake forms of a mis-decoded µ).
constexpr std::array<std::string_view, 7> MICRO_ALIASES = {
    "ug", "mcg", "\xC2\xB5g", "\xCE\xBCg", "\xC3\xA6g", "\xC3\x86g", "\xCE\x9Cg",
};

const std::unordered_map<std::string_view, std::string_view>& mass_aliases() {
    static const std::unordered_map<std::string_view, std::string_view> table = {
        {"g", "g"},        {"gram", "g"},      {"grams", "g"},
        {"gramo", "g"},    {"gramos", "g"},
        {"kg", "kg"},      {"kilogram", "kg"}, {"kilograms", "kg"},
        {"kilogramo", "kg"}, {"kilogramos", "kg"},
        {"t", "ton"},      {"tn", "ton"},      {"ton", "ton"},
        {"tonne", "ton"},  {"tonnes", "ton"},  {"tonelada", "ton"},
        {"toneladas", "ton"},
        {"lb", "lb"},      {"lbs", "lb"},      {"libra", "lb"},
        {"libras", "lb"},  {"pound", "lb"},    {"pounds", "lb"},
        {"oz", "oz"},      {"onza", "oz"},     {"onzas", "oz"},
        {"ounce", "oz"},   {"ounces", "oz"},
        {"mg", "mg"},
    };
    return table;
}

bool is_formulation_mass_unit(std::string_view canonical) {
    return canonical == "g" || canonical == "kg" || canonical == "ton" ||
           canonical == "lb" || canonical == "oz";
}

}  // namespace

// ─── Numbers ──────────────────────────────────────────────────────────────────

std::optional<Decimal> UnitConverter::parse_user_number(std::string_view text) {
    std::string cleaned = text::trim(text);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ' '), cleaned.end());
    if (cleaned.find(',') != std::string::npos) {
        // "1.234,5": periods group thousands, the comma is the decimal point.
        cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '.'), cleaned.end());
        std::replace(cleaned.begin(), cleaned.end(), ',', '.');
    } else {
        cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ','), cleaned.end());
    }

    return Decimal::parse(cleaned);
}

// ─── Unit tokens ──────────────────────────────────────────────────────────────

std::string UnitConverter::canonical_unit(std::string_view unit) {
    const std::string lower = text::fold(unit);
    if (lower.empty()) {
        return {};
    }

    if (std::find(MICRO_ALIASES.begin(), MICRO_ALIASES.end(), lower) != MICRO_ALIASES.end()) {
        return std::string(constants::MICROGRAM_SYMBOL);
    }
    if (lower == "kj" || lower == "kilojoule" || lower == "kilojoules") {
        return "kJ";
    }
    if (lower == "kcal" || lower == "kilocalorie" || lower == "kilocalories") {
        return "kcal";
    }
    if (lower == "iu") {
        return "iu";
    }

    const auto& aliases = mass_aliases();
    if (const auto it = aliases.find(lower); it != aliases.end()) {
        return std::string(it->second);
    }
    return lower;
}

std::string UnitConverter::normalize_mass_unit(std::string_view unit) {
    const std::string lower = text::fold(unit);
    const auto& aliases = mass_aliases();
    const auto it = aliases.find(lower);
    if (it == aliases.end() || !is_formulation_mass_unit(it->second)) {
        return {};
    }
    return std::string(it->second);
}

bool UnitConverter::is_mass_unit(std::string_view unit) {
    return grams_per_unit(canonical_unit(unit)).has_value();
}

std::optional<Decimal> UnitConverter::grams_per_unit(std::string_view canonical) {
    if (canonical == constants::MICROGRAM_SYMBOL) return Decimal(constants::GRAMS_PER_MICROGRAM);
    if (canonical == "mg")  return Decimal(constants::GRAMS_PER_MILLIGRAM);
    if (canonical == "g")   return Decimal(1);
    if (canonical == "kg")  return Decimal(constants::GRAMS_PER_KILOGRAM);
    if (canonical == "ton") return Decimal(constants::GRAMS_PER_TON);
    if (canonical == "lb")  return Decimal(constants::GRAMS_PER_POUND);
    if (canonical == "oz")  return Decimal(constants::GRAMS_PER_OUNCE);
    return std::nullopt;
}

// ─── Conversion ───────────────────────────────────────────────────────────────

std::optional<Decimal>
UnitConverter::convert_mass(const Decimal& value, std::string_view from, std::string_view to) {
    const std::string source = canonical_unit(from);
    const std::string target = canonical_unit(to);
    if (source.empty() || target.empty()) {
        return std::nullopt;
    }
    if (source == target) {
        return value;
    }

    const auto source_g = grams_per_unit(source);
    const auto target_g = grams_per_unit(target);
    if (!source_g || !target_g) {
        return std::nullopt;
    }
    return value * *source_g / *target_g;
}

std::optional<Decimal>
UnitConverter::convert_amount(const Decimal& value, std::string_view from, std::string_view to) {
    const std::string source = canonical_unit(from);
    const std::string target = canonical_unit(to);
    if (source.empty() || target.empty()) {
        return std::nullopt;
    }
    if (source == target) {
        return value;
    }

    if (grams_per_unit(source) && grams_per_unit(target)) {
        return convert_mass(value, source, target);
    }

    const Decimal kj_per_kcal(constants::KCAL_TO_KJ);
    if (source == "kcal" && target == "kJ") {
        return value * kj_per_kcal;
    }
    if (source == "kJ" && target == "kcal") {
        return value / kj_per_kcal;
    }
    return std::nullopt;
}

std::optional<Decimal> UnitConverter::mass_to_g(const Decimal& value, std::string_view unit) {
    return convert_mass(value, unit, "g");
}

std::optional<Decimal> UnitConverter::mass_to_kg(const Decimal& value, std::string_view unit) {
    return convert_mass(value, unit, "kg");
}

std::optional<Decimal>
UnitConverter::time_to_hours(const Decimal& value, std::string_view unit) {
    if (!value.is_positive()) {
        return std::nullopt;
    }
    const std::string lower = text::fold(unit);
    if (lower == "h") {
        return value;
    }
    if (lower == "min") {
        return value / Decimal(60);
    }
    return std::nullopt;
}

}  // namespace fce::units
