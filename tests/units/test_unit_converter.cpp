/// @file tests/units/test_unit_converter.cpp
/// @brief Unit tests for unit canonicalization and mass/energy/time conversion.

#include <gtest/gtest.h>
#include "../test_support.hpp"
#include "fce/constants.hpp"
#include "fce/units.hpp"

#include <string>

using namespace fce;
using fce::testing::D;
using fce::units::UnitConverter;

namespace {
const std::string MICRO{constants::MICROGRAM_SYMBOL};
}

// ─── canonical_unit ──────────────────────────────────────────────────────────

TEST(UnitConverter_CanonicalUnit, MicroAliasesCollapse) {
    EXPECT_EQ(UnitConverter::canonical_unit("ug"), MICRO);
    EXPECT_EQ(UnitConverter::canonical_unit("MCG"), MICRO);
    EXPECT_EQ(UnitConverter::canonical_unit("\xCE\xBCg"), MICRO);   // Greek mu
    EXPECT_EQ(UnitConverter::canonical_unit("\xC2\xB5g"), MICRO);   // micro sign
    EXPECT_EQ(UnitConverter::canonical_unit("\xC3\xA6g"), MICRO);   // mis-decoded
}

TEST(UnitConverter_CanonicalUnit, EnergyUnits) {
    EXPECT_EQ(UnitConverter::canonical_unit("KJ"), "kJ");
    EXPECT_EQ(UnitConverter::canonical_unit("kilojoules"), "kJ");
    EXPECT_EQ(UnitConverter::canonical_unit("KCAL"), "kcal");
    EXPECT_EQ(UnitConverter::canonical_unit("IU"), "iu");
}

TEST(UnitConverter_CanonicalUnit, MassAliases) {
    EXPECT_EQ(UnitConverter::canonical_unit(" Gramos "), "g");
    EXPECT_EQ(UnitConverter::canonical_unit("Kilogramo"), "kg");
    EXPECT_EQ(UnitConverter::canonical_unit("lbs"), "lb");
    EXPECT_EQ(UnitConverter::canonical_unit("onzas"), "oz");
    EXPECT_EQ(UnitConverter::canonical_unit("tonelada"), "ton");
}

TEST(UnitConverter_CanonicalUnit, UnknownLowercasedAndBlankEmpty) {
    EXPECT_EQ(UnitConverter::canonical_unit("SPECIAL"), "special");
    EXPECT_EQ(UnitConverter::canonical_unit("   "), "");
}

// ─── normalize_mass_unit ─────────────────────────────────────────────────────

TEST(UnitConverter_NormalizeMassUnit, FormulationUnitsOnly) {
    EXPECT_EQ(UnitConverter::normalize_mass_unit("KG"), "kg");
    EXPECT_EQ(UnitConverter::normalize_mass_unit("pounds"), "lb");
    EXPECT_EQ(UnitConverter::normalize_mass_unit("mg"), "");
    EXPECT_EQ(UnitConverter::normalize_mass_unit("kcal"), "");
    EXPECT_EQ(UnitConverter::normalize_mass_unit(""), "");
}

TEST(UnitConverter_IsMassUnit, IncludesSubGramUnits) {
    EXPECT_TRUE(UnitConverter::is_mass_unit("mg"));
    EXPECT_TRUE(UnitConverter::is_mass_unit("mcg"));
    EXPECT_FALSE(UnitConverter::is_mass_unit("kJ"));
}

// ─── Conversion ──────────────────────────────────────────────────────────────

TEST(UnitConverter_ConvertMass, KilogramToGram) {
    EXPECT_EQ(*UnitConverter::convert_mass(D("1.5"), "kg", "g"), D("1500"));
}

TEST(UnitConverter_ConvertMass, PoundToGram) {
    EXPECT_EQ(*UnitConverter::mass_to_g(Decimal(2), "lb"), D("907.18474"));
}

TEST(UnitConverter_ConvertMass, MicrogramToMilligram) {
    EXPECT_EQ(*UnitConverter::convert_mass(Decimal(250), "mcg", "mg"), D("0.25"));
}

TEST(UnitConverter_ConvertMass, SameUnitUnchanged) {
    EXPECT_EQ(*UnitConverter::convert_mass(D("3.3"), "grams", "g"), D("3.3"));
}

TEST(UnitConverter_ConvertMass, NonMass_ReturnsNullopt) {
    EXPECT_FALSE(UnitConverter::convert_mass(Decimal(1), "kcal", "g").has_value());
    EXPECT_FALSE(UnitConverter::convert_mass(Decimal(1), "", "g").has_value());
}

TEST(UnitConverter_ConvertAmount, KcalToKj) {
    EXPECT_EQ(*UnitConverter::convert_amount(Decimal(100), "kcal", "kj"), D("418.4"));
    EXPECT_EQ(*UnitConverter::convert_amount(D("418.4"), "kJ", "kcal"), Decimal(100));
}

TEST(UnitConverter_ConvertAmount, MassToEnergy_ReturnsNullopt) {
    EXPECT_FALSE(UnitConverter::convert_amount(Decimal(1), "g", "kcal").has_value());
}

TEST(UnitConverter_MassToKg, Grams) {
    EXPECT_EQ(*UnitConverter::mass_to_kg(Decimal(250), "g"), D("0.25"));
}

// ─── Time ────────────────────────────────────────────────────────────────────

TEST(UnitConverter_TimeToHours, MinutesAndHours) {
    EXPECT_EQ(*UnitConverter::time_to_hours(Decimal(30), "min"), D("0.5"));
    EXPECT_EQ(*UnitConverter::time_to_hours(Decimal(2), " H "), Decimal(2));
}

TEST(UnitConverter_TimeToHours, NonPositiveOrUnknown_ReturnsNullopt) {
    EXPECT_FALSE(UnitConverter::time_to_hours(Decimal(), "h").has_value());
    EXPECT_FALSE(UnitConverter::time_to_hours(Decimal(-1), "h").has_value());
    EXPECT_FALSE(UnitConverter::time_to_hours(Decimal(1), "s").has_value());
}
