/// @file tests/units/test_number_parser.cpp
/// @brief Unit tests for UnitConverter::parse_user_number.
///
/// Both decimal conventions are accepted: with a comma present, the comma is
/// the decimal point and periods group thousands; otherwise commas group.

#include <gtest/gtest.h>
#include "../test_support.hpp"
#include "fce/units.hpp"

using namespace fce;
using fce::testing::D;
using fce::units::UnitConverter;

TEST(UnitConverter_ParseUserNumber, PlainDecimal) {
    EXPECT_EQ(*UnitConverter::parse_user_number("12.5"), D("12.5"));
}

TEST(UnitConverter_ParseUserNumber, CommaDecimalPoint) {
    EXPECT_EQ(*UnitConverter::parse_user_number("12,5"), D("12.5"));
}

TEST(UnitConverter_ParseUserNumber, EuropeanThousands) {
    EXPECT_EQ(*UnitConverter::parse_user_number("1.234,5"), D("1234.5"));
}

TEST(UnitConverter_ParseUserNumber, EnglishThousandsWithoutComma) {
    EXPECT_EQ(*UnitConverter::parse_user_number("1234.5"), D("1234.5"));
}

TEST(UnitConverter_ParseUserNumber, InnerSpacesRemoved) {
    EXPECT_EQ(*UnitConverter::parse_user_number(" 1 234,5 "), D("1234.5"));
}

TEST(UnitConverter_ParseUserNumber, Negative) {
    EXPECT_EQ(*UnitConverter::parse_user_number("-0,25"), D("-0.25"));
}

TEST(UnitConverter_ParseUserNumber, Blank_ReturnsNullopt) {
    EXPECT_FALSE(UnitConverter::parse_user_number("").has_value());
    EXPECT_FALSE(UnitConverter::parse_user_number("   ").has_value());
}

TEST(UnitConverter_ParseUserNumber, Garbage_ReturnsNullopt) {
    EXPECT_FALSE(UnitConverter::parse_user_number("abc").has_value());
    EXPECT_FALSE(UnitConverter::parse_user_number("12g").has_value());
    EXPECT_FALSE(UnitConverter::parse_user_number("nan").has_value());
}
