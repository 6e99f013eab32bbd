/// @file tests/model/test_food.cpp
/// @brief Unit tests for Nutrient, Food and Ingredient construction rules.

#include <gtest/gtest.h>
#include "../test_support.hpp"

using namespace fce;
using namespace fce::model;
using fce::testing::D;
using fce::testing::make_food;

// ─── Nutrient ────────────────────────────────────────────────────────────────

TEST(Nutrient_Make, Valid_Succeeds) {
    const auto n = Nutrient::make("Protein", "g", D("12.5"), 1003, "203");
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->name(), "Protein");
    EXPECT_EQ(n->amount(), D("12.5"));
    EXPECT_EQ(n->id().value_or(0), 1003);
    EXPECT_EQ(n->number().value_or(""), "203");
}

TEST(Nutrient_Make, BlankNameOrUnit_Fails) {
    EXPECT_FALSE(Nutrient::make("  ", "g", Decimal(1)).has_value());
    EXPECT_FALSE(Nutrient::make("Protein", "", Decimal(1)).has_value());
}

TEST(Nutrient_Make, NegativeAmount_Fails) {
    EXPECT_FALSE(Nutrient::make("Protein", "g", D("-0.1")).has_value());
}

TEST(Nutrient_Scale, MultipliesAmount) {
    const auto n = Nutrient::make("Fat", "g", Decimal(4));
    EXPECT_EQ(n->scale(D("0.5"))->amount(), Decimal(2));
    EXPECT_FALSE(n->scale(Decimal(-1)).has_value());
}

// ─── Food ────────────────────────────────────────────────────────────────────

TEST(Food_Make, DatabaseFoodNeedsPositiveId) {
    EXPECT_FALSE(Food::make(0, "Oats", "Foundation").has_value());
    EXPECT_TRUE(Food::make(173904, "Oats", "Foundation").has_value());
}

TEST(Food_Make, ManualFoodMayHaveNoId) {
    EXPECT_TRUE(Food::make(0, "House blend", "manual").has_value());
    EXPECT_TRUE(Food::make(-3, "House blend", "Manual").has_value());
}

TEST(Food_Make, BlankDescriptionOrType_Fails) {
    EXPECT_FALSE(Food::make(1, "", "Branded").has_value());
    EXPECT_FALSE(Food::make(1, "Oats", " ").has_value());
}

TEST(Food_GetNutrient, CaseInsensitive) {
    const auto food = make_food("Oats", {{"Protein", "13.2"}});
    ASSERT_TRUE(food->has_nutrient("PROTEIN"));
    EXPECT_EQ(food->get_nutrient("protein")->amount(), D("13.2"));
    EXPECT_FALSE(food->get_nutrient("Water").has_value());
}

// ─── Ingredient ──────────────────────────────────────────────────────────────

TEST(Ingredient_Make, NullFoodOrNegativeAmount_Fails) {
    EXPECT_FALSE(Ingredient::make(nullptr, Decimal(1)).has_value());
    EXPECT_FALSE(Ingredient::make(make_food("Oats"), Decimal(-1)).has_value());
}

TEST(Ingredient_SetAmount, NegativeRejectedAndUnchanged) {
    auto ing = *Ingredient::make(make_food("Oats"), Decimal(10));
    EXPECT_FALSE(ing.set_amount_g(Decimal(-5)));
    EXPECT_EQ(ing.amount_g(), Decimal(10));
    EXPECT_TRUE(ing.set_amount_g(Decimal(0)));
    EXPECT_TRUE(ing.amount_g().is_zero());
}

TEST(Ingredient_CalculatePercentage, ShareOfTotal) {
    auto ing = *Ingredient::make(make_food("Oats"), Decimal(30));
    EXPECT_EQ(ing.calculate_percentage(Decimal(120)), Decimal(25));
    EXPECT_TRUE(ing.calculate_percentage(Decimal()).is_zero());
}

TEST(Ingredient_GetNutrientAmount, ScaledFromPer100g) {
    auto ing = *Ingredient::make(make_food("Oats", {{"Protein", "13.2"}}), Decimal(50));
    EXPECT_EQ(ing.get_nutrient_amount("Protein"), D("6.6"));
    EXPECT_TRUE(ing.get_nutrient_amount("Water").is_zero());
}

// ─── ScaleType ───────────────────────────────────────────────────────────────

TEST(ScaleType_Parse, CaseInsensitive) {
    EXPECT_EQ(parse_scale_type("fixed"), ScaleType::Fixed);
    EXPECT_EQ(parse_scale_type(" Variable_Per_Kg "), ScaleType::VariablePerKg);
    EXPECT_EQ(parse_scale_type("MIXED"), ScaleType::Mixed);
    EXPECT_FALSE(parse_scale_type("hourly").has_value());
}

TEST(ScaleType_ToString, RoundTrips) {
    for (const auto t : {ScaleType::Fixed, ScaleType::VariablePerKg, ScaleType::Mixed}) {
        EXPECT_EQ(parse_scale_type(to_string(t)), t);
    }
}
