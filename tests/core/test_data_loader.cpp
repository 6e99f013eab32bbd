/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for FormulationLoader.
///
/// Test categories:
///   - Header, comment and blank line handling
///   - Ingredient rows: amounts, locks, macros, cost columns
///   - Directive rows: @process, @packaging, @rate, @yield
///   - Malformed rows skipped, never fatal
///   - File loading

#include <gtest/gtest.h>
#include "../test_support.hpp"
#include "fce/data_loader.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>

using namespace fce;
using namespace fce::core;
using fce::testing::D;

namespace {

const std::string HEADER =
    "description,amount_g,locked,protein_g,carbohydrate_g,fat_g,pack_amount,pack_unit,cost_value,currency\n";

}  // namespace

// ─── Ingredient rows ─────────────────────────────────────────────────────────

TEST(FormulationLoader_Parse, BasicRows) {
    Engine engine;
    const auto f = FormulationLoader::parse_csv_string(
        HEADER +
        "# comment line\n"
        "Wheat flour,50,1,10,76,1,1,kg,1.20,$\n"
        "\n"
        "Sugar,30,0,0,100,0,,,,\n",
        engine, "Cookies");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->name(), "Cookies");
    ASSERT_EQ(f->ingredient_count(), 2u);

    const auto& flour = f->ingredients()[0];
    EXPECT_EQ(flour.description(), "Wheat flour");
    EXPECT_EQ(flour.amount_g(), Decimal(50));
    EXPECT_TRUE(flour.locked());
    EXPECT_EQ(flour.food().data_type(), "Manual");
    EXPECT_EQ(flour.fdc_id(), -3);
    EXPECT_EQ(flour.food().get_nutrient("Protein")->amount(), Decimal(10));
    EXPECT_EQ(flour.cost().pack_unit.value_or(""), "kg");
    EXPECT_EQ(flour.cost().value.value_or(Decimal()), D("1.20"));
    EXPECT_EQ(flour.cost().currency_symbol.value_or(""), "$");

    const auto& sugar = f->ingredients()[1];
    EXPECT_FALSE(sugar.locked());
    EXPECT_FALSE(sugar.cost().pack_amount.has_value());
    EXPECT_FALSE(sugar.cost().currency_symbol.has_value());
}

TEST(FormulationLoader_Parse, ShortRowAndBlankMacros) {
    Engine engine;
    const auto f = FormulationLoader::parse_csv_string(HEADER + "Salt,2\nPepper,1,,,,\n", engine, "Seasoning");
    ASSERT_TRUE(f.has_value());
    ASSERT_EQ(f->ingredient_count(), 2u);
    EXPECT_FALSE(f->ingredients()[0].locked());
    EXPECT_FALSE(f->ingredients()[1].food().has_nutrient("Protein"));
}

TEST(FormulationLoader_Parse, CrLfLineEndings) {
    Engine engine;
    const auto f = FormulationLoader::parse_csv_string(
        "description,amount_g\r\nOats,40,yes\r\n", engine, "Oats");
    ASSERT_TRUE(f.has_value());
    ASSERT_EQ(f->ingredient_count(), 1u);
    EXPECT_TRUE(f->ingredients()[0].locked());
}

TEST(FormulationLoader_Parse, QuotedCommaDecimals) {
    Engine engine;
    const auto f = FormulationLoader::parse_csv_string(
        HEADER +
        "\"Flour, whole wheat\",\"12,5\",0,\"13,2\",,,\"1.000,5\",g,\"2,40\",$\n"
        "@packaging,Bag,1,\"0,05\"\n",
        engine, "Bread");
    ASSERT_TRUE(f.has_value());
    ASSERT_EQ(f->ingredient_count(), 1u);

    const auto& flour = f->ingredients()[0];
    EXPECT_EQ(flour.description(), "Flour, whole wheat");
    EXPECT_EQ(flour.amount_g(), D("12.5"));
    EXPECT_EQ(flour.food().get_nutrient("Protein")->amount(), D("13.2"));
    EXPECT_EQ(flour.cost().pack_amount.value_or(Decimal()), D("1000.5"));
    EXPECT_EQ(flour.cost().value.value_or(Decimal()), D("2.40"));

    ASSERT_EQ(f->packaging_items().size(), 1u);
    EXPECT_EQ(f->packaging_items()[0].unit_cost, D("0.05"));
}

TEST(FormulationLoader_Parse, UnquotedCommaSplitsField) {
    Engine engine;
    // 12,5 unquoted is amount 12 followed by a locked column of "5".
    const auto f = FormulationLoader::parse_csv_string(HEADER + "Sugar,12,5\n", engine, "Sugar");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->ingredient_count(), 0u);
}

TEST(FormulationLoader_Parse, MalformedRowsSkipped) {
    Engine engine;
    const auto f = FormulationLoader::parse_csv_string(
        HEADER +
        ",10,0\n"                            // blank description
        "Bad amount,abc,0\n"                 // amount not a number
        "Negative,-5,0\n"                    // negative amount
        "Bad flag,5,maybe\n"                 // unknown lock flag
        "Bad macro,5,0,lots\n"               // macro not a number
        "Too wide,5,0,1,1,1,1,kg,1,$,extra\n"
        "OnlyName\n"                         // missing amount
        "Good,5,0\n",
        engine, "Messy");
    ASSERT_TRUE(f.has_value());
    ASSERT_EQ(f->ingredient_count(), 1u);
    EXPECT_EQ(f->ingredients()[0].description(), "Good");
}

TEST(FormulationLoader_Parse, HeaderOnly_Empty) {
    Engine engine;
    const auto f = FormulationLoader::parse_csv_string(HEADER, engine, "Nothing");
    ASSERT_TRUE(f.has_value());
    EXPECT_TRUE(f->is_empty());
}

TEST(FormulationLoader_Parse, BlankName_Nullopt) {
    Engine engine;
    EXPECT_FALSE(FormulationLoader::parse_csv_string(HEADER, engine, " ").has_value());
}

TEST(FormulationLoader_Parse, EngineDefaultsApplied) {
    Engine engine(EngineConfig{.default_yield_percent = Decimal(80)});
    const auto f = FormulationLoader::parse_csv_string(HEADER, engine, "Defaults");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->yield_percent(), Decimal(80));
}

// ─── Directives ──────────────────────────────────────────────────────────────

TEST(FormulationLoader_Directives, AllKinds) {
    Engine engine;
    const auto f = FormulationLoader::parse_csv_string(
        HEADER +
        "Flour,100,0\n"
        "@process,Mixing,FIXED,30,min,12,,,,\n"
        "@process,Baking,mixed,2,min,20,,10,min,\n"
        "@packaging,Bag,1,0.05,USD\n"
        "@packaging,Label,2,0.01\n"
        "@rate,US Dollar,USD,17.5\n"
        "@yield,90\n",
        engine, "Directives");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->ingredient_count(), 1u);

    ASSERT_EQ(f->process_costs().size(), 2u);
    const auto& mixing = f->process_costs()[0];
    EXPECT_EQ(mixing.name, "Mixing");
    EXPECT_EQ(mixing.scale_type, model::ScaleType::Fixed);
    EXPECT_EQ(mixing.time_value.value_or(Decimal()), Decimal(30));
    EXPECT_EQ(mixing.time_unit.value_or(""), "min");
    EXPECT_FALSE(mixing.total_cost.has_value());
    const auto& baking = f->process_costs()[1];
    EXPECT_EQ(baking.scale_type, model::ScaleType::Mixed);
    EXPECT_EQ(baking.setup_time_value.value_or(Decimal()), Decimal(10));

    ASSERT_EQ(f->packaging_items().size(), 2u);
    EXPECT_EQ(f->packaging_items()[0].currency_symbol.value_or(""), "USD");
    EXPECT_FALSE(f->packaging_items()[1].currency_symbol.has_value());

    const auto& rates = f->currency_rates();
    const auto usd = std::find_if(rates.begin(), rates.end(),
                                  [](const model::CurrencyRate& r) { return r.symbol == "USD"; });
    ASSERT_NE(usd, rates.end());
    EXPECT_EQ(usd->rate_to_base, D("17.5"));

    EXPECT_EQ(f->yield_percent(), Decimal(90));
}

TEST(FormulationLoader_Directives, MalformedSkipped) {
    Engine engine;
    const auto f = FormulationLoader::parse_csv_string(
        HEADER +
        "@process,,FIXED\n"
        "@process,Run,HOURLY\n"
        "@packaging,Box,one,1\n"
        "@rate,Broken,XXX,0\n"
        "@yield,lots\n"
        "@unknown,1\n",
        engine, "Bad directives");
    ASSERT_TRUE(f.has_value());
    EXPECT_TRUE(f->process_costs().empty());
    EXPECT_TRUE(f->packaging_items().empty());
    EXPECT_EQ(f->currency_rates().size(), 1u);
    EXPECT_EQ(f->yield_percent(), Decimal(100));
}

// ─── Flags ───────────────────────────────────────────────────────────────────

TEST(FormulationLoader_ParseFlag, Spellings) {
    EXPECT_EQ(FormulationLoader::parse_flag(""), false);
    EXPECT_EQ(FormulationLoader::parse_flag("0"), false);
    EXPECT_EQ(FormulationLoader::parse_flag("No"), false);
    EXPECT_EQ(FormulationLoader::parse_flag("1"), true);
    EXPECT_EQ(FormulationLoader::parse_flag(" TRUE "), true);
    EXPECT_EQ(FormulationLoader::parse_flag("x"), true);
    EXPECT_FALSE(FormulationLoader::parse_flag("maybe").has_value());
}

// ─── Files ───────────────────────────────────────────────────────────────────

TEST(FormulationLoader_File, MissingFile_Nullopt) {
    Engine engine;
    EXPECT_FALSE(FormulationLoader::load_csv("/nonexistent/path/batch.csv", engine).has_value());
}

TEST(FormulationLoader_File, LoadsAndDefaultsNameToPath) {
    const std::string path = ::testing::TempDir() + "fce_loader_test.csv";
    {
        std::ofstream out(path);
        out << HEADER << "Rice,70,0,7,80,1\nBeans,30,1,21,60,1\n";
    }

    Engine engine;
    const auto f = FormulationLoader::load_csv(path, engine);
    std::remove(path.c_str());

    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->name(), path);
    EXPECT_EQ(f->ingredient_count(), 2u);
    EXPECT_EQ(f->locked_weight(), Decimal(30));
}
