/// @file src/core/data_loader.cpp
/// @brief CSV FormulationLoader.

#include "fce/data_loader.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"
#include "fce/units.hpp"

#include <fmt/core.h>

#include <fstream>
#include <memory>
#include <sstream>

namespace fce::core {

using units::UnitConverter;

namespace {

constexpr std::size_t INGREDIENT_COLUMNS = 10;

enum Column : std::size_t {
    DESCRIPTION = 0,
    AMOUNT_G,
    LOCKED,
    PROTEIN_G,
    CARBOHYDRATE_G,
    FAT_G,
    PACK_AMOUNT,
    PACK_UNIT,
    COST_VALUE,
    CURRENCY,
};

const std::string& field(const std::vector<std::string>& fields, std::size_t i) {
    static const std::string empty;
    return i < fields.size() ? fields[i] : empty;
}

std::optional<Decimal> number(const std::string& text) {
    if (text::is_blank(text)) {
        return std::nullopt;
    }
    return UnitConverter::parse_user_number(text);
}

std::optional<std::string> text_or_null(const std::string& text) {
    std::string t = text::trim(text);
    if (t.empty()) {
        return std::nullopt;
    }
    return t;
}

}  // namespace

// ─── FormulationLoader::parse_flag ────────────────────────────────────────────

std::optional<bool> FormulationLoader::parse_flag(std::string_view text) {
    const std::string t = text::fold(text);
    if (t.empty() || t == "0" || t == "false" || t == "no") return false;
    if (t == "1" || t == "true" || t == "yes" || t == "x") return true;
    return std::nullopt;
}

// ─── FormulationLoader::parse_ingredient_row ──────────────────────────────────

bool FormulationLoader::parse_ingredient_row(const std::vector<std::string>& fields,
                                             std::size_t row_number,
                                             Engine& engine,
                                             model::Formulation& formulation) {
    if (fields.size() <= AMOUNT_G || fields.size() > INGREDIENT_COLUMNS) {
        return false;
    }

    const std::string description = text::trim(field(fields, DESCRIPTION));
    const auto amount = number(field(fields, AMOUNT_G));
    const auto locked = parse_flag(field(fields, LOCKED));
    if (description.empty() || !amount || amount->is_negative() || !locked) {
        return false;
    }

    // Macro columns: blank = not given, anything else must be a number.
    struct Macro {
        Column      column;
        const char* name;
    };
    constexpr Macro macros[] = {
        {PROTEIN_G,      "Protein"},
        {CARBOHYDRATE_G, "Carbohydrate, by difference"},
        {FAT_G,          "Total lipid (fat)"},
    };

    nutrients::FoodRecord record{
        .fdc_id      = -static_cast<long long>(row_number),
        .description = description,
        .data_type   = "Manual",
    };
    for (const auto& m : macros) {
        const std::string& raw = field(fields, m.column);
        if (text::is_blank(raw)) {
            continue;
        }
        const auto value = number(raw);
        if (!value || value->is_negative()) {
            return false;
        }
        record.nutrients.push_back(nutrients::NutrientRecord{.name = m.name, .unit = "g", .amount = *value});
    }

    auto food = engine.build_food(record);
    if (!food) {
        return false;
    }
    auto ingredient = model::Ingredient::make(std::make_shared<const model::Food>(std::move(*food)),
                                              *amount, *locked);
    if (!ingredient) {
        return false;
    }

    // Cost gaps are reported by the cost engine, not rejected here.
    auto& cost = ingredient->cost();
    cost.pack_amount     = number(field(fields, PACK_AMOUNT));
    cost.pack_unit       = text_or_null(field(fields, PACK_UNIT));
    cost.value           = number(field(fields, COST_VALUE));
    cost.currency_symbol = text_or_null(field(fields, CURRENCY));

    formulation.add_ingredient(std::move(*ingredient));
    return true;
}

// ─── FormulationLoader::parse_directive_row ───────────────────────────────────

bool FormulationLoader::parse_directive_row(const std::vector<std::string>& fields,
                                            model::Formulation& formulation) {
    const std::string kind = text::fold(field(fields, 0));

    if (kind == "@process") {
        const auto name       = text_or_null(field(fields, 1));
        const auto scale_type = model::parse_scale_type(text::trim(field(fields, 2)));
        if (!name || !scale_type) {
            return false;
        }
        formulation.add_process_cost(model::ProcessCost{
            .name              = *name,
            .scale_type        = *scale_type,
            .time_value        = number(field(fields, 3)),
            .time_unit         = text_or_null(field(fields, 4)),
            .cost_per_hour     = number(field(fields, 5)),
            .total_cost        = number(field(fields, 6)),
            .setup_time_value  = number(field(fields, 7)),
            .setup_time_unit   = text_or_null(field(fields, 8)),
            .time_per_kg_value = number(field(fields, 9)),
        });
        return true;
    }

    if (kind == "@packaging") {
        const auto name      = text_or_null(field(fields, 1));
        const auto quantity  = number(field(fields, 2));
        const auto unit_cost = number(field(fields, 3));
        if (!name || !quantity || !unit_cost) {
            return false;
        }
        formulation.add_packaging_item(model::PackagingItem{
            .name              = *name,
            .quantity_per_pack = *quantity,
            .unit_cost         = *unit_cost,
            .currency_symbol   = text_or_null(field(fields, 4)),
        });
        return true;
    }

    if (kind == "@rate") {
        const auto symbol = text_or_null(field(fields, 2));
        const auto rate   = number(field(fields, 3));
        if (!symbol || !rate || !rate->is_positive()) {
            return false;
        }
        formulation.add_currency_rate(model::CurrencyRate{
            .name         = text::trim(field(fields, 1)),
            .symbol       = *symbol,
            .rate_to_base = *rate,
        });
        return true;
    }

    if (kind == "@yield") {
        const auto percent = number(field(fields, 1));
        if (!percent) {
            return false;
        }
        formulation.set_yield_percent(*percent);
        return true;
    }

    return false;
}

// ─── FormulationLoader::parse_csv_string ──────────────────────────────────────

std::optional<model::Formulation>
FormulationLoader::parse_csv_string(const std::string& csv_content, Engine& engine, std::string name) {
    auto formulation = engine.new_formulation(std::move(name));
    if (!formulation) {
        return std::nullopt;
    }

    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;
    std::size_t line_number = 0;
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (text::is_blank(line) || text::trim(line).front() == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        const auto fields = text::split_csv_line(line);
        const bool ok = text::trim(fields.front()).starts_with('@')
                            ? parse_directive_row(fields, *formulation)
                            : parse_ingredient_row(fields, line_number, engine, *formulation);
        if (!ok) {
            ++skipped;
            if (engine.config().verbose) {
                fmt::print(stderr, "[fce] skipping malformed row {}: {}\n", line_number, line);
            }
        }
    }

    if (engine.config().verbose) {
        fmt::print(stderr, "[fce] loaded {} ingredient(s), {} process(es), {} packaging item(s); {} row(s) skipped\n",
                   formulation->ingredient_count(), formulation->process_costs().size(),
                   formulation->packaging_items().size(), skipped);
    }
    return formulation;
}

// ─── FormulationLoader::load_csv ──────────────────────────────────────────────

std::optional<model::Formulation>
FormulationLoader::load_csv(const std::string& filepath, Engine& engine, std::string name) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }

    if (text::is_blank(name)) {
        name = filepath;
    }
    return parse_csv_string(contents, engine, std::move(name));
}

}  // namespace fce::core
