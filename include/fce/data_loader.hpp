#pragma once

/// @file include/fce/data_loader.hpp
/// @brief CSV loader for batch formulations.
///
/// # Module: FormulationLoader
///
/// ## Responsibility
/// Parse a CSV batch file into a `model::Formulation`. Malformed rows are
/// skipped; the loader never fails on bad row data.
///
/// ## Expected CSV Format
/// ```
/// description,amount_g,locked,protein_g,carbohydrate_g,fat_g,pack_amount,pack_unit,cost_value,currency
/// Wheat flour,50,1,10.3,76.3,1.0,1,kg,1.20,$
/// Sugar,30,0,0,100,0,,,,
/// @process,Mixing,FIXED,30,min,12,,,,
/// @process,Baking,MIXED,2,min,20,,10,min,
/// @packaging,Bag,1,0.05,USD
/// @rate,US Dollar,USD,17.5
/// @yield,90
/// ```
/// The first line that is neither blank nor a comment is the header and is
/// skipped. Lines starting with `#` are comments.
///
/// ## Row kinds
/// - ingredient (no `@` prefix): the columns above. Nutrient columns are
///   per 100 g; blank ones are omitted. Cost columns may be blank.
/// - `@process,name,scale_type,time_value,time_unit,cost_per_hour,total_cost,
///   setup_time_value,setup_time_unit,time_per_kg_value`
/// - `@packaging,name,quantity_per_pack,unit_cost[,currency]`
/// - `@rate,name,symbol,rate_to_base`
/// - `@yield,percent`
///
/// Fields are comma-separated. A field in double quotes may contain commas
/// (`""` is a literal quote), so a comma-decimal number is written quoted:
/// `Sugar,"12,5",0`. Numbers accept either decimal convention within a field
/// (`UnitConverter::parse_user_number`).
///
/// ## Guarantees
/// - Ingredient foods are built through `Engine::build_food` with data type
///   "Manual", so they pass through the normalizer
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "fce/engine.hpp"
#include "fce/model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fce::core {

/// Loads formulations from CSV files and strings.
class FormulationLoader {
public:
    FormulationLoader() = delete;  // pure static

    /// Load a formulation from a CSV file on disk.
    ///
    /// # Arguments
    /// * `filepath` - Path to a CSV file with header row
    /// * `engine`   - Builds the ingredient foods; its config supplies the
    ///                formulation defaults
    /// * `name`     - Formulation name; the file path when empty
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Otherwise the formulation, possibly with no ingredients
    [[nodiscard]] static std::optional<model::Formulation>
    load_csv(const std::string& filepath, Engine& engine, std::string name = {});

    /// Parse a formulation from CSV-formatted text (useful for testing).
    ///
    /// # Returns
    /// `nullopt` only for a blank `name`.
    [[nodiscard]] static std::optional<model::Formulation>
    parse_csv_string(const std::string& csv_content, Engine& engine, std::string name);

    /// Parse a locked flag: 1/true/yes/x -> true, 0/false/no/blank -> false.
    [[nodiscard]] static std::optional<bool> parse_flag(std::string_view text);

private:
    [[nodiscard]] static bool
    parse_ingredient_row(const std::vector<std::string>& fields,
                         std::size_t row_number,
                         Engine& engine,
                         model::Formulation& formulation);

    [[nodiscard]] static bool
    parse_directive_row(const std::vector<std::string>& fields, model::Formulation& formulation);
};

}  // namespace fce::core
