/// @file src/main.cpp
/// @brief fce CLI entry point.
///
/// Usage:
///   fce --report <csv_file> [--target <g>] [--unit-mass <value> <unit>] [--verbose]
///   fce --help

#include "fce/cost.hpp"
#include "fce/data_loader.hpp"
#include "fce/engine.hpp"
#include "fce/units.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>

namespace {

constexpr int DISPLAY_PLACES = 4;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  fce --report <csv_file> [options]   Nutrient and cost report for a batch\n"
        "  fce --help                          Show this help\n"
        "\n"
        "Options:\n"
        "  --target <g>                 Scale unlocked ingredients to a batch weight first\n"
        "  --unit-mass <value> <unit>   Per-unit costs for units of this mass (g, kg, lb, oz)\n"
        "  --verbose                    Diagnostics on stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  description,amount_g,locked,protein_g,carbohydrate_g,fat_g,pack_amount,pack_unit,cost_value,currency\n"
        "  @process,name,scale_type,time_value,time_unit,cost_per_hour,total_cost,setup_time_value,setup_time_unit,time_per_kg_value\n"
        "  @packaging,name,quantity_per_pack,unit_cost[,currency]\n"
        "  @rate,name,symbol,rate_to_base\n"
        "  @yield,percent\n"
    );
}

std::string show(const fce::Decimal& d) {
    return d.quantize(DISPLAY_PLACES).to_string();
}

struct ReportOptions {
    std::string                 filepath;
    std::optional<fce::Decimal> target_g;
    std::optional<fce::Decimal> unit_mass;
    std::string                 unit_mass_unit;
    bool                        verbose = false;
};

/// Parse everything after `--report`. Returns nullopt (after printing the
/// reason) on a bad argument.
std::optional<ReportOptions> parse_report_args(int argc, char* argv[]) {
    if (argc < 3) {
        fmt::print(stderr, "Error: --report requires a CSV file path\n");
        return std::nullopt;
    }

    ReportOptions opts;
    opts.filepath = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--target" && i + 1 < argc) {
            opts.target_g = fce::units::UnitConverter::parse_user_number(argv[++i]);
            if (!opts.target_g) {
                fmt::print(stderr, "Error: invalid --target value '{}'\n", argv[i]);
                return std::nullopt;
            }
        } else if (arg == "--unit-mass" && i + 2 < argc) {
            opts.unit_mass = fce::units::UnitConverter::parse_user_number(argv[++i]);
            opts.unit_mass_unit = argv[++i];
            if (!opts.unit_mass) {
                fmt::print(stderr, "Error: invalid --unit-mass value '{}'\n", argv[i - 1]);
                return std::nullopt;
            }
        } else {
            fmt::print(stderr, "Error: unknown or incomplete option '{}'\n", arg);
            return std::nullopt;
        }
    }
    return opts;
}

/// Load, optionally rescale, and print the report.
/// Returns 0 on success, 1 on error.
int run_report(const ReportOptions& opts) {
    fce::core::Engine engine(fce::core::EngineConfig{.verbose = opts.verbose});

    auto formulation = fce::core::FormulationLoader::load_csv(opts.filepath, engine);
    if (!formulation) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.filepath);
        return 1;
    }
    if (formulation->is_empty()) {
        fmt::print(stderr, "Error: no valid ingredients loaded from '{}'\n", opts.filepath);
        return 1;
    }

    fmt::print("Loaded {} ingredients from '{}'\n", formulation->ingredient_count(), opts.filepath);

    if (opts.target_g) {
        const auto status = engine.adjust_to_target_weight(*formulation, *opts.target_g);
        if (status != fce::formulation::Status::Ok) {
            fmt::print(stderr, "Error: cannot adjust to {} g: {}\n",
                       *opts.target_g, fce::formulation::to_string(status));
            return 1;
        }
    }

    // ── Ingredients ───────────────────────────────────────────────────────────
    const fce::Decimal total = formulation->total_weight();
    fmt::print("\nIngredients (total {} g)\n", show(total));
    for (const auto& ing : formulation->ingredients()) {
        fmt::print("  {:<32} {:>14} g  {:>9} %{}\n",
                   ing.description(), show(ing.amount_g()),
                   show(ing.calculate_percentage(total)),
                   ing.locked() ? "  [locked]" : "");
    }

    // ── Nutrients ─────────────────────────────────────────────────────────────
    fmt::print("\nPer 100 g\n");
    for (const auto& [key, t] : engine.display_totals(*formulation)) {
        fmt::print("  {:<40} {:>14} {}\n", t.name, show(t.amount), t.unit);
    }

    // ── Costs ─────────────────────────────────────────────────────────────────
    const auto ingredients_cost = engine.total_ingredients_cost_batch(*formulation);
    const auto process_cost     = engine.total_process_cost_batch(*formulation);
    const auto ing_complete     = fce::cost::CostEngine::ingredient_cost_completeness(*formulation);
    const auto proc_complete    = fce::cost::CostEngine::process_cost_completeness(*formulation);

    fmt::print("\nBatch cost ({})\n", fce::constants::BASE_CURRENCY_SYMBOL);
    fmt::print("  Ingredients  {:>14}  ({} missing, {} % complete)\n",
               show(ingredients_cost.total), ingredients_cost.missing, show(ing_complete.percent));
    fmt::print("  Processes    {:>14}  ({} incomplete, {} % complete)\n",
               show(process_cost.total), process_cost.missing, show(proc_complete.percent));
    fmt::print("  Total        {:>14}\n", show(ingredients_cost.total + process_cost.total));

    if (opts.unit_mass) {
        const auto unit = engine.unit_costs_for_target_mass(*formulation, *opts.unit_mass, opts.unit_mass_unit);
        fmt::print("\nPer unit of {} {}\n", show(*opts.unit_mass), opts.unit_mass_unit);
        fmt::print("  Sellable mass       {:>14} g\n", show(unit.sellable_mass_g));
        fmt::print("  Units               {:>14}\n", show(unit.units_count));
        fmt::print("  Ingredients / unit  {:>14}\n", show(unit.ingredients_cost_per_unit));
        fmt::print("  Processes / unit    {:>14}\n", show(unit.process_cost_per_unit));
        fmt::print("  Packaging / pack    {:>14}\n", show(unit.packaging_cost_per_pack));
        fmt::print("  Total / pack        {:>14}\n", show(unit.total_pack_cost));
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--report") {
        const auto opts = parse_report_args(argc, argv);
        if (!opts) {
            print_usage();
            return 1;
        }
        return run_report(*opts);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
