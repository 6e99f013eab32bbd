/// @file src/nutrients/normalizer.cpp
/// @brief NutrientNormalizer: six-step augmentation pipeline.
///
/// Each step scans the list by lower-cased trimmed name, builds a new list
/// and inserts derived rows by index. Amounts stay Decimal throughout.

#include "fce/normalizer.hpp"
#include "fce/constants.hpp"
#include "fce/text.hpp"
#include "fce/units.hpp"

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>

namespace fce::nutrients {

namespace {

constexpr std::string_view LIPID = "total lipid (fat)";
constexpr std::string_view NLEA  = "total fat (nlea)";
constexpr std::string_view CARBS = "carbohydrate, by difference";

std::string norm_name(const NutrientRecord& r) {
    return text::fold(r.name);
}

/// First amount among rows whose name is in `names`.
std::optional<Decimal> find_amount(const NutrientList& list,
                                   std::initializer_list<std::string_view> names) {
    for (const auto& r : list) {
        const std::string n = norm_name(r);
        if (r.amount && std::find(names.begin(), names.end(), n) != names.end()) {
            return r.amount;
        }
    }
    return std::nullopt;
}

/// Smallest index of a row whose name is in `names`, or 0.
std::size_t min_index_of(const NutrientList& list,
                         std::initializer_list<std::string_view> names) {
    for (std::size_t i = 0; i < list.size(); ++i) {
        const std::string n = norm_name(list[i]);
        if (std::find(names.begin(), names.end(), n) != names.end()) {
            return i;
        }
    }
    return 0;
}

NutrientRecord derived(std::string name, std::string unit, Decimal amount) {
    return NutrientRecord{.name = std::move(name), .unit = std::move(unit), .amount = std::move(amount)};
}

void strip_source_ids(NutrientRecord& r) {
    r.id.reset();
    r.number.reset();
}

void insert_at(NutrientList& list, std::size_t pos, NutrientRecord r) {
    pos = std::min(pos, list.size());
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(pos), std::move(r));
}

}  // namespace

// ─── Pipeline ─────────────────────────────────────────────────────────────────

NutrientList NutrientNormalizer::normalize(const NutrientList& records,
                                           std::string_view data_type) {
    NutrientList out = augment_fat_nutrients(records);
    out = canonicalize_units(out);
    out = merge_aliases(out);
    out = augment_nitrogen(out);
    out = augment_branded_water(out, data_type);
    return augment_energy(out);
}

// ─── Step 1: fat equivalence ──────────────────────────────────────────────────

NutrientList NutrientNormalizer::augment_fat_nutrients(const NutrientList& records) {
    if (records.empty()) {
        return {};
    }

    NutrientList filtered;
    filtered.reserve(records.size() + 1);
    std::optional<NutrientRecord> lipid;
    std::optional<NutrientRecord> nlea;
    std::size_t lipid_pos = 0;
    std::size_t nlea_pos  = 0;
    bool lipid_first = false;

    for (const auto& r : records) {
        const std::string name = norm_name(r);
        if (name == LIPID) {
            if (!lipid) {
                lipid       = r;
                lipid_pos   = filtered.size();
                lipid_first = !nlea;
            }
            continue;
        }
        if (name == NLEA) {
            if (!nlea) {
                nlea     = r;
                nlea_pos = filtered.size();
            }
            continue;
        }
        filtered.push_back(r);
    }

    const bool has_lipid = lipid && lipid->amount.has_value();
    const bool has_nlea  = nlea && nlea->amount.has_value();

    if (!has_lipid && !has_nlea) {
        return records;
    }

    if (!has_lipid) {
        NutrientRecord clone = *nlea;
        clone.name = "Total lipid (fat)";
        strip_source_ids(clone);
        insert_at(filtered, nlea_pos, std::move(clone));
        insert_at(filtered, nlea_pos + 1, std::move(*nlea));
        return filtered;
    }

    if (!has_nlea) {
        NutrientRecord clone = *lipid;
        clone.name = "Total fat (NLEA)";
        strip_source_ids(clone);
        insert_at(filtered, lipid_pos, std::move(*lipid));
        insert_at(filtered, lipid_pos + 1, std::move(clone));
        return filtered;
    }

    // Both present: put each first row back where it was. The second insert
    // lands one further along because the first one shifted the list.
    if (lipid_first) {
        insert_at(filtered, lipid_pos, std::move(*lipid));
        insert_at(filtered, nlea_pos + 1, std::move(*nlea));
    } else {
        insert_at(filtered, nlea_pos, std::move(*nlea));
        insert_at(filtered, lipid_pos + 1, std::move(*lipid));
    }
    return filtered;
}

// ─── Step 2: canonical units ──────────────────────────────────────────────────

NutrientList NutrientNormalizer::canonicalize_units(const NutrientList& records) {
    NutrientList out = records;
    for (auto& r : out) {
        std::string canonical = units::UnitConverter::canonical_unit(r.unit);
        if (!canonical.empty()) {
            r.unit = std::move(canonical);
        }
    }
    return out;
}

// ─── Step 3: alias merge ──────────────────────────────────────────────────────

NutrientList NutrientNormalizer::merge_aliases(const NutrientList& records) {
    static const std::unordered_map<std::string, std::string> canonical_names = {
        {"total sugars", "Sugars, Total"},
        {"sugars, total", "Sugars, Total"},
        {"cystine", "Cysteine"},
        {"cysteine", "Cysteine"},
        {"carbohydrate, by summation", "Carbohydrate, by difference"},
        {"choline, from phosphotidyl choline", "Choline, from phosphatidyl choline"},
    };

    NutrientList merged;
    std::unordered_map<std::string, std::size_t> slot;

    for (const auto& r : records) {
        const std::string trimmed = text::trim(r.name);
        const std::string lower   = text::to_lower(trimmed);
        if (lower == "energy (atwater general factors)" ||
            lower == "energy (atwater specific factors)") {
            continue;
        }

        const auto mapped = canonical_names.find(lower);
        const std::string canonical = mapped != canonical_names.end() ? mapped->second : trimmed;
        if (canonical.empty()) {
            continue;
        }

        // kcal and kJ rows share a name; keep them apart.
        const std::string key = lower == "energy" ? canonical + "|" + text::fold(r.unit) : canonical;

        if (const auto it = slot.find(key); it != slot.end()) {
            NutrientRecord& existing = merged[it->second];
            if (!existing.amount && r.amount) {
                existing.amount = r.amount;
            }
            continue;
        }

        NutrientRecord first = r;
        first.name = canonical;
        slot.emplace(key, merged.size());
        merged.push_back(std::move(first));
    }
    return merged;
}

// ─── Step 4: nitrogen ─────────────────────────────────────────────────────────

NutrientList NutrientNormalizer::augment_nitrogen(const NutrientList& records) {
    if (records.empty()) {
        return {};
    }

    std::optional<Decimal> protein;
    std::size_t protein_pos = 0;
    for (std::size_t i = 0; i < records.size(); ++i) {
        const std::string name = norm_name(records[i]);
        if (name == "nitrogen" && records[i].amount) {
            return records;
        }
        if (name == "protein" && !protein && records[i].amount) {
            protein     = records[i].amount;
            protein_pos = i;
        }
    }
    if (!protein) {
        return records;
    }

    NutrientList out = records;
    const Decimal nitrogen = *protein / Decimal(constants::PROTEIN_TO_NITROGEN);
    insert_at(out, protein_pos, derived("Nitrogen", "g", nitrogen));
    return out;
}

// ─── Step 5: branded water ────────────────────────────────────────────────────

NutrientList NutrientNormalizer::augment_branded_water(const NutrientList& records,
                                                       std::string_view data_type) {
    if (records.empty()) {
        return {};
    }
    if (text::fold(data_type) != constants::DATA_TYPE_BRANDED) {
        return records;
    }
    if (find_amount(records, {"water"})) {
        return records;
    }

    const Decimal fat     = find_amount(records, {LIPID, NLEA}).value_or(Decimal());
    const Decimal protein = find_amount(records, {"protein"}).value_or(Decimal());
    const Decimal carbs   = find_amount(records, {CARBS}).value_or(Decimal());
    const Decimal ash     = find_amount(records, {"ash"}).value_or(Decimal());
    const Decimal fiber   = find_amount(records, {"fiber, total dietary"}).value_or(Decimal());

    Decimal water = Decimal(constants::NUTRIENT_BASIS_G) - (fat + protein + carbs + ash + fiber);
    if (water.is_negative()) {
        water = Decimal();
    }

    const std::size_t pos = min_index_of(
        records, {"protein", CARBS, LIPID, NLEA, "ash", "fiber, total dietary"});
    NutrientList out = records;
    insert_at(out, pos, derived("Water", "g", std::move(water)));
    return out;
}

// ─── Step 6: energy ───────────────────────────────────────────────────────────

NutrientList NutrientNormalizer::augment_energy(const NutrientList& records) {
    if (records.empty()) {
        return {};
    }

    NutrientList out;
    out.reserve(records.size() + 2);
    std::optional<std::size_t> kcal_pos;
    std::optional<std::size_t> kj_pos;

    for (const auto& r : records) {
        if (norm_name(r) != "energy") {
            out.push_back(r);
            continue;
        }
        const std::string unit = text::fold(r.unit);
        if (unit == "kcal" && !kcal_pos) {
            kcal_pos = out.size();
            out.push_back(r);
            strip_source_ids(out.back());
        } else if (unit == "kj" && !kj_pos) {
            kj_pos = out.size();
            out.push_back(r);
            strip_source_ids(out.back());
        }
        // Any other Energy row is a duplicate or a foreign unit: dropped.
    }

    const Decimal protein = find_amount(out, {"protein"}).value_or(Decimal());
    const Decimal carbs   = find_amount(out, {CARBS}).value_or(Decimal());
    const Decimal fat     = find_amount(out, {LIPID, NLEA}).value_or(Decimal());

    const Decimal kcal = protein * Decimal(constants::ATWATER_PROTEIN) +
                         carbs * Decimal(constants::ATWATER_CARBOHYDRATE) +
                         fat * Decimal(constants::ATWATER_FAT);
    const Decimal kj = kcal * Decimal(constants::KCAL_TO_KJ);

    const std::size_t macro_pos = min_index_of(out, {"protein", CARBS, LIPID, NLEA});

    if (kcal_pos) {
        out[*kcal_pos].amount = kcal;
        out[*kcal_pos].unit   = "kcal";
    } else {
        insert_at(out, macro_pos, derived("Energy", "kcal", kcal));
        if (kj_pos && *kj_pos >= macro_pos) {
            ++*kj_pos;
        }
    }

    if (kj_pos) {
        out[*kj_pos].amount = kj;
        out[*kj_pos].unit   = "kJ";
    } else {
        insert_at(out, macro_pos + 1, derived("Energy", "kJ", kj));
    }
    return out;
}

}  // namespace fce::nutrients
