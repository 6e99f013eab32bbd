#pragma once

/// @file include/fce/types.hpp
/// @brief Shared primitive types for the Formulation Calculation Engine.
///
/// Every module includes this file. It registers `fce::Decimal` as an Eigen
/// scalar and defines the linear-algebra aliases used by the nutrient
/// calculator, plus the small enums shared between the model and services.

#include "fce/decimal.hpp"

#include <Eigen/Dense>

#include <limits>
#include <optional>
#include <string_view>

// ─── Eigen Scalar Registration ────────────────────────────────────────────────

namespace Eigen {

/// Decimal is a real, signed, heap-backed scalar: Eigen must construct every
/// coefficient before use (`RequireInitialization`).
template <>
struct NumTraits<fce::Decimal> : GenericNumTraits<fce::Decimal> {
    using Real       = fce::Decimal;
    using NonInteger = fce::Decimal;
    using Literal    = fce::Decimal;
    using Nested     = fce::Decimal;

    enum {
        IsComplex             = 0,
        IsInteger             = 0,
        IsSigned              = 1,
        RequireInitialization = 1,
        ReadCost              = 1,
        AddCost               = 3,
        MulCost               = 3
    };

    static inline fce::Decimal epsilon() { return fce::Decimal("1E-27"); }
    static inline fce::Decimal dummy_precision() { return fce::Decimal("1E-20"); }
    static inline fce::Decimal highest() { return fce::Decimal("1E+100"); }
    static inline fce::Decimal lowest() { return fce::Decimal("-1E+100"); }
    static inline int digits10() { return 28; }
};

}  // namespace Eigen

namespace fce {

// Real-scalar hooks Eigen looks up by ADL.
inline const Decimal& conj(const Decimal& x) { return x; }
inline const Decimal& real(const Decimal& x) { return x; }
inline Decimal imag(const Decimal&) { return Decimal(); }
inline Decimal abs2(const Decimal& x) { return x * x; }

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Rows = ingredients, columns = nutrient names; entries are per-100 g values.
using NutrientMatrix = Eigen::Matrix<Decimal, Eigen::Dynamic, Eigen::Dynamic>;

/// One weight (or total) per row / column of a NutrientMatrix.
using DecimalVector = Eigen::Matrix<Decimal, Eigen::Dynamic, 1>;

// ─── Quantity Mode ────────────────────────────────────────────────────────────

/// How a formulation's ingredient quantities are edited and displayed.
enum class QuantityMode {
    Grams,    ///< absolute mass, "g"
    Percent,  ///< share of the batch, "%"
};

[[nodiscard]] constexpr const char* to_string(QuantityMode m) noexcept {
    switch (m) {
        case QuantityMode::Grams:   return "g";
        case QuantityMode::Percent: return "%";
    }
    return "?";
}

/// Parse "g" or "%"; anything else is `nullopt`.
[[nodiscard]] constexpr std::optional<QuantityMode>
parse_quantity_mode(std::string_view text) noexcept {
    if (text == "g") return QuantityMode::Grams;
    if (text == "%") return QuantityMode::Percent;
    return std::nullopt;
}

}  // namespace fce
