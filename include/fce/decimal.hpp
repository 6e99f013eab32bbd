#pragma once

/// @file include/fce/decimal.hpp
/// @brief Exact base-10 arithmetic for every engine quantity.
///
/// # Module: Decimal
///
/// ## Responsibility
/// Wrap an mpdecimal `mpd_t` in a value type with RAII ownership, so that
/// ingredient amounts, percentages, nutrient figures and costs never pass
/// through binary floating point. Repeated proportional scaling and percent
/// round-trips therefore do not accumulate drift.
///
/// ## Context
/// 28 significant digits, ROUND_HALF_EVEN, no traps. Status flags are
/// inspected by the wrapper and never raised as signals.
///
/// ## Guarantees
/// - A Decimal is always finite (NaN and infinities are rejected on entry)
/// - Equality and ordering compare numeric value: 2.50 == 2.5
/// - Only `src/decimal/decimal.cpp` includes `<mpdecimal.h>`
/// - Allocation failure surfaces as `std::bad_alloc`
///
/// ## NOT Responsible For
/// - Display rounding (see `quantize`, callers pick the places)

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

// Forward declaration; mpdecimal.h is only included in decimal.cpp.
typedef struct mpd_t mpd_t;

namespace fce {

/// Finite, exact decimal number.
class Decimal {
public:
    /// Zero.
    Decimal();

    /// Exact integer value.
    Decimal(long long value);  // NOLINT(google-explicit-constructor)
    Decimal(int value) : Decimal(static_cast<long long>(value)) {}  // NOLINT

    /// Parse a trusted literal such as "4.184".
    ///
    /// Throws `std::invalid_argument` on malformed or non-finite text. Use
    /// `parse` for anything a user or data source supplied.
    explicit Decimal(std::string_view literal);

    Decimal(const Decimal& other);
    Decimal(Decimal&& other) noexcept;
    Decimal& operator=(const Decimal& other);
    Decimal& operator=(Decimal&& other) noexcept;
    ~Decimal();

    // ── Construction from untrusted input ────────────────────────────────────

    /// Parse plain decimal text ("12", "-0.5", "1E+3").
    ///
    /// # Returns
    /// - The value, rounded to the context precision if longer
    /// - `nullopt` for empty text, syntax errors, NaN or infinity
    [[nodiscard]] static std::optional<Decimal> parse(std::string_view text);

    /// Convert a double through its shortest round-trip representation,
    /// so 0.1 becomes exactly 0.1. `nullopt` for non-finite input.
    [[nodiscard]] static std::optional<Decimal> from_double(double value);

    // ── Arithmetic ───────────────────────────────────────────────────────────

    Decimal& operator+=(const Decimal& rhs);
    Decimal& operator-=(const Decimal& rhs);
    Decimal& operator*=(const Decimal& rhs);

    /// Precondition: `rhs` is non-zero. Check first or use `checked_div`.
    Decimal& operator/=(const Decimal& rhs);

    /// Division that reports a zero divisor as `nullopt`.
    [[nodiscard]] std::optional<Decimal> checked_div(const Decimal& rhs) const;

    [[nodiscard]] Decimal operator-() const;

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) { lhs += rhs; return lhs; }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) { lhs -= rhs; return lhs; }
    friend Decimal operator*(Decimal lhs, const Decimal& rhs) { lhs *= rhs; return lhs; }
    friend Decimal operator/(Decimal lhs, const Decimal& rhs) { lhs /= rhs; return lhs; }

    // ── Comparison ───────────────────────────────────────────────────────────

    friend bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept;
    friend std::strong_ordering operator<=>(const Decimal& lhs,
                                            const Decimal& rhs) noexcept;

    // ── Queries ──────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_zero() const noexcept;
    [[nodiscard]] bool is_negative() const noexcept;  ///< strictly < 0
    [[nodiscard]] bool is_positive() const noexcept;  ///< strictly > 0

    [[nodiscard]] Decimal abs() const;

    /// Same value with trailing zeros removed ("2.500" -> "2.5", "100" -> "1E+2"
    /// internally; `to_string` still prints "100").
    [[nodiscard]] Decimal reduce() const;

    /// Round half-even to `places` digits after the decimal point.
    [[nodiscard]] Decimal quantize(int places) const;

    /// Fixed-point text, never scientific notation ("0.00000001", "1500").
    [[nodiscard]] std::string to_string() const;

    /// Nearest double. Display and approximate comparison only.
    [[nodiscard]] double to_double() const;

private:
    struct Adopt {};
    Decimal(Adopt, mpd_t* raw) noexcept;

    mpd_t* value_;  ///< Owned; null only in a moved-from object
};

[[nodiscard]] inline const Decimal& min(const Decimal& a, const Decimal& b) noexcept {
    return (b < a) ? b : a;
}

[[nodiscard]] inline const Decimal& max(const Decimal& a, const Decimal& b) noexcept {
    return (a < b) ? b : a;
}

}  // namespace fce

// ─── fmt integration ──────────────────────────────────────────────────────────

template <>
struct fmt::formatter<fce::Decimal> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const fce::Decimal& d, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(d.to_string(), ctx);
    }
};
