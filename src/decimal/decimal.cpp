/// @file src/decimal/decimal.cpp
/// @brief mpdecimal-backed implementation of fce::Decimal.
///
/// This is the ONLY file that includes <mpdecimal.h>. Every operation uses the
/// quiet (`mpd_q*`) API with a shared read-only context and a local status
/// word, so concurrent use from several threads is safe.

#include "fce/decimal.hpp"
#include "fce/constants.hpp"

#include <mpdecimal.h>

#include <cmath>
#include <cstdlib>
#include <memory>
#include <new>
#include <stdexcept>
#include <utility>

namespace fce {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Shared context: 28 digits, half-even, all traps disabled.
const mpd_context_t& context() {
    static const mpd_context_t ctx = [] {
        mpd_context_t c;
        mpd_defaultcontext(&c);
        mpd_qsetprec(&c, constants::DECIMAL_PRECISION);
        mpd_qsetround(&c, MPD_ROUND_HALF_EVEN);
        mpd_qsettraps(&c, 0);
        return c;
    }();
    return ctx;
}

mpd_t* allocate() {
    mpd_t* raw = mpd_qnew();
    if (raw == nullptr) {
        throw std::bad_alloc();
    }
    return raw;
}

/// Failure bits that mean the result is unusable.
constexpr uint32_t HARD_ERRORS = MPD_Conversion_syntax | MPD_Invalid_operation |
                                 MPD_Division_by_zero | MPD_Malloc_error |
                                 MPD_Overflow;

/// Owns a string allocated by libmpdec.
struct MpdStringDeleter {
    void operator()(char* s) const noexcept { mpd_free(s); }
};
using MpdString = std::unique_ptr<char, MpdStringDeleter>;

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Decimal::Decimal() : Decimal(0LL) {}

Decimal::Decimal(long long value) : value_(allocate()) {
    uint32_t status = 0;
    mpd_qset_i64(value_, static_cast<int64_t>(value), &context(), &status);
}

Decimal::Decimal(std::string_view literal) : value_(allocate()) {
    const std::string text(literal);
    uint32_t status = 0;
    mpd_qset_string(value_, text.c_str(), &context(), &status);
    if ((status & HARD_ERRORS) != 0 || mpd_isspecial(value_)) {
        mpd_del(value_);
        value_ = nullptr;
        throw std::invalid_argument("malformed decimal literal: " + text);
    }
}

Decimal::Decimal(Adopt, mpd_t* raw) noexcept : value_(raw) {}

Decimal::Decimal(const Decimal& other) : value_(allocate()) {
    uint32_t status = 0;
    if (!mpd_qcopy(value_, other.value_, &status)) {
        mpd_del(value_);
        value_ = nullptr;
        throw std::bad_alloc();
    }
}

Decimal::Decimal(Decimal&& other) noexcept : value_(other.value_) {
    other.value_ = nullptr;
}

Decimal& Decimal::operator=(const Decimal& other) {
    if (this != &other) {
        Decimal copy(other);
        std::swap(value_, copy.value_);
    }
    return *this;
}

Decimal& Decimal::operator=(Decimal&& other) noexcept {
    std::swap(value_, other.value_);
    return *this;
}

Decimal::~Decimal() {
    if (value_ != nullptr) {
        mpd_del(value_);
    }
}

// ─── Untrusted input ──────────────────────────────────────────────────────────

std::optional<Decimal> Decimal::parse(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string buffer(text);
    Decimal out(Adopt{}, allocate());
    uint32_t status = 0;
    mpd_qset_string(out.value_, buffer.c_str(), &context(), &status);
    if ((status & HARD_ERRORS) != 0 || mpd_isspecial(out.value_)) {
        return std::nullopt;
    }
    return out;
}

std::optional<Decimal> Decimal::from_double(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    // fmt's default double formatting is the shortest round-trip form.
    return parse(fmt::format("{}", value));
}

// ─── Arithmetic ───────────────────────────────────────────────────────────────

Decimal& Decimal::operator+=(const Decimal& rhs) {
    uint32_t status = 0;
    mpd_qadd(value_, value_, rhs.value_, &context(), &status);
    if ((status & MPD_Malloc_error) != 0) throw std::bad_alloc();
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& rhs) {
    uint32_t status = 0;
    mpd_qsub(value_, value_, rhs.value_, &context(), &status);
    if ((status & MPD_Malloc_error) != 0) throw std::bad_alloc();
    return *this;
}

Decimal& Decimal::operator*=(const Decimal& rhs) {
    uint32_t status = 0;
    mpd_qmul(value_, value_, rhs.value_, &context(), &status);
    if ((status & MPD_Malloc_error) != 0) throw std::bad_alloc();
    return *this;
}

Decimal& Decimal::operator/=(const Decimal& rhs) {
    if (rhs.is_zero()) {
        // Keep the value finite; callers are required to check first.
        throw std::domain_error("Decimal division by zero");
    }
    uint32_t status = 0;
    mpd_qdiv(value_, value_, rhs.value_, &context(), &status);
    if ((status & MPD_Malloc_error) != 0) throw std::bad_alloc();
    return *this;
}

std::optional<Decimal> Decimal::checked_div(const Decimal& rhs) const {
    if (rhs.is_zero()) {
        return std::nullopt;
    }
    Decimal out(*this);
    out /= rhs;
    return out;
}

Decimal Decimal::operator-() const {
    Decimal out(Adopt{}, allocate());
    uint32_t status = 0;
    mpd_qminus(out.value_, value_, &context(), &status);
    if ((status & MPD_Malloc_error) != 0) throw std::bad_alloc();
    return out;
}

// ─── Comparison ───────────────────────────────────────────────────────────────

bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept {
    uint32_t status = 0;
    return mpd_qcmp(lhs.value_, rhs.value_, &status) == 0;
}

std::strong_ordering operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept {
    uint32_t status = 0;
    const int c = mpd_qcmp(lhs.value_, rhs.value_, &status);
    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

// ─── Queries ──────────────────────────────────────────────────────────────────

bool Decimal::is_zero() const noexcept {
    return mpd_iszero(value_) != 0;
}

bool Decimal::is_negative() const noexcept {
    return !is_zero() && mpd_isnegative(value_) != 0;
}

bool Decimal::is_positive() const noexcept {
    return !is_zero() && mpd_isnegative(value_) == 0;
}

Decimal Decimal::abs() const {
    Decimal out(Adopt{}, allocate());
    uint32_t status = 0;
    mpd_qabs(out.value_, value_, &context(), &status);
    if ((status & MPD_Malloc_error) != 0) throw std::bad_alloc();
    return out;
}

Decimal Decimal::reduce() const {
    Decimal out(Adopt{}, allocate());
    uint32_t status = 0;
    mpd_qreduce(out.value_, value_, &context(), &status);
    if ((status & MPD_Malloc_error) != 0) throw std::bad_alloc();
    return out;
}

Decimal Decimal::quantize(int places) const {
    Decimal exponent(Adopt{}, allocate());
    uint32_t status = 0;
    const std::string pattern = fmt::format("1E{}", -places);
    mpd_qset_string(exponent.value_, pattern.c_str(), &context(), &status);

    Decimal out(Adopt{}, allocate());
    status = 0;
    mpd_qquantize(out.value_, value_, exponent.value_, &context(), &status);
    if ((status & MPD_Invalid_operation) != 0) {
        // Result would exceed the precision; the value is already finer.
        return *this;
    }
    return out;
}

std::string Decimal::to_string() const {
    uint32_t status = 0;
    MpdString text(mpd_qformat(value_, "f", &context(), &status));
    if (!text) {
        MpdString sci(mpd_to_sci(value_, 1));
        return sci ? std::string(sci.get()) : std::string("0");
    }
    return std::string(text.get());
}

double Decimal::to_double() const {
    MpdString text(mpd_to_sci(value_, 1));
    if (!text) {
        return 0.0;
    }
    return std::strtod(text.get(), nullptr);
}

}  // namespace fce
