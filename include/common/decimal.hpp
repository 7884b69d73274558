#pragma once

#include <cstdint>
#include <string>

namespace thisthat {

/**
 * Fixed-point decimal with six fractional digits, stored as a signed count of
 * micro-units. Used for every money and price field so that balances never
 * drift through binary floating point.
 *
 * Arithmetic is exact for + and -, and rounds half away from zero for * and /.
 * Any result outside the int64 range throws std::overflow_error.
 */
class Decimal {
public:
    static constexpr int64_t kScale = 1'000'000;
    static constexpr int kFractionDigits = 6;

    constexpr Decimal() = default;

    static constexpr Decimal from_micros(int64_t micros) { return Decimal(micros); }
    static Decimal from_whole(int64_t whole);

    // Accepts "[-]digits[.digits]"; more than six fractional digits is an error.
    static Decimal parse(const std::string& text);

    constexpr int64_t micros() const { return micros_; }

    // Display and metrics only, never fed back into arithmetic.
    double to_double() const { return static_cast<double>(micros_) / static_cast<double>(kScale); }

    // Renders at least two fractional digits: "950.00", "95.123456".
    std::string to_string() const;

    constexpr bool is_zero() const { return micros_ == 0; }
    constexpr bool is_positive() const { return micros_ > 0; }
    constexpr bool is_negative() const { return micros_ < 0; }

    Decimal operator+(Decimal other) const;
    Decimal operator-(Decimal other) const;
    Decimal operator-() const;
    Decimal operator*(Decimal other) const;
    Decimal operator/(Decimal other) const;  // throws std::domain_error on zero

    Decimal& operator+=(Decimal other);
    Decimal& operator-=(Decimal other);

    constexpr bool operator==(const Decimal& other) const { return micros_ == other.micros_; }
    constexpr bool operator!=(const Decimal& other) const { return micros_ != other.micros_; }
    constexpr bool operator<(const Decimal& other) const { return micros_ < other.micros_; }
    constexpr bool operator>(const Decimal& other) const { return micros_ > other.micros_; }
    constexpr bool operator<=(const Decimal& other) const { return micros_ <= other.micros_; }
    constexpr bool operator>=(const Decimal& other) const { return micros_ >= other.micros_; }

private:
    explicit constexpr Decimal(int64_t micros) : micros_(micros) {}

    static int64_t narrow(__int128 value);
    static __int128 divide_rounded(__int128 numerator, __int128 denominator);

    int64_t micros_{0};
};

// Ledger amounts and market prices share the representation.
using Credits = Decimal;
using Probability = Decimal;

Decimal max(Decimal a, Decimal b);
Decimal min(Decimal a, Decimal b);

} // namespace thisthat
