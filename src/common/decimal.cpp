#include "common/decimal.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace thisthat {

Decimal Decimal::from_whole(int64_t whole) {
    return Decimal(narrow(static_cast<__int128>(whole) * kScale));
}

Decimal Decimal::parse(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    __int128 whole = 0;
    size_t whole_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        whole = whole * 10 + (text[pos] - '0');
        if (whole > std::numeric_limits<int64_t>::max()) {
            throw std::overflow_error("Decimal out of range: " + text);
        }
        ++pos;
        ++whole_digits;
    }

    __int128 fraction = 0;
    int fraction_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (fraction_digits == kFractionDigits) {
                throw std::invalid_argument("Too many fractional digits: " + text);
            }
            fraction = fraction * 10 + (text[pos] - '0');
            ++fraction_digits;
            ++pos;
        }
    }

    if (pos != text.size() || (whole_digits == 0 && fraction_digits == 0)) {
        throw std::invalid_argument("Malformed decimal: " + text);
    }

    for (int i = fraction_digits; i < kFractionDigits; ++i) {
        fraction *= 10;
    }

    __int128 micros = whole * kScale + fraction;
    return Decimal(narrow(negative ? -micros : micros));
}

std::string Decimal::to_string() const {
    __int128 value = micros_;
    bool negative = value < 0;
    if (negative) value = -value;

    auto whole = static_cast<uint64_t>(value / kScale);
    auto fraction = static_cast<uint64_t>(value % kScale);

    std::string digits = std::to_string(fraction);
    digits.insert(0, kFractionDigits - digits.size(), '0');
    while (digits.size() > 2 && digits.back() == '0') {
        digits.pop_back();
    }

    std::string out = negative ? "-" : "";
    out += std::to_string(whole);
    out += ".";
    out += digits;
    return out;
}

Decimal Decimal::operator+(Decimal other) const {
    return Decimal(narrow(static_cast<__int128>(micros_) + other.micros_));
}

Decimal Decimal::operator-(Decimal other) const {
    return Decimal(narrow(static_cast<__int128>(micros_) - other.micros_));
}

Decimal Decimal::operator-() const {
    return Decimal(narrow(-static_cast<__int128>(micros_)));
}

Decimal Decimal::operator*(Decimal other) const {
    __int128 wide = static_cast<__int128>(micros_) * other.micros_;
    return Decimal(narrow(divide_rounded(wide, kScale)));
}

Decimal Decimal::operator/(Decimal other) const {
    if (other.micros_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    __int128 wide = static_cast<__int128>(micros_) * kScale;
    return Decimal(narrow(divide_rounded(wide, other.micros_)));
}

Decimal& Decimal::operator+=(Decimal other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(Decimal other) {
    *this = *this - other;
    return *this;
}

int64_t Decimal::narrow(__int128 value) {
    if (value > std::numeric_limits<int64_t>::max() ||
        value < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal arithmetic overflow");
    }
    return static_cast<int64_t>(value);
}

__int128 Decimal::divide_rounded(__int128 numerator, __int128 denominator) {
    __int128 quotient = numerator / denominator;
    __int128 remainder = numerator % denominator;
    if (remainder < 0) remainder = -remainder;
    __int128 abs_denominator = denominator < 0 ? -denominator : denominator;

    if (remainder * 2 >= abs_denominator) {
        bool negative = (numerator < 0) != (denominator < 0);
        quotient += negative ? -1 : 1;
    }
    return quotient;
}

Decimal max(Decimal a, Decimal b) {
    return a < b ? b : a;
}

Decimal min(Decimal a, Decimal b) {
    return b < a ? b : a;
}

} // namespace thisthat
