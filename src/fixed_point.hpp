#pragma once

#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Decimal fixed-point helpers. A value is an int64_t count of 10^-decimals
// units: settlement prices are millionths, contango ratios ten-thousandths.
// ---------------------------------------------------------------------------
namespace fixed_point {

constexpr int PRICE_DECIMALS = 6;
constexpr int64_t PRICE_SCALE = 1'000'000;

constexpr int MAX_INTEGER_DIGITS = 12;

inline int64_t pow10(int n) {
    int64_t value = 1;
    while (n-- > 0) value *= 10;
    return value;
}

// Decimal text ("24.675", "-0.5", "18", "20.000000") to value * 10^decimals.
// Digits past `decimals` must be zero. Throws std::invalid_argument.
inline int64_t parse(const std::string& text, int decimals = PRICE_DECIMALS) {
    size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = text[i] == '-';
        ++i;
    }

    int64_t whole = 0;
    int int_digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        if (++int_digits > MAX_INTEGER_DIGITS) {
            throw std::invalid_argument("Decimal out of range: '" + text + "'");
        }
        whole = whole * 10 + (text[i++] - '0');
    }

    int64_t frac = 0;
    int frac_digits = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            int digit = text[i++] - '0';
            if (frac_digits < decimals) {
                frac = frac * 10 + digit;
            } else if (digit != 0) {
                throw std::invalid_argument("Decimal has more than " + std::to_string(decimals) +
                                            " places: '" + text + "'");
            }
            ++frac_digits;
        }
    }

    if (i != text.size() || (int_digits == 0 && frac_digits == 0)) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }

    int kept = frac_digits < decimals ? frac_digits : decimals;
    int64_t value = whole * pow10(decimals) + frac * pow10(decimals - kept);
    return negative ? -value : value;
}

inline int64_t checked_mul(int64_t a, int64_t b) {
    if (a != 0 && b != 0) {
        int64_t limit = std::numeric_limits<int64_t>::max();
        int64_t abs_a = a < 0 ? -a : a;
        int64_t abs_b = b < 0 ? -b : b;
        if (abs_a > limit / abs_b) {
            throw std::overflow_error("Fixed-point multiplication overflow");
        }
    }
    return a * b;
}

// numerator / denominator, rounded half away from zero.
inline int64_t divide_round(int64_t numerator, int64_t denominator) {
    if (denominator == 0) throw std::invalid_argument("divide_round: zero denominator");

    bool negative = (numerator < 0) != (denominator < 0);
    uint64_t n = numerator < 0 ? 0 - static_cast<uint64_t>(numerator)
                               : static_cast<uint64_t>(numerator);
    uint64_t d = denominator < 0 ? 0 - static_cast<uint64_t>(denominator)
                                 : static_cast<uint64_t>(denominator);

    uint64_t quotient = n / d;
    uint64_t remainder = n % d;
    if (remainder >= d - remainder) ++quotient;

    int64_t result = static_cast<int64_t>(quotient);
    return negative ? -result : result;
}

// Natural scale: trailing fractional zeros dropped ("0.1", "18", "-0.0013").
inline std::string format(int64_t value, int decimals) {
    uint64_t magnitude = value < 0 ? 0 - static_cast<uint64_t>(value)
                                   : static_cast<uint64_t>(value);
    uint64_t scale = static_cast<uint64_t>(pow10(decimals));

    std::string out = std::to_string(magnitude / scale);
    uint64_t frac = magnitude % scale;
    if (frac != 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, static_cast<size_t>(decimals) - digits.size(), '0');
        while (digits.back() == '0') digits.pop_back();
        out += "." + digits;
    }
    return value < 0 ? "-" + out : out;
}

}  // namespace fixed_point
