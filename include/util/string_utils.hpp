#pragma once

/**
 * String utilities for 128-bit settlement amounts
 *
 * The standard library has no formatting for unsigned __int128, so amounts
 * are rendered here for logs, the demo tool and test diagnostics.
 */

#include "../types.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace p2p {
namespace util {

/**
 * Decimal rendering of a 128-bit unsigned value.
 */
inline std::string to_string(unsigned __int128 value) {
    if (value == 0) return "0";

    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

/**
 * Base units -> whole tokens with trailing fractional digits trimmed.
 *
 * Example: format_tokens(1'500'000'000'000'000'000) -> "1.5"
 */
inline std::string format_tokens(Amount amount) {
    std::string whole = to_string(amount / PRICE_PRECISION);
    Amount frac = amount % PRICE_PRECISION;
    if (frac == 0) return whole;

    std::string digits = to_string(frac);
    digits.insert(0, 18 - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);
    return whole + "." + digits;
}

/**
 * Parse a decimal string into a 128-bit value.
 * Throws std::invalid_argument on non-digits, std::out_of_range on overflow.
 */
inline unsigned __int128 parse_u128(const std::string& s) {
    if (s.empty()) throw std::invalid_argument("empty amount");

    unsigned __int128 value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') throw std::invalid_argument("bad digit in amount: " + s);
        unsigned digit = static_cast<unsigned>(c - '0');
        if (value > (MAX_AMOUNT - digit) / 10) throw std::out_of_range("amount overflow: " + s);
        value = value * 10 + digit;
    }
    return value;
}

}  // namespace util
}  // namespace p2p
