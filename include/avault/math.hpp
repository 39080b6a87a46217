#ifndef AVAULT_MATH_HPP
#define AVAULT_MATH_HPP

#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace avault {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

namespace math {

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool fits_u128() const { return hi == 0; }
};

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// a + b, carrying into the high limb
inline U256 add_u128(U256 a, U128 b) {
    U256 result(a.lo + b, a.hi);
    if (result.lo < a.lo) result.hi += 1;
    return result;
}

// Quotient of num / denom; remainder written to rem. denom must be nonzero.
inline U256 divmod_u256_u128(U256 num, U128 denom, U128& rem) {
    if (num.hi == 0) {
        rem = num.lo % denom;
        return U256(num.lo / denom);
    }

    // Restoring long division, one bit at a time from the top.
    // r < denom always holds, so r << 1 overflows at most one bit.
    U256 quot;
    U128 r = 0;
    for (int i = 255; i >= 0; --i) {
        bool top = (r >> 127) != 0;
        U128 bit = (i >= 128) ? ((num.hi >> (i - 128)) & 1) : ((num.lo >> i) & 1);
        r = (r << 1) | bit;
        if (top || r >= denom) {
            r -= denom;
            if (i >= 128) quot.hi |= U128(1) << (i - 128);
            else quot.lo |= U128(1) << i;
        }
    }
    rem = r;
    return quot;
}

// floor(num / denom); nullopt when denom is zero or the quotient exceeds 128 bits
inline std::optional<U128> div_floor(U256 num, U128 denom) {
    if (denom == 0) return std::nullopt;
    U128 rem = 0;
    U256 q = divmod_u256_u128(num, denom, rem);
    if (!q.fits_u128()) return std::nullopt;
    return q.lo;
}

// ceil(num / denom); nullopt when denom is zero or the quotient exceeds 128 bits
inline std::optional<U128> div_ceil(U256 num, U128 denom) {
    if (denom == 0) return std::nullopt;
    U128 rem = 0;
    U256 q = divmod_u256_u128(num, denom, rem);
    if (!q.fits_u128()) return std::nullopt;
    if (rem != 0) {
        if (q.lo == U128_MAX) return std::nullopt;
        return q.lo + 1;
    }
    return q.lo;
}

// floor(a * b / denom) with a 256-bit intermediate
inline std::optional<U128> mul_div(U128 a, U128 b, U128 denom) {
    return div_floor(mul_u128(a, b), denom);
}

// ceil(a * b / denom) with a 256-bit intermediate
inline std::optional<U128> mul_div_up(U128 a, U128 b, U128 denom) {
    return div_ceil(mul_u128(a, b), denom);
}

inline std::optional<U128> checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) return std::nullopt;
    return a + b;
}

inline std::optional<U128> checked_mul(U128 a, U128 b) {
    U256 p = mul_u128(a, b);
    if (!p.fits_u128()) return std::nullopt;
    return p.lo;
}

inline U128 saturating_sub(U128 a, U128 b) {
    return a > b ? a - b : 0;
}

// 10^exp; nullopt past 10^38
std::optional<U128> pow10(uint32_t exp);

// Decimal rendering of a 128-bit amount
std::string to_string(U128 value);

// Parses a non-negative decimal integer; throws std::invalid_argument / std::out_of_range
U128 parse_u128(std::string_view text);

} // namespace math

// =============================================================================
// X18 Decimal Rates
// =============================================================================

namespace x18 {

// "0.01" -> 1e16. Exact; more than 18 fractional digits is rejected.
U128 from_string(std::string_view text);

// 1e16 -> "0.01"
std::string to_string(U128 value);

inline double to_double(U128 value) {
    return static_cast<double>(value) / static_cast<double>(X18_ONE);
}

} // namespace x18

} // namespace avault

#endif // AVAULT_MATH_HPP
