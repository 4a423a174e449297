#ifndef CLAMM_UINT256_HPP
#define CLAMM_UINT256_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "types.hpp"

namespace clamm {

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
// =============================================================================
//
// Operators wrap modulo 2^256; overflow-checked arithmetic goes through
// checked_add / checked_sub / checked_mul, which throw CoreError.

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    constexpr U256() : lo(0), hi(0) {}
    constexpr U256(U128 l) : lo(l), hi(0) {}
    constexpr U256(U128 l, U128 h) : lo(l), hi(h) {}

    static constexpr U256 max() { return U256(U128_MAX, U128_MAX); }

    // Decimal or 0x-prefixed hexadecimal
    static U256 from_string(std::string_view text);

    constexpr bool is_zero() const { return lo == 0 && hi == 0; }
    constexpr bool fits_u128() const { return hi == 0; }

    // Throws CoreError(AMOUNT_OVERFLOW) when the value needs more than 128 bits
    U128 to_u128() const;

    int bit_length() const;
    bool bit(int index) const;
    double to_double() const;

    std::string to_string() const;
    std::string to_hex() const;

    // Wrapping arithmetic
    U256& operator+=(const U256& other);
    U256& operator-=(const U256& other);
    U256& operator*=(const U256& other);
    U256& operator/=(const U256& other);
    U256& operator%=(const U256& other);
    U256& operator<<=(unsigned shift);
    U256& operator>>=(unsigned shift);

    friend constexpr bool operator==(const U256& a, const U256& b) {
        return a.lo == b.lo && a.hi == b.hi;
    }
    friend constexpr bool operator!=(const U256& a, const U256& b) { return !(a == b); }
    friend constexpr bool operator<(const U256& a, const U256& b) {
        return a.hi < b.hi || (a.hi == b.hi && a.lo < b.lo);
    }
    friend constexpr bool operator>(const U256& a, const U256& b) { return b < a; }
    friend constexpr bool operator<=(const U256& a, const U256& b) { return !(b < a); }
    friend constexpr bool operator>=(const U256& a, const U256& b) { return !(a < b); }

    friend constexpr U256 operator&(const U256& a, const U256& b) {
        return U256(a.lo & b.lo, a.hi & b.hi);
    }
    friend constexpr U256 operator|(const U256& a, const U256& b) {
        return U256(a.lo | b.lo, a.hi | b.hi);
    }
    constexpr U256 operator~() const { return U256(~lo, ~hi); }
};

U256 operator+(U256 a, const U256& b);
U256 operator-(U256 a, const U256& b);
U256 operator*(U256 a, const U256& b);
U256 operator/(U256 a, const U256& b);
U256 operator%(U256 a, const U256& b);
U256 operator<<(U256 a, unsigned shift);
U256 operator>>(U256 a, unsigned shift);

std::ostream& operator<<(std::ostream& os, const U256& value);

// 2^128, the unit of Q128.128 fixed point
constexpr U256 Q128 = U256(0, 1);

// Fee growth accumulators are modular: only differences are meaningful
inline U256 wrapping_add(const U256& a, const U256& b) { return a + b; }
inline U256 wrapping_sub(const U256& a, const U256& b) { return a - b; }

// =============================================================================
// Checked Arithmetic
// =============================================================================

// Full 256-bit product of two U128 values
U256 mul_u128(U128 a, U128 b);

bool add_overflows(const U256& a, const U256& b);
bool mul_overflows(const U256& a, const U256& b);

// Throw CoreError(ARITHMETIC_OVERFLOW) on overflow or underflow
U256 checked_add(const U256& a, const U256& b);
U256 checked_sub(const U256& a, const U256& b);
U256 checked_mul(const U256& a, const U256& b);

// floor(a / d) or ceil(a / d); throws CoreError(DIVISION_BY_ZERO)
U256 div_round(const U256& a, const U256& d, bool round_up);

// floor(a * b / d) or ceil(a * b / d) with a 512-bit intermediate product.
// Throws CoreError(DIVISION_BY_ZERO) when d == 0 and
// CoreError(ARITHMETIC_OVERFLOW) when the result does not fit in 256 bits.
U256 mul_div(const U256& a, const U256& b, const U256& d, bool round_up);

// True when floor(a * b / d) needs more than 256 bits
bool mul_div_overflows(const U256& a, const U256& b, const U256& d);

} // namespace clamm

#endif // CLAMM_UINT256_HPP
